/**
 * Ultima Assets - Logging Implementation
 */

#include "ultima/logging.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace ultima {

namespace {

std::string format_line(LogLevel level, std::string_view tag, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif

    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%H:%M:%S") << '.'
       << std::setfill('0') << std::setw(3) << ms.count()
       << " [" << log_level_string(level) << "] ";
    if (!tag.empty()) {
        ss << '[' << tag << "] ";
    }
    ss << message;
    return ss.str();
}

} // namespace

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_console_output(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_ = enabled;
}

bool Logger::set_file(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    file_.open(path, std::ios::app);
    return file_.is_open();
}

void Logger::close_file() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
}

void Logger::set_callback(LogCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

void Logger::log(LogLevel level, std::string_view tag, const std::string& message) {
    if (!is_enabled(level)) return;

    std::string line = format_line(level, tag, message);

    std::lock_guard<std::mutex> lock(mutex_);
    if (console_) {
        (level == LogLevel::Error ? std::cerr : std::cout) << line << '\n';
    }
    if (file_.is_open()) {
        file_ << line << '\n';
        file_.flush();
    }
    if (callback_) {
        callback_(level, line);
    }
}

} // namespace ultima
