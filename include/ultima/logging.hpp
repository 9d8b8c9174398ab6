/**
 * Ultima Assets - Logging
 *
 * Process-wide logger shared by the readers. Silent on the console and
 * without a file until LogConfig::apply() (or the setters) says otherwise.
 */

#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace ultima {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
    None = 4
};

constexpr const char* log_level_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error:   return "ERROR";
        default:                return "NONE";
    }
}

using LogCallback = std::function<void(LogLevel, const std::string&)>;

class Logger {
public:
    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_level(LogLevel level) { min_level_.store(level, std::memory_order_release); }
    LogLevel level() const { return min_level_.load(std::memory_order_acquire); }
    bool is_enabled(LogLevel level) const {
        return level != LogLevel::None && level >= min_level_.load(std::memory_order_acquire);
    }

    void set_console_output(bool enabled);

    /**
     * Append to path, creating its directory. Returns false if the file
     * cannot be opened; the previous file is closed either way.
     */
    bool set_file(const std::filesystem::path& path);
    void close_file();

    // Receives every line written while set; pass nullptr to clear.
    void set_callback(LogCallback callback);

    /**
     * Write one line "HH:MM:SS.mmm [LEVEL] [tag] message" to every active sink.
     */
    void log(LogLevel level, std::string_view tag, const std::string& message);

private:
    Logger() = default;

    std::mutex mutex_;
    std::atomic<LogLevel> min_level_{LogLevel::Info};
    bool console_ = false;
    std::ofstream file_;
    LogCallback callback_;
};

} // namespace ultima

// Usage: LOG_INFO("UopReader", "opened " << count << " entries")
#define ULTIMA_LOG(level, tag, msg) \
    do { \
        if (ultima::Logger::instance().is_enabled(level)) { \
            std::ostringstream _log_ss; \
            _log_ss << msg; \
            ultima::Logger::instance().log(level, tag, _log_ss.str()); \
        } \
    } while (0)

#define LOG_DEBUG(tag, msg)   ULTIMA_LOG(ultima::LogLevel::Debug, tag, msg)
#define LOG_INFO(tag, msg)    ULTIMA_LOG(ultima::LogLevel::Info, tag, msg)
#define LOG_WARNING(tag, msg) ULTIMA_LOG(ultima::LogLevel::Warning, tag, msg)
#define LOG_ERROR(tag, msg)   ULTIMA_LOG(ultima::LogLevel::Error, tag, msg)
