/**
 * Ultima Assets - File Utilities Implementation
 */

#include "ultima/files.hpp"
#include <algorithm>

namespace ultima {

Result<void> RandomAccessFile::open(const fs::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (file_.is_open()) {
        file_.close();
    }
    
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Error::file_not_found(path.string());
    }
    
    file_.open(path, std::ios::binary);
    if (!file_) {
        return Error::io_error("Failed to open file", path.string());
    }
    
    file_.seekg(0, std::ios::end);
    auto end = file_.tellg();
    if (end < 0) {
        file_.close();
        return Error::io_error("Failed to determine file size", path.string());
    }
    
    size_ = static_cast<uint64_t>(end);
    path_ = path;
    return Result<void>::success();
}

void RandomAccessFile::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
    size_ = 0;
}

bool RandomAccessFile::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

Result<std::vector<uint8_t>> RandomAccessFile::read_at(uint64_t offset, size_t length) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (!file_.is_open()) {
        return Error::io_error("File is not open", path_.string());
    }
    
    if (offset >= size_ || length == 0) {
        return std::vector<uint8_t>{};
    }
    
    // Adjust length if it would read beyond the end of the file
    uint64_t available = size_ - offset;
    size_t count = static_cast<size_t>(std::min<uint64_t>(length, available));
    
    file_.clear();
    file_.seekg(static_cast<std::streamoff>(offset));
    if (!file_.good()) {
        return Error::io_error("Failed to seek to offset " + std::to_string(offset), path_.string());
    }
    
    std::vector<uint8_t> data(count);
    file_.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(count));
    
    auto got = file_.gcount();
    if (got < 0) {
        return Error::io_error("Failed to read at offset " + std::to_string(offset), path_.string());
    }
    data.resize(static_cast<size_t>(got));
    return data;
}

Result<std::vector<uint8_t>> RandomAccessFile::read_exact(uint64_t offset, size_t length) {
    TRY_ASSIGN(data, read_at(offset, length));
    if (data.size() != length) {
        return Error::io_error("Short read at offset " + std::to_string(offset) + " (wanted " +
                               std::to_string(length) + ", got " + std::to_string(data.size()) + ")",
                               path_.string());
    }
    return data;
}

std::vector<uint8_t> read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return {};
    
    file.seekg(0, std::ios::end);
    auto end = file.tellg();
    if (end <= 0) return {};
    file.seekg(0, std::ios::beg);
    
    std::vector<uint8_t> data(static_cast<size_t>(end));
    file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
    data.resize(static_cast<size_t>(file.gcount()));
    return data;
}

bool file_exists(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

} // namespace ultima
