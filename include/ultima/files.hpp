/**
 * Ultima Assets - File utilities
 */

#pragma once

#include "ultima/result.hpp"
#include <string>
#include <vector>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <cstdint>

namespace ultima {

namespace fs = std::filesystem;

/**
 * Binary file with positional, thread-safe reads.
 *
 * Reads are serialized on an internal mutex, so one instance can be shared by
 * every thread reading entries from the same container.
 */
class RandomAccessFile {
public:
    RandomAccessFile() = default;
    ~RandomAccessFile() = default;
    
    RandomAccessFile(const RandomAccessFile&) = delete;
    RandomAccessFile& operator=(const RandomAccessFile&) = delete;
    
    Result<void> open(const fs::path& path);
    void close();
    
    bool is_open() const;
    uint64_t size() const { return size_; }
    const fs::path& path() const { return path_; }
    
    /**
     * Read up to length bytes at offset. The read is clamped to the file
     * size; an offset at or past the end yields an empty buffer.
     */
    Result<std::vector<uint8_t>> read_at(uint64_t offset, size_t length);
    
    /**
     * Read exactly length bytes at offset, anything shorter is an IoError.
     */
    Result<std::vector<uint8_t>> read_exact(uint64_t offset, size_t length);

private:
    mutable std::mutex mutex_;
    std::ifstream file_;
    fs::path path_;
    uint64_t size_ = 0;
};

/**
 * Read entire file into memory.
 */
std::vector<uint8_t> read_file(const fs::path& path);

/**
 * Check if a regular file exists.
 */
bool file_exists(const fs::path& path);

} // namespace ultima
