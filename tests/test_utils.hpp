/**
 * Helpers for building asset files byte by byte in a temporary directory.
 */

#pragma once

#include "ultima/files.hpp"
#include "ultima/name_hash.hpp"
#include "ultima/uop_format.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <fstream>
#include <random>
#include <string>
#include <vector>
#include <cstdint>

namespace ultima::test {

inline void put_le16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v));
    out.push_back(static_cast<uint8_t>(v >> 8));
}

inline void put_le32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>(v >> (8 * i)));
}

inline void put_le64(std::vector<uint8_t>& out, uint64_t v) {
    for (int i = 0; i < 8; ++i) out.push_back(static_cast<uint8_t>(v >> (8 * i)));
}

inline void set_le64(std::vector<uint8_t>& out, size_t pos, uint64_t v) {
    for (int i = 0; i < 8; ++i) out[pos + i] = static_cast<uint8_t>(v >> (8 * i));
}

inline std::vector<uint8_t> bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

/**
 * Mythic run-length encoder: runs of two or more equal bytes become
 * (count, byte) pairs, everything else (0, n, bytes) literals.
 */
inline std::vector<uint8_t> encode_mythic(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> out;
    put_le32(out, static_cast<uint32_t>(data.size()));
    
    size_t i = 0;
    while (i < data.size()) {
        size_t run = 1;
        while (i + run < data.size() && data[i + run] == data[i] && run < 255) ++run;
        
        if (run >= 2) {
            out.push_back(static_cast<uint8_t>(run));
            out.push_back(data[i]);
            i += run;
            continue;
        }
        
        size_t start = i;
        size_t n = 0;
        while (i < data.size() && n < 255) {
            if (i + 1 < data.size() && data[i + 1] == data[i]) break;
            ++i;
            ++n;
        }
        out.push_back(0);
        out.push_back(static_cast<uint8_t>(n));
        out.insert(out.end(), data.begin() + static_cast<std::ptrdiff_t>(start),
                   data.begin() + static_cast<std::ptrdiff_t>(i));
    }
    return out;
}

/**
 * Per-test scratch directory, removed on destruction.
 */
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = fs::temp_directory_path() /
                ("ultima_test_" + std::to_string(stamp) + "_" + std::to_string(std::random_device{}()) +
                 "_" + std::to_string(counter++));
        fs::create_directories(path_);
    }
    
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    
    const fs::path& path() const { return path_; }
    
    fs::path write(const std::string& name, const std::vector<uint8_t>& data) const {
        fs::path file = path_ / name;
        std::ofstream out(file, std::ios::binary);
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        return file;
    }
    
    fs::path write_text(const std::string& name, const std::string& text) const {
        return write(name, bytes(text));
    }

private:
    fs::path path_;
};

struct UopTestEntry {
    uint64_t hash = 0;
    std::vector<uint8_t> payload;      // Stored bytes, including any inline extra header
    int16_t compression = 0;
    uint32_t decompressed_size = 0;
    std::vector<uint8_t> header;       // Per-entry header skipped by the reader
    bool placeholder = false;          // Write an all-zero record
};

/**
 * Build a UOP container. Records of every block come first, payloads follow.
 */
inline std::vector<uint8_t> build_uop(const std::vector<std::vector<UopTestEntry>>& blocks,
                                      uint32_t block_capacity = 100, uint32_t entry_count = 0,
                                      uint32_t magic = UOP_MAGIC) {
    std::vector<uint64_t> block_offsets;
    uint64_t pos = UOP_HEADER_SIZE;
    uint32_t total = 0;
    for (const auto& block : blocks) {
        block_offsets.push_back(pos);
        pos += UOP_BLOCK_HEADER_SIZE + block.size() * UOP_ENTRY_SIZE;
        total += static_cast<uint32_t>(block.size());
    }
    uint64_t data_pos = pos;
    
    std::vector<uint8_t> out;
    put_le32(out, magic);
    put_le32(out, 5);
    put_le32(out, 0xFD23EC43);
    put_le64(out, blocks.empty() ? 0 : block_offsets.front());
    put_le32(out, block_capacity);
    put_le32(out, entry_count ? entry_count : total);
    
    std::vector<uint8_t> data;
    for (size_t b = 0; b < blocks.size(); ++b) {
        put_le32(out, static_cast<uint32_t>(blocks[b].size()));
        put_le64(out, b + 1 < blocks.size() ? block_offsets[b + 1] : 0);
        
        for (const auto& entry : blocks[b]) {
            if (entry.placeholder) {
                out.insert(out.end(), UOP_ENTRY_SIZE, 0);
                continue;
            }
            put_le64(out, data_pos + data.size());
            put_le32(out, static_cast<uint32_t>(entry.header.size()));
            put_le32(out, static_cast<uint32_t>(entry.payload.size()));
            put_le32(out, entry.decompressed_size ? entry.decompressed_size
                                                  : static_cast<uint32_t>(entry.payload.size()));
            put_le64(out, entry.hash);
            put_le32(out, 0);
            put_le16(out, static_cast<uint16_t>(entry.compression));
            
            data.insert(data.end(), entry.header.begin(), entry.header.end());
            data.insert(data.end(), entry.payload.begin(), entry.payload.end());
        }
    }
    
    out.insert(out.end(), data.begin(), data.end());
    return out;
}

/**
 * Uncompressed entry stored under the synthetic name of index.
 */
inline UopTestEntry uop_entry(const std::string& pattern, uint32_t index, const std::vector<uint8_t>& payload,
                              const std::string& extension = ".dat") {
    UopTestEntry entry;
    entry.hash = hash_file_name(format_entry_name(pattern, index, extension));
    entry.payload = payload;
    return entry;
}

/**
 * MUL index of (offset, length, extra) records.
 */
struct IndexRecord {
    uint32_t offset;
    uint32_t length;
    uint32_t extra;
};

inline std::vector<uint8_t> build_index(const std::vector<IndexRecord>& records) {
    std::vector<uint8_t> out;
    for (const auto& r : records) {
        put_le32(out, r.offset);
        put_le32(out, r.length);
        put_le32(out, r.extra);
    }
    return out;
}

} // namespace ultima::test
