/**
 * Ultima Assets - MUL Reader
 *
 * Legacy flat-file format: a data file, optionally paired with an index
 * file of fixed-size (offset, length, extra) records.
 */

#pragma once

#include "ultima/entry_reader.hpp"
#include "ultima/files.hpp"
#include <filesystem>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>
#include <cstdint>

namespace ultima {

/**
 * Registers one entry: (id, offset, length, extra, inline value).
 * A non-empty value is served from memory instead of the data file.
 */
using MulAddFn = std::function<void(uint32_t, uint32_t, uint32_t, uint32_t, std::vector<uint8_t>)>;

/**
 * Custom table builder for files without an index (tiledata, speech, cliloc).
 * Receives the whole data file.
 */
using MulDecoder = std::function<Result<void>(const std::vector<uint8_t>& data, const MulAddFn& add)>;

struct MulOptions {
    uint32_t entry_size = 12;   // Index record size, at least 12
    uint32_t chunk_size = 0;    // Split an index-less file into fixed-size entries
    MulDecoder decoder;         // Custom entry table for index-less files
};

class MulReader : public EntryReader {
public:
    /**
     * Open a data file together with its index.
     */
    static Result<std::unique_ptr<MulReader>> open(const fs::path& data_path, const fs::path& index_path,
                                                   MulOptions options = {});
    
    /**
     * Open a data file without an index. Without a decoder or chunk size the
     * whole file becomes entry 0.
     */
    static Result<std::unique_ptr<MulReader>> open_one(const fs::path& data_path, MulOptions options = {});
    
    ~MulReader() override;
    
    MulReader(const MulReader&) = delete;
    MulReader& operator=(const MulReader&) = delete;
    
    Result<std::vector<uint8_t>> read(uint32_t index) override;
    Result<uint64_t> extra(uint32_t index) override;
    std::vector<uint32_t> entries() const override;
    void for_each_entry(const EntryVisitor& visitor) const override;
    void close() override;
    bool is_closed() const override;
    
    size_t entry_count() const;
    const fs::path& path() const { return path_; }

private:
    struct Entry {
        uint32_t id = 0;
        uint32_t offset = 0;
        uint32_t length = 0;
        uint32_t extra = 0;
        std::vector<uint8_t> decoded;
        
        bool valid() const { return offset != INVALID_OFFSET && length != 0; }
    };
    
    MulReader(fs::path path, MulOptions options);
    
    void add(uint32_t id, uint32_t offset, uint32_t length, uint32_t extra, std::vector<uint8_t> value);
    Result<const Entry*> lookup(uint32_t index) const;
    Result<void> load_index(const fs::path& index_path);
    Result<void> load_chunks();
    Result<void> load_decoded();
    Result<void> load_whole();
    
    fs::path path_;
    MulOptions options_;
    RandomAccessFile file_;
    
    mutable std::shared_mutex mutex_;
    bool closed_ = false;
    std::vector<Entry> entries_;
    std::unordered_map<uint32_t, size_t> lookup_;  // id -> position in entries_
};

} // namespace ultima
