/**
 * Ultima Assets - UOP Reader
 */

#pragma once

#include "ultima/entry_reader.hpp"
#include "ultima/files.hpp"
#include "ultima/uop_format.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <cstdint>

namespace ultima {

/**
 * Options controlling how logical indices are matched to container records.
 */
struct UopOptions {
    uint32_t length = 0;                 // Logical table size, 0 = header entry count
    uint32_t index_length = 0xFFFFFFFF;  // Highest logical index a record may resolve to
    std::string extension = ".dat";      // Extension used in the synthetic entry names
    bool has_extra = false;              // Compressed entries start with an 8-byte extra header
    bool extra_uncompressed = false;     // With has_extra, stored (tag 0) entries carry it too
    bool strict = false;                 // Reject records whose hash matches no expected name
};

/**
 * Logical view of an entry, derived from its raw record.
 */
struct UopEntry {
    uint64_t offset = 0;                // Start of the payload (past header and extra)
    uint32_t length = 0;                // Stored payload size
    uint32_t decompressed_length = 0;
    uint32_t extra1 = 0x0FFFFFFF;
    uint32_t extra2 = 0x0FFFFFFF;
    uint8_t compression = 0;            // 0 = none, 1 = zlib, 2 = mythic
    
    bool valid() const { return offset != INVALID_OFFSET && length != 0; }
    uint64_t extra() const { return uint64_t(extra1) | (uint64_t(extra2) << 32); }
};

/**
 * Reader for UOP containers.
 *
 * The block chain is parsed once at open time into an arena of raw records,
 * indexed both by name hash and by dense logical index. The tables are
 * read-only afterwards; a shared mutex only guards them against close().
 */
class UopReader : public EntryReader {
public:
    static Result<std::unique_ptr<UopReader>> open(const fs::path& path, UopOptions options = {});
    
    ~UopReader() override;
    
    UopReader(const UopReader&) = delete;
    UopReader& operator=(const UopReader&) = delete;
    
    Result<std::vector<uint8_t>> read(uint32_t index) override;
    Result<uint64_t> extra(uint32_t index) override;
    std::vector<uint32_t> entries() const override;
    void for_each_entry(const EntryVisitor& visitor) const override;
    void close() override;
    bool is_closed() const override;
    
    /**
     * Logical entry metadata without reading the payload.
     */
    Result<UopEntry> entry(uint32_t index) const;
    
    /**
     * Rebuild the logical table for a new length over the already parsed records.
     */
    Result<void> setup_entries(uint32_t length);
    
    // Direct hash access, bypassing the logical table
    std::optional<UopRawEntry> find_by_hash(uint64_t hash) const;
    Result<std::vector<uint8_t>> read_by_hash(uint64_t hash);
    Result<std::vector<uint8_t>> read_by_name(std::string_view name);
    
    const UopHeader& header() const { return header_; }
    const fs::path& path() const { return path_; }
    const std::string& pattern() const { return pattern_; }
    const UopOptions& options() const { return options_; }
    
    size_t entry_count() const;
    size_t raw_entry_count() const;

private:
    static constexpr uint32_t NO_ENTRY = 0xFFFFFFFF;
    
    UopReader(fs::path path, UopOptions options);
    
    Result<void> parse();
    Result<void> parse_blocks();
    Result<void> build_index(uint32_t length);
    Result<void> load_extra(UopRawEntry& raw);
    UopEntry logical_entry(const UopRawEntry& raw) const;
    Result<UopEntry> resolve(uint32_t index) const;
    Result<std::vector<uint8_t>> read_entry(const UopEntry& entry, std::shared_lock<std::shared_mutex>& lock);
    
    fs::path path_;
    std::string pattern_;
    UopOptions options_;
    UopHeader header_;
    RandomAccessFile file_;
    
    mutable std::shared_mutex mutex_;
    bool closed_ = false;
    std::vector<UopRawEntry> arena_;                  // Records in block-chain order
    std::unordered_map<uint64_t, uint32_t> by_hash_;  // Hash -> arena index, last write wins
    std::vector<uint32_t> logical_;                   // Logical index -> arena index or NO_ENTRY
};

} // namespace ultima
