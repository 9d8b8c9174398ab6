/**
 * Ultima Assets - Asset file
 *
 * One logical asset file, backed by whichever format is present on disk:
 * a UOP container, a MUL data file with its index, or a lone MUL file.
 * The backing reader is created on first use, and caller-supplied patches
 * override its entries.
 */

#pragma once

#include "ultima/entry_reader.hpp"
#include "ultima/file_config.hpp"
#include "ultima/files.hpp"
#include "ultima/result.hpp"
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <cstdint>

namespace ultima {

enum class SourceKind {
    None,           // Nothing usable was found
    Container,      // UOP container
    LegacyIndexed,  // MUL data + index
    LegacySingle    // MUL data without index
};

const char* source_kind_string(SourceKind kind);

/**
 * Creates the backing reader. Runs at most once per successful open.
 */
using ReaderInitializer = std::function<Result<std::unique_ptr<EntryReader>>()>;

struct SourceDetection {
    SourceKind kind = SourceKind::None;
    fs::path path;
    fs::path index_path;
    ReaderInitializer initializer;
};

/**
 * Choose a backing format among the candidate file names. Never fails: when
 * nothing usable exists the initializer reports NoValidSource on first use.
 */
SourceDetection detect_format(const fs::path& base_path, const std::vector<std::string>& file_names,
                              const FileOptions& options);

class AssetFile {
public:
    AssetFile(const fs::path& base_path, const std::vector<std::string>& file_names, FileOptions options = {});
    
    /**
     * Use a custom initializer instead of format detection.
     */
    AssetFile(std::string description, ReaderInitializer initializer, FileOptions options = {});
    
    ~AssetFile();
    
    AssetFile(const AssetFile&) = delete;
    AssetFile& operator=(const AssetFile&) = delete;
    
    /**
     * Create the backing reader if it does not exist yet. Concurrent callers
     * wait for a single initialization; a failed one may be retried.
     */
    Result<void> open();
    
    /**
     * Read one entry. A patch for the index wins over the backing reader.
     */
    Result<std::vector<uint8_t>> read(uint32_t index);
    
    Result<uint64_t> extra(uint32_t index);
    
    /**
     * Sorted union of the reader's valid indices and the patched indices.
     */
    Result<std::vector<uint32_t>> entries();
    
    void add_patch(uint32_t index, std::vector<uint8_t> data);
    void add_patch(uint32_t index, const uint8_t* data, size_t size);
    bool remove_patch(uint32_t index);
    bool has_patch(uint32_t index) const;
    size_t patch_count() const;
    
    /**
     * Close the backing reader and drop all patches. Idempotent.
     */
    void close();
    
    bool is_ready() const;
    bool is_closed() const;
    
    SourceKind source_kind() const { return kind_; }
    const fs::path& path() const { return path_; }
    const fs::path& index_path() const { return index_path_; }
    const std::string& description() const { return description_; }

private:
    enum class State { New, Initializing, Ready, Closed };
    
    Result<std::shared_ptr<EntryReader>> acquire();
    Result<std::unique_ptr<EntryReader>> run_initializer();
    void apply_patches(FileOptions& options);
    
    SourceKind kind_ = SourceKind::None;
    fs::path path_;
    fs::path index_path_;
    std::string description_;
    ReaderInitializer initializer_;
    
    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    State state_ = State::New;
    std::shared_ptr<EntryReader> reader_;
    
    mutable std::shared_mutex patch_mutex_;
    std::unordered_map<uint32_t, std::vector<uint8_t>> patches_;
};

} // namespace ultima
