/**
 * Ultima Assets - File configuration
 *
 * Options for opening one logical asset file, the catalog of the client's
 * standard files, and the JSON form of both.
 */

#pragma once

#include "ultima/logging.hpp"
#include "ultima/mul_reader.hpp"
#include "ultima/result.hpp"
#include "ultima/uop_reader.hpp"
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>

namespace ultima {

/**
 * Configuration surface of an AssetFile.
 */
struct FileOptions {
    // Container settings
    uint32_t count = 0;                  // Entry-count estimate, 0 = container header
    uint32_t index_length = 0xFFFFFFFF;  // Index-table length override
    std::string extension = ".dat";
    bool has_extra = false;
    bool extra_uncompressed = false;     // Extra header on stored entries as well
    bool strict = false;
    
    // Legacy file settings
    uint32_t entry_size = 12;
    uint32_t chunk_size = 0;
    MulDecoder decoder;
    
    // Byte overrides applied at construction
    std::map<uint32_t, std::vector<uint8_t>> patches;
    
    UopOptions uop_options() const;
    MulOptions mul_options() const;
};

/**
 * One logical asset file and the on-disk names it may be stored under.
 * Names may contain "{id}" for per-map or per-body files.
 */
struct FileSpec {
    std::string key;
    std::vector<std::string> names;
    FileOptions options;
    
    std::vector<std::string> resolve(int id) const;
};

/**
 * Logging settings, usually read from the "log" object of a catalog file.
 */
struct LogConfig {
    LogLevel level = LogLevel::Info;
    bool console = false;
    std::filesystem::path file;
    
    static Result<LogConfig> parse(std::string_view json);
    void apply() const;
};

Result<LogLevel> parse_log_level(std::string_view name);

class FileCatalog {
public:
    /**
     * Built-in catalog of the standard client files.
     */
    static FileCatalog defaults();
    
    /**
     * Read a catalog from JSON:
     *   { "files": { "<key>": { "names": [...], "count": N, "extension": ".tga",
     *                           "index_length": N, "extra": bool, "strict": bool,
     *                           "entry_size": N, "chunk_size": N } } }
     */
    static Result<FileCatalog> parse(std::string_view json);
    static Result<FileCatalog> load(const std::filesystem::path& path);
    
    void add(FileSpec spec);
    const FileSpec* find(const std::string& key) const;
    std::vector<std::string> keys() const;
    size_t size() const { return specs_.size(); }
    
    /**
     * Add the entries of other, replacing those with the same key.
     */
    void merge(const FileCatalog& other);

private:
    std::map<std::string, FileSpec> specs_;
};

} // namespace ultima
