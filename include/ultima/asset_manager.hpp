/**
 * Ultima Assets - Asset Manager
 * 
 * Owns the asset files of one client directory and hands out shared,
 * lazily opened AssetFile instances.
 */

#pragma once

#include "ultima/asset_file.hpp"
#include "ultima/file_config.hpp"
#include "ultima/name_table.hpp"
#include "ultima/result.hpp"
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ultima {

class AssetManager {
public:
    /**
     * Open a client directory. FileNotFound if it does not exist,
     * InvalidArgument if it is not a directory.
     */
    static Result<std::unique_ptr<AssetManager>> open(const fs::path& directory,
                                                      FileCatalog catalog = FileCatalog::defaults(),
                                                      std::shared_ptr<const NameTable> names = nullptr);
    
    ~AssetManager();
    
    AssetManager(const AssetManager&) = delete;
    AssetManager& operator=(const AssetManager&) = delete;
    
    /**
     * Get the file stored under any of the given names, creating it on first
     * request. Files are cached by their first name.
     */
    Result<std::shared_ptr<AssetFile>> load_files(const std::vector<std::string>& file_names,
                                                  const FileOptions& options = {});
    
    /**
     * Get a catalog file, substituting id into its names.
     */
    Result<std::shared_ptr<AssetFile>> load(const std::string& key, int id = 0);
    
    bool is_loaded(const std::string& first_name) const;
    size_t loaded_count() const;
    
    /**
     * Close every loaded file and empty the cache. Idempotent.
     */
    void close();
    bool is_closed() const;
    
    const fs::path& base_path() const { return base_path_; }
    const FileCatalog& catalog() const { return catalog_; }
    const NameTable* names() const { return names_.get(); }

private:
    AssetManager(fs::path base_path, FileCatalog catalog, std::shared_ptr<const NameTable> names);
    
    fs::path base_path_;
    FileCatalog catalog_;
    std::shared_ptr<const NameTable> names_;
    
    mutable std::mutex mutex_;
    bool closed_ = false;
    std::unordered_map<std::string, std::shared_ptr<AssetFile>> files_;  // first name -> file
};

} // namespace ultima
