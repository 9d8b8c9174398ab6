/**
 * Ultima Assets - Asset Manager Implementation
 */

#include "ultima/asset_manager.hpp"
#include "ultima/logging.hpp"

namespace ultima {

Result<std::unique_ptr<AssetManager>> AssetManager::open(const fs::path& directory, FileCatalog catalog,
                                                         std::shared_ptr<const NameTable> names) {
    std::error_code ec;
    if (!fs::exists(directory, ec)) {
        return Error::file_not_found(directory.string());
    }
    if (!fs::is_directory(directory, ec)) {
        return Error::invalid_argument("Not a directory: " + directory.string());
    }
    
    std::unique_ptr<AssetManager> manager(new AssetManager(directory, std::move(catalog), std::move(names)));
    LOG_INFO("AssetManager", "Opened " << directory.string() << " (" << manager->catalog_.size() << " known files)");
    return manager;
}

AssetManager::AssetManager(fs::path base_path, FileCatalog catalog, std::shared_ptr<const NameTable> names)
    : base_path_(std::move(base_path))
    , catalog_(std::move(catalog))
    , names_(std::move(names)) {
}

AssetManager::~AssetManager() {
    close();
}

Result<std::shared_ptr<AssetFile>> AssetManager::load_files(const std::vector<std::string>& file_names,
                                                            const FileOptions& options) {
    if (file_names.empty()) {
        return Error::invalid_argument("No file names given");
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return Error::reader_closed(base_path_.string());
    }
    
    const std::string& key = file_names.front();
    auto it = files_.find(key);
    if (it != files_.end()) {
        return it->second;
    }
    
    // Detection only stats files, so it is fine under the lock
    auto file = std::make_shared<AssetFile>(base_path_, file_names, options);
    files_.emplace(key, file);
    
    LOG_DEBUG("AssetManager", "Registered " << key << " as " << source_kind_string(file->source_kind()));
    return file;
}

Result<std::shared_ptr<AssetFile>> AssetManager::load(const std::string& key, int id) {
    const FileSpec* spec = catalog_.find(key);
    if (!spec) {
        return Error::invalid_argument("Unknown file key: " + key);
    }
    return load_files(spec->resolve(id), spec->options);
}

bool AssetManager::is_loaded(const std::string& first_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_.count(first_name) != 0;
}

size_t AssetManager::loaded_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_.size();
}

void AssetManager::close() {
    std::unordered_map<std::string, std::shared_ptr<AssetFile>> files;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        files.swap(files_);
    }
    
    for (auto& [name, file] : files) {
        file->close();
    }
    LOG_INFO("AssetManager", "Closed " << files.size() << " files");
}

bool AssetManager::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

} // namespace ultima
