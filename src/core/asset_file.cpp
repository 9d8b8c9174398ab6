/**
 * Ultima Assets - Asset file implementation
 */

#include "ultima/asset_file.hpp"
#include "ultima/logging.hpp"
#include "ultima/mul_reader.hpp"
#include "ultima/path_utils.hpp"
#include "ultima/uop_reader.hpp"

#include <algorithm>
#include <sstream>

namespace ultima {

namespace {

bool is_index_name(const std::string& name) {
    return name_starts_with(name, "staidx") || name_ends_with(name, "idx.mul") || name_ends_with(name, ".idx");
}

bool is_data_name(const std::string& name) {
    return name_ends_with(name, ".mul") && !name_ends_with(name, "idx.mul");
}

std::string join_names(const std::vector<std::string>& names) {
    std::ostringstream ss;
    ss << '[';
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << names[i];
    }
    ss << ']';
    return ss.str();
}

ReaderInitializer single_initializer(fs::path path, MulOptions options) {
    return [path = std::move(path), options = std::move(options)]() -> Result<std::unique_ptr<EntryReader>> {
        auto reader = MulReader::open_one(path, options);
        if (!reader) return reader.error();
        return std::unique_ptr<EntryReader>(std::move(reader.value()));
    };
}

} // namespace

const char* source_kind_string(SourceKind kind) {
    switch (kind) {
        case SourceKind::None:          return "None";
        case SourceKind::Container:     return "Container";
        case SourceKind::LegacyIndexed: return "LegacyIndexed";
        case SourceKind::LegacySingle:  return "LegacySingle";
        default:                        return "Unknown";
    }
}

SourceDetection detect_format(const fs::path& base_path, const std::vector<std::string>& file_names,
                              const FileOptions& options) {
    SourceDetection result;
    
    // Localization tables are single files read by a custom decoder
    for (const auto& name : file_names) {
        fs::path candidate = base_path / name;
        if (name_starts_with(name, "cliloc.") && file_exists(candidate)) {
            result.kind = SourceKind::LegacySingle;
            result.path = candidate;
            result.initializer = single_initializer(candidate, options.mul_options());
            return result;
        }
    }
    
    for (const auto& name : file_names) {
        fs::path candidate = base_path / name;
        if (name_ends_with(name, ".uop") && file_exists(candidate)) {
            result.kind = SourceKind::Container;
            result.path = candidate;
            result.initializer = [candidate, uop = options.uop_options()]() -> Result<std::unique_ptr<EntryReader>> {
                auto reader = UopReader::open(candidate, uop);
                if (!reader) return reader.error();
                return std::unique_ptr<EntryReader>(std::move(reader.value()));
            };
            return result;
        }
    }
    
    fs::path data_path;
    fs::path index_path;
    for (const auto& name : file_names) {
        fs::path candidate = base_path / name;
        if (!file_exists(candidate)) {
            continue;
        }
        if (is_index_name(name)) {
            index_path = candidate;
        } else if (is_data_name(name)) {
            data_path = candidate;
        }
    }
    
    if (!data_path.empty() && !index_path.empty()) {
        result.kind = SourceKind::LegacyIndexed;
        result.path = data_path;
        result.index_path = index_path;
        result.initializer = [data_path, index_path, mul = options.mul_options()]() -> Result<std::unique_ptr<EntryReader>> {
            auto reader = MulReader::open(data_path, index_path, mul);
            if (!reader) return reader.error();
            return std::unique_ptr<EntryReader>(std::move(reader.value()));
        };
        return result;
    }
    
    if (!data_path.empty()) {
        result.kind = SourceKind::LegacySingle;
        result.path = data_path;
        result.initializer = single_initializer(data_path, options.mul_options());
        return result;
    }
    
    result.kind = SourceKind::None;
    result.path = file_names.empty() ? base_path : base_path / file_names.front();
    std::string message = "Could not find valid files among " + join_names(file_names);
    std::string where = base_path.string();
    result.initializer = [message, where]() -> Result<std::unique_ptr<EntryReader>> {
        return Error::no_valid_source(message, where);
    };
    return result;
}

AssetFile::AssetFile(const fs::path& base_path, const std::vector<std::string>& file_names, FileOptions options) {
    SourceDetection detection = detect_format(base_path, file_names, options);
    kind_ = detection.kind;
    path_ = std::move(detection.path);
    index_path_ = std::move(detection.index_path);
    description_ = path_.string();
    initializer_ = std::move(detection.initializer);
    apply_patches(options);
    
    LOG_DEBUG("AssetFile", "Detected " << source_kind_string(kind_) << " source for "
              << (file_names.empty() ? std::string("<none>") : file_names.front()));
}

AssetFile::AssetFile(std::string description, ReaderInitializer initializer, FileOptions options)
    : description_(std::move(description))
    , initializer_(std::move(initializer)) {
    apply_patches(options);
}

AssetFile::~AssetFile() {
    close();
}

void AssetFile::apply_patches(FileOptions& options) {
    for (auto& [index, data] : options.patches) {
        patches_[index] = std::move(data);
    }
}

Result<std::unique_ptr<EntryReader>> AssetFile::run_initializer() {
    if (!initializer_) {
        return Error::no_valid_source("No initializer configured", description_);
    }
    try {
        return initializer_();
    } catch (const std::exception& e) {
        return Error(Error::Code::Unknown, std::string("Initializer failed: ") + e.what(), description_);
    } catch (...) {
        return Error(Error::Code::Unknown, "Initializer failed with an unknown exception", description_);
    }
}

Result<std::shared_ptr<EntryReader>> AssetFile::acquire() {
    std::unique_lock<std::mutex> lock(state_mutex_);
    
    while (state_ == State::Initializing) {
        state_cv_.wait(lock);
    }
    if (state_ == State::Ready) {
        return reader_;
    }
    if (state_ == State::Closed) {
        return Error::reader_closed(description_);
    }
    
    state_ = State::Initializing;
    lock.unlock();
    
    auto created = run_initializer();
    
    lock.lock();
    if (state_ == State::Closed) {
        // close() ran while we were initializing
        lock.unlock();
        if (created) {
            created.value()->close();
        }
        return Error::reader_closed(description_);
    }
    
    if (!created) {
        state_ = State::New;
        state_cv_.notify_all();
        lock.unlock();
        LOG_WARNING("AssetFile", "Failed to initialize " << description_ << ": ["
                    << error_code_string(created.error().code) << "] " << created.error().full_message());
        return created.error();
    }
    
    reader_ = std::shared_ptr<EntryReader>(std::move(created.value()));
    state_ = State::Ready;
    state_cv_.notify_all();
    return reader_;
}

Result<void> AssetFile::open() {
    auto reader = acquire();
    if (!reader) {
        return reader.error();
    }
    return Result<void>::success();
}

Result<std::vector<uint8_t>> AssetFile::read(uint32_t index) {
    if (is_closed()) {
        return Error::reader_closed(description_);
    }
    
    {
        std::shared_lock<std::shared_mutex> lock(patch_mutex_);
        auto it = patches_.find(index);
        if (it != patches_.end()) {
            return it->second;
        }
    }
    
    TRY_ASSIGN(reader, acquire());
    return reader->read(index);
}

Result<uint64_t> AssetFile::extra(uint32_t index) {
    TRY_ASSIGN(reader, acquire());
    return reader->extra(index);
}

Result<std::vector<uint32_t>> AssetFile::entries() {
    TRY_ASSIGN(reader, acquire());
    
    std::vector<uint32_t> result = reader->entries();
    {
        std::shared_lock<std::shared_mutex> lock(patch_mutex_);
        result.reserve(result.size() + patches_.size());
        for (const auto& [index, data] : patches_) {
            result.push_back(index);
        }
    }
    
    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

void AssetFile::add_patch(uint32_t index, std::vector<uint8_t> data) {
    std::unique_lock<std::shared_mutex> lock(patch_mutex_);
    patches_[index] = std::move(data);
}

void AssetFile::add_patch(uint32_t index, const uint8_t* data, size_t size) {
    add_patch(index, std::vector<uint8_t>(data, data + size));
}

bool AssetFile::remove_patch(uint32_t index) {
    std::unique_lock<std::shared_mutex> lock(patch_mutex_);
    return patches_.erase(index) != 0;
}

bool AssetFile::has_patch(uint32_t index) const {
    std::shared_lock<std::shared_mutex> lock(patch_mutex_);
    return patches_.count(index) != 0;
}

size_t AssetFile::patch_count() const {
    std::shared_lock<std::shared_mutex> lock(patch_mutex_);
    return patches_.size();
}

void AssetFile::close() {
    std::shared_ptr<EntryReader> reader;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == State::Closed) {
            return;
        }
        state_ = State::Closed;
        reader = std::move(reader_);
        state_cv_.notify_all();
    }
    
    {
        std::unique_lock<std::shared_mutex> lock(patch_mutex_);
        patches_.clear();
    }
    
    if (reader) {
        reader->close();
        LOG_DEBUG("AssetFile", "Closed " << description_);
    }
}

bool AssetFile::is_ready() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_ == State::Ready;
}

bool AssetFile::is_closed() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_ == State::Closed;
}

} // namespace ultima
