/**
 * Ultima Assets - MUL Reader Implementation
 */

#include "ultima/mul_reader.hpp"
#include "ultima/logging.hpp"
#include "ultima/endian.hpp"

#include <mutex>

namespace ultima {

MulReader::MulReader(fs::path path, MulOptions options)
    : path_(std::move(path))
    , options_(std::move(options)) {
}

MulReader::~MulReader() {
    close();
}

Result<std::unique_ptr<MulReader>> MulReader::open(const fs::path& data_path, const fs::path& index_path,
                                                   MulOptions options) {
    if (options.entry_size < 12) {
        return Error::invalid_argument("Index entry size must be at least 12 bytes, got " +
                                       std::to_string(options.entry_size));
    }
    
    std::unique_ptr<MulReader> reader(new MulReader(data_path, std::move(options)));
    TRY(reader->file_.open(data_path));
    
    auto loaded = reader->load_index(index_path);
    if (!loaded) {
        LOG_ERROR("MulReader", "Failed to load index " << index_path.filename().string()
                  << ": " << loaded.error().full_message());
        reader->file_.close();
        return loaded.error();
    }
    
    LOG_INFO("MulReader", "Opened: " << data_path.filename().string() << " + "
             << index_path.filename().string() << " (" << reader->entries_.size() << " entries)");
    return reader;
}

Result<std::unique_ptr<MulReader>> MulReader::open_one(const fs::path& data_path, MulOptions options) {
    std::unique_ptr<MulReader> reader(new MulReader(data_path, std::move(options)));
    TRY(reader->file_.open(data_path));
    
    Result<void> loaded;
    if (reader->options_.decoder) {
        loaded = reader->load_decoded();
    } else if (reader->options_.chunk_size > 0) {
        loaded = reader->load_chunks();
    } else {
        loaded = reader->load_whole();
    }
    
    if (!loaded) {
        LOG_ERROR("MulReader", "Failed to load " << data_path.filename().string()
                  << ": " << loaded.error().full_message());
        reader->file_.close();
        return loaded.error();
    }
    
    LOG_INFO("MulReader", "Opened: " << data_path.filename().string()
             << " (" << reader->entries_.size() << " entries, no index)");
    return reader;
}

void MulReader::add(uint32_t id, uint32_t offset, uint32_t length, uint32_t extra, std::vector<uint8_t> value) {
    auto it = lookup_.find(id);
    if (it != lookup_.end()) {
        entries_[it->second] = Entry{id, offset, length, extra, std::move(value)};
        return;
    }
    lookup_.emplace(id, entries_.size());
    entries_.push_back(Entry{id, offset, length, extra, std::move(value)});
}

Result<void> MulReader::load_index(const fs::path& index_path) {
    RandomAccessFile index;
    TRY(index.open(index_path));
    
    TRY_ASSIGN(data, index.read_at(0, static_cast<size_t>(index.size())));
    index.close();
    
    const size_t record = options_.entry_size;
    const size_t count = data.size() / record;
    entries_.reserve(count);
    
    for (size_t i = 0; i < count; ++i) {
        const uint8_t* p = data.data() + i * record;
        add(static_cast<uint32_t>(i), read_le32(p), read_le32(p + 4), read_le32(p + 8), {});
    }
    
    if (data.size() % record != 0) {
        LOG_WARNING("MulReader", index_path.filename().string() << ": ignoring "
                    << data.size() % record << " trailing bytes");
    }
    
    return Result<void>::success();
}

Result<void> MulReader::load_chunks() {
    const uint64_t chunk = options_.chunk_size;
    const uint64_t count = file_.size() / chunk;
    if (count == 0) {
        return Error::invalid_format("File too small for chunk size " + std::to_string(chunk), path_.string());
    }
    
    entries_.reserve(static_cast<size_t>(count));
    for (uint64_t i = 0; i < count; ++i) {
        add(static_cast<uint32_t>(i), static_cast<uint32_t>(i * chunk), static_cast<uint32_t>(chunk), 0, {});
    }
    return Result<void>::success();
}

Result<void> MulReader::load_decoded() {
    TRY_ASSIGN(data, file_.read_at(0, static_cast<size_t>(file_.size())));
    
    MulAddFn add_fn = [this](uint32_t id, uint32_t offset, uint32_t length, uint32_t extra,
                             std::vector<uint8_t> value) {
        add(id, offset, length, extra, std::move(value));
    };
    
    return options_.decoder(data, add_fn);
}

Result<void> MulReader::load_whole() {
    TRY_ASSIGN(data, file_.read_at(0, static_cast<size_t>(file_.size())));
    
    uint32_t length = static_cast<uint32_t>(data.size());
    add(0, 0, length, 0, std::move(data));
    return Result<void>::success();
}

Result<const MulReader::Entry*> MulReader::lookup(uint32_t index) const {
    if (closed_) {
        return Error::reader_closed(path_.string());
    }
    
    auto it = lookup_.find(index);
    if (it == lookup_.end()) {
        return Error::invalid_index(index);
    }
    
    const Entry& entry = entries_[it->second];
    if (!entry.valid()) {
        return Error::entry_not_found(index);
    }
    return &entry;
}

Result<std::vector<uint8_t>> MulReader::read(uint32_t index) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    TRY_ASSIGN(entry, lookup(index));
    
    if (!entry->decoded.empty()) {
        return entry->decoded;
    }
    return file_.read_at(entry->offset, entry->length);
}

Result<uint64_t> MulReader::extra(uint32_t index) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    TRY_ASSIGN(entry, lookup(index));
    return static_cast<uint64_t>(entry->extra);
}

std::vector<uint32_t> MulReader::entries() const {
    std::vector<uint32_t> result;
    for_each_entry([&result](uint32_t index) {
        result.push_back(index);
        return true;
    });
    return result;
}

void MulReader::for_each_entry(const EntryVisitor& visitor) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (closed_) {
        return;
    }
    
    for (const auto& entry : entries_) {
        if (!entry.valid()) {
            continue;
        }
        if (!visitor(entry.id)) {
            return;
        }
    }
}

void MulReader::close() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (closed_) {
        return;
    }
    
    closed_ = true;
    entries_.clear();
    lookup_.clear();
    file_.close();
    
    LOG_DEBUG("MulReader", "Closed: " << path_.filename().string());
}

bool MulReader::is_closed() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return closed_;
}

size_t MulReader::entry_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

} // namespace ultima
