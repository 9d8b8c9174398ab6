/**
 * Ultima Assets - UOP Reader Implementation
 * 
 * Container layout (see uop_format.hpp):
 * - 28-byte header with the first block offset
 * - linked list of blocks, each holding up to block_capacity entry records
 * - entries are located by hashing "build/<pattern>/<index><ext>"
 */

#include "ultima/uop_reader.hpp"
#include "ultima/compression.hpp"
#include "ultima/logging.hpp"
#include "ultima/name_hash.hpp"
#include "ultima/path_utils.hpp"

#include <algorithm>
#include <mutex>
#include <sstream>
#include <unordered_set>

namespace ultima {

namespace {

std::string hex(uint64_t value) {
    std::ostringstream ss;
    ss << "0x" << std::hex << std::uppercase << value;
    return ss.str();
}

} // namespace

UopReader::UopReader(fs::path path, UopOptions options)
    : path_(std::move(path))
    , pattern_(stem_lower(path_))
    , options_(std::move(options)) {
}

UopReader::~UopReader() {
    close();
}

Result<std::unique_ptr<UopReader>> UopReader::open(const fs::path& path, UopOptions options) {
    LOG_DEBUG("UopReader", "Opening: " << path.string());
    
    std::unique_ptr<UopReader> reader(new UopReader(path, std::move(options)));
    
    auto opened = reader->file_.open(path);
    if (!opened) {
        LOG_ERROR("UopReader", "Failed to open file: " << opened.error().full_message());
        return opened.error();
    }
    
    auto parsed = reader->parse();
    if (!parsed) {
        LOG_ERROR("UopReader", "Failed to parse " << path.filename().string()
                  << ": " << parsed.error().full_message());
        reader->file_.close();
        return parsed.error();
    }
    
    LOG_INFO("UopReader", "Opened: " << path.filename().string()
             << " (" << reader->raw_entry_count() << " records, "
             << reader->entry_count() << " logical entries)");
    
    return reader;
}

Result<void> UopReader::parse() {
    auto header_bytes = file_.read_at(0, UOP_HEADER_SIZE);
    if (!header_bytes) {
        return header_bytes.error();
    }
    if (header_bytes->size() < UOP_HEADER_SIZE) {
        return Error::invalid_format("Truncated UOP header", path_.string());
    }
    
    header_ = parse_uop_header(header_bytes->data());
    if (header_.magic != UOP_MAGIC) {
        return Error::invalid_format("Invalid UOP magic " + hex(header_.magic), path_.string());
    }
    
    LOG_DEBUG("UopReader", "Header: version=" << header_.version
              << " first_block=" << header_.first_block
              << " block_capacity=" << header_.block_capacity
              << " entry_count=" << header_.entry_count);
    
    std::unique_lock<std::shared_mutex> lock(mutex_);
    TRY(parse_blocks());
    
    uint32_t length = options_.length > 0 ? options_.length : header_.entry_count;
    return build_index(length);
}

Result<void> UopReader::parse_blocks() {
    std::unordered_set<uint64_t> visited;
    uint64_t next_block = header_.first_block;
    
    while (next_block != 0) {
        if (!visited.insert(next_block).second) {
            return Error::invalid_format("Block chain loops back to offset " + std::to_string(next_block),
                                         path_.string());
        }
        
        auto block_bytes = file_.read_exact(next_block, UOP_BLOCK_HEADER_SIZE);
        if (!block_bytes) {
            return Error::io_error("Failed to read block header at offset " + std::to_string(next_block),
                                   path_.string());
        }
        
        UopBlockHeader block = parse_uop_block_header(block_bytes->data());
        if (block.file_count > header_.block_capacity) {
            return Error::invalid_format("Block fileCount " + std::to_string(block.file_count) +
                                         " exceeds blockCapacity " + std::to_string(header_.block_capacity),
                                         path_.string());
        }
        
        TRY_ASSIGN(records, file_.read_at(next_block + UOP_BLOCK_HEADER_SIZE,
                                          static_cast<size_t>(block.file_count) * UOP_ENTRY_SIZE));
        
        // A final block cut short by end-of-file keeps its complete records
        size_t complete = records.size() / UOP_ENTRY_SIZE;
        if (complete < block.file_count) {
            LOG_WARNING("UopReader", "Block at " << next_block << " truncated by end of file: "
                        << complete << " of " << block.file_count << " records");
        }
        
        for (size_t i = 0; i < complete; ++i) {
            UopRawEntry entry = parse_uop_entry(records.data() + i * UOP_ENTRY_SIZE);
            
            // Placeholder slot
            if (entry.offset == 0) {
                continue;
            }
            
            uint32_t slot = static_cast<uint32_t>(arena_.size());
            arena_.push_back(entry);
            by_hash_[entry.hash] = slot;
        }
        
        next_block = block.next_block;
    }
    
    return Result<void>::success();
}

Result<void> UopReader::build_index(uint32_t length) {
    std::unordered_map<uint64_t, uint32_t> expected;
    expected.reserve(length);
    for (uint32_t i = 0; i < length; ++i) {
        expected[hash_file_name(format_entry_name(pattern_, i, options_.extension))] = i;
    }
    
    std::vector<uint32_t> logical(length, NO_ENTRY);
    size_t unmatched = 0;
    
    for (const auto& [hash, slot] : by_hash_) {
        auto it = expected.find(hash);
        if (it == expected.end()) {
            if (options_.strict) {
                return Error::invalid_format("Record with hash " + hex(hash) + " matches no expected entry name",
                                             path_.string());
            }
            ++unmatched;
            continue;
        }
        
        if (it->second > options_.index_length) {
            return Error::invalid_format("Logical index " + std::to_string(it->second) +
                                         " exceeds index length " + std::to_string(options_.index_length),
                                         path_.string());
        }
        
        TRY(load_extra(arena_[slot]));
        logical[it->second] = slot;
    }
    
    if (unmatched > 0) {
        LOG_WARNING("UopReader", path_.filename().string() << ": " << unmatched
                    << " records did not match any of " << length << " expected names");
    }
    
    logical_ = std::move(logical);
    return Result<void>::success();
}

Result<void> UopReader::load_extra(UopRawEntry& raw) {
    if (!options_.has_extra || raw.has_extra) {
        return Result<void>::success();
    }
    // Default: compressed entries only. extra_uncompressed: every tag except 3
    bool applies = options_.extra_uncompressed ? raw.compression != 3 : raw.compression != 0;
    if (!applies) {
        return Result<void>::success();
    }
    
    auto extra = file_.read_exact(raw.offset + raw.header_size, UOP_EXTRA_SIZE);
    if (!extra) {
        return Error::io_error("Failed to read extra header for hash " + hex(raw.hash), path_.string());
    }
    raw.has_extra = true;
    raw.extra1 = read_le32(extra->data());
    raw.extra2 = read_le32(extra->data() + 4);
    return Result<void>::success();
}

UopEntry UopReader::logical_entry(const UopRawEntry& raw) const {
    UopEntry entry;
    entry.offset = raw.offset + raw.header_size;
    entry.length = raw.compressed_size;
    entry.decompressed_length = raw.decompressed_size;
    entry.compression = static_cast<uint8_t>(raw.compression);
    
    if (raw.has_extra) {
        entry.offset += UOP_EXTRA_SIZE;
        entry.length = raw.compressed_size >= UOP_EXTRA_SIZE
            ? raw.compressed_size - static_cast<uint32_t>(UOP_EXTRA_SIZE) : 0;
        entry.extra1 = raw.extra1;
        entry.extra2 = raw.extra2;
    }
    
    return entry;
}

Result<UopEntry> UopReader::resolve(uint32_t index) const {
    if (closed_) {
        return Error::reader_closed(path_.string());
    }
    if (index >= logical_.size()) {
        return Error::invalid_index(index);
    }
    
    uint32_t slot = logical_[index];
    if (slot == NO_ENTRY) {
        return Error::entry_not_found(index);
    }
    
    UopEntry entry = logical_entry(arena_[slot]);
    if (!entry.valid()) {
        return Error::entry_not_found(index);
    }
    return entry;
}

Result<std::vector<uint8_t>> UopReader::read_entry(const UopEntry& entry,
                                                   std::shared_lock<std::shared_mutex>& lock) {
    auto data = file_.read_at(entry.offset, entry.length);
    lock.unlock();
    
    if (!data) {
        return data.error();
    }
    
    auto decoded = decompress_entry(std::move(data.value()), entry.compression, entry.decompressed_length);
    if (!decoded) {
        LOG_DEBUG("UopReader", "Decode failed at offset " << entry.offset << " ("
                  << compression_type_string(static_cast<CompressionType>(entry.compression))
                  << "): " << decoded.error().message);
    }
    return decoded;
}

Result<std::vector<uint8_t>> UopReader::read(uint32_t index) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    TRY_ASSIGN(entry, resolve(index));
    return read_entry(entry, lock);
}

Result<uint64_t> UopReader::extra(uint32_t index) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    TRY_ASSIGN(entry, resolve(index));
    return entry.extra();
}

Result<UopEntry> UopReader::entry(uint32_t index) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return resolve(index);
}

std::vector<uint32_t> UopReader::entries() const {
    std::vector<uint32_t> result;
    for_each_entry([&result](uint32_t index) {
        result.push_back(index);
        return true;
    });
    return result;
}

void UopReader::for_each_entry(const EntryVisitor& visitor) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (closed_) {
        return;
    }
    
    for (uint32_t i = 0; i < logical_.size(); ++i) {
        if (logical_[i] == NO_ENTRY || !logical_entry(arena_[logical_[i]]).valid()) {
            continue;
        }
        if (!visitor(i)) {
            return;
        }
    }
}

Result<void> UopReader::setup_entries(uint32_t length) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (closed_) {
        return Error::reader_closed(path_.string());
    }
    return build_index(length > 0 ? length : header_.entry_count);
}

std::optional<UopRawEntry> UopReader::find_by_hash(uint64_t hash) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (closed_) {
        return std::nullopt;
    }
    
    auto it = by_hash_.find(hash);
    if (it == by_hash_.end()) {
        return std::nullopt;
    }
    return arena_[it->second];
}

Result<std::vector<uint8_t>> UopReader::read_by_hash(uint64_t hash) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (closed_) {
        return Error::reader_closed(path_.string());
    }
    
    auto it = by_hash_.find(hash);
    if (it == by_hash_.end()) {
        return Error(Error::Code::EntryNotFound, "Entry not found", hex(hash));
    }
    
    UopEntry entry = logical_entry(arena_[it->second]);
    if (!entry.valid()) {
        return Error(Error::Code::EntryNotFound, "Entry not found", hex(hash));
    }
    return read_entry(entry, lock);
}

Result<std::vector<uint8_t>> UopReader::read_by_name(std::string_view name) {
    return read_by_hash(hash_file_name(name));
}

void UopReader::close() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (closed_) {
        return;
    }
    
    closed_ = true;
    arena_.clear();
    by_hash_.clear();
    logical_.clear();
    file_.close();
    
    LOG_DEBUG("UopReader", "Closed: " << path_.filename().string());
}

bool UopReader::is_closed() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return closed_;
}

size_t UopReader::entry_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return logical_.size();
}

size_t UopReader::raw_entry_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return arena_.size();
}

} // namespace ultima
