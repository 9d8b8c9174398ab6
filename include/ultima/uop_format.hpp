/**
 * Ultima Assets - UOP container on-disk layout
 *
 * All fields are little-endian.
 *
 *   Header (28 bytes)  magic, version, signature, first block offset (u64),
 *                      block capacity, entry count
 *   Block  (12 bytes)  file count, next block offset (u64), then
 *                      file count * 34-byte entry records
 *   Entry  (34 bytes)  data offset (u64), header size, compressed size,
 *                      decompressed size, name hash (u64), checksum,
 *                      compression flag (i16)
 *
 * Blocks form a singly linked list terminated by a next offset of zero.
 */

#pragma once

#include "ultima/endian.hpp"
#include <cstdint>
#include <cstddef>

namespace ultima {

// "MYP\0"
constexpr uint32_t UOP_MAGIC = 0x50594D;

constexpr size_t UOP_HEADER_SIZE = 28;
constexpr size_t UOP_BLOCK_HEADER_SIZE = 12;
constexpr size_t UOP_ENTRY_SIZE = 34;
constexpr size_t UOP_EXTRA_SIZE = 8;

// Extra word reported for entries without an inline extra header
constexpr uint64_t UOP_INVALID_EXTRA = uint64_t(0x0FFFFFFF) | (uint64_t(0x0FFFFFFF) << 32);

struct UopHeader {
    uint32_t magic = 0;
    uint32_t version = 0;
    uint32_t signature = 0;
    uint64_t first_block = 0;
    uint32_t block_capacity = 0;
    uint32_t entry_count = 0;
};

struct UopBlockHeader {
    uint32_t file_count = 0;
    uint64_t next_block = 0;
};

/**
 * One parsed entry record. Extra words are filled in at open time when the
 * reader is configured for inline extra headers.
 */
struct UopRawEntry {
    uint64_t offset = 0;
    uint32_t header_size = 0;
    uint32_t compressed_size = 0;
    uint32_t decompressed_size = 0;
    uint64_t hash = 0;
    uint32_t checksum = 0;
    int16_t compression = 0;
    
    bool has_extra = false;
    uint32_t extra1 = 0;
    uint32_t extra2 = 0;
};

/**
 * Decode a header from UOP_HEADER_SIZE bytes.
 */
inline UopHeader parse_uop_header(const uint8_t* p) {
    UopHeader header;
    header.magic = read_le32(p);
    header.version = read_le32(p + 4);
    header.signature = read_le32(p + 8);
    header.first_block = read_le64(p + 12);
    header.block_capacity = read_le32(p + 20);
    header.entry_count = read_le32(p + 24);
    return header;
}

inline UopBlockHeader parse_uop_block_header(const uint8_t* p) {
    UopBlockHeader block;
    block.file_count = read_le32(p);
    block.next_block = read_le64(p + 4);
    return block;
}

/**
 * Decode an entry record from UOP_ENTRY_SIZE bytes.
 */
inline UopRawEntry parse_uop_entry(const uint8_t* p) {
    UopRawEntry entry;
    entry.offset = read_le64(p);
    entry.header_size = read_le32(p + 8);
    entry.compressed_size = read_le32(p + 12);
    entry.decompressed_size = read_le32(p + 16);
    entry.hash = read_le64(p + 20);
    entry.checksum = read_le32(p + 28);
    entry.compression = static_cast<int16_t>(read_le16(p + 32));
    return entry;
}

} // namespace ultima
