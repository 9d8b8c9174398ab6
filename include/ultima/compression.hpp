/**
 * Ultima Assets - Compression utilities
 */

#pragma once

#include "ultima/result.hpp"
#include <vector>
#include <cstdint>
#include <cstddef>

namespace ultima {

/**
 * Compression tag stored with each container entry.
 */
enum class CompressionType : uint8_t {
    None = 0,
    Zlib = 1,
    Mythic = 2   // Run-length scheme used by newer clients
};

const char* compression_type_string(CompressionType type);

/**
 * Decode an entry payload according to its compression tag.
 * Unknown tags are reported as CompressionError.
 */
Result<std::vector<uint8_t>> decompress_entry(const uint8_t* data, size_t size, uint8_t tag,
                                              size_t size_hint = 0);
Result<std::vector<uint8_t>> decompress_entry(std::vector<uint8_t> data, uint8_t tag,
                                              size_t size_hint = 0);

/**
 * Streaming zlib inflate. The output size does not need to be known;
 * size_hint only pre-sizes the buffer.
 */
Result<std::vector<uint8_t>> decompress_zlib(const uint8_t* data, size_t size, size_t size_hint = 0);
Result<std::vector<uint8_t>> decompress_zlib(const std::vector<uint8_t>& data, size_t size_hint = 0);

/**
 * Mythic run-length decode.
 *
 * Layout: u32 decompressed size, then a sequence of
 *   (0, n, n raw bytes)  - literal copy
 *   (c, b)               - byte b repeated c times
 * Every copy is bounds-checked against both buffers and the produced size
 * must match the declared size exactly.
 */
Result<std::vector<uint8_t>> decompress_mythic(const uint8_t* data, size_t size);
Result<std::vector<uint8_t>> decompress_mythic(const std::vector<uint8_t>& data);

/**
 * Compress data with zlib (throws std::runtime_error on failure).
 */
std::vector<uint8_t> compress_zlib(const uint8_t* data, size_t size, int level = 6);
std::vector<uint8_t> compress_zlib(const std::vector<uint8_t>& data, int level = 6);

} // namespace ultima
