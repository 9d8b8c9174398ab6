/**
 * Ultima Assets - Compression Implementation
 */

#include "ultima/compression.hpp"
#include <zlib.h>
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>

namespace ultima {

namespace {

constexpr size_t ZLIB_CHUNK = 16 * 1024;
// Cap on the pre-allocation taken from an untrusted size hint
constexpr size_t MAX_SIZE_HINT = 64 * 1024 * 1024;

// Helper to convert zlib error code to string
const char* zlib_error_string(int err) {
    switch (err) {
        case Z_OK:            return "Z_OK";
        case Z_STREAM_END:    return "Z_STREAM_END";
        case Z_NEED_DICT:     return "Z_NEED_DICT";
        case Z_ERRNO:         return "Z_ERRNO";
        case Z_STREAM_ERROR:  return "Z_STREAM_ERROR";
        case Z_DATA_ERROR:    return "Z_DATA_ERROR";
        case Z_MEM_ERROR:     return "Z_MEM_ERROR";
        case Z_BUF_ERROR:     return "Z_BUF_ERROR";
        case Z_VERSION_ERROR: return "Z_VERSION_ERROR";
        default:              return "UNKNOWN_ERROR";
    }
}

} // namespace

const char* compression_type_string(CompressionType type) {
    switch (type) {
        case CompressionType::None:   return "none";
        case CompressionType::Zlib:   return "zlib";
        case CompressionType::Mythic: return "mythic";
        default:                      return "unknown";
    }
}

Result<std::vector<uint8_t>> decompress_zlib(const uint8_t* data, size_t size, size_t size_hint) {
    std::vector<uint8_t> result;
    result.reserve(std::min(size_hint, MAX_SIZE_HINT));
    
    z_stream strm = {};
    strm.next_in = const_cast<Bytef*>(data);
    strm.avail_in = static_cast<uInt>(size);
    
    int ret = inflateInit(&strm);
    if (ret != Z_OK) {
        return Error::compression_error(std::string("Failed to initialize zlib decompression: ") +
                                        zlib_error_string(ret));
    }
    
    uint8_t chunk[ZLIB_CHUNK];
    do {
        strm.next_out = chunk;
        strm.avail_out = static_cast<uInt>(sizeof(chunk));
        
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&strm);
            return Error::compression_error(std::string("Zlib decompression failed: ") + zlib_error_string(ret) +
                                            " (input=" + std::to_string(size) + ")");
        }
        
        size_t produced = sizeof(chunk) - strm.avail_out;
        result.insert(result.end(), chunk, chunk + produced);
        
        // Input exhausted without reaching the end of the stream
        if (ret == Z_OK && strm.avail_in == 0 && produced == 0) {
            inflateEnd(&strm);
            return Error::compression_error("Zlib stream truncated (input=" + std::to_string(size) + ")");
        }
    } while (ret != Z_STREAM_END);
    
    inflateEnd(&strm);
    return result;
}

Result<std::vector<uint8_t>> decompress_zlib(const std::vector<uint8_t>& data, size_t size_hint) {
    return decompress_zlib(data.data(), data.size(), size_hint);
}

Result<std::vector<uint8_t>> decompress_mythic(const uint8_t* data, size_t size) {
    if (size < 4) {
        return Error::compression_error("Data too short for mythic decompression");
    }
    
    const uint32_t expected = static_cast<uint32_t>(data[0]) |
                              (static_cast<uint32_t>(data[1]) << 8) |
                              (static_cast<uint32_t>(data[2]) << 16) |
                              (static_cast<uint32_t>(data[3]) << 24);
    if (expected == 0) {
        return Error::compression_error("Invalid mythic decompressed size: 0");
    }
    // Every output byte costs at least 2/255 input bytes, anything larger is corrupt
    if (static_cast<uint64_t>(expected) > static_cast<uint64_t>(size) * 255) {
        return Error::compression_error("Mythic bounds exceeded: declared size " + std::to_string(expected) +
                                        " cannot come from " + std::to_string(size) + " input bytes");
    }
    
    std::vector<uint8_t> result(expected);
    size_t out = 0;
    size_t pos = 4;
    
    while (pos < size && out < expected) {
        const uint8_t flag = data[pos++];
        
        if (flag == 0) {
            // Literal copy
            if (pos >= size) {
                return Error::compression_error("Mythic data incomplete at position " + std::to_string(pos));
            }
            const size_t count = data[pos++];
            if (count > size - pos || count > expected - out) {
                return Error::compression_error("Mythic bounds exceeded during raw copy");
            }
            std::memcpy(result.data() + out, data + pos, count);
            out += count;
            pos += count;
        } else {
            // Single-byte run
            const size_t count = flag;
            if (pos >= size || count > expected - out) {
                return Error::compression_error("Mythic bounds exceeded during run");
            }
            std::fill_n(result.begin() + static_cast<std::ptrdiff_t>(out), count, data[pos]);
            out += count;
            pos++;
        }
    }
    
    if (out != expected) {
        return Error::compression_error("Mythic size mismatch: got " + std::to_string(out) +
                                        ", expected " + std::to_string(expected));
    }
    
    return result;
}

Result<std::vector<uint8_t>> decompress_mythic(const std::vector<uint8_t>& data) {
    return decompress_mythic(data.data(), data.size());
}

Result<std::vector<uint8_t>> decompress_entry(const uint8_t* data, size_t size, uint8_t tag, size_t size_hint) {
    switch (static_cast<CompressionType>(tag)) {
        case CompressionType::None:
            return std::vector<uint8_t>(data, data + size);
            
        case CompressionType::Zlib:
            return decompress_zlib(data, size, size_hint);
            
        case CompressionType::Mythic:
            return decompress_mythic(data, size);
            
        default:
            return Error::compression_error("Unknown compression flag: " + std::to_string(tag));
    }
}

Result<std::vector<uint8_t>> decompress_entry(std::vector<uint8_t> data, uint8_t tag, size_t size_hint) {
    if (static_cast<CompressionType>(tag) == CompressionType::None) {
        return data;
    }
    return decompress_entry(data.data(), data.size(), tag, size_hint);
}

std::vector<uint8_t> compress_zlib(const uint8_t* data, size_t size, int level) {
    uLongf bound = compressBound(static_cast<uLong>(size));
    std::vector<uint8_t> result(bound);
    
    int ret = compress2(
        result.data(), &bound,
        data, static_cast<uLong>(size),
        level
    );
    
    if (ret != Z_OK) {
        throw std::runtime_error(std::string("Zlib compression failed: ") + zlib_error_string(ret));
    }
    
    result.resize(bound);
    return result;
}

std::vector<uint8_t> compress_zlib(const std::vector<uint8_t>& data, int level) {
    return compress_zlib(data.data(), data.size(), level);
}

} // namespace ultima
