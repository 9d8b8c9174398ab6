/**
 * Ultima Assets - Container name hashing implementation
 */

#include "ultima/name_hash.hpp"
#include "ultima/endian.hpp"

#include <cstdio>

namespace ultima {

uint64_t hash_file_name(std::string_view name) {
    const auto* s = reinterpret_cast<const uint8_t*>(name.data());
    const size_t length = name.size();

    uint32_t eax = 0;
    uint32_t ecx = 0;
    uint32_t edx = 0;
    uint32_t ebx = static_cast<uint32_t>(length) + 0xDEADBEEFu;
    uint32_t esi = ebx;
    uint32_t edi = ebx;

    size_t i = 0;
    for (; i + 12 <= length; i += 12) {
        edi += read_le32(s + i + 4);
        esi += read_le32(s + i + 8);
        edx = read_le32(s + i) - esi;

        edx = (edx + ebx) ^ (esi >> 28) ^ (esi << 4);
        esi += edi;
        edi = (edi - edx) ^ (edx >> 26) ^ (edx << 6);
        edx += esi;
        esi = (esi - edi) ^ (edi >> 24) ^ (edi << 8);
        edi += edx;
        ebx = (edx - esi) ^ (esi >> 16) ^ (esi << 16);
        esi += edi;
        edi = (edi - ebx) ^ (ebx >> 13) ^ (ebx << 19);
        ebx += esi;
        esi = (esi - edi) ^ (edi >> 28) ^ (edi << 4);
        edi += ebx;
    }

    const size_t remaining = length - i;
    if (remaining == 0) {
        // Exact multiple of 12: no final mix, low word stays zero
        return (static_cast<uint64_t>(esi) << 32) | eax;
    }

    const uint8_t* tail = s + i;
    switch (remaining) {
        case 11: esi += static_cast<uint32_t>(tail[10]) << 16; [[fallthrough]];
        case 10: esi += static_cast<uint32_t>(tail[9]) << 8;   [[fallthrough]];
        case 9:  esi += tail[8];                                [[fallthrough]];
        case 8:  edi += static_cast<uint32_t>(tail[7]) << 24;  [[fallthrough]];
        case 7:  edi += static_cast<uint32_t>(tail[6]) << 16;  [[fallthrough]];
        case 6:  edi += static_cast<uint32_t>(tail[5]) << 8;   [[fallthrough]];
        case 5:  edi += tail[4];                                [[fallthrough]];
        case 4:  ebx += static_cast<uint32_t>(tail[3]) << 24;  [[fallthrough]];
        case 3:  ebx += static_cast<uint32_t>(tail[2]) << 16;  [[fallthrough]];
        case 2:  ebx += static_cast<uint32_t>(tail[1]) << 8;   [[fallthrough]];
        case 1:  ebx += tail[0];                                break;
        default: break;
    }

    esi = (esi ^ edi) - ((edi >> 18) ^ (edi << 14));
    ecx = (esi ^ ebx) - ((esi >> 21) ^ (esi << 11));
    edi = (edi ^ ecx) - ((ecx >> 7) ^ (ecx << 25));
    esi = (esi ^ edi) - ((edi >> 16) ^ (edi << 16));
    edx = (esi ^ ecx) - ((esi >> 28) ^ (esi << 4));
    edi = (edi ^ edx) - ((edx >> 18) ^ (edx << 14));
    eax = (esi ^ edi) - ((edi >> 8) ^ (edi << 24));

    return (static_cast<uint64_t>(edi) << 32) | eax;
}

std::string format_entry_name(std::string_view pattern, uint32_t index, std::string_view extension) {
    char digits[16];
    std::snprintf(digits, sizeof(digits), "%08u", static_cast<unsigned>(index));

    std::string name;
    name.reserve(7 + pattern.size() + 1 + 8 + extension.size());
    name.append("build/");
    name.append(pattern);
    name.push_back('/');
    name.append(digits);
    name.append(extension);
    return name;
}

} // namespace ultima
