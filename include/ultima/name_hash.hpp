/**
 * Ultima Assets - Container name hashing
 *
 * Entries inside a UOP container are not stored by name. Each record carries
 * a 64-bit hash of a synthetic path such as "build/gumpartlegacymul/00000042.tga",
 * so a logical index is resolved by hashing the expected name and looking the
 * result up in the container's hash table.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace ultima {

/**
 * Hash a container entry name.
 *
 * Pure and total over any byte string. All arithmetic wraps modulo 2^32; the
 * two final 32-bit words are packed as (high << 32) | low. Must stay
 * bit-compatible with the hashes stored in real container files.
 */
uint64_t hash_file_name(std::string_view name);

/**
 * Build the synthetic name for a logical index:
 * "build/<pattern>/<8-digit index><extension>".
 * The pattern is used as given; callers pass it lower-cased.
 */
std::string format_entry_name(std::string_view pattern, uint32_t index, std::string_view extension);

} // namespace ultima
