/**
 * Ultima Assets - Path Utilities
 * 
 * Case-insensitive file name matching used by format detection.
 */

#pragma once

#include <string>
#include <string_view>
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace ultima {

inline std::string to_lower(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

/**
 * Check if a file name starts with the given prefix (case-insensitive).
 */
inline bool name_starts_with(std::string_view name, std::string_view prefix) {
    if (prefix.size() > name.size()) return false;
    return to_lower(name.substr(0, prefix.size())) == to_lower(prefix);
}

/**
 * Check if a file name ends with the given suffix (case-insensitive).
 */
inline bool name_ends_with(std::string_view name, std::string_view suffix) {
    if (suffix.size() > name.size()) return false;
    return to_lower(name.substr(name.size() - suffix.size())) == to_lower(suffix);
}

/**
 * Lowercase file name without its extension.
 */
inline std::string stem_lower(const std::filesystem::path& path) {
    return to_lower(path.stem().string());
}

} // namespace ultima
