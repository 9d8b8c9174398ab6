/**
 * Ultima Assets - Name table
 *
 * Immutable body ID -> animation name lookup. Built once from JSON and
 * handed to whatever needs it.
 */

#pragma once

#include "ultima/result.hpp"
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <cstdint>

namespace ultima {

class NameTable {
public:
    NameTable() = default;
    
    /**
     * Parse the {"Mobs": [{"name": ..., "body": ..., "type": ...}]} layout.
     * A later record with the same body replaces an earlier one.
     */
    static Result<NameTable> parse(std::string_view json);
    static Result<NameTable> load(const std::filesystem::path& path);
    
    /**
     * Name for a body ID, empty if unknown.
     */
    const std::string& name(uint32_t id) const;
    
    bool contains(uint32_t id) const { return names_.count(id) != 0; }
    size_t size() const { return names_.size(); }
    bool empty() const { return names_.empty(); }

private:
    std::unordered_map<uint32_t, std::string> names_;
};

} // namespace ultima
