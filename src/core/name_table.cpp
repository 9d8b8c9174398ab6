/**
 * Ultima Assets - Name table implementation
 */

#include "ultima/name_table.hpp"
#include "ultima/files.hpp"
#include "ultima/logging.hpp"

#include <nlohmann/json.hpp>

namespace ultima {

using json = nlohmann::json;

Result<NameTable> NameTable::parse(std::string_view text) {
    NameTable table;
    
    try {
        json root = json::parse(text);
        if (!root.contains("Mobs") || !root["Mobs"].is_array()) {
            return Error::invalid_format("Name table has no \"Mobs\" array");
        }
        
        for (const auto& mob : root["Mobs"]) {
            if (!mob.contains("body") || !mob.contains("name")) {
                return Error::invalid_format("Name table record without body or name");
            }
            table.names_[mob["body"].get<uint32_t>()] = mob["name"].get<std::string>();
        }
    } catch (const json::exception& e) {
        return Error::invalid_format(std::string("Invalid name table JSON: ") + e.what());
    }
    
    return table;
}

Result<NameTable> NameTable::load(const std::filesystem::path& path) {
    if (!file_exists(path)) {
        return Error::file_not_found(path.string());
    }
    
    std::vector<uint8_t> data = read_file(path);
    auto table = parse(std::string_view(reinterpret_cast<const char*>(data.data()), data.size()));
    if (!table) {
        return Error(table.error().code, table.error().message, path.string());
    }
    LOG_DEBUG("NameTable", "Loaded " << table->size() << " names from " << path.filename().string());
    return table;
}

const std::string& NameTable::name(uint32_t id) const {
    static const std::string empty;
    auto it = names_.find(id);
    return it != names_.end() ? it->second : empty;
}

} // namespace ultima
