/**
 * Ultima Assets - File configuration implementation
 */

#include "ultima/file_config.hpp"
#include "ultima/files.hpp"
#include "ultima/path_utils.hpp"

#include <nlohmann/json.hpp>

namespace ultima {

using json = nlohmann::json;

namespace {

FileSpec make_spec(std::string key, std::vector<std::string> names) {
    FileSpec spec;
    spec.key = std::move(key);
    spec.names = std::move(names);
    return spec;
}

Result<FileOptions> parse_options(const json& node, const std::string& key) {
    FileOptions options;
    
    try {
        options.count = node.value("count", options.count);
        options.index_length = node.value("index_length", options.index_length);
        options.extension = node.value("extension", options.extension);
        options.has_extra = node.value("extra", options.has_extra);
        options.extra_uncompressed = node.value("extra_uncompressed", options.extra_uncompressed);
        options.strict = node.value("strict", options.strict);
        options.entry_size = node.value("entry_size", options.entry_size);
        options.chunk_size = node.value("chunk_size", options.chunk_size);
    } catch (const json::exception& e) {
        return Error::invalid_format(std::string("Invalid option value: ") + e.what(), key);
    }
    
    if (!options.extension.empty() && options.extension.front() != '.') {
        options.extension.insert(options.extension.begin(), '.');
    }
    return options;
}

} // namespace

UopOptions FileOptions::uop_options() const {
    UopOptions options;
    options.length = count;
    options.index_length = index_length;
    options.extension = extension;
    options.has_extra = has_extra;
    options.extra_uncompressed = extra_uncompressed;
    options.strict = strict;
    return options;
}

MulOptions FileOptions::mul_options() const {
    MulOptions options;
    options.entry_size = entry_size;
    options.chunk_size = chunk_size;
    options.decoder = decoder;
    return options;
}

std::vector<std::string> FileSpec::resolve(int id) const {
    static constexpr std::string_view placeholder = "{id}";
    const std::string value = std::to_string(id);
    
    std::vector<std::string> result;
    result.reserve(names.size());
    for (auto name : names) {
        size_t pos = 0;
        while ((pos = name.find(placeholder, pos)) != std::string::npos) {
            name.replace(pos, placeholder.size(), value);
            pos += value.size();
        }
        result.push_back(std::move(name));
    }
    return result;
}

Result<LogLevel> parse_log_level(std::string_view name) {
    const std::string lower = to_lower(name);
    
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    if (lower == "none" || lower == "off") return LogLevel::None;
    return Error::invalid_format("Unknown log level", std::string(name));
}

Result<LogConfig> LogConfig::parse(std::string_view text) {
    LogConfig config;
    
    try {
        json root = json::parse(text);
        if (!root.contains("log")) {
            return config;
        }
        
        const json& log = root["log"];
        if (!log.is_object()) {
            return Error::invalid_format("\"log\" must be an object");
        }
        
        if (log.contains("level")) {
            TRY_ASSIGN(level, parse_log_level(log["level"].get<std::string>()));
            config.level = level;
        }
        config.console = log.value("console", config.console);
        if (log.contains("file")) {
            config.file = log["file"].get<std::string>();
        }
    } catch (const json::exception& e) {
        return Error::invalid_format(std::string("Invalid log configuration: ") + e.what());
    }
    
    return config;
}

void LogConfig::apply() const {
    auto& logger = Logger::instance();
    logger.set_level(level);
    logger.set_console_output(console);
    
    if (file.empty()) {
        logger.close_file();
    } else if (!logger.set_file(file)) {
        LOG_WARNING("LogConfig", "Cannot open log file: " << file.string());
    }
}

FileCatalog FileCatalog::defaults() {
    FileCatalog catalog;
    
    {
        FileSpec spec = make_spec("art", {"artLegacyMUL.uop", "art.mul", "artidx.mul"});
        spec.options.count = 0x14000;
        spec.options.extension = ".tga";
        spec.options.index_length = 0x13FDC;
        catalog.add(std::move(spec));
    }
    {
        FileSpec spec = make_spec("gump", {"gumpartLegacyMUL.uop", "gumpart.mul", "gumpidx.mul"});
        spec.options.count = 0xFFFF;
        spec.options.extension = ".tga";
        spec.options.has_extra = true;
        spec.options.extra_uncompressed = true;
        catalog.add(std::move(spec));
    }
    {
        FileSpec spec = make_spec("sound", {"soundLegacyMUL.uop", "sound.mul", "soundidx.mul"});
        spec.options.count = 0xFFF;
        catalog.add(std::move(spec));
    }
    {
        FileSpec spec = make_spec("texmaps", {"texmaps.mul", "texidx.mul"});
        spec.options.count = 0x4000;
        spec.options.index_length = 12;
        catalog.add(std::move(spec));
    }
    {
        FileSpec spec = make_spec("multi", {"housing.bin", "multi.mul", "multi.idx"});
        spec.options.count = 0x2200;
        spec.options.index_length = 14;
        catalog.add(std::move(spec));
    }
    {
        FileSpec spec = make_spec("skills", {"skills.mul", "skills.idx"});
        spec.options.index_length = 16;
        catalog.add(std::move(spec));
    }
    {
        FileSpec spec = make_spec("light", {"light.mul", "lightidx.mul"});
        spec.options.index_length = 12;
        catalog.add(std::move(spec));
    }
    {
        FileSpec spec = make_spec("hues", {"hues.mul"});
        spec.options.count = 3000;
        spec.options.chunk_size = 708;
        catalog.add(std::move(spec));
    }
    {
        // 4-byte header + 8 frames of 68 bytes
        FileSpec spec = make_spec("animdata", {"animdata.mul"});
        spec.options.chunk_size = 548;
        catalog.add(std::move(spec));
    }
    {
        FileSpec spec = make_spec("map", {"map{id}LegacyMUL.uop", "map{id}.mul"});
        spec.options.strict = true;
        catalog.add(std::move(spec));
    }
    {
        FileSpec spec = make_spec("statics", {"statics{id}LegacyMUL.uop", "statics{id}.mul", "staidx{id}.mul"});
        spec.options.index_length = 12;
        spec.options.has_extra = true;
        spec.options.extra_uncompressed = true;
        catalog.add(std::move(spec));
    }
    catalog.add(make_spec("skillgrp", {"skillgrp.mul"}));
    catalog.add(make_spec("radarcol", {"radarcol.mul"}));
    catalog.add(make_spec("tiledata", {"tiledata.mul"}));
    catalog.add(make_spec("speech", {"speech.mul"}));
    
    return catalog;
}

Result<FileCatalog> FileCatalog::parse(std::string_view text) {
    FileCatalog catalog;
    
    try {
        json root = json::parse(text);
        if (!root.contains("files") || !root["files"].is_object()) {
            return Error::invalid_format("Catalog has no \"files\" object");
        }
        
        for (const auto& [key, node] : root["files"].items()) {
            if (!node.is_object() || !node.contains("names") || !node["names"].is_array()) {
                return Error::invalid_format("File entry has no \"names\" array", key);
            }
            
            FileSpec spec;
            spec.key = key;
            spec.names = node["names"].get<std::vector<std::string>>();
            if (spec.names.empty()) {
                return Error::invalid_format("File entry has an empty \"names\" array", key);
            }
            
            TRY_ASSIGN(options, parse_options(node, key));
            spec.options = std::move(options);
            catalog.add(std::move(spec));
        }
    } catch (const json::exception& e) {
        return Error::invalid_format(std::string("Invalid catalog JSON: ") + e.what());
    }
    
    return catalog;
}

Result<FileCatalog> FileCatalog::load(const std::filesystem::path& path) {
    if (!file_exists(path)) {
        return Error::file_not_found(path.string());
    }
    
    std::vector<uint8_t> data = read_file(path);
    auto catalog = parse(std::string_view(reinterpret_cast<const char*>(data.data()), data.size()));
    if (!catalog) {
        return Error(catalog.error().code, catalog.error().message, path.string());
    }
    LOG_INFO("FileCatalog", "Loaded " << catalog->size() << " file definitions from " << path.filename().string());
    return catalog;
}

void FileCatalog::add(FileSpec spec) {
    std::string key = spec.key;
    specs_[key] = std::move(spec);
}

const FileSpec* FileCatalog::find(const std::string& key) const {
    auto it = specs_.find(key);
    return it != specs_.end() ? &it->second : nullptr;
}

std::vector<std::string> FileCatalog::keys() const {
    std::vector<std::string> result;
    result.reserve(specs_.size());
    for (const auto& [key, spec] : specs_) {
        result.push_back(key);
    }
    return result;
}

void FileCatalog::merge(const FileCatalog& other) {
    for (const auto& [key, spec] : other.specs_) {
        specs_[key] = spec;
    }
}

} // namespace ultima
