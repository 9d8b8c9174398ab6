#include "ultima/file_config.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

using namespace ultima;
using namespace ultima::test;

TEST(FileCatalogTest, DefaultsCoverStandardFiles) {
    auto catalog = FileCatalog::defaults();
    
    for (const char* key : {"art", "gump", "sound", "texmaps", "multi", "skills", "skillgrp", "light",
                            "hues", "radarcol", "animdata", "tiledata", "speech", "map", "statics"}) {
        EXPECT_NE(catalog.find(key), nullptr) << key;
    }
    EXPECT_EQ(catalog.find("nonexistent"), nullptr);
}

TEST(FileCatalogTest, DefaultArtOptions) {
    auto catalog = FileCatalog::defaults();
    const FileSpec* art = catalog.find("art");
    ASSERT_NE(art, nullptr);
    
    EXPECT_EQ(art->names, (std::vector<std::string>{"artLegacyMUL.uop", "art.mul", "artidx.mul"}));
    EXPECT_EQ(art->options.count, 0x14000u);
    EXPECT_EQ(art->options.extension, ".tga");
    EXPECT_EQ(art->options.index_length, 0x13FDCu);
    EXPECT_FALSE(art->options.has_extra);
    
    const FileSpec* gump = catalog.find("gump");
    ASSERT_NE(gump, nullptr);
    EXPECT_TRUE(gump->options.has_extra);
    EXPECT_TRUE(gump->options.extra_uncompressed);
    EXPECT_FALSE(art->options.extra_uncompressed);
    
    const FileSpec* hues = catalog.find("hues");
    ASSERT_NE(hues, nullptr);
    EXPECT_EQ(hues->options.chunk_size, 708u);
}

TEST(FileSpecTest, ResolvesIdPlaceholder) {
    auto catalog = FileCatalog::defaults();
    const FileSpec* statics = catalog.find("statics");
    ASSERT_NE(statics, nullptr);
    
    EXPECT_EQ(statics->resolve(2),
              (std::vector<std::string>{"statics2LegacyMUL.uop", "statics2.mul", "staidx2.mul"}));
    EXPECT_TRUE(catalog.find("map")->options.strict);
}

TEST(FileSpecTest, ResolveWithoutPlaceholderIsUnchanged) {
    FileSpec spec;
    spec.names = {"art.mul", "{id}{id}.mul"};
    EXPECT_EQ(spec.resolve(12), (std::vector<std::string>{"art.mul", "1212.mul"}));
}

TEST(FileOptionsTest, MapsToReaderOptions) {
    FileOptions options;
    options.count = 42;
    options.index_length = 40;
    options.extension = ".bin";
    options.has_extra = true;
    options.extra_uncompressed = true;
    options.strict = true;
    options.entry_size = 16;
    options.chunk_size = 8;
    
    UopOptions uop = options.uop_options();
    EXPECT_EQ(uop.length, 42u);
    EXPECT_EQ(uop.index_length, 40u);
    EXPECT_EQ(uop.extension, ".bin");
    EXPECT_TRUE(uop.has_extra);
    EXPECT_TRUE(uop.extra_uncompressed);
    EXPECT_TRUE(uop.strict);
    
    MulOptions mul = options.mul_options();
    EXPECT_EQ(mul.entry_size, 16u);
    EXPECT_EQ(mul.chunk_size, 8u);
    EXPECT_FALSE(static_cast<bool>(mul.decoder));
}

TEST(FileCatalogTest, ParsesJson) {
    auto catalog = FileCatalog::parse(R"({
        "files": {
            "art": { "names": ["artLegacyMUL.uop", "art.mul", "artidx.mul"],
                     "count": 100, "extension": "tga", "index_length": 90 },
            "map": { "names": ["map{id}LegacyMUL.uop", "map{id}.mul"], "strict": true,
                     "extra": true, "extra_uncompressed": true },
            "skills": { "names": ["skills.mul", "skills.idx"], "entry_size": 16 }
        }
    })");
    ASSERT_TRUE(catalog.ok()) << catalog.error().full_message();
    EXPECT_EQ(catalog->size(), 3u);
    EXPECT_EQ(catalog->keys(), (std::vector<std::string>{"art", "map", "skills"}));
    
    const FileSpec* art = catalog->find("art");
    ASSERT_NE(art, nullptr);
    EXPECT_EQ(art->options.count, 100u);
    EXPECT_EQ(art->options.extension, ".tga");
    EXPECT_EQ(art->options.index_length, 90u);
    
    EXPECT_TRUE(catalog->find("map")->options.strict);
    EXPECT_TRUE(catalog->find("map")->options.extra_uncompressed);
    EXPECT_FALSE(art->options.extra_uncompressed);
    EXPECT_EQ(catalog->find("skills")->options.entry_size, 16u);
    EXPECT_EQ(catalog->find("skills")->options.extension, ".dat");
}

TEST(FileCatalogTest, RejectsMalformedJson) {
    EXPECT_EQ(FileCatalog::parse("{ not json").code(), Error::Code::InvalidFormat);
    EXPECT_EQ(FileCatalog::parse(R"({"other": {}})").code(), Error::Code::InvalidFormat);
    EXPECT_EQ(FileCatalog::parse(R"({"files": {"art": {"count": 1}}})").code(), Error::Code::InvalidFormat);
    EXPECT_EQ(FileCatalog::parse(R"({"files": {"art": {"names": []}}})").code(), Error::Code::InvalidFormat);
    EXPECT_EQ(FileCatalog::parse(R"({"files": {"art": {"names": ["a.mul"], "count": "many"}}})").code(),
              Error::Code::InvalidFormat);
}

TEST(FileCatalogTest, MergeOverridesByKey) {
    auto catalog = FileCatalog::defaults();
    auto custom = FileCatalog::parse(R"({"files": {"art": {"names": ["custom.mul"]},
                                                   "extra": {"names": ["extra.mul"]}}})");
    ASSERT_TRUE(custom.ok());
    
    size_t before = catalog.size();
    catalog.merge(*custom);
    EXPECT_EQ(catalog.size(), before + 1);
    EXPECT_EQ(catalog.find("art")->names, (std::vector<std::string>{"custom.mul"}));
}

TEST(FileCatalogTest, LoadFromFile) {
    TempDir dir;
    auto path = dir.write_text("files.json", R"({"files": {"sound": {"names": ["sound.mul", "soundidx.mul"]}}})");
    
    auto catalog = FileCatalog::load(path);
    ASSERT_TRUE(catalog.ok()) << catalog.error().full_message();
    EXPECT_NE(catalog->find("sound"), nullptr);
    
    EXPECT_EQ(FileCatalog::load(dir.path() / "missing.json").code(), Error::Code::FileNotFound);
    
    auto broken = dir.write_text("broken.json", "[");
    auto result = FileCatalog::load(broken);
    EXPECT_EQ(result.code(), Error::Code::InvalidFormat);
    EXPECT_EQ(result.error().context, broken.string());
}

TEST(LogConfigTest, ParsesLogSection) {
    auto config = LogConfig::parse(R"({"log": {"level": "Debug", "console": true, "file": "logs/assets.log"}})");
    ASSERT_TRUE(config.ok()) << config.error().full_message();
    EXPECT_EQ(config->level, LogLevel::Debug);
    EXPECT_TRUE(config->console);
    EXPECT_EQ(config->file, fs::path("logs/assets.log"));
}

TEST(LogConfigTest, MissingSectionUsesDefaults) {
    auto config = LogConfig::parse(R"({"files": {}})");
    ASSERT_TRUE(config.ok());
    EXPECT_EQ(config->level, LogLevel::Info);
    EXPECT_FALSE(config->console);
    EXPECT_TRUE(config->file.empty());
}

TEST(LogConfigTest, RejectsUnknownLevel) {
    EXPECT_EQ(LogConfig::parse(R"({"log": {"level": "chatty"}})").code(), Error::Code::InvalidFormat);
    EXPECT_EQ(LogConfig::parse(R"({"log": "debug"})").code(), Error::Code::InvalidFormat);
}

TEST(LogConfigTest, AppliesToLogger) {
    LogConfig config;
    config.level = LogLevel::Error;
    config.apply();
    
    EXPECT_FALSE(Logger::instance().is_enabled(LogLevel::Warning));
    EXPECT_TRUE(Logger::instance().is_enabled(LogLevel::Error));
    
    LogConfig{}.apply();
    EXPECT_TRUE(Logger::instance().is_enabled(LogLevel::Info));
}

TEST(LogLevelTest, ParsesNames) {
    EXPECT_EQ(*parse_log_level("warn"), LogLevel::Warning);
    EXPECT_EQ(*parse_log_level("WARNING"), LogLevel::Warning);
    EXPECT_EQ(*parse_log_level("off"), LogLevel::None);
    EXPECT_FALSE(parse_log_level("loud").ok());
}
