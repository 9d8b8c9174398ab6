#include "ultima/asset_file.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <thread>

using namespace ultima;
using namespace ultima::test;

namespace {

/**
 * In-memory reader with a fixed set of entries.
 */
class MemoryReader : public EntryReader {
public:
    explicit MemoryReader(std::map<uint32_t, std::vector<uint8_t>> data, std::atomic<int>* closes = nullptr)
        : data_(std::move(data)), closes_(closes) {}
    
    Result<std::vector<uint8_t>> read(uint32_t index) override {
        if (closed_) return Error::reader_closed();
        auto it = data_.find(index);
        if (it == data_.end()) return Error::invalid_index(index);
        return it->second;
    }
    
    Result<uint64_t> extra(uint32_t index) override {
        if (closed_) return Error::reader_closed();
        if (!data_.count(index)) return Error::invalid_index(index);
        return uint64_t(index) * 10;
    }
    
    std::vector<uint32_t> entries() const override {
        std::vector<uint32_t> result;
        for_each_entry([&result](uint32_t index) {
            result.push_back(index);
            return true;
        });
        return result;
    }
    
    void for_each_entry(const EntryVisitor& visitor) const override {
        if (closed_) return;
        for (const auto& entry : data_) {
            if (!visitor(entry.first)) return;
        }
    }
    
    void close() override {
        if (closed_.exchange(true)) return;
        if (closes_) ++*closes_;
    }
    
    bool is_closed() const override { return closed_; }

private:
    std::map<uint32_t, std::vector<uint8_t>> data_;
    std::atomic<int>* closes_;
    std::atomic<bool> closed_{false};
};

ReaderInitializer memory_initializer(std::map<uint32_t, std::vector<uint8_t>> data,
                                     std::atomic<int>* calls = nullptr) {
    return [data, calls]() -> Result<std::unique_ptr<EntryReader>> {
        if (calls) ++*calls;
        return std::unique_ptr<EntryReader>(std::make_unique<MemoryReader>(data));
    };
}

} // namespace

class AssetFileTest : public ::testing::Test {
protected:
    TempDir dir_;
};

// Format detection

TEST_F(AssetFileTest, PrefersContainer) {
    dir_.write("test.uop", build_uop({{uop_entry("test", 0, bytes("from uop"))}}));
    dir_.write("test.mul", bytes("from mul"));
    dir_.write("testidx.mul", build_index({{0, 8, 0}}));
    
    AssetFile file(dir_.path(), {"test.uop", "test.mul", "testidx.mul"});
    EXPECT_EQ(file.source_kind(), SourceKind::Container);
    EXPECT_EQ(file.path(), dir_.path() / "test.uop");
    
    auto data = file.read(0);
    ASSERT_TRUE(data.ok()) << data.error().full_message();
    EXPECT_EQ(*data, bytes("from uop"));
}

TEST_F(AssetFileTest, FallsBackToIndexedMul) {
    const std::vector<uint8_t> payload = bytes("thirty-one bytes of legacy data");
    dir_.write("test.mul", payload);
    dir_.write("testidx.mul", build_index({{0, 31, 0}}));
    
    AssetFile file(dir_.path(), {"test.uop", "test.mul", "testidx.mul"});
    EXPECT_EQ(file.source_kind(), SourceKind::LegacyIndexed);
    EXPECT_EQ(file.path(), dir_.path() / "test.mul");
    EXPECT_EQ(file.index_path(), dir_.path() / "testidx.mul");
    
    auto data = file.read(0);
    ASSERT_TRUE(data.ok()) << data.error().full_message();
    EXPECT_EQ(*data, payload);
}

TEST_F(AssetFileTest, RecognisesIndexNamingConventions) {
    dir_.write("statics0.mul", bytes("abcd"));
    dir_.write("staidx0.mul", build_index({{0, 4, 0}}));
    dir_.write("multi.mul", bytes("efgh"));
    dir_.write("multi.idx", build_index({{0, 4, 0}}));
    
    AssetFile statics(dir_.path(), {"statics0LegacyMUL.uop", "statics0.mul", "staidx0.mul"});
    EXPECT_EQ(statics.source_kind(), SourceKind::LegacyIndexed);
    EXPECT_EQ(statics.index_path(), dir_.path() / "staidx0.mul");
    EXPECT_EQ(*statics.read(0), bytes("abcd"));
    
    AssetFile multi(dir_.path(), {"housing.bin", "multi.mul", "multi.idx"});
    EXPECT_EQ(multi.source_kind(), SourceKind::LegacyIndexed);
    EXPECT_EQ(multi.index_path(), dir_.path() / "multi.idx");
    EXPECT_EQ(*multi.read(0), bytes("efgh"));
}

TEST_F(AssetFileTest, FallsBackToSingleMul) {
    dir_.write("radarcol.mul", bytes("colors"));
    
    AssetFile file(dir_.path(), {"radarcol.mul", "radarcolidx.mul"});
    EXPECT_EQ(file.source_kind(), SourceKind::LegacySingle);
    EXPECT_TRUE(file.index_path().empty());
    EXPECT_EQ(*file.read(0), bytes("colors"));
}

TEST_F(AssetFileTest, ClilocIsSingleFile) {
    dir_.write("cliloc.enu", bytes("strings"));
    
    FileOptions options;
    options.decoder = [](const std::vector<uint8_t>& data, const MulAddFn& add) -> Result<void> {
        add(500000, 0, static_cast<uint32_t>(data.size()), 0, {});
        return Result<void>::success();
    };
    AssetFile file(dir_.path(), {"cliloc.enu"}, options);
    EXPECT_EQ(file.source_kind(), SourceKind::LegacySingle);
    EXPECT_EQ(*file.read(500000), bytes("strings"));
}

TEST_F(AssetFileTest, NoValidSourceIsDeferred) {
    AssetFile file(dir_.path(), {"art.uop", "art.mul", "artidx.mul"});
    EXPECT_EQ(file.source_kind(), SourceKind::None);
    EXPECT_FALSE(file.is_ready());
    
    EXPECT_EQ(file.open().code(), Error::Code::NoValidSource);
    EXPECT_EQ(file.read(0).code(), Error::Code::NoValidSource);
    EXPECT_EQ(file.entries().code(), Error::Code::NoValidSource);
    
    // A file that appears later is not picked up, detection ran at construction
    dir_.write("art.mul", bytes("late"));
    EXPECT_EQ(file.read(0).code(), Error::Code::NoValidSource);
}

TEST_F(AssetFileTest, PassesContainerOptions) {
    dir_.write("artLegacyMUL.uop", build_uop({{uop_entry("artlegacymul", 5, bytes("tile"), ".tga")}}));
    
    FileOptions options;
    options.count = 10;
    options.extension = ".tga";
    AssetFile file(dir_.path(), {"artLegacyMUL.uop"}, options);
    
    auto entries = file.entries();
    ASSERT_TRUE(entries.ok()) << entries.error().full_message();
    EXPECT_EQ(*entries, (std::vector<uint32_t>{5}));
    EXPECT_EQ(*file.read(5), bytes("tile"));
    EXPECT_EQ(file.read(10).code(), Error::Code::InvalidIndex);
}

// Patches

TEST_F(AssetFileTest, PatchTakesPrecedence) {
    AssetFile file("memory", memory_initializer({{1, bytes("disk")}}));
    
    EXPECT_EQ(*file.read(1), bytes("disk"));
    
    file.add_patch(1, bytes("patched"));
    EXPECT_EQ(*file.read(1), bytes("patched"));
    
    EXPECT_TRUE(file.remove_patch(1));
    EXPECT_FALSE(file.remove_patch(1));
    EXPECT_EQ(*file.read(1), bytes("disk"));
}

TEST_F(AssetFileTest, PatchAddsMissingIndex) {
    AssetFile file("memory", memory_initializer({{1, bytes("a")}, {3, bytes("c")}}));
    
    EXPECT_EQ(file.read(2).code(), Error::Code::InvalidIndex);
    file.add_patch(2, bytes("b"));
    file.add_patch(3, bytes("C"));
    
    EXPECT_EQ(*file.read(2), bytes("b"));
    EXPECT_EQ(*file.entries(), (std::vector<uint32_t>{1, 2, 3}));
    EXPECT_EQ(file.patch_count(), 2u);
    EXPECT_TRUE(file.has_patch(2));
}

TEST_F(AssetFileTest, PatchIsServedWithoutInitializing) {
    std::atomic<int> calls{0};
    AssetFile file("memory", memory_initializer({}, &calls));
    
    file.add_patch(7, bytes("patch"));
    EXPECT_EQ(*file.read(7), bytes("patch"));
    EXPECT_EQ(calls.load(), 0);
    EXPECT_FALSE(file.is_ready());
}

TEST_F(AssetFileTest, PatchIsCopied) {
    AssetFile file("memory", memory_initializer({}));
    
    std::vector<uint8_t> buffer = bytes("original");
    file.add_patch(0, buffer.data(), buffer.size());
    buffer[0] = 'X';
    
    auto first = file.read(0);
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(*first, bytes("original"));
    
    first->assign(3, 'Z');
    EXPECT_EQ(*file.read(0), bytes("original"));
}

TEST_F(AssetFileTest, PatchesFromOptions) {
    FileOptions options;
    options.patches[4] = bytes("four");
    AssetFile file(dir_.path(), {"missing.mul"}, options);
    
    EXPECT_EQ(file.patch_count(), 1u);
    EXPECT_EQ(*file.read(4), bytes("four"));
    EXPECT_EQ(file.read(5).code(), Error::Code::NoValidSource);
}

TEST_F(AssetFileTest, ExtraDelegatesToReader) {
    AssetFile file("memory", memory_initializer({{3, bytes("c")}}));
    EXPECT_EQ(*file.extra(3), 30u);
    EXPECT_EQ(file.extra(4).code(), Error::Code::InvalidIndex);
}

// Lifecycle

TEST_F(AssetFileTest, InitializesOnceUnderContention) {
    std::atomic<int> calls{0};
    AssetFile file("memory", [&calls]() -> Result<std::unique_ptr<EntryReader>> {
        ++calls;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        return std::unique_ptr<EntryReader>(std::make_unique<MemoryReader>(
            std::map<uint32_t, std::vector<uint8_t>>{{0, bytes("shared")}}));
    });
    
    constexpr int thread_count = 16;
    std::atomic<int> successes{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < thread_count; ++i) {
        threads.emplace_back([&]() {
            auto data = file.read(0);
            if (data.ok() && *data == bytes("shared")) ++successes;
        });
    }
    for (auto& thread : threads) thread.join();
    
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(successes.load(), thread_count);
    EXPECT_TRUE(file.is_ready());
}

TEST_F(AssetFileTest, RetriesAfterFailedInitialization) {
    std::atomic<int> calls{0};
    AssetFile file("flaky", [&calls]() -> Result<std::unique_ptr<EntryReader>> {
        if (++calls == 1) {
            return Error::io_error("disk not ready");
        }
        return std::unique_ptr<EntryReader>(std::make_unique<MemoryReader>(
            std::map<uint32_t, std::vector<uint8_t>>{{0, bytes("ok")}}));
    });
    
    EXPECT_EQ(file.read(0).code(), Error::Code::IoError);
    EXPECT_FALSE(file.is_ready());
    
    EXPECT_EQ(*file.read(0), bytes("ok"));
    EXPECT_TRUE(file.is_ready());
    EXPECT_EQ(*file.read(0), bytes("ok"));
    EXPECT_EQ(calls.load(), 2);
}

TEST_F(AssetFileTest, ThrowingInitializerIsReported) {
    AssetFile file("throws", []() -> Result<std::unique_ptr<EntryReader>> {
        throw std::runtime_error("boom");
    });
    
    auto result = file.open();
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.code(), Error::Code::Unknown);
    EXPECT_FALSE(file.is_ready());
}

TEST_F(AssetFileTest, NonStandardThrowRollsBackForRetry) {
    std::atomic<int> attempts{0};
    AssetFile file("throws-int", [&attempts]() -> Result<std::unique_ptr<EntryReader>> {
        if (attempts.fetch_add(1) == 0) {
            throw 42;
        }
        return std::unique_ptr<EntryReader>(std::make_unique<MemoryReader>(
            std::map<uint32_t, std::vector<uint8_t>>{{0, bytes("ok")}}));
    });
    
    auto first = file.open();
    ASSERT_FALSE(first.ok());
    EXPECT_EQ(first.code(), Error::Code::Unknown);
    EXPECT_FALSE(file.is_ready());
    
    auto retry = std::async(std::launch::async, [&file]() { return file.open(); });
    ASSERT_EQ(retry.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_TRUE(retry.get().ok());
    EXPECT_EQ(attempts.load(), 2);
    
    auto data = file.read(0);
    ASSERT_TRUE(data.ok());
    EXPECT_EQ(*data, bytes("ok"));
}

TEST_F(AssetFileTest, CloseIsIdempotent) {
    std::atomic<int> closes{0};
    AssetFile file("memory", [&closes]() -> Result<std::unique_ptr<EntryReader>> {
        return std::unique_ptr<EntryReader>(std::make_unique<MemoryReader>(
            std::map<uint32_t, std::vector<uint8_t>>{{0, bytes("a")}}, &closes));
    });
    file.add_patch(9, bytes("p"));
    ASSERT_TRUE(file.open().ok());
    
    file.close();
    file.close();
    
    EXPECT_TRUE(file.is_closed());
    EXPECT_EQ(closes.load(), 1);
    EXPECT_EQ(file.patch_count(), 0u);
    EXPECT_EQ(file.read(0).code(), Error::Code::ReaderClosed);
    EXPECT_EQ(file.read(9).code(), Error::Code::ReaderClosed);
    EXPECT_EQ(file.entries().code(), Error::Code::ReaderClosed);
    EXPECT_EQ(file.open().code(), Error::Code::ReaderClosed);
}

TEST_F(AssetFileTest, CloseBeforeOpen) {
    std::atomic<int> calls{0};
    AssetFile file("memory", memory_initializer({{0, bytes("a")}}, &calls));
    
    file.close();
    EXPECT_EQ(file.read(0).code(), Error::Code::ReaderClosed);
    EXPECT_EQ(calls.load(), 0);
}

TEST_F(AssetFileTest, CloseDuringInitializationWins) {
    std::atomic<int> closes{0};
    std::atomic<bool> started{false};
    std::atomic<bool> release{false};
    
    AssetFile file("slow", [&]() -> Result<std::unique_ptr<EntryReader>> {
        started = true;
        while (!release) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        return std::unique_ptr<EntryReader>(std::make_unique<MemoryReader>(
            std::map<uint32_t, std::vector<uint8_t>>{{0, bytes("a")}}, &closes));
    });
    
    Result<std::vector<uint8_t>> outcome = Error();
    std::thread opener([&]() { outcome = file.read(0); });
    
    while (!started) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    file.close();
    release = true;
    opener.join();
    
    EXPECT_EQ(outcome.code(), Error::Code::ReaderClosed);
    EXPECT_EQ(closes.load(), 1);
    EXPECT_TRUE(file.is_closed());
    EXPECT_FALSE(file.is_ready());
}

TEST_F(AssetFileTest, ClosesUnderlyingContainer) {
    dir_.write("test.uop", build_uop({{uop_entry("test", 0, bytes("x"))}}));
    
    AssetFile file(dir_.path(), {"test.uop"});
    ASSERT_TRUE(file.open().ok());
    EXPECT_TRUE(file.is_ready());
    
    file.close();
    EXPECT_EQ(file.read(0).code(), Error::Code::ReaderClosed);
}
