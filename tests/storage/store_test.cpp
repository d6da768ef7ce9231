// =============================================================================
// zcodec - Store Tests
// =============================================================================
// Unit tests for store keys, the in-memory and filesystem stores and the
// asynchronous storage adapter.
// =============================================================================

#include "zcodec/storage/async_storage_adapter.h"
#include "zcodec/storage/filesystem_store.h"
#include "zcodec/storage/memory_store.h"
#include "zcodec/storage/store_key.h"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace zcodec::storage {
namespace {

Bytes iota(std::size_t size) {
    Bytes out(size);
    for (std::size_t i = 0; i < size; ++i) {
        out[i] = static_cast<std::uint8_t>(i);
    }
    return out;
}

// =============================================================================
// StoreKey Tests
// =============================================================================

TEST(StoreKeyTest, AcceptsHierarchicalKeys) {
    const StoreKey key("arr/c/0/1");
    EXPECT_EQ(key.str(), "arr/c/0/1");
    EXPECT_EQ(key.parent(), "arr/c/0");
    EXPECT_EQ(key.name(), "1");

    const StoreKey top("zarr.json");
    EXPECT_TRUE(top.parent().empty());
    EXPECT_EQ(top.name(), "zarr.json");
}

TEST(StoreKeyTest, RejectsInvalidKeys) {
    for (const std::string bad : {"", "/arr", "arr//c", "arr/", "arr/./c", "../arr"}) {
        EXPECT_FALSE(StoreKey::validate(bad).has_value()) << bad;
        EXPECT_THROW(StoreKey{bad}, UsageError) << bad;
    }
    EXPECT_FALSE(StoreKey::create("a/../b").has_value());
}

// =============================================================================
// MemoryStore Tests
// =============================================================================

TEST(MemoryStoreTest, SetGetErase) {
    MemoryStore store;
    const StoreKey key("arr/c/0");

    EXPECT_FALSE(store.get(key).has_value());
    EXPECT_FALSE(store.size(key).has_value());

    store.set(key, iota(10));
    EXPECT_EQ(store.get(key), iota(10));
    EXPECT_EQ(store.size(key), 10u);
    EXPECT_EQ(store.count(), 1u);

    store.erase(key);
    EXPECT_FALSE(store.get(key).has_value());
    EXPECT_NO_THROW(store.erase(key));
}

TEST(MemoryStoreTest, PartialValues) {
    MemoryStore store;
    const StoreKey key("v");
    store.set(key, iota(32));

    const std::vector<ByteRange> ranges{ByteRange::fromStart(30), ByteRange::fromStart(1, 2)};
    const auto parts = store.getPartialValues(key, ranges, CodecOptions{});
    ASSERT_TRUE(parts.has_value());
    ASSERT_EQ(parts->size(), 2u);
    EXPECT_EQ((*parts)[0], (Bytes{30, 31}));
    EXPECT_EQ((*parts)[1], (Bytes{1, 2}));

    EXPECT_FALSE(store.getPartialValues(StoreKey("missing"), ranges, CodecOptions{}).has_value());

    const std::vector<ByteRange> tooLong{ByteRange::fromStart(16, 17)};
    EXPECT_THROW((void)store.getPartialValues(key, tooLong, CodecOptions{}),
                 InvalidByteRangeError);
}

TEST(MemoryStoreTest, KeysAreSorted) {
    MemoryStore store;
    store.set(StoreKey("b"), Bytes{1});
    store.set(StoreKey("a/c"), Bytes{2});
    store.set(StoreKey("a"), Bytes{3});

    const auto keys = store.keys();
    ASSERT_EQ(keys.size(), 3u);
    EXPECT_EQ(keys[0].str(), "a");
    EXPECT_EQ(keys[1].str(), "a/c");
    EXPECT_EQ(keys[2].str(), "b");
}

// =============================================================================
// FilesystemStore Tests
// =============================================================================

class FilesystemStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        static std::atomic<int> counter{0};
        root_ = std::filesystem::temp_directory_path() /
                ("zcodec_store_test_" + std::to_string(::testing::UnitTest::GetInstance()
                                                           ->random_seed()) +
                 "_" + std::to_string(counter++));
        std::filesystem::remove_all(root_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    std::filesystem::path root_;
};

TEST_F(FilesystemStoreTest, SetGetErase) {
    FilesystemStore store(root_);
    const StoreKey key("arr/c/1/2");

    EXPECT_FALSE(store.get(key).has_value());
    store.set(key, iota(100));
    EXPECT_TRUE(std::filesystem::exists(root_ / "arr" / "c" / "1" / "2"));
    EXPECT_EQ(store.get(key), iota(100));
    EXPECT_EQ(store.size(key), 100u);

    store.set(key, iota(3));
    EXPECT_EQ(store.get(key), iota(3));

    store.erase(key);
    EXPECT_FALSE(store.get(key).has_value());
    EXPECT_NO_THROW(store.erase(key));
}

TEST_F(FilesystemStoreTest, PartialValuesSerialAndParallel) {
    FilesystemStore store(root_);
    const StoreKey key("chunk");
    store.set(key, iota(200));

    std::vector<ByteRange> ranges;
    for (std::uint64_t i = 0; i < 20; ++i) {
        ranges.push_back(ByteRange::fromStart(i * 10, 5));
    }
    ranges.push_back(ByteRange::suffix(3));

    for (const auto& options : {CodecOptions{}, CodecOptions::parallelOptions(4)}) {
        const auto parts = store.getPartialValues(key, ranges, options);
        ASSERT_TRUE(parts.has_value());
        ASSERT_EQ(parts->size(), ranges.size());
        for (std::size_t i = 0; i < 20; ++i) {
            EXPECT_EQ((*parts)[i].front(), static_cast<std::uint8_t>(i * 10));
            EXPECT_EQ((*parts)[i].size(), 5u);
        }
        EXPECT_EQ(parts->back(), (Bytes{197, 198, 199}));
    }
}

TEST_F(FilesystemStoreTest, AbsentAndInvalidRanges) {
    FilesystemStore store(root_);
    const std::vector<ByteRange> ranges{ByteRange::fromStart(0, 4)};
    EXPECT_FALSE(store.getPartialValues(StoreKey("nope"), ranges, CodecOptions{}).has_value());

    store.set(StoreKey("small"), iota(2));
    EXPECT_THROW((void)store.getPartialValues(StoreKey("small"), ranges, CodecOptions{}),
                 InvalidByteRangeError);
}

// =============================================================================
// AsyncStorageAdapter Tests
// =============================================================================

TEST(AsyncStorageAdapterTest, ForwardsToStore) {
    auto memory = std::make_shared<MemoryStore>();
    AsyncStorageAdapter store(memory);
    const StoreKey key("arr/c/0");

    EXPECT_FALSE(store.get(key).get().has_value());

    store.set(key, iota(16)).get();
    EXPECT_EQ(memory->get(key), iota(16));

    auto parts = store.getPartialValues(key, {ByteRange::suffix(1)}, CodecOptions{}).get();
    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ(parts->front(), (Bytes{15}));

    store.erase(key).get();
    EXPECT_FALSE(memory->get(key).has_value());
}

TEST(AsyncStorageAdapterTest, ErrorsArriveThroughFuture) {
    auto memory = std::make_shared<MemoryStore>();
    memory->set(StoreKey("v"), iota(4));
    AsyncStorageAdapter store(memory);

    auto pending = store.getPartialValues(StoreKey("v"), {ByteRange::fromStart(2, 8)},
                                          CodecOptions{});
    EXPECT_THROW((void)pending.get(), InvalidByteRangeError);
}

TEST(AsyncStorageAdapterTest, RejectsNullStore) {
    EXPECT_THROW(AsyncStorageAdapter{nullptr}, UsageError);
}

}  // namespace
}  // namespace zcodec::storage
