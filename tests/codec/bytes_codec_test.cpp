// =============================================================================
// zcodec - Bytes Codec Tests
// =============================================================================
// Unit tests for element serialization and element-aligned partial decoding.
// =============================================================================

#include "zcodec/codec/bytes_codec.h"
#include "zcodec/storage/async_storage_adapter.h"
#include "zcodec/storage/memory_store.h"

#include <gtest/gtest.h>

#include <memory>
#include <vector>

namespace zcodec::codec {
namespace {

constexpr Endianness foreignEndianness() noexcept {
    return nativeEndianness() == Endianness::kLittle ? Endianness::kBig : Endianness::kLittle;
}

Bytes sequence(std::size_t n) {
    Bytes out(n);
    for (std::size_t i = 0; i < n; ++i) {
        out[i] = static_cast<std::uint8_t>(i);
    }
    return out;
}

// =============================================================================
// Byte Swapping
// =============================================================================

TEST(SwapElementBytesTest, ReversesEachElement) {
    Bytes data{1, 2, 3, 4, 5, 6};
    swapElementBytes(data, 2);
    EXPECT_EQ(data, (Bytes{2, 1, 4, 3, 6, 5}));

    swapElementBytes(data, 1);
    EXPECT_EQ(data, (Bytes{2, 1, 4, 3, 6, 5}));
}

TEST(SwapElementBytesTest, LeavesTrailingPartialElement) {
    Bytes data{1, 2, 3, 4, 5};
    swapElementBytes(data, 4);
    EXPECT_EQ(data, (Bytes{4, 3, 2, 1, 5}));
}

// =============================================================================
// Encode / Decode
// =============================================================================

TEST(BytesCodecTest, NativeOrderIsIdentity) {
    const ChunkRepresentation rep({4}, DataType::kUInt32);
    const BytesCodec codec(BytesCodecConfig{nativeEndianness()});
    const Bytes data = sequence(16);

    EXPECT_EQ(codec.encode(data, rep, CodecOptions{}), data);
    EXPECT_EQ(codec.decode(data, rep, CodecOptions{}), data);
}

TEST(BytesCodecTest, ForeignOrderSwapsElements) {
    const ChunkRepresentation rep({2, 2}, DataType::kInt16);
    const BytesCodec codec(BytesCodecConfig{foreignEndianness()});
    const Bytes data = sequence(8);

    const Bytes encoded = codec.encode(data, rep, CodecOptions{});
    EXPECT_EQ(encoded, (Bytes{1, 0, 3, 2, 5, 4, 7, 6}));
    EXPECT_EQ(codec.decode(encoded, rep, CodecOptions{}), data);
}

TEST(BytesCodecTest, SingleByteElementsNeverSwap) {
    const ChunkRepresentation rep({8}, DataType::kUInt8);
    const BytesCodec codec(BytesCodecConfig{foreignEndianness()});
    const Bytes data = sequence(8);
    EXPECT_EQ(codec.encode(data, rep, CodecOptions{}), data);
}

TEST(BytesCodecTest, RejectsWrongSizes) {
    const ChunkRepresentation rep({4}, DataType::kFloat64);
    const BytesCodec codec;

    EXPECT_THROW((void)codec.encode(sequence(31), rep, CodecOptions{}), EncodeError);
    try {
        (void)codec.decode(sequence(40), rep, CodecOptions{});
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& ex) {
        ASSERT_TRUE(ex.hasContext());
        EXPECT_EQ(ex.context()->codecName, "bytes");
    }
}

// =============================================================================
// Partial Decode
// =============================================================================

class BytesPartialDecodeTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<storage::MemoryStore>();
        decoded_ = sequence(rep_.sizeBytes());
        store_->set(key_, codec_.encode(decoded_, rep_, CodecOptions{}));
    }

    BytesPartialDecoderPtr decoder(const storage::StoreKey& key) const {
        return codec_.partialDecoder(std::make_unique<StoragePartialDecoder>(store_, key), rep_,
                                     CodecOptions{});
    }

    Bytes slice(std::size_t start, std::size_t end) const {
        return Bytes(decoded_.begin() + static_cast<std::ptrdiff_t>(start),
                     decoded_.begin() + static_cast<std::ptrdiff_t>(end));
    }

    ChunkRepresentation rep_{{4, 4}, DataType::kUInt32};
    BytesCodec codec_{BytesCodecConfig{foreignEndianness()}};
    std::shared_ptr<storage::MemoryStore> store_;
    storage::StoreKey key_{"c/0/0"};
    Bytes decoded_;
};

TEST_F(BytesPartialDecodeTest, UnalignedRangesAreServedInNativeOrder) {
    const std::vector<ByteRange> ranges{ByteRange::interval(5, 10), ByteRange::interval(0, 4),
                                        ByteRange::suffix(3), ByteRange::interval(9, 9)};
    const auto parts = decoder(key_)->partialDecode(ranges, CodecOptions{});

    ASSERT_TRUE(parts.has_value());
    ASSERT_EQ(parts->size(), 4u);
    EXPECT_EQ((*parts)[0], slice(5, 10));
    EXPECT_EQ((*parts)[1], slice(0, 4));
    EXPECT_EQ((*parts)[2], slice(61, 64));
    EXPECT_TRUE((*parts)[3].empty());
}

TEST_F(BytesPartialDecodeTest, WholeDecodeMatches) {
    const auto whole = decoder(key_)->decode(CodecOptions{});
    ASSERT_TRUE(whole.has_value());
    EXPECT_EQ(*whole, decoded_);
}

TEST_F(BytesPartialDecodeTest, RangePastChunkIsRejected) {
    const std::vector<ByteRange> ranges{ByteRange::interval(60, 65)};
    try {
        (void)decoder(key_)->partialDecode(ranges, CodecOptions{});
        FAIL() << "expected InvalidByteRangeError";
    } catch (const InvalidByteRangeError& ex) {
        ASSERT_TRUE(ex.hasContext());
        EXPECT_EQ(ex.context()->codecName, "bytes");
        EXPECT_EQ(ex.context()->requestIndex, 0u);
    }
}

TEST_F(BytesPartialDecodeTest, AbsentChunkYieldsNullopt) {
    const std::vector<ByteRange> ranges{ByteRange::interval(0, 4)};
    EXPECT_FALSE(decoder(storage::StoreKey("c/1/1"))->partialDecode(ranges, CodecOptions{}));
}

TEST_F(BytesPartialDecodeTest, AsyncTwinMatchesBlocking) {
    auto asyncStore = std::make_shared<storage::AsyncStorageAdapter>(store_);
    auto asyncDecoder = codec_.asyncPartialDecoder(
        std::make_unique<AsyncStoragePartialDecoder>(asyncStore, key_), rep_, CodecOptions{});

    const std::vector<ByteRange> ranges{ByteRange::interval(3, 13), ByteRange::fromStart(50)};
    const auto parts = asyncDecoder->partialDecode(ranges, CodecOptions{}).get();

    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ((*parts)[0], slice(3, 13));
    EXPECT_EQ((*parts)[1], slice(50, 64));
}

}  // namespace
}  // namespace zcodec::codec
