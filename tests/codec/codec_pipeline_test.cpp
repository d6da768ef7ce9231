// =============================================================================
// zcodec - Codec Pipeline Tests
// =============================================================================
// Unit tests for stage ordering, full encode/decode and partial decoder
// chains through every stage kind.
// =============================================================================

#include "zcodec/codec/codec_pipeline.h"

#include "zcodec/codec/blosc_codec.h"
#include "zcodec/codec/blosc_header.h"
#include "zcodec/codec/bytes_codec.h"
#include "zcodec/codec/zstd_codec.h"
#include "zcodec/storage/async_storage_adapter.h"
#include "zcodec/storage/memory_store.h"

#include <gtest/gtest.h>

#include <cstring>
#include <memory>
#include <vector>

namespace zcodec::codec {
namespace {

// =============================================================================
// Test Stages
// =============================================================================

/// @brief Reverses element order.
class ReverseElementsCodec final : public ArrayToArrayCodec {
public:
    std::string_view name() const noexcept override { return "reverse"; }

    Bytes encode(ByteSpan decoded, const ChunkRepresentation& rep,
                 const CodecOptions& /*options*/) const override {
        return reverse(decoded, rep.elementSize());
    }

    Bytes decode(ByteSpan encoded, const ChunkRepresentation& rep,
                 const CodecOptions& /*options*/) const override {
        return reverse(encoded, rep.elementSize());
    }

private:
    static Bytes reverse(ByteSpan data, std::size_t elementSize) {
        Bytes out(data.size());
        const std::size_t n = data.size() / elementSize;
        for (std::size_t i = 0; i < n; ++i) {
            std::memcpy(out.data() + (n - 1 - i) * elementSize, data.data() + i * elementSize,
                        elementSize);
        }
        return out;
    }
};

/// @brief Widens uint8 elements to uint16.
class WidenCodec final : public ArrayToArrayCodec {
public:
    std::string_view name() const noexcept override { return "widen"; }

    ChunkRepresentation encodedRepresentation(const ChunkRepresentation& decoded) const override {
        return ChunkRepresentation(decoded.shape, DataType::kUInt16);
    }

    Bytes encode(ByteSpan decoded, const ChunkRepresentation& /*rep*/,
                 const CodecOptions& /*options*/) const override {
        Bytes out(decoded.size() * 2);
        for (std::size_t i = 0; i < decoded.size(); ++i) {
            const auto value = static_cast<std::uint16_t>(decoded[i]);
            std::memcpy(out.data() + i * 2, &value, sizeof(value));
        }
        return out;
    }

    Bytes decode(ByteSpan encoded, const ChunkRepresentation& /*rep*/,
                 const CodecOptions& /*options*/) const override {
        Bytes out(encoded.size() / 2);
        for (std::size_t i = 0; i < out.size(); ++i) {
            std::uint16_t value = 0;
            std::memcpy(&value, encoded.data() + i * 2, sizeof(value));
            if (value > 0xFF) {
                throw DecodeError("widened element out of range");
            }
            out[i] = static_cast<std::uint8_t>(value);
        }
        return out;
    }
};

/// @brief Drops the last decoded byte.
class TruncatingCodec final : public ArrayToArrayCodec {
public:
    std::string_view name() const noexcept override { return "truncate"; }

    Bytes encode(ByteSpan decoded, const ChunkRepresentation& /*rep*/,
                 const CodecOptions& /*options*/) const override {
        return Bytes(decoded.begin(), decoded.end());
    }

    Bytes decode(ByteSpan encoded, const ChunkRepresentation& /*rep*/,
                 const CodecOptions& /*options*/) const override {
        return Bytes(encoded.begin(), encoded.end() - 1);
    }
};

Bytes ramp(std::size_t n) {
    Bytes out(n);
    for (std::size_t i = 0; i < n; ++i) {
        out[i] = static_cast<std::uint8_t>(i * 7 % 251);
    }
    return out;
}

Bytes slice(const Bytes& data, std::size_t start, std::size_t end) {
    return Bytes(data.begin() + static_cast<std::ptrdiff_t>(start),
                 data.begin() + static_cast<std::ptrdiff_t>(end));
}

BloscCodecConfig bloscConfig(std::size_t typesize) {
    BloscCodecConfig config;
    config.shuffle = BloscShuffle::kShuffle;
    config.typesize = typesize;
    config.blocksize = 128;
    return config;
}

// =============================================================================
// Construction
// =============================================================================

TEST(CodecPipelineTest, FromCodecsPartitionsStages) {
    const auto pipeline = CodecPipeline::fromCodecs(
        {std::make_shared<ReverseElementsCodec>(), std::make_shared<BytesCodec>(),
         std::make_shared<ZstdCodec>(ZstdCodecConfig{}),
         std::make_shared<BloscCodec>(BloscCodecConfig{})});

    EXPECT_EQ(pipeline.arrayToArray().size(), 1u);
    EXPECT_EQ(pipeline.arrayToBytes()->name(), "bytes");
    EXPECT_EQ(pipeline.bytesToBytes().size(), 2u);
    EXPECT_EQ(pipeline.size(), 4u);
    EXPECT_EQ(pipeline.describe(), "reverse -> bytes -> zstd -> blosc");
    EXPECT_FALSE(pipeline.hasTargetedPartialDecode());
}

TEST(CodecPipelineTest, FromCodecsRejectsBadOrder) {
    const CodecPtr bytes = std::make_shared<BytesCodec>();
    const CodecPtr blosc = std::make_shared<BloscCodec>(BloscCodecConfig{});
    const CodecPtr reverse = std::make_shared<ReverseElementsCodec>();

    EXPECT_THROW((void)CodecPipeline::fromCodecs({}), ConfigError);
    EXPECT_THROW((void)CodecPipeline::fromCodecs({blosc}), ConfigError);
    EXPECT_THROW((void)CodecPipeline::fromCodecs({blosc, bytes}), ConfigError);
    EXPECT_THROW((void)CodecPipeline::fromCodecs({bytes, reverse}), ConfigError);
    EXPECT_THROW((void)CodecPipeline::fromCodecs({bytes, bytes}), ConfigError);
    EXPECT_THROW((void)CodecPipeline::fromCodecs({bytes, nullptr}), ConfigError);
    EXPECT_THROW((CodecPipeline{{}, nullptr, {}}), ConfigError);
}

TEST(CodecPipelineTest, FromConfigurations) {
    const auto pipeline = CodecPipeline::fromConfigurations(
        {BytesCodecConfig{Endianness::kBig}, bloscConfig(4)});
    EXPECT_EQ(pipeline.describe(), "bytes -> blosc");
    EXPECT_TRUE(pipeline.hasTargetedPartialDecode());

    BloscCodecConfig invalid;
    invalid.clevel = 42;
    EXPECT_THROW((void)CodecPipeline::fromConfigurations({BytesCodecConfig{}, invalid}),
                 ConfigError);
}

// =============================================================================
// Full Encode / Decode
// =============================================================================

TEST(CodecPipelineTest, EncodeDecodeThroughEveryStageKind) {
    const auto pipeline = CodecPipeline::fromCodecs(
        {std::make_shared<ReverseElementsCodec>(), std::make_shared<WidenCodec>(),
         std::make_shared<BytesCodec>(BytesCodecConfig{Endianness::kBig}),
         std::make_shared<BloscCodec>(bloscConfig(2))});
    const ChunkRepresentation rep({8, 8}, DataType::kUInt8);
    const Bytes data = ramp(64);

    const Bytes encoded = pipeline.encode(data, rep, CodecOptions{});
    const auto header = BloscHeader::read(encoded);
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->nbytes, 128u);
    EXPECT_EQ(pipeline.decode(encoded, rep, CodecOptions{}), data);
}

TEST(CodecPipelineTest, EncodeRejectsWrongSize) {
    const auto pipeline = CodecPipeline::fromConfigurations({BytesCodecConfig{}});
    const ChunkRepresentation rep({4}, DataType::kInt32);
    EXPECT_THROW((void)pipeline.encode(ramp(15), rep, CodecOptions{}), EncodeError);
}

TEST(CodecPipelineTest, DecodeErrorsNameTheFailingStage) {
    const auto pipeline =
        CodecPipeline::fromConfigurations({BytesCodecConfig{}, ZstdCodecConfig{}});
    const ChunkRepresentation rep({16}, DataType::kUInt8);
    try {
        (void)pipeline.decode(ramp(20), rep, CodecOptions{});
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& ex) {
        ASSERT_TRUE(ex.hasContext());
        EXPECT_EQ(ex.context()->codecName, "zstd");
    }
}

TEST(CodecPipelineTest, DecodeChecksDecodedSize) {
    const CodecPipeline pipeline({std::make_shared<TruncatingCodec>()},
                                 std::make_shared<BytesCodec>(), {});
    const ChunkRepresentation rep({16}, DataType::kUInt8);
    const Bytes encoded = pipeline.encode(ramp(16), rep, CodecOptions{});
    EXPECT_THROW((void)pipeline.decode(encoded, rep, CodecOptions{}), DecodeError);
}

// =============================================================================
// Partial Decoder Chains
// =============================================================================

class PipelinePartialDecodeTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<storage::MemoryStore>();
        data_ = ramp(rep_.sizeBytes());
        store_->set(key_, pipeline_.encode(data_, rep_, CodecOptions{}));
    }

    BytesPartialDecoderPtr decoder(const storage::StoreKey& key) const {
        return pipeline_.partialDecoder(std::make_unique<StoragePartialDecoder>(store_, key), rep_,
                                        CodecOptions{});
    }

    CodecPipeline pipeline_ = CodecPipeline::fromCodecs(
        {std::make_shared<WidenCodec>(),
         std::make_shared<BytesCodec>(BytesCodecConfig{Endianness::kBig}),
         std::make_shared<BloscCodec>(bloscConfig(2))});
    ChunkRepresentation rep_{{512}, DataType::kUInt8};
    std::shared_ptr<storage::MemoryStore> store_;
    storage::StoreKey key_{"chunks/c/0"};
    Bytes data_;
};

TEST_F(PipelinePartialDecodeTest, RangesMatchFullDecode) {
    const std::vector<ByteRange> ranges{ByteRange::interval(10, 20), ByteRange::suffix(5),
                                        ByteRange::interval(0, 512), ByteRange::interval(300, 300)};
    const auto parts = decoder(key_)->partialDecode(ranges, CodecOptions::parallelOptions(4));

    ASSERT_TRUE(parts.has_value());
    ASSERT_EQ(parts->size(), 4u);
    EXPECT_EQ((*parts)[0], slice(data_, 10, 20));
    EXPECT_EQ((*parts)[1], slice(data_, 507, 512));
    EXPECT_EQ((*parts)[2], data_);
    EXPECT_TRUE((*parts)[3].empty());
}

TEST_F(PipelinePartialDecodeTest, DirectChainWithoutArrayStages) {
    const auto pipeline = CodecPipeline::fromConfigurations(
        {BytesCodecConfig{Endianness::kBig}, bloscConfig(4)});
    const ChunkRepresentation rep({64}, DataType::kUInt32);
    const Bytes data = ramp(rep.sizeBytes());
    store_->set(key_, pipeline.encode(data, rep, CodecOptions{}));

    auto chain = pipeline.partialDecoder(std::make_unique<StoragePartialDecoder>(store_, key_),
                                         rep, CodecOptions{});
    const std::vector<ByteRange> ranges{ByteRange::interval(6, 30), ByteRange::interval(129, 131)};
    const auto parts = chain->partialDecode(ranges, CodecOptions{});

    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ((*parts)[0], slice(data, 6, 30));
    EXPECT_EQ((*parts)[1], slice(data, 129, 131));
}

TEST_F(PipelinePartialDecodeTest, AbsentChunkYieldsNullopt) {
    const std::vector<ByteRange> ranges{ByteRange::interval(0, 1)};
    EXPECT_FALSE(decoder(storage::StoreKey("chunks/c/1"))->partialDecode(ranges, CodecOptions{}));
    EXPECT_FALSE(decoder(storage::StoreKey("chunks/c/1"))->decode(CodecOptions{}));
}

TEST_F(PipelinePartialDecodeTest, CorruptValueFailsInBloscStage) {
    Bytes corrupt = *store_->get(key_);
    corrupt[0] = 0;
    store_->set(key_, corrupt);

    const std::vector<ByteRange> ranges{ByteRange::interval(0, 1)};
    try {
        (void)decoder(key_)->partialDecode(ranges, CodecOptions{});
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& ex) {
        ASSERT_TRUE(ex.hasContext());
        EXPECT_EQ(ex.context()->codecName, "blosc");
    }
}

TEST_F(PipelinePartialDecodeTest, RangePastChunkIsRejected) {
    const std::vector<ByteRange> ranges{ByteRange::interval(500, 513)};
    EXPECT_THROW((void)decoder(key_)->partialDecode(ranges, CodecOptions{}),
                 InvalidByteRangeError);
}

TEST_F(PipelinePartialDecodeTest, StoredLengthMustMatchChunk) {
    const auto pipeline = CodecPipeline::fromConfigurations({BytesCodecConfig{}, bloscConfig(4)});
    const ChunkRepresentation rep({16}, DataType::kInt32);
    const BloscCodec blosc(bloscConfig(4));
    auto asyncStore = std::make_shared<storage::AsyncStorageAdapter>(store_);
    const std::vector<ByteRange> ranges{ByteRange::interval(0, 8)};

    for (const std::size_t storedSize : {std::size_t{128}, std::size_t{32}}) {
        SCOPED_TRACE(storedSize);
        const Bytes encoded = blosc.encode(ramp(storedSize), CodecOptions{});
        store_->set(key_, encoded);

        auto chain = pipeline.partialDecoder(
            std::make_unique<StoragePartialDecoder>(store_, key_), rep, CodecOptions{});
        try {
            (void)chain->partialDecode(ranges, CodecOptions{});
            FAIL() << "expected DecodeError";
        } catch (const DecodeError& ex) {
            ASSERT_TRUE(ex.hasContext());
            EXPECT_EQ(ex.context()->codecName, "bytes");
        }
        EXPECT_THROW((void)chain->decode(CodecOptions{}), DecodeError);
        EXPECT_THROW((void)pipeline.decode(encoded, rep, CodecOptions{}), DecodeError);

        auto asyncChain = pipeline.asyncPartialDecoder(
            std::make_unique<AsyncStoragePartialDecoder>(asyncStore, key_), rep, CodecOptions{});
        auto pending = asyncChain->partialDecode(ranges, CodecOptions{});
        EXPECT_THROW((void)pending.get(), DecodeError);
    }
}

TEST_F(PipelinePartialDecodeTest, AsyncChainMatchesBlocking) {
    auto asyncStore = std::make_shared<storage::AsyncStorageAdapter>(store_);
    auto chain = pipeline_.asyncPartialDecoder(
        std::make_unique<AsyncStoragePartialDecoder>(asyncStore, key_), rep_, CodecOptions{});

    const std::vector<ByteRange> ranges{ByteRange::interval(33, 99), ByteRange::suffix(1)};
    auto pending = chain->partialDecode(ranges, CodecOptions{});
    chain.reset();

    const auto parts = pending.get();
    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ((*parts)[0], slice(data_, 33, 99));
    EXPECT_EQ((*parts)[1], slice(data_, 511, 512));

    auto whole = pipeline_
                     .asyncPartialDecoder(
                         std::make_unique<AsyncStoragePartialDecoder>(asyncStore, key_), rep_,
                         CodecOptions{})
                     ->decode(CodecOptions{});
    const auto wholeValue = whole.get();
    ASSERT_TRUE(wholeValue.has_value());
    EXPECT_EQ(*wholeValue, data_);
}

TEST_F(PipelinePartialDecodeTest, ChainOutlivesPipeline) {
    auto pipeline = std::make_unique<CodecPipeline>(CodecPipeline::fromCodecs(
        {std::make_shared<WidenCodec>(), std::make_shared<BytesCodec>(),
         std::make_shared<ZstdCodec>(ZstdCodecConfig{})}));
    store_->set(key_, pipeline->encode(data_, rep_, CodecOptions{}));

    auto asyncStore = std::make_shared<storage::AsyncStorageAdapter>(store_);
    auto asyncChain = pipeline->asyncPartialDecoder(
        std::make_unique<AsyncStoragePartialDecoder>(asyncStore, key_), rep_, CodecOptions{});
    auto chain = pipeline->partialDecoder(std::make_unique<StoragePartialDecoder>(store_, key_),
                                          rep_, CodecOptions{});
    auto pending = asyncChain->partialDecode({ByteRange::interval(40, 60)}, CodecOptions{});
    asyncChain.reset();
    pipeline.reset();

    const auto parts = pending.get();
    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ(parts->front(), slice(data_, 40, 60));
    EXPECT_EQ(chain->decode(CodecOptions{}), data_);
}

TEST(CodecPipelineTest, FallbackDecoderNeedsSharedStage) {
    const ZstdCodec unowned(ZstdCodecConfig{});
    auto store = std::make_shared<storage::MemoryStore>();
    try {
        (void)unowned.partialDecoder(
            std::make_unique<StoragePartialDecoder>(store, storage::StoreKey("c/0")),
            CodecOptions{});
        FAIL() << "expected UsageError";
    } catch (const UsageError& ex) {
        ASSERT_TRUE(ex.hasContext());
        EXPECT_EQ(ex.context()->codecName, "zstd");
    }
}

}  // namespace
}  // namespace zcodec::codec
