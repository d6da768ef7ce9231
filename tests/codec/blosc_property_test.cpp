// =============================================================================
// zcodec - Blosc Codec Property Tests
// =============================================================================
// Property-based tests for the blosc codec using RapidCheck.
//
// Properties:
// - Round trip: decode(encode(x)) == x
// - Partial decode: every served range equals the same slice of a full decode
// =============================================================================

#include "zcodec/codec/blosc_codec.h"
#include "zcodec/storage/memory_store.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <memory>
#include <vector>

namespace zcodec::codec {
namespace {

// =============================================================================
// Generators
// =============================================================================

/// @brief Generate a blosc configuration with an element size in {1, 2, 4, 8}.
rc::Gen<BloscCodecConfig> bloscConfig() {
    return rc::gen::exec([] {
        BloscCodecConfig config;
        config.cname = *rc::gen::element(BloscCompressor::kBloscLz, BloscCompressor::kLz4,
                                         BloscCompressor::kZstd);
        config.clevel = *rc::gen::inRange(0, 10);
        config.shuffle = *rc::gen::element(BloscShuffle::kNoShuffle, BloscShuffle::kShuffle,
                                           BloscShuffle::kBitShuffle);
        config.typesize = *rc::gen::element(std::size_t{1}, std::size_t{2}, std::size_t{4},
                                            std::size_t{8});
        config.blocksize = *rc::gen::element(std::size_t{0}, std::size_t{128}, std::size_t{256},
                                             std::size_t{1024});
        return config;
    });
}

/// @brief Generate a compressible buffer whose length is a multiple of `typesize`.
rc::Gen<Bytes> chunkData(std::size_t typesize) {
    return rc::gen::mapcat(rc::gen::inRange<std::size_t>(0, 1024), [typesize](std::size_t n) {
        return rc::gen::container<Bytes>(n * typesize, rc::gen::inRange<std::uint8_t>(0, 8));
    });
}

/// @brief Generate a range that fits in `total` bytes.
rc::Gen<ByteRange> rangeWithin(std::uint64_t total) {
    return rc::gen::exec([total] {
        const auto start = *rc::gen::inRange<std::uint64_t>(0, total + 1);
        const auto end = *rc::gen::inRange<std::uint64_t>(start, total + 1);
        switch (*rc::gen::inRange(0, 3)) {
            case 0:
                return ByteRange::interval(start, end);
            case 1:
                return ByteRange::fromStart(start);
            default:
                return ByteRange::suffix(total - start);
        }
    });
}

// =============================================================================
// Properties
// =============================================================================

RC_GTEST_PROP(BloscCodecProperty, RoundTripPreservesData, ()) {
    const auto config = *bloscConfig();
    const Bytes decoded = *chunkData(*config.typesize);

    const BloscCodec codec(config);
    const Bytes encoded = codec.encode(decoded, CodecOptions{});

    RC_ASSERT(codec.decode(encoded, CodecOptions{}) == decoded);
}

RC_GTEST_PROP(BloscCodecProperty, PartialDecodeMatchesFullDecodeSlice, ()) {
    const auto config = *bloscConfig();
    const Bytes decoded = *chunkData(*config.typesize);
    const std::uint64_t total = decoded.size();

    const BloscCodec codec(config);
    auto store = std::make_shared<storage::MemoryStore>();
    const storage::StoreKey key("chunk");
    store->set(key, codec.encode(decoded, CodecOptions{}));

    const auto ranges =
        *rc::gen::container<std::vector<ByteRange>>(*rc::gen::inRange<std::size_t>(0, 8),
                                                    rangeWithin(total));
    const bool parallel = *rc::gen::arbitrary<bool>();
    const CodecOptions options = parallel ? CodecOptions::parallelOptions(4) : CodecOptions{};

    auto decoder =
        codec.partialDecoder(std::make_unique<StoragePartialDecoder>(store, key), options);
    const auto parts = decoder->partialDecode(ranges, options);

    RC_ASSERT(parts.has_value());
    RC_ASSERT(parts->size() == ranges.size());
    for (std::size_t i = 0; i < ranges.size(); ++i) {
        const auto first = decoded.begin() + static_cast<std::ptrdiff_t>(ranges[i].start(total));
        const auto last = decoded.begin() + static_cast<std::ptrdiff_t>(ranges[i].end(total));
        RC_ASSERT((*parts)[i] == Bytes(first, last));
    }
}

}  // namespace
}  // namespace zcodec::codec
