// =============================================================================
// zcodec - Blosc Codec Implementation
// =============================================================================

#include "zcodec/codec/blosc_codec.h"

#include <cstring>
#include <format>
#include <string>
#include <utility>

#include <blosc.h>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

#include "zcodec/common/logger.h"

namespace zcodec::codec {

namespace {

constexpr std::string_view kInvalidValue = "blosc encoded value is invalid";

[[noreturn]] void throwInvalid(std::string_view detail) {
    throw DecodeError(std::format("{}: {}", kInvalidValue, detail),
                      ErrorContext{}.withCodec("blosc"));
}

int toBloscShuffle(BloscShuffle shuffle) noexcept {
    switch (shuffle) {
        case BloscShuffle::kNoShuffle:
            return BLOSC_NOSHUFFLE;
        case BloscShuffle::kShuffle:
            return BLOSC_SHUFFLE;
        case BloscShuffle::kBitShuffle:
            return BLOSC_BITSHUFFLE;
    }
    return BLOSC_NOSHUFFLE;
}

}  // namespace

// =============================================================================
// Blosc Primitives
// =============================================================================

BloscHeader bloscValidate(ByteSpan encoded) {
    auto header = BloscHeader::read(encoded);
    if (!header.has_value()) {
        throwInvalid(header.error().message());
    }

    std::size_t destSize = 0;
    if (blosc_cbuffer_validate(encoded.data(), encoded.size(), &destSize) != 0) {
        throwInvalid("rejected by c-blosc");
    }
    if (destSize != header->nbytes) {
        throwInvalid(std::format("c-blosc reports {} bytes, header declares {}", destSize,
                                 header->nbytes));
    }
    return *header;
}

Bytes bloscDecompress(ByteSpan encoded) {
    const BloscHeader header = bloscValidate(encoded);
    Bytes out(header.nbytes);
    if (out.empty()) {
        return out;
    }
    const int n = blosc_decompress_ctx(encoded.data(), out.data(), out.size(),
                                       /*numinternalthreads=*/1);
    if (n <= 0 || static_cast<std::size_t>(n) != out.size()) {
        throw DecodeError(std::format("blosc decompression failed ({})", n),
                          ErrorContext{}.withCodec("blosc"));
    }
    return out;
}

Bytes bloscDecompressBytesPartial(ByteSpan encoded, const BloscHeader& header,
                                  std::uint64_t offset, std::uint64_t length) {
    if (length == 0) {
        return {};
    }

    if (header.isMemcpyed()) {
        const auto first = encoded.begin() + static_cast<std::ptrdiff_t>(BloscHeader::kSize + offset);
        return Bytes(first, first + static_cast<std::ptrdiff_t>(length));
    }

    const std::uint64_t typesize = header.typesize;
    const std::uint64_t firstItem = offset / typesize;
    const std::uint64_t endItem = (offset + length + typesize - 1) / typesize;
    const std::uint64_t totalItems = header.nbytes / typesize;

    if (endItem > totalItems) {
        // The range reaches a trailing partial element that blosc_getitem cannot address.
        Bytes whole = bloscDecompress(encoded);
        const auto first = whole.begin() + static_cast<std::ptrdiff_t>(offset);
        return Bytes(first, first + static_cast<std::ptrdiff_t>(length));
    }

    const std::uint64_t itemBytes = (endItem - firstItem) * typesize;
    Bytes items(static_cast<std::size_t>(itemBytes));
    const int n = blosc_getitem(encoded.data(), static_cast<int>(firstItem),
                                static_cast<int>(endItem - firstItem), items.data());
    if (n < 0 || static_cast<std::uint64_t>(n) != itemBytes) {
        throw DecodeError(
            std::format("blosc failed to decompress items [{}, {}) ({})", firstItem, endItem, n),
            ErrorContext{}.withCodec("blosc").withOffset(offset));
    }

    const std::uint64_t skip = offset - firstItem * typesize;
    if (skip == 0 && length == itemBytes) {
        return items;
    }
    const auto first = items.begin() + static_cast<std::ptrdiff_t>(skip);
    return Bytes(first, first + static_cast<std::ptrdiff_t>(length));
}

std::vector<Bytes> bloscDecompressRanges(ByteSpan encoded, std::span<const ByteRange> ranges,
                                         const CodecOptions& options) {
    const BloscHeader header = bloscValidate(encoded);
    const std::uint64_t nbytes = header.nbytes;

    try {
        storage::validateByteRanges(ranges, nbytes);
    } catch (const ZcodecException& ex) {
        rethrowWithContext(ex, ErrorContext{}.withCodec("blosc"));
    }

    ZCODEC_LOG_TRACE("blosc: serving {} range(s) from {} encoded bytes ({} decoded, {} blocks)",
                     ranges.size(), encoded.size(), nbytes, header.numBlocks());

    std::vector<Bytes> out(ranges.size());
    auto serve = [&](std::size_t i) {
        const std::uint64_t start = ranges[i].start(nbytes);
        const std::uint64_t end = ranges[i].end(nbytes);
        try {
            out[i] = bloscDecompressBytesPartial(encoded, header, start, end - start);
        } catch (const ZcodecException& ex) {
            rethrowWithContext(ex, ErrorContext{}.withCodec("blosc").withRequest(i));
        }
    };

    if (options.parallel && ranges.size() > 1) {
        tbb::parallel_for(tbb::blocked_range<std::size_t>(0, ranges.size()),
                          [&](const tbb::blocked_range<std::size_t>& block) {
                              for (std::size_t i = block.begin(); i < block.end(); ++i) {
                                  serve(i);
                              }
                          });
    } else {
        for (std::size_t i = 0; i < ranges.size(); ++i) {
            serve(i);
        }
    }
    return out;
}

// =============================================================================
// BloscCodec Implementation
// =============================================================================

BloscCodec::BloscCodec(BloscCodecConfig config) : config_(std::move(config)) {
    unwrapOrThrow(config_.validate());
}

Bytes BloscCodec::encode(ByteSpan decoded, const CodecOptions& /*options*/) const {
    if (decoded.size() > BloscHeader::kMaxBufferSize) {
        throw EncodeError(std::format("blosc input of {} bytes exceeds maximum size of {}",
                                      decoded.size(), BloscHeader::kMaxBufferSize),
                          ErrorContext{}.withCodec("blosc"));
    }

    Bytes out(decoded.size() + BLOSC_MAX_OVERHEAD);
    const std::string cname(bloscCompressorToString(config_.cname));
    const int n = blosc_compress_ctx(config_.clevel, toBloscShuffle(config_.shuffle),
                                     config_.typesize.value_or(1), decoded.size(), decoded.data(),
                                     out.data(), out.size(), cname.c_str(), config_.blocksize,
                                     /*numinternalthreads=*/1);
    if (n <= 0) {
        throw EncodeError(std::format("blosc compression with {} failed ({})", cname, n),
                          ErrorContext{}.withCodec("blosc"));
    }
    out.resize(static_cast<std::size_t>(n));
    return out;
}

Bytes BloscCodec::decode(ByteSpan encoded, const CodecOptions& /*options*/) const {
    return bloscDecompress(encoded);
}

BytesPartialDecoderPtr BloscCodec::partialDecoder(BytesPartialDecoderPtr input,
                                                  const CodecOptions& /*options*/) const {
    return std::make_unique<BloscPartialDecoder>(std::move(input));
}

AsyncBytesPartialDecoderPtr BloscCodec::asyncPartialDecoder(
    AsyncBytesPartialDecoderPtr input, const CodecOptions& /*options*/) const {
    return std::make_unique<AsyncBloscPartialDecoder>(std::move(input));
}

// =============================================================================
// Partial Decoders
// =============================================================================

BloscPartialDecoder::BloscPartialDecoder(BytesPartialDecoderPtr input) : input_(std::move(input)) {}

std::optional<std::vector<Bytes>> BloscPartialDecoder::partialDecode(
    std::span<const ByteRange> ranges, const CodecOptions& options) const {
    auto encoded = input_->decode(options);
    if (!encoded.has_value()) {
        return std::nullopt;
    }
    return bloscDecompressRanges(*encoded, ranges, options);
}

AsyncBloscPartialDecoder::AsyncBloscPartialDecoder(AsyncBytesPartialDecoderPtr input)
    : input_(std::move(input)) {}

std::future<std::optional<std::vector<Bytes>>> AsyncBloscPartialDecoder::partialDecode(
    std::vector<ByteRange> ranges, CodecOptions options) const {
    auto pending = input_->decode(options);
    return std::async(std::launch::deferred,
                      [pending = std::move(pending), ranges = std::move(ranges),
                       options]() mutable -> std::optional<std::vector<Bytes>> {
                          auto encoded = pending.get();
                          if (!encoded.has_value()) {
                              return std::nullopt;
                          }
                          return bloscDecompressRanges(*encoded, ranges, options);
                      });
}

}  // namespace zcodec::codec
