// =============================================================================
// zcodec - Bytes Codec Implementation
// =============================================================================

#include "zcodec/codec/bytes_codec.h"

#include <algorithm>
#include <format>
#include <future>
#include <utility>

namespace zcodec::codec {

namespace {

bool needsSwap(const ChunkRepresentation& rep, Endianness endian) noexcept {
    return rep.elementSize() > 1 && endian != nativeEndianness();
}

/// @brief Decoded ranges widened to element boundaries, resolved against the chunk size.
/// @note `widened` ends with one extra range starting at the chunk size; it reads
///       empty exactly when the encoded value is no longer than the chunk.
struct ElementRanges {
    std::vector<ByteRange> widened;
    std::vector<std::uint64_t> skip;
    std::vector<std::uint64_t> length;
};

ElementRanges widenToElements(std::span<const ByteRange> ranges, const ChunkRepresentation& rep) {
    const std::uint64_t total = rep.sizeBytes();
    const std::uint64_t elemSize = rep.elementSize();
    storage::validateByteRanges(ranges, total);

    ElementRanges out;
    out.widened.reserve(ranges.size());
    out.skip.reserve(ranges.size());
    out.length.reserve(ranges.size());
    for (const ByteRange& range : ranges) {
        const std::uint64_t start = range.start(total);
        const std::uint64_t end = range.end(total);
        const std::uint64_t alignedStart = start / elemSize * elemSize;
        const std::uint64_t alignedEnd = (end + elemSize - 1) / elemSize * elemSize;
        out.widened.push_back(ByteRange::interval(alignedStart, alignedEnd));
        out.skip.push_back(start - alignedStart);
        out.length.push_back(end - start);
    }
    out.widened.push_back(ByteRange::fromStart(total));
    return out;
}

/// @brief Remove the trailing extent range, rejecting a value longer than the chunk.
void dropExtentCheck(std::vector<Bytes>& parts, std::size_t requested, std::uint64_t total) {
    if (parts.size() != requested + 1) {
        throw DecodeError(std::format("bytes codec expected {} decoded ranges, got {}",
                                      requested + 1, parts.size()),
                          ErrorContext{}.withCodec("bytes"));
    }
    if (!parts.back().empty()) {
        throw DecodeError(std::format("bytes codec expected {} encoded bytes, got {} more",
                                      total, parts.back().size()),
                          ErrorContext{}.withCodec("bytes"));
    }
    parts.pop_back();
}

/// @brief The inner value ended before the chunk did.
[[noreturn]] void throwShortValue(const InvalidByteRangeError& ex, std::uint64_t total) {
    ErrorContext context = ex.context().value_or(ErrorContext{});
    context.codecName = "bytes";
    context.requestIndex.reset();
    throw DecodeError(
        std::format("bytes codec expected {} encoded bytes, stored value is shorter: {}", total,
                    ex.message()),
        std::move(context));
}

std::vector<Bytes> trimElements(std::vector<Bytes> parts, const ElementRanges& ranges,
                                std::size_t elementSize, bool swap) {
    for (std::size_t i = 0; i < parts.size(); ++i) {
        Bytes& part = parts[i];
        if (swap) {
            swapElementBytes(part, elementSize);
        }
        if (ranges.skip[i] != 0 || ranges.length[i] != part.size()) {
            const auto first = part.begin() + static_cast<std::ptrdiff_t>(ranges.skip[i]);
            part = Bytes(first, first + static_cast<std::ptrdiff_t>(ranges.length[i]));
        }
    }
    return parts;
}

}  // namespace

void swapElementBytes(std::span<std::uint8_t> data, std::size_t elementSize) noexcept {
    if (elementSize <= 1) {
        return;
    }
    for (std::size_t offset = 0; offset + elementSize <= data.size(); offset += elementSize) {
        std::reverse(data.begin() + static_cast<std::ptrdiff_t>(offset),
                     data.begin() + static_cast<std::ptrdiff_t>(offset + elementSize));
    }
}

// =============================================================================
// BytesCodec Implementation
// =============================================================================

BytesCodec::BytesCodec(BytesCodecConfig config) : config_(config) {}

Bytes BytesCodec::encode(ByteSpan decoded, const ChunkRepresentation& decodedRep,
                         const CodecOptions& /*options*/) const {
    if (decoded.size() != decodedRep.sizeBytes()) {
        throw EncodeError(std::format("bytes codec expected {} decoded bytes, got {}",
                                      decodedRep.sizeBytes(), decoded.size()),
                          ErrorContext{}.withCodec("bytes"));
    }
    Bytes out(decoded.begin(), decoded.end());
    if (needsSwap(decodedRep, config_.endian)) {
        swapElementBytes(out, decodedRep.elementSize());
    }
    return out;
}

Bytes BytesCodec::decode(ByteSpan encoded, const ChunkRepresentation& decodedRep,
                         const CodecOptions& /*options*/) const {
    if (encoded.size() != decodedRep.sizeBytes()) {
        throw DecodeError(std::format("bytes codec expected {} encoded bytes, got {}",
                                      decodedRep.sizeBytes(), encoded.size()),
                          ErrorContext{}.withCodec("bytes"));
    }
    Bytes out(encoded.begin(), encoded.end());
    if (needsSwap(decodedRep, config_.endian)) {
        swapElementBytes(out, decodedRep.elementSize());
    }
    return out;
}

BytesPartialDecoderPtr BytesCodec::partialDecoder(BytesPartialDecoderPtr input,
                                                  const ChunkRepresentation& decodedRep,
                                                  const CodecOptions& /*options*/) const {
    return std::make_unique<BytesCodecPartialDecoder>(std::move(input), decodedRep,
                                                      config_.endian);
}

AsyncBytesPartialDecoderPtr BytesCodec::asyncPartialDecoder(
    AsyncBytesPartialDecoderPtr input, const ChunkRepresentation& decodedRep,
    const CodecOptions& /*options*/) const {
    return std::make_unique<AsyncBytesCodecPartialDecoder>(std::move(input), decodedRep,
                                                           config_.endian);
}

// =============================================================================
// Partial Decoders
// =============================================================================

BytesCodecPartialDecoder::BytesCodecPartialDecoder(BytesPartialDecoderPtr input,
                                                   ChunkRepresentation decodedRep,
                                                   Endianness endian)
    : input_(std::move(input)), decodedRep_(std::move(decodedRep)), endian_(endian) {}

std::optional<std::vector<Bytes>> BytesCodecPartialDecoder::partialDecode(
    std::span<const ByteRange> ranges, const CodecOptions& options) const {
    ElementRanges elementRanges;
    try {
        elementRanges = widenToElements(ranges, decodedRep_);
    } catch (const ZcodecException& ex) {
        rethrowWithContext(ex, ErrorContext{}.withCodec("bytes"));
    }

    const std::uint64_t total = decodedRep_.sizeBytes();
    std::optional<std::vector<Bytes>> parts;
    try {
        parts = input_->partialDecode(elementRanges.widened, options);
    } catch (const InvalidByteRangeError& ex) {
        throwShortValue(ex, total);
    }
    if (!parts.has_value()) {
        return std::nullopt;
    }
    dropExtentCheck(*parts, ranges.size(), total);
    return trimElements(std::move(*parts), elementRanges, decodedRep_.elementSize(),
                        needsSwap(decodedRep_, endian_));
}

AsyncBytesCodecPartialDecoder::AsyncBytesCodecPartialDecoder(AsyncBytesPartialDecoderPtr input,
                                                             ChunkRepresentation decodedRep,
                                                             Endianness endian)
    : input_(std::move(input)), decodedRep_(std::move(decodedRep)), endian_(endian) {}

std::future<std::optional<std::vector<Bytes>>> AsyncBytesCodecPartialDecoder::partialDecode(
    std::vector<ByteRange> ranges, CodecOptions options) const {
    ElementRanges elementRanges;
    try {
        try {
            elementRanges = widenToElements(ranges, decodedRep_);
        } catch (const ZcodecException& ex) {
            rethrowWithContext(ex, ErrorContext{}.withCodec("bytes"));
        }
    } catch (const ZcodecException&) {
        // Range errors are delivered through the future like every other error.
        std::promise<std::optional<std::vector<Bytes>>> failed;
        failed.set_exception(std::current_exception());
        return failed.get_future();
    }

    auto pending = input_->partialDecode(elementRanges.widened, options);
    return std::async(std::launch::deferred,
                      [pending = std::move(pending), elementRanges = std::move(elementRanges),
                       requested = ranges.size(), total = decodedRep_.sizeBytes(),
                       elementSize = decodedRep_.elementSize(),
                       swap = needsSwap(decodedRep_, endian_)]() mutable
                      -> std::optional<std::vector<Bytes>> {
                          std::optional<std::vector<Bytes>> parts;
                          try {
                              parts = pending.get();
                          } catch (const InvalidByteRangeError& ex) {
                              throwShortValue(ex, total);
                          }
                          if (!parts.has_value()) {
                              return std::nullopt;
                          }
                          dropExtentCheck(*parts, requested, total);
                          return trimElements(std::move(*parts), elementRanges, elementSize, swap);
                      });
}

}  // namespace zcodec::codec
