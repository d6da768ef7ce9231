// =============================================================================
// zcodec - Byte Range Implementation
// =============================================================================

#include "zcodec/storage/byte_range.h"

#include <format>

namespace zcodec::storage {

ByteRange ByteRange::interval(std::uint64_t start, std::uint64_t end) {
    if (end < start) {
        throw InvalidByteRangeError(
            std::format("byte range end {} precedes start {}", end, start));
    }
    return fromStart(start, end - start);
}

VoidResult ByteRange::validate(std::uint64_t totalLength) const {
    if (kind_ == ByteRangeKind::kSuffix) {
        if (*length_ > totalLength) {
            return makeVoidError(ErrorCode::kInvalidByteRange,
                                 std::format("byte range {} exceeds value length {}", toString(),
                                             totalLength));
        }
        return makeVoidSuccess();
    }

    if (offset_ > totalLength) {
        return makeVoidError(ErrorCode::kInvalidByteRange,
                             std::format("byte range {} starts past value length {}", toString(),
                                         totalLength));
    }
    if (length_.has_value() && *length_ > totalLength - offset_) {
        return makeVoidError(ErrorCode::kInvalidByteRange,
                             std::format("byte range {} exceeds value length {}", toString(),
                                         totalLength));
    }
    return makeVoidSuccess();
}

std::uint64_t ByteRange::start(std::uint64_t totalLength) const {
    unwrapOrThrow(validate(totalLength));
    if (kind_ == ByteRangeKind::kSuffix) {
        return totalLength - *length_;
    }
    return offset_;
}

std::uint64_t ByteRange::end(std::uint64_t totalLength) const {
    unwrapOrThrow(validate(totalLength));
    if (kind_ == ByteRangeKind::kFromStart && length_.has_value()) {
        return offset_ + *length_;
    }
    return totalLength;
}

std::uint64_t ByteRange::length(std::uint64_t totalLength) const {
    return end(totalLength) - start(totalLength);
}

std::string ByteRange::toString() const {
    if (kind_ == ByteRangeKind::kSuffix) {
        return std::format("-{}..", *length_);
    }
    if (length_.has_value()) {
        return std::format("{}..{}", offset_, offset_ + *length_);
    }
    return std::format("{}..", offset_);
}

// =============================================================================
// Helpers
// =============================================================================

void validateByteRanges(std::span<const ByteRange> ranges, std::uint64_t totalLength) {
    for (std::size_t i = 0; i < ranges.size(); ++i) {
        auto result = ranges[i].validate(totalLength);
        if (!result.has_value()) {
            throw InvalidByteRangeError(result.error().message(), ErrorContext{}.withRequest(i));
        }
    }
}

std::vector<Bytes> extractByteRanges(ByteSpan value, std::span<const ByteRange> ranges) {
    validateByteRanges(ranges, value.size());

    std::vector<Bytes> out;
    out.reserve(ranges.size());
    for (const ByteRange& range : ranges) {
        const auto first = static_cast<std::size_t>(range.start(value.size()));
        const auto last = static_cast<std::size_t>(range.end(value.size()));
        out.emplace_back(value.begin() + static_cast<std::ptrdiff_t>(first),
                         value.begin() + static_cast<std::ptrdiff_t>(last));
    }
    return out;
}

}  // namespace zcodec::storage
