// =============================================================================
// zcodec - Byte Range
// =============================================================================
// A sub-interval of a byte buffer whose total length may not be known yet.
//
// A ByteRange is either:
// - FromStart(offset, length): `length` bytes from `offset`, or everything
//   from `offset` to the end when no length is given
// - Suffix(length): the last `length` bytes
//
// Resolution against a known total length N yields concrete [start, end)
// offsets with 0 <= start <= end <= N. A range that does not fit is a caller
// contract violation and raises InvalidByteRangeError; it is never clamped.
// =============================================================================

#ifndef ZCODEC_STORAGE_BYTE_RANGE_H
#define ZCODEC_STORAGE_BYTE_RANGE_H

#include <cstdint>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <vector>

#include "zcodec/common/error.h"
#include "zcodec/common/types.h"

namespace zcodec::storage {

/// @brief Kind of a byte range.
enum class ByteRangeKind : std::uint8_t {
    /// @brief Offset from the start, with an optional length.
    kFromStart = 0,

    /// @brief Length measured back from the end.
    kSuffix = 1
};

/// @brief A byte range over a value of (possibly) unknown length.
class ByteRange {
public:
    /// @brief The whole value.
    constexpr ByteRange() noexcept = default;

    /// @brief `length` bytes starting at `offset`, or to the end if no length.
    [[nodiscard]] static constexpr ByteRange fromStart(
        std::uint64_t offset, std::optional<std::uint64_t> length = std::nullopt) noexcept {
        return ByteRange(ByteRangeKind::kFromStart, offset, length);
    }

    /// @brief The last `length` bytes.
    [[nodiscard]] static constexpr ByteRange suffix(std::uint64_t length) noexcept {
        return ByteRange(ByteRangeKind::kSuffix, 0, length);
    }

    /// @brief The half-open interval [start, end).
    /// @throws InvalidByteRangeError if end < start.
    [[nodiscard]] static ByteRange interval(std::uint64_t start, std::uint64_t end);

    /// @brief The whole value.
    [[nodiscard]] static constexpr ByteRange full() noexcept { return ByteRange{}; }

    [[nodiscard]] constexpr ByteRangeKind kind() const noexcept { return kind_; }

    /// @brief Start offset of a FromStart range (0 for a suffix).
    [[nodiscard]] constexpr std::uint64_t offset() const noexcept { return offset_; }

    /// @brief Requested length, if the range states one.
    [[nodiscard]] constexpr std::optional<std::uint64_t> requestedLength() const noexcept {
        return length_;
    }

    /// @brief Check if the range covers a whole value of any length.
    [[nodiscard]] constexpr bool isFull() const noexcept {
        return kind_ == ByteRangeKind::kFromStart && offset_ == 0 && !length_.has_value();
    }

    /// @brief Resolved inclusive start offset.
    /// @throws InvalidByteRangeError if the range does not fit in `totalLength`.
    [[nodiscard]] std::uint64_t start(std::uint64_t totalLength) const;

    /// @brief Resolved exclusive end offset.
    /// @throws InvalidByteRangeError if the range does not fit in `totalLength`.
    [[nodiscard]] std::uint64_t end(std::uint64_t totalLength) const;

    /// @brief Resolved length in bytes.
    /// @throws InvalidByteRangeError if the range does not fit in `totalLength`.
    [[nodiscard]] std::uint64_t length(std::uint64_t totalLength) const;

    /// @brief Check that the range fits in a value of `totalLength` bytes.
    [[nodiscard]] VoidResult validate(std::uint64_t totalLength) const;

    /// @brief Human-readable form, e.g. "8..16", "8..", "-4..".
    [[nodiscard]] std::string toString() const;

    constexpr bool operator==(const ByteRange& other) const noexcept = default;

    friend std::ostream& operator<<(std::ostream& os, const ByteRange& range) {
        return os << range.toString();
    }

private:
    constexpr ByteRange(ByteRangeKind kind, std::uint64_t offset,
                        std::optional<std::uint64_t> length) noexcept
        : kind_(kind), offset_(offset), length_(length) {}

    ByteRangeKind kind_ = ByteRangeKind::kFromStart;
    std::uint64_t offset_ = 0;
    std::optional<std::uint64_t> length_;
};

// =============================================================================
// Helpers
// =============================================================================

/// @brief Slice a fully materialized value into one buffer per range, in order.
/// @throws InvalidByteRangeError (with the request index in the context) if
///         any range does not fit in the value.
[[nodiscard]] std::vector<Bytes> extractByteRanges(ByteSpan value,
                                                   std::span<const ByteRange> ranges);

/// @brief Validate every range against `totalLength` before any is served.
/// @throws InvalidByteRangeError naming the first offending request.
void validateByteRanges(std::span<const ByteRange> ranges, std::uint64_t totalLength);

}  // namespace zcodec::storage

#endif  // ZCODEC_STORAGE_BYTE_RANGE_H
