// =============================================================================
// zcodec - Chunk Key Encoding
// =============================================================================
// Maps chunk grid coordinates to the key suffix a chunk is stored under.
//
// - default: "c/1/2" ('/' separator) or "c.1.2" ('.' separator); "c" for a
//   zero-dimensional chunk
// - v2: "1.2" ('.' separator) or "1/2" ('/' separator); "0" for a
//   zero-dimensional chunk
// =============================================================================

#ifndef ZCODEC_ARRAY_CHUNK_KEY_ENCODING_H
#define ZCODEC_ARRAY_CHUNK_KEY_ENCODING_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "zcodec/common/types.h"

namespace zcodec::array {

enum class ChunkKeyEncodingKind : std::uint8_t {
    kDefault = 0,
    kV2 = 1
};

enum class ChunkKeySeparator : char {
    kSlash = '/',
    kDot = '.'
};

[[nodiscard]] constexpr std::string_view chunkKeyEncodingKindToString(
    ChunkKeyEncodingKind kind) noexcept {
    return kind == ChunkKeyEncodingKind::kV2 ? "v2" : "default";
}

/// @brief Parse "default" or "v2".
[[nodiscard]] std::optional<ChunkKeyEncodingKind> chunkKeyEncodingKindFromString(
    std::string_view name) noexcept;

class ChunkKeyEncoding {
public:
    /// @brief The "default" encoding with '/' separators.
    ChunkKeyEncoding() = default;

    ChunkKeyEncoding(ChunkKeyEncodingKind kind, ChunkKeySeparator separator)
        : kind_(kind), separator_(separator) {}

    [[nodiscard]] static ChunkKeyEncoding defaultEncoding(
        ChunkKeySeparator separator = ChunkKeySeparator::kSlash) {
        return {ChunkKeyEncodingKind::kDefault, separator};
    }

    [[nodiscard]] static ChunkKeyEncoding v2(ChunkKeySeparator separator = ChunkKeySeparator::kDot) {
        return {ChunkKeyEncodingKind::kV2, separator};
    }

    /// @brief Key suffix of the chunk at `indices`.
    [[nodiscard]] std::string encode(const ChunkIndices& indices) const;

    [[nodiscard]] ChunkKeyEncodingKind kind() const noexcept { return kind_; }
    [[nodiscard]] ChunkKeySeparator separator() const noexcept { return separator_; }

    bool operator==(const ChunkKeyEncoding& other) const = default;

private:
    ChunkKeyEncodingKind kind_ = ChunkKeyEncodingKind::kDefault;
    ChunkKeySeparator separator_ = ChunkKeySeparator::kSlash;
};

}  // namespace zcodec::array

#endif  // ZCODEC_ARRAY_CHUNK_KEY_ENCODING_H
