// =============================================================================
// zcodec - Chunk Key Encoding Implementation
// =============================================================================

#include "zcodec/array/chunk_key_encoding.h"

namespace zcodec::array {

std::optional<ChunkKeyEncodingKind> chunkKeyEncodingKindFromString(
    std::string_view name) noexcept {
    if (name == "default") {
        return ChunkKeyEncodingKind::kDefault;
    }
    if (name == "v2") {
        return ChunkKeyEncodingKind::kV2;
    }
    return std::nullopt;
}

std::string ChunkKeyEncoding::encode(const ChunkIndices& indices) const {
    const char sep = static_cast<char>(separator_);
    std::string key;

    if (kind_ == ChunkKeyEncodingKind::kDefault) {
        key = "c";
        for (const auto index : indices) {
            key += sep;
            key += std::to_string(index);
        }
        return key;
    }

    if (indices.empty()) {
        return "0";
    }
    for (std::size_t i = 0; i < indices.size(); ++i) {
        if (i != 0) {
            key += sep;
        }
        key += std::to_string(indices[i]);
    }
    return key;
}

}  // namespace zcodec::array
