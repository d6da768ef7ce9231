// =============================================================================
// zcodec - Chunk Grid
// =============================================================================
// Regular chunk grid: an array shape tiled by chunks of one fixed shape. Edge
// chunks keep the full chunk shape; elements beyond the array extent hold
// the fill value.
// =============================================================================

#ifndef ZCODEC_ARRAY_CHUNK_GRID_H
#define ZCODEC_ARRAY_CHUNK_GRID_H

#include "zcodec/common/types.h"

namespace zcodec::array {

class ChunkGrid {
public:
    /// @throws ConfigError if the ranks differ or a chunk extent is zero.
    ChunkGrid(ArrayShape arrayShape, ArrayShape chunkShape);

    [[nodiscard]] const ArrayShape& arrayShape() const noexcept { return arrayShape_; }
    [[nodiscard]] const ArrayShape& chunkShape() const noexcept { return chunkShape_; }
    [[nodiscard]] std::size_t dimensionality() const noexcept { return arrayShape_.size(); }

    /// @brief Number of chunks along each dimension.
    [[nodiscard]] ArrayShape gridShape() const;

    /// @brief Total number of chunks.
    [[nodiscard]] std::uint64_t numChunks() const;

    /// @brief Check that `indices` name a chunk of this grid.
    [[nodiscard]] VoidResult validateIndices(const ChunkIndices& indices) const;

    bool operator==(const ChunkGrid& other) const = default;

private:
    ArrayShape arrayShape_;
    ArrayShape chunkShape_;
};

}  // namespace zcodec::array

#endif  // ZCODEC_ARRAY_CHUNK_GRID_H
