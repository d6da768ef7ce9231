// =============================================================================
// zcodec - Chunk Grid Implementation
// =============================================================================

#include "zcodec/array/chunk_grid.h"

#include <format>
#include <utility>

namespace zcodec::array {

ChunkGrid::ChunkGrid(ArrayShape arrayShape, ArrayShape chunkShape)
    : arrayShape_(std::move(arrayShape)), chunkShape_(std::move(chunkShape)) {
    if (arrayShape_.size() != chunkShape_.size()) {
        throw ConfigError(std::format("chunk shape has {} dimensions, array shape has {}",
                                      chunkShape_.size(), arrayShape_.size()));
    }
    for (std::size_t dim = 0; dim < chunkShape_.size(); ++dim) {
        if (chunkShape_[dim] == 0) {
            throw ConfigError(std::format("chunk extent of dimension {} is zero", dim));
        }
    }
}

ArrayShape ChunkGrid::gridShape() const {
    ArrayShape grid(arrayShape_.size());
    for (std::size_t dim = 0; dim < arrayShape_.size(); ++dim) {
        grid[dim] = (arrayShape_[dim] + chunkShape_[dim] - 1) / chunkShape_[dim];
    }
    return grid;
}

std::uint64_t ChunkGrid::numChunks() const {
    std::uint64_t count = 1;
    for (const auto extent : gridShape()) {
        count *= extent;
    }
    return count;
}

VoidResult ChunkGrid::validateIndices(const ChunkIndices& indices) const {
    if (indices.size() != dimensionality()) {
        return makeVoidError(ErrorCode::kUsageError,
                             std::format("chunk indices have {} dimensions, grid has {}",
                                         indices.size(), dimensionality()));
    }
    const ArrayShape grid = gridShape();
    for (std::size_t dim = 0; dim < indices.size(); ++dim) {
        if (indices[dim] >= grid[dim]) {
            return makeVoidError(ErrorCode::kUsageError,
                                 std::format("chunk index {} of dimension {} is outside the grid "
                                             "extent {}",
                                             indices[dim], dim, grid[dim]));
        }
    }
    return makeVoidSuccess();
}

}  // namespace zcodec::array
