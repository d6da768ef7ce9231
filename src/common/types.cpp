// =============================================================================
// zcodec - Common Type Definitions Implementation
// =============================================================================

#include "zcodec/common/types.h"

#include <algorithm>
#include <array>
#include <cstring>
#include <format>
#include <utility>

namespace zcodec {

namespace {

constexpr std::array kAllDataTypes = {
    DataType::kBool,   DataType::kInt8,   DataType::kInt16,   DataType::kInt32,
    DataType::kInt64,  DataType::kUInt8,  DataType::kUInt16,  DataType::kUInt32,
    DataType::kUInt64, DataType::kFloat32, DataType::kFloat64};

}  // namespace

std::optional<DataType> dataTypeFromString(std::string_view name) noexcept {
    for (DataType type : kAllDataTypes) {
        if (dataTypeToString(type) == name) {
            return type;
        }
    }
    return std::nullopt;
}

// =============================================================================
// ChunkRepresentation Implementation
// =============================================================================

ChunkRepresentation::ChunkRepresentation(ArrayShape chunkShape, DataType type, Bytes fill)
    : shape(std::move(chunkShape)), dataType(type), fillValue(std::move(fill)) {
    if (fillValue.empty()) {
        fillValue.assign(elementSize(), 0);
    }
}

std::uint64_t ChunkRepresentation::numElements() const noexcept {
    std::uint64_t count = 1;
    for (std::uint64_t extent : shape) {
        count *= extent;
    }
    return count;
}

Bytes ChunkRepresentation::filledChunk() const {
    const std::size_t elemSize = elementSize();
    Bytes chunk(static_cast<std::size_t>(sizeBytes()));
    if (std::all_of(fillValue.begin(), fillValue.end(), [](std::uint8_t b) { return b == 0; })) {
        return chunk;
    }
    for (std::size_t offset = 0; offset < chunk.size(); offset += elemSize) {
        std::memcpy(chunk.data() + offset, fillValue.data(), elemSize);
    }
    return chunk;
}

bool ChunkRepresentation::isFillValue(ByteSpan decoded) const noexcept {
    const std::size_t elemSize = elementSize();
    if (fillValue.size() != elemSize || decoded.size() % elemSize != 0) {
        return false;
    }
    for (std::size_t offset = 0; offset < decoded.size(); offset += elemSize) {
        if (std::memcmp(decoded.data() + offset, fillValue.data(), elemSize) != 0) {
            return false;
        }
    }
    return true;
}

VoidResult ChunkRepresentation::validate() const {
    for (std::size_t dim = 0; dim < shape.size(); ++dim) {
        if (shape[dim] == 0) {
            return makeVoidError(ErrorCode::kInvalidConfig,
                                 std::format("chunk shape dimension {} is zero", dim));
        }
    }
    if (fillValue.size() != elementSize()) {
        return makeVoidError(
            ErrorCode::kInvalidConfig,
            std::format("fill value has {} bytes, {} expects {}", fillValue.size(),
                        dataTypeToString(dataType), elementSize()));
    }
    return makeVoidSuccess();
}

}  // namespace zcodec
