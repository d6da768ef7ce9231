// =============================================================================
// zcodec - Common Type Definitions
// =============================================================================
// Core type definitions for the zcodec library.
//
// This module defines:
// - Bytes, ByteSpan: owned and borrowed byte buffers
// - ArrayShape, ChunkIndices: grid geometry aliases
// - DataType: Enum for array element types
// - Endianness: Enum for element byte order
// - ChunkRepresentation: Shape, data type and fill value of a decoded chunk
// - CodecOptions: Per-call options for codec and storage operations
// - C++20 Concepts for type constraints
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef ZCODEC_COMMON_TYPES_H
#define ZCODEC_COMMON_TYPES_H

#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "zcodec/common/error.h"

namespace zcodec {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Owned byte buffer (encoded or decoded chunk bytes).
using Bytes = std::vector<std::uint8_t>;

/// @brief Borrowed, immutable view of a byte buffer.
using ByteSpan = std::span<const std::uint8_t>;

/// @brief Shape of an array or chunk (one extent per dimension).
using ArrayShape = std::vector<std::uint64_t>;

/// @brief Coordinates of a chunk in the chunk grid.
using ChunkIndices = std::vector<std::uint64_t>;

// =============================================================================
// Constants
// =============================================================================

/// @brief Default number of concurrent sub-operations when parallelism is enabled.
inline constexpr std::size_t kDefaultConcurrencyTarget = 4;

// =============================================================================
// Data Type Enumeration
// =============================================================================

/// @brief Array element data types.
enum class DataType : std::uint8_t {
    kBool = 0,
    kInt8,
    kInt16,
    kInt32,
    kInt64,
    kUInt8,
    kUInt16,
    kUInt32,
    kUInt64,
    kFloat32,
    kFloat64
};

/// @brief Size in bytes of one element of the given data type.
[[nodiscard]] constexpr std::size_t dataTypeSize(DataType type) noexcept {
    switch (type) {
        case DataType::kBool:
        case DataType::kInt8:
        case DataType::kUInt8:
            return 1;
        case DataType::kInt16:
        case DataType::kUInt16:
            return 2;
        case DataType::kInt32:
        case DataType::kUInt32:
        case DataType::kFloat32:
            return 4;
        case DataType::kInt64:
        case DataType::kUInt64:
        case DataType::kFloat64:
            return 8;
    }
    return 1;
}

/// @brief Convert DataType to its canonical name (e.g. "int32").
[[nodiscard]] constexpr std::string_view dataTypeToString(DataType type) noexcept {
    switch (type) {
        case DataType::kBool:
            return "bool";
        case DataType::kInt8:
            return "int8";
        case DataType::kInt16:
            return "int16";
        case DataType::kInt32:
            return "int32";
        case DataType::kInt64:
            return "int64";
        case DataType::kUInt8:
            return "uint8";
        case DataType::kUInt16:
            return "uint16";
        case DataType::kUInt32:
            return "uint32";
        case DataType::kUInt64:
            return "uint64";
        case DataType::kFloat32:
            return "float32";
        case DataType::kFloat64:
            return "float64";
    }
    return "unknown";
}

/// @brief Parse a canonical data type name.
/// @return The data type, or std::nullopt if the name is unknown.
[[nodiscard]] std::optional<DataType> dataTypeFromString(std::string_view name) noexcept;

// =============================================================================
// Endianness Enumeration
// =============================================================================

/// @brief Byte order of multi-byte elements in an encoded buffer.
enum class Endianness : std::uint8_t {
    kLittle = 0,
    kBig = 1
};

/// @brief Byte order of the running machine.
[[nodiscard]] constexpr Endianness nativeEndianness() noexcept {
    return std::endian::native == std::endian::big ? Endianness::kBig : Endianness::kLittle;
}

/// @brief Convert Endianness to string representation.
[[nodiscard]] constexpr std::string_view endiannessToString(Endianness endian) noexcept {
    return endian == Endianness::kBig ? "big" : "little";
}

// =============================================================================
// Chunk Representation
// =============================================================================

/// @brief Shape, element type and fill value of a decoded chunk.
/// @note The decoded byte size is always a multiple of the element size.
struct ChunkRepresentation {
    /// @brief Chunk shape (elements per dimension). Empty for zero-dimensional chunks.
    ArrayShape shape;

    /// @brief Element data type.
    DataType dataType = DataType::kUInt8;

    /// @brief Fill value, one element in native byte order.
    Bytes fillValue;

    /// @brief Default constructor.
    ChunkRepresentation() = default;

    /// @brief Construct with shape, data type and fill value.
    /// @note An empty fill value is replaced by an all-zero element.
    ChunkRepresentation(ArrayShape chunkShape, DataType type, Bytes fill = {});

    /// @brief Size of one element in bytes.
    [[nodiscard]] std::size_t elementSize() const noexcept { return dataTypeSize(dataType); }

    /// @brief Number of elements in the chunk.
    [[nodiscard]] std::uint64_t numElements() const noexcept;

    /// @brief Decoded size of the chunk in bytes.
    [[nodiscard]] std::uint64_t sizeBytes() const noexcept { return numElements() * elementSize(); }

    /// @brief Build a decoded chunk whose every element equals the fill value.
    [[nodiscard]] Bytes filledChunk() const;

    /// @brief Check whether every element of a decoded chunk equals the fill value.
    [[nodiscard]] bool isFillValue(ByteSpan decoded) const noexcept;

    /// @brief Validate shape and fill value.
    [[nodiscard]] VoidResult validate() const;

    bool operator==(const ChunkRepresentation& other) const = default;
};

// =============================================================================
// Codec Options
// =============================================================================

/// @brief Options passed explicitly to every codec and storage operation.
/// @note There is no process-wide default: callers always state their intent.
struct CodecOptions {
    /// @brief Permit concurrent execution of independent sub-operations.
    /// @note Advisory only: never changes results.
    bool parallel = false;

    /// @brief Upper bound on concurrent sub-operations when parallel is set.
    std::size_t concurrencyTarget = kDefaultConcurrencyTarget;

    /// @brief Options with the parallel hint enabled.
    [[nodiscard]] static CodecOptions parallelOptions(
        std::size_t concurrency = kDefaultConcurrencyTarget) noexcept {
        return CodecOptions{true, concurrency == 0 ? 1 : concurrency};
    }
};

// =============================================================================
// Concepts
// =============================================================================

/// @brief Concept for contiguous containers of bytes.
template <typename T>
concept ByteContainer = requires(const T& container) {
    { std::data(container) } -> std::convertible_to<const std::uint8_t*>;
    { std::size(container) } -> std::convertible_to<std::size_t>;
};

// =============================================================================
// Static Assertions
// =============================================================================

static_assert(sizeof(DataType) == 1, "DataType must be 1 byte");
static_assert(sizeof(Endianness) == 1, "Endianness must be 1 byte");
static_assert(ByteContainer<Bytes>, "Bytes must satisfy ByteContainer");
static_assert(ByteContainer<ByteSpan>, "ByteSpan must satisfy ByteContainer");

}  // namespace zcodec

#endif  // ZCODEC_COMMON_TYPES_H
