// =============================================================================
// zcodec - Codec Configuration
// =============================================================================
// Typed configuration for every supported codec stage.
//
// The set of codecs is closed: a CodecConfiguration is a std::variant of the
// per-codec configuration structs. Each struct validates itself; makeCodec()
// (codec_factory.h) turns a configuration into a stage object.
//
// Supported codecs:
// - bytes (array-to-bytes): element serialization in a fixed byte order
// - blosc (bytes-to-bytes): blocked compressor with block-targeted partial decode
// - zstd  (bytes-to-bytes)
// - gzip  (bytes-to-bytes)
// =============================================================================

#ifndef ZCODEC_CODEC_CODEC_CONFIG_H
#define ZCODEC_CODEC_CODEC_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "zcodec/common/error.h"
#include "zcodec/common/types.h"

namespace zcodec::codec {

// =============================================================================
// Bytes Codec
// =============================================================================

/// @brief Configuration of the "bytes" array-to-bytes codec.
struct BytesCodecConfig {
    /// @brief Byte order of elements in the encoded buffer.
    Endianness endian = Endianness::kLittle;

    [[nodiscard]] VoidResult validate() const { return makeVoidSuccess(); }

    bool operator==(const BytesCodecConfig&) const = default;
};

// =============================================================================
// Blosc Codec
// =============================================================================

/// @brief Internal compressor used by blosc.
enum class BloscCompressor : std::uint8_t {
    kBloscLz = 0,
    kLz4 = 1,
    kLz4Hc = 2,
    kSnappy = 3,
    kZlib = 4,
    kZstd = 5
};

/// @brief Blosc shuffle filter.
/// @note Values match the c-blosc BLOSC_NOSHUFFLE/SHUFFLE/BITSHUFFLE constants.
enum class BloscShuffle : std::uint8_t {
    kNoShuffle = 0,
    kShuffle = 1,
    kBitShuffle = 2
};

/// @brief Convert BloscCompressor to its c-blosc name (e.g. "lz4hc").
[[nodiscard]] constexpr std::string_view bloscCompressorToString(BloscCompressor cname) noexcept {
    switch (cname) {
        case BloscCompressor::kBloscLz:
            return "blosclz";
        case BloscCompressor::kLz4:
            return "lz4";
        case BloscCompressor::kLz4Hc:
            return "lz4hc";
        case BloscCompressor::kSnappy:
            return "snappy";
        case BloscCompressor::kZlib:
            return "zlib";
        case BloscCompressor::kZstd:
            return "zstd";
    }
    return "unknown";
}

/// @brief Parse a c-blosc compressor name.
[[nodiscard]] std::optional<BloscCompressor> bloscCompressorFromString(std::string_view name) noexcept;

/// @brief Convert BloscShuffle to its name ("noshuffle", "shuffle", "bitshuffle").
[[nodiscard]] constexpr std::string_view bloscShuffleToString(BloscShuffle shuffle) noexcept {
    switch (shuffle) {
        case BloscShuffle::kNoShuffle:
            return "noshuffle";
        case BloscShuffle::kShuffle:
            return "shuffle";
        case BloscShuffle::kBitShuffle:
            return "bitshuffle";
    }
    return "unknown";
}

/// @brief Parse a shuffle name.
[[nodiscard]] std::optional<BloscShuffle> bloscShuffleFromString(std::string_view name) noexcept;

/// @brief Minimum blosc compression level.
inline constexpr int kMinBloscLevel = 0;

/// @brief Maximum blosc compression level.
inline constexpr int kMaxBloscLevel = 9;

/// @brief Maximum blosc element size.
inline constexpr std::size_t kMaxBloscTypesize = 255;

/// @brief Configuration of the "blosc" bytes-to-bytes codec.
struct BloscCodecConfig {
    /// @brief Internal compressor.
    BloscCompressor cname = BloscCompressor::kLz4;

    /// @brief Compression level (0-9).
    int clevel = 5;

    /// @brief Shuffle filter.
    BloscShuffle shuffle = BloscShuffle::kNoShuffle;

    /// @brief Element size used by the shuffle filter (1 if unset).
    /// @note Required when shuffling.
    std::optional<std::size_t> typesize;

    /// @brief Block size in bytes (0 = automatic).
    std::size_t blocksize = 0;

    [[nodiscard]] VoidResult validate() const;

    bool operator==(const BloscCodecConfig&) const = default;
};

// =============================================================================
// Zstd Codec
// =============================================================================

/// @brief Minimum zstd compression level (negative levels trade ratio for speed).
inline constexpr int kMinZstdLevel = -131072;

/// @brief Maximum zstd compression level.
inline constexpr int kMaxZstdLevel = 22;

/// @brief Configuration of the "zstd" bytes-to-bytes codec.
struct ZstdCodecConfig {
    /// @brief Compression level.
    int level = 3;

    /// @brief Store a content checksum in the frame.
    bool checksum = false;

    [[nodiscard]] VoidResult validate() const;

    bool operator==(const ZstdCodecConfig&) const = default;
};

// =============================================================================
// Gzip Codec
// =============================================================================

/// @brief Configuration of the "gzip" bytes-to-bytes codec.
struct GzipCodecConfig {
    /// @brief Compression level (0-9).
    int level = 6;

    [[nodiscard]] VoidResult validate() const;

    bool operator==(const GzipCodecConfig&) const = default;
};

// =============================================================================
// Codec Configuration Variant
// =============================================================================

/// @brief Configuration of any supported codec stage.
using CodecConfiguration =
    std::variant<BytesCodecConfig, BloscCodecConfig, ZstdCodecConfig, GzipCodecConfig>;

/// @brief Name of the codec a configuration describes ("bytes", "blosc", ...).
[[nodiscard]] std::string_view codecName(const CodecConfiguration& config) noexcept;

/// @brief Validate any codec configuration.
[[nodiscard]] VoidResult validateConfiguration(const CodecConfiguration& config);

/// @brief One-line human-readable description, e.g. "blosc(cname=lz4, clevel=5, ...)".
[[nodiscard]] std::string describeConfiguration(const CodecConfiguration& config);

}  // namespace zcodec::codec

#endif  // ZCODEC_CODEC_CODEC_CONFIG_H
