// =============================================================================
// zcodec - Codec Interfaces
// =============================================================================
// Abstract codec stages of a chunk codec pipeline.
//
// A pipeline is an ordered stack of stages:
// - zero or more ArrayToArrayCodec (shape-aware transforms of decoded data)
// - exactly one ArrayToBytesCodec (serializes elements to bytes)
// - zero or more BytesToBytesCodec (compression and other byte transforms)
//
// Every stage implements full encode and decode. Partial decoding is
// optional: a stage that has no targeted fast path inherits the default,
// which fully decodes its input once and slices the result.
//
// Stages are immutable after construction and may be shared across threads.
// They are owned through shared_ptr; the default partial decoders hold a
// reference to their stage, so decoders and their futures may outlive the
// pipeline that built them.
// =============================================================================

#ifndef ZCODEC_CODEC_CODEC_H
#define ZCODEC_CODEC_CODEC_H

#include <cstdint>
#include <memory>
#include <string_view>

#include "zcodec/codec/partial_decoder.h"
#include "zcodec/common/types.h"

namespace zcodec::codec {

// =============================================================================
// Codec Kind Enumeration
// =============================================================================

/// @brief Classification of a codec by what it consumes and produces.
enum class CodecKind : std::uint8_t {
    kArrayToArray = 0,
    kArrayToBytes = 1,
    kBytesToBytes = 2
};

/// @brief Convert CodecKind to string representation.
[[nodiscard]] constexpr std::string_view codecKindToString(CodecKind kind) noexcept {
    switch (kind) {
        case CodecKind::kArrayToArray:
            return "array-to-array";
        case CodecKind::kArrayToBytes:
            return "array-to-bytes";
        case CodecKind::kBytesToBytes:
            return "bytes-to-bytes";
    }
    return "unknown";
}

// =============================================================================
// Codec Base
// =============================================================================

/// @brief Common base of all codec stages.
class Codec : public std::enable_shared_from_this<Codec> {
public:
    virtual ~Codec() = default;

    /// @brief Registered codec name (e.g. "blosc").
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /// @brief Stage classification.
    [[nodiscard]] virtual CodecKind kind() const noexcept = 0;

    /// @brief Whether partial decoding avoids decoding the whole input.
    [[nodiscard]] virtual bool hasTargetedPartialDecode() const noexcept { return false; }

protected:
    Codec() = default;
    Codec(const Codec&) = default;
    Codec& operator=(const Codec&) = default;
};

// =============================================================================
// Array-to-Array Codec
// =============================================================================

/// @brief Shape-aware transform of decoded chunk data.
class ArrayToArrayCodec : public Codec {
public:
    [[nodiscard]] CodecKind kind() const noexcept final { return CodecKind::kArrayToArray; }

    /// @brief Representation of this stage's output for a given input.
    [[nodiscard]] virtual ChunkRepresentation encodedRepresentation(
        const ChunkRepresentation& decoded) const {
        return decoded;
    }

    /// @brief Encode a whole decoded chunk.
    [[nodiscard]] virtual Bytes encode(ByteSpan decoded, const ChunkRepresentation& decodedRep,
                                       const CodecOptions& options) const = 0;

    /// @brief Decode a whole chunk back to `decodedRep`.
    [[nodiscard]] virtual Bytes decode(ByteSpan encoded, const ChunkRepresentation& decodedRep,
                                       const CodecOptions& options) const = 0;

    /// @brief Wrap `input` (serving this stage's encoded bytes) in a decoder
    ///        serving ranges of `decodedRep`.
    [[nodiscard]] virtual BytesPartialDecoderPtr partialDecoder(
        BytesPartialDecoderPtr input, const ChunkRepresentation& decodedRep,
        const CodecOptions& options) const;

    /// @brief Non-blocking twin of partialDecoder().
    [[nodiscard]] virtual AsyncBytesPartialDecoderPtr asyncPartialDecoder(
        AsyncBytesPartialDecoderPtr input, const ChunkRepresentation& decodedRep,
        const CodecOptions& options) const;
};

// =============================================================================
// Array-to-Bytes Codec
// =============================================================================

/// @brief Serialization of decoded elements to a byte sequence.
class ArrayToBytesCodec : public Codec {
public:
    [[nodiscard]] CodecKind kind() const noexcept final { return CodecKind::kArrayToBytes; }

    /// @brief Serialize a whole decoded chunk.
    /// @throws EncodeError if `decoded` does not match `decodedRep`.
    [[nodiscard]] virtual Bytes encode(ByteSpan decoded, const ChunkRepresentation& decodedRep,
                                       const CodecOptions& options) const = 0;

    /// @brief Deserialize a whole chunk.
    /// @throws DecodeError if `encoded` does not match `decodedRep`.
    [[nodiscard]] virtual Bytes decode(ByteSpan encoded, const ChunkRepresentation& decodedRep,
                                       const CodecOptions& options) const = 0;

    [[nodiscard]] virtual BytesPartialDecoderPtr partialDecoder(
        BytesPartialDecoderPtr input, const ChunkRepresentation& decodedRep,
        const CodecOptions& options) const;

    [[nodiscard]] virtual AsyncBytesPartialDecoderPtr asyncPartialDecoder(
        AsyncBytesPartialDecoderPtr input, const ChunkRepresentation& decodedRep,
        const CodecOptions& options) const;
};

// =============================================================================
// Bytes-to-Bytes Codec
// =============================================================================

/// @brief Byte-level transform such as compression.
class BytesToBytesCodec : public Codec {
public:
    [[nodiscard]] CodecKind kind() const noexcept final { return CodecKind::kBytesToBytes; }

    /// @throws EncodeError on failure.
    [[nodiscard]] virtual Bytes encode(ByteSpan decoded, const CodecOptions& options) const = 0;

    /// @throws DecodeError if `encoded` is not a valid value of this codec.
    [[nodiscard]] virtual Bytes decode(ByteSpan encoded, const CodecOptions& options) const = 0;

    [[nodiscard]] virtual BytesPartialDecoderPtr partialDecoder(
        BytesPartialDecoderPtr input, const CodecOptions& options) const;

    [[nodiscard]] virtual AsyncBytesPartialDecoderPtr asyncPartialDecoder(
        AsyncBytesPartialDecoderPtr input, const CodecOptions& options) const;
};

// =============================================================================
// Handle Aliases
// =============================================================================

using ArrayToArrayCodecPtr = std::shared_ptr<const ArrayToArrayCodec>;
using ArrayToBytesCodecPtr = std::shared_ptr<const ArrayToBytesCodec>;
using BytesToBytesCodecPtr = std::shared_ptr<const BytesToBytesCodec>;
using CodecPtr = std::shared_ptr<const Codec>;

}  // namespace zcodec::codec

#endif  // ZCODEC_CODEC_CODEC_H
