// =============================================================================
// zcodec - Codec Pipeline
// =============================================================================
// Ordered, immutable stack of codec stages applied to every chunk of an array.
//
// Encoding runs the array-to-array stages, then the array-to-bytes stage, then
// the bytes-to-bytes stages, each in declaration order. Decoding runs the same
// stages in reverse. Partial decoding builds one decoder node per stage, the
// last bytes-to-bytes stage sitting directly above storage.
//
// A pipeline is shared read-only between concurrent chunk operations.
// =============================================================================

#ifndef ZCODEC_CODEC_CODEC_PIPELINE_H
#define ZCODEC_CODEC_CODEC_PIPELINE_H

#include <memory>
#include <string>
#include <vector>

#include "zcodec/codec/codec.h"
#include "zcodec/codec/codec_config.h"

namespace zcodec::codec {

class CodecPipeline {
public:
    /// @brief Pipeline with explicit stages.
    /// @throws ConfigError if `arrayToBytes` is null.
    CodecPipeline(std::vector<ArrayToArrayCodecPtr> arrayToArray, ArrayToBytesCodecPtr arrayToBytes,
                  std::vector<BytesToBytesCodecPtr> bytesToBytes);

    /// @brief Partition a flat, ordered codec list into stages.
    /// @throws ConfigError if the list has no array-to-bytes stage, more than
    ///         one, or a stage out of order.
    [[nodiscard]] static CodecPipeline fromCodecs(const std::vector<CodecPtr>& codecs);

    /// @brief Build every stage from its configuration, then partition.
    /// @throws ConfigError on an invalid configuration or order.
    [[nodiscard]] static CodecPipeline fromConfigurations(
        const std::vector<CodecConfiguration>& configs);

    // =========================================================================
    // Full Encode / Decode
    // =========================================================================

    /// @brief Encode one whole chunk.
    /// @throws EncodeError if `decoded` is not `decodedRep.sizeBytes()` long.
    [[nodiscard]] Bytes encode(ByteSpan decoded, const ChunkRepresentation& decodedRep,
                               const CodecOptions& options) const;

    /// @brief Decode one whole chunk.
    /// @throws DecodeError if any stage fails or the result has the wrong size.
    [[nodiscard]] Bytes decode(ByteSpan encoded, const ChunkRepresentation& decodedRep,
                               const CodecOptions& options) const;

    // =========================================================================
    // Partial Decode
    // =========================================================================

    /// @brief Build the decoder chain above `input`.
    /// @note The returned decoder serves ranges of the decoded chunk. It shares
    ///       ownership of the stages and may outlive the pipeline.
    [[nodiscard]] BytesPartialDecoderPtr partialDecoder(BytesPartialDecoderPtr input,
                                                        const ChunkRepresentation& decodedRep,
                                                        const CodecOptions& options) const;

    /// @brief Non-blocking twin of partialDecoder().
    [[nodiscard]] AsyncBytesPartialDecoderPtr asyncPartialDecoder(
        AsyncBytesPartialDecoderPtr input, const ChunkRepresentation& decodedRep,
        const CodecOptions& options) const;

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] const std::vector<ArrayToArrayCodecPtr>& arrayToArray() const noexcept {
        return arrayToArray_;
    }

    [[nodiscard]] const ArrayToBytesCodecPtr& arrayToBytes() const noexcept {
        return arrayToBytes_;
    }

    [[nodiscard]] const std::vector<BytesToBytesCodecPtr>& bytesToBytes() const noexcept {
        return bytesToBytes_;
    }

    /// @brief Total number of stages.
    [[nodiscard]] std::size_t size() const noexcept {
        return arrayToArray_.size() + 1 + bytesToBytes_.size();
    }

    /// @brief Whether every stage that reads encoded bytes has a targeted partial decoder.
    [[nodiscard]] bool hasTargetedPartialDecode() const noexcept;

    /// @brief Stage names joined with " -> " in encode order.
    [[nodiscard]] std::string describe() const;

private:
    /// @brief Representation entering each array-to-array stage, plus the
    ///        representation entering the array-to-bytes stage last.
    [[nodiscard]] std::vector<ChunkRepresentation> representations(
        const ChunkRepresentation& decodedRep) const;

    std::vector<ArrayToArrayCodecPtr> arrayToArray_;
    ArrayToBytesCodecPtr arrayToBytes_;
    std::vector<BytesToBytesCodecPtr> bytesToBytes_;
};

}  // namespace zcodec::codec

#endif  // ZCODEC_CODEC_CODEC_PIPELINE_H
