// =============================================================================
// zcodec - Blosc Codec
// =============================================================================
// Bytes-to-bytes codec backed by c-blosc 1.x.
//
// Partial decoding fetches the whole encoded buffer once, validates its
// header and block table, then decompresses only the blocks that intersect
// each requested range (blosc_getitem). Validation always happens before any
// range is served: a corrupt buffer fails even for ranges that would not
// touch the corrupt bytes.
// =============================================================================

#ifndef ZCODEC_CODEC_BLOSC_CODEC_H
#define ZCODEC_CODEC_BLOSC_CODEC_H

#include <span>
#include <vector>

#include "zcodec/codec/blosc_header.h"
#include "zcodec/codec/codec.h"
#include "zcodec/codec/codec_config.h"

namespace zcodec::codec {

// =============================================================================
// Blosc Primitives
// =============================================================================
// Pure routines shared by the codec and by both partial decoder flavours.

/// @brief Validate a blosc buffer (own checks, then c-blosc's).
/// @return The buffer's header.
/// @throws DecodeError "blosc encoded value is invalid" if any check fails.
[[nodiscard]] BloscHeader bloscValidate(ByteSpan encoded);

/// @brief Decompress a whole blosc buffer.
/// @throws DecodeError if the buffer is invalid or fails to decompress.
[[nodiscard]] Bytes bloscDecompress(ByteSpan encoded);

/// @brief Decompress `length` bytes starting at decoded `offset`.
/// @pre `header` was returned by bloscValidate(encoded) and the range fits in nbytes.
/// @note Only the blocks intersecting the range are decompressed.
[[nodiscard]] Bytes bloscDecompressBytesPartial(ByteSpan encoded, const BloscHeader& header,
                                                std::uint64_t offset, std::uint64_t length);

/// @brief Validate a blosc buffer, then serve every requested decoded range.
/// @return One buffer per range, in request order.
/// @throws DecodeError if the buffer is invalid or a block fails to decompress.
/// @throws InvalidByteRangeError if a range does not fit in nbytes.
[[nodiscard]] std::vector<Bytes> bloscDecompressRanges(ByteSpan encoded,
                                                       std::span<const ByteRange> ranges,
                                                       const CodecOptions& options);

// =============================================================================
// BloscCodec
// =============================================================================

/// @brief The "blosc" bytes-to-bytes codec.
class BloscCodec final : public BytesToBytesCodec {
public:
    /// @throws ConfigError if the configuration is invalid.
    explicit BloscCodec(BloscCodecConfig config);

    [[nodiscard]] std::string_view name() const noexcept override { return "blosc"; }

    [[nodiscard]] bool hasTargetedPartialDecode() const noexcept override { return true; }

    [[nodiscard]] const BloscCodecConfig& config() const noexcept { return config_; }

    [[nodiscard]] Bytes encode(ByteSpan decoded, const CodecOptions& options) const override;

    [[nodiscard]] Bytes decode(ByteSpan encoded, const CodecOptions& options) const override;

    [[nodiscard]] BytesPartialDecoderPtr partialDecoder(
        BytesPartialDecoderPtr input, const CodecOptions& options) const override;

    [[nodiscard]] AsyncBytesPartialDecoderPtr asyncPartialDecoder(
        AsyncBytesPartialDecoderPtr input, const CodecOptions& options) const override;

private:
    BloscCodecConfig config_;
};

// =============================================================================
// Blosc Partial Decoders
// =============================================================================

/// @brief Block-targeted partial decoder for blosc-encoded values.
class BloscPartialDecoder final : public BytesPartialDecoder {
public:
    explicit BloscPartialDecoder(BytesPartialDecoderPtr input);

    [[nodiscard]] std::optional<std::vector<Bytes>> partialDecode(
        std::span<const ByteRange> ranges, const CodecOptions& options) const override;

private:
    BytesPartialDecoderPtr input_;
};

/// @brief Non-blocking twin of BloscPartialDecoder.
/// @note The inner fetch is the only suspension point; validation and
///       decompression run when the returned future is waited on.
class AsyncBloscPartialDecoder final : public AsyncBytesPartialDecoder {
public:
    explicit AsyncBloscPartialDecoder(AsyncBytesPartialDecoderPtr input);

    [[nodiscard]] std::future<std::optional<std::vector<Bytes>>> partialDecode(
        std::vector<ByteRange> ranges, CodecOptions options) const override;

private:
    AsyncBytesPartialDecoderPtr input_;
};

}  // namespace zcodec::codec

#endif  // ZCODEC_CODEC_BLOSC_CODEC_H
