// =============================================================================
// zcodec - Bytes Codec
// =============================================================================
// Array-to-bytes codec that lays elements out row-major in a configured byte
// order.
//
// Partial decoding is served directly: each decoded range is widened to
// element boundaries, fetched from the inner decoder, byte-swapped if the
// encoded order differs from the native one and trimmed back.
// =============================================================================

#ifndef ZCODEC_CODEC_BYTES_CODEC_H
#define ZCODEC_CODEC_BYTES_CODEC_H

#include <span>
#include <vector>

#include "zcodec/codec/codec.h"
#include "zcodec/codec/codec_config.h"

namespace zcodec::codec {

/// @brief Reverse the bytes of every `elementSize`-byte element in place.
void swapElementBytes(std::span<std::uint8_t> data, std::size_t elementSize) noexcept;

/// @brief The "bytes" array-to-bytes codec.
class BytesCodec final : public ArrayToBytesCodec {
public:
    explicit BytesCodec(BytesCodecConfig config = {});

    [[nodiscard]] std::string_view name() const noexcept override { return "bytes"; }

    [[nodiscard]] bool hasTargetedPartialDecode() const noexcept override { return true; }

    [[nodiscard]] const BytesCodecConfig& config() const noexcept { return config_; }

    [[nodiscard]] Bytes encode(ByteSpan decoded, const ChunkRepresentation& decodedRep,
                               const CodecOptions& options) const override;

    [[nodiscard]] Bytes decode(ByteSpan encoded, const ChunkRepresentation& decodedRep,
                               const CodecOptions& options) const override;

    [[nodiscard]] BytesPartialDecoderPtr partialDecoder(
        BytesPartialDecoderPtr input, const ChunkRepresentation& decodedRep,
        const CodecOptions& options) const override;

    [[nodiscard]] AsyncBytesPartialDecoderPtr asyncPartialDecoder(
        AsyncBytesPartialDecoderPtr input, const ChunkRepresentation& decodedRep,
        const CodecOptions& options) const override;

private:
    BytesCodecConfig config_;
};

/// @brief Direct partial decoder of the bytes codec.
class BytesCodecPartialDecoder final : public BytesPartialDecoder {
public:
    BytesCodecPartialDecoder(BytesPartialDecoderPtr input, ChunkRepresentation decodedRep,
                             Endianness endian);

    [[nodiscard]] std::optional<std::vector<Bytes>> partialDecode(
        std::span<const ByteRange> ranges, const CodecOptions& options) const override;

private:
    BytesPartialDecoderPtr input_;
    ChunkRepresentation decodedRep_;
    Endianness endian_;
};

/// @brief Non-blocking twin of BytesCodecPartialDecoder.
class AsyncBytesCodecPartialDecoder final : public AsyncBytesPartialDecoder {
public:
    AsyncBytesCodecPartialDecoder(AsyncBytesPartialDecoderPtr input,
                                  ChunkRepresentation decodedRep, Endianness endian);

    [[nodiscard]] std::future<std::optional<std::vector<Bytes>>> partialDecode(
        std::vector<ByteRange> ranges, CodecOptions options) const override;

private:
    AsyncBytesPartialDecoderPtr input_;
    ChunkRepresentation decodedRep_;
    Endianness endian_;
};

}  // namespace zcodec::codec

#endif  // ZCODEC_CODEC_BYTES_CODEC_H
