// =============================================================================
// zcodec - Gzip Codec
// =============================================================================
// Bytes-to-bytes codec producing a gzip member (RFC 1952) through zlib.
// Partial decoding falls back to one full decode followed by slicing.
// =============================================================================

#ifndef ZCODEC_CODEC_GZIP_CODEC_H
#define ZCODEC_CODEC_GZIP_CODEC_H

#include "zcodec/codec/codec.h"
#include "zcodec/codec/codec_config.h"

namespace zcodec::codec {

/// @brief The "gzip" bytes-to-bytes codec.
class GzipCodec final : public BytesToBytesCodec {
public:
    /// @throws ConfigError if the configuration is invalid.
    explicit GzipCodec(GzipCodecConfig config);

    [[nodiscard]] std::string_view name() const noexcept override { return "gzip"; }

    [[nodiscard]] const GzipCodecConfig& config() const noexcept { return config_; }

    [[nodiscard]] Bytes encode(ByteSpan decoded, const CodecOptions& options) const override;

    [[nodiscard]] Bytes decode(ByteSpan encoded, const CodecOptions& options) const override;

private:
    GzipCodecConfig config_;
};

}  // namespace zcodec::codec

#endif  // ZCODEC_CODEC_GZIP_CODEC_H
