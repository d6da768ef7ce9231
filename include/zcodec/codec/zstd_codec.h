// =============================================================================
// zcodec - Zstd Codec
// =============================================================================
// Bytes-to-bytes codec producing a single zstd frame. A zstd frame has no
// block index usable for random access, so partial decoding falls back to
// one full decode followed by slicing.
// =============================================================================

#ifndef ZCODEC_CODEC_ZSTD_CODEC_H
#define ZCODEC_CODEC_ZSTD_CODEC_H

#include "zcodec/codec/codec.h"
#include "zcodec/codec/codec_config.h"

namespace zcodec::codec {

/// @brief The "zstd" bytes-to-bytes codec.
class ZstdCodec final : public BytesToBytesCodec {
public:
    /// @throws ConfigError if the configuration is invalid.
    explicit ZstdCodec(ZstdCodecConfig config);

    [[nodiscard]] std::string_view name() const noexcept override { return "zstd"; }

    [[nodiscard]] const ZstdCodecConfig& config() const noexcept { return config_; }

    [[nodiscard]] Bytes encode(ByteSpan decoded, const CodecOptions& options) const override;

    [[nodiscard]] Bytes decode(ByteSpan encoded, const CodecOptions& options) const override;

private:
    ZstdCodecConfig config_;
};

}  // namespace zcodec::codec

#endif  // ZCODEC_CODEC_ZSTD_CODEC_H
