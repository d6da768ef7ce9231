// =============================================================================
// zcodec - Codec Factory Implementation
// =============================================================================

#include "zcodec/codec/codec_factory.h"

#include <memory>
#include <type_traits>
#include <variant>

#include "zcodec/codec/blosc_codec.h"
#include "zcodec/codec/bytes_codec.h"
#include "zcodec/codec/gzip_codec.h"
#include "zcodec/codec/zstd_codec.h"
#include "zcodec/common/logger.h"

namespace zcodec::codec {

CodecPtr makeCodec(const CodecConfiguration& config) {
    ZCODEC_LOG_DEBUG("creating codec {}", describeConfiguration(config));

    return std::visit(
        [](const auto& cfg) -> CodecPtr {
            using T = std::decay_t<decltype(cfg)>;
            if constexpr (std::is_same_v<T, BytesCodecConfig>) {
                return std::make_shared<const BytesCodec>(cfg);
            } else if constexpr (std::is_same_v<T, BloscCodecConfig>) {
                return std::make_shared<const BloscCodec>(cfg);
            } else if constexpr (std::is_same_v<T, ZstdCodecConfig>) {
                return std::make_shared<const ZstdCodec>(cfg);
            } else {
                static_assert(std::is_same_v<T, GzipCodecConfig>, "unhandled codec configuration");
                return std::make_shared<const GzipCodec>(cfg);
            }
        },
        config);
}

}  // namespace zcodec::codec
