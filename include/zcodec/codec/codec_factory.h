// =============================================================================
// zcodec - Codec Factory
// =============================================================================
// Creates codec stage objects from typed configurations.
// =============================================================================

#ifndef ZCODEC_CODEC_CODEC_FACTORY_H
#define ZCODEC_CODEC_CODEC_FACTORY_H

#include "zcodec/codec/codec.h"
#include "zcodec/codec/codec_config.h"

namespace zcodec::codec {

/// @brief Create the codec stage described by `config`.
/// @throws ConfigError if the configuration does not validate.
[[nodiscard]] CodecPtr makeCodec(const CodecConfiguration& config);

}  // namespace zcodec::codec

#endif  // ZCODEC_CODEC_CODEC_FACTORY_H
