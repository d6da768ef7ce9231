// =============================================================================
// zcodec - Codec Interfaces Implementation
// =============================================================================
// Default partial decoders: full decode of the stage input, then slicing.
// =============================================================================

#include "zcodec/codec/codec.h"

#include <format>
#include <string>
#include <utility>

namespace zcodec::codec {

namespace {

/// @brief Owning handle to a stage, kept by its fallback decoders so pending
///        futures stay valid after the pipeline is released.
template <typename C>
std::shared_ptr<const C> sharedStage(const C& codec) {
    auto self = codec.weak_from_this().lock();
    if (!self) {
        throw UsageError(
            std::format("codec {} must be owned by a shared_ptr to build a partial decoder",
                        codec.name()),
            ErrorContext{}.withCodec(std::string(codec.name())));
    }
    return std::static_pointer_cast<const C>(std::move(self));
}

}  // namespace

// =============================================================================
// ArrayToArrayCodec
// =============================================================================

BytesPartialDecoderPtr ArrayToArrayCodec::partialDecoder(BytesPartialDecoderPtr input,
                                                         const ChunkRepresentation& decodedRep,
                                                         const CodecOptions& /*options*/) const {
    return std::make_unique<FullDecodePartialDecoder>(
        std::move(input), std::string(name()),
        [self = sharedStage(*this), decodedRep](ByteSpan encoded, const CodecOptions& opts) {
            return self->decode(encoded, decodedRep, opts);
        });
}

AsyncBytesPartialDecoderPtr ArrayToArrayCodec::asyncPartialDecoder(
    AsyncBytesPartialDecoderPtr input, const ChunkRepresentation& decodedRep,
    const CodecOptions& /*options*/) const {
    return std::make_unique<AsyncFullDecodePartialDecoder>(
        std::move(input), std::string(name()),
        [self = sharedStage(*this), decodedRep](ByteSpan encoded, const CodecOptions& opts) {
            return self->decode(encoded, decodedRep, opts);
        });
}

// =============================================================================
// ArrayToBytesCodec
// =============================================================================

BytesPartialDecoderPtr ArrayToBytesCodec::partialDecoder(BytesPartialDecoderPtr input,
                                                         const ChunkRepresentation& decodedRep,
                                                         const CodecOptions& /*options*/) const {
    return std::make_unique<FullDecodePartialDecoder>(
        std::move(input), std::string(name()),
        [self = sharedStage(*this), decodedRep](ByteSpan encoded, const CodecOptions& opts) {
            return self->decode(encoded, decodedRep, opts);
        });
}

AsyncBytesPartialDecoderPtr ArrayToBytesCodec::asyncPartialDecoder(
    AsyncBytesPartialDecoderPtr input, const ChunkRepresentation& decodedRep,
    const CodecOptions& /*options*/) const {
    return std::make_unique<AsyncFullDecodePartialDecoder>(
        std::move(input), std::string(name()),
        [self = sharedStage(*this), decodedRep](ByteSpan encoded, const CodecOptions& opts) {
            return self->decode(encoded, decodedRep, opts);
        });
}

// =============================================================================
// BytesToBytesCodec
// =============================================================================

BytesPartialDecoderPtr BytesToBytesCodec::partialDecoder(BytesPartialDecoderPtr input,
                                                         const CodecOptions& /*options*/) const {
    return std::make_unique<FullDecodePartialDecoder>(
        std::move(input), std::string(name()),
        [self = sharedStage(*this)](ByteSpan encoded, const CodecOptions& opts) {
            return self->decode(encoded, opts);
        });
}

AsyncBytesPartialDecoderPtr BytesToBytesCodec::asyncPartialDecoder(
    AsyncBytesPartialDecoderPtr input, const CodecOptions& /*options*/) const {
    return std::make_unique<AsyncFullDecodePartialDecoder>(
        std::move(input), std::string(name()),
        [self = sharedStage(*this)](ByteSpan encoded, const CodecOptions& opts) {
            return self->decode(encoded, opts);
        });
}

}  // namespace zcodec::codec
