// =============================================================================
// zcodec - Codec Pipeline Implementation
// =============================================================================

#include "zcodec/codec/codec_pipeline.h"

#include <format>
#include <ranges>
#include <string>
#include <utility>

#include "zcodec/codec/codec_factory.h"
#include "zcodec/common/logger.h"

namespace zcodec::codec {

namespace {

/// @brief Run one stage, adding the stage name to any error it raises.
template <typename Fn>
Bytes runStage(std::string_view stage, Fn&& fn) {
    try {
        return fn();
    } catch (const ZcodecException& ex) {
        rethrowWithContext(ex, ErrorContext{}.withCodec(std::string(stage)));
    }
}

}  // namespace

// =============================================================================
// Construction
// =============================================================================

CodecPipeline::CodecPipeline(std::vector<ArrayToArrayCodecPtr> arrayToArray,
                             ArrayToBytesCodecPtr arrayToBytes,
                             std::vector<BytesToBytesCodecPtr> bytesToBytes)
    : arrayToArray_(std::move(arrayToArray)),
      arrayToBytes_(std::move(arrayToBytes)),
      bytesToBytes_(std::move(bytesToBytes)) {
    if (!arrayToBytes_) {
        throw ConfigError("codec pipeline requires an array-to-bytes codec");
    }
    for (const auto& codec : arrayToArray_) {
        if (!codec) {
            throw ConfigError("codec pipeline contains a null array-to-array codec");
        }
    }
    for (const auto& codec : bytesToBytes_) {
        if (!codec) {
            throw ConfigError("codec pipeline contains a null bytes-to-bytes codec");
        }
    }
}

CodecPipeline CodecPipeline::fromCodecs(const std::vector<CodecPtr>& codecs) {
    std::vector<ArrayToArrayCodecPtr> arrayToArray;
    ArrayToBytesCodecPtr arrayToBytes;
    std::vector<BytesToBytesCodecPtr> bytesToBytes;

    for (std::size_t i = 0; i < codecs.size(); ++i) {
        const CodecPtr& codec = codecs[i];
        if (!codec) {
            throw ConfigError(std::format("codec {} is null", i));
        }
        switch (codec->kind()) {
            case CodecKind::kArrayToArray:
                if (arrayToBytes) {
                    throw ConfigError(std::format(
                        "array-to-array codec '{}' at position {} follows the array-to-bytes codec",
                        codec->name(), i));
                }
                arrayToArray.push_back(std::static_pointer_cast<const ArrayToArrayCodec>(codec));
                break;
            case CodecKind::kArrayToBytes:
                if (arrayToBytes) {
                    throw ConfigError(std::format(
                        "codec '{}' at position {} is a second array-to-bytes codec",
                        codec->name(), i));
                }
                arrayToBytes = std::static_pointer_cast<const ArrayToBytesCodec>(codec);
                break;
            case CodecKind::kBytesToBytes:
                if (!arrayToBytes) {
                    throw ConfigError(std::format(
                        "bytes-to-bytes codec '{}' at position {} precedes the array-to-bytes codec",
                        codec->name(), i));
                }
                bytesToBytes.push_back(std::static_pointer_cast<const BytesToBytesCodec>(codec));
                break;
        }
    }

    if (!arrayToBytes) {
        throw ConfigError("codec pipeline requires an array-to-bytes codec");
    }
    return CodecPipeline(std::move(arrayToArray), std::move(arrayToBytes),
                         std::move(bytesToBytes));
}

CodecPipeline CodecPipeline::fromConfigurations(const std::vector<CodecConfiguration>& configs) {
    std::vector<CodecPtr> codecs;
    codecs.reserve(configs.size());
    for (const auto& config : configs) {
        codecs.push_back(makeCodec(config));
    }
    return fromCodecs(codecs);
}

// =============================================================================
// Full Encode / Decode
// =============================================================================

std::vector<ChunkRepresentation> CodecPipeline::representations(
    const ChunkRepresentation& decodedRep) const {
    std::vector<ChunkRepresentation> reps;
    reps.reserve(arrayToArray_.size() + 1);
    reps.push_back(decodedRep);
    for (const auto& codec : arrayToArray_) {
        reps.push_back(codec->encodedRepresentation(reps.back()));
    }
    return reps;
}

Bytes CodecPipeline::encode(ByteSpan decoded, const ChunkRepresentation& decodedRep,
                            const CodecOptions& options) const {
    if (decoded.size() != decodedRep.sizeBytes()) {
        throw EncodeError(std::format("chunk has {} bytes, expected {}", decoded.size(),
                                      decodedRep.sizeBytes()));
    }

    const auto reps = representations(decodedRep);
    Bytes data(decoded.begin(), decoded.end());
    for (std::size_t i = 0; i < arrayToArray_.size(); ++i) {
        const auto& codec = arrayToArray_[i];
        data = runStage(codec->name(), [&] { return codec->encode(data, reps[i], options); });
    }
    data = runStage(arrayToBytes_->name(),
                    [&] { return arrayToBytes_->encode(data, reps.back(), options); });
    for (const auto& codec : bytesToBytes_) {
        data = runStage(codec->name(), [&] { return codec->encode(data, options); });
    }
    return data;
}

Bytes CodecPipeline::decode(ByteSpan encoded, const ChunkRepresentation& decodedRep,
                            const CodecOptions& options) const {
    const auto reps = representations(decodedRep);
    Bytes data(encoded.begin(), encoded.end());
    for (const auto& codec : bytesToBytes_ | std::views::reverse) {
        data = runStage(codec->name(), [&] { return codec->decode(data, options); });
    }
    data = runStage(arrayToBytes_->name(),
                    [&] { return arrayToBytes_->decode(data, reps.back(), options); });
    for (std::size_t i = arrayToArray_.size(); i-- > 0;) {
        const auto& codec = arrayToArray_[i];
        data = runStage(codec->name(), [&] { return codec->decode(data, reps[i], options); });
    }

    if (data.size() != decodedRep.sizeBytes()) {
        throw DecodeError(std::format("decoded chunk has {} bytes, expected {}", data.size(),
                                      decodedRep.sizeBytes()));
    }
    return data;
}

// =============================================================================
// Partial Decode
// =============================================================================

BytesPartialDecoderPtr CodecPipeline::partialDecoder(BytesPartialDecoderPtr input,
                                                     const ChunkRepresentation& decodedRep,
                                                     const CodecOptions& options) const {
    ZCODEC_LOG_TRACE("building partial decoder chain: {}", describe());

    const auto reps = representations(decodedRep);
    for (const auto& codec : bytesToBytes_ | std::views::reverse) {
        input = codec->partialDecoder(std::move(input), options);
    }
    input = arrayToBytes_->partialDecoder(std::move(input), reps.back(), options);
    for (std::size_t i = arrayToArray_.size(); i-- > 0;) {
        input = arrayToArray_[i]->partialDecoder(std::move(input), reps[i], options);
    }
    return input;
}

AsyncBytesPartialDecoderPtr CodecPipeline::asyncPartialDecoder(
    AsyncBytesPartialDecoderPtr input, const ChunkRepresentation& decodedRep,
    const CodecOptions& options) const {
    ZCODEC_LOG_TRACE("building async partial decoder chain: {}", describe());

    const auto reps = representations(decodedRep);
    for (const auto& codec : bytesToBytes_ | std::views::reverse) {
        input = codec->asyncPartialDecoder(std::move(input), options);
    }
    input = arrayToBytes_->asyncPartialDecoder(std::move(input), reps.back(), options);
    for (std::size_t i = arrayToArray_.size(); i-- > 0;) {
        input = arrayToArray_[i]->asyncPartialDecoder(std::move(input), reps[i], options);
    }
    return input;
}

// =============================================================================
// Accessors
// =============================================================================

bool CodecPipeline::hasTargetedPartialDecode() const noexcept {
    if (!arrayToBytes_->hasTargetedPartialDecode()) {
        return false;
    }
    for (const auto& codec : bytesToBytes_) {
        if (!codec->hasTargetedPartialDecode()) {
            return false;
        }
    }
    return true;
}

std::string CodecPipeline::describe() const {
    std::string out;
    auto append = [&out](std::string_view name) {
        if (!out.empty()) {
            out += " -> ";
        }
        out += name;
    };
    for (const auto& codec : arrayToArray_) {
        append(codec->name());
    }
    append(arrayToBytes_->name());
    for (const auto& codec : bytesToBytes_) {
        append(codec->name());
    }
    return out;
}

}  // namespace zcodec::codec
