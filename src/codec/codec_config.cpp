// =============================================================================
// zcodec - Codec Configuration Implementation
// =============================================================================

#include "zcodec/codec/codec_config.h"

#include <array>
#include <format>

namespace zcodec::codec {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

constexpr std::array kBloscCompressors = {BloscCompressor::kBloscLz, BloscCompressor::kLz4,
                                          BloscCompressor::kLz4Hc,   BloscCompressor::kSnappy,
                                          BloscCompressor::kZlib,    BloscCompressor::kZstd};

constexpr std::array kBloscShuffles = {BloscShuffle::kNoShuffle, BloscShuffle::kShuffle,
                                       BloscShuffle::kBitShuffle};

}  // namespace

std::optional<BloscCompressor> bloscCompressorFromString(std::string_view name) noexcept {
    for (BloscCompressor cname : kBloscCompressors) {
        if (bloscCompressorToString(cname) == name) {
            return cname;
        }
    }
    return std::nullopt;
}

std::optional<BloscShuffle> bloscShuffleFromString(std::string_view name) noexcept {
    for (BloscShuffle shuffle : kBloscShuffles) {
        if (bloscShuffleToString(shuffle) == name) {
            return shuffle;
        }
    }
    return std::nullopt;
}

// =============================================================================
// Validation
// =============================================================================

VoidResult BloscCodecConfig::validate() const {
    if (clevel < kMinBloscLevel || clevel > kMaxBloscLevel) {
        return makeVoidError(ErrorCode::kInvalidConfig,
                             std::format("blosc clevel {} is outside [{}, {}]", clevel,
                                         kMinBloscLevel, kMaxBloscLevel));
    }
    if (typesize.has_value() && (*typesize == 0 || *typesize > kMaxBloscTypesize)) {
        return makeVoidError(ErrorCode::kInvalidConfig,
                             std::format("blosc typesize {} is outside [1, {}]", *typesize,
                                         kMaxBloscTypesize));
    }
    if (shuffle != BloscShuffle::kNoShuffle && !typesize.has_value()) {
        return makeVoidError(ErrorCode::kInvalidConfig,
                             std::format("blosc {} requires a typesize",
                                         bloscShuffleToString(shuffle)));
    }
    return makeVoidSuccess();
}

VoidResult ZstdCodecConfig::validate() const {
    if (level < kMinZstdLevel || level > kMaxZstdLevel) {
        return makeVoidError(ErrorCode::kInvalidConfig,
                             std::format("zstd level {} is outside [{}, {}]", level,
                                         kMinZstdLevel, kMaxZstdLevel));
    }
    return makeVoidSuccess();
}

VoidResult GzipCodecConfig::validate() const {
    if (level < 0 || level > 9) {
        return makeVoidError(ErrorCode::kInvalidConfig,
                             std::format("gzip level {} is outside [0, 9]", level));
    }
    return makeVoidSuccess();
}

// =============================================================================
// Variant Helpers
// =============================================================================

std::string_view codecName(const CodecConfiguration& config) noexcept {
    return std::visit(Overloaded{
                          [](const BytesCodecConfig&) -> std::string_view { return "bytes"; },
                          [](const BloscCodecConfig&) -> std::string_view { return "blosc"; },
                          [](const ZstdCodecConfig&) -> std::string_view { return "zstd"; },
                          [](const GzipCodecConfig&) -> std::string_view { return "gzip"; },
                      },
                      config);
}

VoidResult validateConfiguration(const CodecConfiguration& config) {
    return std::visit([](const auto& typed) { return typed.validate(); }, config);
}

std::string describeConfiguration(const CodecConfiguration& config) {
    return std::visit(
        Overloaded{
            [](const BytesCodecConfig& c) {
                return std::format("bytes(endian={})", endiannessToString(c.endian));
            },
            [](const BloscCodecConfig& c) {
                return std::format("blosc(cname={}, clevel={}, shuffle={}, typesize={}, "
                                   "blocksize={})",
                                   bloscCompressorToString(c.cname), c.clevel,
                                   bloscShuffleToString(c.shuffle), c.typesize.value_or(1),
                                   c.blocksize);
            },
            [](const ZstdCodecConfig& c) {
                return std::format("zstd(level={}, checksum={})", c.level, c.checksum);
            },
            [](const GzipCodecConfig& c) { return std::format("gzip(level={})", c.level); },
        },
        config);
}

}  // namespace zcodec::codec
