// =============================================================================
// zcodec - Zstd Codec Implementation
// =============================================================================

#include "zcodec/codec/zstd_codec.h"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include <zstd.h>

namespace zcodec::codec {

namespace {

/// @brief Largest block a frame may hold; every block costs at least a
///        3-byte header, which bounds what a frame can expand to.
constexpr std::size_t kMaxBlockSize = std::size_t{128} * 1024;
constexpr std::size_t kBlockHeaderSize = 3;

struct CCtxDeleter {
    void operator()(ZSTD_CCtx* ctx) const noexcept { ZSTD_freeCCtx(ctx); }
};

struct DCtxDeleter {
    void operator()(ZSTD_DCtx* ctx) const noexcept { ZSTD_freeDCtx(ctx); }
};

[[noreturn]] void throwZstd(bool decoding, const std::string& what, std::size_t code) {
    std::string message = "zstd " + what + ": " + ZSTD_getErrorName(code);
    if (decoding) {
        throw DecodeError(std::move(message), ErrorContext{}.withCodec("zstd"));
    }
    throw EncodeError(std::move(message), ErrorContext{}.withCodec("zstd"));
}

/// @brief Decode a frame that does not record its content size.
Bytes decompressStreaming(ByteSpan encoded) {
    std::unique_ptr<ZSTD_DCtx, DCtxDeleter> dctx(ZSTD_createDCtx());
    if (!dctx) {
        throw DecodeError("failed to create zstd decompression context");
    }

    Bytes out;
    Bytes chunk(ZSTD_DStreamOutSize());
    ZSTD_inBuffer input{encoded.data(), encoded.size(), 0};
    std::size_t ret = 0;
    bool outputFull = false;
    while (input.pos < input.size || outputFull) {
        ZSTD_outBuffer output{chunk.data(), chunk.size(), 0};
        ret = ZSTD_decompressStream(dctx.get(), &output, &input);
        if (ZSTD_isError(ret)) {
            throwZstd(true, "decompression failed", ret);
        }
        out.insert(out.end(), chunk.begin(),
                   chunk.begin() + static_cast<std::ptrdiff_t>(output.pos));
        outputFull = output.pos == output.size;
    }
    if (ret != 0) {
        throw DecodeError("zstd frame is truncated", ErrorContext{}.withCodec("zstd"));
    }
    return out;
}

}  // namespace

ZstdCodec::ZstdCodec(ZstdCodecConfig config) : config_(std::move(config)) {
    unwrapOrThrow(config_.validate());
}

Bytes ZstdCodec::encode(ByteSpan decoded, const CodecOptions& /*options*/) const {
    std::unique_ptr<ZSTD_CCtx, CCtxDeleter> cctx(ZSTD_createCCtx());
    if (!cctx) {
        throw EncodeError("failed to create zstd compression context");
    }

    std::size_t ret = ZSTD_CCtx_setParameter(cctx.get(), ZSTD_c_compressionLevel, config_.level);
    if (ZSTD_isError(ret)) {
        throwZstd(false, "invalid compression level", ret);
    }
    ret = ZSTD_CCtx_setParameter(cctx.get(), ZSTD_c_checksumFlag, config_.checksum ? 1 : 0);
    if (ZSTD_isError(ret)) {
        throwZstd(false, "invalid checksum flag", ret);
    }

    Bytes out(ZSTD_compressBound(decoded.size()));
    const std::size_t size =
        ZSTD_compress2(cctx.get(), out.data(), out.size(), decoded.data(), decoded.size());
    if (ZSTD_isError(size)) {
        throwZstd(false, "compression failed", size);
    }
    out.resize(size);
    return out;
}

Bytes ZstdCodec::decode(ByteSpan encoded, const CodecOptions& /*options*/) const {
    const unsigned long long contentSize = ZSTD_getFrameContentSize(encoded.data(), encoded.size());
    if (contentSize == ZSTD_CONTENTSIZE_ERROR) {
        throw DecodeError("invalid zstd frame", ErrorContext{}.withCodec("zstd"));
    }
    if (contentSize == ZSTD_CONTENTSIZE_UNKNOWN) {
        return decompressStreaming(encoded);
    }
    const std::uint64_t bound =
        static_cast<std::uint64_t>(encoded.size() / kBlockHeaderSize + 1) * kMaxBlockSize;
    if (contentSize > bound) {
        throw DecodeError("zstd frame declares " + std::to_string(contentSize) +
                              " bytes, more than " + std::to_string(encoded.size()) +
                              " encoded bytes can hold",
                          ErrorContext{}.withCodec("zstd"));
    }

    Bytes out(static_cast<std::size_t>(contentSize));
    const std::size_t size =
        ZSTD_decompress(out.data(), out.size(), encoded.data(), encoded.size());
    if (ZSTD_isError(size)) {
        throwZstd(true, "decompression failed", size);
    }
    if (size != out.size()) {
        throw DecodeError("zstd decompressed size mismatch: expected " +
                              std::to_string(out.size()) + ", got " + std::to_string(size),
                          ErrorContext{}.withCodec("zstd"));
    }
    return out;
}

}  // namespace zcodec::codec
