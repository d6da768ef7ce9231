// =============================================================================
// zcodec - Gzip Codec Implementation
// =============================================================================

#include "zcodec/codec/gzip_codec.h"

#include <algorithm>
#include <cstring>
#include <format>
#include <limits>
#include <utility>

#include <zlib.h>

namespace zcodec::codec {

namespace {

/// @brief Window bits selecting the gzip wrapper (16 + MAX_WBITS).
constexpr int kGzipWindowBits = 16 + MAX_WBITS;

/// @brief Memory level used for deflate (zlib default).
constexpr int kDeflateMemLevel = 8;

/// @brief Output growth step while inflating.
constexpr std::size_t kInflateChunk = 64 * 1024;

/// @brief Ends a z_stream on scope exit.
class StreamGuard {
public:
    StreamGuard(z_stream& stream, bool inflating) : stream_(stream), inflating_(inflating) {}
    ~StreamGuard() {
        if (inflating_) {
            inflateEnd(&stream_);
        } else {
            deflateEnd(&stream_);
        }
    }

    StreamGuard(const StreamGuard&) = delete;
    StreamGuard& operator=(const StreamGuard&) = delete;

private:
    z_stream& stream_;
    bool inflating_;
};

}  // namespace

GzipCodec::GzipCodec(GzipCodecConfig config) : config_(std::move(config)) {
    unwrapOrThrow(config_.validate());
}

Bytes GzipCodec::encode(ByteSpan decoded, const CodecOptions& /*options*/) const {
    if (decoded.size() > std::numeric_limits<uInt>::max()) {
        throw EncodeError(std::format("gzip input of {} bytes is too large", decoded.size()),
                          ErrorContext{}.withCodec("gzip"));
    }

    z_stream stream;
    std::memset(&stream, 0, sizeof(stream));
    int ret = deflateInit2(&stream, config_.level, Z_DEFLATED, kGzipWindowBits, kDeflateMemLevel,
                           Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
        throw EncodeError(std::format("deflateInit2 failed ({})", ret),
                          ErrorContext{}.withCodec("gzip"));
    }
    StreamGuard guard(stream, false);

    Bytes out(deflateBound(&stream, static_cast<uLong>(decoded.size())));
    stream.next_in = const_cast<Bytef*>(decoded.data());
    stream.avail_in = static_cast<uInt>(decoded.size());
    stream.next_out = out.data();
    stream.avail_out = static_cast<uInt>(out.size());

    ret = deflate(&stream, Z_FINISH);
    if (ret != Z_STREAM_END) {
        throw EncodeError(std::format("gzip compression failed ({})", ret),
                          ErrorContext{}.withCodec("gzip"));
    }
    out.resize(stream.total_out);
    return out;
}

Bytes GzipCodec::decode(ByteSpan encoded, const CodecOptions& /*options*/) const {
    z_stream stream;
    std::memset(&stream, 0, sizeof(stream));
    int ret = inflateInit2(&stream, kGzipWindowBits);
    if (ret != Z_OK) {
        throw DecodeError(std::format("inflateInit2 failed ({})", ret),
                          ErrorContext{}.withCodec("gzip"));
    }
    StreamGuard guard(stream, true);

    stream.next_in = const_cast<Bytef*>(encoded.data());
    stream.avail_in = static_cast<uInt>(encoded.size());

    Bytes out(std::max(kInflateChunk, encoded.size() * 4));
    do {
        if (stream.total_out == out.size()) {
            out.resize(out.size() * 2);
        }
        stream.next_out = out.data() + stream.total_out;
        stream.avail_out = static_cast<uInt>(out.size() - stream.total_out);
        ret = inflate(&stream, Z_NO_FLUSH);
        if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR) {
            throw DecodeError(std::format("gzip decompression failed: {}",
                                          stream.msg != nullptr ? stream.msg : "corrupt data"),
                              ErrorContext{}.withCodec("gzip").withOffset(stream.total_in));
        }
        if (ret == Z_BUF_ERROR && stream.avail_in == 0) {
            throw DecodeError("gzip stream is truncated", ErrorContext{}.withCodec("gzip"));
        }
    } while (ret != Z_STREAM_END);

    out.resize(stream.total_out);
    return out;
}

}  // namespace zcodec::codec
