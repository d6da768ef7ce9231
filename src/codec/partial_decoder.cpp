// =============================================================================
// zcodec - Partial Decoders Implementation
// =============================================================================

#include "zcodec/codec/partial_decoder.h"

#include <utility>

#include "zcodec/common/logger.h"

namespace zcodec::codec {

// =============================================================================
// Interface Defaults
// =============================================================================

std::optional<Bytes> BytesPartialDecoder::decode(const CodecOptions& options) const {
    const ByteRange whole = ByteRange::full();
    auto parts = partialDecode(std::span<const ByteRange>(&whole, 1), options);
    if (!parts.has_value()) {
        return std::nullopt;
    }
    return std::move(parts->front());
}

std::future<std::optional<Bytes>> AsyncBytesPartialDecoder::decode(CodecOptions options) const {
    auto pending = partialDecode({ByteRange::full()}, options);
    return std::async(std::launch::deferred,
                      [pending = std::move(pending)]() mutable -> std::optional<Bytes> {
                          auto parts = pending.get();
                          if (!parts.has_value()) {
                              return std::nullopt;
                          }
                          return std::move(parts->front());
                      });
}

// =============================================================================
// StoragePartialDecoder
// =============================================================================

StoragePartialDecoder::StoragePartialDecoder(storage::ReadableStoragePtr storage,
                                             storage::StoreKey key)
    : storage_(std::move(storage)), key_(std::move(key)) {
    if (!storage_) {
        throw UsageError("partial decoder requires a store", ErrorContext{key_.str()});
    }
}

std::optional<std::vector<Bytes>> StoragePartialDecoder::partialDecode(
    std::span<const ByteRange> ranges, const CodecOptions& options) const {
    return storage_->getPartialValues(key_, ranges, options);
}

std::optional<Bytes> StoragePartialDecoder::decode(const CodecOptions& /*options*/) const {
    return storage_->get(key_);
}

AsyncStoragePartialDecoder::AsyncStoragePartialDecoder(storage::AsyncReadableStoragePtr storage,
                                                       storage::StoreKey key)
    : storage_(std::move(storage)), key_(std::move(key)) {
    if (!storage_) {
        throw UsageError("partial decoder requires a store", ErrorContext{key_.str()});
    }
}

std::future<std::optional<std::vector<Bytes>>> AsyncStoragePartialDecoder::partialDecode(
    std::vector<ByteRange> ranges, CodecOptions options) const {
    return storage_->getPartialValues(key_, std::move(ranges), options);
}

std::future<std::optional<Bytes>> AsyncStoragePartialDecoder::decode(
    CodecOptions /*options*/) const {
    return storage_->get(key_);
}

// =============================================================================
// Full-Decode Fallback
// =============================================================================

std::vector<Bytes> decodeAndSlice(ByteSpan encoded, std::span<const ByteRange> ranges,
                                  const CodecOptions& options, const DecodeFunction& decodeFn,
                                  std::string_view codecName) {
    try {
        Bytes decoded = decodeFn(encoded, options);
        return storage::extractByteRanges(decoded, ranges);
    } catch (const ZcodecException& ex) {
        rethrowWithContext(ex, ErrorContext{}.withCodec(std::string(codecName)));
    }
}

FullDecodePartialDecoder::FullDecodePartialDecoder(BytesPartialDecoderPtr input,
                                                   std::string codecName,
                                                   DecodeFunction decodeFn)
    : input_(std::move(input)), codecName_(std::move(codecName)), decodeFn_(std::move(decodeFn)) {
    ZCODEC_LOG_TRACE("{}: no targeted partial decode, using full decode", codecName_);
}

std::optional<std::vector<Bytes>> FullDecodePartialDecoder::partialDecode(
    std::span<const ByteRange> ranges, const CodecOptions& options) const {
    auto encoded = input_->decode(options);
    if (!encoded.has_value()) {
        return std::nullopt;
    }
    return decodeAndSlice(*encoded, ranges, options, decodeFn_, codecName_);
}

AsyncFullDecodePartialDecoder::AsyncFullDecodePartialDecoder(AsyncBytesPartialDecoderPtr input,
                                                             std::string codecName,
                                                             DecodeFunction decodeFn)
    : input_(std::move(input)), codecName_(std::move(codecName)), decodeFn_(std::move(decodeFn)) {}

std::future<std::optional<std::vector<Bytes>>> AsyncFullDecodePartialDecoder::partialDecode(
    std::vector<ByteRange> ranges, CodecOptions options) const {
    auto pending = input_->decode(options);
    return std::async(
        std::launch::deferred,
        [pending = std::move(pending), ranges = std::move(ranges), options, decodeFn = decodeFn_,
         codecName = codecName_]() mutable -> std::optional<std::vector<Bytes>> {
            auto encoded = pending.get();
            if (!encoded.has_value()) {
                return std::nullopt;
            }
            return decodeAndSlice(*encoded, ranges, options, decodeFn, codecName);
        });
}

}  // namespace zcodec::codec
