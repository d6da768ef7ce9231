// =============================================================================
// zcodec - Partial Decoders
// =============================================================================
// Partial decoders serve byte ranges of a chunk without necessarily reading
// or decoding the whole chunk.
//
// A partial decoder chain has one node per codec stage. The node closest to
// storage is a StoragePartialDecoder; each codec stage wraps the node beneath
// it and exclusively owns it. Every node exposes the same contract:
//
//   partialDecode(ranges, options) -> std::optional<std::vector<Bytes>>
//
// - std::nullopt: the chunk is absent from the store (not an error)
// - otherwise: one buffer per requested range, in request order
//
// The non-blocking twins return std::future. Only the storage node performs
// asynchronous work; codec nodes start their inner fetch immediately and
// return a deferred continuation that runs the (synchronous) decode on the
// thread that waits on the future.
// =============================================================================

#ifndef ZCODEC_CODEC_PARTIAL_DECODER_H
#define ZCODEC_CODEC_PARTIAL_DECODER_H

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "zcodec/common/types.h"
#include "zcodec/storage/byte_range.h"
#include "zcodec/storage/storage.h"

namespace zcodec::codec {

using storage::ByteRange;

// =============================================================================
// Partial Decoder Interfaces
// =============================================================================

/// @brief Blocking partial decoder over a byte address space.
class BytesPartialDecoder {
public:
    virtual ~BytesPartialDecoder() = default;

    BytesPartialDecoder(const BytesPartialDecoder&) = delete;
    BytesPartialDecoder& operator=(const BytesPartialDecoder&) = delete;

    /// @brief Decode the requested byte ranges.
    /// @return One buffer per range in request order, or std::nullopt if absent.
    /// @throws DecodeError if the encoded value is invalid.
    /// @throws InvalidByteRangeError if a range does not fit in the decoded value.
    /// @throws StorageError on I/O failure.
    [[nodiscard]] virtual std::optional<std::vector<Bytes>> partialDecode(
        std::span<const ByteRange> ranges, const CodecOptions& options) const = 0;

    /// @brief Decode the whole value.
    [[nodiscard]] virtual std::optional<Bytes> decode(const CodecOptions& options) const;

protected:
    BytesPartialDecoder() = default;
};

/// @brief Owning handle to a blocking partial decoder.
using BytesPartialDecoderPtr = std::unique_ptr<BytesPartialDecoder>;

/// @brief Non-blocking partial decoder over a byte address space.
/// @note Futures returned by a decoder stay valid after the decoder, its
///       pipeline and its codecs are released.
class AsyncBytesPartialDecoder {
public:
    virtual ~AsyncBytesPartialDecoder() = default;

    AsyncBytesPartialDecoder(const AsyncBytesPartialDecoder&) = delete;
    AsyncBytesPartialDecoder& operator=(const AsyncBytesPartialDecoder&) = delete;

    /// @brief Decode the requested byte ranges.
    /// @note Same contract as BytesPartialDecoder::partialDecode; errors are
    ///       delivered through the future.
    [[nodiscard]] virtual std::future<std::optional<std::vector<Bytes>>> partialDecode(
        std::vector<ByteRange> ranges, CodecOptions options) const = 0;

    /// @brief Decode the whole value.
    [[nodiscard]] virtual std::future<std::optional<Bytes>> decode(CodecOptions options) const;

protected:
    AsyncBytesPartialDecoder() = default;
};

/// @brief Owning handle to a non-blocking partial decoder.
using AsyncBytesPartialDecoderPtr = std::unique_ptr<AsyncBytesPartialDecoder>;

// =============================================================================
// Storage Partial Decoders
// =============================================================================

/// @brief Base of every chain: serves ranges straight from a store key.
class StoragePartialDecoder final : public BytesPartialDecoder {
public:
    StoragePartialDecoder(storage::ReadableStoragePtr storage, storage::StoreKey key);

    [[nodiscard]] std::optional<std::vector<Bytes>> partialDecode(
        std::span<const ByteRange> ranges, const CodecOptions& options) const override;

    [[nodiscard]] std::optional<Bytes> decode(const CodecOptions& options) const override;

    [[nodiscard]] const storage::StoreKey& key() const noexcept { return key_; }

private:
    storage::ReadableStoragePtr storage_;
    storage::StoreKey key_;
};

/// @brief Non-blocking base of every chain.
class AsyncStoragePartialDecoder final : public AsyncBytesPartialDecoder {
public:
    AsyncStoragePartialDecoder(storage::AsyncReadableStoragePtr storage, storage::StoreKey key);

    [[nodiscard]] std::future<std::optional<std::vector<Bytes>>> partialDecode(
        std::vector<ByteRange> ranges, CodecOptions options) const override;

    [[nodiscard]] std::future<std::optional<Bytes>> decode(CodecOptions options) const override;

    [[nodiscard]] const storage::StoreKey& key() const noexcept { return key_; }

private:
    storage::AsyncReadableStoragePtr storage_;
    storage::StoreKey key_;
};

// =============================================================================
// Full-Decode Fallback
// =============================================================================

/// @brief Function that fully decodes one stage's encoded value.
using DecodeFunction = std::function<Bytes(ByteSpan encoded, const CodecOptions& options)>;

/// @brief Decode a whole encoded value and slice out the requested ranges.
/// @note Shared by the blocking and non-blocking fallback decoders. Errors are
///       rethrown with the codec name in their context.
[[nodiscard]] std::vector<Bytes> decodeAndSlice(ByteSpan encoded,
                                                std::span<const ByteRange> ranges,
                                                const CodecOptions& options,
                                                const DecodeFunction& decodeFn,
                                                std::string_view codecName);

/// @brief Partial decoder for stages without a targeted fast path.
/// @note Reads the whole inner value, decodes it once and slices it.
class FullDecodePartialDecoder final : public BytesPartialDecoder {
public:
    FullDecodePartialDecoder(BytesPartialDecoderPtr input, std::string codecName,
                             DecodeFunction decodeFn);

    [[nodiscard]] std::optional<std::vector<Bytes>> partialDecode(
        std::span<const ByteRange> ranges, const CodecOptions& options) const override;

private:
    BytesPartialDecoderPtr input_;
    std::string codecName_;
    DecodeFunction decodeFn_;
};

/// @brief Non-blocking partial decoder for stages without a targeted fast path.
class AsyncFullDecodePartialDecoder final : public AsyncBytesPartialDecoder {
public:
    AsyncFullDecodePartialDecoder(AsyncBytesPartialDecoderPtr input, std::string codecName,
                                  DecodeFunction decodeFn);

    [[nodiscard]] std::future<std::optional<std::vector<Bytes>>> partialDecode(
        std::vector<ByteRange> ranges, CodecOptions options) const override;

private:
    AsyncBytesPartialDecoderPtr input_;
    std::string codecName_;
    DecodeFunction decodeFn_;
};

}  // namespace zcodec::codec

#endif  // ZCODEC_CODEC_PARTIAL_DECODER_H
