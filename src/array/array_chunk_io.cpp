// =============================================================================
// zcodec - Array Chunk I/O Implementation
// =============================================================================

#include "zcodec/array/array_chunk_io.h"

#include <exception>
#include <string>
#include <utility>

#include "zcodec/codec/partial_decoder.h"
#include "zcodec/common/logger.h"

namespace zcodec::array {

namespace {

/// @brief Run `fn`, adding the chunk key to any error it raises.
template <typename Fn>
auto withKey(const storage::StoreKey& key, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const ZcodecException& ex) {
        rethrowWithContext(ex, ErrorContext(key.str()));
    }
}

/// @brief Future holding the exception currently being handled.
template <typename T>
std::future<T> failedFuture() {
    std::promise<T> failed;
    failed.set_exception(std::current_exception());
    return failed.get_future();
}

}  // namespace

ArrayChunkIO::ArrayChunkIO(NodePath path, DataType dataType, Bytes fillValue, ChunkGrid grid,
                           ChunkKeyEncoding keyEncoding, CodecPipelinePtr pipeline)
    : path_(std::move(path)),
      dataType_(dataType),
      fillValue_(std::move(fillValue)),
      grid_(std::move(grid)),
      keyEncoding_(keyEncoding),
      pipeline_(std::move(pipeline)) {
    if (!pipeline_) {
        throw ConfigError("array " + path_.str() + " has no codec pipeline");
    }
    if (fillValue_.empty()) {
        fillValue_.assign(dataTypeSize(dataType_), 0);
    }
    unwrapOrThrow(chunkRepresentation().validate());
}

ChunkRepresentation ArrayChunkIO::chunkRepresentation() const {
    return ChunkRepresentation(grid_.chunkShape(), dataType_, fillValue_);
}

storage::StoreKey ArrayChunkIO::chunkKey(const ChunkIndices& indices) const {
    unwrapOrThrow(grid_.validateIndices(indices));
    std::string key(path_.keyPrefix());
    if (!key.empty()) {
        key += '/';
    }
    key += keyEncoding_.encode(indices);
    return storage::StoreKey(std::move(key));
}

// =============================================================================
// Blocking Operations
// =============================================================================

std::optional<Bytes> ArrayChunkIO::retrieveEncodedChunk(const storage::ReadableStorage& store,
                                                        const ChunkIndices& indices) const {
    const auto key = chunkKey(indices);
    return withKey(key, [&] { return store.get(key); });
}

std::optional<Bytes> ArrayChunkIO::retrieveChunkOpt(const storage::ReadableStorage& store,
                                                    const ChunkIndices& indices,
                                                    const CodecOptions& options) const {
    const auto key = chunkKey(indices);
    return withKey(key, [&]() -> std::optional<Bytes> {
        auto encoded = store.get(key);
        if (!encoded.has_value()) {
            ZCODEC_LOG_TRACE("chunk {} is not stored", key.str());
            return std::nullopt;
        }
        return pipeline_->decode(*encoded, chunkRepresentation(), options);
    });
}

Bytes ArrayChunkIO::retrieveChunk(const storage::ReadableStorage& store,
                                  const ChunkIndices& indices, const CodecOptions& options) const {
    auto chunk = retrieveChunkOpt(store, indices, options);
    if (!chunk.has_value()) {
        return chunkRepresentation().filledChunk();
    }
    return std::move(*chunk);
}

std::optional<std::vector<Bytes>> ArrayChunkIO::partialDecodeChunk(
    const storage::ReadableStoragePtr& store, const ChunkIndices& indices,
    std::span<const storage::ByteRange> ranges, const CodecOptions& options) const {
    const auto key = chunkKey(indices);
    auto decoder = partialDecoder(store, indices, options);
    return withKey(key, [&] { return decoder->partialDecode(ranges, options); });
}

codec::BytesPartialDecoderPtr ArrayChunkIO::partialDecoder(const storage::ReadableStoragePtr& store,
                                                           const ChunkIndices& indices,
                                                           const CodecOptions& options) const {
    if (!store) {
        throw UsageError("partial decoder requires a store");
    }
    auto key = chunkKey(indices);
    auto input = std::make_unique<codec::StoragePartialDecoder>(store, std::move(key));
    return pipeline_->partialDecoder(std::move(input), chunkRepresentation(), options);
}

void ArrayChunkIO::storeChunk(storage::WritableStorage& store, const ChunkIndices& indices,
                              ByteSpan decoded, const CodecOptions& options) const {
    const auto key = chunkKey(indices);
    const auto rep = chunkRepresentation();
    withKey(key, [&] {
        if (decoded.size() == rep.sizeBytes() && rep.isFillValue(decoded)) {
            ZCODEC_LOG_TRACE("chunk {} holds only fill values, erasing", key.str());
            store.erase(key);
            return;
        }
        const Bytes encoded = pipeline_->encode(decoded, rep, options);
        store.set(key, encoded);
    });
}

void ArrayChunkIO::eraseChunk(storage::WritableStorage& store, const ChunkIndices& indices) const {
    const auto key = chunkKey(indices);
    withKey(key, [&] { store.erase(key); });
}

// =============================================================================
// Non-blocking Operations
// =============================================================================

std::future<std::optional<Bytes>> ArrayChunkIO::asyncRetrieveEncodedChunk(
    const storage::AsyncReadableStorage& store, const ChunkIndices& indices) const {
    try {
        auto key = chunkKey(indices);
        auto pending = store.get(key);
        return std::async(std::launch::deferred,
                          [pending = std::move(pending), key = std::move(key)]() mutable {
                              return withKey(key, [&] { return pending.get(); });
                          });
    } catch (const ZcodecException&) {
        return failedFuture<std::optional<Bytes>>();
    }
}

std::future<std::optional<Bytes>> ArrayChunkIO::asyncRetrieveChunkOpt(
    const storage::AsyncReadableStorage& store, const ChunkIndices& indices,
    const CodecOptions& options) const {
    try {
        auto key = chunkKey(indices);
        auto pending = store.get(key);
        return std::async(
            std::launch::deferred,
            [pending = std::move(pending), key = std::move(key), pipeline = pipeline_,
             rep = chunkRepresentation(), options]() mutable {
                return withKey(key, [&]() -> std::optional<Bytes> {
                    auto encoded = pending.get();
                    if (!encoded.has_value()) {
                        return std::nullopt;
                    }
                    return pipeline->decode(*encoded, rep, options);
                });
            });
    } catch (const ZcodecException&) {
        return failedFuture<std::optional<Bytes>>();
    }
}

std::future<Bytes> ArrayChunkIO::asyncRetrieveChunk(const storage::AsyncReadableStorage& store,
                                                    const ChunkIndices& indices,
                                                    const CodecOptions& options) const {
    auto pending = asyncRetrieveChunkOpt(store, indices, options);
    return std::async(std::launch::deferred,
                      [pending = std::move(pending), rep = chunkRepresentation()]() mutable {
                          auto chunk = pending.get();
                          if (!chunk.has_value()) {
                              return rep.filledChunk();
                          }
                          return std::move(*chunk);
                      });
}

std::future<std::optional<std::vector<Bytes>>> ArrayChunkIO::asyncPartialDecodeChunk(
    const storage::AsyncReadableStoragePtr& store, const ChunkIndices& indices,
    std::vector<storage::ByteRange> ranges, const CodecOptions& options) const {
    try {
        auto key = chunkKey(indices);
        auto decoder = asyncPartialDecoder(store, indices, options);
        auto pending =
            withKey(key, [&] { return decoder->partialDecode(std::move(ranges), options); });
        return std::async(std::launch::deferred,
                          [pending = std::move(pending), decoder = std::move(decoder),
                           key = std::move(key)]() mutable {
                              return withKey(key, [&] { return pending.get(); });
                          });
    } catch (const ZcodecException&) {
        return failedFuture<std::optional<std::vector<Bytes>>>();
    }
}

codec::AsyncBytesPartialDecoderPtr ArrayChunkIO::asyncPartialDecoder(
    const storage::AsyncReadableStoragePtr& store, const ChunkIndices& indices,
    const CodecOptions& options) const {
    if (!store) {
        throw UsageError("partial decoder requires a store");
    }
    auto key = chunkKey(indices);
    auto input = std::make_unique<codec::AsyncStoragePartialDecoder>(store, std::move(key));
    return pipeline_->asyncPartialDecoder(std::move(input), chunkRepresentation(), options);
}

std::future<void> ArrayChunkIO::asyncStoreChunk(storage::AsyncWritableStorage& store,
                                                const ChunkIndices& indices, ByteSpan decoded,
                                                const CodecOptions& options) const {
    try {
        auto key = chunkKey(indices);
        const auto rep = chunkRepresentation();
        if (decoded.size() == rep.sizeBytes() && rep.isFillValue(decoded)) {
            ZCODEC_LOG_TRACE("chunk {} holds only fill values, erasing", key.str());
            return store.erase(std::move(key));
        }
        Bytes encoded = withKey(key, [&] { return pipeline_->encode(decoded, rep, options); });
        return store.set(std::move(key), std::move(encoded));
    } catch (const ZcodecException&) {
        return failedFuture<void>();
    }
}

std::future<void> ArrayChunkIO::asyncEraseChunk(storage::AsyncWritableStorage& store,
                                                const ChunkIndices& indices) const {
    try {
        return store.erase(chunkKey(indices));
    } catch (const ZcodecException&) {
        return failedFuture<void>();
    }
}

}  // namespace zcodec::array
