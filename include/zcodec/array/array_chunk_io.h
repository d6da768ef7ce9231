// =============================================================================
// zcodec - Array Chunk I/O
// =============================================================================
// Chunk-level read and write operations of one array.
//
// An ArrayChunkIO binds the parts of array metadata needed to locate and
// decode chunks: node path, data type, fill value, chunk grid, chunk key
// encoding and codec pipeline. It holds no store; every operation takes the
// store it reads from or writes to.
//
// Absent chunks are reported as std::nullopt by the *Opt and partial
// operations, and materialized from the fill value by retrieveChunk().
// =============================================================================

#ifndef ZCODEC_ARRAY_ARRAY_CHUNK_IO_H
#define ZCODEC_ARRAY_ARRAY_CHUNK_IO_H

#include <future>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include "zcodec/array/chunk_grid.h"
#include "zcodec/array/chunk_key_encoding.h"
#include "zcodec/array/node_path.h"
#include "zcodec/codec/codec_pipeline.h"
#include "zcodec/common/types.h"
#include "zcodec/storage/byte_range.h"
#include "zcodec/storage/storage.h"
#include "zcodec/storage/store_key.h"

namespace zcodec::array {

using CodecPipelinePtr = std::shared_ptr<const codec::CodecPipeline>;

class ArrayChunkIO {
public:
    /// @throws ConfigError if the fill value does not match the data type or
    ///         the pipeline is null.
    ArrayChunkIO(NodePath path, DataType dataType, Bytes fillValue, ChunkGrid grid,
                 ChunkKeyEncoding keyEncoding, CodecPipelinePtr pipeline);

    [[nodiscard]] const NodePath& path() const noexcept { return path_; }
    [[nodiscard]] DataType dataType() const noexcept { return dataType_; }
    [[nodiscard]] const Bytes& fillValue() const noexcept { return fillValue_; }
    [[nodiscard]] const ChunkGrid& grid() const noexcept { return grid_; }
    [[nodiscard]] const ChunkKeyEncoding& keyEncoding() const noexcept { return keyEncoding_; }
    [[nodiscard]] const codec::CodecPipeline& pipeline() const noexcept { return *pipeline_; }

    /// @brief Decoded representation shared by every chunk of the array.
    [[nodiscard]] ChunkRepresentation chunkRepresentation() const;

    /// @brief Store key of the chunk at `indices`.
    /// @throws UsageError if `indices` are outside the chunk grid.
    [[nodiscard]] storage::StoreKey chunkKey(const ChunkIndices& indices) const;

    // =========================================================================
    // Blocking Operations
    // =========================================================================

    /// @brief Encoded bytes of a chunk exactly as stored.
    [[nodiscard]] std::optional<Bytes> retrieveEncodedChunk(const storage::ReadableStorage& store,
                                                            const ChunkIndices& indices) const;

    /// @brief Decoded bytes of a chunk, or std::nullopt if it is not stored.
    [[nodiscard]] std::optional<Bytes> retrieveChunkOpt(const storage::ReadableStorage& store,
                                                        const ChunkIndices& indices,
                                                        const CodecOptions& options) const;

    /// @brief Decoded bytes of a chunk; an absent chunk is filled with the fill value.
    [[nodiscard]] Bytes retrieveChunk(const storage::ReadableStorage& store,
                                      const ChunkIndices& indices,
                                      const CodecOptions& options) const;

    /// @brief Byte ranges of a decoded chunk, in request order.
    [[nodiscard]] std::optional<std::vector<Bytes>> partialDecodeChunk(
        const storage::ReadableStoragePtr& store, const ChunkIndices& indices,
        std::span<const storage::ByteRange> ranges, const CodecOptions& options) const;

    /// @brief Decoder for several requests against one chunk.
    /// @note The decoder shares ownership of the store and codec stages; it may
    ///       outlive this ArrayChunkIO.
    [[nodiscard]] codec::BytesPartialDecoderPtr partialDecoder(
        const storage::ReadableStoragePtr& store, const ChunkIndices& indices,
        const CodecOptions& options) const;

    /// @brief Encode and store a chunk. A chunk made only of fill values is erased instead.
    void storeChunk(storage::WritableStorage& store, const ChunkIndices& indices,
                    ByteSpan decoded, const CodecOptions& options) const;

    void eraseChunk(storage::WritableStorage& store, const ChunkIndices& indices) const;

    // =========================================================================
    // Non-blocking Operations
    // =========================================================================
    // Errors, including invalid indices and encode failures, are delivered
    // through the returned future rather than thrown by the call.

    [[nodiscard]] std::future<std::optional<Bytes>> asyncRetrieveEncodedChunk(
        const storage::AsyncReadableStorage& store, const ChunkIndices& indices) const;

    [[nodiscard]] std::future<std::optional<Bytes>> asyncRetrieveChunkOpt(
        const storage::AsyncReadableStorage& store, const ChunkIndices& indices,
        const CodecOptions& options) const;

    [[nodiscard]] std::future<Bytes> asyncRetrieveChunk(const storage::AsyncReadableStorage& store,
                                                        const ChunkIndices& indices,
                                                        const CodecOptions& options) const;

    [[nodiscard]] std::future<std::optional<std::vector<Bytes>>> asyncPartialDecodeChunk(
        const storage::AsyncReadableStoragePtr& store, const ChunkIndices& indices,
        std::vector<storage::ByteRange> ranges, const CodecOptions& options) const;

    /// @brief Non-blocking twin of partialDecoder().
    [[nodiscard]] codec::AsyncBytesPartialDecoderPtr asyncPartialDecoder(
        const storage::AsyncReadableStoragePtr& store, const ChunkIndices& indices,
        const CodecOptions& options) const;

    [[nodiscard]] std::future<void> asyncStoreChunk(storage::AsyncWritableStorage& store,
                                                    const ChunkIndices& indices, ByteSpan decoded,
                                                    const CodecOptions& options) const;

    [[nodiscard]] std::future<void> asyncEraseChunk(storage::AsyncWritableStorage& store,
                                                    const ChunkIndices& indices) const;

private:
    NodePath path_;
    DataType dataType_;
    Bytes fillValue_;
    ChunkGrid grid_;
    ChunkKeyEncoding keyEncoding_;
    CodecPipelinePtr pipeline_;
};

}  // namespace zcodec::array

#endif  // ZCODEC_ARRAY_ARRAY_CHUNK_IO_H
