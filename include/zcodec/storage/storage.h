// =============================================================================
// zcodec - Storage Access Traits
// =============================================================================
// The minimal contract the codec layer requires from a key-value store.
//
// Every operation exists in a blocking form (ReadableStorage,
// WritableStorage) and a non-blocking form (AsyncReadableStorage,
// AsyncWritableStorage) with identical contracts:
// - get(key): whole value, std::nullopt if the key is absent
// - getPartialValues(key, ranges): one buffer per range in request order,
//   std::nullopt if the key is absent
// - set(key, bytes): full overwrite
// - erase(key): deletion; erasing an absent key succeeds
//
// I/O failures raise StorageError and are never retried here. Byte ranges
// that do not fit in the stored value raise InvalidByteRangeError.
// Stores are shared read-only across concurrent chunk operations.
// =============================================================================

#ifndef ZCODEC_STORAGE_STORAGE_H
#define ZCODEC_STORAGE_STORAGE_H

#include <future>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include "zcodec/common/types.h"
#include "zcodec/storage/byte_range.h"
#include "zcodec/storage/store_key.h"

namespace zcodec::storage {

// =============================================================================
// Blocking Traits
// =============================================================================

/// @brief Read access to a store.
class ReadableStorage {
public:
    virtual ~ReadableStorage() = default;

    /// @brief Fetch the whole value stored under `key`.
    /// @return The value, or std::nullopt if the key is absent.
    /// @throws StorageError on I/O failure.
    [[nodiscard]] virtual std::optional<Bytes> get(const StoreKey& key) const = 0;

    /// @brief Fetch only the requested byte ranges of the value under `key`.
    /// @param options The parallel hint permits concurrent range fetches.
    /// @return One buffer per range in request order, or std::nullopt if absent.
    /// @note The default fetches the whole value and slices it.
    [[nodiscard]] virtual std::optional<std::vector<Bytes>> getPartialValues(
        const StoreKey& key, std::span<const ByteRange> ranges, const CodecOptions& options) const;

    /// @brief Size in bytes of the value under `key`, std::nullopt if absent.
    [[nodiscard]] virtual std::optional<std::uint64_t> size(const StoreKey& key) const;

protected:
    ReadableStorage() = default;
    ReadableStorage(const ReadableStorage&) = default;
    ReadableStorage& operator=(const ReadableStorage&) = default;
};

/// @brief Write access to a store.
class WritableStorage {
public:
    virtual ~WritableStorage() = default;

    /// @brief Store `value` under `key`, replacing any previous value.
    /// @throws StorageError on I/O failure.
    virtual void set(const StoreKey& key, ByteSpan value) = 0;

    /// @brief Remove `key`. Succeeds if the key is absent.
    /// @throws StorageError on I/O failure.
    virtual void erase(const StoreKey& key) = 0;

protected:
    WritableStorage() = default;
    WritableStorage(const WritableStorage&) = default;
    WritableStorage& operator=(const WritableStorage&) = default;
};

/// @brief Read and write access to a store.
class ReadableWritableStorage : public ReadableStorage, public WritableStorage {};

// =============================================================================
// Non-blocking Traits
// =============================================================================

/// @brief Non-blocking read access to a store.
/// @note Arguments are taken by value so they outlive the caller's frame.
class AsyncReadableStorage {
public:
    virtual ~AsyncReadableStorage() = default;

    [[nodiscard]] virtual std::future<std::optional<Bytes>> get(StoreKey key) const = 0;

    [[nodiscard]] virtual std::future<std::optional<std::vector<Bytes>>> getPartialValues(
        StoreKey key, std::vector<ByteRange> ranges, CodecOptions options) const = 0;

protected:
    AsyncReadableStorage() = default;
};

/// @brief Non-blocking write access to a store.
class AsyncWritableStorage {
public:
    virtual ~AsyncWritableStorage() = default;

    [[nodiscard]] virtual std::future<void> set(StoreKey key, Bytes value) = 0;

    [[nodiscard]] virtual std::future<void> erase(StoreKey key) = 0;

protected:
    AsyncWritableStorage() = default;
};

/// @brief Non-blocking read and write access to a store.
class AsyncReadableWritableStorage : public AsyncReadableStorage, public AsyncWritableStorage {};

// =============================================================================
// Handle Aliases
// =============================================================================

using ReadableStoragePtr = std::shared_ptr<const ReadableStorage>;
using ReadableWritableStoragePtr = std::shared_ptr<ReadableWritableStorage>;
using AsyncReadableStoragePtr = std::shared_ptr<const AsyncReadableStorage>;
using AsyncReadableWritableStoragePtr = std::shared_ptr<AsyncReadableWritableStorage>;

}  // namespace zcodec::storage

#endif  // ZCODEC_STORAGE_STORAGE_H
