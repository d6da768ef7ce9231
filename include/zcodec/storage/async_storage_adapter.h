// =============================================================================
// zcodec - Asynchronous Storage Adapter
// =============================================================================
// Exposes a blocking store through the non-blocking storage traits. Each
// operation runs on its own task (std::launch::async); the returned future
// is the only point where a caller waits.
// =============================================================================

#ifndef ZCODEC_STORAGE_ASYNC_STORAGE_ADAPTER_H
#define ZCODEC_STORAGE_ASYNC_STORAGE_ADAPTER_H

#include <memory>

#include "zcodec/storage/storage.h"

namespace zcodec::storage {

/// @brief Non-blocking view of a blocking store.
class AsyncStorageAdapter final : public AsyncReadableWritableStorage {
public:
    /// @throws UsageError if `store` is null.
    explicit AsyncStorageAdapter(ReadableWritableStoragePtr store);

    [[nodiscard]] std::future<std::optional<Bytes>> get(StoreKey key) const override;

    [[nodiscard]] std::future<std::optional<std::vector<Bytes>>> getPartialValues(
        StoreKey key, std::vector<ByteRange> ranges, CodecOptions options) const override;

    [[nodiscard]] std::future<void> set(StoreKey key, Bytes value) override;

    [[nodiscard]] std::future<void> erase(StoreKey key) override;

    /// @brief The wrapped blocking store.
    [[nodiscard]] const ReadableWritableStoragePtr& store() const noexcept { return store_; }

private:
    ReadableWritableStoragePtr store_;
};

}  // namespace zcodec::storage

#endif  // ZCODEC_STORAGE_ASYNC_STORAGE_ADAPTER_H
