// =============================================================================
// zcodec - In-Memory Store
// =============================================================================
// Thread-safe map-backed store. Concurrent readers share the lock; writers
// take it exclusively.
// =============================================================================

#ifndef ZCODEC_STORAGE_MEMORY_STORE_H
#define ZCODEC_STORAGE_MEMORY_STORE_H

#include <map>
#include <shared_mutex>
#include <vector>

#include "zcodec/storage/storage.h"

namespace zcodec::storage {

/// @brief In-memory key-value store.
class MemoryStore final : public ReadableWritableStorage {
public:
    MemoryStore() = default;

    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    [[nodiscard]] std::optional<Bytes> get(const StoreKey& key) const override;

    [[nodiscard]] std::optional<std::vector<Bytes>> getPartialValues(
        const StoreKey& key, std::span<const ByteRange> ranges,
        const CodecOptions& options) const override;

    [[nodiscard]] std::optional<std::uint64_t> size(const StoreKey& key) const override;

    void set(const StoreKey& key, ByteSpan value) override;

    void erase(const StoreKey& key) override;

    /// @brief All keys currently stored, in lexicographic order.
    [[nodiscard]] std::vector<StoreKey> keys() const;

    /// @brief Number of stored values.
    [[nodiscard]] std::size_t count() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<StoreKey, Bytes> values_;
};

}  // namespace zcodec::storage

#endif  // ZCODEC_STORAGE_MEMORY_STORE_H
