// =============================================================================
// zcodec - Asynchronous Storage Adapter Implementation
// =============================================================================

#include "zcodec/storage/async_storage_adapter.h"

#include <utility>

namespace zcodec::storage {

AsyncStorageAdapter::AsyncStorageAdapter(ReadableWritableStoragePtr store)
    : store_(std::move(store)) {
    if (!store_) {
        throw UsageError("async storage adapter requires a store");
    }
}

std::future<std::optional<Bytes>> AsyncStorageAdapter::get(StoreKey key) const {
    return std::async(std::launch::async,
                      [store = store_, key = std::move(key)]() { return store->get(key); });
}

std::future<std::optional<std::vector<Bytes>>> AsyncStorageAdapter::getPartialValues(
    StoreKey key, std::vector<ByteRange> ranges, CodecOptions options) const {
    return std::async(std::launch::async,
                      [store = store_, key = std::move(key), ranges = std::move(ranges),
                       options]() { return store->getPartialValues(key, ranges, options); });
}

std::future<void> AsyncStorageAdapter::set(StoreKey key, Bytes value) {
    return std::async(std::launch::async,
                      [store = store_, key = std::move(key), value = std::move(value)]() {
                          store->set(key, value);
                      });
}

std::future<void> AsyncStorageAdapter::erase(StoreKey key) {
    return std::async(std::launch::async,
                      [store = store_, key = std::move(key)]() { store->erase(key); });
}

}  // namespace zcodec::storage
