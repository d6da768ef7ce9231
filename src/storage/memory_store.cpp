// =============================================================================
// zcodec - In-Memory Store Implementation
// =============================================================================

#include "zcodec/storage/memory_store.h"

#include <mutex>

#include "zcodec/common/logger.h"

namespace zcodec::storage {

std::optional<Bytes> MemoryStore::get(const StoreKey& key) const {
    std::shared_lock lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::vector<Bytes>> MemoryStore::getPartialValues(
    const StoreKey& key, std::span<const ByteRange> ranges,
    const CodecOptions& /*options*/) const {
    std::shared_lock lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    try {
        return extractByteRanges(it->second, ranges);
    } catch (const ZcodecException& ex) {
        rethrowWithContext(ex, ErrorContext{key.str()});
    }
}

std::optional<std::uint64_t> MemoryStore::size(const StoreKey& key) const {
    std::shared_lock lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second.size();
}

void MemoryStore::set(const StoreKey& key, ByteSpan value) {
    std::unique_lock lock(mutex_);
    values_.insert_or_assign(key, Bytes(value.begin(), value.end()));
    ZCODEC_LOG_TRACE("memory store: set {} ({} bytes)", key.str(), value.size());
}

void MemoryStore::erase(const StoreKey& key) {
    std::unique_lock lock(mutex_);
    values_.erase(key);
}

std::vector<StoreKey> MemoryStore::keys() const {
    std::shared_lock lock(mutex_);
    std::vector<StoreKey> out;
    out.reserve(values_.size());
    for (const auto& [key, value] : values_) {
        out.push_back(key);
    }
    return out;
}

std::size_t MemoryStore::count() const {
    std::shared_lock lock(mutex_);
    return values_.size();
}

}  // namespace zcodec::storage
