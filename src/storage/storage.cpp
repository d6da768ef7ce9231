// =============================================================================
// zcodec - Storage Access Traits Implementation
// =============================================================================

#include "zcodec/storage/storage.h"

namespace zcodec::storage {

std::optional<std::vector<Bytes>> ReadableStorage::getPartialValues(
    const StoreKey& key, std::span<const ByteRange> ranges,
    const CodecOptions& /*options*/) const {
    auto value = get(key);
    if (!value.has_value()) {
        return std::nullopt;
    }
    try {
        return extractByteRanges(*value, ranges);
    } catch (const ZcodecException& ex) {
        rethrowWithContext(ex, ErrorContext{key.str()});
    }
}

std::optional<std::uint64_t> ReadableStorage::size(const StoreKey& key) const {
    auto value = get(key);
    if (!value.has_value()) {
        return std::nullopt;
    }
    return value->size();
}

}  // namespace zcodec::storage
