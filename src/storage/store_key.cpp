// =============================================================================
// zcodec - Store Key Implementation
// =============================================================================

#include "zcodec/storage/store_key.h"

#include <format>
#include <utility>

namespace zcodec::storage {

StoreKey::StoreKey(std::string key) : key_(std::move(key)) {
    unwrapOrThrow(validate(key_));
}

Result<StoreKey> StoreKey::create(std::string key) {
    if (auto valid = validate(key); !valid.has_value()) {
        return std::unexpected(valid.error());
    }
    return StoreKey(Validated{}, std::move(key));
}

VoidResult StoreKey::validate(std::string_view key) {
    if (key.empty()) {
        return makeVoidError(ErrorCode::kUsageError, "store key is empty");
    }
    if (key.front() == '/') {
        return makeVoidError(ErrorCode::kUsageError,
                             std::format("store key '{}' starts with '/'", key));
    }

    std::size_t begin = 0;
    while (begin <= key.size()) {
        std::size_t sep = key.find('/', begin);
        if (sep == std::string_view::npos) {
            sep = key.size();
        }
        std::string_view component = key.substr(begin, sep - begin);
        if (component.empty() || component == "." || component == "..") {
            return makeVoidError(
                ErrorCode::kUsageError,
                std::format("store key '{}' has an invalid component '{}'", key, component));
        }
        begin = sep + 1;
    }
    return makeVoidSuccess();
}

std::string_view StoreKey::parent() const noexcept {
    const auto pos = key_.rfind('/');
    if (pos == std::string::npos) {
        return {};
    }
    return std::string_view(key_).substr(0, pos);
}

std::string_view StoreKey::name() const noexcept {
    const auto pos = key_.rfind('/');
    if (pos == std::string::npos) {
        return key_;
    }
    return std::string_view(key_).substr(pos + 1);
}

}  // namespace zcodec::storage
