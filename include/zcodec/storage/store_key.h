// =============================================================================
// zcodec - Store Key
// =============================================================================
// Validated hierarchical key into a key-value store.
//
// A valid key is non-empty, does not start with '/', and every '/'-separated
// component is non-empty and neither "." nor "..".
// =============================================================================

#ifndef ZCODEC_STORAGE_STORE_KEY_H
#define ZCODEC_STORAGE_STORE_KEY_H

#include <compare>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

#include "zcodec/common/error.h"

namespace zcodec::storage {

/// @brief A validated store key such as "data/root/arr/c/0/1".
class StoreKey {
public:
    /// @brief Construct from a string.
    /// @throws UsageError if the key is not valid.
    explicit StoreKey(std::string key);

    /// @brief Validate and construct without throwing.
    [[nodiscard]] static Result<StoreKey> create(std::string key);

    /// @brief Check whether a string is a valid store key.
    [[nodiscard]] static VoidResult validate(std::string_view key);

    [[nodiscard]] const std::string& str() const noexcept { return key_; }

    /// @brief Parent prefix ("a/b" for "a/b/c"), empty for a top-level key.
    [[nodiscard]] std::string_view parent() const noexcept;

    /// @brief Last path component ("c" for "a/b/c").
    [[nodiscard]] std::string_view name() const noexcept;

    auto operator<=>(const StoreKey& other) const = default;

    friend std::ostream& operator<<(std::ostream& os, const StoreKey& key) {
        return os << key.key_;
    }

private:
    struct Validated {};
    StoreKey(Validated, std::string key) : key_(std::move(key)) {}

    std::string key_;
};

}  // namespace zcodec::storage

template <>
struct std::hash<zcodec::storage::StoreKey> {
    std::size_t operator()(const zcodec::storage::StoreKey& key) const noexcept {
        return std::hash<std::string>{}(key.str());
    }
};

#endif  // ZCODEC_STORAGE_STORE_KEY_H
