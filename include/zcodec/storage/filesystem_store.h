// =============================================================================
// zcodec - Filesystem Store
// =============================================================================
// Store backed by a directory tree: the key "a/b/c" lives in the file
// <root>/a/b/c.
//
// Key features:
// - Partial reads seek to each requested range instead of reading the file
// - Independent ranges are fetched concurrently (TBB) when the parallel hint
//   is set; results always come back in request order
// - Writes go to a temporary sibling file that is renamed into place
// - Erasing an absent key succeeds
// =============================================================================

#ifndef ZCODEC_STORAGE_FILESYSTEM_STORE_H
#define ZCODEC_STORAGE_FILESYSTEM_STORE_H

#include <filesystem>

#include "zcodec/storage/storage.h"

namespace zcodec::storage {

/// @brief Directory-backed key-value store.
class FilesystemStore final : public ReadableWritableStorage {
public:
    /// @brief Open a store rooted at `root`.
    /// @param create Create the root directory if it does not exist.
    /// @throws StorageError if the root is missing (and not created) or not a directory.
    explicit FilesystemStore(std::filesystem::path root, bool create = true);

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    /// @brief Path of the file holding `key`.
    [[nodiscard]] std::filesystem::path keyToPath(const StoreKey& key) const;

    [[nodiscard]] std::optional<Bytes> get(const StoreKey& key) const override;

    [[nodiscard]] std::optional<std::vector<Bytes>> getPartialValues(
        const StoreKey& key, std::span<const ByteRange> ranges,
        const CodecOptions& options) const override;

    [[nodiscard]] std::optional<std::uint64_t> size(const StoreKey& key) const override;

    void set(const StoreKey& key, ByteSpan value) override;

    void erase(const StoreKey& key) override;

private:
    std::filesystem::path root_;
};

}  // namespace zcodec::storage

#endif  // ZCODEC_STORAGE_FILESYSTEM_STORE_H
