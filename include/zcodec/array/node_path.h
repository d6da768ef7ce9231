// =============================================================================
// zcodec - Node Path
// =============================================================================
// Absolute path of an array or group in a hierarchy: "/" for the root, or
// "/a/b" with non-empty components and no trailing '/'.
// =============================================================================

#ifndef ZCODEC_ARRAY_NODE_PATH_H
#define ZCODEC_ARRAY_NODE_PATH_H

#include <ostream>
#include <string>
#include <string_view>

#include "zcodec/common/error.h"

namespace zcodec::array {

class NodePath {
public:
    /// @brief The root path "/".
    NodePath() : path_("/") {}

    /// @throws UsageError if `path` is not a valid node path.
    explicit NodePath(std::string path);

    /// @brief Validate and construct without throwing.
    [[nodiscard]] static Result<NodePath> create(std::string path);

    [[nodiscard]] static VoidResult validate(std::string_view path);

    [[nodiscard]] static NodePath root() { return NodePath(); }

    [[nodiscard]] const std::string& str() const noexcept { return path_; }

    [[nodiscard]] bool isRoot() const noexcept { return path_ == "/"; }

    /// @brief Store key prefix of the node: the path without its leading '/'.
    /// @note Empty for the root.
    [[nodiscard]] std::string_view keyPrefix() const noexcept {
        return std::string_view(path_).substr(1);
    }

    bool operator==(const NodePath& other) const = default;

    friend std::ostream& operator<<(std::ostream& os, const NodePath& path) {
        return os << path.path_;
    }

private:
    std::string path_;
};

}  // namespace zcodec::array

#endif  // ZCODEC_ARRAY_NODE_PATH_H
