// =============================================================================
// zcodec - Node Path Implementation
// =============================================================================

#include "zcodec/array/node_path.h"

#include <format>
#include <utility>

namespace zcodec::array {

NodePath::NodePath(std::string path) : path_(std::move(path)) {
    unwrapOrThrow(validate(path_));
}

Result<NodePath> NodePath::create(std::string path) {
    if (auto valid = validate(path); !valid.has_value()) {
        return std::unexpected(valid.error());
    }
    return NodePath(std::move(path));
}

VoidResult NodePath::validate(std::string_view path) {
    if (path.empty() || path.front() != '/') {
        return makeVoidError(ErrorCode::kUsageError,
                             std::format("node path '{}' must start with '/'", path));
    }
    if (path == "/") {
        return makeVoidSuccess();
    }
    if (path.back() == '/') {
        return makeVoidError(ErrorCode::kUsageError,
                             std::format("node path '{}' ends with '/'", path));
    }
    if (path.find("//") != std::string_view::npos) {
        return makeVoidError(ErrorCode::kUsageError,
                             std::format("node path '{}' has an empty component", path));
    }
    std::size_t begin = 1;
    while (begin < path.size()) {
        std::size_t sep = path.find('/', begin);
        if (sep == std::string_view::npos) {
            sep = path.size();
        }
        const std::string_view component = path.substr(begin, sep - begin);
        if (component == "." || component == "..") {
            return makeVoidError(
                ErrorCode::kUsageError,
                std::format("node path '{}' has an invalid component '{}'", path, component));
        }
        begin = sep + 1;
    }
    return makeVoidSuccess();
}

}  // namespace zcodec::array
