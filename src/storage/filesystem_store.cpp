// =============================================================================
// zcodec - Filesystem Store Implementation
// =============================================================================

#include "zcodec/storage/filesystem_store.h"

#include <atomic>
#include <format>
#include <fstream>
#include <random>
#include <system_error>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

#include "zcodec/common/logger.h"

namespace zcodec::storage {

namespace fs = std::filesystem;

namespace {

/// @brief Read `length` bytes at `offset` from an open stream.
Bytes readAt(std::ifstream& stream, std::uint64_t offset, std::uint64_t length,
             const fs::path& path) {
    Bytes out(static_cast<std::size_t>(length));
    if (length == 0) {
        return out;
    }
    stream.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    stream.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(length));
    if (!stream) {
        throw StorageError(
            std::format("short read of {} bytes at offset {} from {}", length, offset,
                        path.string()));
    }
    return out;
}

/// @brief Open a file for reading; std::nullopt if it does not exist.
std::optional<std::ifstream> openForRead(const fs::path& path) {
    std::error_code ec;
    const bool exists = fs::is_regular_file(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        throw StorageError("failed to stat " + path.string(), ec);
    }
    if (!exists) {
        return std::nullopt;
    }
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        throw StorageError("failed to open " + path.string() + " for reading");
    }
    return std::optional<std::ifstream>(std::move(stream));
}

/// @brief Unique temporary sibling for an atomic write.
fs::path temporarySibling(const fs::path& path) {
    static std::atomic<std::uint64_t> counter{0};
    thread_local std::mt19937_64 rng{std::random_device{}()};
    auto name = path.filename().string();
    name += std::format(".tmp.{}.{}", counter.fetch_add(1, std::memory_order_relaxed), rng());
    return path.parent_path() / name;
}

}  // namespace

// =============================================================================
// FilesystemStore Implementation
// =============================================================================

FilesystemStore::FilesystemStore(fs::path root, bool create) : root_(std::move(root)) {
    std::error_code ec;
    if (create) {
        fs::create_directories(root_, ec);
        if (ec) {
            throw StorageError("failed to create store root " + root_.string(), ec);
        }
    }
    if (!fs::is_directory(root_, ec)) {
        throw StorageError("store root " + root_.string() + " is not a directory");
    }
    ZCODEC_LOG_DEBUG("filesystem store opened at {}", root_.string());
}

fs::path FilesystemStore::keyToPath(const StoreKey& key) const {
    return root_ / fs::path(key.str());
}

std::optional<Bytes> FilesystemStore::get(const StoreKey& key) const {
    const fs::path path = keyToPath(key);
    try {
        auto stream = openForRead(path);
        if (!stream.has_value()) {
            ZCODEC_LOG_TRACE("filesystem store: {} absent", key.str());
            return std::nullopt;
        }
        stream->seekg(0, std::ios::end);
        const auto fileSize = static_cast<std::uint64_t>(stream->tellg());
        return readAt(*stream, 0, fileSize, path);
    } catch (const ZcodecException& ex) {
        rethrowWithContext(ex, ErrorContext{key.str()});
    }
}

std::optional<std::vector<Bytes>> FilesystemStore::getPartialValues(
    const StoreKey& key, std::span<const ByteRange> ranges, const CodecOptions& options) const {
    const fs::path path = keyToPath(key);
    try {
        auto stream = openForRead(path);
        if (!stream.has_value()) {
            return std::nullopt;
        }
        stream->seekg(0, std::ios::end);
        const auto fileSize = static_cast<std::uint64_t>(stream->tellg());
        validateByteRanges(ranges, fileSize);

        std::vector<Bytes> out(ranges.size());
        if (options.parallel && ranges.size() > 1) {
            // Each task reads through its own stream.
            tbb::parallel_for(tbb::blocked_range<std::size_t>(0, ranges.size()),
                              [&](const tbb::blocked_range<std::size_t>& block) {
                                  std::ifstream local(path, std::ios::binary);
                                  if (!local) {
                                      throw StorageError("failed to open " + path.string() +
                                                         " for reading");
                                  }
                                  for (std::size_t i = block.begin(); i < block.end(); ++i) {
                                      out[i] = readAt(local, ranges[i].start(fileSize),
                                                      ranges[i].length(fileSize), path);
                                  }
                              });
        } else {
            for (std::size_t i = 0; i < ranges.size(); ++i) {
                out[i] = readAt(*stream, ranges[i].start(fileSize), ranges[i].length(fileSize),
                                path);
            }
        }
        return out;
    } catch (const ZcodecException& ex) {
        rethrowWithContext(ex, ErrorContext{key.str()});
    }
}

std::optional<std::uint64_t> FilesystemStore::size(const StoreKey& key) const {
    const fs::path path = keyToPath(key);
    std::error_code ec;
    const auto fileSize = fs::file_size(path, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            return std::nullopt;
        }
        throw StorageError("failed to stat " + path.string(), ec, ErrorContext{key.str()});
    }
    return fileSize;
}

void FilesystemStore::set(const StoreKey& key, ByteSpan value) {
    const fs::path path = keyToPath(key);
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw StorageError("failed to create directory " + path.parent_path().string(), ec,
                           ErrorContext{key.str()});
    }

    const fs::path tmpPath = temporarySibling(path);
    {
        std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw StorageError("failed to open " + tmpPath.string() + " for writing",
                               ErrorContext{key.str()});
        }
        out.write(reinterpret_cast<const char*>(value.data()),
                  static_cast<std::streamsize>(value.size()));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmpPath, ec);
            throw StorageError("failed to write " + tmpPath.string(), ErrorContext{key.str()});
        }
    }

    fs::rename(tmpPath, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmpPath, ignored);
        throw StorageError("failed to move value into place at " + path.string(), ec,
                           ErrorContext{key.str()});
    }
    ZCODEC_LOG_TRACE("filesystem store: set {} ({} bytes)", key.str(), value.size());
}

void FilesystemStore::erase(const StoreKey& key) {
    const fs::path path = keyToPath(key);
    std::error_code ec;
    fs::remove(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        throw StorageError("failed to erase " + path.string(), ec, ErrorContext{key.str()});
    }
}

}  // namespace zcodec::storage
