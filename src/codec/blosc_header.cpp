// =============================================================================
// zcodec - Blosc Container Header Implementation
// =============================================================================

#include "zcodec/codec/blosc_header.h"

#include <format>

#include <blosc.h>

namespace zcodec::codec {

static_assert(BloscHeader::kSize == BLOSC_MAX_OVERHEAD, "blosc header size mismatch");
static_assert(BloscHeader::kFlagShuffle == BLOSC_DOSHUFFLE, "blosc shuffle flag mismatch");
static_assert(BloscHeader::kFlagMemcpyed == BLOSC_MEMCPYED, "blosc memcpyed flag mismatch");
static_assert(BloscHeader::kFlagBitShuffle == BLOSC_DOBITSHUFFLE,
              "blosc bitshuffle flag mismatch");

namespace {

std::uint32_t readU32Le(ByteSpan buffer, std::size_t offset) noexcept {
    return static_cast<std::uint32_t>(buffer[offset]) |
           (static_cast<std::uint32_t>(buffer[offset + 1]) << 8) |
           (static_cast<std::uint32_t>(buffer[offset + 2]) << 16) |
           (static_cast<std::uint32_t>(buffer[offset + 3]) << 24);
}

}  // namespace

std::optional<BloscHeader> BloscHeader::parse(ByteSpan buffer) noexcept {
    if (buffer.size() < kSize) {
        return std::nullopt;
    }
    BloscHeader header;
    header.version = buffer[0];
    header.versionlz = buffer[1];
    header.flags = buffer[2];
    header.typesize = buffer[3];
    header.nbytes = readU32Le(buffer, 4);
    header.blocksize = readU32Le(buffer, 8);
    header.cbytes = readU32Le(buffer, 12);
    return header;
}

Result<BloscHeader> BloscHeader::read(ByteSpan buffer) {
    auto header = parse(buffer);
    if (!header.has_value()) {
        return makeError<BloscHeader>(
            ErrorCode::kDecodeError,
            std::format("blosc buffer of {} bytes is shorter than its {}-byte header",
                        buffer.size(), kSize));
    }
    if (auto valid = header->validate(buffer); !valid.has_value()) {
        return std::unexpected(valid.error());
    }
    return *header;
}

VoidResult BloscHeader::validate(ByteSpan buffer) const {
    if (buffer.size() < kSize) {
        return makeVoidError(ErrorCode::kDecodeError, "blosc buffer is shorter than its header");
    }
    if (version == 0 || version > kMaxFormatVersion) {
        return makeVoidError(ErrorCode::kDecodeError,
                             std::format("unsupported blosc format version {}", version));
    }
    if (typesize == 0) {
        return makeVoidError(ErrorCode::kDecodeError, "blosc typesize is zero");
    }
    if (nbytes > kMaxBufferSize) {
        return makeVoidError(ErrorCode::kDecodeError,
                             std::format("blosc nbytes {} exceeds the maximum buffer size",
                                         nbytes));
    }
    if (cbytes < kSize || cbytes > buffer.size()) {
        return makeVoidError(ErrorCode::kDecodeError,
                             std::format("blosc cbytes {} is inconsistent with a {}-byte buffer",
                                         cbytes, buffer.size()));
    }

    if (isMemcpyed()) {
        if (static_cast<std::uint64_t>(cbytes) != static_cast<std::uint64_t>(nbytes) + kSize) {
            return makeVoidError(
                ErrorCode::kDecodeError,
                std::format("memcpyed blosc buffer declares {} bytes but holds {}", nbytes,
                            cbytes - kSize));
        }
        return makeVoidSuccess();
    }

    if (nbytes == 0) {
        return makeVoidSuccess();
    }
    if (blocksize == 0) {
        return makeVoidError(ErrorCode::kDecodeError, "blosc blocksize is zero");
    }

    const std::uint64_t nblocks = numBlocks();
    const std::uint64_t dataStart = kSize + nblocks * sizeof(std::uint32_t);
    if (dataStart > cbytes) {
        return makeVoidError(ErrorCode::kDecodeError,
                             std::format("blosc block table of {} entries overruns cbytes {}",
                                         nblocks, cbytes));
    }
    for (std::uint64_t block = 0; block < nblocks; ++block) {
        const std::uint32_t start =
            readU32Le(buffer, kSize + static_cast<std::size_t>(block) * sizeof(std::uint32_t));
        if (start < dataStart || start >= cbytes) {
            return makeVoidError(
                ErrorCode::kDecodeError,
                std::format("blosc block {} starts at {}, outside [{}, {})", block, start,
                            dataStart, cbytes));
        }
    }
    return makeVoidSuccess();
}

std::string_view BloscHeader::compressorFormatName() const noexcept {
    switch (compressorFormat()) {
        case BLOSC_BLOSCLZ_FORMAT:
            return "blosclz";
        case BLOSC_LZ4_FORMAT:
            return "lz4";
        case BLOSC_SNAPPY_FORMAT:
            return "snappy";
        case BLOSC_ZLIB_FORMAT:
            return "zlib";
        case BLOSC_ZSTD_FORMAT:
            return "zstd";
        default:
            return "unknown";
    }
}

std::uint32_t BloscHeader::numBlocks() const noexcept {
    if (isMemcpyed() || blocksize == 0) {
        return 0;
    }
    return nbytes / blocksize + (nbytes % blocksize != 0 ? 1 : 0);
}

std::vector<std::uint32_t> BloscHeader::blockStarts(ByteSpan buffer) const {
    std::vector<std::uint32_t> starts(numBlocks());
    for (std::size_t block = 0; block < starts.size(); ++block) {
        starts[block] = readU32Le(buffer, kSize + block * sizeof(std::uint32_t));
    }
    return starts;
}

}  // namespace zcodec::codec
