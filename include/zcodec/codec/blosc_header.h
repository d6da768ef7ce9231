// =============================================================================
// zcodec - Blosc Container Header
// =============================================================================
// Parser for the 16-byte header of a c-blosc 1.x compressed buffer.
//
// Layout (all multi-byte integers little-endian):
//
//   offset  size  field
//   0       1     version      format version (1..kMaxFormatVersion)
//   1       1     versionlz    version of the internal compressor format
//   2       1     flags        bit 0: byte shuffle, bit 1: memcpyed,
//                              bit 2: bit shuffle, bits 5-7: compressor format
//   3       1     typesize     element size used by the shuffle filter
//   4       4     nbytes       decompressed length
//   8       4     blocksize    decompressed length of every block but the last
//   12      4     cbytes       total compressed length including this header
//
// Unless the memcpyed flag is set, the header is followed by a table of
// ceil(nbytes / blocksize) 32-bit block start offsets, each pointing inside
// the compressed buffer. A memcpyed buffer stores the input verbatim after
// the header, so cbytes == nbytes + 16.
// =============================================================================

#ifndef ZCODEC_CODEC_BLOSC_HEADER_H
#define ZCODEC_CODEC_BLOSC_HEADER_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "zcodec/common/error.h"
#include "zcodec/common/types.h"

namespace zcodec::codec {

/// @brief Decoded c-blosc 1.x container header.
struct BloscHeader {
    /// @brief Header length in bytes.
    static constexpr std::size_t kSize = 16;

    /// @brief Newest container format version understood.
    static constexpr std::uint8_t kMaxFormatVersion = 2;

    /// @brief Flag bits.
    static constexpr std::uint8_t kFlagShuffle = 0x01;
    static constexpr std::uint8_t kFlagMemcpyed = 0x02;
    static constexpr std::uint8_t kFlagBitShuffle = 0x04;

    /// @brief Largest decompressed length c-blosc can produce.
    static constexpr std::uint32_t kMaxBufferSize = 0x7FFFFFFFu - static_cast<std::uint32_t>(kSize);

    std::uint8_t version = 0;
    std::uint8_t versionlz = 0;
    std::uint8_t flags = 0;
    std::uint8_t typesize = 0;
    std::uint32_t nbytes = 0;
    std::uint32_t blocksize = 0;
    std::uint32_t cbytes = 0;

    /// @brief Decode the header fields without checking them.
    /// @return std::nullopt if the buffer is shorter than a header.
    [[nodiscard]] static std::optional<BloscHeader> parse(ByteSpan buffer) noexcept;

    /// @brief Decode the header and check it against the whole buffer.
    [[nodiscard]] static Result<BloscHeader> read(ByteSpan buffer);

    /// @brief Check the header against the buffer it was read from.
    /// @note Checks version, typesize, declared lengths and the block start table.
    [[nodiscard]] VoidResult validate(ByteSpan buffer) const;

    [[nodiscard]] bool isMemcpyed() const noexcept { return (flags & kFlagMemcpyed) != 0; }
    [[nodiscard]] bool isShuffled() const noexcept { return (flags & kFlagShuffle) != 0; }
    [[nodiscard]] bool isBitShuffled() const noexcept { return (flags & kFlagBitShuffle) != 0; }

    /// @brief Internal compressor format code (flags bits 5-7).
    [[nodiscard]] std::uint8_t compressorFormat() const noexcept {
        return static_cast<std::uint8_t>(flags >> 5);
    }

    /// @brief Name of the internal compressor format ("blosclz", "lz4", ...).
    [[nodiscard]] std::string_view compressorFormatName() const noexcept;

    /// @brief Number of compressed blocks (0 for a memcpyed buffer).
    [[nodiscard]] std::uint32_t numBlocks() const noexcept;

    /// @brief Block start offsets read from the buffer's block table.
    /// @pre validate(buffer) succeeded.
    [[nodiscard]] std::vector<std::uint32_t> blockStarts(ByteSpan buffer) const;

    bool operator==(const BloscHeader&) const = default;
};

}  // namespace zcodec::codec

#endif  // ZCODEC_CODEC_BLOSC_HEADER_H
