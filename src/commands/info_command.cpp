// =============================================================================
// zcodec - Info Command Implementation
// =============================================================================

#include "info_command.h"

#include <optional>
#include <ostream>
#include <utility>

#include "zcodec/common/logger.h"
#include "zcodec/storage/filesystem_store.h"
#include "zcodec/storage/store_key.h"

namespace zcodec::commands {

namespace {

/// @brief Parsed header and validation outcome of a possible blosc container.
struct BloscInfo {
    codec::BloscHeader header;
    std::optional<std::string> problem;
};

std::optional<BloscInfo> inspectBlosc(const Bytes& encoded) {
    const auto header = codec::BloscHeader::parse(encoded);
    if (!header.has_value()) {
        return std::nullopt;
    }
    BloscInfo info{*header, std::nullopt};
    if (auto valid = header->validate(encoded); !valid.has_value()) {
        info.problem = valid.error().message();
    }
    return info;
}

std::string jsonEscape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (const char c : text) {
        if (c == '"' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    return out;
}

}  // namespace

// =============================================================================
// InfoCommand Implementation
// =============================================================================

InfoCommand::InfoCommand(InfoOptions options) : options_(std::move(options)) {}

int InfoCommand::execute(std::ostream& out) {
    try {
        const storage::StoreKey key(options_.key);
        const storage::FilesystemStore store(options_.storeRoot, false);
        const auto encoded = store.get(key);
        if (!encoded.has_value()) {
            throw StorageError("chunk not found: " + key.str(), ErrorContext(key.str()));
        }

        if (options_.jsonOutput) {
            printJsonInfo(out, *encoded);
        } else {
            printTextInfo(out, *encoded);
        }
        return 0;

    } catch (const ZcodecException& e) {
        ZCODEC_LOG_ERROR("Info command failed: {}", e.what());
        return static_cast<int>(e.code());
    }
}

void InfoCommand::printTextInfo(std::ostream& out, const Bytes& encoded) const {
    out << "=== Chunk Information ===" << std::endl;
    out << std::endl;
    out << "Store:          " << options_.storeRoot.string() << std::endl;
    out << "Key:            " << options_.key << std::endl;
    out << "Encoded size:   " << encoded.size() << " bytes" << std::endl;

    const auto blosc = inspectBlosc(encoded);
    if (!blosc.has_value()) {
        out << std::endl;
        out << "(no blosc header)" << std::endl;
        return;
    }

    const auto& header = blosc->header;
    out << std::endl;
    out << "--- Blosc Header ---" << std::endl;
    out << "Version:        " << static_cast<int>(header.version) << std::endl;
    out << "Codec version:  " << static_cast<int>(header.versionlz) << std::endl;
    out << "Compressor:     " << header.compressorFormatName() << std::endl;
    out << "Shuffle:        "
              << (header.isBitShuffled() ? "bitshuffle"
                                         : (header.isShuffled() ? "shuffle" : "noshuffle"))
              << std::endl;
    out << "Memcpyed:       " << (header.isMemcpyed() ? "yes" : "no") << std::endl;
    out << "Type size:      " << static_cast<int>(header.typesize) << std::endl;
    out << "Decoded size:   " << header.nbytes << " bytes" << std::endl;
    out << "Block size:     " << header.blocksize << " bytes" << std::endl;
    out << "Blocks:         " << header.numBlocks() << std::endl;
    out << "Valid:          " << (blosc->problem ? "NO (" + *blosc->problem + ")" : "yes")
              << std::endl;

    if (options_.detailed && !blosc->problem && !header.isMemcpyed()) {
        out << std::endl;
        out << "--- Block Starts ---" << std::endl;
        const auto starts = header.blockStarts(encoded);
        for (std::size_t i = 0; i < starts.size(); ++i) {
            out << "  [" << i << "] " << starts[i] << std::endl;
        }
    }
}

void InfoCommand::printJsonInfo(std::ostream& out, const Bytes& encoded) const {
    out << "{" << std::endl;
    out << "  \"store\": \"" << jsonEscape(options_.storeRoot.string()) << "\","
              << std::endl;
    out << "  \"key\": \"" << jsonEscape(options_.key) << "\"," << std::endl;
    out << "  \"encoded_size\": " << encoded.size();

    const auto blosc = inspectBlosc(encoded);
    if (!blosc.has_value()) {
        out << std::endl << "}" << std::endl;
        return;
    }

    const auto& header = blosc->header;
    out << "," << std::endl;
    out << "  \"blosc\": {" << std::endl;
    out << "    \"version\": " << static_cast<int>(header.version) << "," << std::endl;
    out << "    \"versionlz\": " << static_cast<int>(header.versionlz) << "," << std::endl;
    out << "    \"compressor\": \"" << header.compressorFormatName() << "\"," << std::endl;
    out << "    \"shuffle\": " << (header.isShuffled() ? "true" : "false") << ","
              << std::endl;
    out << "    \"bitshuffle\": " << (header.isBitShuffled() ? "true" : "false") << ","
              << std::endl;
    out << "    \"memcpyed\": " << (header.isMemcpyed() ? "true" : "false") << ","
              << std::endl;
    out << "    \"typesize\": " << static_cast<int>(header.typesize) << "," << std::endl;
    out << "    \"nbytes\": " << header.nbytes << "," << std::endl;
    out << "    \"blocksize\": " << header.blocksize << "," << std::endl;
    out << "    \"cbytes\": " << header.cbytes << "," << std::endl;
    out << "    \"blocks\": " << header.numBlocks() << "," << std::endl;
    out << "    \"valid\": " << (blosc->problem ? "false" : "true");
    if (blosc->problem) {
        out << "," << std::endl;
        out << "    \"problem\": \"" << jsonEscape(*blosc->problem) << "\"";
    }
    out << std::endl << "  }" << std::endl;
    out << "}" << std::endl;
}

}  // namespace zcodec::commands
