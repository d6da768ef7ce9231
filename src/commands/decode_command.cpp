// =============================================================================
// zcodec - Decode Command Implementation
// =============================================================================

#include "decode_command.h"

#include <fstream>
#include <iostream>
#include <memory>
#include <ranges>
#include <utility>

#include "zcodec/codec/blosc_header.h"
#include "zcodec/codec/partial_decoder.h"
#include "zcodec/common/logger.h"
#include "zcodec/storage/filesystem_store.h"
#include "zcodec/storage/store_key.h"

namespace zcodec::commands {

namespace {

/// @brief Decoded size of a stored chunk when no shape was given.
/// @note A blosc chunk reports it in its header; other chains are decoded
///       down to the array-to-bytes input.
std::uint64_t inferDecodedSize(const storage::ReadableStorage& store,
                               const storage::StoreKey& key,
                               const codec::CodecPipeline& pipeline,
                               const CodecOptions& options) {
    const auto& stages = pipeline.bytesToBytes();
    const auto storedSize = store.size(key);
    if (!storedSize.has_value()) {
        throw StorageError("chunk not found: " + key.str(), ErrorContext(key.str()));
    }
    if (stages.size() == 1 && stages.front()->name() == "blosc" &&
        *storedSize >= codec::BloscHeader::kSize) {
        const std::vector<storage::ByteRange> headerRange{
            storage::ByteRange::fromStart(0, codec::BloscHeader::kSize)};
        const auto prefix = store.getPartialValues(key, headerRange, options);
        if (!prefix.has_value()) {
            throw StorageError("chunk not found: " + key.str(), ErrorContext(key.str()));
        }
        const auto header = codec::BloscHeader::parse(prefix->front());
        if (header.has_value()) {
            return header->nbytes;
        }
    }

    auto encoded = store.get(key);
    if (!encoded.has_value()) {
        throw StorageError("chunk not found: " + key.str(), ErrorContext(key.str()));
    }
    Bytes data = std::move(*encoded);
    for (const auto& stage : stages | std::views::reverse) {
        data = stage->decode(data, options);
    }
    return data.size();
}

void writeOutput(const std::filesystem::path& path, const std::vector<Bytes>& parts) {
    if (path == "-") {
        for (const auto& part : parts) {
            std::cout.write(reinterpret_cast<const char*>(part.data()),
                            static_cast<std::streamsize>(part.size()));
        }
        std::cout.flush();
        if (!std::cout) {
            throw StorageError("failed to write to stdout");
        }
        return;
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw StorageError("failed to open output file: " + path.string());
    }
    for (const auto& part : parts) {
        out.write(reinterpret_cast<const char*>(part.data()),
                  static_cast<std::streamsize>(part.size()));
    }
    if (!out) {
        throw StorageError("failed to write output file: " + path.string());
    }
}

}  // namespace

DecodeCommand::DecodeCommand(DecodeOptions options) : options_(std::move(options)) {}

int DecodeCommand::execute() {
    try {
        run();
        return 0;
    } catch (const ZcodecException& e) {
        ZCODEC_LOG_ERROR("Decode failed: {}", e.what());
        return static_cast<int>(e.code());
    }
}

void DecodeCommand::run() {
    storage::StoreKey key(options_.key);
    std::vector<storage::ByteRange> ranges;
    ranges.reserve(options_.ranges.size());
    for (const auto& text : options_.ranges) {
        ranges.push_back(parseByteRange(text));
    }

    CodecOptions codecOptions;
    if (options_.threads > 1) {
        codecOptions = CodecOptions::parallelOptions(static_cast<std::size_t>(options_.threads));
    }

    auto store = std::make_shared<const storage::FilesystemStore>(options_.storeRoot, false);
    const codec::CodecPipeline pipeline = buildPipeline(options_.chunk);

    std::optional<std::uint64_t> decodedSize;
    if (options_.chunk.shape.empty()) {
        decodedSize = inferDecodedSize(*store, key, pipeline, codecOptions);
    }
    const ChunkRepresentation rep = buildRepresentation(options_.chunk, decodedSize);

    ZCODEC_LOG_DEBUG("decoding {} ({} bytes decoded) with {}, {} range(s)", key.str(),
                     rep.sizeBytes(), pipeline.describe(), ranges.size());

    auto decoder = pipeline.partialDecoder(
        std::make_unique<codec::StoragePartialDecoder>(store, key), rep, codecOptions);

    std::vector<Bytes> parts;
    if (ranges.empty()) {
        auto whole = decoder->decode(codecOptions);
        if (!whole.has_value()) {
            throw StorageError("chunk not found: " + key.str(), ErrorContext(key.str()));
        }
        parts.push_back(std::move(*whole));
    } else {
        auto decoded = decoder->partialDecode(ranges, codecOptions);
        if (!decoded.has_value()) {
            throw StorageError("chunk not found: " + key.str(), ErrorContext(key.str()));
        }
        parts = std::move(*decoded);
    }

    writeOutput(options_.outputPath, parts);
}

}  // namespace zcodec::commands
