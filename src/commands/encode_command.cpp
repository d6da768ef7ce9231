// =============================================================================
// zcodec - Encode Command Implementation
// =============================================================================

#include "encode_command.h"

#include <chrono>
#include <fstream>
#include <iterator>
#include <utility>

#include "zcodec/common/logger.h"
#include "zcodec/storage/filesystem_store.h"
#include "zcodec/storage/store_key.h"

namespace zcodec::commands {

namespace {

Bytes readFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw StorageError("failed to open input file: " + path.string());
    }
    Bytes data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw StorageError("failed to read input file: " + path.string());
    }
    return data;
}

}  // namespace

EncodeCommand::EncodeCommand(EncodeOptions options) : options_(std::move(options)) {}

int EncodeCommand::execute() {
    const auto startTime = std::chrono::steady_clock::now();
    try {
        run();
        stats_.elapsedSeconds =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
        ZCODEC_LOG_INFO("encoded {} -> {} bytes (ratio {:.2f}) in {:.3f}s", stats_.decodedBytes,
                        stats_.encodedBytes, stats_.ratio(), stats_.elapsedSeconds);
        return 0;
    } catch (const ZcodecException& e) {
        ZCODEC_LOG_ERROR("Encode failed: {}", e.what());
        return static_cast<int>(e.code());
    }
}

void EncodeCommand::run() {
    const storage::StoreKey key(options_.key);
    const Bytes decoded = readFile(options_.inputPath);
    const ChunkRepresentation rep = buildRepresentation(options_.chunk, decoded.size());
    const codec::CodecPipeline pipeline = buildPipeline(options_.chunk);

    ZCODEC_LOG_DEBUG("encoding {} ({} x {}) with {}", options_.inputPath.string(),
                     rep.numElements(), dataTypeToString(rep.dataType), pipeline.describe());

    CodecOptions codecOptions;
    if (options_.threads > 1) {
        codecOptions = CodecOptions::parallelOptions(static_cast<std::size_t>(options_.threads));
    }
    const Bytes encoded = pipeline.encode(decoded, rep, codecOptions);

    storage::FilesystemStore store(options_.storeRoot);
    store.set(key, encoded);

    stats_.decodedBytes = decoded.size();
    stats_.encodedBytes = encoded.size();
}

}  // namespace zcodec::commands
