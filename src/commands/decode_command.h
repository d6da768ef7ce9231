// =============================================================================
// zcodec - Decode Command
// =============================================================================
// Decodes a stored chunk, whole or only selected byte ranges of its decoded
// form, and writes the bytes to a file or stdout.
// =============================================================================

#ifndef ZCODEC_COMMANDS_DECODE_COMMAND_H
#define ZCODEC_COMMANDS_DECODE_COMMAND_H

#include <filesystem>
#include <string>
#include <vector>

#include "chunk_spec.h"

namespace zcodec::commands {

/// @brief Configuration options for the decode command.
struct DecodeOptions {
    /// @brief Root directory of the filesystem store.
    std::filesystem::path storeRoot;

    /// @brief Store key of the encoded chunk.
    std::string key;

    /// @brief Output file ("-" for stdout).
    std::filesystem::path outputPath = "-";

    ChunkSpec chunk;

    /// @brief Decoded byte ranges to extract; empty decodes the whole chunk.
    std::vector<std::string> ranges;

    /// @brief Worker threads; more than one enables the parallel hint.
    int threads = 1;
};

/// @brief Command handler for chunk decoding.
class DecodeCommand {
public:
    explicit DecodeCommand(DecodeOptions options);

    DecodeCommand(const DecodeCommand&) = delete;
    DecodeCommand& operator=(const DecodeCommand&) = delete;

    /// @brief Execute the decode command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

private:
    void run();

    DecodeOptions options_;
};

}  // namespace zcodec::commands

#endif  // ZCODEC_COMMANDS_DECODE_COMMAND_H
