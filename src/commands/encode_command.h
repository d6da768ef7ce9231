// =============================================================================
// zcodec - Encode Command
// =============================================================================
// Encodes a raw file as one chunk and stores it in a filesystem store.
// =============================================================================

#ifndef ZCODEC_COMMANDS_ENCODE_COMMAND_H
#define ZCODEC_COMMANDS_ENCODE_COMMAND_H

#include <cstdint>
#include <filesystem>
#include <string>

#include "chunk_spec.h"

namespace zcodec::commands {

/// @brief Configuration options for the encode command.
struct EncodeOptions {
    /// @brief Raw input file holding the decoded chunk.
    std::filesystem::path inputPath;

    /// @brief Root directory of the filesystem store.
    std::filesystem::path storeRoot;

    /// @brief Store key the encoded chunk is written under.
    std::string key;

    ChunkSpec chunk;

    /// @brief Worker threads; more than one enables the parallel hint.
    int threads = 1;
};

/// @brief Statistics of one encode run.
struct EncodeStats {
    std::uint64_t decodedBytes = 0;
    std::uint64_t encodedBytes = 0;
    double elapsedSeconds = 0.0;

    [[nodiscard]] double ratio() const noexcept {
        return encodedBytes == 0 ? 0.0
                                 : static_cast<double>(decodedBytes) /
                                       static_cast<double>(encodedBytes);
    }
};

/// @brief Command handler for chunk encoding.
class EncodeCommand {
public:
    explicit EncodeCommand(EncodeOptions options);

    EncodeCommand(const EncodeCommand&) = delete;
    EncodeCommand& operator=(const EncodeCommand&) = delete;

    /// @brief Execute the encode command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const EncodeStats& stats() const noexcept { return stats_; }

private:
    void run();

    EncodeOptions options_;
    EncodeStats stats_;
};

}  // namespace zcodec::commands

#endif  // ZCODEC_COMMANDS_ENCODE_COMMAND_H
