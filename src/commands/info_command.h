// =============================================================================
// zcodec - Info Command
// =============================================================================
// Prints the encoded size of a stored chunk and, when the value carries a
// blosc header, the parsed header, its validation outcome and optionally the
// block start table. Text or JSON.
// =============================================================================

#ifndef ZCODEC_COMMANDS_INFO_COMMAND_H
#define ZCODEC_COMMANDS_INFO_COMMAND_H

#include <filesystem>
#include <iostream>
#include <ostream>
#include <string>

#include "zcodec/codec/blosc_header.h"
#include "zcodec/common/error.h"
#include "zcodec/common/types.h"

namespace zcodec::commands {

struct InfoOptions {
    std::filesystem::path storeRoot;
    std::string key;
    bool jsonOutput = false;
    /// @brief Also list the block start table of a blosc container.
    bool detailed = false;
};

class InfoCommand {
public:
    explicit InfoCommand(InfoOptions options);

    /// @brief Describe the chunk on out.
    /// @return 0, or the ErrorCode of the failure (an absent chunk is a
    ///         storage error here).
    [[nodiscard]] int execute(std::ostream& out = std::cout);

private:
    void printTextInfo(std::ostream& out, const Bytes& encoded) const;
    void printJsonInfo(std::ostream& out, const Bytes& encoded) const;

    InfoOptions options_;
};

}  // namespace zcodec::commands

#endif  // ZCODEC_COMMANDS_INFO_COMMAND_H
