// =============================================================================
// zcodec - Chunk Codec Tool
// =============================================================================
// Main entry point for the zcodec command-line tool.
//
// Subcommands encode, decode and info operate on one chunk of a directory
// store. Global options select the thread count and logging.
// =============================================================================

#include <CLI/CLI.hpp>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "zcodec/common/error.h"
#include "zcodec/common/logger.h"
#include "zcodec/common/types.h"

// Command implementations
#include "commands/decode_command.h"
#include "commands/encode_command.h"
#include "commands/info_command.h"

namespace zcodec::commands {
int runEncode(CLI::App* app);
int runDecode(CLI::App* app);
int runInfo(CLI::App* app);
}  // namespace zcodec::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "zcodec: chunk codec pipeline with block-targeted partial decoding\n"
    "Encodes raw chunks with a bytes -> (blosc|zstd|gzip) codec chain into a\n"
    "directory store and decodes whole chunks or selected byte ranges.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    int threads = 1;
    int verbosity = 0;
    bool quiet = false;
    std::string logLevel;
    std::string logFile;
};

GlobalOptions gOptions;

// =============================================================================
// Shared Chunk Options
// =============================================================================

struct CliChunkOptions {
    std::string codec = "blosc";
    std::string dtype = "uint8";
    std::string endian = "little";
    std::vector<std::uint64_t> shape;
    std::optional<int> level;  // unset = codec default
    std::string bloscCompressor = "lz4";
    std::string bloscShuffle = "noshuffle";
    std::size_t bloscBlocksize = 0;
    bool zstdChecksum = false;
};

// =============================================================================
// Encode Command Options
// =============================================================================

struct CliEncodeOptions {
    std::string input;
    std::string store;
    std::string key;
    CliChunkOptions chunk;
};

CliEncodeOptions gEncodeOpts;

// =============================================================================
// Decode Command Options
// =============================================================================

struct CliDecodeOptions {
    std::string store;
    std::string key;
    std::string output = "-";
    std::vector<std::string> ranges;
    CliChunkOptions chunk;
};

CliDecodeOptions gDecodeOpts;

// =============================================================================
// Info Command Options
// =============================================================================

struct CliInfoOptions {
    std::string store;
    std::string key;
    bool json = false;
    bool detailed = false;
};

CliInfoOptions gInfoOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

void addChunkOptions(CLI::App* cmd, CliChunkOptions& opts) {
    cmd->add_option("-c,--codec", opts.codec, "Bytes-to-bytes codec: blosc, zstd, gzip, none")
        ->default_val("blosc")
        ->check(CLI::IsMember({"blosc", "zstd", "gzip", "none"}));

    cmd->add_option("-d,--dtype", opts.dtype, "Element data type (e.g. uint8, int32, float64)")
        ->default_val("uint8")
        ->check(CLI::IsMember({"bool", "int8", "int16", "int32", "int64", "uint8", "uint16",
                               "uint32", "uint64", "float32", "float64"}));

    cmd->add_option("--endian", opts.endian, "Byte order of the bytes codec: little, big")
        ->default_val("little")
        ->check(CLI::IsMember({"little", "big"}));

    cmd->add_option("--shape", opts.shape, "Chunk shape (default: one dimension over the data)")
        ->delimiter(',');

    cmd->add_option("-l,--level", opts.level, "Compression level (default: codec default)");

    cmd->add_option("--blosc-cname", opts.bloscCompressor,
                    "Blosc compressor: blosclz, lz4, lz4hc, snappy, zlib, zstd")
        ->default_val("lz4")
        ->check(CLI::IsMember({"blosclz", "lz4", "lz4hc", "snappy", "zlib", "zstd"}));

    cmd->add_option("--blosc-shuffle", opts.bloscShuffle,
                    "Blosc shuffle: noshuffle, shuffle, bitshuffle")
        ->default_val("noshuffle")
        ->check(CLI::IsMember({"noshuffle", "shuffle", "bitshuffle"}));

    cmd->add_option("--blosc-blocksize", opts.bloscBlocksize,
                    "Blosc block size in bytes (0 = automatic)")
        ->default_val(0);

    cmd->add_flag("--zstd-checksum", opts.zstdChecksum, "Write a zstd frame checksum");
}

void setupEncodeCommand(CLI::App& app) {
    auto* encode = app.add_subcommand("encode", "Encode a raw file as one stored chunk");
    encode->alias("e");

    encode->add_option("-i,--input", gEncodeOpts.input, "Raw input file")
        ->required()
        ->check(CLI::ExistingFile);

    encode->add_option("-s,--store", gEncodeOpts.store, "Store root directory")->required();

    encode->add_option("-k,--key", gEncodeOpts.key, "Store key of the chunk")->required();

    addChunkOptions(encode, gEncodeOpts.chunk);
}

void setupDecodeCommand(CLI::App& app) {
    auto* decode = app.add_subcommand("decode", "Decode a stored chunk or byte ranges of it");
    decode->alias("d");

    decode->add_option("-s,--store", gDecodeOpts.store, "Store root directory")
        ->required()
        ->check(CLI::ExistingDirectory);

    decode->add_option("-k,--key", gDecodeOpts.key, "Store key of the chunk")->required();

    decode->add_option("-o,--output", gDecodeOpts.output, "Output file (or '-' for stdout)")
        ->default_val("-");

    decode->add_option("-r,--range", gDecodeOpts.ranges,
                       "Decoded byte range: 'start:end', 'start:' or '-length' (repeatable)");

    addChunkOptions(decode, gDecodeOpts.chunk);
}

void setupInfoCommand(CLI::App& app) {
    auto* info = app.add_subcommand("info", "Display stored chunk information");
    info->alias("i");

    info->add_option("-s,--store", gInfoOpts.store, "Store root directory")
        ->required()
        ->check(CLI::ExistingDirectory);

    info->add_option("-k,--key", gInfoOpts.key, "Store key of the chunk")->required();

    info->add_flag("--json", gInfoOpts.json, "Output as JSON");

    info->add_flag("--detailed", gInfoOpts.detailed, "Show the blosc block table");
}

zcodec::commands::ChunkSpec toChunkSpec(const CliChunkOptions& opts) {
    zcodec::commands::ChunkSpec spec;
    spec.codec = opts.codec;
    spec.dtype = opts.dtype;
    spec.endian = opts.endian;
    spec.shape = opts.shape;
    spec.level = opts.level;
    spec.bloscCompressor = opts.bloscCompressor;
    spec.bloscShuffle = opts.bloscShuffle;
    spec.bloscBlocksize = opts.bloscBlocksize;
    spec.zstdChecksum = opts.zstdChecksum;
    return spec;
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    // Global options
    app.add_option("-t,--threads", gOptions.threads,
                   "Number of threads (> 1 enables parallel range service)")
        ->default_val(1)
        ->check(CLI::PositiveNumber);

    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v debug, -vv trace)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Suppress non-error output");

    app.add_option("--log-level", gOptions.logLevel, "Log threshold (overrides -v/-q)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warning", "error", "critical"},
                              CLI::ignore_case));

    app.add_option("--log-file", gOptions.logFile, "Also append log records to this file");

    setupEncodeCommand(app);
    setupDecodeCommand(app);
    setupInfoCommand(app);

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    zcodec::log::Config logConfig;
    logConfig.level = zcodec::log::levelForVerbosity(gOptions.verbosity, gOptions.quiet);
    if (!gOptions.logLevel.empty()) {
        logConfig.level = zcodec::log::parseLevel(gOptions.logLevel).value_or(logConfig.level);
    }
    logConfig.logFile = gOptions.logFile;
    if (app.got_subcommand("decode") && gDecodeOpts.output == "-") {
        // Decoded bytes own stdout; only failures may reach the console.
        logConfig.level = std::max(logConfig.level, zcodec::log::Level::kError);
    }

    std::optional<zcodec::log::Session> logSession;
    try {
        logSession.emplace(logConfig);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("encode")) {
            exitCode = zcodec::commands::runEncode(app.get_subcommand("encode"));
        } else if (app.got_subcommand("decode")) {
            exitCode = zcodec::commands::runDecode(app.get_subcommand("decode"));
        } else if (app.got_subcommand("info")) {
            exitCode = zcodec::commands::runInfo(app.get_subcommand("info"));
        }
    } catch (const zcodec::ZcodecException& ex) {
        ZCODEC_LOG_ERROR("Error: {}", ex.what());
        exitCode = static_cast<int>(ex.code());
    } catch (const std::exception& ex) {
        ZCODEC_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = EXIT_FAILURE;
    }

    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace zcodec::commands {

int runEncode([[maybe_unused]] CLI::App* app) {
    EncodeOptions opts;
    opts.inputPath = gEncodeOpts.input;
    opts.storeRoot = gEncodeOpts.store;
    opts.key = gEncodeOpts.key;
    opts.chunk = toChunkSpec(gEncodeOpts.chunk);
    opts.threads = gOptions.threads;

    auto cmd = std::make_unique<EncodeCommand>(std::move(opts));
    return cmd->execute();
}

int runDecode([[maybe_unused]] CLI::App* app) {
    DecodeOptions opts;
    opts.storeRoot = gDecodeOpts.store;
    opts.key = gDecodeOpts.key;
    opts.outputPath = gDecodeOpts.output;
    opts.ranges = gDecodeOpts.ranges;
    opts.chunk = toChunkSpec(gDecodeOpts.chunk);
    opts.threads = gOptions.threads;

    auto cmd = std::make_unique<DecodeCommand>(std::move(opts));
    return cmd->execute();
}

int runInfo([[maybe_unused]] CLI::App* app) {
    InfoOptions opts;
    opts.storeRoot = gInfoOpts.store;
    opts.key = gInfoOpts.key;
    opts.jsonOutput = gInfoOpts.json;
    opts.detailed = gInfoOpts.detailed;
    return InfoCommand(std::move(opts)).execute();
}

}  // namespace zcodec::commands
