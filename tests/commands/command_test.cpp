// =============================================================================
// zcodec - Command Tests
// =============================================================================
// Tests for command-line chunk options and the encode/decode commands
// against a directory store.
// =============================================================================

#include "commands/chunk_spec.h"
#include "commands/decode_command.h"
#include "commands/encode_command.h"
#include "commands/info_command.h"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

namespace zcodec::commands {
namespace {

// =============================================================================
// Option Parsing Tests
// =============================================================================

TEST(ChunkSpecTest, ParseByteRange) {
    const auto interval = parseByteRange("8:16");
    EXPECT_EQ(interval.start(64), 8u);
    EXPECT_EQ(interval.end(64), 16u);

    const auto open = parseByteRange("10:");
    EXPECT_EQ(open.start(64), 10u);
    EXPECT_EQ(open.end(64), 64u);

    const auto suffix = parseByteRange("-4");
    EXPECT_EQ(suffix.start(64), 60u);

    for (const char* bad : {"", "8", "x:4", "8:4", "-", "1:2:3"}) {
        EXPECT_THROW((void)parseByteRange(bad), UsageError) << bad;
    }
}

TEST(ChunkSpecTest, ParseNames) {
    EXPECT_EQ(parseDataType("float64"), DataType::kFloat64);
    EXPECT_EQ(parseEndianness("big"), Endianness::kBig);
    EXPECT_THROW((void)parseDataType("complex64"), UsageError);
    EXPECT_THROW((void)parseEndianness("middle"), UsageError);
}

TEST(ChunkSpecTest, BloscChainUsesElementSize) {
    ChunkSpec spec;
    spec.dtype = "int32";
    spec.level = 7;
    spec.bloscShuffle = "shuffle";

    const auto configs = buildCodecConfigurations(spec);
    ASSERT_EQ(configs.size(), 2u);
    const auto* blosc = std::get_if<codec::BloscCodecConfig>(&configs[1]);
    ASSERT_NE(blosc, nullptr);
    EXPECT_EQ(blosc->typesize, 4u);
    EXPECT_EQ(blosc->clevel, 7);
    EXPECT_EQ(blosc->shuffle, codec::BloscShuffle::kShuffle);
    EXPECT_EQ(buildPipeline(spec).describe(), "bytes -> blosc");
}

TEST(ChunkSpecTest, OtherChains) {
    ChunkSpec spec;
    spec.codec = "none";
    EXPECT_EQ(buildPipeline(spec).describe(), "bytes");

    spec.codec = "zstd";
    spec.level = -3;
    EXPECT_EQ(std::get<codec::ZstdCodecConfig>(buildCodecConfigurations(spec)[1]).level, -3);

    spec.codec = "lzma";
    EXPECT_THROW((void)buildCodecConfigurations(spec), UnsupportedCodecError);
}

TEST(ChunkSpecTest, Representation) {
    ChunkSpec spec;
    spec.dtype = "uint16";
    spec.shape = {4, 8};
    EXPECT_EQ(buildRepresentation(spec, std::nullopt).sizeBytes(), 64u);

    spec.shape.clear();
    EXPECT_EQ(buildRepresentation(spec, 10).shape, (ArrayShape{5}));
    EXPECT_THROW((void)buildRepresentation(spec, 11), UsageError);
    EXPECT_THROW((void)buildRepresentation(spec, std::nullopt), UsageError);
}

// =============================================================================
// Encode / Decode Command Tests
// =============================================================================

class CommandRoundTripTest : public ::testing::Test {
protected:
    void SetUp() override {
        static std::atomic<int> counter{0};
        dir_ = std::filesystem::temp_directory_path() /
               ("zcodec_command_test_" +
                std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
                std::to_string(counter++));
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);

        data_.resize(4096);
        for (std::size_t i = 0; i < data_.size(); ++i) {
            data_[i] = static_cast<std::uint8_t>((i / 4) % 200);
        }
        writeFile(dir_ / "input.bin", data_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    static void writeFile(const std::filesystem::path& path, const Bytes& data) {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
    }

    static Bytes readFile(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        return Bytes(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    int encode(const ChunkSpec& chunk) {
        EncodeOptions opts;
        opts.inputPath = dir_ / "input.bin";
        opts.storeRoot = dir_ / "store";
        opts.key = "arr/c/0";
        opts.chunk = chunk;
        EncodeCommand cmd(std::move(opts));
        return cmd.execute();
    }

    int decode(const ChunkSpec& chunk, std::vector<std::string> ranges, int threads = 1) {
        DecodeOptions opts;
        opts.storeRoot = dir_ / "store";
        opts.key = "arr/c/0";
        opts.outputPath = dir_ / "output.bin";
        opts.chunk = chunk;
        opts.ranges = std::move(ranges);
        opts.threads = threads;
        DecodeCommand cmd(std::move(opts));
        return cmd.execute();
    }

    int info(std::ostream& out, bool json, bool detailed = false) {
        InfoOptions opts;
        opts.storeRoot = dir_ / "store";
        opts.key = "arr/c/0";
        opts.jsonOutput = json;
        opts.detailed = detailed;
        return InfoCommand(std::move(opts)).execute(out);
    }

    Bytes slice(std::size_t start, std::size_t end) const {
        return Bytes(data_.begin() + static_cast<std::ptrdiff_t>(start),
                     data_.begin() + static_cast<std::ptrdiff_t>(end));
    }

    std::filesystem::path dir_;
    Bytes data_;
};

TEST_F(CommandRoundTripTest, BloscRangesWithoutShape) {
    ChunkSpec chunk;
    chunk.dtype = "uint32";
    chunk.bloscShuffle = "shuffle";
    chunk.bloscBlocksize = 512;
    ASSERT_EQ(encode(chunk), 0);
    EXPECT_TRUE(std::filesystem::exists(dir_ / "store" / "arr" / "c" / "0"));

    ASSERT_EQ(decode(chunk, {"8:16", "-6"}, 4), 0);
    Bytes expected = slice(8, 16);
    const Bytes tail = slice(4090, 4096);
    expected.insert(expected.end(), tail.begin(), tail.end());
    EXPECT_EQ(readFile(dir_ / "output.bin"), expected);

    ASSERT_EQ(decode(chunk, {}), 0);
    EXPECT_EQ(readFile(dir_ / "output.bin"), data_);
}

TEST_F(CommandRoundTripTest, ZstdWithShape) {
    ChunkSpec chunk;
    chunk.codec = "zstd";
    chunk.dtype = "uint16";
    chunk.endian = "big";
    chunk.shape = {32, 64};
    ASSERT_EQ(encode(chunk), 0);

    ASSERT_EQ(decode(chunk, {"1001:"}), 0);
    EXPECT_EQ(readFile(dir_ / "output.bin"), slice(1001, 4096));
}

TEST_F(CommandRoundTripTest, FailuresReturnErrorCodes) {
    ChunkSpec chunk;
    chunk.shape = {100};
    EXPECT_EQ(encode(chunk), static_cast<int>(ErrorCode::kEncodeError));

    chunk.shape.clear();
    ASSERT_EQ(encode(chunk), 0);
    EXPECT_EQ(decode(chunk, {"0:4097"}), static_cast<int>(ErrorCode::kInvalidByteRange));
    EXPECT_EQ(decode(chunk, {"4:"}, 2), 0);

    std::filesystem::remove(dir_ / "store" / "arr" / "c" / "0");
    EXPECT_EQ(decode(chunk, {}), static_cast<int>(ErrorCode::kStorageError));
}

TEST_F(CommandRoundTripTest, InfoDescribesBloscChunk) {
    ChunkSpec chunk;
    chunk.dtype = "uint32";
    chunk.bloscBlocksize = 512;
    ASSERT_EQ(encode(chunk), 0);

    std::ostringstream json;
    ASSERT_EQ(info(json, true), 0);
    EXPECT_NE(json.str().find("\"key\": \"arr/c/0\""), std::string::npos);
    EXPECT_NE(json.str().find("\"nbytes\": 4096"), std::string::npos);
    EXPECT_NE(json.str().find("\"typesize\": 4"), std::string::npos);
    EXPECT_NE(json.str().find("\"blocks\": 8"), std::string::npos);
    EXPECT_NE(json.str().find("\"valid\": true"), std::string::npos);

    std::ostringstream text;
    ASSERT_EQ(info(text, false, true), 0);
    EXPECT_NE(text.str().find("--- Block Starts ---"), std::string::npos);
    EXPECT_NE(text.str().find("[7]"), std::string::npos);
}

TEST_F(CommandRoundTripTest, InfoFlagsNonBloscValues) {
    ChunkSpec chunk;
    chunk.codec = "zstd";
    ASSERT_EQ(encode(chunk), 0);

    std::ostringstream text;
    ASSERT_EQ(info(text, false), 0);
    EXPECT_NE(text.str().find("Encoded size:"), std::string::npos);
    EXPECT_EQ(text.str().find("Valid:          yes"), std::string::npos);

    std::ostringstream missing;
    std::filesystem::remove(dir_ / "store" / "arr" / "c" / "0");
    EXPECT_EQ(info(missing, true), static_cast<int>(ErrorCode::kStorageError));
}

}  // namespace
}  // namespace zcodec::commands
