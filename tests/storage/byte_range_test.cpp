// =============================================================================
// zcodec - Byte Range Tests
// =============================================================================
// Unit tests for byte range resolution, validation and slicing.
// =============================================================================

#include "zcodec/storage/byte_range.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <vector>

namespace zcodec::storage {
namespace {

// =============================================================================
// Resolution Tests
// =============================================================================

TEST(ByteRangeTest, FromStartWithLength) {
    const auto range = ByteRange::fromStart(4, 6);
    EXPECT_EQ(range.start(16), 4u);
    EXPECT_EQ(range.end(16), 10u);
    EXPECT_EQ(range.length(16), 6u);
    EXPECT_EQ(range.toString(), "4..10");
}

TEST(ByteRangeTest, FromStartToEnd) {
    const auto range = ByteRange::fromStart(4);
    EXPECT_EQ(range.start(16), 4u);
    EXPECT_EQ(range.end(16), 16u);
    EXPECT_EQ(range.toString(), "4..");
}

TEST(ByteRangeTest, Suffix) {
    const auto range = ByteRange::suffix(4);
    EXPECT_EQ(range.start(16), 12u);
    EXPECT_EQ(range.end(16), 16u);
    EXPECT_EQ(range.toString(), "-4..");
}

TEST(ByteRangeTest, FullRange) {
    const auto range = ByteRange::full();
    EXPECT_TRUE(range.isFull());
    EXPECT_EQ(range.start(0), 0u);
    EXPECT_EQ(range.end(0), 0u);
    EXPECT_EQ(range.length(32), 32u);
}

TEST(ByteRangeTest, Interval) {
    EXPECT_EQ(ByteRange::interval(2, 8), ByteRange::fromStart(2, 6));
    EXPECT_THROW((void)ByteRange::interval(8, 2), InvalidByteRangeError);
}

TEST(ByteRangeTest, EmptyRangeAtEnd) {
    const auto range = ByteRange::fromStart(16, 0);
    EXPECT_TRUE(range.validate(16).has_value());
    EXPECT_EQ(range.length(16), 0u);
}

// =============================================================================
// Validation Tests
// =============================================================================

TEST(ByteRangeTest, RejectsOverlongSuffix) {
    const auto result = ByteRange::suffix(17).validate(16);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kInvalidByteRange);
}

TEST(ByteRangeTest, RejectsRangesPastTheEnd) {
    EXPECT_FALSE(ByteRange::fromStart(17).validate(16).has_value());
    EXPECT_FALSE(ByteRange::fromStart(10, 7).validate(16).has_value());
    EXPECT_THROW((void)ByteRange::fromStart(10, 7).end(16), InvalidByteRangeError);
}

TEST(ByteRangeTest, ValidateByteRangesNamesOffendingRequest) {
    const std::vector<ByteRange> ranges{ByteRange::fromStart(0, 4), ByteRange::fromStart(8, 4),
                                        ByteRange::suffix(32)};
    try {
        validateByteRanges(ranges, 16);
        FAIL() << "expected InvalidByteRangeError";
    } catch (const InvalidByteRangeError& ex) {
        ASSERT_TRUE(ex.hasContext());
        EXPECT_EQ(ex.context()->requestIndex, 2u);
    }
}

// =============================================================================
// Extraction Tests
// =============================================================================

TEST(ByteRangeTest, ExtractPreservesRequestOrder) {
    Bytes value(16);
    for (std::size_t i = 0; i < value.size(); ++i) {
        value[i] = static_cast<std::uint8_t>(i);
    }
    const std::vector<ByteRange> ranges{ByteRange::suffix(2), ByteRange::fromStart(0, 3),
                                        ByteRange::fromStart(5, 0)};

    const auto parts = extractByteRanges(value, ranges);
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], (Bytes{14, 15}));
    EXPECT_EQ(parts[1], (Bytes{0, 1, 2}));
    EXPECT_TRUE(parts[2].empty());
}

TEST(ByteRangeTest, ExtractRejectsBeforeServing) {
    const Bytes value(8, 0xAB);
    const std::vector<ByteRange> ranges{ByteRange::fromStart(0, 4), ByteRange::fromStart(6, 4)};
    EXPECT_THROW((void)extractByteRanges(value, ranges), InvalidByteRangeError);
}

// =============================================================================
// Properties
// =============================================================================

RC_GTEST_PROP(ByteRangeProperty, ResolvedRangesStayInBounds, ()) {
    const auto total = *rc::gen::inRange<std::uint64_t>(0, 4096);
    const auto offset = *rc::gen::inRange<std::uint64_t>(0, total + 1);
    const auto length = *rc::gen::inRange<std::uint64_t>(0, total - offset + 1);

    for (const auto& range : {ByteRange::fromStart(offset, length), ByteRange::fromStart(offset),
                              ByteRange::suffix(length)}) {
        RC_ASSERT(range.validate(total).has_value());
        RC_ASSERT(range.start(total) <= range.end(total));
        RC_ASSERT(range.end(total) <= total);
    }
}

}  // namespace
}  // namespace zcodec::storage
