// vidstream/tests/test_range_parser.cpp
#include <gtest/gtest.h>
#include "vidstream/media/RangeParser.h"

using namespace Vidstream::Media;

namespace {

// Returns a copy; the request passed in is usually a temporary
RangeSpec expect_spec(const RangeRequest& request) {
    const RangeSpec* spec = std::get_if<RangeSpec>(&request);
    EXPECT_NE(spec, nullptr);
    return spec ? *spec : RangeSpec{};
}

bool is_malformed(const RangeRequest& request) {
    return std::holds_alternative<RangeMalformed>(request);
}

// ── Absent ─────────────────────────────────────────────────────

TEST(RangeParserTest, NoHeaderIsAbsent) {
    EXPECT_TRUE(std::holds_alternative<RangeAbsent>(parse_range_header(std::nullopt)));
}

TEST(RangeParserTest, BlankHeaderIsAbsent) {
    EXPECT_TRUE(std::holds_alternative<RangeAbsent>(parse_range_header("")));
    EXPECT_TRUE(std::holds_alternative<RangeAbsent>(parse_range_header("   ")));
}

// ── Accepted forms ─────────────────────────────────────────────

TEST(RangeParserTest, StartAndEnd) {
    RangeSpec spec = expect_spec(parse_range_header("bytes=500-999"));
    ASSERT_TRUE(spec.start.has_value());
    ASSERT_TRUE(spec.end.has_value());
    EXPECT_EQ(*spec.start, 500u);
    EXPECT_EQ(*spec.end, 999u);
    EXPECT_FALSE(spec.is_suffix());
}

TEST(RangeParserTest, OpenEnded) {
    RangeSpec spec = expect_spec(parse_range_header("bytes=0-"));
    ASSERT_TRUE(spec.start.has_value());
    EXPECT_EQ(*spec.start, 0u);
    EXPECT_FALSE(spec.end.has_value());
}

TEST(RangeParserTest, SuffixMeansLastBytes) {
    RangeSpec spec = expect_spec(parse_range_header("bytes=-100"));
    EXPECT_TRUE(spec.is_suffix());
    ASSERT_TRUE(spec.end.has_value());
    EXPECT_EQ(*spec.end, 100u);
}

TEST(RangeParserTest, UnitIsCaseInsensitiveAndWhitespaceTolerated) {
    RangeSpec spec = expect_spec(parse_range_header("  BYTES = 10 - 20 "));
    EXPECT_EQ(spec.start.value_or(0), 10u);
    EXPECT_EQ(spec.end.value_or(0), 20u);
}

TEST(RangeParserTest, SingleByteRange) {
    RangeSpec spec = expect_spec(parse_range_header("bytes=7-7"));
    EXPECT_EQ(spec.start.value_or(0), 7u);
    EXPECT_EQ(spec.end.value_or(0), 7u);
}

TEST(RangeParserTest, EndPastAnyFileIsStillParsed) {
    // Clamping is the resolver's job
    RangeSpec spec = expect_spec(parse_range_header("bytes=900-5000"));
    EXPECT_EQ(spec.end.value_or(0), 5000u);
}

// ── Malformed ──────────────────────────────────────────────────

TEST(RangeParserTest, NonNumericIsMalformed) {
    EXPECT_TRUE(is_malformed(parse_range_header("bytes=abc-def")));
    EXPECT_TRUE(is_malformed(parse_range_header("bytes=1x-2")));
}

TEST(RangeParserTest, WrongUnitIsMalformed) {
    EXPECT_TRUE(is_malformed(parse_range_header("items=0-10")));
    EXPECT_TRUE(is_malformed(parse_range_header("byte=0-10")));
}

TEST(RangeParserTest, MissingSeparatorsAreMalformed) {
    EXPECT_TRUE(is_malformed(parse_range_header("bytes 0-10")));
    EXPECT_TRUE(is_malformed(parse_range_header("bytes=10")));
    EXPECT_TRUE(is_malformed(parse_range_header("bytes=")));
}

TEST(RangeParserTest, BothBoundsOmittedIsMalformed) {
    EXPECT_TRUE(is_malformed(parse_range_header("bytes=-")));
}

TEST(RangeParserTest, RangeListIsMalformed) {
    EXPECT_TRUE(is_malformed(parse_range_header("bytes=0-100,200-300")));
    EXPECT_TRUE(is_malformed(parse_range_header("bytes=-5,10-")));
}

TEST(RangeParserTest, EndBeforeStartIsMalformed) {
    EXPECT_TRUE(is_malformed(parse_range_header("bytes=500-100")));
}

TEST(RangeParserTest, SignsAndOverflowAreMalformed) {
    EXPECT_TRUE(is_malformed(parse_range_header("bytes=+5-10")));
    EXPECT_TRUE(is_malformed(parse_range_header("bytes=--5")));
    EXPECT_TRUE(is_malformed(parse_range_header("bytes=0-99999999999999999999999")));
}

TEST(RangeParserTest, TrailingGarbageIsMalformed) {
    EXPECT_TRUE(is_malformed(parse_range_header("bytes=0-10abc")));
    EXPECT_TRUE(is_malformed(parse_range_header("bytes=-10 x")));
}

} // namespace
