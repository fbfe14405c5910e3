// vidstream/tests/test_range_resolver.cpp
#include <gtest/gtest.h>
#include "vidstream/media/RangeResolver.h"

using namespace Vidstream::Media;
using Vidstream::Http::HttpStatus;

namespace {

StreamPlan resolve(const char* header, uint64_t size) {
    return resolve_range(parse_range_header(header), size);
}

void expect_partial(const StreamPlan& plan, uint64_t start, uint64_t end, uint64_t total) {
    EXPECT_EQ(plan.status, HttpStatus::PARTIAL_CONTENT);
    ASSERT_TRUE(plan.content_range.has_value());
    EXPECT_EQ(plan.content_range->start, start);
    EXPECT_EQ(plan.content_range->end, end);
    EXPECT_EQ(plan.start, start);
    EXPECT_EQ(plan.end, end);
    EXPECT_EQ(plan.total_size, total);
    EXPECT_EQ(plan.content_length, end - start + 1);
    EXPECT_EQ(plan.content_range_header(),
              "bytes " + std::to_string(start) + "-" + std::to_string(end) + "/" + std::to_string(total));
}

// ── Full file ──────────────────────────────────────────────────

TEST(RangeResolverTest, AbsentServesWholeFile) {
    StreamPlan plan = resolve_range(RangeAbsent{}, 1000);
    EXPECT_EQ(plan.status, HttpStatus::OK);
    EXPECT_FALSE(plan.content_range.has_value());
    EXPECT_EQ(plan.content_length, 1000u);
    EXPECT_EQ(plan.start, 0u);
    EXPECT_EQ(plan.end, 999u);
    EXPECT_TRUE(plan.has_body());
    EXPECT_EQ(plan.content_range_header(), "");
}

TEST(RangeResolverTest, MalformedServesWholeFile) {
    StreamPlan plan = resolve("bytes=abc-def", 1000);
    EXPECT_EQ(plan.status, HttpStatus::OK);
    EXPECT_FALSE(plan.content_range.has_value());
    EXPECT_EQ(plan.content_length, 1000u);
}

TEST(RangeResolverTest, EmptyFileWithoutRangeHasNoBody) {
    StreamPlan plan = resolve_range(RangeAbsent{}, 0);
    EXPECT_EQ(plan.status, HttpStatus::OK);
    EXPECT_EQ(plan.content_length, 0u);
    EXPECT_FALSE(plan.has_body());
}

// ── Partial ────────────────────────────────────────────────────

TEST(RangeResolverTest, OpenEndedFromZero) {
    expect_partial(resolve("bytes=0-", 1000), 0, 999, 1000);
}

TEST(RangeResolverTest, ExplicitWindow) {
    expect_partial(resolve("bytes=500-999", 1000), 500, 999, 1000);
}

TEST(RangeResolverTest, SuffixTakesLastBytes) {
    expect_partial(resolve("bytes=-100", 1000), 900, 999, 1000);
}

TEST(RangeResolverTest, SuffixLongerThanFileTakesWholeFile) {
    expect_partial(resolve("bytes=-5000", 1000), 0, 999, 1000);
}

TEST(RangeResolverTest, EndIsClampedToLastByte) {
    expect_partial(resolve("bytes=900-5000", 1000), 900, 999, 1000);
}

TEST(RangeResolverTest, LastByteOnly) {
    expect_partial(resolve("bytes=999-999", 1000), 999, 999, 1000);
}

// ── Unsatisfiable ──────────────────────────────────────────────

TEST(RangeResolverTest, StartAtSizeIsUnsatisfiable) {
    StreamPlan plan = resolve("bytes=1000-", 1000);
    EXPECT_EQ(plan.status, HttpStatus::RANGE_NOT_SATISFIABLE);
    EXPECT_FALSE(plan.satisfiable());
    EXPECT_FALSE(plan.has_body());
    EXPECT_EQ(plan.content_length, 0u);
    EXPECT_EQ(plan.content_range_header(), "bytes */1000");
}

TEST(RangeResolverTest, StartPastSizeIsUnsatisfiable) {
    StreamPlan plan = resolve("bytes=5000-6000", 1000);
    EXPECT_EQ(plan.status, HttpStatus::RANGE_NOT_SATISFIABLE);
    EXPECT_EQ(plan.content_range_header(), "bytes */1000");
}

TEST(RangeResolverTest, ZeroSuffixIsUnsatisfiable) {
    EXPECT_EQ(resolve("bytes=-0", 1000).status, HttpStatus::RANGE_NOT_SATISFIABLE);
}

TEST(RangeResolverTest, AnyRangeOnEmptyFileIsUnsatisfiable) {
    EXPECT_EQ(resolve("bytes=0-", 0).status, HttpStatus::RANGE_NOT_SATISFIABLE);
    EXPECT_EQ(resolve("bytes=-10", 0).status, HttpStatus::RANGE_NOT_SATISFIABLE);
    EXPECT_EQ(resolve("bytes=0-", 0).content_range_header(), "bytes */0");
}

// ── Length always matches the window ───────────────────────────

TEST(RangeResolverTest, ContentLengthMatchesWindowForAllStarts) {
    const uint64_t size = 64;
    for (uint64_t start = 0; start < size; ++start) {
        for (uint64_t end = start; end < size + 8; end += 7) {
            StreamPlan plan = resolve_range(RangeSpec{start, end}, size);
            ASSERT_EQ(plan.status, HttpStatus::PARTIAL_CONTENT);
            EXPECT_LE(plan.end, size - 1);
            EXPECT_EQ(plan.content_length, plan.end - plan.start + 1)
                << "start " << start << " end " << end;
        }
    }
}

} // namespace
