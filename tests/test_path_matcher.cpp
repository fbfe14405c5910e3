// vidstream/tests/test_path_matcher.cpp
#include <gtest/gtest.h>
#include "vidstream/server/PathMatcher.h"

using Vidstream::Server::PathMatcher;

namespace {

TEST(PathMatcherTest, LiteralMatch) {
    auto params = PathMatcher::match("/api", "/api");
    ASSERT_TRUE(params.has_value());
    EXPECT_TRUE(params->empty());
}

TEST(PathMatcherTest, RootMatchesOnlyRoot) {
    EXPECT_TRUE(PathMatcher::match("/", "/").has_value());
    EXPECT_FALSE(PathMatcher::match("/", "/api").has_value());
}

TEST(PathMatcherTest, CapturesParameter) {
    auto params = PathMatcher::match("/api/videos/:id", "/api/videos/42");
    ASSERT_TRUE(params.has_value());
    EXPECT_EQ(params->at("id"), "42");
}

TEST(PathMatcherTest, CapturesSeveralParameters) {
    auto params = PathMatcher::match("/a/:x/b/:y", "/a/1/b/two");
    ASSERT_TRUE(params.has_value());
    EXPECT_EQ(params->at("x"), "1");
    EXPECT_EQ(params->at("y"), "two");
}

TEST(PathMatcherTest, SegmentCountMustAgree) {
    EXPECT_FALSE(PathMatcher::match("/api/videos/:id", "/api/videos").has_value());
    EXPECT_FALSE(PathMatcher::match("/api/videos/:id", "/api/videos/1/extra").has_value());
}

TEST(PathMatcherTest, LiteralSegmentsMustAgree) {
    EXPECT_FALSE(PathMatcher::match("/api/videos/:id", "/api/thumbnails/1").has_value());
}

TEST(PathMatcherTest, EmptySegmentsAreIgnored) {
    auto params = PathMatcher::match("/api/videos/:id", "//api/videos//7/");
    ASSERT_TRUE(params.has_value());
    EXPECT_EQ(params->at("id"), "7");
}

TEST(PathMatcherTest, SplitDropsEmptySegments) {
    auto segments = PathMatcher::split_path_to_segments("/api//videos/:id/");
    ASSERT_EQ(segments.size(), 3u);
    EXPECT_EQ(segments[0], "api");
    EXPECT_EQ(segments[1], "videos");
    EXPECT_EQ(segments[2], ":id");
    EXPECT_TRUE(PathMatcher::split_path_to_segments("/").empty());
}

} // namespace
