// vidstream/tests/test_http_parser.cpp
#include <gtest/gtest.h>
#include "vidstream/http/HttpParser.h"

using namespace Vidstream::Http;

namespace {

TEST(HttpParserTest, ParsesSimpleGet) {
    HttpParser parser;
    HttpRequest request;
    std::string raw = "GET /api/videos/1 HTTP/1.1\r\nHost: localhost\r\nRange: bytes=0-\r\n\r\n";
    size_t consumed = 0;

    ASSERT_TRUE(parser.parse_request(raw, consumed, request));
    EXPECT_EQ(consumed, raw.size());
    EXPECT_EQ(parser.get_state(), ParsingState::COMPLETE);
    EXPECT_EQ(request.method(), HttpMethod::GET);
    EXPECT_EQ(request.path(), "/api/videos/1");
    EXPECT_EQ(request.version(), "HTTP/1.1");
    EXPECT_EQ(request.header("range").value_or(""), "bytes=0-");
}

TEST(HttpParserTest, HeaderLookupIsCaseInsensitive) {
    HttpParser parser;
    HttpRequest request;
    std::string raw = "GET / HTTP/1.1\r\nRANGE:   bytes=5-10  \r\n\r\n";
    size_t consumed = 0;

    ASSERT_TRUE(parser.parse_request(raw, consumed, request));
    EXPECT_EQ(request.header("Range").value_or(""), "bytes=5-10");
    EXPECT_EQ(request.header("range").value_or(""), "bytes=5-10");
    EXPECT_FALSE(request.header("Accept").has_value());
}

TEST(HttpParserTest, SplitsQueryString) {
    HttpParser parser;
    HttpRequest request;
    std::string raw = "GET /api?page=2&verbose HTTP/1.1\r\n\r\n";
    size_t consumed = 0;

    ASSERT_TRUE(parser.parse_request(raw, consumed, request));
    EXPECT_EQ(request.path(), "/api");
    EXPECT_EQ(request.query("page").value_or(""), "2");
    ASSERT_TRUE(request.query("verbose").has_value());
    EXPECT_EQ(*request.query("verbose"), "");
}

TEST(HttpParserTest, IncrementalInputKeepsState) {
    HttpParser parser;
    HttpRequest request;
    size_t consumed = 0;

    std::string part1 = "GET /api HTTP/1.1\r\nHost: x";
    EXPECT_FALSE(parser.parse_request(part1, consumed, request));
    EXPECT_EQ(parser.get_state(), ParsingState::HEADERS);
    // The request line was consumed; the partial header line was not
    EXPECT_EQ(consumed, std::string("GET /api HTTP/1.1\r\n").size());

    std::string rest = "Host: x\r\n\r\n";
    ASSERT_TRUE(parser.parse_request(rest, consumed, request));
    EXPECT_EQ(consumed, rest.size());
    EXPECT_EQ(request.path(), "/api");
    EXPECT_EQ(request.header("host").value_or(""), "x");
}

TEST(HttpParserTest, ReadsBodyByContentLength) {
    HttpParser parser;
    HttpRequest request;
    std::string raw = "POST /upload HTTP/1.1\r\nContent-Length: 5\r\n\r\nhelloGET";
    size_t consumed = 0;

    ASSERT_TRUE(parser.parse_request(raw, consumed, request));
    EXPECT_EQ(request.body(), "hello");
    EXPECT_EQ(consumed, raw.size() - 3); // Pipelined bytes are left alone
}

TEST(HttpParserTest, ResetAllowsNextRequest) {
    HttpParser parser;
    HttpRequest first;
    size_t consumed = 0;
    ASSERT_TRUE(parser.parse_request("GET /a HTTP/1.1\r\n\r\n", consumed, first));

    parser.reset();
    HttpRequest second;
    ASSERT_TRUE(parser.parse_request("GET /b HTTP/1.1\r\n\r\n", consumed, second));
    EXPECT_EQ(second.path(), "/b");
}

TEST(HttpParserTest, RejectsBadRequestLines) {
    const char* bad[] = {
        "GET /\r\n\r\n",
        "GET / HTTP/2.0\r\n\r\n",
        "BREW /pot HTTP/1.1\r\n\r\n",
        "GET relative HTTP/1.1\r\n\r\n",
    };
    for (const char* raw : bad) {
        HttpParser parser;
        HttpRequest request;
        size_t consumed = 0;
        EXPECT_FALSE(parser.parse_request(raw, consumed, request)) << raw;
        EXPECT_EQ(parser.get_state(), ParsingState::ERROR) << raw;
        EXPECT_FALSE(parser.get_error_message().empty());
    }
}

TEST(HttpParserTest, RejectsBadHeaders) {
    const char* bad[] = {
        "GET / HTTP/1.1\r\nNoColonHere\r\n\r\n",
        "GET / HTTP/1.1\r\nContent-Length: ten\r\n\r\n",
        "POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n",
    };
    for (const char* raw : bad) {
        HttpParser parser;
        HttpRequest request;
        size_t consumed = 0;
        EXPECT_FALSE(parser.parse_request(raw, consumed, request)) << raw;
        EXPECT_EQ(parser.get_state(), ParsingState::ERROR) << raw;
    }
}

// ── Keep-alive ─────────────────────────────────────────────────

HttpRequest parse(const std::string& raw) {
    HttpParser parser;
    HttpRequest request;
    size_t consumed = 0;
    EXPECT_TRUE(parser.parse_request(raw, consumed, request));
    return request;
}

TEST(HttpRequestTest, KeepAliveDefaults) {
    EXPECT_TRUE(parse("GET / HTTP/1.1\r\n\r\n").keep_alive());
    EXPECT_FALSE(parse("GET / HTTP/1.0\r\n\r\n").keep_alive());
}

TEST(HttpRequestTest, ConnectionHeaderOverridesDefault) {
    EXPECT_FALSE(parse("GET / HTTP/1.1\r\nConnection: Close\r\n\r\n").keep_alive());
    EXPECT_TRUE(parse("GET / HTTP/1.0\r\nConnection: keep-alive\r\n\r\n").keep_alive());
}

} // namespace
