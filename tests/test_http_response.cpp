// vidstream/tests/test_http_response.cpp
#include <gtest/gtest.h>
#include "vidstream/http/HttpResponse.h"

using namespace Vidstream::Http;
using Vidstream::Json::JsonValue;

namespace {

TEST(HttpResponseTest, DefaultsToEmptyOk) {
    HttpResponse res;
    EXPECT_EQ(res.get_status(), HttpStatus::OK);
    EXPECT_EQ(res.get_header("Content-Length").value_or(""), "0");
    EXPECT_EQ(res.get_header("Connection").value_or(""), "keep-alive");
    EXPECT_EQ(res.get_header("Server").value_or(""), "Vidstream/1.0.0");
    EXPECT_FALSE(res.is_stream());
}

TEST(HttpResponseTest, JsonSetsTypeAndLength) {
    HttpResponse res;
    JsonValue body = JsonValue::object();
    body["message"] = "hi";
    res.json(body);

    EXPECT_EQ(res.get_body(), R"({"message":"hi"})");
    EXPECT_EQ(res.get_header("Content-Type").value_or(""), "application/json");
    EXPECT_EQ(res.get_header("Content-Length").value_or(""), std::to_string(res.get_body().size()));
}

TEST(HttpResponseTest, NotFoundDropsRangeHeaders) {
    HttpResponse res;
    res.status(HttpStatus::PARTIAL_CONTENT)
       .header("Content-Range", "bytes 0-1/2")
       .header("Accept-Ranges", "bytes");
    res.not_found();

    EXPECT_EQ(res.get_status(), HttpStatus::NOT_FOUND);
    EXPECT_EQ(res.get_body(), "404 Not Found");
    EXPECT_EQ(res.get_header("Content-Type").value_or(""), "text/plain");
    EXPECT_EQ(res.get_header("Content-Length").value_or(""), "13");
    EXPECT_EQ(res.get_header("Access-Control-Allow-Origin").value_or(""), "*");
    EXPECT_FALSE(res.get_header("Content-Range").has_value());
    EXPECT_FALSE(res.get_header("Accept-Ranges").has_value());
}

TEST(HttpResponseTest, HeadBlockFormat) {
    HttpResponse res;
    res.status(HttpStatus::RANGE_NOT_SATISFIABLE).header("Content-Range", "bytes */1000");
    std::string head = res.build_headers_string();

    EXPECT_EQ(head.rfind("HTTP/1.1 416 Range Not Satisfiable\r\n", 0), 0u);
    EXPECT_NE(head.find("\r\nDate: "), std::string::npos);
    EXPECT_NE(head.find("\r\nContent-Range: bytes */1000\r\n"), std::string::npos);
    EXPECT_EQ(head.substr(head.size() - 4), "\r\n\r\n");
}

TEST(HttpResponseTest, ResetRestoresDefaults) {
    HttpResponse res;
    res.status(HttpStatus::INTERNAL_SERVER_ERROR).text("boom").header("X-Test", "1");
    res.reset();

    EXPECT_EQ(res.get_status(), HttpStatus::OK);
    EXPECT_TRUE(res.get_body().empty());
    EXPECT_FALSE(res.get_header("X-Test").has_value());
    EXPECT_EQ(res.get_header("Content-Length").value_or(""), "0");
}

TEST(HttpResponseTest, TakeBodyMovesContent) {
    HttpResponse res;
    res.text("payload");
    EXPECT_EQ(res.take_body(), "payload");
    EXPECT_TRUE(res.take_stream() == nullptr);
}

} // namespace
