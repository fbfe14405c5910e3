// vidstream/tests/test_json.cpp
#include <gtest/gtest.h>
#include "vidstream/json/JsonParser.h"
#include "vidstream/json/JsonValue.h"

using Vidstream::Json::JsonParser;
using Vidstream::Json::JsonType;
using Vidstream::Json::JsonValue;

namespace {

// ── Building and serializing ───────────────────────────────────

TEST(JsonValueTest, ObjectSerializesWithSortedKeys) {
    JsonValue obj = JsonValue::object();
    obj["message"] = "Welcome";
    obj["count"] = 3;
    obj["ok"] = true;
    obj["nothing"] = nullptr;
    EXPECT_EQ(obj.to_string(), R"({"count":3,"message":"Welcome","nothing":null,"ok":true})");
}

TEST(JsonValueTest, EmptyContainers) {
    EXPECT_EQ(JsonValue::array().to_string(), "[]");
    EXPECT_EQ(JsonValue::object().to_string(), "{}");
    EXPECT_EQ(JsonValue::array().to_string(2), "[]");
}

TEST(JsonValueTest, StringsAreEscaped) {
    JsonValue s("quote\" backslash\\ newline\n tab\t bell\x07");
    EXPECT_EQ(s.to_string(), R"("quote\" backslash\\ newline\n tab\t bell\u0007")");
}

TEST(JsonValueTest, NumbersKeepIntegersIntegral) {
    EXPECT_EQ(JsonValue(42).to_string(), "42");
    EXPECT_EQ(JsonValue(-7).to_string(), "-7");
    EXPECT_EQ(JsonValue(1.5).to_string(), "1.5");
    EXPECT_EQ(JsonValue(static_cast<size_t>(65536)).to_string(), "65536");
}

TEST(JsonValueTest, NullAutoConvertsOnAccess) {
    JsonValue list;
    list.push_back("a");
    list.push_back("b");
    ASSERT_TRUE(list.is_array());
    EXPECT_EQ(list.size(), 2u);

    JsonValue obj;
    obj["key"] = "value";
    EXPECT_TRUE(obj.is_object());
    EXPECT_TRUE(obj.contains("key"));
    EXPECT_FALSE(obj.contains("other"));
}

TEST(JsonValueTest, PrettyPrint) {
    JsonValue obj = JsonValue::object();
    obj["a"] = 1;
    JsonValue list = JsonValue::array();
    list.push_back(2);
    obj["b"] = list;
    EXPECT_EQ(obj.to_string(2), "{\n  \"a\": 1,\n  \"b\": [\n    2\n  ]\n}");
}

TEST(JsonValueTest, WrongTypeAccessThrows) {
    JsonValue s("text");
    EXPECT_THROW(s.get_number(), std::runtime_error);
    EXPECT_THROW(s.get_array(), std::runtime_error);
    EXPECT_THROW(JsonValue(1.5).get_integer(), std::runtime_error);
    EXPECT_EQ(JsonValue(8080).get_integer(), 8080);
}

TEST(JsonValueTest, CopiesAreDeep) {
    JsonValue original = JsonValue::object();
    original["name"] = "first";
    JsonValue copy = original;
    copy["name"] = "second";
    EXPECT_EQ(original["name"].get_string(), "first");
    EXPECT_EQ(copy["name"].get_string(), "second");
}

TEST(JsonValueTest, AssignFromOwnChild) {
    JsonValue outer = JsonValue::object();
    outer["inner"]["leaf"] = "x";
    outer = outer["inner"];
    EXPECT_EQ(outer["leaf"].get_string(), "x");

    JsonValue moved = JsonValue::object();
    moved["inner"]["leaf"] = "y";
    moved = std::move(moved["inner"]);
    EXPECT_EQ(moved["leaf"].get_string(), "y");
}

// ── Parsing ────────────────────────────────────────────────────

TEST(JsonParserTest, ParsesNestedDocument) {
    JsonValue doc = JsonParser::parse(R"(
        {"port": 8080, "host": "127.0.0.1", "tags": ["a", "b"], "debug": false, "extra": null}
    )");
    ASSERT_TRUE(doc.is_object());
    EXPECT_EQ(doc["port"].get_integer(), 8080);
    EXPECT_EQ(doc["host"].get_string(), "127.0.0.1");
    ASSERT_EQ(doc["tags"].size(), 2u);
    EXPECT_EQ(doc["tags"].get_array()[1].get_string(), "b");
    EXPECT_FALSE(doc["debug"].get_bool());
    EXPECT_TRUE(doc["extra"].is_null());
}

TEST(JsonParserTest, NumberForms) {
    EXPECT_DOUBLE_EQ(JsonParser::parse("-0.25").get_number(), -0.25);
    EXPECT_DOUBLE_EQ(JsonParser::parse("1e3").get_number(), 1000.0);
    EXPECT_DOUBLE_EQ(JsonParser::parse("2.5E-1").get_number(), 0.25);
    EXPECT_EQ(JsonParser::parse("0").get_integer(), 0);
}

TEST(JsonParserTest, UnicodeEscapes) {
    EXPECT_EQ(JsonParser::parse(R"("caf\u00e9")").get_string(), "caf\xc3\xa9");
    EXPECT_EQ(JsonParser::parse(R"("\ud83c\udfac")").get_string(), "\xf0\x9f\x8e\xac");
    EXPECT_EQ(JsonParser::parse(R"("a\/b")").get_string(), "a/b");
}

TEST(JsonParserTest, RoundTripsSerializedOutput) {
    JsonValue obj = JsonValue::object();
    obj["text"] = "line\nbreak \"quoted\"";
    obj["n"] = 12;
    JsonValue back = JsonParser::parse(obj.to_string());
    EXPECT_EQ(back.to_string(), obj.to_string());
}

TEST(JsonParserTest, RejectsInvalidDocuments) {
    const char* bad[] = {
        "", "{", "[1,]", "{\"a\" 1}", "{\"a\":1,}", "01", "1.", "-", "+1", ".5",
        "tru", "\"unterminated", "\"bad \\x escape\"", "\"\\ud800\"", "{} extra",
        "[1 2]", "\"tab\tinside\"", "{1:2}",
    };
    for (const char* text : bad) {
        EXPECT_THROW(JsonParser::parse(text), std::runtime_error) << text;
    }
}

TEST(JsonParserTest, RejectsExcessiveNesting) {
    std::string deep(500, '[');
    deep += std::string(500, ']');
    EXPECT_THROW(JsonParser::parse(deep), std::runtime_error);
}

TEST(JsonParserTest, TypeReportsKind) {
    EXPECT_EQ(JsonParser::parse("[]").type(), JsonType::ARRAY);
    EXPECT_EQ(JsonParser::parse("{}").type(), JsonType::OBJECT);
    EXPECT_EQ(JsonParser::parse("true").type(), JsonType::BOOL);
    EXPECT_EQ(JsonParser::parse("null").type(), JsonType::NULL_VALUE);
}

} // namespace
