// vidstream/include/vidstream/json/JsonParser.h
#ifndef VIDSTREAM_JSON_JSONPARSER_H
#define VIDSTREAM_JSON_JSONPARSER_H

#include "vidstream/json/JsonValue.h"
#include <string>
#include <string_view>

namespace Vidstream {
namespace Json {

class JsonParser {
public:
    // Parses one JSON document. Throws std::runtime_error on parsing errors,
    // including trailing data after the document.
    static JsonValue parse(std::string_view json_string);

private:
    static constexpr int MAX_DEPTH = 128;

    // Helper functions for parsing different JSON types
    static JsonValue parse_value(std::string_view& data, int depth);
    static std::string parse_string(std::string_view& data);
    static JsonValue parse_number(std::string_view& data);
    static JsonValue parse_object(std::string_view& data, int depth);
    static JsonValue parse_array(std::string_view& data, int depth);
    static bool parse_keyword(std::string_view& data, std::string_view keyword);
    static unsigned parse_hex4(std::string_view data, size_t pos);
    static void append_utf8(std::string& out, unsigned code_point);

    // Skip whitespace characters
    static void skip_whitespace(std::string_view& data);
};

} // namespace Json
} // namespace Vidstream

#endif // VIDSTREAM_JSON_JSONPARSER_H
