// vidstream/src/json/JsonParser.cpp
#include "vidstream/json/JsonParser.h"
#include <cctype>
#include <charconv> // For std::from_chars
#include <stdexcept>

namespace Vidstream {
namespace Json {

void JsonParser::skip_whitespace(std::string_view& data) {
    size_t i = 0;
    while (i < data.length() &&
           (data[i] == ' ' || data[i] == '\t' || data[i] == '\n' || data[i] == '\r')) {
        i++;
    }
    data.remove_prefix(i);
}

unsigned JsonParser::parse_hex4(std::string_view data, size_t pos) {
    if (pos + 4 > data.length()) {
        throw std::runtime_error("Incomplete \\u escape sequence in string.");
    }
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(data.data() + pos, data.data() + pos + 4, value, 16);
    if (ec != std::errc() || ptr != data.data() + pos + 4) {
        throw std::runtime_error("Invalid \\u escape sequence: " + std::string(data.substr(pos, 4)));
    }
    return value;
}

void JsonParser::append_utf8(std::string& out, unsigned cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::string JsonParser::parse_string(std::string_view& data) {
    if (data.empty() || data[0] != '"') {
        throw std::runtime_error("Expected '\"' for string parsing.");
    }
    data.remove_prefix(1); // Consume leading '"'

    std::string s;
    size_t i = 0;
    while (i < data.length()) {
        char c = data[i];
        if (c == '"') {
            data.remove_prefix(i + 1); // Consume string content and closing '"'
            return s;
        } else if (c == '\\') {
            if (i + 1 >= data.length()) {
                throw std::runtime_error("Incomplete escape sequence in string.");
            }
            char escaped_char = data[i + 1];
            i += 2; // Consume '\' and the escaped character
            switch (escaped_char) {
                case '"':  s += '"'; break;
                case '\\': s += '\\'; break;
                case '/':  s += '/'; break;
                case 'b':  s += '\b'; break;
                case 'f':  s += '\f'; break;
                case 'n':  s += '\n'; break;
                case 'r':  s += '\r'; break;
                case 't':  s += '\t'; break;
                case 'u': {
                    unsigned cp = parse_hex4(data, i);
                    i += 4;
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        // High surrogate, must be followed by \uDC00-\uDFFF
                        if (i + 1 >= data.length() || data[i] != '\\' || data[i + 1] != 'u') {
                            throw std::runtime_error("Unpaired surrogate in \\u escape.");
                        }
                        unsigned low = parse_hex4(data, i + 2);
                        if (low < 0xDC00 || low > 0xDFFF) {
                            throw std::runtime_error("Unpaired surrogate in \\u escape.");
                        }
                        i += 6;
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                        throw std::runtime_error("Unpaired surrogate in \\u escape.");
                    }
                    append_utf8(s, cp);
                    break;
                }
                default:
                    throw std::runtime_error("Invalid escape sequence in string: \\" + std::string(1, escaped_char));
            }
        } else if (static_cast<unsigned char>(c) < 0x20) {
            throw std::runtime_error("Unescaped control character in string.");
        } else {
            s += c;
            i++;
        }
    }
    throw std::runtime_error("Unterminated string.");
}

JsonValue JsonParser::parse_number(std::string_view& data) {
    // -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
    size_t i = 0;
    auto digits = [&]() {
        size_t begin = i;
        while (i < data.length() && std::isdigit(static_cast<unsigned char>(data[i]))) {
            i++;
        }
        return i - begin;
    };

    if (i < data.length() && data[i] == '-') i++;
    size_t int_start = i;
    size_t int_digits = digits();
    if (int_digits == 0 || (int_digits > 1 && data[int_start] == '0')) {
        throw std::runtime_error("Invalid number format: " + std::string(data.substr(0, i + 1)));
    }
    if (i < data.length() && data[i] == '.') {
        i++;
        if (digits() == 0) {
            throw std::runtime_error("Invalid number format: " + std::string(data.substr(0, i)));
        }
    }
    if (i < data.length() && (data[i] == 'e' || data[i] == 'E')) {
        i++;
        if (i < data.length() && (data[i] == '+' || data[i] == '-')) i++;
        if (digits() == 0) {
            throw std::runtime_error("Invalid number format: " + std::string(data.substr(0, i)));
        }
    }

    std::string_view num_str = data.substr(0, i);
    data.remove_prefix(i);

    double value = 0;
    auto [ptr, ec] = std::from_chars(num_str.data(), num_str.data() + num_str.length(), value);
    if (ec == std::errc::result_out_of_range) {
        throw std::runtime_error("Number out of range: " + std::string(num_str));
    } else if (ec != std::errc() || ptr != num_str.data() + num_str.length()) {
        throw std::runtime_error("Failed to parse number: " + std::string(num_str));
    }
    return JsonValue(value);
}

JsonValue JsonParser::parse_array(std::string_view& data, int depth) {
    data.remove_prefix(1); // Consume '['
    skip_whitespace(data);

    JsonValue array_val = JsonValue::array();
    if (!data.empty() && data[0] == ']') {
        data.remove_prefix(1);
        return array_val;
    }

    while (true) {
        array_val.push_back(parse_value(data, depth + 1));
        skip_whitespace(data);

        if (data.empty()) {
            throw std::runtime_error("Unterminated array.");
        }
        if (data[0] == ']') {
            data.remove_prefix(1);
            break;
        }
        if (data[0] != ',') {
            throw std::runtime_error("Expected ',' or ']' after array element.");
        }
        data.remove_prefix(1);
    }
    return array_val;
}

JsonValue JsonParser::parse_object(std::string_view& data, int depth) {
    data.remove_prefix(1); // Consume '{'
    skip_whitespace(data);

    JsonValue object_val = JsonValue::object();
    if (!data.empty() && data[0] == '}') {
        data.remove_prefix(1);
        return object_val;
    }

    while (true) {
        skip_whitespace(data);
        std::string key = parse_string(data); // Key must be a string
        skip_whitespace(data);

        if (data.empty() || data[0] != ':') {
            throw std::runtime_error("Expected ':' after object key.");
        }
        data.remove_prefix(1);

        object_val[key] = parse_value(data, depth + 1); // Last duplicate key wins
        skip_whitespace(data);

        if (data.empty()) {
            throw std::runtime_error("Unterminated object.");
        }
        if (data[0] == '}') {
            data.remove_prefix(1);
            break;
        }
        if (data[0] != ',') {
            throw std::runtime_error("Expected ',' or '}' after object member.");
        }
        data.remove_prefix(1);
    }
    return object_val;
}

bool JsonParser::parse_keyword(std::string_view& data, std::string_view keyword) {
    if (data.substr(0, keyword.length()) == keyword) {
        data.remove_prefix(keyword.length());
        return true;
    }
    return false;
}

JsonValue JsonParser::parse_value(std::string_view& data, int depth) {
    if (depth > MAX_DEPTH) {
        throw std::runtime_error("JSON nesting too deep.");
    }
    skip_whitespace(data);

    if (data.empty()) {
        throw std::runtime_error("Unexpected end of JSON input.");
    }

    char first_char = data[0];
    if (first_char == '"') {
        return JsonValue(parse_string(data));
    } else if (first_char == '{') {
        return parse_object(data, depth);
    } else if (first_char == '[') {
        return parse_array(data, depth);
    } else if (first_char == '-' || std::isdigit(static_cast<unsigned char>(first_char))) {
        return parse_number(data);
    } else if (parse_keyword(data, "true")) {
        return JsonValue(true);
    } else if (parse_keyword(data, "false")) {
        return JsonValue(false);
    } else if (parse_keyword(data, "null")) {
        return JsonValue();
    }
    throw std::runtime_error("Unexpected character: " + std::string(1, first_char));
}

JsonValue JsonParser::parse(std::string_view json_string) {
    std::string_view data = json_string; // Work with a mutable copy of the view
    JsonValue result = parse_value(data, 0);
    skip_whitespace(data);
    if (!data.empty()) {
        throw std::runtime_error("Extra data after JSON document: " + std::string(data.substr(0, 32)));
    }
    return result;
}

} // namespace Json
} // namespace Vidstream
