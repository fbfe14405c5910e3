// vidstream/src/json/JsonValue.cpp
#include "vidstream/json/JsonValue.h"
#include <cmath>
#include <cstdio>
#include <limits>
#include <sstream> // Required for std::ostringstream

namespace Vidstream {
namespace Json {

JsonValue::JsonValue(const JsonValue& other) : value_(nullptr) {
    copy_from(other);
}

JsonValue::JsonValue(JsonValue&& other) noexcept : value_(std::move(other.value_)) {
    other.value_ = nullptr; // Moved-from values read as null
}

JsonValue::~JsonValue() = default;

JsonValue& JsonValue::operator=(const JsonValue& other) {
    if (this != &other) {
        JsonValue copy(other); // Other may be a child of this value
        *this = std::move(copy);
    }
    return *this;
}

JsonValue& JsonValue::operator=(JsonValue&& other) noexcept {
    if (this != &other) {
        auto taken = std::move(other.value_); // Other may be a child of this value
        other.value_ = nullptr;
        value_ = std::move(taken);
    }
    return *this;
}

void JsonValue::copy_from(const JsonValue& other) {
    switch (other.type()) {
        case JsonType::NULL_VALUE:
            value_ = nullptr;
            break;
        case JsonType::BOOL:
            value_ = std::get<bool>(other.value_);
            break;
        case JsonType::NUMBER:
            value_ = std::get<double>(other.value_);
            break;
        case JsonType::STRING:
            value_ = std::get<std::string>(other.value_);
            break;
        case JsonType::ARRAY:
            value_ = std::make_unique<Array>(other.get_array());
            break;
        case JsonType::OBJECT:
            value_ = std::make_unique<Object>(other.get_object());
            break;
    }
}

bool JsonValue::get_bool() const {
    if (!is_bool()) throw std::runtime_error("JsonValue is not a boolean.");
    return std::get<bool>(value_);
}

double JsonValue::get_number() const {
    if (!is_number()) throw std::runtime_error("JsonValue is not a number.");
    return std::get<double>(value_);
}

long long JsonValue::get_integer() const {
    double number = get_number();
    if (!std::isfinite(number) || std::trunc(number) != number ||
        number < static_cast<double>(std::numeric_limits<long long>::min()) ||
        number >= static_cast<double>(std::numeric_limits<long long>::max())) {
        throw std::runtime_error("JsonValue is not an integer.");
    }
    return static_cast<long long>(number);
}

const std::string& JsonValue::get_string() const {
    if (!is_string()) throw std::runtime_error("JsonValue is not a string.");
    return std::get<std::string>(value_);
}

std::string& JsonValue::get_string() {
    if (!is_string()) throw std::runtime_error("JsonValue is not a string.");
    return std::get<std::string>(value_);
}

const JsonValue::Array& JsonValue::get_array() const {
    if (!is_array()) throw std::runtime_error("JsonValue is not an array.");
    return *std::get<std::unique_ptr<Array>>(value_);
}

JsonValue::Array& JsonValue::get_array() {
    if (!is_array()) throw std::runtime_error("JsonValue is not an array.");
    return *std::get<std::unique_ptr<Array>>(value_);
}

const JsonValue::Object& JsonValue::get_object() const {
    if (!is_object()) throw std::runtime_error("JsonValue is not an object.");
    return *std::get<std::unique_ptr<Object>>(value_);
}

JsonValue::Object& JsonValue::get_object() {
    if (!is_object()) throw std::runtime_error("JsonValue is not an object.");
    return *std::get<std::unique_ptr<Object>>(value_);
}

JsonValue& JsonValue::operator[](size_t index) {
    if (is_null()) {
        value_ = std::make_unique<Array>();
    }
    Array& arr = get_array();
    if (index >= arr.size()) {
        arr.resize(index + 1);
    }
    return arr[index];
}

const JsonValue& JsonValue::operator[](size_t index) const {
    const Array& arr = get_array();
    if (index >= arr.size()) {
        throw std::out_of_range("Array index out of bounds.");
    }
    return arr[index];
}

JsonValue& JsonValue::operator[](const std::string& key) {
    if (is_null()) {
        value_ = std::make_unique<Object>();
    }
    return get_object()[key];
}

const JsonValue& JsonValue::operator[](const std::string& key) const {
    const JsonValue* found = find(key);
    if (!found) {
        throw std::out_of_range("Missing JSON key: " + key);
    }
    return *found;
}

const JsonValue* JsonValue::find(const std::string& key) const {
    if (!is_object()) {
        return nullptr;
    }
    const Object& obj = get_object();
    auto it = obj.find(key);
    return it == obj.end() ? nullptr : &it->second;
}

void JsonValue::push_back(JsonValue value) {
    if (is_null()) {
        value_ = std::make_unique<Array>();
    }
    get_array().push_back(std::move(value));
}

JsonValue JsonValue::array() {
    JsonValue val;
    val.value_ = std::make_unique<Array>();
    return val;
}

JsonValue JsonValue::object() {
    JsonValue val;
    val.value_ = std::make_unique<Object>();
    return val;
}

size_t JsonValue::size() const {
    if (is_array()) {
        return get_array().size();
    } else if (is_object()) {
        return get_object().size();
    }
    return 0;
}

bool JsonValue::empty() const {
    return size() == 0;
}

namespace {

void write_escaped(std::ostream& os, const std::string& s) {
    os << '"';
    for (unsigned char c : s) {
        switch (c) {
            case '"':  os << "\\\""; break;
            case '\\': os << "\\\\"; break;
            case '\b': os << "\\b"; break;
            case '\f': os << "\\f"; break;
            case '\n': os << "\\n"; break;
            case '\r': os << "\\r"; break;
            case '\t': os << "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    os << buf;
                } else {
                    os << static_cast<char>(c);
                }
        }
    }
    os << '"';
}

void write_number(std::ostream& os, double number) {
    if (!std::isfinite(number)) {
        os << "null"; // JSON has no NaN or infinity
        return;
    }
    if (std::trunc(number) == number && std::fabs(number) < 1e15) {
        os << static_cast<long long>(number);
        return;
    }
    std::ostringstream tmp;
    tmp.precision(17);
    tmp << number;
    os << tmp.str();
}

void serialize(std::ostream& os, const JsonValue& val, int indent_level, int indent_width) {
    std::string indent_str(indent_level * indent_width, ' ');
    std::string next_indent_str((indent_level + 1) * indent_width, ' ');

    switch (val.type()) {
        case JsonType::NULL_VALUE:
            os << "null";
            break;
        case JsonType::BOOL:
            os << (val.get_bool() ? "true" : "false");
            break;
        case JsonType::NUMBER:
            write_number(os, val.get_number());
            break;
        case JsonType::STRING:
            write_escaped(os, val.get_string());
            break;
        case JsonType::ARRAY: {
            const JsonValue::Array& arr = val.get_array();
            os << "[";
            for (size_t i = 0; i < arr.size(); ++i) {
                if (i > 0) os << ",";
                if (indent_width > 0) os << "\n" << next_indent_str;
                serialize(os, arr[i], indent_level + 1, indent_width);
            }
            if (indent_width > 0 && !arr.empty()) os << "\n" << indent_str;
            os << "]";
            break;
        }
        case JsonType::OBJECT: {
            const JsonValue::Object& obj = val.get_object();
            os << "{";
            bool first = true;
            for (const auto& pair : obj) {
                if (!first) os << ",";
                if (indent_width > 0) os << "\n" << next_indent_str;
                write_escaped(os, pair.first);
                os << (indent_width > 0 ? ": " : ":");
                serialize(os, pair.second, indent_level + 1, indent_width);
                first = false;
            }
            if (indent_width > 0 && !obj.empty()) os << "\n" << indent_str;
            os << "}";
            break;
        }
    }
}

} // namespace

std::string JsonValue::to_string(int indent_width) const {
    std::ostringstream oss;
    serialize(oss, *this, 0, indent_width);
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const JsonValue& val) {
    serialize(os, val, 0, 0); // No indentation by default for operator<<
    return os;
}

} // namespace Json
} // namespace Vidstream
