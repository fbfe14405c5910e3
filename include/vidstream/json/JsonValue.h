// vidstream/include/vidstream/json/JsonValue.h
#ifndef VIDSTREAM_JSON_JSONVALUE_H
#define VIDSTREAM_JSON_JSONVALUE_H

#include <cstddef>
#include <iostream>  // For ostream
#include <map>
#include <memory>    // For std::unique_ptr
#include <stdexcept> // For std::runtime_error
#include <string>
#include <variant>
#include <vector>

namespace Vidstream {
namespace Json {

// JSON Value types. Order matches the storage variant below.
enum class JsonType {
    NULL_VALUE, BOOL, NUMBER, STRING, ARRAY, OBJECT
};

class JsonValue {
public:
    using Array = std::vector<JsonValue>;
    using Object = std::map<std::string, JsonValue>; // Sorted keys give stable output

private:
    // Containers live on the heap so JsonValue can hold itself
    std::variant<std::nullptr_t, bool, double, std::string,
                 std::unique_ptr<Array>, std::unique_ptr<Object>> value_;

    void copy_from(const JsonValue& other);

public:
    // Constructors
    JsonValue() : value_(nullptr) {}
    JsonValue(std::nullptr_t) : value_(nullptr) {}
    JsonValue(bool val) : value_(val) {}
    JsonValue(double val) : value_(val) {}
    JsonValue(int val) : value_(static_cast<double>(val)) {}
    JsonValue(long val) : value_(static_cast<double>(val)) {}
    JsonValue(long long val) : value_(static_cast<double>(val)) {}
    JsonValue(unsigned int val) : value_(static_cast<double>(val)) {}
    JsonValue(unsigned long val) : value_(static_cast<double>(val)) {}
    JsonValue(unsigned long long val) : value_(static_cast<double>(val)) {}
    JsonValue(const std::string& val) : value_(val) {}
    JsonValue(std::string&& val) : value_(std::move(val)) {}
    JsonValue(const char* val) : value_(std::string(val)) {}

    JsonValue(const JsonValue& other);
    JsonValue(JsonValue&& other) noexcept;
    ~JsonValue();

    JsonValue& operator=(const JsonValue& other);
    JsonValue& operator=(JsonValue&& other) noexcept;

    JsonType type() const { return static_cast<JsonType>(value_.index()); }

    // Type checking
    bool is_null() const { return type() == JsonType::NULL_VALUE; }
    bool is_bool() const { return type() == JsonType::BOOL; }
    bool is_number() const { return type() == JsonType::NUMBER; }
    bool is_string() const { return type() == JsonType::STRING; }
    bool is_array() const { return type() == JsonType::ARRAY; }
    bool is_object() const { return type() == JsonType::OBJECT; }

    // Getters with type checking; throw std::runtime_error on mismatch
    bool get_bool() const;
    double get_number() const;
    // Number with no fractional part, e.g. a port or a size
    long long get_integer() const;
    const std::string& get_string() const;
    std::string& get_string();
    const Array& get_array() const;
    Array& get_array();
    const Object& get_object() const;
    Object& get_object();

    // Array and object accessors (will auto-convert if null)
    JsonValue& operator[](size_t index);
    const JsonValue& operator[](size_t index) const;
    JsonValue& operator[](const std::string& key);
    const JsonValue& operator[](const std::string& key) const;
    JsonValue& operator[](const char* key) { return (*this)[std::string(key)]; }
    const JsonValue& operator[](const char* key) const { return (*this)[std::string(key)]; }

    // nullptr when this is not an object or has no such key
    const JsonValue* find(const std::string& key) const;
    bool contains(const std::string& key) const { return find(key) != nullptr; }

    // Appends to an array (a null value becomes an empty array first)
    void push_back(JsonValue value);

    // Static factory methods for convenience
    static JsonValue array();
    static JsonValue object();

    // Size for arrays/objects
    size_t size() const;
    bool empty() const;

    // JSON serialization. indent > 0 pretty-prints with that many spaces.
    std::string to_string(int indent = 0) const;

    friend std::ostream& operator<<(std::ostream& os, const JsonValue& val);
};

} // namespace Json
} // namespace Vidstream

#endif // VIDSTREAM_JSON_JSONVALUE_H
