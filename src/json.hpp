#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace forge {

class JsonValue;

using JsonArray  = std::vector<JsonValue>;
using JsonMember = std::pair<std::string, JsonValue>;
// Members in source order. Duplicate keys are kept; lookups see the last one.
using JsonObject = std::vector<JsonMember>;

// Numbers keep their decimal text so nothing is lost before the caller
// decides how to interpret them.
struct JsonNumber {
    std::string text;

    // Lexically an integer: no fraction and no exponent.
    bool is_integer() const;
    bool operator==(const JsonNumber& other) const { return text == other.text; }
};

enum class JsonType { Null, Bool, Number, String, Array, Object };

const char* json_type_name(JsonType type);

class JsonValue {
public:
    JsonValue() = default;
    JsonValue(std::nullptr_t) {}
    JsonValue(bool b) : data_(b) {}
    JsonValue(int n);
    JsonValue(long n);
    JsonValue(long long n);
    JsonValue(unsigned n);
    JsonValue(unsigned long n);
    JsonValue(unsigned long long n);
    JsonValue(double d); // throws std::invalid_argument for NaN/inf
    JsonValue(JsonNumber n) : data_(std::move(n)) {}
    JsonValue(const char* s) : data_(std::string(s)) {}
    JsonValue(std::string s) : data_(std::move(s)) {}
    JsonValue(JsonArray a) : data_(std::move(a)) {}
    JsonValue(JsonObject o) : data_(std::move(o)) {}

    static JsonValue array() { return JsonValue(JsonArray{}); }
    static JsonValue object() { return JsonValue(JsonObject{}); }

    JsonType type() const { return static_cast<JsonType>(data_.index()); }

    bool is_null() const   { return type() == JsonType::Null; }
    bool is_bool() const   { return type() == JsonType::Bool; }
    bool is_number() const { return type() == JsonType::Number; }
    bool is_string() const { return type() == JsonType::String; }
    bool is_array() const  { return type() == JsonType::Array; }
    bool is_object() const { return type() == JsonType::Object; }

    // Typed accessors throw std::logic_error on a type mismatch.
    bool as_bool() const;
    const JsonNumber& as_number() const;
    int64_t as_int() const;
    double as_double() const;
    const std::string& as_string() const;
    const JsonArray& as_array() const;
    JsonArray& as_array();
    const JsonObject& as_object() const;
    JsonObject& as_object();

    // Object lookup, last occurrence wins. nullptr when absent or not an object.
    const JsonValue* find(std::string_view key) const;
    bool contains(std::string_view key) const { return find(key) != nullptr; }

    // Fallback-returning lookups for loosely shaped server payloads.
    std::string get_string(std::string_view key, const std::string& fallback = "") const;
    bool get_bool(std::string_view key, bool fallback = false) const;
    int64_t get_int(std::string_view key, int64_t fallback = 0) const;

    // Replace the last member named key, or append one. Converts null to object.
    JsonValue& set(const std::string& key, JsonValue value);
    // Append to an array. Converts null to array.
    void push_back(JsonValue value);

    // Element count for arrays/objects, 0 otherwise.
    size_t size() const;

    bool operator==(const JsonValue& other) const { return data_ == other.data_; }
    bool operator!=(const JsonValue& other) const { return !(*this == other); }

private:
    // Alternative order matches JsonType.
    std::variant<std::nullptr_t, bool, JsonNumber, std::string, JsonArray, JsonObject> data_;
};

// ── Parsing ────────────────────────────────────────────────────

constexpr size_t kDefaultJsonMaxDepth = 128;

struct JsonParseOptions {
    size_t max_depth = kDefaultJsonMaxDepth;
};

struct JsonPrefix {
    JsonValue value;
    size_t consumed = 0; // bytes up to and including the value's last byte
};

// Parse exactly one value; anything but whitespace after it is an error.
// Throws JsonError.
JsonValue parse_one(std::string_view input, const JsonParseOptions& options = {});

// Parse the first complete value and report how far it reached. Bytes after
// the value are left alone. Throws JsonError; an error whose incomplete()
// is true means the input ended too early.
JsonPrefix parse_value_prefix(std::string_view input, const JsonParseOptions& options = {});

// ── Serialization ──────────────────────────────────────────────

// Compact canonical form: no inserted whitespace, members in stored order,
// numbers as their stored text.
std::string serialize(const JsonValue& value);
void serialize_into(const JsonValue& value, std::string& out);

// Escape a string body for embedding between JSON quotes.
std::string json_escape(std::string_view s);

} // namespace forge
