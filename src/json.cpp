#include "json.hpp"
#include "errors.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace forge {

// ── JsonNumber / JsonValue ─────────────────────────────────────

bool JsonNumber::is_integer() const {
    return text.find_first_of(".eE") == std::string::npos;
}

const char* json_type_name(JsonType type) {
    switch (type) {
        case JsonType::Null:   return "null";
        case JsonType::Bool:   return "bool";
        case JsonType::Number: return "number";
        case JsonType::String: return "string";
        case JsonType::Array:  return "array";
        case JsonType::Object: return "object";
    }
    return "unknown";
}

JsonValue::JsonValue(int n) : data_(JsonNumber{std::to_string(n)}) {}
JsonValue::JsonValue(long n) : data_(JsonNumber{std::to_string(n)}) {}
JsonValue::JsonValue(long long n) : data_(JsonNumber{std::to_string(n)}) {}
JsonValue::JsonValue(unsigned n) : data_(JsonNumber{std::to_string(n)}) {}
JsonValue::JsonValue(unsigned long n) : data_(JsonNumber{std::to_string(n)}) {}
JsonValue::JsonValue(unsigned long long n) : data_(JsonNumber{std::to_string(n)}) {}

JsonValue::JsonValue(double d) {
    if (!std::isfinite(d))
        throw std::invalid_argument("JSON cannot represent NaN or infinity");

    // Shortest of %.15g / %.17g that reads back to the same double.
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.15g", d);
    if (std::strtod(buf, nullptr) != d)
        std::snprintf(buf, sizeof(buf), "%.17g", d);

    std::string text = buf;
    if (text.find_first_of(".eE") == std::string::npos) text += ".0";
    data_ = JsonNumber{std::move(text)};
}

static void require_type(JsonType have, JsonType want) {
    if (have != want) {
        throw std::logic_error(std::string("JSON value is ") + json_type_name(have) +
                               ", expected " + json_type_name(want));
    }
}

bool JsonValue::as_bool() const {
    require_type(type(), JsonType::Bool);
    return std::get<bool>(data_);
}

const JsonNumber& JsonValue::as_number() const {
    require_type(type(), JsonType::Number);
    return std::get<JsonNumber>(data_);
}

int64_t JsonValue::as_int() const {
    const auto& num = as_number();
    if (num.is_integer()) return std::strtoll(num.text.c_str(), nullptr, 10);
    return static_cast<int64_t>(std::strtod(num.text.c_str(), nullptr));
}

double JsonValue::as_double() const {
    return std::strtod(as_number().text.c_str(), nullptr);
}

const std::string& JsonValue::as_string() const {
    require_type(type(), JsonType::String);
    return std::get<std::string>(data_);
}

const JsonArray& JsonValue::as_array() const {
    require_type(type(), JsonType::Array);
    return std::get<JsonArray>(data_);
}

JsonArray& JsonValue::as_array() {
    require_type(type(), JsonType::Array);
    return std::get<JsonArray>(data_);
}

const JsonObject& JsonValue::as_object() const {
    require_type(type(), JsonType::Object);
    return std::get<JsonObject>(data_);
}

JsonObject& JsonValue::as_object() {
    require_type(type(), JsonType::Object);
    return std::get<JsonObject>(data_);
}

const JsonValue* JsonValue::find(std::string_view key) const {
    if (!is_object()) return nullptr;
    const auto& members = std::get<JsonObject>(data_);
    for (auto it = members.rbegin(); it != members.rend(); ++it) {
        if (it->first == key) return &it->second;
    }
    return nullptr;
}

std::string JsonValue::get_string(std::string_view key, const std::string& fallback) const {
    const JsonValue* v = find(key);
    return (v && v->is_string()) ? v->as_string() : fallback;
}

bool JsonValue::get_bool(std::string_view key, bool fallback) const {
    const JsonValue* v = find(key);
    return (v && v->is_bool()) ? v->as_bool() : fallback;
}

int64_t JsonValue::get_int(std::string_view key, int64_t fallback) const {
    const JsonValue* v = find(key);
    return (v && v->is_number()) ? v->as_int() : fallback;
}

JsonValue& JsonValue::set(const std::string& key, JsonValue value) {
    if (is_null()) data_ = JsonObject{};
    auto& members = as_object();
    for (auto it = members.rbegin(); it != members.rend(); ++it) {
        if (it->first == key) {
            it->second = std::move(value);
            return it->second;
        }
    }
    members.emplace_back(key, std::move(value));
    return members.back().second;
}

void JsonValue::push_back(JsonValue value) {
    if (is_null()) data_ = JsonArray{};
    as_array().push_back(std::move(value));
}

size_t JsonValue::size() const {
    if (is_array()) return std::get<JsonArray>(data_).size();
    if (is_object()) return std::get<JsonObject>(data_).size();
    return 0;
}

// ── Parser ─────────────────────────────────────────────────────

namespace {

class Parser {
public:
    Parser(std::string_view input, size_t max_depth)
        : in_(input), max_depth_(max_depth) {}

    JsonValue parse_value() {
        skip_whitespace();
        if (at_end()) fail(JsonErrorKind::UnexpectedEnd, "expected a value");

        switch (in_[pos_]) {
            case '{': return parse_object();
            case '[': return parse_array();
            case '"': return JsonValue(parse_string());
            case 't': expect_literal("true");  return JsonValue(true);
            case 'f': expect_literal("false"); return JsonValue(false);
            case 'n': expect_literal("null");  return JsonValue(nullptr);
            default: break;
        }
        char c = in_[pos_];
        if (c == '-' || (c >= '0' && c <= '9')) return parse_number();
        fail(JsonErrorKind::UnexpectedToken,
             std::string("unexpected character '") + c + "'");
    }

    void skip_whitespace() {
        while (!at_end()) {
            char c = in_[pos_];
            if (c != ' ' && c != '\t' && c != '\r' && c != '\n') break;
            ++pos_;
        }
    }

    bool at_end() const { return pos_ >= in_.size(); }
    size_t pos() const { return pos_; }

    [[noreturn]] void fail(JsonErrorKind kind, const std::string& detail) const {
        throw JsonError(kind, pos_, detail);
    }

private:
    void enter() {
        if (++depth_ > max_depth_) {
            fail(JsonErrorKind::DepthExceeded,
                 "nesting deeper than " + std::to_string(max_depth_));
        }
    }

    void leave() { --depth_; }

    JsonValue parse_object() {
        enter();
        ++pos_; // '{'
        JsonObject members;

        skip_whitespace();
        if (at_end()) fail(JsonErrorKind::UnexpectedEnd, "unterminated object");
        if (in_[pos_] == '}') {
            ++pos_;
            leave();
            return JsonValue(std::move(members));
        }

        while (true) {
            skip_whitespace();
            if (at_end()) fail(JsonErrorKind::UnexpectedEnd, "expected object key");
            if (in_[pos_] != '"') fail(JsonErrorKind::UnexpectedToken, "expected string key");
            std::string key = parse_string();

            skip_whitespace();
            if (at_end()) fail(JsonErrorKind::UnexpectedEnd, "expected ':'");
            if (in_[pos_] != ':') fail(JsonErrorKind::UnexpectedToken, "expected ':'");
            ++pos_;

            JsonValue value = parse_value();
            members.emplace_back(std::move(key), std::move(value));

            skip_whitespace();
            if (at_end()) fail(JsonErrorKind::UnexpectedEnd, "unterminated object");
            char c = in_[pos_++];
            if (c == '}') break;
            if (c != ',') {
                --pos_;
                fail(JsonErrorKind::UnexpectedToken, "expected ',' or '}'");
            }
        }
        leave();
        return JsonValue(std::move(members));
    }

    JsonValue parse_array() {
        enter();
        ++pos_; // '['
        JsonArray items;

        skip_whitespace();
        if (at_end()) fail(JsonErrorKind::UnexpectedEnd, "unterminated array");
        if (in_[pos_] == ']') {
            ++pos_;
            leave();
            return JsonValue(std::move(items));
        }

        while (true) {
            items.push_back(parse_value());

            skip_whitespace();
            if (at_end()) fail(JsonErrorKind::UnexpectedEnd, "unterminated array");
            char c = in_[pos_++];
            if (c == ']') break;
            if (c != ',') {
                --pos_;
                fail(JsonErrorKind::UnexpectedToken, "expected ',' or ']'");
            }
        }
        leave();
        return JsonValue(std::move(items));
    }

    void expect_literal(std::string_view word) {
        for (char expected : word) {
            if (at_end()) fail(JsonErrorKind::UnexpectedEnd, "truncated literal");
            if (in_[pos_] != expected) {
                fail(JsonErrorKind::UnexpectedToken,
                     "invalid literal, expected '" + std::string(word) + "'");
            }
            ++pos_;
        }
    }

    JsonValue parse_number() {
        size_t start = pos_;

        if (in_[pos_] == '-') ++pos_;

        if (at_end()) fail(JsonErrorKind::UnexpectedEnd, "truncated number");
        if (in_[pos_] == '0') {
            ++pos_;
            if (!at_end() && is_digit(in_[pos_]))
                fail(JsonErrorKind::InvalidNumber, "leading zero");
        } else if (is_digit(in_[pos_])) {
            while (!at_end() && is_digit(in_[pos_])) ++pos_;
        } else {
            fail(JsonErrorKind::InvalidNumber, "expected digit");
        }

        if (!at_end() && in_[pos_] == '.') {
            ++pos_;
            require_digits("fraction");
        }

        if (!at_end() && (in_[pos_] == 'e' || in_[pos_] == 'E')) {
            ++pos_;
            if (!at_end() && (in_[pos_] == '+' || in_[pos_] == '-')) ++pos_;
            require_digits("exponent");
        }

        return JsonValue(JsonNumber{std::string(in_.substr(start, pos_ - start))});
    }

    void require_digits(const char* part) {
        if (at_end()) fail(JsonErrorKind::UnexpectedEnd, std::string("truncated ") + part);
        if (!is_digit(in_[pos_]))
            fail(JsonErrorKind::InvalidNumber, std::string("expected digit in ") + part);
        while (!at_end() && is_digit(in_[pos_])) ++pos_;
    }

    static bool is_digit(char c) { return c >= '0' && c <= '9'; }

    std::string parse_string() {
        size_t open = pos_;
        ++pos_; // opening quote
        std::string out;

        while (true) {
            if (at_end()) throw JsonError(JsonErrorKind::UnterminatedString, open,
                                          "unterminated string");
            unsigned char c = static_cast<unsigned char>(in_[pos_]);
            if (c == '"') {
                ++pos_;
                return out;
            }
            if (c < 0x20) fail(JsonErrorKind::UnexpectedToken, "control character in string");
            if (c != '\\') {
                out += static_cast<char>(c);
                ++pos_;
                continue;
            }

            ++pos_;
            if (at_end()) throw JsonError(JsonErrorKind::UnterminatedString, open,
                                          "unterminated string");
            char esc = in_[pos_++];
            switch (esc) {
                case '"':  out += '"';  break;
                case '\\': out += '\\'; break;
                case '/':  out += '/';  break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u':  append_utf8(out, parse_unicode_escape(open)); break;
                default:
                    --pos_;
                    fail(JsonErrorKind::InvalidEscape,
                         std::string("invalid escape '\\") + esc + "'");
            }
        }
    }

    uint32_t read_hex4(size_t open) {
        uint32_t cp = 0;
        for (int i = 0; i < 4; ++i) {
            if (at_end()) throw JsonError(JsonErrorKind::UnterminatedString, open,
                                          "unterminated string");
            char h = in_[pos_];
            cp <<= 4;
            if (h >= '0' && h <= '9')      cp |= static_cast<uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') cp |= static_cast<uint32_t>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') cp |= static_cast<uint32_t>(h - 'A' + 10);
            else fail(JsonErrorKind::InvalidEscape, "invalid hex digit in \\u escape");
            ++pos_;
        }
        return cp;
    }

    // Called with pos_ just past "\u".
    uint32_t parse_unicode_escape(size_t open) {
        uint32_t cp = read_hex4(open);
        if (cp >= 0xDC00 && cp <= 0xDFFF)
            fail(JsonErrorKind::InvalidEscape, "unpaired low surrogate");
        if (cp < 0xD800 || cp > 0xDBFF) return cp;

        // High surrogate: a "\uDC00".."\uDFFF" escape must follow.
        for (char expected : {'\\', 'u'}) {
            if (at_end()) throw JsonError(JsonErrorKind::UnterminatedString, open,
                                          "unterminated string");
            if (in_[pos_] != expected)
                fail(JsonErrorKind::InvalidEscape, "unpaired high surrogate");
            ++pos_;
        }
        uint32_t low = read_hex4(open);
        if (low < 0xDC00 || low > 0xDFFF)
            fail(JsonErrorKind::InvalidEscape, "invalid low surrogate");
        return 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
    }

    static void append_utf8(std::string& out, uint32_t cp) {
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

    std::string_view in_;
    size_t pos_ = 0;
    size_t depth_ = 0;
    size_t max_depth_;
};

} // namespace

JsonValue parse_one(std::string_view input, const JsonParseOptions& options) {
    Parser parser(input, options.max_depth);
    JsonValue value = parser.parse_value();
    parser.skip_whitespace();
    if (!parser.at_end())
        parser.fail(JsonErrorKind::TrailingData, "unexpected data after value");
    return value;
}

JsonPrefix parse_value_prefix(std::string_view input, const JsonParseOptions& options) {
    Parser parser(input, options.max_depth);
    JsonPrefix result;
    result.value = parser.parse_value();
    result.consumed = parser.pos();
    return result;
}

// ── Serializer ─────────────────────────────────────────────────

static void escape_into(std::string_view s, std::string& out) {
    for (unsigned char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out += static_cast<char>(c);
                }
                break;
        }
    }
}

std::string json_escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 16);
    escape_into(s, out);
    return out;
}

void serialize_into(const JsonValue& value, std::string& out) {
    switch (value.type()) {
        case JsonType::Null:
            out += "null";
            break;
        case JsonType::Bool:
            out += value.as_bool() ? "true" : "false";
            break;
        case JsonType::Number:
            out += value.as_number().text;
            break;
        case JsonType::String:
            out += '"';
            escape_into(value.as_string(), out);
            out += '"';
            break;
        case JsonType::Array: {
            out += '[';
            bool first = true;
            for (const auto& item : value.as_array()) {
                if (!first) out += ',';
                first = false;
                serialize_into(item, out);
            }
            out += ']';
            break;
        }
        case JsonType::Object: {
            out += '{';
            bool first = true;
            for (const auto& [key, member] : value.as_object()) {
                if (!first) out += ',';
                first = false;
                out += '"';
                escape_into(key, out);
                out += "\":";
                serialize_into(member, out);
            }
            out += '}';
            break;
        }
    }
}

std::string serialize(const JsonValue& value) {
    std::string out;
    serialize_into(value, out);
    return out;
}

} // namespace forge
