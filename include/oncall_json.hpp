/**
 * @file oncall_json.hpp
 * @brief Lightweight JSON reading and writing for schedule documents
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * This header provides:
 * - JSON value representation
 * - JSON parsing with position-annotated errors
 * - JSON serialization (compact or indented)
 */

#ifndef ONCALL_JSON_HPP
#define ONCALL_JSON_HPP

#include <cmath>
#include <cstdint>
#include <functional>
#include <iomanip>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace oncall {
namespace json {

class JsonValue;

using JsonNull = std::monostate;
using JsonBool = bool;
using JsonNumber = double;
using JsonString = std::string;
using JsonArray = std::vector<JsonValue>;
using JsonObject = std::map<std::string, JsonValue>;

enum class JsonType {
    Null,
    Bool,
    Number,
    String,
    Array,
    Object
};

inline const char* jsonTypeToString(JsonType type) {
    switch (type) {
        case JsonType::Null: return "null";
        case JsonType::Bool: return "boolean";
        case JsonType::Number: return "number";
        case JsonType::String: return "string";
        case JsonType::Array: return "array";
        case JsonType::Object: return "object";
    }
    return "unknown";
}

/**
 * @brief JSON value class
 */
class JsonValue {
public:
    using ValueType = std::variant<JsonNull, JsonBool, JsonNumber, JsonString,
                                   JsonArray, JsonObject>;

    JsonValue() : value_(JsonNull{}) {}
    JsonValue(std::nullptr_t) : value_(JsonNull{}) {}
    JsonValue(bool b) : value_(b) {}
    JsonValue(int i) : value_(static_cast<double>(i)) {}
    JsonValue(int64_t l) : value_(static_cast<double>(l)) {}
    JsonValue(double d) : value_(d) {}
    JsonValue(const char* s) : value_(JsonString(s)) {}
    JsonValue(std::string s) : value_(std::move(s)) {}
    JsonValue(JsonArray arr) : value_(std::move(arr)) {}
    JsonValue(JsonObject obj) : value_(std::move(obj)) {}

    [[nodiscard]] JsonType type() const noexcept;
    [[nodiscard]] bool isNull() const noexcept { return std::holds_alternative<JsonNull>(value_); }
    [[nodiscard]] bool isBool() const noexcept { return std::holds_alternative<JsonBool>(value_); }
    [[nodiscard]] bool isNumber() const noexcept { return std::holds_alternative<JsonNumber>(value_); }
    [[nodiscard]] bool isString() const noexcept { return std::holds_alternative<JsonString>(value_); }
    [[nodiscard]] bool isArray() const noexcept { return std::holds_alternative<JsonArray>(value_); }
    [[nodiscard]] bool isObject() const noexcept { return std::holds_alternative<JsonObject>(value_); }

    // Value access (throws on type mismatch)
    [[nodiscard]] bool asBool() const;
    [[nodiscard]] double asNumber() const;
    [[nodiscard]] const JsonString& asString() const;
    [[nodiscard]] const JsonArray& asArray() const;
    [[nodiscard]] const JsonObject& asObject() const;
    [[nodiscard]] JsonArray& asArray();

    // Optional access (nullopt on type mismatch)
    [[nodiscard]] std::optional<double> getNumber() const noexcept;
    [[nodiscard]] std::optional<std::string> getString() const noexcept;

    [[nodiscard]] std::size_t size() const noexcept;
    void push_back(JsonValue val);

    [[nodiscard]] bool contains(const std::string& key) const noexcept;
    [[nodiscard]] const JsonValue* find(const std::string& key) const noexcept;

    [[nodiscard]] std::string dump(int indent = -1) const;

    [[nodiscard]] bool operator==(const JsonValue& other) const { return value_ == other.value_; }
    [[nodiscard]] bool operator!=(const JsonValue& other) const { return !(*this == other); }

private:
    ValueType value_;

    void dumpImpl(std::ostringstream& oss, int indent, int currentIndent) const;
};

// ============================================================================
// JSON Parser
// ============================================================================

class JsonParseError : public std::runtime_error {
public:
    JsonParseError(const std::string& msg, std::size_t pos)
        : std::runtime_error(msg + " at position " + std::to_string(pos))
        , position_(pos) {}

    [[nodiscard]] std::size_t position() const noexcept { return position_; }

private:
    std::size_t position_;
};

class JsonParser {
public:
    /**
     * @brief Parse a complete JSON document
     * @throws JsonParseError on invalid JSON
     */
    [[nodiscard]] static JsonValue parse(std::string_view json);

private:
    std::string_view json_;
    std::size_t pos_ = 0;
    int depth_ = 0;

    static constexpr int kMaxDepth = 256;

    explicit JsonParser(std::string_view json) : json_(json) {}

    JsonValue parseValue();
    JsonValue parseLiteral();
    JsonValue parseNumber();
    JsonValue parseArray();
    JsonValue parseObject();

    void skipWhitespace();
    char peek() const { return pos_ < json_.size() ? json_[pos_] : '\0'; }
    bool atEnd() const { return pos_ >= json_.size(); }
    bool match(char c);
    void expect(char c);
    std::string parseString();
    void appendUnicodeEscape(std::string& out);
};

[[nodiscard]] inline JsonValue parse(std::string_view json) {
    return JsonParser::parse(json);
}

// ============================================================================
// Implementation
// ============================================================================

inline JsonType JsonValue::type() const noexcept {
    return std::visit([](auto&& arg) -> JsonType {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, JsonNull>) return JsonType::Null;
        else if constexpr (std::is_same_v<T, JsonBool>) return JsonType::Bool;
        else if constexpr (std::is_same_v<T, JsonNumber>) return JsonType::Number;
        else if constexpr (std::is_same_v<T, JsonString>) return JsonType::String;
        else if constexpr (std::is_same_v<T, JsonArray>) return JsonType::Array;
        else return JsonType::Object;
    }, value_);
}

inline bool JsonValue::asBool() const {
    if (auto* p = std::get_if<JsonBool>(&value_)) return *p;
    throw std::runtime_error("JSON value is not a boolean");
}

inline double JsonValue::asNumber() const {
    if (auto* p = std::get_if<JsonNumber>(&value_)) return *p;
    throw std::runtime_error("JSON value is not a number");
}

inline const JsonString& JsonValue::asString() const {
    if (auto* p = std::get_if<JsonString>(&value_)) return *p;
    throw std::runtime_error("JSON value is not a string");
}

inline const JsonArray& JsonValue::asArray() const {
    if (auto* p = std::get_if<JsonArray>(&value_)) return *p;
    throw std::runtime_error("JSON value is not an array");
}

inline JsonArray& JsonValue::asArray() {
    if (auto* p = std::get_if<JsonArray>(&value_)) return *p;
    throw std::runtime_error("JSON value is not an array");
}

inline const JsonObject& JsonValue::asObject() const {
    if (auto* p = std::get_if<JsonObject>(&value_)) return *p;
    throw std::runtime_error("JSON value is not an object");
}

inline std::optional<double> JsonValue::getNumber() const noexcept {
    if (auto* p = std::get_if<JsonNumber>(&value_)) return *p;
    return std::nullopt;
}

inline std::optional<std::string> JsonValue::getString() const noexcept {
    if (auto* p = std::get_if<JsonString>(&value_)) return *p;
    return std::nullopt;
}

inline std::size_t JsonValue::size() const noexcept {
    if (auto* arr = std::get_if<JsonArray>(&value_)) return arr->size();
    if (auto* obj = std::get_if<JsonObject>(&value_)) return obj->size();
    return 0;
}

inline void JsonValue::push_back(JsonValue val) {
    asArray().push_back(std::move(val));
}

inline bool JsonValue::contains(const std::string& key) const noexcept {
    return find(key) != nullptr;
}

inline const JsonValue* JsonValue::find(const std::string& key) const noexcept {
    if (auto* obj = std::get_if<JsonObject>(&value_)) {
        auto it = obj->find(key);
        if (it != obj->end()) return &it->second;
    }
    return nullptr;
}

inline std::string JsonValue::dump(int indent) const {
    std::ostringstream oss;
    dumpImpl(oss, indent, 0);
    return oss.str();
}

namespace detail {

inline void writeEscaped(std::ostringstream& oss, const std::string& s) {
    oss << '"';
    for (char c : s) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec << std::setfill(' ');
                } else {
                    oss << c;
                }
        }
    }
    oss << '"';
}

} // namespace detail

inline void JsonValue::dumpImpl(std::ostringstream& oss, int indent, int currentIndent) const {
    const bool pretty = indent >= 0;
    const std::string closingPad = pretty ? std::string(currentIndent, ' ') : "";
    const std::string itemPad = pretty ? std::string(currentIndent + indent, ' ') : "";
    const char* newline = pretty ? "\n" : "";

    std::visit([&](auto&& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, JsonNull>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, JsonBool>) {
            oss << (arg ? "true" : "false");
        } else if constexpr (std::is_same_v<T, JsonNumber>) {
            if (std::isnan(arg) || std::isinf(arg)) {
                oss << "null";
            } else if (arg == std::floor(arg) && std::abs(arg) < 1e15) {
                oss << static_cast<int64_t>(arg);
            } else {
                oss << std::setprecision(15) << arg;
            }
        } else if constexpr (std::is_same_v<T, JsonString>) {
            detail::writeEscaped(oss, arg);
        } else if constexpr (std::is_same_v<T, JsonArray>) {
            oss << "[";
            for (std::size_t i = 0; i < arg.size(); ++i) {
                oss << (i == 0 ? "" : ",") << newline << itemPad;
                arg[i].dumpImpl(oss, indent, currentIndent + indent);
            }
            if (!arg.empty()) oss << newline << closingPad;
            oss << "]";
        } else {
            oss << "{";
            bool first = true;
            for (const auto& [key, val] : arg) {
                oss << (first ? "" : ",") << newline << itemPad;
                detail::writeEscaped(oss, key);
                oss << (pretty ? ": " : ":");
                val.dumpImpl(oss, indent, currentIndent + indent);
                first = false;
            }
            if (!arg.empty()) oss << newline << closingPad;
            oss << "}";
        }
    }, value_);
}

inline JsonValue JsonParser::parse(std::string_view json) {
    JsonParser parser(json);
    JsonValue result = parser.parseValue();
    parser.skipWhitespace();
    if (!parser.atEnd()) {
        throw JsonParseError("Unexpected characters after JSON", parser.pos_);
    }
    return result;
}

inline JsonValue JsonParser::parseValue() {
    skipWhitespace();
    if (atEnd()) {
        throw JsonParseError("Unexpected end of input", pos_);
    }

    char c = peek();
    if (c == 'n' || c == 't' || c == 'f') return parseLiteral();
    if (c == '"') return JsonValue(parseString());
    if (c == '[' || c == '{') {
        if (++depth_ > kMaxDepth) throw JsonParseError("Nesting too deep", pos_);
        JsonValue v = c == '[' ? parseArray() : parseObject();
        --depth_;
        return v;
    }
    if (c == '-' || (c >= '0' && c <= '9')) return parseNumber();

    throw JsonParseError(std::string("Unexpected character: ") + c, pos_);
}

inline JsonValue JsonParser::parseLiteral() {
    auto rest = json_.substr(pos_);
    if (rest.substr(0, 4) == "null") { pos_ += 4; return JsonValue(nullptr); }
    if (rest.substr(0, 4) == "true") { pos_ += 4; return JsonValue(true); }
    if (rest.substr(0, 5) == "false") { pos_ += 5; return JsonValue(false); }
    throw JsonParseError("Invalid literal", pos_);
}

inline JsonValue JsonParser::parseNumber() {
    const std::size_t start = pos_;
    auto digits = [this]() {
        std::size_t n = 0;
        while (!atEnd() && peek() >= '0' && peek() <= '9') { ++pos_; ++n; }
        return n;
    };

    match('-');
    if (peek() == '0') {
        ++pos_;
    } else if (digits() == 0) {
        throw JsonParseError("Invalid number", pos_);
    }
    if (match('.') && digits() == 0) {
        throw JsonParseError("Invalid number", pos_);
    }
    if (peek() == 'e' || peek() == 'E') {
        ++pos_;
        if (!match('+')) match('-');
        if (digits() == 0) throw JsonParseError("Invalid number", pos_);
    }

    return JsonValue(std::stod(std::string(json_.substr(start, pos_ - start))));
}

inline std::string JsonParser::parseString() {
    expect('"');
    std::string result;
    while (true) {
        if (atEnd()) throw JsonParseError("Unterminated string", pos_);
        char c = json_[pos_++];
        if (c == '"') break;
        if (static_cast<unsigned char>(c) < 32) {
            throw JsonParseError("Control character in string", pos_ - 1);
        }
        if (c != '\\') {
            result += c;
            continue;
        }
        if (atEnd()) throw JsonParseError("Unexpected end of string", pos_);
        char esc = json_[pos_++];
        switch (esc) {
            case '"': result += '"'; break;
            case '\\': result += '\\'; break;
            case '/': result += '/'; break;
            case 'b': result += '\b'; break;
            case 'f': result += '\f'; break;
            case 'n': result += '\n'; break;
            case 'r': result += '\r'; break;
            case 't': result += '\t'; break;
            case 'u': appendUnicodeEscape(result); break;
            default:
                throw JsonParseError(std::string("Invalid escape sequence: \\") + esc, pos_ - 1);
        }
    }
    return result;
}

// Encodes \uXXXX as UTF-8; surrogate pairs are combined.
inline void JsonParser::appendUnicodeEscape(std::string& out) {
    auto readHex4 = [this]() -> unsigned {
        if (pos_ + 4 > json_.size()) throw JsonParseError("Invalid unicode escape", pos_);
        unsigned cp = 0;
        for (int i = 0; i < 4; ++i) {
            char h = json_[pos_++];
            cp <<= 4;
            if (h >= '0' && h <= '9') cp |= static_cast<unsigned>(h - '0');
            else if (h >= 'a' && h <= 'f') cp |= static_cast<unsigned>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') cp |= static_cast<unsigned>(h - 'A' + 10);
            else throw JsonParseError("Invalid unicode escape", pos_ - 1);
        }
        return cp;
    };

    unsigned cp = readHex4();
    if (cp >= 0xD800 && cp <= 0xDBFF) {
        if (json_.substr(pos_, 2) != "\\u") throw JsonParseError("Unpaired surrogate", pos_);
        pos_ += 2;
        unsigned low = readHex4();
        if (low < 0xDC00 || low > 0xDFFF) throw JsonParseError("Invalid low surrogate", pos_);
        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
    }

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

inline JsonValue JsonParser::parseArray() {
    expect('[');
    JsonArray arr;
    skipWhitespace();
    if (match(']')) return JsonValue(std::move(arr));

    do {
        arr.push_back(parseValue());
        skipWhitespace();
    } while (match(','));

    expect(']');
    return JsonValue(std::move(arr));
}

inline JsonValue JsonParser::parseObject() {
    expect('{');
    JsonObject obj;
    skipWhitespace();
    if (match('}')) return JsonValue(std::move(obj));

    do {
        skipWhitespace();
        std::string key = parseString();
        skipWhitespace();
        expect(':');
        obj[key] = parseValue();
        skipWhitespace();
    } while (match(','));

    expect('}');
    return JsonValue(std::move(obj));
}

inline void JsonParser::skipWhitespace() {
    while (!atEnd()) {
        char c = json_[pos_];
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
        ++pos_;
    }
}

inline bool JsonParser::match(char c) {
    if (!atEnd() && json_[pos_] == c) {
        ++pos_;
        return true;
    }
    return false;
}

inline void JsonParser::expect(char c) {
    if (!match(c)) {
        throw JsonParseError(std::string("Expected '") + c + "'", pos_);
    }
}

} // namespace json
} // namespace oncall

#endif // ONCALL_JSON_HPP
