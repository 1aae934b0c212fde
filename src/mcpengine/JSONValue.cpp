//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONValue.cpp
// Purpose: Strict recursive-descent JSON parser and compact serializer for JSONValue.
//==========================================================================================================

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iterator>
#include <limits>
#include <string>

#include <fmt/format.h>

#include "mcpengine/JSONValue.h"

namespace mcpengine {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) noexcept = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) noexcept = default;
JSONValue::~JSONValue() = default;

JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int v) : value(static_cast<int64_t>(v)) {}
JSONValue::JSONValue(int64_t v) : value(v) {}
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

const char* JSONValue::typeName() const {
    switch (value.index()) {
        case 0: return "null";
        case 1: return "boolean";
        case 2: return "integer";
        case 3: return "number";
        case 4: return "string";
        case 5: return "array";
        case 6: return "object";
        default: return "unknown";
    }
}

bool operator==(const JSONValue& a, const JSONValue& b) {
    if (a.value.index() != b.value.index()) {
        return false;
    }
    if (a.isArray()) {
        const auto& x = std::get<JSONValue::Array>(a.value);
        const auto& y = std::get<JSONValue::Array>(b.value);
        if (x.size() != y.size()) return false;
        for (std::size_t i = 0; i < x.size(); ++i) {
            const JSONValue nullValue;
            const JSONValue& l = x[i] ? *x[i] : nullValue;
            const JSONValue& r = y[i] ? *y[i] : nullValue;
            if (!(l == r)) return false;
        }
        return true;
    }
    if (a.isObject()) {
        const auto& x = std::get<JSONValue::Object>(a.value);
        const auto& y = std::get<JSONValue::Object>(b.value);
        if (x.size() != y.size()) return false;
        for (const auto& [key, val] : x) {
            auto it = y.find(key);
            if (it == y.end()) return false;
            const JSONValue nullValue;
            const JSONValue& l = val ? *val : nullValue;
            const JSONValue& r = it->second ? *it->second : nullValue;
            if (!(l == r)) return false;
        }
        return true;
    }
    return a.value == b.value;
}

// -------------------------------
// Recursive JSON parser
// -------------------------------
namespace {

constexpr std::size_t kMaxDepth = 512;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    std::size_t depth{0};

    explicit JsonParser(const std::string& str) : s(str) {}

    [[noreturn]] void fail(const std::string& what) const {
        throw JsonParseError(fmt::format("{} at offset {}", what, i), i);
    }

    void skipWs() {
        while (i < s.size()) {
            char c = s[i];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') { ++i; } else { break; }
        }
    }

    bool match(char c) {
        skipWs();
        if (i < s.size() && s[i] == c) { ++i; return true; }
        return false;
    }

    unsigned int parseHex4() {
        if (i + 4 > s.size()) fail("Truncated unicode escape");
        unsigned int code = 0;
        for (int k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else fail("Invalid hex digit in unicode escape");
        }
        return code;
    }

    static void appendUtf8(std::string& out, unsigned int code) {
        if (code <= 0x7F) {
            out.push_back(static_cast<char>(code));
        } else if (code <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else if (code <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
    }

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') fail("Expected '\"'");
        ++i;
        std::string out;
        while (true) {
            if (i >= s.size()) fail("Unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("Unescaped control character in string");
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (i >= s.size()) fail("Invalid escape");
            char e = s[i++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned int code = parseHex4();
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        // High surrogate must be followed by \uDC00..\uDFFF
                        if (i + 2 > s.size() || s[i] != '\\' || s[i + 1] != 'u') fail("Unpaired surrogate");
                        i += 2;
                        unsigned int low = parseHex4();
                        if (low < 0xDC00 || low > 0xDFFF) fail("Invalid low surrogate");
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        fail("Unpaired surrogate");
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: fail("Unknown escape");
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("Invalid number");
        if (s[i] == '0') {
            ++i;
            if (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) fail("Leading zero in number");
        } else {
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("Expected digit after '.'");
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("Expected digit in exponent");
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        const std::string num = s.substr(start, i - start);
        if (!isFloat) {
            errno = 0;
            char* end = nullptr;
            long long v = std::strtoll(num.c_str(), &end, 10);
            if (errno != ERANGE) {
                return JSONValue(static_cast<int64_t>(v));
            }
            // Out of int64 range: fall through to double
        }
        char* end = nullptr;
        double d = std::strtod(num.c_str(), &end);
        return JSONValue(d);
    }

    JSONValue parseArray() {
        ++i; // '['
        if (++depth > kMaxDepth) fail("Nesting too deep");
        JSONValue::Array arr;
        if (match(']')) { --depth; return JSONValue(std::move(arr)); }
        while (true) {
            arr.push_back(std::make_shared<JSONValue>(parseValue()));
            if (match(']')) break;
            if (!match(',')) fail("Expected ',' or ']' in array");
        }
        --depth;
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        ++i; // '{'
        if (++depth > kMaxDepth) fail("Nesting too deep");
        JSONValue::Object obj;
        if (match('}')) { --depth; return JSONValue(std::move(obj)); }
        while (true) {
            std::string key = parseString();
            if (!match(':')) fail("Expected ':' after key");
            obj[key] = std::make_shared<JSONValue>(parseValue());
            if (match('}')) break;
            if (!match(',')) fail("Expected ',' or '}' in object");
        }
        --depth;
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("Unexpected end of JSON");
        char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
        if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
        if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parseNumber();
        fail(fmt::format("Unexpected character '{}'", c));
    }
};

template <typename Out>
void appendEscaped(Out& out, const std::string& v) {
    out.push_back('"');
    for (char c : v) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    fmt::format_to(std::back_inserter(out), "\\u{:04x}", static_cast<unsigned int>(static_cast<unsigned char>(c)));
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
}

template <typename Out>
void serializeInto(Out& out, const JSONValue& value) {
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            fmt::format_to(std::back_inserter(out), "{}", v);
        } else if constexpr (std::is_same_v<T, double>) {
            if (std::isfinite(v)) {
                fmt::format_to(std::back_inserter(out), "{}", v);
            } else {
                out += "null";
            }
        } else if constexpr (std::is_same_v<T, std::string>) {
            appendEscaped(out, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            out.push_back('[');
            for (std::size_t k = 0; k < v.size(); ++k) {
                if (k > 0) out.push_back(',');
                if (v[k]) serializeInto(out, *v[k]); else out += "null";
            }
            out.push_back(']');
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            out.push_back('{');
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) out.push_back(',');
                first = false;
                appendEscaped(out, key);
                out.push_back(':');
                if (val) serializeInto(out, *val); else out += "null";
            }
            out.push_back('}');
        }
    }, value.value);
}

} // namespace

JSONValue ParseJSON(const std::string& text) {
    JsonParser p(text);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != text.size()) {
        p.fail("Trailing characters after JSON value");
    }
    return v;
}

std::string SerializeJSON(const JSONValue& value) {
    std::string out;
    serializeInto(out, value);
    return out;
}

std::pmr::string SerializeJSON(const JSONValue& value, std::pmr::memory_resource* memory) {
    std::pmr::string out(memory);
    serializeInto(out, value);
    return out;
}

void AppendJSON(std::string& out, const JSONValue& value) {
    serializeInto(out, value);
}

void AppendJSON(std::pmr::string& out, const JSONValue& value) {
    serializeInto(out, value);
}

const JSONValue* FindMember(const JSONValue& value, const std::string& key) {
    if (!value.isObject()) {
        return nullptr;
    }
    const auto& obj = std::get<JSONValue::Object>(value.value);
    auto it = obj.find(key);
    if (it == obj.end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

std::optional<std::string> GetString(const JSONValue& value, const std::string& key) {
    const JSONValue* m = FindMember(value, key);
    if (m == nullptr || !m->isString()) return std::nullopt;
    return std::get<std::string>(m->value);
}

std::optional<int64_t> GetInteger(const JSONValue& value, const std::string& key) {
    const JSONValue* m = FindMember(value, key);
    if (m == nullptr || !m->isInteger()) return std::nullopt;
    return std::get<int64_t>(m->value);
}

std::optional<double> GetNumber(const JSONValue& value, const std::string& key) {
    const JSONValue* m = FindMember(value, key);
    if (m == nullptr) return std::nullopt;
    if (m->isInteger()) return static_cast<double>(std::get<int64_t>(m->value));
    if (std::holds_alternative<double>(m->value)) return std::get<double>(m->value);
    return std::nullopt;
}

std::optional<bool> GetBool(const JSONValue& value, const std::string& key) {
    const JSONValue* m = FindMember(value, key);
    if (m == nullptr || !m->isBool()) return std::nullopt;
    return std::get<bool>(m->value);
}

void SetMember(JSONValue& object, const std::string& key, JSONValue member) {
    if (!object.isObject()) {
        object.value = JSONValue::Object{};
    }
    std::get<JSONValue::Object>(object.value)[key] = std::make_shared<JSONValue>(std::move(member));
}

} // namespace mcpengine
