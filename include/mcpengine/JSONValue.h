//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONValue.h
// Purpose: Dynamic JSON value used at the codec boundary, with a strict parser and a serializer.
//==========================================================================================================

#pragma once

#include <cstdint>
#include <memory>
#include <memory_resource>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace mcpengine {

//==========================================================================================================
// JSONValue
// Purpose: JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
// Notes:
//   Integers that fit int64_t parse as int64_t; everything else numeric parses as double.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&) noexcept;
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&) noexcept;
    ~JSONValue();

    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    bool isNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool isBool() const { return std::holds_alternative<bool>(value); }
    bool isInteger() const { return std::holds_alternative<int64_t>(value); }
    bool isNumber() const { return isInteger() || std::holds_alternative<double>(value); }
    bool isString() const { return std::holds_alternative<std::string>(value); }
    bool isArray() const { return std::holds_alternative<Array>(value); }
    bool isObject() const { return std::holds_alternative<Object>(value); }

    // Human-readable name of the held type ("null", "boolean", "integer", "number", "string", "array", "object")
    const char* typeName() const;
};

// Deep structural equality. Integer 1 and double 1.0 compare unequal.
bool operator==(const JSONValue& a, const JSONValue& b);
inline bool operator!=(const JSONValue& a, const JSONValue& b) { return !(a == b); }

//==========================================================================================================
// JsonParseError
// Purpose: Thrown by ParseJSON for malformed input.
// Fields:
//   offset(): byte offset where parsing failed.
//==========================================================================================================
class JsonParseError : public std::runtime_error {
public:
    JsonParseError(const std::string& what, std::size_t offset)
        : std::runtime_error(what), errorOffset(offset) {}
    std::size_t offset() const { return errorOffset; }
private:
    std::size_t errorOffset;
};

//==========================================================================================================
// ParseJSON
// Purpose: Parses a complete JSON document. Trailing non-whitespace is rejected.
// Args:
//   text: UTF-8 JSON text.
// Returns:
//   The parsed value.
// Throws:
//   JsonParseError on malformed input or nesting deeper than 512 levels.
//==========================================================================================================
JSONValue ParseJSON(const std::string& text);

//==========================================================================================================
// SerializeJSON
// Purpose: Compact serialization. Doubles use the shortest round-trip form; NaN and infinities become null.
//==========================================================================================================
std::string SerializeJSON(const JSONValue& value);

// Same output, with the buffer allocated from memory (a request arena on the dispatch path).
std::pmr::string SerializeJSON(const JSONValue& value, std::pmr::memory_resource* memory);

// Appends the compact serialization of value to out.
void AppendJSON(std::string& out, const JSONValue& value);
void AppendJSON(std::pmr::string& out, const JSONValue& value);

// Member lookup on an object value; null when value is not an object or the key is missing.
const JSONValue* FindMember(const JSONValue& value, const std::string& key);

// Typed member accessors; std::nullopt when missing or of another type.
std::optional<std::string> GetString(const JSONValue& value, const std::string& key);
std::optional<int64_t> GetInteger(const JSONValue& value, const std::string& key);
std::optional<double> GetNumber(const JSONValue& value, const std::string& key);
std::optional<bool> GetBool(const JSONValue& value, const std::string& key);

// Inserts or replaces a member on an object value (converting a non-object value into an empty object first).
void SetMember(JSONValue& object, const std::string& key, JSONValue member);

} // namespace mcpengine
