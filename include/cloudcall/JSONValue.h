//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONValue.h
// Purpose: JSON value type used for call parameters, parsed bodies, service descriptions and config files
//==========================================================================================================

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace cloudcall {

//==========================================================================================================
// JSONValue
// Purpose: Simplified JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
// Notes:
//   Copies share child nodes. Replace a member's pointer instead of mutating through it when the
//   original must stay untouched.
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
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    auto& get() { return value; }
    const auto& get() const { return value; }

    bool IsNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool IsObject() const { return std::holds_alternative<Object>(value); }
    bool IsArray() const { return std::holds_alternative<Array>(value); }
    bool IsString() const { return std::holds_alternative<std::string>(value); }
};

//==========================================================================================================
// ParseJSON
// Purpose: Parses a complete JSON document.
// Args:
//   text: JSON text. Trailing non-whitespace is rejected.
// Returns:
//   Parsed JSONValue.
// Throws:
//   std::runtime_error on malformed input.
//==========================================================================================================
JSONValue ParseJSON(const std::string& text);

//==========================================================================================================
// SerializeJSON
// Purpose: Compact JSON serialization (object member order follows the underlying map).
//==========================================================================================================
std::string SerializeJSON(const JSONValue& value);

//------------------------------ Lookup helpers ------------------------------
// Returns the member value or nullptr when v is not an object or the key is absent.
const JSONValue* FindMember(const JSONValue& v, const std::string& key);

// Resolves a dotted path such as "Result.NextToken"; nullptr when any segment is missing.
const JSONValue* FindPath(const JSONValue& v, const std::string& dottedPath);

// Returns the string at key, or std::nullopt when absent or not a string.
std::optional<std::string> GetString(const JSONValue& v, const std::string& key);

// Returns a bool at key, or std::nullopt when absent or not a bool.
std::optional<bool> GetBool(const JSONValue& v, const std::string& key);

// Sets obj[key] = value on an object value (converts a null value into an empty object first).
void SetMember(JSONValue& obj, const std::string& key, JSONValue value);

// Sets a value at a dotted path, creating intermediate objects.
void SetPath(JSONValue& obj, const std::string& dottedPath, JSONValue value);

// Human-readable name of the held alternative ("string", "integer", "object", ...).
const char* TypeName(const JSONValue& v);

// Structural equality (objects compare by key set and member values).
bool operator==(const JSONValue& a, const JSONValue& b);
inline bool operator!=(const JSONValue& a, const JSONValue& b) { return !(a == b); }

} // namespace cloudcall
