//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONValue.h
// Purpose: Minimal JSON value used for token endpoint payloads
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <variant>
#include <unordered_map>
#include <vector>

namespace oidc {

//==========================================================================================================
// JSONValue
// Purpose: Simplified JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
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
};

//==========================================================================================================
// SerializeJSON
// Purpose: Compact JSON text for a value. Object member order is unspecified.
//==========================================================================================================
std::string SerializeJSON(const JSONValue& value);

//==========================================================================================================
// ParseJSON
// Purpose: Parse a complete JSON document.
// Throws:
//   std::runtime_error on malformed input or trailing characters.
//==========================================================================================================
JSONValue ParseJSON(const std::string& json);

//==========================================================================================================
// GetStringMember
// Purpose: Returns the string member `key` of an object value, or an empty string when the value is not an
//          object, the member is absent, or it is not a string.
//==========================================================================================================
std::string GetStringMember(const JSONValue& object, const std::string& key);

} // namespace oidc
