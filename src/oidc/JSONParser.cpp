//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Minimalistic JSON parser and serializer using only std library
//==========================================================================================================

#include <sstream>
#include <cctype>
#include <stdexcept>
#include <iomanip>
#include <type_traits>
#include "oidc/JSONValue.h"

namespace oidc {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) = default;
JSONValue::~JSONValue() {}

JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int64_t v) : value(v) {}
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

namespace {

// -------------------------------
// Minimal recursive JSON parser
// -------------------------------
struct JsonParser {
    const std::string& s;
    std::size_t i{0};

    explicit JsonParser(const std::string& str) : s(str) {}

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

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') throw std::runtime_error("Expected '\"' at string start");
        ++i;
        std::string out;
        bool closed = false;
        while (i < s.size()) {
            char c = s[i++];
            if (c == '"') { closed = true; break; }
            if (c != '\\') { out.push_back(c); continue; }
            if (i >= s.size()) throw std::runtime_error("Invalid escape");
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
                    if (i + 4 > s.size()) throw std::runtime_error("Invalid unicode escape");
                    unsigned int code = 0;
                    for (std::size_t k = 0; k < 4; ++k) {
                        char h = s[i + k];
                        code <<= 4;
                        if (h >= '0' && h <= '9') code += (h - '0');
                        else if (h >= 'a' && h <= 'f') code += 10 + (h - 'a');
                        else if (h >= 'A' && h <= 'F') code += 10 + (h - 'A');
                        else throw std::runtime_error("Invalid hex in unicode escape");
                    }
                    i += 4;
                    // BMP only, no surrogate pairs
                    if (code <= 0x7F) {
                        out.push_back(static_cast<char>(code));
                    } else if (code <= 0x7FF) {
                        out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
                        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
                    } else {
                        out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
                        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
                        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
                    }
                    break;
                }
                default: throw std::runtime_error("Unknown escape");
            }
        }
        if (!closed) throw std::runtime_error("Unterminated string");
        return out;
    }

    JSONValue parseNumber() {
        skipWs();
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        if (i == start) throw std::runtime_error("Unexpected character in JSON");
        std::string num = s.substr(start, i - start);
        try {
            if (!isFloat) {
                return JSONValue(static_cast<int64_t>(std::stoll(num)));
            }
            return JSONValue(std::stod(num));
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid number: " + num);
        }
    }

    JSONValue parseArray() {
        if (!match('[')) throw std::runtime_error("Expected '['");
        JSONValue::Array arr;
        if (match(']')) return JSONValue(std::move(arr));
        while (true) {
            arr.push_back(std::make_shared<JSONValue>(parseValue()));
            if (match(']')) break;
            if (!match(',')) throw std::runtime_error("Expected ',' in array");
        }
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) throw std::runtime_error("Expected '{'");
        JSONValue::Object obj;
        if (match('}')) return JSONValue(std::move(obj));
        while (true) {
            std::string key = parseString();
            if (!match(':')) throw std::runtime_error("Expected ':' after key");
            obj[key] = std::make_shared<JSONValue>(parseValue());
            if (match('}')) break;
            if (!match(',')) throw std::runtime_error("Expected ',' in object");
        }
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) throw std::runtime_error("Unexpected end of JSON");
        char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
        if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
        if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
        return parseNumber();
    }
};

void writeEscaped(std::ostringstream& oss, const std::string& v) {
    oss << '"';
    for (char c : v) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
                break;
        }
    }
    oss << '"';
}

void serializeInto(std::ostringstream& oss, const JSONValue& value) {
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else if constexpr (std::is_same_v<T, double>) {
            oss << std::to_string(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            writeEscaped(oss, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            oss << '[';
            for (std::size_t k = 0; k < v.size(); ++k) {
                if (k > 0) oss << ',';
                if (v[k]) { serializeInto(oss, *v[k]); } else { oss << "null"; }
            }
            oss << ']';
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            oss << '{';
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) oss << ',';
                first = false;
                writeEscaped(oss, key);
                oss << ':';
                if (val) { serializeInto(oss, *val); } else { oss << "null"; }
            }
            oss << '}';
        }
    }, value.get());
}

} // namespace

std::string SerializeJSON(const JSONValue& value) {
    std::ostringstream oss;
    serializeInto(oss, value);
    return oss.str();
}

JSONValue ParseJSON(const std::string& json) {
    JsonParser p(json);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != json.size()) {
        throw std::runtime_error("Trailing characters after JSON value");
    }
    return v;
}

std::string GetStringMember(const JSONValue& object, const std::string& key) {
    if (!std::holds_alternative<JSONValue::Object>(object.value)) {
        return {};
    }
    const auto& obj = std::get<JSONValue::Object>(object.value);
    auto it = obj.find(key);
    if (it == obj.end() || !it->second || !std::holds_alternative<std::string>(it->second->value)) {
        return {};
    }
    return std::get<std::string>(it->second->value);
}

} // namespace oidc
