//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oidc/FormUrlEncoded.cpp
// Purpose: application/x-www-form-urlencoded encoding and decoding
//==========================================================================================================

#include <sstream>
#include <string>

#include "oidc/FormUrlEncoded.hpp"

namespace oidc {

namespace {

int hexValue(char h) {
    if (h >= '0' && h <= '9') return h - '0';
    if (h >= 'a' && h <= 'f') return 10 + (h - 'a');
    if (h >= 'A' && h <= 'F') return 10 + (h - 'A');
    return -1;
}

std::string urlDecodeForm(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < s.size() && hexValue(s[i + 1]) >= 0 && hexValue(s[i + 2]) >= 0) {
            out.push_back(static_cast<char>((hexValue(s[i + 1]) << 4) | hexValue(s[i + 2])));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace

FormFields ParseFormUrlEncoded(const std::string& body) {
    FormFields fields;
    std::size_t start = 0;
    while (start <= body.size()) {
        std::size_t amp = body.find('&', start);
        if (amp == std::string::npos) {
            amp = body.size();
        }
        std::string pair = body.substr(start, amp - start);
        if (!pair.empty()) {
            std::size_t eq = pair.find('=');
            std::string name = urlDecodeForm(eq == std::string::npos ? pair : pair.substr(0, eq));
            std::string value = (eq == std::string::npos) ? std::string() : urlDecodeForm(pair.substr(eq + 1));
            if (!name.empty()) {
                fields.emplace(std::move(name), std::move(value));
            }
        }
        start = amp + 1;
    }
    return fields;
}

std::string UrlEncodeForm(const std::string& s) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else if (c == ' ') {
            oss << '+';
        } else {
            const char* hex = "0123456789ABCDEF";
            oss << '%' << hex[(c >> 4) & 0xFu] << hex[c & 0xFu];
        }
    }
    return oss.str();
}

} // namespace oidc
