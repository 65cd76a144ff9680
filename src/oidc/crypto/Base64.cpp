//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oidc/crypto/Base64.cpp
// Purpose: Base64 helpers on top of OpenSSL EVP block coding
//==========================================================================================================

#include <cctype>
#include <string>
#include <vector>

#include <openssl/evp.h>

#include "oidc/crypto/Base64.hpp"

namespace oidc::crypto {

namespace {

std::string encodeBlock(const unsigned char* data, std::size_t len) {
    if (len == 0) {
        return std::string();
    }
    std::string out(4 * ((len + 2) / 3), '\0');
    int n = ::EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data, static_cast<int>(len));
    out.resize(n > 0 ? static_cast<std::size_t>(n) : 0);
    return out;
}

bool isBase64Char(unsigned char c) {
    return std::isalnum(c) != 0 || c == '+' || c == '/';
}

} // namespace

std::optional<std::string> Base64Decode(const std::string& encoded) {
    std::size_t b = 0;
    std::size_t e = encoded.size();
    while (b < e && std::isspace(static_cast<unsigned char>(encoded[b])) != 0) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(encoded[e - 1])) != 0) --e;
    const std::string in = encoded.substr(b, e - b);

    if (in.empty()) {
        return std::string();
    }
    if (in.size() % 4 != 0) {
        return std::nullopt;
    }

    // EVP_DecodeBlock accepts '=' anywhere; only allow it as trailing padding.
    std::size_t padding = 0;
    for (std::size_t i = 0; i < in.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(in[i]);
        if (c == '=') {
            if (i + 2 < in.size()) {
                return std::nullopt;
            }
            ++padding;
        } else if (padding > 0 || !isBase64Char(c)) {
            return std::nullopt;
        }
    }

    std::string out(3 * (in.size() / 4), '\0');
    int n = ::EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                              reinterpret_cast<const unsigned char*>(in.data()),
                              static_cast<int>(in.size()));
    if (n < 0 || static_cast<std::size_t>(n) < padding) {
        return std::nullopt;
    }
    // EVP_DecodeBlock counts the padding positions as zero bytes.
    out.resize(static_cast<std::size_t>(n) - padding);
    return out;
}

std::string Base64Encode(const std::string& data) {
    return encodeBlock(reinterpret_cast<const unsigned char*>(data.data()), data.size());
}

std::string Base64UrlEncode(const std::vector<std::uint8_t>& data) {
    std::string out = encodeBlock(data.data(), data.size());
    while (!out.empty() && out.back() == '=') {
        out.pop_back();
    }
    for (char& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return out;
}

} // namespace oidc::crypto
