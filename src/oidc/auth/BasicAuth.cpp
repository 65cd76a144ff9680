//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oidc/auth/BasicAuth.cpp
// Purpose: HTTP Basic client credential extraction
//==========================================================================================================

#include <cctype>
#include <string>

#include "oidc/auth/BasicAuth.hpp"
#include "oidc/crypto/Base64.hpp"

namespace oidc::auth {

namespace {
    bool icaseEqual(char a, char b) {
        return (std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b)));
    }

    bool startsWithBasic(const std::string& s) {
        const std::string pfx = "Basic ";
        if (s.size() < pfx.size()) {
            return false;
        }
        for (size_t i = 0; i < pfx.size(); ++i) {
            if (!icaseEqual(s[i], pfx[i])) {
                return false;
            }
        }
        return true;
    }
}

std::optional<ClientCredentials> ExtractBasicCredentials(const std::string& authorizationHeader) {
    if (authorizationHeader.empty() || !startsWithBasic(authorizationHeader)) {
        return std::nullopt;
    }

    auto decoded = oidc::crypto::Base64Decode(authorizationHeader.substr(6));
    if (!decoded.has_value()) {
        return std::nullopt;
    }

    const std::string& data = decoded.value();
    std::size_t colon = data.find(':');
    if (colon == std::string::npos) {
        return std::nullopt;
    }

    ClientCredentials creds;
    creds.clientId = data.substr(0, colon);
    creds.clientSecret = data.substr(colon + 1);
    return creds;
}

std::string MakeBasicAuthorizationHeader(const std::string& clientId, const std::string& clientSecret) {
    return std::string("Basic ") + oidc::crypto::Base64Encode(clientId + ":" + clientSecret);
}

} // namespace oidc::auth
