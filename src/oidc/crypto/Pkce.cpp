//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oidc/crypto/Pkce.cpp
// Purpose: PKCE S256/plain verification using OpenSSL SHA-256 and constant-time comparison
//==========================================================================================================

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include "oidc/Constants.h"
#include "oidc/crypto/Base64.hpp"
#include "oidc/crypto/Pkce.hpp"

namespace oidc::crypto {

std::string ComputeS256Challenge(const std::string& verifier) {
    std::vector<std::uint8_t> digest(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    if (::EVP_Digest(verifier.data(), verifier.size(), digest.data(), &len, ::EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(SHA-256) failed");
    }
    digest.resize(len);
    return Base64UrlEncode(digest);
}

bool FixedTimeEquals(const std::string& a, const std::string& b) {
    const std::size_t n = std::max(a.size(), b.size());
    std::string pa(a);
    std::string pb(b);
    pa.resize(n, '\0');
    pb.resize(n, '\0');
    const int diff = (n == 0) ? 0 : ::CRYPTO_memcmp(pa.data(), pb.data(), n);
    return static_cast<bool>((diff == 0) & (a.size() == b.size()));
}

bool VerifyCodeVerifier(const std::string& challenge,
                        const std::string& method,
                        const std::string& verifier) {
    if (method.empty() || method == CodeChallengeMethods::Plain) {
        return FixedTimeEquals(verifier, challenge);
    }
    if (method == CodeChallengeMethods::Sha256) {
        return FixedTimeEquals(ComputeS256Challenge(verifier), challenge);
    }
    return false;
}

} // namespace oidc::crypto
