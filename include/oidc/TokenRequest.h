//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TokenRequest.h
// Purpose: Normalized token request parameters and grant type classification
//==========================================================================================================

#pragma once

#include <set>
#include <string>

#include "oidc/FormUrlEncoded.hpp"

namespace oidc {

//==========================================================================================================
// GrantType
// Purpose: Grant state selected by the grant_type parameter. Other covers custom grants left to policy.
//==========================================================================================================
enum class GrantType {
    AuthorizationCode,
    RefreshToken,
    ClientCredentials,
    Password,
    Other
};

// Ordinal match against the registered grant type names; anything else (including empty) is Other.
GrantType ParseGrantType(const std::string& grantType);

//==========================================================================================================
// TokenRequest
// Purpose: Token request as read from the form body. Empty strings mean "absent".
// Fields:
//   isConfidential: set by the endpoint from the Validate stage outcome, never from client input.
//==========================================================================================================
struct TokenRequest {
    std::string grantType;
    std::string code;
    std::string refreshToken;
    std::string username;
    std::string password;
    std::string clientId;
    std::string clientSecret;
    std::string redirectUri;
    std::string codeVerifier;
    std::string scope;
    std::string resource;
    bool isConfidential{false};

    static TokenRequest FromForm(const FormFields& form);

    GrantType GetGrantType() const { return ParseGrantType(grantType); }
    bool IsAuthorizationCodeGrantType() const { return GetGrantType() == GrantType::AuthorizationCode; }
    bool IsRefreshTokenGrantType() const { return GetGrantType() == GrantType::RefreshToken; }
    bool IsClientCredentialsGrantType() const { return GetGrantType() == GrantType::ClientCredentials; }
    bool IsPasswordGrantType() const { return GetGrantType() == GrantType::Password; }

    // Space-delimited scope/resource lists as sets (duplicates and extra spaces collapse).
    std::set<std::string> GetScopes() const;
    std::set<std::string> GetResources() const;
};

// Split a space-delimited parameter value into its distinct non-empty tokens.
std::set<std::string> SplitSpaceDelimited(const std::string& value);

} // namespace oidc
