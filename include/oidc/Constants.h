//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Constants.h
// Purpose: OAuth2/OpenID Connect parameter names, grant types, error codes and reserved ticket properties
//==========================================================================================================

#pragma once

namespace oidc {

// Form parameter names read by the token endpoint
namespace Parameters {
    constexpr const char* GrantType = "grant_type";
    constexpr const char* Code = "code";
    constexpr const char* RefreshToken = "refresh_token";
    constexpr const char* Username = "username";
    constexpr const char* Password = "password";
    constexpr const char* ClientId = "client_id";
    constexpr const char* ClientSecret = "client_secret";
    constexpr const char* RedirectUri = "redirect_uri";
    constexpr const char* CodeVerifier = "code_verifier";
    constexpr const char* Scope = "scope";
    constexpr const char* Resource = "resource";

    // Response members
    constexpr const char* Error = "error";
    constexpr const char* ErrorDescription = "error_description";
    constexpr const char* ErrorUri = "error_uri";
    constexpr const char* AccessToken = "access_token";
    constexpr const char* TokenType = "token_type";
    constexpr const char* ExpiresIn = "expires_in";
    constexpr const char* IdToken = "id_token";
}

namespace GrantTypes {
    constexpr const char* AuthorizationCode = "authorization_code";
    constexpr const char* RefreshToken = "refresh_token";
    constexpr const char* ClientCredentials = "client_credentials";
    constexpr const char* Password = "password";
}

// RFC 6749 section 5.2 error codes
namespace Errors {
    constexpr const char* InvalidRequest = "invalid_request";
    constexpr const char* InvalidClient = "invalid_client";
    constexpr const char* InvalidGrant = "invalid_grant";
    constexpr const char* UnauthorizedClient = "unauthorized_client";
    constexpr const char* UnsupportedGrantType = "unsupported_grant_type";
    constexpr const char* InvalidScope = "invalid_scope";
    constexpr const char* ServerError = "server_error";
}

// Reserved ticket properties written when the code/refresh token was issued
namespace Properties {
    constexpr const char* RedirectUri = "redirect_uri";
    constexpr const char* CodeChallenge = "code_challenge";
    constexpr const char* CodeChallengeMethod = "code_challenge_method";
    constexpr const char* IssuedAt = "issued_at";
    constexpr const char* ExpiresAt = "expires_at";
}

namespace CodeChallengeMethods {
    constexpr const char* Plain = "plain";
    constexpr const char* Sha256 = "S256";
}

namespace ContentTypes {
    constexpr const char* FormUrlEncoded = "application/x-www-form-urlencoded";
    constexpr const char* Json = "application/json";
}

} // namespace oidc
