//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BasicAuth.hpp
// Purpose: Client credential extraction from an HTTP Basic Authorization header (RFC 6749 section 2.3.1)
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

namespace oidc::auth {

struct ClientCredentials {
    std::string clientId;
    std::string clientSecret;
};

//==========================================================================================================
// ExtractBasicCredentials
// Purpose: Parse "Basic <base64(id:secret)>" (scheme is case-insensitive) and split on the first colon.
// Returns:
//   Credentials on success; std::nullopt when the header is empty, uses another scheme, is not valid
//   base64, or has no colon. Never throws for malformed input.
//==========================================================================================================
std::optional<ClientCredentials> ExtractBasicCredentials(const std::string& authorizationHeader);

//==========================================================================================================
// MakeBasicAuthorizationHeader
// Purpose: Build the header value a client would send for the given credentials.
//==========================================================================================================
std::string MakeBasicAuthorizationHeader(const std::string& clientId, const std::string& clientSecret);

} // namespace oidc::auth
