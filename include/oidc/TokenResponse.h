//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TokenResponse.h
// Purpose: Token endpoint response document (success tokens or OAuth2 error)
//==========================================================================================================

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "oidc/JSONValue.h"

namespace oidc {

//==========================================================================================================
// TokenResponse
// Purpose: JSON-shaped response handed to the transport collaborator. Either the error members or the
//          token members are populated; empty strings are omitted from the payload.
// Fields:
//   additional: extra string members emitted verbatim (issuer-specific parameters).
//==========================================================================================================
struct TokenResponse {
    std::string error;
    std::string errorDescription;
    std::string errorUri;

    std::string accessToken;
    std::string tokenType;
    std::optional<int64_t> expiresIn;
    std::string refreshToken;
    std::string idToken;
    std::string scope;
    std::string resource;
    std::map<std::string, std::string> additional;

    bool IsError() const { return !error.empty(); }

    JSONValue ToJSON() const;
    std::string Serialize() const;

    static TokenResponse MakeError(std::string error,
                                   std::string description,
                                   std::string uri = std::string());
};

} // namespace oidc
