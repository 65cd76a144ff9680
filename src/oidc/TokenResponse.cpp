//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oidc/TokenResponse.cpp
// Purpose: Token endpoint response serialization
//==========================================================================================================

#include <memory>

#include "oidc/TokenResponse.h"
#include "oidc/Constants.h"

namespace oidc {

namespace {
void putString(JSONValue::Object& obj, const std::string& key, const std::string& value) {
    if (!value.empty()) {
        obj[key] = std::make_shared<JSONValue>(value);
    }
}
}

JSONValue TokenResponse::ToJSON() const {
    JSONValue::Object obj;
    for (const auto& [key, value] : additional) {
        putString(obj, key, value);
    }
    putString(obj, Parameters::Error, error);
    putString(obj, Parameters::ErrorDescription, errorDescription);
    putString(obj, Parameters::ErrorUri, errorUri);
    putString(obj, Parameters::AccessToken, accessToken);
    putString(obj, Parameters::TokenType, tokenType);
    if (expiresIn.has_value()) {
        obj[Parameters::ExpiresIn] = std::make_shared<JSONValue>(expiresIn.value());
    }
    putString(obj, Parameters::RefreshToken, refreshToken);
    putString(obj, Parameters::IdToken, idToken);
    putString(obj, Parameters::Scope, scope);
    putString(obj, Parameters::Resource, resource);
    return JSONValue{std::move(obj)};
}

std::string TokenResponse::Serialize() const {
    return SerializeJSON(ToJSON());
}

TokenResponse TokenResponse::MakeError(std::string error, std::string description, std::string uri) {
    TokenResponse r;
    r.error = std::move(error);
    r.errorDescription = std::move(description);
    r.errorUri = std::move(uri);
    return r;
}

} // namespace oidc
