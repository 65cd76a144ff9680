//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oidc/TokenRequest.cpp
// Purpose: Token request model helpers
//==========================================================================================================

#include "oidc/TokenRequest.h"
#include "oidc/Constants.h"

namespace oidc {

namespace {
std::string fieldOrEmpty(const FormFields& form, const char* name) {
    auto it = form.find(name);
    return (it == form.end()) ? std::string() : it->second;
}
}

GrantType ParseGrantType(const std::string& grantType) {
    if (grantType == GrantTypes::AuthorizationCode) return GrantType::AuthorizationCode;
    if (grantType == GrantTypes::RefreshToken) return GrantType::RefreshToken;
    if (grantType == GrantTypes::ClientCredentials) return GrantType::ClientCredentials;
    if (grantType == GrantTypes::Password) return GrantType::Password;
    return GrantType::Other;
}

TokenRequest TokenRequest::FromForm(const FormFields& form) {
    TokenRequest r;
    r.grantType = fieldOrEmpty(form, Parameters::GrantType);
    r.code = fieldOrEmpty(form, Parameters::Code);
    r.refreshToken = fieldOrEmpty(form, Parameters::RefreshToken);
    r.username = fieldOrEmpty(form, Parameters::Username);
    r.password = fieldOrEmpty(form, Parameters::Password);
    r.clientId = fieldOrEmpty(form, Parameters::ClientId);
    r.clientSecret = fieldOrEmpty(form, Parameters::ClientSecret);
    r.redirectUri = fieldOrEmpty(form, Parameters::RedirectUri);
    r.codeVerifier = fieldOrEmpty(form, Parameters::CodeVerifier);
    r.scope = fieldOrEmpty(form, Parameters::Scope);
    r.resource = fieldOrEmpty(form, Parameters::Resource);
    return r;
}

std::set<std::string> SplitSpaceDelimited(const std::string& value) {
    std::set<std::string> out;
    std::size_t i = 0;
    while (i < value.size()) {
        while (i < value.size() && value[i] == ' ') {
            ++i;
        }
        std::size_t j = i;
        while (j < value.size() && value[j] != ' ') {
            ++j;
        }
        if (j > i) {
            out.insert(value.substr(i, j - i));
        }
        i = j;
    }
    return out;
}

std::set<std::string> TokenRequest::GetScopes() const {
    return SplitSpaceDelimited(scope);
}

std::set<std::string> TokenRequest::GetResources() const {
    return SplitSpaceDelimited(resource);
}

} // namespace oidc
