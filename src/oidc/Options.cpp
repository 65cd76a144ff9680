//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oidc/Options.cpp
// Purpose: Environment overlay for token endpoint options
//==========================================================================================================

#include "env/EnvVars.h"
#include "oidc/Options.h"

namespace oidc {

TokenEndpointOptions LoadTokenEndpointOptionsFromEnv(TokenEndpointOptions base) {
    base.authorizationEndpointPath = GetEnvOrDefault("OIDC_AUTHORIZATION_ENDPOINT_PATH", base.authorizationEndpointPath);
    base.tokenEndpointPath = GetEnvOrDefault("OIDC_TOKEN_ENDPOINT_PATH", base.tokenEndpointPath);
    return base;
}

} // namespace oidc
