//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Options.h
// Purpose: Explicit per-endpoint configuration and collaborators of the token endpoint
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

#include "oidc/ISystemClock.h"
#include "oidc/ITicketStore.h"
#include "oidc/ITokenEndpointProvider.h"
#include "oidc/ITokenIssuer.h"

namespace oidc {

//==========================================================================================================
// TokenEndpointOptions
// Purpose: Read-only configuration shared by all requests of one endpoint.
// Fields:
//   authorizationEndpointPath: Path of the authorization endpoint; empty disables it and, with it, the
//                              authorization_code grant.
//   tokenEndpointPath: Path the hosting server routes to the token endpoint.
//   clock: Time source for expiration checks (system clock when null).
//   provider: Policy callbacks (no-op provider when null).
//   ticketStore: Code/refresh token lookup (required).
//   issuer: Token minting (required).
//==========================================================================================================
struct TokenEndpointOptions {
    std::string authorizationEndpointPath{"/connect/authorize"};
    std::string tokenEndpointPath{"/connect/token"};
    std::shared_ptr<ISystemClock> clock;
    std::shared_ptr<ITokenEndpointProvider> provider;
    std::shared_ptr<ITicketStore> ticketStore;
    std::shared_ptr<ITokenIssuer> issuer;
};

//==========================================================================================================
// LoadTokenEndpointOptionsFromEnv
// Purpose: Overlay OIDC_AUTHORIZATION_ENDPOINT_PATH and OIDC_TOKEN_ENDPOINT_PATH on `base` when set.
//          Setting OIDC_AUTHORIZATION_ENDPOINT_PATH to an empty value disables the authorization endpoint.
//==========================================================================================================
TokenEndpointOptions LoadTokenEndpointOptionsFromEnv(TokenEndpointOptions base);

} // namespace oidc
