//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ITokenIssuer.h
// Purpose: Hand-off of a validated ticket to the component that mints wire tokens
//==========================================================================================================

#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>

#include "oidc/Ticket.h"
#include "oidc/TokenRequest.h"
#include "oidc/TokenResponse.h"

namespace oidc {

//==========================================================================================================
// ITokenIssuer
// Purpose: Turns the ticket that survived the Handle stage into access/refresh/identity tokens and persists
//          whatever the new refresh token needs. The returned response is emitted through the Apply stage.
// Notes:
//   Unset issuedAt/expiresAt on the ticket mean "assign fresh lifetimes".
//==========================================================================================================
class ITokenIssuer {
public:
    virtual ~ITokenIssuer() = default;

    virtual boost::asio::awaitable<TokenResponse> IssueTokens(const TokenRequest& request, const Ticket& ticket) = 0;
};

} // namespace oidc
