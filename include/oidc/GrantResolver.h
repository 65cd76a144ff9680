//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GrantResolver.h
// Purpose: Resolution and validation of the ticket behind authorization_code and refresh_token grants
//==========================================================================================================

#pragma once

#include <optional>
#include <utility>
#include <boost/asio/awaitable.hpp>

#include "oidc/ITicketStore.h"
#include "oidc/Ticket.h"
#include "oidc/TokenRequest.h"
#include "oidc/TokenResponse.h"

namespace oidc {

//==========================================================================================================
// GrantResolution
// Purpose: Either a validated ticket (plus an unmodified copy of it, kept for timestamp comparison after the
//          Handle stage), no ticket at all for grants that do not redeem one, or an error response.
//==========================================================================================================
struct GrantResolution {
    std::optional<Ticket> ticket;
    std::optional<Ticket> original;
    std::optional<TokenResponse> error;

    bool IsError() const { return error.has_value(); }
};

// Only authorization_code and refresh_token redeem a previously issued ticket.
bool RequiresTicket(GrantType grantType);

//==========================================================================================================
// ResolveGrant
// Purpose: Look the code/refresh token up through the store and validate the ticket against the request.
// Notes:
//   - Grants that do not require a ticket resolve to an empty GrantResolution without touching the store.
//   - `store` and `request` must outlive the returned awaitable.
//==========================================================================================================
boost::asio::awaitable<GrantResolution> ResolveGrant(ITicketStore& store,
                                                     const TokenRequest& request,
                                                     TimePoint now);

//==========================================================================================================
// ValidateTicket
// Purpose: Apply the redemption rules to a resolved ticket, in order: expiration, confidentiality (refresh
//          only), presenters, client_id (code only), redirect_uri, PKCE (code only), then resource and scope
//          containment (refresh only).
// Notes:
//   The reserved redirect_uri, code_challenge and code_challenge_method properties are taken out of
//   `ticket` as they are checked, so they never flow into the next ticket generation.
// Returns:
//   std::nullopt when the ticket can be redeemed, else the error response to emit.
//==========================================================================================================
std::optional<TokenResponse> ValidateTicket(Ticket& ticket, const TokenRequest& request, TimePoint now);

} // namespace oidc
