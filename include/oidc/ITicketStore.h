//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ITicketStore.h
// Purpose: Lookup of the tickets behind authorization codes and refresh tokens
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <boost/asio/awaitable.hpp>

#include "oidc/Ticket.h"

namespace oidc {

//==========================================================================================================
// ITicketStore
// Purpose: Decodes/looks up a presented code or refresh token.
// Notes:
//   - Unknown, undecodable, revoked or already-consumed artifacts yield std::nullopt (not an exception).
//   - Implementations must make an authorization code redeemable at most once, including under concurrent
//     redemption attempts.
//==========================================================================================================
class ITicketStore {
public:
    virtual ~ITicketStore() = default;

    virtual boost::asio::awaitable<std::optional<Ticket>> ResolveAuthorizationCode(std::string code) = 0;
    virtual boost::asio::awaitable<std::optional<Ticket>> ResolveRefreshToken(std::string refreshToken) = 0;
};

} // namespace oidc
