//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: OpaqueTokenIssuer.hpp
// Purpose: Issuer of random reference tokens backed by an InMemoryTicketStore
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>

#include "oidc/ISystemClock.h"
#include "oidc/ITokenIssuer.h"
#include "oidc/InMemoryTicketStore.hpp"

namespace oidc {

//==========================================================================================================
// OpaqueTokenIssuer
// Purpose: Mints random base64url access tokens. When the ticket carries the "offline_access" scope, a
//          refresh token is minted too and its ticket is stored for later refresh_token grants.
// Notes:
//   Unset ticket timestamps are assigned from the clock and the configured lifetimes.
//==========================================================================================================
class OpaqueTokenIssuer : public ITokenIssuer {
public:
    struct Options {
        std::chrono::seconds accessTokenLifetime{3600};
        std::chrono::seconds refreshTokenLifetime{14 * 24 * 3600};
    };

    OpaqueTokenIssuer(std::shared_ptr<InMemoryTicketStore> store,
                      std::shared_ptr<ISystemClock> clock,
                      Options options);
    OpaqueTokenIssuer(std::shared_ptr<InMemoryTicketStore> store, std::shared_ptr<ISystemClock> clock)
        : OpaqueTokenIssuer(std::move(store), std::move(clock), Options{}) {}

    boost::asio::awaitable<TokenResponse> IssueTokens(const TokenRequest& request, const Ticket& ticket) override;

private:
    std::shared_ptr<InMemoryTicketStore> store;
    std::shared_ptr<ISystemClock> clock;
    Options opts;
};

// 32 random bytes from the OpenSSL CSPRNG, base64url-encoded. Throws std::runtime_error on RNG failure.
std::string GenerateOpaqueToken();

} // namespace oidc
