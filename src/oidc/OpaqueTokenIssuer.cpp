//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oidc/OpaqueTokenIssuer.cpp
// Purpose: Issuer of random reference tokens backed by an InMemoryTicketStore
//==========================================================================================================

#include <set>
#include <stdexcept>
#include <vector>

#include <openssl/rand.h>

#include "logging/Logger.h"
#include "oidc/OpaqueTokenIssuer.hpp"
#include "oidc/crypto/Base64.hpp"

namespace oidc {

namespace {
    constexpr const char* kOfflineAccessScope = "offline_access";

    std::string joinSpaceDelimited(const std::set<std::string>& values) {
        std::string out;
        for (const auto& v : values) {
            if (!out.empty()) {
                out.push_back(' ');
            }
            out += v;
        }
        return out;
    }
}

std::string GenerateOpaqueToken() {
    std::vector<std::uint8_t> bytes(32);
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return crypto::Base64UrlEncode(bytes);
}

OpaqueTokenIssuer::OpaqueTokenIssuer(std::shared_ptr<InMemoryTicketStore> s,
                                     std::shared_ptr<ISystemClock> c,
                                     Options o)
    : store(std::move(s)), clock(std::move(c)), opts(o) {
    if (!store) {
        throw std::invalid_argument("OpaqueTokenIssuer: a ticket store is required");
    }
    if (!clock) {
        clock = std::make_shared<SystemClock>();
    }
}

boost::asio::awaitable<TokenResponse> OpaqueTokenIssuer::IssueTokens(const TokenRequest& request,
                                                                     const Ticket& ticket) {
    const TimePoint now = clock->UtcNow();

    TokenResponse response;
    response.accessToken = GenerateOpaqueToken();
    response.tokenType = "Bearer";
    response.expiresIn = static_cast<int64_t>(opts.accessTokenLifetime.count());
    response.scope = joinSpaceDelimited(ticket.scopes);
    response.resource = joinSpaceDelimited(ticket.resources);

    if (ticket.scopes.count(kOfflineAccessScope) > 0) {
        Ticket next = ticket;
        next.issuedAt = ticket.issuedAt.value_or(now);
        next.expiresAt = ticket.expiresAt.value_or(now + opts.refreshTokenLifetime);
        if (!request.clientId.empty()) {
            next.presenters.insert(request.clientId);
        }
        next.confidential = ticket.confidential || request.isConfidential;

        response.refreshToken = GenerateOpaqueToken();
        store->AddRefreshToken(response.refreshToken, std::move(next));
    }

    LOG_DEBUG("OpaqueTokenIssuer: issued tokens for subject '{}'", ticket.principal.subject);
    co_return response;
}

} // namespace oidc
