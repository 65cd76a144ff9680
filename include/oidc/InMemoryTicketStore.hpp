//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTicketStore.hpp
// Purpose: Process-local ticket store with single-use authorization codes
//==========================================================================================================

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "oidc/ISystemClock.h"
#include "oidc/ITicketStore.h"

namespace oidc {

//==========================================================================================================
// InMemoryTicketStore
// Purpose: Thread-safe reference ITicketStore.
// Notes:
//   - An authorization code is removed as it is resolved; a second redemption (concurrent or not) yields
//     std::nullopt.
//   - Refresh tokens stay redeemable until revoked.
//   - Constructed with a clock, every Add* call first drops entries whose expiresAt has passed, so a long
//     running host does not accumulate dead tickets. Without a clock nothing is evicted.
//==========================================================================================================
class InMemoryTicketStore : public ITicketStore {
public:
    InMemoryTicketStore() = default;
    explicit InMemoryTicketStore(std::shared_ptr<ISystemClock> clock) : clock(std::move(clock)) {}

    void AddAuthorizationCode(const std::string& code, Ticket ticket);
    void AddRefreshToken(const std::string& refreshToken, Ticket ticket);
    bool RevokeRefreshToken(const std::string& refreshToken);

    std::size_t AuthorizationCodeCount() const;
    std::size_t RefreshTokenCount() const;

    // Removes expired codes and refresh tokens; returns how many were dropped (0 without a clock).
    std::size_t PurgeExpired();

    boost::asio::awaitable<std::optional<Ticket>> ResolveAuthorizationCode(std::string code) override;
    boost::asio::awaitable<std::optional<Ticket>> ResolveRefreshToken(std::string refreshToken) override;

private:
    std::optional<Ticket> takeCode(const std::string& code);
    std::optional<Ticket> findRefreshToken(const std::string& refreshToken) const;
    std::size_t purgeExpiredLocked();

    std::shared_ptr<ISystemClock> clock;
    mutable std::mutex mutex;
    std::unordered_map<std::string, Ticket> codes;
    std::unordered_map<std::string, Ticket> refreshTokens;
};

} // namespace oidc
