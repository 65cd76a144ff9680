//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oidc/InMemoryTicketStore.cpp
// Purpose: Process-local ticket store with single-use authorization codes
//==========================================================================================================

#include "oidc/InMemoryTicketStore.hpp"

namespace oidc {

void InMemoryTicketStore::AddAuthorizationCode(const std::string& code, Ticket ticket) {
    std::lock_guard<std::mutex> lk(mutex);
    purgeExpiredLocked();
    codes[code] = std::move(ticket);
}

void InMemoryTicketStore::AddRefreshToken(const std::string& refreshToken, Ticket ticket) {
    std::lock_guard<std::mutex> lk(mutex);
    purgeExpiredLocked();
    refreshTokens[refreshToken] = std::move(ticket);
}

bool InMemoryTicketStore::RevokeRefreshToken(const std::string& refreshToken) {
    std::lock_guard<std::mutex> lk(mutex);
    return refreshTokens.erase(refreshToken) > 0;
}

std::size_t InMemoryTicketStore::AuthorizationCodeCount() const {
    std::lock_guard<std::mutex> lk(mutex);
    return codes.size();
}

std::size_t InMemoryTicketStore::RefreshTokenCount() const {
    std::lock_guard<std::mutex> lk(mutex);
    return refreshTokens.size();
}

std::size_t InMemoryTicketStore::PurgeExpired() {
    std::lock_guard<std::mutex> lk(mutex);
    return purgeExpiredLocked();
}

boost::asio::awaitable<std::optional<Ticket>> InMemoryTicketStore::ResolveAuthorizationCode(std::string code) {
    co_return takeCode(code);
}

boost::asio::awaitable<std::optional<Ticket>> InMemoryTicketStore::ResolveRefreshToken(std::string refreshToken) {
    co_return findRefreshToken(refreshToken);
}

std::optional<Ticket> InMemoryTicketStore::takeCode(const std::string& code) {
    std::lock_guard<std::mutex> lk(mutex);
    auto it = codes.find(code);
    if (it == codes.end()) {
        return std::nullopt;
    }
    Ticket ticket = std::move(it->second);
    codes.erase(it);
    return ticket;
}

std::optional<Ticket> InMemoryTicketStore::findRefreshToken(const std::string& refreshToken) const {
    std::lock_guard<std::mutex> lk(mutex);
    auto it = refreshTokens.find(refreshToken);
    if (it == refreshTokens.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t InMemoryTicketStore::purgeExpiredLocked() {
    if (!clock) {
        return 0;
    }
    const TimePoint now = clock->UtcNow();
    // Tickets without a recorded expiry are kept; the grant resolver rejects them on redemption anyway.
    auto expired = [now](const auto& entry) {
        return entry.second.expiresAt.has_value() && *entry.second.expiresAt <= now;
    };
    return std::erase_if(codes, expired) + std::erase_if(refreshTokens, expired);
}

} // namespace oidc
