//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Ticket.h
// Purpose: Resolved authorization decision carried by an authorization code or refresh token
//==========================================================================================================

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

namespace oidc {

using TimePoint = std::chrono::system_clock::time_point;

//==========================================================================================================
// Principal
// Purpose: Opaque identity payload; the endpoint never interprets it, it only flows it to the issuer.
//==========================================================================================================
struct Principal {
    std::string subject;
    std::unordered_map<std::string, std::string> claims;
};

//==========================================================================================================
// Ticket
// Purpose: Previously granted authorization decision reconstructed from a code or refresh token.
// Fields:
//   properties: free-form string properties, including the reserved redirect_uri, code_challenge and
//               code_challenge_method entries (see Properties in Constants.h).
//   presenters: client identifiers allowed to redeem the ticket.
//   scopes/resources: what the original grant allowed.
//   issuedAt/expiresAt: lifetime of the artifact; unset means unknown.
//   confidential: true when the ticket was issued to a fully authenticated client.
//==========================================================================================================
struct Ticket {
    Principal principal;
    std::map<std::string, std::string> properties;
    std::set<std::string> presenters;
    std::set<std::string> scopes;
    std::set<std::string> resources;
    std::optional<TimePoint> issuedAt;
    std::optional<TimePoint> expiresAt;
    bool confidential{false};

    std::optional<std::string> GetProperty(const std::string& key) const;

    // An empty value removes the property.
    void SetProperty(const std::string& key, const std::string& value);

    //==========================================================================================================
    // TakeProperty
    // Purpose: Read a property and remove it in the same step so it cannot flow into the next ticket.
    // Returns:
    //   The stored value, or std::nullopt when absent or empty.
    //==========================================================================================================
    std::optional<std::string> TakeProperty(const std::string& key);

    bool IsConfidential() const { return confidential; }

    // True when no expiration is set or it is not strictly after `now`.
    bool HasExpired(TimePoint now) const;
};

} // namespace oidc
