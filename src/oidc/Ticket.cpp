//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oidc/Ticket.cpp
// Purpose: Ticket property and lifetime helpers
//==========================================================================================================

#include "oidc/Ticket.h"

namespace oidc {

std::optional<std::string> Ticket::GetProperty(const std::string& key) const {
    auto it = properties.find(key);
    if (it == properties.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

void Ticket::SetProperty(const std::string& key, const std::string& value) {
    if (value.empty()) {
        properties.erase(key);
        return;
    }
    properties[key] = value;
}

std::optional<std::string> Ticket::TakeProperty(const std::string& key) {
    auto it = properties.find(key);
    if (it == properties.end()) {
        return std::nullopt;
    }
    std::string value = std::move(it->second);
    properties.erase(it);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

bool Ticket::HasExpired(TimePoint now) const {
    if (!expiresAt.has_value()) {
        return true;
    }
    return expiresAt.value() <= now;
}

} // namespace oidc
