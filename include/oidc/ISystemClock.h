//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ISystemClock.h
// Purpose: Injectable time source for ticket expiration checks
//==========================================================================================================

#pragma once

#include "oidc/Ticket.h"

namespace oidc {

class ISystemClock {
public:
    virtual ~ISystemClock() = default;
    virtual TimePoint UtcNow() const = 0;
};

class SystemClock : public ISystemClock {
public:
    TimePoint UtcNow() const override { return std::chrono::system_clock::now(); }
};

} // namespace oidc
