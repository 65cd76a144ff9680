//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ScopeContainment.h
// Purpose: Refresh requests may narrow but never widen the scopes/resources of the original grant
//==========================================================================================================

#pragma once

#include <set>
#include <string>

namespace oidc {

enum class ContainmentResult {
    Contained,      // requested is a subset of granted
    NotGranted,     // the original grant carried no entries at all
    Escalation      // requested names at least one entry the grant did not allow
};

//==========================================================================================================
// CheckContainment
// Purpose: Compare a non-empty requested set against what the original grant allowed (ordinal).
//==========================================================================================================
ContainmentResult CheckContainment(const std::set<std::string>& granted,
                                   const std::set<std::string>& requested);

bool IsSupersetOf(const std::set<std::string>& have, const std::set<std::string>& need);

} // namespace oidc
