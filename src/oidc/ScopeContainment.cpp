//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oidc/ScopeContainment.cpp
// Purpose: Scope/resource containment checks for refresh token requests
//==========================================================================================================

#include <algorithm>

#include "oidc/ScopeContainment.h"

namespace oidc {

bool IsSupersetOf(const std::set<std::string>& have, const std::set<std::string>& need) {
    return std::includes(have.begin(), have.end(), need.begin(), need.end());
}

ContainmentResult CheckContainment(const std::set<std::string>& granted,
                                   const std::set<std::string>& requested) {
    if (granted.empty()) {
        return ContainmentResult::NotGranted;
    }
    if (!IsSupersetOf(granted, requested)) {
        return ContainmentResult::Escalation;
    }
    return ContainmentResult::Contained;
}

} // namespace oidc
