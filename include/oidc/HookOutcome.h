//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HookOutcome.h
// Purpose: Result of a policy hook invocation at any token endpoint stage
//==========================================================================================================

#pragma once

#include <string>
#include <variant>

namespace oidc {

namespace outcome {
    // Built-in processing of the stage proceeds.
    struct Continue {};
    // Policy code already produced the complete HTTP response; the endpoint stops and reports "handled".
    struct HandledResponse {};
    // Policy code declines; the endpoint stops and reports "not handled" so the host can fall through.
    struct Skipped {};
    // The request is refused. Empty members are replaced by stage defaults when the error is emitted.
    struct Rejected {
        std::string error;
        std::string description;
        std::string uri;
    };
}

using HookOutcome = std::variant<outcome::Continue, outcome::HandledResponse, outcome::Skipped, outcome::Rejected>;

} // namespace oidc
