//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TokenEndpoint.h
// Purpose: OAuth2/OpenID Connect token request pipeline (Extract -> Validate -> Handle -> Apply)
//==========================================================================================================

#pragma once

#include <optional>
#include <utility>
#include <boost/asio/awaitable.hpp>

#include "oidc/ITokenHttpExchange.h"
#include "oidc/Options.h"
#include "oidc/Ticket.h"
#include "oidc/TokenRequest.h"
#include "oidc/TokenResponse.h"

namespace oidc {

class BaseTokenContext;

enum class TokenEndpointResult {
    Handled,    // a response was written, by the endpoint or by policy code
    NotHandled  // policy code skipped the request; the host should fall through to its next handler
};

//==========================================================================================================
// TokenEndpoint
// Purpose: Processes one token request per Invoke() call against a fixed set of options.
// Notes:
//   - Every protocol failure is written as an OAuth2 error document through the Apply stage; exceptions
//     thrown by policy code, the ticket store or the issuer are logged and written as server_error.
//   - The endpoint holds no per-request state, so one instance may serve concurrent requests as long as
//     the collaborators in its options are safe to share.
//==========================================================================================================
class TokenEndpoint {
public:
    // Throws std::invalid_argument when options.ticketStore or options.issuer is null.
    explicit TokenEndpoint(TokenEndpointOptions options);

    const TokenEndpointOptions& Options() const { return options; }

    boost::asio::awaitable<TokenEndpointResult> Invoke(ITokenHttpExchange& exchange);

private:
    struct RequestState {
        TokenRequest request;
        bool responseStarted{false};
    };

    boost::asio::awaitable<TokenEndpointResult> process(ITokenHttpExchange& exchange, RequestState& state);

    boost::asio::awaitable<std::optional<TokenEndpointResult>> applyOutcome(ITokenHttpExchange& exchange,
                                                                             RequestState& state,
                                                                             const BaseTokenContext& context,
                                                                             const char* stage,
                                                                             const char* defaultError);

    boost::asio::awaitable<TokenEndpointResult> reject(ITokenHttpExchange& exchange,
                                                       RequestState& state,
                                                       const char* error,
                                                       const char* description);

    boost::asio::awaitable<TokenEndpointResult> sendTokenResponse(ITokenHttpExchange& exchange,
                                                                  RequestState& state,
                                                                  TokenResponse response,
                                                                  const Ticket* ticket);

    TokenEndpointOptions options;
};

} // namespace oidc
