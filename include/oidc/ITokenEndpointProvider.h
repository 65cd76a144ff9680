//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ITokenEndpointProvider.h
// Purpose: Policy callbacks invoked at each token endpoint stage
//==========================================================================================================

#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>

#include "oidc/events/TokenEndpointContexts.h"

namespace oidc {

//==========================================================================================================
// ITokenEndpointProvider
// Purpose: One asynchronous callback per stage. Each receives a context whose outcome starts as Continue;
//          the callback may leave it or move it to HandledResponse, Skipped or Rejected. The endpoint waits
//          for each callback to complete before moving on.
//==========================================================================================================
class ITokenEndpointProvider {
public:
    virtual ~ITokenEndpointProvider() = default;

    virtual boost::asio::awaitable<void> ExtractTokenRequest(ExtractTokenRequestContext& context) = 0;
    virtual boost::asio::awaitable<void> ValidateTokenRequest(ValidateTokenRequestContext& context) = 0;
    virtual boost::asio::awaitable<void> HandleTokenRequest(HandleTokenRequestContext& context) = 0;
    virtual boost::asio::awaitable<void> ApplyTokenResponse(ApplyTokenResponseContext& context) = 0;
};

//==========================================================================================================
// TokenEndpointProvider
// Purpose: Provider whose stages all leave the outcome untouched. Derive and override the stages you need.
// Notes:
//   With no override, ValidateTokenRequest neither validates nor skips client authentication, so requests
//   are treated as non-confidential, and HandleTokenRequest keeps the resolved ticket as-is.
//==========================================================================================================
class TokenEndpointProvider : public ITokenEndpointProvider {
public:
    boost::asio::awaitable<void> ExtractTokenRequest(ExtractTokenRequestContext& context) override {
        (void)context;
        co_return;
    }
    boost::asio::awaitable<void> ValidateTokenRequest(ValidateTokenRequestContext& context) override {
        (void)context;
        co_return;
    }
    boost::asio::awaitable<void> HandleTokenRequest(HandleTokenRequestContext& context) override {
        (void)context;
        co_return;
    }
    boost::asio::awaitable<void> ApplyTokenResponse(ApplyTokenResponseContext& context) override {
        (void)context;
        co_return;
    }
};

} // namespace oidc
