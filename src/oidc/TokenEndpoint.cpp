//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oidc/TokenEndpoint.cpp
// Purpose: OAuth2/OpenID Connect token request pipeline (Extract -> Validate -> Handle -> Apply)
//==========================================================================================================

#include <cctype>
#include <exception>
#include <format>
#include <stdexcept>

#include "logging/Logger.h"
#include "oidc/Constants.h"
#include "oidc/GrantResolver.h"
#include "oidc/TokenEndpoint.h"
#include "oidc/auth/BasicAuth.hpp"
#include "oidc/events/TokenEndpointContexts.h"

namespace oidc {

namespace {
    bool iequals(const std::string& a, const std::string& b) {
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
                return false;
            }
        }
        return true;
    }

    bool istartsWith(const std::string& s, const std::string& prefix) {
        return s.size() >= prefix.size() && iequals(s.substr(0, prefix.size()), prefix);
    }
}

TokenEndpoint::TokenEndpoint(TokenEndpointOptions opts) : options(std::move(opts)) {
    if (!options.ticketStore) {
        throw std::invalid_argument("TokenEndpoint: a ticket store is required");
    }
    if (!options.issuer) {
        throw std::invalid_argument("TokenEndpoint: a token issuer is required");
    }
    if (!options.clock) {
        options.clock = std::make_shared<SystemClock>();
    }
    if (!options.provider) {
        options.provider = std::make_shared<TokenEndpointProvider>();
    }
}

boost::asio::awaitable<TokenEndpointResult> TokenEndpoint::Invoke(ITokenHttpExchange& exchange) {
    FUNC_SCOPE();
    RequestState state;
    std::exception_ptr failure;
    try {
        co_return co_await process(exchange, state);
    } catch (const std::exception& e) {
        LOG_ERROR("The token request failed with an unhandled exception: {}", e.what());
        failure = std::current_exception();
    }

    // Part of the response is already on the wire; nothing consistent can be written anymore.
    if (state.responseStarted) {
        std::rethrow_exception(failure);
    }
    co_return co_await sendTokenResponse(exchange, state,
        TokenResponse::MakeError(Errors::ServerError, "An internal server error occurred."), nullptr);
}

boost::asio::awaitable<TokenEndpointResult> TokenEndpoint::process(ITokenHttpExchange& exchange,
                                                                  RequestState& state) {
    if (!iequals(exchange.Method(), "POST")) {
        LOG_ERROR("The token request was rejected because an invalid HTTP method was used: {}", exchange.Method());
        co_return co_await reject(exchange, state, Errors::InvalidRequest,
            "A malformed token request has been received: make sure to use POST.");
    }

    const std::string contentType = exchange.ContentType();
    if (contentType.empty()) {
        LOG_ERROR("The token request was rejected because the mandatory 'Content-Type' header was missing.");
        co_return co_await reject(exchange, state, Errors::InvalidRequest,
            "A malformed token request has been received: the mandatory 'Content-Type' header "
            "was missing from the POST request.");
    }

    if (!istartsWith(contentType, ContentTypes::FormUrlEncoded)) {
        LOG_ERROR("The token request was rejected because an invalid 'Content-Type' header was received: {}",
                  contentType);
        co_return co_await reject(exchange, state, Errors::InvalidRequest,
            "A malformed token request has been received: the 'Content-Type' header contained an "
            "unexpected value. Make sure to use 'application/x-www-form-urlencoded'.");
    }

    FormFields form = co_await exchange.ReadForm();
    state.request = TokenRequest::FromForm(form);
    TokenRequest& request = state.request;

    ITokenEndpointProvider& provider = *options.provider;

    ExtractTokenRequestContext extractContext(options, request);
    co_await provider.ExtractTokenRequest(extractContext);
    if (auto result = co_await applyOutcome(exchange, state, extractContext, "extract", Errors::InvalidRequest)) {
        co_return *result;
    }

    if (request.grantType.empty()) {
        LOG_ERROR("The token request was rejected because the grant type was missing.");
        co_return co_await reject(exchange, state, Errors::InvalidRequest,
            "The mandatory 'grant_type' parameter was missing.");
    }

    if (request.IsAuthorizationCodeGrantType() && options.authorizationEndpointPath.empty()) {
        LOG_ERROR("The token request was rejected because the authorization code grant was disabled.");
        co_return co_await reject(exchange, state, Errors::UnsupportedGrantType,
            "The authorization code grant is not allowed by this authorization server.");
    }

    if (request.IsAuthorizationCodeGrantType() && request.code.empty()) {
        LOG_ERROR("The token request was rejected because the authorization code was missing.");
        co_return co_await reject(exchange, state, Errors::InvalidRequest,
            "The mandatory 'code' parameter was missing.");
    }

    if (request.IsRefreshTokenGrantType() && request.refreshToken.empty()) {
        LOG_ERROR("The token request was rejected because the refresh token was missing.");
        co_return co_await reject(exchange, state, Errors::InvalidRequest,
            "The mandatory 'refresh_token' parameter was missing.");
    }

    if (request.IsPasswordGrantType() && (request.username.empty() || request.password.empty())) {
        LOG_ERROR("The token request was rejected because the resource owner credentials were missing.");
        co_return co_await reject(exchange, state, Errors::InvalidRequest,
            "The mandatory 'username' and/or 'password' parameters "
            "were missing from the grant_type=password request.");
    }

    // A malformed Basic header leaves the request without credentials; client validation fails naturally.
    if (request.clientId.empty() && request.clientSecret.empty()) {
        if (auto credentials = auth::ExtractBasicCredentials(exchange.Header("Authorization"))) {
            request.clientId = credentials->clientId;
            request.clientSecret = credentials->clientSecret;
        }
    }

    ValidateTokenRequestContext validateContext(options, request);
    co_await provider.ValidateTokenRequest(validateContext);
    request.isConfidential = validateContext.IsValidated();
    if (auto result = co_await applyOutcome(exchange, state, validateContext, "validate", Errors::InvalidClient)) {
        co_return *result;
    }

    if (validateContext.IsClientAuthenticationSkipped() && request.IsClientCredentialsGrantType()) {
        LOG_ERROR("The token request must be fully validated to use the client_credentials grant type.");
        co_return co_await reject(exchange, state, Errors::InvalidGrant,
            "Client authentication is required when using client_credentials.");
    }

    if (validateContext.IsValidated() && request.clientId.empty()) {
        LOG_ERROR("The token request was validated but the client_id was not set.");
        co_return co_await reject(exchange, state, Errors::ServerError, "An internal server error occurred.");
    }

    GrantResolution resolution = co_await ResolveGrant(*options.ticketStore, request, options.clock->UtcNow());
    if (resolution.IsError()) {
        co_return co_await sendTokenResponse(exchange, state, std::move(*resolution.error), nullptr);
    }

    HandleTokenRequestContext handleContext(options, request, std::move(resolution.ticket));
    co_await provider.HandleTokenRequest(handleContext);

    // Tokens minted from a redeemed ticket get fresh lifetimes unless policy code chose new ones.
    std::optional<Ticket>& ticket = handleContext.GetTicket();
    if (ticket.has_value() && resolution.original.has_value()) {
        if (ticket->issuedAt == resolution.original->issuedAt) {
            ticket->issuedAt.reset();
        }
        if (ticket->expiresAt == resolution.original->expiresAt) {
            ticket->expiresAt.reset();
        }
    }

    if (auto result = co_await applyOutcome(exchange, state, handleContext, "handle", Errors::InvalidGrant)) {
        co_return *result;
    }

    if (!ticket.has_value()) {
        LOG_ERROR("The token request was rejected because no authentication ticket was returned by application code.");
        co_return co_await reject(exchange, state, Errors::UnsupportedGrantType,
            "The specified grant_type parameter is not supported.");
    }

    TokenResponse response = co_await options.issuer->IssueTokens(request, *ticket);
    LOG_DEBUG("Tokens issued for grant_type={} client_id={}", request.grantType, request.clientId);
    co_return co_await sendTokenResponse(exchange, state, std::move(response), &*ticket);
}

boost::asio::awaitable<std::optional<TokenEndpointResult>> TokenEndpoint::applyOutcome(
    ITokenHttpExchange& exchange,
    RequestState& state,
    const BaseTokenContext& context,
    const char* stage,
    const char* defaultError) {
    const HookOutcome& hookOutcome = context.Outcome();

    if (std::holds_alternative<outcome::HandledResponse>(hookOutcome)) {
        LOG_DEBUG("The token request was handled by application code at the {} stage.", stage);
        co_return TokenEndpointResult::Handled;
    }

    if (std::holds_alternative<outcome::Skipped>(hookOutcome)) {
        LOG_DEBUG("The token request was skipped by application code at the {} stage.", stage);
        co_return TokenEndpointResult::NotHandled;
    }

    if (const auto* rejected = std::get_if<outcome::Rejected>(&hookOutcome)) {
        TokenResponse response = TokenResponse::MakeError(
            rejected->error.empty() ? std::string(defaultError) : rejected->error,
            rejected->description.empty()
                ? std::format("The token request was rejected by the {} stage.", stage)
                : rejected->description,
            rejected->uri);
        LOG_ERROR("The token request was rejected with the following error: {} ; {}",
                  response.error, response.errorDescription);
        co_return co_await sendTokenResponse(exchange, state, std::move(response), nullptr);
    }

    co_return std::nullopt;
}

boost::asio::awaitable<TokenEndpointResult> TokenEndpoint::reject(ITokenHttpExchange& exchange,
                                                                 RequestState& state,
                                                                 const char* error,
                                                                 const char* description) {
    co_return co_await sendTokenResponse(exchange, state, TokenResponse::MakeError(error, description), nullptr);
}

boost::asio::awaitable<TokenEndpointResult> TokenEndpoint::sendTokenResponse(ITokenHttpExchange& exchange,
                                                                            RequestState& state,
                                                                            TokenResponse response,
                                                                            const Ticket* ticket) {
    ApplyTokenResponseContext context(options, state.request, response, ticket);
    co_await options.provider->ApplyTokenResponse(context);

    const HookOutcome& hookOutcome = context.Outcome();
    if (std::holds_alternative<outcome::HandledResponse>(hookOutcome)) {
        LOG_DEBUG("The token response was handled by application code.");
        co_return TokenEndpointResult::Handled;
    }
    if (std::holds_alternative<outcome::Skipped>(hookOutcome)) {
        LOG_DEBUG("The token response was skipped by application code.");
        co_return TokenEndpointResult::NotHandled;
    }
    if (const auto* rejected = std::get_if<outcome::Rejected>(&hookOutcome)) {
        response = TokenResponse::MakeError(
            rejected->error.empty() ? std::string(Errors::ServerError) : rejected->error,
            rejected->description.empty() ? std::string("The token response was rejected by the apply stage.")
                                          : rejected->description,
            rejected->uri);
        LOG_ERROR("The token response was rejected with the following error: {} ; {}",
                  response.error, response.errorDescription);
    }

    state.responseStarted = true;
    co_await exchange.WriteResponse(response);
    co_return TokenEndpointResult::Handled;
}

} // namespace oidc
