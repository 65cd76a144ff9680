//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oidc/GrantResolver.cpp
// Purpose: Resolution and validation of the ticket behind authorization_code and refresh_token grants
//==========================================================================================================

#include <format>

#include "logging/Logger.h"
#include "oidc/Constants.h"
#include "oidc/GrantResolver.h"
#include "oidc/ScopeContainment.h"
#include "oidc/crypto/Pkce.hpp"

namespace oidc {

namespace {
    TokenResponse invalidGrant(const char* description) {
        return TokenResponse::MakeError(Errors::InvalidGrant, description);
    }

    std::optional<TokenResponse> checkContainment(const std::set<std::string>& granted,
                                                  const std::set<std::string>& requested,
                                                  const char* parameter) {
        switch (CheckContainment(granted, requested)) {
            case ContainmentResult::Contained:
                return std::nullopt;
            case ContainmentResult::NotGranted:
                LOG_ERROR("The token request was rejected because the '{}' parameter was not allowed.", parameter);
                return TokenResponse::MakeError(Errors::InvalidGrant,
                    std::format("Token request cannot contain a {} parameter "
                                "if the authorization request didn't contain one", parameter));
            case ContainmentResult::Escalation:
                break;
        }
        LOG_ERROR("The token request was rejected because the '{}' parameter was not valid.", parameter);
        return TokenResponse::MakeError(Errors::InvalidGrant,
            std::format("Token request doesn't contain a valid {} parameter", parameter));
    }
}

bool RequiresTicket(GrantType grantType) {
    return grantType == GrantType::AuthorizationCode || grantType == GrantType::RefreshToken;
}

boost::asio::awaitable<GrantResolution> ResolveGrant(ITicketStore& store,
                                                     const TokenRequest& request,
                                                     TimePoint now) {
    GrantResolution resolution;
    const GrantType grantType = request.GetGrantType();
    if (!RequiresTicket(grantType)) {
        co_return resolution;
    }

    std::optional<Ticket> ticket;
    if (grantType == GrantType::AuthorizationCode) {
        ticket = co_await store.ResolveAuthorizationCode(request.code);
    } else {
        ticket = co_await store.ResolveRefreshToken(request.refreshToken);
    }

    if (!ticket.has_value()) {
        LOG_ERROR("The token request was rejected because the authorization code or the refresh token was invalid.");
        resolution.error = invalidGrant("Invalid ticket");
        co_return resolution;
    }

    resolution.original = ticket;
    if (auto error = ValidateTicket(*ticket, request, now)) {
        resolution.error = std::move(error);
        resolution.original.reset();
        co_return resolution;
    }

    resolution.ticket = std::move(ticket);
    co_return resolution;
}

std::optional<TokenResponse> ValidateTicket(Ticket& ticket, const TokenRequest& request, TimePoint now) {
    const bool isCode = request.IsAuthorizationCodeGrantType();
    const bool isRefresh = request.IsRefreshTokenGrantType();

    if (ticket.HasExpired(now)) {
        LOG_ERROR("The token request was rejected because the authorization code or the refresh token was expired.");
        return invalidGrant("Expired ticket");
    }

    // Tickets issued to an authenticated client can only be refreshed by an authenticated client.
    if (isRefresh && !request.isConfidential && ticket.IsConfidential()) {
        LOG_ERROR("The token request was rejected because client authentication was required to use the "
                  "confidential refresh token.");
        return invalidGrant("Client authentication is required to use this ticket");
    }

    const std::set<std::string>& presenters = ticket.presenters;
    if (isCode && presenters.empty()) {
        LOG_ERROR("The token request was rejected because the authorization code didn't contain any valid presenter.");
        return TokenResponse::MakeError(Errors::ServerError, "An internal server error occurred.");
    }

    if (isCode && request.clientId.empty()) {
        LOG_ERROR("The token request was rejected because the mandatory 'client_id' was missing.");
        return TokenResponse::MakeError(Errors::ServerError, "An internal server error occurred.");
    }

    if (!request.clientId.empty() && !presenters.empty() && presenters.count(request.clientId) == 0) {
        LOG_ERROR("The token request was rejected because the authorization code was issued to a different client.");
        return invalidGrant("Ticket does not contain matching client_id");
    }

    // Refresh tickets keep their redirect_uri so it flows into the next refresh token.
    if (isCode) {
        if (auto redirectUri = ticket.TakeProperty(Properties::RedirectUri)) {
            if (request.redirectUri.empty()) {
                LOG_ERROR("The token request was rejected because the mandatory 'redirect_uri' was missing.");
                return TokenResponse::MakeError(Errors::InvalidRequest,
                                                "redirect_uri was missing from the token request");
            }
            if (request.redirectUri != *redirectUri) {
                LOG_ERROR("The token request was rejected because the 'redirect_uri' was invalid.");
                return invalidGrant("Authorization code does not contain matching redirect_uri");
            }
        }

        auto challenge = ticket.TakeProperty(Properties::CodeChallenge);
        auto method = ticket.TakeProperty(Properties::CodeChallengeMethod);
        if (challenge.has_value()) {
            if (request.codeVerifier.empty()) {
                LOG_ERROR("The token request was rejected because the required 'code_verifier' was missing.");
                return invalidGrant("The required 'code_verifier' was missing from the token request.");
            }
            if (!crypto::VerifyCodeVerifier(*challenge, method.value_or(std::string()), request.codeVerifier)) {
                LOG_ERROR("The token request was rejected because the 'code_verifier' was invalid.");
                return invalidGrant("The specified 'code_verifier' was invalid.");
            }
        }
    }

    if (isRefresh && !request.resource.empty()) {
        if (auto error = checkContainment(ticket.resources, request.GetResources(), Parameters::Resource)) {
            return error;
        }
    }

    if (isRefresh && !request.scope.empty()) {
        if (auto error = checkContainment(ticket.scopes, request.GetScopes(), Parameters::Scope)) {
            return error;
        }
    }

    return std::nullopt;
}

} // namespace oidc
