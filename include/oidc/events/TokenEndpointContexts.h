//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TokenEndpointContexts.h
// Purpose: Mutable contexts handed to policy code at the Extract, Validate, Handle and Apply stages
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "oidc/HookOutcome.h"
#include "oidc/Ticket.h"
#include "oidc/TokenRequest.h"
#include "oidc/TokenResponse.h"

namespace oidc {

struct TokenEndpointOptions;

//==========================================================================================================
// BaseTokenContext
// Purpose: Common state of every stage context: the endpoint options and the hook outcome, which starts as
//          Continue and is moved by exactly one of HandleResponse/SkipHandler/Reject (the last call wins).
//==========================================================================================================
class BaseTokenContext {
public:
    explicit BaseTokenContext(const TokenEndpointOptions& options) : options(options) {}
    virtual ~BaseTokenContext() = default;

    const TokenEndpointOptions& Options() const { return options; }
    const HookOutcome& Outcome() const { return hookOutcome; }

    void HandleResponse() { hookOutcome = outcome::HandledResponse{}; }
    void SkipHandler() { hookOutcome = outcome::Skipped{}; }
    void Reject(std::string error = std::string(),
                std::string description = std::string(),
                std::string uri = std::string()) {
        hookOutcome = outcome::Rejected{std::move(error), std::move(description), std::move(uri)};
    }

    bool IsHandledResponse() const { return std::holds_alternative<outcome::HandledResponse>(hookOutcome); }
    bool IsSkipped() const { return std::holds_alternative<outcome::Skipped>(hookOutcome); }
    bool IsRejected() const { return std::holds_alternative<outcome::Rejected>(hookOutcome); }

protected:
    void Continue() { hookOutcome = outcome::Continue{}; }

private:
    const TokenEndpointOptions& options;
    HookOutcome hookOutcome{outcome::Continue{}};
};

//==========================================================================================================
// ExtractTokenRequestContext
// Purpose: Raised right after the form body has been read, before any built-in parameter check. Policy
//          code may rewrite request parameters here.
//==========================================================================================================
class ExtractTokenRequestContext : public BaseTokenContext {
public:
    ExtractTokenRequestContext(const TokenEndpointOptions& options, TokenRequest& request)
        : BaseTokenContext(options), request(request) {}

    TokenRequest& Request() { return request; }

private:
    TokenRequest& request;
};

//==========================================================================================================
// ValidateTokenRequestContext
// Purpose: Raised once the request is structurally valid and Basic credentials were extracted. Policy
//          code authenticates the client here.
// Methods:
//   Validate(): the client was fully authenticated; the request becomes confidential.
//   Validate(clientId): same, and flows the authenticated client_id into the request.
//   SkipClientAuthentication(): public client; no authentication was performed.
//==========================================================================================================
class ValidateTokenRequestContext : public BaseTokenContext {
public:
    enum class ClientAuthentication { None, Validated, Skipped };

    ValidateTokenRequestContext(const TokenEndpointOptions& options, TokenRequest& request)
        : BaseTokenContext(options), request(request) {}

    TokenRequest& Request() { return request; }
    const std::string& ClientId() const { return request.clientId; }
    const std::string& ClientSecret() const { return request.clientSecret; }

    void Validate() {
        clientAuthentication = ClientAuthentication::Validated;
        Continue();
    }

    void Validate(const std::string& clientId) {
        request.clientId = clientId;
        Validate();
    }

    void SkipClientAuthentication() {
        clientAuthentication = ClientAuthentication::Skipped;
        Continue();
    }

    bool IsValidated() const {
        return clientAuthentication == ClientAuthentication::Validated && !IsRejected();
    }

    bool IsClientAuthenticationSkipped() const {
        return clientAuthentication == ClientAuthentication::Skipped && !IsRejected();
    }

private:
    TokenRequest& request;
    ClientAuthentication clientAuthentication{ClientAuthentication::None};
};

//==========================================================================================================
// HandleTokenRequestContext
// Purpose: Raised after grant resolution. Carries the validated ticket for authorization_code and
//          refresh_token grants (none for other grants); policy code may replace or clear it. Without a
//          ticket after this stage the grant is reported as unsupported.
//==========================================================================================================
class HandleTokenRequestContext : public BaseTokenContext {
public:
    HandleTokenRequestContext(const TokenEndpointOptions& options,
                              const TokenRequest& request,
                              std::optional<Ticket> ticket)
        : BaseTokenContext(options), request(request), ticket(std::move(ticket)) {}

    const TokenRequest& Request() const { return request; }

    std::optional<Ticket>& GetTicket() { return ticket; }
    const std::optional<Ticket>& GetTicket() const { return ticket; }
    void SetTicket(Ticket t) { ticket = std::move(t); }
    void ClearTicket() { ticket.reset(); }

private:
    const TokenRequest& request;
    std::optional<Ticket> ticket;
};

//==========================================================================================================
// ApplyTokenResponseContext
// Purpose: Raised for every response just before it is written. Policy code may edit the response, write
//          its own (HandleResponse), defer to the host (SkipHandler) or turn it into an error (Reject).
//==========================================================================================================
class ApplyTokenResponseContext : public BaseTokenContext {
public:
    ApplyTokenResponseContext(const TokenEndpointOptions& options,
                              const TokenRequest& request,
                              TokenResponse& response,
                              const Ticket* ticket)
        : BaseTokenContext(options), request(request), response(response), ticket(ticket) {}

    const TokenRequest& Request() const { return request; }
    TokenResponse& Response() { return response; }

    // Ticket the response was issued for; null for error responses.
    const Ticket* GetTicket() const { return ticket; }

private:
    const TokenRequest& request;
    TokenResponse& response;
    const Ticket* ticket;
};

} // namespace oidc
