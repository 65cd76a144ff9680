//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/TokenTestHelpers.h
// Purpose: Shared fakes for token endpoint tests (exchange, clock, provider, issuer) and a coroutine runner
//==========================================================================================================

#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include "oidc/Constants.h"
#include "oidc/ISystemClock.h"
#include "oidc/ITicketStore.h"
#include "oidc/ITokenEndpointProvider.h"
#include "oidc/ITokenHttpExchange.h"
#include "oidc/ITokenIssuer.h"
#include "oidc/InMemoryTicketStore.hpp"
#include "oidc/Options.h"

namespace oidc::test {

//==========================================================================================================
// RunAwaitable
// Purpose: Drive one awaitable to completion on a private io_context and return its value (or rethrow).
//==========================================================================================================
template <typename T>
T RunAwaitable(boost::asio::awaitable<T> aw) {
    boost::asio::io_context ioc;
    std::optional<T> result;
    std::exception_ptr failure;
    boost::asio::co_spawn(ioc, std::move(aw), [&](std::exception_ptr e, T value) {
        failure = e;
        if (!e) {
            result.emplace(std::move(value));
        }
    });
    ioc.run();
    if (failure) {
        std::rethrow_exception(failure);
    }
    return std::move(*result);
}

inline void RunAwaitable(boost::asio::awaitable<void> aw) {
    boost::asio::io_context ioc;
    std::exception_ptr failure;
    boost::asio::co_spawn(ioc, std::move(aw), [&](std::exception_ptr e) { failure = e; });
    ioc.run();
    if (failure) {
        std::rethrow_exception(failure);
    }
}

class FixedClock : public ISystemClock {
public:
    explicit FixedClock(TimePoint t) : now(t) {}
    TimePoint UtcNow() const override { return now; }
    TimePoint now;
};

//==========================================================================================================
// FakeExchange
// Purpose: In-memory ITokenHttpExchange. Defaults to a form POST; every WriteResponse is recorded.
//==========================================================================================================
class FakeExchange : public ITokenHttpExchange {
public:
    std::string method{"POST"};
    std::string contentType{ContentTypes::FormUrlEncoded};
    std::map<std::string, std::string> headers;
    FormFields form;
    std::vector<TokenResponse> written;
    int formReads{0};

    FakeExchange() = default;
    explicit FakeExchange(FormFields f) : form(std::move(f)) {}

    std::string Method() const override { return method; }
    std::string ContentType() const override { return contentType; }
    std::string Header(const std::string& name) const override {
        auto it = headers.find(name);
        return it == headers.end() ? std::string() : it->second;
    }
    boost::asio::awaitable<FormFields> ReadForm() override {
        ++formReads;
        co_return form;
    }
    boost::asio::awaitable<void> WriteResponse(const TokenResponse& response) override {
        written.push_back(response);
        co_return;
    }

    const TokenResponse& Response() const {
        if (written.empty()) {
            throw std::logic_error("no response was written");
        }
        return written.back();
    }
};

//==========================================================================================================
// ScriptedProvider
// Purpose: Provider whose stages run optional callbacks and count invocations.
//==========================================================================================================
class ScriptedProvider : public ITokenEndpointProvider {
public:
    std::function<void(ExtractTokenRequestContext&)> onExtract;
    std::function<void(ValidateTokenRequestContext&)> onValidate;
    std::function<void(HandleTokenRequestContext&)> onHandle;
    std::function<void(ApplyTokenResponseContext&)> onApply;

    int extractCalls{0};
    int validateCalls{0};
    int handleCalls{0};
    int applyCalls{0};

    boost::asio::awaitable<void> ExtractTokenRequest(ExtractTokenRequestContext& context) override {
        ++extractCalls;
        if (onExtract) { onExtract(context); }
        co_return;
    }
    boost::asio::awaitable<void> ValidateTokenRequest(ValidateTokenRequestContext& context) override {
        ++validateCalls;
        if (onValidate) { onValidate(context); }
        co_return;
    }
    boost::asio::awaitable<void> HandleTokenRequest(HandleTokenRequestContext& context) override {
        ++handleCalls;
        if (onHandle) { onHandle(context); }
        co_return;
    }
    boost::asio::awaitable<void> ApplyTokenResponse(ApplyTokenResponseContext& context) override {
        ++applyCalls;
        if (onApply) { onApply(context); }
        co_return;
    }
};

//==========================================================================================================
// RecordingIssuer
// Purpose: Returns a fixed bearer token and keeps the last ticket it was asked to issue for.
//==========================================================================================================
class RecordingIssuer : public ITokenIssuer {
public:
    std::optional<Ticket> lastTicket;
    std::optional<TokenRequest> lastRequest;
    int calls{0};
    bool throwOnIssue{false};

    boost::asio::awaitable<TokenResponse> IssueTokens(const TokenRequest& request, const Ticket& ticket) override {
        ++calls;
        if (throwOnIssue) {
            throw std::runtime_error("issuer unavailable");
        }
        lastTicket = ticket;
        lastRequest = request;
        TokenResponse response;
        response.accessToken = "at-1";
        response.tokenType = "Bearer";
        response.expiresIn = 3600;
        co_return response;
    }
};

class ThrowingTicketStore : public ITicketStore {
public:
    boost::asio::awaitable<std::optional<Ticket>> ResolveAuthorizationCode(std::string code) override {
        (void)code;
        throw std::runtime_error("store offline");
        co_return std::nullopt;
    }
    boost::asio::awaitable<std::optional<Ticket>> ResolveRefreshToken(std::string refreshToken) override {
        (void)refreshToken;
        throw std::runtime_error("store offline");
        co_return std::nullopt;
    }
};

inline TimePoint TestNow() {
    return TimePoint(std::chrono::seconds(1'700'000'000));
}

//==========================================================================================================
// MakeTicket
// Purpose: Non-expired ticket issued a minute before TestNow() for the given presenters.
//==========================================================================================================
inline Ticket MakeTicket(std::set<std::string> presenters = {"cid"}) {
    Ticket t;
    t.principal.subject = "alice";
    t.presenters = std::move(presenters);
    t.issuedAt = TestNow() - std::chrono::minutes(1);
    t.expiresAt = TestNow() + std::chrono::minutes(5);
    return t;
}

//==========================================================================================================
// EndpointFixture
// Purpose: Wires an InMemoryTicketStore, a scripted provider, a recording issuer and a fixed clock.
//==========================================================================================================
struct EndpointFixture {
    std::shared_ptr<InMemoryTicketStore> store = std::make_shared<InMemoryTicketStore>();
    std::shared_ptr<ScriptedProvider> provider = std::make_shared<ScriptedProvider>();
    std::shared_ptr<RecordingIssuer> issuer = std::make_shared<RecordingIssuer>();
    std::shared_ptr<FixedClock> clock = std::make_shared<FixedClock>(TestNow());

    TokenEndpointOptions Options() const {
        TokenEndpointOptions o;
        o.clock = clock;
        o.provider = provider;
        o.ticketStore = store;
        o.issuer = issuer;
        return o;
    }
};

} // namespace oidc::test
