//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Token endpoint example server
//==========================================================================================================

#include "logging/Logger.h"
#include "oidc/Constants.h"
#include "oidc/InMemoryTicketStore.hpp"
#include "oidc/OpaqueTokenIssuer.hpp"
#include "oidc/TokenEndpoint.h"
#include "oidc/TokenHTTPServer.hpp"
#include "oidc/crypto/Pkce.hpp"
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <future>
#include <iostream>
#include <optional>
#include <thread>
#include "env/EnvVars.h"

using namespace oidc;

//==========================================================================================================
// Parses simple key=value style command-line options.
// Args:
//   argc: Argument count
//   argv: Argument values
//   key: Option name including leading dashes (e.g., "--listen")
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

//==========================================================================================================
// DemoProvider
// Purpose: One confidential client (OIDC_DEMO_CLIENT_ID / OIDC_DEMO_CLIENT_SECRET) and one public client
//          (OIDC_DEMO_PUBLIC_CLIENT_ID). client_credentials and password grants are answered with a
//          ticket for the client or the demo user (OIDC_DEMO_USERNAME / OIDC_DEMO_PASSWORD).
//==========================================================================================================
class DemoProvider : public TokenEndpointProvider {
public:
    std::string clientId{GetEnvOrDefault("OIDC_DEMO_CLIENT_ID", "demo-client")};
    std::string clientSecret{GetEnvOrDefault("OIDC_DEMO_CLIENT_SECRET", "demo-secret")};
    std::string publicClientId{GetEnvOrDefault("OIDC_DEMO_PUBLIC_CLIENT_ID", "demo-public")};
    std::string username{GetEnvOrDefault("OIDC_DEMO_USERNAME", "alice")};
    std::string password{GetEnvOrDefault("OIDC_DEMO_PASSWORD", "wonderland")};

    boost::asio::awaitable<void> ValidateTokenRequest(ValidateTokenRequestContext& context) override {
        if (context.ClientId() == clientId && crypto::FixedTimeEquals(context.ClientSecret(), clientSecret)) {
            context.Validate();
        } else if (context.ClientId() == publicClientId && context.ClientSecret().empty()) {
            context.SkipClientAuthentication();
        } else {
            context.Reject(Errors::InvalidClient, "Invalid credentials: ensure that you specified a correct client_id.");
        }
        co_return;
    }

    boost::asio::awaitable<void> HandleTokenRequest(HandleTokenRequestContext& context) override {
        const TokenRequest& request = context.Request();
        if (request.IsClientCredentialsGrantType()) {
            Ticket ticket;
            ticket.principal.subject = request.clientId;
            ticket.scopes = request.GetScopes();
            ticket.presenters.insert(request.clientId);
            context.SetTicket(std::move(ticket));
        } else if (request.IsPasswordGrantType()) {
            if (request.username != username || !crypto::FixedTimeEquals(request.password, password)) {
                context.Reject(Errors::InvalidGrant, "Invalid credentials.");
                co_return;
            }
            Ticket ticket;
            ticket.principal.subject = request.username;
            ticket.scopes = request.GetScopes();
            ticket.presenters.insert(request.clientId);
            context.SetTicket(std::move(ticket));
        }
        co_return;
    }
};

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::configureFromEnv();

    auto clock = std::make_shared<SystemClock>();
    auto store = std::make_shared<InMemoryTicketStore>(clock);
    auto provider = std::make_shared<DemoProvider>();

    // Optional pre-issued authorization code for trying the authorization_code grant with curl.
    std::string demoCode = GetEnvOrDefault("OIDC_DEMO_CODE", "");
    if (!demoCode.empty()) {
        Ticket ticket;
        ticket.principal.subject = provider->username;
        ticket.presenters.insert(provider->clientId);
        ticket.scopes = {"openid", "offline_access"};
        ticket.issuedAt = clock->UtcNow();
        ticket.expiresAt = clock->UtcNow() + std::chrono::minutes(5);
        ticket.SetProperty(Properties::RedirectUri, GetEnvOrDefault("OIDC_DEMO_REDIRECT_URI", ""));
        store->AddAuthorizationCode(demoCode, std::move(ticket));
        LOG_INFO("Demo authorization code registered for client '{}'", provider->clientId);
    }

    TokenEndpointOptions base;
    base.clock = clock;
    base.provider = provider;
    base.ticketStore = store;
    base.issuer = std::make_shared<OpaqueTokenIssuer>(store, clock);

    std::shared_ptr<TokenEndpoint> endpoint;
    try {
        endpoint = std::make_shared<TokenEndpoint>(LoadTokenEndpointOptionsFromEnv(base));
    } catch (const std::exception& e) {
        LOG_ERROR("Invalid token endpoint configuration: {}", e.what());
        return 2;
    }

    std::string listen = getArgValue(argc, argv, "--listen").value_or(GetEnvOrDefault("OIDC_LISTEN", "http://127.0.0.1:8080"));
    std::promise<void> stopped;
    std::unique_ptr<TokenHTTPServer> server;
    try {
        server = std::make_unique<TokenHTTPServer>(ParseListenUri(listen), endpoint);
        server->SetErrorHandler([](const std::string& e){
            LOG_WARN("TokenHTTPServer error: {}", e);
        });
        server->Start().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start token server at {}: {}", listen, e.what());
        return 1;
    }

    // Allow pressing Enter to exit demo
    std::thread waiter([&stopped]() {
        LOG_INFO("Press ENTER to stop the token server...");
        (void)std::getchar();
        stopped.set_value();
    });
    stopped.get_future().wait();
    if (waiter.joinable()) {
        waiter.join();
    }
    server->Stop().get();
    return 0;
}
