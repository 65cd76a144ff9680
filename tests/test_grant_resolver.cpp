//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_grant_resolver.cpp
// Purpose: GoogleTests for ticket resolution and the per-grant redemption rules
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>

#include "oidc/Constants.h"
#include "oidc/GrantResolver.h"
#include "oidc/InMemoryTicketStore.hpp"
#include "oidc/crypto/Pkce.hpp"
#include "TokenTestHelpers.h"

using namespace oidc;
using namespace oidc::test;
using namespace std::chrono;

namespace {

TokenRequest codeRequest(const std::string& clientId = "cid") {
    TokenRequest r;
    r.grantType = GrantTypes::AuthorizationCode;
    r.code = "code-1";
    r.clientId = clientId;
    return r;
}

TokenRequest refreshRequest(const std::string& clientId = "cid") {
    TokenRequest r;
    r.grantType = GrantTypes::RefreshToken;
    r.refreshToken = "rt-1";
    r.clientId = clientId;
    return r;
}

void expectError(const std::optional<TokenResponse>& r, const char* error, const std::string& description) {
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->error, error);
    EXPECT_EQ(r->errorDescription, description);
}

} // namespace

TEST(GrantResolver, OnlyCodeAndRefreshRequireTicket) {
    EXPECT_TRUE(RequiresTicket(GrantType::AuthorizationCode));
    EXPECT_TRUE(RequiresTicket(GrantType::RefreshToken));
    EXPECT_FALSE(RequiresTicket(GrantType::ClientCredentials));
    EXPECT_FALSE(RequiresTicket(GrantType::Password));
    EXPECT_FALSE(RequiresTicket(GrantType::Other));
}

TEST(GrantResolver, ValidCodeTicketPasses) {
    Ticket t = MakeTicket();
    EXPECT_FALSE(ValidateTicket(t, codeRequest(), TestNow()).has_value());
}

TEST(GrantResolver, ExpiredOrUnboundedTicketIsRejected) {
    Ticket t = MakeTicket();
    t.expiresAt = TestNow();
    expectError(ValidateTicket(t, codeRequest(), TestNow()), Errors::InvalidGrant, "Expired ticket");

    Ticket noExpiry = MakeTicket();
    noExpiry.expiresAt.reset();
    expectError(ValidateTicket(noExpiry, refreshRequest(), TestNow()), Errors::InvalidGrant, "Expired ticket");
}

TEST(GrantResolver, ConfidentialRefreshTokenNeedsAuthenticatedClient) {
    Ticket t = MakeTicket();
    t.confidential = true;
    TokenRequest r = refreshRequest();
    expectError(ValidateTicket(t, r, TestNow()), Errors::InvalidGrant,
                "Client authentication is required to use this ticket");

    Ticket again = MakeTicket();
    again.confidential = true;
    r.isConfidential = true;
    EXPECT_FALSE(ValidateTicket(again, r, TestNow()).has_value());
}

TEST(GrantResolver, ConfidentialityIsNotCheckedForCodes) {
    Ticket t = MakeTicket();
    t.confidential = true;
    EXPECT_FALSE(ValidateTicket(t, codeRequest(), TestNow()).has_value());
}

TEST(GrantResolver, CodeWithoutPresentersIsServerError) {
    Ticket t = MakeTicket({});
    expectError(ValidateTicket(t, codeRequest(), TestNow()), Errors::ServerError, "An internal server error occurred.");
}

TEST(GrantResolver, RefreshWithoutPresentersIsAllowed) {
    Ticket t = MakeTicket({});
    EXPECT_FALSE(ValidateTicket(t, refreshRequest(""), TestNow()).has_value());
    Ticket t2 = MakeTicket({});
    EXPECT_FALSE(ValidateTicket(t2, refreshRequest("anyone"), TestNow()).has_value());
}

TEST(GrantResolver, CodeRequiresClientId) {
    Ticket t = MakeTicket({"client-A"});
    expectError(ValidateTicket(t, codeRequest(""), TestNow()), Errors::ServerError, "An internal server error occurred.");
}

TEST(GrantResolver, PresenterBinding) {
    Ticket t = MakeTicket({"client-A"});
    expectError(ValidateTicket(t, codeRequest("client-B"), TestNow()), Errors::InvalidGrant,
                "Ticket does not contain matching client_id");

    Ticket t2 = MakeTicket({"client-A"});
    EXPECT_FALSE(ValidateTicket(t2, codeRequest("client-A"), TestNow()).has_value());

    Ticket t3 = MakeTicket({"client-A"});
    expectError(ValidateTicket(t3, refreshRequest("client-B"), TestNow()), Errors::InvalidGrant,
                "Ticket does not contain matching client_id");

    Ticket t4 = MakeTicket({"client-A"});
    EXPECT_FALSE(ValidateTicket(t4, refreshRequest(""), TestNow()).has_value());

    Ticket t5 = MakeTicket({"client-A"});
    expectError(ValidateTicket(t5, codeRequest("CLIENT-A"), TestNow()), Errors::InvalidGrant,
                "Ticket does not contain matching client_id");
}

TEST(GrantResolver, RedirectUriMustMatchStoredValue) {
    Ticket missing = MakeTicket();
    missing.SetProperty(Properties::RedirectUri, "https://app/cb");
    expectError(ValidateTicket(missing, codeRequest(), TestNow()), Errors::InvalidRequest,
                "redirect_uri was missing from the token request");

    Ticket mismatch = MakeTicket();
    mismatch.SetProperty(Properties::RedirectUri, "https://app/cb");
    TokenRequest r = codeRequest();
    r.redirectUri = "https://app/cb/";
    expectError(ValidateTicket(mismatch, r, TestNow()), Errors::InvalidGrant,
                "Authorization code does not contain matching redirect_uri");

    Ticket match = MakeTicket();
    match.SetProperty(Properties::RedirectUri, "https://app/cb");
    r.redirectUri = "https://app/cb";
    EXPECT_FALSE(ValidateTicket(match, r, TestNow()).has_value());
    EXPECT_FALSE(match.GetProperty(Properties::RedirectUri).has_value()) << "consumed during validation";
}

TEST(GrantResolver, RedirectUriIsNotRequiredWhenNotStored) {
    Ticket t = MakeTicket();
    TokenRequest r = codeRequest();
    r.redirectUri = "https://elsewhere/cb";
    EXPECT_FALSE(ValidateTicket(t, r, TestNow()).has_value());
}

TEST(GrantResolver, RefreshIgnoresStoredRedirectUri) {
    Ticket t = MakeTicket();
    t.SetProperty(Properties::RedirectUri, "https://app/cb");
    EXPECT_FALSE(ValidateTicket(t, refreshRequest(), TestNow()).has_value());
    ASSERT_TRUE(t.GetProperty(Properties::RedirectUri).has_value());
    EXPECT_EQ(*t.GetProperty(Properties::RedirectUri), "https://app/cb");
}

TEST(GrantResolver, PkceVerifierRequiredAndChecked) {
    const std::string verifier = "dBjftJeZ4CVP-mB92K27uhbUJU1p1r_wW1gFWFOEjXk";

    Ticket t = MakeTicket();
    t.SetProperty(Properties::CodeChallenge, crypto::ComputeS256Challenge(verifier));
    t.SetProperty(Properties::CodeChallengeMethod, CodeChallengeMethods::Sha256);
    expectError(ValidateTicket(t, codeRequest(), TestNow()), Errors::InvalidGrant,
                "The required 'code_verifier' was missing from the token request.");

    Ticket wrong = MakeTicket();
    wrong.SetProperty(Properties::CodeChallenge, crypto::ComputeS256Challenge(verifier));
    wrong.SetProperty(Properties::CodeChallengeMethod, CodeChallengeMethods::Sha256);
    TokenRequest r = codeRequest();
    r.codeVerifier = verifier + "x";
    expectError(ValidateTicket(wrong, r, TestNow()), Errors::InvalidGrant, "The specified 'code_verifier' was invalid.");

    Ticket right = MakeTicket();
    right.SetProperty(Properties::CodeChallenge, crypto::ComputeS256Challenge(verifier));
    right.SetProperty(Properties::CodeChallengeMethod, CodeChallengeMethods::Sha256);
    r.codeVerifier = verifier;
    EXPECT_FALSE(ValidateTicket(right, r, TestNow()).has_value());
    EXPECT_TRUE(right.properties.empty()) << "challenge and method are consumed";
}

TEST(GrantResolver, PkcePlainWhenMethodAbsent) {
    Ticket t = MakeTicket();
    t.SetProperty(Properties::CodeChallenge, "plain-verifier-value");
    TokenRequest r = codeRequest();
    r.codeVerifier = "plain-verifier-value";
    EXPECT_FALSE(ValidateTicket(t, r, TestNow()).has_value());
}

TEST(GrantResolver, PkceIsNotRequiredWithoutStoredChallenge) {
    Ticket t = MakeTicket();
    TokenRequest r = codeRequest();
    r.codeVerifier = "unexpected-but-harmless";
    EXPECT_FALSE(ValidateTicket(t, r, TestNow()).has_value());
}

TEST(GrantResolver, RefreshResourceContainment) {
    TokenRequest r = refreshRequest();
    r.resource = "https://api.example.com";

    Ticket none = MakeTicket();
    expectError(ValidateTicket(none, r, TestNow()), Errors::InvalidGrant,
                "Token request cannot contain a resource parameter if the authorization request didn't contain one");

    Ticket other = MakeTicket();
    other.resources = {"https://other.example.com"};
    expectError(ValidateTicket(other, r, TestNow()), Errors::InvalidGrant,
                "Token request doesn't contain a valid resource parameter");

    Ticket ok = MakeTicket();
    ok.resources = {"https://api.example.com", "https://other.example.com"};
    EXPECT_FALSE(ValidateTicket(ok, r, TestNow()).has_value());
}

TEST(GrantResolver, RefreshScopeContainment) {
    TokenRequest r = refreshRequest();
    r.scope = "openid profile";

    Ticket none = MakeTicket();
    expectError(ValidateTicket(none, r, TestNow()), Errors::InvalidGrant,
                "Token request cannot contain a scope parameter if the authorization request didn't contain one");

    Ticket narrower = MakeTicket();
    narrower.scopes = {"openid"};
    expectError(ValidateTicket(narrower, r, TestNow()), Errors::InvalidGrant,
                "Token request doesn't contain a valid scope parameter");

    Ticket superset = MakeTicket();
    superset.scopes = {"openid", "profile", "offline_access"};
    EXPECT_FALSE(ValidateTicket(superset, r, TestNow()).has_value());
}

TEST(GrantResolver, CodeGrantDoesNotCheckContainment) {
    Ticket t = MakeTicket();
    TokenRequest r = codeRequest();
    r.scope = "admin";
    r.resource = "https://api.example.com";
    EXPECT_FALSE(ValidateTicket(t, r, TestNow()).has_value());
}

TEST(GrantResolver, ResolveGrant_UnknownCodeIsInvalidTicket) {
    InMemoryTicketStore store;
    TokenRequest r = codeRequest();
    auto resolution = RunAwaitable(ResolveGrant(store, r, TestNow()));
    ASSERT_TRUE(resolution.IsError());
    EXPECT_EQ(resolution.error->error, Errors::InvalidGrant);
    EXPECT_EQ(resolution.error->errorDescription, "Invalid ticket");
}

TEST(GrantResolver, ResolveGrant_KeepsOriginalForTimestampComparison) {
    InMemoryTicketStore store;
    Ticket t = MakeTicket();
    t.SetProperty(Properties::RedirectUri, "https://app/cb");
    store.AddAuthorizationCode("code-1", t);

    TokenRequest r = codeRequest();
    r.redirectUri = "https://app/cb";
    auto resolution = RunAwaitable(ResolveGrant(store, r, TestNow()));
    ASSERT_FALSE(resolution.IsError());
    ASSERT_TRUE(resolution.ticket.has_value());
    ASSERT_TRUE(resolution.original.has_value());
    EXPECT_EQ(resolution.original->issuedAt, t.issuedAt);
    EXPECT_EQ(resolution.original->expiresAt, t.expiresAt);
    EXPECT_FALSE(resolution.ticket->GetProperty(Properties::RedirectUri).has_value());
}

TEST(GrantResolver, ResolveGrant_TicketlessGrantsSkipTheStore) {
    ThrowingTicketStore store;
    TokenRequest r;
    r.grantType = GrantTypes::ClientCredentials;
    auto resolution = RunAwaitable(ResolveGrant(store, r, TestNow()));
    EXPECT_FALSE(resolution.IsError());
    EXPECT_FALSE(resolution.ticket.has_value());
    EXPECT_FALSE(resolution.original.has_value());
}
