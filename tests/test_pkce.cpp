//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_pkce.cpp
// Purpose: GoogleTests for PKCE challenge computation and code_verifier verification
//==========================================================================================================

#include <gtest/gtest.h>

#include "oidc/crypto/Pkce.hpp"

using namespace oidc::crypto;

namespace {
// RFC 7636, Appendix B.
const char* kVerifier = "dBjftJeZ4CVP-mB92K27uhbUJU1p1r_wW1gFWFOEjXk";
const char* kChallenge = "E9Melhoa2OwvFrEMTJguCHaoeK1t8URWbuGJSstw-cM";
}

TEST(Pkce, S256ChallengeMatchesKnownVector) {
    EXPECT_EQ(ComputeS256Challenge(kVerifier), kChallenge);
}

TEST(Pkce, S256_VerifierRoundTrip) {
    for (const std::string v : {"a", kVerifier, "0123456789012345678901234567890123456789012345678901234567890123"}) {
        const std::string challenge = ComputeS256Challenge(v);
        EXPECT_EQ(challenge.find('='), std::string::npos);
        EXPECT_TRUE(VerifyCodeVerifier(challenge, "S256", v)) << v;
        EXPECT_FALSE(VerifyCodeVerifier(challenge, "S256", v + "x")) << v;
    }
}

TEST(Pkce, PlainAndAbsentMethodCompareVerbatim) {
    EXPECT_TRUE(VerifyCodeVerifier("secret-verifier", "plain", "secret-verifier"));
    EXPECT_TRUE(VerifyCodeVerifier("secret-verifier", "", "secret-verifier"));
    EXPECT_FALSE(VerifyCodeVerifier("secret-verifier", "", "secret-verifieR"));
    // A plain verifier is never hashed.
    EXPECT_FALSE(VerifyCodeVerifier(kChallenge, "plain", kVerifier));
}

TEST(Pkce, UnknownMethodNeverVerifies) {
    EXPECT_FALSE(VerifyCodeVerifier(kChallenge, "S512", kVerifier));
    EXPECT_FALSE(VerifyCodeVerifier("x", "s256", "x"));
}

TEST(Pkce, FixedTimeEqualsRequiresSameLengthAndContent) {
    EXPECT_TRUE(FixedTimeEquals("", ""));
    EXPECT_TRUE(FixedTimeEquals("abc", "abc"));
    EXPECT_FALSE(FixedTimeEquals("abc", "abd"));
    EXPECT_FALSE(FixedTimeEquals("abc", std::string("abc\0", 4)));
    EXPECT_FALSE(FixedTimeEquals("", "a"));
}
