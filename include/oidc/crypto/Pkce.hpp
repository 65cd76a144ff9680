//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Pkce.hpp
// Purpose: Proof Key for Code Exchange (RFC 7636) verification
//==========================================================================================================

#pragma once

#include <string>

namespace oidc::crypto {

//==========================================================================================================
// ComputeS256Challenge
// Purpose: BASE64URL(SHA256(ASCII(verifier))) without padding.
// Throws:
//   std::runtime_error when the OpenSSL digest fails.
//==========================================================================================================
std::string ComputeS256Challenge(const std::string& verifier);

//==========================================================================================================
// FixedTimeEquals
// Purpose: Equality whose running time depends only on the longer input length, never on content or on
//          the position of the first difference.
//==========================================================================================================
bool FixedTimeEquals(const std::string& a, const std::string& b);

//==========================================================================================================
// VerifyCodeVerifier
// Purpose: Check a token request code_verifier against the challenge stored with the authorization code.
// Args:
//   challenge: Stored code_challenge (non-empty).
//   method: Stored code_challenge_method; empty means "plain". Unknown methods never verify.
//   verifier: code_verifier from the token request.
// Returns:
//   true when the transformed verifier matches the challenge.
//==========================================================================================================
bool VerifyCodeVerifier(const std::string& challenge,
                        const std::string& method,
                        const std::string& verifier);

} // namespace oidc::crypto
