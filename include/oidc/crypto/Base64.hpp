//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Base64.hpp
// Purpose: Base64 (RFC 4648 section 4) decoding and base64url (section 5) encoding backed by OpenSSL
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace oidc::crypto {

//==========================================================================================================
// Base64Decode
// Purpose: Decode padded standard base64. Surrounding whitespace is ignored.
// Returns:
//   Decoded bytes, or std::nullopt when the input is not well-formed base64.
//==========================================================================================================
std::optional<std::string> Base64Decode(const std::string& encoded);

std::string Base64Encode(const std::string& data);

// URL-safe alphabet without '=' padding.
std::string Base64UrlEncode(const std::vector<std::uint8_t>& data);

} // namespace oidc::crypto
