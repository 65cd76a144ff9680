//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FormUrlEncoded.hpp
// Purpose: application/x-www-form-urlencoded encoding and decoding
//==========================================================================================================

#pragma once

#include <string>
#include <unordered_map>

namespace oidc {

// Decoded form parameters; when a name repeats, the first occurrence wins.
using FormFields = std::unordered_map<std::string, std::string>;

//==========================================================================================================
// ParseFormUrlEncoded
// Purpose: Split on '&' and '=', translate '+' to space and decode %XX escapes. Malformed escapes are
//          kept literally. Pairs with an empty name are ignored.
//==========================================================================================================
FormFields ParseFormUrlEncoded(const std::string& body);

// Percent-encode a single value (unreserved characters kept, space as '+').
std::string UrlEncodeForm(const std::string& s);

} // namespace oidc
