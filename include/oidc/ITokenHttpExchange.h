//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ITokenHttpExchange.h
// Purpose: Transport-side view of one HTTP token request/response exchange
//==========================================================================================================

#pragma once

#include <string>
#include <utility>
#include <boost/asio/awaitable.hpp>

#include "oidc/FormUrlEncoded.hpp"
#include "oidc/TokenResponse.h"

namespace oidc {

//==========================================================================================================
// ITokenHttpExchange
// Purpose: What the token endpoint needs from the hosting HTTP layer.
// Methods:
//   Method(): request method as received (e.g., "POST").
//   ContentType(): Content-Type header value, empty when absent.
//   Header(name): any request header value, empty when absent (used for Authorization).
//   ReadForm(): decode the form-encoded body.
//   WriteResponse(response): serialize the response document and send it; HTTP status selection is the
//                            transport's concern.
//==========================================================================================================
class ITokenHttpExchange {
public:
    virtual ~ITokenHttpExchange() = default;

    virtual std::string Method() const = 0;
    virtual std::string ContentType() const = 0;
    virtual std::string Header(const std::string& name) const = 0;
    virtual boost::asio::awaitable<FormFields> ReadForm() = 0;
    virtual boost::asio::awaitable<void> WriteResponse(const TokenResponse& response) = 0;
};

} // namespace oidc
