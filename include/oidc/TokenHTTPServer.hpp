//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TokenHTTPServer.hpp
// Purpose: Coroutine-based HTTP/HTTPS host for the token endpoint using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <string>

#include "oidc/TokenEndpoint.h"
#include "oidc/TokenResponse.h"

namespace oidc {

  class TokenHTTPServer {
  public:
    //==========================================================================================================
    // Options
    // Purpose: Configuration for bind address/port and TLS files.
    // Fields:
    //   address: Bind address (default: 0.0.0.0)
    //   port: Listen port (default: 8443)
    //   scheme: "http" or "https" (TLS 1.3 only for https)
    //   certFile/keyFile: PEM files required when scheme == https
    //==========================================================================================================
    struct Options {
        std::string address{"0.0.0.0"};
        std::string port{"8443"};
        std::string scheme{"https"}; // "http" or "https"
        std::string certFile; // PEM (required for https)
        std::string keyFile;  // PEM (required for https)
    };

    using ErrorHandler = std::function<void(const std::string&)>;

    // Serves endpoint->Options().tokenEndpointPath; every other target answers 404.
    TokenHTTPServer(const Options& opts, std::shared_ptr<TokenEndpoint> endpoint);
    ~TokenHTTPServer();

    //==========================================================================================================
    // Binds the listener and starts the accept loop on a background I/O thread.
    // Returns:
    //   Future that becomes ready once the listener accepts connections; it carries the exception when the
    //   port is invalid or cannot be bound.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Stops the server: closes acceptor, stops I/O context, and joins background thread.
    // Returns:
    //   Future that completes when shutdown has finished.
    //==========================================================================================================
    std::future<void> Stop();

    void SetErrorHandler(ErrorHandler handler);

  private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
  };

  //==========================================================================================================
  // ParseListenUri
  // Purpose: Build server options from a listener URI:
  //            - "http://<address>:<port>" (e.g., http://127.0.0.1:8080)
  //            - "https://<address>:<port>?cert=<pem>&key=<pem>"
  //          Unknown parameters are ignored. If scheme is omitted, defaults to http. A missing port
  //          defaults to 8080 (http) or 8443 (https).
  //==========================================================================================================
  TokenHTTPServer::Options ParseListenUri(const std::string& config);

  //==========================================================================================================
  // HttpStatusForTokenResponse
  // Purpose: 200 for success, 401 for invalid_client, 500 for server_error, 400 for every other error.
  //==========================================================================================================
  unsigned HttpStatusForTokenResponse(const TokenResponse& response);

} // namespace oidc
