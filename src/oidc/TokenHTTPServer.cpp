//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oidc/TokenHTTPServer.cpp
// Purpose: HTTP/HTTPS token endpoint host using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <charconv>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "oidc/Constants.h"
#include "oidc/FormUrlEncoded.hpp"
#include "oidc/ITokenHttpExchange.h"
#include "oidc/TokenHTTPServer.hpp"

#include <openssl/ssl.h>

namespace oidc {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

//==========================================================================================================
// BeastTokenExchange
// Purpose: ITokenHttpExchange over one fully-read Beast request; WriteResponse fills the Beast response that
//          the session writes once the endpoint returns.
//==========================================================================================================
class BeastTokenExchange : public ITokenHttpExchange {
public:
    BeastTokenExchange(const http::request<http::string_body>& req, http::response<http::string_body>& res)
        : req(req), res(res) {}

    std::string Method() const override { return std::string(req.method_string()); }

    std::string ContentType() const override { return Header("Content-Type"); }

    std::string Header(const std::string& name) const override {
        auto it = req.find(name);
        if (it == req.end()) {
            return std::string();
        }
        return std::string(it->value());
    }

    net::awaitable<FormFields> ReadForm() override {
        co_return ParseFormUrlEncoded(req.body());
    }

    net::awaitable<void> WriteResponse(const TokenResponse& response) override {
        res.result(static_cast<http::status>(HttpStatusForTokenResponse(response)));
        res.set(http::field::content_type, ContentTypes::Json);
        res.set(http::field::cache_control, "no-store");
        res.set(http::field::pragma, "no-cache");
        if (response.error == Errors::InvalidClient && !Header("Authorization").empty()) {
            res.set(http::field::www_authenticate, "Basic");
        }
        res.body() = response.Serialize();
        res.prepare_payload();
        written = true;
        co_return;
    }

    bool Written() const { return written; }

private:
    const http::request<http::string_body>& req;
    http::response<http::string_body>& res;
    bool written{false};
};

std::string trimmed(const std::string& s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto first = std::find_if(s.begin(), s.end(), notSpace);
    auto last = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    return (first < last) ? std::string(first, last) : std::string();
}

std::string targetPath(const http::request<http::string_body>& req) {
    std::string target(req.target());
    auto q = target.find('?');
    if (q != std::string::npos) {
        target.resize(q);
    }
    return target;
}

} // namespace

unsigned HttpStatusForTokenResponse(const TokenResponse& response) {
    if (!response.IsError()) {
        return 200;
    }
    if (response.error == Errors::InvalidClient) {
        return 401;
    }
    if (response.error == Errors::ServerError) {
        return 500;
    }
    return 400;
}

class TokenHTTPServer::Impl {
public:
    TokenHTTPServer::Options opts;
    std::shared_ptr<TokenEndpoint> endpoint;
    std::atomic<bool> running{false};

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    std::thread ioThread;

    TokenHTTPServer::ErrorHandler errorHandler;

    Impl(const TokenHTTPServer::Options& o, std::shared_ptr<TokenEndpoint> ep)
        : opts(o), endpoint(std::move(ep)) {
        if (!endpoint) {
            throw std::invalid_argument("TokenHTTPServer: a token endpoint is required");
        }
        if (opts.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
            // TLS 1.3 only
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            try {
                sslCtx->use_certificate_chain_file(opts.certFile);
                sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
            } catch (const std::exception& e) {
                LOG_ERROR("TokenHTTPServer: failed to load certificate/key: {}", e.what());
                throw;
            }
            sslCtx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
        }
    }

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
    }

    void setError(const std::string& msg) {
        LOG_ERROR("{}", msg);
        if (errorHandler) { errorHandler(msg); }
    }

    // Errors raised while Stop() tears the sockets down are expected and only traced.
    void reportFailure(const char* what, const std::exception& e) {
        if (running.load()) {
            setError(std::string("TokenHTTPServer ") + what + ": " + e.what());
        } else {
            LOG_DEBUG("TokenHTTPServer {} during shutdown: {}", what, e.what());
        }
    }

    // One token request per connection: read, run the endpoint, write, half-close.
    template <typename Stream>
    net::awaitable<void> serveOneRequest(Stream& stream) {
        boost::beast::flat_buffer buffer;
        http::request<http::string_body> req;
        co_await http::async_read(stream, buffer, req, net::use_awaitable);
        http::response<http::string_body> res = co_await makeResponse(req);
        co_await http::async_write(stream, res, net::use_awaitable);
    }

    net::awaitable<void> session(tcp::socket socket) {
        try {
            if (sslCtx) {
                ssl::stream<tcp::socket> tls(std::move(socket), *sslCtx);
                co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
                co_await serveOneRequest(tls);
                boost::system::error_code ec;
                tls.shutdown(ec);
            } else {
                co_await serveOneRequest(socket);
                boost::system::error_code ec;
                socket.shutdown(tcp::socket::shutdown_send, ec);
            }
        } catch (const std::exception& e) {
            reportFailure("session error", e);
        }
    }

    static void setJsonBody(http::response<http::string_body>& res, http::status status, std::string body) {
        res.result(status);
        res.set(http::field::content_type, ContentTypes::Json);
        res.body() = std::move(body);
        res.prepare_payload();
    }

    net::awaitable<http::response<http::string_body>> makeResponse(const http::request<http::string_body>& req) {
        http::response<http::string_body> res{http::status::ok, req.version()};
        res.keep_alive(false);

        if (targetPath(req) != endpoint->Options().tokenEndpointPath) {
            setJsonBody(res, http::status::not_found, "{\"error\":\"Not found\"}");
            co_return res;
        }

        BeastTokenExchange exchange(req, res);
        std::optional<TokenEndpointResult> result;
        try {
            result = co_await endpoint->Invoke(exchange);
        } catch (const std::exception& e) {
            setError(std::string("TokenHTTPServer token endpoint error: ") + e.what());
        }

        if (!result.has_value()) {
            // The endpoint gave up mid-write; replace whatever was staged.
            res = http::response<http::string_body>{http::status::ok, req.version()};
            res.keep_alive(false);
            res.set(http::field::cache_control, "no-store");
            setJsonBody(res, http::status::internal_server_error,
                        TokenResponse::MakeError(Errors::ServerError, "An internal server error occurred.").Serialize());
        } else if (*result == TokenEndpointResult::NotHandled) {
            // No further handler behind this host.
            setJsonBody(res, http::status::not_found, "{\"error\":\"Not found\"}");
        } else if (!exchange.Written()) {
            // Application code claimed the request without producing a body.
            if (res.body().empty()) {
                res.result(http::status::no_content);
            }
            res.prepare_payload();
        }
        co_return res;
    }

    void bindListener() {
        unsigned short port = 0;
        const char* first = opts.port.data();
        const char* last = first + opts.port.size();
        auto [end, ec] = std::from_chars(first, last, port);
        if (opts.port.empty() || ec != std::errc() || end != last) {
            throw std::invalid_argument("TokenHTTPServer invalid port: '" + opts.port + "'");
        }

        tcp::resolver resolver(ioc);
        tcp::endpoint ep = *resolver.resolve(opts.address, opts.port).begin();
        acceptor = std::make_unique<tcp::acceptor>(ioc, ep, /*reuse_addr*/ true);
        LOG_INFO("TokenHTTPServer listening on {}://{}:{}{}", opts.scheme, opts.address,
                 acceptor->local_endpoint().port(), endpoint->Options().tokenEndpointPath);
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                net::co_spawn(ioc, session(std::move(socket)), net::detached);
            }
        } catch (const std::exception& e) {
            reportFailure("accept error", e);
        }
    }
};

TokenHTTPServer::TokenHTTPServer(const Options& opts, std::shared_ptr<TokenEndpoint> endpoint)
    : pImpl(std::make_unique<Impl>(opts, std::move(endpoint))) {}

TokenHTTPServer::~TokenHTTPServer() = default;

std::future<void> TokenHTTPServer::Start() {
    std::promise<void> ready; auto fut = ready.get_future();
    try {
        pImpl->bindListener();
    } catch (const std::exception& e) {
        pImpl->setError(std::string("TokenHTTPServer failed to listen: ") + e.what());
        ready.set_exception(std::current_exception());
        return fut;
    }
    pImpl->running.store(true);
    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    pImpl->ioThread = std::thread([this]() {
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            pImpl->setError(e.what());
        }
    });
    ready.set_value();
    return fut;
}

std::future<void> TokenHTTPServer::Stop() {
    std::promise<void> done; auto fut = done.get_future();
    pImpl->running.store(false);
    if (pImpl->acceptor) {
        boost::system::error_code ec; pImpl->acceptor->close(ec);
    }
    pImpl->ioc.stop();
    if (pImpl->ioThread.joinable()) {
        pImpl->ioThread.join();
    }
    done.set_value();
    return fut;
}

void TokenHTTPServer::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

TokenHTTPServer::Options ParseListenUri(const std::string& config) {
    TokenHTTPServer::Options opts;
    std::string cfg = trimmed(config);

    opts.scheme = "http";
    if (cfg.rfind("https://", 0) == 0) {
        opts.scheme = "https";
        cfg.erase(0, 8);
    } else if (cfg.rfind("http://", 0) == 0) {
        cfg.erase(0, 7);
    }

    // TLS files travel as a form-encoded query: ?cert=<pem>&key=<pem>
    const auto query = cfg.find('?');
    if (query != std::string::npos) {
        FormFields params = ParseFormUrlEncoded(cfg.substr(query + 1));
        opts.certFile = params["cert"];
        opts.keyFile = params["key"];
        cfg.resize(query);
    }

    // Any path is ignored; the endpoint options decide which target is served.
    cfg.resize(std::min(cfg.find('/'), cfg.size()));
    const auto colon = cfg.rfind(':');
    if (colon != std::string::npos) {
        opts.address = cfg.substr(0, colon);
        opts.port = cfg.substr(colon + 1);
    } else {
        opts.address = cfg;
        opts.port.clear();
    }
    if (opts.port.empty()) {
        opts.port = (opts.scheme == "https") ? "8443" : "8080";
    }
    return opts;
}

} // namespace oidc
