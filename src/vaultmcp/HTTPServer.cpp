//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/vaultmcp/HTTPServer.cpp
// Purpose: HTTP/HTTPS acceptor using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <stdexcept>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "vaultmcp/HTTPServer.hpp"
#include "vaultmcp/JSONRPCTypes.h"
#include "vaultmcp/auth/ApiKeyAuth.hpp"

namespace vaultmcp {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string errorBody(const std::string& message) {
    JSONValue::Object o;
    o["error"] = std::make_shared<JSONValue>(message);
    return SerializeJSON(JSONValue{std::move(o)});
}

} // namespace

std::optional<std::string> HttpRequest::Header(const std::string& name) const {
    auto it = headers.find(toLower(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

class HTTPServer::Impl {
public:
    HTTPServer::Options opts;
    std::atomic<bool> running{false};
    std::atomic<unsigned short> boundPort{0};

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    std::vector<std::thread> ioThreads;

    HTTPServer::RequestHandler requestHandler;
    HTTPServer::ErrorHandler errorHandler;

    explicit Impl(const HTTPServer::Options& o) : opts(o) {
        if (opts.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
            // TLS 1.3 only
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            try {
                sslCtx->use_certificate_chain_file(opts.certFile);
                sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
            } catch (const std::exception& e) {
                LOG_ERROR("HTTPServer: failed to load certificate/key: {}", e.what());
                throw;
            }
            sslCtx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
        } else if (opts.scheme != "http") {
            throw std::invalid_argument("HTTPServer unsupported scheme: " + opts.scheme);
        }
    }

    ~Impl() {
        stop();
    }

    void stop() {
        running.store(false);
        ioc.stop();
        for (auto& t : ioThreads) {
            if (t.joinable()) {
                t.join();
            }
        }
        ioThreads.clear();
        if (acceptor) {
            boost::system::error_code ec;
            acceptor->close(ec);
        }
    }

    void setError(const std::string& msg) {
        if (errorHandler) {
            errorHandler(msg);
        } else {
            LOG_ERROR("{}", msg);
        }
    }

    template <typename Stream>
    net::awaitable<void> serveOne(Stream& stream) {
        boost::beast::flat_buffer buffer;
        http::request<http::string_body> req;
        co_await http::async_read(stream, buffer, req, net::use_awaitable);
        auto res = makeResponse(req);
        co_await http::async_write(stream, res, net::use_awaitable);
    }

    net::awaitable<void> session_plain(tcp::socket socket) {
        try {
            boost::beast::tcp_stream stream(std::move(socket));
            co_await serveOne(stream);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const std::exception& e) {
            if (running.load()) {
                setError(std::string("HTTPServer plain session error: ") + e.what());
            }
        }
        co_return;
    }

    net::awaitable<void> session_tls(tcp::socket socket) {
        try {
            ssl::stream<tcp::socket> tls(std::move(socket), *sslCtx);
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            co_await serveOne(tls);
            boost::system::error_code ec;
            tls.shutdown(ec);
        } catch (const std::exception& e) {
            if (running.load()) {
                setError(std::string("HTTPServer TLS session error: ") + e.what());
            }
        }
        co_return;
    }

    http::response<http::string_body> makeResponse(const http::request<http::string_body>& req) {
        HttpRequest in;
        in.method = std::string(req.method_string());
        in.target = std::string(req.target());
        const auto q = in.target.find('?');
        if (q != std::string::npos) {
            in.target.resize(q);
        }
        for (const auto& field : req) {
            in.headers[toLower(std::string(field.name_string()))] = std::string(field.value());
        }
        in.body = req.body();

        HttpReply reply;
        auto auth = auth::CheckApiKeyAuth(in.Header("authorization").value_or(""), opts.apiKey);
        if (!auth.ok) {
            LOG_WARN("HTTPServer: rejected {} {}: {}", in.method, in.target, auth.errorMessage);
            reply.status = static_cast<unsigned int>(auth.httpStatus);
            reply.body = errorBody(auth.errorMessage);
        } else if (!requestHandler) {
            reply.status = 503;
            reply.body = errorBody("No request handler");
        } else {
            try {
                reply = requestHandler(in);
            } catch (const std::exception& e) {
                LOG_ERROR("HTTPServer: handler failed for {} {}: {}", in.method, in.target, e.what());
                reply = HttpReply{};
                reply.status = 500;
                reply.body = errorBody(std::string("Internal server error: ") + e.what());
            }
        }

        http::response<http::string_body> res{http::status::ok, req.version()};
        res.result(reply.status);
        res.keep_alive(false);
        if (!reply.body.empty()) {
            res.set(http::field::content_type, reply.contentType);
        }
        for (const auto& [name, value] : reply.headers) {
            res.set(name, value);
        }
        res.body() = std::move(reply.body);
        res.prepare_payload();
        return res;
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                if (sslCtx) {
                    net::co_spawn(ioc, session_tls(std::move(socket)), net::detached);
                } else {
                    net::co_spawn(ioc, session_plain(std::move(socket)), net::detached);
                }
            }
        } catch (const std::exception& e) {
            if (running.load()) {
                setError(std::string("HTTPServer accept error: ") + e.what());
            }
        }
        co_return;
    }

    void bind() {
        // Validate port strictly: numeric and within [0, 65535]
        if (opts.port.empty() ||
            !std::all_of(opts.port.begin(), opts.port.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; }) ||
            opts.port.size() > 5 || std::stoul(opts.port) > 65535ul) {
            throw std::invalid_argument("HTTPServer invalid port: '" + opts.port + "'");
        }
        tcp::resolver resolver(ioc);
        auto r = resolver.resolve(opts.address, opts.port);
        tcp::endpoint ep = *r.begin();

        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
        boundPort.store(acceptor->local_endpoint().port());
    }
};

HTTPServer::HTTPServer(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

HTTPServer::~HTTPServer() = default;

std::future<void> HTTPServer::Start() {
    FUNC_SCOPE();
    std::promise<void> ready;
    auto fut = ready.get_future();
    pImpl->bind();
    pImpl->running.store(true);
    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    const std::size_t n = std::max<std::size_t>(1, pImpl->opts.ioThreads);
    for (std::size_t i = 0; i < n; ++i) {
        pImpl->ioThreads.emplace_back([this]() {
            try {
                pImpl->ioc.run();
            } catch (const std::exception& e) {
                pImpl->setError(std::string("HTTPServer I/O thread error: ") + e.what());
            }
        });
    }
    LOG_INFO("HTTPServer listening on {}://{}:{} ({} I/O threads)", pImpl->opts.scheme, pImpl->opts.address,
             pImpl->boundPort.load(), n);
    ready.set_value();
    return fut;
}

std::future<void> HTTPServer::Stop() {
    FUNC_SCOPE();
    std::promise<void> done;
    auto fut = done.get_future();
    pImpl->stop();
    done.set_value();
    return fut;
}

void HTTPServer::SetRequestHandler(RequestHandler handler) {
    pImpl->requestHandler = std::move(handler);
}

void HTTPServer::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

unsigned short HTTPServer::BoundPort() const {
    return pImpl->boundPort.load();
}

} // namespace vaultmcp
