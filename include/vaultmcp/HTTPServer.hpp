//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPServer.hpp
// Purpose: Coroutine-based HTTP/HTTPS acceptor using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace vaultmcp {

//==========================================================================================================
// HttpRequest
// Purpose: Transport-neutral view of one inbound request.
// Fields:
//   method: Upper-case verb ("GET", "POST", "DELETE", ...).
//   target: Path without query string.
//   headers: Header map keyed by lower-case field name.
//==========================================================================================================
struct HttpRequest {
    std::string method;
    std::string target;
    std::map<std::string, std::string> headers;
    std::string body;

    // Case-insensitive header lookup; nullopt when absent.
    std::optional<std::string> Header(const std::string& name) const;
};

struct HttpReply {
    unsigned int status{200};
    std::string body;
    std::string contentType{"application/json"};
    std::vector<std::pair<std::string, std::string>> headers;
};

class HTTPServer {
public:
    using RequestHandler = std::function<HttpReply(const HttpRequest&)>;
    using ErrorHandler = std::function<void(const std::string&)>;

    //==========================================================================================================
    // Options
    // Purpose: Bind address/port, TLS files and I/O concurrency.
    // Fields:
    //   address: Bind address (default: 127.0.0.1)
    //   port: Listen port; "0" selects an ephemeral port (see BoundPort)
    //   scheme: "http" or "https" (TLS 1.3 only for https)
    //   certFile/keyFile: PEM files required when scheme == https
    //   ioThreads: Threads running the I/O context; handlers may block, so this bounds parallel requests
    //   apiKey: When non-empty, every request must authenticate with Bearer/Basic (401 otherwise)
    //==========================================================================================================
    struct Options {
        std::string address{"127.0.0.1"};
        std::string port{"3001"};
        std::string scheme{"http"};
        std::string certFile;
        std::string keyFile;
        std::size_t ioThreads{4};
        std::string apiKey;
    };

    explicit HTTPServer(const Options& opts);
    ~HTTPServer();

    HTTPServer(const HTTPServer&) = delete;
    HTTPServer& operator=(const HTTPServer&) = delete;

    //==========================================================================================================
    // Binds the listening socket and starts the accept loop on the I/O threads.
    // Returns:
    //   Future that becomes ready once the I/O threads are running.
    // Throws:
    //   std::invalid_argument for a malformed port; boost::system::system_error when binding fails.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Stops the I/O context, joins the I/O threads and closes the acceptor.
    //==========================================================================================================
    std::future<void> Stop();

    void SetRequestHandler(RequestHandler handler);
    void SetErrorHandler(ErrorHandler handler);

    // Actual listening port; valid after Start().
    unsigned short BoundPort() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace vaultmcp
