//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: VaultServer.h
// Purpose: Wires document store, tools, pools, request router and HTTP acceptor into one server
//==========================================================================================================

#pragma once

#include <memory>

#include "vaultmcp/Config.h"
#include "vaultmcp/HTTPServer.hpp"
#include "vaultmcp/RequestRouter.h"

namespace vaultmcp {

//==========================================================================================================
// VaultServer
// Purpose: Owns every component for one ServerConfig.
// Notes:
//   - Concurrent mode builds a worker pool and a per-session handler pool capped at
//     maxConcurrentConnections; otherwise one shared handler serves every session and tools run inline.
//   - HandleHttp is the complete route table and can be driven without sockets.
//   - Stop order: HTTP acceptor, then router shutdown (channels, sessions, worker pool, handler pool).
//==========================================================================================================
class VaultServer {
public:
    explicit VaultServer(ServerConfig config);
    ~VaultServer();

    VaultServer(const VaultServer&) = delete;
    VaultServer& operator=(const VaultServer&) = delete;

    // Binds the listener and starts the idle sweep. Throws on bind failure.
    void Start();

    // Idempotent.
    void Stop();

    //==========================================================================================================
    // HandleHttp
    // Purpose: Routes one request.
    //   POST   /mcp   JSON-RPC request (router) or notification (202)
    //   GET    /mcp   endpoint description
    //   DELETE /mcp   close the session named by Mcp-Session-Id
    //   GET    /      health
    //   GET    /.well-known/appspecific/com.mcp.vault-mcp   discovery
    //==========================================================================================================
    HttpReply HandleHttp(const HttpRequest& request);

    unsigned short BoundPort() const;
    bool IsConcurrent() const;
    RequestRouter& Router();
    const ServerConfig& Config() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace vaultmcp
