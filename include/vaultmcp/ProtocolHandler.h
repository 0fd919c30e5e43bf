//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProtocolHandler.h
// Purpose: Per-session MCP protocol state (negotiated version, handshake phase) and method dispatch
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "vaultmcp/JSONRPCTypes.h"
#include "vaultmcp/Protocol.h"
#include "vaultmcp/store/DocumentStore.h"
#include "vaultmcp/tools/ToolInvoker.h"

namespace vaultmcp {

//==========================================================================================================
// IProtocolHandler
// Purpose: Protocol-level object holding tool/resource registrations and negotiated state for one
//          session (or for every session in single-handler mode).
// Methods:
//   HandleRequest(req, sessionId): Dispatches a request; never throws, errors become JSON-RPC errors.
//   HandleNotification(note): Consumes a client notification.
//   HandshakeInternally(version): Negotiates version without producing a wire response; true on success.
//   IsInitialized(): True after a successful initialize or internal handshake.
//   NegotiatedVersion(): Version agreed by the last successful handshake.
//==========================================================================================================
class IProtocolHandler {
public:
    virtual ~IProtocolHandler() = default;

    virtual std::unique_ptr<JSONRPCResponse> HandleRequest(const JSONRPCRequest& req, const std::string& sessionId) = 0;
    virtual void HandleNotification(const JSONRPCNotification& note, const std::string& sessionId) = 0;
    virtual bool HandshakeInternally(const std::string& version) = 0;
    virtual bool IsInitialized() const = 0;
    virtual std::optional<std::string> NegotiatedVersion() const = 0;
};

//==========================================================================================================
// ProtocolHandlerOptions
// Fields:
//   invoker: Tool collaborator; tools/list reads its registry, tools/call goes through Invoke.
//   store: Backing store for the vault://info resource.
//   sessionInfo: When set, vault://session-info is advertised and served from this provider.
//   serverInfo: Name/version reported by initialize.
//   capabilities: Advertised by initialize; absent entries are omitted.
//==========================================================================================================
struct ProtocolHandlerOptions {
    std::shared_ptr<tools::ToolInvoker> invoker;
    std::shared_ptr<store::IDocumentStore> store;
    std::function<JSONValue()> sessionInfo;
    Implementation serverInfo;
    ServerCapabilities capabilities{ToolsCapability{}, ResourcesCapability{}};
};

class ProtocolHandler : public IProtocolHandler {
public:
    explicit ProtocolHandler(ProtocolHandlerOptions options);
    ~ProtocolHandler() override;

    std::unique_ptr<JSONRPCResponse> HandleRequest(const JSONRPCRequest& req, const std::string& sessionId) override;
    void HandleNotification(const JSONRPCNotification& note, const std::string& sessionId) override;
    bool HandshakeInternally(const std::string& version) override;
    bool IsInitialized() const override;
    std::optional<std::string> NegotiatedVersion() const override;

    // True once the client sent notifications/initialized.
    bool IsClientReady() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace vaultmcp
