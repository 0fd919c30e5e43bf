//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Channel.h
// Purpose: Duplex binding between one session and its protocol handler across HTTP request/response pairs
//==========================================================================================================

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "vaultmcp/JSONRPCTypes.h"
#include "vaultmcp/ProtocolHandler.h"

namespace vaultmcp {

//==========================================================================================================
// IChannel
// Purpose: Session-scoped channel interface; each HTTP POST becomes one exchange on the channel.
//==========================================================================================================
class IChannel {
public:
    virtual ~IChannel() = default;

    /////////////////////////////////////////// Message exchange ///////////////////////////////////////////
    //==========================================================================================================
    // Dispatches one request through the bound protocol handler.
    // Args:
    //   request: Decoded JSON-RPC request.
    // Returns:
    //   The handler's response, or a NoActiveTransport error once the channel is closed. Never null.
    //==========================================================================================================
    virtual std::unique_ptr<JSONRPCResponse> HandleRequest(const JSONRPCRequest& request) = 0;

    //==========================================================================================================
    // Delivers a client notification to the bound handler; dropped when the channel is closed.
    //==========================================================================================================
    virtual void HandleNotification(const JSONRPCNotification& notification) = 0;

    //==========================================================================================================
    // Runs the handler's internal handshake for the given version.
    // Returns:
    //   true when the handler accepted the version.
    //==========================================================================================================
    virtual bool HandshakeInternally(const std::string& version) = 0;

    /////////////////////////////////////////// Lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Closes the channel. Only the first call has effect and fires the close handler.
    // Returns:
    //   true when this call performed the close.
    //==========================================================================================================
    virtual bool Close() = 0;

    //==========================================================================================================
    // Reports a channel-level failure: fires the error handler, then closes the channel.
    //==========================================================================================================
    virtual void Fail(const std::string& reason) = 0;

    virtual bool IsOpen() const = 0;
    virtual std::string GetSessionId() const = 0;
    virtual std::shared_ptr<IProtocolHandler> GetHandler() const = 0;

    /////////////////////////////////////////// Notifications to the owner ///////////////////////////////////////////
    using CloseHandler = std::function<void(const std::string& sessionId, const IChannel* channel)>;
    using ErrorHandler = std::function<void(const std::string& sessionId, const std::string& error)>;
    virtual void SetCloseHandler(CloseHandler handler) = 0;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

//==========================================================================================================
// SessionChannel
// Purpose: IChannel bound to one protocol handler instance.
//==========================================================================================================
class SessionChannel : public IChannel {
public:
    SessionChannel(std::string sessionId, std::shared_ptr<IProtocolHandler> handler);
    ~SessionChannel() override;

    std::unique_ptr<JSONRPCResponse> HandleRequest(const JSONRPCRequest& request) override;
    void HandleNotification(const JSONRPCNotification& notification) override;
    bool HandshakeInternally(const std::string& version) override;

    bool Close() override;
    void Fail(const std::string& reason) override;

    bool IsOpen() const override;
    std::string GetSessionId() const override;
    std::shared_ptr<IProtocolHandler> GetHandler() const override;

    void SetCloseHandler(CloseHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

private:
    const std::string sessionId;
    const std::shared_ptr<IProtocolHandler> handler;
    std::atomic<bool> closed{false};
    mutable std::mutex handlersMutex;
    CloseHandler closeHandler;
    ErrorHandler errorHandler;
};

} // namespace vaultmcp
