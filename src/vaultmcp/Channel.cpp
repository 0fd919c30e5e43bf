//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Channel.cpp
// Purpose: SessionChannel implementation
//==========================================================================================================

#include "vaultmcp/Channel.h"
#include "logging/Logger.h"

#include <stdexcept>

namespace vaultmcp {

SessionChannel::SessionChannel(std::string id, std::shared_ptr<IProtocolHandler> h)
    : sessionId(std::move(id)), handler(std::move(h)) {
    FUNC_SCOPE();
    if (!handler) {
        throw std::invalid_argument("SessionChannel requires a protocol handler");
    }
    LOG_DEBUG("Channel opened for session {}", sessionId);
}

SessionChannel::~SessionChannel() {
    FUNC_SCOPE();
}

std::unique_ptr<JSONRPCResponse> SessionChannel::HandleRequest(const JSONRPCRequest& request) {
    FUNC_SCOPE();
    if (closed.load()) {
        return CreateErrorResponse(request.id, JSONRPCErrorCodes::NoActiveTransport,
                                   "No active transport/session. Please initialize and retry.");
    }
    std::unique_ptr<JSONRPCResponse> resp;
    try {
        resp = handler->HandleRequest(request, sessionId);
    } catch (const std::exception& e) {
        LOG_ERROR("Channel {} failed handling {}: {}", sessionId, request.method, e.what());
        Fail(e.what());
        return CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError,
                                   std::string("Internal error: ") + e.what());
    }
    if (!resp) {
        return CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, "Null response from handler");
    }
    resp->id = request.id;
    return resp;
}

void SessionChannel::HandleNotification(const JSONRPCNotification& notification) {
    FUNC_SCOPE();
    if (closed.load()) {
        LOG_DEBUG("Dropping notification {} on closed channel {}", notification.method, sessionId);
        return;
    }
    try {
        handler->HandleNotification(notification, sessionId);
    } catch (const std::exception& e) {
        LOG_ERROR("Channel {} notification handler exception: {}", sessionId, e.what());
        Fail(e.what());
    }
}

bool SessionChannel::HandshakeInternally(const std::string& version) {
    FUNC_SCOPE();
    if (closed.load()) {
        return false;
    }
    return handler->HandshakeInternally(version);
}

bool SessionChannel::Close() {
    FUNC_SCOPE();
    if (closed.exchange(true)) {
        return false;
    }
    LOG_DEBUG("Channel closed for session {}", sessionId);
    CloseHandler cb;
    {
        std::lock_guard<std::mutex> lock(handlersMutex);
        cb = closeHandler;
    }
    if (cb) {
        cb(sessionId, this);
    }
    return true;
}

void SessionChannel::Fail(const std::string& reason) {
    FUNC_SCOPE();
    if (closed.load()) {
        return;
    }
    ErrorHandler cb;
    {
        std::lock_guard<std::mutex> lock(handlersMutex);
        cb = errorHandler;
    }
    if (cb) {
        cb(sessionId, reason);
    }
    Close();
}

bool SessionChannel::IsOpen() const {
    return !closed.load();
}

std::string SessionChannel::GetSessionId() const {
    return sessionId;
}

std::shared_ptr<IProtocolHandler> SessionChannel::GetHandler() const {
    return handler;
}

void SessionChannel::SetCloseHandler(CloseHandler h) {
    std::lock_guard<std::mutex> lock(handlersMutex);
    closeHandler = std::move(h);
}

void SessionChannel::SetErrorHandler(ErrorHandler h) {
    std::lock_guard<std::mutex> lock(handlersMutex);
    errorHandler = std::move(h);
}

} // namespace vaultmcp
