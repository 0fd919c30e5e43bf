//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HandlerPool.cpp
// Purpose: Protocol handler memoization and statistics
//==========================================================================================================

#include "vaultmcp/HandlerPool.h"
#include "logging/Logger.h"

#include <stdexcept>

namespace vaultmcp {

HandlerPool::HandlerPool(Factory f, std::size_t max, bool sharedMode)
    : factory(std::move(f)), maxHandlers(sharedMode ? 1 : max), shared(sharedMode) {
    if (!factory) {
        throw std::invalid_argument("HandlerPool requires a handler factory");
    }
}

std::shared_ptr<IProtocolHandler> HandlerPool::GetOrCreate(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(mutex);
    if (shutdown) {
        throw std::runtime_error("Handler pool is shut down");
    }
    if (shared) {
        if (!sharedHandler) {
            sharedHandler = factory(sessionId);
            if (!sharedHandler) {
                throw std::runtime_error("Handler factory returned null");
            }
            ++created;
            LOG_INFO("Shared protocol handler created");
        }
        return sharedHandler;
    }
    auto it = handlers.find(sessionId);
    if (it != handlers.end()) {
        return it->second;
    }
    auto handler = factory(sessionId);
    if (!handler) {
        throw std::runtime_error("Handler factory returned null for session " + sessionId);
    }
    handlers.emplace(sessionId, handler);
    ++created;
    LOG_DEBUG("Protocol handler created for session {} ({} active)", sessionId, handlers.size());
    return handler;
}

std::shared_ptr<IProtocolHandler> HandlerPool::Find(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mutex);
    if (shared) {
        return sharedHandler;
    }
    auto it = handlers.find(sessionId);
    return it == handlers.end() ? nullptr : it->second;
}

bool HandlerPool::Evict(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(mutex);
    if (shared) {
        return false;
    }
    if (handlers.erase(sessionId) > 0) {
        LOG_DEBUG("Protocol handler evicted for session {}", sessionId);
        return true;
    }
    return false;
}

void HandlerPool::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex);
    if (shutdown) {
        return;
    }
    shutdown = true;
    LOG_INFO("Handler pool shutting down ({} handlers)", shared ? (sharedHandler ? 1u : 0u) : handlers.size());
    handlers.clear();
    sharedHandler.reset();
}

HandlerPoolStats HandlerPool::GetStats() const {
    HandlerPoolStats s;
    {
        std::lock_guard<std::mutex> lock(mutex);
        s.activeHandlers = shared ? (sharedHandler ? 1 : 0) : handlers.size();
    }
    s.maxHandlers = maxHandlers;
    s.totalRequests = totalRequests.load(std::memory_order_relaxed);
    s.handlersCreated = created.load(std::memory_order_relaxed);
    return s;
}

} // namespace vaultmcp
