//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HandlerPool.h
// Purpose: Lazily created, memoized protocol handler per session id (or one shared handler)
//==========================================================================================================

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "vaultmcp/ProtocolHandler.h"

namespace vaultmcp {

struct HandlerPoolStats {
    std::size_t activeHandlers{0};
    std::size_t maxHandlers{0};
    uint64_t totalRequests{0};
    uint64_t handlersCreated{0};
};

//==========================================================================================================
// HandlerPool
// Purpose: Owns protocol handler instances keyed by session id so negotiated state never leaks across
//          sessions. In shared mode every id maps to a single handler built on first use.
// Notes:
//   GetOrCreate holds the pool lock while the factory runs, so concurrent first use of an id constructs
//   exactly one handler.
//==========================================================================================================
class HandlerPool {
public:
    using Factory = std::function<std::shared_ptr<IProtocolHandler>(const std::string& sessionId)>;

    HandlerPool(Factory factory, std::size_t maxHandlers, bool shared);

    std::shared_ptr<IProtocolHandler> GetOrCreate(const std::string& sessionId);
    std::shared_ptr<IProtocolHandler> Find(const std::string& sessionId) const;

    // Drops the handler for sessionId; no-op in shared mode. Returns true when an entry was removed.
    bool Evict(const std::string& sessionId);

    void RecordRequest() { totalRequests.fetch_add(1, std::memory_order_relaxed); }

    void Shutdown();

    bool IsShared() const { return shared; }
    HandlerPoolStats GetStats() const;

private:
    Factory factory;
    const std::size_t maxHandlers;
    const bool shared;
    mutable std::mutex mutex;
    std::unordered_map<std::string, std::shared_ptr<IProtocolHandler>> handlers;
    std::shared_ptr<IProtocolHandler> sharedHandler;
    std::atomic<uint64_t> totalRequests{0};
    std::atomic<uint64_t> created{0};
    bool shutdown{false};
};

} // namespace vaultmcp
