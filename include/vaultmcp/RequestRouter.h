//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestRouter.h
// Purpose: Session lifecycle state machine between the HTTP endpoint and per-session protocol handlers
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "vaultmcp/HandlerPool.h"
#include "vaultmcp/JSONRPCTypes.h"
#include "vaultmcp/SessionRegistry.h"
#include "vaultmcp/TransportRegistry.h"
#include "vaultmcp/WorkerPool.h"

namespace vaultmcp {

//==========================================================================================================
// RoutePath
// Purpose: Which lifecycle branch served a request.
//   Keepalive:     session/ping or status/ping answered without touching any channel.
//   LiveChannel:   known id with an open channel.
//   Reconnected:   known id without a channel, handshake request; a new channel was bound.
//   Orphaned:      known id without a channel, non-handshake request; new channel plus compat handshake.
//   NewSession:    no id, handshake request.
//   NewSessionCompat: no id, non-handshake request; new session plus compat handshake.
//   NoChannel:     defensive branch when no channel could be obtained.
//   Rejected:      router shutting down or request refused before dispatch.
//   Failed:        internal error caught at the router boundary.
//==========================================================================================================
enum class RoutePath {
    Keepalive,
    LiveChannel,
    Reconnected,
    Orphaned,
    NewSession,
    NewSessionCompat,
    NoChannel,
    Rejected,
    Failed
};

const char* ToString(RoutePath path);

//==========================================================================================================
// RouteResult
// Fields:
//   httpStatus: Status for the HTTP layer (200, 400, 500, 503).
//   sessionId: Value for the Mcp-Session-Id response header when a session was assigned or reused.
//   response: JSON-RPC response body; null only for accepted notifications.
//   path: Lifecycle branch taken.
//==========================================================================================================
struct RouteResult {
    unsigned int httpStatus{200};
    std::optional<std::string> sessionId;
    std::unique_ptr<JSONRPCResponse> response;
    RoutePath path{RoutePath::Failed};
};

enum class DeleteOutcome {
    Closed,
    NotFound
};

struct RouterOptions {
    // Session capacity enforced by least-recently-active eviction (0 = unlimited)
    std::size_t maxSessions{0};
    std::chrono::milliseconds sessionTimeout{std::chrono::hours(1)};
    // Forward the original request even when every compat handshake version fails
    bool compatFailOpen{true};
};

struct RouterStats {
    std::size_t liveConnections{0};
    std::size_t activeSessions{0};
    HandlerPoolStats handlers;
    std::optional<WorkerPoolStats> workers;
    uint64_t compatHandshakes{0};
    uint64_t compatFailures{0};
    uint64_t sessionsEvicted{0};
};

// Renders stats as the vault://session-info document.
JSONValue RouterStatsToJSON(const RouterStats& stats);

//==========================================================================================================
// RequestRouter
// Purpose: Owns the session and transport registries and applies the lifecycle rules to every inbound
//          POST: keepalive fast path, channel reuse, reconnection, orphaned-session recovery, fresh
//          sessions and the compatibility handshake for clients that skip initialize.
// Notes:
//   - Channel resolution and creation for one session id are serialized by a per-id lock, so concurrent
//     first use of an id builds exactly one channel and one handler. Dispatch runs outside the lock.
//   - Evictions (capacity, idle sweep, explicit delete) cascade: unbind, close channel, release the
//     session's worker context, drop its handler.
//   - No exception escapes HandlePost; internal failures become InternalError with HTTP 500.
//==========================================================================================================
class RequestRouter {
public:
    using Clock = std::chrono::steady_clock;
    using IdGenerator = std::function<std::string()>;

    RequestRouter(RouterOptions options, std::shared_ptr<HandlerPool> handlers,
                  std::shared_ptr<WorkerPool> workers);
    ~RequestRouter();

    RequestRouter(const RequestRouter&) = delete;
    RequestRouter& operator=(const RequestRouter&) = delete;

    ///////////////////////////////////////////// Entry points /////////////////////////////////////////////
    RouteResult HandlePost(const std::optional<std::string>& sessionId, const JSONRPCRequest& request);

    // Delivers a notification to the session's channel when one exists. Always accepted (HTTP 202).
    RouteResult HandleNotification(const std::optional<std::string>& sessionId, const JSONRPCNotification& note);

    DeleteOutcome DeleteSession(const std::string& sessionId);

    ///////////////////////////////////////////// Maintenance /////////////////////////////////////////////
    // Removes sessions idle longer than the timeout. Each record goes together with its channel, worker
    // context and handler while that session's lock is held. Returns the count removed.
    std::size_t SweepIdleSessions(Clock::time_point now);

    // Runs SweepIdleSessions every interval on a background thread until Shutdown.
    void StartIdleSweep(std::chrono::milliseconds interval);

    // Closes every channel, clears both registries, then shuts down the worker pool and handler pool.
    void Shutdown();

    // Channel-level error reported for a session: logged, then the channel is closed and unbound.
    void OnTransportError(const std::string& sessionId, const std::string& error);

    ///////////////////////////////////////////// Introspection /////////////////////////////////////////////
    RouterStats GetStats() const;
    SessionRegistry& Sessions();
    TransportRegistry& Transports();
    HandlerPool& Handlers();

    // Replaces the session id generator (random UUID v4 by default).
    void SetIdGenerator(IdGenerator generator);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace vaultmcp
