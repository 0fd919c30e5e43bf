//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestRouter.cpp
// Purpose: Session lifecycle state machine, eviction cascade and shutdown ordering
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stop_token>
#include <thread>
#include <unordered_map>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "logging/Logger.h"
#include "vaultmcp/Protocol.h"
#include "vaultmcp/RequestRouter.h"

namespace vaultmcp {

namespace {

std::shared_ptr<JSONValue> make(JSONValue v) {
    return std::make_shared<JSONValue>(std::move(v));
}

//==========================================================================================================
// KeyedLocks
// Purpose: One mutex per session id, created on demand and dropped when its last user releases it.
//==========================================================================================================
class KeyedLocks {
    struct Entry {
        std::mutex m;
        std::size_t users{0};
    };

public:
    class Guard {
    public:
        Guard(KeyedLocks& o, std::string k, std::shared_ptr<Entry> e)
            : owner(o), key(std::move(k)), entry(std::move(e)), lock(entry->m) {}
        ~Guard() {
            lock.unlock();
            owner.release(key);
        }
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        KeyedLocks& owner;
        std::string key;
        std::shared_ptr<Entry> entry;
        std::unique_lock<std::mutex> lock;
    };

    Guard Acquire(const std::string& key) {
        std::shared_ptr<Entry> entry;
        {
            std::lock_guard<std::mutex> g(mutex);
            auto& slot = locks[key];
            if (!slot) {
                slot = std::make_shared<Entry>();
            }
            ++slot->users;
            entry = slot;
        }
        return Guard(*this, key, std::move(entry));
    }

private:
    void release(const std::string& key) {
        std::lock_guard<std::mutex> g(mutex);
        auto it = locks.find(key);
        if (it != locks.end() && --it->second->users == 0) {
            locks.erase(it);
        }
    }

    std::mutex mutex;
    std::unordered_map<std::string, std::shared_ptr<Entry>> locks;
};

// Adds sessionId to the error's data object so clients can retry with the assigned id.
void attachSessionId(JSONRPCResponse& resp, const std::string& sessionId) {
    if (!resp.error.has_value() || !resp.error->IsObject()) {
        return;
    }
    auto& errObj = std::get<JSONValue::Object>(resp.error->value);
    auto it = errObj.find("data");
    if (it != errObj.end() && it->second && it->second->IsObject()) {
        auto copy = std::make_shared<JSONValue>(*it->second);
        std::get<JSONValue::Object>(copy->value)["sessionId"] = make(JSONValue{sessionId});
        it->second = std::move(copy);
        return;
    }
    JSONValue::Object data;
    data["sessionId"] = make(JSONValue{sessionId});
    errObj["data"] = make(JSONValue{std::move(data)});
}

} // namespace

const char* ToString(RoutePath path) {
    switch (path) {
        case RoutePath::Keepalive: return "keepalive";
        case RoutePath::LiveChannel: return "live-channel";
        case RoutePath::Reconnected: return "reconnected";
        case RoutePath::Orphaned: return "orphaned";
        case RoutePath::NewSession: return "new-session";
        case RoutePath::NewSessionCompat: return "new-session-compat";
        case RoutePath::NoChannel: return "no-channel";
        case RoutePath::Rejected: return "rejected";
        case RoutePath::Failed: return "failed";
    }
    return "unknown";
}

JSONValue RouterStatsToJSON(const RouterStats& stats) {
    JSONValue::Object o;
    o["liveConnections"] = make(JSONValue{static_cast<int64_t>(stats.liveConnections)});
    o["activeSessions"] = make(JSONValue{static_cast<int64_t>(stats.activeSessions)});
    o["compatHandshakes"] = make(JSONValue{static_cast<int64_t>(stats.compatHandshakes)});
    o["compatFailures"] = make(JSONValue{static_cast<int64_t>(stats.compatFailures)});
    o["sessionsEvicted"] = make(JSONValue{static_cast<int64_t>(stats.sessionsEvicted)});

    JSONValue::Object h;
    h["activeHandlers"] = make(JSONValue{static_cast<int64_t>(stats.handlers.activeHandlers)});
    h["maxHandlers"] = make(JSONValue{static_cast<int64_t>(stats.handlers.maxHandlers)});
    h["totalRequests"] = make(JSONValue{static_cast<int64_t>(stats.handlers.totalRequests)});
    o["handlerPool"] = make(JSONValue{std::move(h)});

    if (stats.workers.has_value()) {
        const auto& w = stats.workers.value();
        JSONValue::Object wo;
        wo["activeWorkers"] = make(JSONValue{static_cast<int64_t>(w.activeWorkers)});
        wo["busyWorkers"] = make(JSONValue{static_cast<int64_t>(w.busyWorkers)});
        wo["queuedItems"] = make(JSONValue{static_cast<int64_t>(w.queuedItems)});
        wo["maxWorkers"] = make(JSONValue{static_cast<int64_t>(w.maxWorkers)});
        wo["completed"] = make(JSONValue{static_cast<int64_t>(w.completed)});
        wo["failed"] = make(JSONValue{static_cast<int64_t>(w.failed)});
        wo["timedOut"] = make(JSONValue{static_cast<int64_t>(w.timedOut)});
        wo["rejected"] = make(JSONValue{static_cast<int64_t>(w.rejected)});
        o["workerPool"] = make(JSONValue{std::move(wo)});
    }
    return JSONValue{std::move(o)};
}

class RequestRouter::Impl {
public:
    RouterOptions options;
    std::shared_ptr<HandlerPool> handlers;
    std::shared_ptr<WorkerPool> workers;
    SessionRegistry sessions;
    TransportRegistry transports;
    KeyedLocks keyLocks;

    std::mutex idMutex;
    boost::uuids::random_generator uuidGen;
    IdGenerator idGenerator;

    std::atomic<bool> shuttingDown{false};
    std::atomic<uint64_t> compatHandshakes{0};
    std::atomic<uint64_t> compatFailures{0};
    std::atomic<uint64_t> sessionsEvicted{0};

    std::mutex sweepMutex;
    std::condition_variable_any sweepCv;
    std::jthread sweeper;

    Impl(RouterOptions opts, std::shared_ptr<HandlerPool> h, std::shared_ptr<WorkerPool> w)
        : options(std::move(opts)), handlers(std::move(h)), workers(std::move(w)),
          sessions(SessionRegistry::Options{options.maxSessions, options.sessionTimeout}) {
        if (!handlers) {
            throw std::invalid_argument("RequestRouter requires a handler pool");
        }
    }

    std::string generateId() {
        std::lock_guard<std::mutex> lock(idMutex);
        if (idGenerator) {
            return idGenerator();
        }
        return boost::uuids::to_string(uuidGen());
    }

    // Caller holds the key lock for sessionId.
    std::shared_ptr<IChannel> openChannelLocked(const std::string& sessionId) {
        auto handler = handlers->GetOrCreate(sessionId);
        auto channel = std::make_shared<SessionChannel>(sessionId, std::move(handler));
        channel->SetCloseHandler([this](const std::string& sid, const IChannel* ch) {
            transports.OnChannelClosed(sid, ch);
        });
        channel->SetErrorHandler([](const std::string& sid, const std::string& err) {
            LOG_ERROR("Transport error for session {}: {}", sid, err);
        });
        transports.Bind(sessionId, channel);
        return channel;
    }

    // Caller holds the key lock for sessionId. Returns false when every version was rejected.
    bool compatHandshakeLocked(const std::string& sessionId, IChannel& channel) {
        auto handler = channel.GetHandler();
        if (handler && handler->IsInitialized()) {
            LOG_DEBUG("Handler for session {} already initialized; compat handshake skipped", sessionId);
            return true;
        }
        ++compatHandshakes;
        for (const char* version : COMPAT_HANDSHAKE_VERSIONS) {
            try {
                if (channel.HandshakeInternally(version)) {
                    LOG_INFO("Compat handshake for session {} succeeded with protocolVersion={}", sessionId, version);
                    return true;
                }
                LOG_ERROR("Compat handshake for session {} rejected protocolVersion={}", sessionId, version);
            } catch (const std::exception& e) {
                LOG_ERROR("Compat handshake for session {} failed (protocolVersion={}): {}", sessionId, version, e.what());
            }
        }
        ++compatFailures;
        if (options.compatFailOpen) {
            LOG_WARN("Compat handshake failed for session {}; proceeding without explicit initialize (fail-open)", sessionId);
        } else {
            LOG_WARN("Compat handshake failed for session {}; client must initialize", sessionId);
        }
        return false;
    }

    // Caller holds the key lock for sessionId and has already removed its session record.
    void teardownLocked(const std::string& sessionId, EvictionReason reason) {
        auto channel = transports.Unbind(sessionId);
        if (channel) {
            channel->Close();
        }
        if (workers) {
            workers->ReleaseSession(sessionId);
        }
        handlers->Evict(sessionId);
        ++sessionsEvicted;
        LOG_INFO("Session {} evicted ({}); channel {}", sessionId, ToString(reason), channel ? "closed" : "absent");
    }

    std::size_t sweepIdle(Clock::time_point now) {
        std::size_t removed = 0;
        for (const auto& id : sessions.IdleCandidates(now)) {
            auto guard = keyLocks.Acquire(id);
            if (sessions.RemoveIfIdle(id, now)) {
                teardownLocked(id, EvictionReason::IdleTimeout);
                ++removed;
            }
        }
        return removed;
    }

    // Must not be called while holding a key lock.
    void enforceCapacity(const std::string& protectId) {
        while (auto victim = sessions.CapacityCandidate(protectId)) {
            auto guard = keyLocks.Acquire(victim.value());
            if (sessions.RemoveIfOverCapacity(victim.value(), protectId)) {
                teardownLocked(victim.value(), EvictionReason::Capacity);
            }
        }
    }

    RouteResult keepalive(const std::optional<std::string>& sid, const JSONRPCRequest& req) {
        if (sid.has_value()) {
            sessions.Touch(sid.value());
        }
        JSONValue::Object result;
        result["ok"] = make(JSONValue{true});
        result["sessionId"] = sid.has_value() ? make(JSONValue{sid.value()}) : make(JSONValue{nullptr});
        RouteResult r;
        r.httpStatus = 200;
        r.sessionId = sid;
        r.response = CreateResultResponse(req.id, JSONValue{std::move(result)});
        r.path = RoutePath::Keepalive;
        return r;
    }

    RouteResult notInitialized(const std::string& sessionId, const JSONRPCRequest& req, RoutePath path) {
        JSONValue::Object data;
        data["sessionId"] = make(JSONValue{sessionId});
        RouteResult r;
        r.httpStatus = 400;
        r.sessionId = sessionId;
        r.response = CreateErrorResponse(req.id, JSONRPCErrorCodes::NotInitialized,
                                         "Bad Request: Server not initialized", JSONValue{std::move(data)});
        r.path = path;
        return r;
    }

    RouteResult handlePost(const std::optional<std::string>& sidIn, const JSONRPCRequest& req) {
        std::optional<std::string> sid = sidIn;
        if (sid.has_value() && sid->empty()) {
            sid.reset();
        }
        if (IsKeepalivePing(req.method)) {
            return keepalive(sid, req);
        }

        std::optional<std::string> assigned;
        try {
            if (shuttingDown.load()) {
                RouteResult r;
                r.httpStatus = 503;
                r.sessionId = sid;
                r.response = CreateErrorResponse(req.id, JSONRPCErrorCodes::NoActiveTransport, "Server is shutting down");
                r.path = RoutePath::Rejected;
                return r;
            }

            const bool handshake = IsHandshake(req.method);
            const std::string id = sid.has_value() ? sid.value() : generateId();
            assigned = id;

            RoutePath path = RoutePath::NoChannel;
            std::shared_ptr<IChannel> channel;
            bool created = false;
            bool compatRejected = false;
            {
                auto guard = keyLocks.Acquire(id);
                channel = transports.Get(id);
                if (channel && channel->IsOpen() && sessions.Contains(id)) {
                    path = RoutePath::LiveChannel;
                    sessions.Touch(id);
                } else {
                    if (channel) {
                        transports.Unbind(id);
                        channel->Close();
                    }
                    if (sid.has_value()) {
                        path = handshake ? RoutePath::Reconnected : RoutePath::Orphaned;
                    } else {
                        path = handshake ? RoutePath::NewSession : RoutePath::NewSessionCompat;
                    }
                    created = !sessions.Contains(id);
                    sessions.CreateOrGet(id);
                    sessions.Touch(id);
                    channel = openChannelLocked(id);
                    LOG_INFO("Channel created for session {} via {} path", id, ToString(path));
                    if (!handshake) {
                        compatRejected = !compatHandshakeLocked(id, *channel) && !options.compatFailOpen;
                    }
                }
            }
            if (created) {
                enforceCapacity(id);
            }

            if (compatRejected) {
                return notInitialized(id, req, path);
            }
            if (!channel) {
                JSONValue::Object data;
                data["sessionId"] = make(JSONValue{id});
                RouteResult r;
                r.sessionId = id;
                r.response = CreateErrorResponse(req.id, JSONRPCErrorCodes::NoActiveTransport,
                                                 "No active transport/session. Please initialize and retry.",
                                                 JSONValue{std::move(data)});
                r.path = RoutePath::NoChannel;
                return r;
            }

            handlers->RecordRequest();
            auto resp = channel->HandleRequest(req);
            RouteResult r;
            r.sessionId = id;
            r.path = path;
            const auto code = resp->ErrorCode();
            if (code == JSONRPCErrorCodes::NotInitialized) {
                attachSessionId(*resp, id);
                r.httpStatus = 400;
            } else if (code == JSONRPCErrorCodes::NoActiveTransport) {
                attachSessionId(*resp, id);
                r.path = RoutePath::NoChannel;
            }
            r.response = std::move(resp);
            return r;
        } catch (const std::exception& e) {
            LOG_ERROR("MCP request error ({}): {}", req.method, e.what());
            RouteResult r;
            r.httpStatus = 500;
            r.sessionId = assigned;
            r.response = CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError,
                                             std::string("Internal error: ") + e.what());
            r.path = RoutePath::Failed;
            return r;
        }
    }

    RouteResult handleNotification(const std::optional<std::string>& sid, const JSONRPCNotification& note) {
        RouteResult r;
        r.httpStatus = 202;
        r.sessionId = sid;
        r.path = RoutePath::Rejected;
        if (!sid.has_value() || sid->empty()) {
            LOG_DEBUG("Notification {} without session id accepted and dropped", note.method);
            return r;
        }
        try {
            auto channel = transports.Get(sid.value());
            if (!channel) {
                LOG_DEBUG("Notification {} for session {} without channel dropped", note.method, sid.value());
                return r;
            }
            sessions.Touch(sid.value());
            channel->HandleNotification(note);
            r.path = RoutePath::LiveChannel;
        } catch (const std::exception& e) {
            LOG_ERROR("Notification {} for session {} failed: {}", note.method, sid.value(), e.what());
            r.path = RoutePath::Failed;
        }
        return r;
    }

    DeleteOutcome deleteSession(const std::string& sessionId) {
        auto guard = keyLocks.Acquire(sessionId);
        auto channel = transports.Unbind(sessionId);
        sessions.Remove(sessionId);
        if (workers) {
            workers->ReleaseSession(sessionId);
        }
        handlers->Evict(sessionId);
        if (!channel) {
            LOG_DEBUG("Delete for session {}: no live channel", sessionId);
            return DeleteOutcome::NotFound;
        }
        channel->Close();
        LOG_INFO("Closed MCP session {} (remaining={})", sessionId, transports.LiveConnections());
        return DeleteOutcome::Closed;
    }

    void sweepLoop(std::stop_token st, std::chrono::milliseconds interval) {
        std::unique_lock<std::mutex> lock(sweepMutex);
        while (!st.stop_requested()) {
            sweepCv.wait_for(lock, st, interval, []() { return false; });
            if (st.stop_requested()) {
                break;
            }
            lock.unlock();
            try {
                const auto removed = sweepIdle(Clock::now());
                if (removed > 0) {
                    LOG_INFO("Idle sweep removed {} sessions ({} active)", removed, sessions.Size());
                }
            } catch (const std::exception& e) {
                LOG_ERROR("Idle sweep failed: {}", e.what());
            }
            lock.lock();
        }
    }

    void shutdown() {
        if (shuttingDown.exchange(true)) {
            return;
        }
        LOG_INFO("Request router shutting down");
        if (sweeper.joinable()) {
            sweeper.request_stop();
            sweepCv.notify_all();
            sweeper.join();
        }
        auto channels = transports.DrainAll();
        for (auto& ch : channels) {
            ch->Close();
            LOG_DEBUG("Closed MCP session on shutdown: {}", ch->GetSessionId());
        }
        sessions.Clear();
        if (workers) {
            workers->Shutdown();
        }
        handlers->Shutdown();
        LOG_INFO("Request router stopped ({} channels closed)", channels.size());
    }
};

RequestRouter::RequestRouter(RouterOptions options, std::shared_ptr<HandlerPool> handlers,
                             std::shared_ptr<WorkerPool> workers)
    : pImpl(std::make_unique<Impl>(std::move(options), std::move(handlers), std::move(workers))) {
    FUNC_SCOPE();
}

RequestRouter::~RequestRouter() {
    FUNC_SCOPE();
    pImpl->shutdown();
}

RouteResult RequestRouter::HandlePost(const std::optional<std::string>& sessionId, const JSONRPCRequest& request) {
    FUNC_SCOPE();
    return pImpl->handlePost(sessionId, request);
}

RouteResult RequestRouter::HandleNotification(const std::optional<std::string>& sessionId,
                                              const JSONRPCNotification& note) {
    FUNC_SCOPE();
    return pImpl->handleNotification(sessionId, note);
}

DeleteOutcome RequestRouter::DeleteSession(const std::string& sessionId) {
    FUNC_SCOPE();
    return pImpl->deleteSession(sessionId);
}

std::size_t RequestRouter::SweepIdleSessions(Clock::time_point now) {
    FUNC_SCOPE();
    return pImpl->sweepIdle(now);
}

void RequestRouter::StartIdleSweep(std::chrono::milliseconds interval) {
    FUNC_SCOPE();
    if (pImpl->sweeper.joinable() || interval.count() <= 0) {
        return;
    }
    LOG_INFO("Idle session sweep every {} ms (timeout {} ms)", interval.count(), pImpl->options.sessionTimeout.count());
    pImpl->sweeper = std::jthread([this, interval](std::stop_token st) { pImpl->sweepLoop(st, interval); });
}

void RequestRouter::Shutdown() {
    FUNC_SCOPE();
    pImpl->shutdown();
}

void RequestRouter::OnTransportError(const std::string& sessionId, const std::string& error) {
    FUNC_SCOPE();
    LOG_ERROR("Transport error for session {}: {}", sessionId, error);
    auto guard = pImpl->keyLocks.Acquire(sessionId);
    auto channel = pImpl->transports.Unbind(sessionId);
    if (channel) {
        channel->Close();
    }
}

RouterStats RequestRouter::GetStats() const {
    RouterStats s;
    s.liveConnections = pImpl->transports.LiveConnections();
    s.activeSessions = pImpl->sessions.Size();
    s.handlers = pImpl->handlers->GetStats();
    if (pImpl->workers) {
        s.workers = pImpl->workers->GetStats();
    }
    s.compatHandshakes = pImpl->compatHandshakes.load();
    s.compatFailures = pImpl->compatFailures.load();
    s.sessionsEvicted = pImpl->sessionsEvicted.load();
    return s;
}

SessionRegistry& RequestRouter::Sessions() {
    return pImpl->sessions;
}

TransportRegistry& RequestRouter::Transports() {
    return pImpl->transports;
}

HandlerPool& RequestRouter::Handlers() {
    return *pImpl->handlers;
}

void RequestRouter::SetIdGenerator(IdGenerator generator) {
    std::lock_guard<std::mutex> lock(pImpl->idMutex);
    pImpl->idGenerator = std::move(generator);
}

} // namespace vaultmcp
