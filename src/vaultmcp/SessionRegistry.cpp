//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionRegistry.cpp
// Purpose: Session record bookkeeping, idle sweep and LRU capacity eviction
//==========================================================================================================

#include "vaultmcp/SessionRegistry.h"
#include "logging/Logger.h"

#include <algorithm>

namespace vaultmcp {

Session::Session(std::string sid, Clock::time_point created)
    : id(std::move(sid)), createdAt(created), lastActivityTicks(created.time_since_epoch().count()) {}

Session::Clock::time_point Session::LastActivity() const {
    return Clock::time_point(Clock::duration(lastActivityTicks.load(std::memory_order_relaxed)));
}

void Session::touch(Clock::time_point now) {
    lastActivityTicks.store(now.time_since_epoch().count(), std::memory_order_relaxed);
    requestCount.fetch_add(1, std::memory_order_relaxed);
}

const char* ToString(EvictionReason reason) {
    switch (reason) {
        case EvictionReason::IdleTimeout: return "idle-timeout";
        case EvictionReason::Capacity: return "capacity";
        case EvictionReason::Explicit: return "explicit";
    }
    return "unknown";
}

SessionRegistry::SessionRegistry() : SessionRegistry(Options{}) {}

SessionRegistry::SessionRegistry(Options opts) : options(std::move(opts)) {}

std::shared_ptr<Session> SessionRegistry::CreateOrGet(const std::string& id) {
    return CreateOrGet(id, Clock::now());
}

std::shared_ptr<Session> SessionRegistry::CreateOrGet(const std::string& id, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = sessions.find(id);
    if (it != sessions.end()) {
        return it->second;
    }
    auto session = std::make_shared<Session>(id, now);
    sessions.emplace(id, session);
    LOG_INFO("Session created: {} (active={})", id, sessions.size());
    return session;
}

void SessionRegistry::Touch(const std::string& id) {
    Touch(id, Clock::now());
}

void SessionRegistry::Touch(const std::string& id, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = sessions.find(id);
    if (it == sessions.end()) {
        return;
    }
    it->second->touch(now);
}

bool SessionRegistry::isIdle(const Session& session, Clock::time_point now) const {
    return now - session.LastActivity() > options.idleTimeout;
}

// Caller holds mutex. Returns end() when within capacity or no candidate remains.
SessionRegistry::Map::const_iterator SessionRegistry::selectVictimLocked(const std::string& protectId) const {
    if (options.maxSessions == 0 || sessions.size() <= options.maxSessions) {
        return sessions.end();
    }
    auto victim = sessions.end();
    for (auto it = sessions.begin(); it != sessions.end(); ++it) {
        if (it->first == protectId && sessions.size() > 1) {
            continue;
        }
        if (victim == sessions.end()) {
            victim = it;
            continue;
        }
        const auto& cand = *it->second;
        const auto& best = *victim->second;
        if (cand.LastActivity() < best.LastActivity() ||
            (cand.LastActivity() == best.LastActivity() && cand.CreatedAt() < best.CreatedAt())) {
            victim = it;
        }
    }
    return victim;
}

std::vector<SessionEviction> SessionRegistry::Sweep(Clock::time_point now) {
    std::vector<SessionEviction> evicted;
    std::lock_guard<std::mutex> lock(mutex);
    for (auto it = sessions.begin(); it != sessions.end();) {
        if (isIdle(*it->second, now)) {
            LOG_INFO("Session {} idle for {} ms; sweeping", it->first,
                     std::chrono::duration_cast<std::chrono::milliseconds>(now - it->second->LastActivity()).count());
            evicted.push_back(SessionEviction{it->second, EvictionReason::IdleTimeout});
            it = sessions.erase(it);
        } else {
            ++it;
        }
    }
    return evicted;
}

std::vector<SessionEviction> SessionRegistry::EvictIfOverCapacity(const std::string& protectId) {
    std::vector<SessionEviction> evicted;
    std::lock_guard<std::mutex> lock(mutex);
    for (auto victim = selectVictimLocked(protectId); victim != sessions.end();
         victim = selectVictimLocked(protectId)) {
        LOG_WARN("Session capacity {} exceeded; evicting least recently active session {}",
                 options.maxSessions, victim->first);
        evicted.push_back(SessionEviction{victim->second, EvictionReason::Capacity});
        sessions.erase(victim);
    }
    return evicted;
}

std::vector<std::string> SessionRegistry::IdleCandidates(Clock::time_point now) const {
    std::vector<std::string> ids;
    std::lock_guard<std::mutex> lock(mutex);
    for (const auto& [id, s] : sessions) {
        if (isIdle(*s, now)) {
            ids.push_back(id);
        }
    }
    return ids;
}

std::optional<SessionEviction> SessionRegistry::RemoveIfIdle(const std::string& id, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = sessions.find(id);
    if (it == sessions.end() || !isIdle(*it->second, now)) {
        return std::nullopt;
    }
    LOG_INFO("Session {} idle for {} ms; sweeping", id,
             std::chrono::duration_cast<std::chrono::milliseconds>(now - it->second->LastActivity()).count());
    SessionEviction eviction{std::move(it->second), EvictionReason::IdleTimeout};
    sessions.erase(it);
    return eviction;
}

std::optional<std::string> SessionRegistry::CapacityCandidate(const std::string& protectId) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto victim = selectVictimLocked(protectId);
    if (victim == sessions.end()) {
        return std::nullopt;
    }
    return victim->first;
}

std::optional<SessionEviction> SessionRegistry::RemoveIfOverCapacity(const std::string& id,
                                                                     const std::string& protectId) {
    std::lock_guard<std::mutex> lock(mutex);
    auto victim = selectVictimLocked(protectId);
    if (victim == sessions.end() || victim->first != id) {
        return std::nullopt;
    }
    LOG_WARN("Session capacity {} exceeded; evicting least recently active session {}", options.maxSessions, id);
    SessionEviction eviction{victim->second, EvictionReason::Capacity};
    sessions.erase(victim);
    return eviction;
}

std::shared_ptr<Session> SessionRegistry::Remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = sessions.find(id);
    if (it == sessions.end()) {
        return nullptr;
    }
    auto session = std::move(it->second);
    sessions.erase(it);
    LOG_DEBUG("Session removed: {}", id);
    return session;
}

std::shared_ptr<Session> SessionRegistry::Get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = sessions.find(id);
    return it == sessions.end() ? nullptr : it->second;
}

bool SessionRegistry::Contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex);
    return sessions.find(id) != sessions.end();
}

std::size_t SessionRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return sessions.size();
}

std::vector<std::shared_ptr<Session>> SessionRegistry::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<std::shared_ptr<Session>> out;
    out.reserve(sessions.size());
    for (const auto& [id, s] : sessions) {
        out.push_back(s);
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return a->CreatedAt() < b->CreatedAt();
    });
    return out;
}

std::vector<std::shared_ptr<Session>> SessionRegistry::Clear() {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<std::shared_ptr<Session>> out;
    out.reserve(sessions.size());
    for (auto& [id, s] : sessions) {
        out.push_back(std::move(s));
    }
    sessions.clear();
    return out;
}

} // namespace vaultmcp
