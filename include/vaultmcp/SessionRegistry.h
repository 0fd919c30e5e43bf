//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionRegistry.h
// Purpose: One record per active session with idle sweep and least-recently-active eviction
//==========================================================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace vaultmcp {

//==========================================================================================================
// Session
// Purpose: Identity and activity counters of one client conversation. The id and creation time are
//          fixed at construction; activity fields are updated by SessionRegistry::Touch.
//==========================================================================================================
class Session {
public:
    using Clock = std::chrono::steady_clock;

    Session(std::string id, Clock::time_point createdAt);

    const std::string& GetId() const { return id; }
    Clock::time_point CreatedAt() const { return createdAt; }
    Clock::time_point LastActivity() const;
    uint64_t RequestCount() const { return requestCount.load(std::memory_order_relaxed); }

private:
    friend class SessionRegistry;
    void touch(Clock::time_point now);

    const std::string id;
    const Clock::time_point createdAt;
    std::atomic<Clock::rep> lastActivityTicks;
    std::atomic<uint64_t> requestCount{0};
};

enum class EvictionReason {
    IdleTimeout,
    Capacity,
    Explicit
};

const char* ToString(EvictionReason reason);

//==========================================================================================================
// SessionEviction
// Purpose: Notification returned for every session removed by Sweep or EvictIfOverCapacity; the caller
//          cascades channel closure from these.
//==========================================================================================================
struct SessionEviction {
    std::shared_ptr<Session> session;
    EvictionReason reason;
};

//==========================================================================================================
// SessionRegistry
// Purpose: Thread-safe map of session id to Session record. Pure data and policy, no I/O.
// Options:
//   maxSessions: capacity for EvictIfOverCapacity (0 = unlimited).
//   idleTimeout: inactivity after which Sweep removes a session.
//==========================================================================================================
class SessionRegistry {
public:
    using Clock = Session::Clock;

    struct Options {
        std::size_t maxSessions{0};
        std::chrono::milliseconds idleTimeout{std::chrono::hours(1)};
    };

    SessionRegistry();
    explicit SessionRegistry(Options opts);

    ///////////////////////////////////////////// Lifecycle /////////////////////////////////////////////
    // Returns the existing record for id or creates one with a zero request count. Idempotent.
    std::shared_ptr<Session> CreateOrGet(const std::string& id);
    std::shared_ptr<Session> CreateOrGet(const std::string& id, Clock::time_point now);

    // Updates last activity and bumps the request count. No-op when the session does not exist.
    void Touch(const std::string& id);
    void Touch(const std::string& id, Clock::time_point now);

    // Removes every session idle for longer than the configured timeout.
    std::vector<SessionEviction> Sweep(Clock::time_point now);

    //==========================================================================================================
    // EvictIfOverCapacity
    // Purpose: While the registry holds more than maxSessions records, removes the least recently active
    //          one (ties broken by earliest creation). The protected id is never chosen while another
    //          candidate remains.
    // Args:
    //   protectId: session that triggered the check (typically the one just created).
    // Returns:
    //   One eviction entry per removed session.
    //==========================================================================================================
    std::vector<SessionEviction> EvictIfOverCapacity(const std::string& protectId);

    ///////////////////////////////////////// Two-phase eviction /////////////////////////////////////////
    // The router selects candidates first, then removes each one while holding that id's lock; the
    // conditional removals re-check the policy so a session touched in between survives.
    std::vector<std::string> IdleCandidates(Clock::time_point now) const;
    std::optional<SessionEviction> RemoveIfIdle(const std::string& id, Clock::time_point now);

    // Least recently active session other than protectId while over capacity; nullopt otherwise.
    std::optional<std::string> CapacityCandidate(const std::string& protectId) const;
    // Removes id only if the registry is still over capacity and id is still the chosen victim.
    std::optional<SessionEviction> RemoveIfOverCapacity(const std::string& id, const std::string& protectId);

    // Explicit removal; returns the removed record when present.
    std::shared_ptr<Session> Remove(const std::string& id);

    ///////////////////////////////////////////// Queries /////////////////////////////////////////////
    std::shared_ptr<Session> Get(const std::string& id) const;
    bool Contains(const std::string& id) const;
    std::size_t Size() const;
    std::vector<std::shared_ptr<Session>> Snapshot() const;
    std::vector<std::shared_ptr<Session>> Clear();

    const Options& GetOptions() const { return options; }

private:
    using Map = std::unordered_map<std::string, std::shared_ptr<Session>>;

    bool isIdle(const Session& session, Clock::time_point now) const;
    Map::const_iterator selectVictimLocked(const std::string& protectId) const;

    Options options;
    mutable std::mutex mutex;
    Map sessions;
};

} // namespace vaultmcp
