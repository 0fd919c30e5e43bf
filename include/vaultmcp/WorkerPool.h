//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WorkerPool.h
// Purpose: Bounded pool of per-session execution contexts with a capped wait queue and per-item timeout
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

#include "vaultmcp/JSONRPCTypes.h"
#include "vaultmcp/errors/Errors.h"

namespace vaultmcp {

//==========================================================================================================
// WorkItem
// Purpose: One unit of work submitted to the pool.
// Fields:
//   id: Correlation id for logs; generated when empty.
//   sessionId: Owning session; items of one session never run concurrently.
//   operation: Operation name (tool name) for logs and error data.
//   params: Opaque input passed to task.
//   task: Callable run on an execution context. The stop_token is signalled on timeout or shutdown.
//==========================================================================================================
struct WorkItem {
    using Task = std::function<JSONValue(const JSONValue& params, std::stop_token st)>;

    std::string id;
    std::string sessionId;
    std::string operation;
    JSONValue params;
    Task task;
};

//==========================================================================================================
// WorkResult
// Purpose: Exactly one of value or error is set.
//==========================================================================================================
struct WorkResult {
    std::optional<JSONValue> value;
    std::optional<errors::McpError> error;

    bool Ok() const { return value.has_value() && !error.has_value(); }
};

struct WorkerPoolOptions {
    std::size_t maxWorkers{32};
    std::size_t maxQueueSize{100};
    std::chrono::milliseconds timeout{std::chrono::seconds(30)};
};

struct WorkerPoolStats {
    std::size_t activeWorkers{0};
    std::size_t busyWorkers{0};
    std::size_t queuedItems{0};
    std::size_t maxWorkers{0};
    std::size_t maxQueueSize{0};
    uint64_t submitted{0};
    uint64_t completed{0};
    uint64_t failed{0};
    uint64_t timedOut{0};
    uint64_t rejected{0};
};

//==========================================================================================================
// WorkerPool
// Purpose: Runs work items on at most maxWorkers execution contexts, each bound to one session and
//          running one item at a time. Items that cannot start immediately wait in a FIFO queue capped at
//          maxQueueSize; further submissions are rejected with CapacityExceeded. Every accepted item
//          resolves exactly once: with the task's value, its error, or WorkerTimeout.
// Notes:
//   - Exceptions thrown by a task become failed results; they never affect other sessions.
//   - A timed-out context is abandoned (its stop_token is signalled) and its slot is reused immediately.
//   - Idle contexts are rebound to other sessions when the pool is at capacity.
//==========================================================================================================
class WorkerPool {
public:
    explicit WorkerPool(WorkerPoolOptions options = {});
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    std::future<WorkResult> Submit(WorkItem item);

    // Drops the session's execution context and fails its queued items. Running work completes normally.
    void ReleaseSession(const std::string& sessionId);

    // Cancels queued items, signals running tasks to stop and joins every execution context. Idempotent.
    void Shutdown();

    bool IsShutdown() const;
    WorkerPoolStats GetStats() const;
    const WorkerPoolOptions& GetOptions() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace vaultmcp
