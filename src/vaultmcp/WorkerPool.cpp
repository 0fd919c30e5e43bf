//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WorkerPool.cpp
// Purpose: Per-session execution contexts on std::jthread with a reaper enforcing item timeouts
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#include "logging/Logger.h"
#include "vaultmcp/WorkerPool.h"

namespace vaultmcp {

namespace {
using Clock = std::chrono::steady_clock;

struct Pending {
    WorkItem item;
    std::promise<WorkResult> promise;
    std::atomic<bool> done{false};
    std::stop_source stop;
    Clock::time_point deadline;

    // Delivers the result once; later completions (e.g. a task finishing after its timeout) are dropped.
    bool complete(WorkResult result) {
        if (done.exchange(true)) {
            return false;
        }
        promise.set_value(std::move(result));
        return true;
    }
};

struct Context {
    std::string sessionId;
    std::condition_variable cv;
    std::shared_ptr<Pending> current;
    bool retired{false};
    bool abandoned{false};
    std::atomic<bool> exited{false};
    std::jthread thread;
};

WorkResult failed(errors::McpError err) {
    WorkResult r;
    r.error = std::move(err);
    return r;
}
} // namespace

class WorkerPool::Impl {
public:
    WorkerPoolOptions options;
    mutable std::mutex mutex;
    std::condition_variable_any reaperCv;
    std::unordered_map<std::string, std::shared_ptr<Context>> contexts;
    std::vector<std::shared_ptr<Context>> graveyard;
    std::deque<std::shared_ptr<Pending>> queue;
    std::jthread reaper;
    bool shutdown{false};
    std::atomic<uint64_t> itemCounter{0};
    std::atomic<uint64_t> submitted{0};
    std::atomic<uint64_t> completed{0};
    std::atomic<uint64_t> failedCount{0};
    std::atomic<uint64_t> timedOut{0};
    std::atomic<uint64_t> rejected{0};

    explicit Impl(WorkerPoolOptions opts) : options(std::move(opts)) {
        if (options.maxWorkers == 0) {
            options.maxWorkers = 1;
        }
        reaper = std::jthread([this](std::stop_token st) { reapLoop(st); });
    }

    WorkResult execute(Pending& p) {
        WorkResult r;
        try {
            r.value = p.item.task(p.item.params, p.stop.get_token());
        } catch (const errors::McpException& e) {
            r.error = e.Error();
        } catch (const std::exception& e) {
            LOG_ERROR("Worker task {} ({}) for session {} threw: {}", p.item.id, p.item.operation,
                      p.item.sessionId, e.what());
            r.error = errors::makeError(JSONRPCErrorCodes::InternalError, std::string("Worker error: ") + e.what());
        } catch (...) {
            LOG_ERROR("Worker task {} ({}) threw a non-standard exception", p.item.id, p.item.operation);
            r.error = errors::makeError(JSONRPCErrorCodes::InternalError, "Worker error: unknown exception");
        }
        return r;
    }

    void runContext(const std::shared_ptr<Context>& ctx) {
        std::unique_lock<std::mutex> lock(mutex);
        while (true) {
            ctx->cv.wait(lock, [&]() { return ctx->current || ctx->retired; });
            if (!ctx->current) {
                break;
            }
            auto pending = ctx->current;
            lock.unlock();
            WorkResult result = execute(*pending);
            const bool ok = result.Ok();
            if (pending->complete(std::move(result))) {
                if (ok) { ++completed; } else { ++failedCount; }
            } else {
                LOG_DEBUG("Worker item {} finished after it was already resolved", pending->item.id);
            }
            lock.lock();
            ctx->current.reset();
            if (ctx->abandoned || ctx->retired) {
                break;
            }
            dispatchQueuedLocked();
        }
        lock.unlock();
        ctx->exited = true;
        reaperCv.notify_all();
    }

    std::shared_ptr<Context> createContextLocked(const std::string& sessionId) {
        auto ctx = std::make_shared<Context>();
        ctx->sessionId = sessionId;
        contexts.emplace(sessionId, ctx);
        ctx->thread = std::jthread([this, ctx]() { runContext(ctx); });
        LOG_DEBUG("Worker context created for session {} ({}/{})", sessionId, contexts.size(), options.maxWorkers);
        return ctx;
    }

    std::shared_ptr<Context> findIdleLocked() {
        for (auto& [sid, ctx] : contexts) {
            if (!ctx->current) {
                return ctx;
            }
        }
        return nullptr;
    }

    void rebindLocked(const std::shared_ptr<Context>& ctx, const std::string& sessionId) {
        LOG_DEBUG("Worker context rebound from session {} to {}", ctx->sessionId, sessionId);
        contexts.erase(ctx->sessionId);
        ctx->sessionId = sessionId;
        contexts.emplace(sessionId, ctx);
    }

    void assignLocked(const std::shared_ptr<Context>& ctx, std::shared_ptr<Pending> pending) {
        ctx->current = std::move(pending);
        ctx->cv.notify_one();
    }

    // Tries to place the pending item on an execution context; false when it must wait.
    bool placeLocked(const std::shared_ptr<Pending>& pending) {
        const std::string& sid = pending->item.sessionId;
        auto it = contexts.find(sid);
        if (it != contexts.end()) {
            if (it->second->current) {
                return false;
            }
            assignLocked(it->second, pending);
            return true;
        }
        if (contexts.size() < options.maxWorkers) {
            assignLocked(createContextLocked(sid), pending);
            return true;
        }
        if (auto idle = findIdleLocked()) {
            rebindLocked(idle, sid);
            assignLocked(idle, pending);
            return true;
        }
        return false;
    }

    void dispatchQueuedLocked() {
        for (auto it = queue.begin(); it != queue.end();) {
            if (placeLocked(*it)) {
                it = queue.erase(it);
            } else {
                ++it;
            }
        }
    }

    std::future<WorkResult> submit(WorkItem item) {
        auto pending = std::make_shared<Pending>();
        if (item.id.empty()) {
            item.id = "work-" + std::to_string(++itemCounter);
        }
        pending->item = std::move(item);
        auto fut = pending->promise.get_future();

        std::lock_guard<std::mutex> lock(mutex);
        if (shutdown) {
            ++rejected;
            pending->complete(failed(errors::makeError(JSONRPCErrorCodes::CapacityExceeded,
                                                       "Worker pool is shut down")));
            return fut;
        }
        if (!pending->item.task) {
            ++failedCount;
            pending->complete(failed(errors::makeError(JSONRPCErrorCodes::InternalError,
                                                       "Work item has no task")));
            return fut;
        }
        pending->deadline = Clock::now() + options.timeout;
        // Items of a session already waiting keep FIFO order behind the queue
        bool sessionQueued = std::any_of(queue.begin(), queue.end(), [&](const auto& q) {
            return q->item.sessionId == pending->item.sessionId;
        });
        if (!sessionQueued && placeLocked(pending)) {
            ++submitted;
            reaperCv.notify_one();
            return fut;
        }
        if (queue.size() >= options.maxQueueSize) {
            ++rejected;
            LOG_WARN("Worker queue full ({} items); rejecting {} for session {}", queue.size(),
                     pending->item.operation, pending->item.sessionId);
            JSONValue::Object data;
            data["maxWorkers"] = std::make_shared<JSONValue>(static_cast<int64_t>(options.maxWorkers));
            data["maxQueueSize"] = std::make_shared<JSONValue>(static_cast<int64_t>(options.maxQueueSize));
            pending->complete(failed(errors::makeError(JSONRPCErrorCodes::CapacityExceeded,
                                                       "Worker pool capacity exceeded; retry later",
                                                       JSONValue{std::move(data)})));
            return fut;
        }
        LOG_DEBUG("Worker item {} queued for session {} (queue={})", pending->item.id,
                  pending->item.sessionId, queue.size() + 1);
        ++submitted;
        queue.push_back(pending);
        reaperCv.notify_one();
        return fut;
    }

    errors::McpError timeoutError(const Pending& p) const {
        JSONValue::Object data;
        data["operation"] = std::make_shared<JSONValue>(p.item.operation);
        data["timeoutMs"] = std::make_shared<JSONValue>(static_cast<int64_t>(options.timeout.count()));
        return errors::makeError(JSONRPCErrorCodes::WorkerTimeout,
                                 "Worker timeout after " + std::to_string(options.timeout.count()) + " ms",
                                 JSONValue{std::move(data)});
    }

    void reapLoop(std::stop_token st) {
        std::unique_lock<std::mutex> lock(mutex);
        while (!st.stop_requested()) {
            const auto now = Clock::now();
            std::vector<std::shared_ptr<Pending>> expired;

            for (auto it = queue.begin(); it != queue.end();) {
                if ((*it)->deadline <= now) {
                    expired.push_back(*it);
                    it = queue.erase(it);
                } else {
                    ++it;
                }
            }
            std::vector<std::shared_ptr<Context>> abandoned;
            for (auto it = contexts.begin(); it != contexts.end();) {
                auto& ctx = it->second;
                if (ctx->current && ctx->current->deadline <= now) {
                    expired.push_back(ctx->current);
                    ctx->abandoned = true;
                    abandoned.push_back(ctx);
                    it = contexts.erase(it);
                } else {
                    ++it;
                }
            }
            for (auto& ctx : abandoned) {
                graveyard.push_back(ctx);
            }
            if (!abandoned.empty()) {
                dispatchQueuedLocked();
            }

            std::vector<std::shared_ptr<Context>> finished;
            for (auto it = graveyard.begin(); it != graveyard.end();) {
                if ((*it)->exited) {
                    finished.push_back(std::move(*it));
                    it = graveyard.erase(it);
                } else {
                    ++it;
                }
            }

            auto next = Clock::time_point::max();
            for (const auto& p : queue) {
                next = std::min(next, p->deadline);
            }
            for (const auto& [sid, ctx] : contexts) {
                if (ctx->current) {
                    next = std::min(next, ctx->current->deadline);
                }
            }

            lock.unlock();
            for (auto& p : expired) {
                p->stop.request_stop();
                if (p->complete(failed(timeoutError(*p)))) {
                    ++timedOut;
                    LOG_WARN("Worker item {} ({}) for session {} timed out after {} ms", p->item.id,
                             p->item.operation, p->item.sessionId, options.timeout.count());
                }
            }
            for (auto& ctx : finished) {
                if (ctx->thread.joinable()) {
                    ctx->thread.join();
                }
            }
            lock.lock();

            if (st.stop_requested()) {
                break;
            }
            if (!expired.empty() || !finished.empty()) {
                continue;
            }
            if (next == Clock::time_point::max()) {
                reaperCv.wait(lock, st, [&]() { return hasReaperWorkLocked(); });
            } else {
                reaperCv.wait_until(lock, st, next, [&]() { return hasReaperWorkLocked(next); });
            }
        }
    }

    bool hasReaperWorkLocked(Clock::time_point scheduled = Clock::time_point::max()) const {
        if (shutdown) {
            return true;
        }
        for (const auto& ctx : graveyard) {
            if (ctx->exited) {
                return true;
            }
        }
        // Wake early when a newly submitted item has an earlier deadline
        for (const auto& p : queue) {
            if (p->deadline < scheduled) {
                return true;
            }
        }
        for (const auto& [sid, ctx] : contexts) {
            if (ctx->current && ctx->current->deadline < scheduled) {
                return true;
            }
        }
        return false;
    }

    void releaseSession(const std::string& sessionId) {
        std::vector<std::shared_ptr<Pending>> cancelled;
        {
            std::lock_guard<std::mutex> lock(mutex);
            for (auto it = queue.begin(); it != queue.end();) {
                if ((*it)->item.sessionId == sessionId) {
                    cancelled.push_back(*it);
                    it = queue.erase(it);
                } else {
                    ++it;
                }
            }
            auto it = contexts.find(sessionId);
            if (it != contexts.end()) {
                auto ctx = it->second;
                contexts.erase(it);
                ctx->retired = true;
                ctx->cv.notify_one();
                graveyard.push_back(ctx);
                LOG_DEBUG("Worker context released for session {}", sessionId);
                dispatchQueuedLocked();
            }
        }
        for (auto& p : cancelled) {
            if (p->complete(failed(errors::makeError(JSONRPCErrorCodes::NoActiveTransport,
                                                     "Session closed before the work item ran")))) {
                ++failedCount;
            }
        }
        reaperCv.notify_one();
    }

    void stop() {
        std::vector<std::shared_ptr<Pending>> cancelled;
        std::vector<std::shared_ptr<Context>> all;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (shutdown) {
                return;
            }
            shutdown = true;
            cancelled.assign(queue.begin(), queue.end());
            queue.clear();
            for (auto& [sid, ctx] : contexts) {
                all.push_back(ctx);
            }
            contexts.clear();
            for (auto& ctx : graveyard) {
                all.push_back(ctx);
            }
            graveyard.clear();
            for (auto& ctx : all) {
                ctx->retired = true;
                if (ctx->current) {
                    ctx->current->stop.request_stop();
                }
                ctx->cv.notify_one();
            }
        }
        LOG_INFO("Worker pool shutting down: {} contexts, {} queued items cancelled", all.size(), cancelled.size());
        for (auto& p : cancelled) {
            if (p->complete(failed(errors::makeError(JSONRPCErrorCodes::InternalError,
                                                     "Worker pool shutting down")))) {
                ++failedCount;
            }
        }
        reaper.request_stop();
        reaperCv.notify_all();
        if (reaper.joinable()) {
            reaper.join();
        }
        for (auto& ctx : all) {
            if (ctx->thread.joinable()) {
                ctx->thread.join();
            }
        }
    }
};

WorkerPool::WorkerPool(WorkerPoolOptions options) : pImpl(std::make_unique<Impl>(std::move(options))) {
    FUNC_SCOPE();
}

WorkerPool::~WorkerPool() {
    FUNC_SCOPE();
    pImpl->stop();
}

std::future<WorkResult> WorkerPool::Submit(WorkItem item) {
    FUNC_SCOPE();
    return pImpl->submit(std::move(item));
}

void WorkerPool::ReleaseSession(const std::string& sessionId) {
    FUNC_SCOPE();
    pImpl->releaseSession(sessionId);
}

void WorkerPool::Shutdown() {
    FUNC_SCOPE();
    pImpl->stop();
}

bool WorkerPool::IsShutdown() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->shutdown;
}

WorkerPoolStats WorkerPool::GetStats() const {
    WorkerPoolStats s;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        s.activeWorkers = pImpl->contexts.size();
        for (const auto& [sid, ctx] : pImpl->contexts) {
            if (ctx->current) {
                ++s.busyWorkers;
            }
        }
        s.queuedItems = pImpl->queue.size();
    }
    s.maxWorkers = pImpl->options.maxWorkers;
    s.maxQueueSize = pImpl->options.maxQueueSize;
    s.submitted = pImpl->submitted.load();
    s.completed = pImpl->completed.load();
    s.failed = pImpl->failedCount.load();
    s.timedOut = pImpl->timedOut.load();
    s.rejected = pImpl->rejected.load();
    return s;
}

const WorkerPoolOptions& WorkerPool::GetOptions() const {
    return pImpl->options;
}

} // namespace vaultmcp
