//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_worker_pool.cpp
// Purpose: GoogleTests for per-session worker contexts, bounded queue, timeouts and shutdown
//==========================================================================================================

#include <gtest/gtest.h>
#include "vaultmcp/WorkerPool.h"
#include "vaultmcp/errors/Errors.h"
#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

using namespace vaultmcp;
using namespace std::chrono;

namespace {

WorkItem makeItem(const std::string& sessionId, WorkItem::Task task) {
    WorkItem item;
    item.sessionId = sessionId;
    item.operation = "test.op";
    item.params = JSONValue{JSONValue::Object{}};
    item.task = std::move(task);
    return item;
}

JSONValue intValue(int64_t v) {
    return JSONValue{v};
}

// Blocks a worker until released; used to hold contexts busy deterministically.
struct Gate {
    std::promise<void> open;
    std::shared_future<void> opened{open.get_future().share()};
};

} // namespace

TEST(WorkerPool, RunsTaskAndReturnsValue) {
    WorkerPool pool;
    auto fut = pool.Submit(makeItem("S1", [](const JSONValue&, std::stop_token) { return intValue(42); }));
    WorkResult r = fut.get();
    ASSERT_TRUE(r.Ok());
    EXPECT_EQ(std::get<int64_t>(r.value->value), 42);
    auto stats = pool.GetStats();
    EXPECT_EQ(stats.submitted, 1u);
    EXPECT_EQ(stats.completed, 1u);
    EXPECT_EQ(stats.activeWorkers, 1u);
}

TEST(WorkerPool, TaskExceptionsBecomeErrors) {
    WorkerPool pool;
    auto typed = pool.Submit(makeItem("S1", [](const JSONValue&, std::stop_token) -> JSONValue {
        throw errors::McpException(JSONRPCErrorCodes::SecurityViolation, "blocked");
    })).get();
    ASSERT_TRUE(typed.error.has_value());
    EXPECT_EQ(typed.error->code, JSONRPCErrorCodes::SecurityViolation);

    auto plain = pool.Submit(makeItem("S1", [](const JSONValue&, std::stop_token) -> JSONValue {
        throw std::runtime_error("disk on fire");
    })).get();
    ASSERT_TRUE(plain.error.has_value());
    EXPECT_EQ(plain.error->code, JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(pool.GetStats().failed, 2u);
}

TEST(WorkerPool, SessionItemsRunInSubmissionOrder) {
    WorkerPool pool;
    std::mutex m;
    std::vector<int> order;
    std::vector<std::future<WorkResult>> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(pool.Submit(makeItem("S1", [&, i](const JSONValue&, std::stop_token) {
            std::lock_guard<std::mutex> lock(m);
            order.push_back(i);
            return intValue(i);
        })));
    }
    for (auto& f : futures) {
        EXPECT_TRUE(f.get().Ok());
    }
    ASSERT_EQ(order.size(), 10u);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(order[static_cast<size_t>(i)], i);
    }
}

TEST(WorkerPool, FullQueueRejectsWithCapacityExceeded) {
    WorkerPoolOptions opts;
    opts.maxWorkers = 1;
    opts.maxQueueSize = 1;
    WorkerPool pool(opts);
    Gate gate;
    auto busy = pool.Submit(makeItem("A", [&](const JSONValue&, std::stop_token) {
        gate.opened.wait();
        return intValue(1);
    }));
    auto queued = pool.Submit(makeItem("B", [](const JSONValue&, std::stop_token) { return intValue(2); }));
    auto rejected = pool.Submit(makeItem("C", [](const JSONValue&, std::stop_token) { return intValue(3); }));

    WorkResult r = rejected.get();
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->code, JSONRPCErrorCodes::CapacityExceeded);
    EXPECT_EQ(pool.GetStats().rejected, 1u);

    gate.open.set_value();
    EXPECT_TRUE(busy.get().Ok());
    // B takes over the idle context once A finishes
    EXPECT_TRUE(queued.get().Ok());
}

TEST(WorkerPool, TimeoutResolvesWithWorkerTimeoutAndSignalsStop) {
    WorkerPoolOptions opts;
    opts.timeout = milliseconds(50);
    WorkerPool pool(opts);
    std::atomic<bool> sawStop{false};
    auto fut = pool.Submit(makeItem("S1", [&](const JSONValue&, std::stop_token st) {
        auto deadline = steady_clock::now() + seconds(5);
        while (!st.stop_requested() && steady_clock::now() < deadline) {
            std::this_thread::sleep_for(milliseconds(5));
        }
        sawStop = st.stop_requested();
        return intValue(0);
    }));
    WorkResult r = fut.get();
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->code, JSONRPCErrorCodes::WorkerTimeout);
    EXPECT_EQ(pool.GetStats().timedOut, 1u);

    // The abandoned context is replaced; the session keeps working
    auto next = pool.Submit(makeItem("S1", [](const JSONValue&, std::stop_token) { return intValue(7); })).get();
    EXPECT_TRUE(next.Ok());
    pool.Shutdown();
    EXPECT_TRUE(sawStop.load());
}

TEST(WorkerPool, ReleaseSessionCancelsQueuedItems) {
    WorkerPoolOptions opts;
    opts.maxWorkers = 1;
    WorkerPool pool(opts);
    Gate gate;
    auto running = pool.Submit(makeItem("A", [&](const JSONValue&, std::stop_token) {
        gate.opened.wait();
        return intValue(1);
    }));
    auto waiting = pool.Submit(makeItem("B", [](const JSONValue&, std::stop_token) { return intValue(2); }));
    pool.ReleaseSession("B");
    WorkResult r = waiting.get();
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->code, JSONRPCErrorCodes::NoActiveTransport);
    gate.open.set_value();
    EXPECT_TRUE(running.get().Ok());
}

TEST(WorkerPool, ShutdownRejectsNewWorkAndIsIdempotent) {
    WorkerPool pool;
    pool.Shutdown();
    EXPECT_TRUE(pool.IsShutdown());
    WorkResult r = pool.Submit(makeItem("S1", [](const JSONValue&, std::stop_token) { return intValue(1); })).get();
    ASSERT_TRUE(r.error.has_value());
    EXPECT_NO_THROW(pool.Shutdown());
}

TEST(WorkerPool, ContextCountNeverExceedsMaxWorkers) {
    WorkerPoolOptions opts;
    opts.maxWorkers = 2;
    opts.maxQueueSize = 100;
    WorkerPool pool(opts);
    std::vector<std::future<WorkResult>> futures;
    for (int i = 0; i < 20; ++i) {
        futures.push_back(pool.Submit(makeItem("S" + std::to_string(i), [](const JSONValue&, std::stop_token) {
            std::this_thread::sleep_for(milliseconds(2));
            return intValue(1);
        })));
        EXPECT_LE(pool.GetStats().activeWorkers, 2u);
    }
    for (auto& f : futures) {
        EXPECT_TRUE(f.get().Ok());
    }
    EXPECT_LE(pool.GetStats().activeWorkers, 2u);
    EXPECT_EQ(pool.GetStats().completed, 20u);
}
