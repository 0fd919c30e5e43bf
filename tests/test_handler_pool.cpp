//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_handler_pool.cpp
// Purpose: GoogleTests for per-session and shared protocol handler pooling
//==========================================================================================================

#include <gtest/gtest.h>
#include "vaultmcp/HandlerPool.h"
#include "vaultmcp/ProtocolHandler.h"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace vaultmcp;

namespace {

HandlerPool::Factory countingFactory(std::atomic<int>& counter) {
    return [&counter](const std::string&) -> std::shared_ptr<IProtocolHandler> {
        ++counter;
        return std::make_shared<ProtocolHandler>(ProtocolHandlerOptions{});
    };
}

} // namespace

TEST(HandlerPool, PerSessionHandlersAreCachedAndEvictable) {
    std::atomic<int> created{0};
    HandlerPool pool(countingFactory(created), 8, false);
    auto a1 = pool.GetOrCreate("A");
    auto a2 = pool.GetOrCreate("A");
    auto b = pool.GetOrCreate("B");
    EXPECT_EQ(a1, a2);
    EXPECT_NE(a1, b);
    EXPECT_EQ(created.load(), 2);
    EXPECT_EQ(pool.Find("A"), a1);

    EXPECT_TRUE(pool.Evict("A"));
    EXPECT_FALSE(pool.Evict("A"));
    EXPECT_EQ(pool.Find("A"), nullptr);
    EXPECT_NE(pool.GetOrCreate("A"), a1);

    auto stats = pool.GetStats();
    EXPECT_EQ(stats.activeHandlers, 2u);
    EXPECT_EQ(stats.maxHandlers, 8u);
    EXPECT_EQ(stats.handlersCreated, 3u);
}

TEST(HandlerPool, SharedModeHandsOutOneInstance) {
    std::atomic<int> created{0};
    HandlerPool pool(countingFactory(created), 8, true);
    EXPECT_TRUE(pool.IsShared());
    auto a = pool.GetOrCreate("A");
    auto b = pool.GetOrCreate("B");
    EXPECT_EQ(a, b);
    EXPECT_EQ(created.load(), 1);
    EXPECT_FALSE(pool.Evict("A"));
    EXPECT_EQ(pool.Find("anything"), a);
    EXPECT_EQ(pool.GetStats().maxHandlers, 1u);
}

TEST(HandlerPool, ConcurrentFirstUseCreatesOnce) {
    std::atomic<int> created{0};
    HandlerPool pool(countingFactory(created), 8, false);
    std::vector<std::thread> threads;
    std::vector<std::shared_ptr<IProtocolHandler>> seen(8);
    for (size_t i = 0; i < seen.size(); ++i) {
        threads.emplace_back([&, i]() { seen[i] = pool.GetOrCreate("same"); });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(created.load(), 1);
    for (const auto& h : seen) {
        EXPECT_EQ(h, seen[0]);
    }
}

TEST(HandlerPool, RequestCounterAndShutdown) {
    std::atomic<int> created{0};
    HandlerPool pool(countingFactory(created), 4, false);
    pool.GetOrCreate("A");
    pool.RecordRequest();
    pool.RecordRequest();
    EXPECT_EQ(pool.GetStats().totalRequests, 2u);

    pool.Shutdown();
    EXPECT_EQ(pool.GetStats().activeHandlers, 0u);
    EXPECT_THROW(pool.GetOrCreate("B"), std::runtime_error);
    EXPECT_NO_THROW(pool.Shutdown());
}

TEST(HandlerPool, RejectsMissingFactoryAndNullHandlers) {
    EXPECT_THROW(HandlerPool(HandlerPool::Factory{}, 4, false), std::invalid_argument);
    HandlerPool pool([](const std::string&) -> std::shared_ptr<IProtocolHandler> { return nullptr; }, 4, false);
    EXPECT_THROW(pool.GetOrCreate("A"), std::runtime_error);
}
