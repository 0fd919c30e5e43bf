//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_session_registry.cpp
// Purpose: GoogleTests for session bookkeeping, idle sweep and least-recently-active eviction
//==========================================================================================================

#include <gtest/gtest.h>
#include "vaultmcp/SessionRegistry.h"
#include <chrono>
#include <optional>
#include <string>

using namespace vaultmcp;
using namespace std::chrono;

namespace {
SessionRegistry::Clock::time_point t0() {
    static const auto base = SessionRegistry::Clock::now();
    return base;
}
}

TEST(SessionRegistry, CreateOrGetIsIdempotent) {
    SessionRegistry reg;
    auto a = reg.CreateOrGet("S1", t0());
    auto b = reg.CreateOrGet("S1", t0() + seconds(5));
    EXPECT_EQ(a, b);
    EXPECT_EQ(a->CreatedAt(), t0());
    EXPECT_EQ(reg.Size(), 1u);
    EXPECT_TRUE(reg.Contains("S1"));
    EXPECT_EQ(reg.Get("nope"), nullptr);
}

TEST(SessionRegistry, TouchAdvancesActivityAndCounts) {
    SessionRegistry reg;
    auto s = reg.CreateOrGet("S1", t0());
    EXPECT_EQ(s->LastActivity(), t0());
    reg.Touch("S1", t0() + seconds(3));
    reg.Touch("S1", t0() + seconds(4));
    EXPECT_EQ(s->LastActivity(), t0() + seconds(4));
    EXPECT_EQ(s->RequestCount(), 2u);
    reg.Touch("unknown", t0()); // ignored
    EXPECT_EQ(reg.Size(), 1u);
}

TEST(SessionRegistry, SweepRemovesOnlyIdleSessions) {
    SessionRegistry reg(SessionRegistry::Options{0, milliseconds(1000)});
    reg.CreateOrGet("old", t0());
    reg.CreateOrGet("fresh", t0());
    reg.Touch("fresh", t0() + milliseconds(1500));

    auto evicted = reg.Sweep(t0() + milliseconds(2000));
    ASSERT_EQ(evicted.size(), 1u);
    EXPECT_EQ(evicted[0].session->GetId(), "old");
    EXPECT_EQ(evicted[0].reason, EvictionReason::IdleTimeout);
    EXPECT_FALSE(reg.Contains("old"));
    EXPECT_TRUE(reg.Contains("fresh"));

    // Exactly at the timeout is not yet idle
    EXPECT_TRUE(reg.Sweep(t0() + milliseconds(2500)).empty());
}

TEST(SessionRegistry, CapacityEvictsLeastRecentlyActive) {
    SessionRegistry reg(SessionRegistry::Options{2, hours(1)});
    reg.CreateOrGet("S1", t0());
    reg.CreateOrGet("S2", t0() + seconds(1));
    reg.Touch("S1", t0() + seconds(2));
    reg.CreateOrGet("S3", t0() + seconds(3));

    auto evicted = reg.EvictIfOverCapacity("S3");
    ASSERT_EQ(evicted.size(), 1u);
    EXPECT_EQ(evicted[0].session->GetId(), "S2");
    EXPECT_EQ(evicted[0].reason, EvictionReason::Capacity);
    EXPECT_EQ(reg.Size(), 2u);
    EXPECT_TRUE(reg.Contains("S3"));
}

TEST(SessionRegistry, CapacityTieBreaksOnCreationTime) {
    SessionRegistry reg(SessionRegistry::Options{1, hours(1)});
    reg.CreateOrGet("later", t0() + seconds(1));
    reg.Touch("later", t0() + seconds(5));
    reg.CreateOrGet("earlier", t0());
    reg.Touch("earlier", t0() + seconds(5));
    reg.CreateOrGet("new", t0() + seconds(6));

    auto evicted = reg.EvictIfOverCapacity("new");
    ASSERT_EQ(evicted.size(), 2u);
    EXPECT_EQ(evicted[0].session->GetId(), "earlier");
    EXPECT_EQ(evicted[1].session->GetId(), "later");
    EXPECT_TRUE(reg.Contains("new"));
}

TEST(SessionRegistry, UnlimitedCapacityNeverEvicts) {
    SessionRegistry reg;
    for (int i = 0; i < 50; ++i) {
        reg.CreateOrGet("S" + std::to_string(i), t0());
    }
    EXPECT_TRUE(reg.EvictIfOverCapacity("S0").empty());
    EXPECT_EQ(reg.Size(), 50u);
}

TEST(SessionRegistry, ConditionalIdleRemovalSparesTouchedSession) {
    SessionRegistry reg(SessionRegistry::Options{0, milliseconds(1000)});
    reg.CreateOrGet("S1", t0());
    reg.CreateOrGet("S2", t0());
    auto candidates = reg.IdleCandidates(t0() + milliseconds(2000));
    EXPECT_EQ(candidates.size(), 2u);
    EXPECT_EQ(reg.Size(), 2u); // selection removes nothing

    reg.Touch("S2", t0() + milliseconds(1900));
    auto s1 = reg.RemoveIfIdle("S1", t0() + milliseconds(2000));
    ASSERT_TRUE(s1.has_value());
    EXPECT_EQ(s1->session->GetId(), "S1");
    EXPECT_EQ(s1->reason, EvictionReason::IdleTimeout);
    EXPECT_FALSE(reg.RemoveIfIdle("S2", t0() + milliseconds(2000)).has_value());
    EXPECT_FALSE(reg.RemoveIfIdle("S1", t0() + milliseconds(2000)).has_value());
    EXPECT_TRUE(reg.Contains("S2"));
}

TEST(SessionRegistry, ConditionalCapacityRemovalRechecksVictim) {
    SessionRegistry reg(SessionRegistry::Options{2, hours(1)});
    reg.CreateOrGet("S1", t0());
    reg.CreateOrGet("S2", t0() + seconds(1));
    EXPECT_FALSE(reg.CapacityCandidate("S2").has_value());

    reg.CreateOrGet("S3", t0() + seconds(2));
    EXPECT_EQ(reg.CapacityCandidate("S3"), std::optional<std::string>("S1"));

    // S1 became active after selection; it is no longer the victim
    reg.Touch("S1", t0() + seconds(5));
    EXPECT_FALSE(reg.RemoveIfOverCapacity("S1", "S3").has_value());
    EXPECT_EQ(reg.CapacityCandidate("S3"), std::optional<std::string>("S2"));
    auto removed = reg.RemoveIfOverCapacity("S2", "S3");
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed->reason, EvictionReason::Capacity);
    EXPECT_FALSE(reg.CapacityCandidate("S3").has_value());
    EXPECT_EQ(reg.Size(), 2u);
}

TEST(SessionRegistry, RemoveSnapshotAndClear) {
    SessionRegistry reg;
    reg.CreateOrGet("b", t0() + seconds(1));
    reg.CreateOrGet("a", t0());
    auto snap = reg.Snapshot();
    ASSERT_EQ(snap.size(), 2u);
    EXPECT_EQ(snap[0]->GetId(), "a");

    EXPECT_NE(reg.Remove("a"), nullptr);
    EXPECT_EQ(reg.Remove("a"), nullptr);
    auto cleared = reg.Clear();
    EXPECT_EQ(cleared.size(), 1u);
    EXPECT_EQ(reg.Size(), 0u);
    EXPECT_STREQ(ToString(EvictionReason::Explicit), "explicit");
}
