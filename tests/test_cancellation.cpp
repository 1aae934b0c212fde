//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_cancellation.cpp
// Purpose: Tests for cancellation tokens, the in-flight tracker and the RAII guard
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stop_token>
#include <thread>

#include "mcpengine/Cancellation.h"

using namespace mcpengine;

TEST(CancellationTest, TokenKeepsFirstReason) {
    CancellationToken token;
    EXPECT_FALSE(token.isCancelled());
    EXPECT_FALSE(token.reason().has_value());

    EXPECT_TRUE(token.cancel(std::string("first")));
    EXPECT_FALSE(token.cancel(std::string("second")));
    EXPECT_TRUE(token.isCancelled());
    EXPECT_EQ(token.reason(), std::optional<std::string>("first"));
    EXPECT_TRUE(token.stopToken().stop_requested());
}

TEST(CancellationTest, CancelInFlightRequestWithReason) {
    CancellationTracker tracker;
    auto token = tracker.registerRequest(RequestId(int64_t{42}));
    EXPECT_TRUE(tracker.isTracked(RequestId(int64_t{42})));

    EXPECT_TRUE(tracker.cancel(RequestId(int64_t{42}), std::string("user abort")));
    EXPECT_TRUE(token->isCancelled());
    EXPECT_EQ(token->reason(), std::optional<std::string>("user abort"));
}

TEST(CancellationTest, UnknownIdIsNotAnError) {
    CancellationTracker tracker;
    EXPECT_FALSE(tracker.cancel(RequestId(int64_t{7})));
    tracker.complete(RequestId(int64_t{7}));
    EXPECT_EQ(tracker.size(), 0u);
}

TEST(CancellationTest, StringAndIntegerIdsAreDistinct) {
    CancellationTracker tracker;
    auto token = tracker.registerRequest(RequestId(std::string("42")));
    EXPECT_FALSE(tracker.cancel(RequestId(int64_t{42})));
    EXPECT_FALSE(token->isCancelled());
    EXPECT_TRUE(tracker.cancel(RequestId(std::string("42"))));
    EXPECT_TRUE(token->isCancelled());
}

TEST(CancellationTest, CompletedRequestCannotBeCancelled) {
    CancellationTracker tracker;
    auto token = tracker.registerRequest(RequestId(std::string("req-1")));
    tracker.complete(RequestId(std::string("req-1")));
    EXPECT_FALSE(tracker.isTracked(RequestId(std::string("req-1"))));
    EXPECT_FALSE(tracker.cancel(RequestId(std::string("req-1"))));
    EXPECT_FALSE(token->isCancelled());
}

TEST(CancellationTest, GuardCompletesOnScopeExit) {
    CancellationTracker tracker;
    {
        CancellationGuard guard(tracker, RequestId(int64_t{3}));
        EXPECT_TRUE(tracker.isTracked(RequestId(int64_t{3})));
        EXPECT_FALSE(guard.token().isCancelled());
    }
    EXPECT_FALSE(tracker.isTracked(RequestId(int64_t{3})));
    EXPECT_EQ(tracker.size(), 0u);
}

TEST(CancellationTest, GuardLeavesReRegisteredIdAlone) {
    CancellationTracker tracker;
    std::shared_ptr<CancellationToken> newer;
    {
        CancellationGuard guard(tracker, RequestId(int64_t{9}));
        newer = tracker.registerRequest(RequestId(int64_t{9}));
    }
    EXPECT_TRUE(tracker.isTracked(RequestId(int64_t{9})));
    EXPECT_TRUE(tracker.cancel(RequestId(int64_t{9})));
    EXPECT_TRUE(newer->isCancelled());
}

TEST(CancellationTest, WorkerObservesCancellationFromAnotherThread) {
    CancellationTracker tracker;
    std::atomic<int> steps{0};
    std::atomic<bool> sawCancel{false};

    std::thread worker([&] {
        CancellationGuard guard(tracker, RequestId(std::string("slow")));
        for (int i = 0; i < 500; ++i) {
            if (guard.token().isCancelled()) {
                sawCancel = true;
                return;
            }
            ++steps;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    });

    while (!tracker.isTracked(RequestId(std::string("slow")))) {
        std::this_thread::yield();
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_TRUE(tracker.cancel(RequestId(std::string("slow")), std::string("stop")));
    worker.join();

    EXPECT_TRUE(sawCancel.load());
    EXPECT_LT(steps.load(), 500);
    EXPECT_EQ(tracker.size(), 0u);
}
