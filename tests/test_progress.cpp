//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_progress.cpp
// Purpose: Tests for progress notifications and asynchronous notification delivery
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "mcpengine/ByteStream.h"
#include "mcpengine/JSONValue.h"
#include "mcpengine/Progress.h"

using namespace mcpengine;

namespace {

// Collects delivered notifications from the worker thread.
struct Collector {
    std::mutex mutex;
    std::vector<std::string> messages;

    ProgressNotifier::Callback callback() {
        return [this](const std::string& json) {
            std::lock_guard<std::mutex> lock(mutex);
            messages.push_back(json);
        };
    }

    std::vector<std::string> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return messages;
    }
};

} // namespace

TEST(ProgressTest, BuilderShapesProgressNotification) {
    auto note = ProgressBuilder::createProgress(ProgressToken{std::string("tok")}, 0.5, std::string("half"), 2.0);
    EXPECT_EQ(note.method, "notifications/progress");
    const JSONValue params = note.ParamsOrEmpty();
    EXPECT_EQ(GetString(params, "token"), std::optional<std::string>("tok"));
    const JSONValue* value = FindMember(params, "value");
    ASSERT_NE(value, nullptr);
    EXPECT_EQ(GetNumber(*value, "progress"), std::optional<double>(0.5));
    EXPECT_EQ(GetString(*value, "message"), std::optional<std::string>("half"));
    EXPECT_EQ(GetNumber(*value, "eta_seconds"), std::optional<double>(2.0));

    auto end = ProgressBuilder::createProgressEnd(ProgressToken{int64_t{9}});
    EXPECT_EQ(end.Serialize(), R"({"jsonrpc":"2.0","method":"notifications/progress/end","params":{"token":9}})");
}

TEST(ProgressTest, TokenConversion) {
    EXPECT_EQ(ProgressTokenFromJSON(JSONValue("abc")), std::optional<ProgressToken>(std::string("abc")));
    EXPECT_EQ(ProgressTokenFromJSON(JSONValue(int64_t{4})), std::optional<ProgressToken>(int64_t{4}));
    EXPECT_FALSE(ProgressTokenFromJSON(JSONValue(1.5)).has_value());
    EXPECT_FALSE(ProgressTokenFromJSON(JSONValue(nullptr)).has_value());
}

TEST(ProgressTest, AsyncNotificationsArriveInOrder) {
    Collector collector;
    ProgressNotifier notifier(collector.callback(), std::chrono::milliseconds(1));
    notifier.start();

    ProgressTracker tracker(ProgressToken{std::string("job-1")}, &notifier);
    for (int i = 1; i <= 5; ++i) {
        tracker.updateAsync(i / 5.0, "step " + std::to_string(i));
    }
    notifier.stopAndWait();

    auto messages = collector.snapshot();
    ASSERT_EQ(messages.size(), 5u);
    for (int i = 0; i < 5; ++i) {
        JSONValue parsed = ParseJSON(messages[i]);
        const JSONValue* params = FindMember(parsed, "params");
        ASSERT_NE(params, nullptr);
        EXPECT_EQ(GetString(*params, "token"), std::optional<std::string>("job-1"));
        const JSONValue* value = FindMember(*params, "value");
        ASSERT_NE(value, nullptr);
        EXPECT_EQ(GetString(*value, "message"), std::optional<std::string>("step " + std::to_string(i + 1)));
    }
    EXPECT_EQ(notifier.delivered(), 5u);
    EXPECT_DOUBLE_EQ(tracker.percentage(), 100.0);
}

TEST(ProgressTest, StopDeliversWhatIsQueued) {
    Collector collector;
    ProgressNotifier notifier(collector.callback(), std::chrono::milliseconds(50));
    notifier.start();
    for (int i = 0; i < 3; ++i) {
        notifier.notifyAsync("{\"n\":" + std::to_string(i) + "}");
    }
    notifier.stopAndWait();
    EXPECT_EQ(collector.snapshot(), (std::vector<std::string>{"{\"n\":0}", "{\"n\":1}", "{\"n\":2}"}));
    EXPECT_EQ(notifier.pending(), 0u);
    EXPECT_FALSE(notifier.isRunning());
}

TEST(ProgressTest, CallbackFailureDoesNotStopDelivery) {
    std::vector<std::string> seen;
    ProgressNotifier notifier([&seen](const std::string& json) {
        if (json == "bad") {
            throw std::runtime_error("sink rejected message");
        }
        seen.push_back(json);
    }, std::chrono::milliseconds(1));
    notifier.start();
    notifier.notifyAsync("bad");
    notifier.notifyAsync("good");
    notifier.stopAndWait();
    EXPECT_EQ(seen, std::vector<std::string>{"good"});
    EXPECT_EQ(notifier.delivered(), 2u);
}

TEST(ProgressTest, SynchronousUpdateWritesFrame) {
    auto framer = MakeDelimiterFramer();
    std::istringstream in;
    std::ostringstream out;
    auto stream = MakeIostreamByteStream(in, out);
    FrameWriter writer(*stream, *framer);

    ProgressTracker tracker(ProgressToken{int64_t{1}});
    EXPECT_EQ(tracker.update(0.25, std::nullopt, writer), FrameStatus::Ok);
    EXPECT_EQ(tracker.complete(writer), FrameStatus::Ok);

    const std::string written = out.str();
    EXPECT_NE(written.find("\"method\":\"notifications/progress\""), std::string::npos);
    EXPECT_NE(written.find("notifications/progress/end"), std::string::npos);
    EXPECT_EQ(written.back(), '\n');
    EXPECT_THROW(tracker.updateAsync(0.5), std::logic_error);
}
