//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Progress.h
// Purpose: Progress notifications and the asynchronous notification delivery worker.
//==========================================================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>

#include "mcpengine/Framer.h"
#include "mcpengine/JSONRPCTypes.h"

namespace mcpengine {

// Caller supplied correlation key for one long-running operation.
using ProgressToken = std::variant<std::string, int64_t>;

JSONValue ProgressTokenToJSON(const ProgressToken& token);
std::optional<ProgressToken> ProgressTokenFromJSON(const JSONValue& value);

//==========================================================================================================
// ProgressBuilder
// Purpose: Builds progress notifications.
//   notifications/progress      params { token, value: { progress, message?, eta_seconds? } }
//   notifications/progress/end  params { token }
//==========================================================================================================
class ProgressBuilder {
public:
    static JSONRPCNotification createProgress(const ProgressToken& token, double progress,
                                              const std::optional<std::string>& message = std::nullopt,
                                              std::optional<double> etaSeconds = std::nullopt);
    static JSONRPCNotification createProgressEnd(const ProgressToken& token);
};

//==========================================================================================================
// ProgressNotifier
// Purpose: Queue of serialized notifications drained by one background worker.
// Behavior:
//   - notifyAsync copies the message into the queue and returns immediately.
//   - The worker takes the whole queue every poll interval and calls the callback once per message,
//     in enqueue order.
//   - start()/stop() are idempotent. stop() only clears the running flag; the worker delivers what is
//     already queued and exits on its own. The destructor waits for it.
//   - Delivery is not ordered with respect to responses written by the connection thread.
//==========================================================================================================
class ProgressNotifier {
public:
    using Callback = std::function<void(const std::string& notificationJson)>;

    explicit ProgressNotifier(Callback cb,
                              std::chrono::milliseconds pollInterval = std::chrono::milliseconds(10));
    ~ProgressNotifier();

    ProgressNotifier(const ProgressNotifier&) = delete;
    ProgressNotifier& operator=(const ProgressNotifier&) = delete;

    void start();
    void stop();
    // stop() followed by waiting for the worker's final drain.
    void stopAndWait();
    bool isRunning() const { return running.load(std::memory_order_acquire); }

    void notifyAsync(const std::string& notificationJson);

    std::size_t pending() const;
    std::uint64_t delivered() const { return deliveredCount.load(); }

private:
    void workerLoop();
    void drainOnce();

    Callback callback;
    std::chrono::milliseconds pollInterval;
    mutable std::mutex queueMutex;
    std::deque<std::string> queue;
    std::atomic<bool> running{false};
    std::atomic<std::uint64_t> deliveredCount{0};
    std::mutex lifecycleMutex;
    std::thread worker;
};

//==========================================================================================================
// ProgressTracker
// Purpose: Reports progress for one operation. Without a notifier, update/complete write synchronously
//          through the given FrameWriter; with one, they enqueue on the notifier instead.
// Notes:
//   eta_seconds = elapsed / progress - elapsed, reported once progress > 0.
//   updateAsync/completeAsync throw std::logic_error when no notifier is attached.
//==========================================================================================================
class ProgressTracker {
public:
    explicit ProgressTracker(ProgressToken token, ProgressNotifier* notifier = nullptr);

    void setNotifier(ProgressNotifier* n) { notifier = n; }

    FrameStatus update(double progress, const std::optional<std::string>& message, FrameWriter& writer);
    void updateAsync(double progress, const std::optional<std::string>& message = std::nullopt);

    FrameStatus complete(FrameWriter& writer);
    void completeAsync();

    double percentage() const { return current * 100.0; }
    const ProgressToken& token() const { return tok; }

private:
    JSONRPCNotification progressNotification(double progress, const std::optional<std::string>& message);

    ProgressToken tok;
    ProgressNotifier* notifier;
    double current{0.0};
    std::chrono::steady_clock::time_point startTime;
};

} // namespace mcpengine
