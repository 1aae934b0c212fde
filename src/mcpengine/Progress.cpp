//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Progress.cpp
// Purpose: Progress notification builders, async notifier worker and per-operation tracker
//==========================================================================================================

#include <stdexcept>

#include "logging/Logger.h"
#include "mcpengine/Progress.h"

namespace mcpengine {

JSONValue ProgressTokenToJSON(const ProgressToken& token) {
    if (std::holds_alternative<std::string>(token)) {
        return JSONValue(std::get<std::string>(token));
    }
    return JSONValue(std::get<int64_t>(token));
}

std::optional<ProgressToken> ProgressTokenFromJSON(const JSONValue& value) {
    if (value.isString()) {
        return ProgressToken{std::get<std::string>(value.value)};
    }
    if (value.isInteger()) {
        return ProgressToken{std::get<int64_t>(value.value)};
    }
    return std::nullopt;
}

JSONRPCNotification ProgressBuilder::createProgress(const ProgressToken& token, double progress,
                                                    const std::optional<std::string>& message,
                                                    std::optional<double> etaSeconds) {
    JSONValue value{JSONValue::Object{}};
    SetMember(value, "progress", JSONValue(progress));
    if (message.has_value()) {
        SetMember(value, "message", JSONValue(message.value()));
    }
    if (etaSeconds.has_value()) {
        SetMember(value, "eta_seconds", JSONValue(etaSeconds.value()));
    }
    JSONValue params{JSONValue::Object{}};
    SetMember(params, "token", ProgressTokenToJSON(token));
    SetMember(params, "value", std::move(value));
    return JSONRPCNotification{"notifications/progress", std::move(params)};
}

JSONRPCNotification ProgressBuilder::createProgressEnd(const ProgressToken& token) {
    JSONValue params{JSONValue::Object{}};
    SetMember(params, "token", ProgressTokenToJSON(token));
    return JSONRPCNotification{"notifications/progress/end", std::move(params)};
}

////////////////////////////////////////// ProgressNotifier /////////////////////////////////////////

ProgressNotifier::ProgressNotifier(Callback cb, std::chrono::milliseconds interval)
    : callback(std::move(cb)), pollInterval(interval) {}

ProgressNotifier::~ProgressNotifier() {
    stopAndWait();
}

void ProgressNotifier::stopAndWait() {
    stop();
    std::lock_guard<std::mutex> lock(lifecycleMutex);
    if (worker.joinable()) {
        worker.join();
    }
}

void ProgressNotifier::start() {
    std::lock_guard<std::mutex> lock(lifecycleMutex);
    if (running.load(std::memory_order_acquire)) {
        return;
    }
    if (worker.joinable()) {
        // Previous worker was stopped; it exits after its final drain
        worker.join();
    }
    running.store(true, std::memory_order_release);
    worker = std::thread([this]() { workerLoop(); });
    LOG_DEBUG("Progress notifier started");
}

void ProgressNotifier::stop() {
    if (running.exchange(false, std::memory_order_acq_rel)) {
        LOG_DEBUG("Progress notifier stopping");
    }
}

void ProgressNotifier::notifyAsync(const std::string& notificationJson) {
    std::lock_guard<std::mutex> lock(queueMutex);
    queue.push_back(notificationJson);
}

std::size_t ProgressNotifier::pending() const {
    std::lock_guard<std::mutex> lock(queueMutex);
    return queue.size();
}

void ProgressNotifier::drainOnce() {
    std::deque<std::string> batch;
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        batch.swap(queue);
    }
    while (!batch.empty()) {
        std::string message = std::move(batch.front());
        batch.pop_front();
        if (callback) {
            try {
                callback(message);
            } catch (const std::exception& e) {
                LOG_ERROR("Notification delivery failed: {}", e.what());
            }
        }
        ++deliveredCount;
    }
}

void ProgressNotifier::workerLoop() {
    while (running.load(std::memory_order_acquire)) {
        drainOnce();
        std::this_thread::sleep_for(pollInterval);
    }
    // Messages queued before stop() are still delivered
    drainOnce();
}

////////////////////////////////////////// ProgressTracker //////////////////////////////////////////

ProgressTracker::ProgressTracker(ProgressToken token, ProgressNotifier* n)
    : tok(std::move(token)), notifier(n), startTime(std::chrono::steady_clock::now()) {}

JSONRPCNotification ProgressTracker::progressNotification(double progress, const std::optional<std::string>& message) {
    current = progress;
    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
    std::optional<double> eta;
    if (progress > 0.0) {
        eta = elapsed / progress - elapsed;
    }
    return ProgressBuilder::createProgress(tok, progress, message, eta);
}

FrameStatus ProgressTracker::update(double progress, const std::optional<std::string>& message, FrameWriter& writer) {
    const std::string json = progressNotification(progress, message).Serialize();
    if (notifier) {
        notifier->notifyAsync(json);
        return FrameStatus::Ok;
    }
    return writer.write(json);
}

void ProgressTracker::updateAsync(double progress, const std::optional<std::string>& message) {
    if (!notifier) {
        throw std::logic_error("No notifier configured");
    }
    notifier->notifyAsync(progressNotification(progress, message).Serialize());
}

FrameStatus ProgressTracker::complete(FrameWriter& writer) {
    const std::string json = ProgressBuilder::createProgressEnd(tok).Serialize();
    if (notifier) {
        notifier->notifyAsync(json);
        return FrameStatus::Ok;
    }
    return writer.write(json);
}

void ProgressTracker::completeAsync() {
    if (!notifier) {
        throw std::logic_error("No notifier configured");
    }
    notifier->notifyAsync(ProgressBuilder::createProgressEnd(tok).Serialize());
}

} // namespace mcpengine
