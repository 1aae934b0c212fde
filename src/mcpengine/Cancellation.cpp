//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Cancellation.cpp
// Purpose: Cancellation tokens and the in-flight request tracker
//==========================================================================================================

#include <functional>
#include <type_traits>
#include <variant>

#include "logging/Logger.h"
#include "mcpengine/Cancellation.h"

namespace mcpengine {

std::optional<std::string> CancellationToken::reason() const {
    std::lock_guard<std::mutex> lock(reasonMutex);
    return why_;
}

bool CancellationToken::cancel(std::optional<std::string> why) {
    {
        std::lock_guard<std::mutex> lock(reasonMutex);
        if (source.stop_requested()) {
            return false;
        }
        why_ = std::move(why);
    }
    // Raised only after the reason is visible
    return source.request_stop();
}

////////////////////////////////////////// CancellationTracker //////////////////////////////////////

std::uint64_t CancellationTracker::keyFor(const RequestId& id) {
    return std::visit([](const auto& v) -> std::uint64_t {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return static_cast<std::uint64_t>(std::hash<std::string>{}(v));
        } else {
            return static_cast<std::uint64_t>(v);
        }
    }, id);
}

std::shared_ptr<CancellationToken> CancellationTracker::registerRequest(const RequestId& id) {
    auto token = std::make_shared<CancellationToken>();
    std::lock_guard<std::mutex> lock(mutex);
    auto [it, inserted] = inFlight.insert_or_assign(keyFor(id), Entry{id, token});
    if (!inserted) {
        LOG_WARN("Request id {} registered while a request with the same key is in flight", RequestIdToString(id));
    }
    return token;
}

bool CancellationTracker::cancel(const RequestId& id, std::optional<std::string> reason) {
    std::shared_ptr<CancellationToken> token;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = inFlight.find(keyFor(id));
        // Same key with a different id is a hash collision, not a match
        if (it == inFlight.end() || it->second.id != id) {
            LOG_DEBUG("Cancellation for {} ignored: not in flight", RequestIdToString(id));
            return false;
        }
        token = it->second.token;
    }
    LOG_INFO("Cancelling request {}{}", RequestIdToString(id), reason ? ": " + reason.value() : std::string());
    token->cancel(std::move(reason));
    return true;
}

void CancellationTracker::complete(const RequestId& id) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = inFlight.find(keyFor(id));
    if (it != inFlight.end() && it->second.id == id) {
        inFlight.erase(it);
    }
}

void CancellationTracker::complete(const RequestId& id, const std::shared_ptr<CancellationToken>& token) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = inFlight.find(keyFor(id));
    if (it != inFlight.end() && it->second.id == id && it->second.token == token) {
        inFlight.erase(it);
    }
}

bool CancellationTracker::isTracked(const RequestId& id) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = inFlight.find(keyFor(id));
    return it != inFlight.end() && it->second.id == id;
}

std::size_t CancellationTracker::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return inFlight.size();
}

////////////////////////////////////////// CancellationGuard ////////////////////////////////////////

CancellationGuard::CancellationGuard(CancellationTracker& t, const RequestId& requestId)
    : tracker(t), id(requestId), tok(t.registerRequest(requestId)) {}

CancellationGuard::~CancellationGuard() {
    tracker.complete(id, tok);
}

} // namespace mcpengine
