//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Cancellation.h
// Purpose: Cooperative per-request cancellation: tokens, the in-flight tracker and an RAII guard.
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_map>

#include "mcpengine/JSONRPCTypes.h"

namespace mcpengine {

//==========================================================================================================
// CancellationToken
// Purpose: Flag plus optional reason that a running handler polls. The reason is written before the
//          flag is raised, so a reader that sees isCancelled() also sees the reason.
// Notes:
//   stopToken() exposes the same flag as a std::stop_token for handlers that prefer stop callbacks.
//==========================================================================================================
class CancellationToken {
public:
    bool isCancelled() const { return source.stop_requested(); }
    std::optional<std::string> reason() const;
    std::stop_token stopToken() const { return source.get_token(); }

    // Returns false when the token was already cancelled (the first reason is kept).
    bool cancel(std::optional<std::string> why = std::nullopt);

private:
    mutable std::mutex reasonMutex;
    std::optional<std::string> why_;
    std::stop_source source;
};

//==========================================================================================================
// CancellationTracker
// Purpose: Map of in-flight cancellable requests, keyed by a hash of the request id (the content hash for
//          string ids, the integer itself for integer ids). One per session, since request ids are only
//          unique within a connection; internally locked.
//==========================================================================================================
class CancellationTracker {
public:
    // Creates the token for a request that is about to run. Re-registering an id replaces its token.
    std::shared_ptr<CancellationToken> registerRequest(const RequestId& id);

    // Marks the in-flight request cancelled. Returns false when no such request is running; that is
    // a normal outcome for late or unknown cancellations, not an error.
    bool cancel(const RequestId& id, std::optional<std::string> reason = std::nullopt);

    // Drops the token once the request finished (any outcome). Unknown ids are ignored.
    void complete(const RequestId& id);

    // Same, but only when the tracked token is still this one (the id was not re-registered since).
    void complete(const RequestId& id, const std::shared_ptr<CancellationToken>& token);

    bool isTracked(const RequestId& id) const;
    std::size_t size() const;

    static std::uint64_t keyFor(const RequestId& id);

private:
    struct Entry {
        RequestId id;
        std::shared_ptr<CancellationToken> token;
    };

    mutable std::mutex mutex;
    std::unordered_map<std::uint64_t, Entry> inFlight;
};

//==========================================================================================================
// CancellationGuard
// Purpose: Registers a request on construction and completes it on destruction, so a token never
//          outlives the request it belongs to.
//==========================================================================================================
class CancellationGuard {
public:
    CancellationGuard(CancellationTracker& tracker, const RequestId& id);
    ~CancellationGuard();

    CancellationGuard(const CancellationGuard&) = delete;
    CancellationGuard& operator=(const CancellationGuard&) = delete;

    CancellationToken& token() { return *tok; }

private:
    CancellationTracker& tracker;
    RequestId id;
    std::shared_ptr<CancellationToken> tok;
};

} // namespace mcpengine
