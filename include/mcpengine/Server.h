//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.h
// Purpose: Protocol server: sessions, lifecycle gating and the MCP method surface over a MethodRegistry.
//==========================================================================================================

#pragma once

#include <cstddef>
#include <memory>
#include <memory_resource>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "mcpengine/Cancellation.h"
#include "mcpengine/Dispatcher.h"
#include "mcpengine/EnvelopeCodec.h"
#include "mcpengine/Lifecycle.h"
#include "mcpengine/Progress.h"
#include "mcpengine/Protocol.h"
#include "mcpengine/Registries.h"
#include "mcpengine/RequestScope.h"

namespace mcpengine {

//==========================================================================================================
// Session
// Purpose: State of one client connection: its lifecycle, the client's identity, resource subscriptions,
//          its in-flight cancellable requests, and the notifier used for out-of-band messages.
// Notes:
//   Subscriptions are read from other threads when a resource update is broadcast; they are locked.
//   Request ids are only unique within a connection, so each session tracks its own cancellations.
//==========================================================================================================
class Session {
public:
    explicit Session(std::string peer = "local");

    const std::string& peer() const { return peerName; }
    Lifecycle& lifecycle() { return state; }
    const Lifecycle& lifecycle() const { return state; }

    CancellationTracker& cancellations() { return tracker; }
    const CancellationTracker& cancellations() const { return tracker; }

    void setNotifier(ProgressNotifier* n) { notifier = n; }
    ProgressNotifier* getNotifier() const { return notifier; }

    void setClientInfo(Implementation info);
    std::optional<Implementation> clientInfo() const;

    // Returns false when the uri was already (un)subscribed.
    bool subscribe(const std::string& uri);
    bool unsubscribe(const std::string& uri);
    bool isSubscribed(const std::string& uri) const;
    std::vector<std::string> subscriptions() const;

private:
    std::string peerName;
    Lifecycle state;
    CancellationTracker tracker;
    ProgressNotifier* notifier{nullptr};
    mutable std::mutex mutex;
    std::optional<Implementation> client;
    std::set<std::string> subscribed;
};

//==========================================================================================================
// ProtocolServer
// Purpose: Turns one decoded message into at most one serialized response.
// Behavior:
//   - Envelope errors are answered with ParseError/InvalidRequest, keyed to the id when it was recoverable.
//   - Lifecycle violations are answered with the error Lifecycle::checkAllowed returns.
//   - Handler failures become InternalError (RpcException keeps its own code); nothing escapes raw.
//   - Notifications are never answered; responses from the peer are logged and dropped.
//   - closeConnection is set once the session reached Shutdown or a handler ended the stream.
// Threading:
//   The method table and registries are read-only once serving starts. handleMessage may run
//   concurrently for different sessions, and for cancellation notices of a session that is busy.
//==========================================================================================================
class ProtocolServer {
public:
    struct Outcome {
        std::optional<std::string> response;
        bool closeConnection{false};
    };

    // arenaBytes: initial size of each pooled request arena.
    ProtocolServer(Implementation serverInfo, const Registries& registries, std::size_t arenaBytes = 4096);
    ~ProtocolServer();

    ProtocolServer(const ProtocolServer&) = delete;
    ProtocolServer& operator=(const ProtocolServer&) = delete;

    ////////////////////////////////////////////// Dispatch ////////////////////////////////////////////////
    Outcome handleMessage(Session& session, const std::string& payload,
                          std::pmr::memory_resource* memory = std::pmr::get_default_resource());
    Outcome handleDecoded(Session& session, const DecodeResult& decoded,
                          std::pmr::memory_resource* memory = std::pmr::get_default_resource());

    // True for a well-formed notifications/cancelled notice; these are handled as soon as they are read.
    static bool IsCancellationNotice(const DecodeResult& decoded);

    // Adds or replaces a method before serving starts (same last-wins rule as MethodRegistry::add).
    void addMethod(const std::string& method, MethodHandler handler);

    ////////////////////////////////////////////// Sessions ////////////////////////////////////////////////
    void attachSession(Session& session);
    void detachSession(Session& session);
    std::size_t sessionCount() const;

    // Queues notifications/resources/updated on every attached session subscribed to uri.
    // Returns the number of sessions notified.
    std::size_t notifyResourceUpdated(const std::string& uri);

    ///////////////////////////////////////////// Shared state /////////////////////////////////////////////
    ArenaPool& arenas();
    const Implementation& info() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpengine
