//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Lifecycle.h
// Purpose: Per-connection server state machine and method gating.
//==========================================================================================================

#pragma once

#include <atomic>
#include <optional>
#include <string>

#include "mcpengine/JSONRPCTypes.h"

namespace mcpengine {

//==========================================================================================================
// ServerState
//   Created -> Initializing        initialize received
//   Initializing -> Ready          negotiation succeeded
//   Initializing -> ErrorState     negotiation failed (unsupported protocol version, bad params)
//   any non-terminal -> Shutdown   shutdown request/notification, or the transport closed
// Shutdown is terminal.
//==========================================================================================================
enum class ServerState {
    Created,
    Initializing,
    Ready,
    ErrorState,
    Shutdown
};

const char* ServerStateName(ServerState state);

class Lifecycle {
public:
    ServerState state() const { return current.load(); }
    bool isReady() const { return state() == ServerState::Ready; }
    bool isTerminal() const { return state() == ServerState::Shutdown; }

    // Created/Initializing -> Initializing. Returns false from any other state.
    bool beginInitialize();
    // Initializing -> Ready. Returns false from any other state.
    bool completeInitialize();
    // Initializing -> ErrorState. Returns false from any other state.
    bool failInitialize();
    // Any non-terminal state -> Shutdown. Returns false when already shut down.
    bool shutdown();
    // Transport closed: Shutdown from whatever state.
    void forceTerminate();

    //======================================================================================================
    // checkAllowed
    // Purpose: Gate for one incoming method in the current state.
    // Returns:
    //   std::nullopt when the method may be dispatched, otherwise the error to answer with:
    //   - after shutdown: ServerError "Server is shut down"
    //   - initialize outside Created/Initializing: InvalidRequest
    //   - shutdown and notifications/*: always allowed before shutdown
    //   - anything else outside Ready: ServerNotInitialized
    //======================================================================================================
    std::optional<JSONRPCError> checkAllowed(const std::string& method) const;

private:
    bool transition(ServerState from, ServerState to);

    std::atomic<ServerState> current{ServerState::Created};
};

} // namespace mcpengine
