//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Lifecycle.cpp
// Purpose: Server state transitions and per-state method gating
//==========================================================================================================

#include "logging/Logger.h"
#include "mcpengine/Lifecycle.h"
#include "mcpengine/Protocol.h"

namespace mcpengine {

const char* ServerStateName(ServerState state) {
    switch (state) {
        case ServerState::Created: return "Created";
        case ServerState::Initializing: return "Initializing";
        case ServerState::Ready: return "Ready";
        case ServerState::ErrorState: return "ErrorState";
        case ServerState::Shutdown: return "Shutdown";
    }
    return "Unknown";
}

bool Lifecycle::transition(ServerState from, ServerState to) {
    ServerState expected = from;
    if (current.compare_exchange_strong(expected, to)) {
        LOG_DEBUG("Server state {} -> {}", ServerStateName(from), ServerStateName(to));
        return true;
    }
    return false;
}

bool Lifecycle::beginInitialize() {
    return transition(ServerState::Created, ServerState::Initializing) || state() == ServerState::Initializing;
}

bool Lifecycle::completeInitialize() {
    return transition(ServerState::Initializing, ServerState::Ready);
}

bool Lifecycle::failInitialize() {
    return transition(ServerState::Initializing, ServerState::ErrorState);
}

bool Lifecycle::shutdown() {
    ServerState prev = current.exchange(ServerState::Shutdown);
    if (prev != ServerState::Shutdown) {
        LOG_DEBUG("Server state {} -> Shutdown", ServerStateName(prev));
        return true;
    }
    return false;
}

void Lifecycle::forceTerminate() {
    current.store(ServerState::Shutdown);
}

std::optional<JSONRPCError> Lifecycle::checkAllowed(const std::string& method) const {
    const ServerState s = state();
    if (s == ServerState::Shutdown) {
        return JSONRPCError{JSONRPCErrorCodes::ServerError, "Server is shut down", std::nullopt};
    }
    if (method == Methods::Initialize) {
        if (s == ServerState::Created || s == ServerState::Initializing) {
            return std::nullopt;
        }
        const char* msg = (s == ServerState::Ready) ? "Server already initialized"
                                                    : "Initialization failed; open a new session";
        return JSONRPCError{JSONRPCErrorCodes::InvalidRequest, msg, std::nullopt};
    }
    if (method == Methods::Shutdown || method.rfind("notifications/", 0) == 0) {
        return std::nullopt;
    }
    if (s != ServerState::Ready) {
        return JSONRPCError{JSONRPCErrorCodes::ServerNotInitialized, "Server not initialized", std::nullopt};
    }
    return std::nullopt;
}

} // namespace mcpengine
