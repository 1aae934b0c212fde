//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: Serves a single session over stdin/stdout
//==========================================================================================================

#include <unistd.h>

#include "logging/Logger.h"
#include "mcpengine/Transport.h"

namespace mcpengine {

FrameStatus ServeStdio(ProtocolServer& server, const IFramer& framer, ConnectionOptions options) {
    // stdout carries frames only
    Logger::setStderrOutput(true);
    LOG_INFO("Serving {} on stdio", server.info().name);

    Connection connection(server, MakeFdByteStream(STDIN_FILENO, STDOUT_FILENO, false, "stdio"), framer, options);
    const FrameStatus status = connection.run();
    if (!IsCleanDisconnect(status) && status != FrameStatus::Ok) {
        LOG_ERROR("stdio session ended with {}", FrameStatusName(status));
    }
    return status;
}

} // namespace mcpengine
