//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: mcpengine_server: demo MCP server over stdio or TCP
//==========================================================================================================

#include <csignal>
#include <iostream>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpengine/Config.h"
#include "mcpengine/Server.h"
#include "mcpengine/Transport.h"
#include "mcpengine/tools/DemoContent.h"
#include "mcpengine/version.h"

using namespace mcpengine;

//==========================================================================================================
// Blocks until SIGINT or SIGTERM.
//==========================================================================================================
static void waitForTerminationSignal() {
    boost::asio::io_context ioc;
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& ec, int signalNumber) {
        if (!ec) {
            LOG_INFO("Received signal {}; stopping", signalNumber);
        }
    });
    ioc.run();
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    ServerConfig config;
    try {
        config = LoadServerConfig(argc, argv);
        if (config.showHelp) {
            std::cout << Usage(argv[0]);
            return 0;
        }
        if (config.showVersion) {
            std::cout << "mcpengine " << getVersionString() << " (protocol " << PROTOCOL_VERSION << ")\n";
            return 0;
        }
        config.validate();
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n\n" << Usage(argv[0]);
        return 2;
    }

    // stdout carries frames in stdio mode
    Logger::setStderrOutput(config.transport == TransportKind::Stdio || GetEnvBool("MCP_STDIO_MODE", false));
    Logger::setLogLevelFromString(config.logLevel);
    Logger::setColorEnabled(config.enableColor);
    if (!config.logFile.empty()) {
        Logger::setLogFile(config.logFile);
    }

    // A peer closing mid-write must surface as EPIPE, not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    Implementation info{config.serverName, config.serverVersion};
    Registries registries;
    tools::RegisterDemoContent(registries, info);
    ProtocolServer server(info, registries, config.maxRequestSize);

    auto framer = MakeFramer(config.framing, config.maxMessageSize);
    ConnectionOptions options;
    options.skipBlankLines = config.skipBlankLines;

    LOG_INFO("{} {} starting (transport={}, framing={}, protocol {})", info.name, info.version,
             TransportKindName(config.transport), FramingModeName(config.framing), PROTOCOL_VERSION);

    if (config.transport == TransportKind::Stdio) {
        const FrameStatus status = ServeStdio(server, *framer, options);
        return (status == FrameStatus::Ok || IsCleanDisconnect(status)) ? 0 : 1;
    }

    TcpServer tcp(server, *framer, config.host, static_cast<std::uint16_t>(config.port), options);
    try {
        tcp.start();
    } catch (const std::exception& e) {
        LOG_ERROR("Cannot start TCP listener: {}", e.what());
        return 1;
    }
    waitForTerminationSignal();
    tcp.stop();
    const MemoryStats mem = server.arenas().stats();
    LOG_INFO("Arena pool: {} acquisitions, peak {} in use, peak request {} bytes", mem.acquisitions, mem.peakInUse,
             mem.peakRequestBytes);
    return 0;
}
