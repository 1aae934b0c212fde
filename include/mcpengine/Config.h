//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Server configuration from defaults, MCP_* environment variables and the command line.
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include "mcpengine/Framer.h"

namespace mcpengine {

enum class TransportKind {
    Stdio,
    Tcp
};

const char* TransportKindName(TransportKind kind);
std::optional<TransportKind> TransportKindFromString(const std::string& name);

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

inline constexpr std::size_t kDefaultMaxRequestSize = 1024 * 1024;

//==========================================================================================================
// ServerConfig
// Purpose: Everything the server executable needs to start.
// Notes:
//   port is wider than a TCP port so that out-of-range input survives parsing and validate() can
//   report it.
//   maxRequestSize is the initial size of each request arena, not a limit.
//==========================================================================================================
struct ServerConfig {
    TransportKind transport{TransportKind::Stdio};
    std::string host{"127.0.0.1"};
    std::uint32_t port{8080};
    FramingMode framing{FramingMode::ContentLength};
    bool skipBlankLines{false};
    std::size_t maxMessageSize{kDefaultMaxMessageSize};
    std::size_t maxRequestSize{kDefaultMaxRequestSize};
    std::string logLevel{"INFO"};
    std::string logFile;
    bool enableColor{false};
    std::string serverName{"mcpengine"};
    std::string serverVersion;
    bool showHelp{false};
    bool showVersion{false};

    //======================================================================================================
    // validate
    // Purpose: Rejects configurations the server cannot start with.
    // Throws:
    //   ConfigError naming the offending field (port 0 or above 65535, empty host, zero message size,
    //   empty server name).
    //======================================================================================================
    void validate() const;
};

// Overlays MCP_TRANSPORT, MCP_HOST, MCP_PORT, MCP_FRAMING, MCP_MAX_MESSAGE_SIZE, MCP_LOG_LEVEL,
// MCP_LOG_FILE and MCP_LOG_COLOR onto config. Throws ConfigError on unparsable values.
void ApplyEnvironment(ServerConfig& config);

//==========================================================================================================
// ApplyArguments
// Purpose: Overlays command line options onto config.
// Args:
//   Options take "--key=value" or "--key value". Flags: --stdio, --tcp, --debug, --color,
//   --skip-blank-lines, --help, --version.
// Throws:
//   ConfigError on unknown options, missing values and unparsable values.
//==========================================================================================================
void ApplyArguments(ServerConfig& config, int argc, const char* const* argv);

// Defaults, then environment, then command line. Does not validate.
ServerConfig LoadServerConfig(int argc, const char* const* argv);

std::string Usage(const std::string& program);

} // namespace mcpengine
