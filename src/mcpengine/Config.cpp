//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: Server configuration loading and validation
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <limits>

#include <fmt/format.h>

#include "env/EnvVars.h"
#include "mcpengine/Config.h"
#include "mcpengine/version.h"

namespace mcpengine {

namespace {

std::uint64_t parseUnsigned(const std::string& field, const std::string& text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw ConfigError(fmt::format("Invalid value for {}: '{}' (expected a non-negative integer)", field, text));
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        throw ConfigError(fmt::format("Value for {} is out of range: '{}'", field, text));
    }
}

std::uint32_t parsePort(const std::string& text) {
    const std::uint64_t v = parseUnsigned("port", text);
    if (v > std::numeric_limits<std::uint32_t>::max()) {
        throw ConfigError(fmt::format("Value for port is out of range: '{}'", text));
    }
    return static_cast<std::uint32_t>(v);
}

TransportKind parseTransport(const std::string& text) {
    auto kind = TransportKindFromString(text);
    if (!kind) {
        throw ConfigError(fmt::format("Unknown transport '{}' (expected stdio or tcp)", text));
    }
    return *kind;
}

FramingMode parseFraming(const std::string& text) {
    auto mode = FramingModeFromString(text);
    if (!mode) {
        throw ConfigError(fmt::format("Unknown framing '{}' (expected content-length or newline)", text));
    }
    return *mode;
}

bool isKnownLogLevel(const std::string& level) {
    std::string s;
    for (char c : level) {
        s.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return s == "DEBUG" || s == "INFO" || s == "WARN" || s == "WARNING" || s == "ERROR" || s == "FATAL";
}

} // namespace

const char* TransportKindName(TransportKind kind) {
    switch (kind) {
        case TransportKind::Stdio: return "stdio";
        case TransportKind::Tcp: return "tcp";
    }
    return "unknown";
}

std::optional<TransportKind> TransportKindFromString(const std::string& name) {
    if (name == "stdio") {
        return TransportKind::Stdio;
    }
    if (name == "tcp") {
        return TransportKind::Tcp;
    }
    return std::nullopt;
}

void ServerConfig::validate() const {
    if (port == 0 || port > 65535) {
        throw ConfigError(fmt::format("Invalid port {} (expected 1-65535)", port));
    }
    if (host.empty()) {
        throw ConfigError("Host must not be empty");
    }
    if (maxMessageSize == 0) {
        throw ConfigError("Maximum message size must be greater than zero");
    }
    if (maxRequestSize == 0) {
        throw ConfigError("Request arena size must be greater than zero");
    }
    if (serverName.empty()) {
        throw ConfigError("Server name must not be empty");
    }
    if (!isKnownLogLevel(logLevel)) {
        throw ConfigError(fmt::format("Unknown log level '{}'", logLevel));
    }
}

void ApplyEnvironment(ServerConfig& config) {
    if (auto v = GetEnvOptional("MCP_TRANSPORT")) {
        config.transport = parseTransport(*v);
    }
    if (auto v = GetEnvOptional("MCP_HOST")) {
        config.host = *v;
    }
    if (auto v = GetEnvOptional("MCP_PORT")) {
        config.port = parsePort(*v);
    }
    if (auto v = GetEnvOptional("MCP_FRAMING")) {
        config.framing = parseFraming(*v);
    }
    if (auto v = GetEnvOptional("MCP_MAX_MESSAGE_SIZE")) {
        config.maxMessageSize = static_cast<std::size_t>(parseUnsigned("MCP_MAX_MESSAGE_SIZE", *v));
    }
    if (auto v = GetEnvOptional("MCP_LOG_LEVEL")) {
        config.logLevel = *v;
    }
    if (auto v = GetEnvOptional("MCP_LOG_FILE")) {
        config.logFile = *v;
    }
    config.enableColor = GetEnvBool("MCP_LOG_COLOR", config.enableColor);
}

void ApplyArguments(ServerConfig& config, int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == nullptr) {
            continue;
        }
        std::string arg = argv[i];
        std::optional<std::string> inlineValue;
        const std::size_t eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            inlineValue = arg.substr(eq + 1);
            arg = arg.substr(0, eq);
        }

        auto value = [&]() -> std::string {
            if (inlineValue) {
                return *inlineValue;
            }
            if (i + 1 >= argc || argv[i + 1] == nullptr) {
                throw ConfigError(fmt::format("Option {} requires a value", arg));
            }
            return std::string(argv[++i]);
        };
        auto flag = [&]() {
            if (inlineValue) {
                throw ConfigError(fmt::format("Option {} does not take a value", arg));
            }
        };

        if (arg == "--stdio") {
            flag();
            config.transport = TransportKind::Stdio;
        } else if (arg == "--tcp") {
            flag();
            config.transport = TransportKind::Tcp;
        } else if (arg == "--transport") {
            config.transport = parseTransport(value());
        } else if (arg == "--host") {
            config.host = value();
        } else if (arg == "--port") {
            config.port = parsePort(value());
        } else if (arg == "--framing") {
            config.framing = parseFraming(value());
        } else if (arg == "--skip-blank-lines") {
            flag();
            config.skipBlankLines = true;
        } else if (arg == "--max-message-size") {
            config.maxMessageSize = static_cast<std::size_t>(parseUnsigned("--max-message-size", value()));
        } else if (arg == "--log-level") {
            config.logLevel = value();
        } else if (arg == "--log-file") {
            config.logFile = value();
        } else if (arg == "--debug") {
            flag();
            config.logLevel = "DEBUG";
        } else if (arg == "--color") {
            flag();
            config.enableColor = true;
        } else if (arg == "--name") {
            config.serverName = value();
        } else if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
        } else if (arg == "--version") {
            config.showVersion = true;
        } else {
            throw ConfigError(fmt::format("Unknown option: {}", arg));
        }
    }
}

ServerConfig LoadServerConfig(int argc, const char* const* argv) {
    ServerConfig config;
    config.serverVersion = getVersionString();
    ApplyEnvironment(config);
    ApplyArguments(config, argc, argv);
    return config;
}

std::string Usage(const std::string& program) {
    return fmt::format(
        "Usage: {} [options]\n"
        "\n"
        "Transport:\n"
        "  --stdio                   Serve one session on stdin/stdout (default)\n"
        "  --tcp                     Listen for TCP connections\n"
        "  --transport <stdio|tcp>   Same as --stdio / --tcp\n"
        "  --host <addr>             TCP listen address (default 127.0.0.1)\n"
        "  --port <n>                TCP listen port (default 8080)\n"
        "\n"
        "Framing:\n"
        "  --framing <mode>          content-length (default) or newline\n"
        "  --skip-blank-lines        newline framing: ignore blank lines instead of ending input\n"
        "  --max-message-size <n>    largest accepted frame in bytes (default {})\n"
        "\n"
        "Logging:\n"
        "  --log-level <level>       DEBUG, INFO, WARN, ERROR (default INFO)\n"
        "  --debug                   Same as --log-level DEBUG\n"
        "  --log-file <path>         Also append log lines to a file\n"
        "  --color                   Colour level labels\n"
        "\n"
        "Other:\n"
        "  --name <name>             serverInfo.name reported by initialize\n"
        "  --version                 Print the version and exit\n"
        "  --help                    Print this help and exit\n"
        "\n"
        "Environment: MCP_TRANSPORT, MCP_HOST, MCP_PORT, MCP_FRAMING, MCP_MAX_MESSAGE_SIZE,\n"
        "             MCP_LOG_LEVEL, MCP_LOG_FILE, MCP_LOG_COLOR (command line wins)\n",
        program, kDefaultMaxMessageSize);
}

} // namespace mcpengine
