//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_config.cpp
// Purpose: Tests for server configuration: defaults, environment overlay, command line and validation
//==========================================================================================================

#include <gtest/gtest.h>

#include <cstdlib>
#include <vector>

#include "mcpengine/Config.h"
#include "mcpengine/version.h"

using namespace mcpengine;

namespace {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clearEnv(); }
    void TearDown() override { clearEnv(); }

    static void clearEnv() {
        for (const char* name : {"MCP_TRANSPORT", "MCP_HOST", "MCP_PORT", "MCP_FRAMING", "MCP_MAX_MESSAGE_SIZE",
                                 "MCP_LOG_LEVEL", "MCP_LOG_FILE", "MCP_LOG_COLOR"}) {
            ::unsetenv(name);
        }
    }

    static ServerConfig load(std::vector<const char*> args) {
        args.insert(args.begin(), "mcpengine_server");
        return LoadServerConfig(static_cast<int>(args.size()), args.data());
    }
};

} // namespace

TEST_F(ConfigTest, Defaults) {
    ServerConfig config = load({});
    EXPECT_EQ(config.transport, TransportKind::Stdio);
    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.port, 8080u);
    EXPECT_EQ(config.framing, FramingMode::ContentLength);
    EXPECT_FALSE(config.skipBlankLines);
    EXPECT_EQ(config.maxMessageSize, kDefaultMaxMessageSize);
    EXPECT_EQ(config.serverVersion, getVersionString());
    EXPECT_NO_THROW(config.validate());
}

TEST_F(ConfigTest, CommandLineOptions) {
    ServerConfig config = load({"--tcp", "--host", "0.0.0.0", "--port=9000", "--framing", "newline",
                                "--skip-blank-lines", "--debug", "--name=calc"});
    EXPECT_EQ(config.transport, TransportKind::Tcp);
    EXPECT_EQ(config.host, "0.0.0.0");
    EXPECT_EQ(config.port, 9000u);
    EXPECT_EQ(config.framing, FramingMode::Delimiter);
    EXPECT_TRUE(config.skipBlankLines);
    EXPECT_EQ(config.logLevel, "DEBUG");
    EXPECT_EQ(config.serverName, "calc");
}

TEST_F(ConfigTest, EnvironmentIsOverriddenByCommandLine) {
    ::setenv("MCP_TRANSPORT", "tcp", 1);
    ::setenv("MCP_PORT", "7000", 1);
    ::setenv("MCP_LOG_COLOR", "true", 1);
    ServerConfig fromEnv = load({});
    EXPECT_EQ(fromEnv.transport, TransportKind::Tcp);
    EXPECT_EQ(fromEnv.port, 7000u);
    EXPECT_TRUE(fromEnv.enableColor);

    ServerConfig overridden = load({"--stdio", "--port", "7001"});
    EXPECT_EQ(overridden.transport, TransportKind::Stdio);
    EXPECT_EQ(overridden.port, 7001u);
}

TEST_F(ConfigTest, BadInputThrowsConfigError) {
    EXPECT_THROW(load({"--bogus"}), ConfigError);
    EXPECT_THROW(load({"--port"}), ConfigError);
    EXPECT_THROW(load({"--port", "eighty"}), ConfigError);
    EXPECT_THROW(load({"--framing", "xml"}), ConfigError);
    EXPECT_THROW(load({"--tcp=yes"}), ConfigError);

    ::setenv("MCP_MAX_MESSAGE_SIZE", "-1", 1);
    EXPECT_THROW(load({}), ConfigError);
}

TEST_F(ConfigTest, ValidateRejectsUnusableValues) {
    ServerConfig config = load({"--port", "70000"});
    EXPECT_THROW(config.validate(), ConfigError);

    config = load({"--port", "0"});
    EXPECT_THROW(config.validate(), ConfigError);

    config = load({"--log-level", "chatty"});
    EXPECT_THROW(config.validate(), ConfigError);

    config = load({"--max-message-size", "0"});
    EXPECT_THROW(config.validate(), ConfigError);

    config = load({"--name="});
    EXPECT_THROW(config.validate(), ConfigError);
}

TEST_F(ConfigTest, HelpAndVersionFlags) {
    EXPECT_TRUE(load({"-h"}).showHelp);
    EXPECT_TRUE(load({"--version"}).showVersion);
    const std::string usage = Usage("mcpengine_server");
    EXPECT_NE(usage.find("--framing"), std::string::npos);
    EXPECT_NE(usage.find("MCP_PORT"), std::string::npos);
}
