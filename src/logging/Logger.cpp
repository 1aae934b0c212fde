//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Definitions for Logger static members; initial values honor the MCP_* environment.
//==========================================================================================================

#include "logging/Logger.h"

LogLevel Logger::sLogLevel = Logger::levelFromString(GetEnvOrDefault("MCP_LOG_LEVEL", "INFO"));
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
std::atomic<bool> Logger::sUseStderr{GetEnvBool("MCP_STDIO_MODE", false)};
std::atomic<bool> Logger::sColorEnabled{GetEnvBool("MCP_LOG_COLOR", true)};
