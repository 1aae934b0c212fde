//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Engine version, reported as serverInfo.version by default and by --version.
//==========================================================================================================
#pragma once

#include <string>

#define MCPENGINE_VERSION_MAJOR 0
#define MCPENGINE_VERSION_MINOR 3
#define MCPENGINE_VERSION_PATCH 0

namespace mcpengine {

struct VersionInfo {
    int major;
    int minor;
    int patch;
};

VersionInfo getVersion();

// "MAJOR.MINOR.PATCH"
std::string getVersionString();

} // namespace mcpengine
