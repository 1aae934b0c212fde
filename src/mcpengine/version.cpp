//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Version helpers
//==========================================================================================================
#include "mcpengine/version.h"

#include <fmt/format.h>

namespace mcpengine {

VersionInfo getVersion() {
    return VersionInfo{MCPENGINE_VERSION_MAJOR, MCPENGINE_VERSION_MINOR, MCPENGINE_VERSION_PATCH};
}

std::string getVersionString() {
    const auto v = getVersion();
    return fmt::format("{}.{}.{}", v.major, v.minor, v.patch);
}

} // namespace mcpengine
