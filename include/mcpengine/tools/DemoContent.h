//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DemoContent.h
// Purpose: Tools, resource and prompt registered by the demo server executable.
//==========================================================================================================

#pragma once

#include "mcpengine/Protocol.h"
#include "mcpengine/Registries.h"

namespace mcpengine {
namespace tools {

// "echo" {message}: returns message as text.
void RegisterEchoTool(ToolRegistry& registry);

//==========================================================================================================
// RegisterCounterTool
// Purpose: "counter" {count = 10, intervalMs = 100}: counts to count, one step per interval, reporting
//          progress after each step. Cancellable; a cancelled run returns an isError result naming the
//          step it stopped at and the cancellation reason.
//==========================================================================================================
void RegisterCounterTool(ToolRegistry& registry);

// "info://server": JSON text with the server name, version and protocol version.
void RegisterServerInfoResource(ResourceRegistry& registry, const Implementation& serverInfo);

// "greeting" {name}: a single user message asking for a greeting.
void RegisterGreetingPrompt(PromptRegistry& registry);

// Everything above plus the calculator tools.
void RegisterDemoContent(Registries& registries, const Implementation& serverInfo);

} // namespace tools
} // namespace mcpengine
