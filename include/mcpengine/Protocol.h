//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol constants, method names and descriptor types
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "mcpengine/JSONRPCTypes.h"

namespace mcpengine {

///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// The only protocol version this server negotiates
inline constexpr const char* PROTOCOL_VERSION = "2024-11-05";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}

    JSONValue ToJSON() const;
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool arguments; an empty object schema when unset
    bool cancellable = false;

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{}, bool cancellable = false)
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)), cancellable(cancellable) {}

    JSONValue ToJSON() const;
};

// tools/call result: { content: [ { type: "text", text } ... ], isError }
struct CallToolResult {
    std::vector<JSONValue> content;
    bool isError = false;

    static CallToolResult Text(const std::string& text, bool isError = false);
    JSONValue ToJSON() const;
};

///////////////////////////////////////// Resources ///////////////////////////////////////////
struct Resource {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;

    Resource() = default;
    Resource(std::string uri, std::string name,
             std::optional<std::string> description = std::nullopt,
             std::optional<std::string> mimeType = std::nullopt)
        : uri(std::move(uri)), name(std::move(name)),
          description(std::move(description)), mimeType(std::move(mimeType)) {}

    JSONValue ToJSON() const;
};

// One entry of resources/read "contents"
struct ResourceContent {
    std::string uri;
    std::optional<std::string> mimeType;
    std::string text;

    JSONValue ToJSON() const;
};

///////////////////////////////////////// Prompts ///////////////////////////////////////////
struct PromptArgument {
    std::string name;
    std::optional<std::string> description;
    bool required = false;
};

struct Prompt {
    std::string name;
    std::string description;
    std::vector<PromptArgument> arguments;

    Prompt() = default;
    Prompt(std::string name, std::string description, std::vector<PromptArgument> arguments = {})
        : name(std::move(name)), description(std::move(description)), arguments(std::move(arguments)) {}

    JSONValue ToJSON() const;
};

struct PromptMessage {
    std::string role;   // "user" or "assistant"
    std::string text;

    JSONValue ToJSON() const;
};

struct GetPromptResult {
    std::string description;
    std::vector<PromptMessage> messages;

    JSONValue ToJSON() const;
};

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Shutdown = "shutdown";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";
    constexpr const char* Subscribe = "resources/subscribe";
    constexpr const char* Unsubscribe = "resources/unsubscribe";
    constexpr const char* ListPrompts = "prompts/list";
    constexpr const char* GetPrompt = "prompts/get";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Cancelled = "notifications/cancelled";
    constexpr const char* Progress = "notifications/progress";
    constexpr const char* ProgressEnd = "notifications/progress/end";
    constexpr const char* ResourceUpdated = "notifications/resources/updated";
}

} // namespace mcpengine
