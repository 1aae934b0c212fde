//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DemoContent.cpp
// Purpose: Demo tools, resource and prompt
//==========================================================================================================

#include <chrono>
#include <thread>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "mcpengine/errors/Errors.h"
#include "mcpengine/tools/Calculator.h"
#include "mcpengine/tools/DemoContent.h"

namespace mcpengine {
namespace tools {

using errors::RpcException;

namespace {

constexpr int64_t kMaxCount = 10000;
constexpr int64_t kMaxIntervalMs = 10000;

int64_t integerArgument(const JSONValue& args, const char* name, int64_t fallback, int64_t minValue, int64_t maxValue) {
    const JSONValue* v = FindMember(args, name);
    if (v == nullptr || v->isNull()) {
        return fallback;
    }
    if (!v->isInteger()) {
        throw RpcException(JSONRPCErrorCodes::InvalidParams, fmt::format("Argument '{}' must be an integer", name));
    }
    const int64_t n = std::get<int64_t>(v->value);
    if (n < minValue || n > maxValue) {
        throw RpcException(JSONRPCErrorCodes::InvalidParams,
                           fmt::format("Argument '{}' must be between {} and {}", name, minValue, maxValue));
    }
    return n;
}

} // namespace

void RegisterEchoTool(ToolRegistry& registry) {
    registry.add(Tool("echo", "Echo a message",
                      ParseJSON(R"({"type":"object","properties":{"message":{"type":"string"}},"required":["message"]})")),
                 [](ToolCallContext&, const JSONValue& args) {
                     auto message = GetString(args, "message");
                     if (!message) {
                         throw RpcException(JSONRPCErrorCodes::InvalidParams, "Argument 'message' must be a string");
                     }
                     return CallToolResult::Text(*message);
                 });
}

void RegisterCounterTool(ToolRegistry& registry) {
    Tool tool("counter", "Count slowly, reporting progress; can be cancelled",
              ParseJSON(R"({
  "type": "object",
  "properties": {
    "count": { "type": "integer", "description": "Number of steps", "default": 10 },
    "intervalMs": { "type": "integer", "description": "Delay per step in milliseconds", "default": 100 }
  }
})"),
              true);
    registry.add(std::move(tool), [](ToolCallContext& ctx, const JSONValue& args) {
        const int64_t count = integerArgument(args, "count", 10, 1, kMaxCount);
        const int64_t intervalMs = integerArgument(args, "intervalMs", 100, 0, kMaxIntervalMs);

        for (int64_t i = 1; i <= count; ++i) {
            if (ctx.isCancelled()) {
                const std::string reason = ctx.cancellation->reason().value_or("no reason given");
                LOG_INFO("counter cancelled at step {} of {}: {}", i - 1, count, reason);
                return CallToolResult::Text(fmt::format("Cancelled after {} of {} steps: {}", i - 1, count, reason), true);
            }
            if (intervalMs > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(intervalMs));
            }
            ctx.reportProgress(static_cast<double>(i) / static_cast<double>(count),
                               fmt::format("step {} of {}", i, count));
        }
        return CallToolResult::Text(fmt::format("Counted to {}", count));
    });
}

void RegisterServerInfoResource(ResourceRegistry& registry, const Implementation& serverInfo) {
    registry.add(Resource("info://server", "Server information", std::string("Name and version of this server"),
                          std::string("application/json")),
                 [serverInfo](const std::string& uri) {
                     JSONValue body = serverInfo.ToJSON();
                     SetMember(body, "protocolVersion", JSONValue(PROTOCOL_VERSION));
                     ResourceContent content;
                     content.uri = uri;
                     content.mimeType = "application/json";
                     content.text = SerializeJSON(body);
                     return content;
                 });
}

void RegisterGreetingPrompt(PromptRegistry& registry) {
    Prompt prompt("greeting", "Ask the assistant to greet someone");
    prompt.arguments.push_back(PromptArgument{"name", std::string("Who to greet"), true});
    registry.add(std::move(prompt), [](const JSONValue& args) {
        auto name = GetString(args, "name");
        if (!name || name->empty()) {
            throw RpcException(JSONRPCErrorCodes::InvalidParams, "Argument 'name' is required");
        }
        GetPromptResult result;
        result.description = fmt::format("Greeting for {}", *name);
        result.messages.push_back(PromptMessage{"user", fmt::format("Please write a short, friendly greeting for {}.", *name)});
        return result;
    });
}

void RegisterDemoContent(Registries& registries, const Implementation& serverInfo) {
    RegisterCalculatorTools(registries.tools);
    RegisterEchoTool(registries.tools);
    RegisterCounterTool(registries.tools);
    RegisterServerInfoResource(registries.resources, serverInfo);
    RegisterGreetingPrompt(registries.prompts);
    LOG_DEBUG("Registered {} tool(s), {} resource(s), {} prompt(s)", registries.tools.size(),
              registries.resources.size(), registries.prompts.size());
}

} // namespace tools
} // namespace mcpengine
