//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Registries.h
// Purpose: Tool, resource and prompt registries the protocol server delegates to.
//==========================================================================================================

#pragma once

#include <cstddef>
#include <functional>
#include <memory_resource>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcpengine/Cancellation.h"
#include "mcpengine/Progress.h"
#include "mcpengine/Protocol.h"

namespace mcpengine {

//==========================================================================================================
// ToolCallContext
// Purpose: What a tool handler gets besides its arguments.
// Fields:
//   memory: the request arena.
//   cancellation: token polled by cancellable tools; null for tools not registered as cancellable.
//   progress: tracker for the caller's _meta.progressToken, when one was supplied and the session can
//             deliver notifications.
//==========================================================================================================
struct ToolCallContext {
    std::pmr::memory_resource* memory{std::pmr::get_default_resource()};
    CancellationToken* cancellation{nullptr};
    std::optional<ProgressTracker> progress;

    bool isCancelled() const { return cancellation != nullptr && cancellation->isCancelled(); }

    // Queues a progress notification when the caller asked for progress; otherwise does nothing.
    void reportProgress(double fraction, const std::optional<std::string>& message = std::nullopt);
};

using ToolHandler = std::function<CallToolResult(ToolCallContext& ctx, const JSONValue& arguments)>;
using ResourceReader = std::function<ResourceContent(const std::string& uri)>;
using PromptHandler = std::function<GetPromptResult(const JSONValue& arguments)>;

//==========================================================================================================
// ToolRegistry
// Purpose: Named tools in registration order. Re-registering a name replaces the earlier tool in place.
//==========================================================================================================
class ToolRegistry {
public:
    struct Entry {
        Tool tool;
        ToolHandler handler;
    };

    void add(Tool tool, ToolHandler handler);
    const Entry* find(const std::string& name) const;
    std::vector<Tool> list() const;
    std::size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }

private:
    std::vector<Entry> entries;
    std::unordered_map<std::string, std::size_t> index;
};

//==========================================================================================================
// ResourceRegistry
// Purpose: Static resources addressed by exact URI.
//==========================================================================================================
class ResourceRegistry {
public:
    struct Entry {
        Resource resource;
        ResourceReader reader;
    };

    void add(Resource resource, ResourceReader reader);
    const Entry* find(const std::string& uri) const;
    std::vector<Resource> list() const;
    std::size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }

private:
    std::vector<Entry> entries;
    std::unordered_map<std::string, std::size_t> index;
};

//==========================================================================================================
// PromptRegistry
// Purpose: Named prompt templates.
//==========================================================================================================
class PromptRegistry {
public:
    struct Entry {
        Prompt prompt;
        PromptHandler handler;
    };

    void add(Prompt prompt, PromptHandler handler);
    const Entry* find(const std::string& name) const;
    std::vector<Prompt> list() const;
    std::size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }

private:
    std::vector<Entry> entries;
    std::unordered_map<std::string, std::size_t> index;
};

// Registries built once at startup and shared read-only by every connection.
struct Registries {
    ToolRegistry tools;
    ResourceRegistry resources;
    PromptRegistry prompts;
};

} // namespace mcpengine
