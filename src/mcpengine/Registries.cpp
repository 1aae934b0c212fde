//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Registries.cpp
// Purpose: Tool, resource and prompt registries
//==========================================================================================================

#include "logging/Logger.h"
#include "mcpengine/Registries.h"

namespace mcpengine {

namespace {

// Insert-or-replace keeping first registration order.
template <typename EntryT>
void upsert(std::vector<EntryT>& entries, std::unordered_map<std::string, std::size_t>& index,
            const std::string& key, EntryT entry, const char* kind) {
    auto it = index.find(key);
    if (it != index.end()) {
        LOG_DEBUG("Replacing {} '{}'", kind, key);
        entries[it->second] = std::move(entry);
        return;
    }
    index.emplace(key, entries.size());
    entries.push_back(std::move(entry));
    LOG_DEBUG("Registered {} '{}'", kind, key);
}

template <typename EntryT>
const EntryT* lookup(const std::vector<EntryT>& entries, const std::unordered_map<std::string, std::size_t>& index,
                     const std::string& key) {
    auto it = index.find(key);
    return it == index.end() ? nullptr : &entries[it->second];
}

} // namespace

void ToolCallContext::reportProgress(double fraction, const std::optional<std::string>& message) {
    if (progress.has_value()) {
        progress->updateAsync(fraction, message);
    }
}

void ToolRegistry::add(Tool tool, ToolHandler handler) {
    const std::string name = tool.name;
    upsert(entries, index, name, Entry{std::move(tool), std::move(handler)}, "tool");
}

const ToolRegistry::Entry* ToolRegistry::find(const std::string& name) const {
    return lookup(entries, index, name);
}

std::vector<Tool> ToolRegistry::list() const {
    std::vector<Tool> out;
    out.reserve(entries.size());
    for (const auto& e : entries) {
        out.push_back(e.tool);
    }
    return out;
}

void ResourceRegistry::add(Resource resource, ResourceReader reader) {
    const std::string uri = resource.uri;
    upsert(entries, index, uri, Entry{std::move(resource), std::move(reader)}, "resource");
}

const ResourceRegistry::Entry* ResourceRegistry::find(const std::string& uri) const {
    return lookup(entries, index, uri);
}

std::vector<Resource> ResourceRegistry::list() const {
    std::vector<Resource> out;
    out.reserve(entries.size());
    for (const auto& e : entries) {
        out.push_back(e.resource);
    }
    return out;
}

void PromptRegistry::add(Prompt prompt, PromptHandler handler) {
    const std::string name = prompt.name;
    upsert(entries, index, name, Entry{std::move(prompt), std::move(handler)}, "prompt");
}

const PromptRegistry::Entry* PromptRegistry::find(const std::string& name) const {
    return lookup(entries, index, name);
}

std::vector<Prompt> PromptRegistry::list() const {
    std::vector<Prompt> out;
    out.reserve(entries.size());
    for (const auto& e : entries) {
        out.push_back(e.prompt);
    }
    return out;
}

} // namespace mcpengine
