//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Wire forms of the MCP descriptor types
//==========================================================================================================

#include "mcpengine/Protocol.h"

namespace mcpengine {

JSONValue Implementation::ToJSON() const {
    JSONValue obj{JSONValue::Object{}};
    SetMember(obj, "name", JSONValue(name));
    SetMember(obj, "version", JSONValue(version));
    return obj;
}

JSONValue Tool::ToJSON() const {
    JSONValue obj{JSONValue::Object{}};
    SetMember(obj, "name", JSONValue(name));
    SetMember(obj, "description", JSONValue(description));
    if (inputSchema.isObject()) {
        SetMember(obj, "inputSchema", inputSchema);
    } else {
        JSONValue schema{JSONValue::Object{}};
        SetMember(schema, "type", JSONValue("object"));
        SetMember(schema, "properties", JSONValue{JSONValue::Object{}});
        SetMember(obj, "inputSchema", std::move(schema));
    }
    return obj;
}

CallToolResult CallToolResult::Text(const std::string& text, bool isError) {
    JSONValue block{JSONValue::Object{}};
    SetMember(block, "type", JSONValue("text"));
    SetMember(block, "text", JSONValue(text));
    CallToolResult r;
    r.content.push_back(std::move(block));
    r.isError = isError;
    return r;
}

JSONValue CallToolResult::ToJSON() const {
    JSONValue::Array items;
    for (const auto& c : content) {
        items.push_back(std::make_shared<JSONValue>(c));
    }
    JSONValue obj{JSONValue::Object{}};
    SetMember(obj, "content", JSONValue(std::move(items)));
    SetMember(obj, "isError", JSONValue(isError));
    return obj;
}

JSONValue Resource::ToJSON() const {
    JSONValue obj{JSONValue::Object{}};
    SetMember(obj, "uri", JSONValue(uri));
    SetMember(obj, "name", JSONValue(name));
    if (description) {
        SetMember(obj, "description", JSONValue(*description));
    }
    if (mimeType) {
        SetMember(obj, "mimeType", JSONValue(*mimeType));
    }
    return obj;
}

JSONValue ResourceContent::ToJSON() const {
    JSONValue obj{JSONValue::Object{}};
    SetMember(obj, "uri", JSONValue(uri));
    if (mimeType) {
        SetMember(obj, "mimeType", JSONValue(*mimeType));
    }
    SetMember(obj, "text", JSONValue(text));
    return obj;
}

JSONValue Prompt::ToJSON() const {
    JSONValue obj{JSONValue::Object{}};
    SetMember(obj, "name", JSONValue(name));
    SetMember(obj, "description", JSONValue(description));
    if (!arguments.empty()) {
        JSONValue::Array args;
        for (const auto& a : arguments) {
            JSONValue arg{JSONValue::Object{}};
            SetMember(arg, "name", JSONValue(a.name));
            if (a.description) {
                SetMember(arg, "description", JSONValue(*a.description));
            }
            SetMember(arg, "required", JSONValue(a.required));
            args.push_back(std::make_shared<JSONValue>(std::move(arg)));
        }
        SetMember(obj, "arguments", JSONValue(std::move(args)));
    }
    return obj;
}

JSONValue PromptMessage::ToJSON() const {
    JSONValue content{JSONValue::Object{}};
    SetMember(content, "type", JSONValue("text"));
    SetMember(content, "text", JSONValue(text));
    JSONValue obj{JSONValue::Object{}};
    SetMember(obj, "role", JSONValue(role));
    SetMember(obj, "content", std::move(content));
    return obj;
}

JSONValue GetPromptResult::ToJSON() const {
    JSONValue::Array msgs;
    for (const auto& m : messages) {
        msgs.push_back(std::make_shared<JSONValue>(m.ToJSON()));
    }
    JSONValue obj{JSONValue::Object{}};
    SetMember(obj, "description", JSONValue(description));
    SetMember(obj, "messages", JSONValue(std::move(msgs)));
    return obj;
}

} // namespace mcpengine
