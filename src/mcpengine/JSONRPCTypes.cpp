//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.cpp
// Purpose: Serialization of JSON-RPC envelopes with a fixed member order.
//==========================================================================================================

#include <string>

#include "mcpengine/JSONRPCTypes.h"

namespace mcpengine {

namespace {
template <typename Out>
void appendId(Out& out, const std::optional<RequestId>& id) {
    out += ",\"id\":";
    AppendJSON(out, RequestIdToJSON(id));
}

template <typename Out>
void appendMethodAndParams(Out& out, const std::string& method, const std::optional<JSONValue>& params) {
    out += ",\"method\":";
    AppendJSON(out, JSONValue(method));
    if (params.has_value()) {
        out += ",\"params\":";
        AppendJSON(out, params.value());
    }
}

template <typename Out>
void appendResponse(Out& out, const JSONRPCResponse& r) {
    out += "{\"jsonrpc\":\"2.0\"";
    appendId(out, r.id);
    if (r.error.has_value()) {
        out += ",\"error\":";
        AppendJSON(out, r.error->ToJSON());
    } else {
        out += ",\"result\":";
        if (r.result.has_value()) {
            AppendJSON(out, r.result.value());
        } else {
            out += "null";
        }
    }
    out += "}";
}
} // namespace

std::string RequestIdToString(const std::optional<RequestId>& id) {
    if (!id.has_value()) {
        return "null";
    }
    if (std::holds_alternative<int64_t>(id.value())) {
        return std::to_string(std::get<int64_t>(id.value()));
    }
    return "\"" + std::get<std::string>(id.value()) + "\"";
}

JSONValue RequestIdToJSON(const std::optional<RequestId>& id) {
    if (!id.has_value()) {
        return JSONValue(nullptr);
    }
    if (std::holds_alternative<int64_t>(id.value())) {
        return JSONValue(std::get<int64_t>(id.value()));
    }
    return JSONValue(std::get<std::string>(id.value()));
}

IdReadResult RequestIdFromJSON(const JSONValue& value) {
    IdReadResult r;
    if (value.isNull()) {
        r.valid = true;
    } else if (value.isString()) {
        r.id = RequestId(std::get<std::string>(value.value));
        r.valid = true;
    } else if (value.isInteger()) {
        r.id = RequestId(std::get<int64_t>(value.value));
        r.valid = true;
    }
    return r;
}

JSONValue JSONRPCError::ToJSON() const {
    JSONValue::Object obj;
    obj["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(code));
    obj["message"] = std::make_shared<JSONValue>(message);
    if (data.has_value()) {
        obj["data"] = std::make_shared<JSONValue>(data.value());
    }
    return JSONValue(std::move(obj));
}

std::string JSONRPCRequest::Serialize() const {
    std::string out = "{\"jsonrpc\":\"2.0\"";
    appendId(out, id);
    appendMethodAndParams(out, method, params);
    out += "}";
    return out;
}

JSONValue JSONRPCRequest::ParamsOrEmpty() const {
    return params.has_value() ? params.value() : JSONValue(JSONValue::Object{});
}

std::string JSONRPCNotification::Serialize() const {
    std::string out = "{\"jsonrpc\":\"2.0\"";
    appendMethodAndParams(out, method, params);
    out += "}";
    return out;
}

JSONValue JSONRPCNotification::ParamsOrEmpty() const {
    return params.has_value() ? params.value() : JSONValue(JSONValue::Object{});
}

std::string JSONRPCResponse::Serialize() const {
    std::string out;
    appendResponse(out, *this);
    return out;
}

std::pmr::string JSONRPCResponse::Serialize(std::pmr::memory_resource* memory) const {
    std::pmr::string out(memory);
    appendResponse(out, *this);
    return out;
}

JSONRPCResponse MakeResultResponse(const std::optional<RequestId>& id, JSONValue result) {
    JSONRPCResponse r;
    r.id = id;
    r.result = std::move(result);
    return r;
}

JSONRPCResponse MakeErrorResponse(const std::optional<RequestId>& id, int code, const std::string& message,
                                  const std::optional<JSONValue>& data) {
    JSONRPCResponse r;
    r.id = id;
    r.error = JSONRPCError{code, message, data};
    return r;
}

} // namespace mcpengine
