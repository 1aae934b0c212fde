//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvelopeCodec.cpp
// Purpose: Validating decoder from payload bytes to typed JSON-RPC envelopes.
//==========================================================================================================

#include <limits>
#include <string>

#include "logging/Logger.h"
#include "mcpengine/EnvelopeCodec.h"

namespace mcpengine {

namespace {

DecodeResult fail(int code, const std::string& message, const std::optional<RequestId>& recovered) {
    DecodeResult r;
    r.error = JSONRPCError{code, message, std::nullopt};
    r.recoveredId = recovered;
    return r;
}

DecodeResult decodeResponse(const JSONValue& root, const std::optional<RequestId>& id) {
    JSONRPCResponse response;
    response.id = id;
    const JSONValue* err = FindMember(root, "error");
    if (err != nullptr) {
        auto code = GetInteger(*err, "code");
        auto message = GetString(*err, "message");
        if (!code.has_value() || !message.has_value()) {
            return fail(JSONRPCErrorCodes::InvalidRequest, "Invalid error object", id);
        }
        if (code.value() < std::numeric_limits<int>::min() || code.value() > std::numeric_limits<int>::max()) {
            return fail(JSONRPCErrorCodes::InvalidRequest, "Error code out of range", id);
        }
        JSONRPCError e;
        e.code = static_cast<int>(code.value());
        e.message = message.value();
        if (const JSONValue* data = FindMember(*err, "data")) {
            e.data = *data;
        }
        response.error = std::move(e);
    } else {
        const JSONValue* result = FindMember(root, "result");
        response.result = result ? *result : JSONValue(nullptr);
    }
    DecodeResult r;
    r.envelope = Envelope(std::move(response));
    return r;
}

} // namespace

DecodeResult DecodeEnvelope(const std::string& payload) {
    JSONValue root;
    try {
        root = ParseJSON(payload);
    } catch (const JsonParseError& e) {
        LOG_DEBUG("Envelope parse failure: {}", e.what());
        return fail(JSONRPCErrorCodes::ParseError, "Parse error", std::nullopt);
    }

    if (!root.isObject()) {
        return fail(JSONRPCErrorCodes::InvalidRequest, "Request must be an object", std::nullopt);
    }

    // Salvage the id first so every later rejection can still be correlated
    std::optional<RequestId> id;
    bool idValid = true;
    if (const JSONValue* idVal = FindMember(root, "id")) {
        IdReadResult read = RequestIdFromJSON(*idVal);
        id = read.id;
        idValid = read.valid;
    }

    auto version = GetString(root, "jsonrpc");
    if (!version.has_value()) {
        return fail(JSONRPCErrorCodes::InvalidRequest, "Missing jsonrpc version", id);
    }
    if (version.value() != JSONRPC_VERSION) {
        return fail(JSONRPCErrorCodes::InvalidRequest, "Invalid jsonrpc version", id);
    }
    if (!idValid) {
        return fail(JSONRPCErrorCodes::InvalidRequest, "Invalid id: must be a string, integer or null", std::nullopt);
    }

    const JSONValue* method = FindMember(root, "method");
    if (method == nullptr) {
        if (FindMember(root, "result") != nullptr || FindMember(root, "error") != nullptr) {
            return decodeResponse(root, id);
        }
        return fail(JSONRPCErrorCodes::InvalidRequest, "Method field missing", id);
    }
    if (!method->isString()) {
        return fail(JSONRPCErrorCodes::InvalidRequest, "Method must be a string", id);
    }
    const std::string& name = std::get<std::string>(method->value);
    if (name.empty()) {
        return fail(JSONRPCErrorCodes::InvalidRequest, "Method cannot be empty", id);
    }

    std::optional<JSONValue> params;
    if (const JSONValue* p = FindMember(root, "params")) {
        params = *p;
    }

    DecodeResult r;
    if (id.has_value()) {
        r.envelope = Envelope(JSONRPCRequest{id.value(), name, std::move(params)});
    } else {
        r.envelope = Envelope(JSONRPCNotification{name, std::move(params)});
    }
    return r;
}

std::string EnvelopeMethod(const Envelope& envelope) {
    if (const auto* req = std::get_if<JSONRPCRequest>(&envelope)) {
        return req->method;
    }
    if (const auto* note = std::get_if<JSONRPCNotification>(&envelope)) {
        return note->method;
    }
    return std::string();
}

} // namespace mcpengine
