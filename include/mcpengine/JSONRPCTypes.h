//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: Strongly typed JSON-RPC 2.0 envelopes (request, notification, response) and error codes.
//==========================================================================================================

#pragma once

#include <cstdint>
#include <memory_resource>
#include <optional>
#include <string>
#include <variant>

#include "mcpengine/JSONValue.h"

namespace mcpengine {

inline constexpr const char* JSONRPC_VERSION = "2.0";

//==========================================================================================================
// RequestId
// Purpose: JSON-RPC request id: string or integer. An absent id (std::nullopt) marks a notification.
// Notes:
//   Equality is by alternative and value; "42" and 42 are different ids.
//==========================================================================================================
using RequestId = std::variant<std::string, int64_t>;

// Renders an id for logs: strings quoted, integers bare, absent ids as "null".
std::string RequestIdToString(const std::optional<RequestId>& id);

// JSON form of an optional id; std::nullopt becomes JSON null.
JSONValue RequestIdToJSON(const std::optional<RequestId>& id);

// Reads an id member. JSON null is valid and yields no id; types other than string or integer are invalid.
struct IdReadResult {
    std::optional<RequestId> id;
    bool valid{false};
};
IdReadResult RequestIdFromJSON(const JSONValue& value);

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC codes plus the server-private codes used by the lifecycle and tool routing.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;

    constexpr int ServerError = -32000;
    constexpr int ServerNotInitialized = -32099;
    constexpr int UnknownProtocolVersion = -32098;
    constexpr int UnknownTool = -32097;
}

//==========================================================================================================
// JSONRPCError
// Purpose: The error member of a response: { code, message, data? }.
//==========================================================================================================
struct JSONRPCError {
    int code{JSONRPCErrorCodes::InternalError};
    std::string message;
    std::optional<JSONValue> data;

    JSONValue ToJSON() const;
};

//==========================================================================================================
// JSONRPCRequest
// Purpose: A call expecting a response. id is always present on requests decoded from the wire.
// Methods:
//   Serialize(): Canonical JSON string.
//   ParamsOrEmpty(): params when present, otherwise an empty object.
//==========================================================================================================
struct JSONRPCRequest {
    RequestId id;
    std::string method;
    std::optional<JSONValue> params;

    std::string Serialize() const;
    JSONValue ParamsOrEmpty() const;
};

//==========================================================================================================
// JSONRPCNotification
// Purpose: A message with no id; never answered.
//==========================================================================================================
struct JSONRPCNotification {
    std::string method;
    std::optional<JSONValue> params;

    std::string Serialize() const;
    JSONValue ParamsOrEmpty() const;
};

//==========================================================================================================
// JSONRPCResponse
// Purpose: Carries either result or error, echoing the id of the request it answers (null when unknown).
// Methods:
//   Serialize(): Always emits jsonrpc, id and exactly one of result/error. The overload taking a memory
//                resource builds the text in it (the request arena while dispatching).
//   IsError(): True when error is present.
//==========================================================================================================
struct JSONRPCResponse {
    std::optional<RequestId> id;
    std::optional<JSONValue> result;
    std::optional<JSONRPCError> error;

    std::string Serialize() const;
    std::pmr::string Serialize(std::pmr::memory_resource* memory) const;
    bool IsError() const { return error.has_value(); }
};

// Builders used by the dispatch path. The id is copied verbatim; a missing id serializes as null.
JSONRPCResponse MakeResultResponse(const std::optional<RequestId>& id, JSONValue result);
JSONRPCResponse MakeErrorResponse(const std::optional<RequestId>& id, int code, const std::string& message,
                                  const std::optional<JSONValue>& data = std::nullopt);

} // namespace mcpengine
