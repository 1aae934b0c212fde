//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed errors, the handler exception type, and JSON-RPC error mapping helpers.
//==========================================================================================================

#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

#include "mcpengine/JSONRPCTypes.h"

namespace mcpengine {
namespace errors {

// Categorization of JSON-RPC and server-private error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    ServerGeneric,
    ServerNotInitialized,
    UnknownProtocolVersion,
    UnknownTool,
    Application,
    Unknown
};

// Typed error representation.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code.
//
// Returns:
//   ErrorCategory for reserved codes, Application for any other negative code, Unknown otherwise.
ErrorCategory errorCategoryFromCode(int code);

// Stable name of a category, e.g. "ServerNotInitialized".
const char* errorCategoryName(ErrorCategory category);

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal);

// Extract McpError from a response if it carries an error.
std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response);

// Create the wire error object from a typed McpError.
JSONValue makeErrorValue(const McpError& err);

// Create an error response from McpError and id.
JSONRPCResponse makeErrorResponse(const std::optional<RequestId>& id, const McpError& err);

//==========================================================================================================
// RpcException
// Purpose: Thrown by handlers (and engine internals) to fail a request with a specific JSON-RPC error.
//          Anything else a handler throws is reported as InternalError.
//==========================================================================================================
class RpcException : public std::runtime_error {
public:
    RpcException(int code, const std::string& message, std::optional<JSONValue> data = std::nullopt)
        : std::runtime_error(message), errorCode(code), errorData(std::move(data)) {}

    int code() const { return errorCode; }
    const std::optional<JSONValue>& data() const { return errorData; }

    McpError toError() const {
        return McpError{errorCode, what(), errorData, errorCategoryFromCode(errorCode)};
    }

private:
    int errorCode;
    std::optional<JSONValue> errorData;
};

//==========================================================================================================
// ErrorContext
// Purpose: Operator-facing description of a failed request, logged next to the error response.
// Fields:
//   code/message: the error as sent on the wire.
//   method/requestId: what failed, when known.
//   timestamp: when the failure was recorded.
//   suggestion: remediation hint for well-known failures.
//==========================================================================================================
struct ErrorContext {
    int code{0};
    std::string message;
    std::optional<std::string> method;
    std::optional<RequestId> requestId;
    std::chrono::system_clock::time_point timestamp;
    std::optional<std::string> suggestion;

    // "Error -32097 (UnknownTool): Tool not found (method: tools/call, id: 7) Suggestion: ..."
    std::string format() const;
};

// Builds an ErrorContext stamped with the current time and the suggestion for the code.
ErrorContext makeErrorContext(int code, const std::string& message,
                              const std::optional<std::string>& method,
                              const std::optional<RequestId>& requestId);

// Remediation hint for a code, when one is known.
std::optional<std::string> suggestionForCode(int code);

} // namespace errors
} // namespace mcpengine
