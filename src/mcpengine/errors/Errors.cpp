//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.cpp
// Purpose: Error category mapping, error object conversion and operator-facing error contexts.
//==========================================================================================================

#include <fmt/format.h>

#include "mcpengine/errors/Errors.h"

namespace mcpengine {
namespace errors {

ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::ServerError: return ErrorCategory::ServerGeneric;
        case JSONRPCErrorCodes::ServerNotInitialized: return ErrorCategory::ServerNotInitialized;
        case JSONRPCErrorCodes::UnknownProtocolVersion: return ErrorCategory::UnknownProtocolVersion;
        case JSONRPCErrorCodes::UnknownTool: return ErrorCategory::UnknownTool;
        default: break;
    }
    if (code < 0) {
        return ErrorCategory::Application;
    }
    return ErrorCategory::Unknown;
}

const char* errorCategoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::JsonRpcParse: return "ParseError";
        case ErrorCategory::JsonRpcInvalidRequest: return "InvalidRequest";
        case ErrorCategory::JsonRpcMethodNotFound: return "MethodNotFound";
        case ErrorCategory::JsonRpcInvalidParams: return "InvalidParams";
        case ErrorCategory::JsonRpcInternal: return "InternalError";
        case ErrorCategory::ServerGeneric: return "ServerError";
        case ErrorCategory::ServerNotInitialized: return "ServerNotInitialized";
        case ErrorCategory::UnknownProtocolVersion: return "UnknownProtocolVersion";
        case ErrorCategory::UnknownTool: return "UnknownTool";
        case ErrorCategory::Application: return "ApplicationError";
        case ErrorCategory::Unknown: return "Unknown";
    }
    return "Unknown";
}

std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    auto code = GetInteger(errVal, "code");
    auto message = GetString(errVal, "message");
    if (!code.has_value() || !message.has_value()) {
        return std::nullopt;
    }
    McpError e;
    e.code = static_cast<int>(code.value());
    e.message = message.value();
    if (const JSONValue* data = FindMember(errVal, "data")) {
        e.data = *data;
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    const JSONRPCError& err = response.error.value();
    return McpError{err.code, err.message, err.data, errorCategoryFromCode(err.code)};
}

JSONValue makeErrorValue(const McpError& err) {
    return JSONRPCError{err.code, err.message, err.data}.ToJSON();
}

JSONRPCResponse makeErrorResponse(const std::optional<RequestId>& id, const McpError& err) {
    return MakeErrorResponse(id, err.code, err.message, err.data);
}

std::optional<std::string> suggestionForCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return std::string("Send a single well-formed JSON object per frame");
        case JSONRPCErrorCodes::InvalidRequest: return std::string("Include \"jsonrpc\":\"2.0\" and a non-empty string method");
        case JSONRPCErrorCodes::MethodNotFound: return std::string("Check the method name against the server capabilities");
        case JSONRPCErrorCodes::InvalidParams: return std::string("Check the tool's input schema");
        case JSONRPCErrorCodes::InternalError: return std::string("Check tool implementation and server logs");
        case JSONRPCErrorCodes::ServerNotInitialized: return std::string("Send initialize before any other request");
        case JSONRPCErrorCodes::UnknownProtocolVersion: return std::string("Request a protocol version the server supports");
        case JSONRPCErrorCodes::UnknownTool: return std::string("Call tools/list to see available tools");
        default: return std::nullopt;
    }
}

ErrorContext makeErrorContext(int code, const std::string& message,
                              const std::optional<std::string>& method,
                              const std::optional<RequestId>& requestId) {
    ErrorContext ctx;
    ctx.code = code;
    ctx.message = message;
    ctx.method = method;
    ctx.requestId = requestId;
    ctx.timestamp = std::chrono::system_clock::now();
    ctx.suggestion = suggestionForCode(code);
    return ctx;
}

std::string ErrorContext::format() const {
    std::string out = fmt::format("Error {} ({}): {}", code, errorCategoryName(errorCategoryFromCode(code)), message);
    if (method.has_value() || requestId.has_value()) {
        out += fmt::format(" (method: {}, id: {})", method.value_or("?"), RequestIdToString(requestId));
    }
    if (suggestion.has_value()) {
        out += " Suggestion: " + suggestion.value();
    }
    return out;
}

} // namespace errors
} // namespace mcpengine
