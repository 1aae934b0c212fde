//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.h
// Purpose: Method registry and dispatcher with before/after/error/fallback hooks.
//==========================================================================================================

#pragma once

#include <exception>
#include <functional>
#include <memory_resource>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcpengine/JSONRPCTypes.h"

namespace mcpengine {

class CancellationToken;
class Session;

//==========================================================================================================
// DispatchResult
// Purpose: Typed outcome of a dispatch. Carries no framing or serialization.
// Kinds:
//   None: nothing to send (notifications).
//   EndStream: the connection should stop reading after this message.
//   Result: success value.
//   Error: { code, message, data? }.
//==========================================================================================================
struct DispatchResult {
    enum class Kind { None, EndStream, Result, Error };

    Kind kind{Kind::None};
    std::optional<JSONValue> result;
    std::optional<JSONRPCError> error;

    static DispatchResult None() { return DispatchResult{}; }
    static DispatchResult EndStream() { DispatchResult r; r.kind = Kind::EndStream; return r; }
    static DispatchResult Success(JSONValue value);
    static DispatchResult Failure(int code, const std::string& message,
                                  std::optional<JSONValue> data = std::nullopt);

    bool isError() const { return kind == Kind::Error; }
};

//==========================================================================================================
// DispatchContext
// Purpose: Everything a handler may use for one request or notification.
// Fields:
//   method/id/params: from the envelope; params is an empty object when the message had none.
//   memory: the request's arena; released when the request/response cycle ends.
//   session: per-connection state, null when dispatching outside a connection.
//   cancellation: token of the in-flight request when its handler is cancellable, else null.
//==========================================================================================================
struct DispatchContext {
    std::string method;
    std::optional<RequestId> id;
    JSONValue params;
    std::pmr::memory_resource* memory{std::pmr::get_default_resource()};
    Session* session{nullptr};
    CancellationToken* cancellation{nullptr};

    bool isNotification() const { return !id.has_value(); }
};

using MethodHandler = std::function<DispatchResult(DispatchContext& ctx, const JSONValue& params)>;
using BeforeHook = std::function<void(const DispatchContext& ctx)>;
using AfterHook = std::function<void(const DispatchContext& ctx, const DispatchResult& result)>;
using ErrorHook = std::function<DispatchResult(const DispatchContext& ctx, std::exception_ptr error)>;
using FallbackHook = std::function<DispatchResult(DispatchContext& ctx)>;

//==========================================================================================================
// MethodRegistry
// Purpose: Exact-name dispatch table. Built before serving starts and read-only afterwards, so concurrent
//          dispatch from several connection threads needs no locking.
// Dispatch order:
//   1. before hook (throwing from it aborts the dispatch; the exception propagates)
//   2. handler for ctx.method; a throwing handler is routed to the error hook, or propagates without one
//   3. no handler: fallback hook, or MethodNotFound (-32601)
//   4. after hook, with the final result (including error hook and fallback outcomes)
//==========================================================================================================
class MethodRegistry {
public:
    // Registers handler for method. Registering the same name again replaces the earlier handler.
    void add(const std::string& method, MethodHandler handler);

    bool contains(const std::string& method) const;
    std::vector<std::string> methods() const;

    void setOnBefore(BeforeHook hook) { beforeHook = std::move(hook); }
    void setOnAfter(AfterHook hook) { afterHook = std::move(hook); }
    void setOnError(ErrorHook hook) { errorHook = std::move(hook); }
    void setOnFallback(FallbackHook hook) { fallbackHook = std::move(hook); }

    DispatchResult dispatch(DispatchContext& ctx) const;

private:
    std::unordered_map<std::string, MethodHandler> handlers;
    BeforeHook beforeHook;
    AfterHook afterHook;
    ErrorHook errorHook;
    FallbackHook fallbackHook;
};

} // namespace mcpengine
