//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.cpp
// Purpose: Method registry dispatch
//==========================================================================================================

#include <algorithm>

#include "logging/Logger.h"
#include "mcpengine/Dispatcher.h"

namespace mcpengine {

DispatchResult DispatchResult::Success(JSONValue value) {
    DispatchResult r;
    r.kind = Kind::Result;
    r.result = std::move(value);
    return r;
}

DispatchResult DispatchResult::Failure(int code, const std::string& message, std::optional<JSONValue> data) {
    DispatchResult r;
    r.kind = Kind::Error;
    r.error = JSONRPCError{code, message, std::move(data)};
    return r;
}

void MethodRegistry::add(const std::string& method, MethodHandler handler) {
    if (handlers.count(method) > 0) {
        LOG_DEBUG("Replacing handler for method '{}'", method);
    }
    handlers[method] = std::move(handler);
}

bool MethodRegistry::contains(const std::string& method) const {
    return handlers.count(method) > 0;
}

std::vector<std::string> MethodRegistry::methods() const {
    std::vector<std::string> names;
    names.reserve(handlers.size());
    for (const auto& [name, _] : handlers) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

DispatchResult MethodRegistry::dispatch(DispatchContext& ctx) const {
    if (beforeHook) {
        beforeHook(ctx);
    }

    DispatchResult result;
    auto it = handlers.find(ctx.method);
    if (it != handlers.end()) {
        std::exception_ptr failure;
        try {
            result = it->second(ctx, ctx.params);
        } catch (...) {
            failure = std::current_exception();
        }
        if (failure) {
            if (!errorHook) {
                std::rethrow_exception(failure);
            }
            result = errorHook(ctx, failure);
        }
    } else if (fallbackHook) {
        result = fallbackHook(ctx);
    } else {
        LOG_DEBUG("Method not found: {}", ctx.method);
        result = DispatchResult::Failure(JSONRPCErrorCodes::MethodNotFound, "Method not found");
    }

    if (afterHook) {
        afterHook(ctx, result);
    }
    return result;
}

} // namespace mcpengine
