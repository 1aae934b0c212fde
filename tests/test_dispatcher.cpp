//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_dispatcher.cpp
// Purpose: Tests for the method registry, dispatch order and hooks
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "mcpengine/Dispatcher.h"
#include "mcpengine/errors/Errors.h"

using namespace mcpengine;

namespace {

DispatchContext makeContext(const std::string& method, std::optional<RequestId> id = RequestId(int64_t{1})) {
    DispatchContext ctx;
    ctx.method = method;
    ctx.id = std::move(id);
    ctx.params = JSONValue(JSONValue::Object{});
    return ctx;
}

} // namespace

TEST(DispatcherTest, RoutesByExactName) {
    MethodRegistry registry;
    registry.add("ping", [](DispatchContext&, const JSONValue&) {
        return DispatchResult::Success(JSONValue(JSONValue::Object{}));
    });
    registry.add("echo", [](DispatchContext&, const JSONValue& params) {
        return DispatchResult::Success(params);
    });

    auto ctx = makeContext("echo");
    SetMember(ctx.params, "x", JSONValue(int64_t{5}));
    auto r = registry.dispatch(ctx);
    ASSERT_EQ(r.kind, DispatchResult::Kind::Result);
    EXPECT_EQ(GetInteger(*r.result, "x"), std::optional<int64_t>(5));

    EXPECT_TRUE(registry.contains("ping"));
    EXPECT_FALSE(registry.contains("Ping"));
    EXPECT_EQ(registry.methods(), (std::vector<std::string>{"echo", "ping"}));
}

TEST(DispatcherTest, MissWithoutFallbackIsMethodNotFound) {
    MethodRegistry registry;
    auto ctx = makeContext("nope");
    auto r = registry.dispatch(ctx);
    ASSERT_TRUE(r.isError());
    EXPECT_EQ(r.error->code, JSONRPCErrorCodes::MethodNotFound);
}

TEST(DispatcherTest, FallbackHandlesMisses) {
    MethodRegistry registry;
    registry.setOnFallback([](DispatchContext& ctx) {
        return DispatchResult::Success(JSONValue("fallback:" + ctx.method));
    });
    auto ctx = makeContext("anything");
    auto r = registry.dispatch(ctx);
    ASSERT_EQ(r.kind, DispatchResult::Kind::Result);
    EXPECT_EQ(std::get<std::string>(r.result->value), "fallback:anything");
}

TEST(DispatcherTest, LaterRegistrationWins) {
    MethodRegistry registry;
    registry.add("m", [](DispatchContext&, const JSONValue&) { return DispatchResult::Success(JSONValue(int64_t{1})); });
    registry.add("m", [](DispatchContext&, const JSONValue&) { return DispatchResult::Success(JSONValue(int64_t{2})); });
    auto ctx = makeContext("m");
    auto r = registry.dispatch(ctx);
    EXPECT_EQ(std::get<int64_t>(r.result->value), 2);
    EXPECT_EQ(registry.methods().size(), 1u);
}

TEST(DispatcherTest, HooksRunInOrder) {
    MethodRegistry registry;
    std::vector<std::string> calls;
    registry.setOnBefore([&](const DispatchContext& ctx) { calls.push_back("before:" + ctx.method); });
    registry.setOnAfter([&](const DispatchContext&, const DispatchResult& r) {
        calls.push_back(r.isError() ? "after:error" : "after:ok");
    });
    registry.add("work", [&](DispatchContext&, const JSONValue&) {
        calls.push_back("handler");
        return DispatchResult::None();
    });

    auto ctx = makeContext("work", std::nullopt);
    auto r = registry.dispatch(ctx);
    EXPECT_EQ(r.kind, DispatchResult::Kind::None);
    EXPECT_EQ(calls, (std::vector<std::string>{"before:work", "handler", "after:ok"}));

    calls.clear();
    auto miss = makeContext("missing");
    registry.dispatch(miss);
    EXPECT_EQ(calls, (std::vector<std::string>{"before:missing", "after:error"}));
}

TEST(DispatcherTest, BeforeHookCanAbortDispatch) {
    MethodRegistry registry;
    bool handlerRan = false;
    bool afterRan = false;
    registry.setOnBefore([](const DispatchContext&) {
        throw errors::RpcException(JSONRPCErrorCodes::ServerNotInitialized, "Server not initialized");
    });
    registry.setOnAfter([&](const DispatchContext&, const DispatchResult&) { afterRan = true; });
    registry.add("m", [&](DispatchContext&, const JSONValue&) {
        handlerRan = true;
        return DispatchResult::None();
    });

    auto ctx = makeContext("m");
    EXPECT_THROW(registry.dispatch(ctx), errors::RpcException);
    EXPECT_FALSE(handlerRan);
    EXPECT_FALSE(afterRan);
}

TEST(DispatcherTest, ErrorHookConvertsHandlerExceptions) {
    MethodRegistry registry;
    registry.add("fails", [](DispatchContext&, const JSONValue&) -> DispatchResult {
        throw std::runtime_error("disk on fire");
    });
    registry.setOnError([](const DispatchContext&, std::exception_ptr error) {
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            return DispatchResult::Failure(JSONRPCErrorCodes::InternalError, std::string("Internal error: ") + e.what());
        }
        return DispatchResult::Failure(JSONRPCErrorCodes::InternalError, "Internal error");
    });
    DispatchResult seenByAfter;
    registry.setOnAfter([&](const DispatchContext&, const DispatchResult& r) { seenByAfter = r; });

    auto ctx = makeContext("fails");
    auto r = registry.dispatch(ctx);
    ASSERT_TRUE(r.isError());
    EXPECT_EQ(r.error->code, JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(r.error->message, "Internal error: disk on fire");
    EXPECT_TRUE(seenByAfter.isError());
}

TEST(DispatcherTest, HandlerExceptionPropagatesWithoutErrorHook) {
    MethodRegistry registry;
    registry.add("fails", [](DispatchContext&, const JSONValue&) -> DispatchResult {
        throw std::logic_error("unhandled");
    });
    auto ctx = makeContext("fails");
    EXPECT_THROW(registry.dispatch(ctx), std::logic_error);
}
