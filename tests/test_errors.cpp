//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: Tests for error categories, error objects and error contexts
//==========================================================================================================

#include <gtest/gtest.h>

#include "mcpengine/errors/Errors.h"

using namespace mcpengine;
using namespace mcpengine::errors;

TEST(ErrorsTest, CategoryFromCode) {
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::JsonRpcParse);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::MethodNotFound), ErrorCategory::JsonRpcMethodNotFound);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::ServerNotInitialized), ErrorCategory::ServerNotInitialized);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::UnknownTool), ErrorCategory::UnknownTool);
    EXPECT_EQ(errorCategoryFromCode(-1), ErrorCategory::Application);
    EXPECT_EQ(errorCategoryFromCode(12), ErrorCategory::Unknown);
    EXPECT_STREQ(errorCategoryName(ErrorCategory::UnknownProtocolVersion), "UnknownProtocolVersion");
}

TEST(ErrorsTest, ErrorValueConversions) {
    McpError in{JSONRPCErrorCodes::InvalidParams, "bad", JSONValue("detail"), ErrorCategory::JsonRpcInvalidParams};
    JSONValue v = makeErrorValue(in);
    auto out = mcpErrorFromErrorValue(v);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->code, JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(out->message, "bad");
    ASSERT_TRUE(out->data.has_value());
    EXPECT_EQ(std::get<std::string>(out->data->value), "detail");
    EXPECT_EQ(out->category, ErrorCategory::JsonRpcInvalidParams);

    EXPECT_FALSE(mcpErrorFromErrorValue(JSONValue(JSONValue::Object{})).has_value());
}

TEST(ErrorsTest, ErrorFromResponse) {
    auto resp = makeErrorResponse(RequestId(int64_t{3}), McpError{JSONRPCErrorCodes::InternalError, "boom", std::nullopt,
                                                                 ErrorCategory::JsonRpcInternal});
    EXPECT_TRUE(resp.IsError());
    auto err = mcpErrorFromResponse(resp);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, JSONRPCErrorCodes::InternalError);
    EXPECT_FALSE(mcpErrorFromResponse(MakeResultResponse(RequestId(int64_t{3}), JSONValue())).has_value());
}

TEST(ErrorsTest, RpcExceptionCarriesCodeAndData) {
    try {
        throw RpcException(JSONRPCErrorCodes::UnknownTool, "Tool not found: nope", JSONValue("nope"));
    } catch (const RpcException& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::UnknownTool);
        EXPECT_STREQ(e.what(), "Tool not found: nope");
        ASSERT_TRUE(e.data().has_value());
        McpError err = e.toError();
        EXPECT_EQ(err.category, ErrorCategory::UnknownTool);
    }
}

TEST(ErrorsTest, ErrorContextFormat) {
    auto ctx = makeErrorContext(JSONRPCErrorCodes::UnknownTool, "Tool not found", std::string("tools/call"),
                                RequestId(int64_t{7}));
    EXPECT_EQ(ctx.format(),
              "Error -32097 (UnknownTool): Tool not found (method: tools/call, id: 7) "
              "Suggestion: Call tools/list to see available tools");

    auto bare = makeErrorContext(-5, "custom", std::nullopt, std::nullopt);
    EXPECT_EQ(bare.format(), "Error -5 (ApplicationError): custom");
    EXPECT_FALSE(suggestionForCode(-5).has_value());
}
