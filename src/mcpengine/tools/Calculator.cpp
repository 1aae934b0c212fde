//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Calculator.cpp
// Purpose: Arithmetic tools
//==========================================================================================================

#include <cerrno>
#include <cmath>
#include <cstdlib>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "mcpengine/errors/Errors.h"
#include "mcpengine/tools/Calculator.h"

namespace mcpengine {
namespace tools {

using errors::RpcException;

namespace {

const char* kCalculatorSchema = R"({
  "type": "object",
  "properties": {
    "operation": {
      "type": "string",
      "enum": ["add", "subtract", "multiply", "divide"],
      "description": "The arithmetic operation to perform"
    },
    "a": { "type": "number", "description": "The first number" },
    "b": { "type": "number", "description": "The second number" }
  },
  "required": ["operation", "a", "b"]
})";

const char* kBinarySchema = R"({
  "type": "object",
  "properties": {
    "a": { "type": "number", "description": "First operand" },
    "b": { "type": "number", "description": "Second operand" }
  },
  "required": ["a", "b"]
})";

double requireOperand(const JSONValue& args, const char* name) {
    const JSONValue* v = FindMember(args, name);
    if (v == nullptr) {
        throw RpcException(JSONRPCErrorCodes::InvalidParams, fmt::format("Missing required argument '{}'", name));
    }
    auto operand = ReadOperand(*v);
    if (!operand) {
        throw RpcException(JSONRPCErrorCodes::InvalidParams,
                           fmt::format("Argument '{}' must be a number (got {})", name, v->typeName()));
    }
    return *operand;
}

CallToolResult compute(ArithmeticOp op, const JSONValue& args) {
    const double a = requireOperand(args, "a");
    const double b = requireOperand(args, "b");
    auto result = Evaluate(op, a, b);
    if (!result) {
        LOG_DEBUG("Calculator: {} {} {} rejected (division by zero)", FormatNumber(a), ArithmeticOpName(op), FormatNumber(b));
        return CallToolResult::Text("Division by zero", true);
    }
    return CallToolResult::Text(FormatNumber(*result));
}

} // namespace

std::optional<ArithmeticOp> ArithmeticOpFromString(const std::string& name) {
    if (name == "add") return ArithmeticOp::Add;
    if (name == "subtract") return ArithmeticOp::Subtract;
    if (name == "multiply") return ArithmeticOp::Multiply;
    if (name == "divide") return ArithmeticOp::Divide;
    return std::nullopt;
}

const char* ArithmeticOpName(ArithmeticOp op) {
    switch (op) {
        case ArithmeticOp::Add: return "add";
        case ArithmeticOp::Subtract: return "subtract";
        case ArithmeticOp::Multiply: return "multiply";
        case ArithmeticOp::Divide: return "divide";
    }
    return "unknown";
}

std::optional<double> ReadOperand(const JSONValue& value) {
    if (value.isInteger()) {
        return static_cast<double>(std::get<int64_t>(value.value));
    }
    if (value.isNumber()) {
        return std::get<double>(value.value);
    }
    if (!value.isString()) {
        return std::nullopt;
    }
    const std::string& text = std::get<std::string>(value.value);
    if (text.empty()) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    const double parsed = std::strtod(text.c_str(), &end);
    if (errno != 0 || end != text.c_str() + text.size() || !std::isfinite(parsed)) {
        return std::nullopt;
    }
    return parsed;
}

std::optional<double> Evaluate(ArithmeticOp op, double a, double b) {
    switch (op) {
        case ArithmeticOp::Add: return a + b;
        case ArithmeticOp::Subtract: return a - b;
        case ArithmeticOp::Multiply: return a * b;
        case ArithmeticOp::Divide:
            if (b == 0.0) {
                return std::nullopt;
            }
            return a / b;
    }
    return std::nullopt;
}

std::string FormatNumber(double value) {
    return fmt::format("{}", value);
}

void RegisterCalculatorTools(ToolRegistry& registry) {
    registry.add(Tool("calculator", "Basic arithmetic operations", ParseJSON(kCalculatorSchema)),
                 [](ToolCallContext&, const JSONValue& args) {
                     const JSONValue* opValue = FindMember(args, "operation");
                     if (opValue == nullptr || !opValue->isString()) {
                         throw RpcException(JSONRPCErrorCodes::InvalidParams, "Argument 'operation' must be a string");
                     }
                     auto op = ArithmeticOpFromString(std::get<std::string>(opValue->value));
                     if (!op) {
                         throw RpcException(JSONRPCErrorCodes::InvalidParams,
                                            fmt::format("Unknown operation '{}'", std::get<std::string>(opValue->value)));
                     }
                     return compute(*op, args);
                 });

    const struct {
        ArithmeticOp op;
        const char* description;
    } single[] = {
        {ArithmeticOp::Add, "Add two numbers"},
        {ArithmeticOp::Subtract, "Subtract b from a"},
        {ArithmeticOp::Multiply, "Multiply two numbers"},
        {ArithmeticOp::Divide, "Divide a by b (reports an error when b is zero)"},
    };
    for (const auto& s : single) {
        const ArithmeticOp op = s.op;
        registry.add(Tool(ArithmeticOpName(op), s.description, ParseJSON(kBinarySchema)),
                     [op](ToolCallContext&, const JSONValue& args) { return compute(op, args); });
    }
}

} // namespace tools
} // namespace mcpengine
