//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Calculator.h
// Purpose: Arithmetic tools: "calculator" {operation, a, b} and the single-operation tools add, subtract,
//          multiply and divide {a, b}.
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "mcpengine/JSONValue.h"
#include "mcpengine/Registries.h"

namespace mcpengine {
namespace tools {

enum class ArithmeticOp {
    Add,
    Subtract,
    Multiply,
    Divide
};

std::optional<ArithmeticOp> ArithmeticOpFromString(const std::string& name);
const char* ArithmeticOpName(ArithmeticOp op);

// A JSON number, or a string holding one ("5", "-2.5"). Anything else yields std::nullopt.
std::optional<double> ReadOperand(const JSONValue& value);

// std::nullopt for division by zero.
std::optional<double> Evaluate(ArithmeticOp op, double a, double b);

// Shortest round-trip form: 30.0 -> "30", 0.1 + 0.2 -> "0.30000000000000004".
std::string FormatNumber(double value);

//==========================================================================================================
// RegisterCalculatorTools
// Purpose: Adds calculator, add, subtract, multiply and divide to the registry.
// Behavior:
//   Missing or non-numeric operands and unknown operations are InvalidParams errors.
//   Division by zero is reported in the tool result (isError true), not as a protocol error.
//==========================================================================================================
void RegisterCalculatorTools(ToolRegistry& registry);

} // namespace tools
} // namespace mcpengine
