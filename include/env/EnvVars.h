//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables as strings, booleans and integers.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <optional>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    return v ? std::string(v) : defaultValue;
}

//==========================================================================================================
// GetEnvOptional
// Purpose: Returns the value of the environment variable when it is set and non-empty.
//==========================================================================================================
inline std::optional<std::string> GetEnvOptional(const char* name) {
    if (name == nullptr || *name == '\0') {
        return std::nullopt;
    }
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0') {
        return std::nullopt;
    }
    return std::string(v);
}

//==========================================================================================================
// GetEnvBool
// Purpose: Interprets "1"/"true"/"yes"/"on" as true and "0"/"false"/"no"/"off" as false.
// Returns:
//   defaultValue when unset or unrecognized.
//==========================================================================================================
inline bool GetEnvBool(const char* name, bool defaultValue) {
    auto v = GetEnvOptional(name);
    if (!v.has_value()) {
        return defaultValue;
    }
    const std::string& s = v.value();
    if (s == "1" || s == "true" || s == "TRUE" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "FALSE" || s == "no" || s == "off") return false;
    return defaultValue;
}
