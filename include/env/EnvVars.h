//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Cross-platform helpers to read environment variables safely.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset/empty.
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
    return (v != nullptr && *v != '\0') ? std::string(v) : defaultValue;
}

//==========================================================================================================
// HasEnv
// Purpose: True when the environment variable is set to a non-empty value.
//==========================================================================================================
inline bool HasEnv(const char* name) {
    if (name == nullptr || *name == '\0') {
        return false;
    }
    const char* v = std::getenv(name);
    return v != nullptr && *v != '\0';
}

//==========================================================================================================
// IsTruthy
// Purpose: Interprets "1", "true", "TRUE", "yes", "on" as true; everything else as false.
//==========================================================================================================
inline bool IsTruthy(const std::string& v) {
    return v == "1" || v == "true" || v == "TRUE" || v == "True" || v == "yes" || v == "on";
}
