//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read CLOUDCALL_* environment variables safely.
//==========================================================================================================
#pragma once
#include <cctype>
#include <cstdlib>
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
// GetEnvFlag
// Purpose: Reads a boolean switch. "1", "true", "yes" and "on" (any case) are true; anything else is false.
// Args:
//   name: Environment variable name.
//   defaultValue: Value used when the variable is unset.
// Returns:
//   Parsed flag value.
//==========================================================================================================
inline bool GetEnvFlag(const char* name, bool defaultValue) {
    const char* v = (name && *name) ? std::getenv(name) : nullptr;
    if (!v) {
        return defaultValue;
    }
    std::string s;
    for (const char* p = v; *p; ++p) s.push_back(static_cast<char>(::tolower(static_cast<unsigned char>(*p))));
    return s == "1" || s == "true" || s == "yes" || s == "on";
}
