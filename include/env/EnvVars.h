//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read engine configuration from environment variables.
//==========================================================================================================
#pragma once
#include <cctype>
#include <chrono>
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

// True for "1", "true", "yes", "on" in any case.
inline bool IsTruthy(const std::string& value) {
    std::string s;
    s.reserve(value.size());
    for (char c : value) s.push_back(static_cast<char>(::tolower(static_cast<unsigned char>(c))));
    return s == "1" || s == "true" || s == "yes" || s == "on";
}

//==========================================================================================================
// GetEnvMillis
// Purpose: Reads a non-negative millisecond count from the environment.
// Args:
//   name: Environment variable name.
// Returns:
//   Parsed duration, or std::nullopt when unset or not a valid unsigned integer.
//==========================================================================================================
inline std::optional<std::chrono::milliseconds> GetEnvMillis(const char* name) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty()) {
        return std::nullopt;
    }
    for (char c : raw) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }
    try {
        return std::chrono::milliseconds(static_cast<long long>(std::stoull(raw)));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}
