//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Cross-platform helpers to read environment variables safely.
//==========================================================================================================
#pragma once
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <optional>
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
// GetEnvUint64
// Purpose: Reads an unsigned integer environment variable.
// Returns:
//   The parsed value, or std::nullopt when unset, empty or not a non-negative integer.
//==========================================================================================================
inline std::optional<uint64_t> GetEnvUint64(const char* name) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty() || raw.front() == '-') {
        return std::nullopt;
    }
    try {
        std::size_t used = 0;
        unsigned long long v = std::stoull(raw, &used);
        if (used != raw.size()) {
            return std::nullopt;
        }
        return static_cast<uint64_t>(v);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}
