//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionOptions.cpp
// Purpose: Environment and config-string parsing for SessionOptions
//==========================================================================================================

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "lspc/SessionOptions.h"

namespace lspc {

namespace {
std::optional<uint64_t> parseUint(const std::string& s) {
    if (s.empty() || s.front() == '-' || s.front() == '+') {
        return std::nullopt;
    }
    try {
        std::size_t used = 0;
        unsigned long long v = std::stoull(s, &used);
        if (used != s.size()) {
            return std::nullopt;
        }
        return static_cast<uint64_t>(v);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// Returns false when the key is unknown
bool applyOption(SessionOptions& opts, const std::string& key, uint64_t v) {
    if (key == "request_timeout_ms") {
        opts.requestTimeout = std::chrono::milliseconds(v);
    } else if (key == "initialize_timeout_ms") {
        opts.initializeTimeout = std::chrono::milliseconds(v);
    } else if (key == "shutdown_grace_ms") {
        opts.shutdownGrace = std::chrono::milliseconds(v);
    } else if (key == "max_content_length") {
        if (v == 0) { v = 1; }
        opts.maxContentLength = static_cast<std::size_t>(v);
    } else if (key == "dispatcher_threads") {
        if (v == 0) { v = 1; }
        opts.dispatcherThreads = static_cast<std::size_t>(v);
    } else {
        return false;
    }
    return true;
}

void applyEnv(SessionOptions& opts, const char* name, const char* key) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty()) {
        return;
    }
    auto v = GetEnvUint64(name);
    if (!v.has_value()) {
        LOG_WARN("Ignoring malformed {}={}", name, raw);
        return;
    }
    applyOption(opts, key, v.value());
}
} // namespace

SessionOptions SessionOptions::FromEnvironment() {
    SessionOptions opts;
    applyEnv(opts, "LSPC_REQUEST_TIMEOUT_MS", "request_timeout_ms");
    applyEnv(opts, "LSPC_INITIALIZE_TIMEOUT_MS", "initialize_timeout_ms");
    applyEnv(opts, "LSPC_SHUTDOWN_GRACE_MS", "shutdown_grace_ms");
    applyEnv(opts, "LSPC_MAX_CONTENT_LENGTH", "max_content_length");
    applyEnv(opts, "LSPC_DISPATCHER_THREADS", "dispatcher_threads");
    return opts;
}

SessionOptions ParseSessionOptions(const std::string& config) {
    SessionOptions opts = SessionOptions::FromEnvironment();
    // Parse key=value pairs separated by ';' or whitespace
    std::string token;
    for (std::size_t i = 0; i < config.size();) {
        // Skip separators and spaces
        while (i < config.size() && (config[i] == ';' || config[i] == ' ' || config[i] == '\t')) ++i;
        if (i >= config.size()) break;
        std::size_t start = i;
        while (i < config.size() && config[i] != ';' && config[i] != ' ' && config[i] != '\t') ++i;
        token = config.substr(start, i - start);
        auto eq = token.find('=');
        if (eq == std::string::npos) {
            LOG_WARN("SessionOptions: ignoring token without '=': {}", token);
            continue;
        }
        auto key = token.substr(0, eq);
        auto val = token.substr(eq + 1);
        auto v = parseUint(val);
        if (!v.has_value()) {
            LOG_WARN("SessionOptions: ignoring malformed value {}={}", key, val);
            continue;
        }
        if (!applyOption(opts, key, v.value())) {
            LOG_WARN("SessionOptions: ignoring unknown key {}", key);
        }
    }
    return opts;
}

} // namespace lspc
