//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionOptions.h
// Purpose: Timeouts and limits of a Session, read from the environment and config strings
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "lspc/ContentFramer.h"

namespace lspc {

//==========================================================================================================
// SessionOptions
// Fields:
//   requestTimeout: Per-call timeout for ordinary requests (0 = unlimited).
//   initializeTimeout: Timeout for the initialize request.
//   shutdownGrace: How long to wait for the shutdown response and for process exit.
//   maxContentLength: Largest accepted frame body in bytes.
//   dispatcherThreads: Worker threads running handlers and listeners.
//==========================================================================================================
struct SessionOptions {
    std::chrono::milliseconds requestTimeout{30000};
    std::chrono::milliseconds initializeTimeout{60000};
    std::chrono::milliseconds shutdownGrace{5000};
    std::size_t maxContentLength{DefaultMaxContentLength};
    std::size_t dispatcherThreads{2};

    //==========================================================================================================
    // FromEnvironment
    // Purpose: Defaults overridden by LSPC_REQUEST_TIMEOUT_MS, LSPC_INITIALIZE_TIMEOUT_MS,
    //          LSPC_SHUTDOWN_GRACE_MS, LSPC_MAX_CONTENT_LENGTH and LSPC_DISPATCHER_THREADS.
    //==========================================================================================================
    static SessionOptions FromEnvironment();
};

//==========================================================================================================
// ParseSessionOptions
// Purpose: Applies "key=value" pairs separated by ';' or whitespace on top of FromEnvironment().
// Keys:
//   request_timeout_ms, initialize_timeout_ms, shutdown_grace_ms, max_content_length, dispatcher_threads
// Notes:
//   Unknown keys and malformed values are ignored with a warning.
//==========================================================================================================
SessionOptions ParseSessionOptions(const std::string& config);

} // namespace lspc
