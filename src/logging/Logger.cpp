//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Definitions for Logger static members.
//==========================================================================================================

#include "logging/Logger.h"

// Define static members; the initial level honours LSPC_LOG_LEVEL so tests and tools need no setup call
LogLevel Logger::sLogLevel = Logger::levelFromString(GetEnvOrDefault("LSPC_LOG_LEVEL", "INFO"));
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
