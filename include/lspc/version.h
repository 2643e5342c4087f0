//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Library version of lspc-cpp
//==========================================================================================================
#pragma once

#include <string>

namespace lspc {

// Semantic version components
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

VersionInfo getVersion();

//==========================================================================================================
// getVersionString
// Purpose: "MAJOR.MINOR.PATCH"; sent as clientInfo.version when InitializeOptions leaves it empty.
//==========================================================================================================
std::string getVersionString();

} // namespace lspc
