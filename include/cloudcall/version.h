//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Library version and the default user agent derived from it
//==========================================================================================================
#pragma once

#include <string>

namespace cloudcall {

struct VersionInfo {
    int major;
    int minor;
    int patch;
};

VersionInfo getVersion();

// "MAJOR.MINOR.PATCH"
std::string getVersionString();

//==========================================================================================================
// DefaultUserAgent
// Purpose: User agent sent when the client config does not replace it.
// Returns:
//   "cloudcall/MAJOR.MINOR.PATCH"
//==========================================================================================================
std::string DefaultUserAgent();

} // namespace cloudcall
