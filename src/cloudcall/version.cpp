//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Version helpers
//==========================================================================================================
#include "cloudcall/version.h"

#include <sstream>

namespace cloudcall {

VersionInfo getVersion() {
    return VersionInfo{0, 3, 0};
}

std::string getVersionString() {
    const auto v = getVersion();
    std::ostringstream oss;
    oss << v.major << "." << v.minor << "." << v.patch;
    return oss.str();
}

std::string DefaultUserAgent() {
    return "cloudcall/" + getVersionString();
}

} // namespace cloudcall
