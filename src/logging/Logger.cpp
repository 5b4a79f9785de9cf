//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger static state; the starting level is taken from CLOUDCALL_LOG_LEVEL (INFO when unset).
//==========================================================================================================

#include "logging/Logger.h"

namespace {
LogLevel initialLogLevel() {
    const std::string lvl = GetEnvOrDefault("CLOUDCALL_LOG_LEVEL", "");
    return lvl.empty() ? LogLevel::LOG_INFO_LEVEL : Logger::levelFromString(lvl);
}
}

LogLevel Logger::sLogLevel = initialLogLevel();
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
