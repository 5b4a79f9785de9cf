//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ScopedConfig.h
// Purpose: Profile-scoped configuration loaded from a JSON config file
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "cloudcall/JSONValue.h"

namespace cloudcall {
namespace config {

// One profile section of the config file, e.g. { "region": "eu-west-1", "parameter_validation": "false" }.
using ScopedConfig = JSONValue::Object;

//==========================================================================================================
// LoadScopedConfig
// Purpose: Reads a file shaped { "profiles": { "<name>": { ... } } } and returns the named profile.
// Args:
//   path: Config file path.
//   profile: Profile name.
// Returns:
//   The profile section; empty when the file or profile does not exist.
// Throws:
//   std::runtime_error when the file exists but is not valid JSON.
//==========================================================================================================
ScopedConfig LoadScopedConfig(const std::string& path, const std::string& profile);

//==========================================================================================================
// LoadScopedConfigFromEnv
// Purpose: LoadScopedConfig using CLOUDCALL_CONFIG_FILE and CLOUDCALL_PROFILE (default profile "default").
//          Returns an empty section when CLOUDCALL_CONFIG_FILE is unset.
//==========================================================================================================
ScopedConfig LoadScopedConfigFromEnv();

// String form of a scalar entry: strings as-is, booleans "true"/"false", numbers in decimal.
std::optional<std::string> ScopedValueAsString(const ScopedConfig& scoped, const std::string& key);

// Nested section lookup (e.g. "s3"); nullptr when absent or not an object.
const JSONValue* ScopedSection(const ScopedConfig& scoped, const std::string& key);

} // namespace config
} // namespace cloudcall
