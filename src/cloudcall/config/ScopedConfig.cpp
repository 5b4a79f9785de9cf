//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ScopedConfig.cpp
// Purpose: JSON config file loading for profile-scoped settings
//==========================================================================================================

#include "cloudcall/config/ScopedConfig.h"

#include <fstream>
#include <sstream>

#include "cloudcall/errors/Errors.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace cloudcall {
namespace config {

ScopedConfig LoadScopedConfig(const std::string& path, const std::string& profile) {
    std::ifstream in(path);
    if (!in.is_open()) {
        LOG_DEBUG("Config file not found: {}", path);
        return {};
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    JSONValue doc;
    try {
        doc = ParseJSON(buf.str());
    } catch (const std::runtime_error& e) {
        LOG_ERROR("Config file {} is not valid JSON: {}", path, e.what());
        throw errors::ConfigFileError(path, e.what());
    }

    const JSONValue* profiles = FindMember(doc, "profiles");
    if (!profiles) {
        LOG_WARN("Config file {} has no 'profiles' section", path);
        return {};
    }
    const JSONValue* section = FindMember(*profiles, profile);
    if (!section || !section->IsObject()) {
        LOG_DEBUG("Profile '{}' not present in {}", profile, path);
        return {};
    }
    return std::get<JSONValue::Object>(section->value);
}

ScopedConfig LoadScopedConfigFromEnv() {
    const std::string path = GetEnvOrDefault("CLOUDCALL_CONFIG_FILE", "");
    if (path.empty()) {
        return {};
    }
    return LoadScopedConfig(path, GetEnvOrDefault("CLOUDCALL_PROFILE", "default"));
}

std::optional<std::string> ScopedValueAsString(const ScopedConfig& scoped, const std::string& key) {
    auto it = scoped.find(key);
    if (it == scoped.end() || !it->second) {
        return std::nullopt;
    }
    const auto& v = it->second->value;
    if (std::holds_alternative<std::string>(v)) return std::get<std::string>(v);
    if (std::holds_alternative<bool>(v)) return std::string(std::get<bool>(v) ? "true" : "false");
    if (std::holds_alternative<int64_t>(v)) return std::to_string(std::get<int64_t>(v));
    if (std::holds_alternative<double>(v)) return SerializeJSON(*it->second);
    return std::nullopt;
}

const JSONValue* ScopedSection(const ScopedConfig& scoped, const std::string& key) {
    auto it = scoped.find(key);
    if (it == scoped.end() || !it->second || !it->second->IsObject()) {
        return nullptr;
    }
    return it->second.get();
}

} // namespace config
} // namespace cloudcall
