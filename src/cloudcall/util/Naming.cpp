//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Naming.cpp
// Purpose: Name conversion helpers
//==========================================================================================================

#include "cloudcall/util/Naming.h"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <regex>
#include <unordered_map>

namespace cloudcall {
namespace util {

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string XformName(const std::string& name, char sep) {
    if (name.find(sep) != std::string::npos) {
        return name;
    }
    static std::mutex cacheMutex;
    static std::unordered_map<std::string, std::string> cache;
    const std::string key = name + sep;
    {
        std::lock_guard<std::mutex> lk(cacheMutex);
        auto it = cache.find(key);
        if (it != cache.end()) return it->second;
    }

    static const std::regex firstCap("(.)([A-Z][a-z]+)");
    static const std::regex endCap("([a-z0-9])([A-Z])");
    const std::string replacement = std::string("$1") + sep + "$2";
    std::string out = std::regex_replace(name, firstCap, replacement);
    out = ToLower(std::regex_replace(out, endCap, replacement));

    std::lock_guard<std::mutex> lk(cacheMutex);
    cache.emplace(key, out);
    return out;
}

std::string ServiceClassName(const model::ServiceMetadata& metadata) {
    std::string name = metadata.serviceAbbreviation.empty() ? metadata.serviceFullName
                                                            : metadata.serviceAbbreviation;
    if (name.empty()) {
        name = metadata.endpointPrefix;
    }
    for (const char* prefix : {"Amazon", "AWS"}) {
        std::string p(prefix);
        std::size_t pos;
        while ((pos = name.find(p)) != std::string::npos) {
            name.erase(pos, p.size());
        }
    }
    std::string out;
    for (char c : name) {
        if (std::isalnum(static_cast<unsigned char>(c))) out += c;
    }
    return out;
}

} // namespace util
} // namespace cloudcall
