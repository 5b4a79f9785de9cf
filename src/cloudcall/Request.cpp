//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Request.cpp
// Purpose: URL composition helpers for request records
//==========================================================================================================

#include "cloudcall/Request.h"

#include <sstream>

namespace cloudcall {

std::string PercentEncode(const std::string& s, bool encodeSlash) {
    std::ostringstream oss;
    const char* hex = "0123456789ABCDEF";
    for (std::size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~' || (c == '/' && !encodeSlash)) {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << hex[(c >> 4) & 0xFu] << hex[c & 0xFu];
        }
    }
    return oss.str();
}

std::string BuildRequestUrl(const std::string& endpointHost, const RequestRecord& record) {
    std::string url = endpointHost;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    url += record.urlPath.empty() ? std::string("/") : record.urlPath;
    if (!record.queryString.empty()) {
        url += (url.find('?') == std::string::npos) ? '?' : '&';
        bool first = true;
        for (const auto& [k, v] : record.queryString) {
            if (!first) url += '&';
            first = false;
            url += PercentEncode(k) + "=" + PercentEncode(v);
        }
    }
    return url;
}

} // namespace cloudcall
