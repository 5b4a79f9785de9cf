//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Request.h
// Purpose: Wire-level request record, per-call context and raw HTTP response
//==========================================================================================================

#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "cloudcall/JSONValue.h"

namespace cloudcall {

namespace config { class ClientConfig; }

//==========================================================================================================
// RequestRecord
// Purpose: Serialized request handed to hooks, the signer and the endpoint.
// Fields:
//   method: HTTP verb.
//   urlPath: Path (with labels substituted), always starting with '/'.
//   queryString: Ordered key/value pairs, encoded by the endpoint.
//   headers: Header map; hooks and the signer may add entries.
//   body: Encoded payload.
//   url: Absolute URL, filled from the endpoint host before the before-call hook.
//==========================================================================================================
struct RequestRecord {
    std::string method{"POST"};
    std::string urlPath{"/"};
    std::vector<std::pair<std::string, std::string>> queryString;
    std::map<std::string, std::string> headers;
    std::string body;
    std::string url;
};

//==========================================================================================================
// RequestContext
// Purpose: Per-call scratch state shared by serialize, hooks and dispatch. Discarded after the call.
//==========================================================================================================
struct RequestContext {
    std::string clientRegion;
    const config::ClientConfig* clientConfig{nullptr};
    bool hasStreamingInput{false};
    JSONValue::Object extras;
};

struct HttpResponse {
    int statusCode{0};
    std::map<std::string, std::string> headers;
    std::string body;
};

// Builds the absolute URL: endpoint host, record path, then the encoded query string.
std::string BuildRequestUrl(const std::string& endpointHost, const RequestRecord& record);

// RFC 3986 percent-encoding. '/' is kept when encodeSlash is false.
std::string PercentEncode(const std::string& s, bool encodeSlash = true);

} // namespace cloudcall
