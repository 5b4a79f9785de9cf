//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Parser.h
// Purpose: Response parsing for the json and rest-json protocol families
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <string>

#include "cloudcall/JSONValue.h"
#include "cloudcall/Request.h"
#include "cloudcall/model/ServiceModel.h"

namespace cloudcall {
namespace protocol {

//==========================================================================================================
// IResponseParser
// Purpose: Turns a raw HTTP response into the parsed body returned to callers.
//          Every result carries ResponseMetadata { HTTPStatusCode, HTTPHeaders, RequestId }.
//          Status >= 300 additionally yields Error { Code, Message }.
//==========================================================================================================
class IResponseParser {
public:
    virtual ~IResponseParser() = default;

    // Throws errors::ResponseParserError when a success body is not valid JSON.
    virtual JSONValue Parse(const HttpResponse& response, const model::OperationModel& op) const = 0;
};

// Throws errors::UnknownProtocolError for protocols other than "json" and "rest-json".
std::shared_ptr<IResponseParser> CreateParser(const std::string& protocol);

using ParserFactory = std::function<std::shared_ptr<IResponseParser>(const std::string& protocol)>;

} // namespace protocol
} // namespace cloudcall
