//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Parser.cpp
// Purpose: JSON response parsers with error-code extraction
//==========================================================================================================

#include "cloudcall/protocol/Parser.h"

#include <stdexcept>

#include "cloudcall/errors/Errors.h"
#include "cloudcall/util/Naming.h"
#include "logging/Logger.h"

namespace cloudcall {
namespace protocol {

namespace {

const std::string* findHeader(const HttpResponse& response, const std::string& lowerName) {
    for (const auto& [k, v] : response.headers) {
        if (util::ToLower(k) == lowerName) return &v;
    }
    return nullptr;
}

// "aws.protocoltests#FooError:http://..." -> "FooError"
std::string sanitizeErrorCode(std::string code) {
    std::size_t colon = code.find(':');
    if (colon != std::string::npos) code = code.substr(0, colon);
    std::size_t hash = code.rfind('#');
    if (hash != std::string::npos) code = code.substr(hash + 1);
    return code;
}

class JsonResponseParser : public IResponseParser {
public:
    explicit JsonResponseParser(bool restStyle) : restStyle_(restStyle) {}

    JSONValue Parse(const HttpResponse& response, const model::OperationModel& op) const override {
        const bool isError = response.statusCode >= 300;
        JSONValue parsed(JSONValue::Object{});
        JSONValue body;
        bool bodyOk = true;
        if (!response.body.empty()) {
            try {
                body = ParseJSON(response.body);
            } catch (const std::runtime_error& e) {
                if (!isError) {
                    throw errors::ResponseParserError(op.name + ": " + e.what());
                }
                LOG_DEBUG("Error response body for {} is not JSON: {}", op.name, e.what());
                bodyOk = false;
            }
        }

        if (isError) {
            SetMember(parsed, "Error", parseError(response, body, bodyOk));
        } else {
            if (body.IsObject()) {
                parsed = body;
            }
            if (restStyle_) {
                copyHeaderMembers(response, op, parsed);
            }
        }
        SetMember(parsed, "ResponseMetadata", responseMetadata(response));
        return parsed;
    }

private:
    bool restStyle_;

    static JSONValue parseError(const HttpResponse& response, const JSONValue& body, bool bodyOk) {
        std::string code;
        std::string message;
        if (bodyOk) {
            if (auto t = GetString(body, "__type")) code = *t;
            else if (auto c = GetString(body, "code")) code = *c;
            if (auto m = GetString(body, "message")) message = *m;
            else if (auto m2 = GetString(body, "Message")) message = *m2;
        } else {
            message = response.body;
        }
        if (const std::string* h = findHeader(response, "x-amzn-errortype")) {
            code = *h;
        }
        code = code.empty() ? std::to_string(response.statusCode) : sanitizeErrorCode(code);

        JSONValue err(JSONValue::Object{});
        SetMember(err, "Code", JSONValue(code));
        SetMember(err, "Message", JSONValue(message));
        return err;
    }

    static JSONValue responseMetadata(const HttpResponse& response) {
        JSONValue meta(JSONValue::Object{});
        JSONValue headers(JSONValue::Object{});
        for (const auto& [k, v] : response.headers) {
            SetMember(headers, util::ToLower(k), JSONValue(v));
        }
        SetMember(meta, "HTTPStatusCode", JSONValue(static_cast<int64_t>(response.statusCode)));
        SetMember(meta, "HTTPHeaders", headers);
        if (const std::string* id = findHeader(response, "x-amzn-requestid")) {
            SetMember(meta, "RequestId", JSONValue(*id));
        } else if (const std::string* id2 = findHeader(response, "x-amz-request-id")) {
            SetMember(meta, "RequestId", JSONValue(*id2));
        }
        SetMember(meta, "RetryAttempts", JSONValue(static_cast<int64_t>(0)));
        return meta;
    }

    static void copyHeaderMembers(const HttpResponse& response, const model::OperationModel& op, JSONValue& parsed) {
        for (const auto& [name, member] : op.output.members) {
            if (member.location != "header") continue;
            const std::string wire = util::ToLower(member.locationName.empty() ? name : member.locationName);
            const std::string* value = findHeader(response, wire);
            if (!value) continue;
            if (member.type == "integer" || member.type == "long") {
                try {
                    SetMember(parsed, name, JSONValue(static_cast<int64_t>(std::stoll(*value))));
                } catch (const std::exception&) {
                    SetMember(parsed, name, JSONValue(*value));
                }
            } else if (member.type == "boolean") {
                SetMember(parsed, name, JSONValue(util::ToLower(*value) == "true"));
            } else {
                SetMember(parsed, name, JSONValue(*value));
            }
        }
    }
};

} // namespace

std::shared_ptr<IResponseParser> CreateParser(const std::string& protocol) {
    if (protocol == "json") {
        return std::make_shared<JsonResponseParser>(false);
    }
    if (protocol == "rest-json") {
        return std::make_shared<JsonResponseParser>(true);
    }
    throw errors::UnknownProtocolError(protocol);
}

} // namespace protocol
} // namespace cloudcall
