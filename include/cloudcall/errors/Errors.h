//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed exception taxonomy and service-error extraction helpers for the cloudcall SDK
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "cloudcall/JSONValue.h"

namespace cloudcall {
namespace errors {

//==========================================================================================================
// CloudCallError
// Purpose: Common base for every error raised by this library.
//==========================================================================================================
class CloudCallError : public std::runtime_error {
public:
    explicit CloudCallError(const std::string& what) : std::runtime_error(what) {}
};

//==========================================================================================================
// ConfigValidationError
// Purpose: Bad connector option name or value type. Raised when a ClientConfig is constructed.
//==========================================================================================================
class ConfigValidationError : public CloudCallError {
public:
    ConfigValidationError(std::string key, std::string expected)
        : CloudCallError(expected.empty() ? "invalid connector_arg:" + key
                                          : key + " value must be " + expected),
          key_(std::move(key)), expected_(std::move(expected)) {}

    const std::string& key() const { return key_; }
    const std::string& expected() const { return expected_; }

private:
    std::string key_;
    std::string expected_;
};

// Scoped config file that exists but could not be parsed.
class ConfigFileError : public CloudCallError {
public:
    ConfigFileError(std::string path, const std::string& message)
        : CloudCallError("Unable to parse config file \"" + path + "\": " + message), path_(std::move(path)) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

//==========================================================================================================
// ParamValidationError
// Purpose: Bad call parameters. Never sent over the wire.
//==========================================================================================================
class ParamValidationError : public CloudCallError {
public:
    explicit ParamValidationError(std::string report)
        : CloudCallError("Parameter validation failed:\n" + report), report_(std::move(report)) {}

    const std::string& report() const { return report_; }

private:
    std::string report_;
};

class UnknownOperationError : public CloudCallError {
public:
    explicit UnknownOperationError(std::string operationName)
        : CloudCallError("Unknown operation: " + operationName), operationName_(std::move(operationName)) {}

    const std::string& operationName() const { return operationName_; }

private:
    std::string operationName_;
};

class OperationNotPageableError : public CloudCallError {
public:
    explicit OperationNotPageableError(std::string operationName)
        : CloudCallError("Operation cannot be paginated: " + operationName), operationName_(std::move(operationName)) {}

    const std::string& operationName() const { return operationName_; }

private:
    std::string operationName_;
};

class PaginationError : public CloudCallError {
public:
    explicit PaginationError(const std::string& message) : CloudCallError("Error during pagination: " + message) {}
};

// Raised when a call is made after the client's transport session was explicitly closed.
class SessionClosedError : public CloudCallError {
public:
    SessionClosedError() : CloudCallError("Transport session is closed") {}
};

class UnknownProtocolError : public CloudCallError {
public:
    explicit UnknownProtocolError(const std::string& protocol)
        : CloudCallError("Unsupported protocol: " + protocol) {}
};

class ModelLoadError : public CloudCallError {
public:
    explicit ModelLoadError(const std::string& message) : CloudCallError("Unable to load service model: " + message) {}
};

// Successful response whose body could not be decoded.
class ResponseParserError : public CloudCallError {
public:
    explicit ResponseParserError(const std::string& message) : CloudCallError("Unable to parse response: " + message) {}
};

// Neither a region nor an endpoint URL was available for endpoint resolution.
class NoRegionError : public CloudCallError {
public:
    explicit NoRegionError(const std::string& serviceName)
        : CloudCallError("You must specify a region for service '" + serviceName + "'") {}
};

// Connection-level failure raised by the HTTP endpoint. The call pipeline never wraps or catches it.
class TransportError : public CloudCallError {
public:
    TransportError(std::string endpointUrl, const std::string& message)
        : CloudCallError("Could not connect to the endpoint URL \"" + endpointUrl + "\": " + message),
          endpointUrl_(std::move(endpointUrl)) {}

    const std::string& endpointUrl() const { return endpointUrl_; }

private:
    std::string endpointUrl_;
};

//==========================================================================================================
// ServiceErrorInfo
// Purpose: Fields extracted from a parsed error body of shape { Error: { Code, Message }, ResponseMetadata }.
//==========================================================================================================
struct ServiceErrorInfo {
    std::string code{"Unknown"};
    std::string message{"Unknown"};
    int httpStatus{0};
    std::optional<std::string> requestId;
};

//==========================================================================================================
// serviceErrorInfoFromParsed
// Purpose: Extracts code/message/status from a parsed response body. Missing pieces keep their defaults.
//==========================================================================================================
inline ServiceErrorInfo serviceErrorInfoFromParsed(const JSONValue& parsed) {
    ServiceErrorInfo info;
    if (const JSONValue* err = FindMember(parsed, "Error")) {
        if (auto c = GetString(*err, "Code")) info.code = *c;
        if (auto m = GetString(*err, "Message")) info.message = *m;
    }
    if (const JSONValue* meta = FindMember(parsed, "ResponseMetadata")) {
        if (const JSONValue* status = FindMember(*meta, "HTTPStatusCode")) {
            if (std::holds_alternative<int64_t>(status->value)) {
                info.httpStatus = static_cast<int>(std::get<int64_t>(status->value));
            }
        }
        info.requestId = GetString(*meta, "RequestId");
    }
    return info;
}

//==========================================================================================================
// ServiceError
// Purpose: Response with HTTP status >= 300. Carries the parsed error body and the operation name.
//==========================================================================================================
class ServiceError : public CloudCallError {
public:
    ServiceError(JSONValue parsed, std::string operationName)
        : ServiceError(serviceErrorInfoFromParsed(parsed), parsed, std::move(operationName)) {}

    const JSONValue& response() const { return response_; }
    const std::string& operationName() const { return operationName_; }
    const ServiceErrorInfo& info() const { return info_; }
    const std::string& code() const { return info_.code; }

private:
    ServiceError(ServiceErrorInfo info, const JSONValue& parsed, std::string operationName)
        : CloudCallError("An error occurred (" + info.code + ") when calling the " + operationName +
                         " operation: " + info.message),
          response_(parsed), operationName_(std::move(operationName)), info_(std::move(info)) {}

    JSONValue response_;
    std::string operationName_;
    ServiceErrorInfo info_;
};

} // namespace errors
} // namespace cloudcall
