//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConnectorOptions.cpp
// Purpose: Connector option validation against the fixed key/type table
//==========================================================================================================

#include "cloudcall/config/ConnectorOptions.h"

#include "cloudcall/errors/Errors.h"
#include "logging/Logger.h"

namespace cloudcall {
namespace config {

namespace {

template <typename T>
bool holds(const ConnectorArg& v) { return std::holds_alternative<T>(v); }

void validateOne(const std::string& key, const ConnectorArg& value) {
    if (key == ConnectorKeys::UseDnsCache || key == ConnectorKeys::ForceClose) {
        if (!holds<bool>(value)) {
            throw errors::ConfigValidationError(key, "a boolean");
        }
    } else if (key == ConnectorKeys::KeepaliveTimeout) {
        if (!holds<double>(value) && !holds<int64_t>(value)) {
            throw errors::ConfigValidationError(key, "a float/int");
        }
    } else if (key == ConnectorKeys::Limit) {
        if (!holds<int64_t>(value)) {
            throw errors::ConfigValidationError(key, "an int");
        }
    } else if (key == ConnectorKeys::SslContext) {
        if (!holds<std::shared_ptr<boost::asio::ssl::context>>(value) ||
            !std::get<std::shared_ptr<boost::asio::ssl::context>>(value)) {
            throw errors::ConfigValidationError(key, "an SSLContext instance");
        }
    } else {
        throw errors::ConfigValidationError(key, "");
    }
}

} // namespace

ConnectorArgs ValidateConnectorArgs(const std::optional<ConnectorArgs>& args) {
    ConnectorArgs out;
    if (args.has_value()) {
        for (const auto& [key, value] : *args) {
            validateOne(key, value);
        }
        out = *args;
    }
    if (out.find(ConnectorKeys::KeepaliveTimeout) == out.end()) {
        out[ConnectorKeys::KeepaliveTimeout] = kDefaultKeepaliveTimeoutSeconds;
    }
    return out;
}

ConnectorOptions ConnectorOptions::FromArgs(const ConnectorArgs& args) {
    const ConnectorArgs normalized = ValidateConnectorArgs(args);
    ConnectorOptions o;
    for (const auto& [key, value] : normalized) {
        if (key == ConnectorKeys::UseDnsCache) {
            o.useDnsCache = std::get<bool>(value);
        } else if (key == ConnectorKeys::ForceClose) {
            o.forceClose = std::get<bool>(value);
        } else if (key == ConnectorKeys::KeepaliveTimeout) {
            o.keepaliveTimeoutSeconds = holds<double>(value) ? std::get<double>(value)
                                                             : static_cast<double>(std::get<int64_t>(value));
        } else if (key == ConnectorKeys::Limit) {
            o.limit = std::get<int64_t>(value);
        } else if (key == ConnectorKeys::SslContext) {
            o.sslContext = std::get<std::shared_ptr<boost::asio::ssl::context>>(value);
        }
    }
    if (o.limit.has_value() && *o.limit <= 0) {
        LOG_DEBUG("Connector limit {} disables the connection cap", *o.limit);
        o.limit.reset();
    }
    return o;
}

} // namespace config
} // namespace cloudcall
