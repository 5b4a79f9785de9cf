//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ClientConfig.h
// Purpose: Immutable client configuration with explicit-field tracking and merge semantics
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "cloudcall/config/ConnectorOptions.h"

namespace cloudcall {
namespace config {

//==========================================================================================================
// S3Options
// Purpose: Storage-service addressing knobs. Fields left unset defer to the scoped config file.
// Fields:
//   addressingStyle: "auto" | "virtual" | "path".
//   useAccelerateEndpoint: Route requests through the accelerate endpoint.
//==========================================================================================================
struct S3Options {
    std::optional<std::string> addressingStyle;
    std::optional<bool> useAccelerateEndpoint;
};

//==========================================================================================================
// ClientConfigOptions
// Purpose: Constructor arguments for ClientConfig. Only fields that are set count as user-provided.
// Fields:
//   regionName / signatureVersion: Resolved by the client factory when not given.
//   userAgent: Replaces the SDK default user agent.
//   userAgentExtra: Appended to the user agent after a single space.
//   connectTimeout / readTimeout: Seconds (default 60 each).
//   parameterValidation: Input validation before serialization (default true).
//   s3: Storage-service options.
//   connectorArgs: Transport tuning options, validated by ValidateConnectorArgs.
//==========================================================================================================
struct ClientConfigOptions {
    std::optional<std::string> regionName;
    std::optional<std::string> signatureVersion;
    std::optional<std::string> userAgent;
    std::optional<std::string> userAgentExtra;
    std::optional<double> connectTimeout;
    std::optional<double> readTimeout;
    std::optional<bool> parameterValidation;
    std::optional<S3Options> s3;
    std::optional<ConnectorArgs> connectorArgs;
};

inline constexpr double kDefaultConnectTimeoutSeconds = 60.0;
inline constexpr double kDefaultReadTimeoutSeconds = 60.0;

//==========================================================================================================
// ClientConfig
// Purpose: Validated, immutable configuration value held by a bound client.
//==========================================================================================================
class ClientConfig {
public:
    ClientConfig();

    //==========================================================================================================
    // Constructs and validates a config.
    // Args:
    //   options: User-provided fields.
    // Throws:
    //   errors::ConfigValidationError when connectorArgs contains an unknown key or wrong value type.
    //==========================================================================================================
    explicit ClientConfig(ClientConfigOptions options);

    const std::optional<std::string>& RegionName() const { return options_.regionName; }
    const std::optional<std::string>& SignatureVersion() const { return options_.signatureVersion; }
    const std::optional<std::string>& UserAgent() const { return options_.userAgent; }
    const std::optional<std::string>& UserAgentExtra() const { return options_.userAgentExtra; }
    double ConnectTimeout() const { return options_.connectTimeout.value_or(kDefaultConnectTimeoutSeconds); }
    double ReadTimeout() const { return options_.readTimeout.value_or(kDefaultReadTimeoutSeconds); }
    bool ParameterValidation() const { return options_.parameterValidation.value_or(true); }
    const std::optional<S3Options>& S3() const { return options_.s3; }

    // Normalized connector options (keep-alive default filled).
    const ConnectorArgs& GetConnectorArgs() const { return connectorArgs_; }
    ConnectorOptions GetConnectorOptions() const { return ConnectorOptions::FromArgs(connectorArgs_); }

    // Fields exactly as the caller supplied them.
    const ClientConfigOptions& UserProvidedOptions() const { return options_; }

    //==========================================================================================================
    // Returns a new config where every field explicitly set on other overrides this config's value.
    // Connector options are carried from this config unless other set them explicitly.
    //==========================================================================================================
    ClientConfig Merge(const ClientConfig& other) const;

private:
    ClientConfigOptions options_;
    ConnectorArgs connectorArgs_;
};

} // namespace config
} // namespace cloudcall
