//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ClientConfig.cpp
// Purpose: ClientConfig construction and merge
//==========================================================================================================

#include "cloudcall/config/ClientConfig.h"

namespace cloudcall {
namespace config {

namespace {

template <typename T>
void overlay(std::optional<T>& dst, const std::optional<T>& src) {
    if (src.has_value()) dst = src;
}

} // namespace

ClientConfig::ClientConfig()
    : connectorArgs_(ValidateConnectorArgs(std::nullopt)) {}

ClientConfig::ClientConfig(ClientConfigOptions options)
    : options_(std::move(options)),
      connectorArgs_(ValidateConnectorArgs(options_.connectorArgs)) {}

ClientConfig ClientConfig::Merge(const ClientConfig& other) const {
    ClientConfigOptions merged = options_;
    const ClientConfigOptions& o = other.options_;
    overlay(merged.regionName, o.regionName);
    overlay(merged.signatureVersion, o.signatureVersion);
    overlay(merged.userAgent, o.userAgent);
    overlay(merged.userAgentExtra, o.userAgentExtra);
    overlay(merged.connectTimeout, o.connectTimeout);
    overlay(merged.readTimeout, o.readTimeout);
    overlay(merged.parameterValidation, o.parameterValidation);
    overlay(merged.s3, o.s3);
    overlay(merged.connectorArgs, o.connectorArgs);
    return ClientConfig(std::move(merged));
}

} // namespace config
} // namespace cloudcall
