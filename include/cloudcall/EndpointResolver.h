//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EndpointResolver.h
// Purpose: Endpoint URL and signing parameter resolution
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "cloudcall/model/ServiceModel.h"

namespace cloudcall {

struct ResolvedEndpoint {
    std::string region;
    std::string endpointUrl;
    std::string signingRegion;
    std::string signingName;
    std::string signatureVersion;
};

class IEndpointResolver {
public:
    virtual ~IEndpointResolver() = default;

    //==========================================================================================================
    // Resolve
    // Args:
    //   service: Service description (endpoint prefix, signing name, signature version).
    //   region: Client region, may be absent when endpointUrl is given.
    //   endpointUrl: Explicit URL override.
    //   isSecure: https when true.
    // Throws:
    //   errors::NoRegionError when neither region nor endpointUrl is given.
    //==========================================================================================================
    virtual ResolvedEndpoint Resolve(const model::ServiceModel& service,
                                     const std::optional<std::string>& region,
                                     const std::optional<std::string>& endpointUrl,
                                     bool isSecure) const = 0;
};

//==========================================================================================================
// TemplateEndpointResolver
// Purpose: {scheme}://{endpointPrefix}.{region}.{dnsSuffix}, with the explicit URL taking precedence.
//==========================================================================================================
class TemplateEndpointResolver : public IEndpointResolver {
public:
    explicit TemplateEndpointResolver(std::string dnsSuffix = "amazonaws.com",
                                      std::string defaultSigningRegion = "us-east-1");

    ResolvedEndpoint Resolve(const model::ServiceModel& service,
                             const std::optional<std::string>& region,
                             const std::optional<std::string>& endpointUrl,
                             bool isSecure) const override;

private:
    std::string dnsSuffix_;
    std::string defaultSigningRegion_;
};

} // namespace cloudcall
