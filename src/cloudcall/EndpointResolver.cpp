//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EndpointResolver.cpp
// Purpose: Template-based endpoint resolution
//==========================================================================================================

#include "cloudcall/EndpointResolver.h"

#include "cloudcall/errors/Errors.h"
#include "logging/Logger.h"

namespace cloudcall {

TemplateEndpointResolver::TemplateEndpointResolver(std::string dnsSuffix, std::string defaultSigningRegion)
    : dnsSuffix_(std::move(dnsSuffix)), defaultSigningRegion_(std::move(defaultSigningRegion)) {}

ResolvedEndpoint TemplateEndpointResolver::Resolve(const model::ServiceModel& service,
                                                   const std::optional<std::string>& region,
                                                   const std::optional<std::string>& endpointUrl,
                                                   bool isSecure) const {
    const bool hasRegion = region.has_value() && !region->empty();
    if (!hasRegion && !endpointUrl.has_value()) {
        throw errors::NoRegionError(service.ServiceName());
    }
    ResolvedEndpoint out;
    out.region = hasRegion ? *region : std::string();
    out.signingRegion = hasRegion ? *region : defaultSigningRegion_;
    out.signingName = service.SigningName();
    out.signatureVersion = service.Metadata().signatureVersion;
    if (endpointUrl.has_value()) {
        out.endpointUrl = *endpointUrl;
    } else {
        out.endpointUrl = std::string(isSecure ? "https" : "http") + "://" + service.EndpointPrefix() + "." +
                          *region + "." + dnsSuffix_;
    }
    LOG_DEBUG("Resolved {} endpoint: {} (signing region {})", service.ServiceName(), out.endpointUrl,
              out.signingRegion);
    return out;
}

} // namespace cloudcall
