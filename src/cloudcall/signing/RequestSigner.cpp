//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestSigner.cpp
// Purpose: Signature-version dispatch
//==========================================================================================================

#include "cloudcall/signing/RequestSigner.h"

#include "logging/Logger.h"

namespace cloudcall {
namespace signing {

RequestSigner::RequestSigner(std::string serviceName,
                             std::string signingRegion,
                             std::string signingName,
                             std::string signatureVersion,
                             std::optional<Credentials> credentials,
                             std::shared_ptr<events::EventEmitter> eventEmitter,
                             SigningAlgorithms algorithms)
    : serviceName_(std::move(serviceName)),
      signingRegion_(std::move(signingRegion)),
      signingName_(std::move(signingName)),
      signatureVersion_(std::move(signatureVersion)),
      credentials_(std::move(credentials)),
      eventEmitter_(std::move(eventEmitter)),
      algorithms_(std::move(algorithms)) {}

bool RequestSigner::Sign(const std::string& operationName, RequestRecord& request) const {
    if (signatureVersion_ == kUnsignedVersion || !credentials_.has_value()) {
        return false;
    }
    auto it = algorithms_.find(signatureVersion_);
    if (it == algorithms_.end() || !it->second) {
        LOG_DEBUG("No signing algorithm for version '{}'; sending {} unsigned", signatureVersion_, operationName);
        return false;
    }
    SigningContext ctx{operationName, serviceName_, signingName_, signingRegion_, *credentials_};
    it->second->AddAuth(request, ctx);
    return true;
}

} // namespace signing
} // namespace cloudcall
