//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestSigner.h
// Purpose: Request signer that delegates to pluggable per-signature-version algorithms
//==========================================================================================================

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>

#include "cloudcall/Request.h"
#include "cloudcall/events/EventEmitter.h"

namespace cloudcall {
namespace signing {

struct Credentials {
    std::string accessKey;
    std::string secretKey;
    std::optional<std::string> sessionToken;
};

//==========================================================================================================
// SigningContext
// Purpose: Everything an algorithm needs besides the request itself.
//==========================================================================================================
struct SigningContext {
    std::string operationName;
    std::string serviceName;
    std::string signingName;
    std::string signingRegion;
    const Credentials& credentials;
};

//==========================================================================================================
// ISigningAlgorithm
// Purpose: Adds authentication material (headers or query parameters) to a request record.
//==========================================================================================================
class ISigningAlgorithm {
public:
    virtual ~ISigningAlgorithm() = default;
    virtual void AddAuth(RequestRecord& request, const SigningContext& context) const = 0;
};

using SigningAlgorithms = std::map<std::string, std::shared_ptr<const ISigningAlgorithm>>;

inline constexpr const char* kUnsignedVersion = "none";

//==========================================================================================================
// RequestSigner
// Purpose: Bound to one client. Signs requests with the algorithm registered for its signature version.
//          Requests stay unsigned when the version is "none", no credentials are available, or no
//          algorithm is registered for the version.
//==========================================================================================================
class RequestSigner {
public:
    RequestSigner(std::string serviceName,
                  std::string signingRegion,
                  std::string signingName,
                  std::string signatureVersion,
                  std::optional<Credentials> credentials,
                  std::shared_ptr<events::EventEmitter> eventEmitter,
                  SigningAlgorithms algorithms = {});

    const std::string& ServiceName() const { return serviceName_; }
    const std::string& SigningRegion() const { return signingRegion_; }
    const std::string& SigningName() const { return signingName_; }
    const std::string& SignatureVersion() const { return signatureVersion_; }
    const std::optional<Credentials>& GetCredentials() const { return credentials_; }
    const std::shared_ptr<events::EventEmitter>& GetEventEmitter() const { return eventEmitter_; }

    // Returns true when authentication was added.
    bool Sign(const std::string& operationName, RequestRecord& request) const;

private:
    std::string serviceName_;
    std::string signingRegion_;
    std::string signingName_;
    std::string signatureVersion_;
    std::optional<Credentials> credentials_;
    std::shared_ptr<events::EventEmitter> eventEmitter_;
    SigningAlgorithms algorithms_;
};

} // namespace signing
} // namespace cloudcall
