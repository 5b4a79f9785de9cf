//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ClientCreator.h
// Purpose: Factory that resolves endpoints, signers and codecs and builds bound clients
//==========================================================================================================

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/any_io_executor.hpp>

#include "cloudcall/BaseClient.h"
#include "cloudcall/ClientClass.h"
#include "cloudcall/EndpointResolver.h"
#include "cloudcall/config/ClientConfig.h"
#include "cloudcall/config/ScopedConfig.h"
#include "cloudcall/events/EventEmitter.h"
#include "cloudcall/model/ServiceModel.h"
#include "cloudcall/protocol/Parser.h"
#include "cloudcall/signing/RequestSigner.h"
#include "cloudcall/version.h"

namespace cloudcall {

// Unique id of the built-in S3 virtual-host rewrite on BeforeCall.
inline constexpr const char* kFixS3HostHandlerId = "fix-s3-host";

//==========================================================================================================
// ConfigInjectionContext
// Purpose: What a service-specific config injector may read and amend before the merged config is built.
//==========================================================================================================
struct ConfigInjectionContext {
    config::ClientConfigOptions& kwargs;
    const ResolvedEndpoint& endpoint;
    const config::ScopedConfig& scopedConfig;
    const std::optional<config::ClientConfig>& clientConfig;
};

using ConfigInjector = std::function<void(ConfigInjectionContext& ctx)>;

//==========================================================================================================
// CreateClientOptions
// Fields:
//   region: Client region; falls back to the scoped config "region" key.
//   endpointUrl: Explicit URL override (also disables the S3 host rewrite).
//   scopedConfig: Profile section; loaded from the environment when absent.
//   clientConfig: Explicit caller config.
//==========================================================================================================
struct CreateClientOptions {
    std::optional<std::string> region;
    bool isSecure{true};
    std::optional<std::string> endpointUrl;
    bool verify{true};
    std::optional<signing::Credentials> credentials;
    std::optional<config::ScopedConfig> scopedConfig;
    std::optional<config::ClientConfig> clientConfig;
};

class ClientCreator {
public:
    ClientCreator(boost::asio::any_io_executor executor,
                  std::shared_ptr<model::IServiceModelLoader> loader,
                  std::shared_ptr<IEndpointResolver> endpointResolver,
                  std::string userAgent = DefaultUserAgent(),
                  std::shared_ptr<events::EventEmitter> eventEmitter = nullptr,
                  protocol::ParserFactory parserFactory = protocol::CreateParser);
    ~ClientCreator();
    ClientCreator(const ClientCreator&) = delete;
    ClientCreator& operator=(const ClientCreator&) = delete;

    //==========================================================================================================
    // CreateClient
    // Purpose: Loads the service description, gets or creates its class and binds a new client.
    // Throws:
    //   errors::ModelLoadError, errors::NoRegionError, errors::ConfigValidationError,
    //   errors::UnknownProtocolError.
    //==========================================================================================================
    std::shared_ptr<BaseClient> CreateClient(const std::string& serviceName, CreateClientOptions options = {});

    //==========================================================================================================
    // GetClientArgs
    // Purpose: Everything a client needs. The returned emitter is a copy of this creator's emitter.
    // Args:
    //   serviceModel: Loaded service description.
    //   region: Client region (may be absent when endpointUrl is set).
    //   isSecure: https when true.
    //   endpointUrl: Explicit URL override.
    //   verify: TLS peer verification.
    //   credentials: Signing credentials; unsigned when absent.
    //   scopedConfig: Profile section.
    //   clientConfig: Explicit caller config.
    //   resolver: Endpoint resolution.
    //==========================================================================================================
    ClientArgs GetClientArgs(std::shared_ptr<const model::ServiceModel> serviceModel,
                             const std::optional<std::string>& region,
                             bool isSecure,
                             const std::optional<std::string>& endpointUrl,
                             bool verify,
                             const std::optional<signing::Credentials>& credentials,
                             const config::ScopedConfig& scopedConfig,
                             const std::optional<config::ClientConfig>& clientConfig,
                             const IEndpointResolver& resolver);

    // Cached per service name. CreatingClientClass fires once, when the class is first built.
    std::shared_ptr<const ClientClass> CreateClientClass(const std::string& serviceName,
                                                         const model::ServiceModel& serviceModel);

    // Replaces any injector registered for the service.
    void RegisterConfigInjector(const std::string& serviceName, ConfigInjector injector);
    void RegisterSigningAlgorithm(const std::string& signatureVersion,
                                  std::shared_ptr<const signing::ISigningAlgorithm> algorithm);

    const std::shared_ptr<events::EventEmitter>& GetEventEmitter() const;
    const std::string& UserAgent() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// IsDnsCompatibleBucketName
// Purpose: True when the bucket can be used as a DNS label (3-63 chars, lowercase, digits, '-', '.',
//          no "..", not an IPv4 address, starts and ends alphanumeric).
//==========================================================================================================
bool IsDnsCompatibleBucketName(const std::string& bucket);

} // namespace cloudcall
