//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ClientCreator.cpp
// Purpose: Client argument assembly, class generation and the built-in S3 handlers
//==========================================================================================================

#include "cloudcall/ClientCreator.h"

#include <cctype>
#include <mutex>
#include <regex>

#include "cloudcall/errors/Errors.h"
#include "cloudcall/http/HttpEndpoint.hpp"
#include "cloudcall/http/HttpSession.hpp"
#include "cloudcall/protocol/Serializer.h"
#include "cloudcall/util/Naming.h"
#include "logging/Logger.h"

namespace cloudcall {

namespace {

constexpr const char* kS3ServiceName = "s3";
constexpr const char* kAccelerateHost = "s3-accelerate.amazonaws.com";

std::optional<bool> boolFromJson(const JSONValue& v) {
    if (std::holds_alternative<bool>(v.value)) {
        return std::get<bool>(v.value);
    }
    if (v.IsString()) {
        const std::string lower = util::ToLower(std::get<std::string>(v.value));
        if (lower == "true") return true;
        if (lower == "false") return false;
    }
    return std::nullopt;
}

// Scoped "s3" section first, then the explicit client config on top.
void injectS3Configuration(ConfigInjectionContext& ctx) {
    config::S3Options merged;
    bool any = false;
    if (const JSONValue* section = config::ScopedSection(ctx.scopedConfig, kS3ServiceName)) {
        if (auto style = GetString(*section, "addressing_style")) {
            merged.addressingStyle = *style;
            any = true;
        }
        if (const JSONValue* accel = FindMember(*section, "use_accelerate_endpoint")) {
            if (auto b = boolFromJson(*accel)) {
                merged.useAccelerateEndpoint = *b;
                any = true;
            }
        }
    }
    if (ctx.clientConfig.has_value() && ctx.clientConfig->S3().has_value()) {
        const config::S3Options& explicitS3 = *ctx.clientConfig->S3();
        if (explicitS3.addressingStyle.has_value()) {
            merged.addressingStyle = explicitS3.addressingStyle;
            any = true;
        }
        if (explicitS3.useAccelerateEndpoint.has_value()) {
            merged.useAccelerateEndpoint = explicitS3.useAccelerateEndpoint;
            any = true;
        }
    }
    if (any) {
        ctx.kwargs.s3 = merged;
    }
}

struct SplitUrl {
    std::string scheme;
    std::string authority;
    std::string path;
    std::string query;
};

std::optional<SplitUrl> splitUrl(const std::string& url) {
    const auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        return std::nullopt;
    }
    SplitUrl out;
    out.scheme = url.substr(0, schemeEnd);
    const auto rest = schemeEnd + 3;
    const auto pathStart = url.find_first_of("/?", rest);
    out.authority = url.substr(rest, pathStart == std::string::npos ? std::string::npos : pathStart - rest);
    if (pathStart == std::string::npos) {
        out.path = "/";
        return out;
    }
    const auto queryStart = url.find('?', pathStart);
    out.path = url.substr(pathStart, queryStart == std::string::npos ? std::string::npos : queryStart - pathStart);
    if (out.path.empty()) {
        out.path = "/";
    }
    if (queryStart != std::string::npos) {
        out.query = url.substr(queryStart);
    }
    return out;
}

// Moves the bucket from the path into the host name.
void fixS3Host(events::BeforeCallEvent& event) {
    const config::ClientConfig* cfg = event.context.clientConfig;
    std::optional<config::S3Options> s3;
    if (cfg) {
        s3 = cfg->S3();
    }
    const std::string style = s3.has_value() ? s3->addressingStyle.value_or("auto") : "auto";
    const bool accelerate = s3.has_value() && s3->useAccelerateEndpoint.value_or(false);
    if (style == "path" && !accelerate) {
        return;
    }

    auto parts = splitUrl(event.request.url);
    if (!parts.has_value() || parts->path.size() < 2) {
        return;
    }
    const auto bucketEnd = parts->path.find('/', 1);
    const std::string bucket =
        parts->path.substr(1, bucketEnd == std::string::npos ? std::string::npos : bucketEnd - 1);
    if (!IsDnsCompatibleBucketName(bucket)) {
        LOG_DEBUG("Not changing URI, bucket is not DNS compatible: {}", bucket);
        return;
    }
    if (util::ToLower(parts->scheme) == "https" && bucket.find('.') != std::string::npos && !accelerate) {
        // Dotted bucket names break wildcard certificate matching.
        return;
    }

    std::string remainder = bucketEnd == std::string::npos ? "/" : parts->path.substr(bucketEnd);
    const std::string host = accelerate ? kAccelerateHost : parts->authority;
    const std::string newUrl = parts->scheme + "://" + bucket + "." + host + remainder + parts->query;
    LOG_DEBUG("URI updated to: {}", newUrl);
    event.request.url = newUrl;
    event.request.urlPath = remainder;
}

} // namespace

bool IsDnsCompatibleBucketName(const std::string& bucket) {
    static const std::regex label("^[a-z0-9][a-z0-9.\\-]*[a-z0-9]$");
    static const std::regex ipv4("^\\d+\\.\\d+\\.\\d+\\.\\d+$");
    if (bucket.size() < 3 || bucket.size() > 63) {
        return false;
    }
    if (bucket.find("..") != std::string::npos) {
        return false;
    }
    return std::regex_match(bucket, label) && !std::regex_match(bucket, ipv4);
}

class ClientCreator::Impl {
public:
    boost::asio::any_io_executor executor;
    std::shared_ptr<model::IServiceModelLoader> loader;
    std::shared_ptr<IEndpointResolver> resolver;
    std::string userAgent;
    std::shared_ptr<events::EventEmitter> emitter;
    protocol::ParserFactory parserFactory;

    std::map<std::string, ConfigInjector> injectors;
    signing::SigningAlgorithms signingAlgorithms;

    std::mutex classMutex;
    std::map<std::string, std::shared_ptr<const ClientClass>> classCache;

    static bool resolveParameterValidation(const config::ScopedConfig& scoped,
                                           const std::optional<config::ClientConfig>& clientConfig) {
        if (clientConfig.has_value() && !clientConfig->ParameterValidation()) {
            return false;
        }
        if (auto raw = config::ScopedValueAsString(scoped, "parameter_validation")) {
            if (util::ToLower(*raw) == "false") {
                return false;
            }
        }
        return true;
    }

    std::string composeUserAgent(const std::optional<config::ClientConfig>& clientConfig) const {
        std::string ua = userAgent;
        if (clientConfig.has_value()) {
            if (clientConfig->UserAgent().has_value()) {
                ua = *clientConfig->UserAgent();
            }
            if (clientConfig->UserAgentExtra().has_value()) {
                ua += " " + *clientConfig->UserAgentExtra();
            }
        }
        return ua;
    }
};

ClientCreator::ClientCreator(boost::asio::any_io_executor executor,
                             std::shared_ptr<model::IServiceModelLoader> loader,
                             std::shared_ptr<IEndpointResolver> endpointResolver,
                             std::string userAgent,
                             std::shared_ptr<events::EventEmitter> eventEmitter,
                             protocol::ParserFactory parserFactory)
    : pImpl(std::make_unique<Impl>()) {
    pImpl->executor = std::move(executor);
    pImpl->loader = std::move(loader);
    pImpl->resolver = endpointResolver ? std::move(endpointResolver) : std::make_shared<TemplateEndpointResolver>();
    pImpl->userAgent = std::move(userAgent);
    pImpl->emitter = eventEmitter ? std::move(eventEmitter) : std::make_shared<events::EventEmitter>();
    pImpl->parserFactory = parserFactory ? std::move(parserFactory) : protocol::ParserFactory(protocol::CreateParser);

    pImpl->injectors[kS3ServiceName] = injectS3Configuration;
    pImpl->emitter->OnBeforeCall(kS3ServiceName, fixS3Host, std::string(kFixS3HostHandlerId));
}

ClientCreator::~ClientCreator() = default;

std::shared_ptr<BaseClient> ClientCreator::CreateClient(const std::string& serviceName, CreateClientOptions options) {
    FUNC_SCOPE();
    if (!pImpl->loader) {
        throw errors::ModelLoadError("No service model loader configured");
    }
    std::shared_ptr<const model::ServiceModel> serviceModel = pImpl->loader->LoadServiceModel(serviceName);
    config::ScopedConfig scoped =
        options.scopedConfig.has_value() ? std::move(*options.scopedConfig) : config::LoadScopedConfigFromEnv();

    std::optional<std::string> region = options.region;
    if (!region.has_value()) {
        region = config::ScopedValueAsString(scoped, "region");
    }

    std::shared_ptr<const ClientClass> cls = CreateClientClass(serviceName, *serviceModel);
    ClientArgs args = GetClientArgs(serviceModel, region, options.isSecure, options.endpointUrl, options.verify,
                                    options.credentials, scoped, options.clientConfig, *pImpl->resolver);
    LOG_INFO("Created {} client for {}", cls->className, args.endpoint->Host());
    return std::make_shared<BaseClient>(std::move(cls), std::move(args));
}

ClientArgs ClientCreator::GetClientArgs(std::shared_ptr<const model::ServiceModel> serviceModel,
                                        const std::optional<std::string>& region,
                                        bool isSecure,
                                        const std::optional<std::string>& endpointUrl,
                                        bool verify,
                                        const std::optional<signing::Credentials>& credentials,
                                        const config::ScopedConfig& scopedConfig,
                                        const std::optional<config::ClientConfig>& clientConfig,
                                        const IEndpointResolver& resolver) {
    const model::ServiceModel& service = *serviceModel;
    const std::string serviceName = service.EndpointPrefix();

    const bool validate = Impl::resolveParameterValidation(scopedConfig, clientConfig);
    std::shared_ptr<protocol::ISerializer> serializer = protocol::CreateSerializer(service.Protocol(), validate);

    std::shared_ptr<events::EventEmitter> emitter = pImpl->emitter->Copy();
    std::shared_ptr<protocol::IResponseParser> parser = pImpl->parserFactory(service.Protocol());
    const ResolvedEndpoint endpoint = resolver.Resolve(service, region, endpointUrl, isSecure);
    const std::string userAgent = pImpl->composeUserAgent(clientConfig);

    auto signer = std::make_shared<signing::RequestSigner>(serviceName, endpoint.signingRegion, endpoint.signingName,
                                                           endpoint.signatureVersion, credentials, emitter,
                                                           pImpl->signingAlgorithms);

    config::ClientConfigOptions kwargs;
    if (!endpoint.region.empty()) {
        kwargs.regionName = endpoint.region;
    }
    kwargs.signatureVersion = endpoint.signatureVersion;
    kwargs.userAgent = userAgent;
    kwargs.parameterValidation = validate;
    if (clientConfig.has_value()) {
        const config::ClientConfigOptions& given = clientConfig->UserProvidedOptions();
        kwargs.connectTimeout = given.connectTimeout;
        kwargs.readTimeout = given.readTimeout;
        kwargs.connectorArgs = given.connectorArgs;
    }

    auto injector = pImpl->injectors.find(serviceName);
    if (injector != pImpl->injectors.end() && injector->second) {
        ConfigInjectionContext ctx{kwargs, endpoint, scopedConfig, clientConfig};
        injector->second(ctx);
    }
    if (endpointUrl.has_value()) {
        emitter->UnregisterUniqueId(events::EventKind::BeforeCall, kFixS3HostHandlerId);
    }

    config::ClientConfig merged(std::move(kwargs));
    auto session = std::make_shared<http::HttpSession>(pImpl->executor, merged.GetConnectorOptions());
    http::EndpointCreator endpointCreator(session);
    std::shared_ptr<IEndpoint> ep = endpointCreator.CreateEndpoint(
        service, endpoint.region, endpoint.endpointUrl, verify, pImpl->parserFactory,
        EndpointTimeouts{merged.ConnectTimeout(), merged.ReadTimeout()}, signer);

    ClientArgs args;
    args.serializer = std::move(serializer);
    args.endpoint = std::move(ep);
    args.responseParser = std::move(parser);
    args.eventEmitter = std::move(emitter);
    args.requestSigner = std::move(signer);
    args.serviceModel = std::move(serviceModel);
    args.loader = pImpl->loader;
    args.clientConfig = std::move(merged);
    return args;
}

std::shared_ptr<const ClientClass> ClientCreator::CreateClientClass(const std::string& serviceName,
                                                                    const model::ServiceModel& serviceModel) {
    {
        std::lock_guard<std::mutex> lock(pImpl->classMutex);
        auto cached = pImpl->classCache.find(serviceName);
        if (cached != pImpl->classCache.end()) {
            return cached->second;
        }
    }

    // Handlers run unlocked; they may create other clients through this creator.
    auto cls = std::make_shared<ClientClass>();
    cls->serviceName = serviceName;
    cls->capabilities.push_back("BaseClient");
    for (const auto& opName : serviceModel.OperationNames()) {
        cls->methods.emplace(util::XformName(opName), MethodBinding{opName, nullptr});
    }

    events::CreatingClientClassEvent event{serviceName, cls->methods, cls->capabilities};
    pImpl->emitter->EmitCreatingClientClass(serviceName, event);

    for (const auto& [methodName, binding] : cls->methods) {
        if (!binding.operationName.empty()) {
            cls->methodToOperation.emplace(methodName, binding.operationName);
        }
    }
    cls->className = util::ServiceClassName(serviceModel.Metadata());

    std::lock_guard<std::mutex> lock(pImpl->classMutex);
    auto [it, inserted] = pImpl->classCache.emplace(serviceName, cls);
    if (inserted) {
        LOG_DEBUG("Created client class {} with {} methods", cls->className, cls->methods.size());
    }
    return it->second;
}

void ClientCreator::RegisterConfigInjector(const std::string& serviceName, ConfigInjector injector) {
    pImpl->injectors[serviceName] = std::move(injector);
}

void ClientCreator::RegisterSigningAlgorithm(const std::string& signatureVersion,
                                             std::shared_ptr<const signing::ISigningAlgorithm> algorithm) {
    pImpl->signingAlgorithms[signatureVersion] = std::move(algorithm);
}

const std::shared_ptr<events::EventEmitter>& ClientCreator::GetEventEmitter() const {
    return pImpl->emitter;
}

const std::string& ClientCreator::UserAgent() const {
    return pImpl->userAgent;
}

} // namespace cloudcall
