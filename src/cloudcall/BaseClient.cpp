//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BaseClient.cpp
// Purpose: Call pipeline and session lifecycle for bound clients
//==========================================================================================================

#include "cloudcall/BaseClient.h"

#include "cloudcall/errors/Errors.h"
#include "cloudcall/util/Naming.h"
#include "cloudcall/version.h"
#include "logging/Logger.h"

namespace cloudcall {

class BaseClient::Impl {
public:
    enum class SessionState {
        NeverOpened,
        Open,
        Closed
    };

    std::shared_ptr<const ClientClass> clientClass;
    ClientArgs args;
    ClientMeta meta;
    SessionState state{SessionState::NeverOpened};

    Impl(std::shared_ptr<const ClientClass> cls, ClientArgs a)
        : clientClass(std::move(cls)), args(std::move(a)) {
        meta.serviceName = args.serviceModel->ServiceName();
        meta.regionName = args.clientConfig.RegionName().value_or(std::string());
        meta.endpointUrl = args.endpoint->Host();
        meta.className = clientClass->className;
        meta.config = &args.clientConfig;
        meta.methodToApiMapping = &clientClass->methodToOperation;
        meta.events = args.eventEmitter;
    }

    void ensureSession() {
        if (state == SessionState::Closed) {
            throw errors::SessionClosedError();
        }
        if (state == SessionState::NeverOpened) {
            args.endpoint->Open();
            state = SessionState::Open;
        }
    }

    // Fills the absolute URL and the User-Agent header.
    void prepareRequest(RequestRecord& request) const {
        request.url = BuildRequestUrl(args.endpoint->Host(), request);
        const auto& ua = args.clientConfig.UserAgent();
        request.headers["User-Agent"] = ua.has_value() ? *ua : DefaultUserAgent();
    }

    std::string operationForMethod(const std::string& methodName) const {
        auto it = clientClass->methodToOperation.find(methodName);
        if (it != clientClass->methodToOperation.end()) {
            return it->second;
        }
        if (const MethodBinding* binding = clientClass->FindMethod(methodName)) {
            return binding->operationName;
        }
        return std::string();
    }
};

BaseClient::BaseClient(std::shared_ptr<const ClientClass> clientClass, ClientArgs args)
    : pImpl(std::make_unique<Impl>(std::move(clientClass), std::move(args))) {}

BaseClient::~BaseClient() = default;

boost::asio::awaitable<JSONValue> BaseClient::MakeApiCall(std::string operationName,
                                                          JSONValue params,
                                                          std::stop_token stop) {
    Impl& impl = *pImpl;
    const model::ServiceModel& service = *impl.args.serviceModel;

    // 1. Resolve
    const model::OperationModel& op = service.GetOperation(operationName);
    impl.ensureSession();
    LOG_DEBUG("Calling {}.{}", service.ServiceName(), operationName);

    // 2. Context
    RequestContext context;
    context.clientRegion = impl.meta.regionName;
    context.clientConfig = &impl.args.clientConfig;
    context.hasStreamingInput = op.HasStreamingInput();

    // 3. Serialize
    RequestRecord request = impl.args.serializer->SerializeToRequest(params, op, service.Metadata(), context);
    impl.prepareRequest(request);

    // 4. BeforeCall
    const std::string scope = service.EndpointPrefix() + "." + operationName;
    events::BeforeCallEvent before{service.ServiceName(), op, request, impl.args.requestSigner.get(), context};
    impl.args.eventEmitter->EmitBeforeCall(scope, before);

    // 5. Dispatch
    if (stop.stop_requested()) {
        throw OperationAborted();
    }
    EndpointResponse response = co_await impl.args.endpoint->MakeRequest(op, request, stop);

    // 6. AfterCall
    events::AfterCallEvent after{op, response.http, response.parsed, context};
    impl.args.eventEmitter->EmitAfterCall(scope, after);

    // 7. Classify
    if (response.http.statusCode >= 300) {
        errors::ServiceError error(response.parsed, operationName);
        LOG_WARN("{} failed: {} (HTTP {})", operationName, error.code(), response.http.statusCode);
        throw error;
    }
    co_return response.parsed;
}

boost::asio::awaitable<JSONValue> BaseClient::Invoke(std::string methodName,
                                                     JSONValue params,
                                                     std::stop_token stop) {
    const MethodBinding* binding = pImpl->clientClass->FindMethod(methodName);
    if (!binding) {
        throw errors::UnknownOperationError(methodName);
    }
    if (binding->customHandler) {
        co_return co_await binding->customHandler(*this, params, stop);
    }
    co_return co_await MakeApiCall(binding->operationName, std::move(params), std::move(stop));
}

Paginator BaseClient::GetPaginator(const std::string& methodName) {
    const std::string operationName = pImpl->operationForMethod(methodName);
    const model::OperationModel* op =
        operationName.empty() ? nullptr : pImpl->args.serviceModel->FindOperation(operationName);
    if (!op || !op->paginator.has_value()) {
        throw errors::OperationNotPageableError(methodName);
    }
    BaseClient* self = this;
    PageFetcher fetcher = [self, methodName](const JSONValue& params, std::stop_token stop) {
        return self->Invoke(methodName, params, std::move(stop));
    };
    return Paginator(std::move(fetcher), *op->paginator, operationName);
}

bool BaseClient::CanPaginate(const std::string& methodName) const {
    const std::string operationName = pImpl->operationForMethod(methodName);
    if (operationName.empty()) {
        return false;
    }
    const model::OperationModel* op = pImpl->args.serviceModel->FindOperation(operationName);
    return op && op->CanPaginate();
}

void BaseClient::Open() {
    FUNC_SCOPE();
    pImpl->args.endpoint->Open();
    pImpl->state = Impl::SessionState::Open;
}

void BaseClient::Close() {
    FUNC_SCOPE();
    if (pImpl->state == Impl::SessionState::Closed) {
        return;
    }
    pImpl->args.endpoint->Close();
    pImpl->state = Impl::SessionState::Closed;
}

bool BaseClient::IsOpen() const {
    return pImpl->state == Impl::SessionState::Open && pImpl->args.endpoint->IsOpen();
}

const ClientMeta& BaseClient::Meta() const {
    return pImpl->meta;
}

const ClientClass& BaseClient::Class() const {
    return *pImpl->clientClass;
}

ScopedSession::ScopedSession(BaseClient& client) : client_(client) {
    if (!client_.IsOpen()) {
        client_.Open();
    }
}

ScopedSession::~ScopedSession() {
    try {
        client_.Close();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to close client session: {}", e.what());
    }
}

} // namespace cloudcall
