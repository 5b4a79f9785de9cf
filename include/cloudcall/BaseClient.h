//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BaseClient.h
// Purpose: Bound service client: suspend-capable call pipeline, pagination and session lifecycle
//==========================================================================================================

#pragma once

#include <memory>
#include <stop_token>
#include <string>

#include <boost/asio/awaitable.hpp>

#include "cloudcall/ClientClass.h"
#include "cloudcall/Endpoint.h"
#include "cloudcall/JSONValue.h"
#include "cloudcall/Paginator.h"
#include "cloudcall/config/ClientConfig.h"
#include "cloudcall/events/EventEmitter.h"
#include "cloudcall/model/ServiceModel.h"
#include "cloudcall/protocol/Parser.h"
#include "cloudcall/protocol/Serializer.h"
#include "cloudcall/signing/RequestSigner.h"

namespace cloudcall {

//==========================================================================================================
// ClientArgs
// Purpose: Everything a BaseClient is built from. Produced by ClientCreator::GetClientArgs.
//==========================================================================================================
struct ClientArgs {
    std::shared_ptr<protocol::ISerializer> serializer;
    std::shared_ptr<IEndpoint> endpoint;
    std::shared_ptr<protocol::IResponseParser> responseParser;
    std::shared_ptr<events::EventEmitter> eventEmitter;
    std::shared_ptr<signing::RequestSigner> requestSigner;
    std::shared_ptr<const model::ServiceModel> serviceModel;
    std::shared_ptr<model::IServiceModelLoader> loader;
    config::ClientConfig clientConfig;
};

//==========================================================================================================
// ClientMeta
// Purpose: Read-only facts about a bound client.
//==========================================================================================================
struct ClientMeta {
    std::string serviceName;
    std::string regionName;
    std::string endpointUrl;
    std::string className;
    const config::ClientConfig* config{nullptr};
    const std::map<std::string, std::string>* methodToApiMapping{nullptr};
    std::shared_ptr<events::EventEmitter> events;
};

//==========================================================================================================
// IClient
// Purpose: Caller-facing client surface.
//==========================================================================================================
class IClient {
public:
    virtual ~IClient() = default;

    ////////////////////////////////////////// Calls ///////////////////////////////////////////////////////////
    virtual boost::asio::awaitable<JSONValue> MakeApiCall(std::string operationName, JSONValue params,
                                                          std::stop_token stop) = 0;
    virtual boost::asio::awaitable<JSONValue> Invoke(std::string methodName, JSONValue params,
                                                     std::stop_token stop) = 0;

    ////////////////////////////////////////// Pagination //////////////////////////////////////////////////////
    virtual Paginator GetPaginator(const std::string& methodName) = 0;
    virtual bool CanPaginate(const std::string& methodName) const = 0;

    ////////////////////////////////////////// Session /////////////////////////////////////////////////////////
    virtual void Open() = 0;
    virtual void Close() = 0;
    virtual bool IsOpen() const = 0;
};

//==========================================================================================================
// BaseClient
// Purpose: One instance per logical session. Calls suspend only while the endpoint performs I/O.
// Session policy:
//   A session that was never opened is opened by the first call. This is the one place a call
//   opens the session; otherwise only Open(), Close() and ScopedSession change it. After Close(),
//   calls throw errors::SessionClosedError until Open() (or a new ScopedSession) reopens it.
//==========================================================================================================
class BaseClient : public IClient {
public:
    BaseClient(std::shared_ptr<const ClientClass> clientClass, ClientArgs args);
    ~BaseClient() override;
    BaseClient(const BaseClient&) = delete;
    BaseClient& operator=(const BaseClient&) = delete;

    //==========================================================================================================
    // MakeApiCall
    // Purpose: Resolve, build context, serialize, emit BeforeCall, dispatch, emit AfterCall, classify.
    // Args:
    //   operationName: Operation name as written in the service description.
    //   params: Input members.
    //   stop: Requesting a stop while dispatch is pending aborts the I/O; AfterCall does not fire.
    // Returns:
    //   The parsed response body (status < 300).
    // Throws:
    //   errors::UnknownOperationError, errors::SessionClosedError, errors::ParamValidationError,
    //   errors::ServiceError (status >= 300), and transport faults from the endpoint unchanged
    //   (boost::system::system_error(operation_aborted) when stopped).
    //==========================================================================================================
    boost::asio::awaitable<JSONValue> MakeApiCall(std::string operationName,
                                                  JSONValue params = JSONValue(JSONValue::Object{}),
                                                  std::stop_token stop = {}) override;

    //==========================================================================================================
    // Invoke
    // Purpose: Calls a generated method by its snake_case name. A custom handler installed through
    //          CreatingClientClass runs instead of MakeApiCall.
    // Throws:
    //   errors::UnknownOperationError when the class has no such method.
    //==========================================================================================================
    boost::asio::awaitable<JSONValue> Invoke(std::string methodName,
                                             JSONValue params = JSONValue(JSONValue::Object{}),
                                             std::stop_token stop = {}) override;

    //==========================================================================================================
    // GetPaginator
    // Purpose: Paginator whose pages are fetched through Invoke(methodName, ...). This client must outlive it.
    // Throws:
    //   errors::OperationNotPageableError when the method is unknown or has no pagination metadata.
    //==========================================================================================================
    Paginator GetPaginator(const std::string& methodName) override;
    bool CanPaginate(const std::string& methodName) const override;

    void Open() override;
    // Idempotent; valid without a prior Open().
    void Close() override;
    bool IsOpen() const override;

    const ClientMeta& Meta() const;
    const ClientClass& Class() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// ScopedSession
// Purpose: Opens the client's transport session (if not already open) and closes it on scope exit.
//==========================================================================================================
class ScopedSession {
public:
    explicit ScopedSession(BaseClient& client);
    ~ScopedSession();
    ScopedSession(const ScopedSession&) = delete;
    ScopedSession& operator=(const ScopedSession&) = delete;

private:
    BaseClient& client_;
};

} // namespace cloudcall
