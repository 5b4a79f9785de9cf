//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpEndpoint.hpp
// Purpose: IEndpoint over an HttpSession: signs, sends and parses
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

#include "cloudcall/Endpoint.h"
#include "cloudcall/http/HttpSession.hpp"
#include "cloudcall/protocol/Parser.h"
#include "cloudcall/signing/RequestSigner.h"

namespace cloudcall {
namespace http {

class HttpEndpoint : public IEndpoint {
public:
    HttpEndpoint(std::string host,
                 std::shared_ptr<HttpSession> session,
                 std::shared_ptr<protocol::IResponseParser> parser,
                 EndpointTimeouts timeouts,
                 bool verify,
                 std::shared_ptr<const signing::RequestSigner> signer);

    const std::string& Host() const override { return host_; }

    boost::asio::awaitable<EndpointResponse> MakeRequest(const model::OperationModel& op,
                                                         RequestRecord& request,
                                                         std::stop_token stop) override;

    void Open() override;
    void Close() override;
    bool IsOpen() const override;

    const EndpointTimeouts& Timeouts() const { return timeouts_; }
    const std::shared_ptr<HttpSession>& Session() const { return session_; }

private:
    std::string host_;
    std::shared_ptr<HttpSession> session_;
    std::shared_ptr<protocol::IResponseParser> parser_;
    EndpointTimeouts timeouts_;
    bool verify_;
    std::shared_ptr<const signing::RequestSigner> signer_;
};

//==========================================================================================================
// EndpointCreator
// Purpose: Builds HttpEndpoint handles bound to a client's session.
//==========================================================================================================
class EndpointCreator {
public:
    explicit EndpointCreator(std::shared_ptr<HttpSession> session);

    //==========================================================================================================
    // CreateEndpoint
    // Args:
    //   service: Service description (its protocol selects the parser).
    //   regionName: Client region, for diagnostics.
    //   endpointUrl: Absolute http(s) URL.
    //   verify: TLS peer verification.
    //   parserFactory: Parser constructor keyed by protocol.
    //   timeouts: Connect/read deadlines.
    //   signer: Optional signer applied before each send.
    // Throws:
    //   std::invalid_argument when endpointUrl is not an http(s) URL.
    //==========================================================================================================
    std::shared_ptr<IEndpoint> CreateEndpoint(const model::ServiceModel& service,
                                              const std::string& regionName,
                                              const std::string& endpointUrl,
                                              bool verify,
                                              const protocol::ParserFactory& parserFactory,
                                              EndpointTimeouts timeouts,
                                              std::shared_ptr<const signing::RequestSigner> signer = nullptr);

private:
    std::shared_ptr<HttpSession> session_;
};

} // namespace http
} // namespace cloudcall
