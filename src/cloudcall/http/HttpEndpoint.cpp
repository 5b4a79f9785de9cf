//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpEndpoint.cpp
// Purpose: Endpoint dispatch over the HTTP session
//==========================================================================================================

#include "cloudcall/http/HttpEndpoint.hpp"

#include <stdexcept>

#include <boost/asio/error.hpp>

#include "cloudcall/errors/Errors.h"
#include "cloudcall/util/Naming.h"
#include "logging/Logger.h"

namespace cloudcall {
namespace http {

HttpEndpoint::HttpEndpoint(std::string host,
                           std::shared_ptr<HttpSession> session,
                           std::shared_ptr<protocol::IResponseParser> parser,
                           EndpointTimeouts timeouts,
                           bool verify,
                           std::shared_ptr<const signing::RequestSigner> signer)
    : host_(std::move(host)),
      session_(std::move(session)),
      parser_(std::move(parser)),
      timeouts_(timeouts),
      verify_(verify),
      signer_(std::move(signer)) {}

boost::asio::awaitable<EndpointResponse> HttpEndpoint::MakeRequest(const model::OperationModel& op,
                                                                   RequestRecord& request,
                                                                   std::stop_token stop) {
    if (signer_) {
        signer_->Sign(op.name, request);
    }
    if (request.url.empty()) {
        request.url = BuildRequestUrl(host_, request);
    }

    HttpSession::Request out;
    out.method = request.method;
    out.url = request.url;
    out.headers = request.headers;
    out.body = request.body;
    out.verify = verify_;
    out.connectTimeoutSeconds = timeouts_.connectTimeoutSeconds;
    out.readTimeoutSeconds = timeouts_.readTimeoutSeconds;

    LOG_DEBUG("Sending {} {} ({} bytes)", out.method, out.url, out.body.size());
    HttpResponse response;
    try {
        response = co_await session_->Send(std::move(out), stop);
    } catch (const boost::system::system_error& e) {
        if (stop.stop_requested() || e.code() == boost::asio::error::operation_aborted) {
            throw;
        }
        throw errors::TransportError(request.url, e.what());
    }
    LOG_DEBUG("Received HTTP {} for {} ({} bytes)", response.statusCode, op.name, response.body.size());

    EndpointResponse result;
    result.parsed = parser_->Parse(response, op);
    result.http = std::move(response);
    co_return result;
}

void HttpEndpoint::Open() {
    session_->Open();
}

void HttpEndpoint::Close() {
    session_->Close();
}

bool HttpEndpoint::IsOpen() const {
    return session_->IsOpen();
}

EndpointCreator::EndpointCreator(std::shared_ptr<HttpSession> session) : session_(std::move(session)) {}

std::shared_ptr<IEndpoint> EndpointCreator::CreateEndpoint(const model::ServiceModel& service,
                                                           const std::string& regionName,
                                                           const std::string& endpointUrl,
                                                           bool verify,
                                                           const protocol::ParserFactory& parserFactory,
                                                           EndpointTimeouts timeouts,
                                                           std::shared_ptr<const signing::RequestSigner> signer) {
    const std::string lower = util::ToLower(endpointUrl);
    if (lower.rfind("http://", 0) != 0 && lower.rfind("https://", 0) != 0) {
        throw std::invalid_argument("Invalid endpoint: " + endpointUrl);
    }
    LOG_DEBUG("Creating endpoint for {} in {}: {} (connect {}s, read {}s)", service.ServiceName(), regionName,
              endpointUrl, timeouts.connectTimeoutSeconds, timeouts.readTimeoutSeconds);
    return std::make_shared<HttpEndpoint>(endpointUrl, session_, parserFactory(service.Protocol()), timeouts,
                                          verify, std::move(signer));
}

} // namespace http
} // namespace cloudcall
