//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Endpoint.h
// Purpose: Endpoint handle interface consumed by the call pipeline
//==========================================================================================================

#pragma once

#include <stop_token>
#include <string>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>

#include "cloudcall/JSONValue.h"
#include "cloudcall/Request.h"
#include "cloudcall/model/ServiceModel.h"

namespace cloudcall {

struct EndpointTimeouts {
    double connectTimeoutSeconds{60.0};
    double readTimeoutSeconds{60.0};
};

struct EndpointResponse {
    HttpResponse http;
    JSONValue parsed;
};

// Error raised for a cancelled call.
inline boost::system::system_error OperationAborted() {
    return boost::system::system_error(boost::asio::error::make_error_code(boost::asio::error::operation_aborted));
}

//==========================================================================================================
// IEndpoint
// Purpose: Signs, sends and parses one request against a fixed host. Owns the transport session.
//==========================================================================================================
class IEndpoint {
public:
    virtual ~IEndpoint() = default;

    // Base URL requests are sent to (scheme://host[:port]).
    virtual const std::string& Host() const = 0;

    //==========================================================================================================
    // MakeRequest
    // Purpose: Suspends for the duration of the network exchange.
    // Args:
    //   op: Operation being called.
    //   request: Serialized request; the signer may add headers.
    //   stop: Stop requests abort the in-flight I/O.
    // Returns:
    //   Raw HTTP response plus the parsed body.
    // Throws:
    //   errors::TransportError on connection-level failures.
    //   boost::system::system_error(operation_aborted) when stopped.
    //==========================================================================================================
    virtual boost::asio::awaitable<EndpointResponse> MakeRequest(const model::OperationModel& op,
                                                                 RequestRecord& request,
                                                                 std::stop_token stop) = 0;

    virtual void Open() = 0;
    // Idempotent.
    virtual void Close() = 0;
    virtual bool IsOpen() const = 0;
};

} // namespace cloudcall
