//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpSession.hpp
// Purpose: Coroutine-based HTTP/HTTPS client session with keep-alive pooling using Boost.Beast
//==========================================================================================================

#pragma once

#include <map>
#include <memory>
#include <stop_token>
#include <string>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include "cloudcall/Request.h"
#include "cloudcall/config/ConnectorOptions.h"

namespace cloudcall {
namespace http {

//==========================================================================================================
// HttpSession
// Purpose: Shared transport for one client. Idle connections are pooled per (scheme, host, port, verify)
//          and reused while idle for less than the keep-alive timeout.
//==========================================================================================================
class HttpSession {
public:
    //==========================================================================================================
    // Request
    // Fields:
    //   method: HTTP verb.
    //   url: Absolute http:// or https:// URL including the query string.
    //   headers: Request headers (Host and Content-Length are set by the session).
    //   body: Payload.
    //   verify: TLS peer verification (ignored when the connector options supply an ssl_context).
    //   connectTimeoutSeconds / readTimeoutSeconds: Per-phase deadlines.
    //==========================================================================================================
    struct Request {
        std::string method{"GET"};
        std::string url;
        std::map<std::string, std::string> headers;
        std::string body;
        bool verify{true};
        double connectTimeoutSeconds{60.0};
        double readTimeoutSeconds{60.0};
    };

    HttpSession(boost::asio::any_io_executor executor, config::ConnectorOptions options);
    ~HttpSession();
    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;

    void Open();
    // Drops idle connections. In-flight requests complete but their connections are not pooled.
    void Close();
    bool IsOpen() const;

    //==========================================================================================================
    // Send
    // Purpose: Performs one request/response exchange.
    // Throws:
    //   errors::SessionClosedError when the session is not open.
    //   boost::system::system_error for resolve/connect/TLS/read/write failures and timeouts;
    //   operation_aborted when stop is requested.
    //==========================================================================================================
    boost::asio::awaitable<HttpResponse> Send(Request request, std::stop_token stop);

    const config::ConnectorOptions& Options() const;

    // Diagnostics.
    std::size_t IdleConnectionCount() const;
    std::size_t ConnectionsOpened() const;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace http
} // namespace cloudcall
