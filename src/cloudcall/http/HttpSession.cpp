//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpSession.cpp
// Purpose: HTTP/HTTPS client session using Boost.Beast coroutines with keep-alive pooling
//==========================================================================================================

//==========================================================================================================
#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "cloudcall/Endpoint.h"
#include "cloudcall/errors/Errors.h"
#include "cloudcall/http/HttpSession.hpp"
#include "cloudcall/util/Naming.h"
#include "logging/Logger.h"

namespace cloudcall {
namespace http {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
using tcp = net::ip::tcp;
using Clock = std::chrono::steady_clock;

namespace {

constexpr std::chrono::seconds kDnsCacheTtl{10};

struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
    std::string hostHeader;
};

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;
    std::size_t pos = 0;

    std::size_t schemeEnd = url.find("://");
    if (schemeEnd != std::string::npos) {
        parts.scheme = util::ToLower(url.substr(0, schemeEnd));
        pos = schemeEnd + 3;
    } else {
        parts.scheme = std::string("http");
    }

    std::size_t slash = url.find_first_of("/?", pos);
    std::string hostPort;
    if (slash == std::string::npos) {
        hostPort = url.substr(pos);
        parts.target = std::string("/");
    } else {
        hostPort = url.substr(pos, slash - pos);
        parts.target = url.substr(slash);
        if (parts.target[0] == '?') {
            parts.target = "/" + parts.target;
        }
    }

    std::size_t colon = hostPort.rfind(':');
    if (colon == std::string::npos) {
        parts.host = hostPort;
        parts.port = parts.scheme == "https" ? std::string("443") : std::string("80");
        parts.hostHeader = parts.host;
    } else {
        parts.host = hostPort.substr(0, colon);
        parts.port = hostPort.substr(colon + 1);
        parts.hostHeader = hostPort;
    }
    return parts;
}

std::chrono::milliseconds toMillis(double seconds) {
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
}

void throwIfStopped(const std::stop_token& stop) {
    if (stop.stop_requested()) {
        throw OperationAborted();
    }
}

//==========================================================================================================
// Connection
// Purpose: One plain or TLS stream plus its read buffer.
//==========================================================================================================
struct Connection {
    std::string key;
    std::unique_ptr<beast::tcp_stream> plain;
    std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> tls;
    beast::flat_buffer buffer;
    Clock::time_point lastUsed{Clock::now()};

    beast::tcp_stream& lowest() { return tls ? beast::get_lowest_layer(*tls) : *plain; }

    void cancel() { lowest().cancel(); }

    void close() {
        boost::system::error_code ec;
        lowest().socket().shutdown(tcp::socket::shutdown_both, ec);
        lowest().socket().close(ec);
    }
};

//==========================================================================================================
// CancelState
// Purpose: Bridges a std::stop_token to whatever async object the request is currently waiting on.
//          Only touched on the session's executor.
//==========================================================================================================
struct CancelState {
    std::function<void()> cancel;
};

class CancelScope {
public:
    CancelScope(std::shared_ptr<CancelState> state, std::function<void()> fn) : state_(std::move(state)) {
        state_->cancel = std::move(fn);
    }
    ~CancelScope() { state_->cancel = nullptr; }
    CancelScope(const CancelScope&) = delete;
    CancelScope& operator=(const CancelScope&) = delete;

private:
    std::shared_ptr<CancelState> state_;
};

struct Waiter {
    explicit Waiter(const net::any_io_executor& ex) : timer(ex) {}
    net::steady_timer timer;
    bool granted{false};
};

} // namespace

class HttpSession::Impl : public std::enable_shared_from_this<HttpSession::Impl> {
public:
    net::any_io_executor executor;
    config::ConnectorOptions options;
    std::atomic<bool> open{false};
    std::atomic<std::size_t> opened{0};

    std::unordered_map<std::string, std::vector<std::shared_ptr<Connection>>> idle;
    std::unordered_map<std::string, std::pair<tcp::resolver::results_type, Clock::time_point>> dnsCache;

    std::size_t active{0};
    std::deque<std::shared_ptr<Waiter>> waiters;

    std::unique_ptr<ssl::context> verifyingCtx;
    std::unique_ptr<ssl::context> insecureCtx;

    Impl(net::any_io_executor ex, config::ConnectorOptions opts)
        : executor(std::move(ex)), options(std::move(opts)) {}

    ~Impl() { closeIdle(); }

    void closeIdle() {
        for (auto& [key, conns] : idle) {
            for (auto& c : conns) c->close();
        }
        idle.clear();
    }

    // ------------------------------------------------------------------------------------------------------
    // TLS
    // ------------------------------------------------------------------------------------------------------
    ssl::context& tlsContext(bool verify) {
        if (options.sslContext) {
            return *options.sslContext;
        }
        std::unique_ptr<ssl::context>& slot = verify ? verifyingCtx : insecureCtx;
        if (!slot) {
            slot = std::make_unique<ssl::context>(ssl::context::tls_client);
            ::SSL_CTX_set_min_proto_version(slot->native_handle(), TLS1_2_VERSION);
            if (verify) {
                try {
                    slot->set_default_verify_paths();
                } catch (const std::exception& e) {
                    LOG_DEBUG("HTTPS: set_default_verify_paths failed: {}", e.what());
                }
                slot->set_verify_mode(ssl::verify_peer);
            } else {
                slot->set_verify_mode(ssl::verify_none);
            }
        }
        return *slot;
    }

    // ------------------------------------------------------------------------------------------------------
    // Connection limit
    // ------------------------------------------------------------------------------------------------------
    net::awaitable<void> acquireSlot(std::shared_ptr<CancelState> cs) {
        if (!options.limit.has_value() || active < static_cast<std::size_t>(*options.limit)) {
            ++active;
            co_return;
        }
        auto w = std::make_shared<Waiter>(executor);
        w->timer.expires_at(net::steady_timer::time_point::max());
        waiters.push_back(w);
        LOG_DEBUG("Connection limit {} reached; waiting ({} queued)", *options.limit, waiters.size());
        boost::system::error_code ec;
        {
            CancelScope scope(cs, [w]() { w->timer.cancel(); });
            co_await w->timer.async_wait(net::redirect_error(net::use_awaitable, ec));
        }
        if (w->granted) {
            co_return;
        }
        waiters.erase(std::remove(waiters.begin(), waiters.end(), w), waiters.end());
        throw OperationAborted();
    }

    // Hands the slot to the oldest waiter, if any.
    void releaseSlot() {
        if (!waiters.empty()) {
            auto w = waiters.front();
            waiters.pop_front();
            w->granted = true;
            w->timer.cancel();
            return;
        }
        if (active > 0) {
            --active;
        }
    }

    class SlotGuard {
    public:
        explicit SlotGuard(std::shared_ptr<Impl> impl) : impl_(std::move(impl)) {}
        ~SlotGuard() { impl_->releaseSlot(); }
        SlotGuard(const SlotGuard&) = delete;
        SlotGuard& operator=(const SlotGuard&) = delete;

    private:
        std::shared_ptr<Impl> impl_;
    };

    // ------------------------------------------------------------------------------------------------------
    // Pool
    // ------------------------------------------------------------------------------------------------------
    std::shared_ptr<Connection> takeIdle(const std::string& key) {
        auto it = idle.find(key);
        if (it == idle.end()) {
            return nullptr;
        }
        auto& conns = it->second;
        const auto maxIdle = toMillis(options.keepaliveTimeoutSeconds);
        while (!conns.empty()) {
            auto c = conns.back();
            conns.pop_back();
            if (Clock::now() - c->lastUsed < maxIdle && c->lowest().socket().is_open()) {
                return c;
            }
            c->close();
        }
        return nullptr;
    }

    void release(const std::shared_ptr<Connection>& conn, bool keepAlive) {
        if (open.load() && keepAlive && !options.forceClose) {
            conn->lastUsed = Clock::now();
            idle[conn->key].push_back(conn);
        } else {
            conn->close();
        }
    }

    // ------------------------------------------------------------------------------------------------------
    // Resolve / connect / exchange
    // ------------------------------------------------------------------------------------------------------
    net::awaitable<tcp::resolver::results_type> resolve(const UrlParts& u, std::shared_ptr<CancelState> cs) {
        const std::string key = u.host + ":" + u.port;
        if (options.useDnsCache) {
            auto it = dnsCache.find(key);
            if (it != dnsCache.end() && Clock::now() - it->second.second < kDnsCacheTtl) {
                co_return it->second.first;
            }
        }
        tcp::resolver resolver(executor);
        tcp::resolver::results_type results;
        {
            CancelScope scope(cs, [&resolver]() { resolver.cancel(); });
            results = co_await resolver.async_resolve(u.host, u.port, net::use_awaitable);
        }
        if (options.useDnsCache) {
            dnsCache[key] = std::make_pair(results, Clock::now());
        }
        co_return results;
    }

    net::awaitable<std::shared_ptr<Connection>> connect(const UrlParts& u, const std::string& key,
                                                       const HttpSession::Request& request,
                                                       std::shared_ptr<CancelState> cs) {
        auto results = co_await resolve(u, cs);

        auto conn = std::make_shared<Connection>();
        conn->key = key;
        if (u.scheme == "https") {
            conn->tls = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(executor, tlsContext(request.verify));
            if (!::SSL_set_tlsext_host_name(conn->tls->native_handle(), u.host.c_str())) {
                throw boost::system::system_error(
                    boost::system::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()),
                    "HTTPS: failed to set SNI hostname");
            }
            if (request.verify && !options.sslContext) {
                (void)::SSL_set1_host(conn->tls->native_handle(), u.host.c_str());
            }
        } else {
            conn->plain = std::make_unique<beast::tcp_stream>(executor);
        }

        {
            CancelScope scope(cs, [conn]() { conn->cancel(); });
            conn->lowest().expires_after(toMillis(request.connectTimeoutSeconds));
            co_await conn->lowest().async_connect(results, net::use_awaitable);
            if (conn->tls) {
                co_await conn->tls->async_handshake(ssl::stream_base::client, net::use_awaitable);
            }
        }
        ++opened;
        LOG_DEBUG("HTTP session: opened connection {} (total {})", key, opened.load());
        co_return conn;
    }

    net::awaitable<bhttp::response<bhttp::string_body>> exchange(std::shared_ptr<Connection> conn,
                                                                 bhttp::request<bhttp::string_body>& req,
                                                                 double readTimeoutSeconds,
                                                                 std::shared_ptr<CancelState> cs) {
        CancelScope scope(cs, [conn]() { conn->cancel(); });
        conn->lowest().expires_after(toMillis(readTimeoutSeconds));
        bhttp::response_parser<bhttp::string_body> parser;
        // Responses to HEAD carry Content-Length but no body.
        parser.skip(req.method() == bhttp::verb::head);
        if (conn->tls) {
            co_await bhttp::async_write(*conn->tls, req, net::use_awaitable);
            co_await bhttp::async_read(*conn->tls, conn->buffer, parser, net::use_awaitable);
        } else {
            co_await bhttp::async_write(*conn->plain, req, net::use_awaitable);
            co_await bhttp::async_read(*conn->plain, conn->buffer, parser, net::use_awaitable);
        }
        conn->lowest().expires_never();
        co_return parser.release();
    }

    net::awaitable<HttpResponse> send(HttpSession::Request request, std::stop_token stop) {
        if (!open.load()) {
            throw errors::SessionClosedError();
        }
        throwIfStopped(stop);

        const UrlParts u = parseUrl(request.url);
        if (u.scheme != "http" && u.scheme != "https") {
            throw boost::system::system_error(net::error::make_error_code(net::error::invalid_argument),
                                              "unsupported URL scheme '" + u.scheme + "'");
        }
        const bhttp::verb verb = bhttp::string_to_verb(request.method);
        if (verb == bhttp::verb::unknown) {
            throw boost::system::system_error(net::error::make_error_code(net::error::invalid_argument),
                                              "unsupported HTTP method '" + request.method + "'");
        }
        const std::string key = u.scheme + "://" + u.host + ":" + u.port + (request.verify ? "" : "|noverify");

        auto cs = std::make_shared<CancelState>();
        std::stop_callback onStop(stop, [cs, ex = executor]() {
            net::post(ex, [cs]() {
                if (cs->cancel) cs->cancel();
            });
        });

        co_await acquireSlot(cs);
        SlotGuard slot(shared_from_this());
        throwIfStopped(stop);

        bhttp::request<bhttp::string_body> req{verb, u.target, 11};
        for (const auto& [name, value] : request.headers) {
            req.set(name, value);
        }
        req.set(bhttp::field::host, u.hostHeader);
        req.keep_alive(!options.forceClose);
        req.body() = std::move(request.body);
        req.prepare_payload();

        for (int attempt = 0; ; ++attempt) {
            std::shared_ptr<Connection> conn = attempt == 0 ? takeIdle(key) : nullptr;
            const bool reused = conn != nullptr;
            if (!conn) {
                conn = co_await connect(u, key, request, cs);
            }
            throwIfStopped(stop);

            bool retry = false;
            bhttp::response<bhttp::string_body> res;
            try {
                res = co_await exchange(conn, req, request.readTimeoutSeconds, cs);
            } catch (const boost::system::system_error& e) {
                conn->close();
                if (!reused || stop.stop_requested() || e.code() == net::error::operation_aborted ||
                    e.code() == beast::error::timeout) {
                    throw;
                }
                LOG_DEBUG("HTTP session: pooled connection {} failed ({}); reconnecting", key, e.what());
                retry = true;
            }
            if (retry) {
                continue;
            }

            HttpResponse out;
            out.statusCode = static_cast<int>(res.result_int());
            for (const auto& field : res) {
                std::string name = util::ToLower(std::string(field.name_string().data(), field.name_string().size()));
                std::string value(field.value().data(), field.value().size());
                auto existing = out.headers.find(name);
                if (existing == out.headers.end()) {
                    out.headers.emplace(std::move(name), std::move(value));
                } else {
                    existing->second += ", " + value;
                }
            }
            out.body = std::move(res.body());
            release(conn, res.keep_alive());
            co_return out;
        }
    }
};

HttpSession::HttpSession(boost::asio::any_io_executor executor, config::ConnectorOptions options)
    : pImpl(std::make_shared<Impl>(std::move(executor), std::move(options))) {}

HttpSession::~HttpSession() {
    pImpl->open.store(false);
    pImpl->closeIdle();
}

void HttpSession::Open() {
    FUNC_SCOPE();
    if (!pImpl->open.exchange(true)) {
        LOG_INFO("HTTP session opened (keepalive {}s, limit {})", pImpl->options.keepaliveTimeoutSeconds,
                 pImpl->options.limit.has_value() ? std::to_string(*pImpl->options.limit) : std::string("none"));
    }
}

void HttpSession::Close() {
    FUNC_SCOPE();
    if (pImpl->open.exchange(false)) {
        pImpl->closeIdle();
        LOG_INFO("HTTP session closed");
    }
}

bool HttpSession::IsOpen() const {
    return pImpl->open.load();
}

boost::asio::awaitable<HttpResponse> HttpSession::Send(Request request, std::stop_token stop) {
    auto impl = pImpl;
    co_return co_await impl->send(std::move(request), std::move(stop));
}

const config::ConnectorOptions& HttpSession::Options() const {
    return pImpl->options;
}

std::size_t HttpSession::IdleConnectionCount() const {
    std::size_t n = 0;
    for (const auto& [key, conns] : pImpl->idle) n += conns.size();
    return n;
}

std::size_t HttpSession::ConnectionsOpened() const {
    return pImpl->opened.load();
}

} // namespace http
} // namespace cloudcall
