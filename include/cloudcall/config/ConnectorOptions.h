//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConnectorOptions.h
// Purpose: Validation and typed access for HTTP connector tuning options (keep-alive, limits, TLS)
//==========================================================================================================

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include <boost/asio/ssl/context.hpp>

namespace cloudcall {
namespace config {

// Value accepted for a connector option. The key decides which alternative is valid.
using ConnectorArg = std::variant<bool, int64_t, double, std::string, std::shared_ptr<boost::asio::ssl::context>>;
using ConnectorArgs = std::map<std::string, ConnectorArg>;

namespace ConnectorKeys {
    inline constexpr const char* UseDnsCache = "use_dns_cache";
    inline constexpr const char* ForceClose = "force_close";
    inline constexpr const char* KeepaliveTimeout = "keepalive_timeout";
    inline constexpr const char* Limit = "limit";
    inline constexpr const char* SslContext = "ssl_context";
}

// Seconds. The service closes idle connections after ~20s and the transport default (30s) overshoots it.
inline constexpr double kDefaultKeepaliveTimeoutSeconds = 12.0;

//==========================================================================================================
// ValidateConnectorArgs
// Purpose: Checks every key against the recognized set and its required type, then fills the
//          keep-alive default when absent.
// Args:
//   args: Optional caller-supplied options (std::nullopt behaves like an empty map).
// Returns:
//   Normalized copy of the options.
// Throws:
//   errors::ConfigValidationError naming the offending key and the expected type.
//==========================================================================================================
ConnectorArgs ValidateConnectorArgs(const std::optional<ConnectorArgs>& args);

//==========================================================================================================
// ConnectorOptions
// Purpose: Typed view over a validated ConnectorArgs map, consumed by the HTTP session.
//==========================================================================================================
struct ConnectorOptions {
    double keepaliveTimeoutSeconds{kDefaultKeepaliveTimeoutSeconds};
    std::optional<int64_t> limit;
    bool forceClose{false};
    bool useDnsCache{true};
    std::shared_ptr<boost::asio::ssl::context> sslContext;

    // Builds the typed view; args are validated first, so unvalidated input also throws here.
    static ConnectorOptions FromArgs(const ConnectorArgs& args);
};

} // namespace config
} // namespace cloudcall
