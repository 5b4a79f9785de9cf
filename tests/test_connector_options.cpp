//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_connector_options.cpp
// Purpose: Tests for connector option validation and normalization
//==========================================================================================================

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include <boost/asio/ssl/context.hpp>

#include "cloudcall/config/ConnectorOptions.h"
#include "cloudcall/errors/Errors.h"

using namespace cloudcall;
using namespace cloudcall::config;

TEST(ConnectorOptions, EmptyArgsGetKeepaliveDefault) {
    ConnectorArgs out = ValidateConnectorArgs(std::nullopt);
    ASSERT_EQ(out.size(), 1u);
    ASSERT_TRUE(std::holds_alternative<double>(out.at(ConnectorKeys::KeepaliveTimeout)));
    EXPECT_DOUBLE_EQ(std::get<double>(out.at(ConnectorKeys::KeepaliveTimeout)), 12.0);
}

TEST(ConnectorOptions, ExplicitKeepaliveIsKept) {
    ConnectorArgs in;
    in[ConnectorKeys::KeepaliveTimeout] = int64_t{5};
    ConnectorArgs out = ValidateConnectorArgs(in);
    ASSERT_TRUE(std::holds_alternative<int64_t>(out.at(ConnectorKeys::KeepaliveTimeout)));
    EXPECT_EQ(std::get<int64_t>(out.at(ConnectorKeys::KeepaliveTimeout)), 5);

    ConnectorOptions typed = ConnectorOptions::FromArgs(out);
    EXPECT_DOUBLE_EQ(typed.keepaliveTimeoutSeconds, 5.0);
}

TEST(ConnectorOptions, AcceptsAllKnownKeys) {
    ConnectorArgs in;
    in[ConnectorKeys::UseDnsCache] = false;
    in[ConnectorKeys::ForceClose] = true;
    in[ConnectorKeys::KeepaliveTimeout] = 3.5;
    in[ConnectorKeys::Limit] = int64_t{4};
    in[ConnectorKeys::SslContext] = std::make_shared<boost::asio::ssl::context>(boost::asio::ssl::context::tls_client);

    ConnectorOptions o = ConnectorOptions::FromArgs(ValidateConnectorArgs(in));
    EXPECT_FALSE(o.useDnsCache);
    EXPECT_TRUE(o.forceClose);
    EXPECT_DOUBLE_EQ(o.keepaliveTimeoutSeconds, 3.5);
    ASSERT_TRUE(o.limit.has_value());
    EXPECT_EQ(*o.limit, 4);
    EXPECT_TRUE(o.sslContext != nullptr);
}

TEST(ConnectorOptions, UnknownKeyIsRejected) {
    ConnectorArgs in;
    in["conn_timeout"] = int64_t{1};
    try {
        (void)ValidateConnectorArgs(in);
        FAIL() << "expected ConfigValidationError";
    } catch (const errors::ConfigValidationError& e) {
        EXPECT_EQ(e.key(), "conn_timeout");
        EXPECT_NE(std::string(e.what()).find("conn_timeout"), std::string::npos);
    }
}

TEST(ConnectorOptions, WrongTypesAreRejected) {
    ConnectorArgs badBool;
    badBool[ConnectorKeys::UseDnsCache] = std::string("yes");
    EXPECT_THROW((void)ValidateConnectorArgs(badBool), errors::ConfigValidationError);

    ConnectorArgs badKeepalive;
    badKeepalive[ConnectorKeys::KeepaliveTimeout] = std::string("12");
    EXPECT_THROW((void)ValidateConnectorArgs(badKeepalive), errors::ConfigValidationError);

    ConnectorArgs badLimit;
    badLimit[ConnectorKeys::Limit] = 2.0;
    try {
        (void)ValidateConnectorArgs(badLimit);
        FAIL() << "expected ConfigValidationError";
    } catch (const errors::ConfigValidationError& e) {
        EXPECT_EQ(e.key(), ConnectorKeys::Limit);
        EXPECT_EQ(e.expected(), "an int");
    }

    ConnectorArgs nullContext;
    nullContext[ConnectorKeys::SslContext] = std::shared_ptr<boost::asio::ssl::context>();
    EXPECT_THROW((void)ValidateConnectorArgs(nullContext), errors::ConfigValidationError);
}

TEST(ConnectorOptions, NonPositiveLimitDisablesCap) {
    ConnectorArgs in;
    in[ConnectorKeys::Limit] = int64_t{0};
    ConnectorOptions o = ConnectorOptions::FromArgs(in);
    EXPECT_FALSE(o.limit.has_value());
}
