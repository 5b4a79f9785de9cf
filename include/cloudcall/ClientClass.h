//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ClientClass.h
// Purpose: Per-service method dispatch table built by the client factory
//==========================================================================================================

#pragma once

#include <functional>
#include <map>
#include <stop_token>
#include <string>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include "cloudcall/JSONValue.h"

namespace cloudcall {

class BaseClient;

// Replacement body for a generated method. Receives the bound client so it can still reach MakeApiCall.
using MethodHandler = std::function<boost::asio::awaitable<JSONValue>(
    BaseClient& client, const JSONValue& params, std::stop_token stop)>;

//==========================================================================================================
// MethodBinding
// Purpose: What a generated method does when invoked.
// Fields:
//   operationName: Operation in the service description ("" for purely custom methods).
//   customHandler: When set, runs instead of MakeApiCall(operationName, ...).
//==========================================================================================================
struct MethodBinding {
    std::string operationName;
    MethodHandler customHandler;
};

//==========================================================================================================
// ClientClass
// Purpose: The generated "class" for one service: method table, reverse mapping and capability list.
//==========================================================================================================
struct ClientClass {
    std::string className;
    std::string serviceName;
    std::map<std::string, MethodBinding> methods;
    std::map<std::string, std::string> methodToOperation;
    std::vector<std::string> capabilities;

    const MethodBinding* FindMethod(const std::string& methodName) const {
        auto it = methods.find(methodName);
        return it == methods.end() ? nullptr : &it->second;
    }
};

} // namespace cloudcall
