//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Serializer.h
// Purpose: Parameter validation and request serialization for the json and rest-json protocol families
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

#include "cloudcall/JSONValue.h"
#include "cloudcall/Request.h"
#include "cloudcall/model/ServiceModel.h"

namespace cloudcall {
namespace protocol {

//==========================================================================================================
// ISerializer
// Purpose: Converts call parameters into a transport-ready request record.
//==========================================================================================================
class ISerializer {
public:
    virtual ~ISerializer() = default;

    //==========================================================================================================
    // SerializeToRequest
    // Args:
    //   params: Object of input members (null is treated as empty).
    //   op: Operation being called.
    //   metadata: Service metadata (target prefix, json version).
    //   context: Per-call context. A rest-json call with streaming input sends the streaming member
    //            as the raw body and records "payload_member" in context.extras.
    // Returns:
    //   Request record with method, path, query, headers and body. url is left empty.
    // Throws:
    //   errors::ParamValidationError when validation is enabled and the input does not match the shape,
    //   or when a URI label has no value.
    //==========================================================================================================
    virtual RequestRecord SerializeToRequest(const JSONValue& params,
                                             const model::OperationModel& op,
                                             const model::ServiceMetadata& metadata,
                                             RequestContext& context) const = 0;
};

//==========================================================================================================
// CreateSerializer
// Purpose: Factory for the supported protocols ("json", "rest-json").
// Throws:
//   errors::UnknownProtocolError for any other protocol.
//==========================================================================================================
std::shared_ptr<ISerializer> CreateSerializer(const std::string& protocol, bool validate);

//==========================================================================================================
// ValidateParameters
// Purpose: Checks params against an input shape.
// Returns:
//   Newline-separated report of every problem found; empty when the input is valid.
//==========================================================================================================
std::string ValidateParameters(const JSONValue& params, const model::StructureShape& shape);

} // namespace protocol
} // namespace cloudcall
