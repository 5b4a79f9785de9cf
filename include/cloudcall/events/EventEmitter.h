//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EventEmitter.h
// Purpose: Typed hook registry with hierarchical scopes for call and class-creation events
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cloudcall/ClientClass.h"
#include "cloudcall/Request.h"
#include "cloudcall/model/ServiceModel.h"

namespace cloudcall {

namespace signing { class RequestSigner; }

namespace events {

enum class EventKind {
    BeforeCall,
    AfterCall,
    CreatingClientClass
};

using HandlerId = uint64_t;

//==========================================================================================================
// BeforeCallEvent
// Purpose: Emitted after serialization and before dispatch. Handlers may edit the request record.
//==========================================================================================================
struct BeforeCallEvent {
    const std::string& serviceName;
    const model::OperationModel& model;
    RequestRecord& request;
    const signing::RequestSigner* signer;
    RequestContext& context;
};

//==========================================================================================================
// AfterCallEvent
// Purpose: Emitted once the endpoint returned, for every status code.
//==========================================================================================================
struct AfterCallEvent {
    const model::OperationModel& model;
    const HttpResponse& http;
    const JSONValue& parsed;
    RequestContext& context;
};

//==========================================================================================================
// CreatingClientClassEvent
// Purpose: Emitted once per generated class before it is finalized. Handlers may add, replace or remove
//          methods and capabilities.
//==========================================================================================================
struct CreatingClientClassEvent {
    const std::string& serviceName;
    std::map<std::string, MethodBinding>& methods;
    std::vector<std::string>& capabilities;
};

template <typename EventT>
using Handler = std::function<void(EventT& event)>;

//==========================================================================================================
// EventEmitter
// Purpose: Per-kind ordered handler lists. A handler registered under scope "s3" receives events emitted
//          under "s3" and "s3.<anything>"; an empty scope receives everything. An emission runs the most
//          specific matching scope first ("s3.ListBuckets", then "s3", then ""), and handlers sharing a
//          scope in registration order.
//==========================================================================================================
class EventEmitter {
public:
    EventEmitter();
    ~EventEmitter();
    EventEmitter(const EventEmitter&) = delete;
    EventEmitter& operator=(const EventEmitter&) = delete;

    //==========================================================================================================
    // Registration
    // Args:
    //   scope: Dotted scope prefix ("" for all).
    //   handler: Callback; runs after handlers of more specific scopes.
    //   uniqueId: Optional identity; registering an id already present for the same kind is a no-op
    //             and returns the existing handler's id.
    // Returns:
    //   Handle for Unregister.
    //==========================================================================================================
    HandlerId OnBeforeCall(const std::string& scope, Handler<BeforeCallEvent> handler,
                           const std::optional<std::string>& uniqueId = std::nullopt);
    HandlerId OnAfterCall(const std::string& scope, Handler<AfterCallEvent> handler,
                          const std::optional<std::string>& uniqueId = std::nullopt);
    HandlerId OnCreatingClientClass(const std::string& scope, Handler<CreatingClientClassEvent> handler,
                                    const std::optional<std::string>& uniqueId = std::nullopt);

    // Returns false when no handler has that id.
    bool Unregister(HandlerId id);
    bool UnregisterUniqueId(EventKind kind, const std::string& uniqueId);
    bool HasUniqueId(EventKind kind, const std::string& uniqueId) const;
    std::size_t HandlerCount(EventKind kind) const;

    // Handlers run against a snapshot, so registering or unregistering from inside a handler affects
    // only later emissions. Handler exceptions propagate to the emitter's caller.
    void EmitBeforeCall(const std::string& scope, BeforeCallEvent& event) const;
    void EmitAfterCall(const std::string& scope, AfterCallEvent& event) const;
    void EmitCreatingClientClass(const std::string& scope, CreatingClientClassEvent& event) const;

    // Independent emitter with the same handlers in the same order.
    std::shared_ptr<EventEmitter> Copy() const;

    // True when scope equals prefix or starts with prefix followed by '.'.
    static bool ScopeMatches(const std::string& prefix, const std::string& scope);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace events
} // namespace cloudcall
