//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EventEmitter.cpp
// Purpose: Typed hook registry implementation
//==========================================================================================================

#include "cloudcall/events/EventEmitter.h"

#include <algorithm>
#include <mutex>

#include "logging/Logger.h"

namespace cloudcall {
namespace events {

namespace {

template <typename EventT>
struct Entry {
    HandlerId id;
    std::string scope;
    std::optional<std::string> uniqueId;
    Handler<EventT> handler;
};

template <typename EventT>
using EntryList = std::vector<Entry<EventT>>;

} // namespace

class EventEmitter::Impl {
public:
    mutable std::mutex mutex;
    HandlerId nextId{1};
    EntryList<BeforeCallEvent> beforeCall;
    EntryList<AfterCallEvent> afterCall;
    EntryList<CreatingClientClassEvent> creatingClientClass;

    template <typename EventT>
    HandlerId add(EntryList<EventT>& list, const std::string& scope, Handler<EventT> handler,
                  const std::optional<std::string>& uniqueId) {
        std::lock_guard<std::mutex> lk(mutex);
        if (uniqueId.has_value()) {
            for (const auto& e : list) {
                if (e.uniqueId == uniqueId) {
                    LOG_DEBUG("Handler with unique id '{}' already registered; ignoring", *uniqueId);
                    return e.id;
                }
            }
        }
        HandlerId id = nextId++;
        list.push_back(Entry<EventT>{id, scope, uniqueId, std::move(handler)});
        return id;
    }

    template <typename EventT>
    static bool removeIf(EntryList<EventT>& list, const std::function<bool(const Entry<EventT>&)>& pred) {
        auto it = std::find_if(list.begin(), list.end(), pred);
        if (it == list.end()) {
            return false;
        }
        list.erase(it);
        return true;
    }

    template <typename EventT>
    void emit(const EntryList<EventT>& list, const std::string& scope, EventT& event) const {
        EntryList<EventT> snapshot;
        {
            std::lock_guard<std::mutex> lk(mutex);
            snapshot = list;
        }
        EntryList<EventT> matching;
        for (auto& e : snapshot) {
            if (EventEmitter::ScopeMatches(e.scope, scope)) {
                matching.push_back(std::move(e));
            }
        }
        // Matching scopes are prefixes of one another, so the longer one is the more specific.
        std::stable_sort(matching.begin(), matching.end(),
                         [](const auto& a, const auto& b) { return a.scope.size() > b.scope.size(); });
        for (const auto& e : matching) {
            e.handler(event);
        }
    }
};

EventEmitter::EventEmitter() : pImpl(std::make_unique<Impl>()) {}

EventEmitter::~EventEmitter() = default;

bool EventEmitter::ScopeMatches(const std::string& prefix, const std::string& scope) {
    if (prefix.empty() || prefix == scope) {
        return true;
    }
    return scope.size() > prefix.size() &&
           scope.compare(0, prefix.size(), prefix) == 0 &&
           scope[prefix.size()] == '.';
}

HandlerId EventEmitter::OnBeforeCall(const std::string& scope, Handler<BeforeCallEvent> handler,
                                     const std::optional<std::string>& uniqueId) {
    return pImpl->add(pImpl->beforeCall, scope, std::move(handler), uniqueId);
}

HandlerId EventEmitter::OnAfterCall(const std::string& scope, Handler<AfterCallEvent> handler,
                                    const std::optional<std::string>& uniqueId) {
    return pImpl->add(pImpl->afterCall, scope, std::move(handler), uniqueId);
}

HandlerId EventEmitter::OnCreatingClientClass(const std::string& scope, Handler<CreatingClientClassEvent> handler,
                                              const std::optional<std::string>& uniqueId) {
    return pImpl->add(pImpl->creatingClientClass, scope, std::move(handler), uniqueId);
}

bool EventEmitter::Unregister(HandlerId id) {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return Impl::removeIf<BeforeCallEvent>(pImpl->beforeCall, [id](const auto& e) { return e.id == id; }) ||
           Impl::removeIf<AfterCallEvent>(pImpl->afterCall, [id](const auto& e) { return e.id == id; }) ||
           Impl::removeIf<CreatingClientClassEvent>(pImpl->creatingClientClass,
                                                    [id](const auto& e) { return e.id == id; });
}

bool EventEmitter::UnregisterUniqueId(EventKind kind, const std::string& uniqueId) {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    bool removed = false;
    switch (kind) {
        case EventKind::BeforeCall:
            removed = Impl::removeIf<BeforeCallEvent>(pImpl->beforeCall,
                [&](const auto& e) { return e.uniqueId == uniqueId; });
            break;
        case EventKind::AfterCall:
            removed = Impl::removeIf<AfterCallEvent>(pImpl->afterCall,
                [&](const auto& e) { return e.uniqueId == uniqueId; });
            break;
        case EventKind::CreatingClientClass:
            removed = Impl::removeIf<CreatingClientClassEvent>(pImpl->creatingClientClass,
                [&](const auto& e) { return e.uniqueId == uniqueId; });
            break;
    }
    if (removed) {
        LOG_DEBUG("Unregistered handler '{}'", uniqueId);
    }
    return removed;
}

bool EventEmitter::HasUniqueId(EventKind kind, const std::string& uniqueId) const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    auto has = [&](const auto& list) {
        return std::any_of(list.begin(), list.end(), [&](const auto& e) { return e.uniqueId == uniqueId; });
    };
    switch (kind) {
        case EventKind::BeforeCall: return has(pImpl->beforeCall);
        case EventKind::AfterCall: return has(pImpl->afterCall);
        case EventKind::CreatingClientClass: return has(pImpl->creatingClientClass);
    }
    return false;
}

std::size_t EventEmitter::HandlerCount(EventKind kind) const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    switch (kind) {
        case EventKind::BeforeCall: return pImpl->beforeCall.size();
        case EventKind::AfterCall: return pImpl->afterCall.size();
        case EventKind::CreatingClientClass: return pImpl->creatingClientClass.size();
    }
    return 0;
}

void EventEmitter::EmitBeforeCall(const std::string& scope, BeforeCallEvent& event) const {
    pImpl->emit(pImpl->beforeCall, scope, event);
}

void EventEmitter::EmitAfterCall(const std::string& scope, AfterCallEvent& event) const {
    pImpl->emit(pImpl->afterCall, scope, event);
}

void EventEmitter::EmitCreatingClientClass(const std::string& scope, CreatingClientClassEvent& event) const {
    pImpl->emit(pImpl->creatingClientClass, scope, event);
}

std::shared_ptr<EventEmitter> EventEmitter::Copy() const {
    auto copy = std::make_shared<EventEmitter>();
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    copy->pImpl->nextId = pImpl->nextId;
    copy->pImpl->beforeCall = pImpl->beforeCall;
    copy->pImpl->afterCall = pImpl->afterCall;
    copy->pImpl->creatingClientClass = pImpl->creatingClientClass;
    return copy;
}

} // namespace events
} // namespace cloudcall
