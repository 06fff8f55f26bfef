#include "host/local_host.hpp"
#include "codec/codec.hpp"
#include "core/error.hpp"
#include "core/messages.hpp"
#include "core/operations.hpp"
#include <chrono>
#include <mutex>
#include <spdlog/spdlog.h>
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace caplink::host {
//---------------------------------------------------------------------------
using namespace std;
using core::DispatchError;
using core::ErrorKind;
using core::Operation;
using core::operationName;
using core::Payload;
using core::PayloadView;
using core::systemActor;
//---------------------------------------------------------------------------
Payload LocalHost::ProviderDispatcher::dispatch(string_view actor, string_view op, PayloadView msg)
// Route a push to an actor
{
    return _host.dispatch(*_capability, actor, op, msg);
}
//---------------------------------------------------------------------------
LocalHost::~LocalHost() noexcept
// The destructor, providers may still push to actors while shutting down
{
    unordered_map<string, ProviderEntry> providers;
    {
        unique_lock lock(_mutex);
        providers.swap(_providers);
    }
    providers.clear();
}
//---------------------------------------------------------------------------
shared_ptr<core::CapabilityProvider> LocalHost::provider(string_view capabilityId) const
// Get a provider
{
    shared_lock lock(_mutex);
    auto it = _providers.find(string(capabilityId));
    if (it == _providers.end())
        throw DispatchError(ErrorKind::Rejected, "capability " + string(capabilityId) + " is not installed");
    return it->second.provider;
}
//---------------------------------------------------------------------------
shared_ptr<LocalHost::ActorHandler> LocalHost::actor(string_view actorId) const
// Get an actor
{
    shared_lock lock(_mutex);
    auto it = _actors.find(string(actorId));
    if (it == _actors.end())
        throw DispatchError(ErrorKind::Rejected, "actor " + string(actorId) + " is not running");
    return it->second;
}
//---------------------------------------------------------------------------
Payload LocalHost::invokeActor(string_view origin, string_view actorId, string_view op, PayloadView msg) const
// Invoke an actor, failures other than dispatch errors surface as backend errors
{
    auto handler = actor(actorId);
    try {
        return (*handler)(origin, op, msg);
    } catch (const DispatchError&) {
        throw;
    } catch (const exception& e) {
        throw DispatchError(ErrorKind::Backend, "actor " + string(actorId) + " failed on " + string(op) + ": " + e.what());
    }
}
//---------------------------------------------------------------------------
core::CapabilityDescriptor LocalHost::addProvider(unique_ptr<core::CapabilityProvider> provider)
// Install a provider and replay the bindings of its capability
{
    if (!provider)
        throw DispatchError(ErrorKind::Rejected, "no provider given");
    shared_ptr<core::CapabilityProvider> shared(move(provider));

    // The dispatcher learns its capability id from the descriptor
    auto capabilityHolder = make_shared<string>();
    shared->configureDispatch(make_unique<ProviderDispatcher>(*this, capabilityHolder));

    auto descriptor = codec::deserialize<core::CapabilityDescriptor>(shared->handleCall(systemActor, operationName(Operation::GetCapabilityDescriptor), {}));
    if (descriptor.id().empty())
        throw DispatchError(ErrorKind::InvalidDescriptor, "provider reported a descriptor without id");
    *capabilityHolder = descriptor.id();

    vector<core::CapabilityConfiguration> replay;
    shared_ptr<core::CapabilityProvider> replaced;
    {
        unique_lock lock(_mutex);
        auto it = _providers.find(descriptor.id());
        if (it != _providers.end()) {
            if (!descriptor.supersedes(it->second.descriptor))
                throw DispatchError(ErrorKind::Rejected, "revision " + to_string(descriptor.revision()) + " of " + descriptor.id() + " does not supersede installed revision " + to_string(it->second.descriptor.revision()));
            replaced = move(it->second.provider);
            for (auto& [key, config] : _bindings)
                if (key.second == descriptor.id())
                    replay.push_back(config);
        }
        _providers.insert_or_assign(descriptor.id(), ProviderEntry{shared, descriptor});
    }
    spdlog::info("[LocalHost] installed {} {} revision {}{}", descriptor.id(), descriptor.version(), descriptor.revision(), replaced ? " (replacement)" : "");

    for (auto& config : replay) {
        [[maybe_unused]] auto reply = shared->handleCall(systemActor, operationName(Operation::BindActor), codec::serialize(config));
    }
    return descriptor;
}
//---------------------------------------------------------------------------
optional<core::CapabilityDescriptor> LocalHost::descriptor(string_view capabilityId) const
// Get the descriptor of an installed provider
{
    shared_lock lock(_mutex);
    auto it = _providers.find(string(capabilityId));
    if (it == _providers.end())
        return nullopt;
    return it->second.descriptor;
}
//---------------------------------------------------------------------------
vector<string> LocalHost::capabilities() const
// Get the installed capability ids
{
    shared_lock lock(_mutex);
    vector<string> ids;
    ids.reserve(_providers.size());
    for (auto& [id, entry] : _providers)
        ids.push_back(id);
    return ids;
}
//---------------------------------------------------------------------------
void LocalHost::addActor(string actorId, ActorHandler handler)
// Register an actor
{
    if (actorId.empty() || actorId == systemActor)
        throw DispatchError(ErrorKind::Rejected, "invalid actor id '" + actorId + "'");
    unique_lock lock(_mutex);
    spdlog::info("[LocalHost] actor {} started", actorId);
    _actors.insert_or_assign(move(actorId), make_shared<ActorHandler>(move(handler)));
}
//---------------------------------------------------------------------------
bool LocalHost::removeActor(const string& actorId)
// Remove an actor and its bindings
{
    vector<string> capabilities;
    {
        shared_lock lock(_mutex);
        if (!_actors.contains(actorId))
            return false;
        for (auto& [key, config] : _bindings)
            if (key.first == actorId)
                capabilities.push_back(key.second);
    }
    for (auto& capability : capabilities)
        unbind(actorId, capability);
    unique_lock lock(_mutex);
    auto removed = _actors.erase(actorId) > 0;
    if (removed)
        spdlog::info("[LocalHost] actor {} stopped", actorId);
    return removed;
}
//---------------------------------------------------------------------------
void LocalHost::bind(const string& actorId, const string& capabilityId, unordered_map<string, string> values)
// Bind an actor, the claims must allow the capability
{
    core::CapabilityConfiguration config{actorId, move(values)};
    auto claims = core::ActorClaims::fromConfiguration(config);
    if (!claims.capabilities.empty() && !claims.declares(capabilityId))
        throw DispatchError(ErrorKind::Rejected, "actor " + actorId + " has not declared " + capabilityId);
    auto now = chrono::duration_cast<chrono::seconds>(chrono::system_clock::now().time_since_epoch()).count();
    if (claims.expired(static_cast<uint64_t>(now)))
        throw DispatchError(ErrorKind::Rejected, "claims of actor " + actorId + " expired");

    [[maybe_unused]] auto known = actor(actorId);
    auto target = provider(capabilityId);
    [[maybe_unused]] auto reply = target->handleCall(systemActor, operationName(Operation::BindActor), codec::serialize(config));
    unique_lock lock(_mutex);
    _bindings.insert_or_assign({actorId, capabilityId}, move(config));
}
//---------------------------------------------------------------------------
void LocalHost::unbind(const string& actorId, const string& capabilityId)
// Remove the binding of an actor
{
    core::CapabilityConfiguration config;
    {
        unique_lock lock(_mutex);
        auto node = _bindings.extract({actorId, capabilityId});
        if (node.empty())
            return;
        config = move(node.mapped());
    }
    auto target = provider(capabilityId);
    [[maybe_unused]] auto reply = target->handleCall(systemActor, operationName(Operation::RemoveActor), codec::serialize(config));
}
//---------------------------------------------------------------------------
bool LocalHost::bound(const string& actorId, const string& capabilityId) const
// Is the actor bound to the capability?
{
    shared_lock lock(_mutex);
    return _bindings.contains({actorId, capabilityId});
}
//---------------------------------------------------------------------------
Payload LocalHost::call(string_view actorId, string_view capabilityId, string_view op, PayloadView msg)
// Route an actor call
{
    shared_ptr<core::CapabilityProvider> target;
    {
        shared_lock lock(_mutex);
        auto it = _providers.find(string(capabilityId));
        if (it == _providers.end())
            throw DispatchError(ErrorKind::Rejected, "capability " + string(capabilityId) + " is not installed");
        if (op != operationName(Operation::GetCapabilityDescriptor) && !it->second.descriptor.supports(op))
            throw DispatchError(ErrorKind::UnknownOperation, "operation '" + string(op) + "' is not part of " + string(capabilityId));
        if (op != operationName(Operation::GetCapabilityDescriptor) && !_bindings.contains({string(actorId), string(capabilityId)}))
            throw DispatchError(ErrorKind::Rejected, "actor " + string(actorId) + " is not bound to " + string(capabilityId));
        target = it->second.provider;
    }
    spdlog::debug("[LocalHost] {} -> {} {}", actorId, capabilityId, op);
    try {
        return target->handleCall(actorId, op, msg);
    } catch (const DispatchError&) {
        throw;
    } catch (const exception& e) {
        throw DispatchError(ErrorKind::Backend, "capability " + string(capabilityId) + " failed on " + string(op) + ": " + e.what());
    }
}
//---------------------------------------------------------------------------
Payload LocalHost::dispatch(string_view origin, string_view actorId, string_view op, PayloadView msg)
// Route a push to an actor
{
    spdlog::debug("[LocalHost] {} -> {} {}", origin, actorId, op);
    return invokeActor(origin, actorId, op, msg);
}
//---------------------------------------------------------------------------
bool LocalHost::healthCheck(string_view actorId)
// Send HealthRequest to an actor
{
    try {
        [[maybe_unused]] auto reply = invokeActor(systemActor, actorId, operationName(Operation::HealthRequest), codec::serialize(core::HealthRequest{}));
    } catch (const DispatchError& e) {
        spdlog::warn("[LocalHost] actor {} failed its health check: {}", actorId, e.what());
        return false;
    }
    return true;
}
//---------------------------------------------------------------------------
void LocalHost::liveUpdate(string_view actorId, vector<uint8_t> newModule)
// Send PerformLiveUpdate to an actor
{
    core::LiveUpdate update{move(newModule)};
    spdlog::info("[LocalHost] live update of {} with {} bytes", actorId, update.newModule.size());
    [[maybe_unused]] auto reply = invokeActor(systemActor, actorId, operationName(Operation::PerformLiveUpdate), codec::serialize(update));
}
//---------------------------------------------------------------------------
} // namespace caplink::host
