#pragma once
#include "core/capability_descriptor.hpp"
#include "core/configuration.hpp"
#include "core/dispatcher.hpp"
#include "core/payload.hpp"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace caplink::host {
//---------------------------------------------------------------------------
/// An in-process host runtime.
/// Routes actor calls to providers and provider pushes to actors; every call
/// runs outside the host lock, so providers and actors may call back into the host.
class LocalHost {
    public:
    /// The uniform call shape of an actor: origin, operation, payload
    using ActorHandler = std::function<core::Payload(std::string_view origin, std::string_view op, core::PayloadView msg)>;

    private:
    /// The dispatcher handed to a provider, pushes carry the capability id as origin
    class ProviderDispatcher : public core::Dispatcher {
        /// The host
        LocalHost& _host;
        /// The capability id, known once the provider reported its descriptor
        std::shared_ptr<const std::string> _capability;

        public:
        /// The constructor
        ProviderDispatcher(LocalHost& host, std::shared_ptr<const std::string> capability) : _host(host), _capability(std::move(capability)) {}
        /// Route a push to an actor
        [[nodiscard]] core::Payload dispatch(std::string_view actor, std::string_view op, core::PayloadView msg) override;
    };

    /// An installed provider
    struct ProviderEntry {
        /// The provider
        std::shared_ptr<core::CapabilityProvider> provider;
        /// The descriptor it reported
        core::CapabilityDescriptor descriptor;
    };

    /// The lock
    mutable std::shared_mutex _mutex;
    /// The actors
    std::unordered_map<std::string, std::shared_ptr<ActorHandler>> _actors;
    /// The bindings, keyed by (actor, capability id)
    std::map<std::pair<std::string, std::string>, core::CapabilityConfiguration> _bindings;
    /// The providers, keyed by capability id
    std::unordered_map<std::string, ProviderEntry> _providers;

    /// Get a provider
    [[nodiscard]] std::shared_ptr<core::CapabilityProvider> provider(std::string_view capabilityId) const;
    /// Get an actor
    [[nodiscard]] std::shared_ptr<ActorHandler> actor(std::string_view actorId) const;
    /// Invoke an actor
    core::Payload invokeActor(std::string_view origin, std::string_view actorId, std::string_view op, core::PayloadView msg) const;

    public:
    /// The constructor
    LocalHost() = default;
    /// The destructor, providers go first
    ~LocalHost() noexcept;
    /// No copies
    LocalHost(const LocalHost&) = delete;
    /// No copies
    LocalHost& operator=(const LocalHost&) = delete;

    /// Install a provider, a provider with the same capability id is only replaced by a superseding revision
    core::CapabilityDescriptor addProvider(std::unique_ptr<core::CapabilityProvider> provider);
    /// Get the descriptor of an installed provider
    [[nodiscard]] std::optional<core::CapabilityDescriptor> descriptor(std::string_view capabilityId) const;
    /// Get the installed capability ids
    [[nodiscard]] std::vector<std::string> capabilities() const;

    /// Register an actor, an existing handler is replaced
    void addActor(std::string actorId, ActorHandler handler);
    /// Remove an actor and its bindings, returns whether it existed
    bool removeActor(const std::string& actorId);

    /// Bind an actor to a capability, values may carry identity claims
    void bind(const std::string& actorId, const std::string& capabilityId, std::unordered_map<std::string, std::string> values = {});
    /// Remove the binding of an actor
    void unbind(const std::string& actorId, const std::string& capabilityId);
    /// Is the actor bound to the capability?
    [[nodiscard]] bool bound(const std::string& actorId, const std::string& capabilityId) const;

    /// Route an actor call to the provider of a capability
    core::Payload call(std::string_view actorId, std::string_view capabilityId, std::string_view op, core::PayloadView msg);
    /// Route a push to an actor
    core::Payload dispatch(std::string_view origin, std::string_view actorId, std::string_view op, core::PayloadView msg);

    /// Send HealthRequest to an actor, an actor answering without error is healthy
    bool healthCheck(std::string_view actorId);
    /// Send PerformLiveUpdate with the new module bytes to an actor
    void liveUpdate(std::string_view actorId, std::vector<uint8_t> newModule);
};
//---------------------------------------------------------------------------
} // namespace caplink::host
