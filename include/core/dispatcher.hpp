#pragma once
#include "core/capability_descriptor.hpp"
#include "core/configuration.hpp"
#include "core/payload.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace caplink::core {
//---------------------------------------------------------------------------
/// Used by a provider to call into an actor, implemented by the host.
/// Implementations must be safe to call from several provider threads at once.
class Dispatcher {
    public:
    /// The destructor
    virtual ~Dispatcher() noexcept = default;
    /// Invoke an operation on an actor, throws DispatchError on failure
    [[nodiscard]] virtual Payload dispatch(std::string_view actor, std::string_view op, PayloadView msg) = 0;
};
//---------------------------------------------------------------------------
/// Placeholder until the host installs a real dispatcher, any call aborts
class NullDispatcher : public Dispatcher {
    public:
    /// Aborts the process
    [[nodiscard]] Payload dispatch(std::string_view actor, std::string_view op, PayloadView msg) override;
};
//---------------------------------------------------------------------------
/// Used by the host to call into a provider, implemented by every provider.
/// configureDispatch is called exactly once and before any handleCall.
/// handleCall must be safe under concurrent invocation.
class CapabilityProvider {
    public:
    /// The destructor
    virtual ~CapabilityProvider() noexcept = default;
    /// Hand over the dispatcher used to reach actors
    virtual void configureDispatch(std::unique_ptr<Dispatcher> dispatcher) = 0;
    /// Handle an actor-initiated operation, throws DispatchError on failure
    [[nodiscard]] virtual Payload handleCall(std::string_view actor, std::string_view op, PayloadView msg) = 0;
};
//---------------------------------------------------------------------------
/// Holds the dispatcher of a provider and enforces the initialization order
class DispatcherSlot {
    /// The placeholder
    NullDispatcher _null;
    /// The installed dispatcher
    std::unique_ptr<Dispatcher> _dispatcher;
    /// Installation guard
    std::mutex _mutex;
    /// Is a dispatcher installed?
    std::atomic<bool> _configured;

    public:
    /// The constructor
    DispatcherSlot() : _null(), _dispatcher(), _mutex(), _configured(false) {}

    /// Install the dispatcher, a second installation aborts
    void install(std::unique_ptr<Dispatcher> dispatcher);
    /// Is a dispatcher installed?
    [[nodiscard]] bool configured() const { return _configured.load(std::memory_order_acquire); }
    /// Abort unless a dispatcher is installed
    void requireConfigured(std::string_view op) const;
    /// The installed dispatcher or the null placeholder
    [[nodiscard]] Dispatcher& get();
};
//---------------------------------------------------------------------------
/// The operations every provider answers (descriptor, binding), shared by composition
class ProviderCore {
    /// The descriptor
    CapabilityDescriptor _descriptor;
    /// The bound actors
    BindingTable _bindings;
    /// The dispatcher
    DispatcherSlot _dispatcher;

    public:
    /// The constructor
    explicit ProviderCore(CapabilityDescriptor descriptor);

    /// Get the descriptor
    [[nodiscard]] const CapabilityDescriptor& descriptor() const { return _descriptor; }
    /// Get the bindings
    [[nodiscard]] BindingTable& bindings() { return _bindings; }
    /// Get the bindings
    [[nodiscard]] const BindingTable& bindings() const { return _bindings; }
    /// Get the dispatcher slot
    [[nodiscard]] DispatcherSlot& dispatcher() { return _dispatcher; }

    /// Resolve an incoming call: aborts when unconfigured, throws UnknownOperation for names outside the descriptor
    [[nodiscard]] Operation resolve(std::string_view op) const;
    /// Answer GetCapabilityDescriptor, BindActor and RemoveActor, nullopt for any other operation
    [[nodiscard]] std::optional<Payload> handleCommon(std::string_view actor, Operation op, PayloadView msg);
};
//---------------------------------------------------------------------------
} // namespace caplink::core
