#pragma once
#include "core/dispatcher.hpp"
#include <atomic>
#include <cstdint>
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace caplink::extras {
//---------------------------------------------------------------------------
/// Generates guids, sequence numbers and random numbers for actors
class ExtrasProvider : public core::CapabilityProvider {
    /// The shared provider state
    core::ProviderCore _core;
    /// The last handed out sequence number
    std::atomic<uint64_t> _sequence;

    public:
    /// The constructor
    ExtrasProvider();

    /// The descriptor of the extras capability
    [[nodiscard]] static core::CapabilityDescriptor describe();

    /// Hand over the dispatcher
    void configureDispatch(std::unique_ptr<core::Dispatcher> dispatcher) override;
    /// Handle an actor-initiated operation
    [[nodiscard]] core::Payload handleCall(std::string_view actor, std::string_view op, core::PayloadView msg) override;

    /// Get the shared provider state
    [[nodiscard]] const core::ProviderCore& core() const { return _core; }
};
//---------------------------------------------------------------------------
} // namespace caplink::extras
