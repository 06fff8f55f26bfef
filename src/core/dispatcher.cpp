#include "core/dispatcher.hpp"
#include "codec/codec.hpp"
#include "core/error.hpp"
#include <string>
#include <spdlog/spdlog.h>
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace caplink::core {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
Payload NullDispatcher::dispatch(string_view actor, string_view op, PayloadView /*msg*/)
// Any call is an initialization order bug
{
    fatal(ErrorKind::NotConfigured, "dispatch of " + string(op) + " to " + string(actor) + " before a dispatcher was configured");
}
//---------------------------------------------------------------------------
void DispatcherSlot::install(unique_ptr<Dispatcher> dispatcher)
// Install the dispatcher
{
    if (!dispatcher)
        fatal(ErrorKind::NotConfigured, "configureDispatch without dispatcher");
    lock_guard lock(_mutex);
    if (_configured.load(memory_order_acquire))
        fatal(ErrorKind::NotConfigured, "configureDispatch called twice");
    _dispatcher = std::move(dispatcher);
    _configured.store(true, memory_order_release);
}
//---------------------------------------------------------------------------
void DispatcherSlot::requireConfigured(string_view op) const
// Abort unless a dispatcher is installed
{
    if (!configured()) [[unlikely]]
        fatal(ErrorKind::NotConfigured, "handleCall of " + string(op) + " before configureDispatch");
}
//---------------------------------------------------------------------------
Dispatcher& DispatcherSlot::get()
// The installed dispatcher or the null placeholder
{
    if (!configured())
        return _null;
    return *_dispatcher;
}
//---------------------------------------------------------------------------
ProviderCore::ProviderCore(CapabilityDescriptor descriptor) : _descriptor(std::move(descriptor)), _bindings(), _dispatcher()
// The constructor
{
}
//---------------------------------------------------------------------------
Operation ProviderCore::resolve(string_view op) const
// Resolve an incoming call
{
    _dispatcher.requireConfigured(op);
    auto parsed = parseOperation(op);
    if (parsed == Operation::GetCapabilityDescriptor || parsed == Operation::BindActor || parsed == Operation::RemoveActor)
        return *parsed;
    if (!parsed || !_descriptor.supports(op))
        throw DispatchError(ErrorKind::UnknownOperation, "operation '" + string(op) + "' is not supported by " + _descriptor.id());
    return *parsed;
}
//---------------------------------------------------------------------------
optional<Payload> ProviderCore::handleCommon(string_view actor, Operation op, PayloadView msg)
// Answer the operations every provider supports
{
    switch (op) {
        case Operation::GetCapabilityDescriptor:
            return codec::serialize(_descriptor);
        case Operation::BindActor: {
            if (actor != systemActor)
                throw DispatchError(ErrorKind::Rejected, "only the host may bind actors, not " + string(actor));
            auto config = codec::deserialize<CapabilityConfiguration>(msg);
            auto module = config.module;
            _bindings.bind(std::move(config));
            spdlog::info("[{}] bound actor {}", _descriptor.name(), module);
            return Payload();
        }
        case Operation::RemoveActor: {
            if (actor != systemActor)
                throw DispatchError(ErrorKind::Rejected, "only the host may remove actors, not " + string(actor));
            auto config = codec::deserialize<CapabilityConfiguration>(msg);
            if (_bindings.remove(config.module))
                spdlog::info("[{}] removed actor {}", _descriptor.name(), config.module);
            return Payload();
        }
        default:
            return nullopt;
    }
}
//---------------------------------------------------------------------------
} // namespace caplink::core
