#include "extras/provider.hpp"
#include "codec/codec.hpp"
#include "core/error.hpp"
#include "core/operations.hpp"
#include "extras/messages.hpp"
#include "utils/utils.hpp"
#include <spdlog/spdlog.h>
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace caplink::extras {
//---------------------------------------------------------------------------
using namespace std;
using core::DispatchError;
using core::ErrorKind;
using core::Operation;
using core::OperationDirection;
using core::Payload;
using core::PayloadView;
//---------------------------------------------------------------------------
ExtrasProvider::ExtrasProvider() : _core(describe()), _sequence(0)
// The constructor
{
}
//---------------------------------------------------------------------------
core::CapabilityDescriptor ExtrasProvider::describe()
// The descriptor of the extras capability
{
    return core::DescriptorBuilder()
        .withId(core::capability::extras)
        .withName("CapLink Extras")
        .withVersion("0.2.0")
        .withRevision(2)
        .withLongDescription("Guid, sequence number and random number generation")
        .withOperation(Operation::RequestGuid, OperationDirection::ToProvider, "Generate a version 4 guid")
        .withOperation(Operation::RequestSequence, OperationDirection::ToProvider, "Get the next number of a strictly increasing sequence")
        .withOperation(Operation::RequestRandom, OperationDirection::ToProvider, "Get a uniform random number in [min, max]")
        .build();
}
//---------------------------------------------------------------------------
void ExtrasProvider::configureDispatch(unique_ptr<core::Dispatcher> dispatcher)
// Hand over the dispatcher
{
    _core.dispatcher().install(move(dispatcher));
}
//---------------------------------------------------------------------------
Payload ExtrasProvider::handleCall(string_view actor, string_view op, PayloadView msg)
// Handle an actor-initiated operation
{
    auto operation = _core.resolve(op);
    if (auto reply = _core.handleCommon(actor, operation, msg))
        return move(*reply);

    auto request = codec::deserialize<GeneratorRequest>(msg);
    GeneratorResult result;
    switch (operation) {
        case Operation::RequestGuid:
            if (!request.guid)
                throw DispatchError(ErrorKind::Rejected, "RequestGuid without the guid flag");
            result.guid = utils::generateGuid();
            break;
        case Operation::RequestSequence:
            if (!request.sequence)
                throw DispatchError(ErrorKind::Rejected, "RequestSequence without the sequence flag");
            result.sequenceNumber = ++_sequence;
            break;
        case Operation::RequestRandom:
            if (!request.random)
                throw DispatchError(ErrorKind::Rejected, "RequestRandom without the random flag");
            if (request.min > request.max)
                throw DispatchError(ErrorKind::Malformed, "random range [" + to_string(request.min) + ", " + to_string(request.max) + "] is empty");
            result.randomNumber = utils::randomRange(request.min, request.max);
            break;
        default:
            throw DispatchError(ErrorKind::UnknownOperation, "operation '" + string(op) + "' is not handled by extras");
    }
    spdlog::debug("[ExtrasProvider] {} for {}", op, actor);
    return codec::serialize(result);
}
//---------------------------------------------------------------------------
} // namespace caplink::extras
