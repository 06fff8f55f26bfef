#include "core/messages.hpp"
#include "codec/codec.hpp"
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace caplink::core {
//---------------------------------------------------------------------------
void LiveUpdate::toJson(Json::Value& object) const
// Encode as payload object
{
    codec::writeBytes(object, "newModule", newModule);
}
//---------------------------------------------------------------------------
void LiveUpdate::fromJson(const Json::Value& object)
// Decode from payload object
{
    newModule = codec::readBytes(object, "newModule");
}
//---------------------------------------------------------------------------
void HealthRequest::toJson(Json::Value& object) const
// Encode as payload object
{
    object["placeholder"] = placeholder;
}
//---------------------------------------------------------------------------
void HealthRequest::fromJson(const Json::Value& object)
// Decode from payload object
{
    placeholder = codec::readBool(object, "placeholder");
}
//---------------------------------------------------------------------------
} // namespace caplink::core
