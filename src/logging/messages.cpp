#include "logging/messages.hpp"
#include "codec/codec.hpp"
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace caplink::logging {
//---------------------------------------------------------------------------
void WriteLogRequest::toJson(Json::Value& object) const
// Encode as payload object
{
    object["level"] = Json::UInt(level);
    object["body"] = body;
}
//---------------------------------------------------------------------------
void WriteLogRequest::fromJson(const Json::Value& object)
// Decode from payload object
{
    level = codec::readUInt32(object, "level");
    body = codec::readString(object, "body");
}
//---------------------------------------------------------------------------
} // namespace caplink::logging
