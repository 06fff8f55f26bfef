#include "extras/messages.hpp"
#include "codec/codec.hpp"
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace caplink::extras {
//---------------------------------------------------------------------------
void GeneratorRequest::toJson(Json::Value& object) const
// Encode as payload object
{
    object["guid"] = guid;
    object["sequence"] = sequence;
    object["random"] = random;
    object["min"] = Json::UInt(min);
    object["max"] = Json::UInt(max);
}
//---------------------------------------------------------------------------
void GeneratorRequest::fromJson(const Json::Value& object)
// Decode from payload object
{
    guid = codec::readBool(object, "guid");
    sequence = codec::readBool(object, "sequence");
    random = codec::readBool(object, "random");
    min = codec::readUInt32(object, "min");
    max = codec::readUInt32(object, "max");
}
//---------------------------------------------------------------------------
void GeneratorResult::toJson(Json::Value& object) const
// Encode as payload object, an absent guid is null
{
    object["guid"] = guid ? Json::Value(*guid) : Json::Value(Json::nullValue);
    object["sequenceNumber"] = Json::UInt64(sequenceNumber);
    object["randomNumber"] = Json::UInt(randomNumber);
}
//---------------------------------------------------------------------------
void GeneratorResult::fromJson(const Json::Value& object)
// Decode from payload object
{
    guid.reset();
    if (object.isMember("guid") && !object["guid"].isNull())
        guid = codec::readString(object, "guid");
    sequenceNumber = codec::readUInt64(object, "sequenceNumber");
    randomNumber = codec::readUInt32(object, "randomNumber");
}
//---------------------------------------------------------------------------
} // namespace caplink::extras
