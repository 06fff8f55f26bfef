#include "eventstreams/messages.hpp"
#include "codec/codec.hpp"
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace caplink::eventstreams {
//---------------------------------------------------------------------------
void Event::toJson(Json::Value& object) const
// Encode as payload object
{
    object["eventId"] = eventId;
    object["stream"] = stream;
    codec::writeStringMap(object, "values", values);
}
//---------------------------------------------------------------------------
void Event::fromJson(const Json::Value& object)
// Decode from payload object
{
    eventId = codec::readString(object, "eventId");
    stream = codec::readString(object, "stream");
    values = codec::readStringMap(object, "values");
}
//---------------------------------------------------------------------------
void WriteResponse::toJson(Json::Value& object) const
// Encode as payload object
{
    object["eventId"] = eventId;
}
//---------------------------------------------------------------------------
void WriteResponse::fromJson(const Json::Value& object)
// Decode from payload object
{
    eventId = codec::readString(object, "eventId");
}
//---------------------------------------------------------------------------
void TimeRange::toJson(Json::Value& object) const
// Encode as payload object
{
    object["minTime"] = Json::UInt64(minTime);
    object["maxTime"] = Json::UInt64(maxTime);
}
//---------------------------------------------------------------------------
void TimeRange::fromJson(const Json::Value& object)
// Decode from payload object
{
    minTime = codec::readUInt64(object, "minTime");
    maxTime = codec::readUInt64(object, "maxTime");
}
//---------------------------------------------------------------------------
void StreamQuery::toJson(Json::Value& object) const
// Encode as payload object, an absent range is null
{
    object["streamId"] = streamId;
    if (range) {
        Json::Value window(Json::objectValue);
        range->toJson(window);
        object["range"] = std::move(window);
    } else {
        object["range"] = Json::Value(Json::nullValue);
    }
    object["count"] = Json::UInt64(count);
}
//---------------------------------------------------------------------------
void StreamQuery::fromJson(const Json::Value& object)
// Decode from payload object
{
    streamId = codec::readString(object, "streamId");
    range.reset();
    if (object.isMember("range") && !object["range"].isNull()) {
        if (!object["range"].isObject())
            throw core::DispatchError(core::ErrorKind::Malformed, "field range is not an object");
        range.emplace();
        range->fromJson(object["range"]);
    }
    count = codec::readUInt64(object, "count");
}
//---------------------------------------------------------------------------
void StreamResults::toJson(Json::Value& object) const
// Encode as payload object
{
    codec::writeList(object, "events", events);
}
//---------------------------------------------------------------------------
void StreamResults::fromJson(const Json::Value& object)
// Decode from payload object
{
    events = codec::readList<Event>(object, "events");
}
//---------------------------------------------------------------------------
} // namespace caplink::eventstreams
