#include "messaging/messages.hpp"
#include "codec/codec.hpp"
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace caplink::messaging {
//---------------------------------------------------------------------------
void BrokerMessage::toJson(Json::Value& object) const
// Encode as payload object
{
    object["subject"] = subject;
    object["replyTo"] = replyTo;
    codec::writeBytes(object, "body", body);
}
//---------------------------------------------------------------------------
void BrokerMessage::fromJson(const Json::Value& object)
// Decode from payload object
{
    subject = codec::readString(object, "subject");
    replyTo = codec::readString(object, "replyTo");
    body = codec::readBytes(object, "body");
}
//---------------------------------------------------------------------------
void RequestMessage::toJson(Json::Value& object) const
// Encode as payload object
{
    object["subject"] = subject;
    codec::writeBytes(object, "body", body);
    object["timeout"] = Json::Int64(timeoutMs);
}
//---------------------------------------------------------------------------
void RequestMessage::fromJson(const Json::Value& object)
// Decode from payload object
{
    subject = codec::readString(object, "subject");
    body = codec::readBytes(object, "body");
    timeoutMs = codec::readInt64(object, "timeout");
}
//---------------------------------------------------------------------------
} // namespace caplink::messaging
