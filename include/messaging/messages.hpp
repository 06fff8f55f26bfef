#pragma once
#include <cstdint>
#include <string>
#include <vector>
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace Json {
class Value;
} // namespace Json
//---------------------------------------------------------------------------
namespace caplink::messaging {
//---------------------------------------------------------------------------
/// A message published to or delivered from the broker
struct BrokerMessage {
    /// The subject
    std::string subject;
    /// The subject a reply is expected on, empty for none
    std::string replyTo;
    /// The opaque body
    std::vector<uint8_t> body;

    /// Encode as payload object
    void toJson(Json::Value& object) const;
    /// Decode from payload object
    void fromJson(const Json::Value& object);
    /// Equality
    bool operator==(const BrokerMessage& other) const = default;
};
//---------------------------------------------------------------------------
/// A request expecting exactly one reply within the timeout
struct RequestMessage {
    /// The subject
    std::string subject;
    /// The opaque body
    std::vector<uint8_t> body;
    /// The timeout in milliseconds, sent as "timeout"
    int64_t timeoutMs = 0;

    /// Encode as payload object
    void toJson(Json::Value& object) const;
    /// Decode from payload object
    void fromJson(const Json::Value& object);
};
//---------------------------------------------------------------------------
} // namespace caplink::messaging
