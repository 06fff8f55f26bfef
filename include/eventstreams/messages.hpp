#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
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
namespace caplink::eventstreams {
//---------------------------------------------------------------------------
/// One event of a stream
struct Event {
    /// The event id
    std::string eventId;
    /// The stream
    std::string stream;
    /// The values
    std::unordered_map<std::string, std::string> values;

    /// Encode as payload object
    void toJson(Json::Value& object) const;
    /// Decode from payload object
    void fromJson(const Json::Value& object);
    /// Equality
    bool operator==(const Event& other) const = default;
};
//---------------------------------------------------------------------------
/// The answer to WriteEvent
struct WriteResponse {
    /// The id assigned to the event
    std::string eventId;

    /// Encode as payload object
    void toJson(Json::Value& object) const;
    /// Decode from payload object
    void fromJson(const Json::Value& object);
};
//---------------------------------------------------------------------------
/// An inclusive time window
struct TimeRange {
    /// The start
    uint64_t minTime = 0;
    /// The end
    uint64_t maxTime = 0;

    /// Encode as payload object
    void toJson(Json::Value& object) const;
    /// Decode from payload object
    void fromJson(const Json::Value& object);
    /// Equality
    bool operator==(const TimeRange& other) const = default;
};
//---------------------------------------------------------------------------
/// A query over one stream
struct StreamQuery {
    /// The stream
    std::string streamId;
    /// The window, absent for the whole stream
    std::optional<TimeRange> range;
    /// The maximum number of events
    uint64_t count = 0;

    /// Encode as payload object
    void toJson(Json::Value& object) const;
    /// Decode from payload object
    void fromJson(const Json::Value& object);
};
//---------------------------------------------------------------------------
/// The answer to QueryStream
struct StreamResults {
    /// The events
    std::vector<Event> events;

    /// Encode as payload object
    void toJson(Json::Value& object) const;
    /// Decode from payload object
    void fromJson(const Json::Value& object);
};
//---------------------------------------------------------------------------
} // namespace caplink::eventstreams
