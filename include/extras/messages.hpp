#pragma once
#include <cstdint>
#include <optional>
#include <string>
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
namespace caplink::extras {
//---------------------------------------------------------------------------
/// Asks for exactly one generated value, selected by the flag
struct GeneratorRequest {
    /// Request a guid
    bool guid = false;
    /// Request a sequence number
    bool sequence = false;
    /// Request a random number
    bool random = false;
    /// The lower bound of the random number
    uint32_t min = 0;
    /// The upper bound of the random number
    uint32_t max = 0;

    /// Encode as payload object
    void toJson(Json::Value& object) const;
    /// Decode from payload object
    void fromJson(const Json::Value& object);
};
//---------------------------------------------------------------------------
/// The generated value, the other fields keep their defaults
struct GeneratorResult {
    /// The guid
    std::optional<std::string> guid;
    /// The sequence number
    uint64_t sequenceNumber = 0;
    /// The random number
    uint32_t randomNumber = 0;

    /// Encode as payload object
    void toJson(Json::Value& object) const;
    /// Decode from payload object
    void fromJson(const Json::Value& object);
};
//---------------------------------------------------------------------------
} // namespace caplink::extras
