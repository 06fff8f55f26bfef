#pragma once
#include <cstdint>
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
namespace caplink::core {
//---------------------------------------------------------------------------
/// Sent from the system origin when an actor module is replaced
struct LiveUpdate {
    /// Raw bytes of the new module
    std::vector<uint8_t> newModule;

    /// Encode as payload object
    void toJson(Json::Value& object) const;
    /// Decode from payload object
    void fromJson(const Json::Value& object);
};
//---------------------------------------------------------------------------
/// Sent from the system origin, an actor answering with an empty result is healthy
struct HealthRequest {
    /// Reserved for finer grained checks
    bool placeholder = false;

    /// Encode as payload object
    void toJson(Json::Value& object) const;
    /// Decode from payload object
    void fromJson(const Json::Value& object);
};
//---------------------------------------------------------------------------
} // namespace caplink::core
