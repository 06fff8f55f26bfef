#pragma once
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace caplink::core {
//---------------------------------------------------------------------------
/// An opaque payload owned by the receiver of a call result
using Payload = std::vector<uint8_t>;
/// A borrowed payload passed into a call
using PayloadView = std::span<const uint8_t>;
//---------------------------------------------------------------------------
/// View the bytes of a string as payload
[[nodiscard]] inline PayloadView asPayload(std::string_view data) noexcept {
    return PayloadView(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}
/// View a payload as string
[[nodiscard]] inline std::string_view asString(PayloadView payload) noexcept {
    return std::string_view(reinterpret_cast<const char*>(payload.data()), payload.size());
}
//---------------------------------------------------------------------------
} // namespace caplink::core
