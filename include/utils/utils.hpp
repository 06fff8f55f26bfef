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
namespace caplink::utils {
//---------------------------------------------------------------------------
/// Encode everything from binary representation to hex
std::string hexEncode(const uint8_t* input, uint64_t length, bool upper = false);
/// Encode everything from binary representation to base64
std::string base64Encode(const uint8_t* input, uint64_t length);
/// Decodes from base64 to raw bytes
std::vector<uint8_t> base64Decode(const uint8_t* input, uint64_t length);
/// Fill the buffer with cryptographically strong random bytes
void randomBytes(uint8_t* output, uint64_t length);
/// Generate a random uniform number in [min, max]
uint32_t randomRange(uint32_t min, uint32_t max);
/// Generate a version 4 guid string
std::string generateGuid();
//---------------------------------------------------------------------------
} // namespace caplink::utils
