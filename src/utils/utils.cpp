#include "utils/utils.hpp"
#include <cassert>
#include <limits>
#include <stdexcept>
#include <utility>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace caplink {
namespace utils {
//---------------------------------------------------------------------------
string base64Encode(const uint8_t* input, uint64_t length)
// Encodes a string as a base64 string
{
    if (!in_range<int>(length))
        throw runtime_error("Base64 input too large!");
    auto baseLength = 4 * ((length + 2) / 3);
    string output(baseLength + 1, '\0');
    auto encodeLength = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(output.data()), input, static_cast<int>(length));
    if (encodeLength < 0 || static_cast<unsigned>(encodeLength) != baseLength)
        throw runtime_error("OpenSSL Error!");
    output.resize(static_cast<unsigned>(encodeLength));
    return output;
}
//---------------------------------------------------------------------------
vector<uint8_t> base64Decode(const uint8_t* input, uint64_t length)
// Decodes from base64 to raw bytes
{
    if (!length)
        return {};
    if (!in_range<int>(length) || length % 4)
        throw runtime_error("Invalid base64 length!");
    auto baseLength = 3 * length / 4;
    vector<uint8_t> output(baseLength);
    auto decodeLength = EVP_DecodeBlock(output.data(), input, static_cast<int>(length));
    if (decodeLength < 0 || static_cast<unsigned>(decodeLength) != baseLength)
        throw runtime_error("OpenSSL Error!");
    // EVP_DecodeBlock keeps the padding as zero bytes
    for (auto pad = 0u; pad < 2 && input[length - 1 - pad] == '='; pad++)
        --decodeLength;
    output.resize(static_cast<unsigned>(decodeLength));
    return output;
}
//---------------------------------------------------------------------------
string hexEncode(const uint8_t* input, uint64_t length, bool upper)
// Encodes a string as a hex string
{
    const char hex[] = "0123456789abcdef";
    string output;
    output.reserve(length << 1);
    for (auto i = 0u; i < length; i++) {
        output.push_back(upper ? static_cast<char>(toupper(hex[input[i] >> 4])) : hex[input[i] >> 4]);
        output.push_back(upper ? static_cast<char>(toupper(hex[input[i] & 15])) : hex[input[i] & 15]);
    }
    return output;
}
//---------------------------------------------------------------------------
void randomBytes(uint8_t* output, uint64_t length)
// Fill the buffer from the OpenSSL CSPRNG
{
    if (!in_range<int>(length))
        throw runtime_error("Random request too large!");
    if (RAND_bytes(output, static_cast<int>(length)) != 1)
        throw runtime_error("OpenSSL Random Error: " + to_string(ERR_get_error()));
}
//---------------------------------------------------------------------------
uint32_t randomRange(uint32_t min, uint32_t max)
// Uniform number in [min, max] by rejection sampling
{
    assert(min <= max);
    uint64_t span = static_cast<uint64_t>(max) - min + 1;
    uint64_t limit = (static_cast<uint64_t>(numeric_limits<uint32_t>::max()) + 1) / span * span;
    while (true) {
        uint32_t value;
        randomBytes(reinterpret_cast<uint8_t*>(&value), sizeof(value));
        if (value < limit)
            return static_cast<uint32_t>(min + value % span);
    }
}
//---------------------------------------------------------------------------
string generateGuid()
// Version 4 guid, 8-4-4-4-12 hex digits
{
    uint8_t bytes[16];
    randomBytes(bytes, sizeof(bytes));
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0f) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3f) | 0x80);
    auto hex = hexEncode(bytes, sizeof(bytes));
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" + hex.substr(16, 4) + "-" + hex.substr(20);
}
//---------------------------------------------------------------------------
}; // namespace utils
}; // namespace caplink
