#include "codec/codec.hpp"
#include "utils/utils.hpp"
#include <cstring>
#include <memory>
#include <stdexcept>
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace caplink::codec {
//---------------------------------------------------------------------------
using namespace std;
using core::DispatchError;
using core::ErrorKind;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
[[noreturn]] void mistyped(const char* key, const char* expected)
// Raise a malformed error for a field of the wrong type
{
    throw DispatchError(ErrorKind::Malformed, string("field ") + key + " is not " + expected);
}
//---------------------------------------------------------------------------
const Json::Value* field(const Json::Value& object, const char* key)
// The field or nullptr when absent
{
    if (!object.isObject())
        throw DispatchError(ErrorKind::Malformed, "payload is not an object");
    auto* value = object.find(key, key + strlen(key));
    if (!value || value->isNull())
        return nullptr;
    return value;
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
core::Payload encode(const Json::Value& object)
// Encode an object as compact payload bytes
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    auto text = Json::writeString(builder, object);
    return core::Payload(text.begin(), text.end());
}
//---------------------------------------------------------------------------
Json::Value decode(core::PayloadView payload)
// Decode payload bytes into an object
{
    Json::Value object(Json::objectValue);
    if (payload.empty())
        return object;

    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["failIfExtra"] = true;
    unique_ptr<Json::CharReader> reader(builder.newCharReader());
    string errors;
    auto begin = reinterpret_cast<const char*>(payload.data());
    if (!reader->parse(begin, begin + payload.size(), &object, &errors))
        throw DispatchError(ErrorKind::Malformed, "undecodable payload: " + errors);
    if (!object.isObject())
        throw DispatchError(ErrorKind::Malformed, "payload is not an object");
    return object;
}
//---------------------------------------------------------------------------
string readString(const Json::Value& object, const char* key)
// Read a string field
{
    auto* value = field(object, key);
    if (!value)
        return {};
    if (!value->isString())
        mistyped(key, "a string");
    return value->asString();
}
//---------------------------------------------------------------------------
uint64_t readUInt64(const Json::Value& object, const char* key)
// Read an unsigned field
{
    auto* value = field(object, key);
    if (!value)
        return 0;
    if (!value->isUInt64())
        mistyped(key, "an unsigned number");
    return value->asUInt64();
}
//---------------------------------------------------------------------------
uint32_t readUInt32(const Json::Value& object, const char* key)
// Read a 32 bit unsigned field
{
    auto* value = field(object, key);
    if (!value)
        return 0;
    if (!value->isUInt())
        mistyped(key, "a 32 bit unsigned number");
    return value->asUInt();
}
//---------------------------------------------------------------------------
int64_t readInt64(const Json::Value& object, const char* key)
// Read a signed field
{
    auto* value = field(object, key);
    if (!value)
        return 0;
    if (!value->isInt64())
        mistyped(key, "a signed number");
    return value->asInt64();
}
//---------------------------------------------------------------------------
bool readBool(const Json::Value& object, const char* key)
// Read a bool field
{
    auto* value = field(object, key);
    if (!value)
        return false;
    if (!value->isBool())
        mistyped(key, "a bool");
    return value->asBool();
}
//---------------------------------------------------------------------------
vector<uint8_t> readBytes(const Json::Value& object, const char* key)
// Read a base64 byte field
{
    auto encoded = readString(object, key);
    try {
        return utils::base64Decode(reinterpret_cast<const uint8_t*>(encoded.data()), encoded.size());
    } catch (const runtime_error& e) {
        throw DispatchError(ErrorKind::Malformed, string("field ") + key + ": " + e.what());
    }
}
//---------------------------------------------------------------------------
void writeBytes(Json::Value& object, const char* key, const vector<uint8_t>& bytes)
// Write a base64 byte field
{
    object[key] = utils::base64Encode(bytes.data(), bytes.size());
}
//---------------------------------------------------------------------------
unordered_map<string, string> readStringMap(const Json::Value& object, const char* key)
// Read a string map field
{
    unordered_map<string, string> result;
    auto* value = field(object, key);
    if (!value)
        return result;
    if (!value->isObject())
        mistyped(key, "a map");
    for (auto it = value->begin(); it != value->end(); ++it) {
        if (!it->isString())
            mistyped(key, "a map of strings");
        result.emplace(it.name(), it->asString());
    }
    return result;
}
//---------------------------------------------------------------------------
void writeStringMap(Json::Value& object, const char* key, const unordered_map<string, string>& values)
// Write a string map field
{
    Json::Value map(Json::objectValue);
    for (const auto& [name, value] : values)
        map[name] = value;
    object[key] = std::move(map);
}
//---------------------------------------------------------------------------
} // namespace caplink::codec
