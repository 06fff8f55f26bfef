#pragma once
#include "core/error.hpp"
#include "core/payload.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>
#include <json/json.h>
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace caplink::codec {
//---------------------------------------------------------------------------
// Payloads are field-name addressed objects. Every message type provides
//   void toJson(Json::Value& object) const;
//   void fromJson(const Json::Value& object);
// Absent fields decode to their defaults, mistyped fields are malformed.
//---------------------------------------------------------------------------
/// Encode an object as compact payload bytes
[[nodiscard]] core::Payload encode(const Json::Value& object);
/// Decode payload bytes into an object, an empty payload is an empty object
[[nodiscard]] Json::Value decode(core::PayloadView payload);
//---------------------------------------------------------------------------
/// Serialize a message
template <typename T>
[[nodiscard]] core::Payload serialize(const T& message) {
    Json::Value object(Json::objectValue);
    message.toJson(object);
    return encode(object);
}
//---------------------------------------------------------------------------
/// Deserialize a message
template <typename T>
[[nodiscard]] T deserialize(core::PayloadView payload) {
    auto object = decode(payload);
    T message{};
    try {
        message.fromJson(object);
    } catch (const Json::Exception& e) {
        throw core::DispatchError(core::ErrorKind::Malformed, e.what());
    }
    return message;
}
//---------------------------------------------------------------------------
/// Read a string field
[[nodiscard]] std::string readString(const Json::Value& object, const char* key);
/// Read an unsigned field
[[nodiscard]] uint64_t readUInt64(const Json::Value& object, const char* key);
/// Read a 32 bit unsigned field
[[nodiscard]] uint32_t readUInt32(const Json::Value& object, const char* key);
/// Read a signed field
[[nodiscard]] int64_t readInt64(const Json::Value& object, const char* key);
/// Read a bool field
[[nodiscard]] bool readBool(const Json::Value& object, const char* key);
/// Read a byte field (base64 on the wire)
[[nodiscard]] std::vector<uint8_t> readBytes(const Json::Value& object, const char* key);
/// Write a byte field (base64 on the wire)
void writeBytes(Json::Value& object, const char* key, const std::vector<uint8_t>& bytes);
/// Read a string map field
[[nodiscard]] std::unordered_map<std::string, std::string> readStringMap(const Json::Value& object, const char* key);
/// Write a string map field
void writeStringMap(Json::Value& object, const char* key, const std::unordered_map<std::string, std::string>& values);
/// Read a list field, each element decoded with fromJson
template <typename T>
[[nodiscard]] std::vector<T> readList(const Json::Value& object, const char* key) {
    std::vector<T> result;
    if (!object.isMember(key) || object[key].isNull())
        return result;
    const auto& list = object[key];
    if (!list.isArray())
        throw core::DispatchError(core::ErrorKind::Malformed, std::string("field ") + key + " is not a list");
    result.reserve(list.size());
    for (const auto& element : list) {
        if (!element.isObject())
            throw core::DispatchError(core::ErrorKind::Malformed, std::string("field ") + key + " holds a non-object");
        T value{};
        value.fromJson(element);
        result.push_back(std::move(value));
    }
    return result;
}
/// Write a list field, each element encoded with toJson
template <typename T>
void writeList(Json::Value& object, const char* key, const std::vector<T>& values) {
    Json::Value list(Json::arrayValue);
    for (const auto& value : values) {
        Json::Value element(Json::objectValue);
        value.toJson(element);
        list.append(std::move(element));
    }
    object[key] = std::move(list);
}
//---------------------------------------------------------------------------
} // namespace caplink::codec
