#include "core/capability_descriptor.hpp"
#include "codec/codec.hpp"
#include "core/error.hpp"
#include <json/json.h>
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace caplink::core {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
static string quoted(const string& value)
// Quote a string, control characters including NUL are escaped
{
    return string(asString(codec::encode(Json::Value(value))));
}
//---------------------------------------------------------------------------
string_view directionName(OperationDirection direction) noexcept
// Get the textual form of a direction
{
    switch (direction) {
        case OperationDirection::ToActor: return "to_actor";
        case OperationDirection::ToProvider: return "to_provider";
        case OperationDirection::Both: return "both";
    }
    return "";
}
//---------------------------------------------------------------------------
optional<OperationDirection> parseDirection(string_view name) noexcept
// Parse the textual form of a direction
{
    if (name == "to_actor")
        return OperationDirection::ToActor;
    if (name == "to_provider")
        return OperationDirection::ToProvider;
    if (name == "both")
        return OperationDirection::Both;
    return nullopt;
}
//---------------------------------------------------------------------------
void OperationDescriptor::toJson(Json::Value& object) const
// Encode as payload object
{
    object["name"] = name;
    object["direction"] = string(directionName(direction));
    object["doctext"] = doctext;
}
//---------------------------------------------------------------------------
void OperationDescriptor::fromJson(const Json::Value& object)
// Decode from payload object
{
    name = codec::readString(object, "name");
    doctext = codec::readString(object, "doctext");
    auto text = codec::readString(object, "direction");
    auto parsed = parseDirection(text);
    if (!parsed)
        throw DispatchError(ErrorKind::Malformed, "unknown operation direction '" + text + "'");
    direction = *parsed;
}
//---------------------------------------------------------------------------
const OperationDescriptor* CapabilityDescriptor::find(string_view name) const
// Find an operation by name
{
    for (auto& op : _operations)
        if (op.name == name)
            return &op;
    return nullptr;
}
//---------------------------------------------------------------------------
bool CapabilityDescriptor::supersedes(const CapabilityDescriptor& other) const
// Same id and strictly larger revision
{
    return _id == other._id && _revision > other._revision;
}
//---------------------------------------------------------------------------
string CapabilityDescriptor::toText() const
// The textual form, written by hand to keep the field order stable
{
    string text = "{\"id\":" + quoted(_id);
    text += ",\"name\":" + quoted(_name);
    text += ",\"version\":" + quoted(_version);
    text += ",\"revision\":" + to_string(_revision);
    text += ",\"long_description\":" + quoted(_longDescription);
    text += ",\"supported_operations\":[";
    for (auto i = 0ull; i < _operations.size(); i++) {
        auto& op = _operations[i];
        if (i)
            text += ",";
        text += "{\"name\":" + quoted(op.name);
        text += ",\"direction\":\"" + string(directionName(op.direction)) + "\"";
        text += ",\"doctext\":" + quoted(op.doctext) + "}";
    }
    text += "]}";
    return text;
}
//---------------------------------------------------------------------------
CapabilityDescriptor CapabilityDescriptor::fromText(string_view text)
// Parse the textual form
{
    return codec::deserialize<CapabilityDescriptor>(asPayload(text));
}
//---------------------------------------------------------------------------
void CapabilityDescriptor::toJson(Json::Value& object) const
// Encode as payload object
{
    object["id"] = _id;
    object["name"] = _name;
    object["version"] = _version;
    object["revision"] = _revision;
    object["long_description"] = _longDescription;
    codec::writeList(object, "supported_operations", _operations);
}
//---------------------------------------------------------------------------
void CapabilityDescriptor::fromJson(const Json::Value& object)
// Decode from payload object
{
    _id = codec::readString(object, "id");
    _name = codec::readString(object, "name");
    _version = codec::readString(object, "version");
    _revision = codec::readUInt32(object, "revision");
    _longDescription = codec::readString(object, "long_description");
    _operations.clear();
    for (auto& op : codec::readList<OperationDescriptor>(object, "supported_operations")) {
        if (find(op.name))
            throw DispatchError(ErrorKind::InvalidDescriptor, "duplicate operation '" + op.name + "'");
        _operations.push_back(std::move(op));
    }
}
//---------------------------------------------------------------------------
DescriptorBuilder DescriptorBuilder::withId(string_view id) const
// Set the capability id
{
    auto copy = *this;
    copy._descriptor._id = id;
    return copy;
}
//---------------------------------------------------------------------------
DescriptorBuilder DescriptorBuilder::withName(string_view name) const
// Set the name
{
    auto copy = *this;
    copy._descriptor._name = name;
    return copy;
}
//---------------------------------------------------------------------------
DescriptorBuilder DescriptorBuilder::withVersion(string_view version) const
// Set the version
{
    auto copy = *this;
    copy._descriptor._version = version;
    return copy;
}
//---------------------------------------------------------------------------
DescriptorBuilder DescriptorBuilder::withRevision(uint32_t revision) const
// Set the revision
{
    auto copy = *this;
    copy._descriptor._revision = revision;
    return copy;
}
//---------------------------------------------------------------------------
DescriptorBuilder DescriptorBuilder::withLongDescription(string_view description) const
// Set the long description
{
    auto copy = *this;
    copy._descriptor._longDescription = description;
    return copy;
}
//---------------------------------------------------------------------------
DescriptorBuilder DescriptorBuilder::withOperation(string_view name, OperationDirection direction, string_view doctext) const
// Add an operation
{
    if (name.empty())
        throw DispatchError(ErrorKind::InvalidDescriptor, "operation without name");
    if (_descriptor.find(name))
        throw DispatchError(ErrorKind::InvalidDescriptor, "duplicate operation '" + string(name) + "'");
    auto copy = *this;
    copy._descriptor._operations.push_back(OperationDescriptor{string(name), direction, string(doctext)});
    return copy;
}
//---------------------------------------------------------------------------
CapabilityDescriptor DescriptorBuilder::build() const
// Produce the descriptor
{
    if (_descriptor._id.empty())
        throw DispatchError(ErrorKind::InvalidDescriptor, "descriptor without capability id");
    return _descriptor;
}
//---------------------------------------------------------------------------
} // namespace caplink::core
