#include "core/configuration.hpp"
#include "codec/codec.hpp"
#include "core/error.hpp"
#include <charconv>
#include <mutex>
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
namespace {
//---------------------------------------------------------------------------
vector<string> splitList(string_view list)
// Split a comma separated list, empty entries are skipped
{
    vector<string> result;
    while (!list.empty()) {
        auto pos = list.find(',');
        auto entry = list.substr(0, pos);
        if (!entry.empty())
            result.emplace_back(entry);
        if (pos == string_view::npos)
            break;
        list.remove_prefix(pos + 1);
    }
    return result;
}
//---------------------------------------------------------------------------
string joinList(const vector<string>& list)
// Join a list with commas
{
    string result;
    for (auto& entry : list) {
        if (!result.empty())
            result += ',';
        result += entry;
    }
    return result;
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
optional<string> CapabilityConfiguration::get(string_view key) const
// Get a value
{
    auto it = values.find(string(key));
    if (it == values.end())
        return nullopt;
    return it->second;
}
//---------------------------------------------------------------------------
void CapabilityConfiguration::toJson(Json::Value& object) const
// Encode as payload object
{
    object["module"] = module;
    codec::writeStringMap(object, "values", values);
}
//---------------------------------------------------------------------------
void CapabilityConfiguration::fromJson(const Json::Value& object)
// Decode from payload object
{
    module = codec::readString(object, "module");
    values = codec::readStringMap(object, "values");
}
//---------------------------------------------------------------------------
ActorClaims ActorClaims::fromConfiguration(const CapabilityConfiguration& config)
// Extract the claims
{
    ActorClaims result;
    result.issuer = config.get(claims::issuer).value_or("");
    result.name = config.get(claims::name).value_or("");
    result.capabilities = splitList(config.get(claims::capabilities).value_or(""));
    result.tags = splitList(config.get(claims::tags).value_or(""));
    if (auto expires = config.get(claims::expires); expires && !expires->empty()) {
        auto [ptr, ec] = from_chars(expires->data(), expires->data() + expires->size(), result.expires);
        if (ec != errc() || ptr != expires->data() + expires->size())
            throw DispatchError(ErrorKind::Malformed, "invalid expiration claim '" + *expires + "'");
    }
    return result;
}
//---------------------------------------------------------------------------
void ActorClaims::applyTo(CapabilityConfiguration& config) const
// Store the claims under the reserved keys
{
    config.values[string(claims::issuer)] = issuer;
    config.values[string(claims::name)] = name;
    config.values[string(claims::capabilities)] = joinList(capabilities);
    config.values[string(claims::tags)] = joinList(tags);
    config.values[string(claims::expires)] = to_string(expires);
}
//---------------------------------------------------------------------------
bool ActorClaims::declares(string_view capabilityId) const
// Has the actor declared the capability?
{
    for (auto& capability : capabilities)
        if (capability == capabilityId)
            return true;
    return false;
}
//---------------------------------------------------------------------------
void BindingTable::bind(CapabilityConfiguration config)
// Bind or rebind an actor
{
    if (config.module.empty())
        throw DispatchError(ErrorKind::Malformed, "binding without module");
    unique_lock lock(_mutex);
    auto module = config.module;
    _bindings.insert_or_assign(std::move(module), std::move(config));
}
//---------------------------------------------------------------------------
bool BindingTable::remove(string_view module)
// Remove a binding
{
    unique_lock lock(_mutex);
    return _bindings.erase(string(module));
}
//---------------------------------------------------------------------------
optional<CapabilityConfiguration> BindingTable::find(string_view module) const
// Get a copy of the binding
{
    shared_lock lock(_mutex);
    auto it = _bindings.find(string(module));
    if (it == _bindings.end())
        return nullopt;
    return it->second;
}
//---------------------------------------------------------------------------
bool BindingTable::contains(string_view module) const
// Is the actor bound?
{
    shared_lock lock(_mutex);
    return _bindings.count(string(module));
}
//---------------------------------------------------------------------------
uint64_t BindingTable::size() const
// The number of bound actors
{
    shared_lock lock(_mutex);
    return _bindings.size();
}
//---------------------------------------------------------------------------
} // namespace caplink::core
