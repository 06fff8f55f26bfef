#pragma once
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
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
namespace caplink::core {
//---------------------------------------------------------------------------
/// Reserved configuration keys carrying the identity claims of a bound actor
namespace claims {
/// The issuer of the actor's token
static constexpr std::string_view issuer = "__caplink_issuer";
/// The comma separated capability ids the actor declared
static constexpr std::string_view capabilities = "__caplink_capabilities";
/// The display name
static constexpr std::string_view name = "__caplink_name";
/// The expiration in seconds since the epoch
static constexpr std::string_view expires = "__caplink_expires";
/// The comma separated tags
static constexpr std::string_view tags = "__caplink_tags";
} // namespace claims
//---------------------------------------------------------------------------
/// Per-actor configuration handed to a provider when the actor is bound
struct CapabilityConfiguration {
    /// The public identity of the actor, an opaque key
    std::string module;
    /// Raw configuration values, unknown keys are extension data
    std::unordered_map<std::string, std::string> values;

    /// Get a value
    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;

    /// Encode as payload object
    void toJson(Json::Value& object) const;
    /// Decode from payload object
    void fromJson(const Json::Value& object);

    /// Equality
    bool operator==(const CapabilityConfiguration& other) const = default;
};
//---------------------------------------------------------------------------
/// The identity claims found in a configuration
struct ActorClaims {
    /// The issuer
    std::string issuer;
    /// The declared capabilities
    std::vector<std::string> capabilities;
    /// The display name
    std::string name;
    /// Expiration in seconds since the epoch, 0 never expires
    uint64_t expires = 0;
    /// The tags
    std::vector<std::string> tags;

    /// Extract the claims, absent keys are empty
    [[nodiscard]] static ActorClaims fromConfiguration(const CapabilityConfiguration& config);
    /// Store the claims under the reserved keys
    void applyTo(CapabilityConfiguration& config) const;
    /// Has the actor declared the capability?
    [[nodiscard]] bool declares(std::string_view capabilityId) const;
    /// Is the claim set expired at the given time?
    [[nodiscard]] bool expired(uint64_t nowSeconds) const { return expires && nowSeconds >= expires; }
};
//---------------------------------------------------------------------------
/// The actor bindings of one provider, thread-safe
class BindingTable {
    /// The lock
    mutable std::shared_mutex _mutex;
    /// The bindings keyed by module
    std::unordered_map<std::string, CapabilityConfiguration> _bindings;

    public:
    /// Bind or rebind an actor, a previous configuration is replaced
    void bind(CapabilityConfiguration config);
    /// Remove a binding, returns whether it existed
    bool remove(std::string_view module);
    /// Get a copy of the binding
    [[nodiscard]] std::optional<CapabilityConfiguration> find(std::string_view module) const;
    /// Is the actor bound?
    [[nodiscard]] bool contains(std::string_view module) const;
    /// The number of bound actors
    [[nodiscard]] uint64_t size() const;
};
//---------------------------------------------------------------------------
} // namespace caplink::core
