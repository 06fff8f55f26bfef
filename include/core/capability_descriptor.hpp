#pragma once
#include "core/operations.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
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
/// The direction in which an operation is invoked
enum class OperationDirection : uint8_t {
    /// The provider calls the actor
    ToActor,
    /// The actor calls the provider
    ToProvider,
    /// Both directions
    Both
};
//---------------------------------------------------------------------------
/// Get the textual form of a direction (to_actor, to_provider, both)
[[nodiscard]] std::string_view directionName(OperationDirection direction) noexcept;
/// Parse the textual form of a direction
[[nodiscard]] std::optional<OperationDirection> parseDirection(std::string_view name) noexcept;
//---------------------------------------------------------------------------
/// A single operation supported by a provider
struct OperationDescriptor {
    /// The name, unique per capability id
    std::string name;
    /// The direction
    OperationDirection direction = OperationDirection::ToProvider;
    /// Documentation text
    std::string doctext;

    /// Encode as payload object
    void toJson(Json::Value& object) const;
    /// Decode from payload object
    void fromJson(const Json::Value& object);

    /// Equality
    bool operator==(const OperationDescriptor& other) const = default;
};
//---------------------------------------------------------------------------
/// The immutable identity and operation list of a capability provider
class CapabilityDescriptor {
    /// The capability id, e.g. caplink:blobstore
    std::string _id;
    /// The human-friendly name
    std::string _name;
    /// The semver version string
    std::string _version;
    /// The monotonically increasing revision
    uint32_t _revision = 0;
    /// A longer documentation-friendly description
    std::string _longDescription;
    /// The supported operations
    std::vector<OperationDescriptor> _operations;

    friend class DescriptorBuilder;

    public:
    /// The empty descriptor
    CapabilityDescriptor() = default;

    /// Get the capability id
    [[nodiscard]] const std::string& id() const { return _id; }
    /// Get the name
    [[nodiscard]] const std::string& name() const { return _name; }
    /// Get the version
    [[nodiscard]] const std::string& version() const { return _version; }
    /// Get the revision
    [[nodiscard]] uint32_t revision() const { return _revision; }
    /// Get the long description
    [[nodiscard]] const std::string& longDescription() const { return _longDescription; }
    /// Get the supported operations
    [[nodiscard]] const std::vector<OperationDescriptor>& operations() const { return _operations; }

    /// Find an operation by name
    [[nodiscard]] const OperationDescriptor* find(std::string_view name) const;
    /// Is the operation supported?
    [[nodiscard]] bool supports(std::string_view name) const { return find(name); }
    /// Is the operation supported?
    [[nodiscard]] bool supports(Operation op) const { return find(operationName(op)); }
    /// Does this descriptor replace the other one (same id, larger revision)?
    [[nodiscard]] bool supersedes(const CapabilityDescriptor& other) const;

    /// The textual form with the fixed field order id, name, version, revision, long_description, supported_operations
    [[nodiscard]] std::string toText() const;
    /// Parse the textual form
    [[nodiscard]] static CapabilityDescriptor fromText(std::string_view text);

    /// Encode as payload object
    void toJson(Json::Value& object) const;
    /// Decode from payload object
    void fromJson(const Json::Value& object);

    /// Equality
    bool operator==(const CapabilityDescriptor& other) const = default;
};
//---------------------------------------------------------------------------
/// Accumulates descriptor settings, every setter returns an updated copy
class DescriptorBuilder {
    /// The descriptor under construction
    CapabilityDescriptor _descriptor;

    public:
    /// Set the capability id
    [[nodiscard]] DescriptorBuilder withId(std::string_view id) const;
    /// Set the name
    [[nodiscard]] DescriptorBuilder withName(std::string_view name) const;
    /// Set the version
    [[nodiscard]] DescriptorBuilder withVersion(std::string_view version) const;
    /// Set the revision
    [[nodiscard]] DescriptorBuilder withRevision(uint32_t revision) const;
    /// Set the long description
    [[nodiscard]] DescriptorBuilder withLongDescription(std::string_view description) const;
    /// Add an operation, a name that is already present is rejected
    [[nodiscard]] DescriptorBuilder withOperation(std::string_view name, OperationDirection direction, std::string_view doctext) const;
    /// Add a registered operation
    [[nodiscard]] DescriptorBuilder withOperation(Operation op, OperationDirection direction, std::string_view doctext) const {
        return withOperation(operationName(op), direction, doctext);
    }
    /// Produce the descriptor
    [[nodiscard]] CapabilityDescriptor build() const;
};
//---------------------------------------------------------------------------
} // namespace caplink::core
