#pragma once
#include "blobstore/messages.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace caplink::blobstore {
//---------------------------------------------------------------------------
/// Implements the backing object store abstraction of the blob store provider.
/// Each store owns its container namespace exclusively and is thread-safe.
class BlobStore {
    public:
    /// The destructor
    virtual ~BlobStore() noexcept = default;

    /// Create a container, existing containers are kept
    virtual void createContainer(const std::string& container) = 0;
    /// Remove a container with all its blobs, absent containers are ignored
    virtual void removeContainer(const std::string& container) = 0;
    /// Does the container exist?
    [[nodiscard]] virtual bool containerExists(const std::string& container) const = 0;
    /// List the blobs of a container, order unspecified, throws Rejected for absent containers
    [[nodiscard]] virtual std::vector<Blob> listObjects(const std::string& container) const = 0;
    /// Get the metadata of a blob
    [[nodiscard]] virtual std::optional<Blob> objectInfo(const std::string& container, const std::string& id) const = 0;
    /// Store a blob, replacing an existing one, throws Rejected for absent containers
    virtual void putObject(const std::string& container, const std::string& id, std::vector<uint8_t> data) = 0;
    /// Read a whole blob, throws Rejected for absent blobs
    [[nodiscard]] virtual std::vector<uint8_t> getObject(const std::string& container, const std::string& id) const = 0;
    /// Remove a blob, absent blobs are ignored
    virtual void removeObject(const std::string& container, const std::string& id) = 0;

    /// Create a store, an empty root directory selects the memory store
    [[nodiscard]] static std::unique_ptr<BlobStore> makeStore(const std::string& rootDirectory);
};
//---------------------------------------------------------------------------
} // namespace caplink::blobstore
