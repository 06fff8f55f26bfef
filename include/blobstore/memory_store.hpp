#pragma once
#include "blobstore/store.hpp"
#include <shared_mutex>
#include <unordered_map>
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace caplink::blobstore {
//---------------------------------------------------------------------------
/// Keeps all blobs in memory
class MemoryStore : public BlobStore {
    /// The blobs of one container
    using container_type = std::unordered_map<std::string, std::vector<uint8_t>>;

    /// The lock
    mutable std::shared_mutex _mutex;
    /// The containers
    std::unordered_map<std::string, container_type> _containers;

    public:
    /// Create a container
    void createContainer(const std::string& container) override;
    /// Remove a container
    void removeContainer(const std::string& container) override;
    /// Does the container exist?
    [[nodiscard]] bool containerExists(const std::string& container) const override;
    /// List the blobs of a container
    [[nodiscard]] std::vector<Blob> listObjects(const std::string& container) const override;
    /// Get the metadata of a blob
    [[nodiscard]] std::optional<Blob> objectInfo(const std::string& container, const std::string& id) const override;
    /// Store a blob
    void putObject(const std::string& container, const std::string& id, std::vector<uint8_t> data) override;
    /// Read a whole blob
    [[nodiscard]] std::vector<uint8_t> getObject(const std::string& container, const std::string& id) const override;
    /// Remove a blob
    void removeObject(const std::string& container, const std::string& id) override;
};
//---------------------------------------------------------------------------
} // namespace caplink::blobstore
