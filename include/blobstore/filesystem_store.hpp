#pragma once
#include "blobstore/store.hpp"
#include <filesystem>
#include <mutex>
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace caplink::blobstore {
//---------------------------------------------------------------------------
/// Stores containers as directories and blobs as files below a root directory
class FileSystemStore : public BlobStore {
    /// The root directory
    std::filesystem::path _root;
    /// Serializes namespace changes
    mutable std::mutex _mutex;

    /// Get the directory of a container, rejects ids that escape the root
    [[nodiscard]] std::filesystem::path containerPath(const std::string& container) const;
    /// Get the file of a blob, rejects ids that escape the container
    [[nodiscard]] std::filesystem::path objectPath(const std::string& container, const std::string& id) const;

    public:
    /// The constructor, creates the root directory
    explicit FileSystemStore(std::filesystem::path root);

    /// Get the root directory
    [[nodiscard]] const std::filesystem::path& root() const { return _root; }

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
