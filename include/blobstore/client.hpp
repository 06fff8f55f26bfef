#pragma once
#include "blobstore/messages.hpp"
#include "blobstore/transfer.hpp"
#include "core/payload.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
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
/// The actor side of the blob store operations.
/// Every operation is a single blocking call through the caller function.
class BlobClient {
    public:
    /// Invokes an operation on the blob store provider
    using Caller = std::function<core::Payload(std::string_view op, core::PayloadView msg)>;

    private:
    /// The caller
    Caller _caller;

    /// Invoke an operation
    core::Payload call(std::string_view op, const core::Payload& msg) const;

    public:
    /// The constructor
    explicit BlobClient(Caller caller);

    /// Create a container
    Container createContainer(const std::string& container) const;
    /// Remove a container
    void removeContainer(const std::string& container) const;
    /// Remove a blob
    void removeObject(const std::string& container, const std::string& id) const;
    /// List the blobs of a container
    [[nodiscard]] std::vector<Blob> listObjects(const std::string& container) const;
    /// Get the metadata of a blob
    [[nodiscard]] Blob objectInfo(const std::string& container, const std::string& id) const;
    /// Upload a blob in chunks of chunkSize, the first failing call aborts the upload
    Transfer upload(const std::string& container, const std::string& id, std::span<const uint8_t> data, uint64_t chunkSize) const;
    /// Request a download, the chunks arrive through ReceiveChunk
    void startDownload(const std::string& container, const std::string& id, uint64_t chunkSizeHint = 0) const;
};
//---------------------------------------------------------------------------
/// Reassembles pushed downloads on the actor side
class DownloadReceiver {
    /// The blob key
    using key_type = std::pair<std::string, std::string>;

    /// The lock
    mutable std::mutex _mutex;
    /// The transfers in flight and the completed ones until taken, aborted ones are dropped
    std::map<key_type, TransferTracker> _transfers;

    public:
    /// Handle a ReceiveChunk payload, an unexpected sequence number drops the transfer and throws
    TransferState receive(core::PayloadView msg);
    /// Get the state of a download
    [[nodiscard]] TransferState state(const std::string& container, const std::string& id) const;
    /// Take the bytes of a completed download
    [[nodiscard]] std::optional<std::vector<uint8_t>> take(const std::string& container, const std::string& id);
};
//---------------------------------------------------------------------------
} // namespace caplink::blobstore
