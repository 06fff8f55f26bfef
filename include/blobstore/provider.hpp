#pragma once
#include "blobstore/config.hpp"
#include "blobstore/download_pump.hpp"
#include "blobstore/store.hpp"
#include "blobstore/transfer.hpp"
#include "core/dispatcher.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace caplink::blobstore {
//---------------------------------------------------------------------------
/// The blob store capability provider.
/// Uploads are driven by the actor through StartUpload and UploadChunk, downloads are
/// pushed back into the actor with ReceiveChunk by the download pump.
class BlobstoreProvider : public core::CapabilityProvider {
    public:
    /// The clock used for stale transfer detection
    using clock = std::chrono::steady_clock;

    private:
    /// An upload in flight
    struct Upload {
        /// The receiver state machine
        TransferTracker tracker;
        /// The last chunk arrival
        clock::time_point lastActivity;
    };

    /// The config
    ProviderConfig _config;
    /// The shared provider state
    core::ProviderCore _core;
    /// The backing store
    std::unique_ptr<BlobStore> _store;
    /// The upload lock
    std::mutex _uploadMutex;
    /// The uploads, keyed by (container, id)
    std::map<std::pair<std::string, std::string>, Upload> _uploads;
    /// The download workers, destroyed first
    std::unique_ptr<DownloadPump> _pump;

    /// Begin an upload
    core::Payload startUpload(std::string_view actor, core::PayloadView msg);
    /// Accept an upload chunk
    core::Payload uploadChunk(std::string_view actor, core::PayloadView msg);
    /// Begin a download
    core::Payload startDownload(std::string_view actor, core::PayloadView msg);
    /// Create a container
    core::Payload createContainer(core::PayloadView msg);
    /// Remove a container
    core::Payload removeContainer(core::PayloadView msg);
    /// Remove a blob
    core::Payload removeObject(core::PayloadView msg);
    /// List the blobs of a container
    core::Payload listObjects(core::PayloadView msg);
    /// Get the metadata of a blob
    core::Payload getObjectInfo(core::PayloadView msg);

    public:
    /// The constructor with an explicit store
    BlobstoreProvider(ProviderConfig config, std::unique_ptr<BlobStore> store);
    /// The constructor, the store is chosen by the config
    explicit BlobstoreProvider(ProviderConfig config = ProviderConfig());
    /// The destructor
    ~BlobstoreProvider() noexcept override;

    /// The descriptor of the blob store capability
    [[nodiscard]] static core::CapabilityDescriptor describe();

    /// Hand over the dispatcher used to reach actors
    void configureDispatch(std::unique_ptr<core::Dispatcher> dispatcher) override;
    /// Handle an actor-initiated operation
    [[nodiscard]] core::Payload handleCall(std::string_view actor, std::string_view op, core::PayloadView msg) override;

    /// Drop uploads idle for longer than the stale timeout, returns the number dropped
    size_t collectStale(clock::time_point now);
    /// Block until all queued downloads were sent
    void waitIdle();

    /// Get the config
    [[nodiscard]] const ProviderConfig& config() const { return _config; }
    /// Get the backing store
    [[nodiscard]] BlobStore& store() { return *_store; }
    /// Get the shared provider state
    [[nodiscard]] const core::ProviderCore& core() const { return _core; }
    /// Get the number of uploads in flight
    [[nodiscard]] size_t activeUploads();
    /// Get the download pump
    [[nodiscard]] const DownloadPump& pump() const { return *_pump; }
};
//---------------------------------------------------------------------------
} // namespace caplink::blobstore
