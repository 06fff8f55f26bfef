#pragma once
#include <chrono>
#include <cstdint>
#include <unordered_map>
#include <string>
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace caplink::blobstore {
//---------------------------------------------------------------------------
/// Config for chunk sizing, download workers and transfer cleanup
struct ProviderConfig {
    /// Chunk size used when the requester gives no hint
    static constexpr uint64_t defaultChunkSize = 64ull << 10;
    /// Smallest chunk size the provider sends
    static constexpr uint64_t defaultMinChunkSize = 1ull << 10;
    /// Largest chunk size the provider sends
    static constexpr uint64_t defaultMaxChunkSize = 4ull << 20;
    /// Largest blob an upload may announce
    static constexpr uint64_t defaultMaxBlobSize = 4ull << 30;
    /// Default number of download threads
    static constexpr unsigned defaultDownloadWorkers = 2;
    /// Uploads idle for longer are dropped
    static constexpr std::chrono::milliseconds defaultStaleTransferTimeout = std::chrono::minutes(5);

    /// The chunk size used when the hint is 0
    uint64_t chunkSize = defaultChunkSize;
    /// The minimum chunk size
    uint64_t minChunkSize = defaultMinChunkSize;
    /// The maximum chunk size
    uint64_t maxChunkSize = defaultMaxChunkSize;
    /// The upload size limit
    uint64_t maxBlobSize = defaultMaxBlobSize;
    /// The download threads
    unsigned downloadWorkers = defaultDownloadWorkers;
    /// The stale transfer timeout
    std::chrono::milliseconds staleTransferTimeout = defaultStaleTransferTimeout;
    /// The root directory of the file system store, empty selects the memory store
    std::string rootDirectory;

    /// Pick the chunk size for a download, the hint is clamped to [minChunkSize, maxChunkSize]
    [[nodiscard]] constexpr uint64_t selectChunkSize(uint64_t hint) const {
        if (!hint)
            return chunkSize;
        if (hint < minChunkSize)
            return minChunkSize;
        if (hint > maxChunkSize)
            return maxChunkSize;
        return hint;
    }

    /// Parse from binding style string values, unknown keys are ignored
    [[nodiscard]] static ProviderConfig fromValues(const std::unordered_map<std::string, std::string>& values);
};
//---------------------------------------------------------------------------
} // namespace caplink::blobstore
