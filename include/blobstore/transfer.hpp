#pragma once
#include "blobstore/messages.hpp"
#include "core/error.hpp"
#include <cstdint>
#include <span>
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
namespace caplink::blobstore {
//---------------------------------------------------------------------------
/// The state of one transfer, either direction
enum class TransferState : uint8_t {
    Idle,
    InProgress,
    Complete,
    Aborted
};
//---------------------------------------------------------------------------
/// Get the name of a state
[[nodiscard]] std::string_view transferStateName(TransferState state) noexcept;
//---------------------------------------------------------------------------
/// The receiving side of a transfer.
/// Chunks must arrive with exactly the next sequence number, nothing is buffered or reordered.
/// Completion is reached when the received bytes equal the announced total.
class TransferTracker {
    /// The transfer
    Transfer _transfer;
    /// The state
    TransferState _state;
    /// The next expected sequence number
    uint64_t _nextSequence;
    /// The received bytes
    std::vector<uint8_t> _data;

    /// Abort and raise
    [[noreturn]] void fail(core::ErrorKind kind, const std::string& message);

    public:
    /// The idle tracker
    TransferTracker();
    /// Start from the announced metadata, a zero byte transfer is complete right away
    explicit TransferTracker(Transfer transfer);

    /// Accept the next chunk, any violation aborts the transfer and throws DispatchError
    TransferState accept(const FileChunk& chunk);

    /// Get the transfer
    [[nodiscard]] const Transfer& transfer() const { return _transfer; }
    /// Get the state
    [[nodiscard]] TransferState state() const { return _state; }
    /// Get the next expected sequence number
    [[nodiscard]] uint64_t nextSequence() const { return _nextSequence; }
    /// Get the number of received bytes
    [[nodiscard]] uint64_t receivedBytes() const { return _data.size(); }
    /// Get the received bytes
    [[nodiscard]] const std::vector<uint8_t>& data() const { return _data; }
    /// Take the received bytes
    [[nodiscard]] std::vector<uint8_t> takeData() { return std::move(_data); }
};
//---------------------------------------------------------------------------
/// The sending side of a transfer, slices a blob into chunks
class ChunkPlanner {
    /// The transfer
    Transfer _transfer;

    public:
    /// The constructor, chunkSize must not be 0 unless totalSize is 0
    ChunkPlanner(std::string container, std::string blobId, uint64_t totalSize, uint64_t chunkSize);

    /// Get the transfer
    [[nodiscard]] const Transfer& transfer() const { return _transfer; }
    /// Get the number of chunks
    [[nodiscard]] uint64_t chunks() const { return _transfer.totalChunks; }
    /// The metadata-only chunk announcing the transfer
    [[nodiscard]] FileChunk metadata() const;
    /// The chunk with the given sequence number, cut out of the whole blob
    [[nodiscard]] FileChunk chunk(uint64_t sequence, std::span<const uint8_t> blob) const;
};
//---------------------------------------------------------------------------
} // namespace caplink::blobstore
