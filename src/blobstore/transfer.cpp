#include "blobstore/transfer.hpp"
#include <algorithm>
#include <cassert>
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace caplink::blobstore {
//---------------------------------------------------------------------------
using namespace std;
using core::DispatchError;
using core::ErrorKind;
//---------------------------------------------------------------------------
string_view transferStateName(TransferState state) noexcept
// Get the name of a state
{
    switch (state) {
        case TransferState::Idle: return "idle";
        case TransferState::InProgress: return "in progress";
        case TransferState::Complete: return "complete";
        case TransferState::Aborted: return "aborted";
    }
    return "unknown";
}
//---------------------------------------------------------------------------
TransferTracker::TransferTracker() : _transfer(), _state(TransferState::Idle), _nextSequence(0), _data()
// The idle tracker
{
}
//---------------------------------------------------------------------------
TransferTracker::TransferTracker(Transfer transfer) : _transfer(std::move(transfer)), _state(TransferState::InProgress), _nextSequence(0), _data()
// Start from the announced metadata
{
    if (!_transfer.totalSize)
        _state = TransferState::Complete;
}
//---------------------------------------------------------------------------
void TransferTracker::fail(ErrorKind kind, const string& message)
// Abort and raise
{
    _state = TransferState::Aborted;
    _data.clear();
    throw DispatchError(kind, _transfer.container + "/" + _transfer.blobId + ": " + message);
}
//---------------------------------------------------------------------------
TransferState TransferTracker::accept(const FileChunk& chunk)
// Accept the next chunk
{
    if (_state != TransferState::InProgress)
        throw DispatchError(ErrorKind::OutOfSequence, _transfer.container + "/" + _transfer.blobId + ": transfer is " + string(transferStateName(_state)));

    if (chunk.sequenceNo != _nextSequence)
        fail(ErrorKind::OutOfSequence, "expected chunk " + to_string(_nextSequence) + ", got " + to_string(chunk.sequenceNo));
    if (chunk.totalBytes != _transfer.totalSize)
        fail(ErrorKind::SizeMismatch, "chunk announces " + to_string(chunk.totalBytes) + " total bytes, transfer has " + to_string(_transfer.totalSize));
    if (chunk.chunkSize != _transfer.chunkSize)
        fail(ErrorKind::SizeMismatch, "chunk size changed from " + to_string(_transfer.chunkSize) + " to " + to_string(chunk.chunkSize));

    auto length = chunk.chunkBytes.size();
    auto received = _data.size() + length;
    if (length > _transfer.chunkSize)
        fail(ErrorKind::SizeMismatch, "chunk of " + to_string(length) + " bytes exceeds chunk size " + to_string(_transfer.chunkSize));
    if (received > _transfer.totalSize)
        fail(ErrorKind::SizeMismatch, "received " + to_string(received) + " bytes of " + to_string(_transfer.totalSize));
    if (length < _transfer.chunkSize && received != _transfer.totalSize)
        fail(ErrorKind::SizeMismatch, "short chunk " + to_string(chunk.sequenceNo) + " before the end of the transfer");

    _data.insert(_data.end(), chunk.chunkBytes.begin(), chunk.chunkBytes.end());
    _nextSequence++;
    if (received == _transfer.totalSize)
        _state = TransferState::Complete;
    return _state;
}
//---------------------------------------------------------------------------
ChunkPlanner::ChunkPlanner(string container, string blobId, uint64_t totalSize, uint64_t chunkSize) : _transfer(Transfer::make(std::move(container), std::move(blobId), totalSize, chunkSize))
// The constructor
{
    assert(chunkSize || !totalSize);
}
//---------------------------------------------------------------------------
FileChunk ChunkPlanner::metadata() const
// The metadata-only chunk announcing the transfer
{
    FileChunk chunk;
    chunk.sequenceNo = 0;
    chunk.container = _transfer.container;
    chunk.id = _transfer.blobId;
    chunk.totalBytes = _transfer.totalSize;
    chunk.chunkSize = _transfer.chunkSize;
    return chunk;
}
//---------------------------------------------------------------------------
FileChunk ChunkPlanner::chunk(uint64_t sequence, span<const uint8_t> blob) const
// Cut the chunk out of the whole blob
{
    assert(blob.size() == _transfer.totalSize);
    auto chunk = metadata();
    chunk.sequenceNo = sequence;
    auto offset = min<uint64_t>(sequence * _transfer.chunkSize, blob.size());
    auto length = min<uint64_t>(_transfer.chunkSize, blob.size() - offset);
    auto part = blob.subspan(offset, length);
    chunk.chunkBytes.assign(part.begin(), part.end());
    return chunk;
}
//---------------------------------------------------------------------------
} // namespace caplink::blobstore
