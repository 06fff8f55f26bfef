#include "blobstore/client.hpp"
#include "codec/codec.hpp"
#include "core/error.hpp"
#include "core/operations.hpp"
#include <spdlog/spdlog.h>
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
using core::Operation;
using core::operationName;
using core::Payload;
using core::PayloadView;
//---------------------------------------------------------------------------
BlobClient::BlobClient(Caller caller) : _caller(move(caller))
// The constructor
{
}
//---------------------------------------------------------------------------
Payload BlobClient::call(string_view op, const Payload& msg) const
// Invoke an operation
{
    return _caller(op, msg);
}
//---------------------------------------------------------------------------
Container BlobClient::createContainer(const string& container) const
// Create a container
{
    return codec::deserialize<Container>(call(operationName(Operation::CreateContainer), codec::serialize(Container{container})));
}
//---------------------------------------------------------------------------
void BlobClient::removeContainer(const string& container) const
// Remove a container
{
    [[maybe_unused]] auto reply = call(operationName(Operation::RemoveContainer), codec::serialize(Container{container}));
}
//---------------------------------------------------------------------------
void BlobClient::removeObject(const string& container, const string& id) const
// Remove a blob
{
    [[maybe_unused]] auto reply = call(operationName(Operation::RemoveObject), codec::serialize(Blob{id, container, 0}));
}
//---------------------------------------------------------------------------
vector<Blob> BlobClient::listObjects(const string& container) const
// List the blobs of a container
{
    return codec::deserialize<BlobList>(call(operationName(Operation::ListObjects), codec::serialize(Container{container}))).blobs;
}
//---------------------------------------------------------------------------
Blob BlobClient::objectInfo(const string& container, const string& id) const
// Get the metadata of a blob
{
    return codec::deserialize<Blob>(call(operationName(Operation::GetObjectInfo), codec::serialize(Blob{id, container, 0})));
}
//---------------------------------------------------------------------------
Transfer BlobClient::upload(const string& container, const string& id, span<const uint8_t> data, uint64_t chunkSize) const
// Upload a blob in chunks
{
    if (!chunkSize && !data.empty())
        throw DispatchError(ErrorKind::Malformed, "upload of " + to_string(data.size()) + " bytes without chunk size");
    ChunkPlanner planner(container, id, data.size(), chunkSize);
    [[maybe_unused]] auto started = call(operationName(Operation::StartUpload), codec::serialize(planner.metadata()));
    for (uint64_t sequence = 0; sequence < planner.chunks(); sequence++) {
        [[maybe_unused]] auto ack = call(operationName(Operation::UploadChunk), codec::serialize(planner.chunk(sequence, data)));
    }
    return planner.transfer();
}
//---------------------------------------------------------------------------
void BlobClient::startDownload(const string& container, const string& id, uint64_t chunkSizeHint) const
// Request a download
{
    StreamRequest request{id, container, chunkSizeHint};
    [[maybe_unused]] auto reply = call(operationName(Operation::StartDownload), codec::serialize(request));
}
//---------------------------------------------------------------------------
TransferState DownloadReceiver::receive(PayloadView msg)
// Handle a ReceiveChunk payload, chunk 0 starts a fresh transfer
{
    auto chunk = codec::deserialize<FileChunk>(msg);
    lock_guard lock(_mutex);
    key_type key{chunk.container, chunk.id};
    if (!chunk.sequenceNo) {
        if (chunk.totalBytes && !chunk.chunkSize)
            throw DispatchError(ErrorKind::Malformed, chunk.container + "/" + chunk.id + ": chunk without chunk size");
        auto it = _transfers.insert_or_assign(key, TransferTracker(Transfer::make(chunk.container, chunk.id, chunk.totalBytes, chunk.chunkSize))).first;
        if (it->second.state() == TransferState::Complete) {
            if (!chunk.chunkBytes.empty()) {
                _transfers.erase(it);
                throw DispatchError(ErrorKind::SizeMismatch, chunk.container + "/" + chunk.id + ": data in an empty download");
            }
            return TransferState::Complete;
        }
    }

    auto it = _transfers.find(key);
    if (it == _transfers.end())
        throw DispatchError(ErrorKind::OutOfSequence, chunk.container + "/" + chunk.id + ": chunk " + to_string(chunk.sequenceNo) + " without a download in progress");
    try {
        return it->second.accept(chunk);
    } catch (const DispatchError& e) {
        _transfers.erase(it);
        spdlog::warn("[DownloadReceiver] download of {}/{} failed: {}", chunk.container, chunk.id, e.what());
        throw;
    }
}
//---------------------------------------------------------------------------
TransferState DownloadReceiver::state(const string& container, const string& id) const
// Get the state of a download
{
    lock_guard lock(_mutex);
    auto it = _transfers.find({container, id});
    return it == _transfers.end() ? TransferState::Idle : it->second.state();
}
//---------------------------------------------------------------------------
optional<vector<uint8_t>> DownloadReceiver::take(const string& container, const string& id)
// Take the bytes of a completed download
{
    lock_guard lock(_mutex);
    auto it = _transfers.find({container, id});
    if (it == _transfers.end() || it->second.state() != TransferState::Complete)
        return nullopt;
    auto data = it->second.takeData();
    _transfers.erase(it);
    return data;
}
//---------------------------------------------------------------------------
} // namespace caplink::blobstore
