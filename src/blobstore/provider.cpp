#include "blobstore/provider.hpp"
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
using core::OperationDirection;
using core::Payload;
using core::PayloadView;
//---------------------------------------------------------------------------
static void requireIds(const string& container, const string& id)
// Blob addressed operations need both ids
{
    if (container.empty())
        throw DispatchError(ErrorKind::Malformed, "container id is missing");
    if (id.empty())
        throw DispatchError(ErrorKind::Malformed, "blob id is missing");
}
//---------------------------------------------------------------------------
BlobstoreProvider::BlobstoreProvider(ProviderConfig config, unique_ptr<BlobStore> store) : _config(move(config)), _core(describe()), _store(move(store)), _uploadMutex(), _uploads(), _pump()
// The constructor
{
    if (!_store)
        _store = BlobStore::makeStore(_config.rootDirectory);
    _pump = make_unique<DownloadPump>(_core.dispatcher(), _config.downloadWorkers);
}
//---------------------------------------------------------------------------
BlobstoreProvider::BlobstoreProvider(ProviderConfig config) : BlobstoreProvider(move(config), nullptr)
// The constructor
{
}
//---------------------------------------------------------------------------
BlobstoreProvider::~BlobstoreProvider() noexcept
// The destructor, lets the pump finish before the dispatcher goes away
{
    _pump.reset();
}
//---------------------------------------------------------------------------
core::CapabilityDescriptor BlobstoreProvider::describe()
// The descriptor of the blob store capability
{
    return core::DescriptorBuilder()
        .withId(core::capability::blobstore)
        .withName("CapLink Blob Store")
        .withVersion("0.3.0")
        .withRevision(3)
        .withLongDescription("Containers of binary objects with chunked upload and push based download")
        .withOperation(Operation::CreateContainer, OperationDirection::ToProvider, "Create a container, existing containers are kept")
        .withOperation(Operation::RemoveContainer, OperationDirection::ToProvider, "Remove a container with all its blobs")
        .withOperation(Operation::RemoveObject, OperationDirection::ToProvider, "Remove a blob, absent blobs are ignored")
        .withOperation(Operation::ListObjects, OperationDirection::ToProvider, "List the blobs of a container")
        .withOperation(Operation::GetObjectInfo, OperationDirection::ToProvider, "Get the metadata of a blob")
        .withOperation(Operation::StartUpload, OperationDirection::ToProvider, "Announce an upload with a metadata chunk")
        .withOperation(Operation::UploadChunk, OperationDirection::ToProvider, "Send the next chunk of an upload")
        .withOperation(Operation::StartDownload, OperationDirection::ToProvider, "Request a blob, its chunks arrive through ReceiveChunk")
        .withOperation(Operation::ReceiveChunk, OperationDirection::ToActor, "Deliver the next chunk of a download")
        .build();
}
//---------------------------------------------------------------------------
void BlobstoreProvider::configureDispatch(unique_ptr<core::Dispatcher> dispatcher)
// Hand over the dispatcher
{
    _core.dispatcher().install(move(dispatcher));
    spdlog::info("[BlobstoreProvider] dispatcher configured, {} download workers", _pump->workers());
}
//---------------------------------------------------------------------------
Payload BlobstoreProvider::handleCall(string_view actor, string_view op, PayloadView msg)
// Handle an actor-initiated operation
{
    auto operation = _core.resolve(op);
    if (auto reply = _core.handleCommon(actor, operation, msg))
        return move(*reply);

    switch (operation) {
        case Operation::StartUpload: return startUpload(actor, msg);
        case Operation::UploadChunk: return uploadChunk(actor, msg);
        case Operation::StartDownload: return startDownload(actor, msg);
        case Operation::CreateContainer: return createContainer(msg);
        case Operation::RemoveContainer: return removeContainer(msg);
        case Operation::RemoveObject: return removeObject(msg);
        case Operation::ListObjects: return listObjects(msg);
        case Operation::GetObjectInfo: return getObjectInfo(msg);
        default:
            throw DispatchError(ErrorKind::UnknownOperation, "operation '" + string(op) + "' is delivered to actors, not handled by the blob store");
    }
}
//---------------------------------------------------------------------------
Payload BlobstoreProvider::startUpload(string_view actor, PayloadView msg)
// Begin an upload, a running upload of the same blob restarts
{
    auto chunk = codec::deserialize<FileChunk>(msg);
    requireIds(chunk.container, chunk.id);
    if (chunk.sequenceNo)
        throw DispatchError(ErrorKind::Malformed, "StartUpload must carry sequence 0, got " + to_string(chunk.sequenceNo));
    if (!chunk.chunkBytes.empty())
        throw DispatchError(ErrorKind::Malformed, "StartUpload must not carry data");
    if (chunk.totalBytes && !chunk.chunkSize)
        throw DispatchError(ErrorKind::Malformed, "StartUpload of " + to_string(chunk.totalBytes) + " bytes without chunk size");
    if (chunk.totalBytes > _config.maxBlobSize)
        throw DispatchError(ErrorKind::Rejected, "upload of " + to_string(chunk.totalBytes) + " bytes exceeds the limit of " + to_string(_config.maxBlobSize) + " bytes");

    auto now = clock::now();
    collectStale(now);
    if (!_store->containerExists(chunk.container))
        throw DispatchError(ErrorKind::Rejected, "container " + chunk.container + " does not exist");

    if (!chunk.totalBytes) {
        {
            lock_guard lock(_uploadMutex);
            _uploads.erase({chunk.container, chunk.id});
        }
        _store->putObject(chunk.container, chunk.id, {});
        spdlog::info("[BlobstoreProvider] {} stored empty blob {}/{}", actor, chunk.container, chunk.id);
        return Payload();
    }

    auto transfer = Transfer::make(chunk.container, chunk.id, chunk.totalBytes, chunk.chunkSize);
    lock_guard lock(_uploadMutex);
    auto [it, inserted] = _uploads.insert_or_assign({chunk.container, chunk.id}, Upload{TransferTracker(move(transfer)), now});
    spdlog::info("[BlobstoreProvider] {} {} upload of {}/{}: {} bytes in {} chunks", actor, inserted ? "started" : "restarted", chunk.container, chunk.id, chunk.totalBytes, it->second.tracker.transfer().totalChunks);
    return Payload();
}
//---------------------------------------------------------------------------
Payload BlobstoreProvider::uploadChunk(string_view actor, PayloadView msg)
// Accept an upload chunk, the completed blob is committed to the store
{
    auto chunk = codec::deserialize<FileChunk>(msg);
    requireIds(chunk.container, chunk.id);

    vector<uint8_t> data;
    {
        lock_guard lock(_uploadMutex);
        auto it = _uploads.find({chunk.container, chunk.id});
        if (it == _uploads.end())
            throw DispatchError(ErrorKind::OutOfSequence, chunk.container + "/" + chunk.id + ": no upload in progress, expected StartUpload and chunk 0, got " + to_string(chunk.sequenceNo));
        auto& upload = it->second;
        try {
            upload.tracker.accept(chunk);
        } catch (const DispatchError& e) {
            spdlog::warn("[BlobstoreProvider] upload of {}/{} from {} aborted: {}", chunk.container, chunk.id, actor, e.what());
            _uploads.erase(it);
            throw;
        }
        spdlog::debug("[BlobstoreProvider] chunk {} of {}/{} from {}", chunk.sequenceNo, chunk.container, chunk.id, actor);
        if (upload.tracker.state() != TransferState::Complete) {
            upload.lastActivity = clock::now();
            return Payload();
        }
        data = upload.tracker.takeData();
        _uploads.erase(it);
    }

    auto size = data.size();
    _store->putObject(chunk.container, chunk.id, move(data));
    spdlog::info("[BlobstoreProvider] {} completed upload of {}/{} ({} bytes)", actor, chunk.container, chunk.id, size);
    return Payload();
}
//---------------------------------------------------------------------------
Payload BlobstoreProvider::startDownload(string_view actor, PayloadView msg)
// Begin a download, the chunk size is picked by the provider
{
    auto request = codec::deserialize<StreamRequest>(msg);
    requireIds(request.container, request.id);
    auto data = _store->getObject(request.container, request.id);
    auto chunkSize = _config.selectChunkSize(request.chunkSize);
    ChunkPlanner planner(request.container, request.id, data.size(), chunkSize);
    spdlog::info("[BlobstoreProvider] {} requested {}/{}, chunk size {} (hint {})", actor, request.container, request.id, chunkSize, request.chunkSize);
    _pump->enqueue(string(actor), move(planner), move(data));
    return Payload();
}
//---------------------------------------------------------------------------
Payload BlobstoreProvider::createContainer(PayloadView msg)
// Create a container
{
    auto container = codec::deserialize<Container>(msg);
    if (container.id.empty())
        throw DispatchError(ErrorKind::Malformed, "container id is missing");
    _store->createContainer(container.id);
    spdlog::info("[BlobstoreProvider] created container {}", container.id);
    return codec::serialize(container);
}
//---------------------------------------------------------------------------
Payload BlobstoreProvider::removeContainer(PayloadView msg)
// Remove a container and the uploads into it
{
    auto container = codec::deserialize<Container>(msg);
    if (container.id.empty())
        throw DispatchError(ErrorKind::Malformed, "container id is missing");
    {
        lock_guard lock(_uploadMutex);
        erase_if(_uploads, [&](const auto& entry) { return entry.first.first == container.id; });
    }
    _store->removeContainer(container.id);
    spdlog::info("[BlobstoreProvider] removed container {}", container.id);
    return Payload();
}
//---------------------------------------------------------------------------
Payload BlobstoreProvider::removeObject(PayloadView msg)
// Remove a blob
{
    auto blob = codec::deserialize<Blob>(msg);
    requireIds(blob.container, blob.id);
    _store->removeObject(blob.container, blob.id);
    spdlog::debug("[BlobstoreProvider] removed blob {}/{}", blob.container, blob.id);
    return Payload();
}
//---------------------------------------------------------------------------
Payload BlobstoreProvider::listObjects(PayloadView msg)
// List the blobs of a container
{
    auto container = codec::deserialize<Container>(msg);
    if (container.id.empty())
        throw DispatchError(ErrorKind::Malformed, "container id is missing");
    BlobList list;
    list.blobs = _store->listObjects(container.id);
    return codec::serialize(list);
}
//---------------------------------------------------------------------------
Payload BlobstoreProvider::getObjectInfo(PayloadView msg)
// Complete the metadata of a blob
{
    auto blob = codec::deserialize<Blob>(msg);
    requireIds(blob.container, blob.id);
    auto info = _store->objectInfo(blob.container, blob.id);
    if (!info)
        throw DispatchError(ErrorKind::Rejected, "blob " + blob.container + "/" + blob.id + " does not exist");
    return codec::serialize(*info);
}
//---------------------------------------------------------------------------
size_t BlobstoreProvider::collectStale(clock::time_point now)
// Drop idle uploads
{
    lock_guard lock(_uploadMutex);
    auto dropped = erase_if(_uploads, [&](const auto& entry) {
        if (now - entry.second.lastActivity <= _config.staleTransferTimeout)
            return false;
        spdlog::warn("[BlobstoreProvider] dropping stale upload of {}/{} after chunk {}", entry.first.first, entry.first.second, entry.second.tracker.nextSequence());
        return true;
    });
    return dropped;
}
//---------------------------------------------------------------------------
void BlobstoreProvider::waitIdle()
// Block until all queued downloads were sent
{
    _pump->waitIdle();
}
//---------------------------------------------------------------------------
size_t BlobstoreProvider::activeUploads()
// Get the number of uploads in flight
{
    lock_guard lock(_uploadMutex);
    return _uploads.size();
}
//---------------------------------------------------------------------------
} // namespace caplink::blobstore
