#include "blobstore/messages.hpp"
#include "codec/codec.hpp"
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
//---------------------------------------------------------------------------
void FileChunk::toJson(Json::Value& object) const
// Encode as payload object
{
    object["sequenceNo"] = Json::UInt64(sequenceNo);
    object["container"] = container;
    object["id"] = id;
    object["totalBytes"] = Json::UInt64(totalBytes);
    object["chunkSize"] = Json::UInt64(chunkSize);
    codec::writeBytes(object, "chunkBytes", chunkBytes);
}
//---------------------------------------------------------------------------
void FileChunk::fromJson(const Json::Value& object)
// Decode from payload object
{
    sequenceNo = codec::readUInt64(object, "sequenceNo");
    container = codec::readString(object, "container");
    id = codec::readString(object, "id");
    totalBytes = codec::readUInt64(object, "totalBytes");
    chunkSize = codec::readUInt64(object, "chunkSize");
    chunkBytes = codec::readBytes(object, "chunkBytes");
}
//---------------------------------------------------------------------------
void Container::toJson(Json::Value& object) const
// Encode as payload object
{
    object["id"] = id;
}
//---------------------------------------------------------------------------
void Container::fromJson(const Json::Value& object)
// Decode from payload object
{
    id = codec::readString(object, "id");
}
//---------------------------------------------------------------------------
void ContainerList::toJson(Json::Value& object) const
// Encode as payload object
{
    codec::writeList(object, "containers", containers);
}
//---------------------------------------------------------------------------
void ContainerList::fromJson(const Json::Value& object)
// Decode from payload object
{
    containers = codec::readList<Container>(object, "containers");
}
//---------------------------------------------------------------------------
void Blob::toJson(Json::Value& object) const
// Encode as payload object
{
    object["id"] = id;
    object["container"] = container;
    object["byteSize"] = Json::UInt64(byteSize);
}
//---------------------------------------------------------------------------
void Blob::fromJson(const Json::Value& object)
// Decode from payload object
{
    id = codec::readString(object, "id");
    container = codec::readString(object, "container");
    byteSize = codec::readUInt64(object, "byteSize");
}
//---------------------------------------------------------------------------
void BlobList::toJson(Json::Value& object) const
// Encode as payload object
{
    codec::writeList(object, "blobs", blobs);
}
//---------------------------------------------------------------------------
void BlobList::fromJson(const Json::Value& object)
// Decode from payload object
{
    blobs = codec::readList<Blob>(object, "blobs");
}
//---------------------------------------------------------------------------
void StreamRequest::toJson(Json::Value& object) const
// Encode as payload object
{
    object["id"] = id;
    object["container"] = container;
    object["chunkSize"] = Json::UInt64(chunkSize);
}
//---------------------------------------------------------------------------
void StreamRequest::fromJson(const Json::Value& object)
// Decode from payload object
{
    id = codec::readString(object, "id");
    container = codec::readString(object, "container");
    chunkSize = codec::readUInt64(object, "chunkSize");
}
//---------------------------------------------------------------------------
Transfer Transfer::make(string container, string blobId, uint64_t totalSize, uint64_t chunkSize)
// Describe a transfer
{
    Transfer transfer;
    transfer.blobId = std::move(blobId);
    transfer.container = std::move(container);
    transfer.chunkSize = chunkSize;
    transfer.totalSize = totalSize;
    transfer.totalChunks = chunkCount(totalSize, chunkSize);
    return transfer;
}
//---------------------------------------------------------------------------
void Transfer::toJson(Json::Value& object) const
// Encode as payload object
{
    object["blobId"] = blobId;
    object["container"] = container;
    object["chunkSize"] = Json::UInt64(chunkSize);
    object["totalSize"] = Json::UInt64(totalSize);
    object["totalChunks"] = Json::UInt64(totalChunks);
}
//---------------------------------------------------------------------------
void Transfer::fromJson(const Json::Value& object)
// Decode from payload object
{
    blobId = codec::readString(object, "blobId");
    container = codec::readString(object, "container");
    chunkSize = codec::readUInt64(object, "chunkSize");
    totalSize = codec::readUInt64(object, "totalSize");
    totalChunks = codec::readUInt64(object, "totalChunks");
}
//---------------------------------------------------------------------------
} // namespace caplink::blobstore
