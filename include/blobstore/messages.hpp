#pragma once
#include <cstdint>
#include <string>
#include <vector>
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace Json {
class Value;
} // namespace Json
//---------------------------------------------------------------------------
namespace caplink::blobstore {
//---------------------------------------------------------------------------
/// One segment of a blob transfer
struct FileChunk {
    /// The sequence number, starting at 0 per transfer
    uint64_t sequenceNo = 0;
    /// The container of the blob
    std::string container;
    /// The blob id
    std::string id;
    /// Total number of bytes of the blob
    uint64_t totalBytes = 0;
    /// The chunk size, the final chunk may be shorter
    uint64_t chunkSize = 0;
    /// The raw bytes, empty for the metadata chunk of StartUpload
    std::vector<uint8_t> chunkBytes;

    /// Encode as payload object
    void toJson(Json::Value& object) const;
    /// Decode from payload object
    void fromJson(const Json::Value& object);
    /// Equality
    bool operator==(const FileChunk& other) const = default;
};
//---------------------------------------------------------------------------
/// A namespace of blobs
struct Container {
    /// The container id
    std::string id;

    /// Encode as payload object
    void toJson(Json::Value& object) const;
    /// Decode from payload object
    void fromJson(const Json::Value& object);
    /// Equality
    bool operator==(const Container& other) const = default;
};
//---------------------------------------------------------------------------
/// A list of containers
struct ContainerList {
    /// The containers
    std::vector<Container> containers;

    /// Encode as payload object
    void toJson(Json::Value& object) const;
    /// Decode from payload object
    void fromJson(const Json::Value& object);
};
//---------------------------------------------------------------------------
/// Metadata about a stored blob, never the bytes
struct Blob {
    /// The blob id
    std::string id;
    /// The container
    std::string container;
    /// The size in bytes
    uint64_t byteSize = 0;

    /// Encode as payload object
    void toJson(Json::Value& object) const;
    /// Decode from payload object
    void fromJson(const Json::Value& object);
    /// Equality
    bool operator==(const Blob& other) const = default;
};
//---------------------------------------------------------------------------
/// A list of blobs
struct BlobList {
    /// The blobs
    std::vector<Blob> blobs;

    /// Encode as payload object
    void toJson(Json::Value& object) const;
    /// Decode from payload object
    void fromJson(const Json::Value& object);
};
//---------------------------------------------------------------------------
/// A request to start downloading a blob
struct StreamRequest {
    /// The blob id
    std::string id;
    /// The container
    std::string container;
    /// The preferred chunk size, a hint only
    uint64_t chunkSize = 0;

    /// Encode as payload object
    void toJson(Json::Value& object) const;
    /// Decode from payload object
    void fromJson(const Json::Value& object);
};
//---------------------------------------------------------------------------
/// Bookkeeping of an in-flight transfer
struct Transfer {
    /// The blob id
    std::string blobId;
    /// The container
    std::string container;
    /// The chunk size
    uint64_t chunkSize = 0;
    /// The total number of bytes
    uint64_t totalSize = 0;
    /// The total number of chunks, ceil(totalSize / chunkSize)
    uint64_t totalChunks = 0;

    /// Describe a transfer
    [[nodiscard]] static Transfer make(std::string container, std::string blobId, uint64_t totalSize, uint64_t chunkSize);
    /// Number of chunks needed for the given sizes
    [[nodiscard]] static constexpr uint64_t chunkCount(uint64_t totalSize, uint64_t chunkSize) {
        return chunkSize ? totalSize / chunkSize + (totalSize % chunkSize != 0) : 0;
    }

    /// Encode as payload object
    void toJson(Json::Value& object) const;
    /// Decode from payload object
    void fromJson(const Json::Value& object);
};
//---------------------------------------------------------------------------
} // namespace caplink::blobstore
