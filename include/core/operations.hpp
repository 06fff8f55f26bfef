#pragma once
#include <cstdint>
#include <optional>
#include <string_view>
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace caplink::core {
//---------------------------------------------------------------------------
/// The origin id used for calls issued by the host runtime itself
static constexpr std::string_view systemActor = "system";
//---------------------------------------------------------------------------
/// The capability ids
namespace capability {
/// Binary object storage and streaming
static constexpr std::string_view blobstore = "caplink:blobstore";
/// Message broker
static constexpr std::string_view messaging = "caplink:messaging";
/// Key value store
static constexpr std::string_view keyvalue = "caplink:keyvalue";
/// Per-actor logging
static constexpr std::string_view logging = "caplink:logging";
/// Append-only event streams
static constexpr std::string_view eventstreams = "caplink:eventstreams";
/// Guid, sequence and random number generation
static constexpr std::string_view extras = "caplink:extras";
/// Inbound http requests delivered to actors
static constexpr std::string_view httpServer = "caplink:httpserver";
/// Outbound http requests issued by actors
static constexpr std::string_view httpClient = "caplink:httpclient";
} // namespace capability
//---------------------------------------------------------------------------
/// Every operation known to actors, providers and the host
enum class Operation : uint8_t {
    // All providers
    GetCapabilityDescriptor,
    // Blob store
    CreateContainer,
    RemoveContainer,
    RemoveObject,
    ListObjects,
    UploadChunk,
    StartDownload,
    StartUpload,
    ReceiveChunk,
    GetObjectInfo,
    // Messaging
    Publish,
    DeliverMessage,
    Request,
    // Logging
    WriteLog,
    // Event streams
    DeliverEvent,
    WriteEvent,
    QueryStream,
    // Extras
    RequestGuid,
    RequestSequence,
    RequestRandom,
    // Http server and client
    PerformRequest,
    HandleRequest,
    // Host runtime
    PerformLiveUpdate,
    IdentifyCapability,
    HealthRequest,
    Initialize,
    BindActor,
    RemoveActor
};
//---------------------------------------------------------------------------
/// The number of operations
static constexpr unsigned operationCount = static_cast<unsigned>(Operation::RemoveActor) + 1;
/// The wire names, indexed by Operation
static constexpr std::string_view operationNames[operationCount] = {
    "GetCapabilityDescriptor",
    "CreateContainer",
    "RemoveContainer",
    "RemoveObject",
    "ListObjects",
    "UploadChunk",
    "StartDownload",
    "StartUpload",
    "ReceiveChunk",
    "GetObjectInfo",
    "Publish",
    "DeliverMessage",
    "Request",
    "WriteLog",
    "DeliverEvent",
    "WriteEvent",
    "QueryStream",
    "RequestGuid",
    "RequestSequence",
    "RequestRandom",
    "PerformRequest",
    "HandleRequest",
    "PerformLiveUpdate",
    "IdentifyCapability",
    "HealthRequest",
    "Initialize",
    "BindActor",
    "RemoveActor"};
//---------------------------------------------------------------------------
/// Get the wire name of an operation
[[nodiscard]] constexpr std::string_view operationName(Operation op) noexcept {
    return operationNames[static_cast<unsigned>(op)];
}
/// Find the operation of a wire name (case-sensitive)
[[nodiscard]] std::optional<Operation> parseOperation(std::string_view name) noexcept;
//---------------------------------------------------------------------------
} // namespace caplink::core
