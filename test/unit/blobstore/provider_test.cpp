#include "blobstore/client.hpp"
#include "blobstore/provider.hpp"
#include "codec/codec.hpp"
#include "core/error.hpp"
#include "core/operations.hpp"
#include "catch2/catch.hpp"
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace caplink::blobstore::test {
//---------------------------------------------------------------------------
using namespace std;
using core::DispatchError;
using core::ErrorKind;
using core::Operation;
using core::operationName;
using core::Payload;
using core::PayloadView;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
/// Hands ReceiveChunk pushes to a receiver and records the chunk sizes
class ReceiverDispatcher : public core::Dispatcher {
    public:
    /// The receiver
    DownloadReceiver& receiver;
    /// The lock
    mutex chunksMutex;
    /// The received chunks
    vector<FileChunk> chunks;
    /// Refuse the chunk with this sequence number
    atomic<uint64_t> refuse{~0ull};
    /// Fail the chunk with this sequence number with a non-dispatch error
    atomic<uint64_t> crash{~0ull};

    /// The constructor
    explicit ReceiverDispatcher(DownloadReceiver& receiver) : receiver(receiver) {}

    /// Deliver a push
    Payload dispatch(string_view actor, string_view op, PayloadView msg) override {
        // Runs on a pump worker, so no assertions here
        if (actor != "MA" || op != operationName(Operation::ReceiveChunk))
            throw DispatchError(ErrorKind::Rejected, "unexpected push " + string(op) + " to " + string(actor));
        auto chunk = codec::deserialize<FileChunk>(msg);
        if (chunk.sequenceNo == refuse)
            throw DispatchError(ErrorKind::Rejected, "actor is gone");
        if (chunk.sequenceNo == crash)
            throw runtime_error("actor crashed");
        {
            lock_guard lock(chunksMutex);
            chunks.push_back(chunk);
        }
        receiver.receive(msg);
        return {};
    }
};
//---------------------------------------------------------------------------
/// A configured provider with an actor side client
struct Fixture {
    /// The receiver
    DownloadReceiver receiver;
    /// The dispatcher, owned by the provider
    ReceiverDispatcher* dispatcher;
    /// The provider
    BlobstoreProvider provider;
    /// The client of actor MA
    BlobClient client;

    /// The constructor
    explicit Fixture(ProviderConfig config = ProviderConfig()) : receiver(), dispatcher(nullptr), provider(move(config)), client([this](string_view op, PayloadView msg) { return provider.handleCall("MA", op, msg); }) {
        auto owned = make_unique<ReceiverDispatcher>(receiver);
        dispatcher = owned.get();
        provider.configureDispatch(move(owned));
    }

    /// Call the provider as actor MA
    Payload call(Operation op, const Payload& msg) { return provider.handleCall("MA", operationName(op), msg); }
    /// Call and report the error kind
    ErrorKind failureOf(Operation op, const Payload& msg) {
        try {
            auto reply = call(op, msg);
        } catch (const DispatchError& e) {
            return e.kind();
        }
        FAIL(operationName(op) << " succeeded");
        return ErrorKind::Backend;
    }
};
//---------------------------------------------------------------------------
FileChunk chunk(uint64_t sequence, string_view bytes, uint64_t total = 9, uint64_t chunkSize = 4)
// An upload chunk of c1/b1
{
    FileChunk result;
    result.sequenceNo = sequence;
    result.container = "c1";
    result.id = "b1";
    result.totalBytes = total;
    result.chunkSize = chunkSize;
    result.chunkBytes.assign(bytes.begin(), bytes.end());
    return result;
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
TEST_CASE("blobstore_descriptor") {
    auto descriptor = BlobstoreProvider::describe();
    REQUIRE(descriptor.id() == core::capability::blobstore);
    for (auto op : {Operation::CreateContainer, Operation::RemoveContainer, Operation::RemoveObject, Operation::ListObjects, Operation::UploadChunk, Operation::StartDownload, Operation::StartUpload, Operation::ReceiveChunk, Operation::GetObjectInfo})
        REQUIRE(descriptor.supports(op));
    REQUIRE(descriptor.find("ReceiveChunk")->direction == core::OperationDirection::ToActor);
    REQUIRE(descriptor.find("StartUpload")->direction == core::OperationDirection::ToProvider);
}
//---------------------------------------------------------------------------
TEST_CASE("blobstore_upload_scenario") {
    Fixture fixture;
    fixture.client.createContainer("c1");

    auto start = chunk(0, "");
    REQUIRE(fixture.call(Operation::StartUpload, codec::serialize(start)).empty());
    REQUIRE(fixture.call(Operation::UploadChunk, codec::serialize(chunk(0, "abcd"))).empty());
    REQUIRE(fixture.call(Operation::UploadChunk, codec::serialize(chunk(1, "efgh"))).empty());
    REQUIRE(fixture.provider.activeUploads() == 1);
    REQUIRE(fixture.call(Operation::UploadChunk, codec::serialize(chunk(2, "i"))).empty());
    REQUIRE(fixture.provider.activeUploads() == 0);

    auto info = codec::deserialize<Blob>(fixture.call(Operation::GetObjectInfo, codec::serialize(Blob{"b1", "c1", 0})));
    REQUIRE(info.byteSize == 9);
    REQUIRE(fixture.provider.store().getObject("c1", "b1") == vector<uint8_t>{'a', 'b', 'c', 'd', 'e', 'f', 'g', 'h', 'i'});

    // The finished transfer is gone, further chunks are out of sequence
    REQUIRE(fixture.failureOf(Operation::UploadChunk, codec::serialize(chunk(3, ""))) == ErrorKind::OutOfSequence);
}
//---------------------------------------------------------------------------
TEST_CASE("blobstore_upload_out_of_sequence") {
    Fixture fixture;
    fixture.client.createContainer("c1");

    SECTION("first chunk of a fresh blob") {
        REQUIRE(fixture.failureOf(Operation::UploadChunk, codec::serialize(chunk(5, "abcd"))) == ErrorKind::OutOfSequence);
    }
    SECTION("skip ahead") {
        auto reply = fixture.call(Operation::StartUpload, codec::serialize(chunk(0, "")));
        reply = fixture.call(Operation::UploadChunk, codec::serialize(chunk(0, "abcd")));
        REQUIRE(fixture.failureOf(Operation::UploadChunk, codec::serialize(chunk(2, "i"))) == ErrorKind::OutOfSequence);
        // The transfer was aborted, nothing is buffered
        REQUIRE(fixture.provider.activeUploads() == 0);
        REQUIRE(fixture.failureOf(Operation::UploadChunk, codec::serialize(chunk(1, "efgh"))) == ErrorKind::OutOfSequence);
        REQUIRE(!fixture.provider.store().objectInfo("c1", "b1"));
    }
    SECTION("size mismatch") {
        auto reply = fixture.call(Operation::StartUpload, codec::serialize(chunk(0, "")));
        REQUIRE(fixture.failureOf(Operation::UploadChunk, codec::serialize(chunk(0, "abcdef"))) == ErrorKind::SizeMismatch);
        REQUIRE(fixture.provider.activeUploads() == 0);
    }
    SECTION("restart") {
        auto reply = fixture.call(Operation::StartUpload, codec::serialize(chunk(0, "")));
        reply = fixture.call(Operation::UploadChunk, codec::serialize(chunk(0, "abcd")));
        reply = fixture.call(Operation::StartUpload, codec::serialize(chunk(0, "", 3, 4)));
        reply = fixture.call(Operation::UploadChunk, codec::serialize(chunk(0, "xyz", 3, 4)));
        REQUIRE(fixture.provider.store().getObject("c1", "b1") == vector<uint8_t>{'x', 'y', 'z'});
    }
}
//---------------------------------------------------------------------------
TEST_CASE("blobstore_start_upload_validation") {
    Fixture fixture;
    REQUIRE(fixture.failureOf(Operation::StartUpload, codec::serialize(chunk(0, ""))) == ErrorKind::Rejected);
    fixture.client.createContainer("c1");
    REQUIRE(fixture.failureOf(Operation::StartUpload, codec::serialize(chunk(1, ""))) == ErrorKind::Malformed);
    REQUIRE(fixture.failureOf(Operation::StartUpload, codec::serialize(chunk(0, "abcd"))) == ErrorKind::Malformed);
    REQUIRE(fixture.failureOf(Operation::StartUpload, codec::serialize(chunk(0, "", 9, 0))) == ErrorKind::Malformed);
    REQUIRE(fixture.failureOf(Operation::StartUpload, core::Payload{'{'}) == ErrorKind::Malformed);

    // A zero byte upload completes right away
    auto reply = fixture.call(Operation::StartUpload, codec::serialize(chunk(0, "", 0, 0)));
    REQUIRE(fixture.provider.store().objectInfo("c1", "b1") == Blob{"b1", "c1", 0});
    REQUIRE(fixture.provider.activeUploads() == 0);
}
//---------------------------------------------------------------------------
TEST_CASE("blobstore_client_upload") {
    Fixture fixture;
    fixture.client.createContainer("c1");
    string content(10000, 'q');
    auto transfer = fixture.client.upload("c1", "large", core::asPayload(content), 1024);
    REQUIRE(transfer.totalChunks == 10);
    REQUIRE(fixture.client.objectInfo("c1", "large").byteSize == 10000);
    auto listed = fixture.client.listObjects("c1");
    REQUIRE(listed.size() == 1);
    REQUIRE(listed[0].id == "large");
}
//---------------------------------------------------------------------------
TEST_CASE("blobstore_download") {
    ProviderConfig config;
    config.minChunkSize = 16;
    config.maxChunkSize = 256;
    config.chunkSize = 64;
    Fixture fixture(config);
    fixture.client.createContainer("c1");
    string content;
    for (auto i = 0u; i < 1000; i++)
        content.push_back(static_cast<char>('a' + i % 26));
    auto transfer = fixture.client.upload("c1", "b1", core::asPayload(content), 100);

    auto download = [&](uint64_t hint) {
        fixture.dispatcher->chunks.clear();
        fixture.client.startDownload("c1", "b1", hint);
        fixture.provider.waitIdle();
        REQUIRE(fixture.receiver.state("c1", "b1") == TransferState::Complete);
        auto data = fixture.receiver.take("c1", "b1");
        REQUIRE(data);
        REQUIRE(core::asString(*data) == content);
        REQUIRE(!fixture.dispatcher->chunks.empty());
        return fixture.dispatcher->chunks.front().chunkSize;
    };

    SECTION("hint within bounds") {
        REQUIRE(download(100) == 100);
        REQUIRE(fixture.dispatcher->chunks.size() == 10);
    }
    SECTION("zero hint") {
        REQUIRE(download(0) == 64);
    }
    SECTION("huge hint") {
        REQUIRE(download(~0ull) == 256);
        REQUIRE(fixture.dispatcher->chunks.size() == 4);
    }
    SECTION("tiny hint") {
        REQUIRE(download(1) == 16);
    }
    SECTION("sequence order") {
        auto size = download(32);
        REQUIRE(size == 32);
        for (uint64_t i = 0; i < fixture.dispatcher->chunks.size(); i++)
            REQUIRE(fixture.dispatcher->chunks[i].sequenceNo == i);
    }
    REQUIRE(fixture.provider.pump().aborted() == 0);
}
//---------------------------------------------------------------------------
TEST_CASE("blobstore_download_empty_blob") {
    Fixture fixture;
    fixture.client.createContainer("c1");
    auto transfer = fixture.client.upload("c1", "empty", {}, 0);
    fixture.client.startDownload("c1", "empty");
    fixture.provider.waitIdle();
    REQUIRE(fixture.dispatcher->chunks.size() == 1);
    REQUIRE(fixture.dispatcher->chunks[0].totalBytes == 0);
    auto data = fixture.receiver.take("c1", "empty");
    REQUIRE(data);
    REQUIRE(data->empty());
}
//---------------------------------------------------------------------------
TEST_CASE("blobstore_download_failures") {
    Fixture fixture;
    fixture.client.createContainer("c1");
    REQUIRE(fixture.failureOf(Operation::StartDownload, codec::serialize(StreamRequest{"missing", "c1", 0})) == ErrorKind::Rejected);

    // A refused chunk aborts the download
    string content(5000, 'z');
    auto transfer = fixture.client.upload("c1", "b1", core::asPayload(content), 1024);
    fixture.dispatcher->refuse = 1;
    fixture.client.startDownload("c1", "b1", 1024);
    fixture.provider.waitIdle();
    REQUIRE(fixture.provider.pump().aborted() == 1);
    REQUIRE(fixture.dispatcher->chunks.size() == 1);
    REQUIRE(fixture.receiver.state("c1", "b1") == TransferState::InProgress);
    REQUIRE(!fixture.receiver.take("c1", "b1"));

    // Any other failure of the push aborts the download and keeps the worker alive
    fixture.dispatcher->refuse = ~0ull;
    fixture.dispatcher->crash = 2;
    fixture.client.startDownload("c1", "b1", 1024);
    fixture.provider.waitIdle();
    REQUIRE(fixture.provider.pump().aborted() == 2);
    REQUIRE(fixture.dispatcher->chunks.size() == 3);

    fixture.dispatcher->crash = ~0ull;
    fixture.client.startDownload("c1", "b1", 1024);
    fixture.provider.waitIdle();
    REQUIRE(fixture.provider.pump().completed() == 1);
    REQUIRE(core::asString(*fixture.receiver.take("c1", "b1")) == content);
}
//---------------------------------------------------------------------------
TEST_CASE("blobstore_upload_size_limit") {
    ProviderConfig config;
    config.maxBlobSize = 8;
    Fixture fixture(config);
    fixture.client.createContainer("c1");

    REQUIRE(fixture.failureOf(Operation::StartUpload, codec::serialize(chunk(0, "", 9))) == ErrorKind::Rejected);
    REQUIRE(fixture.failureOf(Operation::StartUpload, codec::serialize(chunk(0, "", 1ull << 62))) == ErrorKind::Rejected);
    REQUIRE(fixture.failureOf(Operation::StartUpload, codec::serialize(chunk(0, "", ~0ull, 1ull << 40))) == ErrorKind::Rejected);
    REQUIRE(fixture.provider.activeUploads() == 0);

    auto transfer = fixture.client.upload("c1", "b1", core::asPayload("abcdefgh"), 4);
    REQUIRE(transfer.totalChunks == 2);
    REQUIRE(fixture.client.objectInfo("c1", "b1").byteSize == 8);
}
//---------------------------------------------------------------------------
TEST_CASE("blobstore_upload_huge_announcement") {
    Fixture fixture;
    fixture.client.createContainer("c1");
    REQUIRE(fixture.failureOf(Operation::StartUpload, codec::serialize(chunk(0, "", 1ull << 62))) == ErrorKind::Rejected);

    // An announcement within the limit does not allocate the announced size up front
    auto total = ProviderConfig::defaultMaxBlobSize;
    REQUIRE(fixture.call(Operation::StartUpload, codec::serialize(chunk(0, "", total))).empty());
    REQUIRE(fixture.call(Operation::UploadChunk, codec::serialize(chunk(0, "abcd", total))).empty());
    REQUIRE(fixture.provider.activeUploads() == 1);
    REQUIRE(fixture.failureOf(Operation::UploadChunk, codec::serialize(chunk(1, "ef", total))) == ErrorKind::SizeMismatch);
    REQUIRE(fixture.provider.activeUploads() == 0);
}
//---------------------------------------------------------------------------
TEST_CASE("blobstore_download_receiver") {
    DownloadReceiver receiver;
    string content = "abcdefghi";
    ChunkPlanner planner("c1", "b1", content.size(), 4);
    auto blob = core::asPayload(content);

    REQUIRE(receiver.receive(codec::serialize(planner.chunk(0, blob))) == TransferState::InProgress);
    try {
        receiver.receive(codec::serialize(planner.chunk(2, blob)));
        FAIL("chunk 2 after chunk 0 was accepted");
    } catch (const DispatchError& e) {
        REQUIRE(e.kind() == ErrorKind::OutOfSequence);
    }
    REQUIRE(receiver.state("c1", "b1") == TransferState::Idle);
    REQUIRE_THROWS_AS(receiver.receive(codec::serialize(planner.chunk(1, blob))), DispatchError);

    // A fresh download starts again at 0
    for (uint64_t sequence = 0; sequence < planner.chunks(); sequence++)
        receiver.receive(codec::serialize(planner.chunk(sequence, blob)));
    REQUIRE(core::asString(*receiver.take("c1", "b1")) == content);

    // A chunk without a download in progress
    REQUIRE_THROWS_AS(receiver.receive(codec::serialize(planner.chunk(1, blob))), DispatchError);
}
//---------------------------------------------------------------------------
TEST_CASE("blobstore_containers") {
    Fixture fixture;
    REQUIRE(fixture.client.createContainer("c1").id == "c1");
    REQUIRE(fixture.client.createContainer("c1").id == "c1");
    auto transfer = fixture.client.upload("c1", "b1", core::asPayload("abc"), 2);
    fixture.client.removeObject("c1", "b1");
    fixture.client.removeObject("c1", "b1");
    REQUIRE(fixture.client.listObjects("c1").empty());
    REQUIRE(fixture.failureOf(Operation::GetObjectInfo, codec::serialize(Blob{"b1", "c1", 0})) == ErrorKind::Rejected);
    REQUIRE(fixture.failureOf(Operation::GetObjectInfo, codec::serialize(Blob{"", "c1", 0})) == ErrorKind::Malformed);
    fixture.client.removeContainer("c1");
    fixture.client.removeContainer("c1");
    REQUIRE(fixture.failureOf(Operation::ListObjects, codec::serialize(Container{"c1"})) == ErrorKind::Rejected);
    REQUIRE(fixture.failureOf(Operation::CreateContainer, codec::serialize(Container{""})) == ErrorKind::Malformed);
}
//---------------------------------------------------------------------------
TEST_CASE("blobstore_unknown_operations") {
    Fixture fixture;
    REQUIRE(fixture.failureOf(Operation::Publish, {}) == ErrorKind::UnknownOperation);
    REQUIRE(fixture.failureOf(Operation::ReceiveChunk, {}) == ErrorKind::UnknownOperation);
    try {
        auto reply = fixture.provider.handleCall("MA", "Teleport", {});
        FAIL("Teleport was accepted");
    } catch (const DispatchError& e) {
        REQUIRE(e.kind() == ErrorKind::UnknownOperation);
    }
}
//---------------------------------------------------------------------------
TEST_CASE("blobstore_stale_uploads") {
    ProviderConfig config;
    config.staleTransferTimeout = chrono::milliseconds(100);
    Fixture fixture(config);
    fixture.client.createContainer("c1");
    auto reply = fixture.call(Operation::StartUpload, codec::serialize(chunk(0, "")));
    reply = fixture.call(Operation::UploadChunk, codec::serialize(chunk(0, "abcd")));

    auto now = BlobstoreProvider::clock::now();
    REQUIRE(fixture.provider.collectStale(now) == 0);
    REQUIRE(fixture.provider.activeUploads() == 1);
    REQUIRE(fixture.provider.collectStale(now + chrono::seconds(1)) == 1);
    REQUIRE(fixture.provider.activeUploads() == 0);
    REQUIRE(fixture.failureOf(Operation::UploadChunk, codec::serialize(chunk(1, "efgh"))) == ErrorKind::OutOfSequence);
}
//---------------------------------------------------------------------------
} // namespace caplink::blobstore::test
