#include "catch2/catch.hpp"
#include "blobstore/client.hpp"
#include "blobstore/provider.hpp"
#include "codec/codec.hpp"
#include "core/error.hpp"
#include "core/messages.hpp"
#include "core/operations.hpp"
#include "extras/messages.hpp"
#include "extras/provider.hpp"
#include "host/local_host.hpp"
#include "utils/utils.hpp"
#include <atomic>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace caplink {
namespace test {
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
/// A blob store with a revision of choice
class RevisedBlobstore : public core::CapabilityProvider {
    /// The wrapped provider
    blobstore::BlobstoreProvider _inner;
    /// The descriptor
    core::CapabilityDescriptor _descriptor;

    public:
    /// The constructor
    explicit RevisedBlobstore(uint32_t revision) : _inner(), _descriptor() {
        auto builder = core::DescriptorBuilder().withId(core::capability::blobstore).withRevision(revision);
        auto base = blobstore::BlobstoreProvider::describe();
        for (auto& op : base.operations())
            builder = builder.withOperation(op.name, op.direction, op.doctext);
        _descriptor = builder.build();
    }
    /// Hand over the dispatcher
    void configureDispatch(unique_ptr<core::Dispatcher> dispatcher) override { _inner.configureDispatch(std::move(dispatcher)); }
    /// Answer with the own descriptor
    Payload handleCall(string_view actor, string_view op, PayloadView msg) override {
        if (op == operationName(Operation::GetCapabilityDescriptor))
            return codec::serialize(_descriptor);
        return _inner.handleCall(actor, op, msg);
    }
    /// The wrapped provider
    const blobstore::BlobstoreProvider& inner() const { return _inner; }
};
//---------------------------------------------------------------------------
/// A provider whose operations fail with a plain exception
class FaultyProvider : public core::CapabilityProvider {
    public:
    /// Nothing to push
    void configureDispatch(unique_ptr<core::Dispatcher>) override {}
    /// Answer the host, fail everything else
    Payload handleCall(string_view, string_view op, PayloadView) override {
        if (op == operationName(Operation::GetCapabilityDescriptor))
            return codec::serialize(core::DescriptorBuilder().withId("caplink:faulty").withOperation("Explode", core::OperationDirection::ToProvider, "Fail").build());
        if (op == operationName(Operation::BindActor) || op == operationName(Operation::RemoveActor))
            return {};
        throw runtime_error("out of memory");
    }
};
//---------------------------------------------------------------------------
ErrorKind failureOf(const function<void()>& body)
// Run the body and report the error kind
{
    try {
        body();
    } catch (const DispatchError& e) {
        return e.kind();
    }
    FAIL("host operation succeeded");
    return ErrorKind::Backend;
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
TEST_CASE("LocalHost Integration") {
    host::LocalHost host;
    auto provider = make_unique<blobstore::BlobstoreProvider>();
    auto& blobProvider = *provider;
    auto descriptor = host.addProvider(std::move(provider));
    REQUIRE(descriptor.id() == core::capability::blobstore);
    REQUIRE(host.descriptor(core::capability::blobstore) == descriptor);
    host.addProvider(make_unique<extras::ExtrasProvider>());
    REQUIRE(host.capabilities().size() == 2);

    // The actor reassembles downloads and answers health checks
    blobstore::DownloadReceiver receiver;
    atomic<unsigned> healthChecks = 0;
    vector<uint8_t> lastModule;
    host.addActor("MA", [&](string_view origin, string_view op, PayloadView msg) -> Payload {
        if (op == operationName(Operation::ReceiveChunk)) {
            if (origin != core::capability::blobstore)
                throw DispatchError(ErrorKind::Rejected, "chunk from " + string(origin));
            receiver.receive(msg);
            return {};
        }
        if (op == operationName(Operation::HealthRequest)) {
            healthChecks++;
            return {};
        }
        if (op == operationName(Operation::PerformLiveUpdate)) {
            lastModule = codec::deserialize<core::LiveUpdate>(msg).newModule;
            return {};
        }
        throw DispatchError(ErrorKind::UnknownOperation, string(op));
    });

    blobstore::BlobClient client([&](string_view op, PayloadView msg) { return host.call("MA", core::capability::blobstore, op, msg); });

    // Calls before binding are refused, the descriptor is always available
    REQUIRE(failureOf([&] { client.createContainer("c1"); }) == ErrorKind::Rejected);
    auto unboundReply = host.call("MA", core::capability::blobstore, operationName(Operation::GetCapabilityDescriptor), {});
    REQUIRE(codec::deserialize<core::CapabilityDescriptor>(unboundReply) == descriptor);
    host.bind("MA", string(core::capability::blobstore), {{"tenant", "blue"}});
    REQUIRE(host.bound("MA", string(core::capability::blobstore)));
    REQUIRE(blobProvider.core().bindings().find("MA")->get("tenant") == "blue");

    SECTION("upload and download") {
        client.createContainer("c1");
        string content(3000, 'x');
        for (auto i = 0u; i < content.size(); i += 7)
            content[i] = 'y';
        auto transfer = client.upload("c1", "b1", core::asPayload(content), 512);
        REQUIRE(transfer.totalChunks == 6);
        REQUIRE(client.objectInfo("c1", "b1").byteSize == 3000);

        client.startDownload("c1", "b1", 0);
        blobProvider.waitIdle();
        auto data = receiver.take("c1", "b1");
        REQUIRE(data);
        REQUIRE(core::asString(*data) == content);
    }
    SECTION("routing errors") {
        REQUIRE(failureOf([&] { auto reply = host.call("MA", "caplink:nothing", "StartUpload", {}); }) == ErrorKind::Rejected);
        REQUIRE(failureOf([&] { auto reply = host.call("MA", core::capability::blobstore, "RequestGuid", {}); }) == ErrorKind::UnknownOperation);
        REQUIRE(failureOf([&] { auto reply = host.dispatch(core::capability::blobstore, "MB", "ReceiveChunk", {}); }) == ErrorKind::Rejected);
        REQUIRE(failureOf([&] { host.bind("MB", string(core::capability::blobstore)); }) == ErrorKind::Rejected);
        auto reply = host.call("MA", core::capability::blobstore, operationName(Operation::GetCapabilityDescriptor), {});
        REQUIRE(codec::deserialize<core::CapabilityDescriptor>(reply) == descriptor);
    }
    SECTION("claims") {
        host.addActor("MC", [](string_view, string_view, PayloadView) -> Payload { return {}; });
        REQUIRE(failureOf([&] { host.bind("MC", string(core::capability::extras), {{string(core::claims::capabilities), "caplink:blobstore"}}); }) == ErrorKind::Rejected);
        REQUIRE(failureOf([&] { host.bind("MC", string(core::capability::extras), {{string(core::claims::expires), "1"}}); }) == ErrorKind::Rejected);
        host.bind("MC", string(core::capability::extras), {{string(core::claims::capabilities), "caplink:extras"}});

        extras::GeneratorRequest request;
        request.sequence = true;
        auto reply = host.call("MC", core::capability::extras, operationName(Operation::RequestSequence), codec::serialize(request));
        REQUIRE(codec::deserialize<extras::GeneratorResult>(reply).sequenceNumber == 1);

        REQUIRE(host.removeActor("MC"));
        REQUIRE(!host.removeActor("MC"));
        REQUIRE(!host.bound("MC", string(core::capability::extras)));
    }
    SECTION("health and live update") {
        REQUIRE(host.healthCheck("MA"));
        REQUIRE(healthChecks == 1);
        REQUIRE(!host.healthCheck("MB"));
        host.liveUpdate("MA", {1, 2, 3});
        REQUIRE(lastModule == vector<uint8_t>{1, 2, 3});

        // Failures of the actor other than dispatch errors surface as backend errors
        host.addActor("MD", [](string_view, string_view, PayloadView) -> Payload { throw runtime_error("trap"); });
        REQUIRE(failureOf([&] { host.liveUpdate("MD", {}); }) == ErrorKind::Backend);
        REQUIRE(!host.healthCheck("MD"));
    }
    SECTION("provider replacement") {
        REQUIRE(failureOf([&] { host.addProvider(make_unique<RevisedBlobstore>(descriptor.revision())); }) == ErrorKind::Rejected);
        auto revised = make_unique<RevisedBlobstore>(descriptor.revision() + 1);
        auto& revisedProvider = *revised;
        auto replacement = host.addProvider(std::move(revised));
        REQUIRE(replacement.revision() == descriptor.revision() + 1);
        REQUIRE(host.descriptor(core::capability::blobstore)->revision() == descriptor.revision() + 1);

        // The binding was replayed to the new provider
        REQUIRE(revisedProvider.inner().core().bindings().find("MA")->get("tenant") == "blue");
        REQUIRE(client.createContainer("c2").id == "c2");
    }
    SECTION("provider failures") {
        host.addProvider(make_unique<FaultyProvider>());
        host.bind("MA", "caplink:faulty");
        REQUIRE(failureOf([&] { auto reply = host.call("MA", "caplink:faulty", "Explode", {}); }) == ErrorKind::Backend);

        // A huge upload announcement is refused instead of exhausting memory
        client.createContainer("c1");
        blobstore::FileChunk start;
        start.container = "c1";
        start.id = "b1";
        start.totalBytes = 1ull << 62;
        start.chunkSize = 4;
        REQUIRE(failureOf([&] { auto reply = host.call("MA", core::capability::blobstore, operationName(Operation::StartUpload), codec::serialize(start)); }) == ErrorKind::Rejected);
    }
    SECTION("unbind") {
        host.unbind("MA", string(core::capability::blobstore));
        REQUIRE(!blobProvider.core().bindings().contains("MA"));
        REQUIRE(failureOf([&] { client.createContainer("c1"); }) == ErrorKind::Rejected);
    }
}
//---------------------------------------------------------------------------
TEST_CASE("LocalHost FileSystem Integration") {
    auto root = filesystem::temp_directory_path() / ("caplink-host-" + utils::generateGuid());
    {
        host::LocalHost host;
        blobstore::ProviderConfig config;
        config.rootDirectory = root.string();
        host.addProvider(make_unique<blobstore::BlobstoreProvider>(config));
        host.addActor("MA", [](string_view, string_view, PayloadView) -> Payload { return {}; });
        host.bind("MA", string(core::capability::blobstore));

        blobstore::BlobClient client([&](string_view op, PayloadView msg) { return host.call("MA", core::capability::blobstore, op, msg); });
        client.createContainer("photos");
        auto transfer = client.upload("photos", "cat.jpg", core::asPayload("meow meow meow"), 4);
        REQUIRE(client.objectInfo("photos", "cat.jpg").byteSize == 14);
        REQUIRE(filesystem::file_size(root / "photos" / "cat.jpg") == 14);
        REQUIRE(failureOf([&] { client.createContainer(".."); }) == ErrorKind::Rejected);
    }
    filesystem::remove_all(root);
}
//---------------------------------------------------------------------------
} // namespace test
} // namespace caplink
