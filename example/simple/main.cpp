#include "blobstore/client.hpp"
#include "blobstore/provider.hpp"
#include "core/operations.hpp"
#include "extras/messages.hpp"
#include "extras/provider.hpp"
#include "codec/codec.hpp"
#include "host/local_host.hpp"
#include "utils/log.hpp"
#include <iostream>
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
using namespace std;
using namespace caplink;
//---------------------------------------------------------------------------
int main(int argc, char** argv) {
    // Log level from the command line, e.g. debug to see every chunk
    utils::initLogging(argc > 1 ? string_view(argv[1]) : string_view("info"));

    // The actor and the blob to be uploaded and downloaded
    auto actorId = "MB4OLDIC3TCZ4Q4TGGOVAZC43VXFE2JQVRAXQMQFXUCREOOFEKOKZTY2";
    string container = "demo";
    string blobId = "greeting.txt";
    string content = "Hello from CapLink, streamed in tiny chunks!";

    // Create the host with a blob store and an extras provider
    host::LocalHost host;
    blobstore::ProviderConfig config;
    config.minChunkSize = 8;
    auto blobstoreProvider = make_unique<blobstore::BlobstoreProvider>(config);
    auto& blobProvider = *blobstoreProvider;
    auto blobstoreDescriptor = host.addProvider(move(blobstoreProvider));
    host.addProvider(make_unique<extras::ExtrasProvider>());

    // The actor reassembles pushed downloads
    blobstore::DownloadReceiver receiver;
    host.addActor(actorId, [&](string_view origin, string_view op, core::PayloadView msg) -> core::Payload {
        if (op == core::operationName(core::Operation::ReceiveChunk)) {
            receiver.receive(msg);
            return {};
        }
        if (op == core::operationName(core::Operation::HealthRequest))
            return {};
        throw core::DispatchError(core::ErrorKind::UnknownOperation, string(op) + " from " + string(origin));
    });
    host.bind(actorId, string(core::capability::blobstore));
    host.bind(actorId, string(core::capability::extras));

    // Print the descriptor in its textual form
    cout << blobstoreDescriptor.toText() << endl;

    try {
        // Upload, query and download the blob
        blobstore::BlobClient client([&](string_view op, core::PayloadView msg) { return host.call(actorId, core::capability::blobstore, op, msg); });
        client.createContainer(container);
        auto transfer = client.upload(container, blobId, core::asPayload(content), 8);
        cout << "uploaded " << transfer.totalSize << " bytes in " << transfer.totalChunks << " chunks" << endl;
        cout << "stored size " << client.objectInfo(container, blobId).byteSize << endl;

        // The download arrives through ReceiveChunk pushes
        client.startDownload(container, blobId, 16);
        blobProvider.waitIdle();
        auto downloaded = receiver.take(container, blobId);
        if (!downloaded) {
            cerr << "download did not complete" << endl;
            return 1;
        }
        cout << "downloaded: " << core::asString(*downloaded) << endl;

        // Ask the extras provider for a guid
        extras::GeneratorRequest request;
        request.guid = true;
        auto reply = host.call(actorId, core::capability::extras, core::operationName(core::Operation::RequestGuid), codec::serialize(request));
        cout << "guid: " << codec::deserialize<extras::GeneratorResult>(reply).guid.value_or("") << endl;
        cout << "actor healthy: " << boolalpha << host.healthCheck(actorId) << endl;
    } catch (const core::DispatchError& e) {
        cerr << e.what() << endl;
        return 1;
    }
    return 0;
}
//---------------------------------------------------------------------------
