#include "codec/codec.hpp"
#include "blobstore/messages.hpp"
#include "eventstreams/messages.hpp"
#include "extras/messages.hpp"
#include "http/messages.hpp"
#include "logging/messages.hpp"
#include "messaging/messages.hpp"
#include "catch2/catch.hpp"
#include <string>
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace caplink::codec::test {
//---------------------------------------------------------------------------
using namespace std;
using core::asPayload;
using core::asString;
using core::DispatchError;
using core::ErrorKind;
//---------------------------------------------------------------------------
static ErrorKind failureOf(string_view text)
// Decode a chunk and report the error kind
{
    try {
        auto chunk = deserialize<blobstore::FileChunk>(asPayload(text));
    } catch (const DispatchError& e) {
        return e.kind();
    }
    FAIL("payload was accepted: " << text);
    return ErrorKind::Backend;
}
//---------------------------------------------------------------------------
TEST_CASE("codec_field_names") {
    blobstore::FileChunk chunk;
    chunk.sequenceNo = 1;
    chunk.container = "c1";
    chunk.id = "b1";
    chunk.totalBytes = 9;
    chunk.chunkSize = 4;
    chunk.chunkBytes = {'e', 'f', 'g', 'h'};
    auto payload = serialize(chunk);
    auto object = decode(payload);
    REQUIRE(object["sequenceNo"].asUInt64() == 1);
    REQUIRE(object["totalBytes"].asUInt64() == 9);
    REQUIRE(object["chunkSize"].asUInt64() == 4);
    REQUIRE(object["chunkBytes"].asString() == "ZWZnaA==");
    REQUIRE(deserialize<blobstore::FileChunk>(payload) == chunk);

    // Compact output
    REQUIRE(asString(payload).find(' ') == string_view::npos);
    REQUIRE(asString(payload).find('\n') == string_view::npos);
}
//---------------------------------------------------------------------------
TEST_CASE("codec_defaults") {
    // Absent fields take the type defaults
    auto chunk = deserialize<blobstore::FileChunk>(asPayload(R"({"id":"b1"})"));
    REQUIRE(chunk.id == "b1");
    REQUIRE(chunk.container.empty());
    REQUIRE(chunk.sequenceNo == 0);
    REQUIRE(chunk.chunkBytes.empty());

    // The empty payload is the empty object
    auto empty = deserialize<blobstore::StreamRequest>({});
    REQUIRE(empty.chunkSize == 0);

    // Null counts as absent
    auto blob = deserialize<blobstore::Blob>(asPayload(R"({"id":"x","byteSize":null})"));
    REQUIRE(blob.byteSize == 0);

    // Unknown fields are ignored
    auto list = deserialize<blobstore::BlobList>(asPayload(R"({"blobs":[{"id":"x","container":"c","byteSize":3}],"next":"y"})"));
    REQUIRE(list.blobs.size() == 1);
    REQUIRE(list.blobs[0] == blobstore::Blob{"x", "c", 3});
}
//---------------------------------------------------------------------------
TEST_CASE("codec_malformed") {
    REQUIRE(failureOf("{") == ErrorKind::Malformed);
    REQUIRE(failureOf("{} {}") == ErrorKind::Malformed);
    REQUIRE(failureOf("42") == ErrorKind::Malformed);
    REQUIRE(failureOf(R"({"sequenceNo":"one"})") == ErrorKind::Malformed);
    REQUIRE(failureOf(R"({"sequenceNo":-1})") == ErrorKind::Malformed);
    REQUIRE(failureOf(R"({"container":7})") == ErrorKind::Malformed);
    REQUIRE(failureOf(R"({"chunkBytes":"abc"})") == ErrorKind::Malformed);
    REQUIRE(failureOf(R"({"chunkBytes":[1,2]})") == ErrorKind::Malformed);
}
//---------------------------------------------------------------------------
TEST_CASE("codec_message_shapes") {
    messaging::RequestMessage request{"user.profile.175", {'q'}, 100};
    auto object = decode(serialize(request));
    REQUIRE(object["timeout"].asInt64() == 100);
    REQUIRE(deserialize<messaging::RequestMessage>(serialize(request)).timeoutMs == 100);

    messaging::BrokerMessage message{"subject", "_INBOX.1", {1, 2, 3}};
    REQUIRE(decode(serialize(message)).isMember("replyTo"));
    REQUIRE(deserialize<messaging::BrokerMessage>(serialize(message)) == message);

    logging::WriteLogRequest log{4, "This is a debug message"};
    REQUIRE(decode(serialize(log))["level"].asUInt() == 4);

    eventstreams::StreamQuery query;
    query.streamId = "stream1";
    query.count = 42;
    auto withoutRange = deserialize<eventstreams::StreamQuery>(serialize(query));
    REQUIRE(!withoutRange.range);
    query.range = eventstreams::TimeRange{0, 1000};
    auto withRange = deserialize<eventstreams::StreamQuery>(serialize(query));
    REQUIRE(withRange.range == eventstreams::TimeRange{0, 1000});
    REQUIRE(withRange.count == 42);

    eventstreams::StreamResults results;
    results.events.push_back(eventstreams::Event{"e1", "stream1", {{"k", "v"}}});
    REQUIRE(deserialize<eventstreams::StreamResults>(serialize(results)).events == results.events);

    extras::GeneratorResult generated;
    REQUIRE(decode(serialize(generated))["guid"].isNull());
    REQUIRE(!deserialize<extras::GeneratorResult>(serialize(generated)).guid);
    generated.guid = "1b4e28ba-2fa1-41d2-883f-0016d3cca427";
    REQUIRE(deserialize<extras::GeneratorResult>(serialize(generated)).guid == generated.guid);
}
//---------------------------------------------------------------------------
TEST_CASE("codec_http_messages") {
    http::Request request;
    request.method = "GET";
    request.path = "/foo";
    request.queryString = "a=1&b=2";
    request.header = {{"accept", "application/json"}, {"dummy", "value"}};
    const string requestBody = "This is the body of a request";
    request.body.assign(requestBody.begin(), requestBody.end());

    auto object = decode(serialize(request));
    REQUIRE(object["queryString"].asString() == "a=1&b=2");
    REQUIRE(object["header"]["accept"].asString() == "application/json");
    auto decoded = deserialize<http::Request>(serialize(request));
    REQUIRE(decoded.method == "GET");
    REQUIRE(decoded.path == "/foo");
    REQUIRE(decoded.header == request.header);
    REQUIRE(decoded.body == request.body);

    auto bare = deserialize<http::Request>(asPayload(R"({"method":"DELETE","path":"/x","queryString":""})"));
    REQUIRE(bare.header.empty());
    REQUIRE(bare.body.empty());

    auto response = http::Response::internalServerError("boom");
    REQUIRE(response.statusCode == 500);
    REQUIRE(response.status == "Internal Server Error");
    auto echoed = deserialize<http::Response>(serialize(response));
    REQUIRE(echoed.statusCode == 500);
    REQUIRE(asString(echoed.body) == "boom");
    REQUIRE(decode(serialize(response))["statusCode"].asUInt() == 500);

    REQUIRE(http::Response::ok().statusCode == 200);
    REQUIRE(http::Response::ok().status == "OK");
    REQUIRE(http::Response::notFound().statusCode == 404);
    REQUIRE(http::Response::badRequest().status == "Bad Request");

    logging::WriteLogRequest log{2, "hello"};
    auto json = http::Response::json(log, 201, "Created");
    REQUIRE(json.statusCode == 201);
    REQUIRE(json.header.empty());
    REQUIRE(deserialize<logging::WriteLogRequest>(json.body).body == "hello");
}
//---------------------------------------------------------------------------
} // namespace caplink::codec::test
