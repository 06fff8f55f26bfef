#include "blobstore/config.hpp"
#include "core/error.hpp"
#include "catch2/catch.hpp"
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
//---------------------------------------------------------------------------
TEST_CASE("provider_config_defaults") {
    ProviderConfig config;
    REQUIRE(config.chunkSize == 64 * 1024);
    REQUIRE(config.minChunkSize == 1024);
    REQUIRE(config.maxChunkSize == 4 * 1024 * 1024);
    REQUIRE(config.downloadWorkers == 2);
    REQUIRE(config.maxBlobSize == 4ull * 1024 * 1024 * 1024);
    REQUIRE(config.staleTransferTimeout == chrono::minutes(5));
    REQUIRE(config.rootDirectory.empty());
}
//---------------------------------------------------------------------------
TEST_CASE("provider_config_chunk_size") {
    ProviderConfig config;
    REQUIRE(config.selectChunkSize(0) == config.chunkSize);
    REQUIRE(config.selectChunkSize(1) == config.minChunkSize);
    REQUIRE(config.selectChunkSize(8192) == 8192);
    REQUIRE(config.selectChunkSize(~0ull) == config.maxChunkSize);
}
//---------------------------------------------------------------------------
TEST_CASE("provider_config_values") {
    auto config = ProviderConfig::fromValues({{"chunk_size", "4096"}, {"min_chunk_size", "16"}, {"max_chunk_size", "65536"}, {"download_workers", "4"}, {"max_blob_size", "1048576"}, {"stale_timeout_ms", "250"}, {"root_dir", "/tmp/blobs"}, {"unrelated", "x"}});
    REQUIRE(config.chunkSize == 4096);
    REQUIRE(config.minChunkSize == 16);
    REQUIRE(config.maxChunkSize == 65536);
    REQUIRE(config.downloadWorkers == 4);
    REQUIRE(config.maxBlobSize == 1048576);
    REQUIRE(config.staleTransferTimeout == chrono::milliseconds(250));
    REQUIRE(config.rootDirectory == "/tmp/blobs");

    REQUIRE(ProviderConfig::fromValues({}).chunkSize == ProviderConfig::defaultChunkSize);
    REQUIRE_THROWS_AS(ProviderConfig::fromValues({{"chunk_size", "big"}}), core::DispatchError);
    REQUIRE_THROWS_AS(ProviderConfig::fromValues({{"chunk_size", "-5"}}), core::DispatchError);
    REQUIRE_THROWS_AS(ProviderConfig::fromValues({{"chunk_size", "12 "}}), core::DispatchError);
    REQUIRE_THROWS_AS(ProviderConfig::fromValues({{"download_workers", "0"}}), core::DispatchError);
    REQUIRE_THROWS_AS(ProviderConfig::fromValues({{"min_chunk_size", "9000000"}}), core::DispatchError);
    REQUIRE_THROWS_AS(ProviderConfig::fromValues({{"chunk_size", "16"}}), core::DispatchError);
    REQUIRE_THROWS_AS(ProviderConfig::fromValues({{"max_blob_size", "0"}}), core::DispatchError);
}
//---------------------------------------------------------------------------
} // namespace caplink::blobstore::test
