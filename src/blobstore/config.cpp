#include "blobstore/config.hpp"
#include "core/error.hpp"
#include <charconv>
#include <utility>
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
//---------------------------------------------------------------------------
static uint64_t parseNumber(const unordered_map<string, string>& values, const char* key, uint64_t fallback)
// Parse an unsigned decimal value
{
    auto it = values.find(key);
    if (it == values.end())
        return fallback;
    auto& text = it->second;
    uint64_t result = 0;
    auto [ptr, ec] = from_chars(text.data(), text.data() + text.size(), result);
    if (text.empty() || ec != errc() || ptr != text.data() + text.size())
        throw DispatchError(ErrorKind::Malformed, string(key) + " is not a number: '" + text + "'");
    return result;
}
//---------------------------------------------------------------------------
ProviderConfig ProviderConfig::fromValues(const unordered_map<string, string>& values)
// Parse from binding style string values
{
    ProviderConfig config;
    config.chunkSize = parseNumber(values, "chunk_size", config.chunkSize);
    config.minChunkSize = parseNumber(values, "min_chunk_size", config.minChunkSize);
    config.maxChunkSize = parseNumber(values, "max_chunk_size", config.maxChunkSize);
    config.maxBlobSize = parseNumber(values, "max_blob_size", config.maxBlobSize);
    auto workers = parseNumber(values, "download_workers", config.downloadWorkers);
    config.staleTransferTimeout = chrono::milliseconds(parseNumber(values, "stale_timeout_ms", static_cast<uint64_t>(config.staleTransferTimeout.count())));
    if (auto it = values.find("root_dir"); it != values.end())
        config.rootDirectory = it->second;

    if (!config.minChunkSize || config.minChunkSize > config.maxChunkSize)
        throw DispatchError(ErrorKind::Malformed, "chunk size bounds are invalid");
    if (config.chunkSize < config.minChunkSize || config.chunkSize > config.maxChunkSize)
        throw DispatchError(ErrorKind::Malformed, "chunk_size lies outside [min_chunk_size, max_chunk_size]");
    if (!config.maxBlobSize)
        throw DispatchError(ErrorKind::Malformed, "max_blob_size must be positive");
    if (!workers || !in_range<unsigned>(workers))
        throw DispatchError(ErrorKind::Malformed, "download_workers must be positive");
    config.downloadWorkers = static_cast<unsigned>(workers);
    return config;
}
//---------------------------------------------------------------------------
} // namespace caplink::blobstore
