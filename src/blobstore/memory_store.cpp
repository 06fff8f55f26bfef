#include "blobstore/memory_store.hpp"
#include "core/error.hpp"
#include <mutex>
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
void MemoryStore::createContainer(const string& container)
// Create a container
{
    unique_lock lock(_mutex);
    _containers.try_emplace(container);
}
//---------------------------------------------------------------------------
void MemoryStore::removeContainer(const string& container)
// Remove a container
{
    unique_lock lock(_mutex);
    _containers.erase(container);
}
//---------------------------------------------------------------------------
bool MemoryStore::containerExists(const string& container) const
// Does the container exist?
{
    shared_lock lock(_mutex);
    return _containers.contains(container);
}
//---------------------------------------------------------------------------
vector<Blob> MemoryStore::listObjects(const string& container) const
// List the blobs of a container
{
    shared_lock lock(_mutex);
    auto it = _containers.find(container);
    if (it == _containers.end())
        throw DispatchError(ErrorKind::Rejected, "container " + container + " does not exist");
    vector<Blob> blobs;
    blobs.reserve(it->second.size());
    for (auto& [id, data] : it->second)
        blobs.push_back(Blob{id, container, data.size()});
    return blobs;
}
//---------------------------------------------------------------------------
optional<Blob> MemoryStore::objectInfo(const string& container, const string& id) const
// Get the metadata of a blob
{
    shared_lock lock(_mutex);
    auto it = _containers.find(container);
    if (it == _containers.end())
        return nullopt;
    auto blob = it->second.find(id);
    if (blob == it->second.end())
        return nullopt;
    return Blob{id, container, blob->second.size()};
}
//---------------------------------------------------------------------------
void MemoryStore::putObject(const string& container, const string& id, vector<uint8_t> data)
// Store a blob
{
    unique_lock lock(_mutex);
    auto it = _containers.find(container);
    if (it == _containers.end())
        throw DispatchError(ErrorKind::Rejected, "container " + container + " does not exist");
    it->second.insert_or_assign(id, move(data));
}
//---------------------------------------------------------------------------
vector<uint8_t> MemoryStore::getObject(const string& container, const string& id) const
// Read a whole blob
{
    shared_lock lock(_mutex);
    auto it = _containers.find(container);
    if (it != _containers.end()) {
        auto blob = it->second.find(id);
        if (blob != it->second.end())
            return blob->second;
    }
    throw DispatchError(ErrorKind::Rejected, "blob " + container + "/" + id + " does not exist");
}
//---------------------------------------------------------------------------
void MemoryStore::removeObject(const string& container, const string& id)
// Remove a blob
{
    unique_lock lock(_mutex);
    auto it = _containers.find(container);
    if (it != _containers.end())
        it->second.erase(id);
}
//---------------------------------------------------------------------------
} // namespace caplink::blobstore
