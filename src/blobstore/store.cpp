#include "blobstore/store.hpp"
#include "blobstore/filesystem_store.hpp"
#include "blobstore/memory_store.hpp"
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
unique_ptr<BlobStore> BlobStore::makeStore(const string& rootDirectory)
// Create a store
{
    if (rootDirectory.empty())
        return make_unique<MemoryStore>();
    return make_unique<FileSystemStore>(rootDirectory);
}
//---------------------------------------------------------------------------
} // namespace caplink::blobstore
