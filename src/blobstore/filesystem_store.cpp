#include "blobstore/filesystem_store.hpp"
#include "core/error.hpp"
#include "utils/utils.hpp"
#include <fstream>
#include <iterator>
#include <spdlog/spdlog.h>
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
namespace fs = std::filesystem;
//---------------------------------------------------------------------------
static void validateName(const string& kind, const string& name)
// Names must stay within their parent directory
{
    if (name.empty() || name == "." || name == ".." || name.find('/') != string::npos || name.find('\0') != string::npos)
        throw DispatchError(ErrorKind::Rejected, "invalid " + kind + " id '" + name + "'");
}
//---------------------------------------------------------------------------
[[noreturn]] static void backendFailure(const string& what, const error_code& ec)
// Raise a backend error
{
    throw DispatchError(ErrorKind::Backend, what + ": " + ec.message());
}
//---------------------------------------------------------------------------
FileSystemStore::FileSystemStore(fs::path root) : _root(move(root))
// The constructor
{
    error_code ec;
    fs::create_directories(_root, ec);
    if (ec)
        backendFailure("cannot create root " + _root.string(), ec);
    spdlog::info("[FileSystemStore] serving blobs below {}", _root.string());
}
//---------------------------------------------------------------------------
fs::path FileSystemStore::containerPath(const string& container) const
// Get the directory of a container
{
    validateName("container", container);
    return _root / container;
}
//---------------------------------------------------------------------------
fs::path FileSystemStore::objectPath(const string& container, const string& id) const
// Get the file of a blob
{
    validateName("blob", id);
    return containerPath(container) / id;
}
//---------------------------------------------------------------------------
void FileSystemStore::createContainer(const string& container)
// Create a container
{
    auto path = containerPath(container);
    lock_guard lock(_mutex);
    error_code ec;
    fs::create_directory(path, ec);
    if (ec)
        backendFailure("cannot create container " + container, ec);
}
//---------------------------------------------------------------------------
void FileSystemStore::removeContainer(const string& container)
// Remove a container
{
    auto path = containerPath(container);
    lock_guard lock(_mutex);
    error_code ec;
    fs::remove_all(path, ec);
    if (ec)
        backendFailure("cannot remove container " + container, ec);
}
//---------------------------------------------------------------------------
bool FileSystemStore::containerExists(const string& container) const
// Does the container exist?
{
    auto path = containerPath(container);
    error_code ec;
    return fs::is_directory(path, ec);
}
//---------------------------------------------------------------------------
vector<Blob> FileSystemStore::listObjects(const string& container) const
// List the blobs of a container
{
    auto path = containerPath(container);
    lock_guard lock(_mutex);
    error_code ec;
    if (!fs::is_directory(path, ec))
        throw DispatchError(ErrorKind::Rejected, "container " + container + " does not exist");
    vector<Blob> blobs;
    for (auto it = fs::directory_iterator(path, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        if (!it->is_regular_file())
            continue;
        blobs.push_back(Blob{it->path().filename().string(), container, it->file_size()});
    }
    if (ec)
        backendFailure("cannot list container " + container, ec);
    return blobs;
}
//---------------------------------------------------------------------------
optional<Blob> FileSystemStore::objectInfo(const string& container, const string& id) const
// Get the metadata of a blob
{
    auto path = objectPath(container, id);
    error_code ec;
    if (!fs::is_regular_file(path, ec))
        return nullopt;
    auto size = fs::file_size(path, ec);
    if (ec)
        backendFailure("cannot stat blob " + container + "/" + id, ec);
    return Blob{id, container, size};
}
//---------------------------------------------------------------------------
void FileSystemStore::putObject(const string& container, const string& id, vector<uint8_t> data)
// Store a blob, written to a staging file below the root and renamed into place
{
    auto path = objectPath(container, id);
    lock_guard lock(_mutex);
    error_code ec;
    if (!fs::is_directory(path.parent_path(), ec))
        throw DispatchError(ErrorKind::Rejected, "container " + container + " does not exist");

    auto staging = _root / (".upload-" + utils::generateGuid());
    {
        ofstream out(staging, ios::binary | ios::trunc);
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<streamsize>(data.size()));
        out.close();
        if (!out) {
            fs::remove(staging, ec);
            throw DispatchError(ErrorKind::Backend, "cannot write blob " + container + "/" + id);
        }
    }
    fs::rename(staging, path, ec);
    if (ec) {
        auto renameError = ec;
        fs::remove(staging, ec);
        backendFailure("cannot commit blob " + container + "/" + id, renameError);
    }
}
//---------------------------------------------------------------------------
vector<uint8_t> FileSystemStore::getObject(const string& container, const string& id) const
// Read a whole blob
{
    auto path = objectPath(container, id);
    error_code ec;
    if (!fs::is_regular_file(path, ec))
        throw DispatchError(ErrorKind::Rejected, "blob " + container + "/" + id + " does not exist");
    ifstream in(path, ios::binary);
    if (!in)
        throw DispatchError(ErrorKind::Backend, "cannot open blob " + container + "/" + id);
    vector<uint8_t> data((istreambuf_iterator<char>(in)), istreambuf_iterator<char>());
    if (in.bad())
        throw DispatchError(ErrorKind::Backend, "cannot read blob " + container + "/" + id);
    return data;
}
//---------------------------------------------------------------------------
void FileSystemStore::removeObject(const string& container, const string& id)
// Remove a blob
{
    auto path = objectPath(container, id);
    lock_guard lock(_mutex);
    error_code ec;
    fs::remove(path, ec);
    if (ec)
        backendFailure("cannot remove blob " + container + "/" + id, ec);
}
//---------------------------------------------------------------------------
} // namespace caplink::blobstore
