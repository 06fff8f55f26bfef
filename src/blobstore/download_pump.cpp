#include "blobstore/download_pump.hpp"
#include "codec/codec.hpp"
#include "core/operations.hpp"
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
//---------------------------------------------------------------------------
DownloadPump::DownloadPump(core::DispatcherSlot& dispatcher, unsigned workers) : _dispatcher(dispatcher), _jobs(), _mutex(), _wakeup(), _idle(), _running(0), _stop(false), _completed(0), _aborted(0), _workers()
// The constructor
{
    if (!workers)
        workers = 1;
    _workers.reserve(workers);
    for (unsigned i = 0; i < workers; i++)
        _workers.emplace_back(&DownloadPump::run, this);
}
//---------------------------------------------------------------------------
DownloadPump::~DownloadPump() noexcept
// The destructor
{
    {
        lock_guard lock(_mutex);
        _stop = true;
    }
    _wakeup.notify_all();
    for (auto& worker : _workers)
        worker.join();
}
//---------------------------------------------------------------------------
void DownloadPump::enqueue(string actor, ChunkPlanner planner, vector<uint8_t> data)
// Queue a download
{
    {
        lock_guard lock(_mutex);
        _jobs.push_back(Job{move(actor), move(planner), move(data)});
    }
    _wakeup.notify_one();
}
//---------------------------------------------------------------------------
void DownloadPump::waitIdle()
// Block until no job is queued or running
{
    unique_lock lock(_mutex);
    _idle.wait(lock, [this] { return _jobs.empty() && !_running; });
}
//---------------------------------------------------------------------------
void DownloadPump::run()
// The worker loop, leaves once stopped and drained
{
    while (true) {
        unique_lock lock(_mutex);
        _wakeup.wait(lock, [this] { return _stop || !_jobs.empty(); });
        if (_jobs.empty())
            return;
        auto job = move(_jobs.front());
        _jobs.pop_front();
        _running++;
        lock.unlock();

        if (send(job))
            _completed++;
        else
            _aborted++;

        lock.lock();
        _running--;
        if (_jobs.empty() && !_running)
            _idle.notify_all();
    }
}
//---------------------------------------------------------------------------
bool DownloadPump::send(const Job& job)
// Send all chunks of a job, an empty blob is sent as a single empty chunk
{
    auto& transfer = job.planner.transfer();
    auto chunks = max<uint64_t>(job.planner.chunks(), 1);
    auto op = core::operationName(core::Operation::ReceiveChunk);
    spdlog::info("[DownloadPump] sending {}/{} to {} in {} chunks of {} bytes", transfer.container, transfer.blobId, job.actor, chunks, transfer.chunkSize);
    for (uint64_t sequence = 0; sequence < chunks; sequence++) {
        auto payload = codec::serialize(job.planner.chunk(sequence, job.data));
        try {
            [[maybe_unused]] auto ack = _dispatcher.get().dispatch(job.actor, op, payload);
        } catch (const core::DispatchError& e) {
            spdlog::warn("[DownloadPump] download {}/{} to {} aborted at chunk {}: {}", transfer.container, transfer.blobId, job.actor, sequence, e.what());
            return false;
        } catch (const exception& e) {
            spdlog::error("[DownloadPump] download {}/{} to {} failed at chunk {}: {}", transfer.container, transfer.blobId, job.actor, sequence, e.what());
            return false;
        }
        spdlog::debug("[DownloadPump] sent chunk {} of {}/{} to {}", sequence, transfer.container, transfer.blobId, job.actor);
    }
    return true;
}
//---------------------------------------------------------------------------
} // namespace caplink::blobstore
