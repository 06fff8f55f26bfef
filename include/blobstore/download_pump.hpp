#pragma once
#include "blobstore/transfer.hpp"
#include "core/dispatcher.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace caplink::blobstore {
//---------------------------------------------------------------------------
/// Pushes ReceiveChunk calls into actors from a set of worker threads.
/// A download is owned by a single worker from its first to its last chunk,
/// so chunks of one transfer always leave in sequence order.
class DownloadPump {
    /// One queued download
    struct Job {
        /// The receiving actor
        std::string actor;
        /// The chunk layout
        ChunkPlanner planner;
        /// The blob
        std::vector<uint8_t> data;
    };

    /// The dispatcher slot of the owning provider
    core::DispatcherSlot& _dispatcher;
    /// The pending jobs
    std::deque<Job> _jobs;
    /// The lock
    std::mutex _mutex;
    /// Signals new jobs and shutdown
    std::condition_variable _wakeup;
    /// Signals that the pump ran dry
    std::condition_variable _idle;
    /// Jobs currently sent by a worker
    unsigned _running;
    /// Stop flag
    bool _stop;
    /// Completed downloads
    std::atomic<uint64_t> _completed;
    /// Aborted downloads
    std::atomic<uint64_t> _aborted;
    /// The workers
    std::vector<std::thread> _workers;

    /// The worker loop
    void run();
    /// Send all chunks of a job, returns false when the actor refused a chunk
    bool send(const Job& job);

    public:
    /// The constructor, starts the workers
    DownloadPump(core::DispatcherSlot& dispatcher, unsigned workers);
    /// The destructor, sends the pending jobs and joins the workers
    ~DownloadPump() noexcept;
    /// No copies
    DownloadPump(const DownloadPump&) = delete;
    /// No copies
    DownloadPump& operator=(const DownloadPump&) = delete;

    /// Queue a download
    void enqueue(std::string actor, ChunkPlanner planner, std::vector<uint8_t> data);
    /// Block until no job is queued or running
    void waitIdle();

    /// Get the number of completed downloads
    [[nodiscard]] uint64_t completed() const { return _completed.load(); }
    /// Get the number of aborted downloads
    [[nodiscard]] uint64_t aborted() const { return _aborted.load(); }
    /// Get the number of workers
    [[nodiscard]] size_t workers() const { return _workers.size(); }
};
//---------------------------------------------------------------------------
} // namespace caplink::blobstore
