#pragma once

#include <vellum/frame-snapshot.h>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace vellum {

//-----------------------------------------------------------------------------
// FrameExchange - single-slot mailbox between the scene producer and the
// render thread.
//
// publish() hands over a whole snapshot. If the previous one was never taken
// it is superseded and counted as dropped. take() returns the newest
// snapshot exactly once. Snapshots are shared_ptr<const>, so nothing the
// renderer reads can change under it.
//-----------------------------------------------------------------------------
class FrameExchange {
public:
    FrameExchange() = default;

    FrameExchange(const FrameExchange&) = delete;
    FrameExchange& operator=(const FrameExchange&) = delete;

    void publish(FrameSnapshot::Ptr snapshot);

    // Newest untaken snapshot, or nullptr
    FrameSnapshot::Ptr take();

    // Block up to `timeout` for a snapshot; nullptr on timeout or close
    FrameSnapshot::Ptr waitAndTake(std::chrono::milliseconds timeout);

    bool hasPending() const;

    // Wake waiters and refuse further snapshots
    void close();
    bool isClosed() const;

    uint64_t publishedCount() const;
    uint64_t droppedCount() const;

private:
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    FrameSnapshot::Ptr _pending;
    uint64_t _published = 0;
    uint64_t _dropped = 0;
    bool _closed = false;
};

} // namespace vellum
