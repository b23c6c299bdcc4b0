#include <vellum/frame-exchange.h>
#include <ytrace/ytrace.hpp>

namespace vellum {

void FrameExchange::publish(FrameSnapshot::Ptr snapshot) {
    if (!snapshot) return;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_closed) return;
        if (_pending) {
            _dropped++;
            ytrace("FrameExchange: frame {} superseded by {}",
                   _pending->frameId, snapshot->frameId);
        }
        _pending = std::move(snapshot);
        _published++;
    }
    _cv.notify_one();
}

FrameSnapshot::Ptr FrameExchange::take() {
    std::lock_guard<std::mutex> lock(_mutex);
    return std::move(_pending);
}

FrameSnapshot::Ptr FrameExchange::waitAndTake(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(_mutex);
    _cv.wait_for(lock, timeout, [this] { return _pending != nullptr || _closed; });
    return std::move(_pending);
}

bool FrameExchange::hasPending() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _pending != nullptr;
}

void FrameExchange::close() {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _closed = true;
    }
    _cv.notify_all();
}

bool FrameExchange::isClosed() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _closed;
}

uint64_t FrameExchange::publishedCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _published;
}

uint64_t FrameExchange::droppedCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _dropped;
}

} // namespace vellum
