#pragma once
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include "camera/frame_source.hpp"

// Bounded hand-off between the acquisition and detection workers.
// A full queue drops its oldest frame so the consumer always sees the newest scene.
class FrameQueue
{
public:
    explicit FrameQueue(size_t capacity = 2);

    // Returns false when a frame had to be dropped to make room (or the queue is closed)
    bool push(Frame frame);

    // Waits up to timeout_ms; false on timeout or when closed and drained
    bool pop(Frame &frame, int timeout_ms = 100);

    // Wake every waiter, later pushes are ignored
    void close();
    bool isClosed() const;

    void clear();
    size_t size() const;
    size_t capacity() const { return capacity_; }
    uint64_t dropped() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<Frame> queue_;
    size_t capacity_;
    uint64_t dropped_ = 0;
    bool closed_ = false;
};
