#include "frame_queue.hpp"
#include <algorithm>
#include <chrono>

FrameQueue::FrameQueue(size_t capacity)
    : capacity_(std::max<size_t>(1, capacity))
{
}

bool FrameQueue::push(Frame frame)
{
    bool dropped = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_)
            return false;

        while (queue_.size() >= capacity_)
        {
            queue_.pop_front();
            dropped_++;
            dropped = true;
        }
        queue_.push_back(std::move(frame));
    }
    condition_.notify_one();
    return !dropped;
}

bool FrameQueue::pop(Frame &frame, int timeout_ms)
{
    std::unique_lock<std::mutex> lock(mutex_);

    if (condition_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                            [this]
                            { return !queue_.empty() || closed_; }))
    {
        if (queue_.empty())
            return false; // closed

        frame = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }
    return false;
}

void FrameQueue::close()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    condition_.notify_all();
}

bool FrameQueue::isClosed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

void FrameQueue::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.clear();
}

size_t FrameQueue::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

uint64_t FrameQueue::dropped() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}
