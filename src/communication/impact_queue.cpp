#include "impact_queue.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <chrono>

ImpactQueue::ImpactQueue(size_t capacity)
    : capacity_(std::max<size_t>(1, capacity))
{
}

bool ImpactQueue::push(const SessionEvent &event)
{
    bool dropped = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.size() >= capacity_)
        {
            queue_.pop_front();
            dropped_++;
            dropped = true;
        }
        queue_.push_back(event);
    }
    condition_.notify_one();

    if (dropped)
        log_debug("Event queue full, dropped oldest event");
    return !dropped;
}

bool ImpactQueue::pop(SessionEvent &event, int timeout_ms)
{
    std::unique_lock<std::mutex> lock(mutex_);

    if (condition_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                            [this]
                            { return !queue_.empty(); }))
    {
        event = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }
    return false;
}

size_t ImpactQueue::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

uint64_t ImpactQueue::dropped() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}
