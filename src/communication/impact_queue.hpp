#pragma once
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <condition_variable>
#include "detector/target_types.hpp"

// Something the control surface should hear about
struct SessionEvent
{
    std::string type = "impact"; // impact, session_started, session_ended, state
    std::string session_id = "";
    std::string state = "";
    Impact impact;               // Set for "impact" events
    uint64_t timestamp = 0;
};

// Bounded like FrameQueue: a stalled control surface loses its oldest events, not memory
class ImpactQueue
{
public:
    explicit ImpactQueue(size_t capacity = 256);

    // Returns false when the oldest event was dropped to make room
    bool push(const SessionEvent &event);
    bool pop(SessionEvent &event, int timeout_ms = 100);
    size_t size() const;
    size_t capacity() const { return capacity_; }
    uint64_t dropped() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<SessionEvent> queue_;
    size_t capacity_;
    uint64_t dropped_ = 0;
};
