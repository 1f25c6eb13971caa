#pragma once
#include <atomic>
#include <csignal>
#include <functional>
#include "logging.hpp"

namespace signals
{

    // Set from the signal handler, polled by the main thread
    inline std::atomic<int> pendingSignal{0};

    // Signal handler function - only async-signal-safe work here
    inline void signalHandler(int signal)
    {
        pendingSignal.store(signal);
    }

    // Register SIGINT/SIGTERM handlers
    inline void setupSignalHandlers()
    {
        pendingSignal.store(0);
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        log_info("Signal handlers registered for graceful shutdown");
    }

    // Returns the received signal number and runs the callback once, 0 if nothing arrived
    inline int dispatchPending(const std::function<void(int)> &callback)
    {
        int signal = pendingSignal.exchange(0);
        if (signal != 0)
        {
            log_warning("Received signal " + std::to_string(signal) + ", shutting down...");
            if (callback)
                callback(signal);
        }
        return signal;
    }

} // namespace signals
