#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace timeutil
{
    // Wall clock in milliseconds since the Unix epoch
    inline uint64_t nowMs()
    {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                         std::chrono::system_clock::now().time_since_epoch())
                                         .count());
    }

    // ISO 8601 local time with milliseconds, e.g. 2024-05-01T14:03:22.120
    inline std::string formatIso(uint64_t epoch_ms)
    {
        std::time_t seconds = static_cast<std::time_t>(epoch_ms / 1000);
        std::tm local{};
        localtime_r(&seconds, &local);

        std::stringstream ss;
        ss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << (epoch_ms % 1000);
        return ss.str();
    }

    // Compact form used for identifiers, e.g. 20240501-140322
    inline std::string formatCompact(uint64_t epoch_ms)
    {
        std::time_t seconds = static_cast<std::time_t>(epoch_ms / 1000);
        std::tm local{};
        localtime_r(&seconds, &local);

        std::stringstream ss;
        ss << std::put_time(&local, "%Y%m%d-%H%M%S");
        return ss.str();
    }

} // namespace timeutil
