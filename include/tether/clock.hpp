#pragma once

#include <chrono>
#include <string>

namespace tether
{
    /** ISO-8601 UTC timestamp with millisecond precision, e.g. 2024-05-01T12:00:00.123Z */
    std::string utc_timestamp(std::chrono::system_clock::time_point tp = std::chrono::system_clock::now());

    /** Filesystem-safe UTC timestamp, e.g. 20240501T120000123Z */
    std::string compact_utc_timestamp(std::chrono::system_clock::time_point tp = std::chrono::system_clock::now());

    /** Seconds elapsed since a steady_clock start point */
    inline double seconds_since(std::chrono::steady_clock::time_point start)
    {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    }

} // namespace tether
