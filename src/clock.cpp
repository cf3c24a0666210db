#include "tether/clock.hpp"
#include <ctime>
#include <format>

namespace tether
{
    namespace
    {
        struct UtcParts
        {
            std::tm tm{};
            int ms{0};
        };

        UtcParts split(std::chrono::system_clock::time_point tp)
        {
            UtcParts parts;
            auto t = std::chrono::system_clock::to_time_t(tp);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;
            gmtime_r(&t, &parts.tm);
            parts.ms = static_cast<int>(ms.count());
            return parts;
        }
    }

    std::string utc_timestamp(std::chrono::system_clock::time_point tp)
    {
        auto p = split(tp);
        return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                           p.tm.tm_year + 1900,
                           p.tm.tm_mon + 1,
                           p.tm.tm_mday,
                           p.tm.tm_hour,
                           p.tm.tm_min,
                           p.tm.tm_sec,
                           p.ms);
    }

    std::string compact_utc_timestamp(std::chrono::system_clock::time_point tp)
    {
        auto p = split(tp);
        return std::format("{:04d}{:02d}{:02d}T{:02d}{:02d}{:02d}{:03d}Z",
                           p.tm.tm_year + 1900,
                           p.tm.tm_mon + 1,
                           p.tm.tm_mday,
                           p.tm.tm_hour,
                           p.tm.tm_min,
                           p.tm.tm_sec,
                           p.ms);
    }

} // namespace tether
