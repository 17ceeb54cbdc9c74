/**
 * @file log_timestamp.hpp
 * @brief Calendar time rendering for text lines and syslog headers
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iterator>

#include "log_types.hpp"

namespace sinkwright
{

/**
 * @brief Break a time point into calendar fields in local time or UTC
 */
inline std::tm to_calendar(std::chrono::system_clock::time_point tp, time_zone_style style)
{
    std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    if (style == time_zone_style::utc) { gmtime_r(&seconds, &tm); }
    else { localtime_r(&seconds, &tm); }
    return tm;
}

/**
 * @brief Sub-second part of a time point
 */
template <typename Duration> inline long long subsecond_part(std::chrono::system_clock::time_point tp)
{
    auto since_epoch = tp.time_since_epoch();
    auto whole       = std::chrono::floor<std::chrono::seconds>(since_epoch);
    return std::chrono::duration_cast<Duration>(since_epoch - whole).count();
}

/**
 * @brief Offset of local time from UTC at @p tp, in seconds east of Greenwich
 */
inline long utc_offset_seconds(std::chrono::system_clock::time_point tp = std::chrono::system_clock::now())
{
    return to_calendar(tp, time_zone_style::local).tm_gmtoff;
}

/**
 * @brief Append "YYYY-MM-DD HH:MM:SS" to @p out
 */
inline void format_asctime(fmt::memory_buffer &out, std::chrono::system_clock::time_point tp, time_zone_style style)
{
    std::tm tm = to_calendar(tp, style);
    fmt::format_to(std::back_inserter(out), "{:%Y-%m-%d %H:%M:%S}", tm);
}

/**
 * @brief Append an RFC 5424 TIMESTAMP to @p out
 *
 * The time is shown in the zone described by @p offset_seconds, with
 * microseconds, followed by "Z" for a zero offset or "+HH:MM"/"-HH:MM".
 */
inline void format_rfc5424_timestamp(fmt::memory_buffer &out,
                                     std::chrono::system_clock::time_point tp,
                                     long offset_seconds)
{
    std::tm tm = to_calendar(tp + std::chrono::seconds(offset_seconds), time_zone_style::utc);
    fmt::format_to(std::back_inserter(out),
                   "{:%Y-%m-%dT%H:%M:%S}.{:06d}",
                   tm,
                   subsecond_part<std::chrono::microseconds>(tp));

    if (offset_seconds == 0)
    {
        out.push_back('Z');
        return;
    }

    long minutes = std::labs(offset_seconds) / 60;
    fmt::format_to(std::back_inserter(out), "{}{:02d}:{:02d}", offset_seconds < 0 ? '-' : '+', minutes / 60, minutes % 60);
}

} // namespace sinkwright
