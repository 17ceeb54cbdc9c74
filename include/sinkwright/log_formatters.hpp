/**
 * @file log_formatters.hpp
 * @brief Text line formatting for console, file and mail sinks
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <iterator>
#include <string>

#include "log_types.hpp"
#include "log_record.hpp"
#include "log_timestamp.hpp"

namespace sinkwright
{

/**
 * @brief Renders a record as one human-readable line
 *
 * Two patterns exist. The compact one is
 * @code
 * 2025-03-01 12:00:00 - app - INFO - Service started
 * @endcode
 * and the verbose one, used by sinks configured at DEBUG level, adds
 * milliseconds, process and source location:
 * @code
 * 2025-03-01 12:00:00,042 - app - DEBUG - <PID 4242:app> - main:run:17 - Service started
 * @endcode
 *
 * With use_color the whole line is wrapped in the level's escape code and
 * followed by the reset code.
 */
class text_formatter
{
  public:
    bool verbose             = false;
    time_zone_style time_zone = time_zone_style::local;
    bool use_color           = false;
    level_colors colors;
    bool add_newline         = false;

    /**
     * @brief Formatter whose verbosity follows the sink's configured level
     */
    static text_formatter for_level(log_level configured, time_zone_style tz)
    {
        text_formatter formatter;
        formatter.verbose   = configured == log_level::debug;
        formatter.time_zone = tz;
        return formatter;
    }

    void format(const log_record &record, fmt::memory_buffer &out) const
    {
        auto it = std::back_inserter(out);

        if (use_color) { out.append(colors.for_level(record.level)); }

        format_asctime(out, record.timestamp, time_zone);
        if (verbose) { fmt::format_to(it, ",{:03d}", subsecond_part<std::chrono::milliseconds>(record.timestamp)); }

        fmt::format_to(it, " - {} - {} - ", record.logger_name, string_from_log_level(record.level));

        if (verbose)
        {
            process_info process = record.process ? *record.process : process_info::current();
            fmt::format_to(it, "<PID {}:{}> - ", process.pid, process.process_name);

            if (record.location)
            {
                fmt::format_to(it, "{}:{}:{} - ", record.location->module, record.location->function, record.location->line);
            }
            else { out.append(std::string_view("-:-:0 - ")); }
        }

        out.append(record.message);

        if (use_color) { out.append(colors.reset); }
        if (add_newline) { out.push_back('\n'); }
    }

    std::string format(const log_record &record) const
    {
        fmt::memory_buffer out;
        format(record, out);
        return fmt::to_string(out);
    }
};

} // namespace sinkwright
