/**
 * @file log_sink_filters.hpp
 * @brief Per-sink filters for selective record processing
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include "log_types.hpp"
#include "log_record.hpp"

namespace sinkwright
{

/**
 * @brief Filter based on minimum log level
 *
 * Every factory in log_sinks.hpp attaches one, so a logger at DEBUG can feed
 * a console sink that only shows warnings:
 * @code
 * auto sink = make_console_sink(log_level::warning, time_zone_style::local);
 * @endcode
 */
struct level_filter final
{
    log_level min_level = DEFAULT_LOG_LEVEL;

    bool should_process(const log_record &record) const noexcept { return record.level >= min_level; }
};

} // namespace sinkwright
