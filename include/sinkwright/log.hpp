/**
 * @file log.hpp
 * @brief Single include for the sinkwright logging facade
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * sinkwright routes records from named loggers to four kinds of sinks:
 * - console, colored per level
 * - a size-rotated file whose old generations are kept as gzip archives
 * - SMTP mail, buffered into digests
 * - RFC 5424 syslog over UDP
 *
 * @code
 * #include "sinkwright/log.hpp"
 *
 * int main()
 * {
 *     sinkwright::logger_registry registry;
 *     auto &log = sinkwright::create_file_logger(registry, "app", "app.log", "debug");
 *
 *     log.info("starting {}", sinkwright::VERSION);
 *     SINKWRIGHT_LOG(log, warning) << "cache is " << 93 << "% full";
 * }   // registry flushes and closes every sink here
 * @endcode
 */
#pragma once

#include "log_version.hpp"   // IWYU pragma: export
#include "log_types.hpp"     // IWYU pragma: export
#include "log_severity.hpp"  // IWYU pragma: export
#include "log_record.hpp"    // IWYU pragma: export
#include "log_formatters.hpp" // IWYU pragma: export
#include "log_sinks.hpp"     // IWYU pragma: export
#include "log_config.hpp"    // IWYU pragma: export
#include "logger.hpp"        // IWYU pragma: export
#include "log_registry.hpp"  // IWYU pragma: export
#include "log_setup.hpp"     // IWYU pragma: export
