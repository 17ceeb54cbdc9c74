/**
 * @file log_types.hpp
 * @brief Core type definitions and constants for the logging facade
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdint>
#include <cstdio>
#include <array>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "fmt_config.hpp" // IWYU pragma: keep

namespace sinkwright
{

// File sink defaults
inline constexpr uint64_t DEFAULT_MAX_FILE_BYTES      = 10 * 1024 * 1024; // Rotate after 10 MiB
inline constexpr int DEFAULT_BACKUP_COUNT             = 5;                // Compressed archives kept
inline constexpr const char *DEFAULT_FILE_ENCODING    = "utf-8";

// Mail sink defaults
inline constexpr int DEFAULT_SMTP_PORT     = 587;
inline constexpr int DEFAULT_SMTP_CAPACITY = 100; // Records per outbound message

// Syslog sink defaults
inline constexpr int DEFAULT_SYSLOG_PORT     = 1514;
inline constexpr int SYSLOG_FACILITY_USER    = 1;
inline constexpr size_t SYSLOG_MAX_DATAGRAM  = 65507; // Largest UDP payload over IPv4

// Logger names used when the caller does not supply one
inline constexpr const char *ROOT_LOGGER_NAME   = "root";
inline constexpr const char *FILE_LOGGER_NAME   = "File";
inline constexpr const char *SMTP_LOGGER_NAME   = "SMTP";
inline constexpr const char *SYSLOG_LOGGER_NAME = "SysLog";

/**
 * @brief The five canonical levels in ascending order of severity
 */
enum class log_level : int8_t
{
    debug    = 0, ///< Debugging information, selects the verbose line pattern
    info     = 1, ///< General information
    warning  = 2, ///< Something unexpected that did not stop the program
    error    = 3, ///< An operation failed
    critical = 4, ///< The program may not be able to continue
};

inline constexpr size_t LOG_LEVEL_COUNT    = 5;
inline constexpr log_level DEFAULT_LOG_LEVEL = log_level::info;

// Level names as they appear in rendered lines
inline constexpr std::array<const char *, LOG_LEVEL_COUNT> log_level_names = {
    "DEBUG",
    "INFO",
    "WARNING",
    "ERROR",
    "CRITICAL",
};

inline const char *string_from_log_level(log_level level)
{
    auto index = static_cast<size_t>(level);
    return index < LOG_LEVEL_COUNT ? log_level_names[index] : "UNKNOWN";
}

/**
 * @brief Which clock the timestamp of a rendered line is expressed in
 */
enum class time_zone_style : uint8_t
{
    local,
    utc,
};

/**
 * @brief Parse a time-zone style. Anything but "utc" (any case) means local time.
 */
inline time_zone_style time_zone_style_from_string(std::string_view str)
{
    if (str.size() != 3) return time_zone_style::local;

    auto lower = [](char c) { return static_cast<char>(c >= 'A' && c <= 'Z' ? c - 'A' + 'a' : c); };
    if (lower(str[0]) == 'u' && lower(str[1]) == 't' && lower(str[2]) == 'c') return time_zone_style::utc;
    return time_zone_style::local;
}

/**
 * @brief ANSI escapes used to wrap console lines, one per level plus the reset code
 */
struct level_colors
{
    std::string debug    = "\x1b[34;20m"; // blue
    std::string info     = "\x1b[38;20m"; // grey
    std::string warning  = "\x1b[33;20m"; // yellow
    std::string error    = "\x1b[31;20m"; // red
    std::string critical = "\x1b[31;1m";  // bold red
    std::string reset    = "\x1b[0m";

    const std::string &for_level(log_level level) const
    {
        switch (level)
        {
        case log_level::debug: return debug;
        case log_level::info: return info;
        case log_level::warning: return warning;
        case log_level::error: return error;
        case log_level::critical: return critical;
        }
        return reset;
    }
};

/**
 * @brief Receives human-readable diagnostics from the configuration layer
 *
 * Configuration fallbacks, degraded sinks and best-effort send failures are
 * reported here instead of being thrown.
 */
using diagnostic_handler = std::function<void(std::string_view)>;

inline void print_diagnostic(std::string_view message) { fmt::print(stderr, "[sinkwright] {}\n", message); }

inline diagnostic_handler default_diagnostic_handler() { return &print_diagnostic; }

/**
 * @brief Classification of a failure to construct a sink
 */
enum class error_kind : uint8_t
{
    configuration, ///< A setting was unusable
    resource,      ///< A file, socket or transport could not be acquired
};

inline const char *string_from_error_kind(error_kind kind)
{
    switch (kind)
    {
    case error_kind::configuration: return "configuration";
    case error_kind::resource: return "resource";
    }
    return "unknown";
}

struct sink_error
{
    error_kind kind;
    std::string message;
};

/**
 * @brief Thrown when an outbound mail could not be delivered
 */
class mail_error : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Thrown when a logger cannot be looked up or created
 */
class registry_error : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

} // namespace sinkwright
