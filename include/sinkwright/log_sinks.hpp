/**
 * @file log_sinks.hpp
 * @brief Factories for the console, file, mail and syslog sinks
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * The console factory cannot fail. The others return a sink_result that
 * carries either the sink or the reason it could not be built; they never
 * substitute another sink. Falling back to the console is left to
 * log_setup.hpp.
 */
#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unistd.h>

#include "log_types.hpp"
#include "log_formatters.hpp"
#include "log_writers.hpp"
#include "log_sink.hpp"
#include "log_sink_filters.hpp"
#include "log_syslog.hpp"
#include "log_mail.hpp"

namespace sinkwright
{

/**
 * @brief A constructed sink, or the error that prevented construction
 */
struct sink_result
{
    std::shared_ptr<log_sink> sink;
    std::optional<sink_error> error;

    explicit operator bool() const noexcept { return sink != nullptr; }

    static sink_result success(std::shared_ptr<log_sink> sink) { return {std::move(sink), std::nullopt}; }

    static sink_result failure(error_kind kind, std::string message)
    {
        return {nullptr, sink_error{kind, std::move(message)}};
    }
};

/**
 * @brief Colored (optionally) line output to a terminal descriptor
 *
 * Lines use the verbose pattern when @p level is DEBUG.
 */
inline std::shared_ptr<log_sink> make_console_sink(log_level level,
                                                   time_zone_style tz,
                                                   bool use_color      = true,
                                                   level_colors colors = {},
                                                   int fd              = STDERR_FILENO)
{
    text_formatter formatter = text_formatter::for_level(level, tz);
    formatter.use_color      = use_color;
    formatter.colors         = std::move(colors);
    formatter.add_newline    = true;

    return make_sink(std::move(formatter), file_writer{fd}, level_filter{level});
}

/**
 * @brief Rotating, gzip-archiving file sink
 *
 * Fails with error_kind::configuration for an empty path and with
 * error_kind::resource when the file cannot be opened.
 */
inline sink_result try_make_file_sink(const std::string &path,
                                      log_level level,
                                      time_zone_style tz,
                                      rotate_policy policy           = {},
                                      diagnostic_handler diagnostics = default_diagnostic_handler())
{
    if (path.empty()) { return sink_result::failure(error_kind::configuration, "Log file path is empty"); }

    text_formatter formatter = text_formatter::for_level(level, tz);
    formatter.add_newline    = true;

    try
    {
        file_writer writer(path, policy, std::move(diagnostics));
        return sink_result::success(make_sink(std::move(formatter), std::move(writer), level_filter{level}));
    }
    catch (const std::system_error &e)
    {
        return sink_result::failure(error_kind::resource, e.what());
    }
}

/**
 * @brief Buffered mail sink sending digests of @p capacity lines
 *
 * Without a @p transport, mails go out through libcurl SMTP with STARTTLS.
 */
inline sink_result try_make_mail_sink(mail_envelope envelope,
                                      int capacity,
                                      log_level level,
                                      time_zone_style tz,
                                      std::shared_ptr<mail_transport> transport = nullptr)
{
    if (envelope.host.empty()) { return sink_result::failure(error_kind::configuration, "SMTP mail host is empty"); }
    if (envelope.to.empty()) { return sink_result::failure(error_kind::configuration, "SMTP recipient list is empty"); }
    if (capacity <= 0)
    {
        return sink_result::failure(error_kind::configuration, fmt::format("SMTP capacity {} is not positive", capacity));
    }

    if (!transport)
    {
        try
        {
            transport = std::make_shared<curl_smtp_transport>();
        }
        catch (const mail_error &e)
        {
            return sink_result::failure(error_kind::resource, e.what());
        }
    }

    buffered_mail_writer writer(std::move(envelope), static_cast<size_t>(capacity), std::move(transport));
    return sink_result::success(
        make_sink(text_formatter::for_level(level, tz), std::move(writer), level_filter{level}));
}

/**
 * @brief RFC 5424 syslog sink sending UDP datagrams
 *
 * Fails with error_kind::configuration for an empty address or a bad port
 * and with error_kind::resource when resolution or socket creation fails.
 */
inline sink_result try_make_syslog_sink(const syslog_endpoint &endpoint,
                                        std::string app_name,
                                        std::string msgid,
                                        log_level level,
                                        time_zone_style tz,
                                        diagnostic_handler diagnostics = default_diagnostic_handler(),
                                        int facility                   = SYSLOG_FACILITY_USER,
                                        bool append_nul                = true)
{
    try
    {
        udp_syslog_writer writer(endpoint, facility, append_nul, std::move(diagnostics));
        auto formatter = syslog_formatter::create(std::move(app_name), std::move(msgid), level, tz);
        return sink_result::success(make_sink(std::move(formatter), std::move(writer), level_filter{level}));
    }
    catch (const std::invalid_argument &e)
    {
        return sink_result::failure(error_kind::configuration, e.what());
    }
    catch (const std::runtime_error &e)
    {
        return sink_result::failure(error_kind::resource, e.what());
    }
}

} // namespace sinkwright
