/**
 * @file log_setup.hpp
 * @brief One-call creation of console, file, mail and syslog loggers
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * These functions take settings as a user would write them, repair what can
 * be repaired (unknown level, bad port, ...) with a diagnostic, and attach the
 * requested sink to a logger of the registry. When a sink cannot be built,
 * the logger gets a console sink instead, so a create_* call always returns a
 * usable logger. Only a failed logger lookup is fatal.
 *
 * @code
 * sinkwright::logger_registry registry;
 * auto &file = sinkwright::create_file_logger(registry, "app", "logs/app.log", "debug", "utc");
 * file.info("listening on port {}", 8080);
 *
 * auto [mail, mail_sink] = sinkwright::create_smtp_logger(registry, mail_settings);
 * mail.error("disk full");
 * mail_sink->flush();
 * @endcode
 */
#pragma once

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include "log_types.hpp"
#include "log_utils.hpp"
#include "log_severity.hpp"
#include "log_sinks.hpp"
#include "log_config.hpp"
#include "logger.hpp"
#include "log_registry.hpp"

namespace sinkwright
{

/**
 * @brief A mail logger together with its sink, which the caller flushes
 */
struct smtp_logger
{
    logger &target;
    std::shared_ptr<log_sink> sink;
};

/**
 * @brief Attach @p sink to the logger @p name and set its level
 *
 * If the registry cannot provide the logger, the failure is reported and the
 * process exits with EXIT_FAILURE.
 */
inline logger &configure_logger(logger_registry &registry,
                                std::string_view name,
                                std::shared_ptr<log_sink> sink,
                                log_level level)
{
    logger *target = nullptr;
    try
    {
        target = &registry.get_logger(name);
    }
    catch (const registry_error &e)
    {
        registry.report(e.what());
        if (name.empty() || name == ROOT_LOGGER_NAME) { registry.report("Error while creating new root logger"); }
        else { registry.report(fmt::format("Error while creating {} Logger", name)); }
        std::exit(EXIT_FAILURE);
    }

    target->add_sink(std::move(sink));
    target->set_level(level);
    return *target;
}

namespace detail
{

inline std::shared_ptr<log_sink> console_fallback(logger_registry &registry,
                                                  const sink_error &error,
                                                  std::string_view reason,
                                                  log_level level,
                                                  time_zone_style tz)
{
    registry.report(fmt::format("{} error: {}", string_from_error_kind(error.kind), error.message));
    registry.report(reason);
    return make_console_sink(level, tz, false);
}

inline bool valid_port(int port) { return port > 0 && port <= 65535; }

} // namespace detail

inline logger &create_console_logger(logger_registry &registry, const console_config &config)
{
    log_level level    = classify_log_level(config.level, DEFAULT_LOG_LEVEL, registry.diagnostics());
    time_zone_style tz = time_zone_style_from_string(config.time_zone);

    return configure_logger(registry, config.name, make_console_sink(level, tz, config.use_color, config.colors), level);
}

inline logger &create_console_logger(logger_registry &registry,
                                     std::string_view name  = ROOT_LOGGER_NAME,
                                     std::string_view level = "INFO",
                                     std::string_view tz    = "local")
{
    console_config config;
    config.name      = name;
    config.level     = level;
    config.time_zone = tz;
    return create_console_logger(registry, config);
}

/**
 * @brief Logger writing to a rotating file whose rollovers are gzip-compressed
 *
 * A missing file is created. An empty path or a file that cannot be created
 * or opened switches the logger to console output.
 */
inline logger &create_file_logger(logger_registry &registry, const file_config &config)
{
    log_level level    = classify_log_level(config.level, DEFAULT_LOG_LEVEL, registry.diagnostics());
    time_zone_style tz = time_zone_style_from_string(config.time_zone);
    const char *fallback_reason = "Logfile couldn't be created or given path is empty, changing to console output";

    rotate_policy policy;
    policy.max_bytes = config.max_bytes;
    policy.delay     = config.delay;

    policy.backup_count = config.backup_count;
    if (policy.backup_count < 0)
    {
        registry.report(fmt::format("Backup count {} is negative, using default {}", config.backup_count, DEFAULT_BACKUP_COUNT));
        policy.backup_count = DEFAULT_BACKUP_COUNT;
    }

    if (auto encoding = text_encoding_from_string(config.encoding)) { policy.encoding = *encoding; }
    else
    {
        registry.report(fmt::format("Unknown encoding '{}', using default {}",
                                    config.encoding,
                                    string_from_text_encoding(text_encoding::utf8)));
        policy.encoding = text_encoding::utf8;
    }

    if (!config.path.empty() && ::access(config.path.c_str(), F_OK) != 0)
    {
        registry.report("Logfile doesn't exist and will be created");
        gzip::file_descriptor created(::open(config.path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644));
        if (!created)
        {
            sink_error error{error_kind::resource, fmt::format("Cannot create {}: {}", config.path, std::strerror(errno))};
            return configure_logger(registry, config.name, detail::console_fallback(registry, error, fallback_reason, level, tz), level);
        }
    }

    auto result = try_make_file_sink(config.path, level, tz, policy, registry.diagnostics());
    auto sink   = result ? result.sink : detail::console_fallback(registry, *result.error, fallback_reason, level, tz);
    return configure_logger(registry, config.name, std::move(sink), level);
}

inline logger &create_file_logger(logger_registry &registry,
                                  std::string_view name,
                                  std::string_view path,
                                  std::string_view level    = "INFO",
                                  std::string_view tz       = "local",
                                  uint64_t max_bytes        = DEFAULT_MAX_FILE_BYTES,
                                  int backup_count          = DEFAULT_BACKUP_COUNT,
                                  std::string_view encoding = DEFAULT_FILE_ENCODING)
{
    file_config config;
    config.name         = name;
    config.path         = path;
    config.level        = level;
    config.time_zone    = tz;
    config.max_bytes    = max_bytes;
    config.backup_count = backup_count;
    config.encoding     = encoding;
    return create_file_logger(registry, config);
}

/**
 * @brief Logger whose records are mailed in digests of config.capacity lines
 *
 * The returned sink must be flushed to send a partial digest; the registry
 * flushes it at shutdown. @p transport replaces libcurl SMTP delivery.
 */
inline smtp_logger create_smtp_logger(logger_registry &registry,
                                      const mail_config &config,
                                      std::shared_ptr<mail_transport> transport = nullptr)
{
    std::string name = config.name;
    if (name.empty() || name == ROOT_LOGGER_NAME)
    {
        registry.report("The name can't be empty or root for this type of logger, defaulting to name SMTP");
        name = SMTP_LOGGER_NAME;
    }

    int port = config.port;
    if (!detail::valid_port(port))
    {
        registry.report(fmt::format("The port has to be between 1 and 65535, defaulting to port {}", DEFAULT_SMTP_PORT));
        port = DEFAULT_SMTP_PORT;
    }

    int capacity = config.capacity;
    if (capacity <= 0)
    {
        registry.report(fmt::format("The capacity has to be positive, defaulting to capacity {}", DEFAULT_SMTP_CAPACITY));
        capacity = DEFAULT_SMTP_CAPACITY;
    }

    log_level level    = classify_log_level(config.level, DEFAULT_LOG_LEVEL, registry.diagnostics());
    time_zone_style tz = time_zone_style_from_string(config.time_zone);

    mail_envelope envelope;
    envelope.host     = config.host;
    envelope.port     = port;
    envelope.username = config.username;
    envelope.password = config.password;
    envelope.from     = config.from;
    envelope.to       = config.to;
    envelope.subject  = config.subject;

    auto result = try_make_mail_sink(std::move(envelope), capacity, level, tz, std::move(transport));
    auto sink   = result ? result.sink
                         : detail::console_fallback(registry,
                                                    *result.error,
                                                    "SMTP Logger couldn't be created, changing to console output",
                                                    level,
                                                    tz);

    logger &target = configure_logger(registry, name, sink, level);
    return smtp_logger{target, std::move(sink)};
}

inline smtp_logger create_smtp_logger(logger_registry &registry,
                                      std::string_view name,
                                      std::string_view level,
                                      std::string_view tz,
                                      std::string_view host,
                                      int port,
                                      std::string_view username,
                                      std::string_view password,
                                      std::string_view from,
                                      std::vector<std::string> to,
                                      std::string_view subject,
                                      int capacity                              = DEFAULT_SMTP_CAPACITY,
                                      std::shared_ptr<mail_transport> transport = nullptr)
{
    mail_config config;
    config.name      = name;
    config.level     = level;
    config.time_zone = tz;
    config.host      = host;
    config.port      = port;
    config.username  = username;
    config.password  = password;
    config.from      = from;
    config.to        = std::move(to);
    config.subject   = subject;
    config.capacity  = capacity;
    return create_smtp_logger(registry, config, std::move(transport));
}

/**
 * @brief Logger sending RFC 5424 lines over UDP to a syslog collector
 */
inline logger &create_syslog_logger(logger_registry &registry, const syslog_config &config)
{
    log_level level    = classify_log_level(config.level, DEFAULT_LOG_LEVEL, registry.diagnostics());
    time_zone_style tz = time_zone_style_from_string(config.time_zone);

    auto result = try_make_syslog_sink(syslog_endpoint{config.address, config.port},
                                       config.app_name,
                                       config.msgid,
                                       level,
                                       tz,
                                       registry.diagnostics(),
                                       config.facility,
                                       config.append_nul);
    auto sink   = result ? result.sink
                         : detail::console_fallback(registry,
                                                    *result.error,
                                                    "SysLog address or port are wrong or unavailable, changing to console output",
                                                    level,
                                                    tz);
    return configure_logger(registry, config.name, std::move(sink), level);
}

inline logger &create_syslog_logger(logger_registry &registry,
                                    std::string_view name,
                                    std::string_view level,
                                    std::string_view tz,
                                    std::string_view address,
                                    int port                  = DEFAULT_SYSLOG_PORT,
                                    std::string_view app_name = {},
                                    std::string_view msgid    = {})
{
    syslog_config config;
    config.name      = name;
    config.level     = level;
    config.time_zone = tz;
    config.address   = address;
    config.port      = port;
    config.app_name  = app_name;
    config.msgid     = msgid;
    return create_syslog_logger(registry, config);
}

} // namespace sinkwright
