/**
 * @file log_config.hpp
 * @brief Per-sink configuration and loading it from JSON documents
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Configs hold the raw settings as a user would write them. Level and time
 * zone stay strings here; log_setup.hpp normalizes them when the sink is
 * built.
 *
 * A mail credentials file may look like
 * @code
 * {
 *     "smtp_mailhost": "mail.example.com",
 *     "smtp_port": "587",
 *     "smtp_username": "logger",
 *     "smtp_password": "secret",
 *     "smtp_fromaddr": "logger@example.com",
 *     "smtp_toaddrs": ["ops@example.com", "dev@example.com"]
 * }
 * @endcode
 * Every key also has a short form ("host", "port", ...). Unknown keys are
 * ignored; a value of the wrong type is reported and the default is kept.
 */
#pragma once

#include <charconv>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <tao/json.hpp>

#include "log_types.hpp"

namespace sinkwright
{

struct console_config
{
    std::string name      = ROOT_LOGGER_NAME;
    std::string level     = "INFO";
    std::string time_zone = "local";
    bool use_color        = true;
    level_colors colors;
};

struct file_config
{
    std::string name      = FILE_LOGGER_NAME;
    std::string path;
    std::string level     = "INFO";
    std::string time_zone = "local";
    uint64_t max_bytes    = DEFAULT_MAX_FILE_BYTES;
    int backup_count      = DEFAULT_BACKUP_COUNT;
    std::string encoding  = DEFAULT_FILE_ENCODING;
    bool delay            = false;
};

struct mail_config
{
    std::string name      = SMTP_LOGGER_NAME;
    std::string level     = "INFO";
    std::string time_zone = "local";
    std::string host;
    int port = DEFAULT_SMTP_PORT;
    std::string username;
    std::string password;
    std::string from;
    std::vector<std::string> to;
    std::string subject;
    int capacity = DEFAULT_SMTP_CAPACITY;
};

struct syslog_config
{
    std::string name      = SYSLOG_LOGGER_NAME;
    std::string level     = "INFO";
    std::string time_zone = "local";
    std::string address;
    int port = DEFAULT_SYSLOG_PORT;
    std::string app_name;
    std::string msgid;
    int facility    = SYSLOG_FACILITY_USER;
    bool append_nul = true;
};

namespace detail
{

/**
 * @brief Parse a whole string as a base-10 integer
 */
template <typename Int> inline bool parse_integer(std::string_view text, Int &out)
{
    if (text.empty()) return false;
    Int value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) return false;
    out = value;
    return true;
}

class config_reader
{
  public:
    config_reader(const tao::json::value &doc, const diagnostic_handler &diagnostics)
    : doc_(doc),
      diagnostics_(diagnostics)
    {
    }

    bool usable() const
    {
        if (doc_.is_object()) return true;
        report("Configuration document is not a JSON object, using defaults");
        return false;
    }

    // Returns the first of the given keys present in the document
    const tao::json::value *find(std::initializer_list<std::string_view> keys, std::string_view &found_key) const
    {
        for (auto key : keys)
        {
            const auto &object = doc_.get_object();
            auto it            = object.find(std::string(key));
            if (it != object.end())
            {
                found_key = key;
                return &it->second;
            }
        }
        return nullptr;
    }

    void read(std::initializer_list<std::string_view> keys, std::string &target) const
    {
        std::string_view key;
        const auto *value = find(keys, key);
        if (!value) return;

        if (value->is_string()) { target = value->get_string(); }
        else { report(fmt::format("Config key '{}' must be a string, keeping '{}'", key, target)); }
    }

    void read(std::initializer_list<std::string_view> keys, bool &target) const
    {
        std::string_view key;
        const auto *value = find(keys, key);
        if (!value) return;

        if (value->is_boolean()) { target = value->get_boolean(); }
        else { report(fmt::format("Config key '{}' must be true or false, keeping {}", key, target)); }
    }

    template <typename Int>
        requires std::is_integral_v<Int>
    void read(std::initializer_list<std::string_view> keys, Int &target) const
    {
        std::string_view key;
        const auto *value = find(keys, key);
        if (!value) return;

        if (value->is_integer())
        {
            // Unsigned JSON values above INT64_MAX are out of range for every field
            if (value->is_signed() || value->get_unsigned() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
            {
                auto number = value->as<int64_t>();
                if (number >= static_cast<int64_t>(std::numeric_limits<Int>::min()) &&
                    static_cast<uint64_t>(number < 0 ? 0 : number) <= std::numeric_limits<Int>::max())
                {
                    target = static_cast<Int>(number);
                    return;
                }
            }
        }
        else if (value->is_string() && parse_integer(value->get_string(), target)) { return; }

        report(fmt::format("Config key '{}' must be an integer, keeping {}", key, target));
    }

    void read(std::initializer_list<std::string_view> keys, std::vector<std::string> &target) const
    {
        std::string_view key;
        const auto *value = find(keys, key);
        if (!value) return;

        if (value->is_string())
        {
            target = {value->get_string()};
            return;
        }

        if (value->is_array())
        {
            std::vector<std::string> list;
            for (const auto &entry : value->get_array())
            {
                if (!entry.is_string())
                {
                    report(fmt::format("Config key '{}' must only hold strings, ignoring it", key));
                    return;
                }
                list.push_back(entry.get_string());
            }
            target = std::move(list);
            return;
        }

        report(fmt::format("Config key '{}' must be a string or a list of strings, ignoring it", key));
    }

    void read_colors(level_colors &colors) const
    {
        std::string_view key;
        const auto *value = find({"colors"}, key);
        if (!value) return;
        if (!value->is_object())
        {
            report("Config key 'colors' must be an object, keeping the default colors");
            return;
        }

        config_reader nested(*value, diagnostics_);
        nested.read({"debug"}, colors.debug);
        nested.read({"info"}, colors.info);
        nested.read({"warning"}, colors.warning);
        nested.read({"error"}, colors.error);
        nested.read({"critical"}, colors.critical);
        nested.read({"reset"}, colors.reset);
    }

  private:
    void report(std::string_view message) const
    {
        if (diagnostics_) { diagnostics_(message); }
    }

    const tao::json::value &doc_;
    const diagnostic_handler &diagnostics_;
};

} // namespace detail

inline console_config load_console_config(const tao::json::value &doc,
                                          const diagnostic_handler &diagnostics = default_diagnostic_handler())
{
    console_config config;
    detail::config_reader reader(doc, diagnostics);
    if (!reader.usable()) return config;

    reader.read({"name"}, config.name);
    reader.read({"level", "loglevel"}, config.level);
    reader.read({"time_zone", "time_zone_style"}, config.time_zone);
    reader.read({"use_color"}, config.use_color);
    reader.read_colors(config.colors);
    return config;
}

inline file_config load_file_config(const tao::json::value &doc,
                                    const diagnostic_handler &diagnostics = default_diagnostic_handler())
{
    file_config config;
    detail::config_reader reader(doc, diagnostics);
    if (!reader.usable()) return config;

    reader.read({"name"}, config.name);
    reader.read({"path", "log_file"}, config.path);
    reader.read({"level", "loglevel"}, config.level);
    reader.read({"time_zone", "time_zone_style"}, config.time_zone);
    reader.read({"max_bytes"}, config.max_bytes);
    reader.read({"backup_count"}, config.backup_count);
    reader.read({"encoding"}, config.encoding);
    reader.read({"delay"}, config.delay);
    return config;
}

/**
 * @brief Load a mail config, accepting the smtp_* credential keys
 */
inline mail_config load_mail_config(const tao::json::value &doc,
                                    const diagnostic_handler &diagnostics = default_diagnostic_handler())
{
    mail_config config;
    detail::config_reader reader(doc, diagnostics);
    if (!reader.usable()) return config;

    reader.read({"name"}, config.name);
    reader.read({"level", "loglevel"}, config.level);
    reader.read({"time_zone", "time_zone_style"}, config.time_zone);
    reader.read({"smtp_mailhost", "host"}, config.host);
    reader.read({"smtp_port", "port"}, config.port);
    reader.read({"smtp_username", "username"}, config.username);
    reader.read({"smtp_password", "password"}, config.password);
    reader.read({"smtp_fromaddr", "from"}, config.from);
    reader.read({"smtp_toaddrs", "to"}, config.to);
    reader.read({"smtp_subject", "subject"}, config.subject);
    reader.read({"smtp_capacity", "capacity"}, config.capacity);
    return config;
}

inline syslog_config load_syslog_config(const tao::json::value &doc,
                                        const diagnostic_handler &diagnostics = default_diagnostic_handler())
{
    syslog_config config;
    detail::config_reader reader(doc, diagnostics);
    if (!reader.usable()) return config;

    reader.read({"name"}, config.name);
    reader.read({"level", "loglevel"}, config.level);
    reader.read({"time_zone", "time_zone_style"}, config.time_zone);
    reader.read({"syslog_address", "address"}, config.address);
    reader.read({"syslog_port", "port"}, config.port);
    reader.read({"app_name", "appname"}, config.app_name);
    reader.read({"msgid"}, config.msgid);
    reader.read({"facility"}, config.facility);
    reader.read({"append_nul"}, config.append_nul);
    return config;
}

/**
 * @brief Parse a JSON file for one of the load_*_config functions
 * @throws std::runtime_error (or a subclass) if the file cannot be read or parsed
 */
inline tao::json::value read_config_file(const std::string &path) { return tao::json::from_file(path); }

} // namespace sinkwright
