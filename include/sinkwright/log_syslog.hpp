/**
 * @file log_syslog.hpp
 * @brief RFC 5424 line formatting and UDP delivery to a syslog collector
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * A formatted line looks like
 * @code
 * 1 2025-03-01T12:00:00.042117+01:00 host app 4242 - [req@1 id="7"] 2025-03-01 12:00:00 - SysLog - INFO - hello
 * @endcode
 * and travels as one datagram, prefixed with "<PRI>" and terminated by NUL.
 */
#pragma once

#include <array>
#include <cstring>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include <errno.h>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include "log_types.hpp"
#include "log_record.hpp"
#include "log_timestamp.hpp"
#include "log_formatters.hpp"
#include "log_gzip.hpp" // file_descriptor

namespace sinkwright
{

struct syslog_endpoint
{
    std::string address;
    int port = DEFAULT_SYSLOG_PORT;
};

/**
 * @brief Syslog SEVERITY of a level
 */
inline int syslog_severity(log_level level)
{
    switch (level)
    {
    case log_level::debug: return 7;
    case log_level::info: return 6;
    case log_level::warning: return 4;
    case log_level::error: return 3;
    case log_level::critical: return 2;
    }
    return 6;
}

inline int syslog_priority(int facility, log_level level) { return facility * 8 + syslog_severity(level); }

/**
 * @brief Append an SD-PARAM value with '"', '\' and ']' escaped by a backslash
 */
inline void escape_sd_value(std::string_view value, fmt::memory_buffer &out)
{
    for (char c : value)
    {
        if (c == '"' || c == '\\' || c == ']') { out.push_back('\\'); }
        out.push_back(c);
    }
}

/**
 * @brief Append the STRUCTURED-DATA field, or "-" when there is none
 *
 * SD-IDs and parameter names are copied as given; they are not checked
 * against the RFC 5424 character set.
 */
inline void format_structured_data(const structured_data &sd, fmt::memory_buffer &out)
{
    if (sd.empty())
    {
        out.push_back('-');
        return;
    }

    for (const auto &element : sd)
    {
        out.push_back('[');
        out.append(element.id);
        for (const auto &param : element.params)
        {
            out.push_back(' ');
            out.append(param.name);
            out.append(std::string_view("=\""));
            escape_sd_value(param.value, out);
            out.push_back('"');
        }
        out.push_back(']');
    }
}

/**
 * @brief This machine's host name, or "-" if it cannot be determined
 */
inline std::string resolve_hostname()
{
    std::array<char, 256> name{};
    if (::gethostname(name.data(), name.size() - 1) != 0 || name[0] == '\0') { return "-"; }
    return std::string(name.data());
}

/**
 * @brief Renders records as RFC 5424 lines
 *
 * MSGID is always written as "-"; a configured msgid is kept for reference
 * only. The MESSAGE part is the plain text line of text_formatter.
 */
class syslog_formatter
{
  public:
    std::string app_name;                 ///< Empty renders as "-"
    std::string msgid;                    ///< Accepted but not rendered
    std::string hostname = "-";
    std::optional<long> utc_offset;       ///< Fixed offset in seconds; current local offset if unset
    text_formatter message_format;

    static syslog_formatter create(std::string app_name, std::string msgid, log_level configured, time_zone_style tz)
    {
        syslog_formatter formatter;
        formatter.app_name       = std::move(app_name);
        formatter.msgid          = std::move(msgid);
        formatter.hostname       = resolve_hostname();
        formatter.message_format = text_formatter::for_level(configured, tz);
        return formatter;
    }

    void format(const log_record &record, fmt::memory_buffer &out) const
    {
        auto it = std::back_inserter(out);

        out.append(std::string_view("1 "));
        format_rfc5424_timestamp(out, record.timestamp, utc_offset ? *utc_offset : utc_offset_seconds());

        int pid = record.process ? record.process->pid : static_cast<int>(::getpid());
        fmt::format_to(it,
                       " {} {} {} - ",
                       hostname.empty() ? "-" : hostname,
                       app_name.empty() ? "-" : app_name,
                       pid);

        format_structured_data(record.sd, out);
        out.push_back(' ');
        message_format.format(record, out);
    }

    std::string format(const log_record &record) const
    {
        fmt::memory_buffer out;
        format(record, out);
        return fmt::to_string(out);
    }
};

/**
 * @brief Sends each line as one UDP datagram to a syslog collector
 *
 * The collector address is resolved once, at construction. Sending is
 * fire-and-forget: a failed send is reported to the diagnostic handler and
 * the record is dropped.
 */
class udp_syslog_writer
{
  public:
    /**
     * @throws std::invalid_argument if the address is empty or the port out of range
     * @throws std::runtime_error if the address cannot be resolved
     * @throws std::system_error if the socket cannot be created
     */
    udp_syslog_writer(const syslog_endpoint &endpoint,
                      int facility                  = SYSLOG_FACILITY_USER,
                      bool append_nul               = true,
                      diagnostic_handler diagnostics = default_diagnostic_handler())
    : endpoint_(endpoint),
      facility_(facility),
      append_nul_(append_nul),
      diagnostics_(std::move(diagnostics))
    {
        if (endpoint_.address.empty()) { throw std::invalid_argument("Syslog address is empty"); }
        if (endpoint_.port <= 0 || endpoint_.port > 65535)
        {
            throw std::invalid_argument(fmt::format("Syslog port {} is out of range", endpoint_.port));
        }

        addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_DGRAM;

        addrinfo *found = nullptr;
        std::string port = std::to_string(endpoint_.port);
        int rc           = ::getaddrinfo(endpoint_.address.c_str(), port.c_str(), &hints, &found);
        if (rc != 0)
        {
            throw std::runtime_error(
                fmt::format("Cannot resolve syslog address {}:{}: {}", endpoint_.address, endpoint_.port, ::gai_strerror(rc)));
        }
        std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> results(found, &::freeaddrinfo);

        socket_.reset(::socket(found->ai_family, found->ai_socktype | SOCK_CLOEXEC, found->ai_protocol));
        if (!socket_) { throw std::system_error(errno, std::generic_category(), "Failed to create syslog socket"); }

        std::memcpy(&address_, found->ai_addr, found->ai_addrlen);
        address_len_ = found->ai_addrlen;
    }

    udp_syslog_writer(udp_syslog_writer &&) noexcept = default;

    void write(const log_record &record, std::string_view line)
    {
        datagram_.clear();
        fmt::format_to(std::back_inserter(datagram_), "<{}>", syslog_priority(facility_, record.level));
        datagram_.append(line);

        size_t limit = append_nul_ ? SYSLOG_MAX_DATAGRAM - 1 : SYSLOG_MAX_DATAGRAM;
        if (datagram_.size() > limit) { datagram_.resize(limit); }
        if (append_nul_) { datagram_.push_back('\0'); }

        ssize_t sent = ::sendto(socket_.get(),
                                datagram_.data(),
                                datagram_.size(),
                                MSG_NOSIGNAL,
                                reinterpret_cast<const sockaddr *>(&address_),
                                address_len_);
        if (sent < 0 && diagnostics_)
        {
            diagnostics_(fmt::format("Failed to send syslog datagram to {}:{}: {}",
                                     endpoint_.address,
                                     endpoint_.port,
                                     std::strerror(errno)));
        }
    }

    void close()
    {
        if (socket_.close() != 0)
        {
            throw std::system_error(errno, std::generic_category(), "Failed to close syslog socket");
        }
    }

    const syslog_endpoint &endpoint() const noexcept { return endpoint_; }

  private:
    syslog_endpoint endpoint_;
    int facility_;
    bool append_nul_;
    diagnostic_handler diagnostics_;
    gzip::file_descriptor socket_;
    sockaddr_storage address_{};
    socklen_t address_len_ = 0;
    fmt::memory_buffer datagram_;
};

} // namespace sinkwright
