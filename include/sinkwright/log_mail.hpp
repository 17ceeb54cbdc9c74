/**
 * @file log_mail.hpp
 * @brief Buffered delivery of log lines as SMTP digest mails
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * The mail writer collects rendered lines and sends them as one message when
 * its capacity is reached, when flushed explicitly, or when closed:
 * @code
 * From: logger@example.com
 * To: ops@example.com,dev@example.com
 * Subject: Service log
 *
 * 2025-03-01 12:00:00 - SMTP - ERROR - disk full
 * 2025-03-01 12:00:01 - SMTP - CRITICAL - giving up
 * @endcode
 */
#pragma once

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <curl/curl.h>

#include "log_types.hpp"
#include "log_record.hpp"

namespace sinkwright
{

/**
 * @brief SMTP server, credentials and addressing of log mails
 */
struct mail_envelope
{
    std::string host;
    int port = DEFAULT_SMTP_PORT;
    std::string username;
    std::string password;
    std::string from;
    std::vector<std::string> to;
    std::string subject;
};

/**
 * @brief Build the message text: headers, blank line, one CRLF-terminated line per entry
 */
inline std::string compose_mail(const mail_envelope &envelope, const std::vector<std::string> &lines)
{
    fmt::memory_buffer out;
    auto it = std::back_inserter(out);
    fmt::format_to(it,
                   "From: {}\r\nTo: {}\r\nSubject: {}\r\n\r\n",
                   envelope.from,
                   fmt::join(envelope.to, ","),
                   envelope.subject);
    for (const auto &line : lines) { fmt::format_to(it, "{}\r\n", line); }
    return fmt::to_string(out);
}

/**
 * @brief Delivers one composed message to every recipient of an envelope
 */
class mail_transport
{
  public:
    virtual ~mail_transport() = default;

    /**
     * @throws mail_error if the message could not be delivered
     */
    virtual void send(const mail_envelope &envelope, std::string_view message) = 0;
};

/**
 * @brief SMTP submission through libcurl, upgrading the session with STARTTLS
 */
class curl_smtp_transport final : public mail_transport
{
  public:
    /**
     * @throws mail_error if libcurl cannot be initialized
     */
    curl_smtp_transport()
    {
        static const CURLcode global_init = curl_global_init(CURL_GLOBAL_ALL);
        if (global_init != CURLE_OK)
        {
            throw mail_error(fmt::format("Failed to initialize libcurl: {}", curl_easy_strerror(global_init)));
        }
    }

    void send(const mail_envelope &envelope, std::string_view message) override
    {
        std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
        if (!curl) { throw mail_error("Failed to create libcurl handle"); }

        std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> recipients(nullptr, &curl_slist_free_all);
        for (const auto &address : envelope.to)
        {
            curl_slist *appended = curl_slist_append(recipients.get(), address.c_str());
            if (!appended) { throw mail_error("Failed to build recipient list"); }
            recipients.release();
            recipients.reset(appended);
        }

        std::string url = fmt::format("smtp://{}:{}", envelope.host, envelope.port);
        upload_state upload{message, 0};

        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
        if (!envelope.username.empty())
        {
            curl_easy_setopt(curl.get(), CURLOPT_USERNAME, envelope.username.c_str());
            curl_easy_setopt(curl.get(), CURLOPT_PASSWORD, envelope.password.c_str());
        }
        curl_easy_setopt(curl.get(), CURLOPT_MAIL_FROM, envelope.from.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_MAIL_RCPT, recipients.get());
        curl_easy_setopt(curl.get(), CURLOPT_READFUNCTION, &curl_smtp_transport::read_callback);
        curl_easy_setopt(curl.get(), CURLOPT_READDATA, &upload);
        curl_easy_setopt(curl.get(), CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

        CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK)
        {
            throw mail_error(
                fmt::format("Failed to send log mail via {}:{}: {}", envelope.host, envelope.port, curl_easy_strerror(res)));
        }
    }

  private:
    struct upload_state
    {
        std::string_view data;
        size_t offset;
    };

    static size_t read_callback(char *buffer, size_t size, size_t nitems, void *userdata)
    {
        auto *upload     = static_cast<upload_state *>(userdata);
        size_t remaining = upload->data.size() - upload->offset;
        size_t chunk     = std::min(remaining, size * nitems);
        std::memcpy(buffer, upload->data.data() + upload->offset, chunk);
        upload->offset += chunk;
        return chunk;
    }
};

/**
 * @brief Writer that keeps up to capacity lines and mails them in one message
 *
 * The buffer is emptied before the transport is called, so a failed send
 * loses the buffered lines instead of repeating them in the next mail.
 */
class buffered_mail_writer
{
  public:
    buffered_mail_writer(mail_envelope envelope, size_t capacity, std::shared_ptr<mail_transport> transport)
    : envelope_(std::move(envelope)),
      capacity_(capacity == 0 ? 1 : capacity),
      transport_(std::move(transport))
    {
        buffer_.reserve(capacity_);
    }

    buffered_mail_writer(buffered_mail_writer &&) noexcept = default;

    /**
     * @brief Buffer one line, sending the digest once capacity is reached
     * @throws mail_error if the automatic flush fails
     */
    void write(const log_record &, std::string_view line)
    {
        buffer_.emplace_back(line);
        if (buffer_.size() >= capacity_) { flush(); }
    }

    /**
     * @brief Send everything buffered as one mail; no-op when empty
     * @throws mail_error if delivery fails (the buffer is cleared regardless)
     */
    void flush()
    {
        if (buffer_.empty()) { return; }

        std::vector<std::string> lines;
        lines.reserve(capacity_);
        lines.swap(buffer_);

        ++flush_count_;
        transport_->send(envelope_, compose_mail(envelope_, lines));
    }

    void close() { flush(); }

    size_t buffered() const noexcept { return buffer_.size(); }
    size_t capacity() const noexcept { return capacity_; }
    uint64_t flush_count() const noexcept { return flush_count_; }
    const mail_envelope &envelope() const noexcept { return envelope_; }

  private:
    mail_envelope envelope_;
    size_t capacity_;
    std::shared_ptr<mail_transport> transport_;
    std::vector<std::string> buffer_;
    uint64_t flush_count_ = 0;
};

} // namespace sinkwright
