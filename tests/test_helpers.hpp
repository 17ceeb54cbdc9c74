/**
 * @file test_helpers.hpp
 * @brief Fixtures and fakes shared by the sinkwright tests
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>
#include <unistd.h>

#include "sinkwright/log.hpp"

namespace sinkwright_test
{

namespace fs = std::filesystem;
using namespace sinkwright;

// 2024-03-01 12:00:00 UTC
inline constexpr std::time_t REFERENCE_EPOCH = 1709294400;

inline std::chrono::system_clock::time_point reference_time(std::chrono::microseconds extra = {})
{
    return std::chrono::system_clock::from_time_t(REFERENCE_EPOCH) + extra;
}

inline log_record make_test_record(log_level level,
                                   std::string name,
                                   std::string message,
                                   std::chrono::microseconds extra = {})
{
    log_record record;
    record.timestamp   = reference_time(extra);
    record.level       = level;
    record.logger_name = std::move(name);
    record.message     = std::move(message);
    record.process     = process_info{4242, "worker"};
    return record;
}

/**
 * @brief Per-test scratch directory under /tmp, removed afterwards
 */
class temp_dir_fixture
{
  protected:
    std::string test_dir;

    temp_dir_fixture()
    {
        auto pid = getpid();
        auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
        test_dir = "/tmp/test_sinkwright_" + std::to_string(pid) + "_" + std::to_string(tid);
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    ~temp_dir_fixture()
    {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    std::string path(std::string_view name) const { return test_dir + "/" + std::string(name); }

    static bool file_exists(const std::string &file) { return fs::exists(file); }

    static std::string read_file(const std::string &file)
    {
        std::ifstream in(file, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    static void write_file(const std::string &file, std::string_view content)
    {
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
    }
};

/**
 * @brief Decompress a single-member gzip file written by log_gzip.hpp
 * @return std::nullopt if the header, stream or trailer is invalid
 */
inline std::optional<std::string> gunzip_file(const std::string &file)
{
    std::ifstream in(file, std::ios::binary);
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    // 10 byte header without optional fields, 8 byte trailer
    if (data.size() < 18) return std::nullopt;
    auto byte = [&](size_t i) { return static_cast<unsigned char>(data[i]); };
    if (byte(0) != 0x1f || byte(1) != 0x8b || byte(2) != 0x08 || byte(3) != 0x00) return std::nullopt;

    mz_stream stream{};
    if (mz_inflateInit2(&stream, -MZ_DEFAULT_WINDOW_BITS) != MZ_OK) return std::nullopt;

    std::string output;
    std::vector<unsigned char> chunk(16 * 1024);
    stream.next_in  = reinterpret_cast<const unsigned char *>(data.data()) + 10;
    stream.avail_in = static_cast<unsigned>(data.size() - 18);

    int status = MZ_OK;
    while (status == MZ_OK)
    {
        stream.next_out  = chunk.data();
        stream.avail_out = static_cast<unsigned>(chunk.size());
        status           = mz_inflate(&stream, MZ_NO_FLUSH);
        output.append(reinterpret_cast<const char *>(chunk.data()), chunk.size() - stream.avail_out);
    }
    mz_inflateEnd(&stream);
    if (status != MZ_STREAM_END) return std::nullopt;

    size_t t      = data.size() - 8;
    uint32_t crc  = byte(t) | (byte(t + 1) << 8) | (byte(t + 2) << 16) | (static_cast<uint32_t>(byte(t + 3)) << 24);
    uint32_t size = byte(t + 4) | (byte(t + 5) << 8) | (byte(t + 6) << 16) | (static_cast<uint32_t>(byte(t + 7)) << 24);

    auto actual_crc = static_cast<uint32_t>(
        mz_crc32(MZ_CRC32_INIT, reinterpret_cast<const unsigned char *>(output.data()), output.size()));
    if (crc != actual_crc || size != static_cast<uint32_t>(output.size())) return std::nullopt;

    return output;
}

inline std::vector<std::string> split_lines(std::string_view text)
{
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size())
    {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        lines.emplace_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

/**
 * @brief Collects diagnostics instead of printing them
 */
struct diagnostic_capture
{
    std::shared_ptr<std::vector<std::string>> messages = std::make_shared<std::vector<std::string>>();

    diagnostic_handler handler() const
    {
        auto target = messages;
        return [target](std::string_view message) { target->emplace_back(message); };
    }

    bool contains(std::string_view needle) const
    {
        for (const auto &message : *messages)
        {
            if (message.find(needle) != std::string::npos) return true;
        }
        return false;
    }
};

/**
 * @brief Sink that keeps every record it is given
 */
class capturing_sink : public log_sink
{
  public:
    void write(const log_record &record) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_writes) { throw std::runtime_error("capturing_sink write failure"); }
        records.push_back(record);
    }

    void flush() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++flushes;
        if (fail_flush) { throw mail_error("capturing_sink flush failure"); }
    }

    void close() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++closes;
    }

    std::vector<log_record> records;
    int flushes      = 0;
    int closes       = 0;
    bool fail_writes = false;
    bool fail_flush  = false;

  private:
    std::mutex mutex_;
};

/**
 * @brief Mail transport that records messages instead of sending them
 */
class recording_transport : public mail_transport
{
  public:
    void send(const mail_envelope &envelope, std::string_view message) override
    {
        envelopes.push_back(envelope);
        messages.emplace_back(message);
        if (fail) { throw mail_error("connection refused"); }
    }

    std::vector<mail_envelope> envelopes;
    std::vector<std::string> messages;
    bool fail = false;
};

/**
 * @brief Sets TZ for the lifetime of the object
 */
class scoped_time_zone
{
  public:
    explicit scoped_time_zone(const char *tz)
    {
        if (const char *old = std::getenv("TZ")) { previous_ = old; }
        ::setenv("TZ", tz, 1);
        ::tzset();
    }

    ~scoped_time_zone()
    {
        if (previous_) { ::setenv("TZ", previous_->c_str(), 1); }
        else { ::unsetenv("TZ"); }
        ::tzset();
    }

    scoped_time_zone(const scoped_time_zone &)            = delete;
    scoped_time_zone &operator=(const scoped_time_zone &) = delete;

  private:
    std::optional<std::string> previous_;
};

} // namespace sinkwright_test
