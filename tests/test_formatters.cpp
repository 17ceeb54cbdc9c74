/**
 * @file test_formatters.cpp
 * @brief Tests for timestamp rendering and the text line patterns
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */

#include <catch2/catch_test_macros.hpp>

#include "test_helpers.hpp"

using namespace sinkwright;
using namespace sinkwright_test;
using namespace std::chrono_literals;

namespace
{

std::string rfc5424(std::chrono::system_clock::time_point tp, long offset)
{
    fmt::memory_buffer out;
    format_rfc5424_timestamp(out, tp, offset);
    return fmt::to_string(out);
}

std::string asctime(std::chrono::system_clock::time_point tp, time_zone_style style)
{
    fmt::memory_buffer out;
    format_asctime(out, tp, style);
    return fmt::to_string(out);
}

} // namespace

TEST_CASE("Asctime rendering", "[timestamp]")
{
    SECTION("UTC")
    {
        REQUIRE(asctime(reference_time(), time_zone_style::utc) == "2024-03-01 12:00:00");
    }

    SECTION("Local time follows TZ")
    {
        scoped_time_zone tz("CET-1");
        REQUIRE(asctime(reference_time(), time_zone_style::local) == "2024-03-01 13:00:00");
        REQUIRE(asctime(reference_time(), time_zone_style::utc) == "2024-03-01 12:00:00");
    }

    SECTION("Sub-second parts")
    {
        auto tp = reference_time(42'123us);
        REQUIRE(subsecond_part<std::chrono::milliseconds>(tp) == 42);
        REQUIRE(subsecond_part<std::chrono::microseconds>(tp) == 42'123);
    }
}

TEST_CASE("RFC 5424 timestamps", "[timestamp][syslog]")
{
    SECTION("Zero offset ends in Z")
    {
        REQUIRE(rfc5424(reference_time(), 0) == "2024-03-01T12:00:00.000000Z");
    }

    SECTION("Positive offset")
    {
        REQUIRE(rfc5424(reference_time(123'456us), 3600) == "2024-03-01T13:00:00.123456+01:00");
    }

    SECTION("Negative offset with minutes")
    {
        REQUIRE(rfc5424(reference_time(), -(5 * 3600 + 30 * 60)) == "2024-03-01T06:30:00.000000-05:30");
    }

    SECTION("Offset of the process time zone")
    {
        {
            scoped_time_zone tz("UTC0");
            REQUIRE(utc_offset_seconds(reference_time()) == 0);
        }
        {
            scoped_time_zone tz("CET-1");
            REQUIRE(utc_offset_seconds(reference_time()) == 3600);
        }
    }
}

TEST_CASE("Compact line pattern", "[formatter]")
{
    auto formatter = text_formatter::for_level(log_level::info, time_zone_style::utc);
    REQUIRE_FALSE(formatter.verbose);

    auto record = make_test_record(log_level::info, "app", "Service started", 42'000us);
    REQUIRE(formatter.format(record) == "2024-03-01 12:00:00 - app - INFO - Service started");

    record.level = log_level::critical;
    REQUIRE(formatter.format(record) == "2024-03-01 12:00:00 - app - CRITICAL - Service started");
}

TEST_CASE("Verbose line pattern at DEBUG", "[formatter]")
{
    auto formatter = text_formatter::for_level(log_level::debug, time_zone_style::utc);
    REQUIRE(formatter.verbose);

    auto record = make_test_record(log_level::info, "app", "Service started", 42'000us);

    SECTION("With source location")
    {
        record.location = source_location{"main", "run", 17};
        REQUIRE(formatter.format(record) ==
                "2024-03-01 12:00:00,042 - app - INFO - <PID 4242:worker> - main:run:17 - Service started");
    }

    SECTION("Without source location")
    {
        REQUIRE(formatter.format(record) == "2024-03-01 12:00:00,042 - app - INFO - <PID 4242:worker> - -:-:0 - Service started");
    }

    SECTION("Without process information the current process is shown")
    {
        record.process.reset();
        std::string line = formatter.format(record);
        REQUIRE(line.find(fmt::format("<PID {}:", getpid())) != std::string::npos);
    }
}

TEST_CASE("Console colors wrap the whole line", "[formatter][console]")
{
    auto formatter        = text_formatter::for_level(log_level::info, time_zone_style::utc);
    formatter.use_color   = true;
    formatter.add_newline = true;

    auto record = make_test_record(log_level::warning, "app", "careful");
    REQUIRE(formatter.format(record) == "\x1b[33;20m2024-03-01 12:00:00 - app - WARNING - careful\x1b[0m\n");

    record.level = log_level::critical;
    REQUIRE(formatter.format(record).starts_with("\x1b[31;1m"));

    SECTION("Custom colors")
    {
        formatter.colors.error = "<red>";
        formatter.colors.reset = "</red>";
        record.level           = log_level::error;
        REQUIRE(formatter.format(record) == "<red>2024-03-01 12:00:00 - app - ERROR - careful</red>\n");
    }
}

TEST_CASE("Default level colors", "[formatter][console]")
{
    level_colors colors;
    REQUIRE(colors.for_level(log_level::debug) == "\x1b[34;20m");
    REQUIRE(colors.for_level(log_level::info) == "\x1b[38;20m");
    REQUIRE(colors.for_level(log_level::warning) == "\x1b[33;20m");
    REQUIRE(colors.for_level(log_level::error) == "\x1b[31;20m");
    REQUIRE(colors.for_level(log_level::critical) == "\x1b[31;1m");
    REQUIRE(colors.reset == "\x1b[0m");
}

TEST_CASE("Console sink writes colored lines to its descriptor", "[formatter][console]")
{
    int fds[2];
    REQUIRE(::pipe(fds) == 0);

    {
        auto sink = make_console_sink(log_level::warning, time_zone_style::utc, true, level_colors{}, fds[1]);
        sink->write(make_test_record(log_level::info, "console", "filtered"));
        sink->write(make_test_record(log_level::error, "console", "shown"));
    }
    ::close(fds[1]);

    std::string output;
    char buffer[512];
    ssize_t n;
    while ((n = ::read(fds[0], buffer, sizeof(buffer))) > 0) { output.append(buffer, static_cast<size_t>(n)); }
    ::close(fds[0]);

    REQUIRE(output == "\x1b[31;20m2024-03-01 12:00:00 - console - ERROR - shown\x1b[0m\n");
}
