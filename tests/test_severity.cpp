/**
 * @file test_severity.cpp
 * @brief Tests for level classification and level names
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */

#include <catch2/catch_test_macros.hpp>

#include "test_helpers.hpp"

using namespace sinkwright;
using namespace sinkwright_test;

TEST_CASE("Level names classify case-insensitively", "[severity]")
{
    diagnostic_capture diagnostics;

    SECTION("Canonical names")
    {
        REQUIRE(classify_log_level("DEBUG", log_level::info, diagnostics.handler()) == log_level::debug);
        REQUIRE(classify_log_level("info", log_level::debug, diagnostics.handler()) == log_level::info);
        REQUIRE(classify_log_level("Error", log_level::info, diagnostics.handler()) == log_level::error);
        REQUIRE(classify_log_level("CRITICAL", log_level::info, diagnostics.handler()) == log_level::critical);
    }

    SECTION("Warning spellings")
    {
        REQUIRE(classify_log_level("warn", log_level::info, diagnostics.handler()) == log_level::warning);
        REQUIRE(classify_log_level("WARNING", log_level::info, diagnostics.handler()) == log_level::warning);
        REQUIRE(classify_log_level("Warning123", log_level::info, diagnostics.handler()) == log_level::warning);
    }

    SECTION("Critical abbreviation")
    {
        REQUIRE(classify_log_level("crit", log_level::info, diagnostics.handler()) == log_level::critical);
    }

    SECTION("Level names embedded in other text")
    {
        REQUIRE(classify_log_level("-debug", log_level::info, diagnostics.handler()) == log_level::debug);
        REQUIRE(classify_log_level("loglevel=error", log_level::info, diagnostics.handler()) == log_level::error);
    }

    REQUIRE(diagnostics.messages->empty());
}

TEST_CASE("The first matching level name wins", "[severity]")
{
    // DEBUG is checked before INFO, INFO before WARN, and so on
    REQUIRE(match_log_level("debuginfo") == log_level::debug);
    REQUIRE(match_log_level("info-or-error") == log_level::info);
    REQUIRE(match_log_level("critical error") == log_level::error);
}

TEST_CASE("Unknown level input falls back to the default with a diagnostic", "[severity]")
{
    diagnostic_capture diagnostics;

    SECTION("Nonsense input")
    {
        REQUIRE(classify_log_level("nonsense", log_level::info, diagnostics.handler()) == log_level::info);
        REQUIRE(diagnostics.messages->size() == 1);
        REQUIRE(diagnostics.contains("Couldn't parse inputted loglevel 'nonsense'"));
        REQUIRE(diagnostics.contains("INFO"));
    }

    SECTION("Empty input uses the given fallback")
    {
        REQUIRE(classify_log_level("", log_level::warning, diagnostics.handler()) == log_level::warning);
        REQUIRE(diagnostics.contains("WARNING"));
    }

    SECTION("No handler installed")
    {
        REQUIRE(classify_log_level("nonsense", log_level::error, diagnostic_handler{}) == log_level::error);
    }

    REQUIRE_FALSE(match_log_level("verbose").has_value());
}

TEST_CASE("Level names and ordering", "[severity]")
{
    REQUIRE(std::string(string_from_log_level(log_level::debug)) == "DEBUG");
    REQUIRE(std::string(string_from_log_level(log_level::info)) == "INFO");
    REQUIRE(std::string(string_from_log_level(log_level::warning)) == "WARNING");
    REQUIRE(std::string(string_from_log_level(log_level::error)) == "ERROR");
    REQUIRE(std::string(string_from_log_level(log_level::critical)) == "CRITICAL");

    REQUIRE(log_level::debug < log_level::info);
    REQUIRE(log_level::info < log_level::warning);
    REQUIRE(log_level::warning < log_level::error);
    REQUIRE(log_level::error < log_level::critical);
}

TEST_CASE("Time-zone style parsing", "[severity][timestamp]")
{
    REQUIRE(time_zone_style_from_string("utc") == time_zone_style::utc);
    REQUIRE(time_zone_style_from_string("UTC") == time_zone_style::utc);
    REQUIRE(time_zone_style_from_string("local") == time_zone_style::local);
    REQUIRE(time_zone_style_from_string("gmt") == time_zone_style::local);
    REQUIRE(time_zone_style_from_string("") == time_zone_style::local);
    REQUIRE(time_zone_style_from_string("utc+1") == time_zone_style::local);
}
