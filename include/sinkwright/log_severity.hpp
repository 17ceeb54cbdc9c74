/**
 * @file log_severity.hpp
 * @brief Normalization of free-form level input into a canonical log_level
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>

#include "log_types.hpp"

namespace sinkwright
{

namespace detail
{

struct level_stem
{
    std::string_view stem;
    log_level level;
};

// Checked in this order; the first stem found anywhere in the input wins.
// "WARN" and "CRIT" cover both the full names and their usual abbreviations.
inline constexpr std::array<level_stem, LOG_LEVEL_COUNT> level_stems = {{
    {"DEBUG", log_level::debug},
    {"INFO", log_level::info},
    {"WARN", log_level::warning},
    {"ERROR", log_level::error},
    {"CRIT", log_level::critical},
}};

} // namespace detail

/**
 * @brief Match free-form input against the level names
 *
 * The comparison is case-insensitive and matches substrings, so "warn",
 * "WARNING" and "Warning123" all yield log_level::warning.
 *
 * @param input Level text, e.g. from a command line or config file
 * @return The matched level, or std::nullopt if no level name occurs in the input
 */
inline std::optional<log_level> match_log_level(std::string_view input)
{
    std::string upper(input);
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return std::toupper(c); });

    for (const auto &entry : detail::level_stems)
    {
        if (upper.find(entry.stem) != std::string::npos) { return entry.level; }
    }
    return std::nullopt;
}

/**
 * @brief Classify level input, falling back to a default on no match
 *
 * A miss is a recoverable configuration error: it is reported through
 * @p diagnostics and @p fallback is returned.
 */
inline log_level classify_log_level(std::string_view input,
                                    log_level fallback                 = DEFAULT_LOG_LEVEL,
                                    const diagnostic_handler &diagnostics = default_diagnostic_handler())
{
    if (auto level = match_log_level(input)) { return *level; }

    if (diagnostics)
    {
        diagnostics(fmt::format("Couldn't parse inputted loglevel '{}', using default {}",
                                input,
                                string_from_log_level(fallback)));
    }
    return fallback;
}

} // namespace sinkwright
