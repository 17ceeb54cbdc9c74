/**
 * @file fmt_config.hpp
 * @brief Pulls in {fmt} in header-only mode
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * sinkwright is header-only, so fmt is used the same way and no fmt
 * library has to be linked by consumers.
 */
#pragma once

#ifndef FMT_HEADER_ONLY
#define FMT_HEADER_ONLY
#endif

#include <fmt/format.h>
#include <fmt/chrono.h>
#include <fmt/ranges.h> // fmt::join
