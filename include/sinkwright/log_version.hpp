/**
 * @file log_version.hpp
 * @brief Version information for the sinkwright logging facade
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

namespace sinkwright
{

#ifndef SINKWRIGHT_VERSION_STRING
    #define SINKWRIGHT_VERSION_STRING "0.3.1"
#endif

inline constexpr const char *VERSION = SINKWRIGHT_VERSION_STRING;

} // namespace sinkwright
