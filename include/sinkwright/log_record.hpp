/**
 * @file log_record.hpp
 * @brief The immutable unit of logging passed from loggers to sinks
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <errno.h> // program_invocation_short_name
#include <unistd.h>

#include "log_types.hpp"

namespace sinkwright
{

/**
 * @brief Where in the program a record was emitted
 */
struct source_location
{
    std::string module;   ///< Source file name without extension
    std::string function; ///< Enclosing function
    uint32_t line = 0;
};

/**
 * @brief The process that emitted a record
 */
struct process_info
{
    int pid = 0;
    std::string process_name;

    static process_info current()
    {
#ifdef __GLIBC__
        return {static_cast<int>(::getpid()), program_invocation_short_name};
#else
        return {static_cast<int>(::getpid()), "MainProcess"};
#endif
    }
};

/**
 * @brief One RFC 5424 SD-PARAM
 */
struct sd_param
{
    std::string name;
    std::string value;
};

/**
 * @brief One RFC 5424 SD-ELEMENT: an SD-ID and its parameters, in insertion order
 */
struct sd_element
{
    std::string id;
    std::vector<sd_param> params;
};

using structured_data = std::vector<sd_element>;

/**
 * @brief A single log event
 *
 * Built once by the logger and handed to every sink by const reference;
 * sinks never modify it.
 */
struct log_record
{
    std::chrono::system_clock::time_point timestamp;
    log_level level = log_level::info;
    std::string logger_name;
    std::string message;
    std::optional<source_location> location;
    std::optional<process_info> process;
    structured_data sd;
};

/**
 * @brief Create a record stamped with the current time and process
 */
inline log_record make_record(log_level level, std::string logger_name, std::string message)
{
    log_record record;
    record.timestamp   = std::chrono::system_clock::now();
    record.level       = level;
    record.logger_name = std::move(logger_name);
    record.message     = std::move(message);
    record.process     = process_info::current();
    return record;
}

} // namespace sinkwright
