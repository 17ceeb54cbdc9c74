/**
 * @file logger.hpp
 * @brief Named loggers and the stream-style line builder
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <algorithm>
#include <atomic>
#include <exception>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "log_types.hpp"
#include "log_utils.hpp"
#include "log_record.hpp"
#include "log_sink.hpp"

namespace sinkwright
{

/**
 * @brief A named source of records with its own level and sinks
 *
 * A record that passes the logger's level goes to every sink of the logger
 * and, while propagation is enabled, to the sinks of its parent. Each sink
 * then applies its own level filter.
 *
 * Loggers are owned by a logger_registry and handed out by reference.
 */
class logger
{
  public:
    logger(std::string name, log_level level = DEFAULT_LOG_LEVEL, logger *parent = nullptr)
    : name_(std::move(name)),
      level_(level),
      parent_(parent)
    {
    }

    logger(const logger &)            = delete;
    logger &operator=(const logger &) = delete;

    const std::string &name() const noexcept { return name_; }

    log_level level() const noexcept { return level_.load(std::memory_order_relaxed); }
    void set_level(log_level level) noexcept { level_.store(level, std::memory_order_relaxed); }
    bool is_enabled_for(log_level level) const noexcept { return level >= this->level(); }

    logger *parent() const noexcept { return parent_; }
    bool propagate() const noexcept { return propagate_.load(std::memory_order_relaxed); }
    void set_propagate(bool propagate) noexcept { propagate_.store(propagate, std::memory_order_relaxed); }

    void add_sink(std::shared_ptr<log_sink> sink)
    {
        if (!sink) return;
        std::unique_lock lock(mutex_);
        sinks_.push_back(std::move(sink));
    }

    bool remove_sink(const std::shared_ptr<log_sink> &sink)
    {
        std::unique_lock lock(mutex_);
        auto it = std::find(sinks_.begin(), sinks_.end(), sink);
        if (it == sinks_.end()) return false;
        sinks_.erase(it);
        return true;
    }

    std::vector<std::shared_ptr<log_sink>> sinks() const
    {
        std::shared_lock lock(mutex_);
        return sinks_;
    }

    /**
     * @brief Dispatch a record, ignoring it if it is below the logger's level
     *
     * Every sink sees the record even if an earlier one throws; the first
     * exception is rethrown once dispatch is complete.
     */
    void log(const log_record &record)
    {
        if (!is_enabled_for(record.level)) return;

        std::exception_ptr first_failure;
        for (logger *current = this; current != nullptr; current = current->parent_)
        {
            current->call_sinks(record, first_failure);
            if (!current->propagate()) break;
        }

        if (first_failure) { std::rethrow_exception(first_failure); }
    }

    void log(log_level level,
             std::string message,
             structured_data sd                      = {},
             std::optional<source_location> location = std::nullopt)
    {
        if (!is_enabled_for(level)) return;

        log_record record = make_record(level, name_, std::move(message));
        record.sd         = std::move(sd);
        record.location   = std::move(location);
        log(record);
    }

    template <typename... Args> void debug(fmt::format_string<Args...> fmt, Args &&...args)
    {
        log_formatted(log_level::debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args> void info(fmt::format_string<Args...> fmt, Args &&...args)
    {
        log_formatted(log_level::info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args> void warning(fmt::format_string<Args...> fmt, Args &&...args)
    {
        log_formatted(log_level::warning, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args> void error(fmt::format_string<Args...> fmt, Args &&...args)
    {
        log_formatted(log_level::error, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args> void critical(fmt::format_string<Args...> fmt, Args &&...args)
    {
        log_formatted(log_level::critical, fmt, std::forward<Args>(args)...);
    }

  private:
    template <typename... Args> void log_formatted(log_level level, fmt::format_string<Args...> fmt, Args &&...args)
    {
        if (!is_enabled_for(level)) return;
        log(level, fmt::format(fmt, std::forward<Args>(args)...));
    }

    void call_sinks(const log_record &record, std::exception_ptr &first_failure) const
    {
        std::shared_lock lock(mutex_);
        for (const auto &sink : sinks_)
        {
            try
            {
                sink->write(record);
            }
            catch (const std::exception &)
            {
                if (!first_failure) { first_failure = std::current_exception(); }
            }
        }
    }

    std::string name_;
    std::atomic<log_level> level_;
    std::atomic<bool> propagate_{true};
    logger *parent_;

    mutable std::shared_mutex mutex_; // Guards sinks_
    std::vector<std::shared_ptr<log_sink>> sinks_;
};

/**
 * @brief Builds one record from streamed or formatted parts
 *
 * The record is dispatched when the builder goes out of scope. A builder for
 * a disabled level ignores everything it is given.
 *
 * @code
 * SINKWRIGHT_LOG(log, warning) << "disk at " << percent << "%";
 * SINKWRIGHT_LOG(log, error).format("request {} failed", id).sd("req@1", "id", id);
 * @endcode
 */
class log_line
{
  public:
    log_line(logger &target, log_level level, std::string_view file, const char *function, uint32_t line)
    : target_(target.is_enabled_for(level) ? &target : nullptr),
      level_(level)
    {
        if (target_) { location_ = source_location{std::string(module_from_path(file)), function, line}; }
    }

    log_line(const log_line &)            = delete;
    log_line &operator=(const log_line &) = delete;

    ~log_line()
    {
        if (!target_) return;
        try
        {
            target_->log(level_, fmt::to_string(message_), std::move(sd_), std::move(location_));
        }
        catch (const std::exception &e)
        {
            print_diagnostic(fmt::format("Failed to emit record of logger '{}': {}", target_->name(), e.what()));
        }
    }

    template <typename T> log_line &operator<<(const T &value)
    {
        if (target_) { fmt::format_to(std::back_inserter(message_), "{}", value); }
        return *this;
    }

    template <typename... Args> log_line &format(fmt::format_string<Args...> fmt, Args &&...args)
    {
        if (target_) { fmt::format_to(std::back_inserter(message_), fmt, std::forward<Args>(args)...); }
        return *this;
    }

    /**
     * @brief Attach a structured-data parameter, grouped under its SD-ID
     */
    template <typename T> log_line &sd(std::string_view id, std::string_view name, const T &value)
    {
        if (!target_) return *this;

        auto element = std::find_if(sd_.begin(), sd_.end(), [&](const sd_element &e) { return e.id == id; });
        if (element == sd_.end()) { element = sd_.insert(sd_.end(), sd_element{std::string(id), {}}); }
        element->params.push_back(sd_param{std::string(name), fmt::format("{}", value)});
        return *this;
    }

    bool enabled() const noexcept { return target_ != nullptr; }

  private:
    logger *target_;
    log_level level_;
    fmt::memory_buffer message_;
    structured_data sd_;
    std::optional<source_location> location_;
};

} // namespace sinkwright

/**
 * @brief Start a record on @p _logger at @p _level, capturing the call site
 *
 * @p _logger is a sinkwright::logger (or a reference to one) and @p _level
 * one of debug, info, warning, error, critical.
 */
#define SINKWRIGHT_LOG(_logger, _level) \
    ::sinkwright::log_line((_logger), ::sinkwright::log_level::_level, __FILE__, __func__, __LINE__)
