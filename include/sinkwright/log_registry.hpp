/**
 * @file log_registry.hpp
 * @brief Named logger lookup and orderly teardown of their sinks
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "log_types.hpp"
#include "logger.hpp"

namespace sinkwright
{

/**
 * @brief Owns every logger of an application
 *
 * The registry is an ordinary object, created by the application and
 * destroyed at exit; destruction flushes and closes all sinks, so buffered
 * mail is sent. Loggers live as long as the registry and are handed out by
 * reference.
 *
 * Every named logger has the root logger as parent. The names "" and "root"
 * both refer to the root logger.
 *
 * @code
 * sinkwright::logger_registry registry;
 * auto &log = sinkwright::create_file_logger(registry, "app", "app.log");
 * log.info("started");
 * @endcode
 */
class logger_registry
{
  public:
    explicit logger_registry(diagnostic_handler diagnostics = default_diagnostic_handler())
    : root_(std::make_unique<logger>(ROOT_LOGGER_NAME)),
      diagnostics_(std::move(diagnostics))
    {
    }

    ~logger_registry() { shutdown(); }

    logger_registry(const logger_registry &)            = delete;
    logger_registry &operator=(const logger_registry &) = delete;

    logger &root() noexcept { return *root_; }

    /**
     * @brief Get the logger called @p name, creating it on first use
     * @throws registry_error after shutdown()
     */
    logger &get_logger(std::string_view name)
    {
        if (shut_down_.load(std::memory_order_acquire))
        {
            throw registry_error(fmt::format("Logger registry is shut down, cannot provide logger '{}'", name));
        }

        if (is_root_name(name)) { return *root_; }

        // Try to find existing logger (read lock)
        {
            std::shared_lock lock(mutex_);
            auto it = loggers_.find(name);
            if (it != loggers_.end()) { return *it->second; }
        }

        // Create new logger (write lock)
        std::unique_lock lock(mutex_);
        // Double-check in case another thread created it
        auto it = loggers_.find(name);
        if (it != loggers_.end()) { return *it->second; }

        auto created = std::make_unique<logger>(std::string(name), DEFAULT_LOG_LEVEL, root_.get());
        auto *ptr    = created.get();
        loggers_.emplace(std::string(name), std::move(created));
        return *ptr;
    }

    /**
     * @brief Look up an existing logger without creating it
     * @return nullptr if no logger with that name exists
     */
    logger *find_logger(std::string_view name) const
    {
        if (is_root_name(name)) { return root_.get(); }

        std::shared_lock lock(mutex_);
        auto it = loggers_.find(name);
        return it != loggers_.end() ? it->second.get() : nullptr;
    }

    /**
     * @brief Names of all loggers, root first, the others in lexical order
     */
    std::vector<std::string> logger_names() const
    {
        std::shared_lock lock(mutex_);
        std::vector<std::string> names;
        names.reserve(loggers_.size() + 1);
        names.push_back(root_->name());
        for (const auto &[name, ptr] : loggers_) { names.push_back(name); }
        return names;
    }

    /**
     * @brief Flush every sink once, reporting failures as diagnostics
     */
    void flush_all()
    {
        for_each_unique_sink([this](const std::string &owner, log_sink &sink) {
            try
            {
                sink.flush();
            }
            catch (const std::exception &e)
            {
                report(fmt::format("Failed to flush sink of logger '{}': {}", owner, e.what()));
            }
        });
    }

    /**
     * @brief Flush and close all sinks, then refuse further lookups
     *
     * Safe to call more than once; only the first call does anything.
     */
    void shutdown()
    {
        if (shut_down_.exchange(true, std::memory_order_acq_rel)) return;

        flush_all();
        for_each_unique_sink([this](const std::string &owner, log_sink &sink) {
            try
            {
                sink.close();
            }
            catch (const std::exception &e)
            {
                report(fmt::format("Failed to close sink of logger '{}': {}", owner, e.what()));
            }
        });
    }

    bool is_shut_down() const noexcept { return shut_down_.load(std::memory_order_acquire); }

    void report(std::string_view message) const
    {
        if (diagnostics_) { diagnostics_(message); }
    }

    const diagnostic_handler &diagnostics() const noexcept { return diagnostics_; }

  private:
    static bool is_root_name(std::string_view name) { return name.empty() || name == ROOT_LOGGER_NAME; }

    // Sinks shared by several loggers are visited once
    template <typename Fn> void for_each_unique_sink(Fn &&fn)
    {
        std::vector<std::pair<std::string, std::shared_ptr<log_sink>>> targets;
        {
            std::shared_lock lock(mutex_);
            std::set<const log_sink *> seen;
            auto collect = [&](const logger &owner) {
                for (auto &sink : owner.sinks())
                {
                    if (seen.insert(sink.get()).second) { targets.emplace_back(owner.name(), std::move(sink)); }
                }
            };
            collect(*root_);
            for (const auto &[name, ptr] : loggers_) { collect(*ptr); }
        }

        for (auto &[owner, sink] : targets) { fn(owner, *sink); }
    }

    std::unique_ptr<logger> root_;
    std::map<std::string, std::unique_ptr<logger>, std::less<>> loggers_;
    mutable std::shared_mutex mutex_;
    std::atomic<bool> shut_down_{false};
    diagnostic_handler diagnostics_;
};

} // namespace sinkwright
