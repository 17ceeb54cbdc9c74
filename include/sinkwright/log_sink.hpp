/**
 * @file log_sink.hpp
 * @brief The sink interface and its formatter/writer/filter composition
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <concepts>
#include <memory>
#include <mutex>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "log_types.hpp"
#include "log_record.hpp"

namespace sinkwright
{

/**
 * @brief Destination of log records
 *
 * Loggers hold sinks through std::shared_ptr<log_sink>; one sink may be
 * shared by several loggers. Every operation is safe to call concurrently.
 */
class log_sink
{
  public:
    virtual ~log_sink() = default;

    /**
     * @brief Render and emit one record, if the sink's filter accepts it
     */
    virtual void write(const log_record &record) = 0;

    /**
     * @brief Push out anything the sink holds back (mail buffer, etc.)
     */
    virtual void flush() = 0;

    /**
     * @brief Release files, sockets and transports. Called at teardown.
     */
    virtual void close() = 0;
};

/**
 * @brief Concrete sink that holds a formatter, a writer and an optional filter
 *
 * Formatter needs `void format(const log_record &, fmt::memory_buffer &) const`.
 * Writer needs `void write(const log_record &, std::string_view line)` and may
 * provide `flush()` and `close()`. Filter, when not void, needs
 * `bool should_process(const log_record &) const`.
 *
 * write, flush and close are serialized by one mutex, so a rollover or a
 * buffer flush triggered by a write completes before the next write starts.
 */
template <typename Formatter, typename Writer, typename Filter = void> class sink_model final : public log_sink
{
  public:
    template <typename F = Filter>
    sink_model(Formatter f, Writer w)
        requires std::is_void_v<F>
    : formatter_(std::move(f)),
      writer_(std::move(w))
    {
    }

    template <typename F = Filter>
    sink_model(Formatter f, Writer w, F flt)
        requires(!std::is_void_v<F> && std::is_same_v<F, Filter>)
    : formatter_(std::move(f)),
      writer_(std::move(w)),
      filter_(std::move(flt))
    {
    }

    template <typename T> static constexpr bool has_flush_v = requires(T &t) { t.flush(); };
    template <typename T> static constexpr bool has_close_v = requires(T &t) { t.close(); };

    void write(const log_record &record) override
    {
        if constexpr (!std::is_void_v<Filter>)
        {
            if (!filter_.should_process(record)) { return; }
        }

        std::lock_guard<std::mutex> lock(mutex_);
        scratch_.clear();
        formatter_.format(record, scratch_);
        writer_.write(record, std::string_view(scratch_.data(), scratch_.size()));
    }

    void flush() override
    {
        if constexpr (has_flush_v<Writer>)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            writer_.flush();
        }
    }

    void close() override
    {
        if constexpr (has_close_v<Writer>)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            writer_.close();
        }
    }

    const Formatter &formatter() const noexcept { return formatter_; }

    // Not synchronized; for inspection when no other thread is writing
    const Writer &writer() const noexcept { return writer_; }

  private:
    Formatter formatter_;
    Writer writer_;
    [[no_unique_address]] std::conditional_t<std::is_void_v<Filter>, std::monostate, Filter> filter_;

    std::mutex mutex_;
    fmt::memory_buffer scratch_; // Reused for every rendered line
};

/**
 * @brief Build a shared sink from its parts
 */
template <typename Formatter, typename Writer> std::shared_ptr<log_sink> make_sink(Formatter f, Writer w)
{
    return std::make_shared<sink_model<Formatter, Writer>>(std::move(f), std::move(w));
}

template <typename Formatter, typename Writer, typename Filter>
std::shared_ptr<log_sink> make_sink(Formatter f, Writer w, Filter flt)
{
    return std::make_shared<sink_model<Formatter, Writer, Filter>>(std::move(f), std::move(w), std::move(flt));
}

} // namespace sinkwright
