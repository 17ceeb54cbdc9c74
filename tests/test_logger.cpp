/**
 * @file test_logger.cpp
 * @brief Tests for loggers, the line builder and the logger registry
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <atomic>
#include <thread>

#include "test_helpers.hpp"

using namespace sinkwright;
using namespace sinkwright_test;
using namespace Catch::Matchers;

TEST_CASE("Registry hands out one logger per name", "[registry]")
{
    logger_registry registry(diagnostic_handler{});

    SECTION("Same name, same logger")
    {
        auto &a = registry.get_logger("db");
        auto &b = registry.get_logger("db");
        REQUIRE(&a == &b);
        REQUIRE(a.name() == "db");
        REQUIRE(a.parent() == &registry.root());
    }

    SECTION("Empty name and root name refer to the root logger")
    {
        REQUIRE(&registry.get_logger("") == &registry.root());
        REQUIRE(&registry.get_logger("root") == &registry.root());
        REQUIRE(registry.root().name() == "root");
        REQUIRE(registry.root().parent() == nullptr);
    }

    SECTION("Lookup without creation")
    {
        REQUIRE(registry.find_logger("missing") == nullptr);
        auto &created = registry.get_logger("present");
        REQUIRE(registry.find_logger("present") == &created);
        REQUIRE(registry.find_logger("") == &registry.root());
    }

    SECTION("Names are listed root first")
    {
        registry.get_logger("zeta");
        registry.get_logger("alpha");
        REQUIRE(registry.logger_names() == std::vector<std::string>{"root", "alpha", "zeta"});
    }

    SECTION("Concurrent first use creates a single logger")
    {
        std::vector<std::thread> threads;
        std::vector<logger *> seen(8, nullptr);
        for (size_t i = 0; i < seen.size(); ++i)
        {
            threads.emplace_back([&, i] { seen[i] = &registry.get_logger("shared"); });
        }
        for (auto &t : threads) { t.join(); }

        for (auto *ptr : seen) { REQUIRE(ptr == seen[0]); }
        REQUIRE(registry.logger_names().size() == 2);
    }
}

TEST_CASE("Logger level gates records", "[logger]")
{
    logger_registry registry(diagnostic_handler{});
    auto sink = std::make_shared<capturing_sink>();
    auto &log = registry.get_logger("gate");
    log.set_propagate(false);
    log.add_sink(sink);
    log.set_level(log_level::warning);

    log.info("dropped");
    log.warning("kept {}", 1);
    log.critical("kept {}", 2);

    REQUIRE(sink->records.size() == 2);
    REQUIRE(sink->records[0].message == "kept 1");
    REQUIRE(sink->records[0].level == log_level::warning);
    REQUIRE(sink->records[0].logger_name == "gate");
    REQUIRE(sink->records[1].level == log_level::critical);

    SECTION("Lowering the level takes effect immediately")
    {
        log.set_level(log_level::debug);
        log.debug("now visible");
        REQUIRE(sink->records.size() == 3);
    }

    SECTION("Removed sinks receive nothing")
    {
        REQUIRE(log.remove_sink(sink));
        REQUIRE_FALSE(log.remove_sink(sink));
        log.error("after removal");
        REQUIRE(sink->records.size() == 2);
    }
}

TEST_CASE("Records propagate to the root logger", "[logger]")
{
    logger_registry registry(diagnostic_handler{});
    auto root_sink  = std::make_shared<capturing_sink>();
    auto child_sink = std::make_shared<capturing_sink>();
    registry.root().add_sink(root_sink);
    auto &child = registry.get_logger("child");
    child.add_sink(child_sink);

    child.info("hello");
    REQUIRE(child_sink->records.size() == 1);
    REQUIRE(root_sink->records.size() == 1);
    REQUIRE(root_sink->records[0].logger_name == "child");

    SECTION("Propagation can be switched off")
    {
        child.set_propagate(false);
        child.info("local only");
        REQUIRE(child_sink->records.size() == 2);
        REQUIRE(root_sink->records.size() == 1);
    }

    SECTION("The root level does not filter propagated records")
    {
        registry.root().set_level(log_level::critical);
        child.info("still delivered");
        REQUIRE(root_sink->records.size() == 2);
    }
}

TEST_CASE("A failing sink does not starve the others", "[logger][errors]")
{
    logger_registry registry(diagnostic_handler{});
    auto failing = std::make_shared<capturing_sink>();
    auto healthy = std::make_shared<capturing_sink>();
    failing->fail_writes = true;

    auto &log = registry.get_logger("mixed");
    log.add_sink(failing);
    log.add_sink(healthy);

    REQUIRE_THROWS_WITH(log.error("boom"), "capturing_sink write failure");
    REQUIRE(healthy->records.size() == 1);

    SECTION("Line builder reports instead of throwing")
    {
        REQUIRE_NOTHROW(SINKWRIGHT_LOG(log, error) << "from builder");
        REQUIRE(healthy->records.size() == 2);
    }
}

TEST_CASE("Line builder captures the call site", "[logger][line]")
{
    logger_registry registry(diagnostic_handler{});
    auto sink = std::make_shared<capturing_sink>();
    auto &log = registry.get_logger("builder");
    log.add_sink(sink);

    uint32_t line = __LINE__ + 1;
    SINKWRIGHT_LOG(log, warning) << "disk at " << 93 << "%";

    REQUIRE(sink->records.size() == 1);
    const auto &record = sink->records[0];
    REQUIRE(record.message == "disk at 93%");
    REQUIRE(record.level == log_level::warning);
    REQUIRE(record.location.has_value());
    REQUIRE(record.location->module == "test_logger");
    REQUIRE(record.location->line == line);
    REQUIRE_FALSE(record.location->function.empty());

    SECTION("Formatted text and structured data")
    {
        SINKWRIGHT_LOG(log, error)
            .format("request {} failed", 7)
            .sd("req@1", "id", 7)
            .sd("peer@1", "addr", "10.0.0.1")
            .sd("req@1", "path", "/index");

        REQUIRE(sink->records.size() == 2);
        const auto &second = sink->records[1];
        REQUIRE(second.message == "request 7 failed");
        REQUIRE(second.sd.size() == 2);
        REQUIRE(second.sd[0].id == "req@1");
        REQUIRE(second.sd[0].params.size() == 2);
        REQUIRE(second.sd[0].params[0].name == "id");
        REQUIRE(second.sd[0].params[0].value == "7");
        REQUIRE(second.sd[0].params[1].value == "/index");
        REQUIRE(second.sd[1].id == "peer@1");
    }

    SECTION("Disabled levels build nothing")
    {
        log.set_level(log_level::error);
        auto builder = SINKWRIGHT_LOG(log, info);
        REQUIRE_FALSE(builder.enabled());
    }
}

TEST_CASE("Records carry structured data to sinks", "[logger]")
{
    logger_registry registry(diagnostic_handler{});
    auto sink = std::make_shared<capturing_sink>();
    auto &log = registry.get_logger("sd");
    log.add_sink(sink);

    log.log(log_level::info, "Message", {{"user1@host1", {{"key1", "value1"}}}});
    REQUIRE(sink->records.size() == 1);
    REQUIRE(sink->records[0].sd.size() == 1);
    REQUIRE(sink->records[0].sd[0].params[0].value == "value1");
    REQUIRE_FALSE(sink->records[0].location.has_value());
}

TEST_CASE("Registry shutdown flushes and closes each sink once", "[registry]")
{
    diagnostic_capture diagnostics;
    auto shared = std::make_shared<capturing_sink>();
    auto own    = std::make_shared<capturing_sink>();

    SECTION("Explicit shutdown")
    {
        logger_registry registry(diagnostics.handler());
        registry.root().add_sink(shared);
        registry.get_logger("a").add_sink(shared);
        registry.get_logger("b").add_sink(own);

        registry.shutdown();
        REQUIRE(shared->flushes == 1);
        REQUIRE(shared->closes == 1);
        REQUIRE(own->flushes == 1);
        REQUIRE(own->closes == 1);
        REQUIRE(registry.is_shut_down());

        registry.shutdown();
        REQUIRE(shared->closes == 1);

        REQUIRE_THROWS_AS(registry.get_logger("a"), registry_error);
    }

    SECTION("Destruction shuts down")
    {
        {
            logger_registry registry(diagnostics.handler());
            registry.get_logger("a").add_sink(shared);
        }
        REQUIRE(shared->flushes == 1);
        REQUIRE(shared->closes == 1);
    }

    SECTION("Flush failures are reported and closing continues")
    {
        shared->fail_flush = true;
        {
            logger_registry registry(diagnostics.handler());
            registry.get_logger("mailer").add_sink(shared);
            registry.get_logger("other").add_sink(own);
        }
        REQUIRE(diagnostics.contains("Failed to flush sink of logger 'mailer'"));
        REQUIRE(shared->closes == 1);
        REQUIRE(own->closes == 1);
    }
}
