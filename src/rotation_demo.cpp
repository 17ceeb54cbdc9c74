/**
 * @file rotation_demo.cpp
 * @brief Demonstration of size-based rotation with gzip archives
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * This demo shows:
 * - Size-based rollover of the active file
 * - The numbered .gz archives and their cap
 * - Delayed opening of the active file
 * - Multi-threaded logging into one rotating file
 */

#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "sinkwright/log.hpp"

using namespace sinkwright;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace
{

const std::string log_dir = "/tmp/rotation_demo";

std::atomic<uint64_t> total_messages{0};

void print_header(const std::string &title)
{
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << " " << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

void list_rotated_files(const std::string &base_path)
{
    fs::path base(base_path);
    std::string prefix = base.filename().string() + ".";

    size_t count      = 0;
    uintmax_t total   = 0;
    for (const auto &entry : fs::directory_iterator(base.parent_path()))
    {
        if (!entry.is_regular_file()) continue;
        std::string filename = entry.path().filename().string();
        if (filename.rfind(prefix, 0) == 0 && entry.path().extension() == ".gz")
        {
            std::cout << "  " << filename << " (" << entry.file_size() << " bytes)\n";
            count++;
            total += entry.file_size();
        }
    }

    std::cout << "  Archives: " << count << " (total size: " << total / 1024 << " KB)\n";
    if (fs::exists(base)) { std::cout << "  Active file: " << fs::file_size(base) << " bytes\n"; }
}

void remove_previous(const std::string &base_path)
{
    std::error_code ec;
    fs::remove(base_path, ec);
    for (int i = 1; i <= 20; ++i) { fs::remove(base_path + "." + std::to_string(i) + ".gz", ec); }
}

// Demo 1: Size-based rotation
void demo_size_rotation(logger_registry &registry)
{
    print_header("Demo 1: Size-Based Rotation");

    std::string log_file = log_dir + "/size_rotation.log";
    remove_previous(log_file);

    file_config config;
    config.name         = "size";
    config.path         = log_file;
    config.max_bytes    = 16 * 1024;
    config.backup_count = 3;

    auto &log = create_file_logger(registry, config);
    log.set_propagate(false);

    std::cout << "Configuration:\n";
    std::cout << "  Max file size: 16 KB\n";
    std::cout << "  Backup count: 3\n";
    std::cout << "  Log file: " << log_file << "\n\n";

    std::cout << "Generating logs to trigger rotation...\n";
    for (int i = 0; i < 1000; ++i)
    {
        SINKWRIGHT_LOG(log, info) << "Size rotation test message " << i
                                  << " - Lorem ipsum dolor sit amet, consectetur adipiscing elit.";

        if (i % 250 == 0) { std::cout << "  Generated " << i << " messages\n"; }
    }

    list_rotated_files(log_file);
}

// Demo 2: The active file is only opened by the first record after a rollover
void demo_delayed_open(logger_registry &registry)
{
    print_header("Demo 2: Delayed Open");

    std::string log_file = log_dir + "/delayed.log";
    remove_previous(log_file);

    file_config config;
    config.name         = "delayed";
    config.path         = log_file;
    config.max_bytes    = 4 * 1024;
    config.backup_count = 2;
    config.delay        = true;

    auto &log = create_file_logger(registry, config);
    log.set_propagate(false);

    for (int i = 0; i < 200; ++i) { log.warning("Delayed open message {} with some padding text", i); }

    list_rotated_files(log_file);
}

// Demo 3: Concurrent writers sharing one rotating sink
void demo_multithreaded(logger_registry &registry)
{
    print_header("Demo 3: Multi-Threaded Logging");

    std::string log_file = log_dir + "/threads.log";
    remove_previous(log_file);

    auto &log = create_file_logger(registry, "threads", log_file, "info", "utc", 32 * 1024, 5);
    log.set_propagate(false);

    constexpr int num_threads = 4;
    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t)
    {
        threads.emplace_back([&log, t] {
            std::mt19937 gen(static_cast<unsigned>(t));
            std::uniform_int_distribution<> size_dist(20, 120);
            for (int i = 0; i < 500; ++i)
            {
                std::string padding(static_cast<size_t>(size_dist(gen)), 'X');
                log.info("Thread-{} msg#{} {}", t, total_messages.fetch_add(1), padding);
            }
        });
    }

    for (auto &thread : threads) { thread.join(); }

    std::cout << "Messages written: " << total_messages.load() << "\n";
    list_rotated_files(log_file);
}

} // namespace

int main()
{
    std::error_code ec;
    fs::create_directories(log_dir, ec);
    if (ec)
    {
        std::cerr << "Cannot create " << log_dir << ": " << ec.message() << "\n";
        return 1;
    }

    logger_registry registry;

    demo_size_rotation(registry);
    demo_delayed_open(registry);
    demo_multithreaded(registry);

    registry.shutdown();
    std::cout << "\nAll logs written to " << log_dir << "\n";
    return 0;
}
