/**
 * @file usage_sample.cpp
 * @brief Examples of the console, file, mail and syslog loggers
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <strings.h>
#include <unistd.h>

#include "sinkwright/log.hpp"

using namespace sinkwright;
namespace fs = std::filesystem;

namespace
{

struct sample_options
{
    std::string level = "info";
    std::string time_zone = "local";
    std::string log_file = "logs/logfile.log";
    std::string mail_config;
    std::string syslog_address;
    int syslog_port = DEFAULT_SYSLOG_PORT;
    bool combined = false;
};

void print_usage(const char *prog_name)
{
    std::cerr << "sinkwright " << sinkwright::VERSION << " usage sample\n"
              << "Usage: " << prog_name << " [options]\n"
              << "Options:\n"
              << "  -debug|-info|-warning|-warn|-error|-critical|-crit\n"
              << "                    Log level of the sample loggers (default: info)\n"
              << "  -utc              Timestamps in UTC instead of local time\n"
              << "  -f <file>         Log file (default: logs/logfile.log)\n"
              << "  -both             Also log to console and file through one logger\n"
              << "  -smtp <json>      Send a test mail with settings from a JSON file\n"
              << "  -syslog <addr>    Send a test record to a syslog collector\n"
              << "  -port <n>         Syslog collector port (default: 1514)\n"
              << "  -h                Show this help\n";
}

// Level flags are accepted in lower and upper case, like -debug and -DEBUG
const char *level_from_flag(const char *arg)
{
    static const char *const flags[][2] = {
        {"-debug", "DEBUG"},
        {"-info", "INFO"},
        {"-warning", "WARNING"},
        {"-warn", "WARNING"},
        {"-error", "ERROR"},
        {"-critical", "CRITICAL"},
        {"-crit", "CRITICAL"},
    };

    for (const auto &flag : flags)
    {
        if (strcasecmp(arg, flag[0]) == 0) return flag[1];
    }
    return nullptr;
}

void console_test(logger_registry &registry, const sample_options &options)
{
    auto &console_1 = create_console_logger(registry, "console_logger_1");
    console_1.debug("debug message");
    console_1.info("info message");
    console_1.warning("warn message");
    console_1.error("error message");
    console_1.critical("critical message");

    std::cout << std::endl;

    // Console output with the selected level
    auto &console_2 = create_console_logger(registry, "console_logger_2", options.level, options.time_zone);
    console_2.debug("debug message");
    console_2.info("info message");
    console_2.warning("warn message");
    console_2.error("error message");
    console_2.critical("critical message");

    std::cout << std::endl;

    auto &console_3 = create_console_logger(registry, "console_logger_3", "DEBUG", options.time_zone);
    SINKWRIGHT_LOG(console_3, debug) << "debug message";
    SINKWRIGHT_LOG(console_3, info) << "info message";
    SINKWRIGHT_LOG(console_3, warning) << "warn message";
    SINKWRIGHT_LOG(console_3, error) << "error message";
    SINKWRIGHT_LOG(console_3, critical) << "critical message";
}

void file_test(logger_registry &registry, const sample_options &options)
{
    auto &file_logger = create_file_logger(registry, "file_logger", options.log_file, options.level, options.time_zone);

    std::cout << "Logging to " << options.log_file << std::endl;
    file_logger.debug("debug message");
    file_logger.info("info message");
    file_logger.warning("warn message");
    file_logger.error("error message");
    file_logger.critical("critical message");
}

void console_and_file_test(logger_registry &registry, const sample_options &options)
{
    create_console_logger(registry, "console_logger");
    auto &combined = create_file_logger(registry, "console_logger", options.log_file, options.level, options.time_zone);

    combined.debug("debug message");
    combined.info("info message");
    combined.warning("warn message");
    combined.error("error message");
    combined.critical("critical message");
}

void smtp_test(logger_registry &registry, const sample_options &options)
{
    mail_config config;
    try
    {
        config = load_mail_config(read_config_file(options.mail_config), registry.diagnostics());
    }
    catch (const std::exception &e)
    {
        std::cerr << "Cannot read mail settings from " << options.mail_config << ": " << e.what() << "\n";
        return;
    }
    config.subject   = "test";
    config.time_zone = options.time_zone;

    auto [mail_logger, mail_sink] = create_smtp_logger(registry, config);
    mail_logger.info("test message");

    try
    {
        mail_sink->flush();
        mail_sink->close();
    }
    catch (const mail_error &e)
    {
        std::cerr << "Sending the test mail failed: " << e.what() << "\n";
    }
}

void syslog_test(logger_registry &registry, const sample_options &options)
{
    auto &sys_logger =
        create_syslog_logger(registry, SYSLOG_LOGGER_NAME, options.level, options.time_zone, options.syslog_address, options.syslog_port);

    sys_logger.log(log_level::error,
                   "Message",
                   {
                       {"user1@host1", {{"key1", "value1"}, {"key2", "value2"}}},
                       {"some@thing", {{"key3", "value3"}, {"key4", "value4"}}},
                   });
}

} // namespace

int main(int argc, char *argv[])
{
    sample_options options;

    for (int i = 1; i < argc; i++)
    {
        if (const char *level = level_from_flag(argv[i])) { options.level = level; }
        else if (strcasecmp(argv[i], "-utc") == 0) { options.time_zone = "utc"; }
        else if (strcmp(argv[i], "-f") == 0 && i + 1 < argc) { options.log_file = argv[++i]; }
        else if (strcmp(argv[i], "-both") == 0) { options.combined = true; }
        else if (strcmp(argv[i], "-smtp") == 0 && i + 1 < argc) { options.mail_config = argv[++i]; }
        else if (strcmp(argv[i], "-syslog") == 0 && i + 1 < argc) { options.syslog_address = argv[++i]; }
        else if (strcmp(argv[i], "-port") == 0 && i + 1 < argc) { options.syslog_port = std::atoi(argv[++i]); }
        else if (strcmp(argv[i], "-h") == 0)
        {
            print_usage(argv[0]);
            return 0;
        }
        else
        {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    fs::path log_dir = fs::path(options.log_file).parent_path();
    std::error_code ec;
    if (!log_dir.empty() && !fs::create_directories(log_dir, ec) && ec)
    {
        std::cerr << "Cannot create " << log_dir << ": " << ec.message() << "\n";
    }

    logger_registry registry;

    file_test(registry, options);
    if (::isatty(STDIN_FILENO)) { console_test(registry, options); }
    if (options.combined) { console_and_file_test(registry, options); }
    if (!options.mail_config.empty()) { smtp_test(registry, options); }
    if (!options.syslog_address.empty()) { syslog_test(registry, options); }

    return 0;
}
