#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "logger.hpp"

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    size_t max_log_size = 0;
    size_t max_log_files = 1;
    bool json_log = false;
    bool compress_logs = false;
    bool use_syslog = false;
    int syslog_facility = 0;
};

struct Options {
    std::filesystem::path path = ".";
    bool recursive = false;
    std::uintmax_t max_file_size = 1024 * 1024;
    size_t max_lines = 0;
    bool no_colors = false;
    bool show_help = false;
    bool print_version = false;
    std::filesystem::path config_file;
    LoggingOptions logging;
};

/**
 * @brief Parse command line arguments into an Options structure.
 *
 * Values from a configuration file given with `--config-yaml` or
 * `--config-json` act as defaults and are overridden by the command line.
 *
 * @param argc Argument count from `main`.
 * @param argv Argument vector from `main`.
 * @return Populated Options instance.
 * @throws std::runtime_error on unknown options, unknown configuration keys,
 *         missing values or malformed values.
 */
Options parse_options(int argc, char* argv[]);

#endif // OPTIONS_HPP
