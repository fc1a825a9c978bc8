#include <cstdint>
#include <map>
#include <set>
#include <stdexcept>
#include <string>

#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

namespace fs = std::filesystem;

namespace {

const std::set<std::string>& known_options() {
    static const std::set<std::string> known{
        "--path",          "--recursive",      "--config-yaml", "--config-json",
        "--log-file",      "--log-level",      "--json-log",    "--max-log-size",
        "--max-log-files", "--compress-logs",  "--syslog",      "--syslog-facility",
        "--max-file-size", "--max-lines",      "--no-colors",   "--help",
        "--version"};
    return known;
}

const std::set<std::string>& value_options() {
    static const std::set<std::string> values{
        "--path",         "--config-yaml",   "--config-json",     "--log-file",
        "--log-level",    "--max-log-size",  "--max-log-files",   "--syslog-facility",
        "--max-file-size", "--max-lines"};
    return values;
}

void load_config(const ArgParser& parser, std::map<std::string, std::string>& cfg_opts,
                 fs::path& config_file) {
    if (parser.has_flag("--config-yaml")) {
        std::string cfg = parser.get_option("--config-yaml");
        if (cfg.empty())
            throw std::runtime_error("--config-yaml requires a file");
        std::string err;
        if (!load_yaml_config(cfg, cfg_opts, err))
            throw std::runtime_error("Failed to load config: " + err);
        config_file = cfg;
    }
    if (parser.has_flag("--config-json")) {
        std::string cfg = parser.get_option("--config-json");
        if (cfg.empty())
            throw std::runtime_error("--config-json requires a file");
        std::string err;
        if (!load_json_config(cfg, cfg_opts, err))
            throw std::runtime_error("Failed to load config: " + err);
        config_file = cfg;
    }
    for (const auto& kv : cfg_opts) {
        if (!known_options().count(kv.first) || kv.first == "--config-yaml" ||
            kv.first == "--config-json")
            throw std::runtime_error("Unknown option in config: " + kv.first.substr(2));
    }
}

} // namespace

Options parse_options(int argc, char* argv[]) {
    const std::map<char, std::string> short_opts{{'p', "--path"},        {'r', "--recursive"},
                                                 {'y', "--config-yaml"}, {'j', "--config-json"},
                                                 {'h', "--help"},        {'v', "--version"}};
    ArgParser parser(argc, argv, known_options(), short_opts, value_options());
    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());
    if (!parser.missing_values().empty())
        throw std::runtime_error(parser.missing_values().front() + " requires a value");

    Options opts;
    std::map<std::string, std::string> cfg_opts;
    load_config(parser, cfg_opts, opts.config_file);

    auto cfg_flag = [&](const std::string& k) {
        auto it = cfg_opts.find(k);
        if (it == cfg_opts.end())
            return false;
        bool ok = false;
        bool v = parse_bool(it->second, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for " + k + ": " + it->second);
        return v;
    };
    // Command line value first, then the config file, then empty.
    auto opt_value = [&](const std::string& k) {
        if (parser.has_flag(k))
            return parser.get_option(k);
        auto it = cfg_opts.find(k);
        if (it != cfg_opts.end())
            return it->second;
        return std::string();
    };
    auto has_value = [&](const std::string& k) {
        return parser.has_flag(k) || cfg_opts.count(k) > 0;
    };
    auto flag = [&](const std::string& k) { return parser.has_flag(k) || cfg_flag(k); };

    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");
    opts.recursive = flag("--recursive");
    opts.no_colors = flag("--no-colors");

    if (parser.has_flag("--path") && !parser.positional().empty())
        throw std::runtime_error("Path given both as --path and as an argument");
    if (parser.positional().size() > 1)
        throw std::runtime_error("Unexpected argument: " + parser.positional()[1]);
    if (!parser.positional().empty())
        opts.path = parser.positional().front();
    else if (has_value("--path"))
        opts.path = opt_value("--path");
    if (opts.path.empty())
        throw std::runtime_error("--path requires a value");

    bool ok = false;
    if (has_value("--max-file-size")) {
        std::string val = opt_value("--max-file-size");
        opts.max_file_size = parse_bytes(val, 1, SIZE_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-file-size: " + val);
    }
    if (has_value("--max-lines")) {
        std::string val = opt_value("--max-lines");
        opts.max_lines = parse_size_t(val, 0, SIZE_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-lines: " + val);
    }

    LoggingOptions& logging = opts.logging;
    logging.log_file = opt_value("--log-file");
    logging.json_log = flag("--json-log");
    logging.compress_logs = flag("--compress-logs");
    logging.use_syslog = flag("--syslog");
    if (has_value("--log-level")) {
        std::string val = opt_value("--log-level");
        if (!parse_log_level(val, logging.log_level))
            throw std::runtime_error("Invalid log level: " + val);
    }
    if (has_value("--max-log-size")) {
        std::string val = opt_value("--max-log-size");
        logging.max_log_size = parse_bytes(val, 0, SIZE_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-size: " + val);
    }
    if (has_value("--max-log-files")) {
        std::string val = opt_value("--max-log-files");
        logging.max_log_files = parse_size_t(val, 1, 100, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-files: " + val);
    }
    if (has_value("--syslog-facility")) {
        std::string val = opt_value("--syslog-facility");
        logging.syslog_facility = static_cast<int>(parse_size_t(val, 0, 1024, ok));
        if (!ok)
            throw std::runtime_error("Invalid value for --syslog-facility: " + val);
    }
    return opts;
}
