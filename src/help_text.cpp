#include "help_text.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <map>
#include <string>
#include <vector>

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

namespace {

std::string flag_column(const OptionInfo& o) {
    std::string flag = "  ";
    if (std::strlen(o.short_flag))
        flag += std::string(o.short_flag) + ", ";
    else
        flag += "    ";
    flag += o.long_flag;
    if (std::strlen(o.arg))
        flag += " " + std::string(o.arg);
    return flag;
}

} // namespace

void print_help(const char* prog, std::ostream& os) {
    static const std::vector<OptionInfo> opts = {
        {"--path", "-p", "<dir>", "Directory to watch (default: current directory)", "Basics"},
        {"--recursive", "-r", "", "Watch subdirectories, including new ones", "Basics"},
        {"--max-file-size", "", "<bytes>", "Skip diffs of larger files (default 1MB)", "Display"},
        {"--max-lines", "", "<n>", "Print at most n diff lines per change (0 = all)", "Display"},
        {"--no-colors", "", "", "Disable ANSI colors", "Display"},
        {"--config-yaml", "-y", "<file>", "Load options from YAML file", "Config"},
        {"--config-json", "-j", "<file>", "Load options from JSON file", "Config"},
        {"--log-file", "", "<file>", "Write log entries to file", "Logging"},
        {"--log-level", "", "<level>", "DEBUG, INFO, WARNING or ERROR", "Logging"},
        {"--json-log", "", "", "Write log entries as JSON lines", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate the log file at this size", "Logging"},
        {"--max-log-files", "", "<n>", "Rotated log files to keep (default 1)", "Logging"},
        {"--compress-logs", "", "", "gzip rotated log files", "Logging"},
        {"--syslog", "", "", "Mirror log entries to syslog", "Logging"},
        {"--syslog-facility", "", "<n>", "Syslog facility code", "Logging"},
        {"--version", "-v", "", "Show program version", "Basics"},
        {"--help", "-h", "", "Show this message", "Basics"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        width = std::max(width, flag_column(o).size());
    }

    os << "diffwatch - Live file change diffs\n";
    os << "Watches a directory and prints a line diff for every file that changes.\n";
    os << "Configuration can be read from YAML or JSON files.\n\n";
    os << "Usage: " << prog << " [<dir>] [options]\n";
    os << "       " << prog << " --path <dir> [options]\n\n";
    const std::vector<std::string> order{"Basics", "Display", "Config", "Logging"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        os << cat << ":\n";
        for (const auto* o : groups[cat]) {
            os << std::left << std::setw(static_cast<int>(width) + 2) << flag_column(*o)
               << o->desc << "\n";
        }
        os << "\n";
    }
}
