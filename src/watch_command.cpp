#include "watch_command.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <thread>

#include "change_processor.hpp"
#include "diff_printer.hpp"
#include "directory_watcher.hpp"
#include "logger.hpp"

namespace fs = std::filesystem;

namespace {

std::atomic<bool>* g_running_ptr = nullptr;

void handle_signal(int) {
    if (g_running_ptr)
        g_running_ptr->store(false);
}

void setup_logging(const LoggingOptions& logging) {
    if (logging.log_file.empty())
        return;
    init_logger(logging.log_file, logging.log_level, logging.max_log_size, logging.max_log_files);
    set_json_logging(logging.json_log);
    set_log_compression(logging.compress_logs);
    if (logging.use_syslog)
        init_syslog(logging.syslog_facility);
}

} // namespace

int run_watch(const Options& opts, std::ostream& out, std::atomic<bool>& running) {
    std::error_code ec;
    if (!fs::exists(opts.path, ec)) {
        std::cerr << "Path does not exist: " << opts.path.string() << "\n";
        return 1;
    }
    if (!fs::is_directory(opts.path, ec)) {
        std::cerr << "Path is not a directory: " << opts.path.string() << "\n";
        return 1;
    }

    DirectoryWatcher watcher(opts.path, opts.recursive);
    ChangeProcessor processor(opts.max_file_size);
    const DiffColors colors = make_diff_colors(opts.no_colors);
    out << "Watching " << watcher.root().string() << (opts.recursive ? " (recursive)" : "")
        << "\n";
    out.flush();

    std::thread consumer([&] {
        processor.run(
            watcher,
            [&](const Event& ev, const ChangeOutcome& outcome) {
                std::string text = render_outcome(ev, outcome, colors, opts.max_lines);
                if (!text.empty()) {
                    out << text;
                    out.flush();
                }
            },
            [&](const WatchError& err) {
                out << colors.warning << "watch error: " << err.path << ": " << err.message
                    << colors.reset << "\n";
                out.flush();
            });
    });

    while (running.load())
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

    watcher.close();
    consumer.join();
    log_info("Watch stopped", {{"snapshots", std::to_string(processor.store().size())}});
    return 0;
}

int run_watch(const Options& opts) {
    setup_logging(opts.logging);
    std::atomic<bool> running{true};
    g_running_ptr = &running;
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    int rc = 0;
    try {
        rc = run_watch(opts, std::cout, running);
    } catch (const std::exception&) {
        g_running_ptr = nullptr;
        shutdown_logger();
        throw;
    }
    g_running_ptr = nullptr;
    shutdown_logger();
    return rc;
}
