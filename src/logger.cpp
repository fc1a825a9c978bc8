#include "logger.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>
#include <zlib.h>
#ifdef __linux__
#include <syslog.h>
#endif

#include "time_utils.hpp"

namespace fs = std::filesystem;

namespace {

struct LogMessage {
    LogLevel level;
    std::string msg;
    LogFields fields;
};

std::ofstream g_log_ofs;
std::string g_log_path; // NOLINT(runtime/string)
std::atomic<LogLevel> g_min_level{LogLevel::INFO};
std::atomic<size_t> g_max_size{0};
std::atomic<size_t> g_max_files{1};
std::atomic<bool> g_json_log{false};
std::atomic<bool> g_compress_logs{false};
std::atomic<bool> g_syslog{false};

std::deque<LogMessage> g_queue;
std::mutex g_queue_mtx;
std::condition_variable g_queue_cv;
std::condition_variable g_drained_cv;
bool g_running = false;
bool g_writing = false;
std::thread g_log_thread;
std::mutex g_init_mtx;

const char* level_label(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARNING";
    case LogLevel::ERR:
        return "ERROR";
    }
    return "INFO";
}

bool gzip_file(const std::string& src, const std::string& dst) {
    std::ifstream in(src, std::ios::binary);
    gzFile out = gzopen(dst.c_str(), "wb");
    if (!in.is_open() || out == nullptr) {
        if (out)
            gzclose(out);
        return false;
    }
    char buf[8192];
    bool ok = true;
    while (in) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n > 0 && gzwrite(out, buf, static_cast<unsigned int>(n)) == 0) {
            ok = false;
            break;
        }
    }
    return gzclose(out) == Z_OK && ok;
}

// Shift <log>.N to <log>.N+1, dropping the oldest, then move the active file
// to <log>.1 (gzipped when compression is on).
void rotate_files() {
    g_log_ofs.close();
    const size_t keep = g_max_files.load();
    const std::string suffix = g_compress_logs.load() ? ".gz" : "";
    std::error_code ec;
    if (keep > 0) {
        for (size_t i = keep; i > 0; --i) {
            fs::path src = g_log_path + "." + std::to_string(i) + suffix;
            if (i == keep)
                fs::remove(src, ec);
            else
                fs::rename(src, g_log_path + "." + std::to_string(i + 1) + suffix, ec);
        }
        fs::path first = g_log_path + ".1";
        fs::rename(g_log_path, first, ec);
        if (!suffix.empty() && gzip_file(first.string(), first.string() + suffix))
            fs::remove(first, ec);
    }
    g_log_ofs.open(g_log_path, std::ios::trunc);
}

std::string format_entry(const LogMessage& m) {
    const std::string ts = timestamp();
    if (g_json_log.load()) {
        nlohmann::json j;
        j["timestamp"] = ts;
        j["level"] = level_label(m.level);
        j["msg"] = m.msg;
        for (const auto& [k, v] : m.fields)
            j[k] = v;
        return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    std::string line = "[" + ts + "] [" + level_label(m.level) + "] " + m.msg;
    for (const auto& [k, v] : m.fields)
        line += " " + k + "=" + v;
    return line;
}

void write_entry(const LogMessage& m) {
    if (!g_log_ofs.is_open())
        return;
    std::string line = format_entry(m);
    g_log_ofs << line << '\n';
    if (g_max_size.load() > 0) {
        g_log_ofs.flush();
        std::error_code ec;
        auto size = fs::file_size(g_log_path, ec);
        if (!ec && size > g_max_size.load())
            rotate_files();
    }
#ifdef __linux__
    if (g_syslog.load()) {
        int pri = LOG_INFO;
        switch (m.level) {
        case LogLevel::DEBUG:
            pri = LOG_DEBUG;
            break;
        case LogLevel::INFO:
            pri = LOG_INFO;
            break;
        case LogLevel::WARNING:
            pri = LOG_WARNING;
            break;
        case LogLevel::ERR:
            pri = LOG_ERR;
            break;
        }
        syslog(pri, "%s", line.c_str());
    }
#endif
}

void log_worker() {
    std::vector<LogMessage> batch;
    batch.reserve(16);
    std::unique_lock<std::mutex> lk(g_queue_mtx);
    while (true) {
        g_queue_cv.wait(lk, [] { return !g_queue.empty() || !g_running; });
        if (g_queue.empty() && !g_running)
            break;
        while (!g_queue.empty() && batch.size() < 16) {
            batch.push_back(std::move(g_queue.front()));
            g_queue.pop_front();
        }
        g_writing = true;
        lk.unlock();
        for (const auto& m : batch)
            write_entry(m);
        batch.clear();
        g_log_ofs.flush();
        lk.lock();
        g_writing = false;
        g_drained_cv.notify_all();
    }
    g_drained_cv.notify_all();
}

void stop_log_thread() {
    {
        std::lock_guard<std::mutex> lk(g_queue_mtx);
        g_running = false;
    }
    g_queue_cv.notify_all();
    if (g_log_thread.joinable())
        g_log_thread.join();
}

void enqueue(LogLevel level, const std::string& msg, const LogFields& fields) {
    if (level < g_min_level.load())
        return;
    {
        std::lock_guard<std::mutex> lk(g_queue_mtx);
        if (!g_running)
            return;
        g_queue.push_back(LogMessage{level, msg, fields});
    }
    g_queue_cv.notify_one();
}

} // namespace

void init_logger(const std::string& path, LogLevel level, size_t max_size, size_t max_files) {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    const std::string prev_path = g_log_path;
    stop_log_thread();
    if (g_log_ofs.is_open())
        g_log_ofs.close();
    g_log_ofs.clear();
    g_max_size.store(max_size);
    g_max_files.store(max_files);
    std::string target = path;
    g_log_ofs.open(target, std::ios::app);
    if (!g_log_ofs.is_open()) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        target = prev_path;
        if (!target.empty())
            g_log_ofs.open(target, std::ios::app);
    }
    g_log_path = target;
    g_min_level.store(level);
    {
        std::lock_guard<std::mutex> qlk(g_queue_mtx);
        g_running = true;
    }
    g_log_thread = std::thread(log_worker);
}

#ifdef __linux__
void init_syslog(int facility) {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    openlog("diffwatch", LOG_PID | LOG_CONS, facility);
    g_syslog.store(true);
}
#else
void init_syslog(int) {}
#endif

void set_log_level(LogLevel level) { g_min_level.store(level); }

void set_json_logging(bool enable) { g_json_log.store(enable); }

void set_log_compression(bool enable) { g_compress_logs.store(enable); }

void set_log_rotation(size_t max_files) { g_max_files.store(max_files); }

bool logger_initialized() {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    return g_log_ofs.is_open();
}

bool parse_log_level(const std::string& name, LogLevel& level) {
    std::string val = name;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (val == "DEBUG")
        level = LogLevel::DEBUG;
    else if (val == "INFO")
        level = LogLevel::INFO;
    else if (val == "WARNING" || val == "WARN")
        level = LogLevel::WARNING;
    else if (val == "ERROR")
        level = LogLevel::ERR;
    else
        return false;
    return true;
}

void flush_logger() {
    std::unique_lock<std::mutex> lk(g_queue_mtx);
    g_drained_cv.wait(lk, [] { return (g_queue.empty() && !g_writing) || !g_running; });
}

void log_event(LogLevel level, const std::string& message) { enqueue(level, message, {}); }
void log_event(LogLevel level, const std::string& message, const LogFields& fields) {
    enqueue(level, message, fields);
}

void log_debug(const std::string& msg) { enqueue(LogLevel::DEBUG, msg, {}); }
void log_debug(const std::string& msg, const LogFields& fields) {
    enqueue(LogLevel::DEBUG, msg, fields);
}
void log_info(const std::string& msg) { enqueue(LogLevel::INFO, msg, {}); }
void log_info(const std::string& msg, const LogFields& fields) {
    enqueue(LogLevel::INFO, msg, fields);
}
void log_warning(const std::string& msg) { enqueue(LogLevel::WARNING, msg, {}); }
void log_warning(const std::string& msg, const LogFields& fields) {
    enqueue(LogLevel::WARNING, msg, fields);
}
void log_error(const std::string& msg) { enqueue(LogLevel::ERR, msg, {}); }
void log_error(const std::string& msg, const LogFields& fields) {
    enqueue(LogLevel::ERR, msg, fields);
}

void shutdown_logger() {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    stop_log_thread();
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
#ifdef __linux__
    if (g_syslog.load()) {
        closelog();
        g_syslog.store(false);
    }
#endif
    std::lock_guard<std::mutex> qlk(g_queue_mtx);
    g_queue.clear();
}
