#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <string>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

using LogFields = std::map<std::string, std::string>;

/**
 * @brief Open the log file and start the background writer.
 *
 * Messages logged before this call are discarded.
 *
 * @param path      Log file, opened for append.
 * @param level     Minimum severity written.
 * @param max_size  Rotate once the file exceeds this many bytes; `0` never
 *                  rotates.
 * @param max_files Rotated files kept next to the active one.
 */
void init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

void set_log_level(LogLevel level);

/// Write each entry as one JSON object per line.
void set_json_logging(bool enable);

/// gzip rotated files (`<log>.1.gz`, `<log>.2.gz`, ...).
void set_log_compression(bool enable);

void set_log_rotation(size_t max_files);

bool logger_initialized();

/**
 * @brief Parse a level name (`DEBUG`, `INFO`, `WARNING`/`WARN`, `ERROR`),
 *        case-insensitive.
 *
 * @return `false` if @p name is not a known level.
 */
bool parse_log_level(const std::string& name, LogLevel& level);

void log_event(LogLevel level, const std::string& message);
void log_event(LogLevel level, const std::string& message, const LogFields& fields);

void log_debug(const std::string& msg);
void log_debug(const std::string& msg, const LogFields& fields);
void log_info(const std::string& msg);
void log_info(const std::string& msg, const LogFields& fields);
void log_warning(const std::string& msg);
void log_warning(const std::string& msg, const LogFields& fields);
void log_error(const std::string& msg);
void log_error(const std::string& msg, const LogFields& fields);

/**
 * @brief Mirror every entry to syslog using @p facility.
 */
void init_syslog(int facility = 0);

/// Block until queued entries have been written.
void flush_logger();

/**
 * @brief Drain the queue, stop the writer and close the file.
 */
void shutdown_logger();

#endif // LOGGER_HPP
