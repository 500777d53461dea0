#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <string>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/**
 * @brief Initialize the asynchronous file logger.
 *
 * Opens the log file at @p path and starts the writer thread. Messages logged
 * before this call, or after @ref shutdown_logger, are discarded.
 *
 * @param path      Filesystem path where the log file will be written.
 * @param level     Minimum @ref LogLevel severity to record.
 * @param max_size  Maximum size in bytes before rotating the file. A value of
 *                  `0` disables size-based rotation.
 * @param max_files Number of rotated log files to keep.
 */
void init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

/**
 * @brief Set the global minimum log level.
 */
void set_log_level(LogLevel level);

/**
 * @brief Parse a level name such as `debug`, `INFO`, `warn` or `error`.
 *
 * @param name  Case-insensitive level name.
 * @param level Receives the parsed level on success.
 * @return `false` if @p name is not a known level.
 */
bool parse_log_level(const std::string& name, LogLevel& level);

/**
 * @brief Return the upper-case label used in log lines for @p level.
 */
const char* log_level_label(LogLevel level);

/**
 * @brief Enable or disable JSON formatted logging.
 *
 * @param enable Set to `true` to emit one JSON object per line.
 */
void set_json_logging(bool enable);

/// Gzip rotated files when enabled.
void set_log_compression(bool enable);

/**
 * @brief Configure how many rotated log files are retained.
 */
void set_log_rotation(size_t max_files);

/**
 * @brief Mirror formatted lines at or above @p level to standard error.
 *
 * Works with or without a log file.
 */
void set_console_logging(bool enable, LogLevel level = LogLevel::WARNING);

/**
 * @brief Check whether the logger has been initialized.
 */
bool logger_initialized();

/**
 * @brief Block until every queued message has been written.
 */
void flush_logger();

/**
 * @brief Log a message with structured key/value fields.
 *
 * @param level   Severity level for the event.
 * @param message Human-readable text describing the event.
 * @param fields  Map of field names to values providing structured context.
 */
void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields = {});

void log_debug(const std::string& msg);
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_info(const std::string& msg);
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_warning(const std::string& msg);
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_error(const std::string& msg);
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields);

/**
 * @brief Initialize system logging using the specified facility.
 *
 * Only effective on Linux; a no-op elsewhere.
 *
 * @param facility Syslog facility identifier to tag messages with.
 */
void init_syslog(int facility = 0);

/**
 * @brief Drain the queue, stop the writer thread and close all sinks.
 */
void shutdown_logger();

#endif // LOGGER_HPP
