#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <string>
#include <map>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/**
 * @brief Start the asynchronous logger.
 *
 * Opens the log file at @p path for append and starts the writer thread.
 * An empty @p path runs the logger without a file sink, so only the console
 * and syslog mirrors receive messages.
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
 * @brief Parse a level name (`debug`, `info`, `warning`/`warn`, `error`).
 *
 * Matching is case-insensitive.
 *
 * @return `false` if @p name is not a known level; @p out is left untouched.
 */
bool parse_log_level(const std::string& name, LogLevel& out);

/**
 * @brief Enable or disable JSON formatted logging.
 *
 * @param enable Set to `true` to emit logs as JSON objects instead of plain
 *               text.
 */
void set_json_logging(bool enable);

/** Gzip rotated log files when enabled. */
void set_log_compression(bool enable);

/**
 * @brief Configure how many rotated log files are retained.
 */
void set_log_rotation(size_t max_files);

/**
 * @brief Mirror warnings and errors to stderr.
 *
 * Enabled by default.
 */
void set_console_logging(bool enable);

/**
 * @brief Check whether the logger writer is running.
 */
bool logger_initialized();

/**
 * @brief Block until every queued message has been written.
 */
void flush_logger();

/**
 * @brief Log a message with the specified severity.
 */
void log_event(LogLevel level, const std::string& message);

/**
 * @brief Log a message with structured key/value fields.
 *
 * @param level   Severity level for the event.
 * @param message Human-readable text describing the event.
 * @param fields  Map of field names to values providing structured context.
 */
void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields);

void log_debug(const std::string& msg);
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_info(const std::string& msg);
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_warning(const std::string& msg);
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_error(const std::string& msg);
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields);

/**
 * @brief Mirror every written entry to syslog.
 *
 * @param facility Syslog facility identifier to tag messages with.
 */
void init_syslog(int facility = 0);

/**
 * @brief Drain the queue, stop the writer and close every sink.
 */
void shutdown_logger();

#endif // LOGGER_HPP
