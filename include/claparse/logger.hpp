#ifndef CLAPARSE_LOGGER_HPP
#define CLAPARSE_LOGGER_HPP
#include <cstddef>
#include <map>
#include <string>

namespace claparse {

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path for appending and configures rotation.
 * Until this is called every logging function is a no-op, so the parser
 * stays silent in programs that never set up logging.
 *
 * @param path      Filesystem path where the log file will be written.
 * @param level     Minimum @ref LogLevel severity to record.
 * @param max_size  Maximum size in bytes before rotating the file. A value of
 *                  `0` disables size-based rotation.
 * @param max_files Number of rotated log files to keep.
 * @return `true` if the file could be opened.
 */
bool init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

/** @brief Set the global minimum log level. */
void set_log_level(LogLevel level);

/** @return Current minimum log level. */
LogLevel log_level();

/**
 * @brief Enable or disable JSON formatted logging.
 *
 * @param enable Set to `true` to emit one JSON object per line instead of
 *               plain text.
 */
void set_json_logging(bool enable);

/** @brief Gzip rotated log files (`<file>.1.gz`, ...) when enabled. */
void set_log_compression(bool enable);

/** @brief Configure how many rotated log files are retained. */
void set_log_rotation(size_t max_files);

/** @return `true` if the logger has an open log file. */
bool logger_initialized();

/**
 * @brief Convert a level name (`DEBUG`, `INFO`, `WARNING`/`WARN`, `ERROR`)
 * to a @ref LogLevel, ignoring case.
 *
 * @return `false` if @p name is not a known level.
 */
bool parse_log_level(const std::string& name, LogLevel& level);

/**
 * @brief Log a message with the specified severity.
 *
 * @param level   Severity level for the event.
 * @param message Human-readable text describing the event.
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

/** @brief Flush and close the log file. */
void shutdown_logger();

} // namespace claparse

#endif // CLAPARSE_LOGGER_HPP
