#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <string>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/**
 * @brief Open the log file sink.
 *
 * Entries are appended to @p path. When @p max_size is non-zero the file is
 * rotated to `path.1` ... `path.N` once it grows past that many bytes.
 *
 * @param path      Log file location.
 * @param level     Minimum @ref LogLevel to record.
 * @param max_size  Rotation threshold in bytes, `0` disables rotation.
 * @param max_files Number of rotated files kept.
 * @return `true` if the file could be opened.
 */
bool init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

/** @brief Set the global minimum log level. */
void set_log_level(LogLevel level);

/** @brief Current minimum log level. */
LogLevel log_level();

/**
 * @brief Emit entries as JSON objects instead of plain text.
 */
void set_json_logging(bool enable);

/**
 * @brief Mirror entries to stderr.
 *
 * Console output is independent of the file sink and enabled by default.
 */
void set_console_logging(bool enable);

/** @brief Whether entries are mirrored to stderr. */
bool console_logging();

/** @brief Whether a file sink is open. */
bool logger_initialized();

/**
 * @brief Parse a level name (DEBUG, INFO, WARNING/WARN, ERROR/ERR).
 *
 * Matching is case-insensitive.
 *
 * @param name  Level name.
 * @param level Receives the parsed level.
 * @return `false` for unknown names.
 */
bool parse_log_level(const std::string& name, LogLevel& level);

/**
 * @brief Log a message with the specified severity.
 */
void log_event(LogLevel level, const std::string& message);

/**
 * @brief Log a message with structured key/value fields.
 *
 * Fields are appended as `key=value` pairs in text mode and as extra
 * members in JSON mode.
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

/** @brief Flush and close the file sink. */
void shutdown_logger();

#endif // LOGGER_HPP
