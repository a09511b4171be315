/**
 * @file cpp_logger.h
 * @brief Defines the logging framework used throughout the device engine.
 * @details Log messages produced by C++ components are pushed into a bounded, thread-safe
 *          queue from which a host layer (Python bindings, tests) can drain them. Entries can
 *          optionally be mirrored to stderr as they are produced.
 */
#ifndef CAPTUREHUB_CPP_LOGGER_H
#define CAPTUREHUB_CPP_LOGGER_H

#include <string>
#include <vector>
#include <atomic>

namespace capturehub {
namespace devices {
namespace logging {

/**
 * @enum LogLevel
 * @brief Defines the severity levels for log messages.
 */
enum class LogLevel {
    DEBUG,   ///< Detailed information, typically of interest only when diagnosing problems.
    INFO,    ///< Confirmation that things are working as expected.
    WARNING, ///< Something unexpected happened but the component keeps running.
    ERR      ///< A serious problem, preventing a component from performing a function.
};

/** @brief Global atomic variable to hold the current log level. */
extern std::atomic<LogLevel> current_log_level;

/**
 * @struct LogEntry
 * @brief Represents a single log message.
 */
struct LogEntry {
    LogLevel level;         ///< The severity level of the log message.
    std::string message;    ///< The log message content.
    std::string filename;   ///< The source file where the log was generated.
    int line_number;        ///< The line number in the source file.
};

/**
 * @brief Retrieves buffered log entries.
 * @details Blocks until entries are available, the timeout expires, or the logger is shut
 *          down. At most 100 entries are returned per call.
 * @param timeout_ms The maximum time to wait in milliseconds.
 * @return A vector of `LogEntry` objects.
 */
std::vector<LogEntry> retrieve_log_entries(int timeout_ms = 100);

/**
 * @brief Signals the logger to prepare for shutdown.
 * @details This will unblock any threads waiting on `retrieve_log_entries`.
 */
void shutdown_cpp_logger();

/**
 * @brief Sets the global log level.
 * @param level Messages below this level are discarded.
 */
void set_cpp_log_level(LogLevel level);

/**
 * @brief Enables or disables mirroring of every accepted entry to stderr.
 */
void set_cpp_log_stderr_mirror(bool enabled);

/**
 * @brief Parses a level name (DEBUG, INFO, WARNING, ERROR, case-insensitive).
 * @return true if `name` was recognized and `out` was written.
 */
bool parse_log_level(const std::string& name, LogLevel& out);

/**
 * @brief Formats a printf-style message and queues it.
 * @param level The log level.
 * @param file The source file name (`__FILE__`).
 * @param line The source line number (`__LINE__`).
 * @param format The printf-style format string.
 * @param ... Arguments for the format string.
 */
void log_message(LogLevel level, const char* file, int line, const char* format, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 4, 5)))
#endif
    ;

/**
 * @brief Helper function to extract the base filename from a full path.
 * @param path The full path to the file.
 * @return A pointer to the base filename within the path string.
 */
const char* get_base_filename(const char* path);

} // namespace logging
} // namespace devices
} // namespace capturehub

/**
 * @def LOG_CPP_BASE
 * @brief A base macro for logging. Not intended for direct use.
 */
#define LOG_CPP_BASE(level, fmt, ...) \
    do { \
        if (static_cast<int>(level) >= static_cast<int>(capturehub::devices::logging::current_log_level.load())) { \
            capturehub::devices::logging::log_message( \
                level, \
                capturehub::devices::logging::get_base_filename(__FILE__), \
                __LINE__, \
                fmt, \
                ##__VA_ARGS__); \
        } \
    } while (0)

/** @def LOG_CPP_DEBUG(fmt, ...) @brief Logs a message at the DEBUG level. */
#define LOG_CPP_DEBUG(fmt, ...)   LOG_CPP_BASE(capturehub::devices::logging::LogLevel::DEBUG, fmt, ##__VA_ARGS__)
/** @def LOG_CPP_INFO(fmt, ...) @brief Logs a message at the INFO level. */
#define LOG_CPP_INFO(fmt, ...)    LOG_CPP_BASE(capturehub::devices::logging::LogLevel::INFO, fmt, ##__VA_ARGS__)
/** @def LOG_CPP_WARNING(fmt, ...) @brief Logs a message at the WARNING level. */
#define LOG_CPP_WARNING(fmt, ...) LOG_CPP_BASE(capturehub::devices::logging::LogLevel::WARNING, fmt, ##__VA_ARGS__)
/** @def LOG_CPP_ERROR(fmt, ...) @brief Logs a message at the ERROR level. */
#define LOG_CPP_ERROR(fmt, ...)   LOG_CPP_BASE(capturehub::devices::logging::LogLevel::ERR, fmt, ##__VA_ARGS__)

#endif // CAPTUREHUB_CPP_LOGGER_H
