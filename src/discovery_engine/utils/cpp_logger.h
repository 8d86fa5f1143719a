/**
 * @file cpp_logger.h
 * @brief Defines the logging framework for the C++ discovery engine.
 * @details This file provides a simple, thread-safe logging mechanism that queues log
 *          messages from C++ and allows them to be retrieved by a Python layer or by
 *          a command-line tool. It includes log levels, a log entry structure, and
 *          macros for easy logging. Python bindings live in `cpp_logger_bindings.h`.
 */
#ifndef AUDYN_DISCOVERY_CPP_LOGGER_H
#define AUDYN_DISCOVERY_CPP_LOGGER_H

#include <atomic>
#include <string>
#include <vector>

namespace audyn {
namespace discovery {
namespace logging {

/**
 * @enum LogLevel
 * @brief Defines the severity levels for log messages.
 */
enum class LogLevel {
    DEBUG,   ///< Detailed information, typically of interest only when diagnosing problems.
    INFO,    ///< Confirmation that things are working as expected.
    WARNING, ///< An indication that something unexpected happened, or a potential problem.
    ERR      ///< A serious problem, preventing the program from performing a function.
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
 * @brief Retrieves currently buffered log entries.
 * @details Blocks until messages are available, shutdown is requested or the timeout
 *          expires, then returns up to 100 entries and removes them from the queue.
 * @param timeout_ms The maximum time to wait in milliseconds.
 * @return A vector of `LogEntry` objects.
 */
std::vector<LogEntry> retrieve_log_entries(int timeout_ms = 100);

/**
 * @brief Signals the C++ logger to prepare for shutdown.
 * @details This will unblock any threads waiting on `retrieve_log_entries`.
 */
void shutdown_cpp_logger();

/**
 * @brief Sets the global C++ log level.
 * @param level The new log level to set. Messages below this level will be ignored.
 */
void set_cpp_log_level(LogLevel level);

/** @brief Returns the short upper-case name of a log level ("DEBUG", "INFO", ...). */
const char* log_level_name(LogLevel level);

/**
 * @brief Dispatches a log message to the internal C++ queue.
 * @details This function handles printf-style formatting and captures file/line info.
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
} // namespace discovery
} // namespace audyn

/**
 * @def LOG_CPP_BASE
 * @brief A base macro for logging. Not intended for direct use.
 */
#define LOG_CPP_BASE(level, fmt, ...) \
    audyn::discovery::logging::log_message( \
        level, \
        audyn::discovery::logging::get_base_filename(__FILE__), \
        __LINE__, \
        fmt, \
        ##__VA_ARGS__)

/** @def LOG_CPP_DEBUG(fmt, ...) @brief Logs a message at the DEBUG level. */
#define LOG_CPP_DEBUG(fmt, ...)   LOG_CPP_BASE(audyn::discovery::logging::LogLevel::DEBUG, fmt, ##__VA_ARGS__)
/** @def LOG_CPP_INFO(fmt, ...) @brief Logs a message at the INFO level. */
#define LOG_CPP_INFO(fmt, ...)    LOG_CPP_BASE(audyn::discovery::logging::LogLevel::INFO, fmt, ##__VA_ARGS__)
/** @def LOG_CPP_WARNING(fmt, ...) @brief Logs a message at the WARNING level. */
#define LOG_CPP_WARNING(fmt, ...) LOG_CPP_BASE(audyn::discovery::logging::LogLevel::WARNING, fmt, ##__VA_ARGS__)
/** @def LOG_CPP_ERROR(fmt, ...) @brief Logs a message at the ERROR level. */
#define LOG_CPP_ERROR(fmt, ...)   LOG_CPP_BASE(audyn::discovery::logging::LogLevel::ERR, fmt, ##__VA_ARGS__)

#endif // AUDYN_DISCOVERY_CPP_LOGGER_H
