/**
 * @file logging.hpp
 * @brief Thread-safe logging system for strata
 *
 * Severity-levelled logger with colored console output and an optional log
 * file. Formatting goes through std::format so format strings are checked
 * at compile time.
 *
 * Design decisions:
 * - Thread-safe logging with mutex (the ECS itself is single-threaded,
 *   but host applications usually are not)
 * - Colored console output (ANSI escape codes), switchable for tests
 * - Optional file sink (plain text, with source file and line)
 * - Level filtering happens before formatting
 *
 * @date 2025-11-02
 * @version 1.0
 *
 * @note Uses C++23 features (std::format, std::source_location)
 */

#pragma once

#include <strata/core/types.hpp>

#include <format>
#include <source_location>
#include <string_view>

namespace strata {

// ============================================================================
// Log Level Enumeration
// ============================================================================

/**
 * @enum LogLevel
 * @brief Severity levels for log messages
 *
 * Ordered from least to most severe. Messages are only logged if their
 * level is >= the current minimum log level.
 */
enum class LogLevel : u8 {
    TRACE = 0,  ///< Trace: very detailed debug information
    DEBUG = 1,  ///< Debug: archetype creation, command replay details
    INFO = 2,   ///< Info: snapshot/restore summaries
    WARN = 3,   ///< Warning: something unexpected but recoverable
    ERROR = 4,  ///< Error: operation failed but program continues
    FATAL = 5   ///< Fatal: critical error
};

/**
 * @brief Converts log level to string
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param level Log level
 * @return String representation of level
 */
[[nodiscard]] constexpr auto to_string(LogLevel level) noexcept -> std::string_view {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
    }
    return "UNKNOWN";
}

/**
 * @brief Parses a log level name (case-sensitive, upper or lower case)
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param name Level name ("info", "WARN", ...)
 * @return Parsed level or CONFIG_INVALID_VALUE
 */
[[nodiscard]] auto parse_log_level(std::string_view name) -> Result<LogLevel>;

// ============================================================================
// Logger Class (singleton with thread-safe access)
// ============================================================================

/**
 * @class Logger
 * @brief Thread-safe logging system
 *
 * Provides logging to console and file with colored output, timestamps
 * and source location information.
 *
 * ⚠️ IMPURE CLASS (has side effects)
 *
 * Side effects:
 * - Writes to console (stdout/stderr)
 * - Writes to log file when one is open
 * - Modifies global state (log level, file handle)
 *
 * @note Singleton pattern used for global access
 * @note Thread-safe: all public methods use mutex
 */
class Logger {
public:
    /**
     * @brief Gets singleton instance
     *
     * ⚠️ IMPURE FUNCTION (returns reference to global state)
     *
     * @return Reference to logger instance
     */
    static auto instance() -> Logger&;

    /**
     * @brief Opens a log file next to console output
     *
     * ⚠️ IMPURE FUNCTION (file I/O)
     *
     * Creates missing parent directories. Calling it again while a file is
     * open is a no-op.
     *
     * @param log_file_path Path to log file (default: "logs/strata.log")
     * @return Result indicating success or CORE_FILE_IO_ERROR
     */
    auto initialize(std::string_view log_file_path = "logs/strata.log") -> Result<void>;

    /**
     * @brief Closes the log file
     *
     * ⚠️ IMPURE FUNCTION (file I/O)
     */
    auto shutdown() -> void;

    /**
     * @brief Sets minimum log level
     *
     * ⚠️ IMPURE FUNCTION (modifies global state)
     *
     * @param level Minimum log level (messages below this are ignored)
     */
    auto set_level(LogLevel level) -> void;

    /**
     * @brief Gets current minimum log level
     *
     * @return Current log level
     */
    [[nodiscard]] auto get_level() const -> LogLevel;

    /**
     * @brief Enables or disables ANSI colors on console output
     *
     * @param enabled true to color console lines
     */
    auto set_colors_enabled(bool enabled) -> void;

    /**
     * @brief Checks whether a message at this level would be written
     *
     * @param level Level to test
     * @return true if level >= minimum level
     */
    [[nodiscard]] auto is_enabled(LogLevel level) const -> bool;

    /**
     * @brief Logs a message with format string
     *
     * ⚠️ IMPURE FUNCTION (I/O operations)
     *
     * @tparam Args Format argument types
     * @param level Log level
     * @param location Source location (automatic via std::source_location)
     * @param format Format string (std::format compatible)
     * @param args Format arguments
     */
    template<typename... Args>
    auto log(LogLevel level,
             const std::source_location& location,
             std::format_string<Args...> format,
             Args&&... args) -> void {
        if (!is_enabled(level)) {
            return;
        }
        const auto message = std::format(format, std::forward<Args>(args)...);
        log_impl(level, location, message);
    }

    // Delete copy and move (singleton)
    Logger(const Logger&) = delete;
    auto operator=(const Logger&) -> Logger& = delete;
    Logger(Logger&&) = delete;
    auto operator=(Logger&&) -> Logger& = delete;

private:
    Logger();
    ~Logger();

    auto log_impl(LogLevel level, const std::source_location& location, std::string_view message) -> void;

    struct Impl;
    Impl* impl_;  ///< Pointer to implementation (pimpl idiom)
};

} // namespace strata

// ============================================================================
// Logging Macros (convenient wrappers with source location)
// ============================================================================

/**
 * @def LOG_TRACE
 * @brief Logs trace message
 *
 * Usage: LOG_TRACE("value = {}", value);
 */
#define LOG_TRACE(...) \
    ::strata::Logger::instance().log(::strata::LogLevel::TRACE, \
                                     std::source_location::current(), \
                                     __VA_ARGS__)

/**
 * @def LOG_DEBUG
 * @brief Logs debug message
 *
 * Usage: LOG_DEBUG("Created archetype {} [{}]", id, key);
 */
#define LOG_DEBUG(...) \
    ::strata::Logger::instance().log(::strata::LogLevel::DEBUG, \
                                     std::source_location::current(), \
                                     __VA_ARGS__)

/**
 * @def LOG_INFO
 * @brief Logs info message
 */
#define LOG_INFO(...) \
    ::strata::Logger::instance().log(::strata::LogLevel::INFO, \
                                     std::source_location::current(), \
                                     __VA_ARGS__)

/**
 * @def LOG_WARN
 * @brief Logs warning message
 */
#define LOG_WARN(...) \
    ::strata::Logger::instance().log(::strata::LogLevel::WARN, \
                                     std::source_location::current(), \
                                     __VA_ARGS__)

/**
 * @def LOG_ERROR
 * @brief Logs error message
 *
 * Usage: LOG_ERROR("Command replay failed: {}", error.what());
 */
#define LOG_ERROR(...) \
    ::strata::Logger::instance().log(::strata::LogLevel::ERROR, \
                                     std::source_location::current(), \
                                     __VA_ARGS__)

/**
 * @def LOG_FATAL
 * @brief Logs fatal error message
 */
#define LOG_FATAL(...) \
    ::strata::Logger::instance().log(::strata::LogLevel::FATAL, \
                                     std::source_location::current(), \
                                     __VA_ARGS__)
