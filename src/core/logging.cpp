/**
 * @file logging.cpp
 * @brief Implementation of thread-safe logging system
 *
 * @date 2025-11-02
 */

#include <strata/core/logging.hpp>

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>

namespace strata {

// ============================================================================
// ANSI Color Codes (for colored console output)
// ============================================================================

namespace ansi {
constexpr auto RESET = "\033[0m";
constexpr auto BOLD_BRIGHT_RED = "\033[1m\033[91m";
constexpr auto BRIGHT_BLACK = "\033[90m";
constexpr auto BRIGHT_RED = "\033[91m";
constexpr auto BRIGHT_GREEN = "\033[92m";
constexpr auto BRIGHT_YELLOW = "\033[93m";
constexpr auto BRIGHT_CYAN = "\033[96m";
} // namespace ansi

auto parse_log_level(std::string_view name) -> Result<LogLevel> {
    if (name == "trace" || name == "TRACE") return LogLevel::TRACE;
    if (name == "debug" || name == "DEBUG") return LogLevel::DEBUG;
    if (name == "info" || name == "INFO") return LogLevel::INFO;
    if (name == "warn" || name == "WARN") return LogLevel::WARN;
    if (name == "error" || name == "ERROR") return LogLevel::ERROR;
    if (name == "fatal" || name == "FATAL") return LogLevel::FATAL;
    return make_error(ErrorCode::CONFIG_INVALID_VALUE,
                      std::format("Unknown log level '{}'", name));
}

// ============================================================================
// Logger Implementation (pimpl idiom for encapsulation)
// ============================================================================

struct Logger::Impl {
    mutable std::mutex mutex;                  ///< Mutex for thread safety
    std::ofstream log_file;                    ///< Log file stream
    LogLevel min_level = LogLevel::INFO;       ///< Minimum log level
    bool enable_colors = true;                 ///< Color output flag

    [[nodiscard]] auto get_level_color(LogLevel level) const noexcept -> const char* {
        if (!enable_colors) {
            return "";
        }

        switch (level) {
            case LogLevel::TRACE: return ansi::BRIGHT_BLACK;
            case LogLevel::DEBUG: return ansi::BRIGHT_CYAN;
            case LogLevel::INFO:  return ansi::BRIGHT_GREEN;
            case LogLevel::WARN:  return ansi::BRIGHT_YELLOW;
            case LogLevel::ERROR: return ansi::BRIGHT_RED;
            case LogLevel::FATAL: return ansi::BOLD_BRIGHT_RED;
        }
        return "";
    }

    [[nodiscard]] static auto format_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&time_t_now, &tm_buf);

        return std::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:03d}",
                           tm_buf.tm_year + 1900,
                           tm_buf.tm_mon + 1,
                           tm_buf.tm_mday,
                           tm_buf.tm_hour,
                           tm_buf.tm_min,
                           tm_buf.tm_sec,
                           static_cast<int>(ms.count()));
    }

    /**
     * @brief Writes one line to console and file
     *
     * @pre mutex is held by the caller
     */
    auto write_locked(LogLevel level,
                      const std::source_location& location,
                      std::string_view message) -> void {
        if (level < min_level) {
            return;
        }

        const auto timestamp = format_timestamp();
        const auto level_str = to_string(level);

        const auto console_line = std::format(
            "{}[{}] [{}] {}: {}{}\n",
            get_level_color(level),
            timestamp,
            level_str,
            location.function_name(),
            message,
            enable_colors ? ansi::RESET : ""
        );

        if (level >= LogLevel::ERROR) {
            std::cerr << console_line << std::flush;
        } else {
            std::cout << console_line << std::flush;
        }

        if (log_file.is_open()) {
            log_file << std::format("[{}] [{}] {} ({}:{}): {}\n",
                                    timestamp,
                                    level_str,
                                    location.function_name(),
                                    location.file_name(),
                                    location.line(),
                                    message)
                     << std::flush;
        }
    }
};

// ============================================================================
// Logger Public Methods
// ============================================================================

Logger::Logger() : impl_(new Impl()) {}

Logger::~Logger() {
    delete impl_;
}

auto Logger::instance() -> Logger& {
    static Logger instance;
    return instance;
}

auto Logger::initialize(std::string_view log_file_path) -> Result<void> {
    std::lock_guard lock(impl_->mutex);

    if (impl_->log_file.is_open()) {
        return {};
    }

    const auto log_path = std::filesystem::path(log_file_path);
    const auto log_dir = log_path.parent_path();

    if (!log_dir.empty() && !std::filesystem::exists(log_dir)) {
        std::error_code ec;
        if (!std::filesystem::create_directories(log_dir, ec)) {
            return make_error(ErrorCode::CORE_FILE_IO_ERROR,
                              std::format("Failed to create log directory: {}", ec.message()));
        }
    }

    impl_->log_file.open(log_path, std::ios::out | std::ios::app);
    if (!impl_->log_file.is_open()) {
        return make_error(ErrorCode::CORE_FILE_IO_ERROR,
                          std::format("Failed to open log file: {}", log_file_path));
    }

    impl_->write_locked(LogLevel::INFO, std::source_location::current(),
                        std::format("Logger initialized (log file: {})", log_file_path));
    return {};
}

auto Logger::shutdown() -> void {
    std::lock_guard lock(impl_->mutex);

    if (impl_->log_file.is_open()) {
        impl_->write_locked(LogLevel::INFO, std::source_location::current(),
                            "Logger shutting down");
        impl_->log_file.close();
    }
}

auto Logger::set_level(LogLevel level) -> void {
    std::lock_guard lock(impl_->mutex);
    impl_->min_level = level;
}

auto Logger::get_level() const -> LogLevel {
    std::lock_guard lock(impl_->mutex);
    return impl_->min_level;
}

auto Logger::set_colors_enabled(bool enabled) -> void {
    std::lock_guard lock(impl_->mutex);
    impl_->enable_colors = enabled;
}

auto Logger::is_enabled(LogLevel level) const -> bool {
    std::lock_guard lock(impl_->mutex);
    return level >= impl_->min_level;
}

auto Logger::log_impl(LogLevel level, const std::source_location& location,
                      std::string_view message) -> void {
    std::lock_guard lock(impl_->mutex);
    impl_->write_locked(level, location, message);
}

} // namespace strata
