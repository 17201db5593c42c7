/**
 * @file config.hpp
 * @brief Runtime configuration loaded from YAML
 *
 * @code
 * log:
 *   level: debug          # trace | debug | info | warn | error | fatal
 *   file: logs/sim.log    # empty = console only
 * profiling:
 *   enabled: true
 *   history_capacity: 240
 * schedule:
 *   auto_boundaries: true
 * @endcode
 *
 * Every key is optional; missing keys keep their defaults and unknown keys
 * are ignored.
 *
 * @date 2025-11-02
 */

#pragma once

#include <strata/core/logging.hpp>
#include <strata/core/types.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace strata {

/**
 * @brief Settings an application reads at startup
 */
struct RuntimeConfig {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;                 ///< Empty = console only
    bool profiling_enabled = true;
    std::size_t history_capacity = 120;   ///< Frames of timing history
    bool auto_boundaries = true;          ///< Schedule flushes and swaps after every phase
};

/**
 * @brief Parses a configuration document
 *
 * ✨ PURE FUNCTION ✨
 *
 * @return CONFIG_PARSE_ERROR for malformed YAML,
 *         CONFIG_INVALID_VALUE for values of the wrong type or range
 */
[[nodiscard]] auto parse_config(std::string_view text) -> Result<RuntimeConfig>;

/**
 * @brief Loads a configuration file
 *
 * ⚠️ IMPURE FUNCTION (file I/O)
 *
 * @return CORE_FILE_NOT_FOUND, or any parse_config() error
 */
[[nodiscard]] auto load_config(const std::filesystem::path& path) -> Result<RuntimeConfig>;

/**
 * @brief Applies the log settings to the global Logger
 *
 * ⚠️ IMPURE FUNCTION (opens the log file)
 */
auto apply_logging(const RuntimeConfig& config) -> Result<void>;

} // namespace strata
