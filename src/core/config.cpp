/**
 * @file config.cpp
 * @brief Implementation of runtime configuration loading
 *
 * Parses YAML with the yaml-cpp library.
 *
 * @date 2025-11-02
 */

#include <strata/core/config.hpp>

#include <yaml-cpp/yaml.h>

#include <format>
#include <fstream>
#include <sstream>

namespace strata {

namespace {

auto invalid_value(std::string_view key, const YAML::Node& node, std::string_view expected) -> std::unexpected<Error> {
    const std::string shown = node.IsScalar() ? node.Scalar() : "<non-scalar>";
    return make_error(ErrorCode::CONFIG_INVALID_VALUE,
                      std::format("Invalid config value for '{}': {} (expected {})", key, shown, expected));
}

/**
 * @brief Reads `section.key` into `out` if present
 *
 * ✨ FUNCTIONAL ✨
 */
template<typename T>
auto read_value(const YAML::Node& section, std::string_view section_name, const char* key,
                std::string_view expected, T& out) -> Result<void> {
    const YAML::Node node = section[key];
    if (!node) {
        return {};
    }

    const std::string full_key = std::format("{}.{}", section_name, key);
    if (!node.IsScalar()) {
        return invalid_value(full_key, node, expected);
    }
    try {
        out = node.as<T>();
    } catch (const YAML::Exception&) {
        return invalid_value(full_key, node, expected);
    }
    return {};
}

/**
 * @brief Checks that a top-level section is a map (absent or empty is fine)
 *
 * ✨ FUNCTIONAL ✨
 */
auto check_section(const YAML::Node& section, std::string_view name) -> Result<bool> {
    if (!section || section.IsNull()) {
        return false;
    }
    if (!section.IsMap()) {
        return invalid_value(name, section, "a map");
    }
    return true;
}

} // anonymous namespace

auto parse_config(std::string_view text) -> Result<RuntimeConfig> {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(text));
    } catch (const YAML::Exception& e) {
        return make_error(ErrorCode::CONFIG_PARSE_ERROR, std::format("Config parse error: {}", e.what()));
    }

    RuntimeConfig config;
    if (!root || root.IsNull()) {
        return config;  // empty document
    }
    if (!root.IsMap()) {
        return make_error(ErrorCode::CONFIG_PARSE_ERROR, "Config parse error: expected a map at document root");
    }

    const YAML::Node log = root["log"];
    auto has_log = check_section(log, "log");
    if (!has_log) {
        return std::unexpected(has_log.error());
    }
    if (*has_log) {
        std::string level = std::string(to_string(config.log_level));
        if (auto ok = read_value(log, "log", "level", "a log level", level); !ok) {
            return std::unexpected(ok.error());
        }
        auto parsed = parse_log_level(level);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        config.log_level = *parsed;

        if (auto ok = read_value(log, "log", "file", "a path", config.log_file); !ok) {
            return std::unexpected(ok.error());
        }
    }

    const YAML::Node profiling = root["profiling"];
    auto has_profiling = check_section(profiling, "profiling");
    if (!has_profiling) {
        return std::unexpected(has_profiling.error());
    }
    if (*has_profiling) {
        if (auto ok = read_value(profiling, "profiling", "enabled", "true or false", config.profiling_enabled); !ok) {
            return std::unexpected(ok.error());
        }

        i64 capacity = static_cast<i64>(config.history_capacity);
        if (auto ok = read_value(profiling, "profiling", "history_capacity", "a non-negative integer", capacity); !ok) {
            return std::unexpected(ok.error());
        }
        if (capacity < 0) {
            return invalid_value("profiling.history_capacity", profiling["history_capacity"], "a non-negative integer");
        }
        config.history_capacity = static_cast<std::size_t>(capacity);
    }

    const YAML::Node schedule = root["schedule"];
    auto has_schedule = check_section(schedule, "schedule");
    if (!has_schedule) {
        return std::unexpected(has_schedule.error());
    }
    if (*has_schedule) {
        if (auto ok = read_value(schedule, "schedule", "auto_boundaries", "true or false", config.auto_boundaries); !ok) {
            return std::unexpected(ok.error());
        }
    }

    return config;
}

auto load_config(const std::filesystem::path& path) -> Result<RuntimeConfig> {
    std::ifstream file(path);
    if (!file.is_open()) {
        return make_error(ErrorCode::CORE_FILE_NOT_FOUND,
                          std::format("Config file not found: {}", path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto config = parse_config(buffer.str());
    if (config) {
        LOG_INFO("Loaded config from: {}", path.string());
    }
    return config;
}

auto apply_logging(const RuntimeConfig& config) -> Result<void> {
    auto& logger = Logger::instance();
    logger.set_level(config.log_level);
    if (config.log_file.empty()) {
        return {};
    }
    return logger.initialize(config.log_file);
}

} // namespace strata
