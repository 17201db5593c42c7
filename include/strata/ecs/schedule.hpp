/**
 * @file schedule.hpp
 * @brief Multi-phase system scheduler
 *
 * Runs named phases in caller-given order. Each phase ends at a boundary:
 * pending commands are flushed and event buffers swapped, so events emitted
 * in one phase are readable in the next.
 *
 * @code
 * Schedule schedule;
 * schedule.add(world, "input", "read_keys", read_keys);
 * schedule.add(world, "update", "integrate", integrate);
 *
 * const std::vector<std::string> phases{"input", "update", "render"};
 * schedule.run(world, dt, phases);
 * @endcode
 *
 * @note A World driven by a Schedule cannot also use World::update()
 *
 * @date 2025-11-02
 */

#pragma once

#include <strata/core/config.hpp>
#include <strata/core/types.hpp>
#include <strata/ecs/world.hpp>

#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace strata::ecs {

/**
 * @brief Scheduler configuration
 */
struct ScheduleConfig {
    /// Flush + swap after every phase; when false, call Schedule::boundary() yourself
    bool auto_boundaries = true;
};

/**
 * @brief Schedule settings from a loaded RuntimeConfig
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] inline auto to_schedule_config(const RuntimeConfig& config) -> ScheduleConfig {
    return ScheduleConfig{.auto_boundaries = config.auto_boundaries};
}

class Schedule {
public:
    explicit Schedule(ScheduleConfig config = {}) : config_(config) {}

    /**
     * @brief Registers a system in a phase (runs in registration order)
     *
     * Binds `world` to the phased lifecycle.
     *
     * @return ECS_LIFECYCLE_CONFLICT if `world` already uses World::update()
     */
    auto add(World& world, std::string phase, std::string name, SystemFn fn) -> Result<void>;

    /**
     * @brief Runs one frame: every phase of `phase_order`, in order
     *
     * Phases without systems still get their boundary. System timings are
     * recorded as "phase:name".
     *
     * If a system throws, the exception is logged with its phase and system,
     * its timing is recorded, the phase boundary still runs (with auto
     * boundaries), the frame is closed and the exception is rethrown.
     *
     * @return ECS_LIFECYCLE_CONFLICT, or the first boundary flush error
     */
    auto run(World& world, f64 dt, std::span<const std::string> phase_order) -> Result<void>;

    /**
     * @brief Phase boundary: flushes pending commands, then swaps events
     *
     * @return Flush result (events are swapped regardless)
     */
    auto boundary(World& world) -> Result<void>;

    [[nodiscard]] auto config() const noexcept -> const ScheduleConfig& { return config_; }

    /// Systems registered in `phase`
    [[nodiscard]] auto system_count(const std::string& phase) const -> std::size_t;

private:
    struct System {
        std::string name;
        SystemFn fn;
    };

    ScheduleConfig config_;
    std::unordered_map<std::string, std::vector<System>> phases_;
};

} // namespace strata::ecs
