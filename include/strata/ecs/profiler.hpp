/**
 * @file profiler.hpp
 * @brief Point-in-time world counters and rolling frame timings
 *
 * Read-only telemetry: a debug overlay or test reads WorldStats and
 * StatsHistory, nothing here feeds back into the simulation.
 *
 * History series all have the same length. A phase or system first seen in
 * a later frame gets zeros for the frames before it, and a known key that
 * did not run in a frame records 0 for that frame.
 *
 * @date 2025-11-02
 */

#pragma once

#include <strata/core/ring_buffer.hpp>
#include <strata/core/time.hpp>
#include <strata/core/types.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace strata::ecs {

/// Default number of frames kept in the timing history
inline constexpr std::size_t DEFAULT_HISTORY_CAPACITY = 120;

/**
 * @brief Point-in-time counters for a World
 */
struct WorldStats {
    std::size_t alive_entities = 0;
    std::size_t archetypes = 0;
    std::size_t rows = 0;              ///< Total rows over all archetypes
    std::size_t systems = 0;           ///< World systems + scheduled systems
    std::size_t resources = 0;
    std::size_t event_channels = 0;
    bool pending_commands = false;

    u64 frame = 0;                     ///< Completed update()/run() frames
    f64 dt = 0.0;                      ///< dt of the last frame
    f64 frame_ms = 0.0;                ///< Duration of the last frame
    std::map<std::string, f64> phase_ms;   ///< Last frame, per phase
    std::map<std::string, f64> system_ms;  ///< Last frame, per system ("phase:name" when scheduled)
};

/**
 * @brief Rolling timing history (oldest sample first)
 */
struct StatsHistory {
    std::size_t capacity = 0;
    std::size_t size = 0;
    std::vector<f64> dt;
    std::vector<f64> frame_ms;
    std::map<std::string, std::vector<f64>> phase_ms;
    std::map<std::string, std::vector<f64>> system_ms;
};

/**
 * @brief Frame timing recorder owned by World
 *
 * ⚠️ IMPURE CLASS
 */
class Profiler {
public:
    explicit Profiler(bool enabled = true, std::size_t history_capacity = DEFAULT_HISTORY_CAPACITY);

    /**
     * @brief Starts a frame: records dt, clears last frame's timings
     */
    auto begin_frame(f64 dt) -> void;

    /**
     * @brief Ends the frame: bumps the frame counter and appends history
     */
    auto end_frame() -> void;

    /// Adds time to a phase of the current frame
    auto add_phase(const std::string& phase, f64 ms) -> void;

    /// Adds time to a system of the current frame
    auto add_system(const std::string& system, f64 ms) -> void;

    /**
     * @brief Enables or disables timing
     *
     * While disabled, frames and dt are still counted; timings stay 0 and
     * no history is appended.
     */
    auto set_enabled(bool enabled) -> void { enabled_ = enabled; }
    [[nodiscard]] auto enabled() const noexcept -> bool { return enabled_; }

    /**
     * @brief Resizes every history series (keeps the newest samples, 0 disables history)
     */
    auto set_history_capacity(std::size_t capacity) -> void;

    /// Copies the frame fields into `stats`
    auto fill(WorldStats& stats) const -> void;

    [[nodiscard]] auto history() const -> StatsHistory;

private:
    bool enabled_;
    std::size_t capacity_;

    u64 frame_ = 0;
    f64 dt_ = 0.0;
    f64 frame_ms_ = 0.0;
    std::optional<Timer> frame_timer_;
    std::map<std::string, f64> phase_ms_;
    std::map<std::string, f64> system_ms_;

    RingBuffer<f64> dt_history_;
    RingBuffer<f64> frame_ms_history_;
    std::map<std::string, RingBuffer<f64>> phase_history_;
    std::map<std::string, RingBuffer<f64>> system_history_;
};

} // namespace strata::ecs
