/**
 * @file time.hpp
 * @brief Time measurement for frame and system profiling
 *
 * Uses std::chrono::steady_clock for monotonic, high-resolution timing.
 *
 * @date 2025-11-02
 * @version 1.0
 *
 * @note Thread-safe when each thread has its own Timer instance
 */

#pragma once

#include <strata/core/types.hpp>

#include <chrono>

namespace strata {

// ============================================================================
// Timer Class (high-resolution timing)
// ============================================================================

/**
 * @class Timer
 * @brief High-resolution timer for measuring elapsed time
 *
 * ✨ MOSTLY PURE (only modifies internal state)
 *
 * @note Not thread-safe: each thread should have its own Timer instance
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    /**
     * @brief Constructs timer and starts counting
     *
     * ⚠️ IMPURE (queries system clock)
     */
    Timer() noexcept;

    /**
     * @brief Resets timer to current time
     *
     * ⚠️ IMPURE (queries system clock)
     */
    auto reset() noexcept -> void;

    /**
     * @brief Returns seconds since last tick and restarts the tick interval
     *
     * ⚠️ IMPURE (queries system clock, modifies state)
     *
     * @return Delta time in seconds since last tick
     */
    auto tick() noexcept -> f64;

    /**
     * @brief Gets elapsed time since timer creation/reset
     *
     * @return Elapsed time in seconds
     */
    [[nodiscard]] auto elapsed() const noexcept -> f64;

    /**
     * @brief Gets elapsed time since timer creation/reset
     *
     * @return Elapsed time in milliseconds
     */
    [[nodiscard]] auto elapsed_ms() const noexcept -> f64;

private:
    TimePoint start_time_;      ///< Timer start time
    TimePoint last_tick_time_;  ///< Last tick time
};

} // namespace strata
