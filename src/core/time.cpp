/**
 * @file time.cpp
 * @brief Implementation of time measurement utilities
 *
 * @date 2025-11-02
 */

#include <strata/core/time.hpp>

namespace strata {

Timer::Timer() noexcept
    : start_time_(Clock::now())
    , last_tick_time_(start_time_) {}

auto Timer::reset() noexcept -> void {
    start_time_ = Clock::now();
    last_tick_time_ = start_time_;
}

auto Timer::tick() noexcept -> f64 {
    const auto current_time = Clock::now();
    const auto delta = std::chrono::duration<f64>(current_time - last_tick_time_).count();
    last_tick_time_ = current_time;
    return delta;
}

auto Timer::elapsed() const noexcept -> f64 {
    return std::chrono::duration<f64>(Clock::now() - start_time_).count();
}

auto Timer::elapsed_ms() const noexcept -> f64 {
    return std::chrono::duration<f64, std::milli>(Clock::now() - start_time_).count();
}

} // namespace strata
