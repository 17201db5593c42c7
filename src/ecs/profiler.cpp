/**
 * @file profiler.cpp
 * @brief Implementation of frame timing history
 *
 * @date 2025-11-02
 */

#include <strata/ecs/profiler.hpp>

namespace strata::ecs {

namespace {

/**
 * @brief Appends this frame's value to every series of a keyed history
 *
 * New keys are backfilled with zeros so all series keep `prior` samples
 * before the push.
 */
auto append_keyed(std::map<std::string, RingBuffer<f64>>& history,
                  const std::map<std::string, f64>& frame,
                  std::size_t prior,
                  std::size_t capacity) -> void {
    for (const auto& [key, ms] : frame) {
        if (history.contains(key)) {
            continue;
        }
        RingBuffer<f64> series(capacity);
        for (std::size_t i = 0; i < prior; ++i) {
            series.push(0.0);
        }
        history.emplace(key, std::move(series));
    }

    for (auto& [key, series] : history) {
        const auto it = frame.find(key);
        series.push(it != frame.end() ? it->second : 0.0);
    }
}

} // anonymous namespace

Profiler::Profiler(bool enabled, std::size_t history_capacity)
    : enabled_(enabled)
    , capacity_(history_capacity)
    , dt_history_(history_capacity)
    , frame_ms_history_(history_capacity) {}

auto Profiler::begin_frame(f64 dt) -> void {
    dt_ = dt;
    frame_ms_ = 0.0;
    phase_ms_.clear();
    system_ms_.clear();
    if (enabled_) {
        frame_timer_.emplace();
    } else {
        frame_timer_.reset();
    }
}

auto Profiler::end_frame() -> void {
    ++frame_;
    if (!enabled_ || !frame_timer_) {
        return;
    }

    frame_ms_ = frame_timer_->elapsed_ms();
    frame_timer_.reset();

    const std::size_t prior = dt_history_.size();
    dt_history_.push(dt_);
    frame_ms_history_.push(frame_ms_);
    append_keyed(phase_history_, phase_ms_, prior, capacity_);
    append_keyed(system_history_, system_ms_, prior, capacity_);
}

auto Profiler::add_phase(const std::string& phase, f64 ms) -> void {
    if (enabled_) {
        phase_ms_[phase] += ms;
    }
}

auto Profiler::add_system(const std::string& system, f64 ms) -> void {
    if (enabled_) {
        system_ms_[system] += ms;
    }
}

auto Profiler::set_history_capacity(std::size_t capacity) -> void {
    capacity_ = capacity;
    dt_history_.set_capacity(capacity);
    frame_ms_history_.set_capacity(capacity);
    for (auto& [key, series] : phase_history_) {
        series.set_capacity(capacity);
    }
    for (auto& [key, series] : system_history_) {
        series.set_capacity(capacity);
    }
}

auto Profiler::fill(WorldStats& stats) const -> void {
    stats.frame = frame_;
    stats.dt = dt_;
    stats.frame_ms = frame_ms_;
    stats.phase_ms = phase_ms_;
    stats.system_ms = system_ms_;
}

auto Profiler::history() const -> StatsHistory {
    StatsHistory out;
    out.capacity = capacity_;
    out.size = dt_history_.size();
    out.dt = dt_history_.to_vector();
    out.frame_ms = frame_ms_history_.to_vector();
    for (const auto& [key, series] : phase_history_) {
        out.phase_ms.emplace(key, series.to_vector());
    }
    for (const auto& [key, series] : system_history_) {
        out.system_ms.emplace(key, series.to_vector());
    }
    return out;
}

} // namespace strata::ecs
