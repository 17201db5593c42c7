/**
 * @file schedule.cpp
 * @brief Implementation of the multi-phase scheduler
 *
 * @date 2025-11-02
 */

#include <strata/ecs/schedule.hpp>
#include <strata/core/logging.hpp>
#include <strata/core/time.hpp>

#include <exception>
#include <format>
#include <string>

namespace strata::ecs {

namespace {

/// Message of the exception being handled (call inside a catch block)
auto current_exception_message() -> std::string {
    try {
        throw;
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

} // anonymous namespace

auto Schedule::add(World& world, std::string phase, std::string name, SystemFn fn) -> Result<void> {
    if (auto ok = world.enter_lifecycle(Lifecycle::PHASED, "Schedule::add()"); !ok) {
        return ok;
    }

    LOG_DEBUG("Scheduled system '{}' in phase '{}'", name, phase);
    phases_[std::move(phase)].push_back(System{std::move(name), std::move(fn)});
    ++world.scheduled_systems_;
    return {};
}

auto Schedule::system_count(const std::string& phase) const -> std::size_t {
    const auto it = phases_.find(phase);
    return it != phases_.end() ? it->second.size() : 0;
}

auto Schedule::boundary(World& world) -> Result<void> {
    Result<void> flushed{};
    if (world.has_pending_commands()) {
        flushed = world.flush();
    }
    world.swap_events();
    return flushed;
}

auto Schedule::run(World& world, f64 dt, std::span<const std::string> phase_order) -> Result<void> {
    if (auto ok = world.enter_lifecycle(Lifecycle::PHASED, "Schedule::run()"); !ok) {
        return ok;
    }

    Result<void> result{};
    world.profiler_.begin_frame(dt);

    for (const auto& phase : phase_order) {
        Timer phase_timer;

        if (const auto it = phases_.find(phase); it != phases_.end()) {
            for (auto& system : it->second) {
                const std::string label = std::format("{}:{}", phase, system.name);
                Timer system_timer;
                try {
                    system.fn(world, dt);
                } catch (...) {
                    LOG_ERROR("[phase={} system={}] {}", phase, system.name, current_exception_message());
                    world.profiler_.add_system(label, system_timer.elapsed_ms());
                    if (config_.auto_boundaries) {
                        if (auto flushed = boundary(world); !flushed) {
                            LOG_ERROR("Boundary after system failure failed: {}", flushed.error().what());
                        }
                    }
                    world.profiler_.add_phase(phase, phase_timer.elapsed_ms());
                    world.profiler_.end_frame();
                    throw;
                }
                world.profiler_.add_system(label, system_timer.elapsed_ms());
            }
        }

        if (config_.auto_boundaries) {
            if (auto flushed = boundary(world); !flushed && result) {
                result = std::unexpected(flushed.error());
            }
        }

        world.profiler_.add_phase(phase, phase_timer.elapsed_ms());
    }

    world.profiler_.end_frame();
    return result;
}

} // namespace strata::ecs
