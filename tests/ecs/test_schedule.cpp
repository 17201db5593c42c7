/**
 * @file test_schedule.cpp
 * @brief Tests for the multi-phase scheduler
 *
 * @date 2025-11-02
 */

#include <strata/ecs/schedule.hpp>

#include "test_components.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace strata;
using namespace strata::ecs;
using namespace strata::test;

class ScheduleTest : public ::testing::Test {
protected:
    TypeRegistry registry;
    World world{WorldConfig{.profiling_enabled = true, .history_capacity = 8, .registry = &registry}};
    const std::vector<std::string> phases{"input", "update", "render"};
};

TEST_F(ScheduleTest, PhasesRunInGivenOrder) {
    Schedule schedule;
    std::vector<std::string> order;
    ASSERT_TRUE(schedule.add(world, "render", "draw", [&](World&, f64) { order.push_back("render:draw"); }));
    ASSERT_TRUE(schedule.add(world, "input", "keys", [&](World&, f64) { order.push_back("input:keys"); }));
    ASSERT_TRUE(schedule.add(world, "update", "move", [&](World&, f64) { order.push_back("update:move"); }));
    ASSERT_TRUE(schedule.add(world, "update", "collide", [&](World&, f64) { order.push_back("update:collide"); }));

    ASSERT_TRUE(schedule.run(world, 0.016, phases));
    EXPECT_EQ(order, (std::vector<std::string>{"input:keys", "update:move", "update:collide", "render:draw"}));
    EXPECT_EQ(schedule.system_count("update"), 2u);
    EXPECT_EQ(schedule.system_count("physics"), 0u);
}

TEST_F(ScheduleTest, PhasesNotInOrderAreSkipped) {
    Schedule schedule;
    bool ran = false;
    ASSERT_TRUE(schedule.add(world, "debug", "overlay", [&](World&, f64) { ran = true; }));

    ASSERT_TRUE(schedule.run(world, 0.016, phases));
    EXPECT_FALSE(ran);
}

TEST_F(ScheduleTest, EventsCrossExactlyOnePhaseBoundary) {
    Schedule schedule;
    int seen_in_update = 0;
    int seen_in_render = 0;

    ASSERT_TRUE(schedule.add(world, "input", "emit", [](World& w, f64) { w.emit(Damage{1, 5}); }));
    ASSERT_TRUE(schedule.add(world, "input", "read_same_phase", [](World& w, f64) {
        EXPECT_EQ(w.events<Damage>().count(), 0u);
    }));
    ASSERT_TRUE(schedule.add(world, "update", "peek", [&](World& w, f64) {
        seen_in_update += static_cast<int>(w.events<Damage>().count());
    }));
    ASSERT_TRUE(schedule.add(world, "render", "peek", [&](World& w, f64) {
        seen_in_render += static_cast<int>(w.events<Damage>().count());
    }));

    ASSERT_TRUE(schedule.run(world, 0.016, phases));
    EXPECT_EQ(seen_in_update, 1);
    EXPECT_EQ(seen_in_render, 0);  // unread events are dropped at the next boundary
}

TEST_F(ScheduleTest, CommandsApplyAtPhaseBoundary) {
    Schedule schedule;
    std::size_t seen_in_update = 0;

    ASSERT_TRUE(schedule.add(world, "input", "spawn", [](World& w, f64) {
        w.cmd().spawn_bundle(Position{}, Velocity{1, 0});
        EXPECT_EQ(w.entity_count(), 0u);
    }));
    ASSERT_TRUE(schedule.add(world, "update", "count", [&](World& w, f64) {
        seen_in_update = w.entity_count();
    }));

    ASSERT_TRUE(schedule.run(world, 0.016, phases));
    EXPECT_EQ(seen_in_update, 1u);
}

TEST_F(ScheduleTest, ManualBoundaries) {
    Schedule schedule(ScheduleConfig{.auto_boundaries = false});
    std::size_t seen_in_update = 0;

    ASSERT_TRUE(schedule.add(world, "input", "spawn", [](World& w, f64) { w.cmd().spawn_bundle(Health{1}); }));
    ASSERT_TRUE(schedule.add(world, "update", "count", [&](World& w, f64) {
        seen_in_update = w.entity_count();
    }));

    ASSERT_TRUE(schedule.run(world, 0.016, phases));
    EXPECT_EQ(seen_in_update, 0u);
    EXPECT_TRUE(world.has_pending_commands());

    ASSERT_TRUE(schedule.boundary(world));
    EXPECT_EQ(world.entity_count(), 1u);
}

TEST_F(ScheduleTest, ThrowingSystemFlushesAndRethrows) {
    Schedule schedule;
    ASSERT_TRUE(schedule.add(world, "update", "explode", [](World& w, f64) {
        w.cmd().spawn_bundle(Health{1});
        throw std::runtime_error("kaboom");
    }));

    EXPECT_THROW((void)schedule.run(world, 0.016, phases), std::runtime_error);
    EXPECT_EQ(world.entity_count(), 1u);
    EXPECT_FALSE(world.is_iterating());
}

TEST_F(ScheduleTest, ThrowingSystemIsStillTimed) {
    Schedule schedule;
    ASSERT_TRUE(schedule.add(world, "update", "explode", [](World&, f64) {
        throw std::runtime_error("kaboom");
    }));

    EXPECT_THROW((void)schedule.run(world, 0.016, phases), std::runtime_error);

    const auto stats = world.stats();
    EXPECT_EQ(stats.frame, 1u);
    EXPECT_TRUE(stats.system_ms.contains("update:explode"));
    EXPECT_TRUE(stats.phase_ms.contains("update"));
    EXPECT_EQ(world.stats_history().size, 1u);
}

TEST_F(ScheduleTest, SystemsMayChangeStructureDirectly) {
    Schedule schedule;
    ASSERT_TRUE(schedule.add(world, "input", "spawn", [](World& w, f64) {
        const auto spawned = w.spawn_with(Health{3});
        ASSERT_TRUE(spawned);
        EXPECT_EQ(w.entity_count(), 1u);  // visible immediately

        w.each<Health>([&](Entity entity, Health&) {
            EXPECT_FALSE(w.despawn(entity));  // but not from inside a query
        });
    }));

    ASSERT_TRUE(schedule.run(world, 0.016, phases));
    EXPECT_EQ(world.entity_count(), 1u);
}

TEST_F(ScheduleTest, RunReportsFirstBoundaryError) {
    const Entity stale = world.spawn().value();
    ASSERT_TRUE(world.despawn(stale));

    Schedule schedule;
    ASSERT_TRUE(schedule.add(world, "input", "bad", [stale](World& w, f64) { w.cmd().despawn(stale); }));

    const auto result = schedule.run(world, 0.016, phases);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::ECS_STALE_ENTITY);
}

TEST_F(ScheduleTest, RecordsPhaseAndSystemTimings) {
    Schedule schedule;
    ASSERT_TRUE(schedule.add(world, "update", "move", [](World&, f64) {}));

    ASSERT_TRUE(schedule.run(world, 0.5, phases));

    const auto stats = world.stats();
    EXPECT_EQ(stats.frame, 1u);
    EXPECT_DOUBLE_EQ(stats.dt, 0.5);
    EXPECT_EQ(stats.systems, 1u);
    EXPECT_TRUE(stats.system_ms.contains("update:move"));
    EXPECT_EQ(stats.phase_ms.size(), 3u);  // empty phases are timed too
}
