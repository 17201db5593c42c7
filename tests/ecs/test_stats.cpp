/**
 * @file test_stats.cpp
 * @brief Tests for world counters and timing history
 *
 * @date 2025-11-02
 */

#include <strata/ecs/schedule.hpp>
#include <strata/ecs/world.hpp>

#include "test_components.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace strata;
using namespace strata::ecs;
using namespace strata::test;

class StatsTest : public ::testing::Test {
protected:
    TypeRegistry registry;
    World world{WorldConfig{.profiling_enabled = true, .history_capacity = 4, .registry = &registry}};
};

// ========== Counter Tests ==========

TEST_F(StatsTest, FreshWorldCounters) {
    const auto stats = world.stats();

    EXPECT_EQ(stats.alive_entities, 0u);
    EXPECT_EQ(stats.archetypes, 1u);  // the empty archetype
    EXPECT_EQ(stats.rows, 0u);
    EXPECT_EQ(stats.systems, 0u);
    EXPECT_EQ(stats.resources, 0u);
    EXPECT_EQ(stats.event_channels, 0u);
    EXPECT_FALSE(stats.pending_commands);
    EXPECT_EQ(stats.frame, 0u);
}

TEST_F(StatsTest, CountersTrackWorldContents) {
    ASSERT_TRUE(world.spawn_with(Position{}, Velocity{}));
    ASSERT_TRUE(world.spawn_with(Position{}));
    ASSERT_TRUE(world.spawn());
    world.set_resource(GameClock{});
    world.emit(Damage{1, 1});
    world.cmd().spawn_bundle(Health{});

    const auto stats = world.stats();
    EXPECT_EQ(stats.alive_entities, 3u);
    EXPECT_EQ(stats.archetypes, 3u);
    EXPECT_EQ(stats.rows, 3u);
    EXPECT_EQ(stats.resources, 1u);
    EXPECT_EQ(stats.event_channels, 1u);
    EXPECT_TRUE(stats.pending_commands);
}

TEST_F(StatsTest, EmptyArchetypesStayCounted) {
    const Entity e = world.spawn_with(Health{}).value();
    ASSERT_TRUE(world.despawn(e));

    const auto stats = world.stats();
    EXPECT_EQ(stats.archetypes, 2u);
    EXPECT_EQ(stats.rows, 0u);
}

// ========== Frame Timing Tests ==========

TEST_F(StatsTest, UpdateRecordsFrameAndSystems) {
    ASSERT_TRUE(world.add_system("move", [](World&, f64) {}));

    ASSERT_TRUE(world.update(0.1));
    ASSERT_TRUE(world.update(0.2));

    const auto stats = world.stats();
    EXPECT_EQ(stats.frame, 2u);
    EXPECT_DOUBLE_EQ(stats.dt, 0.2);
    EXPECT_EQ(stats.systems, 1u);
    EXPECT_TRUE(stats.system_ms.contains("move"));
    EXPECT_GE(stats.frame_ms, 0.0);

    const auto history = world.stats_history();
    EXPECT_EQ(history.size, 2u);
    EXPECT_EQ(history.dt, (std::vector<f64>{0.1, 0.2}));
    EXPECT_EQ(history.frame_ms.size(), 2u);
    ASSERT_TRUE(history.system_ms.contains("move"));
    EXPECT_EQ(history.system_ms.at("move").size(), 2u);
}

TEST_F(StatsTest, HistoryIsBoundedByCapacity) {
    for (int i = 1; i <= 6; ++i) {
        ASSERT_TRUE(world.update(static_cast<f64>(i)));
    }

    const auto history = world.stats_history();
    EXPECT_EQ(history.capacity, 4u);
    EXPECT_EQ(history.size, 4u);
    EXPECT_EQ(history.dt, (std::vector<f64>{3.0, 4.0, 5.0, 6.0}));
}

TEST_F(StatsTest, LateSystemsAreBackfilledWithZeros) {
    ASSERT_TRUE(world.add_system("early", [](World&, f64) {}));
    ASSERT_TRUE(world.update(0.016));
    ASSERT_TRUE(world.update(0.016));

    ASSERT_TRUE(world.add_system("late", [](World&, f64) {}));
    ASSERT_TRUE(world.update(0.016));

    const auto history = world.stats_history();
    ASSERT_TRUE(history.system_ms.contains("late"));
    const auto& late = history.system_ms.at("late");
    ASSERT_EQ(late.size(), 3u);
    EXPECT_EQ(late[0], 0.0);
    EXPECT_EQ(late[1], 0.0);
    EXPECT_EQ(history.system_ms.at("early").size(), 3u);
}

TEST_F(StatsTest, ShrinkingHistoryKeepsNewestSamples) {
    for (int i = 1; i <= 4; ++i) {
        ASSERT_TRUE(world.update(static_cast<f64>(i)));
    }

    world.set_profiling_history_size(2);
    const auto history = world.stats_history();
    EXPECT_EQ(history.capacity, 2u);
    EXPECT_EQ(history.dt, (std::vector<f64>{3.0, 4.0}));
}

TEST_F(StatsTest, DisabledProfilingStillCountsFrames) {
    world.set_profiling_enabled(false);
    ASSERT_TRUE(world.add_system("move", [](World&, f64) {}));

    ASSERT_TRUE(world.update(0.5));

    const auto stats = world.stats();
    EXPECT_EQ(stats.frame, 1u);
    EXPECT_DOUBLE_EQ(stats.dt, 0.5);
    EXPECT_EQ(stats.frame_ms, 0.0);
    EXPECT_TRUE(stats.system_ms.empty());
    EXPECT_EQ(world.stats_history().size, 0u);
}

TEST_F(StatsTest, ScheduledPhasesAppearInHistory) {
    Schedule schedule;
    const std::vector<std::string> phases{"update", "render"};
    ASSERT_TRUE(schedule.add(world, "update", "move", [](World&, f64) {}));

    ASSERT_TRUE(schedule.run(world, 0.016, phases));

    const auto history = world.stats_history();
    EXPECT_TRUE(history.phase_ms.contains("update"));
    EXPECT_TRUE(history.phase_ms.contains("render"));
    EXPECT_TRUE(history.system_ms.contains("update:move"));
}
