/**
 * @file test_lifecycle.cpp
 * @brief Tests for the single-pass update() lifecycle and lifecycle conflicts
 *
 * @date 2025-11-02
 */

#include <strata/ecs/schedule.hpp>
#include <strata/ecs/world.hpp>

#include "test_components.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace strata;
using namespace strata::ecs;
using namespace strata::test;

class LifecycleTest : public ::testing::Test {
protected:
    TypeRegistry registry;
    World world{WorldConfig{.profiling_enabled = true, .history_capacity = 8, .registry = &registry}};
    const std::vector<std::string> phases{"update"};
};

// ========== update() Tests ==========

TEST_F(LifecycleTest, SystemsRunInRegistrationOrder) {
    std::vector<std::string> order;
    ASSERT_TRUE(world.add_system("first", [&](World&, f64) { order.push_back("first"); }));
    ASSERT_TRUE(world.add_system("second", [&](World&, f64) { order.push_back("second"); }));

    ASSERT_TRUE(world.update(0.016));
    EXPECT_EQ(order, (std::vector<std::string>{"first", "second"}));
    EXPECT_EQ(world.lifecycle(), Lifecycle::SIMPLE);
}

TEST_F(LifecycleTest, SystemsReceiveDt) {
    f64 received = 0.0;
    ASSERT_TRUE(world.add_system("dt", [&](World&, f64 dt) { received = dt; }));

    ASSERT_TRUE(world.update(0.25));
    EXPECT_DOUBLE_EQ(received, 0.25);
}

TEST_F(LifecycleTest, SystemsMayChangeStructureOutsideQueries) {
    Entity direct = NULL_ENTITY;
    ASSERT_TRUE(world.add_system("spawner", [&](World& w, f64) {
        EXPECT_FALSE(w.is_iterating());
        auto spawned = w.spawn();
        ASSERT_TRUE(spawned);
        direct = *spawned;
        EXPECT_TRUE(w.add(direct, Health{1}));
        EXPECT_TRUE(w.flush());
    }));

    ASSERT_TRUE(world.update(0.016));
    EXPECT_TRUE(world.is_alive(direct));
    EXPECT_EQ(world.get<Health>(direct)->value, 1);
}

TEST_F(LifecycleTest, QueriesInsideSystemsStillLock) {
    const Entity target = world.spawn_with(Health{1}).value();

    ASSERT_TRUE(world.add_system("tagger", [](World& w, f64) {
        w.each<Health>([&](Entity entity, Health&) {
            const auto added = w.add(entity, Position{});
            ASSERT_FALSE(added);
            EXPECT_EQ(added.error().code, ErrorCode::ECS_STRUCTURAL_CHANGE_WHILE_ITERATING);
            w.cmd().add(entity, Velocity{});
        });
        EXPECT_FALSE(w.is_iterating());
    }));

    ASSERT_TRUE(world.update(0.016));
    EXPECT_TRUE(world.has<Velocity>(target));  // deferred add landed in the flush
    EXPECT_FALSE(world.has<Position>(target));
}

TEST_F(LifecycleTest, UpdateFlushesThenSwapsEvents) {
    int delivered = 0;
    ASSERT_TRUE(world.add_system("emit", [](World& w, f64) { w.emit(Damage{1, 1}); }));
    ASSERT_TRUE(world.add_system("read", [&](World& w, f64) {
        w.drain_events<Damage>([&](const Damage&) { ++delivered; });
    }));

    ASSERT_TRUE(world.update(0.016));
    EXPECT_EQ(delivered, 0);  // emitted this frame, readable next frame

    ASSERT_TRUE(world.update(0.016));
    EXPECT_EQ(delivered, 1);
}

TEST_F(LifecycleTest, ThrowingSystemStillFlushes) {
    ASSERT_TRUE(world.add_system("explode", [](World& w, f64) {
        w.cmd().spawn_bundle(Health{1});
        throw std::runtime_error("system failure");
    }));

    EXPECT_THROW((void)world.update(0.016), std::runtime_error);
    EXPECT_EQ(world.entity_count(), 1u);
    EXPECT_FALSE(world.has_pending_commands());
    EXPECT_FALSE(world.is_iterating());

    const auto stats = world.stats();
    EXPECT_EQ(stats.frame, 1u);
    EXPECT_TRUE(stats.system_ms.contains("explode"));
}

TEST_F(LifecycleTest, UpdateReturnsFlushError) {
    const Entity stale = world.spawn().value();
    ASSERT_TRUE(world.despawn(stale));

    ASSERT_TRUE(world.add_system("bad", [stale](World& w, f64) { w.cmd().add(stale, Health{}); }));

    const auto result = world.update(0.016);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::ECS_STALE_ENTITY);
}

// ========== Conflict Tests ==========

TEST_F(LifecycleTest, ScheduleOnSimpleWorldConflicts) {
    ASSERT_TRUE(world.update(0.016));

    Schedule schedule;
    const auto added = schedule.add(world, "update", "late", [](World&, f64) {});
    ASSERT_FALSE(added);
    EXPECT_EQ(added.error().code, ErrorCode::ECS_LIFECYCLE_CONFLICT);

    const auto ran = schedule.run(world, 0.016, phases);
    ASSERT_FALSE(ran);
    EXPECT_EQ(ran.error().code, ErrorCode::ECS_LIFECYCLE_CONFLICT);

    const std::string& message = ran.error().message;
    EXPECT_NE(message.find("ECS Lifecycle Conflict Detected!"), std::string::npos);
    EXPECT_NE(message.find("World::update()"), std::string::npos);
    EXPECT_NE(message.find("Schedule::run()"), std::string::npos);
}

TEST_F(LifecycleTest, UpdateOnScheduledWorldConflicts) {
    Schedule schedule;
    ASSERT_TRUE(schedule.run(world, 0.016, phases));
    EXPECT_EQ(world.lifecycle(), Lifecycle::PHASED);

    const auto updated = world.update(0.016);
    ASSERT_FALSE(updated);
    EXPECT_EQ(updated.error().code, ErrorCode::ECS_LIFECYCLE_CONFLICT);

    EXPECT_FALSE(world.add_system("late", [](World&, f64) {}));
}

TEST_F(LifecycleTest, FreshWorldIsUnused) {
    EXPECT_EQ(world.lifecycle(), Lifecycle::UNUSED);

    // plain structural use does not bind a lifecycle
    ASSERT_TRUE(world.spawn());
    ASSERT_TRUE(world.flush());
    EXPECT_EQ(world.lifecycle(), Lifecycle::UNUSED);
}
