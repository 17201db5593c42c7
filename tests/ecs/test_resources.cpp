/**
 * @file test_resources.cpp
 * @brief Tests for typed world resources
 *
 * @date 2025-11-02
 */

#include <strata/ecs/world.hpp>

#include "test_components.hpp"

#include <gtest/gtest.h>

using namespace strata;
using namespace strata::ecs;
using namespace strata::test;

class ResourcesTest : public ::testing::Test {
protected:
    TypeRegistry registry;
    World world{WorldConfig{.profiling_enabled = false, .history_capacity = 0, .registry = &registry}};
};

TEST_F(ResourcesTest, SetGetReplace) {
    EXPECT_EQ(world.get_resource<GameClock>(), nullptr);
    EXPECT_FALSE(world.has_resource<GameClock>());

    world.set_resource(GameClock{5});
    ASSERT_NE(world.get_resource<GameClock>(), nullptr);
    EXPECT_EQ(world.get_resource<GameClock>()->tick, 5u);

    world.set_resource(GameClock{6});
    EXPECT_EQ(world.get_resource<GameClock>()->tick, 6u);
    EXPECT_EQ(world.stats().resources, 1u);
}

TEST_F(ResourcesTest, MutableAccessWritesThrough) {
    world.set_resource(GameClock{});
    world.get_resource<GameClock>()->tick += 3;

    const World& view = world;
    EXPECT_EQ(view.get_resource<GameClock>()->tick, 3u);
}

TEST_F(ResourcesTest, RequireResourceReportsMissingType) {
    const auto missing = world.require_resource<Gravity>();
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::ECS_MISSING_RESOURCE);
    EXPECT_EQ(missing.error().message, "missing resource Gravity");

    world.set_resource(Gravity{-1.0f});
    const auto present = world.require_resource<Gravity>();
    ASSERT_TRUE(present);
    EXPECT_EQ((*present)->g, -1.0f);
}

TEST_F(ResourcesTest, RemoveResource) {
    world.set_resource(Gravity{});

    EXPECT_TRUE(world.remove_resource<Gravity>());
    EXPECT_FALSE(world.remove_resource<Gravity>());
    EXPECT_FALSE(world.has_resource<Gravity>());
}

TEST_F(ResourcesTest, InitResourceCallsFactoryOnce) {
    int calls = 0;
    const auto factory = [&] {
        ++calls;
        return GameClock{42};
    };

    GameClock& first = world.init_resource<GameClock>(factory);
    first.tick = 7;
    GameClock& second = world.init_resource<GameClock>(factory);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(second.tick, 7u);
    EXPECT_EQ(&first, &second);
}

TEST_F(ResourcesTest, ResourcesAreLegalWhileIterating) {
    ASSERT_TRUE(world.spawn_with(Health{1}));

    world.each<Health>([&](Entity, Health&) {
        world.set_resource(GameClock{1});
        world.init_resource<Gravity>([] { return Gravity{}; });
    });

    EXPECT_TRUE(world.has_resource<GameClock>());
    EXPECT_TRUE(world.has_resource<Gravity>());
}

TEST_F(ResourcesTest, ResourcesAreNotComponents) {
    world.set_resource(Position{1, 1});
    const auto e = world.spawn();
    ASSERT_TRUE(e);

    EXPECT_FALSE(world.has<Position>(*e));
    EXPECT_EQ(world.entity_count(), 1u);
}
