/**
 * @file test_query.cpp
 * @brief Tests for row queries, table queries and each()
 *
 * @date 2025-11-02
 */

#include <strata/ecs/world.hpp>

#include "test_components.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>
#include <vector>

using namespace strata;
using namespace strata::ecs;
using namespace strata::test;

class QueryTest : public ::testing::Test {
protected:
    void SetUp() override {
        moving = world.spawn_with(Position{0, 0}, Velocity{1, 0}).value();
        still = world.spawn_with(Position{5, 5}).value();
        tagged = world.spawn_with(Position{9, 9}, Velocity{0, 1}, Frozen{}).value();
        loner = world.spawn_with(Health{3}).value();
    }

    TypeRegistry registry;
    World world{WorldConfig{.profiling_enabled = false, .history_capacity = 0, .registry = &registry}};
    Entity moving;
    Entity still;
    Entity tagged;
    Entity loner;
};

// ========== Row Query Tests ==========

TEST_F(QueryTest, RowQueryYieldsMatchingEntities) {
    std::vector<Entity> seen;
    for (auto [entity, position, velocity] : world.query<Position, Velocity>()) {
        seen.push_back(entity);
        position.x += velocity.dx;
    }

    std::ranges::sort(seen);
    EXPECT_EQ(seen, (std::vector<Entity>{moving, tagged}));
    EXPECT_EQ(world.get<Position>(moving)->x, 1.0f);  // written through the reference
    EXPECT_EQ(world.get<Position>(still)->x, 5.0f);
}

TEST_F(QueryTest, ArchetypesVisitedInCreationOrder) {
    std::vector<Entity> seen;
    for (auto [entity, position] : world.query<Position>()) {
        seen.push_back(entity);
    }
    EXPECT_EQ(seen, (std::vector<Entity>{moving, still, tagged}));
}

TEST_F(QueryTest, ArgumentOrderIsKept) {
    for (auto [entity, velocity, position] : world.query<Velocity, Position>()) {
        if (entity == moving) {
            EXPECT_EQ(velocity, (Velocity{1, 0}));
            EXPECT_EQ(position, (Position{0, 0}));
        }
    }
}

TEST_F(QueryTest, EmptyAndUnmatchedQueries) {
    int count = 0;
    for ([[maybe_unused]] auto row : world.query<Position, Health>()) {
        ++count;
    }
    EXPECT_EQ(count, 0);
    EXPECT_FALSE(world.is_iterating());
}

TEST_F(QueryTest, QueryHoldsLockUntilExhausted) {
    {
        auto query = world.query<Health>();
        EXPECT_TRUE(world.is_iterating());

        auto it = query.begin();
        EXPECT_TRUE(world.is_iterating());
        EXPECT_FALSE(world.spawn());

        ++it;  // past the only row
        EXPECT_TRUE(it == query.end());
        EXPECT_FALSE(world.is_iterating());
    }
    EXPECT_TRUE(world.spawn());
}

TEST_F(QueryTest, AbandonedQueryReleasesLock) {
    {
        auto query = world.query<Position>();
        auto it = query.begin();
        EXPECT_FALSE(it == query.end());
    }
    EXPECT_FALSE(world.is_iterating());
    EXPECT_TRUE(world.spawn());
}

TEST_F(QueryTest, EmptyArchetypesAreSkipped) {
    ASSERT_TRUE(world.remove<Health>(loner));  // {Health} is now empty

    int count = 0;
    for ([[maybe_unused]] auto row : world.query<Health>()) {
        ++count;
    }
    EXPECT_EQ(count, 0);
}

// ========== Table Query Tests ==========

TEST_F(QueryTest, TablesExposeRawColumns) {
    std::size_t rows = 0;
    std::size_t tables = 0;
    for (auto table : world.query_tables<Position, const Velocity>()) {
        ++tables;
        rows += table.size();

        auto positions = table.column<0>();
        auto velocities = table.column<1>();
        ASSERT_EQ(positions.size(), table.entities.size());
        for (std::size_t i = 0; i < table.size(); ++i) {
            positions[i].y += velocities[i].dy;
        }
    }

    EXPECT_EQ(tables, 2u);
    EXPECT_EQ(rows, 2u);
    EXPECT_EQ(world.get<Position>(tagged)->y, 10.0f);
}

TEST_F(QueryTest, TablesReportArchetypeIds) {
    std::vector<u32> ids;
    for (auto table : world.query_tables<Position>()) {
        ids.push_back(table.archetype_id);
    }
    ASSERT_EQ(ids.size(), 3u);
    EXPECT_TRUE(std::ranges::is_sorted(ids));
}

// ========== each() Tests ==========

TEST_F(QueryTest, EachVisitsEveryMatchingRow) {
    int visits = 0;
    world.each<Position, const Velocity>([&](Entity, Position& p, const Velocity& v) {
        ++visits;
        p.x += v.dx * 10.0f;
    });

    EXPECT_EQ(visits, 2);
    EXPECT_EQ(world.get<Position>(moving)->x, 10.0f);
}

TEST_F(QueryTest, ConstEachReadsOnly) {
    const World& view = world;

    f32 sum = 0.0f;
    view.each<Position>([&](Entity, const Position& p) { sum += p.x; });
    EXPECT_EQ(sum, 14.0f);

    int unknown = 0;
    view.each<Name>([&](Entity, const Name&) { ++unknown; });  // never registered
    EXPECT_EQ(unknown, 0);
}

TEST_F(QueryTest, LockIsReleasedWhenCallbackThrows) {
    EXPECT_THROW(world.each<Position>([](Entity, Position&) { throw std::runtime_error("boom"); }),
                 std::runtime_error);
    EXPECT_FALSE(world.is_iterating());
}

TEST_F(QueryTest, NestedQueriesKeepTheLock) {
    world.each<Velocity>([&](Entity, Velocity&) {
        for ([[maybe_unused]] auto row : world.query<Health>()) {
        }
        EXPECT_TRUE(world.is_iterating());  // outer each still holds it
    });
    EXPECT_FALSE(world.is_iterating());
}
