/**
 * @file test_type_registry.cpp
 * @brief Unit tests for component type ids and names
 *
 * @date 2025-11-02
 */

#include <strata/ecs/type_registry.hpp>

#include "test_components.hpp"

#include <gtest/gtest.h>

using namespace strata::ecs;
using namespace strata::test;

namespace {

template<typename T>
struct Wrapper {
    T value;
};

} // anonymous namespace

class TypeRegistryTest : public ::testing::Test {
protected:
    TypeRegistry registry;
};

TEST_F(TypeRegistryTest, IdsStartAtOneInFirstUseOrder) {
    EXPECT_EQ(registry.size(), 0u);

    const TypeId velocity = registry.id<Velocity>();
    const TypeId position = registry.id<Position>();

    EXPECT_EQ(velocity, 1u);
    EXPECT_EQ(position, 2u);
    EXPECT_EQ(registry.id<Velocity>(), velocity);  // stable
    EXPECT_EQ(registry.size(), 2u);
}

TEST_F(TypeRegistryTest, ConstQualifiedTypesShareTheId) {
    const TypeId id = registry.id<const Position>();
    EXPECT_EQ(registry.id<Position>(), id);
    EXPECT_EQ(registry.name(id), "Position");
}

TEST_F(TypeRegistryTest, FindIdDoesNotRegister) {
    EXPECT_FALSE(registry.find_id<Health>().has_value());
    EXPECT_EQ(registry.size(), 0u);

    registry.id<Health>();
    EXPECT_EQ(registry.find_id<Health>().value(), 1u);
}

TEST_F(TypeRegistryTest, NamesStripNamespaces) {
    const TypeId position = registry.id<Position>();
    EXPECT_EQ(registry.name(position), "Position");
    EXPECT_EQ(registry.name(99), "#99");
}

TEST_F(TypeRegistryTest, TemplateNamesKeepArguments) {
    const TypeId id = registry.id<Wrapper<int>>();
    EXPECT_NE(registry.name(id).find("Wrapper<int>"), std::string::npos);
}

TEST_F(TypeRegistryTest, InfoProvidesColumnFactory) {
    const TypeId id = registry.id<Position>();

    const auto* info = registry.info(id);
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(info->id, id);
    EXPECT_EQ(info->type, std::type_index(typeid(Position)));

    auto column = info->make_array();
    ASSERT_NE(column, nullptr);
    EXPECT_EQ(column->size(), 0u);
    EXPECT_EQ(column->type(), std::type_index(typeid(Position)));

    EXPECT_EQ(registry.info(0), nullptr);
    EXPECT_EQ(registry.info(42), nullptr);
}

TEST_F(TypeRegistryTest, RegistriesAreIndependent) {
    TypeRegistry other;
    other.id<Health>();

    EXPECT_EQ(registry.id<Position>(), 1u);
    EXPECT_EQ(other.id<Position>(), 2u);
}
