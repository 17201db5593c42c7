/**
 * @file entity.hpp
 * @brief Entity handle for the strata ECS
 *
 * Entities are lightweight value handles (id + generation) that reference
 * a row in exactly one archetype. All entity state lives in the
 * EntityManager metadata table and in archetype columns.
 *
 * ✨ FUNCTIONAL DESIGN ✨
 * - Entities are immutable values (copy freely, compare cheaply)
 * - Generation counter detects stale handles (use-after-free safety)
 * - Generation 0 is never issued, so a default handle is never alive
 *
 * @date 2025-11-02
 */

#pragma once

#include <strata/core/types.hpp>

#include <compare>
#include <format>
#include <functional>

namespace strata::ecs {

/**
 * @brief Handle to an entity
 *
 * - **id**: dense, reusable slot index (starts at 1)
 * - **generation**: bumped every time the slot is reused
 *
 * ✨ IMMUTABLE VALUE TYPE ✨
 *
 * @note Entities are created by World, never constructed directly by users
 *       (the two-argument constructor exists for snapshots and tests)
 */
class Entity {
public:
    /**
     * @brief Construct null entity (id=0, generation=0)
     *
     * ✨ PURE FUNCTION ✨
     */
    constexpr Entity() noexcept = default;

    /**
     * @brief Construct entity from id and generation
     *
     * ✨ PURE FUNCTION ✨
     */
    constexpr Entity(u32 id, u32 generation) noexcept
        : id_(id), generation_(generation) {}

    [[nodiscard]] constexpr auto id() const noexcept -> u32 { return id_; }
    [[nodiscard]] constexpr auto generation() const noexcept -> u32 { return generation_; }

    /**
     * @brief Check if entity is null (default-constructed)
     *
     * ✨ PURE FUNCTION ✨
     */
    [[nodiscard]] constexpr auto is_null() const noexcept -> bool {
        return id_ == 0 && generation_ == 0;
    }

    /**
     * @brief Three-way comparison (ordered by id, then generation)
     */
    [[nodiscard]] constexpr auto operator<=>(const Entity& other) const noexcept = default;

private:
    u32 id_ = 0;
    u32 generation_ = 0;
};

/**
 * @brief Null entity constant
 *
 * Returned by Archetype::remove_row() when no row was displaced.
 */
inline constexpr Entity NULL_ENTITY = Entity();

} // namespace strata::ecs

/**
 * @brief Hash function for Entity (enables use in std::unordered_map)
 *
 * ✨ PURE FUNCTION ✨
 */
template<>
struct std::hash<strata::ecs::Entity> {
    [[nodiscard]] auto operator()(const strata::ecs::Entity& entity) const noexcept -> std::size_t {
        const auto packed = (static_cast<strata::u64>(entity.generation()) << 32) | entity.id();
        return std::hash<strata::u64>{}(packed);
    }
};

/**
 * @brief Formats entities as "e#<id>@<generation>" (used in error messages)
 */
template<>
struct std::formatter<strata::ecs::Entity> : std::formatter<std::string_view> {
    auto format(const strata::ecs::Entity& entity, std::format_context& ctx) const {
        return std::format_to(ctx.out(), "e#{}@{}", entity.id(), entity.generation());
    }
};
