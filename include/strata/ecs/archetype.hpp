/**
 * @file archetype.hpp
 * @brief Column storage for one exact component signature
 *
 * An archetype is a table: every entity whose component set equals the
 * archetype's signature has one row here. Rows are stored as Structure of
 * Arrays (one contiguous column per component type plus the entity column).
 *
 * **Row protocol**:
 * - add_row() appends the entity and returns its row
 * - the caller then pushes exactly one value into every column, in
 *   signature order, before touching the archetype again
 * - remove_row() swap-removes and reports which entity moved
 *
 * **Performance Characteristics**:
 * - Add row: O(1) amortized
 * - Remove row: O(columns) swap-and-pop
 * - Column lookup: hash map hit
 *
 * ⚠️ IMPURE CLASS (manages mutable storage)
 *
 * @note Archetypes are created by World, not directly by users
 *
 * @date 2025-11-02
 */

#pragma once

#include <strata/core/types.hpp>
#include <strata/ecs/component_array.hpp>
#include <strata/ecs/entity.hpp>
#include <strata/ecs/signature.hpp>
#include <strata/ecs/type_registry.hpp>

#include <memory>
#include <span>
#include <unordered_map>
#include <vector>

namespace strata::ecs {

class Archetype {
public:
    /**
     * @brief Creates an empty table with one column per signature entry
     *
     * @param id Archetype id (0 is the empty-signature archetype)
     * @param signature Sorted component type ids
     * @param registry Registry that assigned the ids (provides column factories)
     */
    Archetype(u32 id, Signature signature, const TypeRegistry& registry);

    Archetype(const Archetype&) = delete;
    auto operator=(const Archetype&) -> Archetype& = delete;

    /**
     * @brief Appends an entity row
     *
     * ⚠️ IMPURE (the caller must push one value per column next)
     *
     * @return Index of the new row
     */
    auto add_row(Entity entity) -> u32;

    /**
     * @brief Swap-removes a row
     *
     * ⚠️ IMPURE
     *
     * If `row` is not the last row, the last row's entity and values move
     * into `row`.
     *
     * @return The entity now occupying `row`, NULL_ENTITY if `row` was last,
     *         ECS_ROW_OUT_OF_RANGE if `row` does not exist
     */
    auto remove_row(u32 row) -> Result<Entity>;

    /// Does the signature contain this type?
    [[nodiscard]] auto has(TypeId type) const -> bool { return columns_.contains(type); }

    /**
     * @brief Column for a type of the signature
     *
     * @return nullptr if the type is not part of the signature
     */
    [[nodiscard]] auto column(TypeId type) -> ComponentArray*;
    [[nodiscard]] auto column(TypeId type) const -> const ComponentArray*;

    /**
     * @brief Typed column access
     *
     * @pre `type` was assigned to T by this archetype's registry
     * @return nullptr if the type is not part of the signature
     */
    template<typename T>
    [[nodiscard]] auto column_as(TypeId type) -> TypedComponentArray<T>* {
        return static_cast<TypedComponentArray<T>*>(column(type));
    }

    template<typename T>
    [[nodiscard]] auto column_as(TypeId type) const -> const TypedComponentArray<T>* {
        return static_cast<const TypedComponentArray<T>*>(column(type));
    }

    /// Entity handle per row
    [[nodiscard]] auto entities() const noexcept -> std::span<const Entity> { return entities_; }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return entities_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return entities_.empty(); }
    [[nodiscard]] auto id() const noexcept -> u32 { return id_; }
    [[nodiscard]] auto signature() const noexcept -> const Signature& { return signature_; }

private:
    u32 id_;
    Signature signature_;
    std::vector<Entity> entities_;
    std::unordered_map<TypeId, std::unique_ptr<ComponentArray>> columns_;  ///< One per signature entry
};

} // namespace strata::ecs
