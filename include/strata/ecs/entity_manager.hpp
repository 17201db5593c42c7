/**
 * @file entity_manager.hpp
 * @brief Entity id allocation, recycling and liveness
 *
 * The EntityManager is the identity authority of a World: it hands out
 * entity ids, recycles freed ids with a bumped generation, and keeps the
 * per-id metadata (where the entity's row currently lives).
 *
 * Generation rules:
 * - fresh ids start at generation 1 (generation 0 is never valid)
 * - kill() does not touch the generation
 * - create() bumps the generation when it pops a recycled id
 *
 * @date 2025-11-02
 */

#pragma once

#include <strata/core/types.hpp>
#include <strata/ecs/entity.hpp>

#include <span>
#include <utility>
#include <vector>

namespace strata::ecs {

/**
 * @brief Per-id metadata record
 *
 * generation == 0 means the id has never been allocated.
 */
struct EntityMeta {
    u32 generation = 0;  ///< Current generation of this id
    bool alive = false;  ///< Whether the id is currently allocated
    u32 archetype = 0;   ///< Archetype holding the entity's row
    u32 row = 0;         ///< Row within that archetype
};

/**
 * @brief Exported allocator state (used by snapshots)
 */
struct AllocatorState {
    u32 next_id = 1;                                 ///< Next never-used id
    std::vector<u32> free;                           ///< Recyclable ids (popped from the back)
    std::vector<std::pair<u32, u32>> generations;    ///< (id, generation) for every known id

    auto operator==(const AllocatorState&) const -> bool = default;
};

/**
 * @brief Allocates and recycles entity ids
 *
 * ⚠️ IMPURE CLASS (owns the metadata table)
 */
class EntityManager {
public:
    EntityManager() = default;

    /**
     * @brief Allocates an entity
     *
     * Pops the free list if non-empty (generation + 1, location reset to the
     * empty archetype), otherwise takes the next id with generation 1.
     */
    auto create() -> Entity;

    /**
     * @brief True iff the id is allocated and the generation matches
     *
     * ✨ PURE FUNCTION ✨
     */
    [[nodiscard]] auto is_alive(Entity entity) const noexcept -> bool;

    /**
     * @brief Frees the id of a live entity
     *
     * No-op for stale or already killed handles.
     */
    auto kill(Entity entity) -> void;

    /**
     * @brief Metadata for an id
     *
     * @pre id was allocated at least once (is_alive() or a snapshot entry)
     */
    [[nodiscard]] auto meta(u32 id) -> EntityMeta& { return meta_[id]; }
    [[nodiscard]] auto meta(u32 id) const -> const EntityMeta& { return meta_[id]; }

    /**
     * @brief All metadata records, indexed by id (index 0 unused)
     */
    [[nodiscard]] auto records() const noexcept -> std::span<const EntityMeta> { return meta_; }

    /// Number of alive entities
    [[nodiscard]] auto alive_count() const noexcept -> std::size_t { return alive_count_; }

    /**
     * @brief Exports id counter, free list and generation table
     *
     * ✨ PURE FUNCTION ✨
     */
    [[nodiscard]] auto export_allocator() const -> AllocatorState;

    /**
     * @brief Checks an allocator state for structural consistency
     *
     * Rejects: next_id == 0, generation entries with id 0, generation 0,
     * id >= next_id or duplicate ids, free ids that are 0, >= next_id,
     * lack a generation entry or appear twice.
     *
     * ✨ PURE FUNCTION ✨
     *
     * @return ALLOCATOR_VALIDATION_ERROR describing the first violation
     */
    [[nodiscard]] static auto validate_allocator(const AllocatorState& state) -> Result<void>;

    /**
     * @brief Replaces the allocator with an exported state
     *
     * Validates first; on failure nothing changes. Afterwards every id is
     * dead: callers revive the snapshot's alive entities with revive().
     */
    auto import_allocator(const AllocatorState& state) -> Result<void>;

    /**
     * @brief Marks an imported id alive at a storage location
     *
     * @pre id has a metadata record (import_allocator() created it)
     */
    auto revive(Entity entity, u32 archetype, u32 row) -> void;

private:
    std::vector<EntityMeta> meta_ = std::vector<EntityMeta>(1);  ///< meta_[0] unused
    std::vector<u32> free_;
    u32 next_id_ = 1;
    std::size_t alive_count_ = 0;
};

} // namespace strata::ecs
