/**
 * @file commands.hpp
 * @brief Deferred structural changes
 *
 * Systems and query callbacks may not change structure directly (the World
 * is locked while iterating). They enqueue commands instead; World::flush()
 * replays them in enqueue order once iteration has ended.
 *
 * A spawn command's init callback runs during replay and may enqueue more
 * commands for the new entity; flush() keeps draining until the queue stays
 * empty, so those land in the same flush.
 *
 * @date 2025-11-02
 */

#pragma once

#include <strata/core/types.hpp>
#include <strata/ecs/entity.hpp>
#include <strata/ecs/type_registry.hpp>

#include <any>
#include <functional>
#include <span>
#include <variant>
#include <vector>

namespace strata::ecs {

struct SpawnCommand {
    std::function<void(Entity)> init;  ///< Optional, runs right after the spawn
};

struct DespawnCommand {
    Entity entity;
};

struct AddCommand {
    Entity entity;
    TypeId type;
    std::any value;
};

struct RemoveCommand {
    Entity entity;
    TypeId type;
};

/// One queued structural change
using Command = std::variant<SpawnCommand, DespawnCommand, AddCommand, RemoveCommand>;

/**
 * @brief Ordered queue of deferred structural changes
 *
 * ⚠️ IMPURE CLASS
 *
 * @note Component values are stored in std::any, so queued component types
 *       must be copy constructible
 */
class Commands {
public:
    /**
     * @param registry Registry used to resolve component type ids
     */
    explicit Commands(TypeRegistry& registry) : registry_(&registry) {}

    /**
     * @brief Queue a spawn
     *
     * @param init Called with the new entity during replay
     */
    auto spawn(std::function<void(Entity)> init = {}) -> void;

    /**
     * @brief Queue a spawn whose init adds every value (in argument order)
     *
     * The adds are enqueued when the spawn replays, so they land in the
     * same flush.
     */
    template<typename... Ts>
    auto spawn_bundle(Ts... values) -> void {
        spawn([this, ... values = std::move(values)](Entity entity) mutable {
            (add(entity, std::move(values)), ...);
        });
    }

    auto despawn(Entity entity) -> void;

    /// Queue one despawn per entity, in order
    auto despawn_bundle(std::span<const Entity> entities) -> void;

    /**
     * @brief Queue an add (overwrites in place when the component exists)
     */
    template<typename T>
    auto add(Entity entity, T value) -> void {
        add(entity, registry_->id<T>(), std::any(std::move(value)));
    }

    /// Type-erased add
    auto add(Entity entity, TypeId type, std::any value) -> void;

    /// Queue one add per value, in argument order
    template<typename... Ts>
    auto add_bundle(Entity entity, Ts... values) -> void {
        (add(entity, std::move(values)), ...);
    }

    template<typename T>
    auto remove(Entity entity) -> void {
        remove(entity, registry_->id<T>());
    }

    /// Type-erased remove
    auto remove(Entity entity, TypeId type) -> void;

    /// Queue one remove per type, in argument order
    template<typename... Ts>
    auto remove_bundle(Entity entity) -> void {
        (remove<Ts>(entity), ...);
    }

    /**
     * @brief Empties the queue and returns its contents in enqueue order
     */
    [[nodiscard]] auto drain() -> std::vector<Command>;

    /// Discards everything queued
    auto clear() noexcept -> void { queue_.clear(); }

    [[nodiscard]] auto has_pending() const noexcept -> bool { return !queue_.empty(); }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return queue_.size(); }

private:
    TypeRegistry* registry_;
    std::vector<Command> queue_;
};

} // namespace strata::ecs
