/**
 * @file commands.cpp
 * @brief Implementation of the deferred command queue
 *
 * @date 2025-11-02
 */

#include <strata/ecs/commands.hpp>

namespace strata::ecs {

auto Commands::spawn(std::function<void(Entity)> init) -> void {
    queue_.emplace_back(SpawnCommand{std::move(init)});
}

auto Commands::despawn(Entity entity) -> void {
    queue_.emplace_back(DespawnCommand{entity});
}

auto Commands::despawn_bundle(std::span<const Entity> entities) -> void {
    for (const Entity entity : entities) {
        despawn(entity);
    }
}

auto Commands::add(Entity entity, TypeId type, std::any value) -> void {
    queue_.emplace_back(AddCommand{entity, type, std::move(value)});
}

auto Commands::remove(Entity entity, TypeId type) -> void {
    queue_.emplace_back(RemoveCommand{entity, type});
}

auto Commands::drain() -> std::vector<Command> {
    auto out = std::move(queue_);
    queue_.clear();
    return out;
}

} // namespace strata::ecs
