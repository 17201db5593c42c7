/**
 * @file entity_manager.cpp
 * @brief Implementation of entity id allocation
 *
 * @date 2025-11-02
 */

#include <strata/ecs/entity_manager.hpp>

#include <format>
#include <unordered_set>

namespace strata::ecs {

auto EntityManager::create() -> Entity {
    ++alive_count_;

    if (!free_.empty()) {
        const u32 id = free_.back();
        free_.pop_back();

        auto& record = meta_[id];
        record.alive = true;
        record.generation += 1;  // bump generation on reuse
        record.archetype = 0;
        record.row = 0;
        return Entity(id, record.generation);
    }

    const u32 id = next_id_++;
    if (meta_.size() <= id) {
        meta_.resize(id + 1);
    }
    meta_[id] = EntityMeta{.generation = 1, .alive = true, .archetype = 0, .row = 0};
    return Entity(id, 1);
}

auto EntityManager::is_alive(Entity entity) const noexcept -> bool {
    if (entity.id() == 0 || entity.id() >= meta_.size()) {
        return false;
    }
    const auto& record = meta_[entity.id()];
    return record.alive && record.generation == entity.generation();
}

auto EntityManager::kill(Entity entity) -> void {
    if (!is_alive(entity)) {
        return;
    }
    meta_[entity.id()].alive = false;
    free_.push_back(entity.id());
    --alive_count_;
}

auto EntityManager::export_allocator() const -> AllocatorState {
    AllocatorState state;
    state.next_id = next_id_;
    state.free = free_;
    for (u32 id = 1; id < meta_.size(); ++id) {
        if (meta_[id].generation == 0) {
            continue;
        }
        state.generations.emplace_back(id, meta_[id].generation);
    }
    return state;
}

auto EntityManager::validate_allocator(const AllocatorState& state) -> Result<void> {
    if (state.next_id == 0) {
        return make_error(ErrorCode::ALLOCATOR_VALIDATION_ERROR,
                          "Invalid snapshot allocator next_id: 0");
    }

    std::unordered_set<u32> seen_generations;
    for (const auto& [id, generation] : state.generations) {
        if (id == 0) {
            return make_error(ErrorCode::ALLOCATOR_VALIDATION_ERROR,
                              "Invalid snapshot allocator generations id: 0");
        }
        if (generation == 0) {
            return make_error(ErrorCode::ALLOCATOR_VALIDATION_ERROR,
                              std::format("Invalid snapshot allocator generation for id {}: 0", id));
        }
        if (id >= state.next_id) {
            return make_error(ErrorCode::ALLOCATOR_VALIDATION_ERROR,
                              std::format("Invalid snapshot allocator generation id {}: must be < next_id ({})",
                                          id, state.next_id));
        }
        if (!seen_generations.insert(id).second) {
            return make_error(ErrorCode::ALLOCATOR_VALIDATION_ERROR,
                              std::format("Duplicate snapshot allocator generation entry for id {}", id));
        }
    }

    std::unordered_set<u32> seen_free;
    for (const u32 id : state.free) {
        if (id == 0) {
            return make_error(ErrorCode::ALLOCATOR_VALIDATION_ERROR,
                              "Invalid snapshot allocator free id: 0");
        }
        if (id >= state.next_id) {
            return make_error(ErrorCode::ALLOCATOR_VALIDATION_ERROR,
                              std::format("Invalid snapshot allocator free id {}: must be < next_id ({})",
                                          id, state.next_id));
        }
        if (!seen_generations.contains(id)) {
            return make_error(ErrorCode::ALLOCATOR_VALIDATION_ERROR,
                              std::format("Invalid snapshot allocator free id {}: missing generation entry", id));
        }
        if (!seen_free.insert(id).second) {
            return make_error(ErrorCode::ALLOCATOR_VALIDATION_ERROR,
                              std::format("Duplicate snapshot allocator free id {}", id));
        }
    }

    return {};
}

auto EntityManager::import_allocator(const AllocatorState& state) -> Result<void> {
    if (auto valid = validate_allocator(state); !valid) {
        return valid;
    }

    meta_.assign(state.next_id, EntityMeta{});
    for (const auto& [id, generation] : state.generations) {
        meta_[id].generation = generation;
    }
    free_ = state.free;
    next_id_ = state.next_id;
    alive_count_ = 0;
    return {};
}

auto EntityManager::revive(Entity entity, u32 archetype, u32 row) -> void {
    auto& record = meta_[entity.id()];
    if (!record.alive) {
        ++alive_count_;
    }
    record.generation = entity.generation();
    record.alive = true;
    record.archetype = archetype;
    record.row = row;
}

} // namespace strata::ecs
