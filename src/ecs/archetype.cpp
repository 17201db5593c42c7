/**
 * @file archetype.cpp
 * @brief Archetype implementation
 *
 * @date 2025-11-02
 */

#include <strata/ecs/archetype.hpp>

#include <format>

namespace strata::ecs {

Archetype::Archetype(u32 id, Signature signature, const TypeRegistry& registry)
    : id_(id)
    , signature_(std::move(signature)) {
    for (const TypeId type : signature_) {
        const auto* info = registry.info(type);
        if (info != nullptr) {
            columns_.emplace(type, info->make_array());
        }
    }
}

auto Archetype::add_row(Entity entity) -> u32 {
    const auto row = static_cast<u32>(entities_.size());
    entities_.push_back(entity);
    return row;
}

auto Archetype::remove_row(u32 row) -> Result<Entity> {
    if (row >= entities_.size()) {
        return make_error(ErrorCode::ECS_ROW_OUT_OF_RANGE,
                          std::format("remove_row out of range: {} (archetype {} has {} rows)",
                                      row, id_, entities_.size()));
    }

    for (auto& [type, column] : columns_) {
        column->swap_remove(row);
    }

    const auto last = static_cast<u32>(entities_.size() - 1);
    if (row == last) {
        entities_.pop_back();
        return NULL_ENTITY;
    }

    const Entity moved = entities_[last];
    entities_[row] = moved;
    entities_.pop_back();
    return moved;
}

auto Archetype::column(TypeId type) -> ComponentArray* {
    const auto it = columns_.find(type);
    return it != columns_.end() ? it->second.get() : nullptr;
}

auto Archetype::column(TypeId type) const -> const ComponentArray* {
    const auto it = columns_.find(type);
    return it != columns_.end() ? it->second.get() : nullptr;
}

} // namespace strata::ecs
