/**
 * @file type_registry.cpp
 * @brief Implementation of the component type registry
 *
 * @date 2025-11-02
 */

#include <strata/ecs/type_registry.hpp>

#include <format>

namespace strata::ecs {

auto TypeRegistry::global() -> TypeRegistry& {
    static TypeRegistry registry;
    return registry;
}

auto TypeRegistry::info(TypeId id) const -> const ComponentTypeInfo* {
    if (id == 0 || id > infos_.size()) {
        return nullptr;
    }
    return &infos_[id - 1];
}

auto TypeRegistry::name(TypeId id) const -> std::string {
    if (const auto* type_info = info(id)) {
        return type_info->name;
    }
    return std::format("#{}", id);
}

} // namespace strata::ecs
