/**
 * @file type_registry.hpp
 * @brief Stable small integer ids for component types
 *
 * Ids are assigned on first use, start at 1 and increase monotonically.
 * They never change for the lifetime of a registry. Signatures are sorted
 * sequences of these ids.
 *
 * The process-wide registry (TypeRegistry::global()) is what a World uses
 * by default. Tests that need deterministic ids construct their own
 * registry and hand it to the World through WorldConfig.
 *
 * @date 2025-11-02
 */

#pragma once

#include <strata/core/types.hpp>
#include <strata/ecs/component_array.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace strata::ecs {

/// Numeric id of a component type (0 is never assigned)
using TypeId = u32;

/**
 * @brief Derives a readable name for T from the compiler's function signature
 *
 * Namespaces are stripped ("game::Position" becomes "Position"); template
 * arguments are kept.
 *
 * ✨ PURE FUNCTION ✨
 */
template<typename T>
[[nodiscard]] auto type_name() -> std::string {
    const std::string_view signature = std::source_location::current().function_name();

    // GCC: "... [with T = game::Position; ...]", Clang: "... [T = game::Position]"
    constexpr std::string_view marker = "T = ";
    const auto start = signature.find(marker);
    if (start == std::string_view::npos) {
        return std::string(typeid(T).name());
    }
    auto name = signature.substr(start + marker.size());
    name = name.substr(0, name.find_first_of(";]"));

    const auto template_start = name.find('<');
    const auto scope = name.substr(0, template_start).rfind("::");
    if (scope != std::string_view::npos) {
        name.remove_prefix(scope + 2);
    }
    return std::string(name);
}

/**
 * @brief Everything the runtime needs to handle a component type erased
 */
struct ComponentTypeInfo {
    TypeId id;                                                  ///< Assigned id (>= 1)
    std::string name;                                           ///< Display name for messages
    std::type_index type;                                       ///< C++ type
    std::function<std::unique_ptr<ComponentArray>()> make_array; ///< Empty column factory
};

/**
 * @brief Maps component types to ids (first use wins)
 *
 * ⚠️ IMPURE CLASS (grows lazily)
 *
 * @note Not thread-safe: the ECS is single-threaded
 */
class TypeRegistry {
public:
    TypeRegistry() = default;

    TypeRegistry(const TypeRegistry&) = delete;
    auto operator=(const TypeRegistry&) -> TypeRegistry& = delete;

    /**
     * @brief Process-wide registry used by worlds without an explicit one
     *
     * ⚠️ IMPURE FUNCTION (returns reference to global state)
     */
    static auto global() -> TypeRegistry&;

    /**
     * @brief Returns the id of T, assigning the next id on first use
     *
     * ⚠️ IMPURE (may register T)
     */
    template<typename T>
    auto id() -> TypeId {
        using Component = std::remove_cvref_t<T>;
        const std::type_index key(typeid(Component));
        if (const auto it = ids_.find(key); it != ids_.end()) {
            return it->second;
        }

        const auto id = static_cast<TypeId>(infos_.size() + 1);
        infos_.push_back(ComponentTypeInfo{
            .id = id,
            .name = type_name<Component>(),
            .type = key,
            .make_array = &make_component_array<Component>,
        });
        ids_.emplace(key, id);
        return id;
    }

    /**
     * @brief Looks up the id of T without registering it
     *
     * ✨ PURE FUNCTION ✨
     */
    template<typename T>
    [[nodiscard]] auto find_id() const -> std::optional<TypeId> {
        if (const auto it = ids_.find(std::type_index(typeid(T))); it != ids_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    /**
     * @brief Type info for an id
     *
     * @return nullptr for ids this registry never assigned
     */
    [[nodiscard]] auto info(TypeId id) const -> const ComponentTypeInfo*;

    /**
     * @brief Display name for an id ("#<id>" when unknown)
     */
    [[nodiscard]] auto name(TypeId id) const -> std::string;

    /// Number of registered types
    [[nodiscard]] auto size() const noexcept -> std::size_t { return infos_.size(); }

private:
    std::vector<ComponentTypeInfo> infos_;                  ///< Indexed by id - 1
    std::unordered_map<std::type_index, TypeId> ids_;
};

} // namespace strata::ecs
