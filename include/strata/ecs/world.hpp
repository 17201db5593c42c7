/**
 * @file world.hpp
 * @brief ECS World - owner of all entities, archetypes, resources and events
 *
 * The World is the orchestrator of strata's archetype store:
 * - **Entity metadata** (EntityManager): id, generation, current row
 * - **Archetypes**: one table per exact component signature, indexed by the
 *   canonical signature key; archetype 0 (empty signature) always exists
 * - **Commands**: deferred structural changes, replayed by flush()
 * - **Resources**: typed singletons, not tied to any entity
 * - **Event channels**: double-buffered, swapped at phase boundaries
 *
 * **Move-on-mutation**: adding or removing a component moves the entity's
 * row to the archetype of the new signature (append to destination, point
 * the metadata there, swap-remove from the source, fix the displaced row).
 *
 * **Iteration lock**: every query form holds the lock while it runs; any
 * structural change (spawn, despawn, add, remove, flush, snapshot,
 * restore) attempted meanwhile fails with
 * ECS_STRUCTURAL_CHANGE_WHILE_ITERATING. Use cmd() and flush afterwards.
 *
 * **Usage Example**:
 * @code
 * World world;
 *
 * auto entity = world.spawn();
 * if (!entity) { ... }
 * world.add(*entity, Position{0.0f, 0.0f});
 * world.add(*entity, Velocity{1.0f, 0.0f});
 *
 * world.each<Position, const Velocity>([&](Entity e, Position& p, const Velocity& v) {
 *     p.x += v.dx * dt;
 * });
 * @endcode
 *
 * ⚠️ IMPURE CLASS (manages mutable state)
 *
 * @note Single-threaded: systems run sequentially, nothing is locked
 *
 * @date 2025-11-02
 */

#pragma once

#include <strata/core/config.hpp>
#include <strata/core/logging.hpp>
#include <strata/core/types.hpp>
#include <strata/ecs/archetype.hpp>
#include <strata/ecs/commands.hpp>
#include <strata/ecs/entity.hpp>
#include <strata/ecs/entity_manager.hpp>
#include <strata/ecs/events.hpp>
#include <strata/ecs/profiler.hpp>
#include <strata/ecs/query.hpp>
#include <strata/ecs/signature.hpp>
#include <strata/ecs/snapshot.hpp>
#include <strata/ecs/type_registry.hpp>

#include <any>
#include <array>
#include <format>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace strata::ecs {

class World;
class Schedule;

/// A system: called once per frame with the world and the frame's dt
using SystemFn = std::function<void(World&, f64)>;

/**
 * @brief Code-level World configuration
 */
struct WorldConfig {
    bool profiling_enabled = true;                          ///< Record frame timings
    std::size_t history_capacity = DEFAULT_HISTORY_CAPACITY; ///< Frames of timing history
    TypeRegistry* registry = nullptr;                       ///< nullptr = TypeRegistry::global()
};

/**
 * @brief World settings from a loaded RuntimeConfig (uses the global registry)
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] inline auto to_world_config(const RuntimeConfig& config) -> WorldConfig {
    return WorldConfig{
        .profiling_enabled = config.profiling_enabled,
        .history_capacity = config.history_capacity,
        .registry = nullptr,
    };
}

/**
 * @brief Which frame driver a World is bound to
 *
 * UNUSED -> SIMPLE (add_system / update) or UNUSED -> PHASED (Schedule).
 * Every other transition is a lifecycle conflict.
 */
enum class Lifecycle : u8 {
    UNUSED,
    SIMPLE,
    PHASED,
};

namespace detail {

template<typename... Ts>
struct unique_types : std::true_type {};

template<typename T, typename... Rest>
struct unique_types<T, Rest...>
    : std::bool_constant<(!std::is_same_v<T, Rest> && ...) && unique_types<Rest...>::value> {};

} // namespace detail

class World {
public:
    explicit World(WorldConfig config = {});
    ~World() = default;

    World(const World&) = delete;
    auto operator=(const World&) -> World& = delete;
    World(World&&) = delete;
    auto operator=(World&&) -> World& = delete;

    // ========================================================================
    // Entity Lifecycle
    // ========================================================================

    /**
     * @brief Creates an entity with no components (archetype 0)
     *
     * @return New entity, or ECS_STRUCTURAL_CHANGE_WHILE_ITERATING
     */
    [[nodiscard]] auto spawn() -> Result<Entity>;

    /**
     * @brief Creates an entity directly in the archetype of its initial components
     *
     * One row placement, no intermediate moves.
     */
    template<typename... Ts>
    [[nodiscard]] auto spawn_with(Ts... values) -> Result<Entity>;

    /**
     * @brief Destroys an entity and frees its id
     *
     * @return ECS_STALE_ENTITY, ECS_STRUCTURAL_CHANGE_WHILE_ITERATING
     */
    auto despawn(Entity entity) -> Result<void>;

    /**
     * @brief Despawns in order, stopping at the first failure
     */
    auto despawn_many(std::span<const Entity> entities) -> Result<void>;

    [[nodiscard]] auto is_alive(Entity entity) const noexcept -> bool {
        return entities_.is_alive(entity);
    }

    // ========================================================================
    // Components
    // ========================================================================

    /**
     * @brief Adds a component, or overwrites it in place if already present
     *
     * @warning Adding a component the entity already has is NOT an error:
     *          the existing value is replaced, the entity stays in its
     *          archetype and no row moves.
     *
     * @return ECS_STALE_ENTITY, ECS_STRUCTURAL_CHANGE_WHILE_ITERATING
     */
    template<typename T>
    auto add(Entity entity, T value) -> Result<void>;

    /**
     * @brief Type-erased add (used by command replay)
     *
     * @return also ECS_UNKNOWN_COMPONENT_TYPE, ECS_COMPONENT_TYPE_MISMATCH
     */
    auto add(Entity entity, TypeId type, std::any value) -> Result<void>;

    /**
     * @brief Adds several components with a single move
     *
     * Values for components already present overwrite them.
     */
    template<typename... Ts>
    auto add_many(Entity entity, Ts... values) -> Result<void>;

    /**
     * @brief Removes a component (no-op if absent)
     */
    template<typename T>
    auto remove(Entity entity) -> Result<void> {
        const std::array<TypeId, 1> types{registry_->id<T>()};
        return remove_types("remove", entity, types);
    }

    /// Type-erased remove (used by command replay)
    auto remove(Entity entity, TypeId type) -> Result<void>;

    /**
     * @brief Removes several components with a single move
     */
    template<typename... Ts>
    auto remove_many(Entity entity) -> Result<void> {
        const std::array<TypeId, sizeof...(Ts)> types{registry_->id<Ts>()...};
        return remove_types("remove_many", entity, types);
    }

    /**
     * @brief Component of an entity
     *
     * @return nullptr for stale entities or missing components
     * @note Pointer is valid until the next structural change
     */
    template<typename T>
    [[nodiscard]] auto get(Entity entity) -> T* {
        return const_cast<T*>(std::as_const(*this).template get<T>(entity));
    }

    template<typename T>
    [[nodiscard]] auto get(Entity entity) const -> const T*;

    template<typename T>
    [[nodiscard]] auto has(Entity entity) const -> bool {
        return get<T>(entity) != nullptr;
    }

    [[nodiscard]] auto has(Entity entity, TypeId type) const -> bool;

    /**
     * @brief Replaces an existing component (non-structural)
     *
     * @return ECS_STALE_ENTITY, ECS_MISSING_COMPONENT
     */
    template<typename T>
    auto set(Entity entity, T value) -> Result<void>;

    // ========================================================================
    // Queries
    // ========================================================================

    /**
     * @brief Lazy rows (entity, Ts&...) of every entity having all of Ts
     *
     * Holds the iteration lock until exhausted or destroyed.
     */
    template<typename... Ts>
    [[nodiscard]] auto query() -> Query<Ts...> {
        const std::array<TypeId, sizeof...(Ts)> types{registry_->id<Ts>()...};
        return Query<Ts...>(matching_archetypes(types), types, iteration_depth_);
    }

    /**
     * @brief One raw-column table per matching archetype
     */
    template<typename... Ts>
    [[nodiscard]] auto query_tables() -> QueryTables<Ts...> {
        const std::array<TypeId, sizeof...(Ts)> types{registry_->id<Ts>()...};
        return QueryTables<Ts...>(matching_archetypes(types), types, iteration_depth_);
    }

    /**
     * @brief Calls fn(Entity, Ts&...) for every matching row
     */
    template<typename... Ts, typename Fn>
    auto each(Fn&& fn) -> void;

    /**
     * @brief Calls fn(Entity, const Ts&...) for every matching row
     */
    template<typename... Ts, typename Fn>
    auto each(Fn&& fn) const -> void;

    /// True while any query form is running
    [[nodiscard]] auto is_iterating() const noexcept -> bool { return iteration_depth_ > 0; }

    // ========================================================================
    // Deferred Commands
    // ========================================================================

    /// Command queue for structural changes during iteration
    [[nodiscard]] auto cmd() noexcept -> Commands& { return commands_; }

    /**
     * @brief Replays queued commands until the queue stays empty
     *
     * A failing command is logged and skipped; the remaining commands still
     * run and the first failure is returned.
     *
     * @return ECS_STRUCTURAL_CHANGE_WHILE_ITERATING, or the first command error
     */
    auto flush() -> Result<void>;

    [[nodiscard]] auto has_pending_commands() const noexcept -> bool { return commands_.has_pending(); }

    // ========================================================================
    // Events
    // ========================================================================

    /// Channel for T (created on first use)
    template<typename T>
    auto events() -> EventChannel<T>&;

    /// Emits into the current phase
    template<typename T>
    auto emit(T event) -> void {
        events<T>().emit(std::move(event));
    }

    /**
     * @brief Drains readable events of T (no-op if the channel does not exist)
     */
    template<typename T, typename Fn>
    auto drain_events(Fn&& fn) -> void;

    /// Clears readable events of T
    template<typename T>
    auto clear_events() -> void;

    /// Clears readable events of every channel
    auto clear_events() -> void;

    /**
     * @brief Phase boundary: delivers this phase's events to the next
     */
    auto swap_events() -> void;

    // ========================================================================
    // Resources
    // ========================================================================

    /// Inserts or replaces a resource (not structural, legal while iterating)
    template<typename T>
    auto set_resource(T value) -> void {
        resources_.insert_or_assign(std::type_index(typeid(T)), std::any(std::move(value)));
    }

    /// @return nullptr if missing
    template<typename T>
    [[nodiscard]] auto get_resource() -> T*;

    template<typename T>
    [[nodiscard]] auto get_resource() const -> const T*;

    /// @return ECS_MISSING_RESOURCE if missing
    template<typename T>
    [[nodiscard]] auto require_resource() -> Result<T*>;

    template<typename T>
    [[nodiscard]] auto has_resource() const -> bool {
        return resources_.contains(std::type_index(typeid(T)));
    }

    /// @return false if it was missing
    template<typename T>
    auto remove_resource() -> bool {
        return resources_.erase(std::type_index(typeid(T))) > 0;
    }

    /**
     * @brief Returns the resource, inserting factory() first if missing
     *
     * The factory runs at most once per missing resource.
     */
    template<typename T, typename Factory>
    auto init_resource(Factory&& factory) -> T&;

    // ========================================================================
    // Systems (single-pass lifecycle)
    // ========================================================================

    /**
     * @brief Registers a system for update()
     *
     * @return ECS_LIFECYCLE_CONFLICT if this world is driven by a Schedule
     */
    auto add_system(std::string name, SystemFn fn) -> Result<void>;

    /**
     * @brief Runs every system once, in registration order
     *
     * Systems may change structure directly; only code inside a query must
     * go through cmd(). Afterwards pending commands are flushed and events
     * swap. When a system throws, its timing is recorded, the flush and swap
     * still run, the frame is closed and the exception is rethrown.
     *
     * @return ECS_LIFECYCLE_CONFLICT, or the flush result
     */
    auto update(f64 dt) -> Result<void>;

    [[nodiscard]] auto lifecycle() const noexcept -> Lifecycle { return lifecycle_; }

    // ========================================================================
    // Stats
    // ========================================================================

    [[nodiscard]] auto stats() const -> WorldStats;
    [[nodiscard]] auto stats_history() const -> StatsHistory { return profiler_.history(); }

    auto set_profiling_enabled(bool enabled) -> void { profiler_.set_enabled(enabled); }
    auto set_profiling_history_size(std::size_t capacity) -> void { profiler_.set_history_capacity(capacity); }

    // ========================================================================
    // Snapshots
    // ========================================================================

    template<typename T>
    auto register_component_snapshot(SnapshotCodec<T> codec) -> Result<void> {
        const TypeId type = registry_->id<T>();
        return snapshots_.register_component<T>(type, registry_->name(type), std::move(codec));
    }

    template<typename T>
    auto unregister_component_snapshot() -> bool {
        const auto type = registry_->find_id<T>();
        return type && snapshots_.unregister_component(*type);
    }

    template<typename T>
    auto register_resource_snapshot(SnapshotCodec<T> codec) -> Result<void> {
        return snapshots_.register_resource<T>(std::move(codec));
    }

    template<typename T>
    auto unregister_resource_snapshot() -> bool {
        return snapshots_.unregister_resource(std::type_index(typeid(T)));
    }

    /**
     * @brief Exports alive entities, registered components and resources
     *
     * Flushes pending commands first. Unregistered component and resource
     * types are left out.
     *
     * @return ECS_STRUCTURAL_CHANGE_WHILE_ITERATING, or a flush error
     */
    [[nodiscard]] auto snapshot() -> Result<WorldSnapshot>;

    /**
     * @brief Replaces entities, archetypes, resources and allocator state
     *
     * Everything is validated before anything changes. On commit pending
     * commands are discarded and all event buffers cleared; systems and
     * codecs are kept.
     *
     * @return ECS_STRUCTURAL_CHANGE_WHILE_ITERATING, SNAPSHOT_FORMAT_MISMATCH,
     *         SNAPSHOT_VALIDATION_ERROR, ALLOCATOR_VALIDATION_ERROR
     */
    auto restore(const WorldSnapshot& snapshot) -> Result<void>;

    // ========================================================================
    // Introspection
    // ========================================================================

    [[nodiscard]] auto type_registry() noexcept -> TypeRegistry& { return *registry_; }

    [[nodiscard]] auto archetype_count() const noexcept -> std::size_t { return archetypes_.size(); }

    /// @return nullptr for unknown ids
    [[nodiscard]] auto archetype(u32 id) const -> const Archetype*;

    /**
     * @brief Storage location of an alive entity
     *
     * @return nullptr for stale entities
     */
    [[nodiscard]] auto location(Entity entity) const -> const EntityMeta*;

    [[nodiscard]] auto entity_count() const noexcept -> std::size_t { return entities_.alive_count(); }

private:
    friend class Schedule;

    /// Pushes a new value into `column` if `type` is one of the added types
    using ColumnFiller = std::function<bool(TypeId, ComponentArray&)>;

    auto ensure_alive(Entity entity, std::string_view op, std::span<const TypeId> types) const -> Result<void>;
    auto ensure_not_iterating(std::string_view op) const -> Result<void>;

    /// "op(Position, Velocity)"
    [[nodiscard]] auto describe(std::string_view op, std::span<const TypeId> types) const -> std::string;

    auto get_or_create_archetype(const Signature& signature) -> Archetype&;
    auto reset_archetypes() -> void;
    [[nodiscard]] auto matching_archetypes(std::span<const TypeId> types) const -> std::vector<Archetype*>;

    auto move_entity(Entity entity, Archetype& destination, const ColumnFiller& fill) -> Result<void>;
    auto place_entity(Entity entity, Archetype& archetype, const ColumnFiller& fill) -> void;
    auto remove_types(std::string_view op, Entity entity, std::span<const TypeId> types) -> Result<void>;
    auto apply(Command&& command) -> Result<void>;

    template<typename... Ts, std::size_t... Is>
    static auto push_matching(TypeId type, ComponentArray& column,
                              const std::array<TypeId, sizeof...(Ts)>& types,
                              std::index_sequence<Is...>, Ts&... values) -> bool {
        return ((types[Is] == type
                     ? (static_cast<TypedComponentArray<Ts>&>(column).push(std::move(values)), true)
                     : false) || ...);
    }

    /**
     * @brief Moves to `target` lifecycle or fails with ECS_LIFECYCLE_CONFLICT
     *
     * @param caller Entry point for the message ("World::update()")
     */
    auto enter_lifecycle(Lifecycle target, std::string_view caller) -> Result<void>;

    struct System {
        std::string name;
        SystemFn fn;
    };

    TypeRegistry* registry_;
    EntityManager entities_;
    std::vector<std::unique_ptr<Archetype>> archetypes_;          ///< Indexed by archetype id
    std::unordered_map<std::string, u32> archetype_index_;        ///< Signature key -> id
    Commands commands_;
    std::unordered_map<std::type_index, std::any> resources_;
    std::unordered_map<std::type_index, std::unique_ptr<EventChannelBase>> events_;
    std::vector<System> systems_;
    std::size_t scheduled_systems_ = 0;                           ///< Registered through Schedule::add()
    Lifecycle lifecycle_ = Lifecycle::UNUSED;
    Profiler profiler_;
    SnapshotRegistry snapshots_;
    mutable u32 iteration_depth_ = 0;
};

// ============================================================================
// Template Implementations
// ============================================================================

template<typename... Ts>
auto World::spawn_with(Ts... values) -> Result<Entity> {
    static_assert(detail::unique_types<Ts...>::value, "spawn_with() takes each component type once");

    if (auto ok = ensure_not_iterating("spawn"); !ok) {
        return std::unexpected(ok.error());
    }

    const std::array<TypeId, sizeof...(Ts)> types{registry_->id<Ts>()...};
    Archetype& archetype = get_or_create_archetype(make_signature(types));

    const Entity entity = entities_.create();
    place_entity(entity, archetype, [&](TypeId type, ComponentArray& column) {
        return push_matching<Ts...>(type, column, types, std::index_sequence_for<Ts...>{}, values...);
    });
    return entity;
}

template<typename T>
auto World::add(Entity entity, T value) -> Result<void> {
    return add_many(entity, std::move(value));
}

template<typename... Ts>
auto World::add_many(Entity entity, Ts... values) -> Result<void> {
    static_assert(detail::unique_types<Ts...>::value, "add_many() takes each component type once");

    const std::array<TypeId, sizeof...(Ts)> types{registry_->id<Ts>()...};
    const std::string_view op = sizeof...(Ts) == 1 ? "add" : "add_many";

    if (auto ok = ensure_alive(entity, op, types); !ok) {
        return ok;
    }
    if (auto ok = ensure_not_iterating(op); !ok) {
        return ok;
    }

    const auto& meta = entities_.meta(entity.id());
    Archetype& source = *archetypes_[meta.archetype];

    bool all_present = true;
    for (const TypeId type : types) {
        all_present = all_present && source.has(type);
    }

    if (all_present) {
        // overwrite in place: no move, archetype unchanged
        std::size_t i = 0;
        ((source.column_as<Ts>(types[i++])->at(meta.row) = std::move(values)), ...);
        return {};
    }

    Archetype& destination = get_or_create_archetype(merge_signature(source.signature(), types));
    return move_entity(entity, destination, [&](TypeId type, ComponentArray& column) {
        return push_matching<Ts...>(type, column, types, std::index_sequence_for<Ts...>{}, values...);
    });
}

template<typename T>
auto World::get(Entity entity) const -> const T* {
    if (!entities_.is_alive(entity)) {
        return nullptr;
    }
    const auto type = registry_->find_id<T>();
    if (!type) {
        return nullptr;
    }

    const auto& meta = entities_.meta(entity.id());
    const auto* column = archetypes_[meta.archetype]->column_as<T>(*type);
    return column != nullptr ? &column->at(meta.row) : nullptr;
}

template<typename T>
auto World::set(Entity entity, T value) -> Result<void> {
    const std::array<TypeId, 1> types{registry_->id<T>()};
    if (auto ok = ensure_alive(entity, "set", types); !ok) {
        return ok;
    }

    T* cell = get<T>(entity);
    if (cell == nullptr) {
        return make_error(ErrorCode::ECS_MISSING_COMPONENT,
                          std::format("set({}) requires component to exist on {}; use add()",
                                      registry_->name(types[0]), entity));
    }
    *cell = std::move(value);
    return {};
}

template<typename... Ts, typename Fn>
auto World::each(Fn&& fn) -> void {
    const std::array<TypeId, sizeof...(Ts)> types{registry_->id<Ts>()...};
    const auto matches = matching_archetypes(types);
    IterationLock lock(iteration_depth_);

    [&]<std::size_t... Is>(std::index_sequence<Is...>) {
        for (Archetype* archetype : matches) {
            const auto entities = archetype->entities();
            const std::tuple<Ts*...> columns{archetype->template column_as<std::remove_const_t<Ts>>(types[Is])->data().data()...};
            for (std::size_t row = 0; row < entities.size(); ++row) {
                fn(entities[row], std::get<Is>(columns)[row]...);
            }
        }
    }(std::index_sequence_for<Ts...>{});
}

template<typename... Ts, typename Fn>
auto World::each(Fn&& fn) const -> void {
    std::array<TypeId, sizeof...(Ts)> types{};
    std::size_t i = 0;
    for (const auto type : {registry_->find_id<Ts>()...}) {
        if (!type) {
            return;  // a type never used as a component matches nothing
        }
        types[i++] = *type;
    }

    const auto matches = matching_archetypes(types);
    IterationLock lock(iteration_depth_);

    [&]<std::size_t... Is>(std::index_sequence<Is...>) {
        for (const Archetype* archetype : matches) {
            const auto entities = archetype->entities();
            const std::tuple<const Ts*...> columns{archetype->template column_as<std::remove_const_t<Ts>>(types[Is])->data().data()...};
            for (std::size_t row = 0; row < entities.size(); ++row) {
                fn(entities[row], std::get<Is>(columns)[row]...);
            }
        }
    }(std::index_sequence_for<Ts...>{});
}

template<typename T>
auto World::events() -> EventChannel<T>& {
    auto& slot = events_[std::type_index(typeid(T))];
    if (!slot) {
        slot = std::make_unique<EventChannel<T>>();
    }
    return static_cast<EventChannel<T>&>(*slot);
}

template<typename T, typename Fn>
auto World::drain_events(Fn&& fn) -> void {
    const auto it = events_.find(std::type_index(typeid(T)));
    if (it == events_.end()) {
        return;
    }
    static_cast<EventChannel<T>&>(*it->second).drain(std::forward<Fn>(fn));
}

template<typename T>
auto World::clear_events() -> void {
    if (const auto it = events_.find(std::type_index(typeid(T))); it != events_.end()) {
        it->second->clear();
    }
}

template<typename T>
auto World::get_resource() -> T* {
    const auto it = resources_.find(std::type_index(typeid(T)));
    return it != resources_.end() ? std::any_cast<T>(&it->second) : nullptr;
}

template<typename T>
auto World::get_resource() const -> const T* {
    const auto it = resources_.find(std::type_index(typeid(T)));
    return it != resources_.end() ? std::any_cast<T>(&it->second) : nullptr;
}

template<typename T>
auto World::require_resource() -> Result<T*> {
    if (T* value = get_resource<T>()) {
        return value;
    }
    return make_error(ErrorCode::ECS_MISSING_RESOURCE,
                      std::format("missing resource {}", type_name<T>()));
}

template<typename T, typename Factory>
auto World::init_resource(Factory&& factory) -> T& {
    const std::type_index key(typeid(T));
    auto it = resources_.find(key);
    if (it == resources_.end()) {
        it = resources_.emplace(key, std::any(T(std::forward<Factory>(factory)()))).first;
    }
    return *std::any_cast<T>(&it->second);
}

} // namespace strata::ecs
