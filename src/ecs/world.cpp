/**
 * @file world.cpp
 * @brief Implementation of ECS World
 *
 * @date 2025-11-02
 */

#include <strata/ecs/world.hpp>
#include <strata/core/time.hpp>

#include <format>

namespace strata::ecs {

namespace {

auto lifecycle_owner(Lifecycle lifecycle) -> std::string_view {
    switch (lifecycle) {
        case Lifecycle::SIMPLE: return "World::add_system()/World::update()";
        case Lifecycle::PHASED: return "Schedule::add()/Schedule::run()";
        case Lifecycle::UNUSED: break;
    }
    return "nothing";
}

} // anonymous namespace

World::World(WorldConfig config)
    : registry_(config.registry != nullptr ? config.registry : &TypeRegistry::global())
    , commands_(*registry_)
    , profiler_(config.profiling_enabled, config.history_capacity) {
    reset_archetypes();
    LOG_DEBUG("World created (profiling: {}, history: {} frames)",
              config.profiling_enabled, config.history_capacity);
}

// ============================================================================
// Guards
// ============================================================================

auto World::describe(std::string_view op, std::span<const TypeId> types) const -> std::string {
    if (types.empty()) {
        return std::string(op);
    }

    std::string label = std::format("{}(", op);
    for (std::size_t i = 0; i < types.size(); ++i) {
        if (i > 0) {
            label += ", ";
        }
        label += registry_->name(types[i]);
    }
    label += ')';
    return label;
}

auto World::ensure_alive(Entity entity, std::string_view op, std::span<const TypeId> types) const -> Result<void> {
    if (!entities_.is_alive(entity)) {
        return make_error(ErrorCode::ECS_STALE_ENTITY,
                          std::format("{} failed: stale entity {}", describe(op, types), entity));
    }
    return {};
}

auto World::ensure_not_iterating(std::string_view op) const -> Result<void> {
    if (iteration_depth_ > 0) {
        return make_error(ErrorCode::ECS_STRUCTURAL_CHANGE_WHILE_ITERATING,
                          std::format("Cannot do structural change ({}) while iterating. "
                                      "Use world.cmd() and flush at end of frame.", op));
    }
    return {};
}

auto World::enter_lifecycle(Lifecycle target, std::string_view caller) -> Result<void> {
    if (lifecycle_ == target) {
        return {};
    }
    if (lifecycle_ == Lifecycle::UNUSED) {
        lifecycle_ = target;
        return {};
    }

    const std::string message = std::format(
        "ECS Lifecycle Conflict Detected! {} called on a world driven by {}. "
        "A world runs either World::update() or Schedule::run(), never both.",
        caller, lifecycle_owner(lifecycle_));
    LOG_ERROR("{}", message);
    return make_error(ErrorCode::ECS_LIFECYCLE_CONFLICT, message);
}

// ============================================================================
// Entity Lifecycle
// ============================================================================

auto World::spawn() -> Result<Entity> {
    if (auto ok = ensure_not_iterating("spawn"); !ok) {
        return std::unexpected(ok.error());
    }

    const Entity entity = entities_.create();
    place_entity(entity, *archetypes_[0], {});
    return entity;
}

auto World::despawn(Entity entity) -> Result<void> {
    if (auto ok = ensure_alive(entity, "despawn", {}); !ok) {
        return ok;
    }
    if (auto ok = ensure_not_iterating("despawn"); !ok) {
        return ok;
    }

    const auto meta = entities_.meta(entity.id());
    auto displaced = archetypes_[meta.archetype]->remove_row(meta.row);
    if (!displaced) {
        return std::unexpected(displaced.error());
    }
    if (!displaced->is_null()) {
        entities_.meta(displaced->id()).row = meta.row;
    }

    entities_.kill(entity);
    return {};
}

auto World::despawn_many(std::span<const Entity> entities) -> Result<void> {
    for (const Entity entity : entities) {
        if (auto ok = despawn(entity); !ok) {
            return ok;
        }
    }
    return {};
}

// ============================================================================
// Components
// ============================================================================

auto World::add(Entity entity, TypeId type, std::any value) -> Result<void> {
    const std::array<TypeId, 1> types{type};
    if (auto ok = ensure_alive(entity, "add", types); !ok) {
        return ok;
    }
    if (auto ok = ensure_not_iterating("add"); !ok) {
        return ok;
    }

    const auto* info = registry_->info(type);
    if (info == nullptr) {
        return make_error(ErrorCode::ECS_UNKNOWN_COMPONENT_TYPE,
                          std::format("add failed: unknown component type id {}", type));
    }
    if (!value.has_value() || std::type_index(value.type()) != info->type) {
        return make_error(ErrorCode::ECS_COMPONENT_TYPE_MISMATCH,
                          std::format("add({}) failed: value holds a different type", info->name));
    }

    const auto& meta = entities_.meta(entity.id());
    Archetype& source = *archetypes_[meta.archetype];

    if (ComponentArray* column = source.column(type)) {
        if (!column->set_any(meta.row, std::move(value))) {
            return make_error(ErrorCode::ECS_COMPONENT_TYPE_MISMATCH,
                              std::format("add({}) failed: column rejected the value", info->name));
        }
        return {};
    }

    Archetype& destination = get_or_create_archetype(merge_signature(source.signature(), type));
    return move_entity(entity, destination, [&](TypeId column_type, ComponentArray& column) {
        return column_type == type && column.push_any(std::move(value));
    });
}

auto World::remove(Entity entity, TypeId type) -> Result<void> {
    const std::array<TypeId, 1> types{type};
    return remove_types("remove", entity, types);
}

auto World::remove_types(std::string_view op, Entity entity, std::span<const TypeId> types) -> Result<void> {
    if (auto ok = ensure_alive(entity, op, types); !ok) {
        return ok;
    }
    if (auto ok = ensure_not_iterating(op); !ok) {
        return ok;
    }

    const auto& meta = entities_.meta(entity.id());
    Archetype& source = *archetypes_[meta.archetype];

    bool any_present = false;
    for (const TypeId type : types) {
        any_present = any_present || source.has(type);
    }
    if (!any_present) {
        return {};
    }

    Archetype& destination = get_or_create_archetype(subtract_signature(source.signature(), types));
    return move_entity(entity, destination, {});
}

auto World::has(Entity entity, TypeId type) const -> bool {
    if (!entities_.is_alive(entity)) {
        return false;
    }
    return archetypes_[entities_.meta(entity.id()).archetype]->has(type);
}

// ============================================================================
// Archetype Storage
// ============================================================================

auto World::get_or_create_archetype(const Signature& signature) -> Archetype& {
    const std::string key = signature_key(signature);
    if (const auto it = archetype_index_.find(key); it != archetype_index_.end()) {
        return *archetypes_[it->second];
    }

    const auto id = static_cast<u32>(archetypes_.size());
    archetypes_.push_back(std::make_unique<Archetype>(id, signature, *registry_));
    archetype_index_.emplace(key, id);

    LOG_DEBUG("Created archetype {} {}", id, describe("", signature));
    return *archetypes_.back();
}

auto World::reset_archetypes() -> void {
    archetypes_.clear();
    archetype_index_.clear();
    get_or_create_archetype({});
}

auto World::matching_archetypes(std::span<const TypeId> types) const -> std::vector<Archetype*> {
    const Signature needed = make_signature(types);

    std::vector<Archetype*> matches;
    for (const auto& archetype : archetypes_) {
        if (signature_has_all(archetype->signature(), needed)) {
            matches.push_back(archetype.get());
        }
    }
    return matches;
}

auto World::place_entity(Entity entity, Archetype& archetype, const ColumnFiller& fill) -> void {
    const u32 row = archetype.add_row(entity);
    for (const TypeId type : archetype.signature()) {
        fill(type, *archetype.column(type));
    }

    auto& meta = entities_.meta(entity.id());
    meta.archetype = archetype.id();
    meta.row = row;
}

auto World::move_entity(Entity entity, Archetype& destination, const ColumnFiller& fill) -> Result<void> {
    auto& meta = entities_.meta(entity.id());
    Archetype& source = *archetypes_[meta.archetype];
    const u32 source_row = meta.row;

    const u32 row = destination.add_row(entity);
    for (const TypeId type : destination.signature()) {
        ComponentArray& column = *destination.column(type);
        if (fill && fill(type, column)) {
            continue;
        }
        // every destination type not being added lives in the source
        column.push_from(*source.column(type), source_row);
    }

    // point at the destination before the swap-remove can displace anything
    meta.archetype = destination.id();
    meta.row = row;

    auto displaced = source.remove_row(source_row);
    if (!displaced) {
        return std::unexpected(displaced.error());
    }
    if (!displaced->is_null()) {
        entities_.meta(displaced->id()).row = source_row;
    }
    return {};
}

auto World::archetype(u32 id) const -> const Archetype* {
    return id < archetypes_.size() ? archetypes_[id].get() : nullptr;
}

auto World::location(Entity entity) const -> const EntityMeta* {
    return entities_.is_alive(entity) ? &entities_.meta(entity.id()) : nullptr;
}

// ============================================================================
// Deferred Commands
// ============================================================================

auto World::apply(Command&& command) -> Result<void> {
    if (auto* spawn_command = std::get_if<SpawnCommand>(&command)) {
        auto entity = spawn();
        if (!entity) {
            return std::unexpected(entity.error());
        }
        if (spawn_command->init) {
            spawn_command->init(*entity);
        }
        return {};
    }
    if (auto* despawn_command = std::get_if<DespawnCommand>(&command)) {
        return despawn(despawn_command->entity);
    }
    if (auto* add_command = std::get_if<AddCommand>(&command)) {
        return add(add_command->entity, add_command->type, std::move(add_command->value));
    }
    const auto& remove_command = std::get<RemoveCommand>(command);
    return remove(remove_command.entity, remove_command.type);
}

auto World::flush() -> Result<void> {
    if (auto ok = ensure_not_iterating("flush"); !ok) {
        return ok;
    }

    Result<void> result{};
    // commands issued during replay (spawn init, spawn_bundle) land in the same flush
    while (commands_.has_pending()) {
        for (auto& command : commands_.drain()) {
            if (auto applied = apply(std::move(command)); !applied) {
                LOG_ERROR("Command replay failed: {}", applied.error().what());
                if (result) {
                    result = std::unexpected(applied.error());
                }
            }
        }
    }
    return result;
}

// ============================================================================
// Events
// ============================================================================

auto World::clear_events() -> void {
    for (auto& [type, channel] : events_) {
        channel->clear();
    }
}

auto World::swap_events() -> void {
    for (auto& [type, channel] : events_) {
        channel->swap_buffers();
    }
}

// ============================================================================
// Systems
// ============================================================================

auto World::add_system(std::string name, SystemFn fn) -> Result<void> {
    if (auto ok = enter_lifecycle(Lifecycle::SIMPLE, "World::add_system()"); !ok) {
        return ok;
    }

    LOG_DEBUG("Registered system '{}'", name);
    systems_.push_back(System{std::move(name), std::move(fn)});
    return {};
}

auto World::update(f64 dt) -> Result<void> {
    if (auto ok = enter_lifecycle(Lifecycle::SIMPLE, "World::update()"); !ok) {
        return ok;
    }

    profiler_.begin_frame(dt);
    for (auto& system : systems_) {
        Timer timer;
        try {
            system.fn(*this, dt);
        } catch (...) {
            profiler_.add_system(system.name, timer.elapsed_ms());
            if (auto flushed = flush(); !flushed) {
                LOG_ERROR("Flush after system failure failed: {}", flushed.error().what());
            }
            swap_events();
            profiler_.end_frame();
            throw;
        }
        profiler_.add_system(system.name, timer.elapsed_ms());
    }

    auto flushed = flush();
    swap_events();
    profiler_.end_frame();
    return flushed;
}

// ============================================================================
// Stats
// ============================================================================

auto World::stats() const -> WorldStats {
    WorldStats stats;
    stats.alive_entities = entities_.alive_count();
    stats.archetypes = archetypes_.size();
    for (const auto& archetype : archetypes_) {
        stats.rows += archetype->size();
    }
    stats.systems = systems_.size() + scheduled_systems_;
    stats.resources = resources_.size();
    stats.event_channels = events_.size();
    stats.pending_commands = commands_.has_pending();
    profiler_.fill(stats);
    return stats;
}

} // namespace strata::ecs
