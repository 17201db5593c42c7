/**
 * @file world_snapshot.cpp
 * @brief World export and restore
 *
 * restore() runs in two passes: every entity, component and resource is
 * decoded and checked first, and the world is only touched once the whole
 * snapshot is known to be valid.
 *
 * @date 2025-11-02
 */

#include <strata/ecs/world.hpp>

#include <algorithm>
#include <format>
#include <unordered_set>

namespace strata::ecs {

namespace {

auto validation_error(std::string message) -> std::unexpected<Error> {
    return make_error(ErrorCode::SNAPSHOT_VALIDATION_ERROR, std::move(message));
}

/// Decoded entity, ready to be placed
struct RestoredEntity {
    Entity entity;
    std::vector<std::pair<TypeId, std::any>> components;  ///< Sorted by type id
};

/**
 * @brief Runs a codec's decode, reporting yaml-cpp conversion failures as errors
 */
template<typename Codec>
auto decode_payload(const Codec& codec, const YAML::Node& data, std::string_view what) -> Result<std::any> {
    try {
        auto value = codec.decode(data);
        if (!value) {
            return validation_error(std::format("Failed to decode {} \"{}\": {}",
                                                what, codec.key, value.error().what()));
        }
        return value;
    } catch (const YAML::Exception& e) {
        return validation_error(std::format("Failed to decode {} \"{}\": {}", what, codec.key, e.what()));
    }
}

} // anonymous namespace

auto World::snapshot() -> Result<WorldSnapshot> {
    if (auto ok = ensure_not_iterating("snapshot"); !ok) {
        return std::unexpected(ok.error());
    }
    if (commands_.has_pending()) {
        if (auto flushed = flush(); !flushed) {
            return std::unexpected(flushed.error());
        }
    }

    WorldSnapshot out;
    out.allocator = entities_.export_allocator();

    const auto records = entities_.records();
    for (u32 id = 1; id < records.size(); ++id) {
        const auto& meta = records[id];
        if (!meta.alive) {
            continue;
        }

        EntitySnapshot entity{.id = id, .generation = meta.generation, .components = {}};
        if (const Archetype* archetype = this->archetype(meta.archetype)) {
            for (const auto& [key, codec] : snapshots_.components()) {
                if (const ComponentArray* column = archetype->column(codec.type)) {
                    entity.components.push_back(ComponentSnapshot{key, codec.encode(*column, meta.row)});
                }
            }
        }
        out.entities.push_back(std::move(entity));
    }

    for (const auto& [key, codec] : snapshots_.resources()) {
        if (const auto it = resources_.find(codec.type); it != resources_.end()) {
            out.resources.push_back(ResourceSnapshot{key, codec.encode(it->second)});
        }
    }

    LOG_INFO("World snapshot taken: {} entities, {} resources", out.entities.size(), out.resources.size());
    return out;
}

auto World::restore(const WorldSnapshot& snapshot) -> Result<void> {
    if (auto ok = ensure_not_iterating("restore"); !ok) {
        return ok;
    }

    if (snapshot.format != WORLD_SNAPSHOT_FORMAT) {
        return make_error(ErrorCode::SNAPSHOT_FORMAT_MISMATCH,
                          std::format("Unsupported world snapshot format \"{}\". Expected \"{}\".",
                                      snapshot.format, WORLD_SNAPSHOT_FORMAT));
    }

    if (auto valid = EntityManager::validate_allocator(snapshot.allocator); !valid) {
        return valid;
    }

    // ========== Pass 1: decode and validate ==========

    std::unordered_map<std::type_index, std::any> resources;
    std::unordered_set<std::string> seen_resources;
    for (const auto& resource : snapshot.resources) {
        if (!seen_resources.insert(resource.type).second) {
            return validation_error(std::format("Duplicate snapshot resource type \"{}\"", resource.type));
        }

        const auto* codec = snapshots_.find_resource(resource.type);
        if (codec == nullptr) {
            return validation_error(std::format(
                "Missing resource snapshot codec for \"{}\". Register it before restore().", resource.type));
        }

        auto value = decode_payload(*codec, resource.data, "resource");
        if (!value) {
            return std::unexpected(value.error());
        }
        resources.insert_or_assign(codec->type, std::move(*value));
    }

    const std::unordered_set<u32> free_ids(snapshot.allocator.free.begin(), snapshot.allocator.free.end());
    std::unordered_set<u32> known_ids;
    for (const auto& [id, generation] : snapshot.allocator.generations) {
        known_ids.insert(id);
    }

    std::vector<RestoredEntity> restored;
    restored.reserve(snapshot.entities.size());
    std::unordered_set<u32> seen_entities;

    for (const auto& entity : snapshot.entities) {
        if (entity.id == 0) {
            return validation_error("Invalid snapshot entity id: 0");
        }
        if (entity.generation == 0) {
            return validation_error(std::format("Invalid snapshot entity generation for id {}: 0", entity.id));
        }
        if (!seen_entities.insert(entity.id).second) {
            return validation_error(std::format("Duplicate snapshot entity id {}", entity.id));
        }
        if (free_ids.contains(entity.id)) {
            return validation_error(std::format(
                "Invalid snapshot: entity id {} is both alive and free", entity.id));
        }
        if (!known_ids.contains(entity.id)) {
            return validation_error(std::format(
                "Invalid snapshot: missing allocator generation entry for entity id {}. "
                "Ensure snapshot.allocator.generations includes all alive ids.", entity.id));
        }

        RestoredEntity out{.entity = Entity(entity.id, entity.generation), .components = {}};
        std::unordered_set<std::string> seen_components;
        for (const auto& component : entity.components) {
            if (!seen_components.insert(component.type).second) {
                return validation_error(std::format(
                    "Duplicate component type \"{}\" on entity {}", component.type, entity.id));
            }

            const auto* codec = snapshots_.find_component(component.type);
            if (codec == nullptr) {
                return validation_error(std::format(
                    "Missing component snapshot codec for \"{}\". Register it before restore().", component.type));
            }

            auto value = decode_payload(*codec, component.data, "component");
            if (!value) {
                return std::unexpected(value.error());
            }
            out.components.emplace_back(codec->type, std::move(*value));
        }

        std::ranges::sort(out.components, {}, &std::pair<TypeId, std::any>::first);
        restored.push_back(std::move(out));
    }

    // ========== Pass 2: commit ==========

    if (auto imported = entities_.import_allocator(snapshot.allocator); !imported) {
        return imported;
    }

    commands_.clear();
    for (auto& [type, channel] : events_) {
        channel->clear_all();
    }

    resources_ = std::move(resources);
    reset_archetypes();

    for (auto& entity : restored) {
        Signature signature;
        signature.reserve(entity.components.size());
        for (const auto& [type, value] : entity.components) {
            signature.push_back(type);
        }

        Archetype& archetype = get_or_create_archetype(signature);
        const u32 row = archetype.add_row(entity.entity);
        for (auto& [type, value] : entity.components) {
            archetype.column(type)->push_any(std::move(value));
        }
        entities_.revive(entity.entity, archetype.id(), row);
    }

    LOG_INFO("World restored: {} entities, {} resources, {} archetypes",
             restored.size(), resources_.size(), archetypes_.size());
    return {};
}

} // namespace strata::ecs
