/**
 * @file snapshot.cpp
 * @brief Snapshot codec registry and YAML persistence
 *
 * Converts WorldSnapshot to/from YAML using the yaml-cpp library.
 *
 * @date 2025-11-02
 */

#include <strata/ecs/snapshot.hpp>
#include <strata/core/logging.hpp>

#include <fstream>
#include <limits>

namespace strata::ecs {

// ============================================================================
// Codec Registry
// ============================================================================

auto normalize_snapshot_key(std::string_view key) -> std::string {
    constexpr std::string_view whitespace = " \t\r\n\f\v";
    const auto first = key.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = key.find_last_not_of(whitespace);
    return std::string(key.substr(first, last - first + 1));
}

auto SnapshotRegistry::insert_component(ComponentCodecEntry entry) -> Result<void> {
    entry.key = normalize_snapshot_key(entry.key);
    if (entry.key.empty()) {
        return make_error(ErrorCode::SNAPSHOT_CODEC_CONFLICT,
                          "register_component_snapshot() failed: codec.key must be a non-empty string");
    }

    if (const auto it = components_.find(entry.key); it != components_.end() && it->second.type != entry.type) {
        return make_error(ErrorCode::SNAPSHOT_CODEC_CONFLICT,
                          std::format("register_component_snapshot({}) failed: key already used by {}",
                                      entry.key, it->second.type_name));
    }

    // re-registration under a new key releases the old one
    if (const auto it = component_keys_.find(entry.type); it != component_keys_.end() && it->second != entry.key) {
        components_.erase(it->second);
    }

    component_keys_[entry.type] = entry.key;
    const std::string key = entry.key;
    components_.insert_or_assign(key, std::move(entry));
    return {};
}

auto SnapshotRegistry::unregister_component(TypeId type) -> bool {
    const auto it = component_keys_.find(type);
    if (it == component_keys_.end()) {
        return false;
    }
    components_.erase(it->second);
    component_keys_.erase(it);
    return true;
}

auto SnapshotRegistry::insert_resource(ResourceCodecEntry entry) -> Result<void> {
    entry.key = normalize_snapshot_key(entry.key);
    if (entry.key.empty()) {
        return make_error(ErrorCode::SNAPSHOT_CODEC_CONFLICT,
                          "register_resource_snapshot() failed: codec.key must be a non-empty string");
    }

    if (const auto it = resources_.find(entry.key); it != resources_.end() && it->second.type != entry.type) {
        return make_error(ErrorCode::SNAPSHOT_CODEC_CONFLICT,
                          std::format("register_resource_snapshot({}) failed: key already used by {}",
                                      entry.key, it->second.type_name));
    }

    if (const auto it = resource_keys_.find(entry.type); it != resource_keys_.end() && it->second != entry.key) {
        resources_.erase(it->second);
    }

    resource_keys_.insert_or_assign(entry.type, entry.key);
    const std::string key = entry.key;
    resources_.insert_or_assign(key, std::move(entry));
    return {};
}

auto SnapshotRegistry::unregister_resource(std::type_index type) -> bool {
    const auto it = resource_keys_.find(type);
    if (it == resource_keys_.end()) {
        return false;
    }
    resources_.erase(it->second);
    resource_keys_.erase(it);
    return true;
}

auto SnapshotRegistry::find_component(std::string_view key) const -> const ComponentCodecEntry* {
    const auto it = components_.find(key);
    return it != components_.end() ? &it->second : nullptr;
}

auto SnapshotRegistry::find_resource(std::string_view key) const -> const ResourceCodecEntry* {
    const auto it = resources_.find(key);
    return it != resources_.end() ? &it->second : nullptr;
}

// ============================================================================
// YAML Conversion
// ============================================================================

namespace {

auto parse_error(std::string message) -> std::unexpected<Error> {
    return make_error(ErrorCode::SNAPSHOT_PARSE_ERROR, std::move(message));
}

/**
 * @brief Reads a non-negative integer that fits u32
 *
 * ✨ FUNCTIONAL ✨
 */
auto read_u32(const YAML::Node& node, std::string_view what) -> Result<u32> {
    if (!node || !node.IsScalar()) {
        return parse_error(std::format("Invalid snapshot {}: expected an integer", what));
    }

    i64 value = 0;
    try {
        value = node.as<i64>();
    } catch (const YAML::Exception&) {
        return parse_error(std::format("Invalid snapshot {}: {}", what, node.Scalar()));
    }

    if (value < 0 || value > static_cast<i64>(std::numeric_limits<u32>::max())) {
        return parse_error(std::format("Invalid snapshot {}: {}", what, value));
    }
    return static_cast<u32>(value);
}

auto read_type_key(const YAML::Node& node, std::string_view what) -> Result<std::string> {
    if (!node.IsMap()) {
        return parse_error(std::format("Invalid snapshot {}: expected a map", what));
    }
    if (!node["type"] || !node["type"].IsScalar()) {
        return parse_error(std::format("Invalid snapshot {}: missing type", what));
    }
    return node["type"].Scalar();
}

auto allocator_to_yaml(const AllocatorState& allocator) -> YAML::Node {
    YAML::Node node;
    node["next_id"] = allocator.next_id;

    YAML::Node free(YAML::NodeType::Sequence);
    for (const u32 id : allocator.free) {
        free.push_back(id);
    }
    node["free"] = free;

    YAML::Node generations(YAML::NodeType::Sequence);
    for (const auto& [id, generation] : allocator.generations) {
        YAML::Node entry;
        entry.push_back(id);
        entry.push_back(generation);
        entry.SetStyle(YAML::EmitterStyle::Flow);
        generations.push_back(entry);
    }
    node["generations"] = generations;
    return node;
}

auto allocator_from_yaml(const YAML::Node& node) -> Result<AllocatorState> {
    if (!node || !node.IsMap()) {
        return parse_error("Invalid snapshot allocator: expected a map");
    }

    AllocatorState allocator;
    auto next_id = read_u32(node["next_id"], "allocator next_id");
    if (!next_id) return std::unexpected(next_id.error());
    allocator.next_id = *next_id;

    if (const auto free = node["free"]) {
        if (!free.IsSequence()) {
            return parse_error("Invalid snapshot allocator free list: expected a sequence");
        }
        for (const auto& entry : free) {
            auto id = read_u32(entry, "allocator free id");
            if (!id) return std::unexpected(id.error());
            allocator.free.push_back(*id);
        }
    }

    if (const auto generations = node["generations"]) {
        if (!generations.IsSequence()) {
            return parse_error("Invalid snapshot allocator generations: expected a sequence");
        }
        for (const auto& entry : generations) {
            if (!entry.IsSequence() || entry.size() != 2) {
                return parse_error("Invalid snapshot allocator generation entry: expected [id, generation]");
            }
            auto id = read_u32(entry[0], "allocator generations id");
            if (!id) return std::unexpected(id.error());
            auto generation = read_u32(entry[1], "allocator generation");
            if (!generation) return std::unexpected(generation.error());
            allocator.generations.emplace_back(*id, *generation);
        }
    }

    return allocator;
}

} // anonymous namespace

auto snapshot_to_yaml(const WorldSnapshot& snapshot) -> YAML::Node {
    YAML::Node root;
    root["format"] = snapshot.format;
    root["allocator"] = allocator_to_yaml(snapshot.allocator);

    YAML::Node entities(YAML::NodeType::Sequence);
    for (const auto& entity : snapshot.entities) {
        YAML::Node node;
        node["id"] = entity.id;
        node["generation"] = entity.generation;

        YAML::Node components(YAML::NodeType::Sequence);
        for (const auto& component : entity.components) {
            YAML::Node entry;
            entry["type"] = component.type;
            entry["data"] = component.data;
            components.push_back(entry);
        }
        node["components"] = components;
        entities.push_back(node);
    }
    root["entities"] = entities;

    YAML::Node resources(YAML::NodeType::Sequence);
    for (const auto& resource : snapshot.resources) {
        YAML::Node entry;
        entry["type"] = resource.type;
        entry["data"] = resource.data;
        resources.push_back(entry);
    }
    root["resources"] = resources;

    return root;
}

auto snapshot_from_yaml(const YAML::Node& root) -> Result<WorldSnapshot> {
    if (!root || !root.IsMap()) {
        return parse_error("Invalid snapshot: expected a map at document root");
    }
    if (!root["format"] || !root["format"].IsScalar()) {
        return parse_error("Invalid snapshot: missing format");
    }

    WorldSnapshot snapshot;
    snapshot.format = root["format"].Scalar();

    auto allocator = allocator_from_yaml(root["allocator"]);
    if (!allocator) return std::unexpected(allocator.error());
    snapshot.allocator = std::move(*allocator);

    if (const auto entities = root["entities"]) {
        if (!entities.IsSequence()) {
            return parse_error("Invalid snapshot entities: expected a sequence");
        }
        for (const auto& node : entities) {
            if (!node.IsMap()) {
                return parse_error("Invalid snapshot entity: expected a map");
            }

            EntitySnapshot entity;
            auto id = read_u32(node["id"], "entity id");
            if (!id) return std::unexpected(id.error());
            entity.id = *id;

            auto generation = read_u32(node["generation"], "entity generation");
            if (!generation) return std::unexpected(generation.error());
            entity.generation = *generation;

            if (const auto components = node["components"]) {
                if (!components.IsSequence()) {
                    return parse_error(std::format("Invalid snapshot components for entity {}", entity.id));
                }
                for (const auto& component : components) {
                    auto type = read_type_key(component, "component");
                    if (!type) return std::unexpected(type.error());
                    entity.components.push_back(ComponentSnapshot{
                        .type = std::move(*type),
                        .data = YAML::Clone(component["data"]),
                    });
                }
            }

            snapshot.entities.push_back(std::move(entity));
        }
    }

    if (const auto resources = root["resources"]) {
        if (!resources.IsSequence()) {
            return parse_error("Invalid snapshot resources: expected a sequence");
        }
        for (const auto& resource : resources) {
            auto type = read_type_key(resource, "resource");
            if (!type) return std::unexpected(type.error());
            snapshot.resources.push_back(ResourceSnapshot{
                .type = std::move(*type),
                .data = YAML::Clone(resource["data"]),
            });
        }
    }

    return snapshot;
}

auto save_snapshot(const WorldSnapshot& snapshot, const std::filesystem::path& path) -> Result<void> {
    LOG_INFO("Saving world snapshot to: {}", path.string());

    if (const auto parent = path.parent_path(); !parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            LOG_ERROR("Failed to create directory: {}", ec.message());
            return make_error(ErrorCode::CORE_FILE_IO_ERROR,
                              std::format("Failed to create directory {}: {}", parent.string(), ec.message()));
        }
    }

    YAML::Emitter out;
    out << snapshot_to_yaml(snapshot);

    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open file for writing: {}", path.string());
        return make_error(ErrorCode::CORE_FILE_IO_ERROR,
                          std::format("Failed to open file for writing: {}", path.string()));
    }

    file << out.c_str() << '\n';
    if (!file) {
        return make_error(ErrorCode::CORE_FILE_IO_ERROR,
                          std::format("Failed to write snapshot: {}", path.string()));
    }

    LOG_INFO("World snapshot saved ({} entities, {} resources)",
             snapshot.entities.size(), snapshot.resources.size());
    return {};
}

auto load_snapshot(const std::filesystem::path& path) -> Result<WorldSnapshot> {
    LOG_INFO("Loading world snapshot from: {}", path.string());

    if (!std::filesystem::exists(path)) {
        LOG_ERROR("Snapshot file not found: {}", path.string());
        return make_error(ErrorCode::CORE_FILE_NOT_FOUND,
                          std::format("Snapshot file not found: {}", path.string()));
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error: {}", e.what());
        return parse_error(std::format("YAML parse error in {}: {}", path.string(), e.what()));
    }

    return snapshot_from_yaml(root);
}

} // namespace strata::ecs
