/**
 * @file snapshot.hpp
 * @brief World snapshot payload, codec registry and YAML persistence
 *
 * A snapshot is an explicit export of a World's entities, registered
 * components, registered resources and allocator state. Component and
 * resource payloads are YAML nodes produced by user codecs, keyed by a
 * stable string (the codec key), so snapshots survive type renames and
 * process restarts.
 *
 * YAML layout:
 * @code
 * format: strata/world-snapshot@1
 * allocator:
 *   next_id: 3
 *   free: [2]
 *   generations: [[1, 1], [2, 1]]
 * entities:
 *   - id: 1
 *     generation: 1
 *     components:
 *       - type: position
 *         data: {x: 1, y: 2}
 * resources:
 *   - type: game_clock
 *     data: {tick: 42}
 * @endcode
 *
 * ✨ FUNCTIONAL DESIGN ✨
 * - Snapshots are plain values (copy, compare, persist)
 * - Codecs are pure functions T <-> YAML::Node
 * - Errors via std::expected (no exceptions escape)
 *
 * @date 2025-11-02
 */

#pragma once

#include <strata/core/types.hpp>
#include <strata/ecs/component_array.hpp>
#include <strata/ecs/entity_manager.hpp>
#include <strata/ecs/type_registry.hpp>

#include <yaml-cpp/yaml.h>

#include <any>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace strata::ecs {

/// Format tag written into and checked on every snapshot
inline constexpr std::string_view WORLD_SNAPSHOT_FORMAT = "strata/world-snapshot@1";

// ============================================================================
// Snapshot Payload
// ============================================================================

struct ComponentSnapshot {
    std::string type;  ///< Codec key
    YAML::Node data;   ///< Codec output
};

struct EntitySnapshot {
    u32 id = 0;
    u32 generation = 0;
    std::vector<ComponentSnapshot> components;  ///< Sorted by codec key
};

struct ResourceSnapshot {
    std::string type;  ///< Codec key
    YAML::Node data;
};

/**
 * @brief Full world export
 */
struct WorldSnapshot {
    std::string format{WORLD_SNAPSHOT_FORMAT};
    AllocatorState allocator;
    std::vector<EntitySnapshot> entities;    ///< Alive entities, ascending id
    std::vector<ResourceSnapshot> resources; ///< Sorted by codec key
};

// ============================================================================
// Codecs
// ============================================================================

/**
 * @brief Serialize/deserialize pair for one component or resource type
 *
 * deserialize may fail with any Error; YAML::Exception thrown from inside
 * (e.g. a bad node.as<float>()) is caught and reported as a validation error.
 *
 * @code
 * SnapshotCodec<Position> codec{
 *     .key = "position",
 *     .serialize = [](const Position& p) {
 *         YAML::Node node;
 *         node["x"] = p.x;
 *         node["y"] = p.y;
 *         return node;
 *     },
 *     .deserialize = [](const YAML::Node& node) -> Result<Position> {
 *         return Position{node["x"].as<float>(), node["y"].as<float>()};
 *     },
 * };
 * @endcode
 */
template<typename T>
struct SnapshotCodec {
    std::string key;
    std::function<YAML::Node(const T&)> serialize;
    std::function<Result<T>(const YAML::Node&)> deserialize;
};

/**
 * @brief Erased component codec (as stored by the registry)
 */
struct ComponentCodecEntry {
    std::string key;
    TypeId type;
    std::string type_name;
    std::function<YAML::Node(const ComponentArray&, u32)> encode;  ///< Serializes one cell
    std::function<Result<std::any>(const YAML::Node&)> decode;
};

/**
 * @brief Erased resource codec (as stored by the registry)
 */
struct ResourceCodecEntry {
    std::string key;
    std::type_index type;
    std::string type_name;
    std::function<YAML::Node(const std::any&)> encode;
    std::function<Result<std::any>(const YAML::Node&)> decode;
};

/**
 * @brief Trims surrounding whitespace from a codec key
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto normalize_snapshot_key(std::string_view key) -> std::string;

/**
 * @brief Codec registrations of one World, indexed by type and by key
 *
 * Keys are unique per kind (components and resources have separate key
 * spaces). Re-registering a type under a new key releases the old key.
 *
 * ⚠️ IMPURE CLASS
 */
class SnapshotRegistry {
public:
    /**
     * @brief Registers or replaces the codec of a component type
     *
     * @return SNAPSHOT_CODEC_CONFLICT if the key is empty or owned by another type
     */
    template<typename T>
    auto register_component(TypeId type, std::string type_name, SnapshotCodec<T> codec) -> Result<void> {
        auto serialize = std::move(codec.serialize);
        auto deserialize = std::move(codec.deserialize);
        return insert_component(ComponentCodecEntry{
            .key = std::move(codec.key),
            .type = type,
            .type_name = std::move(type_name),
            .encode = [serialize](const ComponentArray& column, u32 row) {
                return serialize(static_cast<const TypedComponentArray<T>&>(column).at(row));
            },
            .decode = [deserialize](const YAML::Node& node) -> Result<std::any> {
                auto value = deserialize(node);
                if (!value) {
                    return std::unexpected(value.error());
                }
                return std::any(std::move(*value));
            },
        });
    }

    /// @return false if the type had no codec
    auto unregister_component(TypeId type) -> bool;

    /**
     * @brief Registers or replaces the codec of a resource type
     *
     * @return SNAPSHOT_CODEC_CONFLICT if the key is empty or owned by another type
     */
    template<typename T>
    auto register_resource(SnapshotCodec<T> codec) -> Result<void> {
        auto serialize = std::move(codec.serialize);
        auto deserialize = std::move(codec.deserialize);
        return insert_resource(ResourceCodecEntry{
            .key = std::move(codec.key),
            .type = std::type_index(typeid(T)),
            .type_name = type_name<T>(),
            .encode = [serialize](const std::any& value) {
                return serialize(*std::any_cast<T>(&value));
            },
            .decode = [deserialize](const YAML::Node& node) -> Result<std::any> {
                auto value = deserialize(node);
                if (!value) {
                    return std::unexpected(value.error());
                }
                return std::any(std::move(*value));
            },
        });
    }

    /// @return false if the type had no codec
    auto unregister_resource(std::type_index type) -> bool;

    /// Codec registered under `key`, nullptr if none
    [[nodiscard]] auto find_component(std::string_view key) const -> const ComponentCodecEntry*;
    [[nodiscard]] auto find_resource(std::string_view key) const -> const ResourceCodecEntry*;

    /// All component codecs, ascending by key
    [[nodiscard]] auto components() const -> const std::map<std::string, ComponentCodecEntry, std::less<>>& {
        return components_;
    }

    /// All resource codecs, ascending by key
    [[nodiscard]] auto resources() const -> const std::map<std::string, ResourceCodecEntry, std::less<>>& {
        return resources_;
    }

private:
    auto insert_component(ComponentCodecEntry entry) -> Result<void>;
    auto insert_resource(ResourceCodecEntry entry) -> Result<void>;

    std::map<std::string, ComponentCodecEntry, std::less<>> components_;
    std::unordered_map<TypeId, std::string> component_keys_;
    std::map<std::string, ResourceCodecEntry, std::less<>> resources_;
    std::unordered_map<std::type_index, std::string> resource_keys_;
};

// ============================================================================
// YAML Persistence
// ============================================================================

/**
 * @brief Converts a snapshot to a YAML document
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto snapshot_to_yaml(const WorldSnapshot& snapshot) -> YAML::Node;

/**
 * @brief Reads a snapshot from a YAML document
 *
 * Only checks shape (maps, sequences, integer ranges). The format tag and
 * referential consistency are checked by World::restore().
 *
 * @return SNAPSHOT_PARSE_ERROR on malformed documents
 */
[[nodiscard]] auto snapshot_from_yaml(const YAML::Node& root) -> Result<WorldSnapshot>;

/**
 * @brief Writes a snapshot to a YAML file (creates parent directories)
 *
 * ⚠️ IMPURE FUNCTION (file I/O)
 *
 * @return CORE_FILE_IO_ERROR if the file cannot be written
 */
auto save_snapshot(const WorldSnapshot& snapshot, const std::filesystem::path& path) -> Result<void>;

/**
 * @brief Loads a snapshot from a YAML file
 *
 * ⚠️ IMPURE FUNCTION (file I/O)
 *
 * @return CORE_FILE_NOT_FOUND, SNAPSHOT_PARSE_ERROR
 */
[[nodiscard]] auto load_snapshot(const std::filesystem::path& path) -> Result<WorldSnapshot>;

} // namespace strata::ecs
