/**
 * @file glm_codecs.hpp
 * @brief YAML conversion for GLM vectors and quaternions
 *
 * Building blocks for snapshot codecs of components holding GLM types.
 * Vectors are written as flat sequences, quaternions as (w, x, y, z).
 *
 * @code
 * world.register_component_snapshot<Transform>({
 *     .key = "transform",
 *     .serialize = [](const Transform& t) {
 *         YAML::Node node;
 *         node["position"] = vec3_to_yaml(t.position);
 *         node["rotation"] = quat_to_yaml(t.rotation);
 *         return node;
 *     },
 *     .deserialize = [](const YAML::Node& node) -> Result<Transform> { ... },
 * });
 * @endcode
 *
 * @note Optional: only available when the build found GLM
 *
 * @date 2025-11-02
 */

#pragma once

#include <strata/core/math.hpp>
#include <strata/core/types.hpp>

#include <yaml-cpp/yaml.h>

namespace strata::ecs {

/**
 * @brief Serializes vec2 to YAML sequence [x, y]
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto vec2_to_yaml(const vec2& v) -> YAML::Node;

/**
 * @brief Serializes vec3 to YAML sequence [x, y, z]
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto vec3_to_yaml(const vec3& v) -> YAML::Node;

/**
 * @brief Serializes vec4 to YAML sequence [x, y, z, w]
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto vec4_to_yaml(const vec4& v) -> YAML::Node;

/**
 * @brief Serializes quat to YAML sequence [w, x, y, z]
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto quat_to_yaml(const quat& q) -> YAML::Node;

/**
 * @brief Deserializes vec2 from YAML sequence
 *
 * ✨ FUNCTIONAL ✨
 *
 * @return SNAPSHOT_VALIDATION_ERROR if the node is not a 2-element numeric sequence
 */
[[nodiscard]] auto yaml_to_vec2(const YAML::Node& node) -> Result<vec2>;

/// @copydoc yaml_to_vec2
[[nodiscard]] auto yaml_to_vec3(const YAML::Node& node) -> Result<vec3>;

/// @copydoc yaml_to_vec2
[[nodiscard]] auto yaml_to_vec4(const YAML::Node& node) -> Result<vec4>;

/**
 * @brief Deserializes quat from YAML sequence (w first)
 *
 * ✨ FUNCTIONAL ✨
 */
[[nodiscard]] auto yaml_to_quat(const YAML::Node& node) -> Result<quat>;

} // namespace strata::ecs
