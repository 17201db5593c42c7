/**
 * @file math.hpp
 * @brief GLM integration for strata
 *
 * Type aliases for the GLM vector and quaternion types used as component
 * payloads by simulations built on strata.
 *
 * Design decisions:
 * - Use GLM types directly (no wrappers, zero overhead)
 * - Only the types the snapshot codecs understand are aliased here
 *
 * @date 2025-11-02
 * @version 1.0
 *
 * @note Optional: only available when the build found GLM
 */

#pragma once

#include <strata/core/types.hpp>

// enable GLM experimental extensions (quaternion, norm, etc.)
#define GLM_ENABLE_EXPERIMENTAL

// disable warnings from external GLM library (we can't fix their code)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wsign-conversion"
#pragma GCC diagnostic ignored "-Wduplicated-branches"

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/gtx/norm.hpp>

#pragma GCC diagnostic pop

namespace strata {

// ============================================================================
// GLM Type Aliases
// ============================================================================

using vec2 = glm::vec2;  ///< 2D vector (float)
using vec3 = glm::vec3;  ///< 3D vector (float)
using vec4 = glm::vec4;  ///< 4D vector (float)
using quat = glm::quat;  ///< Quaternion (rotation)

} // namespace strata
