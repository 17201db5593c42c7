/**
 * @file signature.hpp
 * @brief Sorted component-type sets identifying archetypes
 *
 * A signature is an ascending, duplicate-free sequence of TypeIds. Two
 * archetypes never share a signature; the canonical string key is what the
 * World indexes archetypes by.
 *
 * ✨ PURE FUNCTIONS ✨ (no shared state)
 *
 * @date 2025-11-02
 */

#pragma once

#include <strata/ecs/type_registry.hpp>

#include <span>
#include <string>
#include <vector>

namespace strata::ecs {

/// Ascending, duplicate-free component type ids
using Signature = std::vector<TypeId>;

/**
 * @brief Builds a signature from ids in any order (sorts, drops duplicates)
 */
[[nodiscard]] auto make_signature(std::span<const TypeId> ids) -> Signature;

/**
 * @brief Canonical key: ids joined with ',' ("" for the empty signature)
 *
 * @code
 * signature_key({1, 4, 7}) == "1,4,7"
 * @endcode
 */
[[nodiscard]] auto signature_key(std::span<const TypeId> signature) -> std::string;

/**
 * @brief Returns `signature` with `id` inserted in order (unchanged if present)
 */
[[nodiscard]] auto merge_signature(std::span<const TypeId> signature, TypeId id) -> Signature;

/**
 * @brief Returns `signature` with every id of `ids` inserted in order
 */
[[nodiscard]] auto merge_signature(std::span<const TypeId> signature, std::span<const TypeId> ids) -> Signature;

/**
 * @brief Returns `signature` without `id` (unchanged if absent)
 */
[[nodiscard]] auto subtract_signature(std::span<const TypeId> signature, TypeId id) -> Signature;

/**
 * @brief Returns `signature` without any id of `ids`
 */
[[nodiscard]] auto subtract_signature(std::span<const TypeId> signature, std::span<const TypeId> ids) -> Signature;

/**
 * @brief Subset test: does `have` contain every id of `need`?
 *
 * Both inputs must be sorted ascending. Merge-style scan in
 * O(|have| + |need|), stops at the first missing id. This is the hot path
 * of every query and structural move.
 */
[[nodiscard]] auto signature_has_all(std::span<const TypeId> have, std::span<const TypeId> need) noexcept -> bool;

/**
 * @brief Membership test on a sorted signature (binary search)
 */
[[nodiscard]] auto signature_contains(std::span<const TypeId> signature, TypeId id) noexcept -> bool;

} // namespace strata::ecs
