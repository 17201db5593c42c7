/**
 * @file types.hpp
 * @brief Fundamental type definitions for strata
 *
 * This file provides type aliases, error handling types, and core utilities
 * used throughout strata. We use std::expected for error handling
 * (no exceptions!) and prefer explicit types over language primitives.
 *
 * Design decisions:
 * - Use std::expected instead of exceptions (functional error handling)
 * - Explicit sized integer types (no implicit conversions)
 * - Error codes grouped by module (CORE_*, ECS_*, SNAPSHOT_*)
 *
 * @date 2025-11-02
 * @version 1.0
 *
 * @note Uses C++23 features (std::expected)
 */

#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace strata {

// ============================================================================
// Fundamental Types (explicit sized integers for clarity)
// ============================================================================

using u8 = std::uint8_t;    ///< 8-bit unsigned integer
using u16 = std::uint16_t;  ///< 16-bit unsigned integer
using u32 = std::uint32_t;  ///< 32-bit unsigned integer
using u64 = std::uint64_t;  ///< 64-bit unsigned integer

using i8 = std::int8_t;     ///< 8-bit signed integer
using i16 = std::int16_t;   ///< 16-bit signed integer
using i32 = std::int32_t;   ///< 32-bit signed integer
using i64 = std::int64_t;   ///< 64-bit signed integer

using f32 = float;   ///< 32-bit floating point
using f64 = double;  ///< 64-bit floating point

// ============================================================================
// Error Handling (functional error handling, no exceptions!)
// ============================================================================

/**
 * @enum ErrorCode
 * @brief Error codes for strata operations
 *
 * All error codes are prefixed by module:
 * - CORE_* for core module errors (files, config)
 * - ECS_* for entity/component/world errors
 * - SNAPSHOT_* for snapshot export/import errors
 *
 * @note Using enum class for strong typing (no implicit conversions)
 */
enum class ErrorCode : u32 {
    // Success (not an error)
    OK = 0,

    // Core module errors (1000-1999)
    CORE_UNKNOWN = 1000,
    CORE_INVALID_ARGUMENT = 1002,
    CORE_FILE_NOT_FOUND = 1003,
    CORE_FILE_IO_ERROR = 1004,
    CONFIG_PARSE_ERROR = 1100,
    CONFIG_INVALID_VALUE = 1101,

    // ECS module errors (3000-3999)
    ECS_UNKNOWN = 3000,
    ECS_STALE_ENTITY = 3001,
    ECS_MISSING_COMPONENT = 3002,
    ECS_STRUCTURAL_CHANGE_WHILE_ITERATING = 3003,
    ECS_LIFECYCLE_CONFLICT = 3004,
    ECS_MISSING_RESOURCE = 3005,
    ECS_UNKNOWN_COMPONENT_TYPE = 3006,
    ECS_COMPONENT_TYPE_MISMATCH = 3007,
    ECS_ROW_OUT_OF_RANGE = 3008,
    ALLOCATOR_VALIDATION_ERROR = 3100,

    // Snapshot module errors (4000-4999)
    SNAPSHOT_FORMAT_MISMATCH = 4000,
    SNAPSHOT_VALIDATION_ERROR = 4001,
    SNAPSHOT_CODEC_CONFLICT = 4002,
    SNAPSHOT_PARSE_ERROR = 4003,
};

/**
 * @brief Converts error code to its enumerator name
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param code Error code
 * @return Enumerator name (e.g. "ECS_STALE_ENTITY")
 */
[[nodiscard]] constexpr auto to_string(ErrorCode code) noexcept -> std::string_view {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::CORE_UNKNOWN: return "CORE_UNKNOWN";
        case ErrorCode::CORE_INVALID_ARGUMENT: return "CORE_INVALID_ARGUMENT";
        case ErrorCode::CORE_FILE_NOT_FOUND: return "CORE_FILE_NOT_FOUND";
        case ErrorCode::CORE_FILE_IO_ERROR: return "CORE_FILE_IO_ERROR";
        case ErrorCode::CONFIG_PARSE_ERROR: return "CONFIG_PARSE_ERROR";
        case ErrorCode::CONFIG_INVALID_VALUE: return "CONFIG_INVALID_VALUE";
        case ErrorCode::ECS_UNKNOWN: return "ECS_UNKNOWN";
        case ErrorCode::ECS_STALE_ENTITY: return "ECS_STALE_ENTITY";
        case ErrorCode::ECS_MISSING_COMPONENT: return "ECS_MISSING_COMPONENT";
        case ErrorCode::ECS_STRUCTURAL_CHANGE_WHILE_ITERATING: return "ECS_STRUCTURAL_CHANGE_WHILE_ITERATING";
        case ErrorCode::ECS_LIFECYCLE_CONFLICT: return "ECS_LIFECYCLE_CONFLICT";
        case ErrorCode::ECS_MISSING_RESOURCE: return "ECS_MISSING_RESOURCE";
        case ErrorCode::ECS_UNKNOWN_COMPONENT_TYPE: return "ECS_UNKNOWN_COMPONENT_TYPE";
        case ErrorCode::ECS_COMPONENT_TYPE_MISMATCH: return "ECS_COMPONENT_TYPE_MISMATCH";
        case ErrorCode::ECS_ROW_OUT_OF_RANGE: return "ECS_ROW_OUT_OF_RANGE";
        case ErrorCode::ALLOCATOR_VALIDATION_ERROR: return "ALLOCATOR_VALIDATION_ERROR";
        case ErrorCode::SNAPSHOT_FORMAT_MISMATCH: return "SNAPSHOT_FORMAT_MISMATCH";
        case ErrorCode::SNAPSHOT_VALIDATION_ERROR: return "SNAPSHOT_VALIDATION_ERROR";
        case ErrorCode::SNAPSHOT_CODEC_CONFLICT: return "SNAPSHOT_CODEC_CONFLICT";
        case ErrorCode::SNAPSHOT_PARSE_ERROR: return "SNAPSHOT_PARSE_ERROR";
    }
    return "UNKNOWN";
}

/**
 * @struct Error
 * @brief Error information with code and message
 *
 * This struct combines an error code with a human-readable message.
 * Used with std::expected for functional error handling.
 *
 * @note Immutable after construction (functional paradigm)
 */
struct Error {
    ErrorCode code;      ///< Error code
    std::string message; ///< Human-readable error message

    /**
     * @brief Constructs an error with code and message
     *
     * ✨ PURE FUNCTION ✨
     *
     * @param error_code Error code
     * @param error_message Error message
     */
    Error(ErrorCode error_code, std::string error_message)
        : code(error_code), message(std::move(error_message)) {}

    /**
     * @brief Gets error message
     *
     * ✨ PURE FUNCTION ✨
     *
     * @return Error message as string view
     */
    [[nodiscard]] auto what() const noexcept -> std::string_view {
        return message;
    }

    /**
     * @brief Checks if error is OK (not actually an error)
     *
     * ✨ PURE FUNCTION ✨
     *
     * @return true if error code is OK
     */
    [[nodiscard]] auto is_ok() const noexcept -> bool {
        return code == ErrorCode::OK;
    }
};

/**
 * @typedef Result<T>
 * @brief Result type for operations that can fail
 *
 * This is an alias for std::expected<T, Error>, providing functional
 * error handling without exceptions. Operations return Result<T> to
 * indicate success (T) or failure (Error).
 *
 * Usage:
 * @code
 * auto result = world.add(entity, Position{1.0f, 2.0f});
 * if (!result) {
 *     LOG_ERROR("add failed: {}", result.error().what());
 * }
 * @endcode
 *
 * @tparam T The type of the success value
 */
template<typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Builds a failed Result from code and message
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param code Error code
 * @param message Error message
 * @return std::unexpected holding the Error
 */
[[nodiscard]] inline auto make_error(ErrorCode code, std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{code, std::move(message)});
}

// ============================================================================
// Utility Types
// ============================================================================

/**
 * @brief Base class for non-copyable, non-movable types
 *
 * Inherit from this to pin an object in memory (other objects hold
 * references into it).
 */
struct NonMovable {
    NonMovable() = default;
    ~NonMovable() = default;

    NonMovable(const NonMovable&) = delete;
    auto operator=(const NonMovable&) -> NonMovable& = delete;

    NonMovable(NonMovable&&) = delete;
    auto operator=(NonMovable&&) -> NonMovable& = delete;
};

} // namespace strata
