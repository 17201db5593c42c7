/**
 * @file component_array.hpp
 * @brief Type-erased component columns for archetype storage
 *
 * Each archetype owns one column per component type in its signature. The
 * archetype itself never knows concrete component types: it talks to its
 * columns through the ComponentArray interface, while call sites that know
 * the type downcast to TypedComponentArray<T> for direct access.
 *
 * @date 2025-11-02
 */

#pragma once

#include <strata/core/types.hpp>

#include <any>
#include <memory>
#include <span>
#include <typeindex>
#include <typeinfo>
#include <vector>

namespace strata::ecs {

/**
 * @brief Type-erased component column
 *
 * ⚠️ IMPURE CLASS (manages mutable storage)
 *
 * All row arguments are trusted: Archetype and World only pass rows
 * they obtained from this column's own size.
 */
class ComponentArray {
public:
    virtual ~ComponentArray() = default;

    /// Number of stored values
    [[nodiscard]] virtual auto size() const noexcept -> std::size_t = 0;

    /// Type of the stored values
    [[nodiscard]] virtual auto type() const noexcept -> std::type_index = 0;

    /**
     * @brief Appends the value at `row` of another column of the same type
     *
     * The source value is moved from; the caller removes that row next.
     *
     * @param source Column of identical component type
     * @param row Row in source
     */
    virtual auto push_from(ComponentArray& source, u32 row) -> void = 0;

    /**
     * @brief Checks whether a boxed value holds this column's type
     *
     * ✨ PURE FUNCTION ✨
     */
    [[nodiscard]] auto accepts(const std::any& value) const noexcept -> bool {
        return value.has_value() && std::type_index(value.type()) == type();
    }

    /**
     * @brief Appends a boxed value
     *
     * @param value Value holding exactly this column's type
     * @return false (nothing appended) on type mismatch
     */
    virtual auto push_any(std::any&& value) -> bool = 0;

    /**
     * @brief Overwrites the value at `row` with a boxed value
     *
     * @return false (nothing written) on type mismatch
     */
    virtual auto set_any(u32 row, std::any&& value) -> bool = 0;

    /**
     * @brief Swap-removes `row`: the last value moves into it, size shrinks by one
     */
    virtual auto swap_remove(u32 row) -> void = 0;

    /// Drops all values
    virtual auto clear() noexcept -> void = 0;
};

/**
 * @brief Column of one concrete component type (contiguous std::vector<T>)
 *
 * @tparam T Component type (copy constructible, so it can travel in std::any)
 */
template<typename T>
class TypedComponentArray final : public ComponentArray {
public:
    [[nodiscard]] auto size() const noexcept -> std::size_t override { return data_.size(); }

    [[nodiscard]] auto type() const noexcept -> std::type_index override { return typeid(T); }

    auto push_from(ComponentArray& source, u32 row) -> void override {
        auto& typed = static_cast<TypedComponentArray<T>&>(source);
        data_.push_back(std::move(typed.data_[row]));
    }

    auto push_any(std::any&& value) -> bool override {
        auto* typed = std::any_cast<T>(&value);
        if (typed == nullptr) {
            return false;
        }
        data_.push_back(std::move(*typed));
        return true;
    }

    auto set_any(u32 row, std::any&& value) -> bool override {
        auto* typed = std::any_cast<T>(&value);
        if (typed == nullptr) {
            return false;
        }
        data_[row] = std::move(*typed);
        return true;
    }

    auto swap_remove(u32 row) -> void override {
        if (row + 1 < data_.size()) {
            data_[row] = std::move(data_.back());
        }
        data_.pop_back();
    }

    auto clear() noexcept -> void override { data_.clear(); }

    /**
     * @brief Appends a value
     *
     * ⚠️ IMPURE (appends to vector)
     */
    auto push(T value) -> void { data_.push_back(std::move(value)); }

    [[nodiscard]] auto at(u32 row) -> T& { return data_[row]; }
    [[nodiscard]] auto at(u32 row) const -> const T& { return data_[row]; }

    /// Contiguous view of the column (valid until the next structural change)
    [[nodiscard]] auto data() noexcept -> std::span<T> { return data_; }
    [[nodiscard]] auto data() const noexcept -> std::span<const T> { return data_; }

private:
    std::vector<T> data_;
};

/**
 * @brief Factory for empty columns of type T
 *
 * ✨ PURE FUNCTION ✨
 */
template<typename T>
[[nodiscard]] auto make_component_array() -> std::unique_ptr<ComponentArray> {
    return std::make_unique<TypedComponentArray<T>>();
}

} // namespace strata::ecs
