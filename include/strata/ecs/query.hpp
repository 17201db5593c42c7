/**
 * @file query.hpp
 * @brief Lazy queries over archetype tables
 *
 * Queries are built by World (World::query / World::query_tables) from the
 * archetypes whose signature is a superset of the requested types. They
 * hold the World's iteration lock from construction until they are
 * exhausted or destroyed, so direct structural changes fail in between.
 *
 * Components are always projected in the caller's argument order, which is
 * independent of the numeric type ids used for matching.
 *
 * @code
 * for (auto [entity, position, velocity] : world.query<Position, Velocity>()) {
 *     position.x += velocity.dx * dt;
 * }
 * @endcode
 *
 * @date 2025-11-02
 */

#pragma once

#include <strata/core/types.hpp>
#include <strata/ecs/archetype.hpp>
#include <strata/ecs/entity.hpp>

#include <array>
#include <iterator>
#include <span>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace strata::ecs {

// ============================================================================
// Iteration Lock
// ============================================================================

/**
 * @brief RAII increment of a World's iteration depth
 *
 * Reentrant: nested queries each hold their own lock and the depth
 * unwinds correctly on every exit path (including exceptions).
 */
class IterationLock {
public:
    explicit IterationLock(u32& depth) noexcept : depth_(&depth) { ++*depth_; }

    IterationLock(const IterationLock&) = delete;
    auto operator=(const IterationLock&) -> IterationLock& = delete;

    IterationLock(IterationLock&& other) noexcept : depth_(std::exchange(other.depth_, nullptr)) {}
    auto operator=(IterationLock&& other) noexcept -> IterationLock& {
        if (this != &other) {
            release();
            depth_ = std::exchange(other.depth_, nullptr);
        }
        return *this;
    }

    ~IterationLock() { release(); }

    /// Drops the lock early (idempotent)
    auto release() noexcept -> void {
        if (depth_ != nullptr) {
            --*depth_;
            depth_ = nullptr;
        }
    }

    [[nodiscard]] auto held() const noexcept -> bool { return depth_ != nullptr; }

private:
    u32* depth_;
};

// ============================================================================
// Row Query
// ============================================================================

/**
 * @brief Single-pass sequence of (entity, Ts&...) rows
 *
 * Archetypes are visited in creation order, rows in current array order.
 *
 * ⚠️ Holds the iteration lock until exhausted or destroyed
 *
 * @tparam Ts Requested component types (argument order is kept)
 */
template<typename... Ts>
class Query {
public:
    using Row = std::tuple<Entity, Ts&...>;

    class Iterator {
    public:
        using value_type = Row;
        using difference_type = std::ptrdiff_t;

        Iterator() = default;

        explicit Iterator(Query* query) : query_(query) {
            enter_archetype(0);
        }

        [[nodiscard]] auto operator*() const -> Row {
            return std::apply([this](auto*... columns) {
                return Row(entities_[row_], columns[row_]...);
            }, columns_);
        }

        auto operator++() -> Iterator& {
            if (++row_ >= entities_.size()) {
                enter_archetype(archetype_ + 1);
            }
            return *this;
        }

        auto operator++(int) -> void { ++*this; }

        [[nodiscard]] friend auto operator==(const Iterator& it, std::default_sentinel_t) noexcept -> bool {
            return it.query_ == nullptr;
        }

    private:
        /// Moves to the first non-empty archetype at or after `index`
        auto enter_archetype(std::size_t index) -> void {
            auto& matches = query_->matches_;
            while (index < matches.size() && matches[index]->empty()) {
                ++index;
            }
            if (index >= matches.size()) {
                query_->lock_.release();  // exhausted
                query_ = nullptr;
                return;
            }

            Archetype& archetype = *matches[index];
            archetype_ = index;
            row_ = 0;
            entities_ = archetype.entities();
            columns_ = column_pointers(archetype, std::index_sequence_for<Ts...>{});
        }

        template<std::size_t... Is>
        auto column_pointers(Archetype& archetype, std::index_sequence<Is...>) const -> std::tuple<Ts*...> {
            return {archetype.template column_as<std::remove_const_t<Ts>>(query_->types_[Is])->data().data()...};
        }

        Query* query_ = nullptr;
        std::size_t archetype_ = 0;
        std::size_t row_ = 0;
        std::span<const Entity> entities_;
        std::tuple<Ts*...> columns_{};
    };

    /**
     * @param matches Archetypes whose signature contains all of Ts
     * @param types Type ids of Ts, in argument order
     * @param depth World iteration depth to lock
     */
    Query(std::vector<Archetype*> matches, std::array<TypeId, sizeof...(Ts)> types, u32& depth)
        : matches_(std::move(matches))
        , types_(types)
        , lock_(depth) {}

    Query(const Query&) = delete;
    auto operator=(const Query&) -> Query& = delete;
    Query(Query&&) = delete;
    auto operator=(Query&&) -> Query& = delete;

    /**
     * @brief Starts the single pass (call once)
     */
    [[nodiscard]] auto begin() -> Iterator {
        if (!lock_.held()) {
            return Iterator();
        }
        return Iterator(this);
    }

    [[nodiscard]] auto end() const noexcept -> std::default_sentinel_t { return std::default_sentinel; }

    /// Number of matching archetypes (including empty ones)
    [[nodiscard]] auto archetype_count() const noexcept -> std::size_t { return matches_.size(); }

private:
    std::vector<Archetype*> matches_;
    std::array<TypeId, sizeof...(Ts)> types_;
    IterationLock lock_;
};

// ============================================================================
// Table Query
// ============================================================================

/**
 * @brief One matching archetype, exposed as raw columns
 *
 * Spans are valid until the next structural change.
 */
template<typename... Ts>
struct QueryTable {
    u32 archetype_id;                       ///< Id of the archetype
    std::span<const Entity> entities;       ///< Entity per row
    std::tuple<std::span<Ts>...> columns;   ///< One column per requested type, argument order

    [[nodiscard]] auto size() const noexcept -> std::size_t { return entities.size(); }

    /// I-th requested column
    template<std::size_t I>
    [[nodiscard]] auto column() const noexcept {
        return std::get<I>(columns);
    }
};

/**
 * @brief Single-pass sequence of QueryTable records, one per matching archetype
 *
 * Empty archetypes are skipped.
 *
 * ⚠️ Holds the iteration lock until exhausted or destroyed
 */
template<typename... Ts>
class QueryTables {
public:
    using Table = QueryTable<Ts...>;

    class Iterator {
    public:
        using value_type = Table;
        using difference_type = std::ptrdiff_t;

        Iterator() = default;

        explicit Iterator(QueryTables* tables) : tables_(tables) {
            advance_to(0);
        }

        [[nodiscard]] auto operator*() const -> Table {
            Archetype& archetype = *tables_->matches_[index_];
            return make_table(archetype, std::index_sequence_for<Ts...>{});
        }

        auto operator++() -> Iterator& {
            advance_to(index_ + 1);
            return *this;
        }

        auto operator++(int) -> void { ++*this; }

        [[nodiscard]] friend auto operator==(const Iterator& it, std::default_sentinel_t) noexcept -> bool {
            return it.tables_ == nullptr;
        }

    private:
        auto advance_to(std::size_t index) -> void {
            auto& matches = tables_->matches_;
            while (index < matches.size() && matches[index]->empty()) {
                ++index;
            }
            if (index >= matches.size()) {
                tables_->lock_.release();
                tables_ = nullptr;
                return;
            }
            index_ = index;
        }

        template<std::size_t... Is>
        auto make_table(Archetype& archetype, std::index_sequence<Is...>) const -> Table {
            return Table{
                .archetype_id = archetype.id(),
                .entities = archetype.entities(),
                .columns = {archetype.template column_as<std::remove_const_t<Ts>>(tables_->types_[Is])->data()...},
            };
        }

        QueryTables* tables_ = nullptr;
        std::size_t index_ = 0;
    };

    QueryTables(std::vector<Archetype*> matches, std::array<TypeId, sizeof...(Ts)> types, u32& depth)
        : matches_(std::move(matches))
        , types_(types)
        , lock_(depth) {}

    QueryTables(const QueryTables&) = delete;
    auto operator=(const QueryTables&) -> QueryTables& = delete;
    QueryTables(QueryTables&&) = delete;
    auto operator=(QueryTables&&) -> QueryTables& = delete;

    [[nodiscard]] auto begin() -> Iterator {
        if (!lock_.held()) {
            return Iterator();
        }
        return Iterator(this);
    }

    [[nodiscard]] auto end() const noexcept -> std::default_sentinel_t { return std::default_sentinel; }

private:
    std::vector<Archetype*> matches_;
    std::array<TypeId, sizeof...(Ts)> types_;
    IterationLock lock_;
};

} // namespace strata::ecs
