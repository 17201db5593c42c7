/**
 * @file events.hpp
 * @brief Double-buffered, phase-scoped event channels
 *
 * emit() always appends to the write buffer; drain()/values() always read
 * the read buffer. swap_buffers() runs at phase boundaries only: it makes
 * this phase's events readable and discards whatever was left unread.
 *
 * Net effect: an event emitted in phase N is invisible during N, readable
 * during N+1, and gone after the boundary that ends N+1.
 *
 * @date 2025-11-02
 */

#pragma once

#include <strata/core/types.hpp>

#include <span>
#include <utility>
#include <vector>

namespace strata::ecs {

/**
 * @brief Type-erased view of a channel (what World needs at boundaries)
 */
class EventChannelBase {
public:
    virtual ~EventChannelBase() = default;

    /// Deliver the write buffer, drop unread events
    virtual auto swap_buffers() -> void = 0;

    /// Clear readable events
    virtual auto clear() noexcept -> void = 0;

    /// Clear both buffers
    virtual auto clear_all() noexcept -> void = 0;
};

/**
 * @brief FIFO event channel for one event type
 *
 * ⚠️ IMPURE CLASS
 *
 * @tparam T Event type
 */
template<typename T>
class EventChannel final : public EventChannelBase {
public:
    /**
     * @brief Emit an event into the current phase (write buffer)
     */
    auto emit(T event) -> void {
        write_.push_back(std::move(event));
    }

    /**
     * @brief Calls fn for every readable event in emission order, then clears them
     *
     * Events emitted by fn go to the write buffer and are not visited.
     */
    template<typename Fn>
    auto drain(Fn&& fn) -> void {
        auto readable = std::move(read_);
        read_.clear();
        for (auto& event : readable) {
            fn(event);
        }
        // keep the allocation for the next phase
        if (read_.empty()) {
            readable.clear();
            read_ = std::move(readable);
        }
    }

    /**
     * @brief Readable events (previous phase)
     *
     * Valid until the next boundary; do not store it.
     */
    [[nodiscard]] auto values() const noexcept -> std::span<const T> { return read_; }

    [[nodiscard]] auto count() const noexcept -> std::size_t { return read_.size(); }

    /// Events emitted this phase, not yet readable
    [[nodiscard]] auto pending() const noexcept -> std::size_t { return write_.size(); }

    auto clear() noexcept -> void override { read_.clear(); }

    auto clear_all() noexcept -> void override {
        read_.clear();
        write_.clear();
    }

    auto swap_buffers() -> void override {
        std::swap(read_, write_);
        write_.clear();  // drops events that were never read
    }

private:
    std::vector<T> read_;
    std::vector<T> write_;
};

} // namespace strata::ecs
