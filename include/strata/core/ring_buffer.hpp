/**
 * @file ring_buffer.hpp
 * @brief Fixed-capacity ring buffer that keeps the newest samples
 *
 * Backing store for profiling history series. Pushing into a full buffer
 * overwrites the oldest sample.
 *
 * @date 2025-11-02
 */

#pragma once

#include <strata/core/types.hpp>

#include <cstddef>
#include <utility>
#include <vector>

namespace strata {

/**
 * @class RingBuffer
 * @brief Bounded FIFO of samples, oldest dropped first
 *
 * A capacity of zero stores nothing.
 *
 * @tparam T Sample type (copyable)
 */
template<typename T>
class RingBuffer {
public:
    explicit RingBuffer(std::size_t capacity = 0) : capacity_(capacity) {
        data_.reserve(capacity_);
    }

    /**
     * @brief Appends a sample, dropping the oldest when full
     *
     * @param value Sample to store
     */
    auto push(T value) -> void {
        if (capacity_ == 0) {
            return;
        }
        if (data_.size() < capacity_) {
            data_.push_back(std::move(value));
            return;
        }
        data_[head_] = std::move(value);
        head_ = (head_ + 1) % capacity_;
    }

    /**
     * @brief Copies samples out oldest-first
     *
     * ✨ PURE FUNCTION ✨
     */
    [[nodiscard]] auto to_vector() const -> std::vector<T> {
        std::vector<T> out;
        out.reserve(data_.size());
        for (std::size_t i = 0; i < data_.size(); ++i) {
            out.push_back(data_[(head_ + i) % data_.size()]);
        }
        return out;
    }

    /**
     * @brief Changes capacity, keeping the newest samples that fit
     *
     * @param capacity New capacity (0 clears the buffer)
     */
    auto set_capacity(std::size_t capacity) -> void {
        auto samples = to_vector();
        const std::size_t keep = samples.size() < capacity ? samples.size() : capacity;

        data_.clear();
        data_.reserve(capacity);
        data_.insert(data_.end(),
                     samples.end() - static_cast<std::ptrdiff_t>(keep),
                     samples.end());
        head_ = 0;
        capacity_ = capacity;
    }

    auto clear() noexcept -> void {
        data_.clear();
        head_ = 0;
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return data_.size(); }
    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return capacity_; }
    [[nodiscard]] auto empty() const noexcept -> bool { return data_.empty(); }

private:
    std::vector<T> data_;
    std::size_t capacity_;
    std::size_t head_ = 0;  ///< Index of the oldest sample once full
};

} // namespace strata
