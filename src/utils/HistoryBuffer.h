// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file HistoryBuffer.h
 * @brief Fixed-capacity ring that evicts its oldest entry when full
 *
 * Single-writer. Storage is inline, so push() never allocates.
 * Index 0 is the oldest retained entry, size()-1 the newest.
 */

#pragma once

#include <cstddef>

namespace caninesense {
namespace utils {

template<typename T, size_t Capacity>
class HistoryBuffer {
    static_assert(Capacity > 0, "Capacity must be positive");

public:
    HistoryBuffer() : head_(0), count_(0) {}

    /**
     * @brief Append an item, evicting the oldest when full
     */
    void push(const T& item) {
        size_t tail = (head_ + count_) % Capacity;
        buffer_[tail] = item;
        if (count_ < Capacity) {
            count_++;
        } else {
            head_ = (head_ + 1) % Capacity;
        }
    }

    /**
     * @brief Entry by age order (0 = oldest)
     */
    const T& at(size_t index) const {
        return buffer_[(head_ + index) % Capacity];
    }

    /**
     * @brief Most recently pushed entry (size() must be > 0)
     */
    const T& newest() const {
        return at(count_ - 1);
    }

    size_t size() const { return count_; }
    bool isEmpty() const { return count_ == 0; }
    bool isFull() const { return count_ == Capacity; }
    static constexpr size_t capacity() { return Capacity; }

    void clear() {
        head_ = 0;
        count_ = 0;
    }

private:
    T buffer_[Capacity];
    size_t head_;
    size_t count_;
};

} // namespace utils
} // namespace caninesense
