#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <vector>

namespace auditpipe {

/**
 * @brief Bounded lock-free Multi-Producer Single-Consumer ring buffer
 *
 * Design:
 * - Capacity fixed at construction, power of 2 (bitmask modulo)
 * - Each slot carries a sequence number. A producer claims a slot with a
 *   CAS on write_pos_ only when the slot's sequence says it is free, so a
 *   full buffer never consumes a position.
 * - Overflow: the new item is dropped and counted; producers never block
 * - Consumer: single thread, sequential
 *
 * @tparam T Element type (must be move-constructible)
 */
template <typename T>
class MPSCRingBuffer {
    static_assert(std::is_move_constructible_v<T>, "T must be move-constructible");

public:
    /**
     * @throws std::invalid_argument unless capacity is a non-zero power of 2
     */
    explicit MPSCRingBuffer(size_t capacity)
        : capacity_(capacity), mask_(capacity - 1) {
        if (capacity == 0 || (capacity & (capacity - 1)) != 0) {
            throw std::invalid_argument("Ring buffer capacity must be a power of 2");
        }
        slots_ = std::make_unique<Slot[]>(capacity_);
        for (size_t i = 0; i < capacity_; ++i) {
            slots_[i].sequence.store(i, std::memory_order_relaxed);
        }
    }

    MPSCRingBuffer(const MPSCRingBuffer&) = delete;
    MPSCRingBuffer& operator=(const MPSCRingBuffer&) = delete;

    /**
     * @brief Enqueue (any thread)
     * @return false if the buffer is full and the item was dropped
     */
    [[nodiscard]] bool try_push(T item) {
        size_t pos = write_pos_.load(std::memory_order_relaxed);
        Slot* slot = nullptr;
        for (;;) {
            slot = &slots_[pos & mask_];
            const size_t seq = slot->sequence.load(std::memory_order_acquire);
            const auto diff = static_cast<std::ptrdiff_t>(seq) - static_cast<std::ptrdiff_t>(pos);
            if (diff == 0) {
                if (write_pos_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
                    break;
                }
            } else if (diff < 0) {
                overflow_count_.fetch_add(1, std::memory_order_relaxed);
                return false;
            } else {
                pos = write_pos_.load(std::memory_order_relaxed);
            }
        }

        slot->data.emplace(std::move(item));
        slot->sequence.store(pos + 1, std::memory_order_release);
        return true;
    }

    /**
     * @brief Dequeue one item (consumer only)
     */
    [[nodiscard]] std::optional<T> try_pop() {
        const size_t pos = read_pos_.load(std::memory_order_relaxed);
        Slot& slot = slots_[pos & mask_];
        if (slot.sequence.load(std::memory_order_acquire) != pos + 1) {
            return std::nullopt;
        }

        std::optional<T> result = std::move(slot.data);
        slot.data.reset();
        slot.sequence.store(pos + capacity_, std::memory_order_release);
        read_pos_.store(pos + 1, std::memory_order_relaxed);
        return result;
    }

    /**
     * @brief Move up to max_count items into batch (consumer only)
     * @return Number of items drained
     */
    size_t drain(std::vector<T>& batch, size_t max_count) {
        size_t count = 0;
        while (count < max_count) {
            auto item = try_pop();
            if (!item) break;
            batch.emplace_back(std::move(*item));
            ++count;
        }
        return count;
    }

    [[nodiscard]] uint64_t overflow_count() const noexcept {
        return overflow_count_.load(std::memory_order_relaxed);
    }

    // Approximate: the two positions are read independently (any thread)
    [[nodiscard]] size_t size_approx() const noexcept {
        const size_t r = read_pos_.load(std::memory_order_relaxed);
        const size_t w = write_pos_.load(std::memory_order_relaxed);
        return (w >= r) ? (w - r) : 0;
    }

    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

private:
    struct alignas(64) Slot {
        std::atomic<size_t> sequence{0};
        std::optional<T> data;
    };

    const size_t capacity_;
    const size_t mask_;
    std::unique_ptr<Slot[]> slots_;

    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) std::atomic<size_t> read_pos_{0};   // written by the consumer only
    alignas(64) std::atomic<uint64_t> overflow_count_{0};
};

} // namespace auditpipe
