#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <vector>

namespace piiguard {

/**
 * @brief Lock-free Multi-Producer Single-Consumer ring buffer
 *
 * - Capacity fixed at construction (power of 2, index via bitmask)
 * - Producers reserve a slot with a CAS on write_pos_ only while the
 *   buffer has room, so a dropped item never leaves a hole the
 *   consumer would stall on
 * - Overflow: the new item is dropped and counted
 *
 * Slot protocol:
 *   A producer that reserved position p writes the data, then sets
 *   ready=true. The single consumer reads slots in order while ready,
 *   moves the data out, clears ready, then advances read_pos_.
 *
 * @tparam T Element type (must be move-constructible)
 */
template <typename T>
class MPSCRingBuffer {
    static_assert(std::is_move_constructible_v<T>,
                  "T must be move-constructible");

public:
    explicit MPSCRingBuffer(size_t capacity)
        : capacity_(capacity), mask_(capacity - 1), slots_(capacity) {
        if (capacity == 0 || (capacity & (capacity - 1)) != 0) {
            throw std::invalid_argument("MPSCRingBuffer capacity must be a power of 2");
        }
    }

    // Non-copyable, non-movable (contains atomics)
    MPSCRingBuffer(const MPSCRingBuffer&) = delete;
    MPSCRingBuffer& operator=(const MPSCRingBuffer&) = delete;
    MPSCRingBuffer(MPSCRingBuffer&&) = delete;
    MPSCRingBuffer& operator=(MPSCRingBuffer&&) = delete;

    /**
     * @brief Try to enqueue an item (producer, thread-safe)
     * @return true if enqueued, false if dropped (buffer full)
     */
    [[nodiscard]] bool try_push(T item) {
        size_t pos = write_pos_.load(std::memory_order_relaxed);
        while (true) {
            const size_t read = read_pos_.load(std::memory_order_acquire);
            // pos is stale once the consumer has passed it; occupancy is unknown
            if (pos < read) {
                pos = write_pos_.load(std::memory_order_relaxed);
                continue;
            }
            if (pos - read >= capacity_) {
                overflow_count_.fetch_add(1, std::memory_order_relaxed);
                return false;
            }
            if (write_pos_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
                break;
            }
        }

        Slot& slot = slots_[pos & mask_];
        slot.data.emplace(std::move(item));
        slot.ready.store(true, std::memory_order_release);
        return true;
    }

    /**
     * @brief Drain up to max_count items into a batch (consumer only)
     * @return Number of items drained
     */
    size_t drain(std::vector<T>& batch, size_t max_count) {
        size_t count = 0;
        size_t read = read_pos_.load(std::memory_order_relaxed);

        while (count < max_count) {
            Slot& slot = slots_[read & mask_];
            if (!slot.ready.load(std::memory_order_acquire)) {
                break;
            }

            if (slot.data.has_value()) {
                batch.emplace_back(std::move(*slot.data));
                slot.data.reset();
            }

            slot.ready.store(false, std::memory_order_release);
            ++read;
            read_pos_.store(read, std::memory_order_release);
            ++count;
        }

        return count;
    }

    [[nodiscard]] uint64_t overflow_count() const noexcept {
        return overflow_count_.load(std::memory_order_relaxed);
    }

    /// Approximate: the two positions are read independently
    [[nodiscard]] size_t size_approx() const noexcept {
        const size_t w = write_pos_.load(std::memory_order_relaxed);
        const size_t r = read_pos_.load(std::memory_order_relaxed);
        return (w >= r) ? (w - r) : 0;
    }

    [[nodiscard]] bool empty_approx() const noexcept {
        return size_approx() == 0;
    }

    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

private:
    // Aligned so adjacent slots touched by different threads do not share a line
    struct alignas(64) Slot {
        std::optional<T> data;
        std::atomic<bool> ready{false};
    };

    const size_t capacity_;
    const size_t mask_;

    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) std::atomic<size_t> read_pos_{0};
    alignas(64) std::atomic<uint64_t> overflow_count_{0};

    std::vector<Slot> slots_;
};

} // namespace piiguard
