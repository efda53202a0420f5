#pragma once

#include <atomic>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <type_traits>
#include <vector>

namespace sqlguard {

/**
 * @brief Lock-free multi-producer single-consumer ring buffer
 *
 * Capacity is fixed at construction and rounded up to a power of two.
 * Producers reserve a slot with fetch_add, write, then publish through the
 * slot's ready flag; the single consumer drains slots strictly in order.
 * A push into a slot the consumer has not released yet is dropped and
 * counted as overflow.
 */
template <typename T>
class MPSCRingBuffer {
    static_assert(std::is_move_constructible_v<T>, "T must be move-constructible");

public:
    explicit MPSCRingBuffer(size_t capacity)
        : capacity_(std::bit_ceil(capacity < 2 ? size_t{2} : capacity)),
          mask_(capacity_ - 1),
          slots_(std::make_unique<Slot[]>(capacity_)) {}

    MPSCRingBuffer(const MPSCRingBuffer&) = delete;
    MPSCRingBuffer& operator=(const MPSCRingBuffer&) = delete;

    // Producer side, thread-safe. false when the item was dropped.
    [[nodiscard]] bool try_push(T item) {
        const size_t pos = write_pos_.fetch_add(1, std::memory_order_relaxed);
        Slot& slot = slots_[pos & mask_];

        if (slot.ready.load(std::memory_order_acquire)) {
            overflow_count_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }

        slot.data.emplace(std::move(item));
        slot.ready.store(true, std::memory_order_release);
        return true;
    }

    // Consumer side only. Appends up to max_count items to batch.
    size_t drain(std::vector<T>& batch, size_t max_count) {
        size_t count = 0;
        while (count < max_count) {
            Slot& slot = slots_[read_pos_ & mask_];
            if (!slot.ready.load(std::memory_order_acquire)) {
                break;
            }
            if (slot.data.has_value()) {
                batch.emplace_back(std::move(*slot.data));
                slot.data.reset();
            }
            slot.ready.store(false, std::memory_order_release);
            ++read_pos_;
            ++count;
        }
        return count;
    }

    [[nodiscard]] uint64_t overflow_count() const noexcept {
        return overflow_count_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

private:
    struct alignas(64) Slot {
        std::optional<T> data;
        std::atomic<bool> ready{false};
    };

    const size_t capacity_;
    const size_t mask_;
    std::unique_ptr<Slot[]> slots_;

    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) size_t read_pos_{0};  // consumer only
    alignas(64) std::atomic<uint64_t> overflow_count_{0};
};

} // namespace sqlguard
