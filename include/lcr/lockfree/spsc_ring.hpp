// -----------------------------------------------------------------------------
// Bounded SPSC ring buffer with compile-time capacity
//
// Lock-free and wait-free. Producer and consumer indices live on separate
// cache lines. One slot is kept free to distinguish full from empty, so the
// usable capacity is Capacity - 1.
//
// Example:
//     spsc_ring<Event, 16> events;
//     (void)events.push(ev);
//     Event out;
//     while (events.pop(out)) { ... }
//
// Notes:
//   - Capacity must be a power of two
//   - Single producer, single consumer only
//   - clear() must only be called while no producer is active
// -----------------------------------------------------------------------------
#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <utility>


namespace lcr::lockfree {

template <typename T, std::size_t Capacity>
class alignas(64) spsc_ring {
    static_assert((Capacity >= 2) && ((Capacity & (Capacity - 1)) == 0),
                  "Capacity must be power of two and >= 2");

public:
    spsc_ring() = default;

    spsc_ring(const spsc_ring&) = delete;
    spsc_ring& operator=(const spsc_ring&) = delete;

    [[nodiscard]] inline bool push(const T& item) {
        const std::size_t head = head_.load(std::memory_order_relaxed);
        const std::size_t next = (head + 1) & MASK;
        if (next == tail_.load(std::memory_order_acquire))
            return false; // full
        buffer_[head] = item;
        head_.store(next, std::memory_order_release);
        return true;
    }

    [[nodiscard]] inline bool push(T&& item) {
        const std::size_t head = head_.load(std::memory_order_relaxed);
        const std::size_t next = (head + 1) & MASK;
        if (next == tail_.load(std::memory_order_acquire))
            return false; // full
        buffer_[head] = std::move(item);
        head_.store(next, std::memory_order_release);
        return true;
    }

    [[nodiscard]] inline bool pop(T& out) {
        const std::size_t tail = tail_.load(std::memory_order_relaxed);
        if (tail == head_.load(std::memory_order_acquire))
            return false; // empty
        out = std::move(buffer_[tail]);
        tail_.store((tail + 1) & MASK, std::memory_order_release);
        return true;
    }

    // Consumer-side reset (producer must be quiescent)
    inline void clear() noexcept {
        tail_.store(head_.load(std::memory_order_acquire), std::memory_order_release);
    }

    [[nodiscard]] inline bool empty() const noexcept {
        return tail_.load(std::memory_order_acquire) == head_.load(std::memory_order_acquire);
    }

    [[nodiscard]] inline std::size_t used() const noexcept {
        const std::size_t h = head_.load(std::memory_order_acquire);
        const std::size_t t = tail_.load(std::memory_order_acquire);
        return (h - t) & MASK;
    }

    [[nodiscard]] static constexpr std::size_t capacity() noexcept { return Capacity - 1; }

private:
    static constexpr std::size_t MASK = Capacity - 1;

    std::array<T, Capacity> buffer_{};
    alignas(64) std::atomic<std::size_t> head_{0};
    alignas(64) std::atomic<std::size_t> tail_{0};
};

} // namespace lcr::lockfree
