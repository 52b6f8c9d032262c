#pragma once

#include <deque>
#include <mutex>
#include <memory>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <utility>
#include <string_view>
#include <condition_variable>

#include "lcr/metrics/atomic/counter.hpp"


namespace tidewire::core::channel {

/*
===============================================================================
 Bounded channel
===============================================================================

A bounded queue split into a move-only Sender and a copyable Receiver.

Delivery contract
-----------------
  - Sender::emit() never blocks. When the channel is full the OLDEST pending
    item is evicted and counted (Receiver::dropped()) so the queue always
    holds the freshest data.
  - Capacity 0 is a hand-off: an item is accepted only when a receiver is
    currently blocked waiting for it, otherwise it is dropped.
  - Items still queued when the channel closes remain receivable; receive()
    reports closure only once the queue is drained.

Closure
-------
Closing consumes the Sender (std::move(tx).close()), and destroying an
un-closed Sender closes the channel. Since a moved-from or closed Sender has
no channel to write to, writing after close and closing twice cannot be
expressed.
===============================================================================
*/

enum class RecvStatus : std::uint8_t {
    Ok,
    Timeout,    // nothing arrived within the wait
    Closed      // closed and fully drained
};

[[nodiscard]]
inline constexpr std::string_view to_string(RecvStatus s) noexcept {
    switch (s) {
        case RecvStatus::Ok:      return "Ok";
        case RecvStatus::Timeout: return "Timeout";
        case RecvStatus::Closed:  return "Closed";
        default:                  return "Unknown";
    }
}

namespace detail {

template<typename T>
struct State {
    explicit State(std::size_t cap)
        : capacity(cap)
    {}

    mutable std::mutex mtx;
    std::condition_variable cv;
    std::deque<T> items;
    const std::size_t capacity;
    std::size_t waiting{0};     // receivers blocked in receive()
    bool closed{false};

    lcr::metrics::atomic::counter64 delivered;
    lcr::metrics::atomic::counter64 dropped;
};

} // namespace detail

template<typename T> class Sender;
template<typename T> class Receiver;

template<typename T>
[[nodiscard]] std::pair<Sender<T>, Receiver<T>> make(std::size_t capacity);


// -----------------------------------------------------------------------------
// Sender (single writer, move-only)
// -----------------------------------------------------------------------------
template<typename T>
class Sender {
public:
    Sender() = default;

    Sender(const Sender&) = delete;
    Sender& operator=(const Sender&) = delete;

    Sender(Sender&& other) noexcept = default;

    Sender& operator=(Sender&& other) noexcept {
        if (this != &other) {
            close_();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    ~Sender() {
        close_();
    }

    // Non-blocking. Returns false when the item itself was dropped (hand-off
    // channel with no waiting receiver).
    inline bool emit(T item) {
        if (!state_) {
            return false;
        }
        {
            std::lock_guard<std::mutex> lock(state_->mtx);
            if (state_->capacity == 0) {
                if (state_->items.size() >= state_->waiting) {
                    state_->dropped.inc();
                    return false;
                }
            }
            else if (state_->items.size() >= state_->capacity) {
                state_->items.pop_front();
                state_->dropped.inc();
            }
            state_->items.push_back(std::move(item));
            state_->delivered.inc();
        }
        state_->cv.notify_one();
        return true;
    }

    inline void close() && {
        close_();
    }

    // Closes after enqueueing a final item. If the channel is full the oldest
    // pending item is evicted so the final item is always observable.
    inline void close_with(T last) && {
        if (!state_) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(state_->mtx);
            if (state_->capacity > 0 && state_->items.size() >= state_->capacity) {
                state_->items.pop_front();
                state_->dropped.inc();
            }
            state_->items.push_back(std::move(last));
            state_->delivered.inc();
        }
        close_();
    }

    [[nodiscard]]
    inline bool valid() const noexcept {
        return static_cast<bool>(state_);
    }

private:
    template<typename U>
    friend std::pair<Sender<U>, Receiver<U>> make(std::size_t capacity);

    explicit Sender(std::shared_ptr<detail::State<T>> state) noexcept
        : state_(std::move(state))
    {}

    inline void close_() noexcept {
        if (!state_) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(state_->mtx);
            state_->closed = true;
        }
        state_->cv.notify_all();
        state_.reset();
    }

private:
    std::shared_ptr<detail::State<T>> state_;
};


// -----------------------------------------------------------------------------
// Receiver (copyable; copies share the same queue)
// -----------------------------------------------------------------------------
template<typename T>
class Receiver {
public:
    Receiver() = default;

    // Blocks until an item arrives. false once closed and drained.
    [[nodiscard]]
    inline bool receive(T& out) {
        if (!state_) {
            return false;
        }
        std::unique_lock<std::mutex> lock(state_->mtx);
        ++state_->waiting;
        state_->cv.wait(lock, [this] { return !state_->items.empty() || state_->closed; });
        --state_->waiting;
        return pop_locked_(out);
    }

    [[nodiscard]]
    inline bool try_receive(T& out) {
        if (!state_) {
            return false;
        }
        std::lock_guard<std::mutex> lock(state_->mtx);
        return pop_locked_(out);
    }

    template<typename Rep, typename Period>
    [[nodiscard]]
    inline RecvStatus receive_for(T& out, std::chrono::duration<Rep, Period> timeout) {
        if (!state_) {
            return RecvStatus::Closed;
        }
        std::unique_lock<std::mutex> lock(state_->mtx);
        ++state_->waiting;
        state_->cv.wait_for(lock, timeout, [this] { return !state_->items.empty() || state_->closed; });
        --state_->waiting;
        if (pop_locked_(out)) {
            return RecvStatus::Ok;
        }
        return state_->closed ? RecvStatus::Closed : RecvStatus::Timeout;
    }

    // Closed by the sender (items may still be pending)
    [[nodiscard]]
    inline bool is_closed() const noexcept {
        if (!state_) {
            return true;
        }
        std::lock_guard<std::mutex> lock(state_->mtx);
        return state_->closed;
    }

    [[nodiscard]]
    inline std::size_t size() const noexcept {
        if (!state_) {
            return 0;
        }
        std::lock_guard<std::mutex> lock(state_->mtx);
        return state_->items.size();
    }

    [[nodiscard]]
    inline std::size_t capacity() const noexcept {
        return state_ ? state_->capacity : 0;
    }

    [[nodiscard]]
    inline std::uint64_t dropped() const noexcept {
        return state_ ? state_->dropped.load() : 0;
    }

    [[nodiscard]]
    inline std::uint64_t delivered() const noexcept {
        return state_ ? state_->delivered.load() : 0;
    }

    [[nodiscard]]
    inline bool valid() const noexcept {
        return static_cast<bool>(state_);
    }

private:
    template<typename U>
    friend std::pair<Sender<U>, Receiver<U>> make(std::size_t capacity);

    explicit Receiver(std::shared_ptr<detail::State<T>> state) noexcept
        : state_(std::move(state))
    {}

    inline bool pop_locked_(T& out) {
        if (state_->items.empty()) {
            return false;
        }
        out = std::move(state_->items.front());
        state_->items.pop_front();
        return true;
    }

private:
    std::shared_ptr<detail::State<T>> state_;
};


template<typename T>
std::pair<Sender<T>, Receiver<T>> make(std::size_t capacity) {
    auto state = std::make_shared<detail::State<T>>(capacity);
    return { Sender<T>(state), Receiver<T>(state) };
}

} // namespace tidewire::core::channel
