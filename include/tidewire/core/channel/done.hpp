#pragma once

#include <mutex>
#include <memory>
#include <chrono>
#include <utility>
#include <condition_variable>


namespace tidewire::core::channel {

namespace detail {

struct DoneState {
    mutable std::mutex mtx;
    std::condition_variable cv;
    bool fired{false};
};

} // namespace detail

class DoneTrigger;
class DoneSignal;

[[nodiscard]] inline std::pair<DoneTrigger, DoneSignal> make_done();

// -----------------------------------------------------------------------------
// Observer side of a one-shot terminal signal. Copyable.
// -----------------------------------------------------------------------------
class DoneSignal {
public:
    DoneSignal() = default;

    [[nodiscard]]
    inline bool is_done() const noexcept {
        if (!state_) {
            return false;
        }
        std::lock_guard<std::mutex> lock(state_->mtx);
        return state_->fired;
    }

    inline void wait() const {
        if (!state_) {
            return;
        }
        std::unique_lock<std::mutex> lock(state_->mtx);
        state_->cv.wait(lock, [this] { return state_->fired; });
    }

    // true when fired within the timeout
    template<typename Rep, typename Period>
    [[nodiscard]]
    inline bool wait_for(std::chrono::duration<Rep, Period> timeout) const {
        if (!state_) {
            return false;
        }
        std::unique_lock<std::mutex> lock(state_->mtx);
        return state_->cv.wait_for(lock, timeout, [this] { return state_->fired; });
    }

private:
    friend std::pair<DoneTrigger, DoneSignal> make_done();

    explicit DoneSignal(std::shared_ptr<detail::DoneState> state) noexcept
        : state_(std::move(state))
    {}

    std::shared_ptr<detail::DoneState> state_;
};

// -----------------------------------------------------------------------------
// Firing side. Move-only; fire() consumes it and destruction fires it, so the
// signal fires exactly once.
// -----------------------------------------------------------------------------
class DoneTrigger {
public:
    DoneTrigger() = default;

    DoneTrigger(const DoneTrigger&) = delete;
    DoneTrigger& operator=(const DoneTrigger&) = delete;

    DoneTrigger(DoneTrigger&&) noexcept = default;

    DoneTrigger& operator=(DoneTrigger&& other) noexcept {
        if (this != &other) {
            fire_();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    ~DoneTrigger() {
        fire_();
    }

    inline void fire() && {
        fire_();
    }

    [[nodiscard]]
    inline bool valid() const noexcept {
        return static_cast<bool>(state_);
    }

private:
    friend std::pair<DoneTrigger, DoneSignal> make_done();

    explicit DoneTrigger(std::shared_ptr<detail::DoneState> state) noexcept
        : state_(std::move(state))
    {}

    inline void fire_() noexcept {
        if (!state_) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(state_->mtx);
            state_->fired = true;
        }
        state_->cv.notify_all();
        state_.reset();
    }

    std::shared_ptr<detail::DoneState> state_;
};

inline std::pair<DoneTrigger, DoneSignal> make_done() {
    auto state = std::make_shared<detail::DoneState>();
    return { DoneTrigger(state), DoneSignal(state) };
}

} // namespace tidewire::core::channel
