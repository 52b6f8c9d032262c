#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string_view>
#include <utility>
#include <vector>

#include "tidewire/core/stream/subscription.hpp"


namespace tidewire::core::stream {

// ===============================================================
// CALLER INTENTS
// ===============================================================
enum class IntentKind : std::uint8_t {
    Open,       // subscription entered Connecting, attach it
    Detach,     // subscription already closed by unsubscribe(), release resources
    Cancel      // stop token fired, close with Cancelled and release
};

[[nodiscard]]
inline constexpr std::string_view to_string(IntentKind k) noexcept {
    switch (k) {
        case IntentKind::Open:   return "Open";
        case IntentKind::Detach: return "Detach";
        case IntentKind::Cancel: return "Cancel";
        default:                 return "Unknown";
    }
}

struct Intent {
    IntentKind kind{IntentKind::Open};
    SubscriptionId id{0};
    std::shared_ptr<Subscription> sub;      // Open only
    std::stop_token token;                  // Open only, watched once attached
};

/*
===============================================================================
 stream::Dispatcher
===============================================================================

State shared between an engine and the handles it created. It outlives the
engine when handles do, so late calls on a handle fail cleanly instead of
touching a destroyed engine.

  driver_mutex  held by every writer: Engine::poll() and Stream::unsubscribe()
  intents       FIFO of caller requests, consumed by the next driver step

The intent queue has its own lock and never waits on the driver mutex, so it
is safe to post from stop callbacks.
===============================================================================
*/
class Dispatcher {
public:
    [[nodiscard]]
    inline std::mutex& driver_mutex() noexcept {
        return driver_mutex_;
    }

    // false once the engine has shut down
    [[nodiscard]]
    inline bool post(Intent intent) {
        std::lock_guard<std::mutex> lock(intents_mutex_);
        if (!accepting_) {
            return false;
        }
        intents_.push_back(std::move(intent));
        return true;
    }

    inline void drain(std::vector<Intent>& out) {
        std::lock_guard<std::mutex> lock(intents_mutex_);
        out.swap(intents_);
        intents_.clear();
    }

    // Stops accepting intents and returns the ones never processed
    [[nodiscard]]
    inline std::vector<Intent> shutdown() {
        std::lock_guard<std::mutex> lock(intents_mutex_);
        accepting_ = false;
        return std::exchange(intents_, {});
    }

    [[nodiscard]]
    inline bool accepting() const {
        std::lock_guard<std::mutex> lock(intents_mutex_);
        return accepting_;
    }

    [[nodiscard]]
    inline SubscriptionId next_id() noexcept {
        return next_id_.fetch_add(1, std::memory_order_relaxed);
    }

private:
    std::mutex driver_mutex_;

    mutable std::mutex intents_mutex_;
    std::vector<Intent> intents_;
    bool accepting_{true};

    std::atomic<SubscriptionId> next_id_{1};
};

} // namespace tidewire::core::stream
