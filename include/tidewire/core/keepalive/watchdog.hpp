#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

#include "tidewire/core/timestamp.hpp"


namespace tidewire::core::keepalive {

enum class Action : std::uint8_t {
    None,
    SendPing,       // caller must send a ping now
    Unhealthy       // no pong within pong_timeout (edge, once per episode)
};

[[nodiscard]]
inline constexpr std::string_view to_string(Action a) noexcept {
    switch (a) {
        case Action::None:      return "None";
        case Action::SendPing:  return "SendPing";
        case Action::Unhealthy: return "Unhealthy";
        default:                return "Unknown";
    }
}

/*
===============================================================================
 keepalive::Watchdog
===============================================================================

Ping scheduling and pong-timeout detection for one physical connection.

  - arm(now)     start a keepalive episode; first ping due at now + interval
  - disarm()     stop; poll() returns None until armed again
  - on_pong(now) liveness proof, clears the outstanding ping
  - poll(now)    SendPing when a ping is due and none is outstanding,
                 Unhealthy once when the outstanding ping is older than
                 pong_timeout

At most one ping is outstanding. Unhealthy is edge-triggered: after it fires
poll() stays silent until disarm() + arm() start a new episode.

Time is always passed in, so the watchdog is fully deterministic.
===============================================================================
*/
class Watchdog {
public:
    Watchdog(std::chrono::milliseconds ping_interval, std::chrono::milliseconds pong_timeout) noexcept
        : ping_interval_(ping_interval)
        , pong_timeout_(pong_timeout)
    {}

    // No-op while already armed
    inline void arm(TimePoint now) noexcept {
        if (armed_) {
            return;
        }
        armed_ = true;
        awaiting_pong_ = false;
        unhealthy_reported_ = false;
        next_ping_ = now + ping_interval_;
    }

    inline void disarm() noexcept {
        armed_ = false;
        awaiting_pong_ = false;
        unhealthy_reported_ = false;
    }

    inline void on_pong(TimePoint now) noexcept {
        if (!armed_ || !awaiting_pong_) {
            return;
        }
        awaiting_pong_ = false;
        last_pong_ = now;
    }

    [[nodiscard]]
    inline Action poll(TimePoint now) noexcept {
        if (!armed_ || unhealthy_reported_) {
            return Action::None;
        }
        if (awaiting_pong_) {
            if (now - ping_sent_ >= pong_timeout_) {
                unhealthy_reported_ = true;
                return Action::Unhealthy;
            }
            return Action::None;
        }
        if (now >= next_ping_) {
            awaiting_pong_ = true;
            ping_sent_ = now;
            next_ping_ = now + ping_interval_;
            return Action::SendPing;
        }
        return Action::None;
    }

    // Accessors
    [[nodiscard]] inline bool armed() const noexcept { return armed_; }
    [[nodiscard]] inline bool awaiting_pong() const noexcept { return awaiting_pong_; }
    [[nodiscard]] inline TimePoint last_pong() const noexcept { return last_pong_; }

private:
    std::chrono::milliseconds ping_interval_;
    std::chrono::milliseconds pong_timeout_;

    bool armed_{false};
    bool awaiting_pong_{false};
    bool unhealthy_reported_{false};

    TimePoint next_ping_{};
    TimePoint ping_sent_{};
    TimePoint last_pong_{};
};

} // namespace tidewire::core::keepalive
