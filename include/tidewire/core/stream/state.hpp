#pragma once

#include <cstdint>
#include <string_view>
#include <ostream>


namespace tidewire::core::stream {

// ===============================================================
// SUBSCRIPTION STATE ENUM
// ===============================================================
enum class State : std::uint8_t {
    Idle,           // created, never subscribed
    Connecting,     // waiting for connection, topic subscription and (books) snapshot
    Active,         // delivering data
    Reconnecting,   // waiting for the backoff delay
    Closing,        // terminal error being delivered, channels closing
    Closed          // terminal, irreversible
};

[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
        case State::Idle:         return "Idle";
        case State::Connecting:   return "Connecting";
        case State::Active:       return "Active";
        case State::Reconnecting: return "Reconnecting";
        case State::Closing:      return "Closing";
        case State::Closed:       return "Closed";
        default:                  return "Unknown";
    }
}

// Subscribed and not yet terminal
[[nodiscard]]
inline constexpr bool is_live(State s) noexcept {
    return s == State::Connecting || s == State::Active || s == State::Reconnecting;
}

inline std::ostream& operator<<(std::ostream& os, State s) {
    return os << to_string(s);
}


// ===============================================================
// EVENT ENUM
// ===============================================================
enum class Event : std::uint8_t {
    // --- User intent ---
    SubscribeRequested,
    CloseRequested,

    // --- Driver ---
    Activated,          // connected, topic subscribed, (books) snapshot applied
    AttemptFailed,      // Connecting did not reach Active
    Interrupted,        // Active lost its connection or book consistency
    RetryTimerExpired
};

[[nodiscard]]
inline constexpr std::string_view to_string(Event e) noexcept {
    switch (e) {
        case Event::SubscribeRequested: return "SubscribeRequested";
        case Event::CloseRequested:     return "CloseRequested";
        case Event::Activated:          return "Activated";
        case Event::AttemptFailed:      return "AttemptFailed";
        case Event::Interrupted:        return "Interrupted";
        case Event::RetryTimerExpired:  return "RetryTimerExpired";
        default:                        return "UnknownEvent";
    }
}

} // namespace tidewire::core::stream
