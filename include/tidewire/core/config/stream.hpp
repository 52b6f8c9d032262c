#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

namespace tidewire::core::config {

// ===============================================
// CONFIGURATION ERRORS
// ===============================================
enum class Error : std::uint8_t {
    None = 0,
    NegativeBufferSize,
    NegativeMaxReconnectAttempts,
    NonPositiveBaseDelay,
    InvertedDelayBounds,        // max_delay < base_delay
    NonPositivePingInterval,
    NonPositivePongTimeout,
    NonPositiveConnectTimeout,
    NonPositiveBufferedDiffs,
    InvalidEndpoint             // descriptor endpoint is not a ws:// or wss:// URL
};

[[nodiscard]]
inline constexpr std::string_view to_string(Error e) noexcept {
    switch (e) {
        case Error::None:                          return "None";
        case Error::NegativeBufferSize:            return "NegativeBufferSize";
        case Error::NegativeMaxReconnectAttempts:  return "NegativeMaxReconnectAttempts";
        case Error::NonPositiveBaseDelay:          return "NonPositiveBaseDelay";
        case Error::InvertedDelayBounds:           return "InvertedDelayBounds";
        case Error::NonPositivePingInterval:       return "NonPositivePingInterval";
        case Error::NonPositivePongTimeout:        return "NonPositivePongTimeout";
        case Error::NonPositiveConnectTimeout:     return "NonPositiveConnectTimeout";
        case Error::NonPositiveBufferedDiffs:      return "NonPositiveBufferedDiffs";
        case Error::InvalidEndpoint:               return "InvalidEndpoint";
        default:                                   return "Unknown";
    }
}

// -----------------------------------------------------------------------------
// Per-engine stream configuration. Every subscription created by an engine
// shares these values.
// -----------------------------------------------------------------------------
struct Stream {
    // Data channel capacity per subscription (0 = hand-off only)
    int buffer_size = 100;

    // Automatic recovery after connectivity and consistency failures
    bool reconnect = true;

    // Consecutive failed attempts before giving up (0 = unlimited)
    int max_reconnect_attempts = 10;

    // delay(attempt) = min(max_delay, base_delay * 2^attempt) * jitter
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{30000};

    // Keepalive
    std::chrono::milliseconds ping_interval{20000};
    std::chrono::milliseconds pong_timeout{10000};

    // Bound on Connecting (connect + subscribe + initial snapshot)
    std::chrono::milliseconds connect_timeout{10000};

    // Order-book diffs held while waiting for a snapshot
    int max_buffered_diffs = 1000;

    // Fails fast on the first inconsistent field
    [[nodiscard]] Error validate() const noexcept;
};

} // namespace tidewire::core::config
