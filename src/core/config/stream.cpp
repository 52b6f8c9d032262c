#include "tidewire/core/config/stream.hpp"

namespace tidewire::core::config {

Error Stream::validate() const noexcept {
    if (buffer_size < 0) {
        return Error::NegativeBufferSize;
    }
    if (max_reconnect_attempts < 0) {
        return Error::NegativeMaxReconnectAttempts;
    }
    if (base_delay.count() <= 0) {
        return Error::NonPositiveBaseDelay;
    }
    if (max_delay < base_delay) {
        return Error::InvertedDelayBounds;
    }
    // Keepalive timers only matter when the engine is allowed to recover
    if (reconnect) {
        if (ping_interval.count() <= 0) {
            return Error::NonPositivePingInterval;
        }
        if (pong_timeout.count() <= 0) {
            return Error::NonPositivePongTimeout;
        }
    }
    if (connect_timeout.count() <= 0) {
        return Error::NonPositiveConnectTimeout;
    }
    if (max_buffered_diffs <= 0) {
        return Error::NonPositiveBufferedDiffs;
    }
    return Error::None;
}

} // namespace tidewire::core::config
