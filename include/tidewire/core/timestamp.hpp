#pragma once

#include <chrono>
#include <cstdint>

namespace tidewire::core {

// Exchange event time (UTC)
using Timestamp = std::chrono::sys_time<std::chrono::nanoseconds>;

// Local monotonic time used for deadlines (backoff, keepalive, connect timeout)
using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

[[nodiscard]]
inline Timestamp from_epoch_ms(std::int64_t ms) noexcept {
    return Timestamp{std::chrono::milliseconds(ms)};
}

} // namespace tidewire::core
