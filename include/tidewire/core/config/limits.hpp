#pragma once

#include <cstddef>
#include <chrono>

namespace tidewire::core::config {

// Error channel capacity per subscription
inline constexpr std::size_t ERROR_CHANNEL_CAPACITY = 10;

// Transport rings (receive thread -> engine driver). Power of two.
inline constexpr std::size_t TRANSPORT_MESSAGE_RING = 4096;
inline constexpr std::size_t TRANSPORT_EVENT_RING   = 16;

// Maximum topics carried by one subscribe/unsubscribe control message
inline constexpr std::size_t MAX_TOPICS_PER_REQUEST = 10;

// Sleep between idle driver iterations in Engine::run()
inline constexpr auto DRIVER_IDLE_SLEEP = std::chrono::milliseconds(1);

} // namespace tidewire::core::config
