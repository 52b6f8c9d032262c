#pragma once

#include <cstdint>
#include <type_traits>

#include "tidewire/core/transport/error.hpp"

namespace tidewire::core::transport::websocket {

/*
===============================================================================
 websocket::Event
===============================================================================

Control-plane event pushed by a transport into its event ring and drained by
the owning connection slot through poll_event().

  Open   the connect sequence completed, the socket carries traffic
  Error  transport failure, always followed by a Close
  Close  the connection is gone (local or remote); emitted exactly once

A failed connect yields Error then Close and never Open.

Trivially copyable so it can cross the receive-thread boundary through an
SPSC ring. Losing an event breaks connection tracking, so transports size
the ring so that it can never be full.
===============================================================================
*/

enum class EventType : std::uint8_t {
    Close = 0,
    Error = 1,
    Open  = 2
};

struct Event {
    EventType        type{EventType::Close};
    transport::Error error{transport::Error::None};  // valid only if type == Error

    static constexpr Event make_open() noexcept {
        return Event{EventType::Open, transport::Error::None};
    }

    static constexpr Event make_close() noexcept {
        return Event{EventType::Close, transport::Error::None};
    }

    static constexpr Event make_error(transport::Error e) noexcept {
        return Event{EventType::Error, e};
    }
};

static_assert(std::is_trivially_copyable_v<Event>, "websocket::Event must be trivially copyable");

} // namespace tidewire::core::transport::websocket
