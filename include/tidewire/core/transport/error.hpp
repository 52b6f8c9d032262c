#pragma once

#include <cstdint>
#include <string_view>
#include <ostream>

namespace tidewire::core::transport {

/*
===============================================================================
 transport::Error
===============================================================================

Semantic transport failures, independent of the library underneath
(Boost.Beast, a test mock, ...). The stream engine maps them onto stream
errors and decides via is_retriable() whether a failure enters the retry
cycle.
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,

    // --- Caller errors -------------------------------------------------------
    InvalidUrl,         // malformed or unsupported URL
    InvalidState,       // operation not allowed in the current transport state

    // --- Intentional termination --------------------------------------------
    LocalShutdown,      // closed by the local endpoint
    RemoteClosed,       // CLOSE frame or EOF from the peer

    // --- Transient failures --------------------------------------------------
    Timeout,            // resolve / connect / read stalled
    ConnectionFailed,   // DNS or TCP connect failed
    HandshakeFailed,    // TLS or WebSocket upgrade failed

    // --- Protocol / resource failures ---------------------------------------
    ProtocolError,      // invalid frame or protocol violation
    Backpressure,       // inbound ring full, consumer not keeping up
    TransportFailure    // anything else
};

[[nodiscard]]
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
        case Error::None:              return "None";
        case Error::InvalidUrl:        return "InvalidUrl";
        case Error::InvalidState:      return "InvalidState";
        case Error::LocalShutdown:     return "LocalShutdown";
        case Error::RemoteClosed:      return "RemoteClosed";
        case Error::Timeout:           return "Timeout";
        case Error::ConnectionFailed:  return "ConnectionFailed";
        case Error::HandshakeFailed:   return "HandshakeFailed";
        case Error::ProtocolError:     return "ProtocolError";
        case Error::Backpressure:      return "Backpressure";
        case Error::TransportFailure:  return "TransportFailure";
        default:                       return "Unknown";
    }
}

// External, transient conditions are retried. Caller misuse and intentional
// shutdown are not.
[[nodiscard]]
inline constexpr bool is_retriable(Error err) noexcept {
    switch (err) {
        case Error::RemoteClosed:
        case Error::Timeout:
        case Error::ConnectionFailed:
        case Error::HandshakeFailed:
        case Error::ProtocolError:
        case Error::Backpressure:
        case Error::TransportFailure:
            return true;
        default:
            return false;
    }
}

inline std::ostream& operator<<(std::ostream& os, Error e) {
    return os << to_string(e);
}

} // namespace tidewire::core::transport
