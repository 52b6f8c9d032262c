#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <ostream>

namespace tidewire::core {

/*
===============================================================================
 tidewire::core::Error
===============================================================================

Stream-level error codes returned by public operations and carried on each
subscription's error channel.

Every code belongs to exactly one class (see error_class_of):

  Contract      caller misuse, reported synchronously by the failing call
  Protocol      decoder or exchange-level failure, non-fatal
  Connectivity  drives the subscription into Reconnecting
  Consistency   order-book gap, handled like a connectivity failure
  Terminal      last item on the error channel before both channels close

Configuration problems are reported separately via config::Error.
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,

    // --- Contract ----------------------------------------------------------
    AlreadySubscribed,     // subscribe() on a live handle
    NotSubscribed,         // unsubscribe() on an idle or closed handle
    StreamClosed,          // handle already reached Closed, or engine gone
    UnsupportedFeed,       // exchange codec cannot express the requested topic

    // --- Protocol ----------------------------------------------------------
    DecodeFailed,          // inbound message could not be decoded
    UnexpectedMessage,     // decoded, but not valid for the current state
    SubscriptionRejected,  // exchange refused the topic subscription
    InvalidBookData,       // snapshot or diff failed validation (not applied)

    // --- Connectivity ------------------------------------------------------
    ConnectFailed,         // transport connect attempt failed
    ConnectTimeout,        // Active not reached within connect_timeout
    ConnectionLost,        // transport closed while connected
    PongTimeout,           // keepalive watchdog declared the link unhealthy

    // --- Consistency -------------------------------------------------------
    SequenceGap,           // order-book diff not contiguous with the watermark

    // --- Terminal ----------------------------------------------------------
    ReconnectExhausted,    // max_reconnect_attempts consecutive failures
    ReconnectDisabled,     // failure while reconnect == false
    Unsubscribed,          // explicit unsubscribe()
    Cancelled,             // stop token passed to subscribe() was triggered
    EngineStopped          // owning engine was destroyed
};

enum class ErrorClass : std::uint8_t {
    None,
    Contract,
    Protocol,
    Connectivity,
    Consistency,
    Terminal
};

[[nodiscard]]
inline constexpr std::string_view to_string(Error e) noexcept {
    switch (e) {
        case Error::None:                 return "None";
        case Error::AlreadySubscribed:    return "AlreadySubscribed";
        case Error::NotSubscribed:        return "NotSubscribed";
        case Error::StreamClosed:         return "StreamClosed";
        case Error::UnsupportedFeed:      return "UnsupportedFeed";
        case Error::DecodeFailed:         return "DecodeFailed";
        case Error::UnexpectedMessage:    return "UnexpectedMessage";
        case Error::SubscriptionRejected: return "SubscriptionRejected";
        case Error::InvalidBookData:      return "InvalidBookData";
        case Error::ConnectFailed:        return "ConnectFailed";
        case Error::ConnectTimeout:       return "ConnectTimeout";
        case Error::ConnectionLost:       return "ConnectionLost";
        case Error::PongTimeout:          return "PongTimeout";
        case Error::SequenceGap:          return "SequenceGap";
        case Error::ReconnectExhausted:   return "ReconnectExhausted";
        case Error::ReconnectDisabled:    return "ReconnectDisabled";
        case Error::Unsubscribed:         return "Unsubscribed";
        case Error::Cancelled:            return "Cancelled";
        case Error::EngineStopped:        return "EngineStopped";
        default:                          return "Unknown";
    }
}

[[nodiscard]]
inline constexpr std::string_view to_string(ErrorClass c) noexcept {
    switch (c) {
        case ErrorClass::None:         return "None";
        case ErrorClass::Contract:     return "Contract";
        case ErrorClass::Protocol:     return "Protocol";
        case ErrorClass::Connectivity: return "Connectivity";
        case ErrorClass::Consistency:  return "Consistency";
        case ErrorClass::Terminal:     return "Terminal";
        default:                       return "Unknown";
    }
}

[[nodiscard]]
inline constexpr ErrorClass error_class_of(Error e) noexcept {
    switch (e) {
        case Error::None:
            return ErrorClass::None;
        case Error::AlreadySubscribed:
        case Error::NotSubscribed:
        case Error::StreamClosed:
        case Error::UnsupportedFeed:
            return ErrorClass::Contract;
        case Error::DecodeFailed:
        case Error::UnexpectedMessage:
        case Error::SubscriptionRejected:
        case Error::InvalidBookData:
            return ErrorClass::Protocol;
        case Error::ConnectFailed:
        case Error::ConnectTimeout:
        case Error::ConnectionLost:
        case Error::PongTimeout:
            return ErrorClass::Connectivity;
        case Error::SequenceGap:
            return ErrorClass::Consistency;
        case Error::ReconnectExhausted:
        case Error::ReconnectDisabled:
        case Error::Unsubscribed:
        case Error::Cancelled:
        case Error::EngineStopped:
            return ErrorClass::Terminal;
    }
    return ErrorClass::None;
}

[[nodiscard]]
inline constexpr bool is_terminal(Error e) noexcept {
    return error_class_of(e) == ErrorClass::Terminal;
}

inline std::ostream& operator<<(std::ostream& os, Error e) {
    return os << to_string(e);
}

// -----------------------------------------------------------------------------
// Item carried on a subscription's error channel
// -----------------------------------------------------------------------------
struct StreamError {
    Error code{Error::None};
    std::string topic;      // wire topic of the subscription (e.g. "orderbook.50.BTCUSDT")
    std::string message;    // human readable detail

    [[nodiscard]]
    inline ErrorClass kind() const noexcept {
        return error_class_of(code);
    }

    [[nodiscard]]
    inline bool terminal() const noexcept {
        return is_terminal(code);
    }
};

inline std::ostream& operator<<(std::ostream& os, const StreamError& e) {
    os << "[" << to_string(e.kind()) << "] " << to_string(e.code);
    if (!e.topic.empty()) os << " (" << e.topic << ")";
    if (!e.message.empty()) os << ": " << e.message;
    return os;
}

} // namespace tidewire::core
