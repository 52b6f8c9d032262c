/*
===============================================================================
 WebSocketConcept (pull-based)
===============================================================================

Transport contract consumed by stream::ConnectionSlot.

A transport instance represents ONE connection attempt: the slot creates a
fresh instance per attempt and destroys it after close. The implementation

  - starts the connect sequence in connect() without blocking on the
    network; a non-None return means the attempt failed before it started
  - bounds the whole sequence (resolve, TCP, TLS, upgrade) by the timeout
    passed to connect() and reports the outcome as an Open event, or as
    Error then Close
  - owns whatever receive machinery it needs (thread, io context, ...)
  - queues complete inbound text messages, drained via poll_message()
  - queues control-plane events (Open, Error, Close), drained via poll_event()
  - makes close() idempotent; Close is reported exactly once

No callbacks and no virtual dispatch: all interaction is polled by the
engine driver thread.
===============================================================================
*/
#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <concepts>

#include "tidewire/core/transport/error.hpp"
#include "tidewire/core/transport/websocket/events.hpp"
#include "tidewire/core/transport/telemetry/websocket.hpp"


namespace tidewire::core::transport {

template<class WS>
concept WebSocketConcept =
    std::constructible_from<WS, telemetry::WebSocket&> &&
    requires(
        WS ws,
        const std::string& host,
        const std::string& port,
        const std::string& path,
        std::chrono::milliseconds timeout,
        std::string_view msg,
        std::string& out,
        websocket::Event& ev
    )
{
    // Lifecycle
    { ws.connect(host, port, path, timeout) } -> std::same_as<Error>;
    { ws.close() } -> std::same_as<void>;

    // Outbound
    { ws.send(msg) } -> std::same_as<bool>;

    // Inbound (non-blocking)
    { ws.poll_message(out) } -> std::same_as<bool>;
    { ws.poll_event(ev) } -> std::same_as<bool>;
};

} // namespace tidewire::core::transport
