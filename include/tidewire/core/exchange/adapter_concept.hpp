#pragma once

#include "tidewire/core/transport/websocket_concept.hpp"
#include "tidewire/core/protocol/codec_concept.hpp"

namespace tidewire::core::exchange {

// -----------------------------------------------------------------------------
// Compile-time exchange binding: a transport type paired with the codec that
// speaks the exchange's wire format over it.
//
//   struct MyAdapter {
//       using transport_type = transport::beast::WebSocket;
//       using codec_type     = protocol::bybit::Codec;
//   };
// -----------------------------------------------------------------------------
template<class A>
concept AdapterConcept =
    transport::WebSocketConcept<typename A::transport_type> &&
    protocol::CodecConcept<typename A::codec_type>;

} // namespace tidewire::core::exchange
