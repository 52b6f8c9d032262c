#pragma once

#include "tidewire/core/exchange/adapter_concept.hpp"
#include "tidewire/core/transport/beast/websocket.hpp"
#include "tidewire/core/protocol/bybit/codec.hpp"

namespace tidewire::core::exchange::bybit {

struct Adapter {
    using transport_type = transport::beast::WebSocket;
    using codec_type     = protocol::bybit::Codec;
};

static_assert(AdapterConcept<Adapter>);

} // namespace tidewire::core::exchange::bybit
