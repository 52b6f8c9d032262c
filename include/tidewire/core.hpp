#pragma once

/*
================================================================================
Tidewire Core - Stream Engine
================================================================================

Primary entry point:

    tidewire::core::bybit::Engine

i.e. stream::Engine bound to the Bybit adapter (Boost.Beast TLS transport +
Bybit v5 codec).

-------------------------------------------------------------------------------
Execution Model
-------------------------------------------------------------------------------

    [1] Transport threads (one per live connection)
          recv -> push complete message into an SPSC ring

    [2] Driver (Engine::poll, caller thread or Engine::start worker)
          drain intents -> pop messages -> decode -> book / route
          -> lifecycle, reconnects, keepalive -> send control messages

    [3] Consumer threads (any number)
          Receiver<T>::receive / try_receive, errors(), done(), latest()

Transport threads never touch subscription state. Only the driver writes to
a subscription's channels. Consumers never block the driver: a full data
channel drops its oldest item.

-------------------------------------------------------------------------------
Usage
-------------------------------------------------------------------------------

    config::Error err;
    auto engine = bybit::Engine::create(config::Stream{}, exchange::bybit::spot_descriptor(), err);
    auto book = engine->order_book_stream("BTCUSDT", 50);

    channel::Receiver<book::SnapshotPtr> rx;
    if (book.subscribe(stop_token, rx) == Error::None) {
        engine->start();
        book::SnapshotPtr snap;
        while (rx.receive(snap)) { ... }
    }

================================================================================
*/

#include "tidewire/core/error.hpp"
#include "tidewire/core/config/stream.hpp"
#include "tidewire/core/channel/bounded.hpp"
#include "tidewire/core/channel/done.hpp"
#include "tidewire/core/book/snapshot.hpp"
#include "tidewire/core/market/ticker.hpp"
#include "tidewire/core/market/trade.hpp"
#include "tidewire/core/market/kline.hpp"
#include "tidewire/core/exchange/registry.hpp"
#include "tidewire/core/exchange/bybit/descriptor.hpp"
#include "tidewire/core/exchange/bybit/adapter.hpp"
#include "tidewire/core/stream/engine.hpp"


namespace tidewire::core {

namespace bybit {

    using Engine = stream::Engine<exchange::bybit::Adapter>;

} // namespace bybit

} // namespace tidewire::core
