#pragma once

#include <string>

#include "tidewire/core/exchange/provider.hpp"
#include "tidewire/core/protocol/topic.hpp"

namespace tidewire::core::exchange {

// -----------------------------------------------------------------------------
// Static description of one exchange's public stream service.
//
// Market feeds (ticker, trade, kline) and depth feeds (order book) may live on
// different endpoints. With combined_subscriptions every topic of a feed
// class shares one connection; without it each topic gets its own.
// -----------------------------------------------------------------------------
struct Descriptor {
    Provider    provider{Provider::Bybit};
    std::string market_endpoint;
    std::string depth_endpoint;
    bool        combined_subscriptions{true};

    [[nodiscard]]
    inline const std::string& endpoint(protocol::FeedClass c) const noexcept {
        return (c == protocol::FeedClass::Depth) ? depth_endpoint : market_endpoint;
    }
};

// Both endpoints parse as ws:// or wss:// URLs
[[nodiscard]]
bool has_valid_endpoints(const Descriptor& d);

} // namespace tidewire::core::exchange
