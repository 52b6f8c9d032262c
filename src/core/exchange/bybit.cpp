#include "tidewire/core/exchange/bybit/descriptor.hpp"


namespace tidewire::core::exchange::bybit {

Descriptor spot_descriptor() {
    Descriptor d;
    d.provider = Provider::Bybit;
    d.market_endpoint = SPOT_PUBLIC_URL;
    d.depth_endpoint = SPOT_PUBLIC_URL;
    d.combined_subscriptions = true;
    return d;
}

Descriptor linear_descriptor() {
    Descriptor d;
    d.provider = Provider::Bybit;
    d.market_endpoint = LINEAR_PUBLIC_URL;
    d.depth_endpoint = LINEAR_PUBLIC_URL;
    d.combined_subscriptions = true;
    return d;
}

} // namespace tidewire::core::exchange::bybit
