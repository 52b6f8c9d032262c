#pragma once

#include "tidewire/core/exchange/descriptor.hpp"

namespace tidewire::core::exchange::bybit {

inline constexpr const char* SPOT_PUBLIC_URL   = "wss://stream.bybit.com/v5/public/spot";
inline constexpr const char* LINEAR_PUBLIC_URL = "wss://stream.bybit.com/v5/public/linear";

// Bybit v5 public spot streams: one endpoint for every feed class, combined
// subscriptions supported
[[nodiscard]]
Descriptor spot_descriptor();

// Bybit v5 public USDT perpetual streams
[[nodiscard]]
Descriptor linear_descriptor();

} // namespace tidewire::core::exchange::bybit
