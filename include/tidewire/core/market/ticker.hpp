#pragma once

#include <iosfwd>

#include "tidewire/core/market/symbol.hpp"
#include "tidewire/core/timestamp.hpp"

namespace tidewire::core::market {

// Fields the exchange did not send are left at 0.
struct Ticker {
    Symbol    symbol;
    double    last_price{0.0};
    double    bid_price{0.0};
    double    ask_price{0.0};
    double    bid_qty{0.0};
    double    ask_qty{0.0};
    double    high_24h{0.0};
    double    low_24h{0.0};
    double    volume_24h{0.0};
    double    quote_volume_24h{0.0};
    double    price_change{0.0};
    double    price_change_percent{0.0};
    Timestamp timestamp{};

    [[nodiscard]] double spread() const noexcept;
    [[nodiscard]] double mid_price() const noexcept;

    // false when the mid price is zero
    [[nodiscard]] bool spread_percent(double& out) const noexcept;
};

std::ostream& operator<<(std::ostream& os, const Ticker& t);

} // namespace tidewire::core::market
