#include "tidewire/core/market/ticker.hpp"

#include <ostream>


namespace tidewire::core::market {

double Ticker::spread() const noexcept {
    return ask_price - bid_price;
}

double Ticker::mid_price() const noexcept {
    return (bid_price + ask_price) / 2.0;
}

bool Ticker::spread_percent(double& out) const noexcept {
    const double mid = mid_price();
    if (mid == 0.0) {
        return false;
    }
    out = spread() / mid;
    return true;
}

std::ostream& operator<<(std::ostream& os, const Ticker& t) {
    os << "[Ticker] {"
       << "symbol=" << t.symbol
       << ", last=" << t.last_price
       << ", bid=" << t.bid_price << "x" << t.bid_qty
       << ", ask=" << t.ask_price << "x" << t.ask_qty
       << ", high24h=" << t.high_24h
       << ", low24h=" << t.low_24h
       << ", vol24h=" << t.volume_24h
       << ", chg%=" << t.price_change_percent
       << "}";
    return os;
}

} // namespace tidewire::core::market
