#include "tidewire/core/market/kline.hpp"

#include <ostream>


namespace tidewire::core::market {

double Kline::change() const noexcept {
    return close - open;
}

double Kline::range() const noexcept {
    return high - low;
}

bool Kline::is_bullish() const noexcept {
    return close > open;
}

bool Kline::is_bearish() const noexcept {
    return close < open;
}

bool Kline::change_percent(double& out) const noexcept {
    if (open == 0.0) {
        return false;
    }
    out = change() / open;
    return true;
}

bool Kline::vwap(double& out) const noexcept {
    if (volume == 0.0) {
        return false;
    }
    out = quote_volume / volume;
    return true;
}

std::ostream& operator<<(std::ostream& os, const Kline& k) {
    os << "[Kline] {"
       << "symbol=" << k.symbol
       << ", interval=" << to_string(k.interval)
       << ", o=" << k.open
       << ", h=" << k.high
       << ", l=" << k.low
       << ", c=" << k.close
       << ", vol=" << k.volume
       << ", closed=" << std::boolalpha << k.is_closed
       << "}";
    return os;
}

} // namespace tidewire::core::market
