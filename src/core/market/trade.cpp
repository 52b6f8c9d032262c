#include "tidewire/core/market/trade.hpp"

#include <ostream>


namespace tidewire::core::market {

double Trade::value() const noexcept {
    return price * qty;
}

std::ostream& operator<<(std::ostream& os, const Trade& t) {
    os << "[Trade] {"
       << "id=" << t.id
       << ", symbol=" << t.symbol
       << ", price=" << t.price
       << ", qty=" << t.qty
       << ", side=" << to_string(t.side)
       << ", buyer_maker=" << std::boolalpha << t.is_buyer_maker
       << ", ts_ns=" << t.timestamp.time_since_epoch().count()
       << "}";
    return os;
}

} // namespace tidewire::core::market
