#include "tidewire/core/book/snapshot.hpp"

#include <ostream>


namespace tidewire::core::book {

const Level* Snapshot::best_bid() const noexcept {
    return bids.empty() ? nullptr : &bids.front();
}

const Level* Snapshot::best_ask() const noexcept {
    return asks.empty() ? nullptr : &asks.front();
}

bool Snapshot::spread(double& out) const noexcept {
    const Level* bid = best_bid();
    const Level* ask = best_ask();
    if (!bid || !ask) {
        return false;
    }
    out = ask->price - bid->price;
    return true;
}

bool Snapshot::mid_price(double& out) const noexcept {
    const Level* bid = best_bid();
    const Level* ask = best_ask();
    if (!bid || !ask) {
        return false;
    }
    out = (ask->price + bid->price) / 2.0;
    return true;
}

std::ostream& operator<<(std::ostream& os, const Snapshot& s) {
    os << "[Book] {symbol=" << s.symbol
       << ", u=" << s.last_update_id
       << ", seq=" << s.sequence
       << ", bids=" << s.bids.size()
       << ", asks=" << s.asks.size();
    if (const Level* b = s.best_bid()) {
        os << ", best_bid=" << *b;
    }
    if (const Level* a = s.best_ask()) {
        os << ", best_ask=" << *a;
    }
    os << "}";
    return os;
}

} // namespace tidewire::core::book
