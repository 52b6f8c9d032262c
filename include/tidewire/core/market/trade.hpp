#pragma once

#include <iosfwd>
#include <string>

#include "tidewire/core/market/symbol.hpp"
#include "tidewire/core/market/types.hpp"
#include "tidewire/core/timestamp.hpp"

namespace tidewire::core::market {

struct Trade {
    std::string id;
    Symbol      symbol;
    double      price{0.0};
    double      qty{0.0};
    Side        side{Side::Buy};    // taker side
    bool        is_buyer_maker{false};
    Timestamp   timestamp{};

    [[nodiscard]] double value() const noexcept;
};

std::ostream& operator<<(std::ostream& os, const Trade& t);

} // namespace tidewire::core::market
