#pragma once

#include <iosfwd>
#include <cstdint>

#include "tidewire/core/market/symbol.hpp"
#include "tidewire/core/market/types.hpp"
#include "tidewire/core/timestamp.hpp"

namespace tidewire::core::market {

struct Kline {
    Symbol        symbol;
    KlineInterval interval{KlineInterval::M1};
    Timestamp     open_time{};
    Timestamp     close_time{};
    double        open{0.0};
    double        high{0.0};
    double        low{0.0};
    double        close{0.0};
    double        volume{0.0};
    double        quote_volume{0.0};
    std::uint64_t trade_count{0};
    bool          is_closed{false};

    [[nodiscard]] double change() const noexcept;
    [[nodiscard]] double range() const noexcept;
    [[nodiscard]] bool is_bullish() const noexcept;
    [[nodiscard]] bool is_bearish() const noexcept;

    // false when open is zero
    [[nodiscard]] bool change_percent(double& out) const noexcept;

    // false when volume is zero
    [[nodiscard]] bool vwap(double& out) const noexcept;
};

std::ostream& operator<<(std::ostream& os, const Kline& k);

} // namespace tidewire::core::market
