#pragma once

#include <cstdint>
#include <string_view>
#include <ostream>

#include "tidewire/core/market/symbol.hpp"
#include "tidewire/core/market/types.hpp"

namespace tidewire::core::protocol {

// ===============================================================
// FEED KIND
// ===============================================================
enum class FeedKind : std::uint8_t {
    Ticker,
    OrderBook,
    Trade,
    Kline
};

[[nodiscard]]
inline constexpr std::string_view to_string(FeedKind k) noexcept {
    switch (k) {
        case FeedKind::Ticker:    return "ticker";
        case FeedKind::OrderBook: return "orderbook";
        case FeedKind::Trade:     return "trade";
        case FeedKind::Kline:     return "kline";
        default:                  return "unknown";
    }
}

// ===============================================================
// FEED CLASS
// ===============================================================
// Connections are shared per (endpoint, feed class). Order books get their
// own connections so that depth traffic never delays market feeds.
enum class FeedClass : std::uint8_t {
    Market,
    Depth
};

[[nodiscard]]
inline constexpr std::string_view to_string(FeedClass c) noexcept {
    switch (c) {
        case FeedClass::Market: return "market";
        case FeedClass::Depth:  return "depth";
        default:                return "unknown";
    }
}

[[nodiscard]]
inline constexpr FeedClass feed_class_of(FeedKind k) noexcept {
    return (k == FeedKind::OrderBook) ? FeedClass::Depth : FeedClass::Market;
}

// ===============================================================
// TOPIC
// ===============================================================
// One logical feed. `depth` is meaningful for order books only,
// `interval` for klines only.
struct Topic {
    FeedKind              kind{FeedKind::Ticker};
    market::Symbol        symbol;
    std::uint32_t         depth{0};
    market::KlineInterval interval{market::KlineInterval::M1};

    [[nodiscard]]
    inline FeedClass feed_class() const noexcept {
        return feed_class_of(kind);
    }

    [[nodiscard]]
    inline bool is_book() const noexcept {
        return kind == FeedKind::OrderBook;
    }

    bool operator==(const Topic&) const = default;
};

inline std::ostream& operator<<(std::ostream& os, const Topic& t) {
    os << to_string(t.kind) << ":" << t.symbol;
    if (t.kind == FeedKind::OrderBook) os << "@" << t.depth;
    if (t.kind == FeedKind::Kline) os << "@" << to_string(t.interval);
    return os;
}

} // namespace tidewire::core::protocol
