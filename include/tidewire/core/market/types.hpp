#pragma once

#include <cstdint>
#include <string_view>
#include <ostream>

namespace tidewire::core::market {

// ===============================================================
// SIDE
// ===============================================================
enum class Side : std::uint8_t {
    Buy,
    Sell
};

[[nodiscard]]
inline constexpr std::string_view to_string(Side s) noexcept {
    switch (s) {
        case Side::Buy:  return "buy";
        case Side::Sell: return "sell";
        default:         return "unknown";
    }
}

// Accepts "buy"/"bid"/"sell"/"ask" in any letter case
[[nodiscard]]
bool parse_side(std::string_view s, Side& out) noexcept;

inline std::ostream& operator<<(std::ostream& os, Side s) {
    return os << to_string(s);
}

// ===============================================================
// KLINE INTERVAL
// ===============================================================
enum class KlineInterval : std::uint8_t {
    M1,     // 1m
    M3,     // 3m
    M5,     // 5m
    M15,    // 15m
    M30,    // 30m
    H1,     // 1h
    H2,     // 2h
    H4,     // 4h
    H6,     // 6h
    H8,     // 8h
    H12,    // 12h
    D1,     // 1d
    D3,     // 3d
    W1,     // 1w
    Month1  // 1M
};

[[nodiscard]]
inline constexpr std::string_view to_string(KlineInterval i) noexcept {
    switch (i) {
        case KlineInterval::M1:     return "1m";
        case KlineInterval::M3:     return "3m";
        case KlineInterval::M5:     return "5m";
        case KlineInterval::M15:    return "15m";
        case KlineInterval::M30:    return "30m";
        case KlineInterval::H1:     return "1h";
        case KlineInterval::H2:     return "2h";
        case KlineInterval::H4:     return "4h";
        case KlineInterval::H6:     return "6h";
        case KlineInterval::H8:     return "8h";
        case KlineInterval::H12:    return "12h";
        case KlineInterval::D1:     return "1d";
        case KlineInterval::D3:     return "3d";
        case KlineInterval::W1:     return "1w";
        case KlineInterval::Month1: return "1M";
        default:                    return "unknown";
    }
}

// Case-sensitive ("1m" is one minute, "1M" is one month)
[[nodiscard]]
bool parse_interval(std::string_view s, KlineInterval& out) noexcept;

inline std::ostream& operator<<(std::ostream& os, KlineInterval i) {
    return os << to_string(i);
}

} // namespace tidewire::core::market
