#include "tidewire/core/market/types.hpp"

#include <array>
#include <cctype>


namespace tidewire::core::market {

namespace {

bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

constexpr std::array<KlineInterval, 15> ALL_INTERVALS = {
    KlineInterval::M1,  KlineInterval::M3,  KlineInterval::M5,  KlineInterval::M15,
    KlineInterval::M30, KlineInterval::H1,  KlineInterval::H2,  KlineInterval::H4,
    KlineInterval::H6,  KlineInterval::H8,  KlineInterval::H12, KlineInterval::D1,
    KlineInterval::D3,  KlineInterval::W1,  KlineInterval::Month1
};

} // namespace

bool parse_side(std::string_view s, Side& out) noexcept {
    if (iequals(s, "buy") || iequals(s, "bid")) {
        out = Side::Buy;
        return true;
    }
    if (iequals(s, "sell") || iequals(s, "ask")) {
        out = Side::Sell;
        return true;
    }
    return false;
}

bool parse_interval(std::string_view s, KlineInterval& out) noexcept {
    for (auto i : ALL_INTERVALS) {
        if (to_string(i) == s) {
            out = i;
            return true;
        }
    }
    return false;
}

} // namespace tidewire::core::market
