#include "tidewire/core/market/symbol.hpp"

#include <array>
#include <cctype>


namespace tidewire::core::market {

namespace {

// Checked in order: longer suffixes first ("USDT" and "BUSD" before "USD")
constexpr std::array<std::string_view, 7> QUOTE_ASSETS = {
    "USDT", "USDC", "BUSD", "USD", "BTC", "ETH", "BNB"
};

bool is_space(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

Symbol normalize_symbol(std::string_view raw) {
    std::size_t begin = 0;
    std::size_t end = raw.size();
    while (begin < end && is_space(raw[begin])) ++begin;
    while (end > begin && is_space(raw[end - 1])) --end;
    Symbol out;
    out.reserve(end - begin);
    for (std::size_t i = begin; i < end; ++i) {
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(raw[i]))));
    }
    return out;
}

bool is_valid_symbol(std::string_view symbol) noexcept {
    for (char c : symbol) {
        if (!is_space(c)) return true;
    }
    return false;
}

std::string_view base_asset(std::string_view symbol) noexcept {
    for (auto q : QUOTE_ASSETS) {
        if (symbol.size() > q.size() && symbol.substr(symbol.size() - q.size()) == q) {
            return symbol.substr(0, symbol.size() - q.size());
        }
    }
    return symbol;
}

std::string_view quote_asset(std::string_view symbol) noexcept {
    for (auto q : QUOTE_ASSETS) {
        if (symbol.size() > q.size() && symbol.substr(symbol.size() - q.size()) == q) {
            return q;
        }
    }
    return {};
}

} // namespace tidewire::core::market
