#pragma once

#include <cstdint>
#include <string_view>
#include <ostream>

namespace tidewire::core::exchange {

enum class Provider : std::uint8_t {
    Binance,
    Bybit
};

[[nodiscard]]
inline constexpr std::string_view to_string(Provider p) noexcept {
    switch (p) {
        case Provider::Binance: return "binance";
        case Provider::Bybit:   return "bybit";
        default:                return "unknown";
    }
}

[[nodiscard]]
inline constexpr bool is_valid(Provider p) noexcept {
    return p == Provider::Binance || p == Provider::Bybit;
}

// Case-insensitive ("bybit", "Bybit", "BYBIT")
[[nodiscard]]
bool parse_provider(std::string_view name, Provider& out) noexcept;

inline std::ostream& operator<<(std::ostream& os, Provider p) {
    return os << to_string(p);
}

} // namespace tidewire::core::exchange
