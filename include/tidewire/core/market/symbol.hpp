#pragma once

#include <string>
#include <string_view>

namespace tidewire::core::market {

// Trading pair identifier in exchange-native concatenated form ("BTCUSDT").
// Symbols are stored trimmed and uppercased.
using Symbol = std::string;

[[nodiscard]] Symbol normalize_symbol(std::string_view raw);

[[nodiscard]] bool is_valid_symbol(std::string_view symbol) noexcept;

// Suffix heuristic over common quote assets. Returns the whole symbol (base)
// or an empty string (quote) when no known quote asset matches.
[[nodiscard]] std::string_view base_asset(std::string_view symbol) noexcept;
[[nodiscard]] std::string_view quote_asset(std::string_view symbol) noexcept;

} // namespace tidewire::core::market
