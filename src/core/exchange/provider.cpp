#include "tidewire/core/exchange/provider.hpp"

#include <cctype>


namespace tidewire::core::exchange {

namespace {

bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

bool parse_provider(std::string_view name, Provider& out) noexcept {
    for (auto p : {Provider::Binance, Provider::Bybit}) {
        if (iequals(name, to_string(p))) {
            out = p;
            return true;
        }
    }
    return false;
}

} // namespace tidewire::core::exchange
