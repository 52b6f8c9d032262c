#pragma once

#include <cctype>
#include <cstdint>
#include <exception>
#include <string>

#include <CLI/CLI.hpp>

#include "tidewire/core/market/types.hpp"
#include "tidewire/core/protocol/bybit/codec.hpp"


namespace tidewire::examples::cli {

// -------------------------------------------------------------
// WebSocket URL validator
// -------------------------------------------------------------
inline auto ws_url_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.rfind("ws://", 0) == 0 || value.rfind("wss://", 0) == 0) {
            return {};
        }
        return "URL must start with ws:// or wss://";
    },
    "WebSocket URL validator"
);


// -------------------------------------------------------------
// Symbol validator (exchange notation, e.g. BTCUSDT)
// -------------------------------------------------------------
inline auto symbol_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.empty()) {
            return "Symbol must not be empty";
        }
        for (char c : value) {
            if (!std::isupper(static_cast<unsigned char>(c)) && !std::isdigit(static_cast<unsigned char>(c))) {
                return "Symbol must be upper case letters and digits (e.g. BTCUSDT)";
            }
        }
        return {};
    },
    "Trading symbol validator"
);


// -------------------------------------------------------------
// Order book depth validator
// -------------------------------------------------------------
inline auto depth_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        try {
            if (core::protocol::bybit::is_supported_depth(static_cast<std::uint32_t>(std::stoul(value)))) {
                return {};
            }
            return "Depth must be one of: 1, 50, 200";
        } catch (const std::exception&) {
            return "Depth must be a valid integer";
        }
    },
    "Order book depth validator"
);


// -------------------------------------------------------------
// Kline interval validator (1m, 5m, 1h, 1d, ...)
// -------------------------------------------------------------
inline auto interval_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        core::market::KlineInterval iv;
        if (!core::market::parse_interval(value, iv)) {
            return "Unknown interval: " + value;
        }
        if (core::protocol::bybit::interval_token(iv).empty()) {
            return "Interval not offered by the exchange: " + value;
        }
        return {};
    },
    "Kline interval validator"
);

} // namespace tidewire::examples::cli
