#pragma once

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <CLI/CLI.hpp>

#include "tidewire/core/config/stream.hpp"
#include "tidewire/core/exchange/bybit/descriptor.hpp"
#include "tidewire/core/exchange/provider.hpp"
#include "tidewire/core/exchange/registry.hpp"

#include "common/logger.hpp"
#include "common/cli/validators.hpp"


namespace tidewire::examples::cli::stream {

    // -------------------------------------------------------------
    // Common example parameters
    // -------------------------------------------------------------
    struct Params {
        std::string provider             = "bybit";
        std::string url                  = "";          // empty: use the category default
        bool linear                      = false;
        std::vector<std::string> symbols = {"BTCUSDT"};
        std::uint32_t depth              = 50;
        std::string interval             = "1m";
        int buffer_size                  = 100;
        int max_reconnect_attempts       = 10;
        int max_messages                 = 0;           // 0: run until Ctrl+C
        std::string log_level            = "info";

        inline void dump(const std::string& header, std::ostream& os) const {
            os << header << ":\n"
               << "  Provider  : " << provider << "\n"
               << "  Endpoint  : " << endpoint() << "\n"
               << "  Symbols   : ";
            for (const auto& s : symbols) { os << s << " "; }
            os << "\n"
               << "  Depth     : " << depth << "\n"
               << "  Interval  : " << interval << "\n"
               << "  Buffer    : " << buffer_size << "\n"
               << "  Log Level : " << log_level << "\n";
        }

        [[nodiscard]]
        inline std::string endpoint() const {
            if (!url.empty()) {
                return url;
            }
            return linear ? std::string(core::exchange::bybit::LINEAR_PUBLIC_URL)
                          : std::string(core::exchange::bybit::SPOT_PUBLIC_URL);
        }

        [[nodiscard]]
        inline core::exchange::Descriptor descriptor() const {
            auto d = linear ? core::exchange::bybit::linear_descriptor()
                            : core::exchange::bybit::spot_descriptor();
            if (!url.empty()) {
                d.market_endpoint = url;
                d.depth_endpoint = url;
            }
            return d;
        }

        // Exchanges the examples can run against
        [[nodiscard]]
        inline core::exchange::Registry registry() const {
            core::exchange::Registry r;
            const auto err = r.add(descriptor());
            if (err != core::exchange::Error::None) {
                std::cerr << "[tidewire] Descriptor rejected: " << core::exchange::to_string(err) << "\n";
            }
            return r;
        }

        // nullptr when --provider names an exchange missing from `registry`
        [[nodiscard]]
        inline const core::exchange::Descriptor* lookup(const core::exchange::Registry& registry) const {
            core::exchange::Provider p = core::exchange::Provider::Bybit;
            if (!core::exchange::parse_provider(provider, p)) {
                return nullptr;
            }
            return registry.find(p);
        }

        [[nodiscard]]
        inline core::config::Stream stream_config() const {
            core::config::Stream cfg;
            cfg.buffer_size = buffer_size;
            cfg.max_reconnect_attempts = max_reconnect_attempts;
            return cfg;
        }
    };

    // -------------------------------------------------------------
    // Build CLI for examples
    // -------------------------------------------------------------
    [[nodiscard]]
    inline Params configure(int argc, char** argv, std::string_view description) {
        CLI::App app{std::string(description)};
        Params params{};
        app.add_option("-p,--provider", params.provider, "Exchange to connect to")->default_val(params.provider);
        app.add_option("--url", params.url, "Override the public stream endpoint")->check(ws_url_validator);
        app.add_flag("--linear", params.linear, "Use the USDT perpetual (linear) category instead of spot");
        app.add_option("-s,--symbol", params.symbols, "Trading symbol(s) (e.g. -s BTCUSDT)")->check(symbol_validator)->default_val(params.symbols);
        app.add_option("-d,--depth", params.depth, "Order book depth (1, 50, 200)")->check(depth_validator)->default_val(params.depth);
        app.add_option("-i,--interval", params.interval, "Kline interval (1m, 5m, 1h, 1d, ...)")->check(interval_validator)->default_val(params.interval);
        app.add_option("-b,--buffer", params.buffer_size, "Per-subscription buffer size")->check(CLI::NonNegativeNumber)->default_val(params.buffer_size);
        app.add_option("-r,--max-reconnects", params.max_reconnect_attempts, "Reconnect attempts before giving up (0 = unlimited)")->check(CLI::NonNegativeNumber)->default_val(params.max_reconnect_attempts);
        app.add_option("-n,--max-messages", params.max_messages, "Exit after this many messages (0 = run until Ctrl+C)")->check(CLI::NonNegativeNumber)->default_val(params.max_messages);
        app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error | off")->default_val(params.log_level);
        app.footer(
            "This example runs until interrupted.\n"
            "Press Ctrl+C to unsubscribe and exit cleanly."
        );
        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            app.exit(e, std::cout, std::cerr);
            std::exit(EXIT_FAILURE);
        }
        // -------------------------------------------------------------
        // Logging
        // -------------------------------------------------------------
        set_log_level(params.log_level);
        return params;
    }

} // namespace tidewire::examples::cli::stream
