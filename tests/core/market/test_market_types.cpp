/*
===============================================================================
 market - Value Type Tests
===============================================================================

Covered Requirements:
---------------------
T1. Symbols: normalization, validity, base / quote split
T2. Side and kline interval parsing
T3. Ticker, trade and kline arithmetic
T4. Book snapshot accessors

===============================================================================
*/

#include <cmath>
#include <iostream>
#include <memory>
#include <sstream>

#include "tidewire/core/market/symbol.hpp"
#include "tidewire/core/market/types.hpp"
#include "tidewire/core/market/ticker.hpp"
#include "tidewire/core/market/trade.hpp"
#include "tidewire/core/market/kline.hpp"
#include "tidewire/core/book/snapshot.hpp"
#include "common/test_check.hpp"

using namespace tidewire::core;

static bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

// -----------------------------------------------------------------------------
// T1
// -----------------------------------------------------------------------------
void test_symbols() {
    std::cout << "[TEST] T1: symbols\n";

    TEST_CHECK(market::normalize_symbol("  btcusdt\t") == "BTCUSDT");
    TEST_CHECK(market::normalize_symbol("EthBtc") == "ETHBTC");
    TEST_CHECK(market::normalize_symbol("   ").empty());

    TEST_CHECK(market::is_valid_symbol("BTCUSDT"));
    TEST_CHECK(!market::is_valid_symbol(""));
    TEST_CHECK(!market::is_valid_symbol(" \t "));

    TEST_CHECK(market::base_asset("BTCUSDT") == "BTC");
    TEST_CHECK(market::quote_asset("BTCUSDT") == "USDT");
    TEST_CHECK(market::base_asset("ETHBTC") == "ETH");
    TEST_CHECK(market::quote_asset("ETHBTC") == "BTC");
    TEST_CHECK(market::base_asset("BTCBUSD") == "BTC");
    TEST_CHECK(market::quote_asset("BTCBUSD") == "BUSD");
    TEST_CHECK(market::quote_asset("SOLUSD") == "USD");

    // No known quote asset
    TEST_CHECK(market::base_asset("FOOBAR") == "FOOBAR");
    TEST_CHECK(market::quote_asset("FOOBAR").empty());
    // The quote alone is not a pair
    TEST_CHECK(market::quote_asset("USDT").empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// T2
// -----------------------------------------------------------------------------
void test_enums() {
    std::cout << "[TEST] T2: side and interval parsing\n";

    market::Side side = market::Side::Sell;
    TEST_CHECK(market::parse_side("Buy", side) && side == market::Side::Buy);
    TEST_CHECK(market::parse_side("ASK", side) && side == market::Side::Sell);
    TEST_CHECK(market::parse_side("bid", side) && side == market::Side::Buy);
    TEST_CHECK(!market::parse_side("hold", side));
    TEST_CHECK(side == market::Side::Buy);

    market::KlineInterval iv = market::KlineInterval::M1;
    TEST_CHECK(market::parse_interval("15m", iv) && iv == market::KlineInterval::M15);
    TEST_CHECK(market::parse_interval("1M", iv) && iv == market::KlineInterval::Month1);
    TEST_CHECK(market::parse_interval("1m", iv) && iv == market::KlineInterval::M1);
    TEST_CHECK(market::parse_interval("3d", iv) && iv == market::KlineInterval::D3);
    TEST_CHECK(!market::parse_interval("2d", iv));
    TEST_CHECK(market::to_string(market::KlineInterval::H4) == "4h");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// T3
// -----------------------------------------------------------------------------
void test_arithmetic() {
    std::cout << "[TEST] T3: ticker, trade and kline arithmetic\n";

    market::Ticker t;
    double pct = -1.0;
    TEST_CHECK(!t.spread_percent(pct));
    TEST_CHECK(pct == -1.0);

    t.bid_price = 99.0;
    t.ask_price = 101.0;
    TEST_CHECK(near(t.spread(), 2.0));
    TEST_CHECK(near(t.mid_price(), 100.0));
    TEST_CHECK(t.spread_percent(pct));
    TEST_CHECK(near(pct, 0.02));

    market::Trade tr;
    tr.price = 16578.5;
    tr.qty = 0.5;
    TEST_CHECK(near(tr.value(), 8289.25));

    market::Kline k;
    double out = 0.0;
    TEST_CHECK(!k.change_percent(out));
    TEST_CHECK(!k.vwap(out));

    k.open = 100.0;
    k.close = 110.0;
    k.high = 115.0;
    k.low = 95.0;
    k.volume = 2.0;
    k.quote_volume = 210.0;
    TEST_CHECK(near(k.change(), 10.0));
    TEST_CHECK(near(k.range(), 20.0));
    TEST_CHECK(k.is_bullish());
    TEST_CHECK(!k.is_bearish());
    TEST_CHECK(k.change_percent(out) && near(out, 0.1));
    TEST_CHECK(k.vwap(out) && near(out, 105.0));

    k.close = 100.0;
    TEST_CHECK(!k.is_bullish() && !k.is_bearish());

    std::ostringstream os;
    os << k;
    TEST_CHECK(os.str().find("[Kline]") != std::string::npos);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// T4
// -----------------------------------------------------------------------------
void test_book_snapshot() {
    std::cout << "[TEST] T4: book snapshot accessors\n";

    book::Snapshot s;
    double v = 0.0;
    TEST_CHECK(s.best_bid() == nullptr);
    TEST_CHECK(s.best_ask() == nullptr);
    TEST_CHECK(!s.spread(v));
    TEST_CHECK(!s.mid_price(v));

    s.symbol = "BTCUSDT";
    s.bids = {{100.0, 1.0}, {99.0, 2.0}};
    TEST_CHECK(s.best_bid()->price == 100.0);
    TEST_CHECK(!s.spread(v));

    s.asks = {{101.0, 3.0}};
    TEST_CHECK(s.spread(v) && near(v, 1.0));
    TEST_CHECK(s.mid_price(v) && near(v, 100.5));
    TEST_CHECK(s.bid_depth() == 2);
    TEST_CHECK(s.ask_depth() == 1);
    TEST_CHECK(near(s.asks[0].value(), 303.0));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    test_symbols();
    test_enums();
    test_arithmetic();
    test_book_snapshot();

    std::cout << "\n[MARKET TESTS PASSED]\n";
    return 0;
}
