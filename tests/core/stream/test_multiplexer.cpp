/*
===============================================================================
 stream::Engine - Connection Multiplexing Tests
===============================================================================

Covered Requirements:
---------------------
M1. Combined subscriptions
    - Ticker, trade and kline topics share one market connection
    - Requests issued in one step are batched into one control message
    - Each payload reaches only the subscribers of its topic

M2. Feed classes
    - Order books use their own (depth) slot even on the same endpoint

M3. Non-combined exchanges
    - One connection per topic

M4. Reference counting
    - Two handles on one topic: one subscribe, one unsubscribe
    - Unsubscribing the last topic destroys the slot and its connection

M5. Request batching
    - At most MAX_TOPICS_PER_REQUEST topics per control message

M6. Connection loss fans out
    - Every subscription of the slot moves to Reconnecting, other slots don't

M7. Protocol errors
    - Rejection of a pending book subscription: error + Reconnecting
    - Rejection of an active topic: non-terminal error only
    - Undecodable frame: DecodeFailed to every live subscriber of the slot

M8. Keepalive
    - Pings while Active, answered pongs keep the slot healthy
    - Missing pong: PongTimeout, subscriptions go through Reconnecting

M9. Rejection routing
    - A rejection names whole topics: tickers.BTCUSDT does not hit tickers.BTC

===============================================================================
*/

#include <chrono>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include "tidewire/core/config/limits.hpp"
#include "common/harness/engine.hpp"
#include "common/json_helpers.hpp"

using namespace tidewire::core;
using namespace tidewire::core::test;
using namespace std::chrono_literals;

using stream::State;

static constexpr const char* SUBSCRIBE_OP = R"("op":"subscribe")";
static constexpr const char* UNSUBSCRIBE_OP = R"("op":"unsubscribe")";

// -----------------------------------------------------------------------------
// M1
// -----------------------------------------------------------------------------
void test_combined_market_slot() {
    std::cout << "[TEST] M1: feeds share one combined connection\n";
    harness::Engine h;

    auto ticker = h->ticker_stream("BTCUSDT");
    auto trades = h->trade_stream("BTCUSDT");
    auto klines = h->kline_stream("ETHUSDT", market::KlineInterval::M5);
    TEST_CHECK(klines.wire_topic() == "kline.5.ETHUSDT");

    channel::Receiver<market::Ticker> trx;
    channel::Receiver<market::Trade> prx;
    channel::Receiver<market::Kline> krx;
    TEST_CHECK(ticker.subscribe(trx) == Error::None);
    TEST_CHECK(trades.subscribe(prx) == Error::None);
    TEST_CHECK(klines.subscribe(krx) == Error::None);

    TEST_CHECK(h.wait_state(klines, State::Active));
    TEST_CHECK(ticker.state() == State::Active);
    TEST_CHECK(trades.state() == State::Active);

    TEST_CHECK(h->slot_count() == 1);
    TEST_CHECK(MockTransport::created() == 1);
    TEST_CHECK(MockTransport::sent_count(SUBSCRIBE_OP) == 1);
    const auto log = MockTransport::sent_log();
    TEST_CHECK(log.size() == 1);
    TEST_CHECK(log[0].find("tickers.BTCUSDT") != std::string::npos);
    TEST_CHECK(log[0].find("publicTrade.BTCUSDT") != std::string::npos);
    TEST_CHECK(log[0].find("kline.5.ETHUSDT") != std::string::npos);

    TEST_CHECK(MockTransport::inject("publicTrade.BTCUSDT",
        json::bybit::trade("BTCUSDT", "20f43950-d8dd-5b31-9112-a178eb6023af", "Sell", "16578.50", "0.001")) == 1);
    TEST_CHECK(MockTransport::inject("kline.5.ETHUSDT", json::bybit::kline("ETHUSDT", "5", "16649.5", "16677", true)) == 1);

    market::Trade t;
    TEST_CHECK(h.receive(prx, t));
    TEST_CHECK(t.id == "20f43950-d8dd-5b31-9112-a178eb6023af");
    TEST_CHECK(t.side == market::Side::Sell);
    TEST_CHECK(t.is_buyer_maker);
    TEST_CHECK(t.price == 16578.5);
    TEST_CHECK(t.qty == 0.001);

    market::Kline k;
    TEST_CHECK(h.receive(krx, k));
    TEST_CHECK(k.symbol == "ETHUSDT");
    TEST_CHECK(k.interval == market::KlineInterval::M5);
    TEST_CHECK(k.open == 16649.5);
    TEST_CHECK(k.close == 16677.0);
    TEST_CHECK(k.is_closed);

    // Nothing leaked onto the ticker channel
    market::Ticker tk;
    TEST_CHECK(!trx.try_receive(tk));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// M2
// -----------------------------------------------------------------------------
void test_books_use_depth_slot() {
    std::cout << "[TEST] M2: order books get their own slot\n";
    harness::Engine h;

    auto ticker = h->ticker_stream("BTCUSDT");
    auto book = h->order_book_stream("BTCUSDT");
    channel::Receiver<market::Ticker> trx;
    channel::Receiver<book::SnapshotPtr> brx;
    TEST_CHECK(ticker.subscribe(trx) == Error::None);
    TEST_CHECK(book.subscribe(brx) == Error::None);

    TEST_CHECK(h.wait_state(ticker, State::Active));
    TEST_CHECK(h.poll_until([] { return MockTransport::sent_count("orderbook.50.BTCUSDT") == 1; }));
    TEST_CHECK(h->slot_count() == 2);
    TEST_CHECK(MockTransport::created() == 2);

    const auto keys = h->slot_keys_for_test();
    TEST_CHECK(keys.size() == 2);
    TEST_CHECK(keys[0] != keys[1]);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// M3
// -----------------------------------------------------------------------------
void test_non_combined_exchange() {
    std::cout << "[TEST] M3: one connection per topic when combining is off\n";
    harness::Engine h{harness::fast_config(), harness::test_descriptor(false)};

    auto btc = h->ticker_stream("BTCUSDT");
    auto eth = h->ticker_stream("ETHUSDT");
    auto btc2 = h->ticker_stream("BTCUSDT");
    channel::Receiver<market::Ticker> r1;
    channel::Receiver<market::Ticker> r2;
    channel::Receiver<market::Ticker> r3;
    TEST_CHECK(btc.subscribe(r1) == Error::None);
    TEST_CHECK(eth.subscribe(r2) == Error::None);
    TEST_CHECK(btc2.subscribe(r3) == Error::None);

    TEST_CHECK(h.wait_state(eth, State::Active));
    TEST_CHECK(h.wait_state(btc2, State::Active));
    TEST_CHECK(h->slot_count() == 2);
    TEST_CHECK(MockTransport::created() == 2);

    // Same topic still shares a slot
    TEST_CHECK(MockTransport::sent_count("tickers.BTCUSDT") == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// M4
// -----------------------------------------------------------------------------
void test_topic_reference_counting() {
    std::cout << "[TEST] M4: topic reference counting and slot teardown\n";
    harness::Engine h;

    auto a = h->ticker_stream("BTCUSDT");
    auto b = h->ticker_stream("BTCUSDT");
    auto c = h->trade_stream("BTCUSDT");
    channel::Receiver<market::Ticker> ra;
    channel::Receiver<market::Ticker> rb;
    channel::Receiver<market::Trade> rc;
    TEST_CHECK(a.subscribe(ra) == Error::None);
    TEST_CHECK(h.wait_state(a, State::Active));
    TEST_CHECK(b.subscribe(rb) == Error::None);
    TEST_CHECK(c.subscribe(rc) == Error::None);
    TEST_CHECK(h.wait_state(b, State::Active));
    TEST_CHECK(h.wait_state(c, State::Active));

    TEST_CHECK(MockTransport::sent_count("tickers.BTCUSDT") == 1);

    // Both handles receive the shared topic
    TEST_CHECK(MockTransport::inject("tickers.BTCUSDT", json::bybit::ticker("BTCUSDT", "100")) == 1);
    market::Ticker t;
    TEST_CHECK(h.receive(ra, t));
    TEST_CHECK(rb.try_receive(t));

    TEST_CHECK(a.unsubscribe() == Error::None);
    h.poll(3);
    TEST_CHECK(MockTransport::sent_count(UNSUBSCRIBE_OP) == 0);

    TEST_CHECK(b.unsubscribe() == Error::None);
    TEST_CHECK(h.poll_until([] { return MockTransport::sent_count(UNSUBSCRIBE_OP) == 1; }));
    const auto log = MockTransport::sent_log();
    TEST_CHECK(log.back().find("tickers.BTCUSDT") != std::string::npos);
    TEST_CHECK(h->slot_count() == 1);
    TEST_CHECK(c.state() == State::Active);

    // Last subscriber leaves: slot and connection are gone
    TEST_CHECK(c.unsubscribe() == Error::None);
    TEST_CHECK(h.poll_until([&] { return h->slot_count() == 0; }));
    TEST_CHECK(MockTransport::live_count() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// M5
// -----------------------------------------------------------------------------
void test_request_batching() {
    std::cout << "[TEST] M5: control messages carry at most MAX_TOPICS_PER_REQUEST topics\n";
    harness::Engine h;

    const char* symbols[] = {
        "BTCUSDT", "ETHUSDT", "SOLUSDT", "XRPUSDT", "ADAUSDT", "DOTUSDT",
        "LTCUSDT", "BNBUSDT", "TRXUSDT", "AVAXUSDT", "LINKUSDT", "ATOMUSDT"
    };
    std::vector<stream::Stream<market::Ticker>> streams;
    std::vector<channel::Receiver<market::Ticker>> receivers(std::size(symbols));
    for (std::size_t i = 0; i < std::size(symbols); ++i) {
        streams.push_back(h->ticker_stream(symbols[i]));
        TEST_CHECK(streams.back().subscribe(receivers[i]) == Error::None);
    }
    TEST_CHECK(h.wait_state(streams.back(), State::Active));

    static_assert(config::MAX_TOPICS_PER_REQUEST == 10);
    const auto log = MockTransport::sent_log();
    TEST_CHECK(log.size() == 2);
    TEST_CHECK(MockTransport::sent_count(SUBSCRIBE_OP) == 2);
    TEST_CHECK(log[0].find("tickers.LINKUSDT") == std::string::npos);
    TEST_CHECK(log[1].find("tickers.LINKUSDT") != std::string::npos);
    TEST_CHECK(log[1].find("tickers.ATOMUSDT") != std::string::npos);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// M6
// -----------------------------------------------------------------------------
void test_connection_loss_fans_out() {
    std::cout << "[TEST] M6: connection loss affects only its slot\n";
    harness::Engine h;

    auto ticker = h->ticker_stream("BTCUSDT");
    auto trades = h->trade_stream("ETHUSDT");
    auto book = h->order_book_stream("BTCUSDT");
    channel::Receiver<market::Ticker> r1;
    channel::Receiver<market::Trade> r2;
    channel::Receiver<book::SnapshotPtr> r3;
    TEST_CHECK(ticker.subscribe(r1) == Error::None);
    TEST_CHECK(trades.subscribe(r2) == Error::None);
    TEST_CHECK(book.subscribe(r3) == Error::None);
    TEST_CHECK(h.poll_until([] { return MockTransport::sent_count("orderbook.50.BTCUSDT") == 1; }));
    TEST_CHECK(MockTransport::inject("orderbook.50.BTCUSDT",
        json::bybit::book_snapshot("BTCUSDT", 50, 100, {{"100", "1"}}, {{"101", "1"}})) == 1);
    TEST_CHECK(h.wait_state(book, State::Active));
    TEST_CHECK(ticker.state() == State::Active);

    TEST_CHECK(MockTransport::drop("tickers.BTCUSDT") == 1);
    h.poll();
    TEST_CHECK(ticker.state() == State::Reconnecting);
    TEST_CHECK(trades.state() == State::Reconnecting);
    TEST_CHECK(book.state() == State::Active);

    TEST_CHECK(h.wait_state(ticker, State::Active));
    TEST_CHECK(h.wait_state(trades, State::Active));
    TEST_CHECK(MockTransport::created() == 3);
    TEST_CHECK(h->slot_count() == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// M7
// -----------------------------------------------------------------------------
void test_protocol_errors() {
    std::cout << "[TEST] M7: rejections and undecodable frames\n";
    harness::Engine h;

    auto ticker = h->ticker_stream("BTCUSDT");
    auto book = h->order_book_stream("FOOUSDT");
    channel::Receiver<market::Ticker> r1;
    channel::Receiver<book::SnapshotPtr> r2;
    TEST_CHECK(ticker.subscribe(r1) == Error::None);
    TEST_CHECK(book.subscribe(r2) == Error::None);
    TEST_CHECK(h.wait_state(ticker, State::Active));
    TEST_CHECK(h.poll_until([] { return MockTransport::sent_count("orderbook.50.FOOUSDT") == 1; }));

    // Pending book subscription refused by the exchange
    TEST_CHECK(MockTransport::inject("orderbook.50.FOOUSDT",
        json::bybit::subscribe_ack(false, "error:handler not found,topic:orderbook.50.FOOUSDT")) == 1);
    StreamError e;
    auto book_errors = book.errors();
    TEST_CHECK(h.poll_until([&] { return book_errors.try_receive(e); }));
    TEST_CHECK(e.code == Error::SubscriptionRejected);
    TEST_CHECK(!e.terminal());
    TEST_CHECK(book.state() == State::Reconnecting);
    TEST_CHECK(ticker.state() == State::Active);

    // Rejection naming an active topic: reported, state kept
    TEST_CHECK(MockTransport::inject("tickers.BTCUSDT",
        json::bybit::subscribe_ack(false, "error:already subscribed,topic:tickers.BTCUSDT")) == 1);
    auto ticker_errors = ticker.errors();
    TEST_CHECK(h.poll_until([&] { return ticker_errors.try_receive(e); }));
    TEST_CHECK(e.code == Error::SubscriptionRejected);
    TEST_CHECK(ticker.state() == State::Active);

    // Garbage on the market connection
    TEST_CHECK(MockTransport::inject("tickers.BTCUSDT", "{not json") == 1);
    TEST_CHECK(h.poll_until([&] { return ticker_errors.try_receive(e); }));
    TEST_CHECK(e.code == Error::DecodeFailed);
    TEST_CHECK(e.kind() == ErrorClass::Protocol);
    TEST_CHECK(ticker.state() == State::Active);

    // Data keeps flowing afterwards
    TEST_CHECK(MockTransport::inject("tickers.BTCUSDT", json::bybit::ticker("BTCUSDT", "7")) == 1);
    market::Ticker t;
    TEST_CHECK(h.receive(r1, t));
    TEST_CHECK(t.last_price == 7.0);

    // Successful acks and unknown frames are not errors
    TEST_CHECK(MockTransport::inject("tickers.BTCUSDT", json::bybit::subscribe_ack(true)) == 1);
    TEST_CHECK(MockTransport::inject("tickers.BTCUSDT", R"({"topic":"liquidation.BTCUSDT","data":{}})") == 1);
    h.poll(3);
    TEST_CHECK(!ticker_errors.try_receive(e));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// M8
// -----------------------------------------------------------------------------
void test_keepalive() {
    std::cout << "[TEST] M8: keepalive pings and pong timeout\n";
    {
        auto cfg = harness::fast_config();
        cfg.ping_interval = 10ms;
        cfg.pong_timeout = 500ms;
        harness::Engine h{cfg};

        auto ticker = h->ticker_stream("BTCUSDT");
        channel::Receiver<market::Ticker> rx;
        TEST_CHECK(ticker.subscribe(rx) == Error::None);
        TEST_CHECK(h.wait_state(ticker, State::Active));

        // Answer three pings
        for (std::size_t n = 1; n <= 3; ++n) {
            TEST_CHECK(h.poll_until([n] { return MockTransport::sent_count(R"({"op":"ping"})") >= n; }));
            TEST_CHECK(MockTransport::inject_all(json::bybit::pong()) == 1);
            h.poll();
        }
        TEST_CHECK(ticker.state() == State::Active);
        TEST_CHECK(MockTransport::created() == 1);
        TEST_CHECK(h->telemetry().pong_timeouts_total.load() == 0);
    }
    {
        auto cfg = harness::fast_config();
        cfg.ping_interval = 10ms;
        cfg.pong_timeout = 20ms;
        harness::Engine h{cfg};

        auto ticker = h->ticker_stream("BTCUSDT");
        channel::Receiver<market::Ticker> rx;
        TEST_CHECK(ticker.subscribe(rx) == Error::None);
        TEST_CHECK(h.wait_state(ticker, State::Active));

        // Nobody answers: the slot is declared dead and rebuilt
        TEST_CHECK(h.poll_until([] { return MockTransport::created() == 2; }));
        TEST_CHECK(h.wait_state(ticker, State::Active));
        TEST_CHECK(MockTransport::sent_count("tickers.BTCUSDT") == 2);

        StreamError e;
        TEST_CHECK(!ticker.errors().try_receive(e));
    }

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// M9
// -----------------------------------------------------------------------------
void test_rejection_names_whole_topic() {
    std::cout << "[TEST] M9: rejection routed by whole topic name\n";
    harness::Engine h;

    auto short_sym = h->ticker_stream("BTC");
    auto long_sym = h->ticker_stream("BTCUSDT");
    channel::Receiver<market::Ticker> r1;
    channel::Receiver<market::Ticker> r2;
    TEST_CHECK(short_sym.subscribe(r1) == Error::None);
    TEST_CHECK(long_sym.subscribe(r2) == Error::None);
    TEST_CHECK(h.wait_state(short_sym, State::Active));
    TEST_CHECK(h.wait_state(long_sym, State::Active));
    TEST_CHECK(short_sym.wire_topic() == "tickers.BTC");

    TEST_CHECK(MockTransport::inject("tickers.BTCUSDT",
        json::bybit::subscribe_ack(false, "error:already subscribed,topic:tickers.BTCUSDT")) == 1);

    StreamError e;
    auto long_errors = long_sym.errors();
    TEST_CHECK(h.poll_until([&] { return long_errors.try_receive(e); }));
    TEST_CHECK(e.code == Error::SubscriptionRejected);
    TEST_CHECK(e.topic == "tickers.BTCUSDT");

    h.poll(3);
    TEST_CHECK(!short_sym.errors().try_receive(e));
    TEST_CHECK(short_sym.state() == State::Active);
    TEST_CHECK(long_sym.state() == State::Active);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Info);

    test_combined_market_slot();
    test_books_use_depth_slot();
    test_non_combined_exchange();
    test_topic_reference_counting();
    test_request_batching();
    test_connection_loss_fans_out();
    test_protocol_errors();
    test_keepalive();
    test_rejection_names_whole_topic();

    std::cout << "\n[MULTIPLEXER TESTS PASSED]\n";
    return 0;
}
