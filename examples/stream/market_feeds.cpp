// ============================================================================
// Stream example: market feeds
//
// Demonstrates:
// - Ticker, trade and kline streams for several symbols over one connection
// - Driving the engine from the caller thread with poll()
// - Non-blocking consumption with try_receive()
// - Observing stream states and errors while running
// - Clean unsubscribe on Ctrl+C
// ============================================================================
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>
#include <vector>

#include "tidewire/core.hpp"

#include "common/cli/stream_params.hpp"

// -----------------------------------------------------------------------------
// Ctrl+C handling
// -----------------------------------------------------------------------------
std::atomic<bool> running{true};

void on_signal(int) {
    running.store(false);
}

// -----------------------------------------------------------------------------
// One subscribed stream with its receivers
// -----------------------------------------------------------------------------
template<typename T>
struct Feed {
    tidewire::core::stream::Stream<T> stream;
    tidewire::core::channel::Receiver<T> data;
    tidewire::core::channel::Receiver<tidewire::core::StreamError> errors;
    tidewire::core::stream::State last_state{tidewire::core::stream::State::Idle};
};

template<typename T>
bool open_feed(tidewire::core::stream::Stream<T> stream, std::vector<Feed<T>>& out) {
    Feed<T> feed{std::move(stream), {}, {}, tidewire::core::stream::State::Idle};
    const auto err = feed.stream.subscribe(feed.data);
    if (err != tidewire::core::Error::None) {
        std::cerr << "[tidewire] " << feed.stream.topic() << ": subscribe failed: " << err << "\n";
        return false;
    }
    feed.errors = feed.stream.errors();
    out.push_back(std::move(feed));
    return true;
}

// Drains whatever is ready. Returns the number of data items consumed.
template<typename T>
int drain_feeds(std::vector<Feed<T>>& feeds) {
    int n = 0;
    for (auto& f : feeds) {
        T item;
        while (f.data.try_receive(item)) {
            std::cout << " -> " << item << std::endl;
            ++n;
        }
        tidewire::core::StreamError e;
        while (f.errors.try_receive(e)) {
            std::cout << " !! " << f.stream.wire_topic() << ": " << e << std::endl;
        }
        const auto state = f.stream.state();
        if (state != f.last_state) {
            std::cout << " ** " << f.stream.wire_topic() << ": " << f.last_state << " -> " << state << std::endl;
            f.last_state = state;
        }
    }
    return n;
}

int main(int argc, char** argv) {
    using namespace tidewire::core;

    const auto params = tidewire::examples::cli::stream::configure(argc, argv, "Tidewire market feeds example");
    params.dump("=== Market Feed Parameters ===", std::cout);

    std::signal(SIGINT, on_signal);

    // -------------------------------------------------------------------------
    // Engine setup
    // -------------------------------------------------------------------------
    const auto registry = params.registry();
    const auto* descriptor = params.lookup(registry);
    if (!descriptor) {
        std::cerr << "[tidewire] Provider not available: " << params.provider << "\n";
        return -1;
    }
    config::Error cfg_err = config::Error::None;
    auto engine = bybit::Engine::create(params.stream_config(), *descriptor, cfg_err);
    if (!engine) {
        std::cerr << "[tidewire] Invalid configuration: " << config::to_string(cfg_err) << "\n";
        return -1;
    }

    market::KlineInterval interval = market::KlineInterval::M1;
    if (!market::parse_interval(params.interval, interval)) {
        std::cerr << "[tidewire] Unknown interval: " << params.interval << "\n";
        return -1;
    }

    // -------------------------------------------------------------------------
    // Subscriptions (all share the market connection)
    // -------------------------------------------------------------------------
    std::vector<Feed<market::Ticker>> tickers;
    std::vector<Feed<market::Trade>> trades;
    std::vector<Feed<market::Kline>> klines;

    for (const auto& symbol : params.symbols) {
        (void)open_feed(engine->ticker_stream(symbol), tickers);
        (void)open_feed(engine->trade_stream(symbol), trades);
        (void)open_feed(engine->kline_stream(symbol, interval), klines);
    }

    if (tickers.empty() && trades.empty() && klines.empty()) {
        return -1;
    }

    std::cout << "[tidewire] Running. Press Ctrl+C to exit.\n";

    // -------------------------------------------------------------------------
    // Main polling loop
    // -------------------------------------------------------------------------
    int messages = 0;
    while (running.load(std::memory_order_relaxed)) {
        const auto work = engine->poll();
        messages += drain_feeds(tickers);
        messages += drain_feeds(trades);
        messages += drain_feeds(klines);
        if (params.max_messages > 0 && messages >= params.max_messages) {
            break;
        }
        if (work == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    // -------------------------------------------------------------------------
    // Unsubscribe & graceful shutdown
    // -------------------------------------------------------------------------
    std::cout << "[tidewire] Unsubscribing...\n";
    auto unsubscribe_all = [](auto& feeds) {
        for (auto& f : feeds) {
            const auto err = f.stream.unsubscribe();
            if (err != Error::None && err != Error::NotSubscribed) {
                std::cerr << "[tidewire] " << f.stream.wire_topic() << ": unsubscribe failed: " << err << "\n";
            }
        }
    };
    unsubscribe_all(tickers);
    unsubscribe_all(trades);
    unsubscribe_all(klines);

    // Let the engine send the unsubscribe requests and tear connections down
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (engine->slot_count() > 0 && std::chrono::steady_clock::now() < deadline) {
        (void)engine->poll();
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    std::cout << "[tidewire] " << messages << " messages received.\n";
    std::cout << "[tidewire] Done.\n";
    return 0;
}
