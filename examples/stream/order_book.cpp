// ============================================================================
// Stream example: order book
//
// Demonstrates:
// - Resolving the exchange descriptor through an exchange::Registry (--provider)
// - One order book stream per symbol, all sharing the depth connection
// - Consuming immutable snapshots on a consumer thread per symbol
// - Cancellation through a shared std::stop_source (Ctrl+C)
// - Reading the terminal reason from the error channel
// ============================================================================
#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <stop_token>
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

int main(int argc, char** argv) {
    using namespace tidewire::core;

    const auto params = tidewire::examples::cli::stream::configure(argc, argv, "Tidewire order book example");
    params.dump("=== Order Book Parameters ===", std::cout);

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

    // -------------------------------------------------------------------------
    // Subscriptions
    // -------------------------------------------------------------------------
    std::stop_source stop;
    std::atomic<int> messages{0};
    std::vector<stream::Stream<book::SnapshotPtr>> streams;
    std::vector<std::jthread> consumers;

    for (const auto& symbol : params.symbols) {
        auto stream = engine->order_book_stream(symbol, params.depth);
        channel::Receiver<book::SnapshotPtr> rx;
        const Error err = stream.subscribe(stop.get_token(), rx);
        if (err != Error::None) {
            std::cerr << "[tidewire] " << symbol << ": subscribe failed: " << err << "\n";
            continue;
        }
        consumers.emplace_back([rx, &messages, &params]() mutable {
            book::SnapshotPtr snap;
            while (rx.receive(snap)) {
                double spread = 0.0;
                const auto* bid = snap->best_bid();
                const auto* ask = snap->best_ask();
                std::cout << " -> " << snap->symbol << " #" << snap->last_update_id << std::fixed << std::setprecision(2);
                if (bid) std::cout << "  bid " << bid->qty << " @ " << bid->price;
                if (ask) std::cout << "  ask " << ask->qty << " @ " << ask->price;
                if (snap->spread(spread)) std::cout << "  spread " << spread;
                std::cout << std::endl;
                if (params.max_messages > 0 && ++messages >= params.max_messages) {
                    running.store(false);
                }
            }
        });
        streams.push_back(std::move(stream));
    }

    if (streams.empty()) {
        return -1;
    }

    engine->start();
    std::cout << "[tidewire] Streaming " << streams.size() << " order book(s). Press Ctrl+C to exit.\n";

    // -------------------------------------------------------------------------
    // Main loop: wait for Ctrl+C or for every stream to end on its own
    // -------------------------------------------------------------------------
    while (running.load(std::memory_order_relaxed)) {
        bool all_done = true;
        for (const auto& s : streams) {
            all_done = all_done && s.done().is_done();
        }
        if (all_done) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    // -------------------------------------------------------------------------
    // Cancellation & graceful shutdown
    // -------------------------------------------------------------------------
    std::cout << "[tidewire] Shutting down...\n";
    stop.request_stop();
    for (const auto& s : streams) {
        if (!s.done().wait_for(std::chrono::seconds(5))) {
            std::cerr << "[tidewire] " << s.wire_topic() << ": did not close in time\n";
        }
    }
    consumers.clear();

    for (const auto& s : streams) {
        auto errors = s.errors();
        StreamError e;
        while (errors.try_receive(e)) {
            std::cout << "[tidewire] " << s.wire_topic() << ": " << e << "\n";
        }
    }

    engine->stop();
    const auto& t = engine->telemetry();
    std::cout << "[tidewire] messages=" << t.messages_decoded_total.load()
              << " retries=" << t.retries_total.load() << "\n";
    std::cout << "[tidewire] Done.\n";
    return 0;
}
