/*
===============================================================================
 book::Engine - Unit Tests
===============================================================================

Covered Requirements:
---------------------
E1. Buffered diffs before the snapshot are replayed after it
    - Stale buffered diffs are skipped, contiguous ones applied

E2. Gap on a live replica
    - Replica invalidated, buffer discarded, latest() cleared

E3. Gap during replay invalidates again

E4. Buffer bound
    - max_buffered_diffs evicts the oldest diff first

E5. Books are independent per topic (symbol and depth)
    - erase() destroys one replica only

===============================================================================
*/

#include <iostream>

#include "tidewire/core/book/engine.hpp"
#include "common/test_check.hpp"

using namespace tidewire::core;
using namespace tidewire::core::book;


static Update make_update(std::uint64_t first, std::uint64_t final, Levels bids = {}, Levels asks = {}) {
    Update u;
    u.symbol = "ETHUSDT";
    u.first_update_id = first;
    u.final_update_id = final;
    u.bids = std::move(bids);
    u.asks = std::move(asks);
    return u;
}

static const std::string TOPIC = "orderbook.50.ETHUSDT";

// -----------------------------------------------------------------------------
// E1
// -----------------------------------------------------------------------------
void test_buffered_diffs_replayed() {
    std::cout << "[TEST] E1: diffs buffered before the snapshot are replayed\n";

    Engine books{100};
    TEST_CHECK(books.on_diff(TOPIC, make_update(95, 99, {{10.0, 1.0}})) == Outcome::Buffered);
    TEST_CHECK(books.on_diff(TOPIC, make_update(100, 101, {{11.0, 1.0}})) == Outcome::Buffered);
    TEST_CHECK(books.on_diff(TOPIC, make_update(102, 102, {}, {{12.0, 2.0}})) == Outcome::Buffered);
    TEST_CHECK(books.buffered(TOPIC) == 3);
    TEST_CHECK(!books.is_valid(TOPIC));
    TEST_CHECK(books.latest(TOPIC) == nullptr);

    TEST_CHECK(books.on_snapshot(TOPIC, make_update(100, 100, {{9.0, 1.0}}, {{13.0, 1.0}})) == Outcome::Applied);
    TEST_CHECK(books.is_valid(TOPIC));
    TEST_CHECK(books.buffered(TOPIC) == 0);

    auto snap = books.latest(TOPIC);
    TEST_CHECK(snap != nullptr);
    TEST_CHECK(snap->last_update_id == 102);
    TEST_CHECK(snap->bids.size() == 2);        // 11 (replayed) and 9; 10 was stale
    TEST_CHECK(snap->bids[0].price == 11.0);
    TEST_CHECK(snap->asks.size() == 2);
    TEST_CHECK(snap->asks[0].price == 12.0);

    TEST_CHECK(books.metrics().snapshots_applied_total.load() <= 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// E2
// -----------------------------------------------------------------------------
void test_gap_invalidates() {
    std::cout << "[TEST] E2: gap on a live replica\n";

    Engine books{100};
    TEST_CHECK(books.on_snapshot(TOPIC, make_update(100, 100, {{100.0, 1.0}}, {{101.0, 1.0}})) == Outcome::Applied);
    TEST_CHECK(books.on_diff(TOPIC, make_update(101, 102, {{100.0, 0.0}}, {{101.0, 2.0}})) == Outcome::Applied);
    TEST_CHECK(books.latest(TOPIC)->last_update_id == 102);

    TEST_CHECK(books.on_diff(TOPIC, make_update(90, 101)) == Outcome::Stale);
    TEST_CHECK(books.on_diff(TOPIC, make_update(105, 106)) == Outcome::Gap);
    TEST_CHECK(!books.is_valid(TOPIC));
    TEST_CHECK(books.latest(TOPIC) == nullptr);
    TEST_CHECK(books.contains(TOPIC));

    // Post-gap diffs wait for a fresh snapshot
    TEST_CHECK(books.on_diff(TOPIC, make_update(107, 107)) == Outcome::Buffered);
    TEST_CHECK(books.on_snapshot(TOPIC, make_update(200, 200, {{50.0, 1.0}}, {})) == Outcome::Applied);
    TEST_CHECK(books.latest(TOPIC)->last_update_id == 200);
    TEST_CHECK(books.latest(TOPIC)->bids[0].price == 50.0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// E3
// -----------------------------------------------------------------------------
void test_gap_during_replay() {
    std::cout << "[TEST] E3: gap while replaying buffered diffs\n";

    Engine books{100};
    TEST_CHECK(books.on_diff(TOPIC, make_update(110, 111)) == Outcome::Buffered);
    TEST_CHECK(books.on_snapshot(TOPIC, make_update(100, 100, {{1.0, 1.0}}, {})) == Outcome::Gap);
    TEST_CHECK(!books.is_valid(TOPIC));
    TEST_CHECK(books.buffered(TOPIC) == 0);
    TEST_CHECK(books.latest(TOPIC) == nullptr);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// E4
// -----------------------------------------------------------------------------
void test_buffer_bound() {
    std::cout << "[TEST] E4: bounded diff buffer evicts the oldest\n";

    Engine books{3};
    for (std::uint64_t u = 1; u <= 5; ++u) {
        TEST_CHECK(books.on_diff(TOPIC, make_update(u, u, {{static_cast<double>(u), 1.0}})) == Outcome::Buffered);
    }
    TEST_CHECK(books.buffered(TOPIC) == 3);

    // Snapshot at 2: diffs 3..5 remain and are contiguous
    TEST_CHECK(books.on_snapshot(TOPIC, make_update(2, 2)) == Outcome::Applied);
    auto snap = books.latest(TOPIC);
    TEST_CHECK(snap->last_update_id == 5);
    TEST_CHECK(snap->bids.size() == 3);
    TEST_CHECK(snap->bids.back().price == 3.0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// E5
// -----------------------------------------------------------------------------
void test_topics_independent() {
    std::cout << "[TEST] E5: replicas are independent per topic\n";

    const std::string deep = "orderbook.200.ETHUSDT";
    Engine books{100};
    TEST_CHECK(books.on_snapshot(TOPIC, make_update(10, 10, {{1.0, 1.0}})) == Outcome::Applied);
    TEST_CHECK(books.on_snapshot(deep, make_update(500, 500, {{1.0, 1.0}, {0.5, 1.0}})) == Outcome::Applied);
    TEST_CHECK(books.size() == 2);

    TEST_CHECK(books.on_diff(TOPIC, make_update(20, 20)) == Outcome::Gap);
    TEST_CHECK(!books.is_valid(TOPIC));
    TEST_CHECK(books.is_valid(deep));

    books.erase(TOPIC);
    TEST_CHECK(!books.contains(TOPIC));
    TEST_CHECK(books.contains(deep));
    TEST_CHECK(books.size() == 1);

    books.invalidate(deep);
    TEST_CHECK(!books.is_valid(deep));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Info);

    test_buffered_diffs_replayed();
    test_gap_invalidates();
    test_gap_during_replay();
    test_buffer_bound();
    test_topics_independent();

    std::cout << "\n[BOOK ENGINE TESTS PASSED]\n";
    return 0;
}
