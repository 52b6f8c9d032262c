/*
===============================================================================
 book::Replica - Unit Tests
===============================================================================

Covered Requirements:
---------------------
R1. Snapshot initialization
    - Levels sorted (bids descending, asks ascending), zero quantities absent
    - Watermark and sequence set

R2. Contiguous diff
    - snapshot u=100, diff [101,102] removes bid 100, sets ask 101 to 2
    - Result: bids=[], asks=[(101,2)], u=102

R3. Stale diff
    - final <= watermark never mutates the replica

R4. Gap
    - first > watermark + 1 is reported and leaves the replica untouched

R5. Invariants under arbitrary diff sequences
    - Strict ordering and no zero levels after every application

R6. Invalid updates
    - Non-finite prices or inverted ranges are rejected without mutation

===============================================================================
*/

#include <cmath>
#include <iostream>
#include <limits>
#include <random>

#include "tidewire/core/book/replica.hpp"
#include "common/test_check.hpp"

using namespace tidewire::core;
using namespace tidewire::core::book;


static Update make_update(std::uint64_t first, std::uint64_t final, Levels bids, Levels asks) {
    Update u;
    u.symbol = "BTCUSDT";
    u.first_update_id = first;
    u.final_update_id = final;
    u.bids = std::move(bids);
    u.asks = std::move(asks);
    return u;
}

// -----------------------------------------------------------------------------
// R1
// -----------------------------------------------------------------------------
void test_snapshot_initialization() {
    std::cout << "[TEST] R1: snapshot initialization\n";

    Replica r{"BTCUSDT"};
    TEST_CHECK(!r.valid());
    TEST_CHECK(r.classify(make_update(1, 1, {}, {})) == ApplyResult::NotReady);

    auto snap = make_update(100, 100,
        {{99.0, 1.0}, {100.0, 2.0}, {98.0, 0.0}},
        {{102.0, 1.0}, {101.0, 3.0}});
    TEST_CHECK(r.apply_snapshot(snap) == ApplyResult::Applied);
    TEST_CHECK(r.valid());
    TEST_CHECK(r.last_update_id() == 100);
    TEST_CHECK(r.sequence() == 1);
    TEST_CHECK(r.bid_levels() == 2);
    TEST_CHECK(r.ask_levels() == 2);

    auto s = r.make_snapshot();
    TEST_CHECK(s->bids[0].price == 100.0);
    TEST_CHECK(s->bids[1].price == 99.0);
    TEST_CHECK(s->asks[0].price == 101.0);
    TEST_CHECK(s->asks[1].price == 102.0);
    TEST_CHECK(s->last_update_id == 100);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// R2
// -----------------------------------------------------------------------------
void test_contiguous_diff() {
    std::cout << "[TEST] R2: contiguous diff\n";

    Replica r{"BTCUSDT"};
    TEST_CHECK(r.apply_snapshot(make_update(100, 100, {{100.0, 1.0}}, {{101.0, 1.0}})) == ApplyResult::Applied);

    auto before = r.make_snapshot();
    TEST_CHECK(r.apply_diff(make_update(101, 102, {{100.0, 0.0}}, {{101.0, 2.0}})) == ApplyResult::Applied);

    auto s = r.make_snapshot();
    TEST_CHECK(s->bids.empty());
    TEST_CHECK(s->asks.size() == 1);
    TEST_CHECK(s->asks[0] == (Level{101.0, 2.0}));
    TEST_CHECK(s->last_update_id == 102);
    TEST_CHECK(s->sequence == 2);

    // Earlier snapshot is untouched
    TEST_CHECK(before->bids.size() == 1);
    TEST_CHECK(before->asks[0].qty == 1.0);

    // Overlapping range is applicable as well
    TEST_CHECK(r.apply_diff(make_update(100, 103, {{99.5, 4.0}}, {})) == ApplyResult::Applied);
    TEST_CHECK(r.last_update_id() == 103);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// R3
// -----------------------------------------------------------------------------
void test_stale_diff_is_noop() {
    std::cout << "[TEST] R3: stale diff is a no-op\n";

    Replica r{"BTCUSDT"};
    TEST_CHECK(r.apply_snapshot(make_update(100, 100, {{100.0, 1.0}}, {{101.0, 1.0}})) == ApplyResult::Applied);

    TEST_CHECK(r.apply_diff(make_update(90, 100, {{100.0, 0.0}}, {{101.0, 9.0}})) == ApplyResult::Stale);
    TEST_CHECK(r.apply_diff(make_update(95, 99, {{100.0, 0.0}}, {})) == ApplyResult::Stale);

    auto s = r.make_snapshot();
    TEST_CHECK(s->bids.size() == 1);
    TEST_CHECK(s->asks[0].qty == 1.0);
    TEST_CHECK(r.last_update_id() == 100);
    TEST_CHECK(r.sequence() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// R4
// -----------------------------------------------------------------------------
void test_gap_detected() {
    std::cout << "[TEST] R4: gap detection\n";

    Replica r{"BTCUSDT"};
    TEST_CHECK(r.apply_snapshot(make_update(100, 100, {{100.0, 1.0}}, {{101.0, 1.0}})) == ApplyResult::Applied);

    TEST_CHECK(r.apply_diff(make_update(105, 106, {{100.0, 0.0}}, {})) == ApplyResult::Gap);
    TEST_CHECK(r.valid());
    TEST_CHECK(r.last_update_id() == 100);
    TEST_CHECK(r.bid_levels() == 1);

    r.invalidate();
    TEST_CHECK(!r.valid());
    TEST_CHECK(r.apply_diff(make_update(101, 101, {}, {})) == ApplyResult::NotReady);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// R5
// -----------------------------------------------------------------------------
void test_invariants_hold_under_random_diffs() {
    std::cout << "[TEST] R5: ordering invariants under random diffs\n";

    std::mt19937 rng(42);
    std::uniform_int_distribution<int> price_tick(0, 40);
    std::uniform_int_distribution<int> qty_pick(0, 3);
    std::uniform_int_distribution<int> count(0, 6);

    Replica r{"BTCUSDT"};
    TEST_CHECK(r.apply_snapshot(make_update(1, 1, {{100.0, 1.0}}, {{101.0, 1.0}})) == ApplyResult::Applied);

    std::uint64_t u = 1;
    for (int i = 0; i < 2000; ++i) {
        Levels bids;
        Levels asks;
        for (int n = count(rng); n > 0; --n) {
            bids.push_back(Level{80.0 + price_tick(rng) * 0.5, static_cast<double>(qty_pick(rng))});
        }
        for (int n = count(rng); n > 0; --n) {
            asks.push_back(Level{101.0 + price_tick(rng) * 0.5, static_cast<double>(qty_pick(rng))});
        }
        TEST_CHECK(r.apply_diff(make_update(u + 1, u + 2, std::move(bids), std::move(asks))) == ApplyResult::Applied);
        u += 2;
        TEST_CHECK(r.check_invariants());

        auto s = r.make_snapshot();
        for (std::size_t k = 1; k < s->bids.size(); ++k) {
            TEST_CHECK(s->bids[k - 1].price > s->bids[k].price);
        }
        for (std::size_t k = 1; k < s->asks.size(); ++k) {
            TEST_CHECK(s->asks[k - 1].price < s->asks[k].price);
        }
        for (const auto& l : s->bids) TEST_CHECK(l.qty > 0.0);
        for (const auto& l : s->asks) TEST_CHECK(l.qty > 0.0);
    }
    TEST_CHECK(r.last_update_id() == u);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// R6
// -----------------------------------------------------------------------------
void test_invalid_updates_rejected() {
    std::cout << "[TEST] R6: invalid updates are rejected atomically\n";

    Replica r{"BTCUSDT"};
    TEST_CHECK(r.apply_snapshot(make_update(100, 100, {{100.0, 1.0}}, {{101.0, 1.0}})) == ApplyResult::Applied);

    const double nan = std::numeric_limits<double>::quiet_NaN();
    // First level valid, second not: nothing may be applied
    TEST_CHECK(r.apply_diff(make_update(101, 101, {{100.0, 0.0}, {nan, 1.0}}, {})) == ApplyResult::Invalid);
    TEST_CHECK(r.bid_levels() == 1);
    TEST_CHECK(r.last_update_id() == 100);

    TEST_CHECK(r.apply_diff(make_update(102, 101, {}, {})) == ApplyResult::Invalid);
    TEST_CHECK(r.apply_diff(make_update(101, 101, {{-1.0, 1.0}}, {})) == ApplyResult::Invalid);

    // Malformed snapshot keeps the current state
    TEST_CHECK(r.apply_snapshot(make_update(200, 200, {{100.0, -3.0}}, {})) == ApplyResult::Invalid);
    TEST_CHECK(r.valid());
    TEST_CHECK(r.last_update_id() == 100);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Info);

    test_snapshot_initialization();
    test_contiguous_diff();
    test_stale_diff_is_noop();
    test_gap_detected();
    test_invariants_hold_under_random_diffs();
    test_invalid_updates_rejected();

    std::cout << "\n[BOOK REPLICA TESTS PASSED]\n";
    return 0;
}
