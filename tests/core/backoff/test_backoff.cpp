/*
===============================================================================
 backoff::Controller - Unit Tests
===============================================================================

Covered Requirements:
---------------------
B1. compute_delay()
    - base * 2^attempt, capped at max_delay, scaled by jitter in [0.5, 1.0]
    - Non-decreasing in attempt for a fixed jitter

B2. Controller scheduling
    - First retry after a reset uses exponent 0
    - Delay never exceeds max_delay and never drops below base * 0.5

B3. Exhaustion
    - max_attempts > 0: exhausted once attempts >= max_attempts
    - max_attempts = 0: never exhausted

B4. Reset
    - reset() returns the next delay to the base value

===============================================================================
*/

#include <chrono>
#include <initializer_list>
#include <iostream>

#include "tidewire/core/backoff/controller.hpp"
#include "common/test_check.hpp"

using namespace tidewire::core;
using namespace tidewire::core::backoff;
using namespace std::chrono_literals;


// -----------------------------------------------------------------------------
// B1
// -----------------------------------------------------------------------------
void test_compute_delay() {
    std::cout << "[TEST] B1: compute_delay\n";

    const Policy p{100ms, 5000ms, 0};
    TEST_CHECK(compute_delay(p, 0, 1.0) == 100ms);
    TEST_CHECK(compute_delay(p, 1, 1.0) == 200ms);
    TEST_CHECK(compute_delay(p, 3, 1.0) == 800ms);
    TEST_CHECK(compute_delay(p, 6, 1.0) == 5000ms);         // capped
    TEST_CHECK(compute_delay(p, 1000, 1.0) == 5000ms);      // saturates
    TEST_CHECK(compute_delay(p, 0, 0.5) == 50ms);
    TEST_CHECK(compute_delay(p, 6, 0.5) == 2500ms);

    // Jitter outside the range is clamped
    TEST_CHECK(compute_delay(p, 0, 0.1) == 50ms);
    TEST_CHECK(compute_delay(p, 0, 3.0) == 100ms);

    for (double jitter : {0.5, 0.75, 1.0}) {
        auto prev = compute_delay(p, 0, jitter);
        for (int a = 1; a < 64; ++a) {
            auto d = compute_delay(p, a, jitter);
            TEST_CHECK(d >= prev);
            TEST_CHECK(d <= p.max_delay);
            prev = d;
        }
    }

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B2
// -----------------------------------------------------------------------------
void test_schedule_bounds() {
    std::cout << "[TEST] B2: scheduled delays stay within bounds\n";

    const Policy p{100ms, 1000ms, 0};
    Controller c{p, 7u};
    const TimePoint now = Clock::now();

    c.record_failure();
    auto at = c.schedule(now);
    TEST_CHECK(c.last_delay() >= 50ms);
    TEST_CHECK(c.last_delay() <= 100ms);        // exponent 0
    TEST_CHECK(at == now + c.last_delay());
    TEST_CHECK(!c.ready(now + c.last_delay() - 1ms));
    TEST_CHECK(c.ready(now + c.last_delay()));

    for (int i = 0; i < 20; ++i) {
        c.record_failure();
        (void)c.schedule(now);
        TEST_CHECK(c.last_delay() >= 50ms);
        TEST_CHECK(c.last_delay() <= 1000ms);
    }
    TEST_CHECK(c.last_delay() >= 500ms);        // reached the cap region

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B3
// -----------------------------------------------------------------------------
void test_exhaustion() {
    std::cout << "[TEST] B3: exhaustion\n";

    Controller limited{Policy{10ms, 100ms, 3}, 1u};
    TEST_CHECK(!limited.exhausted());
    limited.record_failure();
    limited.record_failure();
    TEST_CHECK(!limited.exhausted());
    limited.record_failure();
    TEST_CHECK(limited.exhausted());
    TEST_CHECK(limited.attempts() == 3);

    Controller unlimited{Policy{10ms, 100ms, 0}, 1u};
    for (int i = 0; i < 1000; ++i) {
        unlimited.record_failure();
    }
    TEST_CHECK(!unlimited.exhausted());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B4
// -----------------------------------------------------------------------------
void test_reset() {
    std::cout << "[TEST] B4: reset returns to the base delay\n";

    Controller c{Policy{100ms, 10000ms, 5}, 3u};
    const TimePoint now = Clock::now();
    for (int i = 0; i < 4; ++i) {
        c.record_failure();
    }
    (void)c.schedule(now);
    TEST_CHECK(c.last_delay() >= 400ms);

    c.reset();
    TEST_CHECK(c.attempts() == 0);
    TEST_CHECK(!c.exhausted());
    TEST_CHECK(c.ready(now));

    c.record_failure();
    (void)c.schedule(now);
    TEST_CHECK(c.last_delay() <= 100ms);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Info);

    test_compute_delay();
    test_schedule_bounds();
    test_exhaustion();
    test_reset();

    std::cout << "\n[BACKOFF TESTS PASSED]\n";
    return 0;
}
