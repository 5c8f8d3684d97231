// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fraud/fraud_db.h>
#include <guard/rate_limiter.h>
#include <test/test_giftguard.h>

#include <boost/test/unit_test.hpp>
#include <boost/thread.hpp>

#include <atomic>
#include <memory>
#include <vector>

using namespace giftguard;

namespace {

const RateLimitPolicy IP_POLICY(3, 60 * 1000);

/** Behaviour shared by every RateLimitStore implementation */
void CheckFixedWindow(RateLimitStore& store)
{
    const int64_t t0 = TEST_START_TIME_MS;

    for (uint32_t i = 1; i <= 3; ++i) {
        RateLimitDecision d = store.CheckAndIncrement(RateLimitScope::IP, "1.2.3.4", IP_POLICY, t0 + i * 1000);
        BOOST_CHECK(d.allowed);
        BOOST_CHECK_EQUAL(d.count, i);
        BOOST_CHECK_EQUAL(d.limit, 3u);
        BOOST_CHECK_EQUAL(d.windowStart, t0);
    }

    RateLimitDecision denied = store.CheckAndIncrement(RateLimitScope::IP, "1.2.3.4", IP_POLICY, t0 + 10000);
    BOOST_CHECK(!denied.allowed);
    BOOST_CHECK_EQUAL(denied.count, 4u);
    BOOST_CHECK_EQUAL(denied.retryAfterMs, 50000);
    BOOST_CHECK_EQUAL(denied.RetryAfterSeconds(), 50);

    // Other keys and scopes are independent
    BOOST_CHECK(store.CheckAndIncrement(RateLimitScope::IP, "5.6.7.8", IP_POLICY, t0 + 10000).allowed);
    BOOST_CHECK(store.CheckAndIncrement(RateLimitScope::DEVICE, "1.2.3.4", IP_POLICY, t0 + 10000).allowed);

    BOOST_CHECK_EQUAL(store.Peek(RateLimitScope::IP, "1.2.3.4", IP_POLICY.windowMs, t0 + 20000), 4u);
    BOOST_CHECK_EQUAL(store.Peek(RateLimitScope::IP, "9.9.9.9", IP_POLICY.windowMs, t0 + 20000), 0u);

    // Next window resets
    RateLimitDecision next = store.CheckAndIncrement(RateLimitScope::IP, "1.2.3.4", IP_POLICY, t0 + 60000);
    BOOST_CHECK(next.allowed);
    BOOST_CHECK_EQUAL(next.count, 1u);
    BOOST_CHECK_EQUAL(next.windowStart, t0 + 60000);
    BOOST_CHECK_EQUAL(store.Peek(RateLimitScope::IP, "1.2.3.4", IP_POLICY.windowMs, t0 + 120000), 0u);
}

void CheckSweepAndEvict(RateLimitStore& store)
{
    const int64_t t0 = TEST_START_TIME_MS;

    store.CheckAndIncrement(RateLimitScope::IP, "a", IP_POLICY, t0);
    store.CheckAndIncrement(RateLimitScope::IP, "b", IP_POLICY, t0 + 90000);
    store.CheckAndIncrement(RateLimitScope::MERCHANT, "m", RateLimitPolicy(10, 300000), t0);
    BOOST_CHECK_EQUAL(store.Size(), 3u);

    // "a" idle for two windows, "b" and the merchant window are not
    BOOST_CHECK_EQUAL(store.Sweep(t0 + 120000), 1u);
    BOOST_CHECK_EQUAL(store.Size(), 2u);
    BOOST_CHECK_EQUAL(store.Peek(RateLimitScope::IP, "a", IP_POLICY.windowMs, t0), 0u);

    store.Evict(RateLimitScope::MERCHANT, "m");
    BOOST_CHECK_EQUAL(store.Size(), 1u);
    BOOST_CHECK_EQUAL(store.Sweep(t0 + 90000 + 120000), 1u);
    BOOST_CHECK_EQUAL(store.Size(), 0u);
}

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(rate_limiter_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(window_start_alignment)
{
    BOOST_CHECK_EQUAL(WindowStartFor(125000, 60000), 120000);
    BOOST_CHECK_EQUAL(WindowStartFor(120000, 60000), 120000);
    BOOST_CHECK_EQUAL(WindowStartFor(59999, 60000), 0);
    BOOST_CHECK_EQUAL(WindowStartFor(-1, 60000), -60000);
    BOOST_CHECK_EQUAL(WindowStartFor(777, 0), 777);
}

BOOST_AUTO_TEST_CASE(decide_window)
{
    RateLimitDecision ok = DecideWindow(3, IP_POLICY, 0, 1000);
    BOOST_CHECK(ok.allowed);

    RateLimitDecision no = DecideWindow(4, IP_POLICY, 0, 59500);
    BOOST_CHECK(!no.allowed);
    BOOST_CHECK_EQUAL(no.retryAfterMs, 500);
    // Rounded up, never zero
    BOOST_CHECK_EQUAL(no.RetryAfterSeconds(), 1);
}

BOOST_AUTO_TEST_CASE(scope_names)
{
    BOOST_CHECK_EQUAL(RateLimitScopeToString(RateLimitScope::IP), "ip");
    BOOST_CHECK_EQUAL(RateLimitScopeToString(RateLimitScope::DEVICE), "device");
    BOOST_CHECK_EQUAL(RateLimitScopeToString(RateLimitScope::MERCHANT), "merchant");
}

BOOST_AUTO_TEST_CASE(memory_store_fixed_window)
{
    MemoryRateLimitStore store;
    CheckFixedWindow(store);
}

BOOST_AUTO_TEST_CASE(memory_store_sweep_and_evict)
{
    MemoryRateLimitStore store;
    CheckSweepAndEvict(store);
}

BOOST_AUTO_TEST_CASE(memory_store_policy_change_resets_window)
{
    MemoryRateLimitStore store;
    const int64_t t0 = TEST_START_TIME_MS;
    store.CheckAndIncrement(RateLimitScope::IP, "k", IP_POLICY, t0);
    store.CheckAndIncrement(RateLimitScope::IP, "k", IP_POLICY, t0);
    RateLimitDecision d = store.CheckAndIncrement(RateLimitScope::IP, "k", RateLimitPolicy(3, 600000), t0);
    BOOST_CHECK_EQUAL(d.count, 1u);
}

BOOST_AUTO_TEST_CASE(memory_store_concurrent_increments)
{
    MemoryRateLimitStore store;
    const RateLimitPolicy policy(50, 60000);
    std::atomic<int> allowed(0);

    boost::thread_group threads;
    for (int t = 0; t < 8; ++t) {
        threads.create_thread([&store, &policy, &allowed] {
            for (int i = 0; i < 25; ++i) {
                if (store.CheckAndIncrement(RateLimitScope::IP, "shared", policy, TEST_START_TIME_MS).allowed) {
                    allowed++;
                }
            }
        });
    }
    threads.join_all();

    // Exactly the limit gets through, however the threads interleave
    BOOST_CHECK_EQUAL(allowed.load(), 50);
    BOOST_CHECK_EQUAL(store.Peek(RateLimitScope::IP, "shared", policy.windowMs, TEST_START_TIME_MS), 200u);
}

BOOST_AUTO_TEST_CASE(db_store_fixed_window)
{
    FraudDB db;
    BOOST_REQUIRE(db.Open(":memory:"));
    DBRateLimitStore store(db);
    CheckFixedWindow(store);
}

BOOST_AUTO_TEST_CASE(db_store_sweep_and_evict)
{
    FraudDB db;
    BOOST_REQUIRE(db.Open(":memory:"));
    DBRateLimitStore store(db);
    CheckSweepAndEvict(store);
}

BOOST_AUTO_TEST_SUITE_END()
