// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fraud/fraud_db.h>
#include <guard/replay_guard.h>
#include <test/test_giftguard.h>

#include <boost/test/unit_test.hpp>
#include <boost/thread.hpp>

#include <atomic>
#include <stdexcept>

using namespace giftguard;

namespace {

/** Store whose writes always fail */
class FailingCodeStore : public RedeemedCodeStore {
public:
    void StoreRedeemedCode(const std::string&, int64_t) override { throw std::runtime_error("disk full"); }
    std::vector<std::string> LoadRedeemedCodes() override { return {}; }
};

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(replay_guard_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(reserve_release_commit)
{
    ReplayGuard guard(30000);
    const int64_t t0 = TEST_START_TIME_MS;

    BOOST_CHECK(guard.Reserve("GAN-1", t0) == ReserveResult::RESERVED);
    BOOST_CHECK(guard.IsReserved("GAN-1", t0 + 1));
    BOOST_CHECK(guard.Reserve("GAN-1", t0 + 1) == ReserveResult::ALREADY_RESERVED);

    BOOST_CHECK(guard.Release("GAN-1"));
    BOOST_CHECK(!guard.Release("GAN-1"));
    BOOST_CHECK(guard.Reserve("GAN-1", t0 + 2) == ReserveResult::RESERVED);

    BOOST_CHECK(guard.Commit("GAN-1", t0 + 3));
    BOOST_CHECK(guard.IsCommitted("GAN-1"));
    BOOST_CHECK(!guard.IsReserved("GAN-1", t0 + 3));
    BOOST_CHECK_EQUAL(guard.GetReservationCount(), 0u);
    BOOST_CHECK_EQUAL(guard.GetCommittedCount(), 1u);

    // Committed codes are denied forever, also long after the timeout
    BOOST_CHECK(guard.Reserve("GAN-1", t0 + 86400000) == ReserveResult::ALREADY_REDEEMED);
}

BOOST_AUTO_TEST_CASE(codes_are_trimmed)
{
    ReplayGuard guard;
    BOOST_CHECK(guard.Reserve("  GAN-2 ", TEST_START_TIME_MS) == ReserveResult::RESERVED);
    BOOST_CHECK(guard.Reserve("GAN-2", TEST_START_TIME_MS) == ReserveResult::ALREADY_RESERVED);
    BOOST_CHECK_EQUAL(RedemptionCodeDigest(" GAN-2"), RedemptionCodeDigest("GAN-2"));
    BOOST_CHECK(RedemptionCodeDigest("GAN-2") != RedemptionCodeDigest("GAN-3"));
}

BOOST_AUTO_TEST_CASE(reservation_expires)
{
    ReplayGuard guard(1000);
    const int64_t t0 = TEST_START_TIME_MS;
    BOOST_CHECK_EQUAL(guard.GetReservationTimeout(), 1000);

    BOOST_CHECK(guard.Reserve("GAN-3", t0) == ReserveResult::RESERVED);
    BOOST_CHECK(guard.Reserve("GAN-3", t0 + 999) == ReserveResult::ALREADY_RESERVED);
    // An expired reservation can be taken over
    BOOST_CHECK(guard.Reserve("GAN-3", t0 + 1000) == ReserveResult::RESERVED);

    BOOST_CHECK(guard.Reserve("GAN-4", t0) == ReserveResult::RESERVED);
    BOOST_CHECK_EQUAL(guard.Sweep(t0 + 1500), 1u);
    BOOST_CHECK_EQUAL(guard.GetReservationCount(), 1u);
    BOOST_CHECK_EQUAL(guard.Sweep(t0 + 2000), 1u);
    BOOST_CHECK_EQUAL(guard.GetReservationCount(), 0u);
}

BOOST_AUTO_TEST_CASE(single_winner_under_contention)
{
    ReplayGuard guard;
    std::atomic<int> winners(0);

    boost::thread_group threads;
    for (int t = 0; t < 16; ++t) {
        threads.create_thread([&guard, &winners] {
            if (guard.Reserve("GAN-RACE", TEST_START_TIME_MS) == ReserveResult::RESERVED) {
                winners++;
            }
        });
    }
    threads.join_all();

    BOOST_CHECK_EQUAL(winners.load(), 1);
}

BOOST_AUTO_TEST_CASE(committed_codes_survive_restart)
{
    FraudDB db;
    BOOST_REQUIRE(db.Open(":memory:"));

    {
        ReplayGuard guard(30000, &db);
        BOOST_CHECK(guard.Reserve("GAN-5", TEST_START_TIME_MS) == ReserveResult::RESERVED);
        BOOST_CHECK(guard.Commit("GAN-5", TEST_START_TIME_MS));
        // Committing twice does not write twice
        BOOST_CHECK(guard.Commit("GAN-5", TEST_START_TIME_MS));
    }

    ReplayGuard restarted(30000, &db);
    BOOST_CHECK(!restarted.IsCommitted("GAN-5"));
    BOOST_CHECK_EQUAL(restarted.LoadCommitted(), 1u);
    BOOST_CHECK(restarted.IsCommitted("GAN-5"));
    BOOST_CHECK(restarted.Reserve("GAN-5", TEST_START_TIME_MS) == ReserveResult::ALREADY_REDEEMED);

    // Only digests are persisted
    std::vector<std::string> stored = db.LoadRedeemedCodes();
    BOOST_REQUIRE_EQUAL(stored.size(), 1u);
    BOOST_CHECK_EQUAL(stored[0], RedemptionCodeDigest("GAN-5"));
}

BOOST_AUTO_TEST_CASE(persist_failure_keeps_code_committed)
{
    FailingCodeStore store;
    ReplayGuard guard(30000, &store);
    BOOST_CHECK(guard.Reserve("GAN-6", TEST_START_TIME_MS) == ReserveResult::RESERVED);
    BOOST_CHECK(!guard.Commit("GAN-6", TEST_START_TIME_MS));
    BOOST_CHECK(guard.IsCommitted("GAN-6"));
    BOOST_CHECK(guard.Reserve("GAN-6", TEST_START_TIME_MS) == ReserveResult::ALREADY_REDEEMED);
}

BOOST_AUTO_TEST_SUITE_END()
