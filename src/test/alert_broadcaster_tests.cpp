// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fraud/alert_broadcaster.h>
#include <fraud/fraud_cluster.h>
#include <fraud/fraud_log.h>
#include <test/test_giftguard.h>
#include <utiltime.h>

#include <boost/test/unit_test.hpp>

#include <vector>

using namespace giftguard;

BOOST_FIXTURE_TEST_SUITE(alert_broadcaster_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(event_json)
{
    AlertEvent event(AlertEventType::TRANSACTION_FEED, "{\"amount\":5}", 1234);
    BOOST_CHECK_EQUAL(event.ToJSON(), "{\"event\":\"transaction-feed\",\"timestamp\":1234,\"data\":{\"amount\":5}}");

    AlertEvent empty(AlertEventType::FRAUD_CLUSTER, "", 1);
    BOOST_CHECK_EQUAL(empty.ToJSON(), "{\"event\":\"fraud-cluster\",\"timestamp\":1,\"data\":{}}");

    BOOST_CHECK_EQUAL(AlertEventTypeToString(AlertEventType::FRAUD_ALERT), "fraud-alert");
}

BOOST_AUTO_TEST_CASE(subscribe_and_drain)
{
    AlertBroadcaster broadcaster;
    std::vector<uint64_t> opened;
    std::vector<uint64_t> closed;
    broadcaster.OnSubscribe([&opened](uint64_t id) { opened.push_back(id); });
    broadcaster.OnUnsubscribe([&closed](uint64_t id) { closed.push_back(id); });

    uint64_t a = broadcaster.Subscribe("127.0.0.1:5000");
    uint64_t b = broadcaster.Subscribe("127.0.0.1:5001");
    BOOST_CHECK_EQUAL(a, 1u);
    BOOST_CHECK_EQUAL(b, 2u);
    BOOST_CHECK_EQUAL(broadcaster.GetSubscriberCount(), 2u);
    BOOST_CHECK_EQUAL(opened.size(), 2u);

    std::vector<AlertSession> sessions = broadcaster.GetSessions();
    BOOST_REQUIRE_EQUAL(sessions.size(), 2u);
    BOOST_CHECK_EQUAL(sessions[0].remoteAddr, "127.0.0.1:5000");
    BOOST_CHECK_EQUAL(sessions[0].connectedAt, TEST_START_TIME_MS);

    broadcaster.PublishTransaction("GAN-****", "merchant-1", 2500, TEST_START_TIME_MS);

    std::vector<AlertEvent> events = broadcaster.Drain(a);
    BOOST_REQUIRE_EQUAL(events.size(), 1u);
    BOOST_CHECK_EQUAL(events[0].payload, "{\"code\":\"GAN-****\",\"merchantId\":\"merchant-1\",\"amount\":2500}");
    BOOST_CHECK(broadcaster.Drain(a).empty());

    // Every session gets its own copy
    BOOST_CHECK_EQUAL(broadcaster.Drain(b).size(), 1u);

    BOOST_CHECK(broadcaster.Unsubscribe(a));
    BOOST_CHECK(!broadcaster.Unsubscribe(a));
    BOOST_CHECK(!broadcaster.HasSession(a));
    BOOST_CHECK(broadcaster.HasSession(b));
    BOOST_CHECK(broadcaster.Drain(a).empty());
    BOOST_REQUIRE_EQUAL(closed.size(), 1u);
    BOOST_CHECK_EQUAL(closed[0], a);
}

BOOST_AUTO_TEST_CASE(idle_sessions_expire)
{
    AlertBroadcaster broadcaster;
    std::vector<uint64_t> closed;
    broadcaster.OnUnsubscribe([&closed](uint64_t id) { closed.push_back(id); });

    uint64_t abandoned = broadcaster.Subscribe("127.0.0.1:5000");
    uint64_t polling = broadcaster.Subscribe("127.0.0.1:5001");
    BOOST_CHECK_EQUAL(broadcaster.GetSessions()[0].lastSeenAt, TEST_START_TIME_MS);

    AdvanceTimeMillis(4 * 60 * 1000);
    broadcaster.Drain(polling);
    broadcaster.PublishTransaction("GAN-****", "", 100, GetTimeMillis());

    AdvanceTimeMillis(60 * 1000);
    BOOST_CHECK_EQUAL(broadcaster.ExpireIdleSessions(GetTimeMillis(), DEFAULT_ALERT_SESSION_TIMEOUT_MS), 1u);
    BOOST_CHECK(!broadcaster.HasSession(abandoned));
    BOOST_CHECK(broadcaster.HasSession(polling));
    BOOST_REQUIRE_EQUAL(closed.size(), 1u);
    BOOST_CHECK_EQUAL(closed[0], abandoned);

    // Publishing only reaches the live session
    BOOST_CHECK_EQUAL(broadcaster.Drain(polling).size(), 1u);
    BOOST_CHECK_EQUAL(broadcaster.ExpireIdleSessions(GetTimeMillis(), DEFAULT_ALERT_SESSION_TIMEOUT_MS), 0u);

    AdvanceTimeMillis(DEFAULT_ALERT_SESSION_TIMEOUT_MS);
    BOOST_CHECK_EQUAL(broadcaster.ExpireIdleSessions(GetTimeMillis(), DEFAULT_ALERT_SESSION_TIMEOUT_MS), 1u);
    BOOST_CHECK_EQUAL(broadcaster.GetSubscriberCount(), 0u);
}

BOOST_AUTO_TEST_CASE(no_subscribers)
{
    AlertBroadcaster broadcaster;
    FraudLog log;
    log.ipAddress = "10.0.0.1";
    broadcaster.PublishFraudAlert(log);
    BOOST_CHECK_EQUAL(broadcaster.GetSubscriberCount(), 0u);

    // Late subscribers see nothing from before
    uint64_t id = broadcaster.Subscribe("127.0.0.1");
    BOOST_CHECK(broadcaster.Drain(id).empty());
}

BOOST_AUTO_TEST_CASE(bounded_queue_drops_oldest)
{
    AlertBroadcaster broadcaster(3);
    BOOST_CHECK_EQUAL(broadcaster.GetMaxQueueSize(), 3u);
    uint64_t id = broadcaster.Subscribe("127.0.0.1");

    for (int i = 0; i < 5; ++i) {
        broadcaster.Publish(AlertEvent(AlertEventType::FRAUD_ALERT, "{}", i));
    }

    std::vector<AlertEvent> events = broadcaster.Drain(id);
    BOOST_REQUIRE_EQUAL(events.size(), 3u);
    BOOST_CHECK_EQUAL(events[0].timestamp, 2);
    BOOST_CHECK_EQUAL(events[2].timestamp, 4);
    BOOST_CHECK_EQUAL(broadcaster.GetSessions().at(0).dropped, 2u);
}

BOOST_AUTO_TEST_CASE(fraud_alert_payload)
{
    AlertBroadcaster broadcaster;
    uint64_t id = broadcaster.Subscribe("127.0.0.1");

    FraudLog log;
    log.id = 17;
    log.ipAddress = "10.0.0.1";
    log.deviceFingerprint = "dev \"quoted\"";
    log.codeAttempted = "GAN-****";
    log.failureReason = FailureReason::REUSED_CODE;
    log.severity = FraudSeverity::HIGH;
    log.timestamp = TEST_START_TIME_MS;
    broadcaster.PublishFraudAlert(log);

    std::vector<AlertEvent> events = broadcaster.Drain(id);
    BOOST_REQUIRE_EQUAL(events.size(), 1u);
    BOOST_CHECK(events[0].type == AlertEventType::FRAUD_ALERT);
    BOOST_CHECK_EQUAL(events[0].timestamp, TEST_START_TIME_MS);
    const std::string& payload = events[0].payload;
    BOOST_CHECK(payload.find("\"id\":17") != std::string::npos);
    BOOST_CHECK(payload.find("\"deviceFingerprint\":\"dev \\\"quoted\\\"\"") != std::string::npos);
    BOOST_CHECK(payload.find("\"failureReason\":\"reused_code\"") != std::string::npos);
    BOOST_CHECK(payload.find("\"severity\":\"high\"") != std::string::npos);
    BOOST_CHECK(payload.find("\"blocked\":true") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(cluster_payload)
{
    AlertBroadcaster broadcaster;
    uint64_t id = broadcaster.Subscribe("127.0.0.1");

    FraudCluster cluster;
    cluster.id = 3;
    cluster.label = "IP 10.0.0.1 (3 threats)";
    cluster.score = 6.5;
    cluster.severity = 3;
    cluster.threatCount = 3;
    cluster.updatedAt = TEST_START_TIME_MS;
    broadcaster.PublishCluster(cluster, true);

    std::vector<AlertEvent> events = broadcaster.Drain(id);
    BOOST_REQUIRE_EQUAL(events.size(), 1u);
    BOOST_CHECK(events[0].type == AlertEventType::FRAUD_CLUSTER);
    BOOST_CHECK(events[0].payload.find("\"score\":6.50") != std::string::npos);
    BOOST_CHECK(events[0].payload.find("\"created\":true") != std::string::npos);
    BOOST_CHECK(events[0].payload.find("\"patternType\":\"ip_based\"") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
