// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <httpserver/fraud_rest.h>

#include <fraud/alert_broadcaster.h>
#include <fraud/fraud_db.h>
#include <fraud/threat_cluster_engine.h>
#include <guard/giftcard_store.h>
#include <guard/redemption_guard.h>
#include <guard/replay_guard.h>
#include <test/test_giftguard.h>
#include <util.h>

#include <univalue.h>

#include <boost/test/unit_test.hpp>

#include <memory>

using namespace giftguard;

namespace {

struct RESTTestingSetup : public BasicTestingSetup {
    FraudDB db;
    MemoryRateLimitStore rateStore;
    ReplayGuard replay;
    MemoryGiftCardStore cards;
    AlertBroadcaster broadcaster;
    std::unique_ptr<RedemptionGuard> guard;
    std::unique_ptr<ThreatClusterEngine> engine;
    FraudRESTContext context;

    RESTTestingSetup() : replay(30000, &db)
    {
        BOOST_REQUIRE(db.Open(":memory:"));
        guard.reset(new RedemptionGuard(GuardPolicy(), rateStore, replay, cards, db, &broadcaster));
        engine.reset(new ThreatClusterEngine(ClusterEngineConfig(), db, db, &broadcaster));

        context.guard = guard.get();
        context.logStore = &db;
        context.clusterStore = &db;
        context.engine = engine.get();
        context.broadcaster = &broadcaster;
    }

    static APIRequest MakeRequest(const std::string& method, const std::string& path,
                                  const std::string& body = "", bool admin = false)
    {
        APIRequest request;
        request.method = method;
        request.path = path;
        request.body = body;
        request.metadata.peerAddress = "10.0.0.1:40000";
        request.metadata.headers["User-Agent"] = "Mozilla/5.0 (X11; Linux x86_64) Firefox/120.0";
        request.identity.isAdmin = admin;
        return request;
    }

    APIReply Admin(const std::string& method, const std::string& path,
                   const std::map<std::string, std::string>& query = {})
    {
        APIRequest request = MakeRequest(method, path, "", true);
        request.query = query;
        return HandleAPIRequest(context, request);
    }
};

UniValue ParseReply(const APIReply& reply)
{
    UniValue value;
    BOOST_REQUIRE(value.read(reply.body));
    BOOST_REQUIRE(value.isObject());
    return value;
}

void CheckError(const APIReply& reply, int status, const std::string& message)
{
    BOOST_CHECK_EQUAL(reply.status, status);
    UniValue value = ParseReply(reply);
    BOOST_CHECK(!value["success"].get_bool());
    BOOST_CHECK_EQUAL(value["error"].get_str(), message);
}

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(fraud_rest_tests, RESTTestingSetup)

BOOST_AUTO_TEST_CASE(query_string)
{
    std::map<std::string, std::string> query = ParseQueryString("limit=10&session=3&name=a%20b&limit=99&&flag");
    BOOST_CHECK_EQUAL(query.size(), 4u);
    BOOST_CHECK_EQUAL(query["limit"], "10");
    BOOST_CHECK_EQUAL(query["session"], "3");
    BOOST_CHECK_EQUAL(query["name"], "a b");
    BOOST_CHECK_EQUAL(query["flag"], "");
    BOOST_CHECK(ParseQueryString("").empty());
}

BOOST_AUTO_TEST_CASE(secret_equals)
{
    BOOST_CHECK(SecretEquals("s3cret", "s3cret"));
    BOOST_CHECK(!SecretEquals("s3cret", "s3creT"));
    BOOST_CHECK(!SecretEquals("s3cret", "s3cret!"));
    BOOST_CHECK(SecretEquals("", ""));
}

BOOST_AUTO_TEST_CASE(redeem_success)
{
    cards.AddCard("GAN-REST-1", 4200);
    APIReply reply = HandleAPIRequest(context,
        MakeRequest("POST", "/redeem", "{\"code\":\"GAN-REST-1\",\"redeemedBy\":\"alice\",\"merchantId\":\"m-1\"}"));
    BOOST_CHECK_EQUAL(reply.status, 200);
    BOOST_CHECK_EQUAL(reply.headers["Content-Type"], "application/json");
    UniValue value = ParseReply(reply);
    BOOST_CHECK(value["success"].get_bool());
    BOOST_CHECK_EQUAL(value["amount"].get_int64(), 4200);

    MemoryGiftCardStore::Card card;
    BOOST_REQUIRE(cards.GetCard("GAN-REST-1", card));
    BOOST_CHECK_EQUAL(card.redeemedBy, "alice");
}

BOOST_AUTO_TEST_CASE(redeem_validation)
{
    CheckError(HandleAPIRequest(context, MakeRequest("GET", "/redeem")), 405, "Only POST requests allowed");
    CheckError(HandleAPIRequest(context, MakeRequest("POST", "/redeem", "not json")), 400, "Invalid request body");
    CheckError(HandleAPIRequest(context, MakeRequest("POST", "/redeem", "[1,2]")), 400, "Invalid request body");
    CheckError(HandleAPIRequest(context, MakeRequest("POST", "/redeem", "{\"code\":\"GAN-1\"}")),
               400, "code and redeemedBy are required");
    CheckError(HandleAPIRequest(context, MakeRequest("POST", "/redeem", "{\"code\":\"\",\"redeemedBy\":\"bob\"}")),
               400, "code and redeemedBy are required");
    CheckError(HandleAPIRequest(context,
                   MakeRequest("POST", "/redeem", "{\"code\":\"GAN-1\",\"redeemedBy\":\"bob\",\"merchantId\":7}")),
               400, "merchantId must be a string");
    CheckError(HandleAPIRequest(context,
                   MakeRequest("POST", "/redeem", "{\"code\":\"GAN-1\",\"redeemedBy\":\"bob\",\"amount\":-5}")),
               400, "amount must not be negative");
    CheckError(HandleAPIRequest(context,
                   MakeRequest("POST", "/redeem", "{\"code\":\"GAN-1\",\"redeemedBy\":\"bob\",\"amount\":\"ten\"}")),
               400, "amount must be an integer number of cents");

    // Malformed requests never reach the guard
    BOOST_CHECK_EQUAL(db.CountFraudLogs(), 0);
    BOOST_CHECK_EQUAL(rateStore.Size(), 0u);
}

BOOST_AUTO_TEST_CASE(redeem_denials)
{
    const std::string body = "{\"code\":\"WRONG\",\"redeemedBy\":\"mallory\"}";
    for (int i = 0; i < 3; ++i) {
        CheckError(HandleAPIRequest(context, MakeRequest("POST", "/redeem", body)), 404, MSG_NOT_FOUND);
    }

    APIReply reply = HandleAPIRequest(context, MakeRequest("POST", "/redeem", body));
    CheckError(reply, 429, MSG_TOO_MANY_ATTEMPTS);
    BOOST_CHECK_EQUAL(reply.headers["Retry-After"], "60");

    cards.AddCard("GAN-TWICE", 100);
    APIRequest first = MakeRequest("POST", "/redeem", "{\"code\":\"GAN-TWICE\",\"redeemedBy\":\"carol\"}");
    first.metadata.peerAddress = "10.0.0.2:1";
    BOOST_CHECK_EQUAL(HandleAPIRequest(context, first).status, 200);
    APIRequest second = first;
    second.metadata.peerAddress = "10.0.0.3:1";
    APIReply replay = HandleAPIRequest(context, second);
    CheckError(replay, 403, MSG_ALREADY_REDEEMED);
    BOOST_CHECK_EQUAL(replay.headers.count("Retry-After"), 0u);
}

BOOST_AUTO_TEST_CASE(missing_component_is_unavailable)
{
    FraudRESTContext empty;
    CheckError(HandleAPIRequest(empty, MakeRequest("POST", "/redeem", "{}")), 503, "Service not available");
    CheckError(HandleAPIRequest(empty, MakeRequest("GET", "/admin/fraud-logs", "", true)), 503, "Service not available");
}

BOOST_AUTO_TEST_CASE(fraud_alert_webhook)
{
    uint64_t session = broadcaster.Subscribe("127.0.0.1");

    APIReply reply = HandleAPIRequest(context, MakeRequest("POST", "/webhooks/fraud-alert",
        "{\"gan\":\"GAN-987654\",\"ip\":\"203.0.113.9\",\"reason\":\"reused_code\",\"merchantId\":\"m-2\","
        "\"timestamp\":\"1699999000000\"}"));
    BOOST_CHECK_EQUAL(reply.status, 200);
    UniValue value = ParseReply(reply);
    BOOST_CHECK(value["success"].get_bool());
    BOOST_CHECK_EQUAL(value["message"].get_str(), "Fraud alert processed");
    const int64_t id = value["id"].get_int64();
    BOOST_CHECK(id > 0);

    std::vector<FraudLog> logs = db.GetRecent(1);
    BOOST_REQUIRE_EQUAL(logs.size(), 1u);
    BOOST_CHECK_EQUAL(logs[0].id, id);
    BOOST_CHECK_EQUAL(logs[0].ipAddress, "203.0.113.9");
    BOOST_CHECK_EQUAL(logs[0].codeAttempted, "GAN-****");
    BOOST_CHECK_EQUAL(logs[0].merchantId, "m-2");
    BOOST_CHECK_EQUAL(logs[0].timestamp, 1699999000000LL);
    BOOST_CHECK_EQUAL(logs[0].source, FRAUD_SOURCE_WEBHOOK);
    BOOST_CHECK(logs[0].failureReason == FailureReason::REUSED_CODE);
    BOOST_CHECK(logs[0].severity == FraudSeverity::HIGH);
    BOOST_CHECK(!logs[0].blocked);

    // Unknown reasons are kept as suspicious activity
    reply = HandleAPIRequest(context, MakeRequest("POST", "/webhooks/fraud-alert",
        "{\"gan\":\"GAN-1\",\"ip\":\"203.0.113.10\",\"reason\":\"card_testing\"}"));
    BOOST_CHECK_EQUAL(reply.status, 200);
    logs = db.GetRecent(1);
    BOOST_CHECK(logs[0].failureReason == FailureReason::SUSPICIOUS_ACTIVITY);
    BOOST_CHECK(logs[0].severity == FraudSeverity::MEDIUM);
    BOOST_CHECK_EQUAL(logs[0].timestamp, TEST_START_TIME_MS);

    BOOST_CHECK_EQUAL(broadcaster.Drain(session).size(), 2u);
}

BOOST_AUTO_TEST_CASE(malformed_webhook_is_logged)
{
    CheckError(HandleAPIRequest(context, MakeRequest("POST", "/webhooks/fraud-alert", "{\"gan\":\"GAN-1\"}")),
               400, "gan, ip and reason are required");
    CheckError(HandleAPIRequest(context, MakeRequest("POST", "/webhooks/fraud-alert",
                   "{\"gan\":\"GAN-1\",\"ip\":\"1.2.3.4\",\"reason\":\"invalid_code\",\"timestamp\":\"soon\"}")),
               400, "gan, ip and reason are required");

    std::vector<FraudLog> logs = db.GetRecent(10);
    BOOST_REQUIRE_EQUAL(logs.size(), 2u);
    for (const FraudLog& log : logs) {
        BOOST_CHECK(log.failureReason == FailureReason::SYSTEM_ERROR);
        BOOST_CHECK(log.severity == FraudSeverity::LOW);
        // Attributed to the caller
        BOOST_CHECK_EQUAL(log.ipAddress, "10.0.0.1");
    }

    CheckError(HandleAPIRequest(context, MakeRequest("GET", "/webhooks/fraud-alert")), 405, "Only POST requests allowed");
}

BOOST_AUTO_TEST_CASE(admin_requires_identity)
{
    CheckError(HandleAPIRequest(context, MakeRequest("GET", "/admin/fraud-logs")), 403, "Admin access required");
    CheckError(HandleAPIRequest(context, MakeRequest("POST", "/admin/threat-analysis/trigger")), 403,
               "Admin access required");
    CheckError(HandleAPIRequest(context, MakeRequest("GET", "/admin/stream")), 403, "Admin access required");
    BOOST_CHECK_EQUAL(broadcaster.GetSubscriberCount(), 0u);

    CheckError(HandleAPIRequest(context, MakeRequest("GET", "/nowhere")), 404, "Not found");
    CheckError(Admin("GET", "/admin/nowhere"), 404, "Not found");
    CheckError(Admin("POST", "/admin/fraud-logs"), 405, "Only GET requests allowed");
}

BOOST_AUTO_TEST_CASE(fraud_logs_endpoint)
{
    for (int i = 0; i < 5; ++i) {
        FraudLog log;
        log.ipAddress = strprintf("10.1.0.%d", i);
        log.failureReason = FailureReason::INVALID_CODE;
        log.timestamp = TEST_START_TIME_MS - 1000 + i;
        db.Append(log);
    }

    UniValue value = ParseReply(Admin("GET", "/admin/fraud-logs", {{"limit", "2"}}));
    BOOST_CHECK(value["success"].get_bool());
    const UniValue& logs = value["logs"];
    BOOST_REQUIRE_EQUAL(logs.size(), 2u);
    BOOST_CHECK_EQUAL(logs[0]["ipAddress"].get_str(), "10.1.0.4");
    BOOST_CHECK_EQUAL(logs[0]["failureReason"].get_str(), "invalid_code");
    BOOST_CHECK(logs[0]["blocked"].get_bool());

    // Clamped, not rejected
    BOOST_CHECK_EQUAL(ParseReply(Admin("GET", "/admin/fraud-logs", {{"limit", "0"}}))["logs"].size(), 1u);
    BOOST_CHECK_EQUAL(ParseReply(Admin("GET", "/admin/fraud-logs", {{"limit", "100000"}}))["logs"].size(), 5u);
    BOOST_CHECK_EQUAL(ParseReply(Admin("GET", "/admin/fraud-logs"))["logs"].size(), 5u);
    CheckError(Admin("GET", "/admin/fraud-logs", {{"limit", "ten"}}), 400, "Invalid limit");
}

BOOST_AUTO_TEST_CASE(fraud_statistics_endpoint)
{
    FraudLog log;
    log.ipAddress = "10.2.0.1";
    log.failureReason = FailureReason::IP_RATE_LIMIT;
    log.timestamp = TEST_START_TIME_MS - 1000;
    db.Append(log);
    log.blocked = false;
    db.Append(log);

    UniValue value = ParseReply(Admin("GET", "/admin/fraud-statistics"));
    const UniValue& stats = value["statistics"];
    BOOST_CHECK_EQUAL(stats["totalAttempts"].get_int64(), 2);
    BOOST_CHECK_EQUAL(stats["blockedAttempts"].get_int64(), 1);
    BOOST_CHECK_CLOSE(stats["blockRate"].get_real(), 0.5, 0.0001);
    BOOST_CHECK_EQUAL(stats["last24Hours"].get_int64(), 2);
    BOOST_CHECK_EQUAL(stats["uniqueIPs"].get_int64(), 1);
    BOOST_REQUIRE_EQUAL(stats["topReasons"].size(), 1u);
    BOOST_CHECK_EQUAL(stats["topReasons"][0]["reason"].get_str(), "ip_rate_limit");
    BOOST_CHECK_EQUAL(stats["topReasons"][0]["count"].get_int64(), 2);
    BOOST_CHECK_EQUAL(stats["hourly"].size(), 24u);
}

BOOST_AUTO_TEST_CASE(trigger_and_inspect_clusters)
{
    for (int i = 0; i < 3; ++i) {
        FraudLog log;
        log.ipAddress = "10.3.0.1";
        log.failureReason = FailureReason::INVALID_CODE;
        log.severity = FraudSeverity::MEDIUM;
        log.timestamp = TEST_START_TIME_MS - (6 - 2 * i) * 60 * 1000;
        db.Append(log);
    }

    CheckError(Admin("GET", "/admin/threat-analysis/trigger"), 405, "Only POST requests allowed");

    UniValue value = ParseReply(Admin("POST", "/admin/threat-analysis/trigger"));
    BOOST_CHECK(value["success"].get_bool());
    const UniValue& result = value["result"];
    BOOST_CHECK_EQUAL(result["clustersFound"].get_int64(), 1);
    BOOST_CHECK_EQUAL(result["threatsAnalyzed"].get_int64(), 3);
    BOOST_CHECK_EQUAL(result["clustersCreated"].get_int64(), 1);
    BOOST_CHECK(!result["aborted"].get_bool());

    value = ParseReply(Admin("GET", "/admin/fraud-clusters"));
    const UniValue& clusters = value["clusters"];
    BOOST_REQUIRE_EQUAL(clusters.size(), 1u);
    BOOST_CHECK_EQUAL(clusters[0]["patternType"].get_str(), "ip_based");
    BOOST_CHECK_EQUAL(clusters[0]["threatCount"].get_int64(), 3);
    BOOST_CHECK_EQUAL(clusters[0]["metadata"]["uniqueIPs"].get_int64(), 1);
    BOOST_CHECK_EQUAL(value["stats"]["totalClusters"].get_int64(), 1);
    BOOST_CHECK_EQUAL(value["stats"]["byPatternType"]["ip_based"].get_int64(), 1);
    BOOST_CHECK_EQUAL(value["stats"]["bySeverity"]["3"].get_int64(), 1);

    const int64_t id = clusters[0]["id"].get_int64();
    value = ParseReply(Admin("GET", strprintf("/admin/fraud-clusters/%d", id)));
    BOOST_CHECK_EQUAL(value["cluster"]["id"].get_int64(), id);
    BOOST_CHECK_EQUAL(value["patterns"].size(), 3u);
    BOOST_CHECK_EQUAL(value["patterns"][0]["metadata"]["reason"].get_str(), "invalid_code");

    CheckError(Admin("GET", strprintf("/admin/fraud-clusters/%d", id + 1)), 404, "Cluster not found");
    CheckError(Admin("GET", "/admin/fraud-clusters/abc"), 400, "Invalid cluster id");
    CheckError(Admin("GET", "/admin/fraud-clusters/-1"), 400, "Invalid cluster id");
}

BOOST_AUTO_TEST_CASE(monitoring_stream)
{
    UniValue opened = ParseReply(Admin("GET", "/admin/stream"));
    BOOST_CHECK(opened["success"].get_bool());
    const int64_t session = opened["session"].get_int64();
    BOOST_CHECK(session > 0);
    BOOST_CHECK_EQUAL(opened["events"].size(), 0u);

    cards.AddCard("GAN-STREAM", 300);
    BOOST_CHECK_EQUAL(HandleAPIRequest(context,
        MakeRequest("POST", "/redeem", "{\"code\":\"GAN-STREAM\",\"redeemedBy\":\"dave\"}")).status, 200);

    const std::string sessionStr = strprintf("%d", session);
    UniValue events = ParseReply(Admin("GET", "/admin/events", {{"session", sessionStr}}));
    BOOST_REQUIRE_EQUAL(events["events"].size(), 1u);
    BOOST_CHECK_EQUAL(events["events"][0]["event"].get_str(), "transaction-feed");
    BOOST_CHECK_EQUAL(events["events"][0]["data"]["amount"].get_int64(), 300);
    BOOST_CHECK_EQUAL(ParseReply(Admin("GET", "/admin/events", {{"session", sessionStr}}))["events"].size(), 0u);

    CheckError(Admin("GET", "/admin/events"), 400, "Invalid session");
    CheckError(Admin("GET", "/admin/events", {{"session", "999"}}), 404, "Session not found");

    BOOST_CHECK_EQUAL(Admin("DELETE", "/admin/stream", {{"session", sessionStr}}).status, 200);
    CheckError(Admin("DELETE", "/admin/stream", {{"session", sessionStr}}), 404, "Session not found");
    CheckError(Admin("GET", "/admin/events", {{"session", sessionStr}}), 404, "Session not found");
    CheckError(Admin("POST", "/admin/stream"), 405, "Only GET and DELETE requests allowed");
}

BOOST_AUTO_TEST_CASE(storage_failure_is_internal_error)
{
    db.Close();
    CheckError(Admin("GET", "/admin/fraud-logs"), 500, "Internal error");
}

BOOST_AUTO_TEST_SUITE_END()
