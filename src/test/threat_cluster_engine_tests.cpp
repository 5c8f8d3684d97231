// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fraud/alert_broadcaster.h>
#include <fraud/fraud_db.h>
#include <fraud/threat_cluster_engine.h>
#include <guard/fingerprint.h>
#include <test/test_giftguard.h>
#include <util.h>

#include <boost/test/unit_test.hpp>
#include <boost/thread.hpp>

using namespace giftguard;

namespace {

const std::string BROWSER_AGENT =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0 Safari/537.36";

const int64_t MINUTE = 60 * 1000;

FraudLog MakeLog(const std::string& ip, const std::string& device, const std::string& agent, int64_t timestamp,
                 FraudSeverity severity = FraudSeverity::MEDIUM)
{
    FraudLog log;
    log.ipAddress = ip;
    log.deviceFingerprint = device;
    log.userAgent = agent;
    log.failureReason = FailureReason::INVALID_CODE;
    log.severity = severity;
    log.timestamp = timestamp;
    return log;
}

/** Log store whose reads wait until the test opens the gate */
class GatedLogStore : public FraudLogStore {
public:
    explicit GatedLogStore(FraudLogStore& inner) : inner_(inner), entered_(false), open_(false) {}

    int64_t Append(const FraudLog& log) override { return inner_.Append(log); }
    std::vector<FraudLog> GetRecent(size_t limit) override { return inner_.GetRecent(limit); }
    FraudStatistics GetStatistics(int64_t nowMs) override { return inner_.GetStatistics(nowMs); }

    std::vector<FraudLogRow> ReadSince(int64_t sinceMs, size_t limit, int64_t timeoutMs) override
    {
        {
            boost::unique_lock<boost::mutex> lock(mutex_);
            entered_ = true;
            cond_.notify_all();
            cond_.wait(lock, [this]() { return open_; });
        }
        return inner_.ReadSince(sinceMs, limit, timeoutMs);
    }

    void WaitUntilEntered()
    {
        boost::unique_lock<boost::mutex> lock(mutex_);
        cond_.wait(lock, [this]() { return entered_; });
    }

    void Open()
    {
        boost::unique_lock<boost::mutex> lock(mutex_);
        open_ = true;
        cond_.notify_all();
    }

private:
    FraudLogStore& inner_;
    boost::mutex mutex_;
    boost::condition_variable cond_;
    bool entered_;
    bool open_;
};

struct ClusterTestingSetup : public BasicTestingSetup {
    FraudDB db;
    AlertBroadcaster broadcaster;
    ThreatClusterEngine engine;

    ClusterTestingSetup() : engine(ClusterEngineConfig(), db, db, &broadcaster)
    {
        BOOST_REQUIRE(db.Open(":memory:"));
    }

    int64_t Add(const FraudLog& log)
    {
        return db.Append(log);
    }
};

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(threat_cluster_engine_tests, ClusterTestingSetup)

BOOST_AUTO_TEST_CASE(normalize_user_agent)
{
    BOOST_CHECK_EQUAL(NormalizeUserAgent("Mozilla/5.0  (X11)  Firefox/120.0"), "mozilla/x (xx) firefox/x");
    BOOST_CHECK_EQUAL(NormalizeUserAgent("  Bot 1.2.3  "), "bot x");
    BOOST_CHECK_EQUAL(NormalizeUserAgent(""), "");
    // Version bumps land in the same group
    BOOST_CHECK_EQUAL(NormalizeUserAgent("Chrome/119.0.6045.105"), NormalizeUserAgent("chrome/120.0.6099.71"));
}

BOOST_AUTO_TEST_CASE(unusual_user_agent)
{
    BOOST_CHECK(IsUnusualUserAgent(""));
    BOOST_CHECK(IsUnusualUserAgent("curl/8.4.0"));
    BOOST_CHECK(IsUnusualUserAgent("Mozilla/5.0 (compatible; Googlebot/2.1)"));
    BOOST_CHECK(IsUnusualUserAgent("Mozilla/5.0 HeadlessChrome/120.0.0.0 Safari/537.36"));
    BOOST_CHECK(!IsUnusualUserAgent(BROWSER_AGENT));
}

BOOST_AUTO_TEST_CASE(score_and_severity)
{
    BOOST_CHECK_CLOSE(ComputeClusterScore(3, 2.0, 1), 6.5, 0.0001);
    BOOST_CHECK_CLOSE(ComputeClusterScore(4, 1.0, 4), 4.0, 0.0001);
    BOOST_CHECK_CLOSE(ComputeClusterScore(20, 3.0, 1), MAX_CLUSTER_SCORE, 0.0001);
    BOOST_CHECK_EQUAL(ComputeClusterScore(0, 3.0, 0), 0.0);

    BOOST_CHECK_EQUAL(ClusterSeverityForScore(2.9), 1);
    BOOST_CHECK_EQUAL(ClusterSeverityForScore(3.0), 2);
    BOOST_CHECK_EQUAL(ClusterSeverityForScore(4.99), 2);
    BOOST_CHECK_EQUAL(ClusterSeverityForScore(5.0), 3);
    BOOST_CHECK_EQUAL(ClusterSeverityForScore(7.0), 4);
    BOOST_CHECK_EQUAL(ClusterSeverityForScore(9.0), 5);
    BOOST_CHECK_EQUAL(ClusterSeverityForScore(10.0), 5);

    BOOST_CHECK_EQUAL(ClusterPatternTypeToString(ClusterPatternType::DEVICE_FINGERPRINT), "device_fingerprint");
    ClusterPatternType type;
    BOOST_CHECK(ClusterPatternTypeFromString("user_agent", type));
    BOOST_CHECK(type == ClusterPatternType::USER_AGENT);
    BOOST_CHECK(!ClusterPatternTypeFromString("geo", type));
}

BOOST_AUTO_TEST_CASE(candidates_in_processing_order)
{
    const int64_t t0 = TEST_START_TIME_MS - 30 * MINUTE;
    std::vector<FraudLog> logs;
    int64_t id = 1;
    for (int i = 0; i < 3; ++i) {
        FraudLog log = MakeLog("10.0.0.1", "dev-a", BROWSER_AGENT, t0 + i * 1000);
        log.id = id++;
        logs.push_back(log);
    }
    FraudLog anonymous = MakeLog(UNKNOWN_IP, "", BROWSER_AGENT, t0 + 5 * MINUTE);
    anonymous.id = id++;
    logs.push_back(anonymous);

    std::vector<ClusterCandidate> candidates = BuildClusterCandidates(logs, ClusterEngineConfig());
    BOOST_REQUIRE_EQUAL(candidates.size(), 3u);
    BOOST_CHECK(candidates[0].patternType == ClusterPatternType::IP_BASED);
    BOOST_CHECK_EQUAL(candidates[0].groupKey, "10.0.0.1");
    BOOST_CHECK_EQUAL(candidates[0].logs.size(), 3u);
    BOOST_CHECK(candidates[1].patternType == ClusterPatternType::DEVICE_FINGERPRINT);
    BOOST_CHECK_EQUAL(candidates[1].groupKey, "dev-a");
    BOOST_CHECK(candidates[2].patternType == ClusterPatternType::VELOCITY);
    BOOST_CHECK(candidates[2].groupKey.empty());
    BOOST_CHECK_EQUAL(candidates[2].FirstSeen(), t0);
    BOOST_CHECK_EQUAL(candidates[2].LastSeen(), t0 + 2000);
}

BOOST_AUTO_TEST_CASE(identity_sessions_split_on_gap)
{
    const int64_t t0 = TEST_START_TIME_MS - 2 * 60 * MINUTE;
    std::vector<FraudLog> logs;
    for (int i = 0; i < 4; ++i) {
        // Two pairs, 20 minutes apart
        FraudLog log = MakeLog("10.0.0.2", "", BROWSER_AGENT, t0 + (i / 2) * 20 * MINUTE + (i % 2) * MINUTE);
        log.id = i + 1;
        logs.push_back(log);
    }

    std::vector<ClusterCandidate> candidates = BuildClusterCandidates(logs, ClusterEngineConfig());
    BOOST_REQUIRE_EQUAL(candidates.size(), 2u);
    BOOST_CHECK_EQUAL(candidates[0].FirstSeen(), t0);
    BOOST_CHECK_EQUAL(candidates[1].FirstSeen(), t0 + 20 * MINUTE);
}

BOOST_AUTO_TEST_CASE(ip_cluster_from_repeated_failures)
{
    const int64_t now = TEST_START_TIME_MS;
    uint64_t session = broadcaster.Subscribe("127.0.0.1");

    int64_t first = Add(MakeLog("10.0.0.1", "dev-1", BROWSER_AGENT, now - 6 * MINUTE));
    Add(MakeLog("10.0.0.1", "dev-2", BROWSER_AGENT, now - 4 * MINUTE));
    Add(MakeLog("10.0.0.1", "dev-3", BROWSER_AGENT, now - 2 * MINUTE));

    ClusterRunResult result = engine.Trigger();
    BOOST_CHECK(!result.aborted);
    BOOST_CHECK(!result.skipped);
    BOOST_CHECK_EQUAL(result.threatsAnalyzed, 3);
    BOOST_CHECK_EQUAL(result.clustersFound, 1);
    BOOST_CHECK_EQUAL(result.clustersCreated, 1);
    BOOST_CHECK_EQUAL(result.logsAssigned, 3);
    BOOST_CHECK_EQUAL(result.startedAt, now);

    std::vector<FraudCluster> clusters = db.GetClusters(10);
    BOOST_REQUIRE_EQUAL(clusters.size(), 1u);
    const FraudCluster& cluster = clusters[0];
    BOOST_CHECK(cluster.patternType == ClusterPatternType::IP_BASED);
    BOOST_CHECK_EQUAL(cluster.groupKey, "10.0.0.1");
    BOOST_CHECK_EQUAL(cluster.label, "IP 10.0.0.1 (3 threats)");
    BOOST_CHECK_EQUAL(cluster.threatCount, 3);
    BOOST_CHECK_CLOSE(cluster.score, 6.5, 0.0001);
    BOOST_CHECK_EQUAL(cluster.severity, 3);
    BOOST_CHECK_EQUAL(cluster.metadata.uniqueIPs, 1);
    BOOST_CHECK_EQUAL(cluster.metadata.uniqueDevices, 3);
    BOOST_CHECK_EQUAL(cluster.metadata.timeSpanMs, 4 * MINUTE);
    BOOST_REQUIRE_EQUAL(cluster.metadata.threatTypes.size(), 1u);
    BOOST_CHECK_EQUAL(cluster.metadata.threatTypes[0], "invalid_code");

    std::vector<ClusterPattern> patterns = db.GetPatterns(cluster.id);
    BOOST_REQUIRE_EQUAL(patterns.size(), 3u);
    BOOST_CHECK_EQUAL(patterns[0].fraudLogId, first);
    BOOST_CHECK_EQUAL(patterns[0].similarity, 1.0);
    BOOST_CHECK_EQUAL(patterns[2].metadata.device, "dev-3");

    std::vector<AlertEvent> events = broadcaster.Drain(session);
    BOOST_REQUIRE_EQUAL(events.size(), 1u);
    BOOST_CHECK(events[0].type == AlertEventType::FRAUD_CLUSTER);
    BOOST_CHECK(events[0].payload.find("ip_based") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(rerun_is_idempotent)
{
    const int64_t now = TEST_START_TIME_MS;
    for (int i = 0; i < 3; ++i) {
        Add(MakeLog("10.0.0.1", "", BROWSER_AGENT, now - (6 - 2 * i) * MINUTE));
    }

    BOOST_CHECK_EQUAL(engine.Trigger().clustersCreated, 1);

    ClusterRunResult again = engine.Trigger();
    BOOST_CHECK_EQUAL(again.threatsAnalyzed, 3);
    BOOST_CHECK_EQUAL(again.clustersFound, 0);
    BOOST_CHECK_EQUAL(again.logsAssigned, 0);
    BOOST_CHECK_EQUAL(db.GetClusterStats().totalClusters, 1);
    BOOST_CHECK_EQUAL(db.GetAssignedLogIds(0).size(), 3u);
}

BOOST_AUTO_TEST_CASE(new_events_extend_open_cluster)
{
    const int64_t now = TEST_START_TIME_MS;
    for (int i = 0; i < 3; ++i) {
        Add(MakeLog("10.0.0.1", "", BROWSER_AGENT, now - (8 - 2 * i) * MINUTE));
    }
    engine.Trigger();
    FraudCluster before = db.GetClusters(1).at(0);

    // A single late event is below the minimum on its own
    Add(MakeLog("10.0.0.1", "", BROWSER_AGENT, now - MINUTE, FraudSeverity::HIGH));
    ClusterRunResult result = engine.Trigger();
    BOOST_CHECK_EQUAL(result.clustersCreated, 0);
    BOOST_CHECK_EQUAL(result.clustersUpdated, 1);
    BOOST_CHECK_EQUAL(result.logsAssigned, 1);

    FraudCluster after;
    BOOST_REQUIRE(db.GetCluster(before.id, after));
    BOOST_CHECK_EQUAL(after.threatCount, 4);
    BOOST_CHECK_EQUAL(after.label, "IP 10.0.0.1 (4 threats)");
    BOOST_CHECK(after.score > before.score);
    BOOST_CHECK(after.severity >= before.severity);
    BOOST_CHECK_EQUAL(after.metadata.lastSeenMs, now - MINUTE);
    BOOST_CHECK_EQUAL(after.createdAt, before.createdAt);
    BOOST_CHECK_EQUAL(db.GetPatterns(before.id).size(), 4u);
    BOOST_CHECK_EQUAL(db.GetClusterStats().totalClusters, 1);
}

BOOST_AUTO_TEST_CASE(score_never_decreases_on_merge)
{
    const int64_t now = TEST_START_TIME_MS;
    for (int i = 0; i < 3; ++i) {
        Add(MakeLog("10.0.0.1", "", BROWSER_AGENT, now - (8 - 2 * i) * MINUTE, FraudSeverity::HIGH));
    }
    engine.Trigger();
    FraudCluster before = db.GetClusters(1).at(0);

    // Low severity noise would pull the mean down
    Add(MakeLog("10.0.0.1", "", BROWSER_AGENT, now - MINUTE, FraudSeverity::LOW));
    engine.Trigger();

    FraudCluster after;
    BOOST_REQUIRE(db.GetCluster(before.id, after));
    BOOST_CHECK(after.score >= before.score);
    BOOST_CHECK(after.severity >= before.severity);
}

BOOST_AUTO_TEST_CASE(distant_session_opens_new_cluster)
{
    const int64_t now = TEST_START_TIME_MS;
    for (int i = 0; i < 3; ++i) {
        Add(MakeLog("10.0.0.4", "", BROWSER_AGENT, now - 3 * 60 * MINUTE + i * MINUTE));
        Add(MakeLog("10.0.0.4", "", BROWSER_AGENT, now - 60 * MINUTE + i * MINUTE));
    }

    ClusterRunResult result = engine.Trigger();
    BOOST_CHECK_EQUAL(result.clustersCreated, 2);
    ClusterStats stats = db.GetClusterStats();
    BOOST_CHECK_EQUAL(stats.totalClusters, 2);
    BOOST_CHECK_EQUAL(stats.totalThreats, 6);
}

BOOST_AUTO_TEST_CASE(ip_claims_logs_before_device)
{
    const int64_t now = TEST_START_TIME_MS;
    for (int i = 0; i < 3; ++i) {
        Add(MakeLog("10.0.0.5", "dev-shared", BROWSER_AGENT, now - (6 - 2 * i) * MINUTE));
    }

    engine.Trigger();
    ClusterStats stats = db.GetClusterStats();
    BOOST_CHECK_EQUAL(stats.totalClusters, 1);
    BOOST_CHECK_EQUAL(stats.byPatternType["ip_based"], 1);
    BOOST_CHECK_EQUAL(stats.byPatternType.count("device_fingerprint"), 0u);
}

BOOST_AUTO_TEST_CASE(device_cluster_across_ips)
{
    const int64_t now = TEST_START_TIME_MS;
    for (int i = 0; i < 3; ++i) {
        Add(MakeLog(strprintf("192.0.2.%d", i + 1), "dev-rotating-0001", BROWSER_AGENT, now - (6 - 2 * i) * MINUTE));
    }

    BOOST_CHECK_EQUAL(engine.Trigger().clustersCreated, 1);
    FraudCluster cluster = db.GetClusters(1).at(0);
    BOOST_CHECK(cluster.patternType == ClusterPatternType::DEVICE_FINGERPRINT);
    BOOST_CHECK_EQUAL(cluster.groupKey, "dev-rotating-0001");
    BOOST_CHECK_EQUAL(cluster.label, "Device dev-rotating (3 threats)");
    BOOST_CHECK_EQUAL(cluster.metadata.uniqueIPs, 3);
    // Spread over three addresses: no concentration bonus
    BOOST_CHECK_CLOSE(cluster.score, 4.5, 0.0001);
}

BOOST_AUTO_TEST_CASE(velocity_burst)
{
    const int64_t now = TEST_START_TIME_MS;
    for (int i = 0; i < 4; ++i) {
        Add(MakeLog(strprintf("198.51.100.%d", i + 1), strprintf("dev-v%d", i), BROWSER_AGENT,
                    now - MINUTE + i * 1000));
    }

    BOOST_CHECK_EQUAL(engine.Trigger().clustersCreated, 1);
    FraudCluster cluster = db.GetClusters(1).at(0);
    BOOST_CHECK(cluster.patternType == ClusterPatternType::VELOCITY);
    BOOST_CHECK_EQUAL(cluster.label, "Velocity burst (4 threats)");
    BOOST_CHECK_CLOSE(cluster.score, 5.5, 0.0001);

    std::vector<ClusterPattern> patterns = db.GetPatterns(cluster.id);
    BOOST_REQUIRE_EQUAL(patterns.size(), 4u);
    BOOST_CHECK_EQUAL(patterns[0].similarity, 1.0);
    BOOST_CHECK_CLOSE(patterns[1].similarity, 0.9, 0.0001);
}

BOOST_AUTO_TEST_CASE(scripted_user_agent)
{
    const int64_t now = TEST_START_TIME_MS;
    for (int i = 0; i < 3; ++i) {
        Add(MakeLog(strprintf("203.0.113.%d", i + 1), strprintf("dev-u%d", i),
                    strprintf("python-requests/2.3%d", i), now - (6 - 2 * i) * MINUTE));
    }

    BOOST_CHECK_EQUAL(engine.Trigger().clustersCreated, 1);
    FraudCluster cluster = db.GetClusters(1).at(0);
    BOOST_CHECK(cluster.patternType == ClusterPatternType::USER_AGENT);
    BOOST_CHECK_EQUAL(cluster.groupKey, HashIdentityString("ua:" + NormalizeUserAgent("python-requests/2.31")));

    std::vector<ClusterPattern> patterns = db.GetPatterns(cluster.id);
    BOOST_REQUIRE_EQUAL(patterns.size(), 3u);
    BOOST_CHECK_EQUAL(patterns[0].similarity, 1.0);
    BOOST_CHECK_CLOSE(patterns[1].similarity, 0.9, 0.0001);
}

BOOST_AUTO_TEST_CASE(common_user_agent_is_not_a_pattern)
{
    const int64_t now = TEST_START_TIME_MS;
    for (int i = 0; i < 3; ++i) {
        Add(MakeLog(strprintf("203.0.113.%d", i + 1), strprintf("dev-c%d", i), BROWSER_AGENT,
                    now - (6 - 2 * i) * MINUTE));
    }

    ClusterRunResult result = engine.Trigger();
    BOOST_CHECK_EQUAL(result.threatsAnalyzed, 3);
    BOOST_CHECK_EQUAL(result.clustersFound, 0);
}

BOOST_AUTO_TEST_CASE(below_minimum_count)
{
    Add(MakeLog("10.0.0.6", "", BROWSER_AGENT, TEST_START_TIME_MS - 2 * MINUTE));
    Add(MakeLog("10.0.0.6", "", BROWSER_AGENT, TEST_START_TIME_MS - MINUTE));
    BOOST_CHECK_EQUAL(engine.Trigger().clustersFound, 0);
}

BOOST_AUTO_TEST_CASE(old_logs_outside_lookback)
{
    const int64_t old = TEST_START_TIME_MS - DEFAULT_CLUSTER_LOOKBACK_MS - MINUTE;
    for (int i = 0; i < 3; ++i) {
        Add(MakeLog("10.0.0.7", "", BROWSER_AGENT, old + i * 1000));
    }
    ClusterRunResult result = engine.Trigger();
    BOOST_CHECK_EQUAL(result.threatsAnalyzed, 0);
    BOOST_CHECK_EQUAL(result.clustersFound, 0);
}

BOOST_AUTO_TEST_CASE(malformed_rows_are_skipped)
{
    const int64_t now = TEST_START_TIME_MS;
    for (int i = 0; i < 3; ++i) {
        Add(MakeLog("10.0.0.8", "", BROWSER_AGENT, now - (6 - 2 * i) * MINUTE));
    }
    FraudLogRow foreign;
    foreign.ipAddress = "10.0.0.8";
    foreign.failureReason = "card_testing";
    foreign.severity = "medium";
    foreign.timestamp = now - 3 * MINUTE;
    db.AppendRaw(foreign);

    ClusterRunResult result = engine.Trigger();
    BOOST_CHECK_EQUAL(result.malformedRows, 1);
    BOOST_CHECK_EQUAL(result.threatsAnalyzed, 3);
    BOOST_CHECK_EQUAL(result.clustersCreated, 1);
    BOOST_CHECK_EQUAL(db.GetClusters(1).at(0).threatCount, 3);
}

BOOST_AUTO_TEST_CASE(working_set_keeps_newest_logs)
{
    ClusterEngineConfig config;
    config.maxLogs = 3;
    ThreatClusterEngine bounded(config, db, db);

    const int64_t now = TEST_START_TIME_MS;
    for (int i = 0; i < 3; ++i) {
        Add(MakeLog("10.0.2.1", "", BROWSER_AGENT, now - (20 - 2 * i) * MINUTE));
    }
    ClusterRunResult first = bounded.Trigger();
    BOOST_CHECK_EQUAL(first.threatsAnalyzed, 3);
    BOOST_CHECK_EQUAL(first.clustersCreated, 1);

    // Older logs fill the limit on their own; newer ones must still be read
    for (int i = 0; i < 3; ++i) {
        Add(MakeLog("10.0.2.2", "", BROWSER_AGENT, now - (10 - 2 * i) * MINUTE));
    }
    ClusterRunResult second = bounded.Trigger();
    BOOST_CHECK_EQUAL(second.threatsAnalyzed, 3);
    BOOST_CHECK_EQUAL(second.clustersCreated, 1);
    BOOST_CHECK_EQUAL(second.logsAssigned, 3);

    std::vector<FraudCluster> clusters = db.GetClusters(10);
    BOOST_REQUIRE_EQUAL(clusters.size(), 2u);
    BOOST_CHECK_EQUAL(clusters[0].groupKey, "10.0.2.2");
    BOOST_CHECK_EQUAL(clusters[0].threatCount, 3);
    BOOST_CHECK_EQUAL(clusters[1].groupKey, "10.0.2.1");
    BOOST_CHECK_EQUAL(db.GetAssignedLogIds(0).size(), 6u);
}

BOOST_AUTO_TEST_CASE(scheduled_run_skips_while_run_active)
{
    const int64_t now = TEST_START_TIME_MS;
    for (int i = 0; i < 3; ++i) {
        Add(MakeLog("10.0.3.1", "", BROWSER_AGENT, now - (6 - 2 * i) * MINUTE));
    }

    GatedLogStore gated(db);
    ThreatClusterEngine gatedEngine(ClusterEngineConfig(), gated, db);

    ClusterRunResult manual;
    boost::thread manualRun([&gatedEngine, &manual]() { manual = gatedEngine.Trigger(); });
    gated.WaitUntilEntered();

    ClusterRunResult scheduled = gatedEngine.RunScheduled();
    BOOST_CHECK(scheduled.skipped);
    BOOST_CHECK(!scheduled.aborted);
    BOOST_CHECK_EQUAL(scheduled.clustersFound, 0);
    BOOST_CHECK_EQUAL(db.GetClusterStats().totalClusters, 0);

    gated.Open();
    manualRun.join();
    BOOST_CHECK(!manual.skipped);
    BOOST_CHECK_EQUAL(manual.clustersCreated, 1);

    ClusterRunResult after = gatedEngine.RunScheduled();
    BOOST_CHECK(!after.skipped);
    BOOST_CHECK_EQUAL(after.clustersFound, 0);
    BOOST_CHECK_EQUAL(db.GetClusterStats().totalClusters, 1);
}

BOOST_AUTO_TEST_CASE(storage_failure_aborts_run)
{
    Add(MakeLog("10.0.0.9", "", BROWSER_AGENT, TEST_START_TIME_MS - MINUTE));
    db.Close();

    ClusterRunResult result = engine.RunScheduled();
    BOOST_CHECK(result.aborted);
    BOOST_CHECK(!result.skipped);
    BOOST_CHECK_EQUAL(result.clustersFound, 0);
    BOOST_CHECK(engine.GetLastResult().aborted);
}

BOOST_AUTO_TEST_SUITE_END()
