// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GIFTGUARD_FRAUD_THREAT_CLUSTER_ENGINE_H
#define GIFTGUARD_FRAUD_THREAT_CLUSTER_ENGINE_H

/**
 * @file threat_cluster_engine.h
 * @brief Periodic grouping of fraud logs into threat clusters
 *
 * Each run reads the logs of the look-back window, builds candidate groups
 * for four pattern types and assigns every not-yet-clustered log to at most
 * one cluster:
 *
 * - ip_based: same IP, split into sessions on gaps longer than the window
 * - device_fingerprint: same device id, split the same way
 * - velocity: any identity, bursts of events closer than the velocity window
 * - user_agent: same normalized user-agent signature seen from several IPs,
 *   when the agent is unusual or rare
 *
 * Candidates are processed in a fixed order so that two runs over the same
 * rows produce the same clusters. A candidate that overlaps an open cluster
 * of the same type and key is merged into it; score and severity of a
 * merged cluster never decrease.
 */

#include <fraud/fraud_cluster.h>
#include <fraud/fraud_log.h>

#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace giftguard {

class AlertBroadcaster;

// ============================================================================
// Defaults
// ============================================================================

static constexpr int64_t DEFAULT_CLUSTER_INTERVAL_MS = 5 * 60 * 1000;
static constexpr int64_t DEFAULT_CLUSTER_LOOKBACK_MS = 24 * 60 * 60 * 1000;
static constexpr int64_t DEFAULT_CLUSTER_WINDOW_MS = 15 * 60 * 1000;
static constexpr int64_t DEFAULT_VELOCITY_WINDOW_MS = 10 * 1000;
static constexpr int64_t DEFAULT_CLUSTER_TIMEOUT_MS = 30 * 1000;
static constexpr size_t DEFAULT_CLUSTER_MAX_LOGS = 5000;
static constexpr int64_t DEFAULT_CLUSTER_MIN_THREATS = 3;

/** A user agent group is rare when it holds at most this share of the working set */
static constexpr double USER_AGENT_RARE_FRACTION = 0.25;

/** User agents shorter than this are considered unusual */
static constexpr size_t USER_AGENT_SHORT_LENGTH = 20;

struct ClusterEngineConfig {
    int64_t intervalMs;
    int64_t lookbackMs;
    /** Session gap for identity based patterns */
    int64_t windowMs;
    int64_t velocityWindowMs;
    int64_t timeoutMs;
    size_t maxLogs;

    int64_t ipMinCount;
    int64_t deviceMinCount;
    int64_t velocityMinCount;
    int64_t uaMinCount;

    ClusterEngineConfig()
        : intervalMs(DEFAULT_CLUSTER_INTERVAL_MS)
        , lookbackMs(DEFAULT_CLUSTER_LOOKBACK_MS)
        , windowMs(DEFAULT_CLUSTER_WINDOW_MS)
        , velocityWindowMs(DEFAULT_VELOCITY_WINDOW_MS)
        , timeoutMs(DEFAULT_CLUSTER_TIMEOUT_MS)
        , maxLogs(DEFAULT_CLUSTER_MAX_LOGS)
        , ipMinCount(DEFAULT_CLUSTER_MIN_THREATS)
        , deviceMinCount(DEFAULT_CLUSTER_MIN_THREATS)
        , velocityMinCount(DEFAULT_CLUSTER_MIN_THREATS)
        , uaMinCount(DEFAULT_CLUSTER_MIN_THREATS)
    {}

    int64_t MinCountFor(ClusterPatternType type) const;
};

/**
 * @brief Outcome of one clustering run
 */
struct ClusterRunResult {
    /** Clusters created or updated */
    int64_t clustersFound;
    int64_t clustersCreated;
    int64_t clustersUpdated;
    /** Valid logs in the working set */
    int64_t threatsAnalyzed;
    /** Logs newly linked to a cluster */
    int64_t logsAssigned;
    int64_t malformedRows;
    /** The run stopped early (deadline or storage failure) */
    bool aborted;
    /** A scheduled run found another run active and did nothing */
    bool skipped;
    int64_t startedAt;
    int64_t durationMs;

    ClusterRunResult()
        : clustersFound(0), clustersCreated(0), clustersUpdated(0), threatsAnalyzed(0)
        , logsAssigned(0), malformedRows(0), aborted(false), skipped(false)
        , startedAt(0), durationMs(0)
    {}
};

/**
 * @brief A group of logs that may become or extend a cluster
 */
struct ClusterCandidate {
    ClusterPatternType patternType;
    std::string groupKey;
    /** Every log of the session, ordered by (timestamp, id) */
    std::vector<FraudLog> logs;

    ClusterCandidate() : patternType(ClusterPatternType::IP_BASED) {}

    int64_t FirstSeen() const { return logs.empty() ? 0 : logs.front().timestamp; }
    int64_t LastSeen() const { return logs.empty() ? 0 : logs.back().timestamp; }
};

/** Lower-cased user agent with digit runs replaced and whitespace collapsed */
std::string NormalizeUserAgent(const std::string& userAgent);

/** Empty, very short, or carrying an automation marker */
bool IsUnusualUserAgent(const std::string& userAgent);

/**
 * @brief Build the candidates of one run, in processing order
 *
 * Pure: depends only on the logs and the configuration.
 * @param logs Working set ordered by (timestamp, id)
 */
std::vector<ClusterCandidate> BuildClusterCandidates(const std::vector<FraudLog>& logs,
                                                     const ClusterEngineConfig& config);

class ThreatClusterEngine {
public:
    /**
     * @param logStore Source of fraud logs (not owned)
     * @param clusterStore Cluster persistence (not owned)
     * @param broadcaster Optional publisher of created and updated clusters (not owned)
     */
    ThreatClusterEngine(const ClusterEngineConfig& config, FraudLogStore& logStore,
                        ClusterStore& clusterStore, AlertBroadcaster* broadcaster = nullptr);

    /** Run from the scheduler. Does nothing while another run is active. */
    ClusterRunResult RunScheduled();

    /** Run on demand, waiting for an active run to finish first. */
    ClusterRunResult Trigger();

    ClusterRunResult GetLastResult() const;

    const ClusterEngineConfig& GetConfig() const { return config_; }

private:
    ClusterRunResult Run();

    /** One pattern per member, with similarity measured against the whole session */
    std::vector<ClusterPattern> BuildPatterns(const ClusterCandidate& candidate,
                                              const std::vector<FraudLog>& members) const;

    const ClusterEngineConfig config_;
    FraudLogStore& logStore_;
    ClusterStore& clusterStore_;
    AlertBroadcaster* broadcaster_;

    /** Held for the duration of a run */
    std::mutex runMutex_;

    mutable std::mutex resultMutex_;
    ClusterRunResult lastResult_;
};

} // namespace giftguard

#endif // GIFTGUARD_FRAUD_THREAT_CLUSTER_ENGINE_H
