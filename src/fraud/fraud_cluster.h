// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GIFTGUARD_FRAUD_FRAUD_CLUSTER_H
#define GIFTGUARD_FRAUD_FRAUD_CLUSTER_H

/**
 * @file fraud_cluster.h
 * @brief Threat clusters and their member patterns
 *
 * A FraudCluster groups fraud logs that share an identity (IP, device,
 * user-agent signature) or arrived in a burst. Each member log is linked
 * through exactly one ClusterPattern; a log never belongs to two clusters.
 */

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace giftguard {

enum class ClusterPatternType : uint8_t {
    IP_BASED = 1,
    DEVICE_FINGERPRINT = 2,
    VELOCITY = 3,
    USER_AGENT = 4
};

/** Processing order; earlier types claim shared logs first */
static const ClusterPatternType CLUSTER_PATTERN_PRIORITY[] = {
    ClusterPatternType::IP_BASED,
    ClusterPatternType::DEVICE_FINGERPRINT,
    ClusterPatternType::VELOCITY,
    ClusterPatternType::USER_AGENT,
};

std::string ClusterPatternTypeToString(ClusterPatternType type);
bool ClusterPatternTypeFromString(const std::string& str, ClusterPatternType& type);

/** Maximum cluster score */
static constexpr double MAX_CLUSTER_SCORE = 10.0;

struct ClusterMetadata {
    int64_t uniqueIPs;
    int64_t uniqueDevices;
    int64_t timeSpanMs;
    int64_t firstSeenMs;
    int64_t lastSeenMs;
    /** Distinct failure reasons, sorted */
    std::vector<std::string> threatTypes;

    ClusterMetadata() : uniqueIPs(0), uniqueDevices(0), timeSpanMs(0), firstSeenMs(0), lastSeenMs(0) {}
};

struct FraudCluster {
    int64_t id;
    std::string label;
    ClusterPatternType patternType;
    /** Shared identity: IP, device, user-agent signature; empty for velocity */
    std::string groupKey;
    double score;
    int severity;
    int64_t threatCount;
    ClusterMetadata metadata;
    int64_t createdAt;
    int64_t updatedAt;

    FraudCluster()
        : id(0)
        , patternType(ClusterPatternType::IP_BASED)
        , score(0.0)
        , severity(1)
        , threatCount(0)
        , createdAt(0)
        , updatedAt(0)
    {}
};

struct ClusterPatternMetadata {
    std::string ip;
    std::string device;
    std::string userAgent;
    std::string reason;
    std::string severity;
    int64_t timestampMs;

    ClusterPatternMetadata() : timestampMs(0) {}
};

struct ClusterPattern {
    int64_t id;
    int64_t clusterId;
    int64_t fraudLogId;
    /** 0..1 */
    double similarity;
    ClusterPatternMetadata metadata;

    ClusterPattern() : id(0), clusterId(0), fraudLogId(0), similarity(0.0) {}
};

/**
 * @brief Aggregate view over all clusters
 */
struct ClusterStats {
    int64_t totalClusters;
    int64_t totalThreats;
    double averageScore;
    std::map<std::string, int64_t> byPatternType;
    std::map<int, int64_t> bySeverity;

    ClusterStats() : totalClusters(0), totalThreats(0), averageScore(0.0) {}
};

/**
 * @brief Score a group of logs
 *
 * score = threatCount + 1.5 * (meanSeverity - 1) + 3 * (1 - uniqueIPs / threatCount),
 * capped at MAX_CLUSTER_SCORE. Few identities generating many events score
 * higher than the same volume spread across many identities.
 */
double ComputeClusterScore(int64_t threatCount, double meanSeverityWeight, int64_t uniqueIPs);

/** Map a score to severity 1..5: <3, <5, <7, <9, else 5 */
int ClusterSeverityForScore(double score);

/**
 * @brief Persistent cluster storage
 */
class ClusterStore {
public:
    virtual ~ClusterStore() = default;

    /** Clusters whose last seen event is at or after sinceMs, ordered by id */
    virtual std::vector<FraudCluster> GetOpenClusters(int64_t sinceMs) = 0;

    /** Ids of logs with timestamp >= sinceMs that already belong to a cluster */
    virtual std::set<int64_t> GetAssignedLogIds(int64_t sinceMs) = 0;

    /**
     * @brief Insert or update a cluster and add patterns, atomically
     *
     * A cluster with id 0 is inserted and its id assigned; otherwise the
     * existing row is updated. Patterns get the cluster id.
     * @throws FraudDBError on failure, leaving nothing written
     */
    virtual void WriteCluster(FraudCluster& cluster, std::vector<ClusterPattern>& patterns) = 0;

    /** Newest clusters first */
    virtual std::vector<FraudCluster> GetClusters(size_t limit) = 0;
    virtual bool GetCluster(int64_t id, FraudCluster& cluster) = 0;
    virtual std::vector<ClusterPattern> GetPatterns(int64_t clusterId) = 0;
    virtual ClusterStats GetClusterStats() = 0;
};

} // namespace giftguard

#endif // GIFTGUARD_FRAUD_FRAUD_CLUSTER_H
