// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fraud/fraud_cluster.h>

#include <algorithm>

namespace giftguard {

std::string ClusterPatternTypeToString(ClusterPatternType type)
{
    switch (type) {
        case ClusterPatternType::IP_BASED: return "ip_based";
        case ClusterPatternType::DEVICE_FINGERPRINT: return "device_fingerprint";
        case ClusterPatternType::VELOCITY: return "velocity";
        case ClusterPatternType::USER_AGENT: return "user_agent";
    }
    return "unknown";
}

bool ClusterPatternTypeFromString(const std::string& str, ClusterPatternType& type)
{
    for (ClusterPatternType candidate : CLUSTER_PATTERN_PRIORITY) {
        if (ClusterPatternTypeToString(candidate) == str) {
            type = candidate;
            return true;
        }
    }
    return false;
}

double ComputeClusterScore(int64_t threatCount, double meanSeverityWeight, int64_t uniqueIPs)
{
    if (threatCount <= 0) {
        return 0.0;
    }

    double concentration = 1.0 - static_cast<double>(uniqueIPs) / static_cast<double>(threatCount);
    if (concentration < 0.0) concentration = 0.0;

    double score = static_cast<double>(threatCount)
                 + 1.5 * (meanSeverityWeight - 1.0)
                 + 3.0 * concentration;
    return std::min(MAX_CLUSTER_SCORE, std::max(0.0, score));
}

int ClusterSeverityForScore(double score)
{
    if (score < 3.0) return 1;
    if (score < 5.0) return 2;
    if (score < 7.0) return 3;
    if (score < 9.0) return 4;
    return 5;
}

} // namespace giftguard
