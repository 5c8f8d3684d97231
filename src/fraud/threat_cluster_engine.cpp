// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fraud/threat_cluster_engine.h>

#include <fraud/alert_broadcaster.h>
#include <fraud/fraud_db.h>
#include <guard/fingerprint.h>
#include <util.h>
#include <utilstrencodings.h>

#include <algorithm>
#include <cctype>
#include <map>

namespace giftguard {

/** Substrings that mark a scripted client */
static const char* const AUTOMATION_MARKERS[] = {
    "bot", "crawler", "spider", "curl", "wget", "python", "headless",
    "scrapy", "httpclient", "okhttp", "go-http", "java/", "postman", "phantomjs",
};

int64_t ClusterEngineConfig::MinCountFor(ClusterPatternType type) const
{
    switch (type) {
        case ClusterPatternType::IP_BASED: return ipMinCount;
        case ClusterPatternType::DEVICE_FINGERPRINT: return deviceMinCount;
        case ClusterPatternType::VELOCITY: return velocityMinCount;
        case ClusterPatternType::USER_AGENT: return uaMinCount;
    }
    return DEFAULT_CLUSTER_MIN_THREATS;
}

std::string NormalizeUserAgent(const std::string& userAgent)
{
    std::string out;
    out.reserve(userAgent.size());
    bool inNumber = false;
    bool inSpace = false;
    for (char c : userAgent) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isdigit(uc) || (c == '.' && inNumber)) {
            if (!inNumber) out += 'x';
            inNumber = true;
            inSpace = false;
            continue;
        }
        inNumber = false;
        if (std::isspace(uc)) {
            if (!inSpace && !out.empty()) out += ' ';
            inSpace = true;
            continue;
        }
        inSpace = false;
        out += static_cast<char>(std::tolower(uc));
    }
    while (!out.empty() && out.back() == ' ') {
        out.pop_back();
    }
    return out;
}

bool IsUnusualUserAgent(const std::string& userAgent)
{
    std::string trimmed = TrimString(userAgent);
    if (trimmed.size() < USER_AGENT_SHORT_LENGTH) {
        return true;
    }
    std::string lower = ToLower(trimmed);
    for (const char* marker : AUTOMATION_MARKERS) {
        if (lower.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// Candidate construction
// ============================================================================

namespace {

/** Split time-ordered logs wherever two neighbours are more than gapMs apart */
std::vector<std::vector<FraudLog>> SplitSessions(const std::vector<FraudLog>& logs, int64_t gapMs)
{
    std::vector<std::vector<FraudLog>> sessions;
    for (const FraudLog& log : logs) {
        if (sessions.empty() || log.timestamp - sessions.back().back().timestamp > gapMs) {
            sessions.emplace_back();
        }
        sessions.back().push_back(log);
    }
    return sessions;
}

void AddIdentitySessions(std::vector<ClusterCandidate>& out, ClusterPatternType type,
                         const std::map<std::string, std::vector<FraudLog>>& groups, int64_t gapMs)
{
    for (const auto& group : groups) {
        for (std::vector<FraudLog>& session : SplitSessions(group.second, gapMs)) {
            ClusterCandidate candidate;
            candidate.patternType = type;
            candidate.groupKey = group.first;
            candidate.logs = std::move(session);
            out.push_back(std::move(candidate));
        }
    }
}

/** True if some minCount consecutive events fit in windowMs */
bool HasBurst(const std::vector<FraudLog>& session, int64_t minCount, int64_t windowMs)
{
    if (minCount <= 1) return !session.empty();
    const size_t span = static_cast<size_t>(minCount) - 1;
    for (size_t i = 0; i + span < session.size(); ++i) {
        if (session[i + span].timestamp - session[i].timestamp <= windowMs) {
            return true;
        }
    }
    return false;
}

size_t PatternPriority(ClusterPatternType type)
{
    for (size_t i = 0; i < sizeof(CLUSTER_PATTERN_PRIORITY) / sizeof(CLUSTER_PATTERN_PRIORITY[0]); ++i) {
        if (CLUSTER_PATTERN_PRIORITY[i] == type) return i;
    }
    return sizeof(CLUSTER_PATTERN_PRIORITY) / sizeof(CLUSTER_PATTERN_PRIORITY[0]);
}

/** Member summary shared by new and merged clusters */
struct MemberSummary {
    std::string ip;
    std::string device;
    std::string reason;
    int severityWeight;
    int64_t timestamp;
};

MemberSummary SummarizeLog(const FraudLog& log)
{
    MemberSummary s;
    s.ip = log.ipAddress;
    s.device = log.deviceFingerprint;
    s.reason = FailureReasonToString(log.failureReason);
    s.severityWeight = SeverityWeight(log.severity);
    s.timestamp = log.timestamp;
    return s;
}

MemberSummary SummarizePattern(const ClusterPattern& pattern)
{
    MemberSummary s;
    s.ip = pattern.metadata.ip;
    s.device = pattern.metadata.device;
    s.reason = pattern.metadata.reason;
    FraudSeverity severity;
    s.severityWeight = FraudSeverityFromString(pattern.metadata.severity, severity) ? SeverityWeight(severity) : 1;
    s.timestamp = pattern.metadata.timestampMs;
    return s;
}

/** Recompute metadata and score of a cluster from all of its members */
void ApplySummary(FraudCluster& cluster, const std::vector<MemberSummary>& members)
{
    std::set<std::string> ips;
    std::set<std::string> devices;
    std::set<std::string> reasons;
    int64_t first = 0;
    int64_t last = 0;
    int64_t severitySum = 0;

    for (const MemberSummary& m : members) {
        if (!m.ip.empty()) ips.insert(m.ip);
        if (!m.device.empty()) devices.insert(m.device);
        if (!m.reason.empty()) reasons.insert(m.reason);
        severitySum += m.severityWeight;
        if (first == 0 || m.timestamp < first) first = m.timestamp;
        if (m.timestamp > last) last = m.timestamp;
    }

    const int64_t count = static_cast<int64_t>(members.size());
    const double meanSeverity = count > 0 ? static_cast<double>(severitySum) / count : 1.0;
    const double score = ComputeClusterScore(count, meanSeverity, static_cast<int64_t>(ips.size()));

    for (const std::string& previous : cluster.metadata.threatTypes) {
        reasons.insert(previous);
    }

    cluster.threatCount = count;
    cluster.metadata.uniqueIPs = std::max<int64_t>(cluster.metadata.uniqueIPs, ips.size());
    cluster.metadata.uniqueDevices = std::max<int64_t>(cluster.metadata.uniqueDevices, devices.size());
    if (cluster.metadata.firstSeenMs == 0 || first < cluster.metadata.firstSeenMs) {
        cluster.metadata.firstSeenMs = first;
    }
    cluster.metadata.lastSeenMs = std::max(cluster.metadata.lastSeenMs, last);
    cluster.metadata.timeSpanMs = cluster.metadata.lastSeenMs - cluster.metadata.firstSeenMs;
    cluster.metadata.threatTypes.assign(reasons.begin(), reasons.end());

    // Never decrease
    cluster.score = std::max(cluster.score, score);
    cluster.severity = std::max(cluster.severity, ClusterSeverityForScore(cluster.score));
}

std::string ClusterLabel(const FraudCluster& cluster)
{
    switch (cluster.patternType) {
        case ClusterPatternType::IP_BASED:
            return strprintf("IP %s (%d threats)", cluster.groupKey, cluster.threatCount);
        case ClusterPatternType::DEVICE_FINGERPRINT:
            return strprintf("Device %s (%d threats)", cluster.groupKey.substr(0, 12), cluster.threatCount);
        case ClusterPatternType::VELOCITY:
            return strprintf("Velocity burst (%d threats)", cluster.threatCount);
        case ClusterPatternType::USER_AGENT:
            return strprintf("User agent %s (%d threats)", cluster.groupKey.substr(0, 12), cluster.threatCount);
    }
    return strprintf("Cluster (%d threats)", cluster.threatCount);
}

} // anonymous namespace

std::vector<ClusterCandidate> BuildClusterCandidates(const std::vector<FraudLog>& logs,
                                                     const ClusterEngineConfig& config)
{
    std::vector<ClusterCandidate> candidates;

    // Identity groups. std::map keeps keys sorted, logs keep input order.
    std::map<std::string, std::vector<FraudLog>> byIp;
    std::map<std::string, std::vector<FraudLog>> byDevice;
    std::map<std::string, std::vector<FraudLog>> byAgent;
    for (const FraudLog& log : logs) {
        if (!log.ipAddress.empty() && log.ipAddress != UNKNOWN_IP) {
            byIp[log.ipAddress].push_back(log);
        }
        if (!log.deviceFingerprint.empty()) {
            byDevice[log.deviceFingerprint].push_back(log);
        }
        byAgent[HashIdentityString("ua:" + NormalizeUserAgent(log.userAgent))].push_back(log);
    }

    AddIdentitySessions(candidates, ClusterPatternType::IP_BASED, byIp, config.windowMs);
    AddIdentitySessions(candidates, ClusterPatternType::DEVICE_FINGERPRINT, byDevice, config.windowMs);

    for (std::vector<FraudLog>& session : SplitSessions(logs, config.velocityWindowMs)) {
        if (!HasBurst(session, config.velocityMinCount, config.velocityWindowMs)) {
            continue;
        }
        ClusterCandidate candidate;
        candidate.patternType = ClusterPatternType::VELOCITY;
        candidate.logs = std::move(session);
        candidates.push_back(std::move(candidate));
    }

    const double rareLimit = USER_AGENT_RARE_FRACTION * static_cast<double>(logs.size());
    for (auto& group : byAgent) {
        const std::vector<FraudLog>& members = group.second;
        if (static_cast<int64_t>(members.size()) < config.uaMinCount) {
            continue;
        }
        std::set<std::string> ips;
        for (const FraudLog& log : members) {
            ips.insert(log.ipAddress);
        }
        if (ips.size() < 2) {
            continue;
        }
        bool unusual = IsUnusualUserAgent(members.front().userAgent);
        bool rare = static_cast<double>(members.size()) <= rareLimit;
        if (!unusual && !rare) {
            continue;
        }
        ClusterCandidate candidate;
        candidate.patternType = ClusterPatternType::USER_AGENT;
        candidate.groupKey = group.first;
        candidate.logs = members;
        candidates.push_back(std::move(candidate));
    }

    std::stable_sort(candidates.begin(), candidates.end(),
        [](const ClusterCandidate& a, const ClusterCandidate& b) {
            size_t pa = PatternPriority(a.patternType);
            size_t pb = PatternPriority(b.patternType);
            if (pa != pb) return pa < pb;
            if (a.groupKey != b.groupKey) return a.groupKey < b.groupKey;
            return a.FirstSeen() < b.FirstSeen();
        });

    return candidates;
}

// ============================================================================
// ThreatClusterEngine
// ============================================================================

ThreatClusterEngine::ThreatClusterEngine(const ClusterEngineConfig& config, FraudLogStore& logStore,
                                         ClusterStore& clusterStore, AlertBroadcaster* broadcaster)
    : config_(config)
    , logStore_(logStore)
    , clusterStore_(clusterStore)
    , broadcaster_(broadcaster)
{
}

ClusterRunResult ThreatClusterEngine::RunScheduled()
{
    std::unique_lock<std::mutex> lock(runMutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        LogPrint(BCLog::CLUSTER, "ThreatClusterEngine: run already active, skipping\n");
        ClusterRunResult result;
        result.skipped = true;
        return result;
    }
    return Run();
}

ClusterRunResult ThreatClusterEngine::Trigger()
{
    std::lock_guard<std::mutex> lock(runMutex_);
    return Run();
}

ClusterRunResult ThreatClusterEngine::GetLastResult() const
{
    std::lock_guard<std::mutex> lock(resultMutex_);
    return lastResult_;
}

std::vector<ClusterPattern> ThreatClusterEngine::BuildPatterns(const ClusterCandidate& candidate,
                                                               const std::vector<FraudLog>& members) const
{
    std::set<int64_t> memberIds;
    for (const FraudLog& log : members) {
        memberIds.insert(log.id);
    }

    std::vector<ClusterPattern> patterns;
    const std::string& referenceAgent = candidate.logs.front().userAgent;
    int64_t previousTs = 0;

    for (size_t i = 0; i < candidate.logs.size(); ++i) {
        const FraudLog& log = candidate.logs[i];
        double similarity = 1.0;
        if (candidate.patternType == ClusterPatternType::VELOCITY && i > 0 && config_.velocityWindowMs > 0) {
            double gap = static_cast<double>(log.timestamp - previousTs);
            similarity = std::max(0.0, 1.0 - gap / static_cast<double>(config_.velocityWindowMs));
        } else if (candidate.patternType == ClusterPatternType::USER_AGENT && log.userAgent != referenceAgent) {
            similarity = 0.9;
        }
        previousTs = log.timestamp;

        if (memberIds.count(log.id) == 0) {
            continue;
        }

        ClusterPattern pattern;
        pattern.fraudLogId = log.id;
        pattern.similarity = similarity;
        pattern.metadata.ip = log.ipAddress;
        pattern.metadata.device = log.deviceFingerprint;
        pattern.metadata.userAgent = log.userAgent;
        pattern.metadata.reason = FailureReasonToString(log.failureReason);
        pattern.metadata.severity = FraudSeverityToString(log.severity);
        pattern.metadata.timestampMs = log.timestamp;
        patterns.push_back(pattern);
    }
    return patterns;
}

ClusterRunResult ThreatClusterEngine::Run()
{
    ClusterRunResult result;
    result.startedAt = GetTimeMillis();
    const int64_t startSteady = GetSteadyTimeMillis();
    const int64_t deadline = startSteady + config_.timeoutMs;
    const int64_t since = result.startedAt - config_.lookbackMs;

    LogPrint(BCLog::CLUSTER, "ThreatClusterEngine: starting run, look-back from %d\n", since);

    try {
        std::vector<FraudLogRow> rows = logStore_.ReadSince(since, config_.maxLogs, config_.timeoutMs);

        std::vector<FraudLog> logs;
        logs.reserve(rows.size());
        for (const FraudLogRow& row : rows) {
            FraudLog log;
            if (!ParseFraudLogRow(row, log)) {
                LogPrint(BCLog::CLUSTER, "ThreatClusterEngine: skipping malformed row %d\n", row.id);
                result.malformedRows++;
                continue;
            }
            logs.push_back(log);
        }
        result.threatsAnalyzed = static_cast<int64_t>(logs.size());

        std::set<int64_t> assigned = clusterStore_.GetAssignedLogIds(since);
        std::vector<FraudCluster> openClusters = clusterStore_.GetOpenClusters(since);

        for (const ClusterCandidate& candidate : BuildClusterCandidates(logs, config_)) {
            std::vector<FraudLog> members;
            for (const FraudLog& log : candidate.logs) {
                if (assigned.count(log.id) == 0) {
                    members.push_back(log);
                }
            }
            if (members.empty()) {
                continue;
            }

            const int64_t gap = candidate.patternType == ClusterPatternType::VELOCITY
                ? config_.velocityWindowMs : config_.windowMs;

            FraudCluster* target = nullptr;
            for (FraudCluster& open : openClusters) {
                if (open.patternType != candidate.patternType || open.groupKey != candidate.groupKey) {
                    continue;
                }
                if (open.metadata.firstSeenMs - gap <= candidate.LastSeen() &&
                    candidate.FirstSeen() <= open.metadata.lastSeenMs + gap) {
                    target = &open;
                    break;
                }
            }

            if (target == nullptr && static_cast<int64_t>(members.size()) < config_.MinCountFor(candidate.patternType)) {
                continue;
            }

            if (GetSteadyTimeMillis() > deadline) {
                LogPrintf("ThreatClusterEngine: deadline reached, stopping run\n");
                result.aborted = true;
                break;
            }

            std::vector<ClusterPattern> patterns = BuildPatterns(candidate, members);
            const int64_t nowMs = GetTimeMillis();
            const bool created = (target == nullptr);

            FraudCluster cluster;
            std::vector<MemberSummary> summary;
            if (created) {
                cluster.patternType = candidate.patternType;
                cluster.groupKey = candidate.groupKey;
                cluster.createdAt = nowMs;
            } else {
                cluster = *target;
                for (const ClusterPattern& existing : clusterStore_.GetPatterns(cluster.id)) {
                    summary.push_back(SummarizePattern(existing));
                }
            }
            for (const FraudLog& log : members) {
                summary.push_back(SummarizeLog(log));
            }
            ApplySummary(cluster, summary);
            cluster.updatedAt = nowMs;
            cluster.label = ClusterLabel(cluster);

            clusterStore_.WriteCluster(cluster, patterns);

            for (const FraudLog& log : members) {
                assigned.insert(log.id);
            }
            result.logsAssigned += static_cast<int64_t>(members.size());

            if (created) {
                openClusters.push_back(cluster);
                result.clustersCreated++;
            } else {
                *target = cluster;
                result.clustersUpdated++;
            }

            LogPrint(BCLog::CLUSTER, "ThreatClusterEngine: %s cluster %d %s score=%.2f severity=%d\n",
                     created ? "created" : "updated", cluster.id, cluster.label, cluster.score, cluster.severity);

            if (broadcaster_) {
                broadcaster_->PublishCluster(cluster, created);
            }
        }
    } catch (const FraudDBError& e) {
        LogPrintf("ThreatClusterEngine: run aborted: %s\n", e.what());
        result.aborted = true;
    }

    result.clustersFound = result.clustersCreated + result.clustersUpdated;
    result.durationMs = GetSteadyTimeMillis() - startSteady;

    LogPrintf("ThreatClusterEngine: analyzed %d threats, %d clusters created, %d updated, %d malformed rows%s (%dms)\n",
              result.threatsAnalyzed, result.clustersCreated, result.clustersUpdated, result.malformedRows,
              result.aborted ? ", aborted" : "", result.durationMs);

    {
        std::lock_guard<std::mutex> lock(resultMutex_);
        lastResult_ = result;
    }
    return result;
}

} // namespace giftguard
