// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fraud/alert_broadcaster.h>

#include <fraud/fraud_cluster.h>
#include <fraud/fraud_log.h>
#include <util.h>

#include <iomanip>
#include <sstream>

namespace giftguard {

std::string AlertEventTypeToString(AlertEventType type)
{
    switch (type) {
        case AlertEventType::FRAUD_ALERT: return "fraud-alert";
        case AlertEventType::TRANSACTION_FEED: return "transaction-feed";
        case AlertEventType::FRAUD_CLUSTER: return "fraud-cluster";
    }
    return "unknown";
}

std::string EscapeJSONString(const std::string& str)
{
    std::ostringstream ss;
    for (unsigned char c : str) {
        switch (c) {
            case '"': ss << "\\\""; break;
            case '\\': ss << "\\\\"; break;
            case '\n': ss << "\\n"; break;
            case '\r': ss << "\\r"; break;
            case '\t': ss << "\\t"; break;
            default:
                if (c < 0x20) {
                    ss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
                       << std::dec << std::setfill(' ');
                } else {
                    ss << c;
                }
        }
    }
    return ss.str();
}

std::string AlertEvent::ToJSON() const
{
    std::ostringstream json;
    json << "{";
    json << "\"event\":\"" << AlertEventTypeToString(type) << "\",";
    json << "\"timestamp\":" << timestamp << ",";
    json << "\"data\":" << (payload.empty() ? "{}" : payload);
    json << "}";
    return json.str();
}

// ============================================================================
// AlertBroadcaster
// ============================================================================

AlertBroadcaster::AlertBroadcaster(size_t maxQueueSize)
    : maxQueueSize_(maxQueueSize == 0 ? 1 : maxQueueSize)
    , nextSessionId_(1)
{
}

uint64_t AlertBroadcaster::Subscribe(const std::string& remoteAddr)
{
    std::vector<SessionCallback> callbacks;
    AlertSession session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session.id = nextSessionId_.fetch_add(1);
        session.connectedAt = GetTimeMillis();
        session.lastSeenAt = session.connectedAt;
        session.remoteAddr = remoteAddr;
        sessions_[session.id] = session;
        queues_[session.id] = std::vector<AlertEvent>();
        callbacks = subscribeCallbacks_;
    }

    for (const auto& callback : callbacks) {
        callback(session.id);
    }

    LogPrint(BCLog::ALERT, "AlertBroadcaster: session %d subscribed from %s\n", session.id, remoteAddr);
    return session.id;
}

bool AlertBroadcaster::Unsubscribe(uint64_t sessionId)
{
    std::vector<SessionCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sessions_.erase(sessionId) == 0) {
            return false;
        }
        queues_.erase(sessionId);
        callbacks = unsubscribeCallbacks_;
    }

    for (const auto& callback : callbacks) {
        callback(sessionId);
    }

    LogPrint(BCLog::ALERT, "AlertBroadcaster: session %d unsubscribed\n", sessionId);
    return true;
}

bool AlertBroadcaster::HasSession(uint64_t sessionId) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(sessionId) > 0;
}

std::vector<AlertEvent> AlertBroadcaster::Drain(uint64_t sessionId)
{
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<AlertEvent> events;
    auto it = queues_.find(sessionId);
    if (it != queues_.end()) {
        events = std::move(it->second);
        it->second.clear();
    }
    auto session = sessions_.find(sessionId);
    if (session != sessions_.end()) {
        session->second.lastSeenAt = GetTimeMillis();
    }
    return events;
}

size_t AlertBroadcaster::ExpireIdleSessions(int64_t nowMs, int64_t idleMs)
{
    std::vector<uint64_t> idle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : sessions_) {
            if (nowMs - entry.second.lastSeenAt >= idleMs) {
                idle.push_back(entry.first);
            }
        }
    }

    size_t removed = 0;
    for (uint64_t sessionId : idle) {
        if (Unsubscribe(sessionId)) {
            LogPrint(BCLog::ALERT, "AlertBroadcaster: session %d expired after %ds idle\n", sessionId, idleMs / 1000);
            removed++;
        }
    }
    return removed;
}

void AlertBroadcaster::Publish(const AlertEvent& event)
{
    std::lock_guard<std::mutex> lock(mutex_);

    for (auto& entry : queues_) {
        std::vector<AlertEvent>& queue = entry.second;
        queue.push_back(event);

        // Bounded queue: drop the oldest
        if (queue.size() > maxQueueSize_) {
            queue.erase(queue.begin());
            auto session = sessions_.find(entry.first);
            if (session != sessions_.end()) {
                session->second.dropped++;
            }
        }
    }

    LogPrint(BCLog::ALERT, "AlertBroadcaster: published %s to %u sessions\n",
             AlertEventTypeToString(event.type), queues_.size());
}

size_t AlertBroadcaster::GetSubscriberCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<AlertSession> AlertBroadcaster::GetSessions() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AlertSession> result;
    result.reserve(sessions_.size());
    for (const auto& entry : sessions_) {
        result.push_back(entry.second);
    }
    return result;
}

void AlertBroadcaster::OnSubscribe(SessionCallback callback)
{
    std::lock_guard<std::mutex> lock(mutex_);
    subscribeCallbacks_.push_back(callback);
}

void AlertBroadcaster::OnUnsubscribe(SessionCallback callback)
{
    std::lock_guard<std::mutex> lock(mutex_);
    unsubscribeCallbacks_.push_back(callback);
}

// ============================================================================
// Convenience publishers
// ============================================================================

void AlertBroadcaster::PublishFraudAlert(const FraudLog& log)
{
    std::ostringstream payload;
    payload << "{";
    payload << "\"id\":" << log.id << ",";
    payload << "\"ipAddress\":\"" << EscapeJSONString(log.ipAddress) << "\",";
    payload << "\"deviceFingerprint\":\"" << EscapeJSONString(log.deviceFingerprint) << "\",";
    payload << "\"merchantId\":\"" << EscapeJSONString(log.merchantId) << "\",";
    payload << "\"codeAttempted\":\"" << EscapeJSONString(log.codeAttempted) << "\",";
    payload << "\"failureReason\":\"" << FailureReasonToString(log.failureReason) << "\",";
    payload << "\"severity\":\"" << FraudSeverityToString(log.severity) << "\",";
    payload << "\"blocked\":" << (log.blocked ? "true" : "false") << ",";
    payload << "\"source\":\"" << EscapeJSONString(log.source) << "\"";
    payload << "}";

    Publish(AlertEvent(AlertEventType::FRAUD_ALERT, payload.str(), log.timestamp));
}

void AlertBroadcaster::PublishTransaction(const std::string& redactedCode, const std::string& merchantId,
                                          int64_t amount, int64_t timestampMs)
{
    std::ostringstream payload;
    payload << "{";
    payload << "\"code\":\"" << EscapeJSONString(redactedCode) << "\",";
    payload << "\"merchantId\":\"" << EscapeJSONString(merchantId) << "\",";
    payload << "\"amount\":" << amount;
    payload << "}";

    Publish(AlertEvent(AlertEventType::TRANSACTION_FEED, payload.str(), timestampMs));
}

void AlertBroadcaster::PublishCluster(const FraudCluster& cluster, bool created)
{
    std::ostringstream payload;
    payload << "{";
    payload << "\"id\":" << cluster.id << ",";
    payload << "\"label\":\"" << EscapeJSONString(cluster.label) << "\",";
    payload << "\"patternType\":\"" << ClusterPatternTypeToString(cluster.patternType) << "\",";
    payload << "\"score\":" << std::fixed << std::setprecision(2) << cluster.score << ",";
    payload << "\"severity\":" << cluster.severity << ",";
    payload << "\"threatCount\":" << cluster.threatCount << ",";
    payload << "\"created\":" << (created ? "true" : "false");
    payload << "}";

    Publish(AlertEvent(AlertEventType::FRAUD_CLUSTER, payload.str(), cluster.updatedAt));
}

} // namespace giftguard
