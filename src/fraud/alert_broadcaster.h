// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GIFTGUARD_FRAUD_ALERT_BROADCASTER_H
#define GIFTGUARD_FRAUD_ALERT_BROADCASTER_H

/**
 * @file alert_broadcaster.h
 * @brief Fan-out of fraud events to live monitoring sessions
 *
 * Each subscribed session owns a bounded queue. Publish() appends to every
 * queue that exists at that moment; sessions that subscribe later never see
 * older events. Delivery is best-effort: when a queue is full the oldest
 * event is dropped.
 *
 * The host drains queues by polling. A polling client gives no disconnect
 * signal, so sessions that stop draining are expired by ExpireIdleSessions().
 */

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace giftguard {

struct FraudCluster;
struct FraudLog;

/** Default number of undelivered events kept per session */
static constexpr size_t DEFAULT_ALERT_QUEUE_SIZE = 100;

/** Sessions that have not drained for this long are dropped by the sweep */
static constexpr int64_t DEFAULT_ALERT_SESSION_TIMEOUT_MS = 5 * 60 * 1000;

enum class AlertEventType : uint8_t {
    FRAUD_ALERT = 1,        // A fraud log was written
    TRANSACTION_FEED = 2,   // A redemption was allowed
    FRAUD_CLUSTER = 3       // A cluster was created or updated
};

/** Wire name of the event: fraud-alert, transaction-feed, fraud-cluster */
std::string AlertEventTypeToString(AlertEventType type);

/**
 * @brief One published event
 */
struct AlertEvent {
    AlertEventType type;
    std::string payload;    // JSON payload
    int64_t timestamp;      // milliseconds

    AlertEvent() : type(AlertEventType::FRAUD_ALERT), timestamp(0) {}
    AlertEvent(AlertEventType t, const std::string& p, int64_t ts)
        : type(t), payload(p), timestamp(ts) {}

    /** {"event":..,"timestamp":..,"data":payload} */
    std::string ToJSON() const;
};

/**
 * @brief A monitoring subscriber
 */
struct AlertSession {
    uint64_t id;
    int64_t connectedAt;
    /** Subscribe or last Drain */
    int64_t lastSeenAt;
    std::string remoteAddr;
    uint64_t dropped;

    AlertSession() : id(0), connectedAt(0), lastSeenAt(0), dropped(0) {}
};

class AlertBroadcaster {
public:
    using SessionCallback = std::function<void(uint64_t sessionId)>;

    explicit AlertBroadcaster(size_t maxQueueSize = DEFAULT_ALERT_QUEUE_SIZE);

    AlertBroadcaster(const AlertBroadcaster&) = delete;
    AlertBroadcaster& operator=(const AlertBroadcaster&) = delete;

    /**
     * @brief Register a new session
     * @param remoteAddr Peer address, for logging
     * @return Session id, never 0
     */
    uint64_t Subscribe(const std::string& remoteAddr);

    /**
     * @brief Drop a session and its undelivered events
     * @return false if the session was unknown
     */
    bool Unsubscribe(uint64_t sessionId);

    bool HasSession(uint64_t sessionId) const;

    /** Take all queued events of a session, oldest first. Marks the session as alive. */
    std::vector<AlertEvent> Drain(uint64_t sessionId);

    /**
     * @brief Unsubscribe sessions not drained since nowMs - idleMs
     * @return Number of sessions removed
     */
    size_t ExpireIdleSessions(int64_t nowMs, int64_t idleMs);

    /** Append to every live session queue */
    void Publish(const AlertEvent& event);

    size_t GetSubscriberCount() const;
    std::vector<AlertSession> GetSessions() const;
    size_t GetMaxQueueSize() const { return maxQueueSize_; }

    void OnSubscribe(SessionCallback callback);
    void OnUnsubscribe(SessionCallback callback);

    // ========================================================================
    // Convenience publishers
    // ========================================================================

    void PublishFraudAlert(const FraudLog& log);
    void PublishTransaction(const std::string& redactedCode, const std::string& merchantId,
                            int64_t amount, int64_t timestampMs);
    void PublishCluster(const FraudCluster& cluster, bool created);

private:
    const size_t maxQueueSize_;
    std::atomic<uint64_t> nextSessionId_;

    mutable std::mutex mutex_;
    std::map<uint64_t, AlertSession> sessions_;
    std::map<uint64_t, std::vector<AlertEvent>> queues_;

    std::vector<SessionCallback> subscribeCallbacks_;
    std::vector<SessionCallback> unsubscribeCallbacks_;
};

/** Escape a string for embedding in a JSON string literal */
std::string EscapeJSONString(const std::string& str);

} // namespace giftguard

#endif // GIFTGUARD_FRAUD_ALERT_BROADCASTER_H
