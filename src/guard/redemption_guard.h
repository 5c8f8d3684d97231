// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GIFTGUARD_GUARD_REDEMPTION_GUARD_H
#define GIFTGUARD_GUARD_REDEMPTION_GUARD_H

/**
 * @file redemption_guard.h
 * @brief Per-request allow/deny pipeline for gift-card redemptions
 *
 * Every request passes the same ordered stages:
 *
 *   1. fingerprint extraction
 *   2. IP rate limit
 *   3. device failure limit
 *   4. merchant rate limit (only with a merchant id)
 *   5. replay reservation
 *   6. external redemption, then commit or release
 *
 * The first stage that denies ends the pipeline. A fraud log is written
 * synchronously for every denial and for allowed redemptions from devices
 * with recent failures.
 */

#include <guard/fingerprint.h>
#include <guard/giftcard_store.h>
#include <guard/rate_limiter.h>
#include <fraud/fraud_log.h>

#include <sync.h>

#include <boost/thread.hpp>

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace giftguard {

class AlertBroadcaster;
class ReplayGuard;

// ============================================================================
// Defaults
// ============================================================================

static constexpr uint32_t DEFAULT_IP_LIMIT = 3;
static constexpr int64_t DEFAULT_IP_WINDOW_MS = 60 * 1000;
static constexpr uint32_t DEFAULT_DEVICE_LIMIT = 5;
static constexpr int64_t DEFAULT_DEVICE_WINDOW_MS = 10 * 60 * 1000;
static constexpr uint32_t DEFAULT_DEVICE_SOFT_THRESHOLD = 2;
static constexpr uint32_t DEFAULT_MERCHANT_LIMIT = 10;
static constexpr int64_t DEFAULT_MERCHANT_WINDOW_MS = 5 * 60 * 1000;
static constexpr int64_t DEFAULT_UPSTREAM_TIMEOUT_MS = 2000;

/** Caller-visible messages. Deliberately coarse. */
static const char* const MSG_TOO_MANY_ATTEMPTS = "Too many attempts. Please try again later.";
static const char* const MSG_ALREADY_REDEEMED = "This gift card has already been redeemed.";
static const char* const MSG_NOT_FOUND = "Gift card not found.";
static const char* const MSG_INACTIVE = "Gift card is not active.";
static const char* const MSG_UNAVAILABLE = "Redemption temporarily unavailable.";

struct GuardPolicy {
    RateLimitPolicy ipPolicy;
    /** Limit on failed attempts per device */
    RateLimitPolicy devicePolicy;
    RateLimitPolicy merchantPolicy;
    /** Allowed redemptions from a device with this many failures are logged */
    uint32_t deviceSoftThreshold;
    /** Bound on the gift-card ledger call, enforced by the guard */
    int64_t upstreamTimeoutMs;
    /** Peers whose X-Forwarded-For and X-Real-IP headers are believed */
    std::set<std::string> trustedProxies;

    GuardPolicy()
        : ipPolicy(DEFAULT_IP_LIMIT, DEFAULT_IP_WINDOW_MS)
        , devicePolicy(DEFAULT_DEVICE_LIMIT, DEFAULT_DEVICE_WINDOW_MS)
        , merchantPolicy(DEFAULT_MERCHANT_LIMIT, DEFAULT_MERCHANT_WINDOW_MS)
        , deviceSoftThreshold(DEFAULT_DEVICE_SOFT_THRESHOLD)
        , upstreamTimeoutMs(DEFAULT_UPSTREAM_TIMEOUT_MS)
    {}
};

struct RedemptionRequest {
    RequestMetadata metadata;
    std::string code;
    std::string redeemedBy;
    std::string merchantId;
    /** Cents; 0 redeems the full balance */
    int64_t amount;

    RedemptionRequest() : amount(0) {}
};

enum class DenyReason : uint8_t {
    NONE = 0,
    RATE_LIMITED,
    REPLAYED_CODE,
    INVALID_CODE,
    RESERVATION_CONFLICT,
    UPSTREAM_UNAVAILABLE
};

std::string DenyReasonToString(DenyReason reason);

enum class RequestState : uint8_t {
    RECEIVED = 0,
    FINGERPRINTED,
    RATE_CHECKED,
    REPLAY_CHECKED,
    COMMITTED,
    RELEASED,
    ALLOWED,
    DENIED
};

std::string RequestStateToString(RequestState state);

/**
 * @brief Outcome of one evaluation
 */
struct GuardDecision {
    bool allowed;
    DenyReason reason;
    /** Failure recorded in the fraud log; meaningful only when denied */
    FailureReason failureReason;
    int httpStatus;
    std::string message;
    /** Seconds, set on rate-limit denials */
    int64_t retryAfterSeconds;
    /** Redeemed amount in cents */
    int64_t amount;
    /** Last state reached before the terminal one */
    RequestState lastStage;
    RequestState state;
    /** Id of the fraud log written for this request, 0 if none */
    int64_t fraudLogId;
    Fingerprint fingerprint;

    GuardDecision()
        : allowed(false)
        , reason(DenyReason::NONE)
        , failureReason(FailureReason::SYSTEM_ERROR)
        , httpStatus(500)
        , retryAfterSeconds(0)
        , amount(0)
        , lastStage(RequestState::RECEIVED)
        , state(RequestState::RECEIVED)
        , fraudLogId(0)
    {}

    static GuardDecision Allowed(int64_t amount) {
        GuardDecision d;
        d.allowed = true;
        d.httpStatus = 200;
        d.amount = amount;
        d.state = RequestState::ALLOWED;
        return d;
    }

    static GuardDecision Denied(DenyReason reason, FailureReason failure, int status, const std::string& msg) {
        GuardDecision d;
        d.allowed = false;
        d.reason = reason;
        d.failureReason = failure;
        d.httpStatus = status;
        d.message = msg;
        d.state = RequestState::DENIED;
        return d;
    }
};

/** Fraud log severity for a failure reason */
FraudSeverity SeverityForFailure(FailureReason reason);

/**
 * @brief Redemption pipeline
 *
 * Thread-safe. Atomicity per key comes from the rate limit store and the
 * replay guard. Ledger calls that outlive their deadline keep running on
 * their own thread and are joined when the guard is destroyed, so the
 * gift-card store must outlive the guard.
 */
class RedemptionGuard {
public:
    /**
     * @param rateStore Counter store for all three scopes (not owned)
     * @param replay Reservation cache (not owned)
     * @param cards External gift-card ledger (not owned)
     * @param logStore Fraud log (not owned)
     * @param broadcaster Optional live event publisher (not owned)
     */
    RedemptionGuard(const GuardPolicy& policy, RateLimitStore& rateStore, ReplayGuard& replay,
                    GiftCardStore& cards, FraudLogStore& logStore, AlertBroadcaster* broadcaster = nullptr);
    ~RedemptionGuard();

    RedemptionGuard(const RedemptionGuard&) = delete;
    RedemptionGuard& operator=(const RedemptionGuard&) = delete;

    /** Run the pipeline for one request */
    GuardDecision Evaluate(const RedemptionRequest& request);

    /**
     * @brief Evict idle rate-limit windows and expired reservations
     * @return Number of entries removed
     */
    size_t Sweep(int64_t nowMs);

    const GuardPolicy& GetPolicy() const { return policy_; }

    /** Ledger calls that missed their deadline and have not returned yet */
    size_t PendingLedgerCalls();

private:
    /** Call the ledger, giving up with TIMEOUT after upstreamTimeoutMs */
    RedeemResult RedeemWithDeadline(const RedemptionRequest& request);

    /** Join abandoned ledger calls that have since returned */
    size_t ReapLedgerCalls();

    /** Count a failed attempt against the device; logs once when the limit is reached */
    void RecordDeviceFailure(const RedemptionRequest& request, const Fingerprint& fp, int64_t nowMs);

    /** Append a fraud log and publish it. Returns the id, 0 if the write failed. */
    int64_t WriteFraudLog(const RedemptionRequest& request, const Fingerprint& fp, FailureReason reason,
                          FraudSeverity severity, bool blocked, int64_t nowMs);

    /** Finish a denial: fraud log, device failure accounting */
    GuardDecision& Deny(GuardDecision& decision, const RedemptionRequest& request, const Fingerprint& fp,
                        bool deviceFailure, int64_t nowMs);

    const GuardPolicy policy_;
    RateLimitStore& rateStore_;
    ReplayGuard& replay_;
    GiftCardStore& cards_;
    FraudLogStore& logStore_;
    AlertBroadcaster* broadcaster_;

    CCriticalSection cs_calls_;
    std::vector<std::unique_ptr<boost::thread>> abandonedCalls_;
};

} // namespace giftguard

#endif // GIFTGUARD_GUARD_REDEMPTION_GUARD_H
