// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <guard/redemption_guard.h>

#include <fraud/alert_broadcaster.h>
#include <guard/giftcard_store.h>
#include <guard/replay_guard.h>
#include <util.h>

#include <boost/chrono/chrono.hpp>

#include <stdexcept>

namespace giftguard {

std::string DenyReasonToString(DenyReason reason)
{
    switch (reason) {
        case DenyReason::NONE: return "none";
        case DenyReason::RATE_LIMITED: return "rate_limited";
        case DenyReason::REPLAYED_CODE: return "replayed_code";
        case DenyReason::INVALID_CODE: return "invalid_code";
        case DenyReason::RESERVATION_CONFLICT: return "reservation_conflict";
        case DenyReason::UPSTREAM_UNAVAILABLE: return "upstream_unavailable";
    }
    return "unknown";
}

std::string RequestStateToString(RequestState state)
{
    switch (state) {
        case RequestState::RECEIVED: return "received";
        case RequestState::FINGERPRINTED: return "fingerprinted";
        case RequestState::RATE_CHECKED: return "rate_checked";
        case RequestState::REPLAY_CHECKED: return "replay_checked";
        case RequestState::COMMITTED: return "committed";
        case RequestState::RELEASED: return "released";
        case RequestState::ALLOWED: return "allowed";
        case RequestState::DENIED: return "denied";
    }
    return "unknown";
}

FraudSeverity SeverityForFailure(FailureReason reason)
{
    switch (reason) {
        case FailureReason::REUSED_CODE:
        case FailureReason::DEVICE_RATE_LIMIT:
            return FraudSeverity::HIGH;
        case FailureReason::IP_RATE_LIMIT:
        case FailureReason::MERCHANT_RATE_LIMIT:
        case FailureReason::SUSPICIOUS_ACTIVITY:
            return FraudSeverity::MEDIUM;
        case FailureReason::INVALID_CODE:
        case FailureReason::SYSTEM_ERROR:
            return FraudSeverity::LOW;
    }
    return FraudSeverity::LOW;
}

RedemptionGuard::RedemptionGuard(const GuardPolicy& policy, RateLimitStore& rateStore, ReplayGuard& replay,
                                 GiftCardStore& cards, FraudLogStore& logStore, AlertBroadcaster* broadcaster)
    : policy_(policy)
    , rateStore_(rateStore)
    , replay_(replay)
    , cards_(cards)
    , logStore_(logStore)
    , broadcaster_(broadcaster)
{
}

RedemptionGuard::~RedemptionGuard()
{
    std::vector<std::unique_ptr<boost::thread>> calls;
    {
        LOCK(cs_calls_);
        calls.swap(abandonedCalls_);
    }
    for (const auto& call : calls) {
        call->interrupt();
    }
    for (const auto& call : calls) {
        call->join();
    }
}

namespace {

/** Result slot shared between the guard and one ledger call */
struct LedgerCall {
    boost::mutex mutex;
    boost::condition_variable cond;
    bool done;
    RedeemResult result;

    LedgerCall() : done(false) {}
};

} // anonymous namespace

RedeemResult RedemptionGuard::RedeemWithDeadline(const RedemptionRequest& request)
{
    std::shared_ptr<LedgerCall> call = std::make_shared<LedgerCall>();
    GiftCardStore& cards = cards_;
    const std::string code = request.code;
    const std::string redeemedBy = request.redeemedBy;
    const int64_t amount = request.amount;
    const int64_t timeoutMs = policy_.upstreamTimeoutMs;

    std::unique_ptr<boost::thread> thread(new boost::thread([call, &cards, code, redeemedBy, amount, timeoutMs]() {
        RedeemResult result;
        try {
            result = cards.Redeem(code, redeemedBy, amount, timeoutMs);
        } catch (const std::exception& e) {
            LogPrintf("RedemptionGuard: gift-card store failure: %s\n", e.what());
            result = RedeemResult(RedeemStatus::UNAVAILABLE, 0, e.what());
        }
        boost::unique_lock<boost::mutex> lock(call->mutex);
        call->result = result;
        call->done = true;
        call->cond.notify_all();
    }));

    bool finished;
    {
        boost::unique_lock<boost::mutex> lock(call->mutex);
        finished = call->cond.wait_for(lock, boost::chrono::milliseconds(timeoutMs),
                                       [&call]() { return call->done; });
    }

    if (!finished) {
        LogPrintf("RedemptionGuard: gift-card ledger did not answer %s within %dms\n",
                  RedactCode(request.code), timeoutMs);
        LOCK(cs_calls_);
        abandonedCalls_.push_back(std::move(thread));
        return RedeemResult(RedeemStatus::TIMEOUT, 0, "deadline exceeded");
    }

    thread->join();
    boost::unique_lock<boost::mutex> lock(call->mutex);
    return call->result;
}

size_t RedemptionGuard::ReapLedgerCalls()
{
    LOCK(cs_calls_);
    size_t reaped = 0;
    for (auto it = abandonedCalls_.begin(); it != abandonedCalls_.end();) {
        if ((*it)->try_join_for(boost::chrono::milliseconds(0))) {
            it = abandonedCalls_.erase(it);
            reaped++;
        } else {
            ++it;
        }
    }
    return reaped;
}

size_t RedemptionGuard::PendingLedgerCalls()
{
    ReapLedgerCalls();
    LOCK(cs_calls_);
    return abandonedCalls_.size();
}

int64_t RedemptionGuard::WriteFraudLog(const RedemptionRequest& request, const Fingerprint& fp,
                                       FailureReason reason, FraudSeverity severity, bool blocked, int64_t nowMs)
{
    FraudLog log;
    log.ipAddress = fp.ip;
    log.userAgent = fp.userAgent;
    log.deviceFingerprint = fp.deviceId;
    log.merchantId = request.merchantId;
    log.codeAttempted = RedactCode(request.code);
    log.failureReason = reason;
    log.severity = severity;
    log.blocked = blocked;
    log.timestamp = nowMs;
    log.source = FRAUD_SOURCE_GUARD;

    try {
        log.id = logStore_.Append(log);
    } catch (const std::exception& e) {
        LogPrintf("RedemptionGuard: failed to write fraud log (%s): %s\n",
                  FailureReasonToString(reason), e.what());
        return 0;
    }

    if (broadcaster_) {
        broadcaster_->PublishFraudAlert(log);
    }
    return log.id;
}

void RedemptionGuard::RecordDeviceFailure(const RedemptionRequest& request, const Fingerprint& fp, int64_t nowMs)
{
    RateLimitDecision failures;
    try {
        failures = rateStore_.CheckAndIncrement(RateLimitScope::DEVICE, fp.deviceId, policy_.devicePolicy, nowMs);
    } catch (const std::exception& e) {
        LogPrintf("RedemptionGuard: failed to count device failure: %s\n", e.what());
        return;
    }

    LogPrint(BCLog::GUARD, "RedemptionGuard: device %s failures %u/%u\n",
             fp.deviceId, failures.count, policy_.devicePolicy.limit);

    if (failures.count == policy_.devicePolicy.limit) {
        WriteFraudLog(request, fp, FailureReason::SUSPICIOUS_ACTIVITY, FraudSeverity::HIGH, false, nowMs);
    }
}

GuardDecision& RedemptionGuard::Deny(GuardDecision& decision, const RedemptionRequest& request,
                                     const Fingerprint& fp, bool deviceFailure, int64_t nowMs)
{
    decision.fingerprint = fp;
    decision.fraudLogId = WriteFraudLog(request, fp, decision.failureReason,
                                        SeverityForFailure(decision.failureReason), true, nowMs);
    if (deviceFailure) {
        RecordDeviceFailure(request, fp, nowMs);
    }

    LogPrint(BCLog::GUARD, "RedemptionGuard: denied %s from %s (%s, stage %s)\n",
             RedactCode(request.code), fp.ip, DenyReasonToString(decision.reason),
             RequestStateToString(decision.lastStage));
    return decision;
}

GuardDecision RedemptionGuard::Evaluate(const RedemptionRequest& request)
{
    const int64_t nowMs = GetTimeMillis();
    RequestState stage = RequestState::RECEIVED;

    // 1. Fingerprint
    const Fingerprint fp = ExtractFingerprint(request.metadata, policy_.trustedProxies);
    stage = RequestState::FINGERPRINTED;

    // 2-4. Rate limits. A store failure fails closed.
    try {
        RateLimitDecision ip = rateStore_.CheckAndIncrement(RateLimitScope::IP, fp.ip, policy_.ipPolicy, nowMs);
        if (!ip.allowed) {
            GuardDecision d = GuardDecision::Denied(DenyReason::RATE_LIMITED, FailureReason::IP_RATE_LIMIT,
                                                    429, MSG_TOO_MANY_ATTEMPTS);
            d.retryAfterSeconds = ip.RetryAfterSeconds();
            d.lastStage = stage;
            return Deny(d, request, fp, false, nowMs);
        }

        uint32_t failures = rateStore_.Peek(RateLimitScope::DEVICE, fp.deviceId,
                                            policy_.devicePolicy.windowMs, nowMs);
        if (failures >= policy_.devicePolicy.limit) {
            const int64_t windowStart = WindowStartFor(nowMs, policy_.devicePolicy.windowMs);
            RateLimitDecision device = RateLimitDecision::Denied(failures, policy_.devicePolicy.limit, windowStart,
                                                                 windowStart + policy_.devicePolicy.windowMs - nowMs);
            GuardDecision d = GuardDecision::Denied(DenyReason::RATE_LIMITED, FailureReason::DEVICE_RATE_LIMIT,
                                                    429, MSG_TOO_MANY_ATTEMPTS);
            d.retryAfterSeconds = device.RetryAfterSeconds();
            d.lastStage = stage;
            return Deny(d, request, fp, false, nowMs);
        }

        if (!request.merchantId.empty()) {
            RateLimitDecision merchant = rateStore_.CheckAndIncrement(RateLimitScope::MERCHANT, request.merchantId,
                                                                      policy_.merchantPolicy, nowMs);
            if (!merchant.allowed) {
                GuardDecision d = GuardDecision::Denied(DenyReason::RATE_LIMITED, FailureReason::MERCHANT_RATE_LIMIT,
                                                        429, MSG_TOO_MANY_ATTEMPTS);
                d.retryAfterSeconds = merchant.RetryAfterSeconds();
                d.lastStage = stage;
                return Deny(d, request, fp, false, nowMs);
            }
        }
    } catch (const std::exception& e) {
        LogPrintf("RedemptionGuard: rate limit store failure: %s\n", e.what());
        GuardDecision d = GuardDecision::Denied(DenyReason::UPSTREAM_UNAVAILABLE, FailureReason::SYSTEM_ERROR,
                                                503, MSG_UNAVAILABLE);
        d.lastStage = stage;
        return Deny(d, request, fp, false, nowMs);
    }
    stage = RequestState::RATE_CHECKED;

    // 5. Replay reservation
    ReserveResult reserve = replay_.Reserve(request.code, nowMs);
    if (reserve == ReserveResult::ALREADY_REDEEMED) {
        GuardDecision d = GuardDecision::Denied(DenyReason::REPLAYED_CODE, FailureReason::REUSED_CODE,
                                                403, MSG_ALREADY_REDEEMED);
        d.lastStage = stage;
        return Deny(d, request, fp, true, nowMs);
    }
    if (reserve == ReserveResult::ALREADY_RESERVED) {
        GuardDecision d = GuardDecision::Denied(DenyReason::RESERVATION_CONFLICT, FailureReason::REUSED_CODE,
                                                403, MSG_ALREADY_REDEEMED);
        d.lastStage = stage;
        return Deny(d, request, fp, true, nowMs);
    }
    stage = RequestState::REPLAY_CHECKED;

    // 6. External redemption
    RedeemResult redeemed = RedeemWithDeadline(request);

    switch (redeemed.status) {
        case RedeemStatus::REDEEMED: {
            if (!replay_.Commit(request.code, nowMs)) {
                LogPrintf("RedemptionGuard: redeemed code %s could not be stored durably\n", RedactCode(request.code));
            }

            GuardDecision d = GuardDecision::Allowed(redeemed.amount);
            d.lastStage = RequestState::COMMITTED;
            d.fingerprint = fp;

            uint32_t failures = 0;
            try {
                failures = rateStore_.Peek(RateLimitScope::DEVICE, fp.deviceId, policy_.devicePolicy.windowMs, nowMs);
            } catch (const std::exception& e) {
                LogPrintf("RedemptionGuard: failed to read device failures: %s\n", e.what());
            }
            if (policy_.deviceSoftThreshold > 0 && failures >= policy_.deviceSoftThreshold) {
                d.fraudLogId = WriteFraudLog(request, fp, FailureReason::SUSPICIOUS_ACTIVITY,
                                             FraudSeverity::MEDIUM, false, nowMs);
            }

            if (broadcaster_) {
                broadcaster_->PublishTransaction(RedactCode(request.code), request.merchantId, redeemed.amount, nowMs);
            }
            LogPrint(BCLog::GUARD, "RedemptionGuard: redeemed %s for %d from %s\n",
                     RedactCode(request.code), redeemed.amount, fp.ip);
            return d;
        }
        case RedeemStatus::NOT_FOUND: {
            replay_.Release(request.code);
            GuardDecision d = GuardDecision::Denied(DenyReason::INVALID_CODE, FailureReason::INVALID_CODE,
                                                    404, MSG_NOT_FOUND);
            d.lastStage = RequestState::RELEASED;
            return Deny(d, request, fp, true, nowMs);
        }
        case RedeemStatus::INACTIVE: {
            replay_.Release(request.code);
            GuardDecision d = GuardDecision::Denied(DenyReason::INVALID_CODE, FailureReason::INVALID_CODE,
                                                    400, MSG_INACTIVE);
            d.lastStage = RequestState::RELEASED;
            return Deny(d, request, fp, true, nowMs);
        }
        case RedeemStatus::ALREADY_REDEEMED: {
            if (!replay_.Commit(request.code, nowMs)) {
                LogPrintf("RedemptionGuard: redeemed code %s could not be stored durably\n", RedactCode(request.code));
            }
            GuardDecision d = GuardDecision::Denied(DenyReason::REPLAYED_CODE, FailureReason::REUSED_CODE,
                                                    403, MSG_ALREADY_REDEEMED);
            d.lastStage = RequestState::COMMITTED;
            return Deny(d, request, fp, true, nowMs);
        }
        case RedeemStatus::UNAVAILABLE: {
            replay_.Release(request.code);
            GuardDecision d = GuardDecision::Denied(DenyReason::UPSTREAM_UNAVAILABLE, FailureReason::SYSTEM_ERROR,
                                                    503, MSG_UNAVAILABLE);
            d.lastStage = RequestState::RELEASED;
            return Deny(d, request, fp, false, nowMs);
        }
        case RedeemStatus::TIMEOUT: {
            // The ledger may still complete the redemption; the reservation
            // stays until it expires.
            GuardDecision d = GuardDecision::Denied(DenyReason::UPSTREAM_UNAVAILABLE, FailureReason::SYSTEM_ERROR,
                                                    503, MSG_UNAVAILABLE);
            d.lastStage = stage;
            return Deny(d, request, fp, false, nowMs);
        }
    }

    replay_.Release(request.code);
    GuardDecision d = GuardDecision::Denied(DenyReason::UPSTREAM_UNAVAILABLE, FailureReason::SYSTEM_ERROR,
                                            503, MSG_UNAVAILABLE);
    d.lastStage = RequestState::RELEASED;
    return Deny(d, request, fp, false, nowMs);
}

size_t RedemptionGuard::Sweep(int64_t nowMs)
{
    size_t removed = 0;
    try {
        removed += rateStore_.Sweep(nowMs);
    } catch (const std::exception& e) {
        LogPrintf("RedemptionGuard: rate limit sweep failed: %s\n", e.what());
    }
    removed += replay_.Sweep(nowMs);
    ReapLedgerCalls();
    LogPrint(BCLog::RATELIMIT, "RedemptionGuard: sweep removed %u entries\n", removed);
    return removed;
}

} // namespace giftguard
