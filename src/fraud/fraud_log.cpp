// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fraud/fraud_log.h>

#include <algorithm>

namespace giftguard {

static const std::pair<FailureReason, const char*> FAILURE_REASON_NAMES[] = {
    {FailureReason::REUSED_CODE, "reused_code"},
    {FailureReason::INVALID_CODE, "invalid_code"},
    {FailureReason::IP_RATE_LIMIT, "ip_rate_limit"},
    {FailureReason::DEVICE_RATE_LIMIT, "device_rate_limit"},
    {FailureReason::MERCHANT_RATE_LIMIT, "merchant_rate_limit"},
    {FailureReason::SUSPICIOUS_ACTIVITY, "suspicious_activity"},
    {FailureReason::SYSTEM_ERROR, "system_error"},
};

std::string FailureReasonToString(FailureReason reason)
{
    for (const auto& entry : FAILURE_REASON_NAMES) {
        if (entry.first == reason) return entry.second;
    }
    return "unknown";
}

bool FailureReasonFromString(const std::string& str, FailureReason& reason)
{
    for (const auto& entry : FAILURE_REASON_NAMES) {
        if (str == entry.second) {
            reason = entry.first;
            return true;
        }
    }
    return false;
}

std::string FraudSeverityToString(FraudSeverity severity)
{
    switch (severity) {
        case FraudSeverity::LOW: return "low";
        case FraudSeverity::MEDIUM: return "medium";
        case FraudSeverity::HIGH: return "high";
    }
    return "unknown";
}

bool FraudSeverityFromString(const std::string& str, FraudSeverity& severity)
{
    if (str == "low") {
        severity = FraudSeverity::LOW;
    } else if (str == "medium") {
        severity = FraudSeverity::MEDIUM;
    } else if (str == "high") {
        severity = FraudSeverity::HIGH;
    } else {
        return false;
    }
    return true;
}

bool ParseFraudLogRow(const FraudLogRow& row, FraudLog& log)
{
    if (row.id <= 0 || row.timestamp <= 0 || row.ipAddress.empty()) {
        return false;
    }
    if (!FailureReasonFromString(row.failureReason, log.failureReason)) {
        return false;
    }
    if (!FraudSeverityFromString(row.severity, log.severity)) {
        return false;
    }

    log.id = row.id;
    log.ipAddress = row.ipAddress;
    log.userAgent = row.userAgent;
    log.deviceFingerprint = row.deviceFingerprint;
    log.merchantId = row.merchantId;
    log.codeAttempted = row.codeAttempted;
    log.blocked = row.blocked != 0;
    log.timestamp = row.timestamp;
    log.source = row.source.empty() ? FRAUD_SOURCE_GUARD : row.source;
    return true;
}

std::string RedactCode(const std::string& code)
{
    if (code.empty()) return code;
    // Never reveal more than half of a short code.
    return code.substr(0, std::min<size_t>(4, code.size() / 2)) + "****";
}

} // namespace giftguard
