// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GIFTGUARD_FRAUD_FRAUD_LOG_H
#define GIFTGUARD_FRAUD_FRAUD_LOG_H

/**
 * @file fraud_log.h
 * @brief Fraud telemetry records
 *
 * A FraudLog is written for every denied redemption and for allowed
 * redemptions that look suspicious. Logs are append-only: once stored they
 * are never modified.
 */

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace giftguard {

// ============================================================================
// Enumerations
// ============================================================================

enum class FailureReason : uint8_t {
    REUSED_CODE = 1,
    INVALID_CODE = 2,
    IP_RATE_LIMIT = 3,
    DEVICE_RATE_LIMIT = 4,
    MERCHANT_RATE_LIMIT = 5,
    SUSPICIOUS_ACTIVITY = 6,
    SYSTEM_ERROR = 7
};

enum class FraudSeverity : uint8_t {
    LOW = 1,
    MEDIUM = 2,
    HIGH = 3
};

std::string FailureReasonToString(FailureReason reason);
bool FailureReasonFromString(const std::string& str, FailureReason& reason);

std::string FraudSeverityToString(FraudSeverity severity);
bool FraudSeverityFromString(const std::string& str, FraudSeverity& severity);

/** Weight used by cluster scoring: LOW=1, MEDIUM=2, HIGH=3 */
inline int SeverityWeight(FraudSeverity severity) { return static_cast<int>(severity); }

/** Where a log row originated */
static const char* const FRAUD_SOURCE_GUARD = "guard";
static const char* const FRAUD_SOURCE_WEBHOOK = "webhook";

// ============================================================================
// Records
// ============================================================================

struct FraudLog {
    /** Assigned by the store; 0 until appended */
    int64_t id;
    std::string ipAddress;
    std::string userAgent;
    std::string deviceFingerprint;
    /** Empty when the request carried no merchant */
    std::string merchantId;
    /** Redacted code, empty when none was attempted */
    std::string codeAttempted;
    FailureReason failureReason;
    FraudSeverity severity;
    bool blocked;
    /** Milliseconds since epoch */
    int64_t timestamp;
    std::string source;

    FraudLog()
        : id(0)
        , failureReason(FailureReason::SUSPICIOUS_ACTIVITY)
        , severity(FraudSeverity::LOW)
        , blocked(true)
        , timestamp(0)
        , source(FRAUD_SOURCE_GUARD)
    {}
};

/**
 * @brief A fraud_logs row as stored, before validation
 *
 * Enum-typed columns are kept as text so that rows written by older or
 * foreign producers can be detected and skipped instead of aborting a read.
 */
struct FraudLogRow {
    int64_t id;
    std::string ipAddress;
    std::string userAgent;
    std::string deviceFingerprint;
    std::string merchantId;
    std::string codeAttempted;
    std::string failureReason;
    std::string severity;
    int64_t blocked;
    int64_t timestamp;
    std::string source;

    FraudLogRow() : id(0), blocked(0), timestamp(0) {}
};

/**
 * @brief Validate and convert a raw row
 * @return false if the row is malformed (unknown enum text, missing
 *         identity, non-positive timestamp)
 */
bool ParseFraudLogRow(const FraudLogRow& row, FraudLog& log);

/** Keep the first four characters of a code and mask the rest */
std::string RedactCode(const std::string& code);

/**
 * @brief Aggregates over the log, as shown to administrators
 */
struct FraudStatistics {
    int64_t totalAttempts;
    int64_t blockedAttempts;
    double blockRate;
    int64_t last24Hours;
    int64_t uniqueIPs;
    /** Most frequent failure reasons in the last 24 hours, highest first */
    std::vector<std::pair<std::string, int64_t>> topReasons;
    /** Attempts per hour over the last 24 hours, oldest bucket first */
    std::vector<int64_t> hourly;

    FraudStatistics() : totalAttempts(0), blockedAttempts(0), blockRate(0.0), last24Hours(0), uniqueIPs(0) {}
};

// ============================================================================
// Store Interface
// ============================================================================

/**
 * @brief Append-only fraud log
 */
class FraudLogStore {
public:
    virtual ~FraudLogStore() = default;

    /**
     * @brief Durably append a log
     * @return Assigned id
     * @throws FraudDBError on storage failure
     */
    virtual int64_t Append(const FraudLog& log) = 0;

    /** Newest logs first. Malformed rows are skipped. */
    virtual std::vector<FraudLog> GetRecent(size_t limit) = 0;

    /**
     * @brief The newest limit raw rows with timestamp >= sinceMs, ordered by (timestamp, id)
     * @param timeoutMs Read deadline; throws FraudDBError when exceeded
     */
    virtual std::vector<FraudLogRow> ReadSince(int64_t sinceMs, size_t limit, int64_t timeoutMs) = 0;

    virtual FraudStatistics GetStatistics(int64_t nowMs) = 0;
};

} // namespace giftguard

#endif // GIFTGUARD_FRAUD_FRAUD_LOG_H
