// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GIFTGUARD_FRAUD_FRAUD_DB_H
#define GIFTGUARD_FRAUD_FRAUD_DB_H

#include <fraud/fraud_cluster.h>
#include <fraud/fraud_log.h>
#include <guard/rate_limiter.h>
#include <guard/replay_guard.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

struct sqlite3;

namespace giftguard {

/** Default deadline for reads issued by background jobs */
static constexpr int64_t DEFAULT_DB_READ_TIMEOUT_MS = 5000;

/** SQLite busy timeout */
static constexpr int DB_BUSY_TIMEOUT_MS = 2000;

static const char* const FRAUD_DB_FILENAME = "fraud.sqlite";

class FraudDBError : public std::runtime_error
{
public:
    explicit FraudDBError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * SQLite-backed fraud telemetry database.
 *
 * Holds fraud logs, clusters and their patterns, digests of redeemed codes
 * and (optionally) rate-limit windows. All access is serialized through one
 * connection mutex. Query methods throw FraudDBError; lifecycle methods
 * return false and log.
 */
class FraudDB : public FraudLogStore, public ClusterStore, public RedeemedCodeStore {
public:
    // Schema version for migrations
    static const int SCHEMA_VERSION = 2;

    FraudDB();
    ~FraudDB();

    FraudDB(const FraudDB&) = delete;
    FraudDB& operator=(const FraudDB&) = delete;

    /** Open (creating if needed) the database at path. ":memory:" is accepted. */
    bool Open(const std::string& path);
    void Close();
    bool IsOpen() const;
    std::string GetPath() const { return dbPath_; }

    // FraudLogStore
    int64_t Append(const FraudLog& log) override;
    std::vector<FraudLog> GetRecent(size_t limit) override;
    std::vector<FraudLogRow> ReadSince(int64_t sinceMs, size_t limit, int64_t timeoutMs) override;
    FraudStatistics GetStatistics(int64_t nowMs) override;

    /** Insert a raw row as-is. Used to import foreign rows and by tests. */
    int64_t AppendRaw(const FraudLogRow& row);

    int64_t CountFraudLogs();

    // ClusterStore
    std::vector<FraudCluster> GetOpenClusters(int64_t sinceMs) override;
    std::set<int64_t> GetAssignedLogIds(int64_t sinceMs) override;
    void WriteCluster(FraudCluster& cluster, std::vector<ClusterPattern>& patterns) override;
    std::vector<FraudCluster> GetClusters(size_t limit) override;
    bool GetCluster(int64_t id, FraudCluster& cluster) override;
    std::vector<ClusterPattern> GetPatterns(int64_t clusterId) override;
    ClusterStats GetClusterStats() override;

    // RedeemedCodeStore
    void StoreRedeemedCode(const std::string& codeDigest, int64_t committedAt) override;
    std::vector<std::string> LoadRedeemedCodes() override;

    // Rate limit windows
    /** Atomically count one event and return the new count of the window */
    uint32_t IncrementRateLimitWindow(const std::string& scope, const std::string& key,
                                      int64_t windowStart, int64_t windowMs, uint32_t limit, int64_t nowMs);
    uint32_t GetRateLimitCount(const std::string& scope, const std::string& key, int64_t windowStart);
    void DeleteRateLimitWindow(const std::string& scope, const std::string& key);
    size_t SweepRateLimitWindows(int64_t nowMs, int64_t idleWindows);
    size_t CountRateLimitWindows();

private:
    sqlite3* db_;
    std::string dbPath_;
    mutable std::mutex dbMutex_;

    bool createSchema();
    bool upgradeSchema(int fromVersion, int toVersion);
    int getSchemaVersion();
    bool setSchemaVersion(int version);
    bool executeSQL(const std::string& sql);
    void requireOpen() const;

    bool beginTransaction();
    bool commitTransaction();
    bool rollbackTransaction();

    int64_t insertFraudLogRow(const FraudLogRow& row);
    std::vector<FraudCluster> queryClusters(const std::string& sql, int64_t param, bool bindParam);
};

/**
 * Rate limit store persisted in the fraud database.
 *
 * Survives restarts and can be shared by several guard processes using the
 * same database file.
 */
class DBRateLimitStore : public RateLimitStore {
public:
    explicit DBRateLimitStore(FraudDB& db) : db_(db) {}

    RateLimitDecision CheckAndIncrement(RateLimitScope scope, const std::string& key,
                                        const RateLimitPolicy& policy, int64_t nowMs) override;
    uint32_t Peek(RateLimitScope scope, const std::string& key, int64_t windowMs, int64_t nowMs) override;
    void Evict(RateLimitScope scope, const std::string& key) override;
    size_t Sweep(int64_t nowMs) override;
    size_t Size() const override;

private:
    FraudDB& db_;
};

} // namespace giftguard

#endif // GIFTGUARD_FRAUD_FRAUD_DB_H
