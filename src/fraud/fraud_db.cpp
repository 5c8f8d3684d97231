// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fraud/fraud_db.h>

#include <util.h>
#include <utilstrencodings.h>

#include <sqlite3.h>

#include <algorithm>
#include <ctime>
#include <sstream>

namespace giftguard {

// Static member definition
const int FraudDB::SCHEMA_VERSION;

static const int64_t MS_PER_HOUR = 60 * 60 * 1000;
static const int64_t STATS_WINDOW_MS = 24 * MS_PER_HOUR;
static const size_t STATS_TOP_REASONS = 5;

// SQL column lists (used in multiple places to avoid duplication)
static const char* FRAUD_LOG_COLUMNS =
    "id, ip_address, user_agent, device_fingerprint, merchant_id, code_attempted, "
    "failure_reason, severity, blocked, timestamp, source";

static const char* CLUSTER_COLUMNS =
    "id, label, pattern_type, group_key, score, severity, threat_count, unique_ips, "
    "unique_devices, time_span_ms, first_seen, last_seen, threat_types, created_at, updated_at";

namespace {

/** Prepared statement, finalized on scope exit */
class Statement
{
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db), stmt_(nullptr)
    {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            throw FraudDBError(strprintf("failed to prepare statement: %s", sqlite3_errmsg(db)));
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void BindText(int idx, const std::string& value)
    {
        sqlite3_bind_text(stmt_, idx, value.c_str(), -1, SQLITE_TRANSIENT);
    }
    void BindOptionalText(int idx, const std::string& value)
    {
        if (value.empty()) {
            sqlite3_bind_null(stmt_, idx);
        } else {
            BindText(idx, value);
        }
    }
    void BindInt64(int idx, int64_t value) { sqlite3_bind_int64(stmt_, idx, value); }
    void BindDouble(int idx, double value) { sqlite3_bind_double(stmt_, idx, value); }

    /** Step once; returns true while a row is available */
    bool StepRow()
    {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        if (rc == SQLITE_INTERRUPT) {
            throw FraudDBError("read deadline exceeded");
        }
        throw FraudDBError(strprintf("step failed: %s", sqlite3_errmsg(db_)));
    }

    /** Run a statement that returns no rows */
    void Execute()
    {
        int rc = sqlite3_step(stmt_);
        if (rc != SQLITE_DONE) {
            throw FraudDBError(strprintf("execute failed: %s", sqlite3_errmsg(db_)));
        }
    }

    std::string ColumnText(int idx)
    {
        const unsigned char* text = sqlite3_column_text(stmt_, idx);
        return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
    }
    int64_t ColumnInt64(int idx) { return sqlite3_column_int64(stmt_, idx); }
    double ColumnDouble(int idx) { return sqlite3_column_double(stmt_, idx); }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_;
};

/** Installs a progress handler that interrupts statements after a deadline */
class ReadDeadline
{
public:
    ReadDeadline(sqlite3* db, int64_t timeoutMs) : db_(db), deadline_(GetSteadyTimeMillis() + timeoutMs)
    {
        if (timeoutMs > 0) {
            sqlite3_progress_handler(db_, 1000, &ReadDeadline::Check, this);
        }
    }
    ~ReadDeadline() { sqlite3_progress_handler(db_, 0, nullptr, nullptr); }

private:
    static int Check(void* arg)
    {
        const ReadDeadline* self = static_cast<const ReadDeadline*>(arg);
        return GetSteadyTimeMillis() > self->deadline_ ? 1 : 0;
    }

    sqlite3* db_;
    int64_t deadline_;
};

FraudLogRow ReadFraudLogRow(Statement& stmt)
{
    FraudLogRow row;
    row.id = stmt.ColumnInt64(0);
    row.ipAddress = stmt.ColumnText(1);
    row.userAgent = stmt.ColumnText(2);
    row.deviceFingerprint = stmt.ColumnText(3);
    row.merchantId = stmt.ColumnText(4);
    row.codeAttempted = stmt.ColumnText(5);
    row.failureReason = stmt.ColumnText(6);
    row.severity = stmt.ColumnText(7);
    row.blocked = stmt.ColumnInt64(8);
    row.timestamp = stmt.ColumnInt64(9);
    row.source = stmt.ColumnText(10);
    return row;
}

std::string JoinThreatTypes(const std::vector<std::string>& types)
{
    std::string out;
    for (const std::string& t : types) {
        if (!out.empty()) out += ',';
        out += t;
    }
    return out;
}

std::vector<std::string> SplitThreatTypes(const std::string& joined)
{
    std::vector<std::string> types;
    if (joined.empty()) return types;
    for (const std::string& t : SplitString(joined, ',')) {
        if (!t.empty()) types.push_back(t);
    }
    return types;
}

FraudCluster ReadClusterRow(Statement& stmt)
{
    FraudCluster cluster;
    cluster.id = stmt.ColumnInt64(0);
    cluster.label = stmt.ColumnText(1);
    if (!ClusterPatternTypeFromString(stmt.ColumnText(2), cluster.patternType)) {
        throw FraudDBError(strprintf("cluster %d has unknown pattern type", cluster.id));
    }
    cluster.groupKey = stmt.ColumnText(3);
    cluster.score = stmt.ColumnDouble(4);
    cluster.severity = static_cast<int>(stmt.ColumnInt64(5));
    cluster.threatCount = stmt.ColumnInt64(6);
    cluster.metadata.uniqueIPs = stmt.ColumnInt64(7);
    cluster.metadata.uniqueDevices = stmt.ColumnInt64(8);
    cluster.metadata.timeSpanMs = stmt.ColumnInt64(9);
    cluster.metadata.firstSeenMs = stmt.ColumnInt64(10);
    cluster.metadata.lastSeenMs = stmt.ColumnInt64(11);
    cluster.metadata.threatTypes = SplitThreatTypes(stmt.ColumnText(12));
    cluster.createdAt = stmt.ColumnInt64(13);
    cluster.updatedAt = stmt.ColumnInt64(14);
    return cluster;
}

} // anonymous namespace

// ============================================================================
// Lifecycle
// ============================================================================

FraudDB::FraudDB() : db_(nullptr)
{
}

FraudDB::~FraudDB()
{
    Close();
}

bool FraudDB::Open(const std::string& path)
{
    std::lock_guard<std::mutex> lock(dbMutex_);

    if (db_ != nullptr) {
        return true; // Already initialized
    }

    dbPath_ = path;

    int rc = sqlite3_open(dbPath_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        LogPrintf("FraudDB: Failed to open database: %s\n", sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_busy_timeout(db_, DB_BUSY_TIMEOUT_MS);

    // Enable WAL mode for better concurrency
    executeSQL("PRAGMA journal_mode=WAL;");
    executeSQL("PRAGMA synchronous=NORMAL;");
    executeSQL("PRAGMA foreign_keys=ON;");

    // Create or upgrade schema
    int currentVersion = getSchemaVersion();
    if (currentVersion < 0) {
        if (!createSchema()) {
            LogPrintf("FraudDB: Failed to create schema\n");
            sqlite3_close(db_);
            db_ = nullptr;
            return false;
        }
    } else if (currentVersion < SCHEMA_VERSION) {
        if (!upgradeSchema(currentVersion, SCHEMA_VERSION)) {
            LogPrintf("FraudDB: Failed to upgrade schema from %d to %d\n",
                      currentVersion, SCHEMA_VERSION);
            sqlite3_close(db_);
            db_ = nullptr;
            return false;
        }
    }

    LogPrintf("FraudDB: Initialized at %s\n", dbPath_);
    return true;
}

void FraudDB::Close()
{
    std::lock_guard<std::mutex> lock(dbMutex_);

    if (db_ != nullptr) {
        sqlite3_close(db_);
        db_ = nullptr;
        LogPrintf("FraudDB: Shutdown complete\n");
    }
}

bool FraudDB::IsOpen() const
{
    std::lock_guard<std::mutex> lock(dbMutex_);
    return db_ != nullptr;
}

void FraudDB::requireOpen() const
{
    if (db_ == nullptr) {
        throw FraudDBError("database not open");
    }
}

bool FraudDB::createSchema()
{
    const char* schema = R"(
        -- Version tracking
        CREATE TABLE IF NOT EXISTS schema_version (
            version INTEGER PRIMARY KEY,
            applied_at INTEGER NOT NULL
        );

        -- Append-only fraud telemetry
        CREATE TABLE IF NOT EXISTS fraud_logs (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            ip_address TEXT NOT NULL,
            user_agent TEXT NOT NULL DEFAULT '',
            device_fingerprint TEXT NOT NULL DEFAULT '',
            merchant_id TEXT,
            code_attempted TEXT,
            failure_reason TEXT NOT NULL,
            severity TEXT NOT NULL,
            blocked INTEGER NOT NULL DEFAULT 1,
            timestamp INTEGER NOT NULL,
            source TEXT NOT NULL DEFAULT 'guard'
        );

        CREATE INDEX IF NOT EXISTS idx_fraud_logs_timestamp ON fraud_logs(timestamp);
        CREATE INDEX IF NOT EXISTS idx_fraud_logs_ip ON fraud_logs(ip_address);

        -- Threat clusters
        CREATE TABLE IF NOT EXISTS fraud_clusters (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            label TEXT NOT NULL,
            pattern_type TEXT NOT NULL,
            group_key TEXT NOT NULL DEFAULT '',
            score REAL NOT NULL,
            severity INTEGER NOT NULL,
            threat_count INTEGER NOT NULL,
            unique_ips INTEGER NOT NULL DEFAULT 0,
            unique_devices INTEGER NOT NULL DEFAULT 0,
            time_span_ms INTEGER NOT NULL DEFAULT 0,
            first_seen INTEGER NOT NULL,
            last_seen INTEGER NOT NULL,
            threat_types TEXT NOT NULL DEFAULT '',
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL
        );

        CREATE INDEX IF NOT EXISTS idx_fraud_clusters_last_seen ON fraud_clusters(last_seen);

        -- One row per clustered log; a log joins at most one cluster
        CREATE TABLE IF NOT EXISTS cluster_patterns (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            cluster_id INTEGER NOT NULL,
            fraud_log_id INTEGER NOT NULL UNIQUE,
            similarity REAL NOT NULL,
            ip TEXT NOT NULL DEFAULT '',
            device TEXT NOT NULL DEFAULT '',
            user_agent TEXT NOT NULL DEFAULT '',
            reason TEXT NOT NULL DEFAULT '',
            severity TEXT NOT NULL DEFAULT 'low',
            event_timestamp INTEGER NOT NULL DEFAULT 0,
            FOREIGN KEY (cluster_id) REFERENCES fraud_clusters(id) ON DELETE CASCADE
        );

        CREATE INDEX IF NOT EXISTS idx_cluster_patterns_cluster ON cluster_patterns(cluster_id);

        -- Digests of committed redemption codes
        CREATE TABLE IF NOT EXISTS redeemed_codes (
            code_digest TEXT PRIMARY KEY,
            committed_at INTEGER NOT NULL
        );

        -- Durable rate limit windows
        CREATE TABLE IF NOT EXISTS rate_limit_windows (
            scope TEXT NOT NULL,
            key TEXT NOT NULL,
            window_start INTEGER NOT NULL,
            window_ms INTEGER NOT NULL,
            count INTEGER NOT NULL,
            lim INTEGER NOT NULL,
            last_seen INTEGER NOT NULL,
            PRIMARY KEY (scope, key)
        );
    )";

    if (!executeSQL(schema)) {
        return false;
    }

    return setSchemaVersion(SCHEMA_VERSION);
}

bool FraudDB::upgradeSchema(int fromVersion, int toVersion)
{
    LogPrintf("FraudDB: Upgrading schema from version %d to %d\n", fromVersion, toVersion);

    for (int version = fromVersion + 1; version <= toVersion; version++) {
        LogPrintf("FraudDB: Applying migration to version %d\n", version);

        bool success = false;

        switch (version) {
            case 1:
                // Pre-versioned database
                success = true;
                break;

            case 2:
                // Log source, pattern severity and durable rate limit windows
                success = executeSQL("ALTER TABLE fraud_logs ADD COLUMN source TEXT NOT NULL DEFAULT 'guard';") &&
                          executeSQL("ALTER TABLE cluster_patterns ADD COLUMN severity TEXT NOT NULL DEFAULT 'low';") &&
                          executeSQL(
                              "CREATE TABLE IF NOT EXISTS rate_limit_windows ("
                              "scope TEXT NOT NULL, key TEXT NOT NULL, window_start INTEGER NOT NULL, "
                              "window_ms INTEGER NOT NULL, count INTEGER NOT NULL, lim INTEGER NOT NULL, "
                              "last_seen INTEGER NOT NULL, PRIMARY KEY (scope, key));");
                break;

            default:
                LogPrintf("FraudDB: Unknown migration version %d\n", version);
                success = false;
                break;
        }

        if (!success) {
            LogPrintf("FraudDB: Migration to version %d failed\n", version);
            return false;
        }

        if (!setSchemaVersion(version)) {
            LogPrintf("FraudDB: Failed to update schema version to %d\n", version);
            return false;
        }

        LogPrintf("FraudDB: Successfully migrated to version %d\n", version);
    }

    return true;
}

int FraudDB::getSchemaVersion()
{
    if (db_ == nullptr) return -1;

    sqlite3_stmt* stmt;
    const char* sql = "SELECT version FROM schema_version ORDER BY version DESC LIMIT 1;";

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return -1;
    }

    int version = -1;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        version = sqlite3_column_int(stmt, 0);
    }

    sqlite3_finalize(stmt);
    return version;
}

bool FraudDB::setSchemaVersion(int version)
{
    std::stringstream ss;
    ss << "INSERT OR REPLACE INTO schema_version (version, applied_at) VALUES ("
       << version << ", " << std::time(nullptr) << ");";
    return executeSQL(ss.str());
}

bool FraudDB::executeSQL(const std::string& sql)
{
    if (db_ == nullptr) return false;

    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);

    if (rc != SQLITE_OK) {
        LogPrintf("FraudDB: SQL error: %s\n", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }

    return true;
}

bool FraudDB::beginTransaction()
{
    return executeSQL("BEGIN IMMEDIATE TRANSACTION;");
}

bool FraudDB::commitTransaction()
{
    return executeSQL("COMMIT;");
}

bool FraudDB::rollbackTransaction()
{
    return executeSQL("ROLLBACK;");
}

// ============================================================================
// Fraud logs
// ============================================================================

int64_t FraudDB::insertFraudLogRow(const FraudLogRow& row)
{
    Statement stmt(db_,
        "INSERT INTO fraud_logs (ip_address, user_agent, device_fingerprint, merchant_id, "
        "code_attempted, failure_reason, severity, blocked, timestamp, source) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    stmt.BindText(1, row.ipAddress);
    stmt.BindText(2, row.userAgent);
    stmt.BindText(3, row.deviceFingerprint);
    stmt.BindOptionalText(4, row.merchantId);
    stmt.BindOptionalText(5, row.codeAttempted);
    stmt.BindText(6, row.failureReason);
    stmt.BindText(7, row.severity);
    stmt.BindInt64(8, row.blocked);
    stmt.BindInt64(9, row.timestamp);
    stmt.BindText(10, row.source.empty() ? std::string(FRAUD_SOURCE_GUARD) : row.source);
    stmt.Execute();
    return sqlite3_last_insert_rowid(db_);
}

int64_t FraudDB::Append(const FraudLog& log)
{
    FraudLogRow row;
    row.ipAddress = log.ipAddress;
    row.userAgent = log.userAgent;
    row.deviceFingerprint = log.deviceFingerprint;
    row.merchantId = log.merchantId;
    row.codeAttempted = log.codeAttempted;
    row.failureReason = FailureReasonToString(log.failureReason);
    row.severity = FraudSeverityToString(log.severity);
    row.blocked = log.blocked ? 1 : 0;
    row.timestamp = log.timestamp;
    row.source = log.source;

    std::lock_guard<std::mutex> lock(dbMutex_);
    requireOpen();
    int64_t id = insertFraudLogRow(row);
    LogPrint(BCLog::DB, "FraudDB: appended fraud log %d (%s)\n", id, row.failureReason);
    return id;
}

int64_t FraudDB::AppendRaw(const FraudLogRow& row)
{
    std::lock_guard<std::mutex> lock(dbMutex_);
    requireOpen();
    return insertFraudLogRow(row);
}

int64_t FraudDB::CountFraudLogs()
{
    std::lock_guard<std::mutex> lock(dbMutex_);
    requireOpen();
    Statement stmt(db_, "SELECT COUNT(*) FROM fraud_logs;");
    return stmt.StepRow() ? stmt.ColumnInt64(0) : 0;
}

std::vector<FraudLog> FraudDB::GetRecent(size_t limit)
{
    std::lock_guard<std::mutex> lock(dbMutex_);
    requireOpen();

    Statement stmt(db_, strprintf("SELECT %s FROM fraud_logs ORDER BY timestamp DESC, id DESC LIMIT ?;",
                                  FRAUD_LOG_COLUMNS));
    stmt.BindInt64(1, static_cast<int64_t>(limit));

    std::vector<FraudLog> logs;
    while (stmt.StepRow()) {
        FraudLog log;
        if (ParseFraudLogRow(ReadFraudLogRow(stmt), log)) {
            logs.push_back(log);
        }
    }
    return logs;
}

std::vector<FraudLogRow> FraudDB::ReadSince(int64_t sinceMs, size_t limit, int64_t timeoutMs)
{
    std::lock_guard<std::mutex> lock(dbMutex_);
    requireOpen();

    ReadDeadline deadline(db_, timeoutMs);
    // Newest rows win when the look-back holds more than limit
    Statement stmt(db_, strprintf("SELECT %s FROM (SELECT %s FROM fraud_logs WHERE timestamp >= ? "
                                  "ORDER BY timestamp DESC, id DESC LIMIT ?) ORDER BY timestamp ASC, id ASC;",
                                  FRAUD_LOG_COLUMNS, FRAUD_LOG_COLUMNS));
    stmt.BindInt64(1, sinceMs);
    stmt.BindInt64(2, static_cast<int64_t>(limit));

    std::vector<FraudLogRow> rows;
    while (stmt.StepRow()) {
        rows.push_back(ReadFraudLogRow(stmt));
    }
    return rows;
}

FraudStatistics FraudDB::GetStatistics(int64_t nowMs)
{
    std::lock_guard<std::mutex> lock(dbMutex_);
    requireOpen();

    FraudStatistics stats;
    const int64_t since = nowMs - STATS_WINDOW_MS;

    {
        Statement stmt(db_, "SELECT COUNT(*), COALESCE(SUM(blocked), 0) FROM fraud_logs;");
        if (stmt.StepRow()) {
            stats.totalAttempts = stmt.ColumnInt64(0);
            stats.blockedAttempts = stmt.ColumnInt64(1);
        }
    }
    stats.blockRate = stats.totalAttempts > 0
        ? static_cast<double>(stats.blockedAttempts) / static_cast<double>(stats.totalAttempts)
        : 0.0;

    {
        Statement stmt(db_, "SELECT COUNT(*), COUNT(DISTINCT ip_address) FROM fraud_logs WHERE timestamp >= ?;");
        stmt.BindInt64(1, since);
        if (stmt.StepRow()) {
            stats.last24Hours = stmt.ColumnInt64(0);
            stats.uniqueIPs = stmt.ColumnInt64(1);
        }
    }

    {
        Statement stmt(db_,
            "SELECT failure_reason, COUNT(*) AS c FROM fraud_logs WHERE timestamp >= ? "
            "GROUP BY failure_reason ORDER BY c DESC, failure_reason ASC LIMIT ?;");
        stmt.BindInt64(1, since);
        stmt.BindInt64(2, static_cast<int64_t>(STATS_TOP_REASONS));
        while (stmt.StepRow()) {
            stats.topReasons.emplace_back(stmt.ColumnText(0), stmt.ColumnInt64(1));
        }
    }

    stats.hourly.assign(24, 0);
    {
        Statement stmt(db_,
            "SELECT (timestamp - ?) / ? AS bucket, COUNT(*) FROM fraud_logs "
            "WHERE timestamp >= ? AND timestamp <= ? GROUP BY bucket;");
        stmt.BindInt64(1, since);
        stmt.BindInt64(2, MS_PER_HOUR);
        stmt.BindInt64(3, since);
        stmt.BindInt64(4, nowMs);
        while (stmt.StepRow()) {
            int64_t bucket = std::min<int64_t>(23, std::max<int64_t>(0, stmt.ColumnInt64(0)));
            stats.hourly[bucket] += stmt.ColumnInt64(1);
        }
    }

    return stats;
}

// ============================================================================
// Clusters
// ============================================================================

std::vector<FraudCluster> FraudDB::queryClusters(const std::string& sql, int64_t param, bool bindParam)
{
    Statement stmt(db_, sql);
    if (bindParam) {
        stmt.BindInt64(1, param);
    }
    std::vector<FraudCluster> clusters;
    while (stmt.StepRow()) {
        clusters.push_back(ReadClusterRow(stmt));
    }
    return clusters;
}

std::vector<FraudCluster> FraudDB::GetOpenClusters(int64_t sinceMs)
{
    std::lock_guard<std::mutex> lock(dbMutex_);
    requireOpen();
    return queryClusters(strprintf("SELECT %s FROM fraud_clusters WHERE last_seen >= ? ORDER BY id ASC;",
                                   CLUSTER_COLUMNS), sinceMs, true);
}

std::set<int64_t> FraudDB::GetAssignedLogIds(int64_t sinceMs)
{
    std::lock_guard<std::mutex> lock(dbMutex_);
    requireOpen();

    Statement stmt(db_,
        "SELECT p.fraud_log_id FROM cluster_patterns p "
        "JOIN fraud_logs l ON l.id = p.fraud_log_id WHERE l.timestamp >= ?;");
    stmt.BindInt64(1, sinceMs);

    std::set<int64_t> ids;
    while (stmt.StepRow()) {
        ids.insert(stmt.ColumnInt64(0));
    }
    return ids;
}

void FraudDB::WriteCluster(FraudCluster& cluster, std::vector<ClusterPattern>& patterns)
{
    std::lock_guard<std::mutex> lock(dbMutex_);
    requireOpen();

    if (!beginTransaction()) {
        throw FraudDBError("failed to begin cluster transaction");
    }

    try {
        const std::string threatTypes = JoinThreatTypes(cluster.metadata.threatTypes);
        if (cluster.id == 0) {
            Statement stmt(db_,
                "INSERT INTO fraud_clusters (label, pattern_type, group_key, score, severity, threat_count, "
                "unique_ips, unique_devices, time_span_ms, first_seen, last_seen, threat_types, created_at, updated_at) "
                "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
            stmt.BindText(1, cluster.label);
            stmt.BindText(2, ClusterPatternTypeToString(cluster.patternType));
            stmt.BindText(3, cluster.groupKey);
            stmt.BindDouble(4, cluster.score);
            stmt.BindInt64(5, cluster.severity);
            stmt.BindInt64(6, cluster.threatCount);
            stmt.BindInt64(7, cluster.metadata.uniqueIPs);
            stmt.BindInt64(8, cluster.metadata.uniqueDevices);
            stmt.BindInt64(9, cluster.metadata.timeSpanMs);
            stmt.BindInt64(10, cluster.metadata.firstSeenMs);
            stmt.BindInt64(11, cluster.metadata.lastSeenMs);
            stmt.BindText(12, threatTypes);
            stmt.BindInt64(13, cluster.createdAt);
            stmt.BindInt64(14, cluster.updatedAt);
            stmt.Execute();
            cluster.id = sqlite3_last_insert_rowid(db_);
        } else {
            Statement stmt(db_,
                "UPDATE fraud_clusters SET label = ?, score = ?, severity = ?, threat_count = ?, "
                "unique_ips = ?, unique_devices = ?, time_span_ms = ?, first_seen = ?, last_seen = ?, "
                "threat_types = ?, updated_at = ? WHERE id = ?;");
            stmt.BindText(1, cluster.label);
            stmt.BindDouble(2, cluster.score);
            stmt.BindInt64(3, cluster.severity);
            stmt.BindInt64(4, cluster.threatCount);
            stmt.BindInt64(5, cluster.metadata.uniqueIPs);
            stmt.BindInt64(6, cluster.metadata.uniqueDevices);
            stmt.BindInt64(7, cluster.metadata.timeSpanMs);
            stmt.BindInt64(8, cluster.metadata.firstSeenMs);
            stmt.BindInt64(9, cluster.metadata.lastSeenMs);
            stmt.BindText(10, threatTypes);
            stmt.BindInt64(11, cluster.updatedAt);
            stmt.BindInt64(12, cluster.id);
            stmt.Execute();
            if (sqlite3_changes(db_) != 1) {
                throw FraudDBError(strprintf("cluster %d does not exist", cluster.id));
            }
        }

        for (ClusterPattern& pattern : patterns) {
            pattern.clusterId = cluster.id;
            Statement stmt(db_,
                "INSERT INTO cluster_patterns (cluster_id, fraud_log_id, similarity, ip, device, "
                "user_agent, reason, severity, event_timestamp) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);");
            stmt.BindInt64(1, pattern.clusterId);
            stmt.BindInt64(2, pattern.fraudLogId);
            stmt.BindDouble(3, pattern.similarity);
            stmt.BindText(4, pattern.metadata.ip);
            stmt.BindText(5, pattern.metadata.device);
            stmt.BindText(6, pattern.metadata.userAgent);
            stmt.BindText(7, pattern.metadata.reason);
            stmt.BindText(8, pattern.metadata.severity);
            stmt.BindInt64(9, pattern.metadata.timestampMs);
            stmt.Execute();
            pattern.id = sqlite3_last_insert_rowid(db_);
        }
    } catch (const FraudDBError&) {
        rollbackTransaction();
        throw;
    }

    if (!commitTransaction()) {
        rollbackTransaction();
        throw FraudDBError("failed to commit cluster transaction");
    }
}

std::vector<FraudCluster> FraudDB::GetClusters(size_t limit)
{
    std::lock_guard<std::mutex> lock(dbMutex_);
    requireOpen();
    return queryClusters(strprintf("SELECT %s FROM fraud_clusters ORDER BY updated_at DESC, id DESC LIMIT ?;",
                                   CLUSTER_COLUMNS), static_cast<int64_t>(limit), true);
}

bool FraudDB::GetCluster(int64_t id, FraudCluster& cluster)
{
    std::lock_guard<std::mutex> lock(dbMutex_);
    requireOpen();
    std::vector<FraudCluster> found = queryClusters(
        strprintf("SELECT %s FROM fraud_clusters WHERE id = ?;", CLUSTER_COLUMNS), id, true);
    if (found.empty()) {
        return false;
    }
    cluster = found.front();
    return true;
}

std::vector<ClusterPattern> FraudDB::GetPatterns(int64_t clusterId)
{
    std::lock_guard<std::mutex> lock(dbMutex_);
    requireOpen();

    Statement stmt(db_,
        "SELECT id, cluster_id, fraud_log_id, similarity, ip, device, user_agent, reason, severity, event_timestamp "
        "FROM cluster_patterns WHERE cluster_id = ? ORDER BY event_timestamp ASC, fraud_log_id ASC;");
    stmt.BindInt64(1, clusterId);

    std::vector<ClusterPattern> patterns;
    while (stmt.StepRow()) {
        ClusterPattern pattern;
        pattern.id = stmt.ColumnInt64(0);
        pattern.clusterId = stmt.ColumnInt64(1);
        pattern.fraudLogId = stmt.ColumnInt64(2);
        pattern.similarity = stmt.ColumnDouble(3);
        pattern.metadata.ip = stmt.ColumnText(4);
        pattern.metadata.device = stmt.ColumnText(5);
        pattern.metadata.userAgent = stmt.ColumnText(6);
        pattern.metadata.reason = stmt.ColumnText(7);
        pattern.metadata.severity = stmt.ColumnText(8);
        pattern.metadata.timestampMs = stmt.ColumnInt64(9);
        patterns.push_back(pattern);
    }
    return patterns;
}

ClusterStats FraudDB::GetClusterStats()
{
    std::lock_guard<std::mutex> lock(dbMutex_);
    requireOpen();

    ClusterStats stats;
    {
        Statement stmt(db_, "SELECT COUNT(*), COALESCE(SUM(threat_count), 0), COALESCE(AVG(score), 0) FROM fraud_clusters;");
        if (stmt.StepRow()) {
            stats.totalClusters = stmt.ColumnInt64(0);
            stats.totalThreats = stmt.ColumnInt64(1);
            stats.averageScore = stmt.ColumnDouble(2);
        }
    }
    {
        Statement stmt(db_, "SELECT pattern_type, COUNT(*) FROM fraud_clusters GROUP BY pattern_type;");
        while (stmt.StepRow()) {
            stats.byPatternType[stmt.ColumnText(0)] = stmt.ColumnInt64(1);
        }
    }
    {
        Statement stmt(db_, "SELECT severity, COUNT(*) FROM fraud_clusters GROUP BY severity;");
        while (stmt.StepRow()) {
            stats.bySeverity[static_cast<int>(stmt.ColumnInt64(0))] = stmt.ColumnInt64(1);
        }
    }
    return stats;
}

// ============================================================================
// Redeemed codes
// ============================================================================

void FraudDB::StoreRedeemedCode(const std::string& codeDigest, int64_t committedAt)
{
    std::lock_guard<std::mutex> lock(dbMutex_);
    requireOpen();

    Statement stmt(db_, "INSERT OR IGNORE INTO redeemed_codes (code_digest, committed_at) VALUES (?, ?);");
    stmt.BindText(1, codeDigest);
    stmt.BindInt64(2, committedAt);
    stmt.Execute();
}

std::vector<std::string> FraudDB::LoadRedeemedCodes()
{
    std::lock_guard<std::mutex> lock(dbMutex_);
    requireOpen();

    Statement stmt(db_, "SELECT code_digest FROM redeemed_codes;");
    std::vector<std::string> digests;
    while (stmt.StepRow()) {
        digests.push_back(stmt.ColumnText(0));
    }
    return digests;
}

// ============================================================================
// Rate limit windows
// ============================================================================

uint32_t FraudDB::IncrementRateLimitWindow(const std::string& scope, const std::string& key,
                                           int64_t windowStart, int64_t windowMs, uint32_t limit, int64_t nowMs)
{
    std::lock_guard<std::mutex> lock(dbMutex_);
    requireOpen();

    {
        Statement stmt(db_,
            "INSERT INTO rate_limit_windows (scope, key, window_start, window_ms, count, lim, last_seen) "
            "VALUES (?1, ?2, ?3, ?4, 1, ?5, ?6) "
            "ON CONFLICT(scope, key) DO UPDATE SET "
            "count = CASE WHEN window_start = excluded.window_start AND window_ms = excluded.window_ms "
            "THEN count + 1 ELSE 1 END, "
            "window_start = excluded.window_start, window_ms = excluded.window_ms, "
            "lim = excluded.lim, last_seen = excluded.last_seen;");
        stmt.BindText(1, scope);
        stmt.BindText(2, key);
        stmt.BindInt64(3, windowStart);
        stmt.BindInt64(4, windowMs);
        stmt.BindInt64(5, limit);
        stmt.BindInt64(6, nowMs);
        stmt.Execute();
    }

    Statement stmt(db_, "SELECT count FROM rate_limit_windows WHERE scope = ? AND key = ?;");
    stmt.BindText(1, scope);
    stmt.BindText(2, key);
    if (!stmt.StepRow()) {
        throw FraudDBError("rate limit window vanished");
    }
    return static_cast<uint32_t>(stmt.ColumnInt64(0));
}

uint32_t FraudDB::GetRateLimitCount(const std::string& scope, const std::string& key, int64_t windowStart)
{
    std::lock_guard<std::mutex> lock(dbMutex_);
    requireOpen();

    Statement stmt(db_, "SELECT count FROM rate_limit_windows WHERE scope = ? AND key = ? AND window_start = ?;");
    stmt.BindText(1, scope);
    stmt.BindText(2, key);
    stmt.BindInt64(3, windowStart);
    return stmt.StepRow() ? static_cast<uint32_t>(stmt.ColumnInt64(0)) : 0;
}

void FraudDB::DeleteRateLimitWindow(const std::string& scope, const std::string& key)
{
    std::lock_guard<std::mutex> lock(dbMutex_);
    requireOpen();

    Statement stmt(db_, "DELETE FROM rate_limit_windows WHERE scope = ? AND key = ?;");
    stmt.BindText(1, scope);
    stmt.BindText(2, key);
    stmt.Execute();
}

size_t FraudDB::SweepRateLimitWindows(int64_t nowMs, int64_t idleWindows)
{
    std::lock_guard<std::mutex> lock(dbMutex_);
    requireOpen();

    Statement stmt(db_, "DELETE FROM rate_limit_windows WHERE ? - last_seen >= ? * window_ms;");
    stmt.BindInt64(1, nowMs);
    stmt.BindInt64(2, idleWindows);
    stmt.Execute();
    return static_cast<size_t>(sqlite3_changes(db_));
}

size_t FraudDB::CountRateLimitWindows()
{
    std::lock_guard<std::mutex> lock(dbMutex_);
    requireOpen();

    Statement stmt(db_, "SELECT COUNT(*) FROM rate_limit_windows;");
    return stmt.StepRow() ? static_cast<size_t>(stmt.ColumnInt64(0)) : 0;
}

// ============================================================================
// DBRateLimitStore
// ============================================================================

RateLimitDecision DBRateLimitStore::CheckAndIncrement(RateLimitScope scope, const std::string& key,
                                                      const RateLimitPolicy& policy, int64_t nowMs)
{
    const int64_t windowStart = WindowStartFor(nowMs, policy.windowMs);
    uint32_t count = db_.IncrementRateLimitWindow(RateLimitScopeToString(scope), key,
                                                  windowStart, policy.windowMs, policy.limit, nowMs);
    return DecideWindow(count, policy, windowStart, nowMs);
}

uint32_t DBRateLimitStore::Peek(RateLimitScope scope, const std::string& key, int64_t windowMs, int64_t nowMs)
{
    return db_.GetRateLimitCount(RateLimitScopeToString(scope), key, WindowStartFor(nowMs, windowMs));
}

void DBRateLimitStore::Evict(RateLimitScope scope, const std::string& key)
{
    db_.DeleteRateLimitWindow(RateLimitScopeToString(scope), key);
}

size_t DBRateLimitStore::Sweep(int64_t nowMs)
{
    return db_.SweepRateLimitWindows(nowMs, RATE_LIMIT_IDLE_WINDOWS);
}

size_t DBRateLimitStore::Size() const
{
    return db_.CountRateLimitWindows();
}

} // namespace giftguard
