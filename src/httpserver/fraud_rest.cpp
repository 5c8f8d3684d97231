// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file fraud_rest.cpp
 * @brief REST handlers for redemption, fraud monitoring and clustering
 */

#include <httpserver/fraud_rest.h>

#include <fraud/alert_broadcaster.h>
#include <fraud/fraud_cluster.h>
#include <fraud/fraud_log.h>
#include <fraud/threat_cluster_engine.h>
#include <guard/redemption_guard.h>
#include <httpserver.h>
#include <util.h>
#include <utilstrencodings.h>

#include <univalue.h>

#include <stdexcept>

namespace giftguard {

static FraudRESTContext g_restContext;

// ============================================================================
// Reply helpers
// ============================================================================

namespace {

APIReply JSONReply(int status, const UniValue& obj)
{
    APIReply reply(status, obj.write() + "\n");
    reply.headers["Content-Type"] = "application/json";
    return reply;
}

APIReply ErrorReply(int status, const std::string& message)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("success", false);
    obj.pushKV("error", message);
    return JSONReply(status, obj);
}

APIReply Forbidden()
{
    return ErrorReply(HTTP_FORBIDDEN, "Admin access required");
}

APIReply Unavailable()
{
    return ErrorReply(HTTP_SERVICE_UNAVAILABLE, "Service not available");
}

/** Read ?limit=N. Returns false for a malformed value; out-of-range values are clamped. */
bool ReadLimit(const APIRequest& request, int64_t defaultLimit, int64_t maxLimit, int64_t& limit)
{
    limit = defaultLimit;
    auto it = request.query.find("limit");
    if (it == request.query.end() || it->second.empty()) {
        return true;
    }
    int64_t value = 0;
    if (!ParseInt64(it->second, &value)) {
        return false;
    }
    if (value < 1) value = 1;
    if (value > maxLimit) value = maxLimit;
    limit = value;
    return true;
}

bool ReadSession(const APIRequest& request, uint64_t& sessionId)
{
    auto it = request.query.find("session");
    return it != request.query.end() && ParseUInt64(it->second, &sessionId) && sessionId != 0;
}

// ============================================================================
// JSON conversions
// ============================================================================

UniValue FraudLogToJSON(const FraudLog& log)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("id", log.id);
    obj.pushKV("ipAddress", log.ipAddress);
    obj.pushKV("userAgent", log.userAgent);
    obj.pushKV("deviceFingerprint", log.deviceFingerprint);
    obj.pushKV("merchantId", log.merchantId);
    obj.pushKV("codeAttempted", log.codeAttempted);
    obj.pushKV("failureReason", FailureReasonToString(log.failureReason));
    obj.pushKV("severity", FraudSeverityToString(log.severity));
    obj.pushKV("blocked", log.blocked);
    obj.pushKV("timestamp", log.timestamp);
    obj.pushKV("source", log.source);
    return obj;
}

UniValue ClusterToJSON(const FraudCluster& cluster)
{
    UniValue threatTypes(UniValue::VARR);
    for (const std::string& type : cluster.metadata.threatTypes) {
        threatTypes.push_back(type);
    }

    UniValue metadata(UniValue::VOBJ);
    metadata.pushKV("uniqueIPs", cluster.metadata.uniqueIPs);
    metadata.pushKV("uniqueDevices", cluster.metadata.uniqueDevices);
    metadata.pushKV("timeSpanMs", cluster.metadata.timeSpanMs);
    metadata.pushKV("firstSeenMs", cluster.metadata.firstSeenMs);
    metadata.pushKV("lastSeenMs", cluster.metadata.lastSeenMs);
    metadata.pushKV("threatTypes", threatTypes);

    UniValue obj(UniValue::VOBJ);
    obj.pushKV("id", cluster.id);
    obj.pushKV("label", cluster.label);
    obj.pushKV("patternType", ClusterPatternTypeToString(cluster.patternType));
    obj.pushKV("groupKey", cluster.groupKey);
    obj.pushKV("score", cluster.score);
    obj.pushKV("severity", cluster.severity);
    obj.pushKV("threatCount", cluster.threatCount);
    obj.pushKV("metadata", metadata);
    obj.pushKV("createdAt", cluster.createdAt);
    obj.pushKV("updatedAt", cluster.updatedAt);
    return obj;
}

UniValue PatternToJSON(const ClusterPattern& pattern)
{
    UniValue metadata(UniValue::VOBJ);
    metadata.pushKV("ip", pattern.metadata.ip);
    metadata.pushKV("device", pattern.metadata.device);
    metadata.pushKV("userAgent", pattern.metadata.userAgent);
    metadata.pushKV("reason", pattern.metadata.reason);
    metadata.pushKV("severity", pattern.metadata.severity);
    metadata.pushKV("timestampMs", pattern.metadata.timestampMs);

    UniValue obj(UniValue::VOBJ);
    obj.pushKV("id", pattern.id);
    obj.pushKV("clusterId", pattern.clusterId);
    obj.pushKV("fraudLogId", pattern.fraudLogId);
    obj.pushKV("similarity", pattern.similarity);
    obj.pushKV("metadata", metadata);
    return obj;
}

UniValue ClusterStatsToJSON(const ClusterStats& stats)
{
    UniValue byType(UniValue::VOBJ);
    for (const auto& entry : stats.byPatternType) {
        byType.pushKV(entry.first, entry.second);
    }
    UniValue bySeverity(UniValue::VOBJ);
    for (const auto& entry : stats.bySeverity) {
        bySeverity.pushKV(strprintf("%d", entry.first), entry.second);
    }

    UniValue obj(UniValue::VOBJ);
    obj.pushKV("totalClusters", stats.totalClusters);
    obj.pushKV("totalThreats", stats.totalThreats);
    obj.pushKV("averageScore", stats.averageScore);
    obj.pushKV("byPatternType", byType);
    obj.pushKV("bySeverity", bySeverity);
    return obj;
}

UniValue EventsToJSON(const std::vector<AlertEvent>& events)
{
    UniValue arr(UniValue::VARR);
    for (const AlertEvent& event : events) {
        UniValue parsed;
        if (!parsed.read(event.ToJSON())) {
            LogPrint(BCLog::HTTP, "REST: dropping unparsable %s event\n", AlertEventTypeToString(event.type));
            continue;
        }
        arr.push_back(parsed);
    }
    return arr;
}

// ============================================================================
// Endpoints
// ============================================================================

APIReply HandleRedeem(const FraudRESTContext& ctx, const APIRequest& request)
{
    if (request.method != "POST") {
        return ErrorReply(HTTP_BAD_METHOD, "Only POST requests allowed");
    }
    if (!ctx.guard) {
        return Unavailable();
    }

    UniValue body;
    if (!body.read(request.body) || !body.isObject()) {
        return ErrorReply(HTTP_BAD_REQUEST, "Invalid request body");
    }

    const UniValue& code = body["code"];
    const UniValue& redeemedBy = body["redeemedBy"];
    const UniValue& merchantId = body["merchantId"];
    const UniValue& amount = body["amount"];

    if (!code.isStr() || code.get_str().empty() || !redeemedBy.isStr() || redeemedBy.get_str().empty()) {
        return ErrorReply(HTTP_BAD_REQUEST, "code and redeemedBy are required");
    }
    if (!merchantId.isNull() && !merchantId.isStr()) {
        return ErrorReply(HTTP_BAD_REQUEST, "merchantId must be a string");
    }

    RedemptionRequest redemption;
    redemption.metadata = request.metadata;
    redemption.code = code.get_str();
    redemption.redeemedBy = redeemedBy.get_str();
    if (merchantId.isStr()) {
        redemption.merchantId = merchantId.get_str();
    }
    if (!amount.isNull()) {
        int64_t cents = 0;
        try {
            cents = amount.get_int64();
        } catch (const std::runtime_error&) {
            return ErrorReply(HTTP_BAD_REQUEST, "amount must be an integer number of cents");
        }
        if (cents < 0) {
            return ErrorReply(HTTP_BAD_REQUEST, "amount must not be negative");
        }
        redemption.amount = cents;
    }

    GuardDecision decision = ctx.guard->Evaluate(redemption);

    if (decision.allowed) {
        UniValue obj(UniValue::VOBJ);
        obj.pushKV("success", true);
        obj.pushKV("amount", decision.amount);
        return JSONReply(HTTP_OK, obj);
    }

    APIReply reply = ErrorReply(decision.httpStatus, decision.message);
    if (decision.retryAfterSeconds > 0) {
        reply.headers["Retry-After"] = strprintf("%d", decision.retryAfterSeconds);
    }
    return reply;
}

/** Record an external detector signal as a webhook fraud log */
APIReply HandleFraudAlertWebhook(const FraudRESTContext& ctx, const APIRequest& request)
{
    if (request.method != "POST") {
        return ErrorReply(HTTP_BAD_METHOD, "Only POST requests allowed");
    }
    if (!ctx.logStore) {
        return Unavailable();
    }

    Fingerprint fp = ExtractFingerprint(request.metadata);
    int64_t now = GetTimeMillis();

    FraudLog log;
    log.source = FRAUD_SOURCE_WEBHOOK;
    log.userAgent = fp.userAgent;
    log.deviceFingerprint = fp.deviceId;
    log.blocked = false;
    log.timestamp = now;

    UniValue body;
    bool wellFormed = body.read(request.body) && body.isObject();
    if (wellFormed) {
        const UniValue& gan = body["gan"];
        const UniValue& ip = body["ip"];
        const UniValue& reason = body["reason"];
        const UniValue& merchantId = body["merchantId"];
        const UniValue& timestamp = body["timestamp"];

        wellFormed = gan.isStr() && !gan.get_str().empty() &&
                     ip.isStr() && !ip.get_str().empty() &&
                     reason.isStr() && !reason.get_str().empty() &&
                     (merchantId.isNull() || merchantId.isStr());

        if (wellFormed && !timestamp.isNull()) {
            int64_t ts = 0;
            if (timestamp.isNum()) {
                try {
                    ts = timestamp.get_int64();
                } catch (const std::runtime_error&) {
                    wellFormed = false;
                }
            } else if (!timestamp.isStr() || !ParseInt64(timestamp.get_str(), &ts)) {
                wellFormed = false;
            }
            if (wellFormed && ts > 0) {
                log.timestamp = ts;
            }
        }

        if (wellFormed) {
            log.ipAddress = ip.get_str();
            log.codeAttempted = RedactCode(gan.get_str());
            if (merchantId.isStr()) {
                log.merchantId = merchantId.get_str();
            }
            if (!FailureReasonFromString(reason.get_str(), log.failureReason)) {
                log.failureReason = FailureReason::SUSPICIOUS_ACTIVITY;
            }
            log.severity = SeverityForFailure(log.failureReason);
        }
    }

    if (!wellFormed) {
        log.ipAddress = fp.ip;
        log.failureReason = FailureReason::SYSTEM_ERROR;
        log.severity = FraudSeverity::LOW;
        log.timestamp = now;
    }

    log.id = ctx.logStore->Append(log);
    LogPrint(BCLog::GUARD, "Fraud alert webhook: %s from %s (log %d)\n",
             FailureReasonToString(log.failureReason), log.ipAddress, log.id);
    if (ctx.broadcaster) {
        ctx.broadcaster->PublishFraudAlert(log);
    }

    if (!wellFormed) {
        return ErrorReply(HTTP_BAD_REQUEST, "gan, ip and reason are required");
    }

    UniValue obj(UniValue::VOBJ);
    obj.pushKV("success", true);
    obj.pushKV("message", "Fraud alert processed");
    obj.pushKV("id", log.id);
    return JSONReply(HTTP_OK, obj);
}

APIReply HandleFraudLogs(const FraudRESTContext& ctx, const APIRequest& request)
{
    if (!ctx.logStore) return Unavailable();

    int64_t limit = 0;
    if (!ReadLimit(request, DEFAULT_FRAUD_LOG_LIMIT, MAX_FRAUD_LOG_LIMIT, limit)) {
        return ErrorReply(HTTP_BAD_REQUEST, "Invalid limit");
    }

    UniValue logs(UniValue::VARR);
    for (const FraudLog& log : ctx.logStore->GetRecent(static_cast<size_t>(limit))) {
        logs.push_back(FraudLogToJSON(log));
    }

    UniValue obj(UniValue::VOBJ);
    obj.pushKV("success", true);
    obj.pushKV("logs", logs);
    return JSONReply(HTTP_OK, obj);
}

APIReply HandleFraudStatistics(const FraudRESTContext& ctx, const APIRequest& request)
{
    if (!ctx.logStore) return Unavailable();

    FraudStatistics stats = ctx.logStore->GetStatistics(GetTimeMillis());

    UniValue topReasons(UniValue::VARR);
    for (const auto& entry : stats.topReasons) {
        UniValue reason(UniValue::VOBJ);
        reason.pushKV("reason", entry.first);
        reason.pushKV("count", entry.second);
        topReasons.push_back(reason);
    }
    UniValue hourly(UniValue::VARR);
    for (int64_t count : stats.hourly) {
        hourly.push_back(count);
    }

    UniValue statistics(UniValue::VOBJ);
    statistics.pushKV("totalAttempts", stats.totalAttempts);
    statistics.pushKV("blockedAttempts", stats.blockedAttempts);
    statistics.pushKV("blockRate", stats.blockRate);
    statistics.pushKV("last24Hours", stats.last24Hours);
    statistics.pushKV("uniqueIPs", stats.uniqueIPs);
    statistics.pushKV("topReasons", topReasons);
    statistics.pushKV("hourly", hourly);

    UniValue obj(UniValue::VOBJ);
    obj.pushKV("success", true);
    obj.pushKV("statistics", statistics);
    return JSONReply(HTTP_OK, obj);
}

APIReply HandleFraudClusters(const FraudRESTContext& ctx, const APIRequest& request, const std::string& idPart)
{
    if (!ctx.clusterStore) return Unavailable();

    if (!idPart.empty()) {
        int64_t id = 0;
        if (!ParseInt64(idPart, &id) || id <= 0) {
            return ErrorReply(HTTP_BAD_REQUEST, "Invalid cluster id");
        }
        FraudCluster cluster;
        if (!ctx.clusterStore->GetCluster(id, cluster)) {
            return ErrorReply(HTTP_NOT_FOUND, "Cluster not found");
        }
        UniValue patterns(UniValue::VARR);
        for (const ClusterPattern& pattern : ctx.clusterStore->GetPatterns(id)) {
            patterns.push_back(PatternToJSON(pattern));
        }
        UniValue obj(UniValue::VOBJ);
        obj.pushKV("success", true);
        obj.pushKV("cluster", ClusterToJSON(cluster));
        obj.pushKV("patterns", patterns);
        return JSONReply(HTTP_OK, obj);
    }

    int64_t limit = 0;
    if (!ReadLimit(request, DEFAULT_CLUSTER_LIST_LIMIT, MAX_CLUSTER_LIST_LIMIT, limit)) {
        return ErrorReply(HTTP_BAD_REQUEST, "Invalid limit");
    }

    UniValue clusters(UniValue::VARR);
    for (const FraudCluster& cluster : ctx.clusterStore->GetClusters(static_cast<size_t>(limit))) {
        clusters.push_back(ClusterToJSON(cluster));
    }

    UniValue obj(UniValue::VOBJ);
    obj.pushKV("success", true);
    obj.pushKV("clusters", clusters);
    obj.pushKV("stats", ClusterStatsToJSON(ctx.clusterStore->GetClusterStats()));
    return JSONReply(HTTP_OK, obj);
}

APIReply HandleTrigger(const FraudRESTContext& ctx, const APIRequest& request)
{
    if (request.method != "POST") {
        return ErrorReply(HTTP_BAD_METHOD, "Only POST requests allowed");
    }
    if (!ctx.engine) return Unavailable();

    LogPrintf("Threat analysis triggered manually\n");
    ClusterRunResult run = ctx.engine->Trigger();

    UniValue result(UniValue::VOBJ);
    result.pushKV("clustersFound", run.clustersFound);
    result.pushKV("threatsAnalyzed", run.threatsAnalyzed);
    result.pushKV("clustersCreated", run.clustersCreated);
    result.pushKV("clustersUpdated", run.clustersUpdated);
    result.pushKV("logsAssigned", run.logsAssigned);
    result.pushKV("malformedRows", run.malformedRows);
    result.pushKV("aborted", run.aborted);
    result.pushKV("durationMs", run.durationMs);

    UniValue obj(UniValue::VOBJ);
    obj.pushKV("success", true);
    obj.pushKV("result", result);
    return JSONReply(HTTP_OK, obj);
}

APIReply HandleStream(const FraudRESTContext& ctx, const APIRequest& request)
{
    if (!ctx.broadcaster) return Unavailable();

    if (request.method == "DELETE") {
        uint64_t sessionId = 0;
        if (!ReadSession(request, sessionId)) {
            return ErrorReply(HTTP_BAD_REQUEST, "Invalid session");
        }
        if (!ctx.broadcaster->Unsubscribe(sessionId)) {
            return ErrorReply(HTTP_NOT_FOUND, "Session not found");
        }
        UniValue obj(UniValue::VOBJ);
        obj.pushKV("success", true);
        return JSONReply(HTTP_OK, obj);
    }

    uint64_t sessionId = ctx.broadcaster->Subscribe(StripPort(request.metadata.peerAddress));

    UniValue obj(UniValue::VOBJ);
    obj.pushKV("success", true);
    obj.pushKV("session", sessionId);
    obj.pushKV("events", EventsToJSON(ctx.broadcaster->Drain(sessionId)));
    return JSONReply(HTTP_OK, obj);
}

APIReply HandleEvents(const FraudRESTContext& ctx, const APIRequest& request)
{
    if (!ctx.broadcaster) return Unavailable();

    uint64_t sessionId = 0;
    if (!ReadSession(request, sessionId)) {
        return ErrorReply(HTTP_BAD_REQUEST, "Invalid session");
    }
    if (!ctx.broadcaster->HasSession(sessionId)) {
        return ErrorReply(HTTP_NOT_FOUND, "Session not found");
    }

    UniValue obj(UniValue::VOBJ);
    obj.pushKV("success", true);
    obj.pushKV("session", sessionId);
    obj.pushKV("events", EventsToJSON(ctx.broadcaster->Drain(sessionId)));
    return JSONReply(HTTP_OK, obj);
}

APIReply Route(const FraudRESTContext& ctx, const APIRequest& request)
{
    const std::string& path = request.path;

    if (path == "/redeem") {
        return HandleRedeem(ctx, request);
    }
    if (path == "/webhooks/fraud-alert") {
        return HandleFraudAlertWebhook(ctx, request);
    }

    static const std::string ADMIN_PREFIX = "/admin/";
    if (path.compare(0, ADMIN_PREFIX.size(), ADMIN_PREFIX) != 0) {
        return ErrorReply(HTTP_NOT_FOUND, "Not found");
    }
    if (!request.identity.isAdmin) {
        return Forbidden();
    }

    if (path == "/admin/threat-analysis/trigger") {
        return HandleTrigger(ctx, request);
    }
    if (path == "/admin/stream") {
        if (request.method != "GET" && request.method != "DELETE") {
            return ErrorReply(HTTP_BAD_METHOD, "Only GET and DELETE requests allowed");
        }
        return HandleStream(ctx, request);
    }

    if (request.method != "GET") {
        return ErrorReply(HTTP_BAD_METHOD, "Only GET requests allowed");
    }
    if (path == "/admin/fraud-logs") {
        return HandleFraudLogs(ctx, request);
    }
    if (path == "/admin/fraud-statistics") {
        return HandleFraudStatistics(ctx, request);
    }
    if (path == "/admin/events") {
        return HandleEvents(ctx, request);
    }

    static const std::string CLUSTERS = "/admin/fraud-clusters";
    if (path == CLUSTERS || path == CLUSTERS + "/") {
        return HandleFraudClusters(ctx, request, "");
    }
    if (path.compare(0, CLUSTERS.size() + 1, CLUSTERS + "/") == 0) {
        return HandleFraudClusters(ctx, request, path.substr(CLUSTERS.size() + 1));
    }

    return ErrorReply(HTTP_NOT_FOUND, "Not found");
}

} // anonymous namespace

// ============================================================================
// Public API
// ============================================================================

APIReply HandleAPIRequest(const FraudRESTContext& context, const APIRequest& request)
{
    try {
        return Route(context, request);
    } catch (const std::exception& e) {
        LogPrintf("REST: %s %s failed: %s\n", request.method, SanitizeString(request.path), e.what());
        return ErrorReply(HTTP_INTERNAL_SERVER_ERROR, "Internal error");
    }
}

std::map<std::string, std::string> ParseQueryString(const std::string& query)
{
    std::map<std::string, std::string> result;
    for (const std::string& part : SplitString(query, '&')) {
        if (part.empty()) continue;
        size_t eq = part.find('=');
        std::string key = urlDecode(part.substr(0, eq));
        std::string value = eq == std::string::npos ? std::string() : urlDecode(part.substr(eq + 1));
        if (!key.empty() && result.find(key) == result.end()) {
            result[key] = value;
        }
    }
    return result;
}

bool SecretEquals(const std::string& a, const std::string& b)
{
    if (a.size() != b.size()) return false;
    unsigned char diff = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        diff |= static_cast<unsigned char>(a[i]) ^ static_cast<unsigned char>(b[i]);
    }
    return diff == 0;
}

// ============================================================================
// HTTP binding
// ============================================================================

static std::string RequestMethodName(HTTPRequest::RequestMethod method)
{
    switch (method) {
    case HTTPRequest::GET: return "GET";
    case HTTPRequest::POST: return "POST";
    case HTTPRequest::HEAD: return "HEAD";
    case HTTPRequest::PUT: return "PUT";
    case HTTPRequest::DELETE_: return "DELETE";
    case HTTPRequest::OPTIONS: return "OPTIONS";
    default: return "UNKNOWN";
    }
}

static bool HeaderMatchesKey(HTTPRequest* req, const std::string& header, const std::string& arg)
{
    std::string expected = gArgs.GetArg(arg, "");
    if (expected.empty()) return false;
    std::pair<bool, std::string> supplied = req->GetHeader(header);
    return supplied.first && SecretEquals(supplied.second, expected);
}

static bool FraudRESTRequestHandler(HTTPRequest* req, const std::string& strReq)
{
    APIRequest request;
    request.method = RequestMethodName(req->GetRequestMethod());

    std::string uri = req->GetURI();
    size_t queryPos = uri.find('?');
    request.path = uri.substr(0, queryPos);
    if (queryPos != std::string::npos) {
        request.query = ParseQueryString(uri.substr(queryPos + 1));
    }
    request.body = req->ReadBody();
    request.metadata = RequestMetadata(req->GetPeer(), req->GetHeaders());
    request.identity.isAdmin = HeaderMatchesKey(req, "X-Admin-Key", "-adminkey");
    request.identity.isMerchant = HeaderMatchesKey(req, "X-Merchant-Key", "-merchantkey");

    APIReply reply = HandleAPIRequest(g_restContext, request);

    for (const auto& header : reply.headers) {
        req->WriteHeader(header.first, header.second);
    }
    req->WriteReply(reply.status, reply.body);
    return reply.status < 400;
}

void InitFraudRESTHandlers(const FraudRESTContext& context)
{
    LogPrintf("Initializing fraud REST handlers...\n");
    g_restContext = context;

    RegisterHTTPHandler("/redeem", true, FraudRESTRequestHandler);
    RegisterHTTPHandler("/webhooks/fraud-alert", true, FraudRESTRequestHandler);
    RegisterHTTPHandler("/admin/", false, FraudRESTRequestHandler);

    if (gArgs.GetArg("-adminkey", "").empty()) {
        LogPrintf("Warning: -adminkey is not set, admin endpoints will refuse every request\n");
    }
}

void StopFraudRESTHandlers()
{
    UnregisterHTTPHandler("/redeem", true);
    UnregisterHTTPHandler("/webhooks/fraud-alert", true);
    UnregisterHTTPHandler("/admin/", false);
}

} // namespace giftguard
