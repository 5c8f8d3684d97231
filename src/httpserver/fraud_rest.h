// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GIFTGUARD_HTTPSERVER_FRAUD_REST_H
#define GIFTGUARD_HTTPSERVER_FRAUD_REST_H

/**
 * @file fraud_rest.h
 * @brief REST surface of the redemption guard and the threat clustering engine
 *
 * Endpoints:
 * - POST /redeem                           - guarded gift-card redemption
 * - POST /webhooks/fraud-alert             - external detector signal
 * - GET  /admin/fraud-logs?limit=N         - recent fraud logs
 * - GET  /admin/fraud-statistics           - fraud log statistics
 * - GET  /admin/fraud-clusters?limit=N     - clusters with cluster statistics
 * - GET  /admin/fraud-clusters/<id>        - one cluster with its patterns
 * - POST /admin/threat-analysis/trigger    - run the clustering job now
 * - GET  /admin/stream                     - open a monitoring session
 * - GET  /admin/events?session=N           - drain a monitoring session
 * - DELETE /admin/stream?session=N         - close a monitoring session
 *
 * Request dispatch is independent of libevent so it can be driven from
 * tests; InitFraudRESTHandlers() binds it to the HTTP server.
 */

#include <guard/fingerprint.h>

#include <cstdint>
#include <map>
#include <string>

namespace giftguard {

class AlertBroadcaster;
class ClusterStore;
class FraudLogStore;
class RedemptionGuard;
class ThreatClusterEngine;

static constexpr int64_t DEFAULT_FRAUD_LOG_LIMIT = 50;
static constexpr int64_t MAX_FRAUD_LOG_LIMIT = 1000;
static constexpr int64_t DEFAULT_CLUSTER_LIST_LIMIT = 50;
static constexpr int64_t MAX_CLUSTER_LIST_LIMIT = 1000;

/** Caller identity as established by the host. Tokens are never parsed here. */
struct IdentityContext {
    bool isAdmin;
    bool isMerchant;

    IdentityContext() : isAdmin(false), isMerchant(false) {}
};

struct APIRequest {
    /** "GET", "POST", "DELETE", ... */
    std::string method;
    /** URI path without query string */
    std::string path;
    std::map<std::string, std::string> query;
    std::string body;
    RequestMetadata metadata;
    IdentityContext identity;
};

struct APIReply {
    int status;
    std::string body;
    std::map<std::string, std::string> headers;

    APIReply() : status(200) {}
    APIReply(int s, const std::string& b) : status(s), body(b) {}
};

/** Components served by the REST layer. Any may be null; its endpoints then answer 503. */
struct FraudRESTContext {
    RedemptionGuard* guard;
    FraudLogStore* logStore;
    ClusterStore* clusterStore;
    ThreatClusterEngine* engine;
    AlertBroadcaster* broadcaster;

    FraudRESTContext()
        : guard(nullptr), logStore(nullptr), clusterStore(nullptr), engine(nullptr), broadcaster(nullptr) {}
};

/** Route and answer one request */
APIReply HandleAPIRequest(const FraudRESTContext& context, const APIRequest& request);

/** Split "a=1&b=x%20y" into decoded key/value pairs */
std::map<std::string, std::string> ParseQueryString(const std::string& query);

/** Compare two secrets without early exit */
bool SecretEquals(const std::string& a, const std::string& b);

/**
 * @brief Register the REST handlers with the HTTP server
 *
 * The admin identity is granted when the X-Admin-Key header matches
 * -adminkey, the merchant identity when X-Merchant-Key matches -merchantkey.
 * An unset key grants nothing.
 */
void InitFraudRESTHandlers(const FraudRESTContext& context);

/** Unregister the REST handlers */
void StopFraudRESTHandlers();

} // namespace giftguard

#endif // GIFTGUARD_HTTPSERVER_FRAUD_REST_H
