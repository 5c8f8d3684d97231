// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GIFTGUARD_GUARD_GUARD_CONFIG_H
#define GIFTGUARD_GUARD_GUARD_CONFIG_H

/**
 * @file guard_config.h
 * @brief Guard and clustering configuration from command line, environment
 *        and config file
 *
 * Rate-limit and clustering windows are given in seconds, timeouts in
 * milliseconds.
 */

#include <fraud/alert_broadcaster.h>
#include <fraud/threat_cluster_engine.h>
#include <guard/redemption_guard.h>
#include <guard/replay_guard.h>

#include <string>

namespace giftguard {

static const char* const RATE_LIMIT_BACKEND_MEMORY = "memory";
static const char* const RATE_LIMIT_BACKEND_DB = "db";
static const char* const DEFAULT_RATE_LIMIT_BACKEND = RATE_LIMIT_BACKEND_MEMORY;

static constexpr int64_t DEFAULT_SWEEP_INTERVAL_SECONDS = 60;

struct GuardConfig {
    GuardPolicy policy;
    int64_t reservationTimeoutMs;
    std::string rateLimitBackend;
    int64_t sweepIntervalMs;
    size_t alertQueueSize;
    int64_t alertSessionTimeoutMs;
    ClusterEngineConfig cluster;

    GuardConfig();
};

/**
 * Get guard help message for command-line options
 * @return Help message string
 */
std::string GetGuardHelpMessage();

/**
 * Read guard, clustering and alert options from gArgs
 * @param[out] config Parsed configuration
 * @return false (after InitError) if a value is out of range
 */
bool InitGuardConfig(GuardConfig& config);

} // namespace giftguard

#endif // GIFTGUARD_GUARD_GUARD_CONFIG_H
