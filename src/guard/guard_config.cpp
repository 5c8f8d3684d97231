// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <guard/guard_config.h>

#include <util.h>
#include <utilstrencodings.h>

namespace giftguard {

GuardConfig::GuardConfig()
    : reservationTimeoutMs(DEFAULT_RESERVATION_TIMEOUT_MS)
    , rateLimitBackend(DEFAULT_RATE_LIMIT_BACKEND)
    , sweepIntervalMs(DEFAULT_SWEEP_INTERVAL_SECONDS * 1000)
    , alertQueueSize(DEFAULT_ALERT_QUEUE_SIZE)
    , alertSessionTimeoutMs(DEFAULT_ALERT_SESSION_TIMEOUT_MS)
{
}

std::string GetGuardHelpMessage()
{
    std::string strUsage;

    strUsage += HelpMessageGroup("Redemption guard options:");
    strUsage += HelpMessageOpt("-iplimit=<n>", strprintf("Redemption attempts allowed per IP and window (default: %u)", DEFAULT_IP_LIMIT));
    strUsage += HelpMessageOpt("-ipwindow=<secs>", strprintf("IP rate limit window in seconds (default: %d)", DEFAULT_IP_WINDOW_MS / 1000));
    strUsage += HelpMessageOpt("-devicelimit=<n>", strprintf("Failed attempts allowed per device and window (default: %u)", DEFAULT_DEVICE_LIMIT));
    strUsage += HelpMessageOpt("-devicewindow=<secs>", strprintf("Device failure window in seconds (default: %d)", DEFAULT_DEVICE_WINDOW_MS / 1000));
    strUsage += HelpMessageOpt("-devicesoftthreshold=<n>", strprintf("Log allowed redemptions from devices with this many failures, 0 to disable (default: %u)", DEFAULT_DEVICE_SOFT_THRESHOLD));
    strUsage += HelpMessageOpt("-merchantlimit=<n>", strprintf("Redemptions allowed per merchant and window (default: %u)", DEFAULT_MERCHANT_LIMIT));
    strUsage += HelpMessageOpt("-merchantwindow=<secs>", strprintf("Merchant rate limit window in seconds (default: %d)", DEFAULT_MERCHANT_WINDOW_MS / 1000));
    strUsage += HelpMessageOpt("-reservationtimeout=<ms>", strprintf("Lifetime of an in-flight code reservation (default: %d)", DEFAULT_RESERVATION_TIMEOUT_MS));
    strUsage += HelpMessageOpt("-upstreamtimeout=<ms>", strprintf("Timeout of the gift-card ledger call (default: %d)", DEFAULT_UPSTREAM_TIMEOUT_MS));
    strUsage += HelpMessageOpt("-ratelimitbackend=<backend>", strprintf("Rate limit store: %s or %s (default: %s)", RATE_LIMIT_BACKEND_MEMORY, RATE_LIMIT_BACKEND_DB, DEFAULT_RATE_LIMIT_BACKEND));
    strUsage += HelpMessageOpt("-trustedproxy=<ip>", "Believe X-Forwarded-For and X-Real-IP from this peer address (can be specified multiple times)");
    strUsage += HelpMessageOpt("-sweepinterval=<secs>", strprintf("Interval of the rate limit and reservation sweep (default: %d)", DEFAULT_SWEEP_INTERVAL_SECONDS));

    strUsage += HelpMessageGroup("Threat clustering options:");
    strUsage += HelpMessageOpt("-clusterinterval=<secs>", strprintf("Interval between clustering runs, 0 to disable (default: %d)", DEFAULT_CLUSTER_INTERVAL_MS / 1000));
    strUsage += HelpMessageOpt("-clusterlookback=<secs>", strprintf("Age of the oldest fraud log considered (default: %d)", DEFAULT_CLUSTER_LOOKBACK_MS / 1000));
    strUsage += HelpMessageOpt("-clusterwindow=<secs>", strprintf("Gap that splits IP and device sessions (default: %d)", DEFAULT_CLUSTER_WINDOW_MS / 1000));
    strUsage += HelpMessageOpt("-clustertimeout=<ms>", strprintf("Deadline of one clustering run (default: %d)", DEFAULT_CLUSTER_TIMEOUT_MS));
    strUsage += HelpMessageOpt("-clustermaxlogs=<n>", strprintf("Maximum fraud logs read per run (default: %u)", DEFAULT_CLUSTER_MAX_LOGS));
    strUsage += HelpMessageOpt("-ipminthreats=<n>", strprintf("Logs needed for a new IP cluster (default: %d)", DEFAULT_CLUSTER_MIN_THREATS));
    strUsage += HelpMessageOpt("-deviceminthreats=<n>", strprintf("Logs needed for a new device cluster (default: %d)", DEFAULT_CLUSTER_MIN_THREATS));
    strUsage += HelpMessageOpt("-velocityminthreats=<n>", strprintf("Events needed inside the velocity window (default: %d)", DEFAULT_CLUSTER_MIN_THREATS));
    strUsage += HelpMessageOpt("-velocitywindow=<secs>", strprintf("Velocity window in seconds (default: %d)", DEFAULT_VELOCITY_WINDOW_MS / 1000));
    strUsage += HelpMessageOpt("-uaminthreats=<n>", strprintf("Logs needed for a new user agent cluster (default: %d)", DEFAULT_CLUSTER_MIN_THREATS));
    strUsage += HelpMessageOpt("-alertqueuesize=<n>", strprintf("Undelivered events kept per monitoring session (default: %u)", DEFAULT_ALERT_QUEUE_SIZE));
    strUsage += HelpMessageOpt("-alertsessiontimeout=<secs>", strprintf("Drop monitoring sessions that have not polled for this long (default: %d)", DEFAULT_ALERT_SESSION_TIMEOUT_MS / 1000));

    return strUsage;
}

namespace {

bool ReadPositive(const std::string& name, int64_t defaultValue, int64_t& out)
{
    int64_t value = gArgs.GetArg(name, defaultValue);
    if (value <= 0) {
        return InitError(strprintf("Invalid value for %s: %d (must be positive)", name, value));
    }
    out = value;
    return true;
}

bool ReadNonNegative(const std::string& name, int64_t defaultValue, int64_t& out)
{
    int64_t value = gArgs.GetArg(name, defaultValue);
    if (value < 0) {
        return InitError(strprintf("Invalid value for %s: %d (must not be negative)", name, value));
    }
    out = value;
    return true;
}

} // anonymous namespace

bool InitGuardConfig(GuardConfig& config)
{
    int64_t value = 0;

    // Rate limits
    if (!ReadPositive("-iplimit", DEFAULT_IP_LIMIT, value)) return false;
    config.policy.ipPolicy.limit = static_cast<uint32_t>(value);
    if (!ReadPositive("-ipwindow", DEFAULT_IP_WINDOW_MS / 1000, value)) return false;
    config.policy.ipPolicy.windowMs = value * 1000;

    if (!ReadPositive("-devicelimit", DEFAULT_DEVICE_LIMIT, value)) return false;
    config.policy.devicePolicy.limit = static_cast<uint32_t>(value);
    if (!ReadPositive("-devicewindow", DEFAULT_DEVICE_WINDOW_MS / 1000, value)) return false;
    config.policy.devicePolicy.windowMs = value * 1000;
    if (!ReadNonNegative("-devicesoftthreshold", DEFAULT_DEVICE_SOFT_THRESHOLD, value)) return false;
    config.policy.deviceSoftThreshold = static_cast<uint32_t>(value);

    if (!ReadPositive("-merchantlimit", DEFAULT_MERCHANT_LIMIT, value)) return false;
    config.policy.merchantPolicy.limit = static_cast<uint32_t>(value);
    if (!ReadPositive("-merchantwindow", DEFAULT_MERCHANT_WINDOW_MS / 1000, value)) return false;
    config.policy.merchantPolicy.windowMs = value * 1000;

    if (!ReadPositive("-reservationtimeout", DEFAULT_RESERVATION_TIMEOUT_MS, config.reservationTimeoutMs)) return false;
    if (!ReadPositive("-upstreamtimeout", DEFAULT_UPSTREAM_TIMEOUT_MS, config.policy.upstreamTimeoutMs)) return false;

    config.rateLimitBackend = gArgs.GetArg("-ratelimitbackend", DEFAULT_RATE_LIMIT_BACKEND);
    if (config.rateLimitBackend != RATE_LIMIT_BACKEND_MEMORY && config.rateLimitBackend != RATE_LIMIT_BACKEND_DB) {
        return InitError(strprintf("Unknown -ratelimitbackend '%s'", config.rateLimitBackend));
    }

    config.policy.trustedProxies.clear();
    for (const std::string& proxy : gArgs.GetArgs("-trustedproxy")) {
        std::string address = StripPort(TrimString(proxy));
        if (address.empty()) {
            return InitError(strprintf("Invalid -trustedproxy '%s'", proxy));
        }
        config.policy.trustedProxies.insert(address);
    }

    if (!ReadPositive("-sweepinterval", DEFAULT_SWEEP_INTERVAL_SECONDS, value)) return false;
    config.sweepIntervalMs = value * 1000;

    // Clustering
    if (!ReadNonNegative("-clusterinterval", DEFAULT_CLUSTER_INTERVAL_MS / 1000, value)) return false;
    config.cluster.intervalMs = value * 1000;
    if (!ReadPositive("-clusterlookback", DEFAULT_CLUSTER_LOOKBACK_MS / 1000, value)) return false;
    config.cluster.lookbackMs = value * 1000;
    if (!ReadPositive("-clusterwindow", DEFAULT_CLUSTER_WINDOW_MS / 1000, value)) return false;
    config.cluster.windowMs = value * 1000;
    if (!ReadPositive("-velocitywindow", DEFAULT_VELOCITY_WINDOW_MS / 1000, value)) return false;
    config.cluster.velocityWindowMs = value * 1000;
    if (!ReadPositive("-clustertimeout", DEFAULT_CLUSTER_TIMEOUT_MS, config.cluster.timeoutMs)) return false;
    if (!ReadPositive("-clustermaxlogs", DEFAULT_CLUSTER_MAX_LOGS, value)) return false;
    config.cluster.maxLogs = static_cast<size_t>(value);

    if (!ReadPositive("-ipminthreats", DEFAULT_CLUSTER_MIN_THREATS, config.cluster.ipMinCount)) return false;
    if (!ReadPositive("-deviceminthreats", DEFAULT_CLUSTER_MIN_THREATS, config.cluster.deviceMinCount)) return false;
    if (!ReadPositive("-velocityminthreats", DEFAULT_CLUSTER_MIN_THREATS, config.cluster.velocityMinCount)) return false;
    if (!ReadPositive("-uaminthreats", DEFAULT_CLUSTER_MIN_THREATS, config.cluster.uaMinCount)) return false;

    if (!ReadPositive("-alertqueuesize", DEFAULT_ALERT_QUEUE_SIZE, value)) return false;
    config.alertQueueSize = static_cast<size_t>(value);
    if (!ReadPositive("-alertsessiontimeout", DEFAULT_ALERT_SESSION_TIMEOUT_MS / 1000, value)) return false;
    config.alertSessionTimeoutMs = value * 1000;

    LogPrintf("Guard: ip %u/%ds, device %u failures/%ds, merchant %u/%ds, rate limit backend %s\n",
              config.policy.ipPolicy.limit, config.policy.ipPolicy.windowMs / 1000,
              config.policy.devicePolicy.limit, config.policy.devicePolicy.windowMs / 1000,
              config.policy.merchantPolicy.limit, config.policy.merchantPolicy.windowMs / 1000,
              config.rateLimitBackend);
    if (!config.policy.trustedProxies.empty()) {
        LogPrintf("Guard: trusting forwarding headers from %u proxies\n", config.policy.trustedProxies.size());
    }
    LogPrintf("Clustering: interval %ds, look-back %ds, window %ds, velocity window %ds\n",
              config.cluster.intervalMs / 1000, config.cluster.lookbackMs / 1000,
              config.cluster.windowMs / 1000, config.cluster.velocityWindowMs / 1000);

    return true;
}

} // namespace giftguard
