// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file rate_limiter.cpp
 * @brief In-memory fixed-window rate limit store
 */

#include <guard/rate_limiter.h>
#include <util.h>

#include <random>

namespace giftguard {

std::string RateLimitScopeToString(RateLimitScope scope)
{
    switch (scope) {
        case RateLimitScope::IP: return "ip";
        case RateLimitScope::DEVICE: return "device";
        case RateLimitScope::MERCHANT: return "merchant";
    }
    return "unknown";
}

int64_t WindowStartFor(int64_t nowMs, int64_t windowMs)
{
    if (windowMs <= 0) return nowMs;
    int64_t start = (nowMs / windowMs) * windowMs;
    // Floor for negative timestamps
    if (start > nowMs) start -= windowMs;
    return start;
}

RateLimitDecision DecideWindow(uint32_t count, const RateLimitPolicy& policy, int64_t windowStart, int64_t nowMs)
{
    if (count > policy.limit) {
        return RateLimitDecision::Denied(count, policy.limit, windowStart,
                                         windowStart + policy.windowMs - nowMs);
    }
    return RateLimitDecision::Allowed(count, policy.limit, windowStart);
}

// ============================================================================
// MemoryRateLimitStore
// ============================================================================

MemoryRateLimitStore::MemoryRateLimitStore()
{
    // Random per-process shard keys
    std::random_device rd;
    k0_ = (uint64_t(rd()) << 32) | rd();
    k1_ = (uint64_t(rd()) << 32) | rd();
}

MemoryRateLimitStore::Shard& MemoryRateLimitStore::ShardFor(RateLimitScope scope, const std::string& key)
{
    CSipHasher hasher(k0_, k1_);
    unsigned char tag = static_cast<unsigned char>(scope);
    hasher.Write(&tag, 1);
    hasher.Write(key);
    return shards_[hasher.Finalize() % RATE_LIMIT_SHARD_COUNT];
}

RateLimitDecision MemoryRateLimitStore::CheckAndIncrement(
    RateLimitScope scope,
    const std::string& key,
    const RateLimitPolicy& policy,
    int64_t nowMs)
{
    Shard& shard = ShardFor(scope, key);
    const int64_t windowStart = WindowStartFor(nowMs, policy.windowMs);

    LOCK(shard.cs_shard);

    RateLimitWindow& window = shard.windows[WindowKey(scope, key)];
    if (window.windowStart != windowStart || window.windowDuration != policy.windowMs) {
        // New window: reset in place
        window.count = 0;
        window.windowStart = windowStart;
        window.windowDuration = policy.windowMs;
    }
    window.limit = policy.limit;
    window.lastSeen = nowMs;
    window.count++;

    RateLimitDecision decision = DecideWindow(window.count, policy, windowStart, nowMs);
    if (!decision.allowed) {
        LogPrint(BCLog::RATELIMIT, "RateLimit: %s limit reached for %s (%u/%u), retry in %dms\n",
                 RateLimitScopeToString(scope), key, decision.count, decision.limit, decision.retryAfterMs);
    }
    return decision;
}

uint32_t MemoryRateLimitStore::Peek(RateLimitScope scope, const std::string& key, int64_t windowMs, int64_t nowMs)
{
    Shard& shard = ShardFor(scope, key);
    LOCK(shard.cs_shard);

    auto it = shard.windows.find(WindowKey(scope, key));
    if (it == shard.windows.end()) {
        return 0;
    }
    if (it->second.windowStart != WindowStartFor(nowMs, windowMs)) {
        return 0;
    }
    return it->second.count;
}

void MemoryRateLimitStore::Evict(RateLimitScope scope, const std::string& key)
{
    Shard& shard = ShardFor(scope, key);
    LOCK(shard.cs_shard);
    shard.windows.erase(WindowKey(scope, key));
}

size_t MemoryRateLimitStore::Sweep(int64_t nowMs)
{
    size_t evicted = 0;
    for (Shard& shard : shards_) {
        LOCK(shard.cs_shard);
        for (auto it = shard.windows.begin(); it != shard.windows.end(); ) {
            const RateLimitWindow& w = it->second;
            if (nowMs - w.lastSeen >= RATE_LIMIT_IDLE_WINDOWS * w.windowDuration) {
                it = shard.windows.erase(it);
                ++evicted;
            } else {
                ++it;
            }
        }
    }
    if (evicted > 0) {
        LogPrint(BCLog::RATELIMIT, "RateLimit: swept %u idle windows\n", evicted);
    }
    return evicted;
}

size_t MemoryRateLimitStore::Size() const
{
    size_t total = 0;
    for (const Shard& shard : shards_) {
        LOCK(shard.cs_shard);
        total += shard.windows.size();
    }
    return total;
}

} // namespace giftguard
