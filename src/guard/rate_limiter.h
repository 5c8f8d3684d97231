// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GIFTGUARD_GUARD_RATE_LIMITER_H
#define GIFTGUARD_GUARD_RATE_LIMITER_H

/**
 * @file rate_limiter.h
 * @brief Fixed-window rate limit counters keyed by (scope, key)
 *
 * Each (scope, key) pair owns one counter window aligned to multiples of
 * the window duration. check-and-increment is atomic per key: the window is
 * fetched or created, reset if its start has moved, incremented, and the
 * request denied if the resulting count exceeds the limit.
 *
 * Windows idle for two window durations are evicted by Sweep(); windows are
 * also reset lazily on access.
 *
 * The store is injectable so that a durable backend can replace the
 * in-memory one without touching the guard.
 */

#include <crypto/siphash.h>
#include <sync.h>

#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <utility>

namespace giftguard {

// ============================================================================
// Constants
// ============================================================================

/** Number of independently locked shards in the in-memory store */
static constexpr size_t RATE_LIMIT_SHARD_COUNT = 16;

/** Windows without traffic for this many durations are evicted */
static constexpr int64_t RATE_LIMIT_IDLE_WINDOWS = 2;

// ============================================================================
// Data Structures
// ============================================================================

enum class RateLimitScope : uint8_t {
    IP = 1,
    DEVICE = 2,
    MERCHANT = 3
};

std::string RateLimitScopeToString(RateLimitScope scope);

/**
 * @brief Limit and window duration for one scope
 */
struct RateLimitPolicy {
    uint32_t limit;
    int64_t windowMs;

    RateLimitPolicy() : limit(0), windowMs(0) {}
    RateLimitPolicy(uint32_t l, int64_t w) : limit(l), windowMs(w) {}
};

/**
 * @brief One counter window
 */
struct RateLimitWindow {
    uint32_t count;
    int64_t windowStart;
    int64_t windowDuration;
    uint32_t limit;
    int64_t lastSeen;

    RateLimitWindow() : count(0), windowStart(0), windowDuration(0), limit(0), lastSeen(0) {}
};

/**
 * @brief Result of a check-and-increment
 */
struct RateLimitDecision {
    bool allowed;
    uint32_t count;
    uint32_t limit;
    int64_t windowStart;
    /** Milliseconds until the current window ends, only meaningful when denied */
    int64_t retryAfterMs;

    RateLimitDecision() : allowed(true), count(0), limit(0), windowStart(0), retryAfterMs(0) {}

    static RateLimitDecision Allowed(uint32_t count, uint32_t limit, int64_t windowStart) {
        RateLimitDecision d;
        d.allowed = true;
        d.count = count;
        d.limit = limit;
        d.windowStart = windowStart;
        return d;
    }

    static RateLimitDecision Denied(uint32_t count, uint32_t limit, int64_t windowStart, int64_t retryAfterMs) {
        RateLimitDecision d;
        d.allowed = false;
        d.count = count;
        d.limit = limit;
        d.windowStart = windowStart;
        d.retryAfterMs = retryAfterMs;
        return d;
    }

    /** Retry-After in whole seconds, rounded up, at least 1 */
    int64_t RetryAfterSeconds() const {
        int64_t secs = (retryAfterMs + 999) / 1000;
        return secs < 1 ? 1 : secs;
    }
};

/** Start of the fixed window containing nowMs */
int64_t WindowStartFor(int64_t nowMs, int64_t windowMs);

/** Decide a counter that has just been incremented to count */
RateLimitDecision DecideWindow(uint32_t count, const RateLimitPolicy& policy, int64_t windowStart, int64_t nowMs);

// ============================================================================
// Store Interface
// ============================================================================

/**
 * @brief Keyed fixed-window counter store
 */
class RateLimitStore {
public:
    virtual ~RateLimitStore() = default;

    /**
     * @brief Atomically count one event for (scope, key) and decide it
     * @param scope Limit scope
     * @param key Identity within the scope (IP, device id, merchant id)
     * @param policy Limit and window for the scope
     * @param nowMs Current time in milliseconds
     */
    virtual RateLimitDecision CheckAndIncrement(RateLimitScope scope, const std::string& key,
                                                const RateLimitPolicy& policy, int64_t nowMs) = 0;

    /** Current count of the window containing nowMs, without incrementing */
    virtual uint32_t Peek(RateLimitScope scope, const std::string& key, int64_t windowMs, int64_t nowMs) = 0;

    /** Drop the window for (scope, key) */
    virtual void Evict(RateLimitScope scope, const std::string& key) = 0;

    /**
     * @brief Evict windows idle for RATE_LIMIT_IDLE_WINDOWS durations
     * @return Number of windows evicted
     */
    virtual size_t Sweep(int64_t nowMs) = 0;

    /** Number of live windows */
    virtual size_t Size() const = 0;
};

/**
 * @brief In-memory store sharded by key hash
 *
 * Keys hash to one of RATE_LIMIT_SHARD_COUNT shards, each with its own lock,
 * so concurrent requests for different keys rarely contend.
 */
class MemoryRateLimitStore : public RateLimitStore {
public:
    MemoryRateLimitStore();

    RateLimitDecision CheckAndIncrement(RateLimitScope scope, const std::string& key,
                                        const RateLimitPolicy& policy, int64_t nowMs) override;
    uint32_t Peek(RateLimitScope scope, const std::string& key, int64_t windowMs, int64_t nowMs) override;
    void Evict(RateLimitScope scope, const std::string& key) override;
    size_t Sweep(int64_t nowMs) override;
    size_t Size() const override;

private:
    typedef std::pair<RateLimitScope, std::string> WindowKey;

    struct Shard {
        mutable CCriticalSection cs_shard;
        std::map<WindowKey, RateLimitWindow> windows;
    };

    Shard& ShardFor(RateLimitScope scope, const std::string& key);

    std::array<Shard, RATE_LIMIT_SHARD_COUNT> shards_;
    uint64_t k0_;
    uint64_t k1_;
};

} // namespace giftguard

#endif // GIFTGUARD_GUARD_RATE_LIMITER_H
