// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GIFTGUARD_GUARD_REPLAY_GUARD_H
#define GIFTGUARD_GUARD_REPLAY_GUARD_H

/**
 * @file replay_guard.h
 * @brief Redemption code replay protection
 *
 * A code moves through three states inside the guard: free, reserved
 * (a redemption is in flight) and committed (redeemed for good). At most
 * one live reservation exists per code; a reservation that is neither
 * committed nor released expires after the reservation timeout and the
 * code becomes free again. Committed codes are denied forever.
 */

#include <sync.h>

#include <array>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace giftguard {

/** Default lifetime of an in-flight reservation */
static constexpr int64_t DEFAULT_RESERVATION_TIMEOUT_MS = 30 * 1000;

static constexpr size_t REPLAY_SHARD_COUNT = 16;

enum class ReserveResult : uint8_t {
    RESERVED = 0,
    ALREADY_REDEEMED = 1,
    ALREADY_RESERVED = 2
};

std::string ReserveResultToString(ReserveResult result);

/**
 * @brief A live claim on a code
 */
struct ReplayReservation {
    std::string code;
    int64_t claimedAt;
    int64_t expiresAt;

    ReplayReservation() : claimedAt(0), expiresAt(0) {}
};

/**
 * @brief Durable record of committed codes
 *
 * Only digests of codes are handed to the store.
 */
class RedeemedCodeStore {
public:
    virtual ~RedeemedCodeStore() = default;

    /** Persist a committed code digest. Throws on storage failure. */
    virtual void StoreRedeemedCode(const std::string& codeDigest, int64_t committedAt) = 0;

    /** All committed code digests */
    virtual std::vector<std::string> LoadRedeemedCodes() = 0;
};

/** Digest used for the committed set and for durable storage */
std::string RedemptionCodeDigest(const std::string& code);

/**
 * @brief Reservation cache plus permanent denial set
 *
 * Thread-safe. State is sharded by code digest so that concurrent requests
 * for different codes do not contend.
 */
class ReplayGuard {
public:
    /**
     * @param reservationTimeoutMs Lifetime of an uncommitted reservation
     * @param store Optional durable backing for committed codes (not owned)
     */
    explicit ReplayGuard(int64_t reservationTimeoutMs = DEFAULT_RESERVATION_TIMEOUT_MS,
                         RedeemedCodeStore* store = nullptr);

    /**
     * @brief Claim a code for an in-flight redemption
     *
     * Expired reservations are treated as absent.
     */
    ReserveResult Reserve(const std::string& code, int64_t nowMs);

    /**
     * @brief Drop a live reservation
     * @return true if a reservation was removed
     */
    bool Release(const std::string& code);

    /**
     * @brief Mark a code permanently redeemed and drop its reservation
     *
     * The in-memory denial is recorded even if the durable write fails.
     * @return false if the durable write failed
     */
    bool Commit(const std::string& code, int64_t nowMs);

    bool IsCommitted(const std::string& code) const;
    bool IsReserved(const std::string& code, int64_t nowMs) const;

    /** Remove expired reservations. Returns the number removed. */
    size_t Sweep(int64_t nowMs);

    /**
     * @brief Restore the committed set from the durable store
     * @return Number of digests loaded
     */
    size_t LoadCommitted();

    size_t GetReservationCount() const;
    size_t GetCommittedCount() const;

    int64_t GetReservationTimeout() const { return reservationTimeoutMs_; }

private:
    struct Shard {
        mutable CCriticalSection cs_replay;
        std::map<std::string, ReplayReservation> reservations;
        std::set<std::string> committed;
    };

    Shard& ShardFor(const std::string& digest);
    const Shard& ShardFor(const std::string& digest) const;

    std::array<Shard, REPLAY_SHARD_COUNT> shards_;
    const int64_t reservationTimeoutMs_;
    RedeemedCodeStore* store_;
};

} // namespace giftguard

#endif // GIFTGUARD_GUARD_REPLAY_GUARD_H
