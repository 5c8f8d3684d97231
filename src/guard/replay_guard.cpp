// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <guard/replay_guard.h>

#include <guard/fingerprint.h>
#include <util.h>
#include <utilstrencodings.h>

#include <functional>
#include <stdexcept>

namespace giftguard {

std::string ReserveResultToString(ReserveResult result)
{
    switch (result) {
        case ReserveResult::RESERVED: return "reserved";
        case ReserveResult::ALREADY_REDEEMED: return "already_redeemed";
        case ReserveResult::ALREADY_RESERVED: return "already_reserved";
    }
    return "unknown";
}

std::string RedemptionCodeDigest(const std::string& code)
{
    return HashIdentityString("gan:" + TrimString(code));
}

ReplayGuard::ReplayGuard(int64_t reservationTimeoutMs, RedeemedCodeStore* store)
    : reservationTimeoutMs_(reservationTimeoutMs)
    , store_(store)
{
}

ReplayGuard::Shard& ReplayGuard::ShardFor(const std::string& digest)
{
    return shards_[std::hash<std::string>()(digest) % REPLAY_SHARD_COUNT];
}

const ReplayGuard::Shard& ReplayGuard::ShardFor(const std::string& digest) const
{
    return shards_[std::hash<std::string>()(digest) % REPLAY_SHARD_COUNT];
}

ReserveResult ReplayGuard::Reserve(const std::string& code, int64_t nowMs)
{
    const std::string digest = RedemptionCodeDigest(code);
    Shard& shard = ShardFor(digest);
    LOCK(shard.cs_replay);

    if (shard.committed.count(digest)) {
        return ReserveResult::ALREADY_REDEEMED;
    }

    auto it = shard.reservations.find(digest);
    if (it != shard.reservations.end() && it->second.expiresAt > nowMs) {
        LogPrint(BCLog::REPLAY, "Replay: reservation conflict for code digest %s\n", digest);
        return ReserveResult::ALREADY_RESERVED;
    }

    ReplayReservation reservation;
    reservation.code = digest;
    reservation.claimedAt = nowMs;
    reservation.expiresAt = nowMs + reservationTimeoutMs_;
    shard.reservations[digest] = reservation;
    return ReserveResult::RESERVED;
}

bool ReplayGuard::Release(const std::string& code)
{
    const std::string digest = RedemptionCodeDigest(code);
    Shard& shard = ShardFor(digest);
    LOCK(shard.cs_replay);
    return shard.reservations.erase(digest) > 0;
}

bool ReplayGuard::Commit(const std::string& code, int64_t nowMs)
{
    const std::string digest = RedemptionCodeDigest(code);
    {
        Shard& shard = ShardFor(digest);
        LOCK(shard.cs_replay);
        shard.reservations.erase(digest);
        if (!shard.committed.insert(digest).second) {
            return true;
        }
    }

    if (store_ == nullptr) {
        return true;
    }

    try {
        store_->StoreRedeemedCode(digest, nowMs);
    } catch (const std::exception& e) {
        LogPrintf("Replay: failed to persist redeemed code %s: %s\n", digest, e.what());
        return false;
    }
    return true;
}

bool ReplayGuard::IsCommitted(const std::string& code) const
{
    const std::string digest = RedemptionCodeDigest(code);
    const Shard& shard = ShardFor(digest);
    LOCK(shard.cs_replay);
    return shard.committed.count(digest) > 0;
}

bool ReplayGuard::IsReserved(const std::string& code, int64_t nowMs) const
{
    const std::string digest = RedemptionCodeDigest(code);
    const Shard& shard = ShardFor(digest);
    LOCK(shard.cs_replay);
    auto it = shard.reservations.find(digest);
    return it != shard.reservations.end() && it->second.expiresAt > nowMs;
}

size_t ReplayGuard::Sweep(int64_t nowMs)
{
    size_t removed = 0;
    for (Shard& shard : shards_) {
        LOCK(shard.cs_replay);
        for (auto it = shard.reservations.begin(); it != shard.reservations.end(); ) {
            if (it->second.expiresAt <= nowMs) {
                it = shard.reservations.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    if (removed > 0) {
        LogPrint(BCLog::REPLAY, "Replay: swept %u expired reservations\n", removed);
    }
    return removed;
}

size_t ReplayGuard::LoadCommitted()
{
    if (store_ == nullptr) {
        return 0;
    }

    std::vector<std::string> digests = store_->LoadRedeemedCodes();
    for (const std::string& digest : digests) {
        Shard& shard = ShardFor(digest);
        LOCK(shard.cs_replay);
        shard.committed.insert(digest);
    }
    LogPrintf("Replay: loaded %u redeemed codes\n", digests.size());
    return digests.size();
}

size_t ReplayGuard::GetReservationCount() const
{
    size_t total = 0;
    for (const Shard& shard : shards_) {
        LOCK(shard.cs_replay);
        total += shard.reservations.size();
    }
    return total;
}

size_t ReplayGuard::GetCommittedCount() const
{
    size_t total = 0;
    for (const Shard& shard : shards_) {
        LOCK(shard.cs_replay);
        total += shard.committed.size();
    }
    return total;
}

} // namespace giftguard
