// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <guard/giftcard_store.h>

#include <util.h>
#include <utilstrencodings.h>

namespace giftguard {

std::string RedeemStatusToString(RedeemStatus status)
{
    switch (status) {
        case RedeemStatus::REDEEMED: return "redeemed";
        case RedeemStatus::NOT_FOUND: return "not_found";
        case RedeemStatus::ALREADY_REDEEMED: return "already_redeemed";
        case RedeemStatus::INACTIVE: return "inactive";
        case RedeemStatus::UNAVAILABLE: return "unavailable";
        case RedeemStatus::TIMEOUT: return "timeout";
    }
    return "unknown";
}

void MemoryGiftCardStore::AddCard(const std::string& code, int64_t balance, bool active)
{
    LOCK(cs_cards_);
    Card card;
    card.balance = balance;
    card.active = active;
    cards_[code] = card;
}

void MemoryGiftCardStore::SetAvailable(bool available)
{
    LOCK(cs_cards_);
    available_ = available;
}

bool MemoryGiftCardStore::GetCard(const std::string& code, Card& card) const
{
    LOCK(cs_cards_);
    auto it = cards_.find(code);
    if (it == cards_.end()) return false;
    card = it->second;
    return true;
}

RedeemResult MemoryGiftCardStore::Redeem(const std::string& code, const std::string& redeemedBy,
                                         int64_t amount, int64_t timeoutMs)
{
    LOCK(cs_cards_);

    if (!available_) {
        return RedeemResult(RedeemStatus::UNAVAILABLE, 0, "ledger offline");
    }

    auto it = cards_.find(code);
    if (it == cards_.end()) {
        return RedeemResult(RedeemStatus::NOT_FOUND);
    }

    Card& card = it->second;
    if (card.redeemed) {
        return RedeemResult(RedeemStatus::ALREADY_REDEEMED);
    }
    if (!card.active) {
        return RedeemResult(RedeemStatus::INACTIVE);
    }

    int64_t redeemed = card.balance;
    if (amount > 0 && amount < card.balance) {
        redeemed = amount;
    }

    card.redeemed = true;
    card.redeemedBy = redeemedBy;
    card.balance -= redeemed;
    return RedeemResult(RedeemStatus::REDEEMED, redeemed);
}

bool MemoryGiftCardStore::ParseSeed(const std::string& seed, std::string& code, int64_t& amount)
{
    size_t sep = seed.rfind(':');
    if (sep == std::string::npos || sep == 0) {
        return false;
    }
    code = TrimString(seed.substr(0, sep));
    return !code.empty() && ParseInt64(seed.substr(sep + 1), &amount) && amount >= 0;
}

} // namespace giftguard
