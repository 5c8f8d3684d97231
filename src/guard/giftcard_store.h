// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GIFTGUARD_GUARD_GIFTCARD_STORE_H
#define GIFTGUARD_GUARD_GIFTCARD_STORE_H

/**
 * @file giftcard_store.h
 * @brief Interface to the external gift-card ledger
 *
 * Issuance and balances live outside the guard. The guard only needs a
 * single bounded call that attempts the redemption and reports what the
 * ledger saw.
 */

#include <sync.h>

#include <cstdint>
#include <map>
#include <string>

namespace giftguard {

enum class RedeemStatus : uint8_t {
    REDEEMED = 0,
    NOT_FOUND = 1,
    ALREADY_REDEEMED = 2,
    INACTIVE = 3,
    UNAVAILABLE = 4,
    TIMEOUT = 5
};

std::string RedeemStatusToString(RedeemStatus status);

struct RedeemResult {
    RedeemStatus status;
    int64_t amount;
    std::string detail;

    RedeemResult() : status(RedeemStatus::UNAVAILABLE), amount(0) {}
    RedeemResult(RedeemStatus s, int64_t a = 0, const std::string& d = std::string())
        : status(s), amount(a), detail(d) {}
};

/**
 * @brief External gift-card ledger
 */
class GiftCardStore {
public:
    virtual ~GiftCardStore() = default;

    /**
     * @brief Attempt to redeem a code
     *
     * Implementations must answer within timeoutMs, returning TIMEOUT if they
     * cannot, and UNAVAILABLE if the ledger cannot be reached at all.
     *
     * @param code Redemption code
     * @param redeemedBy Caller-supplied identity of the redeemer
     * @param amount Requested amount in cents, 0 for the full balance
     * @param timeoutMs Upper bound for the call
     */
    virtual RedeemResult Redeem(const std::string& code, const std::string& redeemedBy,
                                int64_t amount, int64_t timeoutMs) = 0;
};

/**
 * @brief In-process ledger
 *
 * Backs the daemon when cards are seeded from configuration and serves as
 * the collaborator in tests.
 */
class MemoryGiftCardStore : public GiftCardStore {
public:
    struct Card {
        int64_t balance;
        bool active;
        bool redeemed;
        std::string redeemedBy;

        Card() : balance(0), active(true), redeemed(false) {}
    };

    MemoryGiftCardStore() : available_(true) {}

    void AddCard(const std::string& code, int64_t balance, bool active = true);

    /** Simulate the ledger going away */
    void SetAvailable(bool available);

    bool GetCard(const std::string& code, Card& card) const;

    RedeemResult Redeem(const std::string& code, const std::string& redeemedBy,
                        int64_t amount, int64_t timeoutMs) override;

    /**
     * @brief Parse a CODE:AMOUNT seed entry
     * @return false if malformed
     */
    static bool ParseSeed(const std::string& seed, std::string& code, int64_t& amount);

private:
    mutable CCriticalSection cs_cards_;
    std::map<std::string, Card> cards_;
    bool available_;
};

} // namespace giftguard

#endif // GIFTGUARD_GUARD_GIFTCARD_STORE_H
