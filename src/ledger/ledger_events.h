// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKELEDGER_LEDGER_EVENTS_H
#define STAKELEDGER_LEDGER_EVENTS_H

#include "amount.h"

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

#include <boost/variant.hpp>

/**
 * LEDGER EVENTS
 *
 * Every committed operation appends the events it produced, in emission
 * order, to the caller supplied LedgerEvents list. Nothing is appended for
 * a rejected operation. The list is the only channel to the indexer, so the
 * field sets below mirror the published event schema one to one (see
 * EventToJSON in rpc/ledger.cpp for the wire names).
 */

enum class LoyaltyTier : uint8_t {
    BRONZE = 0,
    SILVER = 1,
    GOLD = 2,
    PLATINUM = 3,
};

static const size_t TIER_COUNT = 4;

std::string TierToString(LoyaltyTier tier);

enum class FeeType : uint8_t {
    REWARD = 0,            // skimmed from a reward claim
    EARLY_WITHDRAWAL = 1,  // penalty on a withdrawal before unlock
};

std::string FeeTypeToString(FeeType type);

struct PoolCreatedEvent {
    uint64_t nPoolId;
    std::string strName;
    int64_t nRewardRate;
    CAmount nMinStake;
    int64_t nLockPeriod;
    int64_t nTime;
};

struct PoolFundedEvent {
    uint64_t nPoolId;
    CAmount nAmount;
    CAmount nNewBalance;
    int64_t nTime;
};

/** pool-paused, pool-resumed and pool-ended share one payload */
struct PoolStatusEvent {
    enum Kind { PAUSED, RESUMED, ENDED };
    Kind kind;
    uint64_t nPoolId;
    int64_t nTime;
};

struct StakeDepositedEvent {
    uint64_t nPoolId;
    std::string staker;
    CAmount nAmount;
    CAmount nTotalStake;
    int64_t nUnlockTime;
    bool fNewStaker;
    int64_t nTime;
};

struct StakeWithdrawnEvent {
    uint64_t nPoolId;
    std::string staker;
    CAmount nAmount;
    CAmount nPenalty;
    CAmount nNetAmount;
    bool fEarlyWithdrawal;
    CAmount nRemainingStake;
    int64_t nTime;
};

struct RewardsClaimedEvent {
    uint64_t nPoolId;
    std::string staker;
    CAmount nGrossRewards;
    CAmount nFee;
    CAmount nNetRewards;
    int64_t nTime;
};

struct RewardsCompoundedEvent {
    uint64_t nPoolId;
    std::string staker;
    CAmount nRewardsCompounded;
    CAmount nFee;
    CAmount nNewStakeAmount;
    int64_t nTime;
};

struct FeeCollectedEvent {
    uint64_t nPoolId;
    FeeType type;
    CAmount nAmount;
    std::string staker;
    int64_t nTime;
};

struct CooldownStartedEvent {
    uint64_t nPoolId;
    std::string staker;
    int64_t nCooldownEnds;
    int64_t nTime;
};

struct TierUpgradedEvent {
    uint64_t nPoolId;
    std::string staker;
    LoyaltyTier oldTier;
    LoyaltyTier newTier;
    int64_t nTime;
};

struct TierInitializedEvent {
    uint64_t nPoolId;
    std::string staker;
    LoyaltyTier tier;
    int64_t nTime;
};

typedef boost::variant<
    PoolCreatedEvent,
    PoolFundedEvent,
    PoolStatusEvent,
    StakeDepositedEvent,
    StakeWithdrawnEvent,
    RewardsClaimedEvent,
    RewardsCompoundedEvent,
    FeeCollectedEvent,
    CooldownStartedEvent,
    TierUpgradedEvent,
    TierInitializedEvent>
    CLedgerEvent;

typedef std::vector<CLedgerEvent> LedgerEvents;

/** Schema name of an event ("pool-created", "stake-deposited", ...) */
std::string GetEventName(const CLedgerEvent& event);

/** Pool id every event refers to */
uint64_t GetEventPoolId(const CLedgerEvent& event);

#endif // STAKELEDGER_LEDGER_EVENTS_H
