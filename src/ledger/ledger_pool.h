// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKELEDGER_LEDGER_POOL_H
#define STAKELEDGER_LEDGER_POOL_H

#include "amount.h"
#include "ledger/ledger_events.h"
#include "optional.h"

#include <map>
#include <stdint.h>
#include <string>

class CValidationState;
class CValueTransferView;
struct CCallContext;
struct LedgerState;

enum class PoolStatus : uint8_t {
    ACTIVE = 0,
    PAUSED = 1,
    ENDED = 2,
};

std::string PoolStatusToString(PoolStatus status);

/**
 * CStakingPool - one named pool of staked value
 *
 * INVARIANTS:
 * - nTotalStaked == sum of nAmount over the live positions of this pool
 * - nRewardPoolBalance >= 0, and no payout ever exceeds it
 * - nStakerCount == number of live positions of this pool
 */
struct CStakingPool
{
    uint64_t nId;
    std::string strName;
    int64_t nDailyRateBps;      // daily reward rate (basis points)
    CAmount nMinStake;
    int64_t nLockPeriod;        // seconds
    int64_t nCooldownPeriod;    // seconds
    CAmount nTotalStaked;
    CAmount nTotalRewardsPaid;  // net rewards paid out or compounded
    uint32_t nStakerCount;
    int64_t nCreatedAt;
    Optional<int64_t> nEndsAt;
    PoolStatus status;
    CAmount nRewardPoolBalance; // funds available to pay yield

    CStakingPool()
    {
        SetNull();
    }

    void SetNull()
    {
        nId = 0;
        strName.clear();
        nDailyRateBps = 0;
        nMinStake = 0;
        nLockPeriod = 0;
        nCooldownPeriod = 0;
        nTotalStaked = 0;
        nTotalRewardsPaid = 0;
        nStakerCount = 0;
        nCreatedAt = 0;
        nEndsAt = nullopt;
        status = PoolStatus::ACTIVE;
        nRewardPoolBalance = 0;
    }

    /** True once the optional end time has been reached */
    bool IsExpired(int64_t nTime) const
    {
        return nEndsAt && nTime >= *nEndsAt;
    }

    /** Stored status, reported as Ended once the end time has passed */
    PoolStatus GetEffectiveStatus(int64_t nTime) const
    {
        if (status != PoolStatus::ENDED && IsExpired(nTime)) return PoolStatus::ENDED;
        return status;
    }

    bool IsActive(int64_t nTime) const
    {
        return GetEffectiveStatus(nTime) == PoolStatus::ACTIVE;
    }

    std::string ToString() const;
};

/**
 * CPoolRegistry - owner of all pool definitions
 *
 * Pools are never deleted.
 */
class CPoolRegistry
{
private:
    std::map<uint64_t, CStakingPool> mapPools;

public:
    typedef std::map<uint64_t, CStakingPool>::const_iterator const_iterator;

    Optional<CStakingPool> ReadPool(uint64_t nPoolId) const;
    const CStakingPool* LookupPool(uint64_t nPoolId) const;
    CStakingPool* LookupPool(uint64_t nPoolId);
    bool ExistsPool(uint64_t nPoolId) const;
    void WritePool(const CStakingPool& pool);

    size_t Size() const { return mapPools.size(); }
    const_iterator begin() const { return mapPools.begin(); }
    const_iterator end() const { return mapPools.end(); }
};

/**
 * CPoolSpec - operator supplied definition of a new pool
 */
struct CPoolSpec
{
    std::string strName;
    int64_t nDailyRateBps;
    CAmount nMinStake;
    int64_t nLockPeriod;
    int64_t nCooldownPeriod;
    Optional<int64_t> nDuration;  // pool closes to deposits at creation + duration

    CPoolSpec() : nDailyRateBps(0), nMinStake(0), nLockPeriod(0), nCooldownPeriod(0) {}
};

/**
 * CREATE POOL (operator only)
 *
 * Checks:
 * 1. caller == operator                         (NOT_AUTHORIZED)
 * 2. name not empty, 0 < rate <= 10000 bps,
 *    minStake > 0, lock/cooldown >= 0,
 *    duration > 0 when given                    (INVALID_AMOUNT)
 *
 * Allocates the next sequential id (first pool is 1), status Active,
 * all aggregates zero. Emits pool-created.
 */
bool CheckCreatePool(const LedgerState& state, const CCallContext& ctx, const CPoolSpec& spec,
                     CValidationState& vstate);
bool ApplyCreatePool(LedgerState& state, const CCallContext& ctx, const CPoolSpec& spec,
                     CValidationState& vstate, LedgerEvents& events, uint64_t& nPoolIdOut);

/**
 * FUND REWARD POOL (operator only)
 *
 * Transfers nAmount from the operator into custody and credits the pool's
 * reward balance. Emits pool-funded.
 */
bool CheckFundRewardPool(const LedgerState& state, const CCallContext& ctx, uint64_t nPoolId, CAmount nAmount,
                         CValidationState& vstate);
bool ApplyFundRewardPool(LedgerState& state, CValueTransferView& view, const CCallContext& ctx, uint64_t nPoolId,
                         CAmount nAmount, CValidationState& vstate, LedgerEvents& events);

/**
 * PAUSE / RESUME / END (operator only)
 *
 * Active -> Paused, Paused -> Active, Active|Paused -> Ended.
 * Stake timers (unlock, cooldown) are not affected.
 */
bool ApplyPausePool(LedgerState& state, const CCallContext& ctx, uint64_t nPoolId,
                    CValidationState& vstate, LedgerEvents& events);
bool ApplyResumePool(LedgerState& state, const CCallContext& ctx, uint64_t nPoolId,
                     CValidationState& vstate, LedgerEvents& events);
bool ApplyEndPool(LedgerState& state, const CCallContext& ctx, uint64_t nPoolId,
                  CValidationState& vstate, LedgerEvents& events);

#endif // STAKELEDGER_LEDGER_POOL_H
