// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKELEDGER_LEDGER_STAKE_H
#define STAKELEDGER_LEDGER_STAKE_H

#include "amount.h"
#include "ledger/ledger_events.h"
#include "optional.h"

#include <map>
#include <stdint.h>
#include <string>
#include <utility>

class CValidationState;
class CValueTransferView;
struct CCallContext;
struct LedgerState;

/**
 * CStakePosition - one staker's balance and timers within one pool
 *
 * INVARIANTS:
 * - nAmount > 0 while the position exists
 * - nUnlockTime == time of the last deposit + pool lock period
 * - with nCooldownStart = t, withdrawable once now >= t + pool cooldown
 *
 * Accrual: rewards accrued on an earlier nAmount are carried in
 * nAccruedRewards whenever nAmount changes outside a claim/compound, and
 * nLastAccrual restarts. Pending rewards are always
 *   nAccruedRewards + floor(nAmount * rate * (now - nLastAccrual) / (10000 * 86400))
 */
struct CStakePosition
{
    uint64_t nPoolId;
    std::string staker;
    CAmount nAmount;
    int64_t nStakedAt;          // start of continuous staking (reset by top-ups)
    int64_t nLastClaim;         // last claim or compound
    int64_t nLastAccrual;       // start of the current accrual window
    CAmount nAccruedRewards;    // carried, not yet claimed
    CAmount nTotalEarned;       // lifetime net rewards
    int64_t nUnlockTime;
    Optional<int64_t> nCooldownStart;

    CStakePosition()
    {
        SetNull();
    }

    void SetNull()
    {
        nPoolId = 0;
        staker.clear();
        nAmount = 0;
        nStakedAt = 0;
        nLastClaim = 0;
        nLastAccrual = 0;
        nAccruedRewards = 0;
        nTotalEarned = 0;
        nUnlockTime = 0;
        nCooldownStart = nullopt;
    }

    bool IsLocked(int64_t nTime) const { return nTime < nUnlockTime; }

    std::string ToString() const;
};

/**
 * CUserStats - per-staker running sums across all pools
 */
struct CUserStats
{
    CAmount nTotalStaked;
    CAmount nTotalRewards;
    CAmount nTotalFeesPaid;
    uint32_t nPoolsJoined;
    int64_t nFirstStake;
    int64_t nLastActivity;

    CUserStats() : nTotalStaked(0), nTotalRewards(0), nTotalFeesPaid(0), nPoolsJoined(0),
                   nFirstStake(0), nLastActivity(0) {}
};

/**
 * CStakeLedger - owner of stake positions and user aggregates
 */
class CStakeLedger
{
public:
    typedef std::pair<uint64_t, std::string> Key;
    typedef std::map<Key, CStakePosition>::const_iterator const_iterator;

private:
    std::map<Key, CStakePosition> mapPositions;
    std::map<std::string, CUserStats> mapUserStats;

public:
    Optional<CStakePosition> ReadPosition(uint64_t nPoolId, const std::string& staker) const;
    const CStakePosition* LookupPosition(uint64_t nPoolId, const std::string& staker) const;
    CStakePosition* LookupPosition(uint64_t nPoolId, const std::string& staker);
    void WritePosition(const CStakePosition& position);
    bool ErasePosition(uint64_t nPoolId, const std::string& staker);

    Optional<CUserStats> ReadUserStats(const std::string& staker) const;
    /** Stats of a staker, created empty on first use */
    CUserStats& GetOrCreateUserStats(const std::string& staker, bool& fCreated);

    size_t PositionCount() const { return mapPositions.size(); }
    size_t UserCount() const { return mapUserStats.size(); }
    const_iterator begin() const { return mapPositions.begin(); }
    const_iterator end() const { return mapPositions.end(); }
};

/**
 * DEPOSIT (any caller, own position)
 *
 * Checks:
 * 1. pool exists                                  (POOL_NOT_FOUND)
 * 2. pool Active and not past its end time        (POOL_INACTIVE)
 * 3. nAmount >= pool.nMinStake, in money range    (INVALID_AMOUNT)
 *
 * First deposit creates the position (unlock = now + lock) and counts a
 * new staker. A top-up adds to nAmount, restarts nStakedAt and the lock,
 * and clears a running cooldown. Emits stake-deposited.
 *
 * @param[out] nNewTotal position amount after the deposit
 */
bool CheckDeposit(const LedgerState& state, const CCallContext& ctx, uint64_t nPoolId, CAmount nAmount,
                  CValidationState& vstate);
bool ApplyDeposit(LedgerState& state, CValueTransferView& view, const CCallContext& ctx, uint64_t nPoolId,
                  CAmount nAmount, CValidationState& vstate, LedgerEvents& events, CAmount& nNewTotal);

/**
 * WITHDRAW (any caller, own position)
 *
 * Checks:
 * 1. pool exists                                  (POOL_NOT_FOUND)
 * 2. nAmount > 0                                  (INVALID_AMOUNT)
 * 3. position exists, nAmount <= position         (INSUFFICIENT_STAKE)
 * 4. locked: early exit, 5% penalty, no cooldown needed
 *    unlocked: cooldown must be complete          (COOLDOWN_ACTIVE)
 *
 * Full withdrawal deletes the position (and its tier record); partial
 * withdrawal keeps the remainder and clears the cooldown. The penalty is
 * paid to the operator. Emits stake-withdrawn, then fee-collected when a
 * penalty was charged.
 *
 * @param[out] nNetAmount amount paid to the staker
 */
bool CheckWithdraw(const LedgerState& state, const CCallContext& ctx, uint64_t nPoolId, CAmount nAmount,
                   CValidationState& vstate);
bool ApplyWithdraw(LedgerState& state, CValueTransferView& view, const CCallContext& ctx, uint64_t nPoolId,
                   CAmount nAmount, CValidationState& vstate, LedgerEvents& events, CAmount& nNetAmount);

#endif // STAKELEDGER_LEDGER_STAKE_H
