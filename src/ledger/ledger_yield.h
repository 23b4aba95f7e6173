// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKELEDGER_LEDGER_YIELD_H
#define STAKELEDGER_LEDGER_YIELD_H

#include "amount.h"
#include "ledger/ledger_events.h"

#include <stdint.h>

class CValidationState;
class CValueTransferView;
struct CCallContext;
struct CStakePosition;
struct CStakingPool;
struct LedgerState;

/**
 * YIELD ACCRUAL
 *
 * Rewards accrue linearly, per second, at the pool's daily rate:
 *
 *   accrued = floor(amount * rateBps * elapsed / (10000 * 86400))
 *
 * elapsed is measured from the position's nLastAccrual; amounts carried
 * at a checkpoint are added on top. The product is formed in 128 bits.
 * Accrual continues while a pool is Paused or Ended; the reward balance
 * is the only thing that bounds a payout.
 */
namespace ledger_yield {

/** Linear accrual of nAmount over nElapsed seconds, 0 for nElapsed <= 0 */
CAmount CalculateAccruedRewards(CAmount nAmount, int64_t nDailyRateBps, int64_t nElapsed);

/**
 * Pending rewards of a position at nTime.
 * @return false when the result does not fit a money amount
 */
bool CalculatePendingRewards(const CStakePosition& position, const CStakingPool& pool, int64_t nTime,
                             CAmount& nPendingOut);

/** Pending rewards, saturated at MAX_MONEY */
CAmount GetPendingRewards(const CStakePosition& position, const CStakingPool& pool, int64_t nTime);

/**
 * Carry the current accrual into nAccruedRewards and restart the window.
 * Called before a position's amount changes outside a claim/compound.
 */
void CheckpointAccrual(CStakePosition& position, const CStakingPool& pool, int64_t nTime);

} // namespace ledger_yield

/**
 * CClaimResult - breakdown of one payout
 */
struct CClaimResult
{
    CAmount nGross;
    CAmount nFee;
    CAmount nNet;
    CAmount nTierBonus;
    CAmount nFeeDiscount;

    CClaimResult() : nGross(0), nFee(0), nNet(0), nTierBonus(0), nFeeDiscount(0) {}
};

/**
 * CLAIM REWARDS (any caller, own position)
 *
 * Checks:
 * 1. pool exists                            (POOL_NOT_FOUND)
 * 2. position exists                        (POSITION_NOT_FOUND)
 * 3. pending > 0                            (NO_REWARDS)
 * 4. pending <= pool reward balance         (NO_REWARDS)
 *
 * fee = 10% of pending, paid to the operator; staker receives the rest.
 * Emits rewards-claimed then fee-collected.
 */
bool CheckClaim(const LedgerState& state, const CCallContext& ctx, uint64_t nPoolId, CValidationState& vstate);
bool ApplyClaim(LedgerState& state, CValueTransferView& view, const CCallContext& ctx, uint64_t nPoolId,
                CValidationState& vstate, LedgerEvents& events, CClaimResult& result);

/**
 * CLAIM WITH TIER BONUS (any caller, own position)
 *
 * As ApplyClaim, plus:
 * - loyalty program must be enabled         (LOYALTY_DISABLED)
 * - gross = pending + tier bonus of the live tier
 * - fee = reward fee of gross less the live tier's discount
 * The tier record accumulates the bonus and the discount.
 */
bool ApplyClaimWithTierBonus(LedgerState& state, CValueTransferView& view, const CCallContext& ctx,
                             uint64_t nPoolId, CValidationState& vstate, LedgerEvents& events,
                             CClaimResult& result);

/**
 * COMPOUND REWARDS (any caller, own position)
 *
 * Pool must be Active and not expired (POOL_INACTIVE). The net of the fee is
 * added to the position's principal. Emits rewards-compounded.
 */
bool ApplyCompound(LedgerState& state, CValueTransferView& view, const CCallContext& ctx, uint64_t nPoolId,
                   CValidationState& vstate, LedgerEvents& events, CClaimResult& result);

#endif // STAKELEDGER_LEDGER_YIELD_H
