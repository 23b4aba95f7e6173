// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/ledger_yield.h"

#include "ledger/ledger_error.h"
#include "ledger/ledger_fee.h"
#include "ledger/ledger_params.h"
#include "ledger/ledger_state.h"
#include "ledger/ledger_tier.h"
#include "ledger/ledger_transfer.h"
#include "logging.h"
#include "util/system.h"

#include <boost/multiprecision/cpp_int.hpp>

using int128_t = boost::multiprecision::int128_t;

namespace {

/**
 * amount * rate * elapsed / (10000 * 86400), truncated.
 * Bounded by MAX_MONEY * MAX_DAILY_RATE_BPS * INT64_MAX < 2^127.
 */
int128_t AccrueLinear(CAmount nAmount, int64_t nDailyRateBps, int64_t nElapsed)
{
    if (nAmount <= 0 || nDailyRateBps <= 0 || nElapsed <= 0) {
        return 0;
    }
    int128_t numerator = static_cast<int128_t>(nAmount) * nDailyRateBps * nElapsed;
    int128_t denominator = static_cast<int128_t>(ledger_params::BPS_DENOMINATOR) * ledger_params::SECONDS_PER_DAY;
    return numerator / denominator;
}

int128_t PendingWide(const CStakePosition& position, const CStakingPool& pool, int64_t nTime)
{
    return static_cast<int128_t>(position.nAccruedRewards) +
           AccrueLinear(position.nAmount, pool.nDailyRateBps, nTime - position.nLastAccrual);
}

} // namespace

namespace ledger_yield {

CAmount CalculateAccruedRewards(CAmount nAmount, int64_t nDailyRateBps, int64_t nElapsed)
{
    int128_t accrued = AccrueLinear(nAmount, nDailyRateBps, nElapsed);
    if (accrued > MAX_MONEY) {
        return MAX_MONEY;
    }
    return static_cast<CAmount>(accrued);
}

bool CalculatePendingRewards(const CStakePosition& position, const CStakingPool& pool, int64_t nTime,
                             CAmount& nPendingOut)
{
    int128_t pending = PendingWide(position, pool, nTime);
    if (pending > MAX_MONEY) {
        return false;
    }
    nPendingOut = static_cast<CAmount>(pending);
    return true;
}

CAmount GetPendingRewards(const CStakePosition& position, const CStakingPool& pool, int64_t nTime)
{
    CAmount nPending = 0;
    if (!CalculatePendingRewards(position, pool, nTime, nPending)) {
        return MAX_MONEY;
    }
    return nPending;
}

void CheckpointAccrual(CStakePosition& position, const CStakingPool& pool, int64_t nTime)
{
    position.nAccruedRewards = GetPendingRewards(position, pool, nTime);
    position.nLastAccrual = nTime;
}

} // namespace ledger_yield

// ============================================================================
// Payout computation
// ============================================================================

namespace {

enum class PayoutKind { CLAIM, CLAIM_WITH_TIER_BONUS, COMPOUND };

/**
 * Validate a payout for the caller's position and compute its breakdown.
 * Shared by the three payout paths; never mutates.
 */
bool CheckPayout(const LedgerState& state, const CCallContext& ctx, uint64_t nPoolId, PayoutKind kind,
                 CValidationState& vstate, CClaimResult& result)
{
    if (!CheckCallContext(state, ctx, vstate)) return false;

    if (kind == PayoutKind::CLAIM_WITH_TIER_BONUS && !state.global.fLoyaltyEnabled) {
        return vstate.Invalid(error("CheckPayout: loyalty program disabled"),
                              LedgerError::LOYALTY_DISABLED, "bad-claim-loyalty-disabled");
    }

    const CStakingPool* pool = state.pools.LookupPool(nPoolId);
    if (!pool) {
        return vstate.Invalid(error("CheckPayout: pool %d not found", nPoolId),
                              LedgerError::POOL_NOT_FOUND, "bad-pool-unknown");
    }

    if (kind == PayoutKind::COMPOUND && !pool->IsActive(ctx.nTime)) {
        return vstate.Invalid(error("CheckPayout: pool %d is %s", nPoolId,
                                    PoolStatusToString(pool->GetEffectiveStatus(ctx.nTime))),
                              LedgerError::POOL_INACTIVE, "bad-compound-pool-inactive");
    }

    const CStakePosition* position = state.stakes.LookupPosition(nPoolId, ctx.caller);
    if (!position) {
        return vstate.Invalid(error("CheckPayout: no position for %s in pool %d", ctx.caller, nPoolId),
                              LedgerError::POSITION_NOT_FOUND, "bad-claim-no-position");
    }

    CAmount nPending = 0;
    if (!ledger_yield::CalculatePendingRewards(*position, *pool, ctx.nTime, nPending)) {
        return vstate.Invalid(error("CheckPayout: pending rewards out of range (pool=%d staker=%s)", nPoolId, ctx.caller),
                              LedgerError::NO_REWARDS, "bad-claim-pending-range");
    }
    if (nPending <= 0) {
        return vstate.Invalid(error("CheckPayout: nothing pending (pool=%d staker=%s)", nPoolId, ctx.caller),
                              LedgerError::NO_REWARDS, "bad-claim-nothing-pending");
    }

    CClaimResult r;
    CAmount nBaseFee = 0;
    if (kind == PayoutKind::CLAIM_WITH_TIER_BONUS) {
        const CTierBenefit& benefit = state.tiers.GetBenefit(ledger_tier::GetLiveTier(*position, ctx.nTime));
        r.nTierBonus = ledger_tier::CalculateTierBonus(nPending, benefit);
        r.nGross = nPending + r.nTierBonus;
        nBaseFee = ledger_fee::CalculateRewardFee(r.nGross);
        r.nFee = ledger_fee::CalculateTierDiscountedFee(nBaseFee, benefit);
        r.nFeeDiscount = nBaseFee - r.nFee;
    } else {
        r.nGross = nPending;
        r.nFee = ledger_fee::CalculateRewardFee(r.nGross);
    }
    r.nNet = r.nGross - r.nFee;

    if (r.nGross > pool->nRewardPoolBalance) {
        return vstate.Invalid(error("CheckPayout: payout %d exceeds reward balance %d (pool=%d)",
                                    r.nGross, pool->nRewardPoolBalance, nPoolId),
                              LedgerError::NO_REWARDS, "bad-claim-reward-balance");
    }

    if (kind == PayoutKind::COMPOUND &&
        (!MoneyRange(position->nAmount + r.nNet) || !MoneyRange(pool->nTotalStaked + r.nNet) ||
         !MoneyRange(state.global.nTotalStaked + r.nNet))) {
        return vstate.Invalid(error("CheckPayout: compounded stake out of range (pool=%d staker=%s)", nPoolId, ctx.caller),
                              LedgerError::INVALID_AMOUNT, "bad-compound-overflow");
    }

    result = r;
    return true;
}

/** Reset the accrual window and book a payout into every aggregate */
void BookPayout(LedgerState& state, CStakingPool& pool, CStakePosition& position, const CCallContext& ctx,
                const CClaimResult& result)
{
    position.nLastClaim = ctx.nTime;
    position.nLastAccrual = ctx.nTime;
    position.nAccruedRewards = 0;
    position.nTotalEarned += result.nNet;

    pool.nRewardPoolBalance -= result.nGross;
    pool.nTotalRewardsPaid += result.nNet;
    state.global.nTotalRewardsPaid += result.nNet;
    state.global.nTotalFeesCollected += result.nFee;

    bool fNewUser = false;
    CUserStats& stats = state.stakes.GetOrCreateUserStats(ctx.caller, fNewUser);
    stats.nTotalRewards += result.nNet;
    stats.nTotalFeesPaid += result.nFee;
    stats.nLastActivity = ctx.nTime;
}

/** Claim and claim-with-bonus share everything but the breakdown */
bool ApplyClaimInternal(LedgerState& state, CValueTransferView& view, const CCallContext& ctx, uint64_t nPoolId,
                        PayoutKind kind, CValidationState& vstate, LedgerEvents& events, CClaimResult& result)
{
    CClaimResult r;
    if (!CheckPayout(state, ctx, nPoolId, kind, vstate, r)) {
        return false;
    }

    std::vector<CValueTransfer> vTransfers;
    vTransfers.emplace_back(state.global.strCustody, ctx.caller, r.nNet);
    if (r.nFee > 0) {
        vTransfers.emplace_back(state.global.strCustody, state.global.strOperator, r.nFee);
    }
    if (!view.ApplyTransfers(vTransfers)) {
        return vstate.Invalid(error("ApplyClaim: payout of %d to %s failed", r.nGross, ctx.caller),
                              LedgerError::TRANSFER_FAILED, "bad-claim-transfer");
    }

    CStakingPool& pool = *state.pools.LookupPool(nPoolId);
    CStakePosition& position = *state.stakes.LookupPosition(nPoolId, ctx.caller);
    const LoyaltyTier liveTier = ledger_tier::GetLiveTier(position, ctx.nTime);
    BookPayout(state, pool, position, ctx, r);

    RewardsClaimedEvent ev = {nPoolId, ctx.caller, r.nGross, r.nFee, r.nNet, ctx.nTime};
    events.push_back(ev);
    if (r.nFee > 0) {
        FeeCollectedEvent feeEv = {nPoolId, FeeType::REWARD, r.nFee, ctx.caller, ctx.nTime};
        events.push_back(feeEv);
    }

    if (kind == PayoutKind::CLAIM_WITH_TIER_BONUS) {
        Optional<CLoyaltyTierRecord> existing = state.tiers.ReadRecord(nPoolId, ctx.caller);
        CLoyaltyTierRecord record;
        if (existing) {
            record = *existing;
        } else {
            record.tier = liveTier;
            record.nAchievedAt = ctx.nTime;
            TierInitializedEvent tierEv = {nPoolId, ctx.caller, liveTier, ctx.nTime};
            events.push_back(tierEv);
        }
        record.nTotalBonus += r.nTierBonus;
        record.nTotalFeeDiscount += r.nFeeDiscount;
        record.nLastCheck = ctx.nTime;
        state.tiers.WriteRecord(nPoolId, ctx.caller, record);

        LogPrint(BCLog::TIER, "ApplyClaimWithTierBonus: pool=%d staker=%s tier=%s bonus=%d discount=%d\n",
                 nPoolId, ctx.caller, TierToString(liveTier), r.nTierBonus, r.nFeeDiscount);
    }

    TouchCallContext(state, ctx);

    LogPrint(BCLog::YIELD, "ApplyClaim: pool=%d staker=%s gross=%d fee=%d net=%d balance=%d\n",
             nPoolId, ctx.caller, r.nGross, r.nFee, r.nNet, pool.nRewardPoolBalance);

    result = r;
    return true;
}

} // namespace

bool CheckClaim(const LedgerState& state, const CCallContext& ctx, uint64_t nPoolId, CValidationState& vstate)
{
    CClaimResult unused;
    return CheckPayout(state, ctx, nPoolId, PayoutKind::CLAIM, vstate, unused);
}

bool ApplyClaim(LedgerState& state, CValueTransferView& view, const CCallContext& ctx, uint64_t nPoolId,
                CValidationState& vstate, LedgerEvents& events, CClaimResult& result)
{
    return ApplyClaimInternal(state, view, ctx, nPoolId, PayoutKind::CLAIM, vstate, events, result);
}

bool ApplyClaimWithTierBonus(LedgerState& state, CValueTransferView& view, const CCallContext& ctx,
                             uint64_t nPoolId, CValidationState& vstate, LedgerEvents& events,
                             CClaimResult& result)
{
    return ApplyClaimInternal(state, view, ctx, nPoolId, PayoutKind::CLAIM_WITH_TIER_BONUS, vstate, events, result);
}

bool ApplyCompound(LedgerState& state, CValueTransferView& view, const CCallContext& ctx, uint64_t nPoolId,
                   CValidationState& vstate, LedgerEvents& events, CClaimResult& result)
{
    CClaimResult r;
    if (!CheckPayout(state, ctx, nPoolId, PayoutKind::COMPOUND, vstate, r)) {
        return false;
    }

    // Only the fee leaves custody; the net stays as principal
    std::vector<CValueTransfer> vTransfers;
    if (r.nFee > 0) {
        vTransfers.emplace_back(state.global.strCustody, state.global.strOperator, r.nFee);
    }
    if (!vTransfers.empty() && !view.ApplyTransfers(vTransfers)) {
        return vstate.Invalid(error("%s: fee transfer of %d failed", __func__, r.nFee),
                              LedgerError::TRANSFER_FAILED, "bad-compound-transfer");
    }

    CStakingPool& pool = *state.pools.LookupPool(nPoolId);
    CStakePosition& position = *state.stakes.LookupPosition(nPoolId, ctx.caller);
    BookPayout(state, pool, position, ctx, r);

    position.nAmount += r.nNet;
    pool.nTotalStaked += r.nNet;
    state.global.nTotalStaked += r.nNet;

    bool fNewUser = false;
    state.stakes.GetOrCreateUserStats(ctx.caller, fNewUser).nTotalStaked += r.nNet;

    TouchCallContext(state, ctx);

    RewardsCompoundedEvent ev = {nPoolId, ctx.caller, r.nGross, r.nFee, position.nAmount, ctx.nTime};
    events.push_back(ev);

    LogPrint(BCLog::YIELD, "%s: pool=%d staker=%s gross=%d fee=%d stake=%d\n",
             __func__, nPoolId, ctx.caller, r.nGross, r.nFee, position.nAmount);

    result = r;
    return true;
}
