// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/ledger_stake.h"

#include "ledger/ledger_cooldown.h"
#include "ledger/ledger_error.h"
#include "ledger/ledger_fee.h"
#include "ledger/ledger_state.h"
#include "ledger/ledger_transfer.h"
#include "ledger/ledger_yield.h"
#include "logging.h"
#include "util/system.h"

#include <limits>

std::string CStakePosition::ToString() const
{
    return strprintf("CStakePosition(pool=%d, staker=%s, amount=%d, stakedAt=%d, unlock=%d, cooldown=%s, earned=%d)",
                     nPoolId, staker, nAmount, nStakedAt, nUnlockTime,
                     nCooldownStart ? strprintf("%d", *nCooldownStart) : "none", nTotalEarned);
}

// ============================================================================
// CStakeLedger
// ============================================================================

Optional<CStakePosition> CStakeLedger::ReadPosition(uint64_t nPoolId, const std::string& staker) const
{
    auto it = mapPositions.find(Key(nPoolId, staker));
    if (it == mapPositions.end()) {
        return nullopt;
    }
    return it->second;
}

const CStakePosition* CStakeLedger::LookupPosition(uint64_t nPoolId, const std::string& staker) const
{
    auto it = mapPositions.find(Key(nPoolId, staker));
    return it == mapPositions.end() ? nullptr : &it->second;
}

CStakePosition* CStakeLedger::LookupPosition(uint64_t nPoolId, const std::string& staker)
{
    auto it = mapPositions.find(Key(nPoolId, staker));
    return it == mapPositions.end() ? nullptr : &it->second;
}

void CStakeLedger::WritePosition(const CStakePosition& position)
{
    mapPositions[Key(position.nPoolId, position.staker)] = position;
}

bool CStakeLedger::ErasePosition(uint64_t nPoolId, const std::string& staker)
{
    return mapPositions.erase(Key(nPoolId, staker)) > 0;
}

Optional<CUserStats> CStakeLedger::ReadUserStats(const std::string& staker) const
{
    auto it = mapUserStats.find(staker);
    if (it == mapUserStats.end()) {
        return nullopt;
    }
    return it->second;
}

CUserStats& CStakeLedger::GetOrCreateUserStats(const std::string& staker, bool& fCreated)
{
    auto it = mapUserStats.find(staker);
    fCreated = (it == mapUserStats.end());
    if (fCreated) {
        it = mapUserStats.emplace(staker, CUserStats()).first;
    }
    return it->second;
}

// ============================================================================
// Deposit
// ============================================================================

bool CheckDeposit(const LedgerState& state, const CCallContext& ctx, uint64_t nPoolId, CAmount nAmount,
                  CValidationState& vstate)
{
    if (!CheckCallContext(state, ctx, vstate)) return false;

    const CStakingPool* pool = state.pools.LookupPool(nPoolId);
    if (!pool) {
        return vstate.Invalid(error("%s: pool %d not found", __func__, nPoolId),
                              LedgerError::POOL_NOT_FOUND, "bad-pool-unknown");
    }

    if (!pool->IsActive(ctx.nTime)) {
        return vstate.Invalid(error("%s: pool %d is %s", __func__, nPoolId,
                                    PoolStatusToString(pool->GetEffectiveStatus(ctx.nTime))),
                              LedgerError::POOL_INACTIVE, "bad-stake-pool-inactive");
    }

    if (!MoneyRange(nAmount) || nAmount < pool->nMinStake) {
        return vstate.Invalid(error("%s: amount %d below minimum stake %d", __func__, nAmount, pool->nMinStake),
                              LedgerError::INVALID_AMOUNT, "bad-stake-amount");
    }

    // Resulting totals must stay representable
    const CStakePosition* position = state.stakes.LookupPosition(nPoolId, ctx.caller);
    if (!MoneyRange(pool->nTotalStaked + nAmount) || !MoneyRange(state.global.nTotalStaked + nAmount) ||
        (position && !MoneyRange(position->nAmount + nAmount))) {
        return vstate.Invalid(error("%s: amount %d overflows staked totals", __func__, nAmount),
                              LedgerError::INVALID_AMOUNT, "bad-stake-overflow");
    }

    if (pool->nLockPeriod > std::numeric_limits<int64_t>::max() - ctx.nTime) {
        return vstate.Invalid(error("%s: unlock time overflows (lock=%d)", __func__, pool->nLockPeriod),
                              LedgerError::INVALID_TIME, "bad-stake-unlock");
    }

    return true;
}

bool ApplyDeposit(LedgerState& state, CValueTransferView& view, const CCallContext& ctx, uint64_t nPoolId,
                  CAmount nAmount, CValidationState& vstate, LedgerEvents& events, CAmount& nNewTotal)
{
    if (!CheckDeposit(state, ctx, nPoolId, nAmount, vstate)) {
        return false;
    }

    std::vector<CValueTransfer> vTransfers;
    vTransfers.emplace_back(ctx.caller, state.global.strCustody, nAmount);
    if (!view.ApplyTransfers(vTransfers)) {
        return vstate.Invalid(error("%s: transfer of %d from %s failed", __func__, nAmount, ctx.caller),
                              LedgerError::TRANSFER_FAILED, "bad-stake-transfer");
    }

    CStakingPool& pool = *state.pools.LookupPool(nPoolId);
    CStakePosition* existing = state.stakes.LookupPosition(nPoolId, ctx.caller);
    const bool fNewStaker = (existing == nullptr);

    CStakePosition position;
    if (fNewStaker) {
        position.nPoolId = nPoolId;
        position.staker = ctx.caller;
        position.nAmount = nAmount;
        position.nStakedAt = ctx.nTime;
        position.nLastClaim = ctx.nTime;
        position.nLastAccrual = ctx.nTime;
        pool.nStakerCount++;
    } else {
        position = *existing;
        // Carry what the old amount earned before resizing
        ledger_yield::CheckpointAccrual(position, pool, ctx.nTime);
        position.nAmount += nAmount;
        position.nStakedAt = ctx.nTime;
        position.nCooldownStart = nullopt;
    }
    position.nUnlockTime = ctx.nTime + pool.nLockPeriod;
    state.stakes.WritePosition(position);

    pool.nTotalStaked += nAmount;
    state.global.nTotalStaked += nAmount;

    bool fNewUser = false;
    CUserStats& stats = state.stakes.GetOrCreateUserStats(ctx.caller, fNewUser);
    if (fNewUser) {
        stats.nFirstStake = ctx.nTime;
        state.global.nTotalStakers++;
    }
    if (fNewStaker) {
        stats.nPoolsJoined++;
    }
    stats.nTotalStaked += nAmount;
    stats.nLastActivity = ctx.nTime;

    TouchCallContext(state, ctx);

    StakeDepositedEvent ev = {nPoolId, ctx.caller, nAmount, position.nAmount, position.nUnlockTime, fNewStaker, ctx.nTime};
    events.push_back(ev);

    LogPrint(BCLog::STAKE, "%s: %s\n", __func__, position.ToString());

    nNewTotal = position.nAmount;
    return true;
}

// ============================================================================
// Withdraw
// ============================================================================

bool CheckWithdraw(const LedgerState& state, const CCallContext& ctx, uint64_t nPoolId, CAmount nAmount,
                   CValidationState& vstate)
{
    if (!CheckCallContext(state, ctx, vstate)) return false;

    const CStakingPool* pool = state.pools.LookupPool(nPoolId);
    if (!pool) {
        return vstate.Invalid(error("%s: pool %d not found", __func__, nPoolId),
                              LedgerError::POOL_NOT_FOUND, "bad-pool-unknown");
    }

    if (nAmount <= 0) {
        return vstate.Invalid(error("%s: invalid amount %d", __func__, nAmount),
                              LedgerError::INVALID_AMOUNT, "bad-withdraw-amount");
    }

    const CStakePosition* position = state.stakes.LookupPosition(nPoolId, ctx.caller);
    if (!position) {
        return vstate.Invalid(error("%s: no position for %s in pool %d", __func__, ctx.caller, nPoolId),
                              LedgerError::INSUFFICIENT_STAKE, "bad-withdraw-no-position");
    }

    if (nAmount > position->nAmount) {
        return vstate.Invalid(error("%s: amount %d exceeds stake %d", __func__, nAmount, position->nAmount),
                              LedgerError::INSUFFICIENT_STAKE, "bad-withdraw-exceeds-stake");
    }

    // Early exit: permitted before unlock, penalised, no cooldown
    if (position->IsLocked(ctx.nTime)) {
        return true;
    }

    if (!position->nCooldownStart) {
        return vstate.Invalid(error("%s: cooldown not started (pool=%d staker=%s)", __func__, nPoolId, ctx.caller),
                              LedgerError::COOLDOWN_ACTIVE, "bad-withdraw-no-cooldown");
    }

    const int64_t nCooldownEnd = ledger_cooldown::GetCooldownEnd(*position, *pool);
    if (ctx.nTime < nCooldownEnd) {
        return vstate.Invalid(error("%s: cooldown running until %d (now=%d)", __func__, nCooldownEnd, ctx.nTime),
                              LedgerError::COOLDOWN_ACTIVE, "bad-withdraw-cooldown");
    }

    return true;
}

bool ApplyWithdraw(LedgerState& state, CValueTransferView& view, const CCallContext& ctx, uint64_t nPoolId,
                   CAmount nAmount, CValidationState& vstate, LedgerEvents& events, CAmount& nNetAmount)
{
    if (!CheckWithdraw(state, ctx, nPoolId, nAmount, vstate)) {
        return false;
    }

    CStakingPool& pool = *state.pools.LookupPool(nPoolId);
    CStakePosition& position = *state.stakes.LookupPosition(nPoolId, ctx.caller);

    const bool fEarly = position.IsLocked(ctx.nTime);
    const CAmount nPenalty = fEarly ? ledger_fee::CalculateEarlyWithdrawalPenalty(nAmount) : 0;
    const CAmount nNet = nAmount - nPenalty;

    std::vector<CValueTransfer> vTransfers;
    vTransfers.emplace_back(state.global.strCustody, ctx.caller, nNet);
    if (nPenalty > 0) {
        vTransfers.emplace_back(state.global.strCustody, state.global.strOperator, nPenalty);
    }
    if (!view.ApplyTransfers(vTransfers)) {
        return vstate.Invalid(error("%s: payout of %d to %s failed", __func__, nAmount, ctx.caller),
                              LedgerError::TRANSFER_FAILED, "bad-withdraw-transfer");
    }

    const CAmount nRemaining = position.nAmount - nAmount;
    if (nRemaining == 0) {
        // Pending rewards are forfeited with the position
        state.stakes.ErasePosition(nPoolId, ctx.caller);
        state.tiers.EraseRecord(nPoolId, ctx.caller);
        pool.nStakerCount--;
    } else {
        ledger_yield::CheckpointAccrual(position, pool, ctx.nTime);
        position.nAmount = nRemaining;
        position.nCooldownStart = nullopt;
    }

    pool.nTotalStaked -= nAmount;
    state.global.nTotalStaked -= nAmount;
    state.global.nTotalFeesCollected += nPenalty;

    bool fNewUser = false;
    CUserStats& stats = state.stakes.GetOrCreateUserStats(ctx.caller, fNewUser);
    stats.nTotalStaked -= nAmount;
    stats.nTotalFeesPaid += nPenalty;
    stats.nLastActivity = ctx.nTime;

    TouchCallContext(state, ctx);

    StakeWithdrawnEvent ev = {nPoolId, ctx.caller, nAmount, nPenalty, nNet, fEarly, nRemaining, ctx.nTime};
    events.push_back(ev);
    if (nPenalty > 0) {
        FeeCollectedEvent feeEv = {nPoolId, FeeType::EARLY_WITHDRAWAL, nPenalty, ctx.caller, ctx.nTime};
        events.push_back(feeEv);
    }

    LogPrint(BCLog::STAKE, "%s: pool=%d staker=%s amount=%d penalty=%d net=%d remaining=%d%s\n",
             __func__, nPoolId, ctx.caller, nAmount, nPenalty, nNet, nRemaining, fEarly ? " (early)" : "");

    nNetAmount = nNet;
    return true;
}
