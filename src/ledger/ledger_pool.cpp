// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/ledger_pool.h"

#include "ledger/ledger_error.h"
#include "ledger/ledger_params.h"
#include "ledger/ledger_state.h"
#include "ledger/ledger_transfer.h"
#include "logging.h"
#include "util/system.h"

#include <limits>

std::string PoolStatusToString(PoolStatus status)
{
    switch (status) {
    case PoolStatus::ACTIVE: return "active";
    case PoolStatus::PAUSED: return "paused";
    case PoolStatus::ENDED: return "ended";
    }
    return "unknown";
}

std::string CStakingPool::ToString() const
{
    return strprintf("CStakingPool(id=%d, name=%s, rate=%d, minStake=%d, lock=%d, cooldown=%d, "
                     "staked=%d, stakers=%u, rewardBalance=%d, status=%s)",
                     nId, strName, nDailyRateBps, nMinStake, nLockPeriod, nCooldownPeriod,
                     nTotalStaked, nStakerCount, nRewardPoolBalance, PoolStatusToString(status));
}

// ============================================================================
// CPoolRegistry
// ============================================================================

Optional<CStakingPool> CPoolRegistry::ReadPool(uint64_t nPoolId) const
{
    auto it = mapPools.find(nPoolId);
    if (it == mapPools.end()) {
        return nullopt;
    }
    return it->second;
}

const CStakingPool* CPoolRegistry::LookupPool(uint64_t nPoolId) const
{
    auto it = mapPools.find(nPoolId);
    return it == mapPools.end() ? nullptr : &it->second;
}

CStakingPool* CPoolRegistry::LookupPool(uint64_t nPoolId)
{
    auto it = mapPools.find(nPoolId);
    return it == mapPools.end() ? nullptr : &it->second;
}

bool CPoolRegistry::ExistsPool(uint64_t nPoolId) const
{
    return mapPools.count(nPoolId) > 0;
}

void CPoolRegistry::WritePool(const CStakingPool& pool)
{
    mapPools[pool.nId] = pool;
}

// ============================================================================
// Create
// ============================================================================

bool CheckCreatePool(const LedgerState& state, const CCallContext& ctx, const CPoolSpec& spec,
                     CValidationState& vstate)
{
    if (!CheckCallContext(state, ctx, vstate)) return false;
    if (!CheckOperator(state, ctx, vstate)) return false;

    if (spec.strName.empty()) {
        return vstate.Invalid(error("%s: empty pool name", __func__),
                              LedgerError::INVALID_AMOUNT, "bad-pool-name");
    }

    if (spec.nDailyRateBps <= 0 || spec.nDailyRateBps > ledger_params::MAX_DAILY_RATE_BPS) {
        return vstate.Invalid(error("%s: daily rate %d out of range (0, %d]", __func__,
                                    spec.nDailyRateBps, ledger_params::MAX_DAILY_RATE_BPS),
                              LedgerError::INVALID_AMOUNT, "bad-pool-rate");
    }

    if (spec.nMinStake <= 0 || !MoneyRange(spec.nMinStake)) {
        return vstate.Invalid(error("%s: minimum stake %d out of range", __func__, spec.nMinStake),
                              LedgerError::INVALID_AMOUNT, "bad-pool-minstake");
    }

    if (spec.nLockPeriod < 0 || spec.nCooldownPeriod < 0) {
        return vstate.Invalid(error("%s: negative period (lock=%d, cooldown=%d)", __func__,
                                    spec.nLockPeriod, spec.nCooldownPeriod),
                              LedgerError::INVALID_AMOUNT, "bad-pool-period");
    }

    if (spec.nDuration) {
        if (*spec.nDuration <= 0 || *spec.nDuration > std::numeric_limits<int64_t>::max() - ctx.nTime) {
            return vstate.Invalid(error("%s: duration %d out of range", __func__, *spec.nDuration),
                                  LedgerError::INVALID_AMOUNT, "bad-pool-duration");
        }
    }

    return true;
}

bool ApplyCreatePool(LedgerState& state, const CCallContext& ctx, const CPoolSpec& spec,
                     CValidationState& vstate, LedgerEvents& events, uint64_t& nPoolIdOut)
{
    if (!CheckCreatePool(state, ctx, spec, vstate)) {
        return false;
    }

    CStakingPool pool;
    pool.nId = state.global.nNextPoolId;
    pool.strName = spec.strName;
    pool.nDailyRateBps = spec.nDailyRateBps;
    pool.nMinStake = spec.nMinStake;
    pool.nLockPeriod = spec.nLockPeriod;
    pool.nCooldownPeriod = spec.nCooldownPeriod;
    pool.nCreatedAt = ctx.nTime;
    if (spec.nDuration) {
        pool.nEndsAt = ctx.nTime + *spec.nDuration;
    }
    pool.status = PoolStatus::ACTIVE;

    state.pools.WritePool(pool);
    state.global.nNextPoolId++;
    state.global.nTotalPools++;
    TouchCallContext(state, ctx);

    PoolCreatedEvent ev = {pool.nId, pool.strName, pool.nDailyRateBps, pool.nMinStake, pool.nLockPeriod, ctx.nTime};
    events.push_back(ev);

    LogPrint(BCLog::POOL, "%s: created %s\n", __func__, pool.ToString());

    nPoolIdOut = pool.nId;
    return true;
}

// ============================================================================
// Fund
// ============================================================================

bool CheckFundRewardPool(const LedgerState& state, const CCallContext& ctx, uint64_t nPoolId, CAmount nAmount,
                         CValidationState& vstate)
{
    if (!CheckCallContext(state, ctx, vstate)) return false;
    if (!CheckOperator(state, ctx, vstate)) return false;

    const CStakingPool* pool = state.pools.LookupPool(nPoolId);
    if (!pool) {
        return vstate.Invalid(error("%s: pool %d not found", __func__, nPoolId),
                              LedgerError::POOL_NOT_FOUND, "bad-pool-unknown");
    }

    if (nAmount <= 0 || !MoneyRange(nAmount) || !MoneyRange(pool->nRewardPoolBalance + nAmount)) {
        return vstate.Invalid(error("%s: invalid amount %d (balance=%d)", __func__, nAmount, pool->nRewardPoolBalance),
                              LedgerError::INVALID_AMOUNT, "bad-fund-amount");
    }

    return true;
}

bool ApplyFundRewardPool(LedgerState& state, CValueTransferView& view, const CCallContext& ctx, uint64_t nPoolId,
                         CAmount nAmount, CValidationState& vstate, LedgerEvents& events)
{
    if (!CheckFundRewardPool(state, ctx, nPoolId, nAmount, vstate)) {
        return false;
    }

    std::vector<CValueTransfer> vTransfers;
    vTransfers.emplace_back(ctx.caller, state.global.strCustody, nAmount);
    if (!view.ApplyTransfers(vTransfers)) {
        return vstate.Invalid(error("%s: transfer of %d from %s failed", __func__, nAmount, ctx.caller),
                              LedgerError::TRANSFER_FAILED, "bad-fund-transfer");
    }

    CStakingPool& pool = *state.pools.LookupPool(nPoolId);
    pool.nRewardPoolBalance += nAmount;
    TouchCallContext(state, ctx);

    PoolFundedEvent ev = {nPoolId, nAmount, pool.nRewardPoolBalance, ctx.nTime};
    events.push_back(ev);

    LogPrint(BCLog::POOL, "%s: pool=%d amount=%d balance=%d\n", __func__, nPoolId, nAmount, pool.nRewardPoolBalance);

    return true;
}

// ============================================================================
// Lifecycle
// ============================================================================

namespace {

/** Shared checks of the operator lifecycle calls; returns the pool or nullptr */
CStakingPool* CheckPoolLifecycle(LedgerState& state, const CCallContext& ctx, uint64_t nPoolId,
                                 CValidationState& vstate)
{
    if (!CheckCallContext(state, ctx, vstate)) return nullptr;
    if (!CheckOperator(state, ctx, vstate)) return nullptr;

    CStakingPool* pool = state.pools.LookupPool(nPoolId);
    if (!pool) {
        vstate.Invalid(error("CheckPoolLifecycle: pool %d not found", nPoolId),
                       LedgerError::POOL_NOT_FOUND, "bad-pool-unknown");
        return nullptr;
    }
    return pool;
}

void EmitStatusChange(LedgerEvents& events, PoolStatusEvent::Kind kind, uint64_t nPoolId, int64_t nTime)
{
    PoolStatusEvent ev = {kind, nPoolId, nTime};
    events.push_back(ev);
}

} // namespace

bool ApplyPausePool(LedgerState& state, const CCallContext& ctx, uint64_t nPoolId,
                    CValidationState& vstate, LedgerEvents& events)
{
    CStakingPool* pool = CheckPoolLifecycle(state, ctx, nPoolId, vstate);
    if (!pool) return false;

    if (pool->status != PoolStatus::ACTIVE) {
        return vstate.Invalid(error("%s: pool %d is %s", __func__, nPoolId, PoolStatusToString(pool->status)),
                              LedgerError::POOL_INACTIVE, "bad-pool-not-active");
    }

    pool->status = PoolStatus::PAUSED;
    TouchCallContext(state, ctx);
    EmitStatusChange(events, PoolStatusEvent::PAUSED, nPoolId, ctx.nTime);

    LogPrint(BCLog::POOL, "%s: pool=%d paused\n", __func__, nPoolId);
    return true;
}

bool ApplyResumePool(LedgerState& state, const CCallContext& ctx, uint64_t nPoolId,
                     CValidationState& vstate, LedgerEvents& events)
{
    CStakingPool* pool = CheckPoolLifecycle(state, ctx, nPoolId, vstate);
    if (!pool) return false;

    if (pool->status != PoolStatus::PAUSED) {
        return vstate.Invalid(error("%s: pool %d is %s", __func__, nPoolId, PoolStatusToString(pool->status)),
                              LedgerError::POOL_INACTIVE, "bad-pool-not-paused");
    }

    pool->status = PoolStatus::ACTIVE;
    TouchCallContext(state, ctx);
    EmitStatusChange(events, PoolStatusEvent::RESUMED, nPoolId, ctx.nTime);

    LogPrint(BCLog::POOL, "%s: pool=%d resumed\n", __func__, nPoolId);
    return true;
}

bool ApplyEndPool(LedgerState& state, const CCallContext& ctx, uint64_t nPoolId,
                  CValidationState& vstate, LedgerEvents& events)
{
    CStakingPool* pool = CheckPoolLifecycle(state, ctx, nPoolId, vstate);
    if (!pool) return false;

    if (pool->status == PoolStatus::ENDED) {
        return vstate.Invalid(error("%s: pool %d already ended", __func__, nPoolId),
                              LedgerError::POOL_INACTIVE, "bad-pool-ended");
    }

    pool->status = PoolStatus::ENDED;
    TouchCallContext(state, ctx);
    EmitStatusChange(events, PoolStatusEvent::ENDED, nPoolId, ctx.nTime);

    LogPrint(BCLog::POOL, "%s: pool=%d ended\n", __func__, nPoolId);
    return true;
}
