// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/ledger_cooldown.h"

#include "ledger/ledger_error.h"
#include "ledger/ledger_state.h"
#include "logging.h"
#include "util/system.h"

#include <limits>

namespace ledger_cooldown {

CooldownPhase GetCooldownPhase(const CStakePosition& position, const CStakingPool& pool, int64_t nTime)
{
    if (position.IsLocked(nTime)) {
        return CooldownPhase::LOCKED;
    }
    if (!position.nCooldownStart) {
        return CooldownPhase::UNLOCKED;
    }
    if (nTime < GetCooldownEnd(position, pool)) {
        return CooldownPhase::COOLDOWN_PENDING;
    }
    return CooldownPhase::WITHDRAWABLE;
}

int64_t GetCooldownEnd(const CStakePosition& position, const CStakingPool& pool)
{
    if (!position.nCooldownStart) {
        return 0;
    }
    const int64_t nStart = *position.nCooldownStart;
    if (pool.nCooldownPeriod > std::numeric_limits<int64_t>::max() - nStart) {
        return std::numeric_limits<int64_t>::max();
    }
    return nStart + pool.nCooldownPeriod;
}

std::string CooldownPhaseToString(CooldownPhase phase)
{
    switch (phase) {
    case CooldownPhase::LOCKED: return "locked";
    case CooldownPhase::UNLOCKED: return "unlocked";
    case CooldownPhase::COOLDOWN_PENDING: return "cooldown-pending";
    case CooldownPhase::WITHDRAWABLE: return "withdrawable";
    }
    return "unknown";
}

} // namespace ledger_cooldown

bool CheckStartCooldown(const LedgerState& state, const CCallContext& ctx, uint64_t nPoolId,
                        CValidationState& vstate)
{
    if (!CheckCallContext(state, ctx, vstate)) return false;

    const CStakingPool* pool = state.pools.LookupPool(nPoolId);
    if (!pool) {
        return vstate.Invalid(error("%s: pool %d not found", __func__, nPoolId),
                              LedgerError::POOL_NOT_FOUND, "bad-pool-unknown");
    }

    const CStakePosition* position = state.stakes.LookupPosition(nPoolId, ctx.caller);
    if (!position) {
        return vstate.Invalid(error("%s: no position for %s in pool %d", __func__, ctx.caller, nPoolId),
                              LedgerError::POSITION_NOT_FOUND, "bad-cooldown-no-position");
    }

    const CooldownPhase phase = ledger_cooldown::GetCooldownPhase(*position, *pool, ctx.nTime);
    switch (phase) {
    case CooldownPhase::UNLOCKED:
        return true;
    case CooldownPhase::LOCKED:
        return vstate.Invalid(error("%s: position locked until %d (now=%d)", __func__, position->nUnlockTime, ctx.nTime),
                              LedgerError::COOLDOWN_ACTIVE, "bad-cooldown-locked");
    case CooldownPhase::COOLDOWN_PENDING:
    case CooldownPhase::WITHDRAWABLE:
        return vstate.Invalid(error("%s: cooldown already started at %d", __func__, *position->nCooldownStart),
                              LedgerError::COOLDOWN_ACTIVE, "bad-cooldown-running");
    }
    return false;
}

bool ApplyStartCooldown(LedgerState& state, const CCallContext& ctx, uint64_t nPoolId,
                        CValidationState& vstate, LedgerEvents& events)
{
    if (!CheckStartCooldown(state, ctx, nPoolId, vstate)) {
        return false;
    }

    const CStakingPool& pool = *state.pools.LookupPool(nPoolId);
    CStakePosition& position = *state.stakes.LookupPosition(nPoolId, ctx.caller);

    position.nCooldownStart = ctx.nTime;
    const int64_t nCooldownEnds = ledger_cooldown::GetCooldownEnd(position, pool);

    TouchCallContext(state, ctx);

    CooldownStartedEvent ev = {nPoolId, ctx.caller, nCooldownEnds, ctx.nTime};
    events.push_back(ev);

    LogPrint(BCLog::STAKE, "%s: pool=%d staker=%s cooldown ends %d\n", __func__, nPoolId, ctx.caller, nCooldownEnds);
    return true;
}
