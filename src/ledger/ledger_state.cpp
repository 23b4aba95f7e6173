// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/ledger_state.h"

#include "ledger/ledger_error.h"
#include "ledger/ledger_transfer.h"
#include "logging.h"
#include "util/system.h"

#include <boost/multiprecision/cpp_int.hpp>

#include <map>

LedgerState::LedgerState(const CLedgerParams& params)
{
    global.strOperator = params.strOperator;
    global.strCustody = params.strCustody;
    global.fLoyaltyEnabled = params.fLoyaltyEnabled;
}

bool LedgerState::CheckInvariants(std::string& strReason) const
{
    using int128_t = boost::multiprecision::int128_t;

    if (!global.CheckInvariants()) {
        strReason = strprintf("global counters inconsistent (next=%d pools=%d)", global.nNextPoolId, global.nTotalPools);
        return false;
    }
    if (global.nTotalPools != pools.Size()) {
        strReason = strprintf("pool count %d != registry size %d", global.nTotalPools, pools.Size());
        return false;
    }

    // Sum positions per pool
    std::map<uint64_t, int128_t> mapStaked;
    std::map<uint64_t, uint32_t> mapStakers;
    for (const auto& entry : stakes) {
        const CStakePosition& position = entry.second;
        if (position.nAmount <= 0) {
            strReason = strprintf("non-positive position pool=%d staker=%s", position.nPoolId, position.staker);
            return false;
        }
        mapStaked[position.nPoolId] += position.nAmount;
        mapStakers[position.nPoolId]++;
    }

    int128_t sumStaked = 0;
    int128_t sumPaid = 0;
    for (const auto& entry : pools) {
        const CStakingPool& pool = entry.second;
        if (pool.nRewardPoolBalance < 0) {
            strReason = strprintf("pool %d reward balance negative", pool.nId);
            return false;
        }
        if (int128_t(pool.nTotalStaked) != mapStaked[pool.nId]) {
            strReason = strprintf("pool %d totalStaked %d != sum of positions %s",
                                  pool.nId, pool.nTotalStaked, mapStaked[pool.nId].str());
            return false;
        }
        if (pool.nStakerCount != mapStakers[pool.nId]) {
            strReason = strprintf("pool %d stakerCount %u != positions %u",
                                  pool.nId, pool.nStakerCount, mapStakers[pool.nId]);
            return false;
        }
        sumStaked += pool.nTotalStaked;
        sumPaid += pool.nTotalRewardsPaid;
    }

    if (int128_t(global.nTotalStaked) != sumStaked) {
        strReason = strprintf("global totalStaked %d != sum over pools %s", global.nTotalStaked, sumStaked.str());
        return false;
    }
    if (int128_t(global.nTotalRewardsPaid) != sumPaid) {
        strReason = strprintf("global totalRewardsPaid %d != sum over pools %s", global.nTotalRewardsPaid, sumPaid.str());
        return false;
    }

    return true;
}

bool LedgerState::CheckCustody(const CValueTransferView& view, std::string& strReason) const
{
    using int128_t = boost::multiprecision::int128_t;

    int128_t expected = 0;
    for (const auto& entry : pools) {
        expected += entry.second.nTotalStaked;
        expected += entry.second.nRewardPoolBalance;
    }

    CAmount held = view.GetBalance(global.strCustody);
    if (int128_t(held) != expected) {
        strReason = strprintf("custody %s holds %d, ledger accounts for %s", global.strCustody, held, expected.str());
        LogPrintf("LEDGER CUSTODY VIOLATION: %s\n", strReason);
        return false;
    }
    return true;
}

bool CheckOperator(const LedgerState& state, const CCallContext& ctx, CValidationState& vstate)
{
    if (ctx.caller != state.global.strOperator) {
        return vstate.Invalid(error("%s: caller %s is not the operator", __func__, ctx.caller),
                              LedgerError::NOT_AUTHORIZED, "bad-caller-not-operator");
    }
    return true;
}

bool CheckCallContext(const LedgerState& state, const CCallContext& ctx, CValidationState& vstate)
{
    if (ctx.caller.empty()) {
        return vstate.Invalid(error("%s: empty caller", __func__),
                              LedgerError::NOT_AUTHORIZED, "bad-caller-empty");
    }
    if (ctx.caller == state.global.strCustody) {
        return vstate.Invalid(error("%s: custody account %s cannot act as a caller", __func__, ctx.caller),
                              LedgerError::NOT_AUTHORIZED, "bad-caller-custody");
    }
    if (ctx.nTime < state.global.nLastTime) {
        return vstate.Invalid(error("%s: time %d before last applied time %d", __func__, ctx.nTime, state.global.nLastTime),
                              LedgerError::INVALID_TIME, "bad-time-regress");
    }
    return true;
}

void TouchCallContext(LedgerState& state, const CCallContext& ctx)
{
    if (ctx.nTime > state.global.nLastTime) {
        state.global.nLastTime = ctx.nTime;
    }
}
