// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKELEDGER_LEDGER_STATE_H
#define STAKELEDGER_LEDGER_STATE_H

#include "amount.h"
#include "ledger/ledger_params.h"
#include "ledger/ledger_pool.h"
#include "ledger/ledger_stake.h"
#include "ledger/ledger_tier.h"

#include <stdint.h>
#include <string>

class CValidationState;
class CValueTransferView;

/**
 * LedgerGlobalState - protocol wide counters and configuration
 *
 * INVARIANTS:
 * - nTotalStaked == sum of pool.nTotalStaked
 * - nTotalRewardsPaid == sum of pool.nTotalRewardsPaid
 * - all amounts non-negative
 * - nNextPoolId == nTotalPools + 1
 */
struct LedgerGlobalState
{
    uint64_t nNextPoolId;
    uint64_t nTotalPools;
    CAmount nTotalStaked;
    CAmount nTotalRewardsPaid;
    CAmount nTotalFeesCollected;
    uint64_t nTotalStakers;       // distinct stakers that ever deposited
    uint64_t nTotalTierUpgrades;
    bool fLoyaltyEnabled;
    int64_t nLastTime;            // time of the last applied call

    std::string strOperator;
    std::string strCustody;

    LedgerGlobalState()
    {
        SetNull();
    }

    void SetNull()
    {
        nNextPoolId = 1;
        nTotalPools = 0;
        nTotalStaked = 0;
        nTotalRewardsPaid = 0;
        nTotalFeesCollected = 0;
        nTotalStakers = 0;
        nTotalTierUpgrades = 0;
        fLoyaltyEnabled = ledger_params::DEFAULT_LOYALTY_ENABLED;
        nLastTime = 0;
        strOperator.clear();
        strCustody.clear();
    }

    bool CheckInvariants() const
    {
        if (nTotalStaked < 0 || nTotalRewardsPaid < 0 || nTotalFeesCollected < 0) {
            return false;
        }
        return nNextPoolId == nTotalPools + 1;
    }
};

/**
 * CCallContext - identity and time of one external call
 *
 * Time is supplied by the caller and is trusted; it only has to be
 * non-decreasing across applied calls.
 */
struct CCallContext
{
    std::string caller;
    int64_t nTime;

    CCallContext() : nTime(0) {}
    CCallContext(const std::string& callerIn, int64_t nTimeIn) : caller(callerIn), nTime(nTimeIn) {}
};

/**
 * LedgerState - the complete ledger
 *
 * Single writer: callers serialize access, nothing here locks.
 */
struct LedgerState
{
    LedgerGlobalState global;
    CPoolRegistry pools;
    CStakeLedger stakes;
    CTierBook tiers;

    LedgerState() {}
    explicit LedgerState(const CLedgerParams& params);

    /**
     * CheckInvariants - Verify the cross-module accounting
     *
     * RULES:
     * 1. global totals equal the sums over pools
     * 2. pool.nTotalStaked equals the sum of its positions, pool.nStakerCount
     *    equals their number, every position amount is positive
     * 3. reward balances non-negative
     *
     * @param[out] strReason first violated rule
     */
    bool CheckInvariants(std::string& strReason) const;

    /**
     * CheckCustody - Value held by custody must equal all principal plus
     * all undistributed reward balances
     */
    bool CheckCustody(const CValueTransferView& view, std::string& strReason) const;
};

/** Reject unless the caller is the operator */
bool CheckOperator(const LedgerState& state, const CCallContext& ctx, CValidationState& vstate);

/** Reject an empty caller, the custody account, or a time earlier than the last applied call */
bool CheckCallContext(const LedgerState& state, const CCallContext& ctx, CValidationState& vstate);

/** Record the time of a successfully applied call */
void TouchCallContext(LedgerState& state, const CCallContext& ctx);

#endif // STAKELEDGER_LEDGER_STATE_H
