// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKELEDGER_LEDGER_TIER_H
#define STAKELEDGER_LEDGER_TIER_H

#include "amount.h"
#include "ledger/ledger_events.h"
#include "optional.h"

#include <array>
#include <map>
#include <stdint.h>
#include <string>
#include <utility>

class CValidationState;
struct CCallContext;
struct CStakePosition;
struct LedgerState;

/**
 * LOYALTY TIERS
 *
 * A position's tier is a pure function of its continuous staking duration
 * (now - nStakedAt, in whole days):
 *
 *   Bronze    [0, 30)
 *   Silver    [30, 90)
 *   Gold      [90, 180)
 *   Platinum  [180, inf)
 *
 * The live tier is recomputed on demand and is the one that drives the
 * reward bonus and fee discount of ClaimWithTierBonus. A top-up restarts
 * nStakedAt, so the live tier can fall back.
 *
 * The recorded tier (CLoyaltyTierRecord) is only moved by
 * ApplyCheckAndUpgradeTier and is never lowered. It carries the
 * bonus/discount counters and is exposed to queries; it never changes a
 * payout.
 */

/**
 * TierBenefit - configuration of one tier
 */
struct CTierBenefit
{
    std::string strName;
    int64_t nRewardBonusBps;
    int64_t nFeeDiscountBps;
    int64_t nMinDaysStaked;

    CTierBenefit() : nRewardBonusBps(0), nFeeDiscountBps(0), nMinDaysStaked(0) {}
    CTierBenefit(const std::string& strNameIn, int64_t nBonusIn, int64_t nDiscountIn, int64_t nMinDaysIn)
        : strName(strNameIn), nRewardBonusBps(nBonusIn), nFeeDiscountBps(nDiscountIn), nMinDaysStaked(nMinDaysIn) {}
};

typedef std::array<CTierBenefit, TIER_COUNT> TierBenefitTable;

/**
 * LoyaltyTierRecord - persisted tier of one (pool, staker) position
 */
struct CLoyaltyTierRecord
{
    LoyaltyTier tier;
    int64_t nAchievedAt;
    CAmount nTotalBonus;        // cumulative tier bonus paid
    CAmount nTotalFeeDiscount;  // cumulative fee discount consumed
    int64_t nLastCheck;

    CLoyaltyTierRecord()
    {
        SetNull();
    }

    void SetNull()
    {
        tier = LoyaltyTier::BRONZE;
        nAchievedAt = 0;
        nTotalBonus = 0;
        nTotalFeeDiscount = 0;
        nLastCheck = 0;
    }
};

/**
 * CTierBook - owner of tier records and of the tier benefit table
 */
class CTierBook
{
public:
    typedef std::pair<uint64_t, std::string> Key;

private:
    std::map<Key, CLoyaltyTierRecord> mapRecords;
    TierBenefitTable benefits;
    bool fBenefitsInitialized;

public:
    CTierBook();

    Optional<CLoyaltyTierRecord> ReadRecord(uint64_t nPoolId, const std::string& staker) const;
    void WriteRecord(uint64_t nPoolId, const std::string& staker, const CLoyaltyTierRecord& record);
    bool EraseRecord(uint64_t nPoolId, const std::string& staker);

    /** Recorded tier, Bronze when no record exists */
    LoyaltyTier GetRecordedTierOrDefault(uint64_t nPoolId, const std::string& staker) const;

    const CTierBenefit& GetBenefit(LoyaltyTier tier) const;
    const TierBenefitTable& GetBenefits() const { return benefits; }
    void SetBenefits(const TierBenefitTable& table);
    bool BenefitsInitialized() const { return fBenefitsInitialized; }

    size_t RecordCount() const { return mapRecords.size(); }
};

namespace ledger_tier {

/** Tier for a number of whole days staked */
LoyaltyTier GetTierForDays(int64_t nDays);

/** Tier for a duration in seconds (truncated to whole days) */
LoyaltyTier GetTierForDuration(int64_t nSeconds);

/** Live tier of a position at nTime */
LoyaltyTier GetLiveTier(const CStakePosition& position, int64_t nTime);

/** Position of a tier in the benefit table */
size_t GetTierIndex(LoyaltyTier tier);

/** Bronze < Silver < Gold < Platinum */
bool IsHigherTier(LoyaltyTier a, LoyaltyTier b);

/** Default benefit table in effect until InitializeTierBenefits runs */
TierBenefitTable DefaultTierBenefits();

/** floor(baseReward * rewardBonusBps / 10000) */
CAmount CalculateTierBonus(CAmount nBaseReward, const CTierBenefit& benefit);

/**
 * Structural checks of an operator supplied benefit table. Minimum days
 * must equal the fixed tier thresholds.
 */
bool CheckTierBenefitTable(const TierBenefitTable& table, std::string& strReason);

} // namespace ledger_tier

/**
 * ApplyCheckAndUpgradeTier - Ratchet the recorded tier of the caller's position
 *
 * - No record: create one at the live tier, emit tier-initialized
 * - Live tier higher than recorded: upgrade, bump the global upgrade
 *   counter, emit tier-upgraded
 * - Otherwise only nLastCheck moves
 *
 * @param[out] tierOut recorded tier after the call
 */
bool CheckCheckAndUpgradeTier(const LedgerState& state, const CCallContext& ctx, uint64_t nPoolId,
                              CValidationState& vstate);
bool ApplyCheckAndUpgradeTier(LedgerState& state, const CCallContext& ctx, uint64_t nPoolId,
                              CValidationState& vstate, LedgerEvents& events, LoyaltyTier& tierOut);

/** Operator bootstrap of the benefit table, allowed once */
bool ApplyInitializeTierBenefits(LedgerState& state, const CCallContext& ctx, const TierBenefitTable& table,
                                 CValidationState& vstate);

/** Operator switch of the loyalty program */
bool ApplySetLoyaltyEnabled(LedgerState& state, const CCallContext& ctx, bool fEnabled,
                            CValidationState& vstate);

#endif // STAKELEDGER_LEDGER_TIER_H
