// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/ledger_tier.h"

#include "ledger/ledger_error.h"
#include "ledger/ledger_fee.h"
#include "ledger/ledger_params.h"
#include "ledger/ledger_state.h"
#include "logging.h"
#include "util/system.h"

std::string TierToString(LoyaltyTier tier)
{
    switch (tier) {
    case LoyaltyTier::BRONZE: return "bronze";
    case LoyaltyTier::SILVER: return "silver";
    case LoyaltyTier::GOLD: return "gold";
    case LoyaltyTier::PLATINUM: return "platinum";
    }
    return "unknown";
}

// ============================================================================
// CTierBook
// ============================================================================

CTierBook::CTierBook() : benefits(ledger_tier::DefaultTierBenefits()), fBenefitsInitialized(false) {}

Optional<CLoyaltyTierRecord> CTierBook::ReadRecord(uint64_t nPoolId, const std::string& staker) const
{
    auto it = mapRecords.find(Key(nPoolId, staker));
    if (it == mapRecords.end()) {
        return nullopt;
    }
    return it->second;
}

void CTierBook::WriteRecord(uint64_t nPoolId, const std::string& staker, const CLoyaltyTierRecord& record)
{
    mapRecords[Key(nPoolId, staker)] = record;
}

bool CTierBook::EraseRecord(uint64_t nPoolId, const std::string& staker)
{
    return mapRecords.erase(Key(nPoolId, staker)) > 0;
}

LoyaltyTier CTierBook::GetRecordedTierOrDefault(uint64_t nPoolId, const std::string& staker) const
{
    Optional<CLoyaltyTierRecord> record = ReadRecord(nPoolId, staker);
    return record ? record->tier : LoyaltyTier::BRONZE;
}

const CTierBenefit& CTierBook::GetBenefit(LoyaltyTier tier) const
{
    return benefits[ledger_tier::GetTierIndex(tier)];
}

void CTierBook::SetBenefits(const TierBenefitTable& table)
{
    benefits = table;
    fBenefitsInitialized = true;
}

// ============================================================================
// Pure tier functions
// ============================================================================

namespace ledger_tier {

static int64_t FixedMinDays(size_t nIndex)
{
    switch (nIndex) {
    case 1: return ledger_params::SILVER_MIN_DAYS;
    case 2: return ledger_params::GOLD_MIN_DAYS;
    case 3: return ledger_params::PLATINUM_MIN_DAYS;
    default: return 0;
    }
}

LoyaltyTier GetTierForDays(int64_t nDays)
{
    if (nDays >= ledger_params::PLATINUM_MIN_DAYS) return LoyaltyTier::PLATINUM;
    if (nDays >= ledger_params::GOLD_MIN_DAYS) return LoyaltyTier::GOLD;
    if (nDays >= ledger_params::SILVER_MIN_DAYS) return LoyaltyTier::SILVER;
    return LoyaltyTier::BRONZE;
}

LoyaltyTier GetTierForDuration(int64_t nSeconds)
{
    if (nSeconds <= 0) return LoyaltyTier::BRONZE;
    return GetTierForDays(nSeconds / ledger_params::SECONDS_PER_DAY);
}

LoyaltyTier GetLiveTier(const CStakePosition& position, int64_t nTime)
{
    return GetTierForDuration(nTime - position.nStakedAt);
}

size_t GetTierIndex(LoyaltyTier tier)
{
    switch (tier) {
    case LoyaltyTier::BRONZE: return 0;
    case LoyaltyTier::SILVER: return 1;
    case LoyaltyTier::GOLD: return 2;
    case LoyaltyTier::PLATINUM: return 3;
    }
    return 0;
}

bool IsHigherTier(LoyaltyTier a, LoyaltyTier b)
{
    return GetTierIndex(a) > GetTierIndex(b);
}

TierBenefitTable DefaultTierBenefits()
{
    TierBenefitTable table;
    table[GetTierIndex(LoyaltyTier::BRONZE)] = CTierBenefit("Bronze", 0, 0, 0);
    table[GetTierIndex(LoyaltyTier::SILVER)] = CTierBenefit("Silver", 500, 1000, ledger_params::SILVER_MIN_DAYS);
    table[GetTierIndex(LoyaltyTier::GOLD)] = CTierBenefit("Gold", 1000, 2500, ledger_params::GOLD_MIN_DAYS);
    table[GetTierIndex(LoyaltyTier::PLATINUM)] = CTierBenefit("Platinum", 2000, 5000, ledger_params::PLATINUM_MIN_DAYS);
    return table;
}

CAmount CalculateTierBonus(CAmount nBaseReward, const CTierBenefit& benefit)
{
    return ledger_fee::ApplyBasisPoints(nBaseReward, benefit.nRewardBonusBps);
}

bool CheckTierBenefitTable(const TierBenefitTable& table, std::string& strReason)
{
    for (size_t i = 0; i < table.size(); ++i) {
        const CTierBenefit& benefit = table[i];
        if (benefit.strName.empty()) {
            strReason = strprintf("tier %d has no name", i);
            return false;
        }
        if (benefit.nRewardBonusBps < 0 || benefit.nRewardBonusBps > ledger_params::BPS_DENOMINATOR) {
            strReason = strprintf("tier %s bonus %d out of range", benefit.strName, benefit.nRewardBonusBps);
            return false;
        }
        if (benefit.nFeeDiscountBps < 0 || benefit.nFeeDiscountBps > ledger_params::BPS_DENOMINATOR) {
            strReason = strprintf("tier %s discount %d out of range", benefit.strName, benefit.nFeeDiscountBps);
            return false;
        }
        // Tier thresholds are fixed; only bonus and discount are configurable.
        const int64_t nFixedDays = FixedMinDays(i);
        if (benefit.nMinDaysStaked != nFixedDays) {
            strReason = strprintf("tier %s minimum days %d differs from the fixed threshold %d",
                                  benefit.strName, benefit.nMinDaysStaked, nFixedDays);
            return false;
        }
    }
    return true;
}

} // namespace ledger_tier

// ============================================================================
// Check and upgrade
// ============================================================================

bool CheckCheckAndUpgradeTier(const LedgerState& state, const CCallContext& ctx, uint64_t nPoolId,
                              CValidationState& vstate)
{
    if (!CheckCallContext(state, ctx, vstate)) return false;

    if (!state.pools.ExistsPool(nPoolId)) {
        return vstate.Invalid(error("%s: pool %d not found", __func__, nPoolId),
                              LedgerError::POOL_NOT_FOUND, "bad-pool-unknown");
    }

    if (!state.stakes.LookupPosition(nPoolId, ctx.caller)) {
        return vstate.Invalid(error("%s: no position for %s in pool %d", __func__, ctx.caller, nPoolId),
                              LedgerError::POSITION_NOT_FOUND, "bad-tier-no-position");
    }

    return true;
}

bool ApplyCheckAndUpgradeTier(LedgerState& state, const CCallContext& ctx, uint64_t nPoolId,
                              CValidationState& vstate, LedgerEvents& events, LoyaltyTier& tierOut)
{
    if (!CheckCheckAndUpgradeTier(state, ctx, nPoolId, vstate)) {
        return false;
    }

    const CStakePosition& position = *state.stakes.LookupPosition(nPoolId, ctx.caller);
    const LoyaltyTier liveTier = ledger_tier::GetLiveTier(position, ctx.nTime);

    Optional<CLoyaltyTierRecord> existing = state.tiers.ReadRecord(nPoolId, ctx.caller);
    CLoyaltyTierRecord record;

    if (!existing) {
        record.tier = liveTier;
        record.nAchievedAt = ctx.nTime;
        record.nLastCheck = ctx.nTime;

        TierInitializedEvent ev = {nPoolId, ctx.caller, liveTier, ctx.nTime};
        events.push_back(ev);

        LogPrint(BCLog::TIER, "%s: pool=%d staker=%s initialized at %s\n",
                 __func__, nPoolId, ctx.caller, TierToString(liveTier));
    } else {
        record = *existing;
        record.nLastCheck = ctx.nTime;

        // Never downgrade
        if (ledger_tier::IsHigherTier(liveTier, record.tier)) {
            const LoyaltyTier oldTier = record.tier;
            record.tier = liveTier;
            record.nAchievedAt = ctx.nTime;
            state.global.nTotalTierUpgrades++;

            TierUpgradedEvent ev = {nPoolId, ctx.caller, oldTier, liveTier, ctx.nTime};
            events.push_back(ev);

            LogPrint(BCLog::TIER, "%s: pool=%d staker=%s %s -> %s\n",
                     __func__, nPoolId, ctx.caller, TierToString(oldTier), TierToString(liveTier));
        }
    }

    state.tiers.WriteRecord(nPoolId, ctx.caller, record);
    TouchCallContext(state, ctx);

    tierOut = record.tier;
    return true;
}

// ============================================================================
// Operator configuration
// ============================================================================

bool ApplyInitializeTierBenefits(LedgerState& state, const CCallContext& ctx, const TierBenefitTable& table,
                                 CValidationState& vstate)
{
    if (!CheckCallContext(state, ctx, vstate)) return false;
    if (!CheckOperator(state, ctx, vstate)) return false;

    if (state.tiers.BenefitsInitialized()) {
        return vstate.Invalid(error("%s: tier benefits already initialized", __func__),
                              LedgerError::ALREADY_INITIALIZED, "bad-tier-already-initialized");
    }

    std::string strReason;
    if (!ledger_tier::CheckTierBenefitTable(table, strReason)) {
        return vstate.Invalid(error("%s: %s", __func__, strReason),
                              LedgerError::INVALID_AMOUNT, "bad-tier-table", strReason);
    }

    state.tiers.SetBenefits(table);
    TouchCallContext(state, ctx);

    LogPrint(BCLog::TIER, "%s: benefit table installed\n", __func__);
    return true;
}

bool ApplySetLoyaltyEnabled(LedgerState& state, const CCallContext& ctx, bool fEnabled,
                            CValidationState& vstate)
{
    if (!CheckCallContext(state, ctx, vstate)) return false;
    if (!CheckOperator(state, ctx, vstate)) return false;

    state.global.fLoyaltyEnabled = fEnabled;
    TouchCallContext(state, ctx);

    LogPrint(BCLog::TIER, "%s: loyalty program %s\n", __func__, fEnabled ? "enabled" : "disabled");
    return true;
}
