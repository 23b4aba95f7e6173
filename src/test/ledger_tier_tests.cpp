// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

//
// Unit tests for loyalty tiers: duration thresholds, ratcheted records,
// benefit table bootstrap
//

#include "test/test_stakeledger.h"

#include "ledger/ledger_params.h"
#include "ledger/ledger_pool.h"
#include "ledger/ledger_stake.h"
#include "ledger/ledger_tier.h"

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(ledger_tier_tests, LedgerTestingSetup)

BOOST_AUTO_TEST_CASE(tier_thresholds)
{
    BOOST_CHECK(ledger_tier::GetTierForDays(0) == LoyaltyTier::BRONZE);
    BOOST_CHECK(ledger_tier::GetTierForDays(29) == LoyaltyTier::BRONZE);
    BOOST_CHECK(ledger_tier::GetTierForDays(30) == LoyaltyTier::SILVER);
    BOOST_CHECK(ledger_tier::GetTierForDays(89) == LoyaltyTier::SILVER);
    BOOST_CHECK(ledger_tier::GetTierForDays(90) == LoyaltyTier::GOLD);
    BOOST_CHECK(ledger_tier::GetTierForDays(179) == LoyaltyTier::GOLD);
    BOOST_CHECK(ledger_tier::GetTierForDays(180) == LoyaltyTier::PLATINUM);
    BOOST_CHECK(ledger_tier::GetTierForDays(10000) == LoyaltyTier::PLATINUM);

    // Durations are truncated to whole days
    BOOST_CHECK(ledger_tier::GetTierForDuration(30 * ONE_DAY - 1) == LoyaltyTier::BRONZE);
    BOOST_CHECK(ledger_tier::GetTierForDuration(30 * ONE_DAY) == LoyaltyTier::SILVER);
    BOOST_CHECK(ledger_tier::GetTierForDuration(-ONE_DAY) == LoyaltyTier::BRONZE);
}

BOOST_AUTO_TEST_CASE(tier_monotonic_in_duration)
{
    LoyaltyTier prev = LoyaltyTier::BRONZE;
    for (int64_t nDays = 0; nDays <= 400; ++nDays) {
        LoyaltyTier tier = ledger_tier::GetTierForDuration(nDays * ONE_DAY);
        BOOST_CHECK(!ledger_tier::IsHigherTier(prev, tier));
        prev = tier;
    }
    BOOST_CHECK(prev == LoyaltyTier::PLATINUM);
}

BOOST_AUTO_TEST_CASE(tier_bonus_calculation)
{
    const TierBenefitTable table = ledger_tier::DefaultTierBenefits();
    BOOST_CHECK_EQUAL(table[ledger_tier::GetTierIndex(LoyaltyTier::SILVER)].strName, "Silver");
    BOOST_CHECK_EQUAL(ledger_tier::CalculateTierBonus(500000, table[0]), 0);
    BOOST_CHECK_EQUAL(ledger_tier::CalculateTierBonus(500000, table[1]), 25000);
    BOOST_CHECK_EQUAL(ledger_tier::CalculateTierBonus(500000, table[2]), 50000);
    BOOST_CHECK_EQUAL(ledger_tier::CalculateTierBonus(500000, table[3]), 100000);
    BOOST_CHECK_EQUAL(ledger_tier::CalculateTierBonus(19, table[1]), 0);
}

BOOST_AUTO_TEST_CASE(check_and_upgrade_initializes_then_upgrades)
{
    uint64_t nPoolId = CreatePool(100, COIN, ONE_WEEK, ONE_DAY);
    Deposit(nPoolId, "alice", 10 * COIN);

    CValidationState vstate;
    LedgerEvents events;
    LoyaltyTier tier = LoyaltyTier::PLATINUM;

    // First check creates the record at the live tier
    BOOST_CHECK(ApplyCheckAndUpgradeTier(state, As("alice"), nPoolId, vstate, events, tier));
    BOOST_CHECK(tier == LoyaltyTier::BRONZE);
    BOOST_REQUIRE_EQUAL(events.size(), 1U);
    BOOST_CHECK_EQUAL(GetEventName(events[0]), "tier-initialized");
    BOOST_CHECK_EQUAL(state.global.nTotalTierUpgrades, 0U);

    // Same tier: no event
    events.clear();
    AdvanceTime(10 * ONE_DAY);
    BOOST_CHECK(ApplyCheckAndUpgradeTier(state, As("alice"), nPoolId, vstate, events, tier));
    BOOST_CHECK(events.empty());
    BOOST_CHECK_EQUAL(state.tiers.ReadRecord(nPoolId, "alice")->nLastCheck, nNow);

    // 95 days: straight to gold
    AdvanceTime(85 * ONE_DAY);
    BOOST_CHECK(ApplyCheckAndUpgradeTier(state, As("alice"), nPoolId, vstate, events, tier));
    BOOST_CHECK(tier == LoyaltyTier::GOLD);
    BOOST_REQUIRE_EQUAL(events.size(), 1U);
    const TierUpgradedEvent* ev = boost::get<TierUpgradedEvent>(&events[0]);
    BOOST_REQUIRE(ev);
    BOOST_CHECK(ev->oldTier == LoyaltyTier::BRONZE);
    BOOST_CHECK(ev->newTier == LoyaltyTier::GOLD);
    BOOST_CHECK_EQUAL(state.global.nTotalTierUpgrades, 1U);
    BOOST_CHECK_EQUAL(state.tiers.ReadRecord(nPoolId, "alice")->nAchievedAt, nNow);
}

/**
 * A top-up restarts the live duration; the recorded tier stays
 */
BOOST_AUTO_TEST_CASE(recorded_tier_never_downgrades)
{
    uint64_t nPoolId = CreatePool(100, COIN, ONE_WEEK, ONE_DAY);
    Deposit(nPoolId, "alice", 10 * COIN);
    AdvanceTime(100 * ONE_DAY);

    CValidationState vstate;
    LedgerEvents events;
    LoyaltyTier tier = LoyaltyTier::BRONZE;
    BOOST_CHECK(ApplyCheckAndUpgradeTier(state, As("alice"), nPoolId, vstate, events, tier));
    BOOST_CHECK(tier == LoyaltyTier::GOLD);

    Deposit(nPoolId, "alice", COIN);
    BOOST_CHECK(ledger_tier::GetLiveTier(*state.stakes.LookupPosition(nPoolId, "alice"), nNow) == LoyaltyTier::BRONZE);

    events.clear();
    AdvanceTime(ONE_DAY);
    BOOST_CHECK(ApplyCheckAndUpgradeTier(state, As("alice"), nPoolId, vstate, events, tier));
    BOOST_CHECK(tier == LoyaltyTier::GOLD);
    BOOST_CHECK(events.empty());
    BOOST_CHECK(state.tiers.GetRecordedTierOrDefault(nPoolId, "alice") == LoyaltyTier::GOLD);
}

BOOST_AUTO_TEST_CASE(check_and_upgrade_requires_position)
{
    uint64_t nPoolId = CreatePool(100, COIN, ONE_WEEK, ONE_DAY);

    CValidationState vstate;
    LedgerEvents events;
    LoyaltyTier tier = LoyaltyTier::BRONZE;
    BOOST_CHECK(!ApplyCheckAndUpgradeTier(state, As("alice"), nPoolId, vstate, events, tier));
    BOOST_CHECK(vstate.GetError() == LedgerError::POSITION_NOT_FOUND);

    CValidationState vstate2;
    BOOST_CHECK(!ApplyCheckAndUpgradeTier(state, As("alice"), 99, vstate2, events, tier));
    BOOST_CHECK(vstate2.GetError() == LedgerError::POOL_NOT_FOUND);
    BOOST_CHECK(events.empty());
    BOOST_CHECK_EQUAL(state.tiers.RecordCount(), 0U);

    // Unknown record reads as bronze
    BOOST_CHECK(state.tiers.GetRecordedTierOrDefault(nPoolId, "alice") == LoyaltyTier::BRONZE);
}

BOOST_AUTO_TEST_CASE(initialize_tier_benefits_once)
{
    TierBenefitTable table = ledger_tier::DefaultTierBenefits();
    table[1].nRewardBonusBps = 700;

    CValidationState vstate;
    BOOST_CHECK(!ApplyInitializeTierBenefits(state, As("alice"), table, vstate));
    BOOST_CHECK(vstate.GetError() == LedgerError::NOT_AUTHORIZED);
    BOOST_CHECK(!state.tiers.BenefitsInitialized());

    CValidationState vstate2;
    BOOST_CHECK(ApplyInitializeTierBenefits(state, Operator(), table, vstate2));
    BOOST_CHECK(state.tiers.BenefitsInitialized());
    BOOST_CHECK_EQUAL(state.tiers.GetBenefit(LoyaltyTier::SILVER).nRewardBonusBps, 700);

    CValidationState vstate3;
    BOOST_CHECK(!ApplyInitializeTierBenefits(state, Operator(), ledger_tier::DefaultTierBenefits(), vstate3));
    BOOST_CHECK(vstate3.GetError() == LedgerError::ALREADY_INITIALIZED);
    BOOST_CHECK_EQUAL(state.tiers.GetBenefit(LoyaltyTier::SILVER).nRewardBonusBps, 700);
}

BOOST_AUTO_TEST_CASE(tier_table_validation)
{
    std::string strReason;
    BOOST_CHECK(ledger_tier::CheckTierBenefitTable(ledger_tier::DefaultTierBenefits(), strReason));

    TierBenefitTable table = ledger_tier::DefaultTierBenefits();
    table[2].nFeeDiscountBps = 10001;
    BOOST_CHECK(!ledger_tier::CheckTierBenefitTable(table, strReason));

    table = ledger_tier::DefaultTierBenefits();
    table[3].nMinDaysStaked = 10;
    BOOST_CHECK(!ledger_tier::CheckTierBenefitTable(table, strReason));

    table = ledger_tier::DefaultTierBenefits();
    table[0].nMinDaysStaked = 1;
    BOOST_CHECK(!ledger_tier::CheckTierBenefitTable(table, strReason));

    table = ledger_tier::DefaultTierBenefits();
    table[0].strName.clear();
    BOOST_CHECK(!ledger_tier::CheckTierBenefitTable(table, strReason));

    CValidationState vstate;
    BOOST_CHECK(!ApplyInitializeTierBenefits(state, Operator(), table, vstate));
    BOOST_CHECK(vstate.GetError() == LedgerError::INVALID_AMOUNT);
    BOOST_CHECK(!state.tiers.BenefitsInitialized());
}

BOOST_AUTO_TEST_CASE(tier_thresholds_are_fixed)
{
    TierBenefitTable table = ledger_tier::DefaultTierBenefits();
    table[1].nMinDaysStaked = 7;
    table[2].nMinDaysStaked = 14;
    table[3].nMinDaysStaked = 21;

    CValidationState vstate;
    BOOST_CHECK(!ApplyInitializeTierBenefits(state, Operator(), table, vstate));
    BOOST_CHECK(vstate.GetError() == LedgerError::INVALID_AMOUNT);
    BOOST_CHECK_EQUAL(vstate.GetRejectReason(), "bad-tier-table");
    BOOST_CHECK(!state.tiers.BenefitsInitialized());
    BOOST_CHECK_EQUAL(state.tiers.GetBenefit(LoyaltyTier::SILVER).nMinDaysStaked, 30);

    BOOST_CHECK(ledger_tier::GetTierForDays(25) == LoyaltyTier::BRONZE);
    BOOST_CHECK(ledger_tier::GetTierForDays(30) == LoyaltyTier::SILVER);
}

BOOST_AUTO_TEST_CASE(set_loyalty_enabled_operator_only)
{
    CValidationState vstate;
    BOOST_CHECK(!ApplySetLoyaltyEnabled(state, As("bob"), false, vstate));
    BOOST_CHECK(vstate.GetError() == LedgerError::NOT_AUTHORIZED);
    BOOST_CHECK(state.global.fLoyaltyEnabled);

    CValidationState vstate2;
    BOOST_CHECK(ApplySetLoyaltyEnabled(state, Operator(), false, vstate2));
    BOOST_CHECK(!state.global.fLoyaltyEnabled);
}

BOOST_AUTO_TEST_SUITE_END()
