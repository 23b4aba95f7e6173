// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

//
// Unit tests for the pool registry: creation, funding, lifecycle
//

#include "test/test_stakeledger.h"

#include "ledger/ledger_pool.h"
#include "ledger/ledger_stake.h"

#include <boost/test/unit_test.hpp>

namespace {

CPoolSpec MakeSpec(int64_t nRateBps = 500, CAmount nMinStake = COIN)
{
    CPoolSpec spec;
    spec.strName = "Flexible";
    spec.nDailyRateBps = nRateBps;
    spec.nMinStake = nMinStake;
    spec.nLockPeriod = ONE_WEEK;
    spec.nCooldownPeriod = ONE_DAY;
    return spec;
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(ledger_pool_tests, LedgerTestingSetup)

BOOST_AUTO_TEST_CASE(create_pool_assigns_sequential_ids)
{
    CValidationState vstate;
    LedgerEvents events;
    uint64_t nPoolId = 0;

    BOOST_CHECK(ApplyCreatePool(state, Operator(), MakeSpec(), vstate, events, nPoolId));
    BOOST_CHECK_EQUAL(nPoolId, 1U);
    BOOST_CHECK(ApplyCreatePool(state, Operator(), MakeSpec(), vstate, events, nPoolId));
    BOOST_CHECK_EQUAL(nPoolId, 2U);
    BOOST_CHECK_EQUAL(state.global.nTotalPools, 2U);

    BOOST_REQUIRE_EQUAL(events.size(), 2U);
    const PoolCreatedEvent* ev = boost::get<PoolCreatedEvent>(&events[1]);
    BOOST_REQUIRE(ev);
    BOOST_CHECK_EQUAL(ev->nPoolId, 2U);
    BOOST_CHECK_EQUAL(ev->strName, "Flexible");
    BOOST_CHECK_EQUAL(ev->nRewardRate, 500);
    BOOST_CHECK_EQUAL(ev->nMinStake, COIN);
    BOOST_CHECK_EQUAL(ev->nLockPeriod, ONE_WEEK);
    BOOST_CHECK_EQUAL(ev->nTime, TEST_START_TIME);

    Optional<CStakingPool> pool = state.pools.ReadPool(2);
    BOOST_REQUIRE(pool);
    BOOST_CHECK(pool->status == PoolStatus::ACTIVE);
    BOOST_CHECK_EQUAL(pool->nTotalStaked, 0);
    BOOST_CHECK_EQUAL(pool->nStakerCount, 0U);
    BOOST_CHECK_EQUAL(pool->nRewardPoolBalance, 0);
    BOOST_CHECK(!pool->nEndsAt);
    BOOST_CHECK_EQUAL(pool->nCreatedAt, TEST_START_TIME);
}

BOOST_AUTO_TEST_CASE(create_pool_rejections)
{
    LedgerEvents events;
    uint64_t nPoolId = 0;

    CValidationState vstate;
    BOOST_CHECK(!ApplyCreatePool(state, As("alice"), MakeSpec(), vstate, events, nPoolId));
    BOOST_CHECK(vstate.GetError() == LedgerError::NOT_AUTHORIZED);
    BOOST_CHECK_EQUAL(vstate.GetRejectCode(), 23001);

    CValidationState vstate2;
    BOOST_CHECK(!ApplyCreatePool(state, Operator(), MakeSpec(0), vstate2, events, nPoolId));
    BOOST_CHECK(vstate2.GetError() == LedgerError::INVALID_AMOUNT);
    BOOST_CHECK_EQUAL(vstate2.GetRejectCode(), 23003);

    CValidationState vstate3;
    BOOST_CHECK(!ApplyCreatePool(state, Operator(), MakeSpec(10001), vstate3, events, nPoolId));
    BOOST_CHECK(vstate3.GetError() == LedgerError::INVALID_AMOUNT);

    CValidationState vstate4;
    BOOST_CHECK(!ApplyCreatePool(state, Operator(), MakeSpec(500, 0), vstate4, events, nPoolId));
    BOOST_CHECK(vstate4.GetError() == LedgerError::INVALID_AMOUNT);

    CPoolSpec spec = MakeSpec();
    spec.nDuration = 0;
    CValidationState vstate5;
    BOOST_CHECK(!ApplyCreatePool(state, Operator(), spec, vstate5, events, nPoolId));
    BOOST_CHECK(vstate5.GetError() == LedgerError::INVALID_AMOUNT);

    spec = MakeSpec();
    spec.strName.clear();
    CValidationState vstate6;
    BOOST_CHECK(!ApplyCreatePool(state, Operator(), spec, vstate6, events, nPoolId));

    BOOST_CHECK(events.empty());
    BOOST_CHECK_EQUAL(state.global.nTotalPools, 0U);
    BOOST_CHECK_EQUAL(state.global.nNextPoolId, 1U);
}

BOOST_AUTO_TEST_CASE(fund_reward_pool)
{
    uint64_t nPoolId = CreatePool(500, COIN, ONE_WEEK, ONE_DAY);
    const CAmount nOperatorBefore = view.GetBalance(params.strOperator);

    CValidationState vstate;
    LedgerEvents events;
    BOOST_CHECK(ApplyFundRewardPool(state, view, Operator(), nPoolId, 100 * COIN, vstate, events));
    BOOST_CHECK(ApplyFundRewardPool(state, view, Operator(), nPoolId, 50 * COIN, vstate, events));

    BOOST_CHECK_EQUAL(state.pools.LookupPool(nPoolId)->nRewardPoolBalance, 150 * COIN);
    BOOST_CHECK_EQUAL(view.GetBalance(params.strOperator), nOperatorBefore - 150 * COIN);
    BOOST_CHECK_EQUAL(view.GetBalance(params.strCustody), 150 * COIN);

    BOOST_REQUIRE_EQUAL(events.size(), 2U);
    const PoolFundedEvent* ev = boost::get<PoolFundedEvent>(&events[1]);
    BOOST_REQUIRE(ev);
    BOOST_CHECK_EQUAL(ev->nAmount, 50 * COIN);
    BOOST_CHECK_EQUAL(ev->nNewBalance, 150 * COIN);
    CheckLedger();
}

BOOST_AUTO_TEST_CASE(fund_reward_pool_rejections)
{
    uint64_t nPoolId = CreatePool(500, COIN, ONE_WEEK, ONE_DAY);
    LedgerEvents events;

    CValidationState vstate;
    BOOST_CHECK(!ApplyFundRewardPool(state, view, As("alice"), nPoolId, COIN, vstate, events));
    BOOST_CHECK(vstate.GetError() == LedgerError::NOT_AUTHORIZED);

    CValidationState vstate2;
    BOOST_CHECK(!ApplyFundRewardPool(state, view, Operator(), 42, COIN, vstate2, events));
    BOOST_CHECK(vstate2.GetError() == LedgerError::POOL_NOT_FOUND);

    CValidationState vstate3;
    BOOST_CHECK(!ApplyFundRewardPool(state, view, Operator(), nPoolId, 0, vstate3, events));
    BOOST_CHECK(vstate3.GetError() == LedgerError::INVALID_AMOUNT);

    // Operator cannot cover it: nothing moves
    CValidationState vstate4;
    BOOST_CHECK(!ApplyFundRewardPool(state, view, Operator(), nPoolId, OPERATOR_FUNDS + 1, vstate4, events));
    BOOST_CHECK(vstate4.GetError() == LedgerError::TRANSFER_FAILED);
    BOOST_CHECK_EQUAL(state.pools.LookupPool(nPoolId)->nRewardPoolBalance, 0);
    BOOST_CHECK_EQUAL(view.GetBalance(params.strOperator), OPERATOR_FUNDS);

    BOOST_CHECK(events.empty());
    CheckLedger();
}

BOOST_AUTO_TEST_CASE(pause_resume_end_lifecycle)
{
    uint64_t nPoolId = CreatePool(500, COIN, ONE_WEEK, ONE_DAY);
    LedgerEvents events;

    CValidationState vstate;
    BOOST_CHECK(!ApplyResumePool(state, Operator(), nPoolId, vstate, events));
    BOOST_CHECK(vstate.GetError() == LedgerError::POOL_INACTIVE);

    CValidationState vstate2;
    BOOST_CHECK(!ApplyPausePool(state, As("alice"), nPoolId, vstate2, events));
    BOOST_CHECK(vstate2.GetError() == LedgerError::NOT_AUTHORIZED);

    CValidationState vstate3;
    BOOST_CHECK(ApplyPausePool(state, Operator(), nPoolId, vstate3, events));
    BOOST_CHECK(state.pools.LookupPool(nPoolId)->status == PoolStatus::PAUSED);
    BOOST_CHECK(!ApplyPausePool(state, Operator(), nPoolId, vstate3, events));
    BOOST_CHECK(vstate3.GetError() == LedgerError::POOL_INACTIVE);

    CValidationState vstate4;
    BOOST_CHECK(ApplyResumePool(state, Operator(), nPoolId, vstate4, events));
    BOOST_CHECK(state.pools.LookupPool(nPoolId)->status == PoolStatus::ACTIVE);

    BOOST_CHECK(ApplyEndPool(state, Operator(), nPoolId, vstate4, events));
    BOOST_CHECK(state.pools.LookupPool(nPoolId)->status == PoolStatus::ENDED);
    BOOST_CHECK(!ApplyEndPool(state, Operator(), nPoolId, vstate4, events));
    BOOST_CHECK(!ApplyResumePool(state, Operator(), nPoolId, vstate4, events));

    BOOST_REQUIRE_EQUAL(events.size(), 3U);
    BOOST_CHECK_EQUAL(GetEventName(events[0]), "pool-paused");
    BOOST_CHECK_EQUAL(GetEventName(events[1]), "pool-resumed");
    BOOST_CHECK_EQUAL(GetEventName(events[2]), "pool-ended");
    BOOST_CHECK_EQUAL(GetEventPoolId(events[2]), nPoolId);

    CValidationState vstate5;
    BOOST_CHECK(!ApplyPausePool(state, Operator(), 77, vstate5, events));
    BOOST_CHECK(vstate5.GetError() == LedgerError::POOL_NOT_FOUND);
}

/**
 * Pausing does not move stake timers
 */
BOOST_AUTO_TEST_CASE(pause_keeps_stake_timers)
{
    uint64_t nPoolId = CreatePool(500, COIN, ONE_WEEK, ONE_DAY);
    Deposit(nPoolId, "alice", 10 * COIN);
    const int64_t nUnlock = state.stakes.LookupPosition(nPoolId, "alice")->nUnlockTime;

    CValidationState vstate;
    LedgerEvents events;
    AdvanceTime(ONE_DAY);
    BOOST_CHECK(ApplyPausePool(state, Operator(), nPoolId, vstate, events));
    AdvanceTime(ONE_DAY);
    BOOST_CHECK(ApplyResumePool(state, Operator(), nPoolId, vstate, events));

    BOOST_CHECK_EQUAL(state.stakes.LookupPosition(nPoolId, "alice")->nUnlockTime, nUnlock);
}

BOOST_AUTO_TEST_CASE(pool_expires_at_end_time)
{
    uint64_t nPoolId = CreatePool(500, COIN, ONE_WEEK, ONE_DAY, 30 * ONE_DAY);
    const CStakingPool& pool = *state.pools.LookupPool(nPoolId);
    BOOST_REQUIRE(pool.nEndsAt);
    BOOST_CHECK_EQUAL(*pool.nEndsAt, TEST_START_TIME + 30 * ONE_DAY);

    BOOST_CHECK(pool.IsActive(TEST_START_TIME + 30 * ONE_DAY - 1));
    BOOST_CHECK(!pool.IsActive(TEST_START_TIME + 30 * ONE_DAY));
    BOOST_CHECK(pool.GetEffectiveStatus(TEST_START_TIME + 31 * ONE_DAY) == PoolStatus::ENDED);
    // Stored status is untouched
    BOOST_CHECK(pool.status == PoolStatus::ACTIVE);

    AdvanceTime(30 * ONE_DAY);
    CValidationState vstate;
    LedgerEvents events;
    CAmount nTotal = 0;
    BOOST_CHECK(!ApplyDeposit(state, view, As("alice"), nPoolId, COIN, vstate, events, nTotal));
    BOOST_CHECK(vstate.GetError() == LedgerError::POOL_INACTIVE);
}

BOOST_AUTO_TEST_SUITE_END()
