// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

//
// Unit tests for stake positions: deposits, top-ups, lock/cooldown gated
// withdrawal, early exit penalty
//

#include "test/test_stakeledger.h"

#include "ledger/ledger_cooldown.h"
#include "ledger/ledger_pool.h"
#include "ledger/ledger_stake.h"

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(ledger_stake_tests, LedgerTestingSetup)

BOOST_AUTO_TEST_CASE(first_deposit_creates_position)
{
    uint64_t nPoolId = CreatePool(500, 1000000, ONE_WEEK, ONE_DAY);

    CValidationState vstate;
    LedgerEvents events;
    CAmount nTotal = 0;
    BOOST_CHECK(ApplyDeposit(state, view, As("alice"), nPoolId, 10000000, vstate, events, nTotal));
    BOOST_CHECK_EQUAL(nTotal, 10000000);

    const CStakePosition* position = state.stakes.LookupPosition(nPoolId, "alice");
    BOOST_REQUIRE(position);
    BOOST_CHECK_EQUAL(position->nAmount, 10000000);
    BOOST_CHECK_EQUAL(position->nStakedAt, TEST_START_TIME);
    BOOST_CHECK_EQUAL(position->nLastClaim, TEST_START_TIME);
    BOOST_CHECK_EQUAL(position->nUnlockTime, TEST_START_TIME + ONE_WEEK);
    BOOST_CHECK(!position->nCooldownStart);

    const CStakingPool& pool = *state.pools.LookupPool(nPoolId);
    BOOST_CHECK_EQUAL(pool.nTotalStaked, 10000000);
    BOOST_CHECK_EQUAL(pool.nStakerCount, 1U);
    BOOST_CHECK_EQUAL(state.global.nTotalStaked, 10000000);
    BOOST_CHECK_EQUAL(state.global.nTotalStakers, 1U);
    BOOST_CHECK_EQUAL(view.GetBalance("alice"), STAKER_FUNDS - 10000000);

    BOOST_REQUIRE_EQUAL(events.size(), 1U);
    const StakeDepositedEvent* ev = boost::get<StakeDepositedEvent>(&events[0]);
    BOOST_REQUIRE(ev);
    BOOST_CHECK_EQUAL(ev->staker, "alice");
    BOOST_CHECK_EQUAL(ev->nTotalStake, 10000000);
    BOOST_CHECK_EQUAL(ev->nUnlockTime, TEST_START_TIME + ONE_WEEK);
    BOOST_CHECK(ev->fNewStaker);

    Optional<CUserStats> stats = state.stakes.ReadUserStats("alice");
    BOOST_REQUIRE(stats);
    BOOST_CHECK_EQUAL(stats->nTotalStaked, 10000000);
    BOOST_CHECK_EQUAL(stats->nPoolsJoined, 1U);
    BOOST_CHECK_EQUAL(stats->nFirstStake, TEST_START_TIME);
    CheckLedger();
}

BOOST_AUTO_TEST_CASE(top_up_restarts_lock)
{
    uint64_t nPoolId = CreatePool(500, 1000000, ONE_WEEK, ONE_DAY);
    Deposit(nPoolId, "alice", 10000000);

    AdvanceTime(3 * ONE_DAY);
    CValidationState vstate;
    LedgerEvents events;
    CAmount nTotal = 0;
    BOOST_CHECK(ApplyDeposit(state, view, As("alice"), nPoolId, 5000000, vstate, events, nTotal));
    BOOST_CHECK_EQUAL(nTotal, 15000000);

    const CStakePosition& position = *state.stakes.LookupPosition(nPoolId, "alice");
    BOOST_CHECK_EQUAL(position.nUnlockTime, nNow + ONE_WEEK);
    BOOST_CHECK_EQUAL(position.nStakedAt, nNow);
    BOOST_CHECK_EQUAL(state.pools.LookupPool(nPoolId)->nStakerCount, 1U);

    const StakeDepositedEvent* ev = boost::get<StakeDepositedEvent>(&events[0]);
    BOOST_REQUIRE(ev);
    BOOST_CHECK(!ev->fNewStaker);
    BOOST_CHECK_EQUAL(ev->nAmount, 5000000);

    // Second pool, same staker: counted once protocol wide
    uint64_t nPool2 = CreatePool(100, 1000000, 0, 0);
    Deposit(nPool2, "alice", 1000000);
    BOOST_CHECK_EQUAL(state.global.nTotalStakers, 1U);
    BOOST_CHECK_EQUAL(state.stakes.ReadUserStats("alice")->nPoolsJoined, 2U);
    CheckLedger();
}

BOOST_AUTO_TEST_CASE(deposit_rejections)
{
    uint64_t nPoolId = CreatePool(500, 1000000, ONE_WEEK, ONE_DAY);
    LedgerEvents events;
    CAmount nTotal = 0;

    CValidationState vstate;
    BOOST_CHECK(!ApplyDeposit(state, view, As("alice"), nPoolId, 999999, vstate, events, nTotal));
    BOOST_CHECK(vstate.GetError() == LedgerError::INVALID_AMOUNT);

    CValidationState vstate2;
    BOOST_CHECK(!ApplyDeposit(state, view, As("alice"), 9, 1000000, vstate2, events, nTotal));
    BOOST_CHECK(vstate2.GetError() == LedgerError::POOL_NOT_FOUND);

    // Staker cannot cover the amount
    CValidationState vstate3;
    BOOST_CHECK(!ApplyDeposit(state, view, As("dave"), nPoolId, 1000000, vstate3, events, nTotal));
    BOOST_CHECK(vstate3.GetError() == LedgerError::TRANSFER_FAILED);
    BOOST_CHECK(!state.stakes.LookupPosition(nPoolId, "dave"));
    BOOST_CHECK(!state.stakes.ReadUserStats("dave"));

    CValidationState vstate4;
    BOOST_CHECK(ApplyPausePool(state, Operator(), nPoolId, vstate4, events));
    events.clear();
    BOOST_CHECK(!ApplyDeposit(state, view, As("alice"), nPoolId, 1000000, vstate4, events, nTotal));
    BOOST_CHECK(vstate4.GetError() == LedgerError::POOL_INACTIVE);

    BOOST_CHECK(events.empty());
    BOOST_CHECK_EQUAL(state.global.nTotalStaked, 0);
    CheckLedger();
}

BOOST_AUTO_TEST_CASE(custody_cannot_stake)
{
    uint64_t nPoolId = CreatePool(500, 1000000, ONE_WEEK, ONE_DAY);
    Deposit(nPoolId, "alice", 10000000);
    const CAmount nCustodyBefore = view.GetBalance(params.strCustody);
    LedgerEvents events;
    CAmount nTotal = 0;

    CValidationState vstate;
    BOOST_CHECK(!ApplyDeposit(state, view, As(params.strCustody), nPoolId, 5000000, vstate, events, nTotal));
    BOOST_CHECK(vstate.GetError() == LedgerError::NOT_AUTHORIZED);
    BOOST_CHECK_EQUAL(vstate.GetRejectReason(), "bad-caller-custody");

    CAmount nNet = 0;
    CValidationState vstate2;
    BOOST_CHECK(!ApplyWithdraw(state, view, As(params.strCustody), nPoolId, 500000, vstate2, events, nNet));
    BOOST_CHECK(vstate2.GetError() == LedgerError::NOT_AUTHORIZED);

    BOOST_CHECK(events.empty());
    BOOST_CHECK(!state.stakes.LookupPosition(nPoolId, params.strCustody));
    BOOST_CHECK_EQUAL(state.pools.LookupPool(nPoolId)->nTotalStaked, 10000000);
    BOOST_CHECK_EQUAL(view.GetBalance(params.strCustody), nCustodyBefore);
    CheckLedger();
}

/**
 * Withdrawing before unlock is an early exit: 5% penalty, no cooldown
 */
BOOST_AUTO_TEST_CASE(early_exit_pays_penalty)
{
    uint64_t nPoolId = CreatePool(500, 1000000, ONE_WEEK, ONE_DAY);
    Deposit(nPoolId, "alice", 1000000);
    const CAmount nOperatorBefore = view.GetBalance(params.strOperator);

    AdvanceTime(3 * ONE_DAY);
    CValidationState vstate;
    LedgerEvents events;
    CAmount nNet = 0;
    BOOST_CHECK(ApplyWithdraw(state, view, As("alice"), nPoolId, 1000000, vstate, events, nNet));
    BOOST_CHECK_EQUAL(nNet, 950000);
    BOOST_CHECK_EQUAL(view.GetBalance("alice"), STAKER_FUNDS - 50000);
    BOOST_CHECK_EQUAL(view.GetBalance(params.strOperator), nOperatorBefore + 50000);
    BOOST_CHECK_EQUAL(state.global.nTotalFeesCollected, 50000);

    BOOST_REQUIRE_EQUAL(events.size(), 2U);
    const StakeWithdrawnEvent* ev = boost::get<StakeWithdrawnEvent>(&events[0]);
    BOOST_REQUIRE(ev);
    BOOST_CHECK(ev->fEarlyWithdrawal);
    BOOST_CHECK_EQUAL(ev->nPenalty, 50000);
    BOOST_CHECK_EQUAL(ev->nNetAmount, 950000);
    BOOST_CHECK_EQUAL(ev->nRemainingStake, 0);
    const FeeCollectedEvent* fee = boost::get<FeeCollectedEvent>(&events[1]);
    BOOST_REQUIRE(fee);
    BOOST_CHECK(fee->type == FeeType::EARLY_WITHDRAWAL);
    BOOST_CHECK_EQUAL(fee->nAmount, 50000);

    BOOST_CHECK(!state.stakes.LookupPosition(nPoolId, "alice"));
    BOOST_CHECK_EQUAL(state.stakes.ReadUserStats("alice")->nTotalFeesPaid, 50000);
    CheckLedger();
}

BOOST_AUTO_TEST_CASE(unlocked_withdraw_needs_cooldown)
{
    uint64_t nPoolId = CreatePool(500, 1000000, ONE_WEEK, ONE_DAY);
    Deposit(nPoolId, "alice", 1000000);
    LedgerEvents events;
    CAmount nNet = 0;

    // Locked: cooldown cannot start yet
    CValidationState vstate;
    BOOST_CHECK(!ApplyStartCooldown(state, As("alice"), nPoolId, vstate, events));
    BOOST_CHECK(vstate.GetError() == LedgerError::COOLDOWN_ACTIVE);

    AdvanceTime(ONE_WEEK);
    const CStakePosition& position = *state.stakes.LookupPosition(nPoolId, "alice");
    const CStakingPool& pool = *state.pools.LookupPool(nPoolId);
    BOOST_CHECK(ledger_cooldown::GetCooldownPhase(position, pool, nNow) == CooldownPhase::UNLOCKED);

    CValidationState vstate2;
    BOOST_CHECK(!ApplyWithdraw(state, view, As("alice"), nPoolId, 1000000, vstate2, events, nNet));
    BOOST_CHECK(vstate2.GetError() == LedgerError::COOLDOWN_ACTIVE);

    CValidationState vstate3;
    BOOST_CHECK(ApplyStartCooldown(state, As("alice"), nPoolId, vstate3, events));
    BOOST_REQUIRE_EQUAL(events.size(), 1U);
    const CooldownStartedEvent* ev = boost::get<CooldownStartedEvent>(&events[0]);
    BOOST_REQUIRE(ev);
    BOOST_CHECK_EQUAL(ev->nCooldownEnds, nNow + ONE_DAY);
    BOOST_CHECK(ledger_cooldown::GetCooldownPhase(position, pool, nNow) == CooldownPhase::COOLDOWN_PENDING);

    // Already running
    CValidationState vstate4;
    BOOST_CHECK(!ApplyStartCooldown(state, As("alice"), nPoolId, vstate4, events));
    BOOST_CHECK(vstate4.GetError() == LedgerError::COOLDOWN_ACTIVE);

    AdvanceTime(ONE_DAY - 1);
    CValidationState vstate5;
    BOOST_CHECK(!ApplyWithdraw(state, view, As("alice"), nPoolId, 1000000, vstate5, events, nNet));
    BOOST_CHECK(vstate5.GetError() == LedgerError::COOLDOWN_ACTIVE);

    AdvanceTime(1);
    BOOST_CHECK(ledger_cooldown::GetCooldownPhase(position, pool, nNow) == CooldownPhase::WITHDRAWABLE);
    events.clear();
    CValidationState vstate6;
    BOOST_CHECK(ApplyWithdraw(state, view, As("alice"), nPoolId, 1000000, vstate6, events, nNet));
    BOOST_CHECK_EQUAL(nNet, 1000000);
    BOOST_REQUIRE_EQUAL(events.size(), 1U);
    BOOST_CHECK_EQUAL(GetEventName(events[0]), "stake-withdrawn");
    BOOST_CHECK_EQUAL(view.GetBalance("alice"), STAKER_FUNDS);
    CheckLedger();
}

BOOST_AUTO_TEST_CASE(full_withdrawal_removes_position)
{
    uint64_t nPoolId = CreatePool(500, 1000000, ONE_WEEK, ONE_DAY);
    Deposit(nPoolId, "alice", 2000000);
    Deposit(nPoolId, "bob", 3000000);
    BOOST_CHECK_EQUAL(state.pools.LookupPool(nPoolId)->nStakerCount, 2U);

    AdvanceTime(ONE_WEEK);
    CValidationState vstate;
    LedgerEvents events;
    BOOST_CHECK(ApplyStartCooldown(state, As("alice"), nPoolId, vstate, events));
    AdvanceTime(ONE_DAY);

    CAmount nNet = 0;
    BOOST_CHECK(ApplyWithdraw(state, view, As("alice"), nPoolId, 2000000, vstate, events, nNet));
    BOOST_CHECK(!state.stakes.LookupPosition(nPoolId, "alice"));
    BOOST_CHECK(!state.stakes.ReadPosition(nPoolId, "alice"));
    BOOST_CHECK_EQUAL(state.pools.LookupPool(nPoolId)->nStakerCount, 1U);
    BOOST_CHECK_EQUAL(state.pools.LookupPool(nPoolId)->nTotalStaked, 3000000);
    BOOST_CHECK_EQUAL(state.global.nTotalStaked, 3000000);
    BOOST_CHECK_EQUAL(state.stakes.ReadUserStats("alice")->nTotalStaked, 0);
    CheckLedger();
}

/**
 * A partial exit keeps the remainder and cancels the cooldown
 */
BOOST_AUTO_TEST_CASE(partial_withdrawal_clears_cooldown)
{
    uint64_t nPoolId = CreatePool(500, 1000000, ONE_WEEK, ONE_DAY);
    Deposit(nPoolId, "alice", 5000000);
    AdvanceTime(ONE_WEEK);

    CValidationState vstate;
    LedgerEvents events;
    BOOST_CHECK(ApplyStartCooldown(state, As("alice"), nPoolId, vstate, events));
    AdvanceTime(ONE_DAY);

    CAmount nNet = 0;
    BOOST_CHECK(ApplyWithdraw(state, view, As("alice"), nPoolId, 2000000, vstate, events, nNet));
    const CStakePosition* position = state.stakes.LookupPosition(nPoolId, "alice");
    BOOST_REQUIRE(position);
    BOOST_CHECK_EQUAL(position->nAmount, 3000000);
    BOOST_CHECK(!position->nCooldownStart);
    BOOST_CHECK(ledger_cooldown::GetCooldownPhase(*position, *state.pools.LookupPool(nPoolId), nNow) == CooldownPhase::UNLOCKED);

    CValidationState vstate2;
    BOOST_CHECK(!ApplyWithdraw(state, view, As("alice"), nPoolId, 1000000, vstate2, events, nNet));
    BOOST_CHECK(vstate2.GetError() == LedgerError::COOLDOWN_ACTIVE);
    CheckLedger();
}

BOOST_AUTO_TEST_CASE(withdraw_rejections)
{
    uint64_t nPoolId = CreatePool(500, 1000000, ONE_WEEK, ONE_DAY);
    LedgerEvents events;
    CAmount nNet = 0;

    CValidationState vstate;
    BOOST_CHECK(!ApplyWithdraw(state, view, As("alice"), nPoolId, 1000000, vstate, events, nNet));
    BOOST_CHECK(vstate.GetError() == LedgerError::INSUFFICIENT_STAKE);

    Deposit(nPoolId, "alice", 1000000);

    CValidationState vstate2;
    BOOST_CHECK(!ApplyWithdraw(state, view, As("alice"), nPoolId, 1000001, vstate2, events, nNet));
    BOOST_CHECK(vstate2.GetError() == LedgerError::INSUFFICIENT_STAKE);

    CValidationState vstate3;
    BOOST_CHECK(!ApplyWithdraw(state, view, As("alice"), nPoolId, 0, vstate3, events, nNet));
    BOOST_CHECK(vstate3.GetError() == LedgerError::INVALID_AMOUNT);

    CValidationState vstate4;
    BOOST_CHECK(!ApplyWithdraw(state, view, As("alice"), 5, 1, vstate4, events, nNet));
    BOOST_CHECK(vstate4.GetError() == LedgerError::POOL_NOT_FOUND);

    BOOST_CHECK(events.empty());
    BOOST_CHECK_EQUAL(state.stakes.LookupPosition(nPoolId, "alice")->nAmount, 1000000);
}

/**
 * Withdrawal stays possible once a pool is paused or ended
 */
BOOST_AUTO_TEST_CASE(withdraw_from_ended_pool)
{
    uint64_t nPoolId = CreatePool(500, 1000000, ONE_WEEK, ONE_DAY);
    Deposit(nPoolId, "alice", 1000000);

    CValidationState vstate;
    LedgerEvents events;
    BOOST_CHECK(ApplyEndPool(state, Operator(), nPoolId, vstate, events));

    CAmount nNet = 0;
    BOOST_CHECK(ApplyWithdraw(state, view, As("alice"), nPoolId, 1000000, vstate, events, nNet));
    BOOST_CHECK_EQUAL(nNet, 950000);
    CheckLedger();
}

BOOST_AUTO_TEST_CASE(time_must_not_regress)
{
    uint64_t nPoolId = CreatePool(500, 1000000, ONE_WEEK, ONE_DAY);
    AdvanceTime(ONE_DAY);
    Deposit(nPoolId, "alice", 1000000);
    BOOST_CHECK_EQUAL(state.global.nLastTime, nNow);

    CValidationState vstate;
    LedgerEvents events;
    CAmount nTotal = 0;
    BOOST_CHECK(!ApplyDeposit(state, view, CCallContext("bob", nNow - 1), nPoolId, 1000000, vstate, events, nTotal));
    BOOST_CHECK(vstate.GetError() == LedgerError::INVALID_TIME);

    // Same instant is fine
    CValidationState vstate2;
    BOOST_CHECK(ApplyDeposit(state, view, As("bob"), nPoolId, 1000000, vstate2, events, nTotal));
}

BOOST_AUTO_TEST_SUITE_END()
