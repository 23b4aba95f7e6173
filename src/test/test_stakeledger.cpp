// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#define BOOST_TEST_MODULE StakeLedger Test Suite

#include "test/test_stakeledger.h"

#include "ledger/ledger_pool.h"
#include "ledger/ledger_stake.h"
#include "logging.h"
#include "util/system.h"

#include <boost/test/unit_test.hpp>

const CAmount LedgerTestingSetup::OPERATOR_FUNDS;
const CAmount LedgerTestingSetup::STAKER_FUNDS;

BasicTestingSetup::BasicTestingSetup()
{
    LogInstance().m_print_to_console = false;
    LogInstance().m_print_to_file = false;
    gArgs.ClearArgs();
}

BasicTestingSetup::~BasicTestingSetup()
{
    gArgs.ClearArgs();
}

static std::unique_ptr<LedgerContext> MakeTestLedger(const CLedgerParams& params)
{
    std::unique_ptr<CBalanceView> balances(new CBalanceView());
    BOOST_REQUIRE(balances->Credit(params.strOperator, LedgerTestingSetup::OPERATOR_FUNDS));
    for (const char* staker : {"alice", "bob", "carol"}) {
        BOOST_REQUIRE(balances->Credit(staker, LedgerTestingSetup::STAKER_FUNDS));
    }
    return std::unique_ptr<LedgerContext>(new LedgerContext(params, std::move(balances)));
}

LedgerTestingSetup::LedgerTestingSetup()
    : context(MakeTestLedger(params)),
      state(context->state),
      view(*context->view),
      nNow(TEST_START_TIME)
{
}

uint64_t LedgerTestingSetup::CreatePool(int64_t nRateBps, CAmount nMinStake, int64_t nLockPeriod, int64_t nCooldownPeriod,
                                        Optional<int64_t> nDuration, const std::string& strName)
{
    CPoolSpec spec;
    spec.strName = strName;
    spec.nDailyRateBps = nRateBps;
    spec.nMinStake = nMinStake;
    spec.nLockPeriod = nLockPeriod;
    spec.nCooldownPeriod = nCooldownPeriod;
    spec.nDuration = nDuration;

    CValidationState vstate;
    LedgerEvents events;
    uint64_t nPoolId = 0;
    BOOST_REQUIRE_MESSAGE(ApplyCreatePool(state, Operator(), spec, vstate, events, nPoolId), vstate.ToString());
    return nPoolId;
}

void LedgerTestingSetup::FundPool(uint64_t nPoolId, CAmount nAmount)
{
    CValidationState vstate;
    LedgerEvents events;
    BOOST_REQUIRE_MESSAGE(ApplyFundRewardPool(state, view, Operator(), nPoolId, nAmount, vstate, events), vstate.ToString());
}

CAmount LedgerTestingSetup::Deposit(uint64_t nPoolId, const std::string& staker, CAmount nAmount)
{
    CValidationState vstate;
    LedgerEvents events;
    CAmount nTotal = 0;
    BOOST_REQUIRE_MESSAGE(ApplyDeposit(state, view, As(staker), nPoolId, nAmount, vstate, events, nTotal), vstate.ToString());
    return nTotal;
}

void LedgerTestingSetup::CheckLedger() const
{
    std::string strReason;
    BOOST_CHECK_MESSAGE(state.CheckInvariants(strReason), strReason);
    BOOST_CHECK_MESSAGE(state.CheckCustody(view, strReason), strReason);
}
