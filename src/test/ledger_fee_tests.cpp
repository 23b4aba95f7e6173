// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

//
// Unit tests for basis point fee arithmetic
//

#include "test/test_stakeledger.h"

#include "ledger/ledger_fee.h"
#include "ledger/ledger_tier.h"

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(ledger_fee_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(reward_fee_is_ten_percent)
{
    BOOST_CHECK_EQUAL(ledger_fee::CalculateRewardFee(100000000), 10000000);
    BOOST_CHECK_EQUAL(ledger_fee::CalculateRewardFee(500000), 50000);
    BOOST_CHECK_EQUAL(ledger_fee::CalculateRewardFee(0), 0);
}

BOOST_AUTO_TEST_CASE(early_withdrawal_penalty_is_five_percent)
{
    BOOST_CHECK_EQUAL(ledger_fee::CalculateEarlyWithdrawalPenalty(100000000), 5000000);
    BOOST_CHECK_EQUAL(ledger_fee::CalculateEarlyWithdrawalPenalty(1000000), 50000);
}

/**
 * Truncation always favours the staker
 */
BOOST_AUTO_TEST_CASE(fees_truncate_toward_zero)
{
    BOOST_CHECK_EQUAL(ledger_fee::CalculateRewardFee(9), 0);
    BOOST_CHECK_EQUAL(ledger_fee::CalculateRewardFee(19), 1);
    BOOST_CHECK_EQUAL(ledger_fee::CalculateRewardFee(999999), 99999);
    BOOST_CHECK_EQUAL(ledger_fee::CalculateEarlyWithdrawalPenalty(19), 0);
    BOOST_CHECK_EQUAL(ledger_fee::CalculateEarlyWithdrawalPenalty(39), 1);

    for (CAmount n = 0; n < 1000; ++n) {
        CAmount fee = ledger_fee::CalculateRewardFee(n);
        BOOST_CHECK(fee * 10 <= n);
        BOOST_CHECK(n - fee * 10 < 10);
    }
}

BOOST_AUTO_TEST_CASE(apply_basis_points_edges)
{
    BOOST_CHECK_EQUAL(ledger_fee::ApplyBasisPoints(-100, 1000), 0);
    BOOST_CHECK_EQUAL(ledger_fee::ApplyBasisPoints(100, 0), 0);
    BOOST_CHECK_EQUAL(ledger_fee::ApplyBasisPoints(100, 10000), 100);

    // No intermediate overflow at the top of the money range
    BOOST_CHECK_EQUAL(ledger_fee::ApplyBasisPoints(MAX_MONEY, 10000), MAX_MONEY);
    BOOST_CHECK_EQUAL(ledger_fee::CalculateRewardFee(MAX_MONEY), MAX_MONEY / 10);
}

BOOST_AUTO_TEST_CASE(tier_discounted_fee)
{
    const TierBenefitTable table = ledger_tier::DefaultTierBenefits();
    const CAmount baseFee = 50000;

    BOOST_CHECK_EQUAL(ledger_fee::CalculateTierDiscountedFee(baseFee, table[0]), 50000);  // bronze: no discount
    BOOST_CHECK_EQUAL(ledger_fee::CalculateTierDiscountedFee(baseFee, table[1]), 45000);  // silver: 10%
    BOOST_CHECK_EQUAL(ledger_fee::CalculateTierDiscountedFee(baseFee, table[2]), 37500);  // gold: 25%
    BOOST_CHECK_EQUAL(ledger_fee::CalculateTierDiscountedFee(baseFee, table[3]), 25000);  // platinum: 50%

    // The discount is truncated, so the fee rounds up by at most one unit
    CTierBenefit odd("Odd", 0, 3333, 0);
    BOOST_CHECK_EQUAL(ledger_fee::CalculateTierDiscountedFee(7, odd), 5);
}

BOOST_AUTO_TEST_SUITE_END()
