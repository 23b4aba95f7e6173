// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/ledger_fee.h"

#include "ledger/ledger_params.h"
#include "ledger/ledger_tier.h"
#include "logging.h"

#include <boost/multiprecision/cpp_int.hpp>

namespace ledger_fee {

CAmount ApplyBasisPoints(CAmount nAmount, int64_t nBps)
{
    if (nAmount <= 0 || nBps <= 0) {
        return 0;
    }

    using int128_t = boost::multiprecision::int128_t;

    // Result never exceeds nAmount for nBps <= 10000
    int128_t result = static_cast<int128_t>(nAmount) * nBps / ledger_params::BPS_DENOMINATOR;

    return static_cast<CAmount>(result);
}

CAmount CalculateRewardFee(CAmount nGrossRewards)
{
    return ApplyBasisPoints(nGrossRewards, ledger_params::REWARD_FEE_BPS);
}

CAmount CalculateEarlyWithdrawalPenalty(CAmount nAmount)
{
    return ApplyBasisPoints(nAmount, ledger_params::EARLY_WITHDRAWAL_PENALTY_BPS);
}

CAmount CalculateTierDiscountedFee(CAmount nBaseFee, const CTierBenefit& benefit)
{
    CAmount discount = ApplyBasisPoints(nBaseFee, benefit.nFeeDiscountBps);

    LogPrint(BCLog::YIELD, "CalculateTierDiscountedFee: base=%d tier=%s discount=%d\n",
             nBaseFee, benefit.strName, discount);

    return nBaseFee - discount;
}

} // namespace ledger_fee
