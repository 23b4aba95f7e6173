// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKELEDGER_LEDGER_FEE_H
#define STAKELEDGER_LEDGER_FEE_H

#include "amount.h"

#include <stdint.h>

struct CTierBenefit;

/**
 * Basis point fee arithmetic.
 *
 * All divisions truncate: a fee is never rounded up, so rounding favours the
 * staker by at most one unit. Products are formed in 128 bits.
 */
namespace ledger_fee {

/** floor(nAmount * nBps / 10000), nAmount and nBps non-negative */
CAmount ApplyBasisPoints(CAmount nAmount, int64_t nBps);

/** 10% of gross rewards */
CAmount CalculateRewardFee(CAmount nGrossRewards);

/** 5% of the withdrawn amount */
CAmount CalculateEarlyWithdrawalPenalty(CAmount nAmount);

/** baseFee - floor(baseFee * feeDiscountBps / 10000) */
CAmount CalculateTierDiscountedFee(CAmount nBaseFee, const CTierBenefit& benefit);

} // namespace ledger_fee

#endif // STAKELEDGER_LEDGER_FEE_H
