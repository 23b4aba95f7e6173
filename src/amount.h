// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKELEDGER_AMOUNT_H
#define STAKELEDGER_AMOUNT_H

#include <stdint.h>

/** Amount in smallest units (micro-STX) */
typedef int64_t CAmount;

static const CAmount COIN = 1000000;

/**
 * No amount larger than this is valid for a single operation or an
 * aggregate. Keeps every product in the accrual formula inside 128 bits.
 */
static const CAmount MAX_MONEY = 1000000000LL * COIN;
inline bool MoneyRange(const CAmount& nValue) { return (nValue >= 0 && nValue <= MAX_MONEY); }

#endif // STAKELEDGER_AMOUNT_H
