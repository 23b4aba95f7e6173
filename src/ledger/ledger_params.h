// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKELEDGER_LEDGER_PARAMS_H
#define STAKELEDGER_LEDGER_PARAMS_H

#include <stdint.h>
#include <string>

class ArgsManager;

namespace ledger_params {

// ============================================================================
// Ledger constants (fixed, not configurable)
// ============================================================================

static const int64_t SECONDS_PER_DAY = 86400;

// Basis points: 10000 bps = 100%
static const int64_t BPS_DENOMINATOR = 10000;

// Reward fee skimmed on every claim/compound: 10%
static const int64_t REWARD_FEE_BPS = 1000;

// Early withdrawal (before unlock) penalty: 5%
static const int64_t EARLY_WITHDRAWAL_PENALTY_BPS = 500;

// Upper bound of a pool's daily rate (100% per day)
static const int64_t MAX_DAILY_RATE_BPS = BPS_DENOMINATOR;

// Loyalty tier thresholds in whole days of continuous staking
static const int64_t SILVER_MIN_DAYS = 30;
static const int64_t GOLD_MIN_DAYS = 90;
static const int64_t PLATINUM_MIN_DAYS = 180;

// ============================================================================
// Configurable defaults
// ============================================================================

static const char* const DEFAULT_OPERATOR = "operator";
static const char* const DEFAULT_CUSTODY = "stakeledger.custody";
static const bool DEFAULT_LOYALTY_ENABLED = true;

} // namespace ledger_params

/**
 * CLedgerParams - Deployment parameters of a ledger instance
 *
 * strOperator is the only identity allowed to call the admin operations.
 * strCustody is the account holding staked principal and reward balances.
 */
struct CLedgerParams
{
    std::string strOperator;
    std::string strCustody;
    bool fLoyaltyEnabled;

    CLedgerParams()
        : strOperator(ledger_params::DEFAULT_OPERATOR),
          strCustody(ledger_params::DEFAULT_CUSTODY),
          fLoyaltyEnabled(ledger_params::DEFAULT_LOYALTY_ENABLED) {}
};

/** Build ledger parameters from -operator, -custody and -loyalty */
CLedgerParams LedgerParamsFromArgs(const ArgsManager& args);

#endif // STAKELEDGER_LEDGER_PARAMS_H
