// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKELEDGER_LEDGER_VALIDATION_H
#define STAKELEDGER_LEDGER_VALIDATION_H

#include "ledger/ledger_params.h"
#include "ledger/ledger_state.h"
#include "ledger/ledger_transfer.h"

#include <memory>
#include <string>
#include <utility>

class ArgsManager;

/**
 * LedgerContext - a ledger together with the value ledger it settles on
 *
 * Owned by the process entry point (stakeledgerd, test fixtures) and
 * handed to the call surface explicitly.
 */
struct LedgerContext
{
    LedgerState state;
    std::unique_ptr<CValueTransferView> view;

    LedgerContext(const CLedgerParams& params, std::unique_ptr<CValueTransferView> viewIn)
        : state(params), view(std::move(viewIn)) {}
};

/**
 * InitLedgerFromArgs - Build a ledger from -operator/-custody/-loyalty
 *
 * The value ledger is an in-memory CBalanceView seeded from every
 * -balance=<id>:<amount> entry.
 *
 * @param[out] strError reason of a malformed -balance entry
 * @return the context, or nullptr on error
 */
std::unique_ptr<LedgerContext> InitLedgerFromArgs(const ArgsManager& args, std::string& strError);

/**
 * ParseBalanceArg - Split "<id>:<amount>" (the last ':' separates)
 */
bool ParseBalanceArg(const std::string& strArg, std::string& account, CAmount& nAmount);

/**
 * VerifyLedgerState - Check ledger accounting and custody after a call
 *
 * Logs every violation. A false return means the ledger can no longer be
 * trusted.
 */
bool VerifyLedgerState(const LedgerContext& context);

#endif // STAKELEDGER_LEDGER_VALIDATION_H
