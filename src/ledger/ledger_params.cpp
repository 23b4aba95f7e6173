// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/ledger_params.h"

#include "util/system.h"

CLedgerParams LedgerParamsFromArgs(const ArgsManager& args)
{
    CLedgerParams params;
    params.strOperator = args.GetArg("-operator", std::string(ledger_params::DEFAULT_OPERATOR));
    params.strCustody = args.GetArg("-custody", std::string(ledger_params::DEFAULT_CUSTODY));
    params.fLoyaltyEnabled = args.GetBoolArg("-loyalty", ledger_params::DEFAULT_LOYALTY_ENABLED);

    LogPrint(BCLog::LEDGER, "LedgerParamsFromArgs: operator=%s custody=%s loyalty=%d\n",
             params.strOperator, params.strCustody, params.fLoyaltyEnabled);

    return params;
}
