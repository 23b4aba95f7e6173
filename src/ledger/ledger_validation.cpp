// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/ledger_validation.h"

#include "logging.h"
#include "util/strencodings.h"
#include "util/system.h"

bool ParseBalanceArg(const std::string& strArg, std::string& account, CAmount& nAmount)
{
    size_t pos = strArg.rfind(':');
    if (pos == std::string::npos || pos == 0) {
        return false;
    }
    int64_t n = 0;
    if (!ParseInt64(strArg.substr(pos + 1), &n) || !MoneyRange(n)) {
        return false;
    }
    account = strArg.substr(0, pos);
    nAmount = n;
    return true;
}

std::unique_ptr<LedgerContext> InitLedgerFromArgs(const ArgsManager& args, std::string& strError)
{
    const CLedgerParams params = LedgerParamsFromArgs(args);
    if (params.strOperator.empty() || params.strCustody.empty()) {
        strError = "operator and custody accounts must not be empty";
        return nullptr;
    }
    if (params.strOperator == params.strCustody) {
        strError = strprintf("operator and custody must differ (both %s)", params.strOperator);
        return nullptr;
    }

    std::unique_ptr<CBalanceView> balances(new CBalanceView());
    for (const std::string& strBalance : args.GetArgs("-balance")) {
        std::string account;
        CAmount nAmount = 0;
        if (!ParseBalanceArg(strBalance, account, nAmount)) {
            strError = strprintf("invalid -balance=%s (expected <id>:<amount>)", strBalance);
            return nullptr;
        }
        if (account == params.strCustody) {
            strError = strprintf("custody account %s cannot be seeded", account);
            return nullptr;
        }
        if (!balances->Credit(account, nAmount)) {
            strError = strprintf("balance of %s out of range", account);
            return nullptr;
        }
        LogPrint(BCLog::LEDGER, "%s: seeded %s with %d\n", __func__, account, nAmount);
    }

    std::unique_ptr<LedgerContext> context(new LedgerContext(params, std::move(balances)));

    LogPrintf("Ledger initialized: operator=%s custody=%s loyalty=%s\n",
              params.strOperator, params.strCustody, params.fLoyaltyEnabled ? "on" : "off");

    return context;
}

bool VerifyLedgerState(const LedgerContext& context)
{
    std::string strReason;
    if (!context.state.CheckInvariants(strReason)) {
        LogPrintf("LEDGER INVARIANT VIOLATION: %s\n", strReason);
        return false;
    }
    if (!context.state.CheckCustody(*context.view, strReason)) {
        LogPrintf("LEDGER CUSTODY VIOLATION: %s\n", strReason);
        return false;
    }
    return true;
}
