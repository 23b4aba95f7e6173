// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/ledger_transfer.h"

#include "logging.h"

#include <boost/multiprecision/cpp_int.hpp>

std::string CValueTransfer::ToString() const
{
    return strprintf("CValueTransfer(from=%s, to=%s, amount=%d)", from, to, nAmount);
}

bool CBalanceView::Credit(const std::string& account, CAmount nAmount)
{
    if (!MoneyRange(nAmount)) {
        return false;
    }
    CAmount& balance = mapBalances[account];
    if (!MoneyRange(balance + nAmount)) {
        return false;
    }
    balance += nAmount;
    return true;
}

bool CBalanceView::ApplyTransfers(const std::vector<CValueTransfer>& vTransfers)
{
    using int128_t = boost::multiprecision::int128_t;

    // Pass 1: validate the whole batch against current balances
    std::map<std::string, int128_t> mapDebits;
    std::map<std::string, int128_t> mapCredits;
    for (const CValueTransfer& transfer : vTransfers) {
        if (transfer.nAmount < 0 || transfer.from.empty() || transfer.to.empty()) {
            LogPrint(BCLog::LEDGER, "CBalanceView::ApplyTransfers: malformed %s\n", transfer.ToString());
            return false;
        }
        mapDebits[transfer.from] += transfer.nAmount;
        mapCredits[transfer.to] += transfer.nAmount;
    }

    for (const auto& debit : mapDebits) {
        if (debit.second > GetBalance(debit.first)) {
            LogPrint(BCLog::LEDGER, "CBalanceView::ApplyTransfers: %s has %d, needs %s\n",
                     debit.first, GetBalance(debit.first), debit.second.str());
            return false;
        }
    }
    for (const auto& credit : mapCredits) {
        int128_t after = static_cast<int128_t>(GetBalance(credit.first)) + credit.second;
        auto itDebit = mapDebits.find(credit.first);
        if (itDebit != mapDebits.end()) after -= itDebit->second;
        if (after > MAX_MONEY) {
            LogPrint(BCLog::LEDGER, "CBalanceView::ApplyTransfers: %s balance out of range\n", credit.first);
            return false;
        }
    }

    // Pass 2: commit
    for (const CValueTransfer& transfer : vTransfers) {
        if (transfer.nAmount == 0) continue;
        mapBalances[transfer.from] -= transfer.nAmount;
        mapBalances[transfer.to] += transfer.nAmount;
    }

    return true;
}

CAmount CBalanceView::GetBalance(const std::string& account) const
{
    auto it = mapBalances.find(account);
    return it == mapBalances.end() ? 0 : it->second;
}
