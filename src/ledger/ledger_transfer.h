// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKELEDGER_LEDGER_TRANSFER_H
#define STAKELEDGER_LEDGER_TRANSFER_H

#include "amount.h"

#include <map>
#include <string>
#include <vector>

/**
 * CValueTransfer - one movement of fungible value between two accounts
 */
struct CValueTransfer
{
    std::string from;
    std::string to;
    CAmount nAmount;

    CValueTransfer() : nAmount(0) {}
    CValueTransfer(const std::string& fromIn, const std::string& toIn, CAmount nAmountIn)
        : from(fromIn), to(toIn), nAmount(nAmountIn) {}

    std::string ToString() const;
};

/**
 * CValueTransferView - the surrounding environment's value ledger
 *
 * Ledger operations never move value themselves: they hand the complete
 * batch of transfers of one operation to ApplyTransfers, which must commit
 * all of them or none. A false return aborts the operation before any
 * ledger state is touched.
 */
class CValueTransferView
{
public:
    virtual ~CValueTransferView() {}

    virtual bool ApplyTransfers(const std::vector<CValueTransfer>& vTransfers) = 0;

    virtual CAmount GetBalance(const std::string& account) const = 0;
};

/**
 * CBalanceView - in-memory value ledger
 *
 * A batch is accepted only if every sender covers the sum of its debits in
 * that batch (credits received within the same batch do not count).
 */
class CBalanceView : public CValueTransferView
{
private:
    std::map<std::string, CAmount> mapBalances;

public:
    /** Mint value into an account (genesis balances, tests) */
    bool Credit(const std::string& account, CAmount nAmount);

    bool ApplyTransfers(const std::vector<CValueTransfer>& vTransfers) override;

    CAmount GetBalance(const std::string& account) const override;

    const std::map<std::string, CAmount>& GetBalances() const { return mapBalances; }
};

#endif // STAKELEDGER_LEDGER_TRANSFER_H
