// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKELEDGER_RPC_REGISTER_H
#define STAKELEDGER_RPC_REGISTER_H

class CRPCTable;

/** Register ledger call and query commands */
void RegisterLedgerRPCCommands(CRPCTable& tableRPC);

static inline void RegisterAllCoreRPCCommands(CRPCTable& t)
{
    RegisterLedgerRPCCommands(t);
}

#endif // STAKELEDGER_RPC_REGISTER_H
