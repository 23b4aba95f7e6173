// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKELEDGER_RPC_LEDGER_H
#define STAKELEDGER_RPC_LEDGER_H

#include "ledger/ledger_events.h"

#include <stdint.h>

#include <univalue.h>

class CValidationState;
struct CStakePosition;
struct CStakingPool;
struct CUserStats;

/** Event as consumed by the indexer: {"event": "<name>", <hyphenated fields>} */
UniValue EventToJSON(const CLedgerEvent& event);
UniValue EventsToJSON(const LedgerEvents& events);

UniValue PoolToJSON(const CStakingPool& pool, int64_t nTime);
UniValue PositionToJSON(const CStakePosition& position, const CStakingPool& pool, int64_t nTime);
UniValue UserStatsToJSON(const CUserStats& stats);

/** Rejection as a JSON-RPC error object carrying the ledger error code */
UniValue LedgerErrorToJSON(const CValidationState& vstate);

#endif // STAKELEDGER_RPC_LEDGER_H
