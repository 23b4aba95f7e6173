// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/ledger_error.h"

#include "util/strprintf.h"

std::string LedgerErrorString(LedgerError err)
{
    switch (err) {
    case LedgerError::NONE: return "None";
    case LedgerError::NOT_AUTHORIZED: return "NotAuthorized";
    case LedgerError::POOL_NOT_FOUND: return "PoolNotFound";
    case LedgerError::INVALID_AMOUNT: return "InvalidAmount";
    case LedgerError::INSUFFICIENT_STAKE: return "InsufficientStake";
    case LedgerError::COOLDOWN_ACTIVE: return "CooldownActive";
    case LedgerError::POOL_INACTIVE: return "PoolInactive";
    case LedgerError::NO_REWARDS: return "NoRewards";
    case LedgerError::POSITION_NOT_FOUND: return "PositionNotFound";
    case LedgerError::LOYALTY_DISABLED: return "LoyaltyDisabled";
    case LedgerError::TRANSFER_FAILED: return "TransferFailed";
    case LedgerError::ALREADY_INITIALIZED: return "AlreadyInitialized";
    case LedgerError::INVALID_TIME: return "InvalidTime";
    }
    return "Unknown";
}

std::string CValidationState::ToString() const
{
    if (IsValid()) return "Valid";
    return strprintf("%s (code %d): %s%s", LedgerErrorString(nError), GetRejectCode(), strRejectReason,
                     strDebugMessage.empty() ? "" : ", " + strDebugMessage);
}
