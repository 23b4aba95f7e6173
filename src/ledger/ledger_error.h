// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKELEDGER_LEDGER_ERROR_H
#define STAKELEDGER_LEDGER_ERROR_H

#include <string>

/**
 * LedgerError - Typed failure kinds of ledger operations
 *
 * Numeric values are part of the external interface (returned as RPC error
 * codes) and must never be renumbered.
 */
enum class LedgerError : int {
    NONE = 0,
    NOT_AUTHORIZED = 23001,       // caller is not the designated operator
    POOL_NOT_FOUND = 23002,       // unknown pool id
    INVALID_AMOUNT = 23003,       // zero/negative/out-of-range amount or rate, below minimum stake
    INSUFFICIENT_STAKE = 23004,   // withdrawal exceeds position, or no position
    COOLDOWN_ACTIVE = 23005,      // still locked / cooldown running / cooldown not complete
    POOL_INACTIVE = 23006,        // pool paused, ended or past its end time
    NO_REWARDS = 23007,           // nothing pending, or reward balance too small
    POSITION_NOT_FOUND = 23008,   // unknown (pool, staker) position
    LOYALTY_DISABLED = 23009,     // loyalty program switched off
    TRANSFER_FAILED = 23010,      // external value transfer aborted
    ALREADY_INITIALIZED = 23011,  // one-shot bootstrap already performed
    INVALID_TIME = 23012,         // call time earlier than the last applied time
};

/** Short name of an error kind ("NotAuthorized", ...) */
std::string LedgerErrorString(LedgerError err);

/** Capture information about the outcome of a ledger operation */
class CValidationState
{
private:
    enum mode_state {
        MODE_VALID,   //!< everything ok
        MODE_INVALID, //!< operation rejected
    } mode;
    LedgerError nError;
    std::string strRejectReason;
    std::string strDebugMessage;

public:
    CValidationState() : mode(MODE_VALID), nError(LedgerError::NONE) {}

    bool Invalid(bool ret, LedgerError errorIn, const std::string& strRejectReasonIn,
                 const std::string& strDebugMessageIn = "")
    {
        nError = errorIn;
        strRejectReason = strRejectReasonIn;
        strDebugMessage = strDebugMessageIn;
        mode = MODE_INVALID;
        return ret;
    }

    bool IsValid() const { return mode == MODE_VALID; }
    bool IsInvalid() const { return mode == MODE_INVALID; }

    LedgerError GetError() const { return nError; }
    int GetRejectCode() const { return static_cast<int>(nError); }
    const std::string& GetRejectReason() const { return strRejectReason; }
    const std::string& GetDebugMessage() const { return strDebugMessage; }

    std::string ToString() const;
};

#endif // STAKELEDGER_LEDGER_ERROR_H
