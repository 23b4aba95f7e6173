// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKELEDGER_LEDGER_COOLDOWN_H
#define STAKELEDGER_LEDGER_COOLDOWN_H

#include "ledger/ledger_events.h"

#include <stdint.h>
#include <string>

class CValidationState;
struct CCallContext;
struct CStakePosition;
struct CStakingPool;
struct LedgerState;

/**
 * Withdrawal gating of a position:
 *
 *   LOCKED            now < unlock                      (early exit only)
 *   UNLOCKED          now >= unlock, no cooldown
 *   COOLDOWN_PENDING  cooldown started at t, now < t + cooldown period
 *   WITHDRAWABLE      now >= t + cooldown period
 *
 * A partial withdrawal sends the remainder back to UNLOCKED.
 */
enum class CooldownPhase : uint8_t {
    LOCKED = 0,
    UNLOCKED = 1,
    COOLDOWN_PENDING = 2,
    WITHDRAWABLE = 3,
};

namespace ledger_cooldown {

CooldownPhase GetCooldownPhase(const CStakePosition& position, const CStakingPool& pool, int64_t nTime);

/** t + cooldown period, 0 when no cooldown is running */
int64_t GetCooldownEnd(const CStakePosition& position, const CStakingPool& pool);

std::string CooldownPhaseToString(CooldownPhase phase);

} // namespace ledger_cooldown

/**
 * START COOLDOWN (any caller, own position)
 *
 * Legal only from UNLOCKED. Emits cooldown-started with the completion time.
 */
bool CheckStartCooldown(const LedgerState& state, const CCallContext& ctx, uint64_t nPoolId,
                        CValidationState& vstate);
bool ApplyStartCooldown(LedgerState& state, const CCallContext& ctx, uint64_t nPoolId,
                        CValidationState& vstate, LedgerEvents& events);

#endif // STAKELEDGER_LEDGER_COOLDOWN_H
