// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/ledger.h"

#include "ledger/ledger_cooldown.h"
#include "ledger/ledger_error.h"
#include "ledger/ledger_fee.h"
#include "ledger/ledger_params.h"
#include "ledger/ledger_pool.h"
#include "ledger/ledger_stake.h"
#include "ledger/ledger_state.h"
#include "ledger/ledger_tier.h"
#include "ledger/ledger_validation.h"
#include "ledger/ledger_yield.h"
#include "logging.h"
#include "rpc/register.h"
#include "rpc/server.h"

#include <univalue.h>

// ============================================================================
// JSON conversion
// ============================================================================

namespace {

class CEventJSONVisitor : public boost::static_visitor<UniValue>
{
private:
    static UniValue Header(const CLedgerEvent& event, uint64_t nPoolId)
    {
        UniValue obj(UniValue::VOBJ);
        obj.pushKV("event", GetEventName(event));
        obj.pushKV("pool-id", nPoolId);
        return obj;
    }

    const CLedgerEvent& event;

public:
    explicit CEventJSONVisitor(const CLedgerEvent& eventIn) : event(eventIn) {}

    UniValue operator()(const PoolCreatedEvent& ev) const
    {
        UniValue obj = Header(event, ev.nPoolId);
        obj.pushKV("name", ev.strName);
        obj.pushKV("reward-rate", ev.nRewardRate);
        obj.pushKV("min-stake", ev.nMinStake);
        obj.pushKV("lock-period", ev.nLockPeriod);
        obj.pushKV("timestamp", ev.nTime);
        return obj;
    }

    UniValue operator()(const PoolFundedEvent& ev) const
    {
        UniValue obj = Header(event, ev.nPoolId);
        obj.pushKV("amount", ev.nAmount);
        obj.pushKV("new-balance", ev.nNewBalance);
        obj.pushKV("timestamp", ev.nTime);
        return obj;
    }

    UniValue operator()(const PoolStatusEvent& ev) const
    {
        UniValue obj = Header(event, ev.nPoolId);
        obj.pushKV("timestamp", ev.nTime);
        return obj;
    }

    UniValue operator()(const StakeDepositedEvent& ev) const
    {
        UniValue obj = Header(event, ev.nPoolId);
        obj.pushKV("staker", ev.staker);
        obj.pushKV("amount", ev.nAmount);
        obj.pushKV("total-stake", ev.nTotalStake);
        obj.pushKV("unlock-time", ev.nUnlockTime);
        obj.pushKV("is-new-staker", ev.fNewStaker);
        obj.pushKV("timestamp", ev.nTime);
        return obj;
    }

    UniValue operator()(const StakeWithdrawnEvent& ev) const
    {
        UniValue obj = Header(event, ev.nPoolId);
        obj.pushKV("staker", ev.staker);
        obj.pushKV("amount", ev.nAmount);
        obj.pushKV("penalty", ev.nPenalty);
        obj.pushKV("net-amount", ev.nNetAmount);
        obj.pushKV("is-early-withdrawal", ev.fEarlyWithdrawal);
        obj.pushKV("remaining-stake", ev.nRemainingStake);
        obj.pushKV("timestamp", ev.nTime);
        return obj;
    }

    UniValue operator()(const RewardsClaimedEvent& ev) const
    {
        UniValue obj = Header(event, ev.nPoolId);
        obj.pushKV("staker", ev.staker);
        obj.pushKV("gross-rewards", ev.nGrossRewards);
        obj.pushKV("fee", ev.nFee);
        obj.pushKV("net-rewards", ev.nNetRewards);
        obj.pushKV("timestamp", ev.nTime);
        return obj;
    }

    UniValue operator()(const RewardsCompoundedEvent& ev) const
    {
        UniValue obj = Header(event, ev.nPoolId);
        obj.pushKV("staker", ev.staker);
        obj.pushKV("rewards-compounded", ev.nRewardsCompounded);
        obj.pushKV("fee", ev.nFee);
        obj.pushKV("new-stake-amount", ev.nNewStakeAmount);
        obj.pushKV("timestamp", ev.nTime);
        return obj;
    }

    UniValue operator()(const FeeCollectedEvent& ev) const
    {
        UniValue obj = Header(event, ev.nPoolId);
        obj.pushKV("fee-type", FeeTypeToString(ev.type));
        obj.pushKV("amount", ev.nAmount);
        obj.pushKV("staker", ev.staker);
        obj.pushKV("timestamp", ev.nTime);
        return obj;
    }

    UniValue operator()(const CooldownStartedEvent& ev) const
    {
        UniValue obj = Header(event, ev.nPoolId);
        obj.pushKV("staker", ev.staker);
        obj.pushKV("cooldown-ends", ev.nCooldownEnds);
        obj.pushKV("timestamp", ev.nTime);
        return obj;
    }

    UniValue operator()(const TierUpgradedEvent& ev) const
    {
        UniValue obj = Header(event, ev.nPoolId);
        obj.pushKV("staker", ev.staker);
        obj.pushKV("old-tier", TierToString(ev.oldTier));
        obj.pushKV("new-tier", TierToString(ev.newTier));
        obj.pushKV("timestamp", ev.nTime);
        return obj;
    }

    UniValue operator()(const TierInitializedEvent& ev) const
    {
        UniValue obj = Header(event, ev.nPoolId);
        obj.pushKV("staker", ev.staker);
        obj.pushKV("tier", TierToString(ev.tier));
        obj.pushKV("timestamp", ev.nTime);
        return obj;
    }
};

UniValue BenefitToJSON(const CTierBenefit& benefit)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("name", benefit.strName);
    obj.pushKV("reward-bonus-bps", benefit.nRewardBonusBps);
    obj.pushKV("fee-discount-bps", benefit.nFeeDiscountBps);
    obj.pushKV("min-days-staked", benefit.nMinDaysStaked);
    return obj;
}

UniValue ClaimResultToJSON(const CClaimResult& result)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("gross-rewards", result.nGross);
    obj.pushKV("fee", result.nFee);
    obj.pushKV("net-rewards", result.nNet);
    return obj;
}

} // namespace

UniValue EventToJSON(const CLedgerEvent& event)
{
    return boost::apply_visitor(CEventJSONVisitor(event), event);
}

UniValue EventsToJSON(const LedgerEvents& events)
{
    UniValue arr(UniValue::VARR);
    for (const CLedgerEvent& event : events) {
        arr.push_back(EventToJSON(event));
    }
    return arr;
}

UniValue PoolToJSON(const CStakingPool& pool, int64_t nTime)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("pool-id", pool.nId);
    obj.pushKV("name", pool.strName);
    obj.pushKV("reward-rate", pool.nDailyRateBps);
    obj.pushKV("min-stake", pool.nMinStake);
    obj.pushKV("lock-period", pool.nLockPeriod);
    obj.pushKV("cooldown-period", pool.nCooldownPeriod);
    obj.pushKV("total-staked", pool.nTotalStaked);
    obj.pushKV("total-rewards-paid", pool.nTotalRewardsPaid);
    obj.pushKV("staker-count", (int64_t)pool.nStakerCount);
    obj.pushKV("created-at", pool.nCreatedAt);
    obj.pushKV("ends-at", pool.nEndsAt ? UniValue(*pool.nEndsAt) : NullUniValue);
    obj.pushKV("status", PoolStatusToString(pool.GetEffectiveStatus(nTime)));
    obj.pushKV("reward-pool-balance", pool.nRewardPoolBalance);
    return obj;
}

UniValue PositionToJSON(const CStakePosition& position, const CStakingPool& pool, int64_t nTime)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("pool-id", position.nPoolId);
    obj.pushKV("staker", position.staker);
    obj.pushKV("amount", position.nAmount);
    obj.pushKV("staked-at", position.nStakedAt);
    obj.pushKV("last-claim", position.nLastClaim);
    obj.pushKV("accrued-rewards", position.nAccruedRewards);
    obj.pushKV("total-earned", position.nTotalEarned);
    obj.pushKV("unlock-time", position.nUnlockTime);
    obj.pushKV("cooldown-start", position.nCooldownStart ? UniValue(*position.nCooldownStart) : NullUniValue);
    obj.pushKV("pending-rewards", ledger_yield::GetPendingRewards(position, pool, nTime));
    obj.pushKV("live-tier", TierToString(ledger_tier::GetLiveTier(position, nTime)));
    return obj;
}

UniValue UserStatsToJSON(const CUserStats& stats)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("total-staked", stats.nTotalStaked);
    obj.pushKV("total-rewards", stats.nTotalRewards);
    obj.pushKV("total-fees-paid", stats.nTotalFeesPaid);
    obj.pushKV("pools-joined", (int64_t)stats.nPoolsJoined);
    obj.pushKV("first-stake", stats.nFirstStake);
    obj.pushKV("last-activity", stats.nLastActivity);
    return obj;
}

UniValue LedgerErrorToJSON(const CValidationState& vstate)
{
    std::string strMessage = strprintf("%s: %s", LedgerErrorString(vstate.GetError()), vstate.GetRejectReason());
    if (!vstate.GetDebugMessage().empty()) {
        strMessage += " (" + vstate.GetDebugMessage() + ")";
    }
    return JSONRPCError(vstate.GetRejectCode(), strMessage);
}

// ============================================================================
// Request helpers
// ============================================================================

static LedgerContext& EnsureLedgerContext(const JSONRPCRequest& request)
{
    if (!request.context) {
        throw JSONRPCError(RPC_LEDGER_NOT_AVAILABLE, "Ledger not available");
    }
    return *request.context;
}

static CCallContext CallContextFromRequest(const JSONRPCRequest& request)
{
    return CCallContext(request.caller, request.nTime);
}

/** Surface a rejection; nothing was committed */
static void ThrowIfInvalid(bool fOk, const CValidationState& vstate)
{
    if (!fOk) {
        LogPrint(BCLog::RPC, "rejected: %s\n", vstate.ToString());
        throw LedgerErrorToJSON(vstate);
    }
}

static void PublishEvents(const JSONRPCRequest& request, const LedgerEvents& events)
{
    if (request.events) {
        request.events->insert(request.events->end(), events.begin(), events.end());
    }
}

static UniValue LedgerErrorValue(LedgerError err, const std::string& strReason)
{
    CValidationState vstate;
    vstate.Invalid(false, err, strReason);
    return LedgerErrorToJSON(vstate);
}

static const CStakingPool& RequirePool(const LedgerContext& context, uint64_t nPoolId)
{
    const CStakingPool* pool = context.state.pools.LookupPool(nPoolId);
    if (!pool) {
        throw LedgerErrorValue(LedgerError::POOL_NOT_FOUND, "bad-pool-unknown");
    }
    return *pool;
}

static const CStakePosition& RequirePosition(const LedgerContext& context, uint64_t nPoolId, const std::string& staker)
{
    const CStakePosition* position = context.state.stakes.LookupPosition(nPoolId, staker);
    if (!position) {
        throw LedgerErrorValue(LedgerError::POSITION_NOT_FOUND, "bad-position-unknown");
    }
    return *position;
}

// ============================================================================
// Operator calls
// ============================================================================

static UniValue createpool(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() < 5 || request.params.size() > 6) {
        throw std::runtime_error(
            "createpool \"name\" rate minstake lockperiod cooldownperiod ( duration )\n"
            "\nCreate a staking pool. Operator only.\n"
            "\nArguments:\n"
            "1. \"name\"          (string, required) Pool name\n"
            "2. rate            (numeric, required) Daily reward rate in basis points (1..10000)\n"
            "3. minstake        (numeric, required) Minimum deposit\n"
            "4. lockperiod      (numeric, required) Seconds a deposit stays locked\n"
            "5. cooldownperiod  (numeric, required) Seconds between cooldown start and withdrawal\n"
            "6. duration        (numeric, optional) Seconds until the pool closes to deposits\n"
            "\nResult:\n"
            "{\n"
            "  \"pool-id\": n     (numeric) Id of the new pool\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("createpool", "\"Flexible\", 500, 1000000, 604800, 86400")
            + HelpExampleRpc("createpool", "\"Flexible\", 500, 1000000, 604800, 86400")
        );
    }

    RPCTypeCheck(request.params, {UniValue::VSTR, UniValue::VNUM, UniValue::VNUM, UniValue::VNUM, UniValue::VNUM, UniValue::VNUM}, true);

    LedgerContext& context = EnsureLedgerContext(request);

    CPoolSpec spec;
    spec.strName = request.params[0].get_str();
    spec.nDailyRateBps = request.params[1].get_int64();
    spec.nMinStake = request.params[2].get_int64();
    spec.nLockPeriod = request.params[3].get_int64();
    spec.nCooldownPeriod = request.params[4].get_int64();
    if (request.params.size() > 5 && !request.params[5].isNull()) {
        spec.nDuration = request.params[5].get_int64();
    }

    CValidationState vstate;
    LedgerEvents events;
    uint64_t nPoolId = 0;
    ThrowIfInvalid(ApplyCreatePool(context.state, CallContextFromRequest(request), spec, vstate, events, nPoolId), vstate);
    PublishEvents(request, events);

    UniValue result(UniValue::VOBJ);
    result.pushKV("pool-id", nPoolId);
    return result;
}

static UniValue fundrewardpool(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 2) {
        throw std::runtime_error(
            "fundrewardpool poolid amount\n"
            "\nMove amount from the operator into the pool's reward balance. Operator only.\n"
            "\nResult:\n"
            "{\n"
            "  \"pool-id\": n,        (numeric) Pool id\n"
            "  \"new-balance\": n     (numeric) Reward balance after funding\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("fundrewardpool", "1, 100000000")
        );
    }

    LedgerContext& context = EnsureLedgerContext(request);
    const uint64_t nPoolId = ParsePoolId(request.params[0]);
    const CAmount nAmount = AmountFromValue(request.params[1]);

    CValidationState vstate;
    LedgerEvents events;
    ThrowIfInvalid(ApplyFundRewardPool(context.state, *context.view, CallContextFromRequest(request), nPoolId, nAmount, vstate, events), vstate);
    PublishEvents(request, events);

    UniValue result(UniValue::VOBJ);
    result.pushKV("pool-id", nPoolId);
    result.pushKV("new-balance", RequirePool(context, nPoolId).nRewardPoolBalance);
    return result;
}

typedef bool (*PoolLifecycleFn)(LedgerState&, const CCallContext&, uint64_t, CValidationState&, LedgerEvents&);

static UniValue ApplyPoolLifecycle(const JSONRPCRequest& request, PoolLifecycleFn fn)
{
    LedgerContext& context = EnsureLedgerContext(request);
    const uint64_t nPoolId = ParsePoolId(request.params[0]);

    CValidationState vstate;
    LedgerEvents events;
    ThrowIfInvalid(fn(context.state, CallContextFromRequest(request), nPoolId, vstate, events), vstate);
    PublishEvents(request, events);

    UniValue result(UniValue::VOBJ);
    result.pushKV("pool-id", nPoolId);
    result.pushKV("status", PoolStatusToString(RequirePool(context, nPoolId).GetEffectiveStatus(request.nTime)));
    return result;
}

static UniValue pausepool(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "pausepool poolid\n"
            "\nStop deposits and compounding on an active pool. Operator only.\n"
            "\nExamples:\n"
            + HelpExampleCli("pausepool", "1")
        );
    }
    return ApplyPoolLifecycle(request, &ApplyPausePool);
}

static UniValue resumepool(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "resumepool poolid\n"
            "\nReactivate a paused pool. Operator only.\n"
            "\nExamples:\n"
            + HelpExampleCli("resumepool", "1")
        );
    }
    return ApplyPoolLifecycle(request, &ApplyResumePool);
}

static UniValue endpool(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "endpool poolid\n"
            "\nClose a pool permanently. Stakers can still claim and withdraw. Operator only.\n"
            "\nExamples:\n"
            + HelpExampleCli("endpool", "1")
        );
    }
    return ApplyPoolLifecycle(request, &ApplyEndPool);
}

static UniValue setloyaltyenabled(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "setloyaltyenabled enabled\n"
            "\nSwitch the loyalty program (claimwithtierbonus) on or off. Operator only.\n"
            "\nExamples:\n"
            + HelpExampleCli("setloyaltyenabled", "false")
        );
    }

    RPCTypeCheckArgument(request.params[0], UniValue::VBOOL);
    LedgerContext& context = EnsureLedgerContext(request);
    const bool fEnabled = request.params[0].get_bool();

    CValidationState vstate;
    ThrowIfInvalid(ApplySetLoyaltyEnabled(context.state, CallContextFromRequest(request), fEnabled, vstate), vstate);

    UniValue result(UniValue::VOBJ);
    result.pushKV("loyalty-enabled", context.state.global.fLoyaltyEnabled);
    return result;
}

static UniValue gettierbenefits(const JSONRPCRequest& request);

static UniValue initializetierbenefits(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "initializetierbenefits [{\"name\":..., \"reward-bonus-bps\":n, \"fee-discount-bps\":n, \"min-days-staked\":n}, ...]\n"
            "\nInstall the benefit table of the four tiers (bronze, silver, gold, platinum). Operator only, once.\n"
            "\nExamples:\n"
            + HelpExampleCli("initializetierbenefits", "[{\"name\":\"Bronze\",\"reward-bonus-bps\":0,\"fee-discount-bps\":0,\"min-days-staked\":0}, ...]")
        );
    }

    RPCTypeCheckArgument(request.params[0], UniValue::VARR);
    LedgerContext& context = EnsureLedgerContext(request);

    const UniValue& arr = request.params[0];
    if (arr.size() != TIER_COUNT) {
        throw JSONRPCError(RPC_INVALID_PARAMETER, strprintf("Expected %d tier entries, got %d", TIER_COUNT, arr.size()));
    }

    TierBenefitTable table;
    for (size_t i = 0; i < arr.size(); ++i) {
        const UniValue& entry = arr[i];
        if (!entry.isObject()) {
            throw JSONRPCError(RPC_TYPE_ERROR, strprintf("Tier entry %d is not an object", i));
        }
        const UniValue& name = find_value(entry, "name");
        const UniValue& bonus = find_value(entry, "reward-bonus-bps");
        const UniValue& discount = find_value(entry, "fee-discount-bps");
        const UniValue& minDays = find_value(entry, "min-days-staked");
        if (!name.isStr() || !bonus.isNum() || !discount.isNum() || !minDays.isNum()) {
            throw JSONRPCError(RPC_INVALID_PARAMETER, strprintf("Tier entry %d is incomplete", i));
        }
        table[i] = CTierBenefit(name.get_str(), bonus.get_int64(), discount.get_int64(), minDays.get_int64());
    }

    CValidationState vstate;
    ThrowIfInvalid(ApplyInitializeTierBenefits(context.state, CallContextFromRequest(request), table, vstate), vstate);

    return gettierbenefits(request);
}

// ============================================================================
// Staker calls
// ============================================================================

static UniValue deposit(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 2) {
        throw std::runtime_error(
            "deposit poolid amount\n"
            "\nStake amount into a pool. A top-up restarts the lock period.\n"
            "\nResult:\n"
            "{\n"
            "  \"total-stake\": n     (numeric) Position amount after the deposit\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("deposit", "1, 10000000")
            + HelpExampleRpc("deposit", "1, 10000000")
        );
    }

    LedgerContext& context = EnsureLedgerContext(request);
    const uint64_t nPoolId = ParsePoolId(request.params[0]);
    const CAmount nAmount = AmountFromValue(request.params[1]);

    CValidationState vstate;
    LedgerEvents events;
    CAmount nNewTotal = 0;
    ThrowIfInvalid(ApplyDeposit(context.state, *context.view, CallContextFromRequest(request), nPoolId, nAmount, vstate, events, nNewTotal), vstate);
    PublishEvents(request, events);

    UniValue result(UniValue::VOBJ);
    result.pushKV("total-stake", nNewTotal);
    return result;
}

static UniValue withdraw(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 2) {
        throw std::runtime_error(
            "withdraw poolid amount\n"
            "\nWithdraw stake. Before unlock this is an early exit with a 5% penalty;\n"
            "after unlock a completed cooldown is required.\n"
            "\nResult:\n"
            "{\n"
            "  \"net-amount\": n      (numeric) Amount paid out after the penalty\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("withdraw", "1, 10000000")
        );
    }

    LedgerContext& context = EnsureLedgerContext(request);
    const uint64_t nPoolId = ParsePoolId(request.params[0]);
    const CAmount nAmount = AmountFromValue(request.params[1]);

    CValidationState vstate;
    LedgerEvents events;
    CAmount nNet = 0;
    ThrowIfInvalid(ApplyWithdraw(context.state, *context.view, CallContextFromRequest(request), nPoolId, nAmount, vstate, events, nNet), vstate);
    PublishEvents(request, events);

    UniValue result(UniValue::VOBJ);
    result.pushKV("net-amount", nNet);
    return result;
}

static UniValue claim(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "claim poolid\n"
            "\nPay out pending rewards less the 10% reward fee.\n"
            "\nResult:\n"
            "{\n"
            "  \"gross-rewards\": n,  (numeric) Pending rewards\n"
            "  \"fee\": n,            (numeric) Reward fee\n"
            "  \"net-rewards\": n     (numeric) Amount paid to the staker\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("claim", "1")
        );
    }

    LedgerContext& context = EnsureLedgerContext(request);
    const uint64_t nPoolId = ParsePoolId(request.params[0]);

    CValidationState vstate;
    LedgerEvents events;
    CClaimResult claimResult;
    ThrowIfInvalid(ApplyClaim(context.state, *context.view, CallContextFromRequest(request), nPoolId, vstate, events, claimResult), vstate);
    PublishEvents(request, events);

    return ClaimResultToJSON(claimResult);
}

static UniValue claimwithtierbonus(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "claimwithtierbonus poolid\n"
            "\nClaim with the bonus and fee discount of the position's current loyalty tier.\n"
            "\nResult:\n"
            "{\n"
            "  \"gross-rewards\": n,  (numeric) Pending rewards plus tier bonus\n"
            "  \"fee\": n,            (numeric) Discounted reward fee\n"
            "  \"net-rewards\": n,    (numeric) Amount paid to the staker\n"
            "  \"tier-bonus\": n,     (numeric) Bonus added by the tier\n"
            "  \"fee-discount\": n    (numeric) Fee waived by the tier\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("claimwithtierbonus", "1")
        );
    }

    LedgerContext& context = EnsureLedgerContext(request);
    const uint64_t nPoolId = ParsePoolId(request.params[0]);

    CValidationState vstate;
    LedgerEvents events;
    CClaimResult claimResult;
    ThrowIfInvalid(ApplyClaimWithTierBonus(context.state, *context.view, CallContextFromRequest(request), nPoolId, vstate, events, claimResult), vstate);
    PublishEvents(request, events);

    UniValue result = ClaimResultToJSON(claimResult);
    result.pushKV("tier-bonus", claimResult.nTierBonus);
    result.pushKV("fee-discount", claimResult.nFeeDiscount);
    return result;
}

static UniValue compound(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "compound poolid\n"
            "\nAdd pending rewards, less the reward fee, to the staked amount.\n"
            "\nExamples:\n"
            + HelpExampleCli("compound", "1")
        );
    }

    LedgerContext& context = EnsureLedgerContext(request);
    const uint64_t nPoolId = ParsePoolId(request.params[0]);

    CValidationState vstate;
    LedgerEvents events;
    CClaimResult claimResult;
    ThrowIfInvalid(ApplyCompound(context.state, *context.view, CallContextFromRequest(request), nPoolId, vstate, events, claimResult), vstate);
    PublishEvents(request, events);

    UniValue result = ClaimResultToJSON(claimResult);
    result.pushKV("new-stake-amount", RequirePosition(context, nPoolId, request.caller).nAmount);
    return result;
}

static UniValue startcooldown(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "startcooldown poolid\n"
            "\nStart the withdrawal cooldown of an unlocked position.\n"
            "\nResult:\n"
            "{\n"
            "  \"cooldown-ends\": n   (numeric) Time from which withdrawal is allowed\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("startcooldown", "1")
        );
    }

    LedgerContext& context = EnsureLedgerContext(request);
    const uint64_t nPoolId = ParsePoolId(request.params[0]);

    CValidationState vstate;
    LedgerEvents events;
    ThrowIfInvalid(ApplyStartCooldown(context.state, CallContextFromRequest(request), nPoolId, vstate, events), vstate);
    PublishEvents(request, events);

    const CStakePosition& position = RequirePosition(context, nPoolId, request.caller);
    UniValue result(UniValue::VOBJ);
    result.pushKV("cooldown-ends", ledger_cooldown::GetCooldownEnd(position, RequirePool(context, nPoolId)));
    return result;
}

static UniValue checkandupgradetier(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "checkandupgradetier poolid\n"
            "\nRecord the loyalty tier reached by the caller's position. Never downgrades.\n"
            "\nResult:\n"
            "{\n"
            "  \"tier\": \"name\"       (string) Recorded tier\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("checkandupgradetier", "1")
        );
    }

    LedgerContext& context = EnsureLedgerContext(request);
    const uint64_t nPoolId = ParsePoolId(request.params[0]);

    CValidationState vstate;
    LedgerEvents events;
    LoyaltyTier tier = LoyaltyTier::BRONZE;
    ThrowIfInvalid(ApplyCheckAndUpgradeTier(context.state, CallContextFromRequest(request), nPoolId, vstate, events, tier), vstate);
    PublishEvents(request, events);

    UniValue result(UniValue::VOBJ);
    result.pushKV("tier", TierToString(tier));
    return result;
}

// ============================================================================
// Queries
// ============================================================================

static UniValue getpool(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "getpool poolid\n"
            "\nReturns a pool definition and its aggregates.\n"
            "\nExamples:\n"
            + HelpExampleCli("getpool", "1")
        );
    }

    const LedgerContext& context = EnsureLedgerContext(request);
    return PoolToJSON(RequirePool(context, ParsePoolId(request.params[0])), request.nTime);
}

static UniValue getposition(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 2) {
        throw std::runtime_error(
            "getposition poolid \"staker\"\n"
            "\nReturns a stake position, with pending rewards and live tier at the request time.\n"
            "\nExamples:\n"
            + HelpExampleCli("getposition", "1, \"alice\"")
        );
    }

    RPCTypeCheckArgument(request.params[1], UniValue::VSTR);
    const LedgerContext& context = EnsureLedgerContext(request);
    const uint64_t nPoolId = ParsePoolId(request.params[0]);
    const CStakingPool& pool = RequirePool(context, nPoolId);
    return PositionToJSON(RequirePosition(context, nPoolId, request.params[1].get_str()), pool, request.nTime);
}

static UniValue getuserstats(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "getuserstats \"staker\"\n"
            "\nReturns the staker's totals across all pools (all zero for an unknown staker).\n"
            "\nExamples:\n"
            + HelpExampleCli("getuserstats", "\"alice\"")
        );
    }

    RPCTypeCheckArgument(request.params[0], UniValue::VSTR);
    const LedgerContext& context = EnsureLedgerContext(request);
    Optional<CUserStats> stats = context.state.stakes.ReadUserStats(request.params[0].get_str());
    return UserStatsToJSON(stats ? *stats : CUserStats());
}

static UniValue getprotocolstats(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 0) {
        throw std::runtime_error(
            "getprotocolstats\n"
            "\nReturns protocol wide aggregates.\n"
            "\nResult:\n"
            "{\n"
            "  \"total-pools\": n,           (numeric) Pools ever created\n"
            "  \"total-staked\": n,          (numeric) Principal across all pools\n"
            "  \"total-rewards-paid\": n,    (numeric) Net rewards paid or compounded\n"
            "  \"total-fees-collected\": n,  (numeric) Reward fees and penalties\n"
            "  \"total-stakers\": n,         (numeric) Distinct stakers\n"
            "  \"total-tier-upgrades\": n,   (numeric) Recorded tier upgrades\n"
            "  \"loyalty-enabled\": true|false,\n"
            "  \"invariants-ok\": true|false (boolean) Accounting and custody checks\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("getprotocolstats", "")
        );
    }

    const LedgerContext& context = EnsureLedgerContext(request);
    const LedgerGlobalState& global = context.state.global;

    UniValue result(UniValue::VOBJ);
    result.pushKV("total-pools", global.nTotalPools);
    result.pushKV("total-staked", global.nTotalStaked);
    result.pushKV("total-rewards-paid", global.nTotalRewardsPaid);
    result.pushKV("total-fees-collected", global.nTotalFeesCollected);
    result.pushKV("total-stakers", global.nTotalStakers);
    result.pushKV("total-tier-upgrades", global.nTotalTierUpgrades);
    result.pushKV("loyalty-enabled", global.fLoyaltyEnabled);
    result.pushKV("invariants-ok", VerifyLedgerState(context));
    return result;
}

static UniValue gettierinfo(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 2) {
        throw std::runtime_error(
            "gettierinfo poolid \"staker\"\n"
            "\nReturns the live and recorded loyalty tier of a position.\n"
            "\nResult:\n"
            "{\n"
            "  \"live-tier\": \"name\",       (string) Tier from the current staking duration\n"
            "  \"days-staked\": n,          (numeric) Whole days since the last deposit\n"
            "  \"recorded-tier\": \"name\",   (string) Ratcheted tier, bronze when never recorded\n"
            "  \"achieved-at\": n,          (numeric) Time the recorded tier was reached\n"
            "  \"total-bonus\": n,          (numeric) Tier bonus paid so far\n"
            "  \"total-fee-discount\": n,   (numeric) Fee discount consumed so far\n"
            "  \"last-check\": n,           (numeric) Time of the last tier check\n"
            "  \"benefit\": {...}           (object) Benefits of the live tier\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("gettierinfo", "1, \"alice\"")
        );
    }

    RPCTypeCheckArgument(request.params[1], UniValue::VSTR);
    const LedgerContext& context = EnsureLedgerContext(request);
    const uint64_t nPoolId = ParsePoolId(request.params[0]);
    const std::string staker = request.params[1].get_str();
    RequirePool(context, nPoolId);
    const CStakePosition& position = RequirePosition(context, nPoolId, staker);

    const LoyaltyTier liveTier = ledger_tier::GetLiveTier(position, request.nTime);
    Optional<CLoyaltyTierRecord> record = context.state.tiers.ReadRecord(nPoolId, staker);
    const CLoyaltyTierRecord entry = record ? *record : CLoyaltyTierRecord();

    UniValue result(UniValue::VOBJ);
    result.pushKV("live-tier", TierToString(liveTier));
    result.pushKV("days-staked", (request.nTime - position.nStakedAt) / ledger_params::SECONDS_PER_DAY);
    result.pushKV("recorded-tier", TierToString(entry.tier));
    result.pushKV("achieved-at", entry.nAchievedAt);
    result.pushKV("total-bonus", entry.nTotalBonus);
    result.pushKV("total-fee-discount", entry.nTotalFeeDiscount);
    result.pushKV("last-check", entry.nLastCheck);
    result.pushKV("benefit", BenefitToJSON(context.state.tiers.GetBenefit(liveTier)));
    return result;
}

static UniValue gettierbenefits(const JSONRPCRequest& request)
{
    if (request.fHelp) {
        throw std::runtime_error(
            "gettierbenefits\n"
            "\nReturns the benefit table of the loyalty tiers.\n"
            "\nExamples:\n"
            + HelpExampleCli("gettierbenefits", "")
        );
    }

    const LedgerContext& context = EnsureLedgerContext(request);

    UniValue tiers(UniValue::VARR);
    for (const CTierBenefit& benefit : context.state.tiers.GetBenefits()) {
        tiers.push_back(BenefitToJSON(benefit));
    }

    UniValue result(UniValue::VOBJ);
    result.pushKV("initialized", context.state.tiers.BenefitsInitialized());
    result.pushKV("tiers", tiers);
    return result;
}

static UniValue getpendingrewards(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 2) {
        throw std::runtime_error(
            "getpendingrewards poolid \"staker\"\n"
            "\nReturns the rewards a claim would pay before fees (0 without a position).\n"
            "\nExamples:\n"
            + HelpExampleCli("getpendingrewards", "1, \"alice\"")
        );
    }

    RPCTypeCheckArgument(request.params[1], UniValue::VSTR);
    const LedgerContext& context = EnsureLedgerContext(request);
    const uint64_t nPoolId = ParsePoolId(request.params[0]);
    const CStakingPool& pool = RequirePool(context, nPoolId);

    const CStakePosition* position = context.state.stakes.LookupPosition(nPoolId, request.params[1].get_str());
    if (!position) {
        return UniValue((int64_t)0);
    }
    return UniValue(ledger_yield::GetPendingRewards(*position, pool, request.nTime));
}

static UniValue getcooldownstatus(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 2) {
        throw std::runtime_error(
            "getcooldownstatus poolid \"staker\"\n"
            "\nReturns where a position stands in the lock and cooldown sequence.\n"
            "\nResult:\n"
            "{\n"
            "  \"phase\": \"name\",        (string) locked, unlocked, cooldown-pending or withdrawable\n"
            "  \"unlock-time\": n,       (numeric) End of the lock period\n"
            "  \"cooldown-start\": n,    (numeric) Cooldown start, null when not started\n"
            "  \"cooldown-ends\": n,     (numeric) Cooldown completion, null when not started\n"
            "  \"can-withdraw\": true|false, (boolean) Penalty free withdrawal allowed now\n"
            "  \"can-exit-early\": true|false (boolean) Penalised early exit available\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("getcooldownstatus", "1, \"alice\"")
        );
    }

    RPCTypeCheckArgument(request.params[1], UniValue::VSTR);
    const LedgerContext& context = EnsureLedgerContext(request);
    const uint64_t nPoolId = ParsePoolId(request.params[0]);
    const CStakingPool& pool = RequirePool(context, nPoolId);
    const CStakePosition& position = RequirePosition(context, nPoolId, request.params[1].get_str());

    const CooldownPhase phase = ledger_cooldown::GetCooldownPhase(position, pool, request.nTime);

    UniValue result(UniValue::VOBJ);
    result.pushKV("phase", ledger_cooldown::CooldownPhaseToString(phase));
    result.pushKV("unlock-time", position.nUnlockTime);
    result.pushKV("cooldown-start", position.nCooldownStart ? UniValue(*position.nCooldownStart) : NullUniValue);
    result.pushKV("cooldown-ends", position.nCooldownStart ? UniValue(ledger_cooldown::GetCooldownEnd(position, pool)) : NullUniValue);
    result.pushKV("can-withdraw", phase == CooldownPhase::WITHDRAWABLE);
    result.pushKV("can-exit-early", phase == CooldownPhase::LOCKED);
    return result;
}

static UniValue calculaterewardfee(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "calculaterewardfee amount\n"
            "\nReturns the 10% reward fee charged on amount.\n"
            "\nExamples:\n"
            + HelpExampleCli("calculaterewardfee", "100000000")
        );
    }
    return UniValue(ledger_fee::CalculateRewardFee(AmountFromValue(request.params[0])));
}

static UniValue calculateearlywithdrawalfee(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "calculateearlywithdrawalfee amount\n"
            "\nReturns the 5% penalty of an early exit of amount.\n"
            "\nExamples:\n"
            + HelpExampleCli("calculateearlywithdrawalfee", "100000000")
        );
    }
    return UniValue(ledger_fee::CalculateEarlyWithdrawalPenalty(AmountFromValue(request.params[0])));
}

static UniValue gettierforduration(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "gettierforduration seconds\n"
            "\nReturns the loyalty tier of a continuous staking duration.\n"
            "\nExamples:\n"
            + HelpExampleCli("gettierforduration", "2592000")
        );
    }
    RPCTypeCheckArgument(request.params[0], UniValue::VNUM);
    return TierToString(ledger_tier::GetTierForDuration(request.params[0].get_int64()));
}

static UniValue getbalance(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "getbalance \"account\"\n"
            "\nReturns the value ledger balance of an account.\n"
            "\nExamples:\n"
            + HelpExampleCli("getbalance", "\"alice\"")
        );
    }
    RPCTypeCheckArgument(request.params[0], UniValue::VSTR);
    const LedgerContext& context = EnsureLedgerContext(request);
    return UniValue(context.view->GetBalance(request.params[0].get_str()));
}

// ============================================================================
// RPC Command Registration
// ============================================================================

static const CRPCCommand commands[] = {
    //  category    name                            actor (function)                okSafe  argNames
    //  ----------- ------------------------------  ------------------------------  ------  ----------
    { "ledger",     "createpool",                   &createpool,                    false,  {"name", "rate", "minstake", "lockperiod", "cooldownperiod", "duration"} },
    { "ledger",     "fundrewardpool",               &fundrewardpool,                false,  {"poolid", "amount"} },
    { "ledger",     "pausepool",                    &pausepool,                     false,  {"poolid"} },
    { "ledger",     "resumepool",                   &resumepool,                    false,  {"poolid"} },
    { "ledger",     "endpool",                      &endpool,                       false,  {"poolid"} },
    { "ledger",     "setloyaltyenabled",            &setloyaltyenabled,             false,  {"enabled"} },
    { "ledger",     "initializetierbenefits",       &initializetierbenefits,        false,  {"benefits"} },
    { "ledger",     "deposit",                      &deposit,                       false,  {"poolid", "amount"} },
    { "ledger",     "withdraw",                     &withdraw,                      false,  {"poolid", "amount"} },
    { "ledger",     "claim",                        &claim,                         false,  {"poolid"} },
    { "ledger",     "claimwithtierbonus",           &claimwithtierbonus,            false,  {"poolid"} },
    { "ledger",     "compound",                     &compound,                      false,  {"poolid"} },
    { "ledger",     "startcooldown",                &startcooldown,                 false,  {"poolid"} },
    { "ledger",     "checkandupgradetier",          &checkandupgradetier,           false,  {"poolid"} },
    { "query",      "getpool",                      &getpool,                       true,   {"poolid"} },
    { "query",      "getposition",                  &getposition,                   true,   {"poolid", "staker"} },
    { "query",      "getuserstats",                 &getuserstats,                  true,   {"staker"} },
    { "query",      "getprotocolstats",             &getprotocolstats,              true,   {} },
    { "query",      "gettierinfo",                  &gettierinfo,                   true,   {"poolid", "staker"} },
    { "query",      "gettierbenefits",              &gettierbenefits,               true,   {} },
    { "query",      "getpendingrewards",            &getpendingrewards,             true,   {"poolid", "staker"} },
    { "query",      "getcooldownstatus",            &getcooldownstatus,             true,   {"poolid", "staker"} },
    { "query",      "calculaterewardfee",           &calculaterewardfee,            true,   {"amount"} },
    { "query",      "calculateearlywithdrawalfee",  &calculateearlywithdrawalfee,   true,   {"amount"} },
    { "query",      "gettierforduration",           &gettierforduration,            true,   {"seconds"} },
    { "query",      "getbalance",                   &getbalance,                    true,   {"account"} },
};

void RegisterLedgerRPCCommands(CRPCTable& t)
{
    for (const CRPCCommand& command : commands)
        t.appendCommand(command.name, &command);
}
