// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/ledger_events.h"

std::string FeeTypeToString(FeeType type)
{
    switch (type) {
    case FeeType::REWARD: return "reward-fee";
    case FeeType::EARLY_WITHDRAWAL: return "early-withdrawal";
    }
    return "unknown";
}

namespace {

class CEventNameVisitor : public boost::static_visitor<std::string>
{
public:
    std::string operator()(const PoolCreatedEvent&) const { return "pool-created"; }
    std::string operator()(const PoolFundedEvent&) const { return "pool-funded"; }
    std::string operator()(const PoolStatusEvent& ev) const
    {
        switch (ev.kind) {
        case PoolStatusEvent::PAUSED: return "pool-paused";
        case PoolStatusEvent::RESUMED: return "pool-resumed";
        case PoolStatusEvent::ENDED: return "pool-ended";
        }
        return "pool-status";
    }
    std::string operator()(const StakeDepositedEvent&) const { return "stake-deposited"; }
    std::string operator()(const StakeWithdrawnEvent&) const { return "stake-withdrawn"; }
    std::string operator()(const RewardsClaimedEvent&) const { return "rewards-claimed"; }
    std::string operator()(const RewardsCompoundedEvent&) const { return "rewards-compounded"; }
    std::string operator()(const FeeCollectedEvent&) const { return "fee-collected"; }
    std::string operator()(const CooldownStartedEvent&) const { return "cooldown-started"; }
    std::string operator()(const TierUpgradedEvent&) const { return "tier-upgraded"; }
    std::string operator()(const TierInitializedEvent&) const { return "tier-initialized"; }
};

class CEventPoolVisitor : public boost::static_visitor<uint64_t>
{
public:
    template <typename Event>
    uint64_t operator()(const Event& ev) const { return ev.nPoolId; }
};

} // namespace

std::string GetEventName(const CLedgerEvent& event)
{
    return boost::apply_visitor(CEventNameVisitor(), event);
}

uint64_t GetEventPoolId(const CLedgerEvent& event)
{
    return boost::apply_visitor(CEventPoolVisitor(), event);
}
