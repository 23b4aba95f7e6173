// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKELEDGER_RPC_SERVER_H
#define STAKELEDGER_RPC_SERVER_H

#include "amount.h"
#include "ledger/ledger_events.h"
#include "rpc/protocol.h"

#include <list>
#include <map>
#include <stdint.h>
#include <string>
#include <vector>

#include <univalue.h>

struct LedgerContext;

/**
 * JSONRPCRequest - one call against the ledger
 *
 * caller and nTime are the identity and clock value supplied by the
 * surrounding environment. Events of a committed call are appended to
 * *events when it is set.
 */
class JSONRPCRequest
{
public:
    UniValue id;
    std::string strMethod;
    UniValue params;
    bool fHelp;
    std::string caller;
    int64_t nTime;
    LedgerContext* context;
    LedgerEvents* events;

    JSONRPCRequest() : id(NullUniValue), params(NullUniValue), fHelp(false), nTime(0), context(nullptr), events(nullptr) {}

    /**
     * Read {"method", "params", "caller", "time", "id"}; a missing time
     * is taken from the system clock.
     */
    void parse(const UniValue& valRequest);
};

typedef UniValue (*rpcfn_type)(const JSONRPCRequest& jsonRequest);

class CRPCCommand
{
public:
    std::string category;
    std::string name;
    rpcfn_type actor;
    bool okSafeMode;
    std::vector<std::string> argNames;
};

/**
 * Ledger call dispatcher.
 */
class CRPCTable
{
private:
    std::map<std::string, const CRPCCommand*> mapCommands;

public:
    CRPCTable();
    const CRPCCommand* operator[](const std::string& name) const;
    std::string help(const std::string& name) const;

    /**
     * Execute a method.
     * @param request The JSONRPCRequest to execute
     * @returns Result of the call.
     * @throws an exception (UniValue) when an error happens.
     */
    UniValue execute(const JSONRPCRequest& request) const;

    /**
     * Returns a list of registered commands
     * @returns List of registered commands.
     */
    std::vector<std::string> listCommands() const;

    /**
     * Appends a CRPCCommand to the dispatch table.
     * Returns false if RPC server is already running (dump concurrency protection).
     * Commands cannot be overwritten (returns false).
     */
    bool appendCommand(const std::string& name, const CRPCCommand* pcmd);
};

extern CRPCTable tableRPC;

/**
 * Type-check arguments; throws JSONRPCError if wrong type given. Does not check that
 * the right number of arguments are passed, just that any passed are the correct type.
 */
void RPCTypeCheck(const UniValue& params, const std::list<UniValue::VType>& typesExpected, bool fAllowNull = false);

/**
 * Type-check one argument; throws JSONRPCError if wrong type given.
 */
void RPCTypeCheckArgument(const UniValue& value, UniValue::VType typeExpected);

/** Non-negative integer parameter that fits a uint64 id */
uint64_t ParsePoolId(const UniValue& value);

/** Integer amount parameter; outside the money range it fails with the ledger INVALID_AMOUNT code */
CAmount AmountFromValue(const UniValue& value);

std::string HelpExampleCli(const std::string& methodname, const std::string& args);
std::string HelpExampleRpc(const std::string& methodname, const std::string& args);

#endif // STAKELEDGER_RPC_SERVER_H
