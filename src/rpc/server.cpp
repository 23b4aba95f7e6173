// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/server.h"

#include "ledger/ledger_error.h"
#include "logging.h"
#include "util/system.h"

#include <algorithm>
#include <set>
#include <unordered_map>

#include <boost/algorithm/string/case_conv.hpp>

CRPCTable tableRPC;

void RPCTypeCheck(const UniValue& params, const std::list<UniValue::VType>& typesExpected, bool fAllowNull)
{
    unsigned int i = 0;
    for (UniValue::VType t : typesExpected) {
        if (params.size() <= i)
            break;

        const UniValue& v = params[i];
        if (!(fAllowNull && v.isNull())) {
            RPCTypeCheckArgument(v, t);
        }
        i++;
    }
}

void RPCTypeCheckArgument(const UniValue& value, UniValue::VType typeExpected)
{
    if (value.type() != typeExpected) {
        throw JSONRPCError(RPC_TYPE_ERROR, strprintf("Expected type %s, got %s", uvTypeName(typeExpected), uvTypeName(value.type())));
    }
}

uint64_t ParsePoolId(const UniValue& value)
{
    RPCTypeCheckArgument(value, UniValue::VNUM);
    int64_t n = value.get_int64();
    if (n < 0)
        throw JSONRPCError(RPC_INVALID_PARAMETER, "Invalid pool id");
    return static_cast<uint64_t>(n);
}

CAmount AmountFromValue(const UniValue& value)
{
    if (!value.isNum() && !value.isStr())
        throw JSONRPCError(RPC_TYPE_ERROR, "Amount is not a number or string");
    int64_t n = 0;
    if (value.isNum()) {
        n = value.get_int64();
    } else {
        UniValue parsed;
        if (!parsed.read(value.get_str()) || !parsed.isNum())
            throw JSONRPCError(RPC_TYPE_ERROR, "Invalid amount");
        n = parsed.get_int64();
    }
    if (!MoneyRange(n))
        throw JSONRPCError(static_cast<int>(LedgerError::INVALID_AMOUNT),
                           strprintf("%s: bad-amount-range (%d)", LedgerErrorString(LedgerError::INVALID_AMOUNT), n));
    return n;
}

std::string HelpExampleCli(const std::string& methodname, const std::string& args)
{
    return "> echo '{\"method\":\"" + methodname + "\",\"params\":[" + args + "],\"caller\":\"alice\"}' | stakeledgerd\n";
}

std::string HelpExampleRpc(const std::string& methodname, const std::string& args)
{
    return "> {\"id\":1, \"method\":\"" + methodname + "\", \"params\":[" + args + "], \"caller\":\"alice\", \"time\":1700000000}\n";
}

// ============================================================================
// help
// ============================================================================

std::string CRPCTable::help(const std::string& strCommand) const
{
    std::string strRet;
    std::string category;
    std::set<rpcfn_type> setDone;
    std::vector<std::pair<std::string, const CRPCCommand*> > vCommands;

    for (const auto& entry : mapCommands)
        vCommands.push_back(std::make_pair(entry.second->category + entry.first, entry.second));
    std::sort(vCommands.begin(), vCommands.end());

    JSONRPCRequest jreq;
    jreq.fHelp = true;
    for (const auto& command : vCommands) {
        const CRPCCommand* pcmd = command.second;
        std::string strMethod = pcmd->name;
        if ((strCommand != "" || pcmd->category == "hidden") && strMethod != strCommand)
            continue;
        jreq.strMethod = strMethod;
        try {
            rpcfn_type pfn = pcmd->actor;
            if (setDone.insert(pfn).second)
                (*pfn)(jreq);
        } catch (const std::exception& e) {
            // Help text is returned in an exception
            std::string strHelp = std::string(e.what());
            if (strCommand == "") {
                if (strHelp.find('\n') != std::string::npos)
                    strHelp = strHelp.substr(0, strHelp.find('\n'));

                if (category != pcmd->category) {
                    if (!category.empty())
                        strRet += "\n";
                    category = pcmd->category;
                    std::string firstLetter = category.substr(0, 1);
                    boost::to_upper(firstLetter);
                    strRet += "== " + firstLetter + category.substr(1) + " ==\n";
                }
            }
            strRet += strHelp + "\n";
        }
    }
    if (strRet == "")
        strRet = strprintf("help: unknown command: %s\n", strCommand);
    strRet = strRet.substr(0, strRet.size() - 1);
    return strRet;
}

static UniValue help(const JSONRPCRequest& jsonRequest)
{
    if (jsonRequest.fHelp || jsonRequest.params.size() > 1)
        throw std::runtime_error(
            "help ( \"command\" )\n"
            "\nList all commands, or get help for a specified command.\n"
            "\nArguments:\n"
            "1. \"command\"     (string, optional) The command to get help on\n"
            "\nResult:\n"
            "\"text\"     (string) The help text\n");

    std::string strCommand;
    if (jsonRequest.params.size() > 0)
        strCommand = jsonRequest.params[0].get_str();

    return tableRPC.help(strCommand);
}

static const CRPCCommand vRPCCommands[] = {
    //  category    name                      actor (function)            okSafe  argNames
    //  ----------- ------------------------  ------------------------    ------  ----------
    { "control",    "help",                   &help,                      true,   {"command"} },
};

CRPCTable::CRPCTable()
{
    for (const CRPCCommand& cmd : vRPCCommands) {
        mapCommands[cmd.name] = &cmd;
    }
}

const CRPCCommand* CRPCTable::operator[](const std::string& name) const
{
    auto it = mapCommands.find(name);
    if (it == mapCommands.end())
        return nullptr;
    return it->second;
}

bool CRPCTable::appendCommand(const std::string& name, const CRPCCommand* pcmd)
{
    auto it = mapCommands.find(name);
    if (it != mapCommands.end())
        return false;

    mapCommands[name] = pcmd;
    return true;
}

std::vector<std::string> CRPCTable::listCommands() const
{
    std::vector<std::string> commandList;
    for (const auto& entry : mapCommands)
        commandList.push_back(entry.first);
    return commandList;
}

// ============================================================================
// Request parsing and dispatch
// ============================================================================

void JSONRPCRequest::parse(const UniValue& valRequest)
{
    if (!valRequest.isObject())
        throw JSONRPCError(RPC_INVALID_REQUEST, "Invalid Request object");
    const UniValue& request = valRequest.get_obj();

    id = find_value(request, "id");

    UniValue valMethod = find_value(request, "method");
    if (valMethod.isNull())
        throw JSONRPCError(RPC_INVALID_REQUEST, "Missing method");
    if (!valMethod.isStr())
        throw JSONRPCError(RPC_INVALID_REQUEST, "Method must be a string");
    strMethod = valMethod.get_str();

    UniValue valParams = find_value(request, "params");
    if (valParams.isArray() || valParams.isObject())
        params = valParams;
    else if (valParams.isNull())
        params = UniValue(UniValue::VARR);
    else
        throw JSONRPCError(RPC_INVALID_REQUEST, "Params must be an array or object");

    UniValue valCaller = find_value(request, "caller");
    if (valCaller.isStr())
        caller = valCaller.get_str();
    else if (!valCaller.isNull())
        throw JSONRPCError(RPC_INVALID_REQUEST, "Caller must be a string");

    UniValue valTime = find_value(request, "time");
    if (valTime.isNum())
        nTime = valTime.get_int64();
    else if (valTime.isNull())
        nTime = GetTime();
    else
        throw JSONRPCError(RPC_INVALID_REQUEST, "Time must be a number");

    LogPrint(BCLog::RPC, "ThreadRPCServer method=%s caller=%s time=%d\n", strMethod, caller, nTime);
}

/**
 * Process named arguments into a vector of positional arguments, based on the
 * argument names the command declares.
 */
static inline JSONRPCRequest transformNamedArguments(const JSONRPCRequest& in, const std::vector<std::string>& argNames)
{
    JSONRPCRequest out = in;
    out.params = UniValue(UniValue::VARR);
    // Build a map of parameters, and remove ones that have been processed, so that we can throw a focused error if
    // there is an unknown one.
    const std::vector<std::string>& keys = in.params.getKeys();
    const std::vector<UniValue>& values = in.params.getValues();
    std::unordered_map<std::string, const UniValue*> argsIn;
    for (size_t i = 0; i < keys.size(); ++i) {
        argsIn[keys[i]] = &values[i];
    }
    // Process expected parameters.
    int hole = 0;
    for (const std::string& argName : argNames) {
        auto fr = argsIn.find(argName);
        if (fr != argsIn.end()) {
            for (int i = 0; i < hole; ++i) {
                // Fill hole between specified parameters with JSON nulls,
                // but not at the end (for backwards compatibility with calls
                // that act based on number of specified parameters).
                out.params.push_back(UniValue());
            }
            hole = 0;
            out.params.push_back(*fr->second);
            argsIn.erase(fr);
        } else {
            hole += 1;
        }
    }
    // If there are still arguments in the argsIn map, this is an error.
    if (!argsIn.empty()) {
        throw JSONRPCError(RPC_INVALID_PARAMETER, "Unknown named parameter " + argsIn.begin()->first);
    }
    // Return request with named arguments transformed to positional arguments
    return out;
}

UniValue CRPCTable::execute(const JSONRPCRequest& request) const
{
    // Find method
    const CRPCCommand* pcmd = (*this)[request.strMethod];
    if (!pcmd)
        throw JSONRPCError(RPC_METHOD_NOT_FOUND, "Method not found");

    try {
        // Execute, convert arguments to array if necessary
        if (request.params.isObject()) {
            return pcmd->actor(transformNamedArguments(request, pcmd->argNames));
        } else {
            return pcmd->actor(request);
        }
    } catch (const std::exception& e) {
        throw JSONRPCError(RPC_MISC_ERROR, e.what());
    }
}
