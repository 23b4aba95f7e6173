// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/ledger_params.h"
#include "ledger/ledger_validation.h"
#include "logging.h"
#include "rpc/ledger.h"
#include "rpc/protocol.h"
#include "rpc/register.h"
#include "rpc/server.h"
#include "util/system.h"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include <univalue.h>

static std::string HelpMessage()
{
    std::string strUsage = "Usage:\n  stakeledgerd [options]\n\n";
    strUsage += "Reads one JSON request per line from stdin:\n";
    strUsage += "  {\"id\":..., \"method\":\"deposit\", \"params\":[1, 10000000], \"caller\":\"alice\", \"time\":1700000000}\n";
    strUsage += "and writes one JSON response per line to stdout.\n\nOptions:\n";
    strUsage += strprintf("  -conf=<file>            Specify configuration file (default: %s)\n", STAKELEDGER_CONF_FILENAME);
    strUsage += strprintf("  -operator=<id>          Designated operator (default: %s)\n", ledger_params::DEFAULT_OPERATOR);
    strUsage += strprintf("  -custody=<id>           Custody account (default: %s)\n", ledger_params::DEFAULT_CUSTODY);
    strUsage += strprintf("  -loyalty=<n>            Enable the loyalty program at startup (default: %u)\n", ledger_params::DEFAULT_LOYALTY_ENABLED);
    strUsage += "  -balance=<id>:<amount>  Initial value ledger balance (repeatable)\n";
    strUsage += strprintf("  -debug=<category>       Output debugging information (%s)\n", ListLogCategories());
    strUsage += "  -printtoconsole         Send log output to stderr\n";
    strUsage += strprintf("  -debuglogfile=<file>    Write log output to <file> (e.g. %s)\n", DEFAULT_DEBUGLOGFILE);
    strUsage += strprintf("  -logtimestamps          Prepend log output with timestamp (default: %u)\n", DEFAULT_LOGTIMESTAMPS);
    return strUsage;
}

static bool InitLogging()
{
    BCLog::Logger& logger = LogInstance();
    logger.m_print_to_console = gArgs.GetBoolArg("-printtoconsole", false);
    logger.m_log_timestamps = gArgs.GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);
    if (gArgs.IsArgSet("-debuglogfile")) {
        logger.m_print_to_file = true;
        logger.m_file_path = gArgs.GetArg("-debuglogfile", std::string(DEFAULT_DEBUGLOGFILE));
        if (!logger.OpenDebugLog()) {
            fprintf(stderr, "Error: could not open debug log file %s\n", logger.m_file_path.c_str());
            return false;
        }
    }

    for (const std::string& category : gArgs.GetArgs("-debug")) {
        if (category == "0" || category == "none") continue;
        if (!logger.EnableCategory(category)) {
            LogPrintf("Unsupported logging category -debug=%s.\n", category);
        }
    }
    return true;
}

/** Handle one request line; returns false when the ledger failed verification */
static bool ProcessRequestLine(LedgerContext& context, const std::string& strLine, std::string& strReply)
{
    JSONRPCRequest jreq;
    LedgerEvents events;
    jreq.context = &context;
    jreq.events = &events;

    UniValue reply;
    try {
        UniValue valRequest;
        if (!valRequest.read(strLine))
            throw JSONRPCError(RPC_PARSE_ERROR, "Parse error");

        jreq.parse(valRequest);
        UniValue result = tableRPC.execute(jreq);

        reply = JSONRPCReplyObj(result, NullUniValue, jreq.id);
        reply.pushKV("events", EventsToJSON(events));
    } catch (const UniValue& objError) {
        reply = JSONRPCReplyObj(NullUniValue, objError, jreq.id);
    } catch (const std::exception& e) {
        reply = JSONRPCReplyObj(NullUniValue, JSONRPCError(RPC_INTERNAL_ERROR, e.what()), jreq.id);
    }
    strReply = reply.write();

    if (!events.empty() && !VerifyLedgerState(context)) {
        LogPrintf("%s: ledger verification failed after %s\n", __func__, jreq.strMethod);
        return false;
    }
    return true;
}

int main(int argc, char* argv[])
{
    std::string error;
    if (!gArgs.ParseParameters(argc, argv, error)) {
        fprintf(stderr, "Error parsing command line arguments: %s\n", error.c_str());
        return EXIT_FAILURE;
    }

    if (gArgs.IsArgSet("-?") || gArgs.IsArgSet("-h") || gArgs.IsArgSet("-help")) {
        fprintf(stdout, "%s", HelpMessage().c_str());
        return EXIT_SUCCESS;
    }

    if (!gArgs.ReadConfigFile(gArgs.GetArg("-conf", std::string(STAKELEDGER_CONF_FILENAME)), error)) {
        fprintf(stderr, "Error reading configuration file: %s\n", error.c_str());
        return EXIT_FAILURE;
    }

    if (!InitLogging()) {
        return EXIT_FAILURE;
    }

    std::unique_ptr<LedgerContext> context = InitLedgerFromArgs(gArgs, error);
    if (!context) {
        fprintf(stderr, "Error: %s\n", error.c_str());
        return EXIT_FAILURE;
    }

    RegisterAllCoreRPCCommands(tableRPC);

    std::string strLine;
    while (std::getline(std::cin, strLine)) {
        if (strLine.find_first_not_of(" \t\r") == std::string::npos) continue;

        std::string strReply;
        const bool fOk = ProcessRequestLine(*context, strLine, strReply);
        std::cout << strReply << std::endl;
        if (!fOk) {
            LogPrintf("Shutdown: ledger state corrupt\n");
            return EXIT_FAILURE;
        }
    }

    LogPrintf("Shutdown: done\n");
    LogInstance().CloseDebugLog();
    return EXIT_SUCCESS;
}
