// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKELEDGER_RPC_PROTOCOL_H
#define STAKELEDGER_RPC_PROTOCOL_H

#include <string>

#include <univalue.h>

//! Error codes of the call surface. Ledger rejections use the LedgerError
//! numbering (23001..) directly.
enum RPCErrorCode {
    //! Standard JSON-RPC 2.0 errors
    RPC_INVALID_REQUEST  = -32600,
    RPC_METHOD_NOT_FOUND = -32601,
    RPC_INVALID_PARAMS   = -32602,
    RPC_INTERNAL_ERROR   = -32603,
    RPC_PARSE_ERROR      = -32700,

    //! General application defined errors
    RPC_MISC_ERROR           = -1,  //!< std::exception thrown in command handling
    RPC_TYPE_ERROR           = -3,  //!< Unexpected type was passed as parameter
    RPC_INVALID_PARAMETER    = -8,  //!< Invalid, missing or duplicate parameter
    RPC_LEDGER_NOT_AVAILABLE = -20, //!< No ledger attached to the request
};

UniValue JSONRPCError(int code, const std::string& message);
UniValue JSONRPCReplyObj(const UniValue& result, const UniValue& error, const UniValue& id);
std::string JSONRPCReply(const UniValue& result, const UniValue& error, const UniValue& id);

#endif // STAKELEDGER_RPC_PROTOCOL_H
