// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKELEDGER_UTIL_STRPRINTF_H
#define STAKELEDGER_UTIL_STRPRINTF_H

#include <stdexcept>

// Report malformed format strings as exceptions instead of asserting.
#ifndef TINYFORMAT_ERROR
#define TINYFORMAT_ERROR(reason) throw std::runtime_error(reason)
#endif

#include <tinyformat.h>

/** Format arguments and return the string or write to given std::ostream (see tinyformat::format doc for details) */
#define strprintf tfm::format

#endif // STAKELEDGER_UTIL_STRPRINTF_H
