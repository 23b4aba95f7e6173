// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Server/client environment: argument handling, config file parsing,
 * time and error helpers
 */
#ifndef STAKELEDGER_UTIL_SYSTEM_H
#define STAKELEDGER_UTIL_SYSTEM_H

#include "logging.h"

#include <istream>
#include <map>
#include <mutex>
#include <stdint.h>
#include <string>
#include <vector>

extern const char * const STAKELEDGER_CONF_FILENAME;

/** Seconds since the epoch, from the system clock */
int64_t GetTime();

template<typename... Args>
bool error(const char* fmt, const Args&... args)
{
    LogPrintf("ERROR: %s\n", tfm::format(fmt, args...));
    return false;
}

/** Interpret "", "1", "true" as true and "0", "false" as false */
bool InterpretBool(const std::string& strValue);

class ArgsManager
{
protected:
    mutable std::mutex cs_args;
    std::map<std::string, std::vector<std::string>> m_override_args;
    std::map<std::string, std::vector<std::string>> m_config_args;

    bool GetArgValue(const std::string& strArg, std::string& strValue) const;

public:
    /**
     * Parse "-key=value" style command line arguments. "-nokey" is stored
     * as "-key=0". Positional arguments are rejected.
     */
    bool ParseParameters(int argc, const char* const argv[], std::string& error);

    /**
     * Read "key=value" lines. Lines starting with '#' and blank lines are
     * ignored. Command line values take precedence over config values.
     */
    bool ReadConfigStream(std::istream& stream, std::string& error);
    bool ReadConfigFile(const std::string& path, std::string& error);

    /**
     * Return a vector of strings of the given argument
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @return command-line arguments followed by config file values
     */
    std::vector<std::string> GetArgs(const std::string& strArg) const;

    /**
     * Return true if the given argument has been manually set
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @return true if the argument has been set
     */
    bool IsArgSet(const std::string& strArg) const;

    /**
     * Return string argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param strDefault (e.g. "1")
     * @return command-line argument or default value
     */
    std::string GetArg(const std::string& strArg, const std::string& strDefault) const;

    /**
     * Return integer argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param nDefault (e.g. 1)
     * @return command-line argument (0 if invalid number) or default value
     */
    int64_t GetArg(const std::string& strArg, int64_t nDefault) const;

    /**
     * Return boolean argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param fDefault (true or false)
     * @return command-line argument or default value
     */
    bool GetBoolArg(const std::string& strArg, bool fDefault) const;

    /**
     * Set an argument if it doesn't already have a value
     *
     * @param strArg Argument to set (e.g. "-foo")
     * @param strValue Value (e.g. "1")
     * @return true if argument gets set, false if it already had a value
     */
    bool SoftSetArg(const std::string& strArg, const std::string& strValue);

    // Forces an arg setting. Called by SoftSetArg() if the arg hasn't already
    // been set. Also called directly in testing.
    void ForceSetArg(const std::string& strArg, const std::string& strValue);

    void ClearArgs();
};

extern ArgsManager gArgs;

#endif // STAKELEDGER_UTIL_SYSTEM_H
