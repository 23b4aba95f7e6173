// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/system.h"

#include "util/strencodings.h"

#include <chrono>
#include <fstream>

const char * const STAKELEDGER_CONF_FILENAME = "stakeledger.conf";

ArgsManager gArgs;

int64_t GetTime()
{
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    if (strValue == "true")
        return true;
    if (strValue == "false")
        return false;
    return (atoi64(strValue) != 0);
}

/** Turn -noX into -X=0 */
static void InterpretNegatedOption(std::string& key, std::string& val)
{
    if (key.substr(0, 3) == "-no") {
        bool bool_val = InterpretBool(val);
        key.erase(1, 2);
        val = bool_val ? "0" : "1";
    }
}

bool ArgsManager::ParseParameters(int argc, const char* const argv[], std::string& error)
{
    std::lock_guard<std::mutex> lock(cs_args);
    m_override_args.clear();

    for (int i = 1; i < argc; i++) {
        std::string key(argv[i]);
        std::string val;
        size_t is_index = key.find('=');
        if (is_index != std::string::npos) {
            val = key.substr(is_index + 1);
            key.erase(is_index);
        }

        if (key.empty() || key[0] != '-') {
            error = strprintf("Invalid parameter %s, only -key[=value] arguments are accepted", argv[i]);
            return false;
        }

        // Interpret --foo as -foo.
        if (key.length() > 1 && key[1] == '-')
            key.erase(0, 1);

        InterpretNegatedOption(key, val);
        m_override_args[key].push_back(val);
    }

    return true;
}

bool ArgsManager::ReadConfigStream(std::istream& stream, std::string& error)
{
    std::lock_guard<std::mutex> lock(cs_args);

    std::string str;
    int linenr = 1;
    while (std::getline(stream, str)) {
        size_t pos = str.find('#');
        if (pos != std::string::npos) {
            str = str.substr(0, pos);
        }
        const static std::string pattern = " \t\r\n";
        str.erase(0, str.find_first_not_of(pattern));
        str.erase(str.find_last_not_of(pattern) + 1);
        if (!str.empty()) {
            if ((pos = str.find('=')) == std::string::npos) {
                error = strprintf("parse error on line %i: %s", linenr, str);
                return false;
            }
            std::string key = "-" + str.substr(0, str.find_last_not_of(pattern, pos - 1) + 1);
            std::string value = str.substr(str.find_first_not_of(pattern, pos + 1) == std::string::npos ?
                                           str.size() : str.find_first_not_of(pattern, pos + 1));
            InterpretNegatedOption(key, value);
            m_config_args[key].push_back(value);
        }
        ++linenr;
    }
    return true;
}

bool ArgsManager::ReadConfigFile(const std::string& path, std::string& error)
{
    {
        std::lock_guard<std::mutex> lock(cs_args);
        m_config_args.clear();
    }

    std::ifstream stream(path);
    if (!stream.good()) {
        // Missing config file is not an error, defaults apply
        return true;
    }
    return ReadConfigStream(stream, error);
}

bool ArgsManager::GetArgValue(const std::string& strArg, std::string& strValue) const
{
    auto it = m_override_args.find(strArg);
    if (it != m_override_args.end() && !it->second.empty()) {
        strValue = it->second.back();
        return true;
    }
    it = m_config_args.find(strArg);
    if (it != m_config_args.end() && !it->second.empty()) {
        strValue = it->second.back();
        return true;
    }
    return false;
}

std::vector<std::string> ArgsManager::GetArgs(const std::string& strArg) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    std::vector<std::string> result;
    auto it = m_override_args.find(strArg);
    if (it != m_override_args.end()) {
        result.insert(result.end(), it->second.begin(), it->second.end());
    }
    it = m_config_args.find(strArg);
    if (it != m_config_args.end()) {
        result.insert(result.end(), it->second.begin(), it->second.end());
    }
    return result;
}

bool ArgsManager::IsArgSet(const std::string& strArg) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    std::string strValue;
    return GetArgValue(strArg, strValue);
}

std::string ArgsManager::GetArg(const std::string& strArg, const std::string& strDefault) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    std::string strValue;
    if (GetArgValue(strArg, strValue)) return strValue;
    return strDefault;
}

int64_t ArgsManager::GetArg(const std::string& strArg, int64_t nDefault) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    std::string strValue;
    if (GetArgValue(strArg, strValue)) return atoi64(strValue);
    return nDefault;
}

bool ArgsManager::GetBoolArg(const std::string& strArg, bool fDefault) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    std::string strValue;
    if (GetArgValue(strArg, strValue)) return InterpretBool(strValue);
    return fDefault;
}

bool ArgsManager::SoftSetArg(const std::string& strArg, const std::string& strValue)
{
    {
        std::lock_guard<std::mutex> lock(cs_args);
        std::string strCurrent;
        if (GetArgValue(strArg, strCurrent)) return false;
    }
    ForceSetArg(strArg, strValue);
    return true;
}

void ArgsManager::ForceSetArg(const std::string& strArg, const std::string& strValue)
{
    std::lock_guard<std::mutex> lock(cs_args);
    m_override_args[strArg] = {strValue};
}

void ArgsManager::ClearArgs()
{
    std::lock_guard<std::mutex> lock(cs_args);
    m_override_args.clear();
    m_config_args.clear();
}
