// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKELEDGER_LOGGING_H
#define STAKELEDGER_LOGGING_H

#include "util/strprintf.h"

#include <atomic>
#include <cstdio>
#include <mutex>
#include <stdint.h>
#include <string>
#include <vector>

static const bool DEFAULT_LOGTIMESTAMPS = true;
extern const char * const DEFAULT_DEBUGLOGFILE;

struct CLogCategoryActive
{
    std::string category;
    bool active;
};

namespace BCLog {

enum LogFlags : uint32_t {
    NONE        = 0,
    LEDGER      = (1 <<  0),
    POOL        = (1 <<  1),
    STAKE       = (1 <<  2),
    YIELD       = (1 <<  3),
    TIER        = (1 <<  4),
    RPC         = (1 <<  5),
    ALL         = ~(uint32_t)0,
};

class Logger
{
private:
    FILE* m_fileout = nullptr;
    std::mutex m_file_mutex;

    /** Log categories bitfield. */
    std::atomic<uint32_t> m_categories{0};

    /**
     * m_started_new_line is a state variable that will suppress printing of
     * the timestamp when multiple calls are made that don't end in a
     * newline.
     */
    std::atomic_bool m_started_new_line{true};

    std::string LogTimestampStr(const std::string& str);

public:
    bool m_print_to_console = false;
    bool m_print_to_file = false;

    bool m_log_timestamps = DEFAULT_LOGTIMESTAMPS;

    std::string m_file_path;

    ~Logger();

    /** Send a string to the log output */
    int LogPrintStr(const std::string& str);

    /** Returns whether logs will be written to any output */
    bool Enabled() const { return m_print_to_console || m_print_to_file; }

    bool OpenDebugLog();
    void CloseDebugLog();

    uint32_t GetCategoryMask() const { return m_categories.load(); }

    void EnableCategory(LogFlags flag);
    bool EnableCategory(const std::string& str);
    void DisableCategory(LogFlags flag);
    bool DisableCategory(const std::string& str);

    bool WillLogCategory(LogFlags category) const;
};

} // namespace BCLog

BCLog::Logger& LogInstance();

/** Return true if log accepts specified category */
static inline bool LogAcceptCategory(BCLog::LogFlags category)
{
    return LogInstance().WillLogCategory(category);
}

/** Returns a string with the log categories. */
std::string ListLogCategories();

/** Returns a vector of the active log categories. */
std::vector<CLogCategoryActive> ListActiveLogCategories();

/** Return true if str parses as a log category and set the flag */
bool GetLogCategory(BCLog::LogFlags& flag, const std::string& str);

template <typename... Args>
static inline void LogPrintf(const char* fmt, const Args&... args)
{
    if (LogInstance().Enabled()) {
        std::string log_msg;
        try {
            log_msg = tfm::format(fmt, args...);
        } catch (const std::runtime_error& fmterr) {
            /* Original format string will have newline so don't add one here */
            log_msg = "Error \"" + std::string(fmterr.what()) + "\" while formatting log message: " + fmt;
        }
        LogInstance().LogPrintStr(log_msg);
    }
}

// Use a macro instead of a function for conditional logging to prevent
// evaluating arguments when logging for the category is not enabled.
#define LogPrint(category, ...)              \
    do {                                     \
        if (LogAcceptCategory((category))) { \
            LogPrintf(__VA_ARGS__);          \
        }                                    \
    } while (0)

#endif // STAKELEDGER_LOGGING_H
