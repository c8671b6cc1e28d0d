// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2019 The Bitcoin developers
// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "logging.h"

#include "util/system.h"
#include "utiltime.h"

const char * const DEFAULT_DEBUGLOGFILE = "debug.log";

FWLog::Logger& LogInstance()
{
/**
 * NOTE: the logger instance is leaked on exit. This is ugly, but will be
 * cleaned up by the OS/libc. Defining a logger as a global object doesn't work
 * since the order of destruction of static/global objects is undefined.
 * Consider if the logger gets destroyed, and then some later destructor calls
 * LogPrintf, maybe indirectly, and you get a core dump at shutdown trying to
 * access the logger. When the shutdown sequence is fully audited and tested,
 * explicit destruction of these objects can be implemented by changing this
 * from a raw pointer to a std::unique_ptr.
 *
 * This method of initialization was originally introduced in
 * ee3374234c60aba2cc4c5cd5cac1c0aefc2d817c.
 */
    static FWLog::Logger* g_logger{new FWLog::Logger()};
    return *g_logger;
}

static int FileWriteStr(const std::string& str, FILE* fp)
{
    return fwrite(str.data(), 1, str.size(), fp);
}

bool FWLog::Logger::OpenDebugLog()
{
    std::lock_guard<std::mutex> scoped_lock(m_file_mutex);

    if (m_fileout) return true;
    if (m_file_path.empty()) return false;

    m_fileout = fsbridge::fopen(m_file_path, "a");
    if (!m_fileout) {
        return false;
    }

    setbuf(m_fileout, nullptr); // unbuffered
    return true;
}

void FWLog::Logger::DisconnectTestLogger()
{
    std::lock_guard<std::mutex> scoped_lock(m_file_mutex);
    if (m_fileout != nullptr) fclose(m_fileout);
    m_fileout = nullptr;
    m_print_callbacks.clear();
    m_print_to_file = false;
}

void FWLog::Logger::EnableCategory(FWLog::LogFlags flag)
{
    m_categories |= flag;
}

bool FWLog::Logger::EnableCategory(const std::string& str)
{
    FWLog::LogFlags flag;
    if (!GetLogCategory(flag, str)) return false;
    EnableCategory(flag);
    return true;
}

void FWLog::Logger::DisableCategory(FWLog::LogFlags flag)
{
    m_categories &= ~flag;
}

bool FWLog::Logger::DisableCategory(const std::string& str)
{
    FWLog::LogFlags flag;
    if (!GetLogCategory(flag, str)) return false;
    DisableCategory(flag);
    return true;
}

bool FWLog::Logger::WillLogCategory(FWLog::LogFlags category) const
{
    return (m_categories.load(std::memory_order_relaxed) & category) != 0;
}

struct CLogCategoryDesc
{
    FWLog::LogFlags flag;
    std::string category;
};

const CLogCategoryDesc LogCategories[] =
{
    {FWLog::NONE, "0"},
    {FWLog::NONE, "none"},
    {FWLog::LEADERBOARD, "leaderboard"},
    {FWLog::COMMIT, "commit"},
    {FWLog::VALIDATOR, "validator"},
    {FWLog::DB, "db"},
    {FWLog::ALL, "1"},
    {FWLog::ALL, "all"},
};

bool GetLogCategory(FWLog::LogFlags& flag, const std::string& str)
{
    if (str == "") {
        flag = FWLog::ALL;
        return true;
    }
    for (const CLogCategoryDesc& category_desc : LogCategories) {
        if (category_desc.category == str) {
            flag = category_desc.flag;
            return true;
        }
    }
    return false;
}

std::string ListLogCategories()
{
    std::string ret;
    int outcount = 0;
    for (const CLogCategoryDesc& category_desc : LogCategories) {
        // Omit the special cases.
        if (category_desc.flag != FWLog::NONE && category_desc.flag != FWLog::ALL) {
            if (outcount != 0) ret += ", ";
            ret += category_desc.category;
            outcount++;
        }
    }
    return ret;
}

std::vector<CLogCategoryActive> ListActiveLogCategories()
{
    std::vector<CLogCategoryActive> ret;
    for (const CLogCategoryDesc& category_desc : LogCategories) {
        // Omit the special cases.
        if (category_desc.flag != FWLog::NONE && category_desc.flag != FWLog::ALL) {
            CLogCategoryActive catActive;
            catActive.category = category_desc.category;
            catActive.active = LogAcceptCategory(category_desc.flag);
            ret.push_back(catActive);
        }
    }
    return ret;
}

std::string FWLog::Logger::LogTimestampStr(const std::string& str)
{
    std::string strStamped;

    if (!m_log_timestamps)
        return str;

    if (m_started_new_line) {
        strStamped = FormatISO8601DateTime(GetTime()) + ' ' + str;
    } else {
        strStamped = str;
    }

    m_started_new_line = !str.empty() && str[str.size() - 1] == '\n';

    return strStamped;
}

void FWLog::Logger::LogPrintStr(const std::string& str)
{
    std::string strTimestamped = LogTimestampStr(str);

    if (m_print_to_console) {
        // print to console
        fwrite(strTimestamped.data(), 1, strTimestamped.size(), stdout);
        fflush(stdout);
    }

    std::lock_guard<std::mutex> scoped_lock(m_file_mutex);
    for (const auto& cb : m_print_callbacks) {
        cb(strTimestamped);
    }
    if (m_print_to_file && m_fileout) {
        FileWriteStr(strTimestamped, m_fileout);
    }
}

FWLog::Logger::~Logger()
{
    if (m_fileout) {
        fclose(m_fileout);
    }
}

bool InitLogging()
{
    FWLog::Logger& logger = LogInstance();
    logger.m_print_to_console = gArgs.GetBoolArg("-printtoconsole", DEFAULT_PRINTTOCONSOLE);
    logger.m_log_timestamps = gArgs.GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);

    if (gArgs.IsArgSet("-debug")) {
        // Special-case: if -debug=0/-nodebug is set, turn off debugging messages
        const std::vector<std::string> categories = gArgs.GetArgs("-debug");
        bool fNone = false;
        for (const std::string& cat : categories) {
            if (cat == "0" || cat == "none") fNone = true;
        }
        if (!fNone) {
            for (const std::string& cat : categories) {
                if (!logger.EnableCategory(cat)) {
                    LogPrintf("Unsupported logging category -debug=%s. Valid categories: %s\n", cat, ListLogCategories());
                }
            }
        }
    }

    if (!gArgs.IsArgNegated("-debuglogfile")) {
        logger.m_file_path = AbsPathForConfigVal(fs::path(gArgs.GetArg("-debuglogfile", DEFAULT_DEBUGLOGFILE)));
        logger.m_print_to_file = true;
        if (!logger.OpenDebugLog()) {
            LogPrintf("Could not open debug log file %s\n", logger.m_file_path.string());
            return false;
        }
    }
    return true;
}
