// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "leaderboard/course.h"

#include "hash.h"
#include "logging.h"
#include "utilstrencodings.h"

bool CBytecodeDeployer::Deploy(const std::vector<unsigned char>& code, CSolutionTarget& target, CValidationState& state)
{
    if (code.size() > nMaxSolutionSize) {
        return state.Invalid(false, REJECT_INVALID, "bad-solution-size",
                             strprintf("%u > %u bytes", code.size(), nMaxSolutionSize));
    }

    target.code = code;
    target.hashCode = Hash(code.begin(), code.end());
    return true;
}

bool CCourseDirectory::RegisterCourse(const std::string& strRef, std::shared_ptr<CCourse> course)
{
    if (strRef.empty() || !course) {
        return false;
    }

    LOCK(cs);
    if (!mapCourses.emplace(strRef, std::move(course)).second) {
        return false;
    }
    LogPrint(FWLog::LEADERBOARD, "CCourseDirectory: registered %s\n", strRef);
    return true;
}

bool CCourseDirectory::UnregisterCourse(const std::string& strRef)
{
    LOCK(cs);
    if (mapCourses.erase(strRef) == 0) {
        return false;
    }
    LogPrint(FWLog::LEADERBOARD, "CCourseDirectory: unregistered %s\n", strRef);
    return true;
}

std::shared_ptr<CCourse> CCourseDirectory::Resolve(const std::string& strRef) const
{
    LOCK(cs);
    auto it = mapCourses.find(strRef);
    if (it == mapCourses.end()) {
        return nullptr;
    }
    return it->second;
}

