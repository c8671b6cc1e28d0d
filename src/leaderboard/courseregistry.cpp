// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "leaderboard/courseregistry.h"

#include "leaderboard/leaderboarddb.h"
#include "logging.h"
#include "utilstrencodings.h"

#include <limits>

bool CCourseRegistry::Register(const std::string& strCourseRef, const COpcodeMask& mask, int64_t nTime, uint32_t& nCourseIdRet, CValidationState& state)
{
    const uint32_t nCourseId = GetNextId();
    if (nCourseId == std::numeric_limits<uint32_t>::max()) {
        return state.Error("course-id-exhausted");
    }

    CourseRecord course;
    course.nCourseId = nCourseId;
    course.strCourseRef = strCourseRef;
    course.allowedOpcodes = mask;
    course.nCreateTime = nTime;

    if (!db.WriteCourse(course) || !db.WriteNextCourseId(nCourseId + 1)) {
        return state.Error("db-write-failed", strprintf("cannot store course %u", nCourseId));
    }

    LogPrint(FWLog::LEADERBOARD, "CCourseRegistry: registered course %u (%s, %u opcodes)\n",
             nCourseId, strCourseRef, mask.Count());
    nCourseIdRet = nCourseId;
    return true;
}

bool CCourseRegistry::Get(uint32_t nCourseId, CourseRecord& course) const
{
    return db.ReadCourse(nCourseId, course);
}

bool CCourseRegistry::Exists(uint32_t nCourseId) const
{
    return db.ExistsCourse(nCourseId);
}

bool CCourseRegistry::Update(const CourseRecord& course, CValidationState& state)
{
    if (!db.ExistsCourse(course.nCourseId)) {
        return state.Invalid(false, REJECT_INVALID, "course-not-found",
                             strprintf("course %u", course.nCourseId));
    }
    if (!db.WriteCourse(course)) {
        return state.Error("db-write-failed", strprintf("cannot update course %u", course.nCourseId));
    }
    return true;
}

bool CCourseRegistry::SetAllowedOpcodes(uint32_t nCourseId, const COpcodeMask& mask, CValidationState& state)
{
    CourseRecord course;
    if (!db.ReadCourse(nCourseId, course)) {
        return state.Invalid(false, REJECT_INVALID, "course-not-found",
                             strprintf("course %u", nCourseId));
    }
    course.allowedOpcodes = mask;
    return Update(course, state);
}

uint32_t CCourseRegistry::GetNextId() const
{
    return db.ReadNextCourseId(consensus.nFirstCourseId);
}

void CCourseRegistry::ForEachCourse(std::function<bool(const CourseRecord&)> func) const
{
    db.ForEachCourse(func);
}
