// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FAIRWAY_LEADERBOARD_COURSEREGISTRY_H
#define FAIRWAY_LEADERBOARD_COURSEREGISTRY_H

#include "consensus/params.h"
#include "consensus/validation.h"
#include "leaderboard/leaderboard.h"

#include <functional>
#include <string>

class CLeaderboardDB;

/**
 * CCourseRegistry - registered courses and their title state
 *
 * Ids are handed out sequentially starting at nFirstCourseId. Records are
 * only mutated through the submission engine.
 */
class CCourseRegistry
{
private:
    CLeaderboardDB& db;
    const Consensus::Params& consensus;

public:
    CCourseRegistry(CLeaderboardDB& dbIn, const Consensus::Params& consensusIn) : db(dbIn), consensus(consensusIn) {}

    /**
     * Register - Store a new course with zeroed counters and no king
     *
     * @param strCourseRef  Opaque reference of the course implementation
     * @param mask          Opcode allow-list
     * @param nTime         Creation time
     * @param nCourseIdRet  Output: assigned id
     * @param state         Output: db-write-failed
     */
    bool Register(const std::string& strCourseRef, const COpcodeMask& mask, int64_t nTime, uint32_t& nCourseIdRet, CValidationState& state);

    bool Get(uint32_t nCourseId, CourseRecord& course) const;
    bool Exists(uint32_t nCourseId) const;

    /** Write back a modified record (course-not-found if it was never registered) */
    bool Update(const CourseRecord& course, CValidationState& state);

    bool SetAllowedOpcodes(uint32_t nCourseId, const COpcodeMask& mask, CValidationState& state);

    /** Id the next Register call will assign */
    uint32_t GetNextId() const;

    void ForEachCourse(std::function<bool(const CourseRecord&)> func) const;
};

#endif // FAIRWAY_LEADERBOARD_COURSEREGISTRY_H
