// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FAIRWAY_LEADERBOARD_LEADERBOARD_H
#define FAIRWAY_LEADERBOARD_LEADERBOARD_H

/**
 * Leaderboard records
 *
 * Each course publishes a challenge and an opcode allow-list. The cheapest
 * valid solution ever submitted holds the title ("king") for the course;
 * each contestant also keeps a personal best ("par") per course.
 *
 * Lifecycle of a course:
 * - Unregistered -> Registered (no king): AddCourse
 * - Registered (no king) -> Registered (king): first valid submission
 * - Registered (king) -> Registered (king'): strictly cheaper submission
 * Courses are never removed.
 *
 * DB Keys:
 * 'c' + courseId -> CourseRecord
 * 'n' -> next course id
 * 'p' + (courseId, player) -> ParRecord
 * "version" -> schema version
 */

#include "primitives/player.h"
#include "script/opcodemask.h"
#include "serialize.h"

#include <stdint.h>
#include <string>

// DB Key prefixes
static const char DB_COURSE = 'c';          // CourseRecord by id
static const char DB_NEXT_COURSE_ID = 'n';  // next id to assign
static const char DB_PAR = 'p';             // ParRecord by (courseId, player)

/**
 * CourseRecord - registered course and its title state
 *
 * nLeadingCost == 0 means nobody holds the title yet.
 */
struct CourseRecord
{
    uint32_t nCourseId{0};
    std::string strCourseRef;       // opaque handle of the course implementation
    COpcodeMask allowedOpcodes;
    uint64_t nLeadingCost{0};
    CPlayerID king;
    uint64_t nSolutions{0};         // valid submissions ever accepted
    uint64_t nKingChanges{0};       // times the title moved
    int64_t nCreateTime{0};

    bool HasKing() const { return nLeadingCost != 0; }

    /** True if a valid solution of this cost takes the title */
    bool IsImprovement(uint64_t nCost) const
    {
        return nLeadingCost == 0 || nCost < nLeadingCost;
    }

    SERIALIZE_METHODS(CourseRecord, obj)
    {
        READWRITE(obj.nCourseId, obj.strCourseRef, obj.allowedOpcodes);
        READWRITE(obj.nLeadingCost, obj.king);
        READWRITE(obj.nSolutions, obj.nKingChanges, obj.nCreateTime);
    }

    std::string ToString() const;
};

/**
 * ParRecord - a contestant's personal best on one course
 *
 * nCost only ever decreases. Never removed nor transferred.
 */
struct ParRecord
{
    uint32_t nCourseId{0};
    CPlayerID player;
    uint64_t nCost{0};
    uint64_t nSolutions{0};         // valid submissions by this player to this course
    int64_t nUpdateTime{0};         // when nCost was last lowered

    SERIALIZE_METHODS(ParRecord, obj)
    {
        READWRITE(obj.nCourseId, obj.player, obj.nCost, obj.nSolutions, obj.nUpdateTime);
    }

    std::string ToString() const;
};

/**
 * SubmissionResult - outcome of an accepted submission
 */
struct SubmissionResult
{
    uint32_t nCourseId{0};
    CPlayerID submitter;
    uint64_t nCost{0};
    bool fKingChanged{false};
    CPlayerID previousKing;         // null if the course had no king
    uint64_t nPreviousCost{0};      // leading cost before this submission (0 = none)
    bool fParImproved{false};
    bool fRevealed{false};          // came in through commit-reveal

    std::string ToString() const;
};

#endif // FAIRWAY_LEADERBOARD_LEADERBOARD_H
