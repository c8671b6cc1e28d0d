// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "leaderboard/leaderboard.h"

#include "utilstrencodings.h"

std::string CourseRecord::ToString() const
{
    return strprintf("CourseRecord(id=%u, ref=%s, opcodes=%u, leadingCost=%u, king=%s, solutions=%u, kingChanges=%u)",
        nCourseId, strCourseRef, allowedOpcodes.Count(), nLeadingCost,
        HasKing() ? king.ToString() : "none", nSolutions, nKingChanges);
}

std::string ParRecord::ToString() const
{
    return strprintf("ParRecord(course=%u, player=%s, cost=%u, solutions=%u)",
        nCourseId, player.ToString(), nCost, nSolutions);
}

std::string SubmissionResult::ToString() const
{
    return strprintf("SubmissionResult(course=%u, submitter=%s, cost=%u, kingChanged=%d, previousKing=%s, previousCost=%u)",
        nCourseId, submitter.ToString(), nCost, fKingChanged,
        previousKing.IsNull() ? "none" : previousKing.ToString(), nPreviousCost);
}
