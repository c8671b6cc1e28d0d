// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FAIRWAY_LEADERBOARD_NOTIFICATIONS_H
#define FAIRWAY_LEADERBOARD_NOTIFICATIONS_H

#include "commit/commitment.h"
#include "leaderboard/leaderboard.h"

/**
 * CLeaderboardInterface - observer of engine state changes
 *
 * Callbacks run synchronously on the caller's thread, with the engine lock
 * held, after the change has been committed to the database. A listener
 * must not call back into the engine's mutating operations.
 */
class CLeaderboardInterface
{
public:
    virtual ~CLeaderboardInterface() = default;

    virtual void CourseAdded(const CourseRecord& course) {}
    virtual void AllowedOpcodesChanged(uint32_t nCourseId, const COpcodeMask& mask) {}
    virtual void Committed(const CommitmentRecord& commitment) {}
    virtual void SubmissionAccepted(const SubmissionResult& result) {}
    /** Title moved; oldKing is null for the first holder */
    virtual void KingChanged(uint32_t nCourseId, const CPlayerID& oldKing, const CPlayerID& newKing, uint64_t nCost) {}
};

#endif // FAIRWAY_LEADERBOARD_NOTIFICATIONS_H
