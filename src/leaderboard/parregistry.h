// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FAIRWAY_LEADERBOARD_PARREGISTRY_H
#define FAIRWAY_LEADERBOARD_PARREGISTRY_H

#include "leaderboard/leaderboard.h"
#include "optional.h"

#include <functional>
#include <vector>

class CLeaderboardDB;

/**
 * CParRegistry - personal bests per (course, player)
 *
 * A par is created on the player's first valid submission to a course and
 * only ever improves. Pars are never removed or transferred.
 */
class CParRegistry
{
private:
    CLeaderboardDB& db;

public:
    explicit CParRegistry(CLeaderboardDB& dbIn) : db(dbIn) {}

    /**
     * Upmint - Record a valid submission
     *
     * Creates the par if absent, lowers its cost if nCost is strictly
     * better, and always counts the submission.
     *
     * @param fImproved  Output: true if the par was created or lowered
     * @return           false on storage failure
     */
    bool Upmint(const CPlayerID& player, uint32_t nCourseId, uint64_t nCost, int64_t nTime, bool& fImproved);

    Optional<ParRecord> GetPar(uint32_t nCourseId, const CPlayerID& player) const;

    void ForEachPar(uint32_t nCourseId, std::function<bool(const ParRecord&)> func) const;

    /** Pars of a course, cheapest first; ties go to the earlier update */
    std::vector<ParRecord> GetLeaderboard(uint32_t nCourseId) const;
};

#endif // FAIRWAY_LEADERBOARD_PARREGISTRY_H
