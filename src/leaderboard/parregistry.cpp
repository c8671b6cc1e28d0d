// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "leaderboard/parregistry.h"

#include "leaderboard/leaderboarddb.h"
#include "logging.h"

#include <algorithm>

bool CParRegistry::Upmint(const CPlayerID& player, uint32_t nCourseId, uint64_t nCost, int64_t nTime, bool& fImproved)
{
    fImproved = false;

    ParRecord par;
    if (!db.ReadPar(nCourseId, player, par)) {
        par.nCourseId = nCourseId;
        par.player = player;
        par.nCost = nCost;
        par.nUpdateTime = nTime;
        fImproved = true;
    } else if (nCost < par.nCost) {
        par.nCost = nCost;
        par.nUpdateTime = nTime;
        fImproved = true;
    }
    par.nSolutions++;

    if (!db.WritePar(par)) {
        LogPrintf("CParRegistry: cannot store par of %s on course %u\n", player.ToString(), nCourseId);
        return false;
    }

    if (fImproved) {
        LogPrint(FWLog::LEADERBOARD, "CParRegistry: %s par on course %u is now %u\n",
                 player.ToString(), nCourseId, nCost);
    }
    return true;
}

Optional<ParRecord> CParRegistry::GetPar(uint32_t nCourseId, const CPlayerID& player) const
{
    ParRecord par;
    if (!db.ReadPar(nCourseId, player, par)) {
        return nullopt;
    }
    return par;
}

void CParRegistry::ForEachPar(uint32_t nCourseId, std::function<bool(const ParRecord&)> func) const
{
    db.ForEachPar(nCourseId, func);
}

std::vector<ParRecord> CParRegistry::GetLeaderboard(uint32_t nCourseId) const
{
    std::vector<ParRecord> vPars;
    db.ForEachPar(nCourseId, [&](const ParRecord& par) {
        vPars.push_back(par);
        return true;
    });

    std::sort(vPars.begin(), vPars.end(), [](const ParRecord& a, const ParRecord& b) {
        if (a.nCost != b.nCost) return a.nCost < b.nCost;
        if (a.nUpdateTime != b.nUpdateTime) return a.nUpdateTime < b.nUpdateTime;
        return a.player < b.player;
    });
    return vPars;
}
