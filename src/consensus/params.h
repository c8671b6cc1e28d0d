// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FAIRWAY_CONSENSUS_PARAMS_H
#define FAIRWAY_CONSENSUS_PARAMS_H

#include <stdint.h>
#include <stddef.h>

namespace Consensus {

/**
 * Parameters that influence leaderboard rules.
 */
struct Params {
    /**
     * Minimum age, in seconds, a commitment must reach before it can be
     * revealed. A reveal at exactly this age is accepted.
     */
    int64_t nCommitMinAge;

    /** Largest solution, in bytes, the default deployer will instantiate (EIP-170 code size limit). */
    size_t nMaxSolutionSize;

    /** First id handed out by the course registry. */
    uint32_t nFirstCourseId;

    bool IsCommitMature(int64_t nCommitTime, int64_t nNow) const
    {
        return nNow - nCommitTime >= nCommitMinAge;
    }
};

} // namespace Consensus

#endif // FAIRWAY_CONSENSUS_PARAMS_H
