// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FAIRWAY_COMMIT_COMMITMENT_H
#define FAIRWAY_COMMIT_COMMITMENT_H

/**
 * Commit-reveal records
 *
 * A contestant first publishes only H(player, solution, salt). After the
 * commitment has aged nCommitMinAge seconds the solution itself may be
 * revealed; credit goes to whoever made the commitment, so a solution seen
 * at reveal time cannot be front-run by a copier.
 *
 * DB Keys:
 * 'k' + commitKey -> CommitmentRecord
 */

#include "primitives/player.h"
#include "serialize.h"
#include "uint256.h"

#include <stdint.h>
#include <string>
#include <vector>

// DB Key prefix
static const char DB_COMMITMENT = 'k';

/**
 * CommitmentRecord - one stored commitment
 *
 * Created exactly once per key and never removed. fRevealed marks the
 * commitment as consumed by a successful reveal.
 */
struct CommitmentRecord
{
    uint256 commitKey;
    CPlayerID committer;
    int64_t nTime{0};           // when the commitment was recorded
    bool fRevealed{false};
    int64_t nRevealTime{0};     // 0 until revealed

    SERIALIZE_METHODS(CommitmentRecord, obj)
    {
        READWRITE(obj.commitKey, obj.committer, obj.nTime, obj.fRevealed, obj.nRevealTime);
    }

    std::string ToString() const;
};

/**
 * ComputeCommitKey - Commitment for a solution
 *
 * SHA256(player || CompactSize(len) || solution || salt). The length prefix
 * keeps (solution, salt) pairs from colliding across the boundary.
 */
uint256 ComputeCommitKey(const CPlayerID& player, const std::vector<unsigned char>& solution, const uint256& salt);

#endif // FAIRWAY_COMMIT_COMMITMENT_H
