// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FAIRWAY_COMMIT_COMMITLEDGER_H
#define FAIRWAY_COMMIT_COMMITLEDGER_H

#include "commit/commitment.h"
#include "consensus/params.h"
#include "consensus/validation.h"

class CLeaderboardDB;

/**
 * CCommitLedger - commitments awaiting reveal
 *
 * Each key is recorded exactly once. A commitment becomes revealable once
 * nCommitMinAge seconds have passed (a reveal at exactly that age is
 * accepted) and can be consumed by one successful reveal. Commitments never
 * expire.
 */
class CCommitLedger
{
private:
    CLeaderboardDB& db;
    const Consensus::Params& consensus;

public:
    CCommitLedger(CLeaderboardDB& dbIn, const Consensus::Params& consensusIn) : db(dbIn), consensus(consensusIn) {}

    /**
     * Commit - Record a new commitment
     *
     * @param key        ComputeCommitKey(committer, solution, salt)
     * @param committer  Identity credited at reveal
     * @param nTime      Current time
     * @param state      Output: commit-null-key, commit-duplicate or db-write-failed
     * @return           true if stored
     */
    bool Commit(const uint256& key, const CPlayerID& committer, int64_t nTime, CValidationState& state);

    /**
     * CheckRevealEligible - May this commitment be revealed now?
     *
     * The key binds a player, so only a commitment recorded by that same
     * player can be revealed under it.
     *
     * @param key        Commitment key
     * @param player     Player the key was computed for
     * @param nNow       Current time
     * @param state      Output: commit-missing, commit-wrong-player, commit-too-new or commit-already-revealed
     */
    bool CheckRevealEligible(const uint256& key, const CPlayerID& player, int64_t nNow, CValidationState& state) const;

    /** Consume a commitment. Only called by the engine inside the reveal transaction. */
    bool MarkRevealed(const uint256& key, int64_t nNow);

    bool GetCommitment(const uint256& key, CommitmentRecord& commitment) const;
    bool IsCommitted(const uint256& key) const;

    int64_t GetMinAge() const { return consensus.nCommitMinAge; }
};

#endif // FAIRWAY_COMMIT_COMMITLEDGER_H
