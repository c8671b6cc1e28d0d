// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "commit/commitledger.h"

#include "leaderboard/leaderboarddb.h"
#include "logging.h"
#include "utilstrencodings.h"

bool CCommitLedger::Commit(const uint256& key, const CPlayerID& committer, int64_t nTime, CValidationState& state)
{
    if (key.IsNull()) {
        return state.Invalid(false, REJECT_INVALID, "commit-null-key");
    }
    if (committer.IsNull()) {
        return state.Invalid(false, REJECT_INVALID, "commit-null-committer");
    }
    if (db.ExistsCommitment(key)) {
        return state.Invalid(false, REJECT_DUPLICATE, "commit-duplicate",
                             strprintf("commitment %s already recorded", key.ToString()));
    }

    CommitmentRecord commitment;
    commitment.commitKey = key;
    commitment.committer = committer;
    commitment.nTime = nTime;

    if (!db.WriteCommitment(commitment)) {
        return state.Error("db-write-failed", strprintf("cannot store commitment %s", key.ToString()));
    }

    LogPrint(FWLog::COMMIT, "CCommitLedger: %s committed %s at %d\n",
             committer.ToString(), key.ToString(), nTime);
    return true;
}

bool CCommitLedger::CheckRevealEligible(const uint256& key, const CPlayerID& player, int64_t nNow, CValidationState& state) const
{
    CommitmentRecord commitment;
    if (!db.ReadCommitment(key, commitment)) {
        return state.Invalid(false, REJECT_INVALID, "commit-missing",
                             strprintf("no commitment %s", key.ToString()));
    }
    if (commitment.committer != player) {
        return state.Invalid(false, REJECT_INVALID, "commit-wrong-player",
                             strprintf("commitment %s recorded by %s, not %s", key.ToString(),
                                       commitment.committer.ToString(), player.ToString()));
    }
    if (commitment.fRevealed) {
        return state.Invalid(false, REJECT_DUPLICATE, "commit-already-revealed",
                             strprintf("commitment %s revealed at %d", key.ToString(), commitment.nRevealTime));
    }
    if (!consensus.IsCommitMature(commitment.nTime, nNow)) {
        return state.Invalid(false, REJECT_PREMATURE, "commit-too-new",
                             strprintf("age %d < %d", nNow - commitment.nTime, consensus.nCommitMinAge));
    }

    return true;
}

bool CCommitLedger::MarkRevealed(const uint256& key, int64_t nNow)
{
    CommitmentRecord commitment;
    if (!db.ReadCommitment(key, commitment)) {
        return false;
    }
    commitment.fRevealed = true;
    commitment.nRevealTime = nNow;
    return db.WriteCommitment(commitment);
}

bool CCommitLedger::GetCommitment(const uint256& key, CommitmentRecord& commitment) const
{
    return db.ReadCommitment(key, commitment);
}

bool CCommitLedger::IsCommitted(const uint256& key) const
{
    return db.ExistsCommitment(key);
}
