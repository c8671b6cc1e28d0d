// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "commit/commitment.h"

#include "hash.h"
#include "utilstrencodings.h"

std::string CommitmentRecord::ToString() const
{
    return strprintf("CommitmentRecord(key=%s, committer=%s, time=%d, revealed=%d)",
        commitKey.ToString(), committer.ToString(), nTime, fRevealed);
}

uint256 ComputeCommitKey(const CPlayerID& player, const std::vector<unsigned char>& solution, const uint256& salt)
{
    CHashWriter ss(SER_GETHASH, 0);
    ss << player << solution << salt;
    return ss.GetHash();
}
