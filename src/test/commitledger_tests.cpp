// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Commit Ledger Tests - commitment keys, uniqueness and reveal gating
 */

#include "chainparams.h"
#include "commit/commitledger.h"
#include "commit/commitment.h"
#include "leaderboard/leaderboarddb.h"
#include "test/test_fairway.h"
#include "utilstrencodings.h"
#include "utiltime.h"

#include <boost/test/unit_test.hpp>

struct CommitLedgerTestingSetup : public BasicTestingSetup {
    CLeaderboardDB db;
    CCommitLedger ledger;
    const CPlayerID alice;
    const std::vector<unsigned char> solution;
    const uint256 salt;

    CommitLedgerTestingSetup()
        : db("", true),
          ledger(db, Params().GetConsensus()),
          alice(TestPlayer(0xa1)),
          solution(ParseHex("6001600201")),
          salt(uint256S("5a17"))
    {
    }
};

BOOST_FIXTURE_TEST_SUITE(commitledger_tests, CommitLedgerTestingSetup)

// =============================================================================
// Commitment keys
// =============================================================================

BOOST_AUTO_TEST_CASE(commit_key_binds_all_inputs)
{
    const uint256 key = ComputeCommitKey(alice, solution, salt);
    BOOST_CHECK(!key.IsNull());
    BOOST_CHECK(key == ComputeCommitKey(alice, solution, salt));

    BOOST_CHECK(key != ComputeCommitKey(TestPlayer(0xb2), solution, salt));
    BOOST_CHECK(key != ComputeCommitKey(alice, ParseHex("6001600202"), salt));
    BOOST_CHECK(key != ComputeCommitKey(alice, solution, uint256S("5a18")));
}

BOOST_AUTO_TEST_CASE(commit_key_length_prefixed)
{
    // Moving bytes between solution and salt must change the key
    const uint256 saltA;
    std::vector<unsigned char> vSaltB(32, 0);
    vSaltB[0] = 0x01;
    const uint256 saltB(vSaltB);

    BOOST_CHECK(ComputeCommitKey(alice, ParseHex("00"), saltA) !=
                ComputeCommitKey(alice, ParseHex("0000"), saltA));
    BOOST_CHECK(ComputeCommitKey(alice, ParseHex("01"), saltA) !=
                ComputeCommitKey(alice, {}, saltB));
}

// =============================================================================
// Commit
// =============================================================================

BOOST_AUTO_TEST_CASE(commit_once)
{
    const uint256 key = ComputeCommitKey(alice, solution, salt);
    CValidationState state;
    BOOST_CHECK(ledger.Commit(key, alice, GetTime(), state));
    BOOST_CHECK(ledger.IsCommitted(key));

    CommitmentRecord commitment;
    BOOST_CHECK(ledger.GetCommitment(key, commitment));
    BOOST_CHECK(commitment.committer == alice);
    BOOST_CHECK_EQUAL(commitment.nTime, GetTime());
    BOOST_CHECK(!commitment.fRevealed);

    // Second commit of the same key fails regardless of caller
    CValidationState state2;
    BOOST_CHECK(!ledger.Commit(key, TestPlayer(0xb2), GetTime() + 5, state2));
    BOOST_CHECK_EQUAL(state2.GetRejectReason(), "commit-duplicate");
    BOOST_CHECK_EQUAL(state2.GetRejectCode(), REJECT_DUPLICATE);

    // Original record untouched
    BOOST_CHECK(ledger.GetCommitment(key, commitment));
    BOOST_CHECK(commitment.committer == alice);
}

BOOST_AUTO_TEST_CASE(commit_rejects_null)
{
    CValidationState state;
    BOOST_CHECK(!ledger.Commit(uint256(), alice, GetTime(), state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "commit-null-key");

    CValidationState state2;
    BOOST_CHECK(!ledger.Commit(ComputeCommitKey(alice, solution, salt), CPlayerID(), GetTime(), state2));
    BOOST_CHECK_EQUAL(state2.GetRejectReason(), "commit-null-committer");
}

// =============================================================================
// Reveal gating
// =============================================================================

BOOST_AUTO_TEST_CASE(reveal_requires_commitment)
{
    CValidationState state;
    BOOST_CHECK(!ledger.CheckRevealEligible(ComputeCommitKey(alice, solution, salt), alice, GetTime(), state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "commit-missing");
}

BOOST_AUTO_TEST_CASE(reveal_min_age_boundary)
{
    const int64_t nMinAge = ledger.GetMinAge();
    BOOST_CHECK_EQUAL(nMinAge, 60);

    const int64_t nCommitTime = GetTime();
    const uint256 key = ComputeCommitKey(alice, solution, salt);
    CValidationState state;
    BOOST_REQUIRE(ledger.Commit(key, alice, nCommitTime, state));

    CValidationState stateEarly;
    BOOST_CHECK(!ledger.CheckRevealEligible(key, alice, nCommitTime, stateEarly));
    BOOST_CHECK_EQUAL(stateEarly.GetRejectReason(), "commit-too-new");
    BOOST_CHECK_EQUAL(stateEarly.GetRejectCode(), REJECT_PREMATURE);

    CValidationState stateJustBefore;
    BOOST_CHECK(!ledger.CheckRevealEligible(key, alice, nCommitTime + nMinAge - 1, stateJustBefore));
    BOOST_CHECK_EQUAL(stateJustBefore.GetRejectReason(), "commit-too-new");

    // Exactly MIN_AGE later is allowed
    CValidationState stateExact;
    BOOST_CHECK(ledger.CheckRevealEligible(key, alice, nCommitTime + nMinAge, stateExact));

    CValidationState stateLater;
    BOOST_CHECK(ledger.CheckRevealEligible(key, alice, nCommitTime + 100 * nMinAge, stateLater));
}

BOOST_AUTO_TEST_CASE(reveal_single_use)
{
    const int64_t nCommitTime = GetTime();
    const uint256 key = ComputeCommitKey(alice, solution, salt);
    CValidationState state;
    BOOST_REQUIRE(ledger.Commit(key, alice, nCommitTime, state));

    BOOST_CHECK(ledger.MarkRevealed(key, nCommitTime + 60));

    CValidationState state2;
    BOOST_CHECK(!ledger.CheckRevealEligible(key, alice, nCommitTime + 120, state2));
    BOOST_CHECK_EQUAL(state2.GetRejectReason(), "commit-already-revealed");

    CommitmentRecord commitment;
    BOOST_CHECK(ledger.GetCommitment(key, commitment));
    BOOST_CHECK(commitment.fRevealed);
    BOOST_CHECK_EQUAL(commitment.nRevealTime, nCommitTime + 60);

    BOOST_CHECK(!ledger.MarkRevealed(uint256S("1234"), nCommitTime));
}

BOOST_AUTO_TEST_CASE(regtest_min_age_override)
{
    UpdateCommitMinAge(0);
    const uint256 key = ComputeCommitKey(alice, solution, salt);
    CValidationState state;
    BOOST_REQUIRE(ledger.Commit(key, alice, GetTime(), state));

    BOOST_CHECK(ledger.CheckRevealEligible(key, alice, GetTime(), state));
}

BOOST_AUTO_TEST_CASE(reveal_bound_to_recording_player)
{
    // A copied key committed by someone else cannot be revealed for its player
    const CPlayerID mallory = TestPlayer(0x66);
    const int64_t nCommitTime = GetTime();
    const uint256 key = ComputeCommitKey(alice, solution, salt);
    CValidationState state;
    BOOST_REQUIRE(ledger.Commit(key, mallory, nCommitTime, state));

    CValidationState stateAlice;
    BOOST_CHECK(!ledger.CheckRevealEligible(key, alice, nCommitTime + 60, stateAlice));
    BOOST_CHECK_EQUAL(stateAlice.GetRejectReason(), "commit-wrong-player");
    BOOST_CHECK_EQUAL(stateAlice.GetRejectCode(), REJECT_INVALID);

    CValidationState stateMallory;
    BOOST_CHECK(!ledger.CheckRevealEligible(key, mallory, nCommitTime + 60, stateMallory));
    BOOST_CHECK_EQUAL(stateMallory.GetRejectReason(), "commit-wrong-player");
}

BOOST_AUTO_TEST_SUITE_END()
