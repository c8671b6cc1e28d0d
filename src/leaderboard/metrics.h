// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FAIRWAY_LEADERBOARD_METRICS_H
#define FAIRWAY_LEADERBOARD_METRICS_H

#include <atomic>
#include <stdint.h>
#include <univalue.h>

/**
 * Leaderboard Metrics - counters kept by the submission engine
 *
 * Counters are atomic so they can be read without taking the engine lock.
 *
 * Usage:
 *   metrics.submissionsAccepted++;
 *   LogPrintf("%s\n", metrics.ToJSON().write(2));
 */
struct LeaderboardMetrics {
    // Submissions
    std::atomic<uint64_t> submissionsAccepted{0};   // Valid submissions recorded
    std::atomic<uint64_t> submissionsRejected{0};   // Rejected by validator, deployer or course
    std::atomic<uint64_t> kingChanges{0};           // Title transfers
    std::atomic<uint64_t> parImprovements{0};       // Pars created or lowered

    // Commit-reveal
    std::atomic<uint64_t> commitments{0};           // Commitments recorded
    std::atomic<uint64_t> reveals{0};               // Successful reveals
    std::atomic<uint64_t> revealsRejected{0};       // Reveals refused by the ledger

    // Administration
    std::atomic<uint64_t> coursesAdded{0};
    std::atomic<uint64_t> storageFailures{0};       // Transactions rolled back on a write error

    UniValue ToJSON() const {
        UniValue result(UniValue::VOBJ);

        UniValue submissions(UniValue::VOBJ);
        submissions.pushKV("accepted", (int64_t)submissionsAccepted.load());
        submissions.pushKV("rejected", (int64_t)submissionsRejected.load());
        submissions.pushKV("king_changes", (int64_t)kingChanges.load());
        submissions.pushKV("par_improvements", (int64_t)parImprovements.load());
        result.pushKV("submissions", submissions);

        UniValue commit(UniValue::VOBJ);
        commit.pushKV("commitments", (int64_t)commitments.load());
        commit.pushKV("reveals", (int64_t)reveals.load());
        commit.pushKV("reveals_rejected", (int64_t)revealsRejected.load());
        result.pushKV("commit", commit);

        result.pushKV("courses_added", (int64_t)coursesAdded.load());
        result.pushKV("storage_failures", (int64_t)storageFailures.load());
        return result;
    }

    /**
     * Reset all metrics (for testing)
     */
    void Reset() {
        submissionsAccepted.store(0);
        submissionsRejected.store(0);
        kingChanges.store(0);
        parImprovements.store(0);
        commitments.store(0);
        reveals.store(0);
        revealsRejected.store(0);
        coursesAdded.store(0);
        storageFailures.store(0);
    }
};

#endif // FAIRWAY_LEADERBOARD_METRICS_H
