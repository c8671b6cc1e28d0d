// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FAIRWAY_LEADERBOARD_ENGINE_H
#define FAIRWAY_LEADERBOARD_ENGINE_H

#include "commit/commitledger.h"
#include "consensus/params.h"
#include "consensus/validation.h"
#include "leaderboard/course.h"
#include "leaderboard/courseregistry.h"
#include "leaderboard/leaderboard.h"
#include "leaderboard/metrics.h"
#include "leaderboard/parregistry.h"
#include "optional.h"
#include "script/solutioncheck.h"
#include "sync.h"

#include <memory>
#include <string>
#include <vector>

class CLeaderboardDB;
class CLeaderboardInterface;

/** Who is calling, when, and the entropy the seed is derived from */
struct CLedgerContext
{
    CPlayerID caller;
    int64_t nTime{0};
    uint256 hashEntropy;

    CLedgerContext() = default;
    CLedgerContext(const CPlayerID& callerIn, int64_t nTimeIn, const uint256& hashEntropyIn = uint256())
        : caller(callerIn), nTime(nTimeIn), hashEntropy(hashEntropyIn) {}
};

/**
 * CSubmissionEngine - course and title state machine
 *
 * Owns the course registry, the par registry and the commit ledger. Every
 * operation runs under the engine lock, so operations are applied one at a
 * time in arrival order, and every mutating operation is a single database
 * transaction: it either fully applies or leaves no trace.
 *
 * A submission goes through two phases:
 * - CheckSubmission: course lookup, opcode validation, deployment and the
 *   course run. Nothing is written.
 * - ApplySubmission: title, counters and par update inside the transaction.
 * Listeners are notified after the transaction commits.
 */
class CSubmissionEngine
{
private:
    mutable RecursiveMutex cs;

    CLeaderboardDB& db;
    const Consensus::Params& consensus;
    CCourseDirectory& directory;
    const CPlayerID admin;

    CCourseRegistry courses;
    CParRegistry pars;
    CCommitLedger ledger;

    std::shared_ptr<CSolutionValidator> validator;
    std::shared_ptr<CSolutionDeployer> deployer;
    std::vector<CLeaderboardInterface*> vListeners;

    LeaderboardMetrics metrics;

    bool CheckAdmin(const CPlayerID& caller, CValidationState& state) const;

    bool CheckSubmission(const CLedgerContext& ctx, const CPlayerID& submitter, uint32_t nCourseId,
                         const std::vector<unsigned char>& solution, CourseRecord& course,
                         uint64_t& nCost, CValidationState& state);

    bool ApplySubmission(CourseRecord& course, const CPlayerID& submitter, uint64_t nCost,
                         int64_t nTime, SubmissionResult& result, CValidationState& state);

    /** Check, then apply in one transaction; pCommitKey is consumed in the same transaction */
    bool ProcessSubmission(const CLedgerContext& ctx, const CPlayerID& submitter, uint32_t nCourseId,
                           const std::vector<unsigned char>& solution, const uint256* pCommitKey,
                           SubmissionResult& result, CValidationState& state);

    bool BeginWrite(CValidationState& state);
    bool CommitWrite(CValidationState& state);
    /** Roll back and turn a bare storage failure into db-write-failed */
    bool AbortWrite(CValidationState& state, const std::string& strDebug);

    void NotifySubmission(const SubmissionResult& result);

public:
    /**
     * @param admin     Identity allowed to add and configure courses (must not be null)
     * @param deployer  Solution deployer; defaults to CBytecodeDeployer
     */
    CSubmissionEngine(CLeaderboardDB& dbIn, const Consensus::Params& consensusIn, CCourseDirectory& directoryIn,
                      const CPlayerID& adminIn, std::shared_ptr<CSolutionDeployer> deployerIn = nullptr);

    // Administration

    /**
     * AddCourse - Register a new course
     *
     * @param ctx            ctx.caller must be the administrator
     * @param strCourseRef   Reference resolvable through the course directory
     * @param mask           Opcode allow-list
     * @param nCourseIdRet   Output: assigned id
     * @param state          Output: not-admin, bad-course-ref or db-write-failed
     */
    bool AddCourse(const CLedgerContext& ctx, const std::string& strCourseRef, const COpcodeMask& mask,
                   uint32_t& nCourseIdRet, CValidationState& state);

    bool SetAllowedOpcodes(const CLedgerContext& ctx, uint32_t nCourseId, const COpcodeMask& mask, CValidationState& state);

    /** Replace the validator used by every later submission */
    bool SetSolutionValidator(const CLedgerContext& ctx, std::shared_ptr<CSolutionValidator> validatorIn, CValidationState& state);

    // Submissions

    /**
     * Submit - Direct submission, credited to ctx.caller
     *
     * @param result  Output: outcome of an accepted submission
     * @param state   Output: bad-submitter, course-not-found, bad-solution-opcode, course-unavailable,
     *                the deployer's or course's rejection, or db-write-failed
     */
    bool Submit(const CLedgerContext& ctx, uint32_t nCourseId, const std::vector<unsigned char>& solution,
                SubmissionResult& result, CValidationState& state);

    /** Commit - Record ComputeCommitKey(ctx.caller, solution, salt) */
    bool Commit(const CLedgerContext& ctx, const uint256& commitKey, CValidationState& state);

    /**
     * Reveal - Submit a committed solution
     *
     * Any caller may relay the reveal. The key is recomputed for player and
     * must have been committed by that player; the submission is credited
     * to player and the commitment is consumed.
     */
    bool Reveal(const CLedgerContext& ctx, const CPlayerID& player, uint32_t nCourseId,
                const std::vector<unsigned char>& solution, const uint256& salt,
                SubmissionResult& result, CValidationState& state);

    // Listeners

    void RegisterListener(CLeaderboardInterface* listener);
    void UnregisterListener(CLeaderboardInterface* listener);

    // Queries

    bool GetCourse(uint32_t nCourseId, CourseRecord& course) const;
    Optional<ParRecord> GetPar(uint32_t nCourseId, const CPlayerID& player) const;
    std::vector<ParRecord> GetLeaderboard(uint32_t nCourseId) const;
    bool GetCommitment(const uint256& commitKey, CommitmentRecord& commitment) const;
    std::vector<CourseRecord> GetCourses() const;

    const CPlayerID& GetAdmin() const { return admin; }
    std::string GetValidatorName() const;
    const LeaderboardMetrics& GetMetrics() const { return metrics; }
};

/** Per-submission seed handed to the course: SHA256(hashEntropy || submitter) */
uint256 ComputeSubmissionSeed(const uint256& hashEntropy, const CPlayerID& submitter);

#endif // FAIRWAY_LEADERBOARD_ENGINE_H
