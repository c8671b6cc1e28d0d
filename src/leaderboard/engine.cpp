// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "leaderboard/engine.h"

#include "hash.h"
#include "leaderboard/leaderboarddb.h"
#include "leaderboard/notifications.h"
#include "logging.h"
#include "utilstrencodings.h"

#include <algorithm>
#include <stdexcept>

uint256 ComputeSubmissionSeed(const uint256& hashEntropy, const CPlayerID& submitter)
{
    CHashWriter ss(SER_GETHASH, 0);
    ss << hashEntropy << submitter;
    return ss.GetHash();
}

CSubmissionEngine::CSubmissionEngine(CLeaderboardDB& dbIn, const Consensus::Params& consensusIn, CCourseDirectory& directoryIn,
                                     const CPlayerID& adminIn, std::shared_ptr<CSolutionDeployer> deployerIn)
    : db(dbIn),
      consensus(consensusIn),
      directory(directoryIn),
      admin(adminIn),
      courses(dbIn, consensusIn),
      pars(dbIn),
      ledger(dbIn, consensusIn),
      validator(std::make_shared<CBytecodeValidator>()),
      deployer(std::move(deployerIn))
{
    if (admin.IsNull()) {
        throw std::runtime_error("CSubmissionEngine: administrator identity must not be null");
    }
    if (!deployer) {
        deployer = std::make_shared<CBytecodeDeployer>(consensus.nMaxSolutionSize);
    }
}

// =============================================================================
// Internal helpers
// =============================================================================

bool CSubmissionEngine::CheckAdmin(const CPlayerID& caller, CValidationState& state) const
{
    if (caller != admin) {
        return state.Invalid(false, REJECT_UNAUTHORIZED, "not-admin",
                             strprintf("caller %s", caller.ToString()));
    }
    return true;
}

bool CSubmissionEngine::BeginWrite(CValidationState& state)
{
    if (!db.TxnBegin()) {
        metrics.storageFailures++;
        return state.Error("db-write-failed", "cannot begin transaction");
    }
    return true;
}

bool CSubmissionEngine::CommitWrite(CValidationState& state)
{
    if (!db.TxnCommit()) {
        return AbortWrite(state, "cannot commit transaction");
    }
    return true;
}

bool CSubmissionEngine::AbortWrite(CValidationState& state, const std::string& strDebug)
{
    if (!db.TxnAbort()) {
        LogPrintf("CSubmissionEngine: rollback failed after: %s\n", strDebug);
    }
    metrics.storageFailures++;
    if (state.IsValid()) {
        return state.Error("db-write-failed", strDebug);
    }
    return false;
}

void CSubmissionEngine::NotifySubmission(const SubmissionResult& result)
{
    for (CLeaderboardInterface* listener : vListeners) {
        if (result.fKingChanged) {
            listener->KingChanged(result.nCourseId, result.previousKing, result.submitter, result.nCost);
        }
        listener->SubmissionAccepted(result);
    }
}

// =============================================================================
// Administration
// =============================================================================

bool CSubmissionEngine::AddCourse(const CLedgerContext& ctx, const std::string& strCourseRef, const COpcodeMask& mask,
                                  uint32_t& nCourseIdRet, CValidationState& state)
{
    LOCK(cs);

    if (!CheckAdmin(ctx.caller, state)) {
        return false;
    }
    if (strCourseRef.empty()) {
        return state.Invalid(false, REJECT_INVALID, "bad-course-ref", "empty course reference");
    }
    if (!directory.Resolve(strCourseRef)) {
        return state.Invalid(false, REJECT_INVALID, "bad-course-ref",
                             strprintf("unknown course reference %s", strCourseRef));
    }

    if (!BeginWrite(state)) {
        return false;
    }
    uint32_t nCourseId = 0;
    if (!courses.Register(strCourseRef, mask, ctx.nTime, nCourseId, state)) {
        return AbortWrite(state, "register course");
    }
    if (!CommitWrite(state)) {
        return false;
    }

    nCourseIdRet = nCourseId;
    metrics.coursesAdded++;
    LogPrintf("CSubmissionEngine: added course %u (%s)\n", nCourseId, strCourseRef);

    CourseRecord course;
    if (courses.Get(nCourseId, course)) {
        for (CLeaderboardInterface* listener : vListeners) {
            listener->CourseAdded(course);
        }
    }
    return true;
}

bool CSubmissionEngine::SetAllowedOpcodes(const CLedgerContext& ctx, uint32_t nCourseId, const COpcodeMask& mask, CValidationState& state)
{
    LOCK(cs);

    if (!CheckAdmin(ctx.caller, state)) {
        return false;
    }
    if (!courses.SetAllowedOpcodes(nCourseId, mask, state)) {
        if (state.IsError()) {
            metrics.storageFailures++;
        }
        return false;
    }

    LogPrint(FWLog::LEADERBOARD, "CSubmissionEngine: course %u allow-list now %u opcodes\n",
             nCourseId, mask.Count());
    for (CLeaderboardInterface* listener : vListeners) {
        listener->AllowedOpcodesChanged(nCourseId, mask);
    }
    return true;
}

bool CSubmissionEngine::SetSolutionValidator(const CLedgerContext& ctx, std::shared_ptr<CSolutionValidator> validatorIn, CValidationState& state)
{
    LOCK(cs);

    if (!CheckAdmin(ctx.caller, state)) {
        return false;
    }
    if (!validatorIn) {
        return state.Invalid(false, REJECT_INVALID, "bad-validator", "null validator");
    }

    LogPrintf("CSubmissionEngine: solution validator %s -> %s\n", validator->GetName(), validatorIn->GetName());
    validator = std::move(validatorIn);
    return true;
}

// =============================================================================
// Submissions
// =============================================================================

bool CSubmissionEngine::CheckSubmission(const CLedgerContext& ctx, const CPlayerID& submitter, uint32_t nCourseId,
                                        const std::vector<unsigned char>& solution, CourseRecord& course,
                                        uint64_t& nCost, CValidationState& state)
{
    if (!courses.Get(nCourseId, course)) {
        return state.Invalid(false, REJECT_INVALID, "course-not-found",
                             strprintf("course %u", nCourseId));
    }

    if (!validator->IsValid(solution, course.allowedOpcodes)) {
        SolutionCheckFailure failure;
        if (!CheckSolutionOpcodes(solution, course.allowedOpcodes, failure)) {
            LogPrint(FWLog::VALIDATOR, "CSubmissionEngine: course %u: %s\n", nCourseId, failure.ToString());
        }
        return state.Invalid(false, REJECT_INVALID, "bad-solution-opcode",
                             strprintf("course %u rejected by %s validator", nCourseId, validator->GetName()));
    }

    std::shared_ptr<CCourse> impl = directory.Resolve(course.strCourseRef);
    if (!impl) {
        return state.Invalid(false, REJECT_INVALID, "course-unavailable",
                             strprintf("course %u reference %s does not resolve", nCourseId, course.strCourseRef));
    }

    CSolutionTarget target;
    if (!deployer->Deploy(solution, target, state)) {
        return false;
    }

    const uint256 seed = ComputeSubmissionSeed(ctx.hashEntropy, submitter);
    nCost = 0;
    if (!impl->Run(target, seed, nCost, state)) {
        if (state.IsValid()) {
            return state.Invalid(false, REJECT_INVALID, "incorrect-solution",
                                 strprintf("course %s gave no reason", impl->GetName()));
        }
        return false;
    }
    return true;
}

bool CSubmissionEngine::ApplySubmission(CourseRecord& course, const CPlayerID& submitter, uint64_t nCost,
                                        int64_t nTime, SubmissionResult& result, CValidationState& state)
{
    result = SubmissionResult();
    result.nCourseId = course.nCourseId;
    result.submitter = submitter;
    result.nCost = nCost;
    result.previousKing = course.king;
    result.nPreviousCost = course.nLeadingCost;

    if (course.IsImprovement(nCost)) {
        course.nLeadingCost = nCost;
        course.king = submitter;
        course.nKingChanges++;
        result.fKingChanged = true;
    }
    course.nSolutions++;

    if (!courses.Update(course, state)) {
        return false;
    }

    bool fImproved = false;
    if (!pars.Upmint(submitter, course.nCourseId, nCost, nTime, fImproved)) {
        return state.Error("db-write-failed", strprintf("cannot update par on course %u", course.nCourseId));
    }
    result.fParImproved = fImproved;
    return true;
}

bool CSubmissionEngine::ProcessSubmission(const CLedgerContext& ctx, const CPlayerID& submitter, uint32_t nCourseId,
                                          const std::vector<unsigned char>& solution, const uint256* pCommitKey,
                                          SubmissionResult& result, CValidationState& state)
{
    CourseRecord course;
    uint64_t nCost = 0;
    if (submitter.IsNull()) {
        metrics.submissionsRejected++;
        return state.Invalid(false, REJECT_INVALID, "bad-submitter", "null submitter");
    }
    if (!CheckSubmission(ctx, submitter, nCourseId, solution, course, nCost, state)) {
        metrics.submissionsRejected++;
        LogPrint(FWLog::LEADERBOARD, "CSubmissionEngine: submission by %s to course %u rejected: %s\n",
                 submitter.ToString(), nCourseId, FormatStateMessage(state));
        return false;
    }

    if (!BeginWrite(state)) {
        return false;
    }
    SubmissionResult resultNew;
    if (!ApplySubmission(course, submitter, nCost, ctx.nTime, resultNew, state)) {
        return AbortWrite(state, "apply submission");
    }
    if (pCommitKey) {
        if (!ledger.MarkRevealed(*pCommitKey, ctx.nTime)) {
            return AbortWrite(state, strprintf("cannot consume commitment %s", pCommitKey->ToString()));
        }
        resultNew.fRevealed = true;
    }
    if (!CommitWrite(state)) {
        return false;
    }

    result = resultNew;
    metrics.submissionsAccepted++;
    if (result.fKingChanged) {
        metrics.kingChanges++;
        LogPrintf("CSubmissionEngine: course %u title %s -> %s at cost %u\n", result.nCourseId,
                  result.previousKing.ToString(), result.submitter.ToString(), result.nCost);
    }
    if (result.fParImproved) {
        metrics.parImprovements++;
    }
    LogPrint(FWLog::LEADERBOARD, "CSubmissionEngine: %s\n", result.ToString());

    NotifySubmission(result);
    return true;
}

bool CSubmissionEngine::Submit(const CLedgerContext& ctx, uint32_t nCourseId, const std::vector<unsigned char>& solution,
                               SubmissionResult& result, CValidationState& state)
{
    LOCK(cs);
    return ProcessSubmission(ctx, ctx.caller, nCourseId, solution, nullptr, result, state);
}

bool CSubmissionEngine::Commit(const CLedgerContext& ctx, const uint256& commitKey, CValidationState& state)
{
    LOCK(cs);

    if (!ledger.Commit(commitKey, ctx.caller, ctx.nTime, state)) {
        if (state.IsError()) {
            metrics.storageFailures++;
        }
        return false;
    }
    metrics.commitments++;

    CommitmentRecord commitment;
    if (ledger.GetCommitment(commitKey, commitment)) {
        for (CLeaderboardInterface* listener : vListeners) {
            listener->Committed(commitment);
        }
    }
    return true;
}

bool CSubmissionEngine::Reveal(const CLedgerContext& ctx, const CPlayerID& player, uint32_t nCourseId,
                               const std::vector<unsigned char>& solution, const uint256& salt,
                               SubmissionResult& result, CValidationState& state)
{
    LOCK(cs);

    const uint256 commitKey = ComputeCommitKey(player, solution, salt);
    if (!ledger.CheckRevealEligible(commitKey, player, ctx.nTime, state)) {
        metrics.revealsRejected++;
        LogPrint(FWLog::COMMIT, "CSubmissionEngine: reveal of %s refused: %s\n",
                 commitKey.ToString(), FormatStateMessage(state));
        return false;
    }

    if (!ProcessSubmission(ctx, player, nCourseId, solution, &commitKey, result, state)) {
        return false;
    }
    metrics.reveals++;
    LogPrint(FWLog::COMMIT, "CSubmissionEngine: %s revealed %s relayed by %s\n",
             player.ToString(), commitKey.ToString(), ctx.caller.ToString());
    return true;
}

// =============================================================================
// Listeners
// =============================================================================

void CSubmissionEngine::RegisterListener(CLeaderboardInterface* listener)
{
    LOCK(cs);
    if (listener && std::find(vListeners.begin(), vListeners.end(), listener) == vListeners.end()) {
        vListeners.push_back(listener);
    }
}

void CSubmissionEngine::UnregisterListener(CLeaderboardInterface* listener)
{
    LOCK(cs);
    vListeners.erase(std::remove(vListeners.begin(), vListeners.end(), listener), vListeners.end());
}

// =============================================================================
// Queries
// =============================================================================

bool CSubmissionEngine::GetCourse(uint32_t nCourseId, CourseRecord& course) const
{
    LOCK(cs);
    return courses.Get(nCourseId, course);
}

Optional<ParRecord> CSubmissionEngine::GetPar(uint32_t nCourseId, const CPlayerID& player) const
{
    LOCK(cs);
    return pars.GetPar(nCourseId, player);
}

std::vector<ParRecord> CSubmissionEngine::GetLeaderboard(uint32_t nCourseId) const
{
    LOCK(cs);
    return pars.GetLeaderboard(nCourseId);
}

bool CSubmissionEngine::GetCommitment(const uint256& commitKey, CommitmentRecord& commitment) const
{
    LOCK(cs);
    return ledger.GetCommitment(commitKey, commitment);
}

std::vector<CourseRecord> CSubmissionEngine::GetCourses() const
{
    LOCK(cs);
    std::vector<CourseRecord> vCourses;
    courses.ForEachCourse([&](const CourseRecord& course) {
        vCourses.push_back(course);
        return true;
    });
    return vCourses;
}

std::string CSubmissionEngine::GetValidatorName() const
{
    LOCK(cs);
    return validator->GetName();
}
