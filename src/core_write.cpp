// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core_io.h"

#include "commit/commitment.h"
#include "leaderboard/leaderboard.h"
#include "script/opcodemask.h"
#include "script/opcodes.h"
#include "script/solutioncheck.h"
#include "utilstrencodings.h"
#include "utiltime.h"

#include <univalue.h>

namespace {

UniValue PlayerToUniv(const CPlayerID& player)
{
    if (player.IsNull()) {
        return NullUniValue;
    }
    return UniValue(player.ToString());
}

} // anonymous namespace

UniValue OpcodeMaskToJSON(const COpcodeMask& mask, bool fListOpcodes)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("hex", mask.GetHex());
    obj.pushKV("count", (int)mask.Count());
    if (fListOpcodes) {
        UniValue ops(UniValue::VARR);
        for (uint8_t op : mask.GetOpcodes()) {
            if (IsAssignedOpcode(op)) {
                ops.push_back(GetOpName(op));
            } else {
                ops.push_back(strprintf("0x%02x", (int)op));
            }
        }
        obj.pushKV("opcodes", ops);
    }
    return obj;
}

UniValue CourseToJSON(const CourseRecord& course)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("id", (int64_t)course.nCourseId);
    obj.pushKV("ref", course.strCourseRef);
    obj.pushKV("allowed", OpcodeMaskToJSON(course.allowedOpcodes, false));
    obj.pushKV("leading_cost", (int64_t)course.nLeadingCost);
    obj.pushKV("king", course.HasKing() ? PlayerToUniv(course.king) : NullUniValue);
    obj.pushKV("solutions", (int64_t)course.nSolutions);
    obj.pushKV("king_changes", (int64_t)course.nKingChanges);
    obj.pushKV("created", FormatISO8601DateTime(course.nCreateTime));
    return obj;
}

UniValue ParToJSON(const ParRecord& par)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("course", (int64_t)par.nCourseId);
    obj.pushKV("player", par.player.ToString());
    obj.pushKV("cost", (int64_t)par.nCost);
    obj.pushKV("solutions", (int64_t)par.nSolutions);
    obj.pushKV("updated", FormatISO8601DateTime(par.nUpdateTime));
    return obj;
}

UniValue CommitmentToJSON(const CommitmentRecord& commitment)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("key", commitment.commitKey.GetHex());
    obj.pushKV("committer", commitment.committer.ToString());
    obj.pushKV("time", commitment.nTime);
    obj.pushKV("revealed", commitment.fRevealed);
    if (commitment.fRevealed) {
        obj.pushKV("reveal_time", commitment.nRevealTime);
    }
    return obj;
}

UniValue SubmissionResultToJSON(const SubmissionResult& result)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("course", (int64_t)result.nCourseId);
    obj.pushKV("submitter", result.submitter.ToString());
    obj.pushKV("cost", (int64_t)result.nCost);
    obj.pushKV("king_changed", result.fKingChanged);
    obj.pushKV("previous_king", PlayerToUniv(result.previousKing));
    obj.pushKV("previous_cost", (int64_t)result.nPreviousCost);
    obj.pushKV("par_improved", result.fParImproved);
    obj.pushKV("revealed", result.fRevealed);
    return obj;
}

UniValue SolutionCheckToJSON(const std::vector<unsigned char>& code, const COpcodeMask& mask)
{
    UniValue obj(UniValue::VOBJ);
    SolutionCheckFailure failure;
    const bool fValid = CheckSolutionOpcodes(code, mask, failure);
    obj.pushKV("valid", fValid);
    obj.pushKV("size", (int64_t)code.size());
    if (!fValid) {
        obj.pushKV("offset", (int64_t)failure.nOffset);
        obj.pushKV("opcode", GetOpName(failure.opcode));
        obj.pushKV("reason", failure.fTruncated ? "truncated-push" : "disallowed-opcode");
    }
    return obj;
}
