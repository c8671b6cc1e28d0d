// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "script/solutioncheck.h"

#include "logging.h"
#include "script/opcodes.h"
#include "utilstrencodings.h"

std::string SolutionCheckFailure::ToString() const
{
    return strprintf("%s %s at offset %u",
        fTruncated ? "truncated" : "disallowed",
        GetOpName(opcode), nOffset);
}

bool CheckSolutionOpcodes(const std::vector<unsigned char>& code, const COpcodeMask& allowed, SolutionCheckFailure& failure)
{
    const size_t nSize = code.size();
    size_t pc = 0;

    while (pc < nSize) {
        const uint8_t opcode = code[pc];
        if (!allowed.Allows(opcode)) {
            failure.nOffset = pc;
            failure.opcode = opcode;
            failure.fTruncated = false;
            return false;
        }

        // Operand must lie entirely inside the code
        const size_t nOperand = GetOperandSize(opcode);
        if (nOperand > nSize - pc - 1) {
            failure.nOffset = pc;
            failure.opcode = opcode;
            failure.fTruncated = true;
            return false;
        }
        pc += 1 + nOperand;
    }

    return true;
}

bool IsValidSolution(const std::vector<unsigned char>& code, const COpcodeMask& allowed)
{
    SolutionCheckFailure failure;
    return CheckSolutionOpcodes(code, allowed, failure);
}

bool CBytecodeValidator::IsValid(const std::vector<unsigned char>& code, const COpcodeMask& allowed) const
{
    SolutionCheckFailure failure;
    if (!CheckSolutionOpcodes(code, allowed, failure)) {
        LogPrint(FWLog::VALIDATOR, "CBytecodeValidator: rejected %u-byte solution: %s\n", code.size(), failure.ToString());
        return false;
    }
    return true;
}
