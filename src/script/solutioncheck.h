// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FAIRWAY_SCRIPT_SOLUTIONCHECK_H
#define FAIRWAY_SCRIPT_SOLUTIONCHECK_H

/**
 * Solution opcode check
 *
 * Walks solution bytecode once from offset 0. Every opcode byte must be
 * allowed by the course mask; the immediate operand of PUSH1..PUSH32 is
 * skipped without being classified. A push whose operand runs past the end
 * of the code is rejected. Empty code is valid.
 */

#include "script/opcodemask.h"

#include <memory>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

/** Where and why a solution failed the opcode check */
struct SolutionCheckFailure
{
    size_t nOffset{0};      //!< offset of the offending opcode
    uint8_t opcode{0};      //!< the offending opcode
    bool fTruncated{false}; //!< opcode allowed but its push operand is cut short

    std::string ToString() const;
};

/**
 * CheckSolutionOpcodes - Validate bytecode against an allow-list
 *
 * Stops at the first disallowed opcode.
 *
 * @param code      Solution bytecode
 * @param allowed   Course allow-list
 * @param failure   Output: details of the rejection (untouched on success)
 * @return          true if every opcode is allowed and no push is truncated
 */
bool CheckSolutionOpcodes(const std::vector<unsigned char>& code, const COpcodeMask& allowed, SolutionCheckFailure& failure);

/** Same verdict as CheckSolutionOpcodes without the diagnostics. Never throws. */
bool IsValidSolution(const std::vector<unsigned char>& code, const COpcodeMask& allowed);

/**
 * Pluggable solution validator held by the submission engine.
 * The administrator may swap the active implementation at runtime.
 */
class CSolutionValidator
{
public:
    virtual ~CSolutionValidator() = default;

    virtual bool IsValid(const std::vector<unsigned char>& code, const COpcodeMask& allowed) const = 0;
    virtual std::string GetName() const = 0;
};

/** Default validator: the single-pass opcode scan above */
class CBytecodeValidator : public CSolutionValidator
{
public:
    bool IsValid(const std::vector<unsigned char>& code, const COpcodeMask& allowed) const override;
    std::string GetName() const override { return "bytecode"; }
};

#endif // FAIRWAY_SCRIPT_SOLUTIONCHECK_H
