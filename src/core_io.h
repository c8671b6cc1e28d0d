// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FAIRWAY_CORE_IO_H
#define FAIRWAY_CORE_IO_H

#include <string>
#include <vector>

class COpcodeMask;
class UniValue;
struct CommitmentRecord;
struct CourseRecord;
struct ParRecord;
struct SubmissionResult;

// core_write.cpp
UniValue OpcodeMaskToJSON(const COpcodeMask& mask, bool fListOpcodes = true);
UniValue CourseToJSON(const CourseRecord& course);
UniValue ParToJSON(const ParRecord& par);
UniValue CommitmentToJSON(const CommitmentRecord& commitment);
UniValue SubmissionResultToJSON(const SubmissionResult& result);
/** Verdict of the opcode scan, with the failing offset when rejected */
UniValue SolutionCheckToJSON(const std::vector<unsigned char>& code, const COpcodeMask& mask);

#endif // FAIRWAY_CORE_IO_H
