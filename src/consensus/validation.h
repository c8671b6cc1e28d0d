// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin developers
// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FAIRWAY_CONSENSUS_VALIDATION_H
#define FAIRWAY_CONSENSUS_VALIDATION_H

#include <string>

/** "reject" codes */
static const unsigned char REJECT_INVALID = 0x10;
static const unsigned char REJECT_DUPLICATE = 0x12;
static const unsigned char REJECT_UNAUTHORIZED = 0x13;
static const unsigned char REJECT_PREMATURE = 0x14;

/** Capture information about leaderboard operation validation */
class CValidationState
{
private:
    enum mode_state {
        MODE_VALID,   //!< everything ok
        MODE_INVALID, //!< request rejected by the leaderboard rules
        MODE_ERROR,   //!< run-time error
    } mode;
    unsigned int chRejectCode;
    std::string strRejectReason;
    std::string strDebugMessage;

public:
    CValidationState() : mode(MODE_VALID), chRejectCode(0) {}

    bool Invalid(bool ret = false,
        unsigned int _chRejectCode = 0,
        const std::string& _strRejectReason = "",
        const std::string& _strDebugMessage = "")
    {
        chRejectCode = _chRejectCode;
        strRejectReason = _strRejectReason;
        strDebugMessage = _strDebugMessage;
        if (mode == MODE_ERROR)
            return ret;
        mode = MODE_INVALID;
        return ret;
    }
    bool Error(const std::string& strRejectReasonIn, const std::string& strDebugMessageIn = "")
    {
        if (mode == MODE_VALID)
            strRejectReason = strRejectReasonIn;
        strDebugMessage = strDebugMessageIn;
        mode = MODE_ERROR;
        return false;
    }
    bool IsValid() const
    {
        return mode == MODE_VALID;
    }
    bool IsInvalid() const
    {
        return mode == MODE_INVALID;
    }
    bool IsError() const
    {
        return mode == MODE_ERROR;
    }
    unsigned int GetRejectCode() const { return chRejectCode; }
    std::string GetRejectReason() const { return strRejectReason; }
    std::string GetDebugMessage() const { return strDebugMessage; }
};

/** Convert CValidationState to a human-readable message for logging */
std::string FormatStateMessage(const CValidationState& state);

#endif // FAIRWAY_CONSENSUS_VALIDATION_H
