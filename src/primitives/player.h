// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FAIRWAY_PRIMITIVES_PLAYER_H
#define FAIRWAY_PRIMITIVES_PLAYER_H

#include "uint256.h"
#include "utilstrencodings.h"

#include <string>

/**
 * 160-bit contestant identity (an account address). The null value means
 * "nobody" and is never a valid submitter.
 */
typedef uint160 CPlayerID;

/** Parse a 40 digit hex identity (0x prefix optional). */
inline bool ParsePlayerID(const std::string& strIn, CPlayerID& playerRet)
{
    std::string str = TrimString(strIn);
    if (str.size() >= 2 && str[0] == '0' && ToLower(str[1]) == 'x')
        str = str.substr(2);
    if (str.size() != 40 || !IsHex(str))
        return false;
    playerRet = uint160S(str);
    return true;
}

#endif // FAIRWAY_PRIMITIVES_PLAYER_H
