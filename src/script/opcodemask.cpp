// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "script/opcodemask.h"

#include "script/opcodes.h"
#include "utilstrencodings.h"

COpcodeMask COpcodeMask::Full()
{
    COpcodeMask mask;
    mask.SetRange(0x00, 0xff);
    return mask;
}

COpcodeMask COpcodeMask::FromOpcodes(const std::vector<uint8_t>& vOpcodes)
{
    COpcodeMask mask;
    for (uint8_t opcode : vOpcodes) {
        mask.Set(opcode);
    }
    return mask;
}

bool COpcodeMask::FromHex(const std::string& strHexIn, COpcodeMask& maskRet)
{
    std::string strHex = TrimString(strHexIn);
    if (strHex.size() >= 2 && strHex[0] == '0' && ToLower(strHex[1]) == 'x')
        strHex = strHex.substr(2);
    if (strHex.empty() || strHex.size() > 64)
        return false;
    for (char c : strHex) {
        if (HexDigit(c) < 0)
            return false;
    }
    maskRet = COpcodeMask(uint256S(strHex));
    return true;
}

void COpcodeMask::SetRange(uint8_t first, uint8_t last)
{
    for (unsigned int op = first; op <= last; op++) {
        Set(op);
    }
}

unsigned int COpcodeMask::Count() const
{
    unsigned int nCount = 0;
    for (const unsigned char* p = bits.begin(); p != bits.end(); ++p) {
        for (unsigned char b = *p; b; b &= b - 1) {
            nCount++;
        }
    }
    return nCount;
}

bool COpcodeMask::IsFull() const
{
    return Count() == 256;
}

std::vector<uint8_t> COpcodeMask::GetOpcodes() const
{
    std::vector<uint8_t> vOpcodes;
    for (unsigned int op = 0; op <= 0xff; op++) {
        if (Allows(op))
            vOpcodes.push_back(op);
    }
    return vOpcodes;
}

std::string COpcodeMask::ToString() const
{
    std::string str;
    for (uint8_t op : GetOpcodes()) {
        if (!str.empty())
            str += " ";
        str += IsAssignedOpcode(op) ? GetOpName(op) : strprintf("0x%02x", (int)op);
    }
    return str;
}
