// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FAIRWAY_SCRIPT_OPCODEMASK_H
#define FAIRWAY_SCRIPT_OPCODEMASK_H

#include "serialize.h"
#include "uint256.h"

#include <stdint.h>
#include <string>
#include <vector>

/**
 * COpcodeMask - per-course instruction allow-list
 *
 * A 256-bit set where bit i is set iff opcode byte i may appear in a
 * solution. The hex form is the 256-bit number most significant byte
 * first, so bit i is (mask >> i) & 1.
 */
class COpcodeMask
{
private:
    uint256 bits;

public:
    COpcodeMask() {}
    explicit COpcodeMask(const uint256& bitsIn) : bits(bitsIn) {}

    /** Every opcode allowed */
    static COpcodeMask Full();
    static COpcodeMask FromOpcodes(const std::vector<uint8_t>& vOpcodes);
    /** Parse a hex number (optional 0x, at most 64 digits); false on malformed input */
    static bool FromHex(const std::string& strHex, COpcodeMask& maskRet);

    bool Allows(uint8_t opcode) const
    {
        return (bits.begin()[opcode >> 3] >> (opcode & 7)) & 1;
    }
    void Set(uint8_t opcode)
    {
        bits.begin()[opcode >> 3] |= (uint8_t)(1 << (opcode & 7));
    }
    void Clear(uint8_t opcode)
    {
        bits.begin()[opcode >> 3] &= (uint8_t)~(1 << (opcode & 7));
    }
    /** Set every opcode in [first, last] */
    void SetRange(uint8_t first, uint8_t last);

    unsigned int Count() const;
    bool IsNull() const { return bits.IsNull(); }
    bool IsFull() const;

    /** Allowed opcodes in ascending order */
    std::vector<uint8_t> GetOpcodes() const;

    const uint256& GetBits() const { return bits; }
    std::string GetHex() const { return bits.GetHex(); }
    /** Space separated mnemonics of the allowed opcodes, unassigned bytes as 0x.. */
    std::string ToString() const;

    friend bool operator==(const COpcodeMask& a, const COpcodeMask& b) { return a.bits == b.bits; }
    friend bool operator!=(const COpcodeMask& a, const COpcodeMask& b) { return a.bits != b.bits; }

    SERIALIZE_METHODS(COpcodeMask, obj) { READWRITE(obj.bits); }
};

#endif // FAIRWAY_SCRIPT_OPCODEMASK_H
