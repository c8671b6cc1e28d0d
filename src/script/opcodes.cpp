// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "script/opcodes.h"

#include "utilstrencodings.h"

#include <map>

// Immediate operand length per opcode byte. Rows are 0x00..0xff in steps of 16.
static const uint8_t vOperandSize[256] =
{
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,          // 0x00
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,          // 0x10
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,          // 0x20
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,          // 0x30
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,          // 0x40
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,          // 0x50 (PUSH0 = 0x5f)
    1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 16,   // 0x60 PUSH1..PUSH16
    17, 18, 19, 20, 21, 22, 23, 24, 25, 26, 27, 28, 29, 30, 31, 32, // 0x70 PUSH17..PUSH32
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,          // 0x80
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,          // 0x90
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,          // 0xa0
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,          // 0xb0
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,          // 0xc0
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,          // 0xd0
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,          // 0xe0
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,          // 0xf0
};

unsigned int GetOperandSize(uint8_t opcode)
{
    return vOperandSize[opcode];
}

std::string GetOpName(uint8_t opcode)
{
    if (opcode >= OP_PUSH1 && opcode <= OP_PUSH32)
        return strprintf("PUSH%d", opcode - OP_PUSH0);
    if (opcode >= OP_DUP1 && opcode <= OP_DUP16)
        return strprintf("DUP%d", opcode - OP_DUP1 + 1);
    if (opcode >= OP_SWAP1 && opcode <= OP_SWAP16)
        return strprintf("SWAP%d", opcode - OP_SWAP1 + 1);
    if (opcode >= OP_LOG0 && opcode <= OP_LOG4)
        return strprintf("LOG%d", opcode - OP_LOG0);

    switch ((opcodetype)opcode) {
    // stop and arithmetic
    case OP_STOP                   : return "STOP";
    case OP_ADD                    : return "ADD";
    case OP_MUL                    : return "MUL";
    case OP_SUB                    : return "SUB";
    case OP_DIV                    : return "DIV";
    case OP_SDIV                   : return "SDIV";
    case OP_MOD                    : return "MOD";
    case OP_SMOD                   : return "SMOD";
    case OP_ADDMOD                 : return "ADDMOD";
    case OP_MULMOD                 : return "MULMOD";
    case OP_EXP                    : return "EXP";
    case OP_SIGNEXTEND             : return "SIGNEXTEND";

    // comparison and bitwise logic
    case OP_LT                     : return "LT";
    case OP_GT                     : return "GT";
    case OP_SLT                    : return "SLT";
    case OP_SGT                    : return "SGT";
    case OP_EQ                     : return "EQ";
    case OP_ISZERO                 : return "ISZERO";
    case OP_AND                    : return "AND";
    case OP_OR                     : return "OR";
    case OP_XOR                    : return "XOR";
    case OP_NOT                    : return "NOT";
    case OP_BYTE                   : return "BYTE";
    case OP_SHL                    : return "SHL";
    case OP_SHR                    : return "SHR";
    case OP_SAR                    : return "SAR";

    case OP_KECCAK256              : return "KECCAK256";

    // environment
    case OP_ADDRESS                : return "ADDRESS";
    case OP_BALANCE                : return "BALANCE";
    case OP_ORIGIN                 : return "ORIGIN";
    case OP_CALLER                 : return "CALLER";
    case OP_CALLVALUE              : return "CALLVALUE";
    case OP_CALLDATALOAD           : return "CALLDATALOAD";
    case OP_CALLDATASIZE           : return "CALLDATASIZE";
    case OP_CALLDATACOPY           : return "CALLDATACOPY";
    case OP_CODESIZE               : return "CODESIZE";
    case OP_CODECOPY               : return "CODECOPY";
    case OP_GASPRICE               : return "GASPRICE";
    case OP_EXTCODESIZE            : return "EXTCODESIZE";
    case OP_EXTCODECOPY            : return "EXTCODECOPY";
    case OP_RETURNDATASIZE         : return "RETURNDATASIZE";
    case OP_RETURNDATACOPY         : return "RETURNDATACOPY";
    case OP_EXTCODEHASH            : return "EXTCODEHASH";

    // block information
    case OP_BLOCKHASH              : return "BLOCKHASH";
    case OP_COINBASE               : return "COINBASE";
    case OP_TIMESTAMP              : return "TIMESTAMP";
    case OP_NUMBER                 : return "NUMBER";
    case OP_PREVRANDAO             : return "PREVRANDAO";
    case OP_GASLIMIT               : return "GASLIMIT";
    case OP_CHAINID                : return "CHAINID";
    case OP_SELFBALANCE            : return "SELFBALANCE";
    case OP_BASEFEE                : return "BASEFEE";
    case OP_BLOBHASH               : return "BLOBHASH";
    case OP_BLOBBASEFEE            : return "BLOBBASEFEE";

    // stack, memory, storage and flow
    case OP_POP                    : return "POP";
    case OP_MLOAD                  : return "MLOAD";
    case OP_MSTORE                 : return "MSTORE";
    case OP_MSTORE8                : return "MSTORE8";
    case OP_SLOAD                  : return "SLOAD";
    case OP_SSTORE                 : return "SSTORE";
    case OP_JUMP                   : return "JUMP";
    case OP_JUMPI                  : return "JUMPI";
    case OP_PC                     : return "PC";
    case OP_MSIZE                  : return "MSIZE";
    case OP_GAS                    : return "GAS";
    case OP_JUMPDEST               : return "JUMPDEST";
    case OP_TLOAD                  : return "TLOAD";
    case OP_TSTORE                 : return "TSTORE";
    case OP_MCOPY                  : return "MCOPY";
    case OP_PUSH0                  : return "PUSH0";

    // system
    case OP_CREATE                 : return "CREATE";
    case OP_CALL                   : return "CALL";
    case OP_CALLCODE               : return "CALLCODE";
    case OP_RETURN                 : return "RETURN";
    case OP_DELEGATECALL           : return "DELEGATECALL";
    case OP_CREATE2                : return "CREATE2";
    case OP_STATICCALL             : return "STATICCALL";
    case OP_REVERT                 : return "REVERT";
    case OP_INVALID                : return "INVALID";
    case OP_SELFDESTRUCT           : return "SELFDESTRUCT";

    default:
        return "INVALID";
    }
}

bool IsAssignedOpcode(uint8_t opcode)
{
    return opcode == OP_INVALID || GetOpName(opcode) != "INVALID";
}

static std::map<std::string, uint8_t> BuildOpNameMap()
{
    std::map<std::string, uint8_t> mapOpNames;
    for (unsigned int op = 0; op <= 0xff; op++) {
        if (!IsAssignedOpcode(op))
            continue;
        std::string strName = ToLower(GetOpName(op));
        mapOpNames[strName] = op;
        mapOpNames["op_" + strName] = op;
    }
    // Pre-Paris spellings
    mapOpNames["sha3"] = OP_KECCAK256;
    mapOpNames["difficulty"] = OP_PREVRANDAO;
    return mapOpNames;
}

bool ParseOpcode(const std::string& strNameIn, uint8_t& opcodeRet)
{
    static const std::map<std::string, uint8_t> mapOpNames = BuildOpNameMap();

    std::string strName = ToLower(TrimString(strNameIn));
    if (strName.size() == 4 && strName[0] == '0' && strName[1] == 'x' && IsHex(strName.substr(2))) {
        opcodeRet = ParseHex(strName.substr(2))[0];
        return true;
    }

    auto it = mapOpNames.find(strName);
    if (it == mapOpNames.end())
        return false;
    opcodeRet = it->second;
    return true;
}
