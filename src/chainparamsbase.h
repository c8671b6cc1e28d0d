// Copyright (c) 2014-2015 The Bitcoin developers
// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FAIRWAY_CHAINPARAMSBASE_H
#define FAIRWAY_CHAINPARAMSBASE_H

#include <string>

/**
 * Network names selectable with -testnet / -regtest.
 */
class CBaseChainParams
{
public:
    /** Chain name strings */
    static const std::string MAIN;
    static const std::string TESTNET;
    static const std::string REGTEST;

    /** Sub-directory of the data directory holding this network's state. */
    static std::string DataDir(const std::string& chain);
};

#endif // FAIRWAY_CHAINPARAMSBASE_H
