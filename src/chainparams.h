// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin developers
// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FAIRWAY_CHAINPARAMS_H
#define FAIRWAY_CHAINPARAMS_H

#include "chainparamsbase.h"
#include "consensus/params.h"

#include <memory>
#include <string>

/**
 * CChainParams defines various tweakable parameters of a given instance of the
 * leaderboard. There are three: the main network that results are published
 * on, a public test network that gets reset from time to time and a
 * regression test mode which is intended for private deployments and unit
 * tests, where the commit age can be tuned.
 */
class CChainParams
{
public:
    const Consensus::Params& GetConsensus() const { return consensus; }

    /** Default value for -checkdb */
    bool DefaultConsistencyChecks() const { return fDefaultConsistencyChecks; }
    /** Return the network string */
    std::string NetworkIDString() const { return strNetworkID; }
    bool IsRegTestNet() const { return NetworkIDString() == CBaseChainParams::REGTEST; }
    bool IsTestnet() const { return NetworkIDString() == CBaseChainParams::TESTNET; }

    void UpdateCommitMinAge(int64_t nCommitMinAge);

protected:
    CChainParams() {}

    std::string strNetworkID;
    Consensus::Params consensus;
    bool fDefaultConsistencyChecks;
};

/**
 * Creates and returns a std::unique_ptr<CChainParams> of the chosen chain.
 * @returns a CChainParams* of the chosen chain.
 * @throws a std::runtime_error if the chain is not supported.
 */
std::unique_ptr<CChainParams> CreateChainParams(const std::string& chain);

/**
 * Return the currently selected parameters. This won't change after app
 * startup, except for unit tests.
 */
const CChainParams& Params();

/**
 * Sets the params returned by Params() to those for the given network.
 */
void SelectParams(const std::string& chain);

/**
 * Allows modifying the commit minimum age (regtest only).
 * @throws a std::runtime_error on any other network.
 */
void UpdateCommitMinAge(int64_t nCommitMinAge);

#endif // FAIRWAY_CHAINPARAMS_H
