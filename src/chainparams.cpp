// Copyright (c) 2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin developers
// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chainparams.h"

#include "utilstrencodings.h"

#include <assert.h>
#include <stdexcept>

const std::string CBaseChainParams::MAIN = "main";
const std::string CBaseChainParams::TESTNET = "test";
const std::string CBaseChainParams::REGTEST = "regtest";

std::string CBaseChainParams::DataDir(const std::string& chain)
{
    if (chain == MAIN)
        return "";
    else if (chain == TESTNET)
        return "testnet";
    else if (chain == REGTEST)
        return "regtest";
    throw std::runtime_error(strprintf("%s: Unknown chain %s.", __func__, chain));
}

void CChainParams::UpdateCommitMinAge(int64_t nCommitMinAge)
{
    if (!IsRegTestNet()) {
        throw std::runtime_error(strprintf("%s: commit age can only be changed on regtest", __func__));
    }
    if (nCommitMinAge < 0) {
        throw std::runtime_error(strprintf("%s: negative commit age %d", __func__, nCommitMinAge));
    }
    consensus.nCommitMinAge = nCommitMinAge;
}

/**
 * Main network
 */
class CMainParams : public CChainParams
{
public:
    CMainParams()
    {
        strNetworkID = CBaseChainParams::MAIN;

        consensus.nCommitMinAge = 60;           // one minute between commit and reveal
        consensus.nMaxSolutionSize = 24576;     // 24 KiB, EIP-170
        consensus.nFirstCourseId = 1;

        fDefaultConsistencyChecks = false;
    }
};

/**
 * Testnet
 */
class CTestNetParams : public CChainParams
{
public:
    CTestNetParams()
    {
        strNetworkID = CBaseChainParams::TESTNET;

        consensus.nCommitMinAge = 60;
        consensus.nMaxSolutionSize = 24576;
        consensus.nFirstCourseId = 1;

        fDefaultConsistencyChecks = false;
    }
};

/**
 * Regression test
 */
class CRegTestParams : public CChainParams
{
public:
    CRegTestParams()
    {
        strNetworkID = CBaseChainParams::REGTEST;

        consensus.nCommitMinAge = 60;           // overridable with -commitminage
        consensus.nMaxSolutionSize = 24576;
        consensus.nFirstCourseId = 1;

        fDefaultConsistencyChecks = true;
    }
};

static std::unique_ptr<CChainParams> globalChainParams;

const CChainParams& Params()
{
    assert(globalChainParams);
    return *globalChainParams;
}

std::unique_ptr<CChainParams> CreateChainParams(const std::string& chain)
{
    if (chain == CBaseChainParams::MAIN)
        return std::unique_ptr<CChainParams>(new CMainParams());
    else if (chain == CBaseChainParams::TESTNET)
        return std::unique_ptr<CChainParams>(new CTestNetParams());
    else if (chain == CBaseChainParams::REGTEST)
        return std::unique_ptr<CChainParams>(new CRegTestParams());
    throw std::runtime_error(strprintf("%s: Unknown chain %s.", __func__, chain));
}

void SelectParams(const std::string& network)
{
    globalChainParams = CreateChainParams(network);
}

void UpdateCommitMinAge(int64_t nCommitMinAge)
{
    globalChainParams->UpdateCommitMinAge(nCommitMinAge);
}
