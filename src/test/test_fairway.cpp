// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#define BOOST_TEST_MODULE Fairway Test Suite

#include "test/test_fairway.h"

#include "chainparams.h"
#include "logging.h"
#include "util/system.h"
#include "utiltime.h"

#include <boost/test/unit_test.hpp>

// Arbitrary fixed start time for mock clocks
static const int64_t TEST_START_TIME = 1700000000;

CPlayerID TestPlayer(unsigned char n)
{
    return CPlayerID(std::vector<unsigned char>(20, n));
}

BasicTestingSetup::BasicTestingSetup(const std::string& chainName)
{
    gArgs.ClearArgs();
    ClearDatadirCache();
    SelectParams(chainName);
    SetMockTime(TEST_START_TIME);
    LogInstance().m_print_to_console = false;

    m_path_root = fs::temp_directory_path() / "test_fairway" / fs::unique_path();
    fs::create_directories(m_path_root);
    gArgs.ForceSetArg("-datadir", m_path_root.string());
}

BasicTestingSetup::~BasicTestingSetup()
{
    LogInstance().DisconnectTestLogger();
    SetMockTime(0);
    gArgs.ClearArgs();
    ClearDatadirCache();
    fs::remove_all(m_path_root);
}

bool MockCourse::Run(const CSolutionTarget& target, const uint256& seed, uint64_t& nCost, CValidationState& state)
{
    nRuns++;
    lastSeed = seed;
    lastCodeHash = target.hashCode;

    if (setRejected.count(target.code)) {
        return state.Invalid(false, REJECT_INVALID, "incorrect-solution", "scripted rejection");
    }
    auto it = mapCosts.find(target.code);
    nCost = it != mapCosts.end() ? it->second : target.code.size();
    return true;
}

LeaderboardTestingSetup::LeaderboardTestingSetup()
    : admin(TestPlayer(0xad)),
      db(new CLeaderboardDB("", true /* fMemory */)),
      course(std::make_shared<MockCourse>())
{
    BOOST_REQUIRE(directory.RegisterCourse("mock", course));
    engine.reset(new CSubmissionEngine(*db, Params().GetConsensus(), directory, admin));
}

LeaderboardTestingSetup::~LeaderboardTestingSetup()
{
    engine.reset();
    db.reset();
}

CLedgerContext LeaderboardTestingSetup::Ctx(const CPlayerID& caller) const
{
    return CLedgerContext(caller, GetTime());
}

uint32_t LeaderboardTestingSetup::AddMockCourse(const COpcodeMask& mask)
{
    uint32_t nCourseId = 0;
    CValidationState state;
    BOOST_REQUIRE_MESSAGE(engine->AddCourse(Ctx(admin), "mock", mask, nCourseId, state), FormatStateMessage(state));
    return nCourseId;
}
