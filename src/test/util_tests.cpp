// Copyright (c) 2011-2016 The Bitcoin Core developers
// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chainparams.h"
#include "core_io.h"
#include "leaderboard/leaderboard.h"
#include "logging.h"
#include "primitives/player.h"
#include "script/opcodes.h"
#include "test/test_fairway.h"
#include "util/system.h"
#include "utilstrencodings.h"
#include "utiltime.h"

#include <sstream>

#include <boost/test/unit_test.hpp>
#include <univalue.h>

BOOST_FIXTURE_TEST_SUITE(util_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(util_ParseParameters)
{
    ArgsManager args;
    std::string error;
    const char* argv_test[] = {"-ignored", "-a", "-b", "-ccc=argument", "-ccc=multiple", "f", "-d=e"};

    BOOST_CHECK(args.ParseParameters(0, (char**)argv_test, error));
    BOOST_CHECK(!args.IsArgSet("-a"));

    BOOST_CHECK(args.ParseParameters(7, (char**)argv_test, error));
    // expectation: -ignored is ignored (program name argument),
    // -a, -b and -ccc end up in map, -d ignored because it is after
    // a non-option argument (non-GNU option parsing)
    BOOST_CHECK(args.IsArgSet("-a") && args.IsArgSet("-b") && args.IsArgSet("-ccc"));
    BOOST_CHECK(!args.IsArgSet("f") && !args.IsArgSet("-d"));
    BOOST_CHECK_EQUAL(args.GetArgs("-ccc").size(), 2U);
    BOOST_CHECK_EQUAL(args.GetArg("-ccc", ""), "multiple");
    BOOST_CHECK_EQUAL(args.GetArg("-a", "xxx"), "");

    const char* argv_bad[] = {"-ignored", "-"};
    BOOST_CHECK(!args.ParseParameters(2, (char**)argv_bad, error));
}

BOOST_AUTO_TEST_CASE(util_GetBoolArg_negation)
{
    ArgsManager args;
    std::string error;
    const char* argv_test[] = {"ignored", "-a", "-nob", "-c=0", "-d=1", "-nodebuglogfile", "-nof=0"};
    BOOST_CHECK(args.ParseParameters(7, (char**)argv_test, error));

    BOOST_CHECK(args.GetBoolArg("-a", false));
    BOOST_CHECK(!args.GetBoolArg("-b", true));
    BOOST_CHECK(!args.GetBoolArg("-c", true));
    BOOST_CHECK(args.GetBoolArg("-d", false));
    BOOST_CHECK(args.GetBoolArg("-f", false));
    BOOST_CHECK(args.GetBoolArg("-unset", true));

    BOOST_CHECK(args.IsArgNegated("-b"));
    BOOST_CHECK(args.IsArgNegated("-debuglogfile"));
    BOOST_CHECK(!args.IsArgNegated("-a"));
    BOOST_CHECK(!args.IsArgNegated("-f"));
}

BOOST_AUTO_TEST_CASE(util_GetIntArg)
{
    ArgsManager args;
    std::string error;
    const char* argv_test[] = {"ignored", "-commitminage=5", "-bad=x", "-neg=-12"};
    BOOST_CHECK(args.ParseParameters(4, (char**)argv_test, error));
    BOOST_CHECK_EQUAL(args.GetIntArg("-commitminage", 60), 5);
    BOOST_CHECK_EQUAL(args.GetIntArg("-bad", 7), 0);
    BOOST_CHECK_EQUAL(args.GetIntArg("-neg", 0), -12);
    BOOST_CHECK_EQUAL(args.GetIntArg("-missing", 7), 7);
}

BOOST_AUTO_TEST_CASE(util_ReadConfigStream)
{
    const std::string str_config =
        "a=\n"
        "b=1\n"
        "ccc=argument\n"
        "ccc=multiple\n"
        "# comment\n"
        "debug=leaderboard   # trailing comment\n"
        "nofff=1\n";

    std::istringstream streamConfig(str_config);
    ArgsManager args;
    std::string error;
    BOOST_CHECK(args.ReadConfigStream(streamConfig, error));

    BOOST_CHECK(args.IsArgSet("-a"));
    BOOST_CHECK(args.GetBoolArg("-b", false));
    BOOST_CHECK_EQUAL(args.GetArg("-ccc", ""), "multiple");
    BOOST_CHECK_EQUAL(args.GetArg("-debug", ""), "leaderboard");
    BOOST_CHECK(!args.GetBoolArg("-fff", true));

    // Command line overrides the config file
    const char* argv_test[] = {"ignored", "-ccc=cmdline"};
    BOOST_CHECK(args.ParseParameters(2, (char**)argv_test, error));
    BOOST_CHECK_EQUAL(args.GetArg("-ccc", ""), "cmdline");

    std::istringstream streamBad("-leadingdash=1\n");
    BOOST_CHECK(!args.ReadConfigStream(streamBad, error));
}

BOOST_AUTO_TEST_CASE(util_SoftSetArg)
{
    ArgsManager args;
    BOOST_CHECK(args.SoftSetArg("-x", "1"));
    BOOST_CHECK(!args.SoftSetArg("-x", "2"));
    BOOST_CHECK_EQUAL(args.GetArg("-x", ""), "1");
    args.ForceSetArg("-x", "3");
    BOOST_CHECK_EQUAL(args.GetArg("-x", ""), "3");
    BOOST_CHECK(args.SoftSetBoolArg("-y", false));
    BOOST_CHECK(!args.GetBoolArg("-y", true));
    args.ClearArgs();
    BOOST_CHECK(!args.IsArgSet("-x"));
}

BOOST_AUTO_TEST_CASE(util_GetChainName)
{
    ArgsManager args;
    std::string error;
    BOOST_CHECK_EQUAL(args.GetChainName(), CBaseChainParams::MAIN);

    const char* argv_regtest[] = {"ignored", "-regtest"};
    BOOST_CHECK(args.ParseParameters(2, (char**)argv_regtest, error));
    BOOST_CHECK_EQUAL(args.GetChainName(), CBaseChainParams::REGTEST);

    const char* argv_testnet[] = {"ignored", "-testnet"};
    BOOST_CHECK(args.ParseParameters(2, (char**)argv_testnet, error));
    BOOST_CHECK_EQUAL(args.GetChainName(), CBaseChainParams::TESTNET);

    const char* argv_both[] = {"ignored", "-testnet", "-regtest"};
    BOOST_CHECK(args.ParseParameters(3, (char**)argv_both, error));
    BOOST_CHECK_THROW(args.GetChainName(), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(chainparams_networks)
{
    SelectParams(CBaseChainParams::MAIN);
    BOOST_CHECK_EQUAL(Params().NetworkIDString(), "main");
    BOOST_CHECK_EQUAL(Params().GetConsensus().nCommitMinAge, 60);
    BOOST_CHECK_EQUAL(Params().GetConsensus().nMaxSolutionSize, 24576U);
    BOOST_CHECK_EQUAL(Params().GetConsensus().nFirstCourseId, 1U);
    BOOST_CHECK(!Params().DefaultConsistencyChecks());
    BOOST_CHECK_THROW(UpdateCommitMinAge(5), std::runtime_error);

    SelectParams(CBaseChainParams::REGTEST);
    BOOST_CHECK(Params().IsRegTestNet());
    UpdateCommitMinAge(5);
    BOOST_CHECK_EQUAL(Params().GetConsensus().nCommitMinAge, 5);
    BOOST_CHECK_THROW(UpdateCommitMinAge(-1), std::runtime_error);

    BOOST_CHECK(Params().GetConsensus().IsCommitMature(100, 105));
    BOOST_CHECK(!Params().GetConsensus().IsCommitMature(100, 104));

    BOOST_CHECK_THROW(SelectParams("nonexistent"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(util_ParsePlayerID)
{
    CPlayerID player;
    BOOST_CHECK(ParsePlayerID("0x00000000000000000000000000000000000000a1", player));
    BOOST_CHECK_EQUAL(player.GetHex(), "00000000000000000000000000000000000000a1");
    BOOST_CHECK(ParsePlayerID(" 00000000000000000000000000000000000000A1 ", player));
    BOOST_CHECK(!ParsePlayerID("a1", player));
    BOOST_CHECK(!ParsePlayerID("0x00000000000000000000000000000000000000zz", player));
    BOOST_CHECK(!ParsePlayerID("", player));
}

BOOST_AUTO_TEST_CASE(util_FormatISO8601DateTime)
{
    BOOST_CHECK_EQUAL(FormatISO8601DateTime(1317425777), "2011-09-30T23:36:17Z");
    BOOST_CHECK_EQUAL(FormatISO8601Date(1317425777), "2011-09-30");
}

BOOST_AUTO_TEST_CASE(util_mocktime)
{
    SetMockTime(111);
    BOOST_CHECK_EQUAL(GetTime(), 111);
    BOOST_CHECK_EQUAL(GetMockTime(), 111);
}

BOOST_AUTO_TEST_CASE(logging_categories)
{
    FWLog::LogFlags flag;
    BOOST_CHECK(GetLogCategory(flag, "leaderboard"));
    BOOST_CHECK_EQUAL(flag, FWLog::LEADERBOARD);
    BOOST_CHECK(GetLogCategory(flag, "commit"));
    BOOST_CHECK(!GetLogCategory(flag, "bogus"));

    FWLog::Logger& logger = LogInstance();
    logger.DisableCategory(FWLog::ALL);
    BOOST_CHECK(!LogAcceptCategory(FWLog::VALIDATOR));
    BOOST_CHECK(logger.EnableCategory("validator"));
    BOOST_CHECK(LogAcceptCategory(FWLog::VALIDATOR));
    BOOST_CHECK(!LogAcceptCategory(FWLog::DB));

    // Callbacks see formatted lines
    std::vector<std::string> vLines;
    auto it = logger.PushBackCallback([&](const std::string& s) { vLines.push_back(s); });
    LogPrintf("hello %s %d\n", "fairway", 7);
    LogPrint(FWLog::DB, "not shown\n");
    LogPrint(FWLog::VALIDATOR, "shown\n");
    logger.DeleteCallback(it);
    logger.DisableCategory(FWLog::ALL);

    BOOST_REQUIRE_EQUAL(vLines.size(), 2U);
    BOOST_CHECK(vLines[0].find("hello fairway 7") != std::string::npos);
    BOOST_CHECK(vLines[1].find("shown") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(core_write_json)
{
    CourseRecord course;
    course.nCourseId = 2;
    course.strCourseRef = "sort";
    course.allowedOpcodes = COpcodeMask::FromOpcodes({OP_ADD, OP_PUSH1});

    UniValue obj = CourseToJSON(course);
    BOOST_CHECK_EQUAL(obj["id"].get_int64(), 2);
    BOOST_CHECK_EQUAL(obj["ref"].get_str(), "sort");
    BOOST_CHECK(obj["king"].isNull());
    BOOST_CHECK_EQUAL(obj["allowed"]["count"].get_int(), 2);

    UniValue mask = OpcodeMaskToJSON(course.allowedOpcodes);
    BOOST_REQUIRE_EQUAL(mask["opcodes"].size(), 2U);
    BOOST_CHECK_EQUAL(mask["opcodes"][0].get_str(), "ADD");
    BOOST_CHECK_EQUAL(mask["opcodes"][1].get_str(), "PUSH1");

    COpcodeMask maskNo55 = COpcodeMask::Full();
    maskNo55.Clear(0x55);
    UniValue check = SolutionCheckToJSON(ParseHex("605500"), maskNo55);
    BOOST_CHECK(check["valid"].get_bool());
    check = SolutionCheckToJSON(ParseHex("600155"), maskNo55);
    BOOST_CHECK(!check["valid"].get_bool());
    BOOST_CHECK_EQUAL(check["offset"].get_int64(), 2);
    BOOST_CHECK_EQUAL(check["reason"].get_str(), "disallowed-opcode");

    SubmissionResult result;
    result.nCourseId = 2;
    result.submitter = TestPlayer(1);
    result.nCost = 40;
    result.fKingChanged = true;
    UniValue res = SubmissionResultToJSON(result);
    BOOST_CHECK(res["king_changed"].get_bool());
    BOOST_CHECK(res["previous_king"].isNull());
    BOOST_CHECK_EQUAL(res["submitter"].get_str(), TestPlayer(1).ToString());
}

BOOST_AUTO_TEST_SUITE_END()
