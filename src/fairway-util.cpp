// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin developers
// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chainparams.h"
#include "chainparamsbase.h"
#include "commit/commitment.h"
#include "core_io.h"
#include "db/sqlitedb.h"
#include "fs.h"
#include "leaderboard/leaderboarddb.h"
#include "logging.h"
#include "script/opcodemask.h"
#include "script/opcodes.h"
#include "util/system.h"
#include "utilstrencodings.h"
#include "version.h"

#include <univalue.h>

#include <cstdio>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

static const int CONTINUE_EXECUTION = -1;

static std::string HelpMessage()
{
    std::string strUsage = strprintf("Fairway utility version %d\n\n", CLIENT_VERSION);
    strUsage += "Usage:  fairway-util [options] <command> [params]\n\n";
    strUsage += "Commands:\n";
    strUsage += "  validate <hexcode> [<maskhex>]      Check bytecode against an opcode allow-list (default: all opcodes)\n";
    strUsage += "  commitkey <player> <hexcode> <salt> Compute the commitment key for a solution\n";
    strUsage += "  opcodes <maskhex>                   List the opcodes an allow-list permits\n";
    strUsage += "  mask <opcode> [<opcode>...]         Build an allow-list from opcode names or 0xNN bytes\n";
    strUsage += "  dump                                Print the leaderboard database as JSON\n";
    strUsage += "  verifydb                            Check the leaderboard database for consistency\n";
    strUsage += "  backup <destination>                Copy the leaderboard database to a file or directory\n\n";
    strUsage += "Options:\n";
    strUsage += "  -?                      Print this help message and exit\n";
    strUsage += strprintf("  -conf=<file>            Specify configuration file (default: %s)\n", FAIRWAY_CONF_FILENAME);
    strUsage += "  -datadir=<dir>          Specify data directory\n";
    strUsage += "  -testnet                Use the test network\n";
    strUsage += "  -regtest                Use the regression test network\n";
    strUsage += "  -commitminage=<n>       Override the commit-reveal delay in seconds (regtest only)\n";
    strUsage += strprintf("  -debug=<category>       Output debugging information (categories: %s)\n", ListLogCategories());
    strUsage += "  -printtoconsole         Send log output to the console\n";
    strUsage += "  -logtimestamps          Prepend log output with a timestamp\n";
    return strUsage;
}

static int AppInitUtil(int argc, char* argv[])
{
    std::string error;
    if (!gArgs.ParseParameters(argc, argv, error)) {
        fprintf(stderr, "Error parsing command line arguments: %s\n", error.c_str());
        return EXIT_FAILURE;
    }

    if (argc < 2 || gArgs.IsArgSet("-?") || gArgs.IsArgSet("-h") || gArgs.IsArgSet("-help")) {
        fprintf(stdout, "%s", HelpMessage().c_str());
        return argc < 2 ? EXIT_FAILURE : EXIT_SUCCESS;
    }

    if (gArgs.IsArgSet("-datadir") && !fs::is_directory(GetDataDir(false))) {
        fprintf(stderr, "Error: Specified data directory \"%s\" does not exist.\n", gArgs.GetArg("-datadir", "").c_str());
        return EXIT_FAILURE;
    }
    if (!gArgs.ReadConfigFile(gArgs.GetArg("-conf", FAIRWAY_CONF_FILENAME), error)) {
        fprintf(stderr, "Error reading configuration file: %s\n", error.c_str());
        return EXIT_FAILURE;
    }

    // Check for -testnet or -regtest parameter (Params() calls are only valid after this clause)
    try {
        SelectParams(gArgs.GetChainName());
        if (gArgs.IsArgSet("-commitminage")) {
            UpdateCommitMinAge(gArgs.GetIntArg("-commitminage", Params().GetConsensus().nCommitMinAge));
        }
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return EXIT_FAILURE;
    }

    return CONTINUE_EXECUTION;
}

static COpcodeMask ParseMaskArg(const std::string& strMask)
{
    COpcodeMask mask;
    if (!COpcodeMask::FromHex(strMask, mask)) {
        throw std::runtime_error(strprintf("invalid opcode mask '%s'", strMask));
    }
    return mask;
}

static std::vector<unsigned char> ParseCodeArg(const std::string& strCode)
{
    std::string strHex = strCode;
    if (strHex.compare(0, 2, "0x") == 0) strHex = strHex.substr(2);
    if (!strHex.empty() && !IsHex(strHex)) {
        throw std::runtime_error(strprintf("invalid hex bytecode '%s'", strCode));
    }
    return ParseHex(strHex);
}

static void RequireParams(const std::vector<std::string>& args, size_t nMin, size_t nMax, const std::string& strCommand)
{
    if (args.size() < nMin || args.size() > nMax) {
        throw std::runtime_error(strprintf("wrong number of parameters for '%s' (see -?)", strCommand));
    }
}

/** Open the existing database of the selected network; logging goes to its datadir */
static std::unique_ptr<CLeaderboardDB> OpenLeaderboardDB()
{
    if (!InitLogging()) {
        throw std::runtime_error("cannot initialize logging");
    }
    const fs::path pathDB = GetDataDir() / DEFAULT_DB_FILENAME;
    if (!fs::exists(pathDB)) {
        throw std::runtime_error(strprintf("no leaderboard database at %s", pathDB.string()));
    }
    LogPrintf("Opening leaderboard database %s\n", pathDB.string());
    return std::unique_ptr<CLeaderboardDB>(new CLeaderboardDB(pathDB));
}

static UniValue DumpLeaderboard(const CLeaderboardDB& db)
{
    const Consensus::Params& consensus = Params().GetConsensus();

    UniValue result(UniValue::VOBJ);
    result.pushKV("chain", Params().NetworkIDString());
    result.pushKV("version", db.GetVersion());

    UniValue params(UniValue::VOBJ);
    params.pushKV("commit_min_age", consensus.nCommitMinAge);
    params.pushKV("max_solution_size", (int64_t)consensus.nMaxSolutionSize);
    result.pushKV("params", params);

    UniValue courses(UniValue::VARR);
    db.ForEachCourse([&](const CourseRecord& course) {
        UniValue entry = CourseToJSON(course);
        UniValue pars(UniValue::VARR);
        db.ForEachPar(course.nCourseId, [&](const ParRecord& par) {
            pars.push_back(ParToJSON(par));
            return true;
        });
        entry.pushKV("pars", pars);
        courses.push_back(entry);
        return true;
    });
    result.pushKV("courses", courses);

    UniValue commitments(UniValue::VARR);
    db.ForEachCommitment([&](const CommitmentRecord& commitment) {
        commitments.push_back(CommitmentToJSON(commitment));
        return true;
    });
    result.pushKV("commitments", commitments);
    return result;
}

static int CommandLineUtil(int argc, char* argv[])
{
    std::vector<std::string> args;
    for (int i = 1; i < argc; i++) {
        if (argv[i][0] == '-') continue;
        args.emplace_back(argv[i]);
    }
    if (args.empty()) {
        fprintf(stderr, "Error: no command given (see -?)\n");
        return EXIT_FAILURE;
    }

    const std::string strCommand = args.front();
    args.erase(args.begin());

    try {
        if (strCommand == "validate") {
            RequireParams(args, 1, 2, strCommand);
            const std::vector<unsigned char> code = ParseCodeArg(args[0]);
            const COpcodeMask mask = args.size() > 1 ? ParseMaskArg(args[1]) : COpcodeMask::Full();
            const UniValue result = SolutionCheckToJSON(code, mask);
            fprintf(stdout, "%s\n", result.write(2).c_str());
            return result["valid"].get_bool() ? EXIT_SUCCESS : EXIT_FAILURE;
        }

        if (strCommand == "commitkey") {
            RequireParams(args, 3, 3, strCommand);
            CPlayerID player;
            if (!ParsePlayerID(args[0], player)) {
                throw std::runtime_error(strprintf("invalid player id '%s'", args[0]));
            }
            const std::vector<unsigned char> code = ParseCodeArg(args[1]);
            std::string strSalt = args[2];
            if (strSalt.compare(0, 2, "0x") == 0) strSalt = strSalt.substr(2);
            if (strSalt.size() != 64 || !IsHex(strSalt)) {
                throw std::runtime_error(strprintf("invalid salt '%s' (expected 32 bytes hex)", args[2]));
            }
            const uint256 salt = uint256S(strSalt);
            fprintf(stdout, "%s\n", ComputeCommitKey(player, code, salt).GetHex().c_str());
            return EXIT_SUCCESS;
        }

        if (strCommand == "opcodes") {
            RequireParams(args, 1, 1, strCommand);
            fprintf(stdout, "%s\n", OpcodeMaskToJSON(ParseMaskArg(args[0])).write(2).c_str());
            return EXIT_SUCCESS;
        }

        if (strCommand == "mask") {
            RequireParams(args, 1, 256, strCommand);
            COpcodeMask mask;
            for (const std::string& strName : args) {
                uint8_t opcode;
                if (!ParseOpcode(strName, opcode)) {
                    throw std::runtime_error(strprintf("unknown opcode '%s'", strName));
                }
                mask.Set(opcode);
            }
            fprintf(stdout, "%s\n", OpcodeMaskToJSON(mask).write(2).c_str());
            return EXIT_SUCCESS;
        }

        if (strCommand == "dump") {
            RequireParams(args, 0, 0, strCommand);
            std::unique_ptr<CLeaderboardDB> db = OpenLeaderboardDB();
            fprintf(stdout, "%s\n", DumpLeaderboard(*db).write(2).c_str());
            return EXIT_SUCCESS;
        }

        if (strCommand == "verifydb") {
            RequireParams(args, 0, 0, strCommand);
            std::string strWarning, strError;
            if (!SQLiteDatabase::VerifyDatabaseFile(GetDataDir() / DEFAULT_DB_FILENAME, strWarning, strError)) {
                throw std::runtime_error(strError);
            }
            if (!strWarning.empty()) {
                fprintf(stderr, "Warning: %s\n", strWarning.c_str());
            }
            std::unique_ptr<CLeaderboardDB> db = OpenLeaderboardDB();
            if (!db->CheckConsistency(strError)) {
                fprintf(stderr, "Inconsistent database: %s\n", strError.c_str());
                return EXIT_FAILURE;
            }
            fprintf(stdout, "ok\n");
            return EXIT_SUCCESS;
        }

        if (strCommand == "backup") {
            RequireParams(args, 1, 1, strCommand);
            std::unique_ptr<CLeaderboardDB> db = OpenLeaderboardDB();
            if (!db->Backup(args[0])) {
                throw std::runtime_error(strprintf("backup to %s failed", args[0]));
            }
            fprintf(stdout, "ok\n");
            return EXIT_SUCCESS;
        }
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return EXIT_FAILURE;
    }

    fprintf(stderr, "Error: unknown command '%s' (see -?)\n", strCommand.c_str());
    return EXIT_FAILURE;
}

int main(int argc, char* argv[])
{
    try {
        int ret = AppInitUtil(argc, argv);
        if (ret != CONTINUE_EXECUTION)
            return ret;
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return EXIT_FAILURE;
    }

    return CommandLineUtil(argc, argv);
}
