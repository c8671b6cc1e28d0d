// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Leaderboard DB Tests - SQLite key/value layer and typed records
 *
 * Tests:
 *   1. SQLiteBatch read/write/erase, transactions and prefix cursors
 *   2. CLeaderboardDB records and schema version
 *   3. Persistence across reopen and consistency checks
 */

#include "chainparams.h"
#include "db/sqlitedb.h"
#include "leaderboard/engine.h"
#include "leaderboard/leaderboarddb.h"
#include "streams.h"
#include "test/test_fairway.h"
#include "utilstrencodings.h"
#include "utiltime.h"
#include "version.h"

#include <boost/test/unit_test.hpp>

#include <limits>

BOOST_FIXTURE_TEST_SUITE(leaderboarddb_tests, BasicTestingSetup)

// =============================================================================
// Test 1: SQLite layer
// =============================================================================

BOOST_AUTO_TEST_CASE(sqlite_batch_basic)
{
    std::unique_ptr<SQLiteDatabase> database = SQLiteDatabase::CreateMock();
    BOOST_CHECK(database->IsMock());
    SQLiteBatch batch(*database);

    const auto key = std::make_pair('x', (uint32_t)7);
    std::string strValue;
    BOOST_CHECK(!batch.Read(key, strValue));
    BOOST_CHECK(!batch.Exists(key));

    BOOST_CHECK(batch.Write(key, std::string("first")));
    BOOST_CHECK(batch.Exists(key));
    BOOST_CHECK(batch.Read(key, strValue));
    BOOST_CHECK_EQUAL(strValue, "first");

    // No overwrite requested
    BOOST_CHECK(!batch.Write(key, std::string("second"), false));
    BOOST_CHECK(batch.Read(key, strValue));
    BOOST_CHECK_EQUAL(strValue, "first");

    BOOST_CHECK(batch.Write(key, std::string("second")));
    BOOST_CHECK(batch.Read(key, strValue));
    BOOST_CHECK_EQUAL(strValue, "second");

    BOOST_CHECK(batch.Erase(key));
    BOOST_CHECK(!batch.Exists(key));
}

BOOST_AUTO_TEST_CASE(sqlite_batch_transactions)
{
    std::unique_ptr<SQLiteDatabase> database = SQLiteDatabase::CreateMock();
    SQLiteBatch batch(*database);

    BOOST_CHECK(!batch.TxnCommit());
    BOOST_CHECK(!batch.TxnAbort());

    BOOST_REQUIRE(batch.TxnBegin());
    BOOST_CHECK(batch.IsInTransaction());
    BOOST_CHECK(!batch.TxnBegin());
    BOOST_CHECK(batch.Write(std::string("a"), 1));
    BOOST_CHECK(batch.TxnAbort());
    BOOST_CHECK(!batch.IsInTransaction());
    BOOST_CHECK(!batch.Exists(std::string("a")));

    BOOST_REQUIRE(batch.TxnBegin());
    BOOST_CHECK(batch.Write(std::string("b"), 2));
    BOOST_CHECK(batch.TxnCommit());
    int nValue = 0;
    BOOST_CHECK(batch.Read(std::string("b"), nValue));
    BOOST_CHECK_EQUAL(nValue, 2);
}

BOOST_AUTO_TEST_CASE(sqlite_prefix_cursor)
{
    std::unique_ptr<SQLiteDatabase> database = SQLiteDatabase::CreateMock();
    SQLiteBatch batch(*database);

    for (uint32_t i = 0; i < 5; i++) {
        BOOST_CHECK(batch.Write(std::make_pair('a', i), i * 10));
    }
    BOOST_CHECK(batch.Write(std::make_pair('b', (uint32_t)0), (uint32_t)99));

    BOOST_REQUIRE(batch.StartCursor('a'));
    uint32_t nCount = 0;
    uint32_t nSum = 0;
    while (true) {
        CDataStream ssKey(SER_DISK, CLIENT_VERSION);
        CDataStream ssValue(SER_DISK, CLIENT_VERSION);
        bool fComplete = false;
        if (!batch.ReadAtCursor(ssKey, ssValue, fComplete)) {
            BOOST_CHECK(fComplete);
            break;
        }
        std::pair<char, uint32_t> key;
        uint32_t nValue;
        ssKey >> key;
        ssValue >> nValue;
        BOOST_CHECK_EQUAL(key.first, 'a');
        BOOST_CHECK_EQUAL(nValue, key.second * 10);
        nSum += nValue;
        nCount++;
    }
    batch.CloseCursor();
    BOOST_CHECK_EQUAL(nCount, 5U);
    BOOST_CHECK_EQUAL(nSum, 100U);
}

// =============================================================================
// Test 2: Typed records
// =============================================================================

BOOST_AUTO_TEST_CASE(course_and_par_records)
{
    CLeaderboardDB db("", true);
    BOOST_CHECK_EQUAL(db.GetVersion(), LEADERBOARD_DB_VERSION);
    BOOST_CHECK_EQUAL(db.ReadNextCourseId(1), 1U);

    CourseRecord course;
    course.nCourseId = 3;
    course.strCourseRef = "sum";
    course.allowedOpcodes = COpcodeMask::FromOpcodes({0x01, 0x60});
    course.nLeadingCost = 12;
    course.king = TestPlayer(9);
    course.nSolutions = 1;
    course.nKingChanges = 1;
    course.nCreateTime = GetTime();
    BOOST_CHECK(db.WriteCourse(course));
    BOOST_CHECK(db.WriteNextCourseId(4));

    CourseRecord course2;
    BOOST_REQUIRE(db.ReadCourse(3, course2));
    BOOST_CHECK_EQUAL(course2.strCourseRef, "sum");
    BOOST_CHECK(course2.allowedOpcodes == course.allowedOpcodes);
    BOOST_CHECK(course2.king == course.king);
    BOOST_CHECK_EQUAL(course2.nLeadingCost, 12U);
    BOOST_CHECK(!db.ExistsCourse(2));
    BOOST_CHECK_EQUAL(db.ReadNextCourseId(1), 4U);

    ParRecord par;
    par.nCourseId = 3;
    par.player = TestPlayer(9);
    par.nCost = 12;
    par.nSolutions = 1;
    BOOST_CHECK(db.WritePar(par));

    // Same player on another course must not show up under course 3
    ParRecord parOther = par;
    parOther.nCourseId = 4;
    BOOST_CHECK(db.WritePar(parOther));

    int nPars = 0;
    db.ForEachPar(3, [&](const ParRecord& p) {
        BOOST_CHECK_EQUAL(p.nCourseId, 3U);
        nPars++;
        return true;
    });
    BOOST_CHECK_EQUAL(nPars, 1);

    std::string strError;
    // parOther points at a course that does not exist
    BOOST_CHECK(!db.CheckConsistency(strError));
    BOOST_CHECK(strError.find("unknown course 4") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(counters_hold_past_32_bits)
{
    CLeaderboardDB db("", true);
    const uint64_t nLarge = (uint64_t)std::numeric_limits<uint32_t>::max() + 5;

    CourseRecord course;
    course.nCourseId = 1;
    course.strCourseRef = "sum";
    course.nSolutions = nLarge;
    course.nKingChanges = nLarge - 1;
    BOOST_REQUIRE(db.WriteCourse(course));

    ParRecord par;
    par.nCourseId = 1;
    par.player = TestPlayer(9);
    par.nCost = 7;
    par.nSolutions = nLarge;
    BOOST_REQUIRE(db.WritePar(par));

    CourseRecord course2;
    BOOST_REQUIRE(db.ReadCourse(1, course2));
    BOOST_CHECK_EQUAL(course2.nSolutions, nLarge);
    BOOST_CHECK_EQUAL(course2.nKingChanges, nLarge - 1);

    ParRecord par2;
    BOOST_REQUIRE(db.ReadPar(1, TestPlayer(9), par2));
    BOOST_CHECK_EQUAL(par2.nSolutions, nLarge);
}

BOOST_AUTO_TEST_CASE(courses_iterate_in_id_order)
{
    CLeaderboardDB db("", true);
    for (uint32_t nId : {300U, 1U, 256U, 2U}) {
        CourseRecord course;
        course.nCourseId = nId;
        course.strCourseRef = "c";
        BOOST_CHECK(db.WriteCourse(course));
    }

    std::vector<uint32_t> vIds;
    db.ForEachCourse([&](const CourseRecord& course) {
        vIds.push_back(course.nCourseId);
        return true;
    });
    BOOST_CHECK((vIds == std::vector<uint32_t>{1, 2, 256, 300}));
}

// =============================================================================
// Test 3: Persistence and consistency
// =============================================================================

BOOST_AUTO_TEST_CASE(state_survives_reopen)
{
    const CPlayerID admin = TestPlayer(0xad);
    const CPlayerID alice = TestPlayer(0xa1);
    CCourseDirectory directory;
    std::shared_ptr<MockCourse> course = std::make_shared<MockCourse>();
    BOOST_REQUIRE(directory.RegisterCourse("mock", course));

    const std::vector<unsigned char> solution = ParseHex("6001600201");
    const uint256 key = ComputeCommitKey(alice, solution, uint256S("77"));
    {
        CLeaderboardDB db(m_path_root);
        CSubmissionEngine engine(db, Params().GetConsensus(), directory, admin);

        uint32_t nCourseId = 0;
        CValidationState state;
        BOOST_REQUIRE(engine.AddCourse(CLedgerContext(admin, GetTime()), "mock", COpcodeMask::Full(), nCourseId, state));
        SubmissionResult result;
        BOOST_REQUIRE(engine.Submit(CLedgerContext(alice, GetTime()), nCourseId, solution, result, state));
        BOOST_REQUIRE(engine.Commit(CLedgerContext(alice, GetTime()), key, state));
    }
    BOOST_CHECK(fs::exists(m_path_root / DEFAULT_DB_FILENAME));

    CLeaderboardDB db(m_path_root);
    CSubmissionEngine engine(db, Params().GetConsensus(), directory, admin);

    CourseRecord c;
    BOOST_REQUIRE(engine.GetCourse(1, c));
    BOOST_CHECK(c.king == alice);
    BOOST_CHECK_EQUAL(c.nLeadingCost, solution.size());
    BOOST_CHECK_EQUAL(c.nSolutions, 1U);
    BOOST_CHECK(engine.GetPar(1, alice));

    CommitmentRecord commitment;
    BOOST_REQUIRE(engine.GetCommitment(key, commitment));
    BOOST_CHECK(commitment.committer == alice);

    std::string strError;
    BOOST_CHECK_MESSAGE(db.CheckConsistency(strError), strError);

    // Ids continue after the stored counter
    uint32_t nCourseId = 0;
    CValidationState state;
    BOOST_REQUIRE(engine.AddCourse(CLedgerContext(admin, GetTime()), "mock", COpcodeMask::Full(), nCourseId, state));
    BOOST_CHECK_EQUAL(nCourseId, 2U);
}

BOOST_AUTO_TEST_CASE(backup_copies_records)
{
    const fs::path pathBackup = m_path_root / "backups";
    fs::create_directories(pathBackup);
    {
        CLeaderboardDB db(m_path_root);
        CourseRecord course;
        course.nCourseId = 5;
        course.strCourseRef = "sum";
        course.nLeadingCost = 9;
        course.king = TestPlayer(3);
        BOOST_REQUIRE(db.WriteCourse(course));
        BOOST_CHECK(db.Backup(pathBackup.string()));
    }
    BOOST_CHECK(fs::exists(pathBackup / DEFAULT_DB_FILENAME));

    CLeaderboardDB dbCopy(pathBackup);
    CourseRecord course;
    BOOST_REQUIRE(dbCopy.ReadCourse(5, course));
    BOOST_CHECK(course.king == TestPlayer(3));
    BOOST_CHECK_EQUAL(course.nLeadingCost, 9U);

    // Nothing to copy from memory
    CLeaderboardDB dbMemory("", true);
    BOOST_CHECK(!dbMemory.Backup(pathBackup.string()));
}

BOOST_FIXTURE_TEST_CASE(consistency_detects_counter_drift, LeaderboardTestingSetup)
{
    const uint32_t nCourseId = AddMockCourse(COpcodeMask::Full());
    SubmissionResult result;
    CValidationState state;
    BOOST_REQUIRE(engine->Submit(Ctx(TestPlayer(1)), nCourseId, ParseHex("6001"), result, state));
    BOOST_REQUIRE(engine->Submit(Ctx(TestPlayer(2)), nCourseId, ParseHex("600101"), result, state));

    std::string strError;
    BOOST_CHECK_MESSAGE(db->CheckConsistency(strError), strError);

    CourseRecord c;
    BOOST_REQUIRE(db->ReadCourse(nCourseId, c));
    c.nSolutions++;
    BOOST_REQUIRE(db->WriteCourse(c));
    BOOST_CHECK(!db->CheckConsistency(strError));
    BOOST_CHECK(strError.find("solutions") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(verify_database_file)
{
    std::string strWarning, strError;
    // Missing file is fine
    BOOST_CHECK(SQLiteDatabase::VerifyDatabaseFile(m_path_root, strWarning, strError));

    {
        CLeaderboardDB db(m_path_root);
        BOOST_CHECK(db.WriteNextCourseId(1));
    }
    BOOST_CHECK(SQLiteDatabase::VerifyDatabaseFile(m_path_root, strWarning, strError));
    BOOST_CHECK(strError.empty());
}

BOOST_AUTO_TEST_SUITE_END()
