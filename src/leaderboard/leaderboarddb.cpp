// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "leaderboard/leaderboarddb.h"

#include "logging.h"
#include "utilstrencodings.h"
#include "version.h"

#include <map>
#include <stdexcept>

// DB key helpers
namespace {

template<typename T>
std::pair<char, T> MakeKey(char prefix, const T& key)
{
    return std::make_pair(prefix, key);
}

// Par key: 'p' + courseId + player, so a course's pars share a prefix
std::pair<char, std::pair<uint32_t, CPlayerID>> MakeParKey(uint32_t nCourseId, const CPlayerID& player)
{
    return std::make_pair(DB_PAR, std::make_pair(nCourseId, player));
}

/**
 * Walk every record under a key prefix, decoding values as T.
 * Records that fail to decode are logged and skipped.
 */
template<typename Prefix, typename T>
void ForEachRecord(SQLiteBatch& batch, const Prefix& prefix, std::function<bool(const T&)> func)
{
    if (!batch.StartCursor(prefix)) {
        LogPrintf("CLeaderboardDB: cannot open cursor\n");
        return;
    }

    CDataStream ssKey(SER_DISK, CLIENT_VERSION);
    CDataStream ssValue(SER_DISK, CLIENT_VERSION);
    bool complete = false;
    while (batch.ReadAtCursor(ssKey, ssValue, complete) && !complete) {
        T record;
        try {
            ssValue >> record;
        } catch (const std::exception& e) {
            LogPrintf("CLeaderboardDB: skipping undecodable record: %s\n", e.what());
            continue;
        }
        if (!func(record)) {
            break;  // Callback returned false, stop iteration
        }
    }
    batch.CloseCursor();
}

} // anonymous namespace

// =============================================================================
// Constructor / Destructor
// =============================================================================

CLeaderboardDB::CLeaderboardDB(const fs::path& path, bool fMemory)
{
    db = std::unique_ptr<SQLiteDatabase>(new SQLiteDatabase(path, fMemory));
    batch = std::unique_ptr<SQLiteBatch>(new SQLiteBatch(*db));

    int nVersion = 0;
    if (!batch->ReadVersion(nVersion)) {
        if (!batch->WriteVersion(LEADERBOARD_DB_VERSION)) {
            throw std::runtime_error("CLeaderboardDB: cannot write schema version");
        }
        LogPrint(FWLog::DB, "CLeaderboardDB: created schema version %d\n", LEADERBOARD_DB_VERSION);
        return;
    }
    if (nVersion < MIN_LEADERBOARD_DB_VERSION || nVersion > LEADERBOARD_DB_VERSION) {
        throw std::runtime_error(strprintf("CLeaderboardDB: unsupported schema version %d (supported %d..%d)",
            nVersion, MIN_LEADERBOARD_DB_VERSION, LEADERBOARD_DB_VERSION));
    }
    LogPrint(FWLog::DB, "CLeaderboardDB: opened schema version %d\n", nVersion);
}

CLeaderboardDB::~CLeaderboardDB()
{
    // Statements must be finalized before the connection closes
    batch.reset();
}

// =============================================================================
// Course Operations
// =============================================================================

bool CLeaderboardDB::WriteCourse(const CourseRecord& course)
{
    return batch->Write(MakeKey(DB_COURSE, course.nCourseId), course);
}

bool CLeaderboardDB::ReadCourse(uint32_t nCourseId, CourseRecord& course) const
{
    return batch->Read(MakeKey(DB_COURSE, nCourseId), course);
}

bool CLeaderboardDB::ExistsCourse(uint32_t nCourseId) const
{
    return batch->Exists(MakeKey(DB_COURSE, nCourseId));
}

uint32_t CLeaderboardDB::ReadNextCourseId(uint32_t nDefault) const
{
    uint32_t nCourseId = 0;
    if (!batch->Read(DB_NEXT_COURSE_ID, nCourseId)) {
        return nDefault;
    }
    return nCourseId;
}

bool CLeaderboardDB::WriteNextCourseId(uint32_t nCourseId)
{
    return batch->Write(DB_NEXT_COURSE_ID, nCourseId);
}

void CLeaderboardDB::ForEachCourse(std::function<bool(const CourseRecord&)> func) const
{
    // Keys are little-endian, so collect and order by id before calling back
    std::map<uint32_t, CourseRecord> mapCourses;
    ForEachRecord<char, CourseRecord>(*batch, DB_COURSE, [&](const CourseRecord& course) {
        mapCourses.emplace(course.nCourseId, course);
        return true;
    });
    for (const auto& entry : mapCourses) {
        if (!func(entry.second)) break;
    }
}

// =============================================================================
// Commitment Operations
// =============================================================================

bool CLeaderboardDB::WriteCommitment(const CommitmentRecord& commitment)
{
    return batch->Write(MakeKey(DB_COMMITMENT, commitment.commitKey), commitment);
}

bool CLeaderboardDB::ReadCommitment(const uint256& commitKey, CommitmentRecord& commitment) const
{
    return batch->Read(MakeKey(DB_COMMITMENT, commitKey), commitment);
}

bool CLeaderboardDB::ExistsCommitment(const uint256& commitKey) const
{
    return batch->Exists(MakeKey(DB_COMMITMENT, commitKey));
}

void CLeaderboardDB::ForEachCommitment(std::function<bool(const CommitmentRecord&)> func) const
{
    ForEachRecord<char, CommitmentRecord>(*batch, DB_COMMITMENT, func);
}

// =============================================================================
// Par Operations
// =============================================================================

bool CLeaderboardDB::WritePar(const ParRecord& par)
{
    return batch->Write(MakeParKey(par.nCourseId, par.player), par);
}

bool CLeaderboardDB::ReadPar(uint32_t nCourseId, const CPlayerID& player, ParRecord& par) const
{
    return batch->Read(MakeParKey(nCourseId, player), par);
}

void CLeaderboardDB::ForEachPar(uint32_t nCourseId, std::function<bool(const ParRecord&)> func) const
{
    ForEachRecord<std::pair<char, uint32_t>, ParRecord>(*batch, MakeKey(DB_PAR, nCourseId), func);
}

void CLeaderboardDB::ForEachPar(std::function<bool(const ParRecord&)> func) const
{
    ForEachRecord<char, ParRecord>(*batch, DB_PAR, func);
}

// =============================================================================
// Transactions
// =============================================================================

bool CLeaderboardDB::TxnBegin()
{
    return batch->TxnBegin();
}

bool CLeaderboardDB::TxnCommit()
{
    return batch->TxnCommit();
}

bool CLeaderboardDB::TxnAbort()
{
    return batch->TxnAbort();
}

// =============================================================================
// Maintenance
// =============================================================================

int CLeaderboardDB::GetVersion() const
{
    int nVersion = 0;
    if (!batch->ReadVersion(nVersion)) {
        return 0;
    }
    return nVersion;
}

bool CLeaderboardDB::CheckConsistency(std::string& strError) const
{
    std::map<uint32_t, CourseRecord> mapCourses;
    ForEachCourse([&](const CourseRecord& course) {
        mapCourses.emplace(course.nCourseId, course);
        return true;
    });

    const uint32_t nNextId = ReadNextCourseId(0);
    for (const auto& entry : mapCourses) {
        if (entry.first >= nNextId) {
            strError = strprintf("course %u not below next id %u", entry.first, nNextId);
            return false;
        }
    }

    std::map<uint32_t, uint64_t> mapSolutions;
    bool fOk = true;
    ForEachPar([&](const ParRecord& par) {
        auto it = mapCourses.find(par.nCourseId);
        if (it == mapCourses.end()) {
            strError = strprintf("par of %s references unknown course %u", par.player.ToString(), par.nCourseId);
            fOk = false;
            return false;
        }
        const CourseRecord& course = it->second;
        if (par.nCost != 0 && (course.nLeadingCost == 0 || course.nLeadingCost > par.nCost)) {
            strError = strprintf("course %u leading cost %u above par %u of %s",
                course.nCourseId, course.nLeadingCost, par.nCost, par.player.ToString());
            fOk = false;
            return false;
        }
        mapSolutions[par.nCourseId] += par.nSolutions;
        return true;
    });
    if (!fOk) return false;

    for (const auto& entry : mapCourses) {
        if (mapSolutions[entry.first] != entry.second.nSolutions) {
            strError = strprintf("course %u counts %u solutions, pars count %u",
                entry.first, entry.second.nSolutions, mapSolutions[entry.first]);
            return false;
        }
    }

    ForEachCommitment([&](const CommitmentRecord& commitment) {
        CommitmentRecord stored;
        if (!ReadCommitment(commitment.commitKey, stored) || stored.committer != commitment.committer) {
            strError = strprintf("commitment %s stored under a foreign key", commitment.commitKey.ToString());
            fOk = false;
            return false;
        }
        return true;
    });

    return fOk;
}

bool CLeaderboardDB::Backup(const std::string& strDest)
{
    return db->Backup(strDest);
}

